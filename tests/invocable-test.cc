#include <fold-core/utility.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>

namespace
{
struct S
{
    int value = 0;
    int call_count = 0;

    int f(int x)
    {
        ++call_count;
        return value + x;
    }

    int f_const(int x) const { return value + x; }
};

struct MO
{
    int x;
};

// smart-pointer-like proxy
struct P
{
    S* p;
    S& operator*() const { return *p; }
};

// ref-qualified operator()
struct Q
{
    int operator()() & { return 1; }
    int operator()() && { return 2; }
};

// distinguishes lvalue/rvalue args
struct G
{
    int operator()(int&) { return 1; }
    int operator()(int&&) { return 2; }
};
} // namespace

TEST("invoke - plain callables")
{
    SECTION("returns value")
    {
        auto f = [](int a, int b, int c) { return a + b + c; };
        CHECK(fc::invoke(f, 1, 2, 3) == 6);
    }

    SECTION("preserves returned references")
    {
        int x = 5;
        auto f = [&]() -> int& { return x; };

        static_assert(std::is_same_v<decltype(fc::invoke(f)), int&>);
        fc::invoke(f) = 10;
        CHECK(x == 10);
    }

    SECTION("forwards the callable")
    {
        Q q;
        CHECK(fc::invoke(q) == 1);
        CHECK(fc::invoke(fc::move(q)) == 2);
        CHECK(fc::invoke(Q{}) == 2);
    }

    SECTION("forwards the arguments")
    {
        G g;
        int x = 10;
        CHECK(fc::invoke(g, x) == 1);
        CHECK(fc::invoke(g, 0) == 2);
        CHECK(fc::invoke(g, fc::move(x)) == 2);
    }

    SECTION("void result")
    {
        int calls = 0;
        fc::invoke([&] { ++calls; });
        CHECK(calls == 1);
    }
}

TEST("invoke - member function pointers")
{
    S s;
    s.value = 10;

    SECTION("on object")
    {
        CHECK(fc::invoke(&S::f, s, 7) == 17);
        CHECK(s.call_count == 1);
        CHECK(fc::invoke(&S::f_const, static_cast<S const&>(s), 1) == 11);
    }

    SECTION("on raw pointer")
    {
        S* p = &s;
        CHECK(fc::invoke(&S::f, p, 5) == 15);
        CHECK(s.call_count == 1);
    }

    SECTION("on smart pointers")
    {
        auto up = std::make_unique<S>();
        up->value = 30;
        CHECK(fc::invoke(&S::f, up, 12) == 42);

        auto sp = std::make_shared<S>();
        sp->value = 100;
        CHECK(fc::invoke(&S::f, sp, 23) == 123);
    }

    SECTION("on custom proxy")
    {
        P proxy{&s};
        CHECK(fc::invoke(&S::f, proxy, 1) == 11);
        CHECK(s.call_count == 1);
    }
}

TEST("invoke - member object pointers")
{
    SECTION("yields references with the object's value category")
    {
        MO m{5};
        static_assert(std::is_same_v<decltype(fc::invoke(&MO::x, m)), int&>);
        static_assert(std::is_same_v<decltype(fc::invoke(&MO::x, static_cast<MO const&>(m))), int const&>);
        static_assert(std::is_same_v<decltype(fc::invoke(&MO::x, fc::move(m))), int&&>);

        fc::invoke(&MO::x, m) = 9;
        CHECK(m.x == 9);
        CHECK(&fc::invoke(&MO::x, m) == &m.x);
    }

    SECTION("through pointers")
    {
        MO m{10};
        MO* p = &m;
        static_assert(std::is_same_v<decltype(fc::invoke(&MO::x, p)), int&>);
        fc::invoke(&MO::x, p) = 20;
        CHECK(m.x == 20);

        auto up = std::make_unique<MO>(MO{30});
        CHECK(fc::invoke(&MO::x, up) == 30);
    }
}

TEST("invoke - is_invocable")
{
    SECTION("positive cases")
    {
        auto f = [](int, float) { return 1.0; };
        using F = decltype(f);
        static_assert(fc::is_invocable<F, int, float>);
        static_assert(fc::is_invocable<F&, int&, float&>);
        static_assert(fc::is_invocable<decltype(&S::f), S&, int>);
        static_assert(fc::is_invocable<decltype(&S::f), S*, int>);
        static_assert(fc::is_invocable<decltype(&S::f), std::unique_ptr<S>&, int>);
        static_assert(fc::is_invocable<decltype(&MO::x), MO&>);
        static_assert(fc::is_invocable<decltype(&MO::x), MO*>);

        SUCCEED(); // just static checks
    }

    SECTION("negative cases")
    {
        struct H
        {
            void operator()(int) {}
        };
        static_assert(!fc::is_invocable<H>);
        static_assert(!fc::is_invocable<H, int, int>);
        static_assert(!fc::is_invocable<H, std::string>);
        static_assert(!fc::is_invocable<decltype(&MO::x), MO&, int>);
        static_assert(!fc::is_invocable<decltype(&S::f), S&>);
        static_assert(!fc::is_invocable<int, int>);

        SUCCEED(); // just static checks
    }

    SECTION("generic lambdas are checked by arity")
    {
        auto unary = [](auto const& v) { return v; };
        static_assert(fc::is_invocable<decltype(unary)&, int&>);
        static_assert(!fc::is_invocable<decltype(unary)&, fc::isize, int&>);

        SUCCEED(); // just static checks
    }
}

TEST("invoke - is_invocable_r")
{
    auto to_int = [](int x) { return x; };
    auto to_string = [](int) { return std::string("x"); };

    static_assert(fc::is_invocable_r<int, decltype(to_int), int>);
    static_assert(fc::is_invocable_r<double, decltype(to_int), int>);
    static_assert(!fc::is_invocable_r<int, decltype(to_string), int>);
    static_assert(fc::is_invocable_r<void, decltype(to_string), int>);
    static_assert(!fc::is_invocable_r<void, decltype(to_string)>);

    SUCCEED(); // just static checks
}

TEST("invoke - regular_invoke maps void to unit")
{
    int calls = 0;
    auto side_effect = [&](int) { ++calls; };
    auto value = [](int x) { return x * 2; };

    static_assert(std::is_same_v<decltype(fc::regular_invoke(side_effect, 1)), fc::unit>);
    static_assert(std::is_same_v<decltype(fc::regular_invoke(value, 1)), int>);

    CHECK(fc::regular_invoke(side_effect, 1) == fc::unit{});
    CHECK(calls == 1);
    CHECK(fc::regular_invoke(value, 21) == 42);
}

TEST("invoke - optional index")
{
    SECTION("index is passed if accepted")
    {
        auto with_idx = [](fc::isize idx, int v) { return idx * 100 + v; };
        CHECK(fc::invoke_with_optional_idx(3, with_idx, 7) == 307);
    }

    SECTION("index is dropped otherwise")
    {
        auto without_idx = [](int v) { return v; };
        CHECK(fc::invoke_with_optional_idx(3, without_idx, 7) == 7);
    }

    SECTION("regular variant")
    {
        fc::isize seen = -1;
        auto record = [&](fc::isize idx, int) { seen = idx; };
        static_assert(std::is_same_v<decltype(fc::regular_invoke_with_optional_idx(5, record, 1)), fc::unit>);
        (void)fc::regular_invoke_with_optional_idx(5, record, 1);
        CHECK(seen == 5);
    }
}
