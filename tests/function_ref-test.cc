#include <fold-core/function_ref.hh>

#include <nexus/test.hh>

#include <string>

namespace
{
struct S
{
    int value = 0;
    int add(int x) const { return value + x; }
};

struct Adder
{
    int base;
    int operator()(int x) const { return base + x; }
};

struct Forwarder
{
    int operator()(int&) { return 1; }
    int operator()(int&&) { return 2; }
};

struct Counter
{
    int count = 0;
    int operator()() { return ++count; }
};

int square(int x)
{
    return x * x;
}

int call_with_ten(fc::function_ref<int(int)> f)
{
    return f(10);
}
} // namespace

TEST("function_ref - default construction is invalid")
{
    fc::function_ref<int(int)> f;
    CHECK(!f.is_valid());
    CHECK(!f);
}

TEST("function_ref - construction from callables")
{
    SECTION("function pointer")
    {
        auto fp = &square;
        fc::function_ref<int(int)> f = fp;
        CHECK(f.is_valid());
        CHECK(f(4) == 16);
    }

    SECTION("lambda lvalue")
    {
        int offset = 3;
        auto lambda = [&](int x) { return x + offset; };
        fc::function_ref<int(int)> f = lambda;
        CHECK(f(1) == 4);

        offset = 10;
        CHECK(f(1) == 11); // references, does not copy
    }

    SECTION("const functor")
    {
        Adder const adder{5};
        fc::function_ref<int(int)> f = adder;
        CHECK(f(1) == 6);
    }

    SECTION("stateful functor is referenced")
    {
        Counter counter;
        fc::function_ref<int()> f = counter;
        CHECK(f() == 1);
        CHECK(f() == 2);
        CHECK(counter.count == 2);
    }

    SECTION("pointer-to-member-function")
    {
        S s{7};
        auto pm = &S::add;
        fc::function_ref<int(S const&, int)> f = pm;
        CHECK(f(s, 3) == 10);
    }
}

TEST("function_ref - temporaries as function arguments")
{
    CHECK(call_with_ten([](int x) { return x * 2; }) == 20);
    CHECK(call_with_ten(Adder{1}) == 11);
    CHECK(call_with_ten(+[](int x) { return x - 1; }) == 9);
}

TEST("function_ref - argument forwarding preserves value category")
{
    Forwarder fwd;

    fc::function_ref<int(int&)> f_lvalue = fwd;
    fc::function_ref<int(int&&)> f_rvalue = fwd;

    int x = 0;
    CHECK(f_lvalue(x) == 1);
    CHECK(f_rvalue(0) == 2);
}

TEST("function_ref - void and converted returns")
{
    SECTION("void signature discards results")
    {
        int calls = 0;
        auto lambda = [&](int) -> int { return ++calls; };
        fc::function_ref<void(int)> f = lambda;
        f(1);
        f(2);
        CHECK(calls == 2);
    }

    SECTION("return conversion")
    {
        auto lambda = [](int x) { return x > 0; };
        fc::function_ref<int(int)> f = lambda;
        CHECK(f(5) == 1);
        CHECK(f(-5) == 0);
    }

    SECTION("bool signature as used by generators")
    {
        int stop_after = 2;
        int seen = 0;
        auto yield = [&](std::string const&) { return ++seen >= stop_after; };
        fc::function_ref<bool(std::string)> f = yield;
        CHECK(!f("a"));
        CHECK(f("b"));
    }
}

TEST("function_ref - copies reference the same callable")
{
    Counter counter;
    fc::function_ref<int()> a = counter;
    fc::function_ref<int()> b = a;
    fc::function_ref<int()> c;
    c = b;

    CHECK(a() == 1);
    CHECK(b() == 2);
    CHECK(c() == 3);
}
