#include <fold-core/optional.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>

// optional stays trivial
static_assert(std::is_constructible_v<fc::optional<int>>);
static_assert(std::is_constructible_v<fc::optional<int>, int>);
static_assert(std::is_constructible_v<fc::optional<int>, fc::nullopt_t>);
static_assert(std::is_trivially_copyable_v<fc::optional<int>>);
static_assert(std::is_trivially_destructible_v<fc::optional<int>>);

// optional references are pointers
static_assert(std::is_trivially_copyable_v<fc::optional<int&>>);
static_assert(sizeof(fc::optional<int&>) == sizeof(int*));
static_assert(!std::is_constructible_v<fc::optional<int const&>, int&&>);
static_assert(std::is_constructible_v<fc::optional<int const&>, fc::optional<int&>>);

namespace
{
struct non_trivial
{
    int value = 0;
    bool* destroyed = nullptr;

    non_trivial() = default;
    explicit non_trivial(int v) : value(v) {}
    non_trivial(int v, bool* d) : value(v), destroyed(d) {}

    ~non_trivial()
    {
        if (destroyed)
            *destroyed = true;
    }

    non_trivial(non_trivial const&) = default;
    non_trivial(non_trivial&&) = default;
    non_trivial& operator=(non_trivial const&) = default;
    non_trivial& operator=(non_trivial&&) = default;

    friend bool operator==(non_trivial const&, non_trivial const&) = default;
};

struct counting_type
{
    int value = 0;

    static inline int value_ctor_count = 0;
    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        value_ctor_count = 0;
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
    }

    explicit counting_type(int v) : value(v) { ++value_ctor_count; }
    counting_type(counting_type const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    counting_type(counting_type&& rhs) noexcept : value(rhs.value) { ++move_ctor_count; }
    counting_type& operator=(counting_type const&) = default;
    counting_type& operator=(counting_type&&) = default;
    ~counting_type() { ++dtor_count; }
};
} // namespace

TEST("optional - trivial types")
{
    SECTION("default and nullopt construction")
    {
        CHECK(!fc::optional<int>{}.has_value());
        CHECK(!fc::optional<int>{fc::nullopt}.has_value());
    }

    SECTION("value construction")
    {
        auto const opt = fc::optional<int>{42};
        CHECK(opt.has_value());
        CHECK(opt.value() == 42);
    }

    SECTION("copy and move keep the source engaged")
    {
        auto opt1 = fc::optional<int>{42};
        auto const opt2 = opt1;
        auto const opt3 = fc::move(opt1);
        CHECK(opt2.value() == 42);
        CHECK(opt3.value() == 42);
        CHECK(opt1.has_value());
    }

    SECTION("value and nullopt assignment")
    {
        auto opt = fc::optional<int>{};
        opt = 42;
        CHECK(opt.value() == 42);
        opt = fc::nullopt;
        CHECK(!opt.has_value());
    }
}

TEST("optional - non-trivial types")
{
    SECTION("move construction empties the source")
    {
        auto opt1 = fc::optional<non_trivial>{non_trivial{42}};
        auto const opt2 = fc::move(opt1);
        CHECK(opt2.value().value == 42);
        CHECK(!opt1.has_value());
    }

    SECTION("copy assignment")
    {
        auto opt1 = fc::optional<non_trivial>{non_trivial{42}};
        auto opt2 = fc::optional<non_trivial>{};
        opt2 = opt1;
        CHECK(opt2.value().value == 42);
        CHECK(opt1.value().value == 42);
    }

    SECTION("destructor runs on reset")
    {
        bool destroyed = false;
        auto opt = fc::optional<non_trivial>{};
        opt.emplace(1, &destroyed);
        CHECK(!destroyed);
        opt.reset();
        CHECK(destroyed);
        CHECK(!opt.has_value());
    }

    SECTION("strings")
    {
        auto opt = fc::optional<std::string>{"hello"};
        CHECK(opt.value() == "hello");

        opt = std::string{"world"};
        CHECK(opt.value() == "world");

        opt = fc::nullopt;
        CHECK(!opt.has_value());
    }

    SECTION("move-only types")
    {
        auto opt = fc::optional<std::unique_ptr<int>>{std::make_unique<int>(7)};
        std::unique_ptr<int> p = fc::move(opt).value();
        REQUIRE(p != nullptr);
        CHECK(*p == 7);
    }
}

TEST("optional - special member function counts")
{
    SECTION("value construction moves once")
    {
        counting_type::reset_counters();
        {
            auto const opt = fc::optional<counting_type>{counting_type{42}};
            CHECK(opt.value().value == 42);
        }
        CHECK(counting_type::value_ctor_count == 1);
        CHECK(counting_type::move_ctor_count == 1);
        CHECK(counting_type::copy_ctor_count == 0);
        CHECK(counting_type::dtor_count == 2);
    }

    SECTION("emplace constructs in place")
    {
        counting_type::reset_counters();
        {
            fc::optional<counting_type> opt;
            opt.emplace(5);
            CHECK(opt.value().value == 5);
        }
        CHECK(counting_type::value_ctor_count == 1);
        CHECK(counting_type::move_ctor_count == 0);
        CHECK(counting_type::dtor_count == 1);
    }
}

TEST("optional - value category of value()")
{
    auto opt = fc::optional<std::string>{"abc"};
    auto const& copt = opt;

    static_assert(std::is_same_v<decltype(opt.value()), std::string&>);
    static_assert(std::is_same_v<decltype(copt.value()), std::string const&>);
    static_assert(std::is_same_v<decltype(fc::move(opt).value()), std::string&&>);

    std::string moved = fc::move(opt).value();
    CHECK(moved == "abc");
}

TEST("optional - value_or")
{
    CHECK(fc::optional<int>{3}.value_or(7) == 3);
    CHECK(fc::optional<int>{}.value_or(7) == 7);
    CHECK(fc::optional<std::string>{}.value_or("fallback") == "fallback");
}

TEST("optional - comparison")
{
    SECTION("optional vs optional")
    {
        CHECK(fc::optional<int>{1} == fc::optional<int>{1});
        CHECK(fc::optional<int>{1} != fc::optional<int>{2});
        CHECK(fc::optional<int>{} == fc::optional<int>{});
        CHECK(fc::optional<int>{} != fc::optional<int>{0});
    }

    SECTION("optional vs value")
    {
        CHECK(fc::optional<int>{5} == 5);
        CHECK(fc::optional<int>{5} != 6);
        CHECK(fc::optional<int>{} != 5);
    }

    SECTION("optional vs nullopt")
    {
        CHECK(fc::optional<int>{} == fc::nullopt);
        CHECK(fc::optional<int>{1} != fc::nullopt);
    }
}

TEST("optional - references")
{
    SECTION("binds and reads through")
    {
        int x = 5;
        fc::optional<int&> ref = x;
        REQUIRE(ref.has_value());
        CHECK(&ref.value() == &x);

        ref.value() = 9;
        CHECK(x == 9);
    }

    SECTION("emplace and assignment rebind")
    {
        int a = 1;
        int b = 2;
        fc::optional<int&> ref = a;
        ref.emplace(b);
        CHECK(&ref.value() == &b);
        CHECK(a == 1);

        ref = fc::optional<int&>(a);
        CHECK(&ref.value() == &a);
        CHECK(b == 2);

        ref.reset();
        CHECK(!ref.has_value());
    }

    SECTION("constness is shallow")
    {
        int x = 1;
        fc::optional<int&> const ref = x;
        static_assert(std::is_same_v<decltype(ref.value()), int&>);
        ref.value() = 2;
        CHECK(x == 2);
    }

    SECTION("comparison looks at the referenced values")
    {
        int a = 3;
        int b = 3;
        CHECK(fc::optional<int&>(a) == fc::optional<int&>(b));
        CHECK(fc::optional<int&>(a) == 3);
        CHECK(fc::optional<int&>() == fc::nullopt);
        CHECK(fc::optional<int&>() != fc::optional<int&>(a));
    }

    SECTION("value_or copies")
    {
        int x = 4;
        CHECK(fc::optional<int&>(x).value_or(0) == 4);
        CHECK(fc::optional<int&>().value_or(0) == 0);
    }

    SECTION("converts to a const reference")
    {
        int x = 8;
        fc::optional<int const&> cref = fc::optional<int&>(x);
        CHECK(&cref.value() == &x);
    }
}
