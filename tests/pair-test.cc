#include <fold-core/pair.hh>

#include <nexus/test.hh>

#include <string>

static_assert(std::is_aggregate_v<fc::pair<int, float>>);
static_assert(std::is_trivially_copyable_v<fc::pair<int, float>>);
static_assert(std::tuple_size_v<fc::pair<int, std::string>> == 2);
static_assert(std::is_same_v<std::tuple_element_t<1, fc::pair<int, std::string>>, std::string>);

TEST("pair - construction and access")
{
    auto p = fc::pair<int, std::string>{1, "one"};
    CHECK(p.first == 1);
    CHECK(p.second == "one");

    p.second = "uno";
    CHECK(get<1>(p) == "uno");
    CHECK(get<0>(p) == 1);
}

TEST("pair - structured bindings")
{
    SECTION("by value")
    {
        auto [a, b] = fc::pair<int, char>{3, 'x'};
        CHECK(a == 3);
        CHECK(b == 'x');
    }

    SECTION("by reference")
    {
        auto p = fc::pair<int, int>{1, 2};
        auto& [a, b] = p;
        a = 10;
        b = 20;
        CHECK(p.first == 10);
        CHECK(p.second == 20);
    }

    SECTION("reference members")
    {
        int value = 5;
        auto p = fc::pair<fc::isize, int&>{0, value};
        auto [idx, ref] = p;
        ref = 6;
        CHECK(idx == 0);
        CHECK(value == 6);
    }
}

TEST("pair - comparison")
{
    using P = fc::pair<int, int>;

    CHECK(P{1, 2} == P{1, 2});
    CHECK(P{1, 2} != P{1, 3});
    CHECK(P{1, 9} < P{2, 0});
    CHECK(P{1, 2} < P{1, 3});
    CHECK(P{2, 0} > P{1, 9});
}

TEST("pair - get preserves value category")
{
    auto p = fc::pair<int, std::string>{1, "moved"};
    auto const& cp = p;

    static_assert(std::is_same_v<decltype(get<1>(p)), std::string&>);
    static_assert(std::is_same_v<decltype(get<1>(cp)), std::string const&>);
    static_assert(std::is_same_v<decltype(get<1>(fc::move(p))), std::string&&>);

    std::string s = get<1>(fc::move(p));
    CHECK(s == "moved");
}

TEST("pair - reference members compare values")
{
    int a = 1;
    int b = 1;
    int c = 2;

    using P = fc::pair<fc::isize, int&>;
    CHECK(P{0, a} == P{0, b});
    CHECK(P{0, a} != P{0, c});
    CHECK(P{0, c} > P{0, a});
    CHECK(P{0, c} < P{1, a});
}
