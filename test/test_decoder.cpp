#include "test_helpers.hpp"
#include <csvl/decoder.hpp>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

struct maybe_name {
    std::optional<std::string> name;

    auto tied() {
        return std::tie(name);
    }
};

struct reading {
    std::string sensor;
    double value;
    std::vector<int> flags;

    auto tied() {
        return std::tie(sensor, value, flags);
    }
};

struct pod {
    int a;
    std::string b;
    double c;
};

TEST_CASE("testing decoder valid lines") {
    csvl::line_decoder<> d;

    {
        auto value = d.decode<int>("5");
        REQUIRE(d.valid());
        CHECK_EQ(value, 5);
    }
    {
        auto [x, y, z] = d.decode<int, std::string, bool>("5,foo,false");
        REQUIRE(d.valid());
        CHECK_EQ(x, 5);
        CHECK_EQ(y, "foo");
        CHECK_FALSE(z);
    }
    {
        auto value = d.decode<std::tuple<int, std::string, bool>>(
            "5,foo,false");
        REQUIRE(d.valid());
        CHECK_EQ(value, std::make_tuple(5, std::string{"foo"}, false));
    }
    {
        auto value = d.decode<reading>("t1;-0.5;1;0;1", ';');
        REQUIRE(d.valid());
        CHECK_EQ(value.sensor, "t1");
        CHECK_EQ(value.value, -0.5);
        CHECK_EQ(value.flags, std::vector<int>{1, 0, 1});
    }
    {
        auto value = d.decode<std::vector<double>>("1.5,2,+3e2\r\n");
        REQUIRE(d.valid());
        CHECK_EQ(value, std::vector<double>{1.5, 2, 300});
    }
}

TEST_CASE("testing decoder tab separated lines") {
    csvl::line_decoder<> d;
    auto [name, count, note] =
        d.decode<std::string, unsigned, std::optional<std::string>>(
            "apples\t12\t", '\t');
    REQUIRE(d.valid());
    CHECK_EQ(name, "apples");
    CHECK_EQ(count, 12);
    CHECK_FALSE(note.has_value());

    auto [quoted, tabbed] =
        d.decode<std::string, std::string>("\"a\tb\"\tc", '\t');
    REQUIRE(d.valid());
    CHECK_EQ(quoted, "a\tb");
    CHECK_EQ(tabbed, "c");
}

TEST_CASE("testing decoder decode object") {
    csvl::line_decoder<> d;

    auto value = d.decode_object<pod, int, std::string, double>("1,x,2.5");
    REQUIRE(d.valid());
    CHECK_EQ(value.a, 1);
    CHECK_EQ(value.b, "x");
    CHECK_EQ(value.c, 2.5);

    value = d.decode_object<pod, int, std::string, double>("1,x");
    REQUIRE_FALSE(d.valid());
    CHECK_EQ(d.error().kind, csvl::error_kind::missing_field);
    CHECK_EQ(value.a, 0);
    CHECK(value.b.empty());
}

TEST_CASE("testing decoder borrowed leaves") {
    csvl::line_decoder<> d;
    std::string line = R"(abc,"d""ef",g)";

    auto [plain, unescaped, last] =
        d.decode<std::string_view, std::string_view, std::string_view>(line);
    REQUIRE(d.valid());
    CHECK_EQ(plain, "abc");
    CHECK_EQ(unescaped, R"(d"ef)");
    CHECK_EQ(last, "g");

    std::string unquoted = "abc,def";
    auto [first, second] =
        d.decode<std::string_view, std::string_view>(unquoted);
    REQUIRE(d.valid());
    CHECK_EQ(first.data(), unquoted.data());
    CHECK_EQ(second, "def");
}

TEST_CASE("testing decoder split") {
    csvl::line_decoder<> d;

    auto fields = words(d.split(R"(x,"y,z")"));
    REQUIRE(d.valid());
    CHECK_EQ(fields, std::vector<std::string>{"x", "y,z"});

    std::ignore = d.split(R"(x,"y)");
    CHECK_FALSE(d.valid());
    CHECK(d.unterminated_quote());
    CHECK_EQ(d.error().kind, csvl::error_kind::malformed);

    std::ignore = d.split("x");
    CHECK(d.valid());
    CHECK_FALSE(d.unterminated_quote());
}

TEST_CASE("testing decoder invalid lines") {
    csvl::line_decoder<> d;

    {
        auto value = d.decode<int, int>("1,x");
        REQUIRE_FALSE(d.valid());
        CHECK_EQ(value, std::make_tuple(0, 0));
        CHECK_EQ(d.error().kind, csvl::error_kind::field_parse);
        CHECK_EQ(d.error().index, 1);
        CHECK_EQ(d.error().raw_text, "x");
    }
    {
        std::ignore = d.decode<int, int>("1");
        REQUIRE_FALSE(d.valid());
        CHECK_EQ(d.error().kind, csvl::error_kind::missing_field);
        CHECK_EQ(d.error().index, 1);
    }
    {
        std::ignore = d.decode<int, int>("1,2,3");
        REQUIRE_FALSE(d.valid());
        CHECK_EQ(d.error().kind, csvl::error_kind::trailing_fields);
        CHECK_EQ(d.error().remaining_count, 1);
    }
    {
        std::ignore = d.decode<int, int>(R"("1,2)");
        REQUIRE_FALSE(d.valid());
        CHECK(d.unterminated_quote());
        CHECK_EQ(d.error().kind, csvl::error_kind::malformed);
        CHECK_EQ(d.error().reason, "unterminated quote at position: 0");
    }
    {
        std::ignore = d.decode<std::map<int, int>>("1,2");
        REQUIRE_FALSE(d.valid());
        CHECK_EQ(d.error().kind, csvl::error_kind::unsupported_shape);
    }

    // the error is cleared by the next call
    std::ignore = d.decode<int, int>("1,2");
    CHECK(d.valid());
    CHECK(d.error().empty());
    CHECK_FALSE(d.unterminated_quote());
}

TEST_CASE("testing decoder with string error") {
    csvl::line_decoder<csvl::string_error> d;

    std::ignore = d.decode<int>("5");
    CHECK(d.valid());
    CHECK(d.error_msg().empty());

    for (const auto& [line, msg] :
         {std::pair<std::string, std::string>{
              "x,abc",
              "invalid conversion for parameter at column 2 as 'i32': 'abc'"},
          {"x", "missing field at column 2, expected 'i32'"},
          {"x,1,2,3", "invalid number of columns, 2 trailing field(s)"},
          {R"(x,"1)", "malformed line: unterminated quote at position: 2"}}) {
        std::ignore = d.decode<std::string, int>(line);
        CHECK_FALSE(d.valid());
        CHECK_EQ(d.error_msg(), msg);
    }

    std::ignore = d.decode<std::map<std::string, int>>("a,1");
    CHECK_FALSE(d.valid());
    CHECK_EQ(d.error_msg(),
             "unsupported shape: map-shaped target, a line carries no keys");

    std::ignore = d.decode<std::string, int>("x,1");
    CHECK(d.valid());
    CHECK(d.error_msg().empty());
}

TEST_CASE("testing decoder with throw on error") {
    csvl::line_decoder<csvl::throw_on_error> d;

    {
        auto [x, y] = d.decode<std::string, int>("x,1");
        CHECK_EQ(x, "x");
        CHECK_EQ(y, 1);
    }

    REQUIRE_EXCEPTION(csvl::error_kind::field_parse,
                      d.decode<std::string, int>("x,y"));
    REQUIRE_EXCEPTION(csvl::error_kind::missing_field,
                      d.decode<std::string, int>("x"));
    REQUIRE_EXCEPTION(csvl::error_kind::trailing_fields,
                      d.decode<std::string, int>("x,1,2"));
    REQUIRE_EXCEPTION(csvl::error_kind::malformed,
                      d.decode<std::string, int>(R"(x,"1)"));
    CHECK_FALSE(d.valid());
    CHECK_EQ(d.error().kind, csvl::error_kind::malformed);
    CHECK_EQ(d.error().reason, "unterminated quote at position: 2");
    CHECK(d.unterminated_quote());

    REQUIRE_EXCEPTION(csvl::error_kind::unsupported_shape,
                      d.decode<std::map<std::string, int>>("a,1"));
    CHECK_EQ(d.error().kind, csvl::error_kind::unsupported_shape);

    try {
        std::ignore = d.decode<std::string, int, bool>("x,1,yes");
        FAIL("Expected exception");
    } catch (csvl::exception& e) {
        CHECK_EQ(e.error().index, 2);
        CHECK_EQ(e.error().raw_text, "yes");
        CHECK_EQ(e.error().expected_kind, csvl::scalar_kind::boolean);
        CHECK_EQ(std::string{e.what()},
                 "invalid conversion for parameter at column 3 as 'bool': "
                 "'yes'");
    }
}

TEST_CASE("testing decoder map target with malformed line") {
    const std::string line = "\"abc";
    const std::string reason = "map-shaped target, a line carries no keys";

    {
        csvl::line_decoder<> d;
        std::ignore = d.decode<std::map<int, int>>(line);
        REQUIRE_FALSE(d.valid());
        CHECK_EQ(d.error().kind, csvl::error_kind::unsupported_shape);
        CHECK_EQ(d.error().reason, reason);
        CHECK_FALSE(d.unterminated_quote());
    }
    {
        csvl::line_decoder<csvl::string_error> d;
        std::ignore = d.decode<std::map<int, int>>(line);
        REQUIRE_FALSE(d.valid());
        CHECK_EQ(d.error_msg(), "unsupported shape: " + reason);
    }
    {
        csvl::line_decoder<csvl::throw_on_error> d;
        REQUIRE_EXCEPTION(csvl::error_kind::unsupported_shape,
                          d.decode<std::map<int, int>>(line));
        CHECK_EQ(d.error().reason, reason);
    }

    REQUIRE_EXCEPTION(csvl::error_kind::unsupported_shape,
                      csvl::from_str<std::map<int, int>>(line));
}

TEST_CASE("testing from str") {
    {
        auto value = csvl::from_str<maybe_name>("");
        CHECK_FALSE(value.name.has_value());
    }
    {
        auto value = csvl::from_str<maybe_name>("bob");
        CHECK_EQ(value.name, "bob");
    }
    {
        auto value = csvl::from_str<std::tuple<std::string, int>>("foo,42");
        CHECK_EQ(value, std::make_tuple(std::string{"foo"}, 42));
    }
    {
        auto [s, i] = csvl::from_str<std::string, int>("foo,42");
        CHECK_EQ(s, "foo");
        CHECK_EQ(i, 42);
    }
    {
        auto value = csvl::from_str<std::vector<long long>>(
            "-9223372036854775808,0,9223372036854775807");
        CHECK_EQ(value,
                 std::vector<long long>{std::numeric_limits<long long>::min(),
                                        0,
                                        std::numeric_limits<long long>::max()});
    }

    REQUIRE_EXCEPTION(csvl::error_kind::field_parse, csvl::from_str<int>(""));
    REQUIRE_EXCEPTION(csvl::error_kind::trailing_fields,
                      csvl::from_str<maybe_name>("a,b"));
    REQUIRE_EXCEPTION(csvl::error_kind::malformed,
                      csvl::from_str<std::string>("\"abc"));
    REQUIRE_EXCEPTION(csvl::error_kind::unsupported_shape,
                      csvl::from_str<std::map<int, int>>("1,2"));
}

TEST_CASE("testing from str sep") {
    {
        auto value =
            csvl::from_str_sep<std::tuple<std::string, int>>("foo 42", ' ');
        CHECK_EQ(value, std::make_tuple(std::string{"foo"}, 42));
    }
    {
        auto value = csvl::from_str_sep<reading>("t2|1e-3|7", '|');
        CHECK_EQ(value.sensor, "t2");
        CHECK_EQ(value.value, 1e-3);
        CHECK_EQ(value.flags, std::vector<int>{7});
    }

    REQUIRE_EXCEPTION(csvl::error_kind::trailing_fields,
                      csvl::from_str_sep<std::tuple<std::string, int>>(
                          "foo,42", ','));
    REQUIRE_EXCEPTION(csvl::error_kind::missing_field,
                      csvl::from_str_sep<std::tuple<std::string, int>>(
                          "foo,42", ';'));
}

TEST_CASE("testing decoder round trip of rendered fields") {
    csvl::line_decoder<> d;

    const auto expected = std::make_tuple(
        std::numeric_limits<int>::min(), std::numeric_limits<unsigned>::max(),
        short{-7}, std::numeric_limits<unsigned long long>::max(), true, 'q',
        std::string{"text"});

    std::string line;
    line.append(std::to_string(std::get<0>(expected)))
        .append(",")
        .append(std::to_string(std::get<1>(expected)))
        .append(",")
        .append(std::to_string(std::get<2>(expected)))
        .append(",")
        .append(std::to_string(std::get<3>(expected)))
        .append(",true,q,text");

    auto value = d.decode<int, unsigned, short, unsigned long long, bool, char,
                          std::string>(line);
    REQUIRE(d.valid());
    CHECK_EQ(value, expected);
}
