#ifndef JADE_TESTS_VALUE__
#define JADE_TESTS_VALUE__

#include "jade_test_harness.hpp"
#include "../include/jade_core.hpp"

namespace jade::tests
{
using namespace jade;

inline bool value_tags_follow_construction()
{
    EXPECT(value().is_null(), "default value should be null");
    EXPECT(value(nullptr).is_null(), "nullptr should be null");
    EXPECT(value(true).is_bool(), "bool should be boolean");
    EXPECT(value(42).is_integer(), "int should be integer");
    EXPECT(value(int64_t{ -7 }).is_integer(), "int64 should be integer");
    EXPECT(value(1.5).is_decimal(), "double should be decimal");
    EXPECT(value("hi").is_string(), "literal should be string");
    EXPECT(value(std::string_view("hi")).is_string(), "string_view should be string");
    EXPECT(value::make_array({ 1, 2 }).is_array(), "make_array should be array");
    EXPECT(value::make_object({ { "a", 1 } }).is_object(), "make_object should be object");

    EXPECT(type_name(value(1.5).type()) == "number", "decimal is a JSON Schema number");
    EXPECT(type_name(value(1).type()) == "integer", "integer type name");

    return true;
}

inline bool characters_are_not_integers()
{
    EXPECT(!(std::is_constructible_v<value, char>), "char does not become an integer");
    EXPECT(!(std::is_constructible_v<value, char8_t>), "char8_t rejected");
    EXPECT(!(std::is_constructible_v<value, char16_t>), "char16_t rejected");
    EXPECT(!(std::is_constructible_v<value, char32_t>), "char32_t rejected");

    EXPECT(value(static_cast<signed char>(-3)) == value(-3), "signed char is a small integer");
    EXPECT(value(uint16_t{ 7 }).is_integer(), "other integral types still accepted");
    EXPECT(value(std::string(1, 'x')) == value("x"), "a one character string is the way to store a char");

    return true;
}

inline bool accessors_return_null_on_mismatch()
{
    value v("text");
    EXPECT(v.as_string() && *v.as_string() == "text", "string payload");
    EXPECT(v.as_integer() == nullptr, "integer accessor should be null");
    EXPECT(v.as_object() == nullptr, "object accessor should be null");
    EXPECT(v.size() == 0, "scalars have no size");
    EXPECT(v.members().empty() && v.elements().empty(), "scalars have no children");
    EXPECT(!value(true).as_number(), "booleans are not numbers");
    EXPECT(*value(3).as_number() == 3.0, "integer widens to number");

    return true;
}

inline bool object_preserves_insertion_order()
{
    auto obj = value::make_object({ { "zeta", 1 }, { "alpha", 2 }, { "mid", 3 } });

    auto const & m = obj.members();
    EXPECT(m.size() == 3, "three members");
    EXPECT(m[0].first == "zeta" && m[1].first == "alpha" && m[2].first == "mid", "order as given");
    EXPECT(obj.find("alpha") && *obj.find("alpha") == value(2), "find by key");
    EXPECT(!obj.contains("missing"), "absent key");

    return true;
}

inline bool builder_duplicate_keys_keep_first_position()
{
    auto obj = value::make_object({ { "a", 1 }, { "b", 2 }, { "a", 3 } });

    EXPECT(obj.size() == 2, "duplicates collapse");
    EXPECT(obj.members()[0].first == "a", "first position kept");
    EXPECT(*obj.find("a") == value(3), "last value wins");

    return true;
}

inline bool object_equality_ignores_order()
{
    auto a = value::make_object({ { "x", 1 }, { "y", value::make_array({ 1, 2 }) } });
    auto b = value::make_object({ { "y", value::make_array({ 1, 2 }) }, { "x", 1 } });
    auto c = value::make_object({ { "x", 1 }, { "y", value::make_array({ 2, 1 }) } });

    EXPECT(a == b, "objects compare as mappings");
    EXPECT(!(a == c), "arrays compare in order");

    return true;
}

inline bool integer_never_equals_decimal()
{
    EXPECT(!(value(1) == value(1.0)), "integer and decimal differ");
    EXPECT(value(1.0) == value(1.0), "decimals compare by payload");
    EXPECT(!(value(0) == value(false)), "integer and boolean differ");
    EXPECT(!(value() == value("null")), "null and string differ");

    return true;
}

inline bool copies_share_container_storage()
{
    auto big = value::make_object({ { "list", value::make_array({ 1, 2, 3 }) } });
    value copy = big;

    EXPECT(copy.shares_storage_with(big), "copy should share storage");
    EXPECT(copy.find("list")->shares_storage_with(*big.find("list")), "children shared too");
    EXPECT(!value(1).shares_storage_with(value(1)), "scalars never share");

    return true;
}

inline bool paths_split_join_and_resolve()
{
    path p = split_path("a.b.0");
    EXPECT(p.size() == 3 && p[2] == "0", "split on dots");
    EXPECT(join_path(p) == "a.b.0", "join is the inverse");
    EXPECT(split_path("").empty(), "empty string is the root path");

    EXPECT(parse_index("12") == size_t{ 12 }, "plain digits parse");
    EXPECT(!parse_index("-1"), "negative index rejected");
    EXPECT(!parse_index("[1]"), "bracketed index rejected");
    EXPECT(!parse_index(""), "empty index rejected");
    EXPECT(!parse_index("99999999999999999999999"), "overflow rejected");

    auto root = value::make_object({
        { "a", value::make_object({ { "b", value::make_array({ "x", "y" }) } }) }
    });

    auto hit = resolve(root, { "a", "b", "1" });
    EXPECT(hit && *hit == value("y"), "resolve through object and array");
    EXPECT(!resolve(root, { "a", "b", "2" }), "out of range index");
    EXPECT(!resolve(root, { "a", "c" }), "missing key");
    EXPECT(resolve(root, {}) == &root, "empty path is the root");

    return true;
}

inline bool utf8_length_counts_code_points()
{
    EXPECT(detail::utf8_length("abc") == 3, "ascii");
    EXPECT(detail::utf8_length("h\xC3\xA9llo") == 5, "two byte sequence");
    EXPECT(detail::utf8_length("\xF0\x9F\x98\x80") == 1, "four byte sequence");

    return true;
}

inline void run_value_tests()
{
    SUBCAT("Construction");
    RUN_TEST(value_tags_follow_construction);
    RUN_TEST(characters_are_not_integers);
    RUN_TEST(accessors_return_null_on_mismatch);

    SUBCAT("Objects");
    RUN_TEST(object_preserves_insertion_order);
    RUN_TEST(builder_duplicate_keys_keep_first_position);

    SUBCAT("Equality and sharing");
    RUN_TEST(object_equality_ignores_order);
    RUN_TEST(integer_never_equals_decimal);
    RUN_TEST(copies_share_container_storage);

    SUBCAT("Paths");
    RUN_TEST(paths_split_join_and_resolve);
    RUN_TEST(utf8_length_counts_code_points);
}

}

#endif
