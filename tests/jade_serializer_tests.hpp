#ifndef JADE_TESTS_SERIALIZER__
#define JADE_TESTS_SERIALIZER__

#include "jade_test_harness.hpp"
#include "../include/jade_edit.hpp"
#include "../include/jade_parser.hpp"
#include "../include/jade_serializer.hpp"

#include <limits>

namespace jade::tests
{
using namespace jade;

// Applies `op` to the parse of `src` and serializes against `src`.
inline std::optional<std::string> edited(std::string_view src, edit_operation const & op)
{
    auto ctx = parse(src);
    if (!ctx.result)
        return std::nullopt;

    auto tree = jade::apply(op, ctx.result->root);
    if (!tree)
        return std::nullopt;

    return serialize(*tree, *ctx.result->source);
}

inline size_t changed_lines(std::string_view a, std::string_view b)
{
    auto lines = [](std::string_view s)
    {
        std::vector<std::string_view> out;
        size_t pos = 0;
        while (pos <= s.size())
        {
            size_t eol = s.find('\n', pos);
            if (eol == std::string_view::npos)
                eol = s.size();
            out.push_back(s.substr(pos, eol - pos));
            pos = eol + 1;
        }
        return out;
    };

    auto la = lines(a);
    auto lb = lines(b);

    // Lines outside the common head and tail count as changed.
    size_t head = 0;
    while (head < la.size() && head < lb.size() && la[head] == lb[head])
        ++head;

    size_t tail = 0;
    while (tail < la.size() - head && tail < lb.size() - head
           && la[la.size() - 1 - tail] == lb[lb.size() - 1 - tail])
        ++tail;

    return std::max(la.size() - head - tail, lb.size() - head - tail);
}

constexpr std::string_view config_src =
    "{\n"
    "  \"name\": \"app\",\n"
    "  \"version\": 1,\n"
    "  \"flags\": {\n"
    "    \"beta\": false,\n"
    "    \"dark\": true\n"
    "  }\n"
    "}\n";

//------------------------------------------------------------------------

inline bool unchanged_tree_is_byte_identical()
{
    constexpr std::string_view src =
        "  {\n\t\"b\" :  1,\n\t\"a\":[ 1,2 ] , \"c\" : {\"x\":null}, \"d\": 1.50}\n\n";

    auto ctx = parse(src);
    EXPECT(ctx.has_value(), "source should parse");

    auto out = serialize(ctx.result->root, *ctx.result->source);
    EXPECT(out && *out == src, "unedited tree reproduces the original bytes");

    auto via_text = serialize(ctx.result->root, src);
    EXPECT(via_text && *via_text == src, "text overload agrees");

    return true;
}

inline bool leaf_edit_touches_one_line()
{
    auto out = edited(config_src, set_value{ { "flags", "beta" }, true });

    std::string expected(config_src);
    expected.replace(expected.find("false"), 5, "true");

    EXPECT(out && *out == expected, "only the value text changes");

    return true;
}

inline bool new_key_follows_sibling_style()
{
    auto out = edited(config_src, add_field{ { "flags" }, "fresh", "x" });

    constexpr std::string_view expected =
        "{\n"
        "  \"name\": \"app\",\n"
        "  \"version\": 1,\n"
        "  \"flags\": {\n"
        "    \"beta\": false,\n"
        "    \"dark\": true,\n"
        "    \"fresh\": \"x\"\n"
        "  }\n"
        "}\n";

    EXPECT(out && *out == expected, "appended after last key with sibling indentation");

    return true;
}

inline bool deleted_members_take_their_separator()
{
    auto first = edited(config_src, delete_field{ { "name" } });
    constexpr std::string_view without_first =
        "{\n"
        "  \"version\": 1,\n"
        "  \"flags\": {\n"
        "    \"beta\": false,\n"
        "    \"dark\": true\n"
        "  }\n"
        "}\n";
    EXPECT(first && *first == without_first, "first member removed cleanly");

    auto last = edited(config_src, delete_field{ { "flags" } });
    constexpr std::string_view without_last =
        "{\n"
        "  \"name\": \"app\",\n"
        "  \"version\": 1\n"
        "}\n";
    EXPECT(last && *last == without_last, "last member removed without trailing comma");

    return true;
}

inline bool emptied_object_collapses()
{
    auto out = edited(R"({"a": {"x": 1}, "b": 2})", delete_field{ { "a", "x" } });
    EXPECT(out && *out == R"({"a": {}, "b": 2})", "no members left");

    return true;
}

inline bool new_container_in_multiline_object()
{
    auto out = edited(config_src, add_field{ {}, "list", value::make_array({ 1, 2 }) });

    constexpr std::string_view expected =
        "{\n"
        "  \"name\": \"app\",\n"
        "  \"version\": 1,\n"
        "  \"flags\": {\n"
        "    \"beta\": false,\n"
        "    \"dark\": true\n"
        "  },\n"
        "  \"list\": [\n"
        "    1,\n"
        "    2\n"
        "  ]\n"
        "}\n";

    EXPECT(out && *out == expected, "one element per line at the next indent");

    return true;
}

inline bool new_container_in_inline_object()
{
    auto compact = edited(R"({"a":1,"b":2})", add_field{ {}, "c", 3 });
    EXPECT(compact && *compact == R"({"a":1,"b":2,"c":3})", "compact separators reused");

    auto nested = edited(R"({"a": 1, "b": 2})",
        add_field{ {}, "o", value::make_object({ { "k", value::make_array({ 1, 2 }) } }) });
    EXPECT(nested && *nested == R"({"a": 1, "b": 2, "o": {"k": [1, 2]}})", "nested container rendered inline");

    return true;
}

inline bool single_member_inline_container_grows()
{
    auto object = edited(R"({"a": 1})", add_field{ {}, "b", 2 });
    EXPECT(object && *object == R"({"a": 1, "b": 2})", "separator after the only member");

    auto array = edited(R"({"n": [1]})", insert_array_element{ { "n" }, 2, std::nullopt });
    EXPECT(array && *array == R"({"n": [1, 2]})", "separator after the only element");

    auto spaced = edited(R"({ "a": 1 })", add_field{ {}, "b", 2 });
    EXPECT(spaced && *spaced == R"({ "a": 1, "b": 2 })", "padding inside braces kept");

    return true;
}

inline bool empty_object_gains_keys()
{
    auto out = edited("{\n  \"a\": {}\n}", set_value{ { "a", "k" }, 1 });
    EXPECT(out && *out == "{\n  \"a\": {\n    \"k\": 1\n  }\n}", "fresh multi-line rendering");

    return true;
}

inline bool scalar_replaced_by_container()
{
    auto out = edited("{\n  \"a\": 1,\n  \"b\": 2\n}", set_value{ { "a" }, value::make_object({ { "x", 1 } }) });
    EXPECT(out && *out == "{\n  \"a\": {\n    \"x\": 1\n  },\n  \"b\": 2\n}", "indented from the key's line");

    return true;
}

inline bool detected_four_space_indent()
{
    auto out = edited("{\n    \"a\": 1\n}", add_field{ {}, "b", value::make_object({ { "c", true } }) });
    EXPECT(out && *out == "{\n    \"a\": 1,\n    \"b\": {\n        \"c\": true\n    }\n}", "four space unit");

    return true;
}

inline bool detected_tab_indent()
{
    auto out = edited("{\n\t\"a\": 1\n}", add_field{ {}, "b", value::make_array({ "x" }) });
    EXPECT(out && *out == "{\n\t\"a\": 1,\n\t\"b\": [\n\t\t\"x\"\n\t]\n}", "tab unit");

    return true;
}

inline bool detect_indentation_cases()
{
    EXPECT(detect_indentation("{\n  \"a\": {\n    \"b\": 1\n  }\n}") == "  ", "two spaces");
    EXPECT(detect_indentation("{\n    \"a\": 1\n}") == "    ", "four spaces");
    EXPECT(detect_indentation("{\n\t\"a\": 1\n}") == "\t", "tab");
    EXPECT(detect_indentation("{\"a\": 1}") == "  ", "default");

    return true;
}

//------------------------------------------------------------------------

inline bool array_insert_keeps_neighbours()
{
    constexpr std::string_view src =
        "{\n"
        "  \"items\": [\n"
        "    \"one\",\n"
        "    \"two\",\n"
        "    \"three\"\n"
        "  ]\n"
        "}";

    auto out = edited(src, insert_array_element{ { "items" }, "new", 1 });

    constexpr std::string_view expected =
        "{\n"
        "  \"items\": [\n"
        "    \"one\",\n"
        "    \"new\",\n"
        "    \"two\",\n"
        "    \"three\"\n"
        "  ]\n"
        "}";

    EXPECT(out && *out == expected, "inserted element on its own line");

    return true;
}

inline bool array_delete_and_move()
{
    auto removed = edited(R"({"list": ["a", "b", "c"]})", delete_array_element{ { "list", "1" } });
    EXPECT(removed && *removed == R"({"list": ["a", "c"]})", "middle element dropped");

    auto moved = edited(R"({"n": [1, 2, 3, 4]})", move_array_element{ { "n" }, 0, 2 });
    EXPECT(moved && *moved == R"({"n": [2, 3, 1, 4]})", "moved element re-rendered in place");

    auto appended = edited(R"({"arr": ["x", "y"]})", insert_array_element{ { "arr" }, "z", std::nullopt });
    EXPECT(appended && *appended == R"({"arr": ["x", "y", "z"]})", "append inline");

    return true;
}

inline bool array_element_edit_is_recursive()
{
    constexpr std::string_view src =
        "{\"rows\": [\n"
        "  {\"id\": 1, \"on\": true},\n"
        "  {\"id\": 2, \"on\": true}\n"
        "]}";

    auto out = edited(src, set_value{ { "rows", "1", "on" }, false });

    constexpr std::string_view expected =
        "{\"rows\": [\n"
        "  {\"id\": 1, \"on\": true},\n"
        "  {\"id\": 2, \"on\": false}\n"
        "]}";

    EXPECT(out && *out == expected, "changed element diffed, not re-rendered");

    return true;
}

//------------------------------------------------------------------------

inline bool canonical_form_without_original()
{
    auto tree = value::make_object({
        { "b", 1 },
        { "a", value::make_array({ 1, 2 }) },
        { "c", value::make_object({}) }
    });

    auto out = serialize(tree);
    constexpr std::string_view expected =
        "{\n"
        "  \"a\": [\n"
        "    1,\n"
        "    2\n"
        "  ],\n"
        "  \"b\": 1,\n"
        "  \"c\": {}\n"
        "}";

    EXPECT(out && *out == expected, "sorted keys, two space indent");

    return true;
}

inline bool scalars_render_as_json()
{
    auto tree = value::make_object({
        { "d", 1.0 },
        { "h", 0.5 },
        { "s", "line\nbreak \"q\" \x01" },
        { "n", value() }
    });

    auto out = serialize(tree);
    EXPECT(out.has_value(), "representable");
    EXPECT(out->find("\"d\": 1.0") != std::string::npos, "integral decimal keeps a point");
    EXPECT(out->find("\"h\": 0.5") != std::string::npos, "shortest decimal");
    EXPECT(out->find(R"("line\nbreak \"q\" \u0001")") != std::string::npos, "escaped string");
    EXPECT(out->find("\"n\": null") != std::string::npos, "null");

    auto back = parse(*out);
    EXPECT(back.has_value() && back.result->root == tree, "re-parses to the same tree");
    EXPECT(back.result->root.find("d")->is_decimal(), "decimal stays decimal");

    return true;
}

inline bool non_finite_decimal_is_unrepresentable()
{
    auto tree = value::make_object({ { "x", std::numeric_limits<double>::infinity() } });
    EXPECT(!serialize(tree), "canonical form fails");

    auto out = edited(R"({"x": 1})", set_value{ { "x" }, std::numeric_limits<double>::quiet_NaN() });
    EXPECT(!out, "preserving form fails");

    return true;
}

//------------------------------------------------------------------------

inline bool single_leaf_edit_in_large_document()
{
    value::object_type groups;
    for (int g = 0; g < 200; ++g)
    {
        value::object_type fields;
        for (int f = 0; f < 10; ++f)
            fields.emplace_back("field_" + std::to_string(f), "value " + std::to_string(g * 10 + f));
        groups.emplace_back("group_" + std::to_string(g), value(std::move(fields)));
    }

    auto src = serialize(value(std::move(groups)));
    EXPECT(src.has_value(), "large document renders");

    auto out = edited(*src, set_value{ { "group_117", "field_4" }, "changed" });
    EXPECT(out.has_value(), "edit applies");
    EXPECT(changed_lines(*src, *out) == 1, "exactly one line differs");

    auto added = edited(*src, add_field{ { "group_3" }, "extra", 1 });
    EXPECT(added && changed_lines(*src, *added) <= 3, "new key shifts only a few lines");

    return true;
}

inline bool reparse_after_many_edits()
{
    auto ctx = parse(config_src);
    EXPECT(ctx.has_value(), "source parses");

    std::vector<edit_operation> ops = {
        add_field{ {}, "tags", value::make_array({ "a", "b", "c" }) },
        move_array_element{ { "tags" }, 2, 0 },
        delete_field{ { "version" } },
        set_value{ { "flags", "dark" }, value::make_object({ { "level", 2.25 } }) },
        insert_array_element{ { "tags" }, value::make_object({ { "k", value() } }), 1 },
        delete_array_element{ { "tags", "3" } },
        add_field{ { "flags" }, "quote", "say \"hi\"" },
    };

    value tree = ctx.result->root;
    for (auto const & op : ops)
    {
        auto next = jade::apply(op, tree);
        EXPECT(next.has_value(), "every edit in the sequence applies");
        tree = *next;
    }

    auto out = serialize(tree, *ctx.result->source);
    EXPECT(out.has_value(), "serializes");

    auto back = parse(*out);
    EXPECT(back.has_value(), "output is valid JSON");
    EXPECT(back.result->root == tree, "re-parse gives the serialized tree");

    auto again = serialize(back.result->root, *back.result->source);
    EXPECT(again && *again == *out, "second round trip is byte identical");

    return true;
}

inline void run_serializer_tests()
{
    SUBCAT("Round trip");
    RUN_TEST(unchanged_tree_is_byte_identical);
    RUN_TEST(reparse_after_many_edits);

    SUBCAT("Objects");
    RUN_TEST(leaf_edit_touches_one_line);
    RUN_TEST(new_key_follows_sibling_style);
    RUN_TEST(deleted_members_take_their_separator);
    RUN_TEST(emptied_object_collapses);
    RUN_TEST(new_container_in_multiline_object);
    RUN_TEST(new_container_in_inline_object);
    RUN_TEST(single_member_inline_container_grows);
    RUN_TEST(empty_object_gains_keys);
    RUN_TEST(scalar_replaced_by_container);

    SUBCAT("Indentation");
    RUN_TEST(detected_four_space_indent);
    RUN_TEST(detected_tab_indent);
    RUN_TEST(detect_indentation_cases);

    SUBCAT("Arrays");
    RUN_TEST(array_insert_keeps_neighbours);
    RUN_TEST(array_delete_and_move);
    RUN_TEST(array_element_edit_is_recursive);

    SUBCAT("Canonical form");
    RUN_TEST(canonical_form_without_original);
    RUN_TEST(scalars_render_as_json);
    RUN_TEST(non_finite_decimal_is_unrepresentable);

    SUBCAT("Diff minimality");
    RUN_TEST(single_leaf_edit_in_large_document);
}

}

#endif
