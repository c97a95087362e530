#include "include/jade.hpp"
#include <iostream>

// Example localization file, as a translator would have written it
const char* example_strings = R"({
    "greeting": {
        "translation": "Hello",
        "notes": "Shown on the start screen",
        "legacy_key": "hello_v1"
    },
    "farewell": {
        "translation": "Goodbye",
        "notes": null
    },
    "plurals": ["one", "other"],
    "meta": { "owner": "loc-team@example.com", "updated": "2025-11-02" }
}
)";

const char* example_schema = R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "title": "Localization strings",
  "type": "object",
  "required": ["greeting", "farewell", "meta"],
  "properties": {
    "greeting": { "type": "object", "required": ["translation"] },
    "farewell": {
      "type": "object",
      "required": ["translation", "notes"],
      "properties": {
        "translation": { "type": "string", "minLength": 1 },
        "notes": { "type": ["string", "null"] }
      }
    },
    "plurals": { "type": "array", "items": { "enum": ["zero", "one", "two", "few", "many", "other"] } },
    "meta": {
      "type": "object",
      "additionalProperties": false,
      "properties": {
        "owner": { "type": "string", "format": "email" },
        "updated": { "type": "string", "format": "date" }
      }
    }
  }
})";

void print_separator(const std::string& title)
{
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

void print_findings(const jade::validation_result& result)
{
    if (result.errors.empty())
    {
        std::cout << "✓ No findings\n";
        return;
    }

    for (const auto& [where, findings] : result.errors_by_path())
    {
        for (const auto& f : findings)
        {
            std::cout << (f.level == jade::severity::error ? "  ✗ " : "  ! ")
                      << where << ": " << f.message << "\n";
        }
    }
}

void example_loading()
{
    print_separator("EXAMPLE 1: Loading");

    auto ctx = jade::load(example_strings, "strings/en.json");
    if (!ctx.has_value())
    {
        std::cout << "✗ Load failed:\n";
        for (const auto& err : ctx.errors)
            std::cout << "  " << err.where.line << ":" << err.where.column << " " << err.message << "\n";
        return;
    }

    const jade::document& doc = *ctx.result;
    std::cout << "✓ Loaded " << doc.file_name() << " (" << doc.content().size() << " top-level keys)\n";

    for (const auto& [key, val] : doc.content().members())
        std::cout << "  • " << key << ": " << jade::type_name(val.type()) << "\n";

    auto bad = jade::load("[\"not\", \"an\", \"object\"]", "bad.json");
    std::cout << "\nLoading an array root: " << (bad.has_value() ? "accepted" : bad.errors[0].message) << "\n";
}

void example_editing()
{
    print_separator("EXAMPLE 2: Editing Without Reformatting");

    auto ctx = jade::load(example_strings, "strings/en.json");
    if (!ctx.has_value())
        return;

    std::vector<jade::edit_operation> edits = {
        jade::set_value{ { "greeting", "translation" }, "Hello there" },
        jade::add_field{ { "farewell" }, "context", "Logout dialog" },
        jade::delete_field{ { "greeting", "legacy_key" } },
        jade::insert_array_element{ { "plurals" }, "few", 1 },
    };

    std::optional<jade::document> doc = *ctx.result;
    for (const auto& op : edits)
    {
        auto next = doc->with_edit(op);
        std::cout << (next ? "✓ " : "✗ ") << jade::describe(op) << "\n";
        if (next)
            doc = std::move(next);
    }

    auto failed = doc->with_updated_value(1, { "meta", "owner", "name" });
    std::cout << (failed ? "✓ " : "✗ ") << "Set meta.owner.name (parent is a string)\n";

    std::cout << "\nEdited paths:";
    for (const auto& p : doc->edited_paths())
        std::cout << " " << p;
    std::cout << "\n\nSerialized:\n" << doc->serialize().value_or("<failed>");

    std::cout << "\nChanges against the loaded file:\n";
    for (const auto& [where, status] : jade::compute_changes(doc->content(), &ctx.result->content()))
        std::cout << "  " << jade::to_string(status) << " " << where << "\n";
}

void example_validation()
{
    print_separator("EXAMPLE 3: Schema Validation");

    auto schema_ctx = jade::parse_schema(example_schema);
    if (!schema_ctx.has_value())
    {
        for (const auto& err : schema_ctx.errors)
            std::cout << "✗ " << err.message << "\n";
        return;
    }

    const jade::schema& schema = *schema_ctx.result;
    std::cout << "Schema \"" << schema.title << "\" declares:\n";
    for (const auto& [where, info] : jade::extract_property_info(schema))
    {
        std::cout << "  " << where;
        if (!info.type_string().empty())
            std::cout << " : " << info.type_string();
        if (info.is_required)
            std::cout << " (required)";
        std::cout << "\n";
    }

    auto ctx = jade::load(example_strings, "strings/en.json");
    if (!ctx.has_value())
        return;

    std::cout << "\nLoaded file:\n";
    print_findings(jade::validate(ctx.result->content(), schema));

    auto broken = ctx.result->with_edit(jade::delete_field{ { "farewell", "notes" } });
    broken = broken->with_updated_value("loc-team", { "meta", "owner" });
    broken = broken->with_updated_value("2025", { "meta", "reviewer" });

    std::cout << "\nAfter edits:\n";
    auto result = jade::validate(broken->content(), schema);
    print_findings(result);
    std::cout << result.error_count() << " errors, " << result.warning_count() << " warnings\n";
}

int main()
{
    jade::log::set_level(jade::log::severity::info);

    example_loading();
    example_editing();
    example_validation();

    return 0;
}
