// jade_schema.hpp - JSON Authored Document Engine (Jade) - Schema Model
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// The practical subset of JSON Schema used to describe localization and
// feature-flag files: types, properties, required, enum, pattern, format,
// numeric and length bounds, items, deprecated and additionalProperties.
// Unknown keywords are ignored.

#ifndef JADE_SCHEMA_HPP
#define JADE_SCHEMA_HPP

#include "jade_core.hpp"
#include "jade_log.hpp"
#include "jade_parser.hpp"

#include <map>
#include <set>

namespace jade
{
//========================================================================
// Schema model
//========================================================================

    enum class schema_type
    {
        string,
        integer,
        number,
        boolean,
        null,
        array,
        object
    };

    inline std::string_view to_string(schema_type t)
    {
        switch (t)
        {
            case schema_type::string:  return "string";
            case schema_type::integer: return "integer";
            case schema_type::number:  return "number";
            case schema_type::boolean: return "boolean";
            case schema_type::null:    return "null";
            case schema_type::array:   return "array";
            case schema_type::object:  return "object";
        }
        return "unknown";
    }

    inline std::optional<schema_type> schema_type_from(std::string_view name)
    {
        for (auto t : { schema_type::string, schema_type::integer, schema_type::number, schema_type::boolean,
                        schema_type::null, schema_type::array, schema_type::object })
        {
            if (to_string(t) == name)
                return t;
        }
        return std::nullopt;
    }

    struct schema
    {
        using additional = std::variant<bool, std::shared_ptr<const schema>>;

        std::vector<schema_type>                    types;        // empty: any type
        std::vector<std::pair<std::string, schema>> properties;   // authored order
        std::vector<std::string>                    required;

        std::optional<std::string> pattern;
        std::optional<std::string> format;
        std::optional<std::vector<value>> enum_values;

        std::optional<double> minimum;
        std::optional<double> maximum;
        std::optional<size_t> min_length;
        std::optional<size_t> max_length;

        bool                          deprecated = false;
        additional                    additional_properties = true;
        std::shared_ptr<const schema> items;
        std::optional<value>          default_value;

        std::string title;
        std::string description;
        std::string schema_uri;

        schema const* property(std::string_view name) const
        {
            for (auto const & [n, s] : properties)
                if (n == name) return &s;
            return nullptr;
        }

        // Walks `properties`, or `items` for a segment that names no
        // property. Null when the path leaves the schema.
        schema const* at(path const & p) const
        {
            schema const* cur = this;
            for (auto const & seg : p)
            {
                if (auto next = cur->property(seg))
                    cur = next;
                else if (cur->items)
                    cur = cur->items.get();
                else
                    return nullptr;
            }
            return cur;
        }

        bool is_required(std::string_view name, path const & p = {}) const
        {
            auto s = at(p);
            return s && std::find(s->required.begin(), s->required.end(), name) != s->required.end();
        }

        std::vector<std::string> property_names() const
        {
            std::vector<std::string> out;
            for (auto const & [n, s] : properties)
                out.push_back(n);
            std::ranges::sort(out);
            return out;
        }
    };

//========================================================================
// Flattened properties
//========================================================================

    struct property_info
    {
        path                     where;
        std::vector<schema_type> types;
        std::string              description;
        std::optional<std::string> format;
        std::optional<std::string> pattern;
        std::optional<std::vector<value>> enum_values;
        bool                     is_required   = false;
        bool                     is_deprecated = false;
        std::optional<double>    minimum;
        std::optional<double>    maximum;
        std::optional<size_t>    min_length;
        std::optional<size_t>    max_length;
        std::optional<value>     default_value;

        std::string path_string() const { return join_path(where); }

        // "string | null"; empty when any type is accepted.
        std::string type_string() const
        {
            std::string out;
            for (size_t i = 0; i < types.size(); ++i)
            {
                if (i > 0) out += " | ";
                out += to_string(types[i]);
            }
            return out;
        }
    };

//========================================================================
// Errors
//========================================================================

    enum class schema_error_kind
    {
        invalid_json,
        invalid_schema,
    };

    using schema_parse_error = error<schema_error_kind>;
    using schema_context     = context<schema, schema_parse_error>;

//========================================================================
// SCHEMA API
//========================================================================

    schema_context parse_schema(std::string_view text);

    std::map<std::string, property_info> extract_property_info(schema const & s, path const & base = {});

    // Unresolvable paths are permissive: nothing required, anything allowed.
    std::set<std::string> required_fields(schema const & s, path const & p = {});
    bool allows_additional_properties(schema const & s, path const & p = {});

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        class schema_builder
        {
        public:
            explicit schema_builder(source_tree const & src)
                : src_(src)
            {}

            std::vector<schema_parse_error> errors;

            schema build(node_id id, path const & at)
            {
                schema out;
                source_node const & n = *src_.node(id);

                if (n.type != value_type::object)
                {
                    invalid(n, at, "expected a schema object");
                    return out;
                }

                for (auto const & m : n.members)
                {
                    source_node const & v = *src_.node(m.node);
                    path here = at;
                    here.push_back(m.key);

                    if (m.key == "$schema")                string_facet(v, here, out.schema_uri);
                    else if (m.key == "title")             string_facet(v, here, out.title);
                    else if (m.key == "description")       string_facet(v, here, out.description);
                    else if (m.key == "type")              read_types(v, here, out);
                    else if (m.key == "properties")        read_properties(v, here, out);
                    else if (m.key == "required")          read_required(v, here, out);
                    else if (m.key == "pattern")           optional_string(v, here, out.pattern);
                    else if (m.key == "format")            optional_string(v, here, out.format);
                    else if (m.key == "enum")              read_enum(v, here, out);
                    else if (m.key == "minimum")           number_facet(v, here, out.minimum);
                    else if (m.key == "maximum")           number_facet(v, here, out.maximum);
                    else if (m.key == "minLength")         length_facet(v, here, out.min_length);
                    else if (m.key == "maxLength")         length_facet(v, here, out.max_length);
                    else if (m.key == "deprecated")        bool_facet(v, here, out.deprecated);
                    else if (m.key == "additionalProperties") read_additional(m.node, here, out);
                    else if (m.key == "items")             read_items(m.node, here, out);
                    else if (m.key == "default")           out.default_value = v.val;
                }

                return out;
            }

        private:
            source_tree const & src_;

            void invalid(source_node const & n, path const & at, std::string_view what)
            {
                std::string msg = at.empty() ? std::string("(root)") : join_path(at);
                msg += ": ";
                msg += what;

                errors.push_back(schema_parse_error{
                    schema_error_kind::invalid_schema,
                    position_of(src_.text(), n.span.begin),
                    std::move(msg)
                });
            }

            void string_facet(source_node const & n, path const & at, std::string & out)
            {
                if (auto s = n.val.as_string())
                    out = *s;
                else
                    invalid(n, at, "expected a string");
            }

            void optional_string(source_node const & n, path const & at, std::optional<std::string> & out)
            {
                if (auto s = n.val.as_string())
                    out = *s;
                else
                    invalid(n, at, "expected a string");
            }

            void number_facet(source_node const & n, path const & at, std::optional<double> & out)
            {
                if (auto d = n.val.as_number())
                    out = *d;
                else
                    invalid(n, at, "expected a number");
            }

            void length_facet(source_node const & n, path const & at, std::optional<size_t> & out)
            {
                auto i = n.val.as_integer();
                if (i && *i >= 0)
                    out = static_cast<size_t>(*i);
                else
                    invalid(n, at, "expected a non-negative integer");
            }

            void bool_facet(source_node const & n, path const & at, bool & out)
            {
                if (auto b = n.val.as_bool())
                    out = *b;
                else
                    invalid(n, at, "expected a boolean");
            }

            void add_type(source_node const & n, path const & at, value const & name, schema & out)
            {
                auto s = name.as_string();
                auto t = s ? schema_type_from(*s) : std::nullopt;
                if (!t)
                {
                    invalid(n, at, s ? "unknown type name \"" + *s + "\"" : "expected a type name");
                    return;
                }
                if (std::ranges::find(out.types, *t) == out.types.end())
                    out.types.push_back(*t);
            }

            void read_types(source_node const & n, path const & at, schema & out)
            {
                if (n.type == value_type::string)
                {
                    add_type(n, at, n.val, out);
                    return;
                }
                if (n.type != value_type::array)
                {
                    invalid(n, at, "expected a type name or an array of type names");
                    return;
                }
                for (auto e : n.elements)
                    add_type(*src_.node(e), at, src_.node(e)->val, out);
            }

            void read_properties(source_node const & n, path const & at, schema & out)
            {
                if (n.type != value_type::object)
                {
                    invalid(n, at, "expected an object");
                    return;
                }
                for (auto const & m : n.members)
                {
                    path here = at;
                    here.push_back(m.key);
                    out.properties.emplace_back(m.key, build(m.node, here));
                }
            }

            void read_required(source_node const & n, path const & at, schema & out)
            {
                if (n.type != value_type::array)
                {
                    invalid(n, at, "expected an array of property names");
                    return;
                }
                for (auto e : n.elements)
                {
                    if (auto s = src_.node(e)->val.as_string())
                        out.required.push_back(*s);
                    else
                        invalid(*src_.node(e), at, "expected a property name");
                }
            }

            void read_enum(source_node const & n, path const & at, schema & out)
            {
                if (auto arr = n.val.as_array())
                    out.enum_values = *arr;
                else
                    invalid(n, at, "expected an array");
            }

            void read_additional(node_id id, path const & at, schema & out)
            {
                source_node const & n = *src_.node(id);
                if (auto b = n.val.as_bool())
                    out.additional_properties = *b;
                else if (n.type == value_type::object)
                    out.additional_properties = std::make_shared<const schema>(build(id, at));
                else
                    invalid(n, at, "expected a boolean or a schema");
            }

            void read_items(node_id id, path const & at, schema & out)
            {
                source_node const & n = *src_.node(id);
                if (n.type == value_type::object)
                    out.items = std::make_shared<const schema>(build(id, at));
                else
                    invalid(n, at, "expected a schema");
            }
        };

        inline void flatten(schema const & s, path const & base, std::map<std::string, property_info> & out)
        {
            for (auto const & [name, child] : s.properties)
            {
                property_info info;
                info.where = base;
                info.where.push_back(name);
                info.types         = child.types;
                info.description   = child.description;
                info.format        = child.format;
                info.pattern       = child.pattern;
                info.enum_values   = child.enum_values;
                info.is_required   = std::ranges::find(s.required, name) != s.required.end();
                info.is_deprecated = child.deprecated;
                info.minimum       = child.minimum;
                info.maximum       = child.maximum;
                info.min_length    = child.min_length;
                info.max_length    = child.max_length;
                info.default_value = child.default_value;

                // A dotted property name can collide with a nested path.
                // The deeper entry wins.
                std::string key = info.path_string();
                auto it = out.find(key);
                if (it == out.end() || it->second.where.size() <= info.where.size())
                    out.insert_or_assign(key, info);

                if (!child.properties.empty())
                    flatten(child, info.where, out);
            }
        }
    }

//========================================================================
// PUBLIC SCHEMA API IMPLEMENTATION
//========================================================================

    inline schema_context parse_schema(std::string_view text)
    {
        schema_context out;

        auto parsed = parse(text);
        if (!parsed.result)
        {
            for (auto const & e : parsed.errors)
                out.errors.push_back(schema_parse_error{ schema_error_kind::invalid_json, e.where, e.message });
            JADE_LOG(debug) << "schema is not valid JSON";
            return out;
        }

        source_tree const & src = *parsed.result->source;
        if (!parsed.result->root.is_object())
        {
            out.errors.push_back(schema_parse_error{
                schema_error_kind::invalid_json,
                position_of(text, src.node(src.root())->span.begin),
                "schema must be a JSON object"
            });
            JADE_LOG(debug) << "schema root is not an object";
            return out;
        }

        detail::schema_builder builder(src);
        schema s = builder.build(src.root(), {});

        if (!builder.errors.empty())
        {
            out.errors = std::move(builder.errors);
            for (auto const & e : out.errors)
                JADE_LOG(debug) << "invalid schema at " << e.where.line << ":" << e.where.column << ": " << e.message;
            return out;
        }

        out.result = std::move(s);
        return out;
    }

    inline std::map<std::string, property_info> extract_property_info(schema const & s, path const & base)
    {
        std::map<std::string, property_info> out;
        detail::flatten(s, base, out);
        return out;
    }

    inline std::set<std::string> required_fields(schema const & s, path const & p)
    {
        auto target = s.at(p);
        if (!target)
            return {};
        return std::set<std::string>(target->required.begin(), target->required.end());
    }

    inline bool allows_additional_properties(schema const & s, path const & p)
    {
        auto target = s.at(p);
        if (!target)
            return true;

        auto b = std::get_if<bool>(&target->additional_properties);
        return !b || *b;
    }

} // namespace jade

#endif // JADE_SCHEMA_HPP
