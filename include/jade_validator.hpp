// jade_validator.hpp - JSON Authored Document Engine (Jade) - Validator
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Validation never fails and never stops early. Every finding in the tree
// is reported, depth first, and the caller decides what blocks a save:
// errors do, warnings don't.

#ifndef JADE_VALIDATOR_HPP
#define JADE_VALIDATOR_HPP

#include "jade_core.hpp"
#include "jade_log.hpp"
#include "jade_schema.hpp"

#include <boost/regex.hpp>

#include <map>

namespace jade
{
//========================================================================
// Findings
//========================================================================

    enum class severity
    {
        error,
        warning
    };

    enum class error_code
    {
        type_mismatch,
        required_field_missing,
        invalid_format,
        pattern_mismatch,
        enum_violation,
        minimum_violation,
        maximum_violation,
        min_length_violation,
        max_length_violation,
        additional_property_not_allowed,
        deprecated,
        other
    };

    struct validation_error
    {
        path        where;
        std::string message;
        severity    level = severity::error;
        error_code  code  = error_code::other;

        std::string path_string() const
        {
            return where.empty() ? std::string("(root)") : join_path(where);
        }
    };

    struct validation_result
    {
        std::vector<validation_error> errors;

        bool is_valid() const { return error_count() == 0; }

        size_t error_count() const
        {
            return static_cast<size_t>(std::ranges::count(errors, severity::error, &validation_error::level));
        }

        size_t warning_count() const
        {
            return static_cast<size_t>(std::ranges::count(errors, severity::warning, &validation_error::level));
        }

        std::map<std::string, std::vector<validation_error>> errors_by_path() const
        {
            std::map<std::string, std::vector<validation_error>> out;
            for (auto const & e : errors)
                out[e.path_string()].push_back(e);
            return out;
        }
    };

    struct validator_options
    {
        bool check_formats      = true;
        bool report_deprecated  = true;
    };

//========================================================================
// VALIDATOR API
//========================================================================

    validation_result validate(value const & tree, schema const & s, validator_options const & opt = {});

    // Checks one candidate value against a flattened property entry, as an
    // editor does before it applies an edit. Nested properties are not
    // part of a property_info and are not checked.
    validation_result validate_value(value const & v, property_info const & info, path const & at,
                                     validator_options const & opt = {});

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        inline std::string format_number(double d)
        {
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{})
                return "?";
            return std::string(buf, ptr);
        }

        inline bool all_digits(std::string_view s)
        {
            return !s.empty() && std::ranges::all_of(s, [](char c) { return c >= '0' && c <= '9'; });
        }

        inline int to_int(std::string_view s)
        {
            int out = 0;
            std::from_chars(s.data(), s.data() + s.size(), out);
            return out;
        }

        inline bool is_date(std::string_view s)
        {
            if (s.size() != 10 || s[4] != '-' || s[7] != '-')
                return false;

            auto y = s.substr(0, 4);
            auto m = s.substr(5, 2);
            auto d = s.substr(8, 2);
            if (!all_digits(y) || !all_digits(m) || !all_digits(d))
                return false;

            int year  = to_int(y);
            int month = to_int(m);
            int day   = to_int(d);
            if (month < 1 || month > 12 || day < 1)
                return false;

            static constexpr int days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
            bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            int limit = days[month - 1] + (month == 2 && leap ? 1 : 0);
            return day <= limit;
        }

        // HH:MM:SS, 24 hour clock.
        inline bool is_time(std::string_view s)
        {
            if (s.size() != 8 || s[2] != ':' || s[5] != ':')
                return false;

            auto h = s.substr(0, 2);
            auto m = s.substr(3, 2);
            auto sec = s.substr(6, 2);
            if (!all_digits(h) || !all_digits(m) || !all_digits(sec))
                return false;

            return to_int(h) <= 23 && to_int(m) <= 59 && to_int(sec) <= 59;
        }

        // Internet date-time: date 'T' time, optional fraction, then Z or
        // a numeric offset.
        inline bool is_date_time(std::string_view s)
        {
            if (s.size() < 20 || (s[10] != 'T' && s[10] != 't'))
                return false;
            if (!is_date(s.substr(0, 10)) || !is_time(s.substr(11, 8)))
                return false;

            size_t i = 19;
            if (i < s.size() && s[i] == '.')
            {
                size_t start = ++i;
                while (i < s.size() && s[i] >= '0' && s[i] <= '9')
                    ++i;
                if (i == start)
                    return false;
            }

            auto zone = s.substr(i);
            if (zone == "Z" || zone == "z")
                return true;

            if (zone.size() != 6 || (zone[0] != '+' && zone[0] != '-') || zone[3] != ':')
                return false;
            auto zh = zone.substr(1, 2);
            auto zm = zone.substr(4, 2);
            return all_digits(zh) && all_digits(zm) && to_int(zh) <= 23 && to_int(zm) <= 59;
        }

        inline bool is_uri(std::string_view s)
        {
            return !s.empty() && std::ranges::none_of(s, [](char c)
            {
                return static_cast<unsigned char>(c) <= 0x20 || c == 0x7F;
            });
        }

        inline bool is_alpha(char c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); }
        inline bool is_alnum(char c) { return is_alpha(c) || (c >= '0' && c <= '9'); }

        // local@domain.tld, where the top-level label is 2 to 64 letters.
        inline bool is_email(std::string_view s)
        {
            size_t at = s.find('@');
            if (at == std::string_view::npos || at == 0 || s.find('@', at + 1) != std::string_view::npos)
                return false;

            auto local  = s.substr(0, at);
            auto domain = s.substr(at + 1);

            size_t dot = domain.rfind('.');
            if (dot == std::string_view::npos || dot == 0)
                return false;

            auto host = domain.substr(0, dot);
            auto tld  = domain.substr(dot + 1);

            return std::ranges::all_of(local, [](char c) { return is_alnum(c) || std::string_view("._%+-").find(c) != std::string_view::npos; })
                && std::ranges::all_of(host, [](char c) { return is_alnum(c) || c == '.' || c == '-'; })
                && tld.size() >= 2 && tld.size() <= 64
                && std::ranges::all_of(tld, is_alpha);
        }

        // Unknown formats pass.
        inline bool matches_format(std::string const & s, std::string_view format)
        {
            if (format == "uri" || format == "url") return is_uri(s);
            if (format == "email")                  return is_email(s);
            if (format == "date-time")              return is_date_time(s);
            if (format == "date")                   return is_date(s);
            if (format == "time")                   return is_time(s);
            return true;
        }

        // Numbers compare by value across integer and decimal.
        inline bool enum_matches(value const & v, value const & allowed)
        {
            if (v.is_number() && allowed.is_number())
                return *v.as_number() == *allowed.as_number();

            if (v.is_array() && allowed.is_array())
            {
                if (v.size() != allowed.size())
                    return false;
                for (size_t i = 0; i < v.size(); ++i)
                    if (!enum_matches(*v.at(i), *allowed.at(i))) return false;
                return true;
            }

            if (v.is_object() && allowed.is_object())
            {
                if (v.size() != allowed.size())
                    return false;
                for (auto const & [k, a] : allowed.members())
                {
                    auto other = v.find(k);
                    if (!other || !enum_matches(*other, a)) return false;
                }
                return true;
            }

            return v == allowed;
        }

        inline std::string describe_allowed(std::vector<value> const & values)
        {
            std::string out;
            for (auto const & a : values)
            {
                std::string item;
                switch (a.type())
                {
                    case value_type::string:  item = *a.as_string(); break;
                    case value_type::integer: item = std::to_string(*a.as_integer()); break;
                    case value_type::decimal: item = format_number(*a.as_decimal()); break;
                    case value_type::boolean: item = *a.as_bool() ? "true" : "false"; break;
                    case value_type::null:    item = "null"; break;
                    default:
                        continue;
                }
                if (!out.empty()) out += ", ";
                out += item;
            }
            return out;
        }

        inline std::string_view json_type_of(value const & v)
        {
            return type_name(v.type());
        }

    //--------------------------------------------------------------------

        class validator_impl
        {
        public:
            explicit validator_impl(validator_options const & opt)
                : opt_(opt)
            {}

            std::vector<validation_error> findings;

            void check(value const & v, schema const & s, path const & at)
            {
                if (s.deprecated && opt_.report_deprecated)
                    add(at, "This field is deprecated", severity::warning, error_code::deprecated);

                if (s.enum_values && std::ranges::none_of(*s.enum_values, [&](value const & a) { return enum_matches(v, a); }))
                    add(at, "Value must be one of: " + describe_allowed(*s.enum_values), severity::error, error_code::enum_violation);

                if (!s.types.empty())
                    check_type(v, s.types, at);

                switch (v.type())
                {
                    case value_type::string:
                        check_string(*v.as_string(), s, at);
                        break;
                    case value_type::integer:
                    case value_type::decimal:
                        check_number(*v.as_number(), s, at);
                        break;
                    case value_type::object:
                        check_object(v, s, at);
                        break;
                    case value_type::array:
                        check_array(v, s, at);
                        break;
                    default:
                        break;
                }
            }

        private:
            validator_options const & opt_;
            std::map<std::string, std::optional<boost::regex>, std::less<>> patterns_;

            void add(path const & at, std::string message, severity level, error_code code)
            {
                findings.push_back(validation_error{ at, std::move(message), level, code });
            }

            void check_type(value const & v, std::vector<schema_type> const & types, path const & at)
            {
                auto declared = [&](schema_type t) { return std::ranges::find(types, t) != types.end(); };

                bool ok = false;
                switch (v.type())
                {
                    case value_type::null:    ok = declared(schema_type::null); break;
                    case value_type::boolean: ok = declared(schema_type::boolean); break;
                    case value_type::integer: ok = declared(schema_type::integer) || declared(schema_type::number); break;
                    case value_type::decimal: ok = declared(schema_type::number); break;
                    case value_type::string:  ok = declared(schema_type::string); break;
                    case value_type::array:   ok = declared(schema_type::array); break;
                    case value_type::object:  ok = declared(schema_type::object); break;
                }
                if (ok)
                    return;

                std::string expected;
                for (size_t i = 0; i < types.size(); ++i)
                {
                    if (i > 0) expected += " or ";
                    expected += to_string(types[i]);
                }

                add(at, "Type mismatch: expected " + expected + ", got " + std::string(json_type_of(v)),
                    severity::error, error_code::type_mismatch);
            }

            boost::regex const* compiled(std::string const & pattern)
            {
                auto it = patterns_.find(pattern);
                if (it == patterns_.end())
                {
                    std::optional<boost::regex> re;
                    try
                    {
                        re.emplace(pattern, boost::regex::ECMAScript);
                    }
                    catch (boost::regex_error const & e)
                    {
                        JADE_LOG(debug) << "pattern \"" << pattern << "\" does not compile: " << e.what();
                    }
                    it = patterns_.emplace(pattern, std::move(re)).first;
                }
                return it->second ? &*it->second : nullptr;
            }

            // Empty when the matcher gives up on the input.
            static std::optional<bool> search(std::string const & s, boost::regex const & re)
            {
                try
                {
                    return boost::regex_search(s, re, boost::match_default);
                }
                catch (std::runtime_error const & e)
                {
                    JADE_LOG(debug) << "pattern match abandoned on " << s.size() << " bytes: " << e.what();
                    return std::nullopt;
                }
            }

            void check_string(std::string const & s, schema const & sc, path const & at)
            {
                if (sc.pattern)
                {
                    if (auto re = compiled(*sc.pattern))
                    {
                        auto found = search(s, *re);
                        if (!found)
                            add(at, "Pattern could not be evaluated: " + *sc.pattern, severity::warning, error_code::other);
                        else if (!*found)
                            add(at, "Value does not match pattern: " + *sc.pattern, severity::error, error_code::pattern_mismatch);
                    }
                    else
                        add(at, "Invalid pattern in schema: " + *sc.pattern, severity::warning, error_code::other);
                }

                if (sc.format && opt_.check_formats && !matches_format(s, *sc.format))
                    add(at, "Invalid " + *sc.format + " format: " + s, severity::warning, error_code::invalid_format);

                size_t length = utf8_length(s);
                check_length(length, sc, at);
            }

            void check_length(size_t length, schema const & sc, path const & at)
            {
                if (sc.min_length && length < *sc.min_length)
                    add(at, "Length " + std::to_string(length) + " is less than minimum " + std::to_string(*sc.min_length),
                        severity::error, error_code::min_length_violation);

                if (sc.max_length && length > *sc.max_length)
                    add(at, "Length " + std::to_string(length) + " exceeds maximum " + std::to_string(*sc.max_length),
                        severity::error, error_code::max_length_violation);
            }

            void check_number(double d, schema const & sc, path const & at)
            {
                if (sc.minimum && d < *sc.minimum)
                    add(at, "Value " + format_number(d) + " is less than minimum " + format_number(*sc.minimum),
                        severity::error, error_code::minimum_violation);

                if (sc.maximum && d > *sc.maximum)
                    add(at, "Value " + format_number(d) + " exceeds maximum " + format_number(*sc.maximum),
                        severity::error, error_code::maximum_violation);
            }

            void check_object(value const & v, schema const & sc, path const & at)
            {
                for (auto const & name : sc.required)
                {
                    if (!v.contains(name))
                        add(at, "Missing required field: " + name, severity::error, error_code::required_field_missing);
                }

                for (auto const & [key, member] : v.members())
                {
                    path here = at;
                    here.push_back(key);

                    if (auto declared = sc.property(key))
                    {
                        check(member, *declared, here);
                        continue;
                    }

                    if (auto allowed = std::get_if<bool>(&sc.additional_properties))
                    {
                        if (!*allowed)
                            add(at, "Additional property not allowed: " + key, severity::warning,
                                error_code::additional_property_not_allowed);
                    }
                    else if (auto const & extra = std::get<std::shared_ptr<const schema>>(sc.additional_properties))
                        check(member, *extra, here);
                }
            }

            void check_array(value const & v, schema const & sc, path const & at)
            {
                check_length(v.size(), sc, at);

                if (!sc.items)
                    return;

                for (size_t i = 0; i < v.size(); ++i)
                {
                    path here = at;
                    here.push_back(std::to_string(i));
                    check(*v.at(i), *sc.items, here);
                }
            }
        };

        inline schema schema_of(property_info const & info)
        {
            schema s;
            s.types       = info.types;
            s.description = info.description;
            s.format      = info.format;
            s.pattern     = info.pattern;
            s.enum_values = info.enum_values;
            s.minimum     = info.minimum;
            s.maximum     = info.maximum;
            s.min_length  = info.min_length;
            s.max_length  = info.max_length;
            s.deprecated  = info.is_deprecated;
            return s;
        }
    }

//========================================================================
// PUBLIC VALIDATOR API IMPLEMENTATION
//========================================================================

    inline validation_result validate(value const & tree, schema const & s, validator_options const & opt)
    {
        detail::validator_impl impl(opt);
        impl.check(tree, s, {});

        validation_result out{ std::move(impl.findings) };
        JADE_LOG(trace) << "validation: " << out.error_count() << " errors, " << out.warning_count() << " warnings";
        return out;
    }

    inline validation_result validate_value(value const & v, property_info const & info, path const & at,
                                            validator_options const & opt)
    {
        detail::validator_impl impl(opt);
        impl.check(v, detail::schema_of(info), at);
        return validation_result{ std::move(impl.findings) };
    }

} // namespace jade

#endif // JADE_VALIDATOR_HPP
