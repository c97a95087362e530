// jade_core.hpp - JSON Authored Document Engine (Jade) - Core Data Structures
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JADE_CORE_HPP
#define JADE_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <memory>
#include <algorithm>
#include <charconv>
#include <cstdint>
#include <type_traits>
#include <unordered_map>

namespace jade
{
//========================================================================
// IDs
//========================================================================

    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

    template <typename Tag>
    struct id
    {
        size_t val;

        explicit id(size_t v = npos()) : val(v) {}
        operator size_t() const { return val; }
        id & operator= (size_t v) { val = v; return *this; }
        auto operator<=>(id const &) const = default;
        id & operator++() { ++val; return *this; }
        id operator++(int) { id temp = *this; ++val; return temp; }
    };

    template <typename Tag>
    constexpr id<Tag> invalid_id()
    {
        return id<Tag>{ npos() };
    }

    template <typename Tag>
    constexpr bool valid(id<Tag> i)
    {
        return i.val != npos();
    }

    struct document_tag;
    struct node_tag;

    using document_id = id<document_tag>;
    using node_id     = id<node_tag>;

//========================================================================
// Values
//========================================================================

    enum class value_type
    {
        null,
        boolean,
        integer,
        decimal,
        string,
        array,
        object
    };

    namespace detail
    {
        // Character types are text, never integers.
        template <typename T>
        inline constexpr bool is_character_v =
            std::is_same_v<T, char> || std::is_same_v<T, wchar_t> || std::is_same_v<T, char8_t>
            || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;
    }

    class value
    {
    public:
        using array_type  = std::vector<value>;
        using member      = std::pair<std::string, value>;
        using object_type = std::vector<member>;

        //------------------------------------------------------------------------
        // Construction
        //------------------------------------------------------------------------

        value() noexcept = default;
        value(std::nullptr_t) noexcept {}
        value(bool b) noexcept : data_(b) {}
        value(double d) noexcept : data_(d) {}
        value(const char* s) : data_(std::string(s)) {}
        value(std::string s) : data_(std::move(s)) {}
        value(std::string_view s) : data_(std::string(s)) {}

        template <typename T>
            requires (std::is_integral_v<T> && !std::is_same_v<T, bool> && !detail::is_character_v<T>)
        value(T i) noexcept : data_(static_cast<int64_t>(i)) {}

        value(array_type arr)
            : data_(std::make_shared<const array_type>(std::move(arr)))
        {}

        // Duplicate keys collapse onto the first occurrence, last value wins.
        value(object_type obj)
            : data_(std::make_shared<const object_type>(dedupe(std::move(obj))))
        {}

        static value make_array(std::initializer_list<value> elems)
        {
            return value(array_type(elems));
        }

        static value make_object(std::initializer_list<member> members)
        {
            return value(object_type(members));
        }

        // Caller guarantees unique keys; used by the parser and the editor.
        static value from_unique_members(object_type obj)
        {
            value v;
            v.data_ = std::make_shared<const object_type>(std::move(obj));
            return v;
        }

        //------------------------------------------------------------------------
        // Inspection
        //------------------------------------------------------------------------

        value_type type() const noexcept
        {
            return static_cast<value_type>(data_.index());
        }

        bool is_null() const noexcept    { return type() == value_type::null; }
        bool is_bool() const noexcept    { return type() == value_type::boolean; }
        bool is_integer() const noexcept { return type() == value_type::integer; }
        bool is_decimal() const noexcept { return type() == value_type::decimal; }
        bool is_number() const noexcept  { return is_integer() || is_decimal(); }
        bool is_string() const noexcept  { return type() == value_type::string; }
        bool is_array() const noexcept   { return type() == value_type::array; }
        bool is_object() const noexcept  { return type() == value_type::object; }
        bool is_container() const noexcept { return is_array() || is_object(); }

        bool const* as_bool() const noexcept            { return std::get_if<bool>(&data_); }
        int64_t const* as_integer() const noexcept      { return std::get_if<int64_t>(&data_); }
        double const* as_decimal() const noexcept       { return std::get_if<double>(&data_); }
        std::string const* as_string() const noexcept   { return std::get_if<std::string>(&data_); }

        array_type const* as_array() const noexcept
        {
            auto p = std::get_if<array_ptr>(&data_);
            return p ? p->get() : nullptr;
        }

        object_type const* as_object() const noexcept
        {
            auto p = std::get_if<object_ptr>(&data_);
            return p ? p->get() : nullptr;
        }

        std::optional<double> as_number() const noexcept
        {
            if (auto i = as_integer()) return static_cast<double>(*i);
            if (auto d = as_decimal()) return *d;
            return std::nullopt;
        }

        // Empty for non-containers, so range-for works on any value.
        array_type const & elements() const noexcept
        {
            static const array_type none;
            auto a = as_array();
            return a ? *a : none;
        }

        object_type const & members() const noexcept
        {
            static const object_type none;
            auto o = as_object();
            return o ? *o : none;
        }

        size_t size() const noexcept
        {
            if (auto a = as_array())  return a->size();
            if (auto o = as_object()) return o->size();
            return 0;
        }

        value const* find(std::string_view key) const noexcept
        {
            auto obj = as_object();
            if (!obj) return nullptr;

            for (auto const & [k, v] : *obj)
                if (k == key) return &v;
            return nullptr;
        }

        bool contains(std::string_view key) const noexcept
        {
            return find(key) != nullptr;
        }

        value const* at(size_t index) const noexcept
        {
            auto arr = as_array();
            if (!arr || index >= arr->size()) return nullptr;
            return &(*arr)[index];
        }

        // True when both values refer to the same container storage.
        bool shares_storage_with(value const & other) const noexcept
        {
            if (auto a = std::get_if<array_ptr>(&data_))
            {
                auto b = std::get_if<array_ptr>(&other.data_);
                return b && *a == *b;
            }
            if (auto a = std::get_if<object_ptr>(&data_))
            {
                auto b = std::get_if<object_ptr>(&other.data_);
                return b && *a == *b;
            }
            return false;
        }

        friend bool operator==(value const & a, value const & b);

    private:
        using array_ptr  = std::shared_ptr<const array_type>;
        using object_ptr = std::shared_ptr<const object_type>;

        // Index order mirrors value_type.
        std::variant<
            std::monostate,
            bool,
            int64_t,
            double,
            std::string,
            array_ptr,
            object_ptr
        > data_;

        static object_type dedupe(object_type obj)
        {
            // Keys in `seen` view strings owned by `out`, which never reallocates.
            std::unordered_map<std::string_view, size_t> seen;
            object_type out;
            out.reserve(obj.size());

            for (auto & m : obj)
            {
                auto it = seen.find(m.first);
                if (it != seen.end())
                {
                    out[it->second].second = std::move(m.second);
                    continue;
                }
                out.push_back(std::move(m));
                seen.emplace(out.back().first, out.size() - 1);
            }

            return out;
        }
    };

//========================================================================
// Equality
//========================================================================

    // Objects compare as mappings: member order is not significant.
    inline bool operator==(value const & a, value const & b)
    {
        if (a.type() != b.type())
            return false;

        switch (a.type())
        {
            case value_type::null:    return true;
            case value_type::boolean: return *a.as_bool() == *b.as_bool();
            case value_type::integer: return *a.as_integer() == *b.as_integer();
            case value_type::decimal: return *a.as_decimal() == *b.as_decimal();
            case value_type::string:  return *a.as_string() == *b.as_string();

            case value_type::array:
            {
                if (a.shares_storage_with(b))
                    return true;

                auto const & l = *a.as_array();
                auto const & r = *b.as_array();
                return l.size() == r.size() && std::equal(l.begin(), l.end(), r.begin());
            }

            case value_type::object:
            {
                if (a.shares_storage_with(b))
                    return true;

                auto const & l = *a.as_object();
                auto const & r = *b.as_object();
                if (l.size() != r.size())
                    return false;

                for (size_t i = 0; i < l.size(); ++i)
                {
                    // Same position is the common case for edited snapshots.
                    if (r[i].first == l[i].first)
                    {
                        if (!(l[i].second == r[i].second)) return false;
                        continue;
                    }

                    auto other = b.find(l[i].first);
                    if (!other || !(l[i].second == *other))
                        return false;
                }
                return true;
            }
        }
        return false;
    }

//========================================================================
// Paths
//========================================================================

    using path = std::vector<std::string>;

//========================================================================
// Generation context
//========================================================================

    struct source_position
    {
        size_t offset = 0;
        size_t line   = 1;
        size_t column = 1;
    };

    template <typename Kind>
    struct error
    {
        Kind            kind;
        source_position where;
        std::string     message;
    };

    template <typename T, typename Error>
    struct context
    {
        std::optional<T>   result;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }
        bool has_value() const { return result.has_value(); }
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    inline std::string_view type_name(value_type type)
    {
        switch (type)
        {
            case value_type::null:    return "null";
            case value_type::boolean: return "boolean";
            case value_type::integer: return "integer";
            case value_type::decimal: return "number";
            case value_type::string:  return "string";
            case value_type::array:   return "array";
            case value_type::object:  return "object";
        }
        return "unknown";
    }

    inline std::string join_path(path const & p, char sep = '.')
    {
        std::string out;
        for (size_t i = 0; i < p.size(); ++i)
        {
            if (i > 0) out += sep;
            out += p[i];
        }
        return out;
    }

    inline path split_path(std::string_view s, char sep = '.')
    {
        path out;
        if (s.empty())
            return out;

        size_t start = 0;
        while (true)
        {
            size_t end = s.find(sep, start);
            out.emplace_back(s.substr(start, end - start));
            if (end == std::string_view::npos)
                break;
            start = end + 1;
        }
        return out;
    }

    // Array index segments are plain non-negative decimal integers.
    inline std::optional<size_t> parse_index(std::string_view segment)
    {
        if (segment.empty())
            return std::nullopt;

        for (char c : segment)
            if (c < '0' || c > '9') return std::nullopt;

        size_t out = 0;
        auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), out);
        if (ec != std::errc{} || ptr != segment.data() + segment.size())
            return std::nullopt;
        return out;
    }

    inline value const* child(value const & parent, std::string_view segment)
    {
        if (parent.is_object())
            return parent.find(segment);

        if (parent.is_array())
        {
            auto idx = parse_index(segment);
            return idx ? parent.at(*idx) : nullptr;
        }
        return nullptr;
    }

    inline value const* resolve(value const & root, path const & p)
    {
        value const* cur = &root;
        for (auto const & seg : p)
        {
            cur = child(*cur, seg);
            if (!cur)
                return nullptr;
        }
        return cur;
    }

    namespace detail
    {
        inline bool is_ws(char c)
        {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r';
        }

        // Number of Unicode code points in a UTF-8 string.
        inline size_t utf8_length(std::string_view s)
        {
            size_t n = 0;
            for (unsigned char c : s)
                if ((c & 0xC0) != 0x80) ++n;
            return n;
        }
    }

} // namespace jade

#endif // JADE_CORE_HPP
