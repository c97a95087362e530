// jade_serializer.hpp - JSON Authored Document Engine (Jade) - Serializer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Two modes. Without an original the tree is pretty-printed canonically.
// With one, the tree is walked in lock-step with the source map of the
// original text: equal subtrees are copied byte for byte, surviving members
// keep their authored keys and separators, and only what changed is
// rendered anew, in the style of its neighbours.

#ifndef JADE_SERIALIZER_HPP
#define JADE_SERIALIZER_HPP

#include "jade_core.hpp"
#include "jade_log.hpp"
#include "jade_parser.hpp"

#include <cmath>

namespace jade
{
//========================================================================
// Options
//========================================================================

    struct serializer_options
    {
        std::string indent        = "  ";   // canonical form only
        std::string key_separator = ": ";
        size_t      max_lcs_cells = 4'000'000;
    };

//========================================================================
// SERIALIZER API
//========================================================================

    // Canonical form: sorted keys, one member or element per line.
    std::optional<std::string> serialize(value const & tree, serializer_options const & opt = {});

    std::optional<std::string> serialize(value const & tree, source_tree const & original,
                                         serializer_options const & opt = {});

    // Falls back to the canonical form if `original_text` does not parse.
    std::optional<std::string> serialize(value const & tree, std::string_view original_text,
                                         serializer_options const & opt = {});

    std::string detect_indentation(std::string_view text);

//========================================================================
// SERIALIZER IMPLEMENTATION
//========================================================================

    namespace detail
    {
        inline bool has_newline(std::string_view s)
        {
            return s.find('\n') != std::string_view::npos;
        }

        // Whitespace following the last newline of `s`.
        inline std::string indent_after(std::string_view s)
        {
            size_t nl = s.rfind('\n');
            if (nl == std::string_view::npos)
                return {};

            size_t i = nl + 1;
            while (i < s.size() && (s[i] == ' ' || s[i] == '\t'))
                ++i;
            return std::string(s.substr(nl + 1, i - nl - 1));
        }

        inline std::string line_indent_at(std::string_view text, size_t offset)
        {
            size_t start = offset;
            while (start > 0 && text[start - 1] != '\n')
                --start;

            size_t i = start;
            while (i < offset && (text[i] == ' ' || text[i] == '\t'))
                ++i;
            return std::string(text.substr(start, i - start));
        }

        inline void write_string(std::string & out, std::string_view s)
        {
            static constexpr char hex[] = "0123456789abcdef";

            out += '"';
            for (char c : s)
            {
                switch (c)
                {
                    case '"':  out += "\\\""; break;
                    case '\\': out += "\\\\"; break;
                    case '\b': out += "\\b";  break;
                    case '\f': out += "\\f";  break;
                    case '\n': out += "\\n";  break;
                    case '\r': out += "\\r";  break;
                    case '\t': out += "\\t";  break;
                    default:
                        if (static_cast<unsigned char>(c) < 0x20)
                        {
                            out += "\\u00";
                            out += hex[(c >> 4) & 0xF];
                            out += hex[c & 0xF];
                        }
                        else
                            out += c;
                }
            }
            out += '"';
        }

        // Shortest round-trip form, always marked as a decimal.
        inline bool write_decimal(std::string & out, double d)
        {
            if (!std::isfinite(d))
                return false;

            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{})
                return false;

            std::string_view lit(buf, static_cast<size_t>(ptr - buf));
            out += lit;
            if (lit.find_first_of(".eE") == std::string_view::npos)
                out += ".0";
            return true;
        }

    //--------------------------------------------------------------------

        class serializer_impl
        {
        public:
            explicit serializer_impl(serializer_options const & opt)
                : opt_(opt)
                , unit_(opt.indent)
            {}

            std::optional<std::string> canonical(value const & tree)
            {
                layout lay;
                lay.key_sep = opt_.key_separator;

                render(tree, lay, true);
                return finish();
            }

            std::optional<std::string> preserving(value const & tree, source_tree const & original)
            {
                src_  = &original;
                unit_ = detect_indentation(original.text());

                std::string_view text = original.text();
                source_node const & root = *original.node(original.root());

                layout lay;
                lay.key_sep = opt_.key_separator;

                out_ += text.substr(0, root.span.begin);
                emit(tree, original.root(), lay);
                out_ += text.substr(root.span.end);

                return finish();
            }

        private:
            // How freshly rendered values are laid out at one position.
            struct layout
            {
                bool        multiline = true;
                std::string indent;
                std::string key_sep;
                std::string item_sep = ", ";
            };

            // One position of a rewritten container. `orig` indexes the
            // original members or elements; npos marks a new entry.
            struct slot
            {
                size_t             orig = npos();
                value const*       val  = nullptr;
                std::string const* key  = nullptr;
            };

            serializer_options const & opt_;
            std::string                unit_;
            source_tree const*         src_ = nullptr;
            std::string                out_;
            bool                       failed_ = false;

            std::optional<std::string> finish()
            {
                if (failed_)
                {
                    JADE_LOG(warning) << "tree holds a non-finite decimal and cannot be serialized";
                    return std::nullopt;
                }
                return std::move(out_);
            }

        //----------------------------------------------------------------
        // Fresh rendering
        //----------------------------------------------------------------

            void write_scalar(value const & v)
            {
                switch (v.type())
                {
                    case value_type::null:    out_ += "null"; break;
                    case value_type::boolean: out_ += *v.as_bool() ? "true" : "false"; break;
                    case value_type::integer: out_ += std::to_string(*v.as_integer()); break;
                    case value_type::decimal:
                        if (!write_decimal(out_, *v.as_decimal()))
                            failed_ = true;
                        break;
                    case value_type::string:  write_string(out_, *v.as_string()); break;
                    default:
                        break;
                }
            }

            void render(value const & v, layout const & lay, bool sort_keys)
            {
                if (!v.is_container())
                {
                    write_scalar(v);
                    return;
                }

                bool is_obj = v.is_object();
                if (v.size() == 0)
                {
                    out_ += is_obj ? "{}" : "[]";
                    return;
                }

                std::vector<value::member const*> members;
                if (is_obj)
                {
                    for (auto const & m : v.members())
                        members.push_back(&m);
                    if (sort_keys)
                        std::ranges::sort(members, {}, [](auto const* m) { return std::string_view(m->first); });
                }

                layout inner = lay;
                inner.indent += unit_;

                out_ += is_obj ? '{' : '[';

                for (size_t i = 0; i < v.size(); ++i)
                {
                    if (lay.multiline)
                    {
                        out_ += i == 0 ? "\n" : ",\n";
                        out_ += inner.indent;
                    }
                    else if (i > 0)
                        out_ += lay.item_sep;

                    if (is_obj)
                    {
                        write_string(out_, members[i]->first);
                        out_ += lay.key_sep;
                        render(members[i]->second, inner, sort_keys);
                    }
                    else
                        render(*v.at(i), inner, sort_keys);
                }

                if (lay.multiline)
                {
                    out_ += '\n';
                    out_ += lay.indent;
                }
                out_ += is_obj ? '}' : ']';
            }

        //----------------------------------------------------------------
        // Lock-step diff against the original
        //----------------------------------------------------------------

            void emit(value const & v, node_id id, layout const & outer)
            {
                source_node const & n = *src_->node(id);

                if (n.val == v)
                {
                    out_ += src_->slice(n.span);
                    return;
                }

                if (n.type == value_type::object && v.is_object() && !n.members.empty())
                {
                    diff_object(v, n, outer);
                    return;
                }

                if (n.type == value_type::array && v.is_array() && !n.elements.empty())
                {
                    diff_array(v, n, outer);
                    return;
                }

                layout lay = outer;
                lay.indent = line_indent_at(src_->text(), n.span.begin);
                render(v, lay, false);
            }

            void diff_object(value const & v, source_node const & n, layout const & outer)
            {
                if (v.size() == 0)
                {
                    out_ += "{}";
                    return;
                }

                std::vector<slot> slots;
                for (size_t i = 0; i < n.members.size(); ++i)
                {
                    if (auto now = v.find(n.members[i].key))
                        slots.push_back(slot{ i, now, nullptr });
                }

                for (auto const & [key, val] : v.members())
                {
                    if (!src_->find_member(n, key))
                        slots.push_back(slot{ npos(), &val, &key });
                }

                emit_container(n, slots, outer);
            }

            void diff_array(value const & v, source_node const & n, layout const & outer)
            {
                if (v.size() == 0)
                {
                    out_ += "[]";
                    return;
                }

                auto const & now = v.elements();
                std::vector<slot> slots;

                size_t i = 0;
                size_t j = 0;
                auto matches = align(n, now);
                matches.emplace_back(n.elements.size(), now.size());

                for (auto [mi, mj] : matches)
                {
                    // Unmatched runs pair up positionally; surplus new
                    // elements are fresh, surplus old ones are dropped.
                    size_t paired = std::min(mi - i, mj - j);
                    for (size_t t = 0; t < paired; ++t)
                        slots.push_back(slot{ i + t, &now[j + t], nullptr });
                    for (size_t jj = j + paired; jj < mj; ++jj)
                        slots.push_back(slot{ npos(), &now[jj], nullptr });

                    if (mi < n.elements.size())
                        slots.push_back(slot{ mi, &now[mj], nullptr });

                    i = mi + 1;
                    j = mj + 1;
                }

                emit_container(n, slots, outer);
            }

            // Index pairs of equal elements, increasing in both arrays.
            std::vector<std::pair<size_t, size_t>> align(source_node const & n, value::array_type const & now)
            {
                auto old_at = [&](size_t i) -> value const & { return src_->node(n.elements[i])->val; };

                size_t old_size = n.elements.size();
                size_t new_size = now.size();

                std::vector<std::pair<size_t, size_t>> head;
                std::vector<std::pair<size_t, size_t>> tail;

                size_t pre = 0;
                while (pre < old_size && pre < new_size && old_at(pre) == now[pre])
                {
                    head.emplace_back(pre, pre);
                    ++pre;
                }

                size_t suf = 0;
                while (suf < old_size - pre && suf < new_size - pre
                       && old_at(old_size - 1 - suf) == now[new_size - 1 - suf])
                {
                    tail.emplace_back(old_size - 1 - suf, new_size - 1 - suf);
                    ++suf;
                }

                size_t a = old_size - pre - suf;
                size_t b = new_size - pre - suf;

                if (a > 0 && b > 0 && (a + 1) * (b + 1) <= opt_.max_lcs_cells)
                {
                    // lcs[x][y]: length of the LCS of old[pre+x..] and now[pre+y..]
                    std::vector<uint32_t> lcs((a + 1) * (b + 1), 0);
                    auto cell = [&](size_t x, size_t y) -> uint32_t & { return lcs[x * (b + 1) + y]; };

                    for (size_t x = a; x-- > 0;)
                        for (size_t y = b; y-- > 0;)
                            cell(x, y) = old_at(pre + x) == now[pre + y]
                                ? cell(x + 1, y + 1) + 1
                                : std::max(cell(x + 1, y), cell(x, y + 1));

                    size_t x = 0;
                    size_t y = 0;
                    while (x < a && y < b)
                    {
                        if (old_at(pre + x) == now[pre + y])
                        {
                            head.emplace_back(pre + x, pre + y);
                            ++x;
                            ++y;
                        }
                        else if (cell(x + 1, y) >= cell(x, y + 1))
                            ++x;
                        else
                            ++y;
                    }
                }
                else if (a > 0 && b > 0)
                {
                    JADE_LOG(debug) << "array of " << old_size << " elements aligned by index";
                }

                head.insert(head.end(), tail.rbegin(), tail.rend());
                return head;
            }

            void emit_container(source_node const & n, std::vector<slot> const & slots, layout const & outer)
            {
                std::string_view text = src_->text();
                bool is_obj = n.type == value_type::object;
                size_t count = is_obj ? n.members.size() : n.elements.size();

                auto node_of  = [&](size_t i) { return is_obj ? n.members[i].node : n.elements[i]; };
                auto begin_of = [&](size_t i) { return is_obj ? n.members[i].key_span.begin : src_->node(node_of(i))->span.begin; };
                auto end_of   = [&](size_t i) { return src_->node(node_of(i))->span.end; };
                auto between  = [&](size_t i) { return text.substr(end_of(i), begin_of(i + 1) - end_of(i)); };

                std::string_view open_ws  = text.substr(n.span.begin + 1, begin_of(0) - n.span.begin - 1);
                std::string_view close_ws = text.substr(end_of(count - 1), n.span.end - 1 - end_of(count - 1));
                // Separator for an entry after the only original one.
                std::string synthesized = has_newline(open_ws) ? "," + std::string(open_ws) : std::string(", ");

                layout inner;
                inner.multiline = has_newline(open_ws);
                inner.key_sep   = outer.key_sep;

                if (is_obj)
                {
                    auto const & first = n.members[0];
                    auto sep = text.substr(first.key_span.end, src_->node(first.node)->span.begin - first.key_span.end);
                    inner.key_sep = has_newline(sep) ? opt_.key_separator : std::string(sep);
                }

                std::string_view sample = count > 1 ? between(0) : std::string_view(synthesized);
                inner.item_sep = has_newline(sample) ? ", " : std::string(sample);

                out_ += is_obj ? '{' : '[';
                out_ += open_ws;

                for (size_t k = 0; k < slots.size(); ++k)
                {
                    std::string_view lead = open_ws;

                    if (k > 0)
                    {
                        size_t prev = slots[k - 1].orig;
                        if (prev != npos() && prev + 1 < count)
                            lead = between(prev);
                        else if (count > 1)
                            lead = between(count - 2);
                        else
                            lead = synthesized;

                        out_ += lead;
                    }

                    slot const & s = slots[k];

                    if (s.orig != npos())
                    {
                        if (is_obj)
                        {
                            auto const & m = n.members[s.orig];
                            out_ += text.substr(m.key_span.begin, src_->node(m.node)->span.begin - m.key_span.begin);
                        }
                        emit(*s.val, node_of(s.orig), inner);
                        continue;
                    }

                    layout fresh = inner;
                    fresh.indent = inner.multiline ? indent_after(lead) : line_indent_at(text, n.span.begin);

                    if (is_obj)
                    {
                        write_string(out_, *s.key);
                        out_ += inner.key_sep;
                    }
                    render(*s.val, fresh, false);
                }

                out_ += close_ws;
                out_ += is_obj ? '}' : ']';
            }
        };
    }

//========================================================================
// PUBLIC SERIALIZER API IMPLEMENTATION
//========================================================================

    inline std::optional<std::string> serialize(value const & tree, serializer_options const & opt)
    {
        detail::serializer_impl impl(opt);
        return impl.canonical(tree);
    }

    inline std::optional<std::string> serialize(value const & tree, source_tree const & original,
                                                serializer_options const & opt)
    {
        detail::serializer_impl impl(opt);
        return impl.preserving(tree, original);
    }

    inline std::optional<std::string> serialize(value const & tree, std::string_view original_text,
                                                serializer_options const & opt)
    {
        auto parsed = parse(original_text);
        if (!parsed.result)
        {
            JADE_LOG(debug) << "original text does not parse, serializing canonically";
            return serialize(tree, opt);
        }
        return serialize(tree, *parsed.result->source, opt);
    }

    inline std::string detect_indentation(std::string_view text)
    {
        size_t smallest = 0;
        size_t pos = 0;

        while (pos < text.size())
        {
            size_t eol = text.find('\n', pos);
            if (eol == std::string_view::npos)
                eol = text.size();

            std::string_view line = text.substr(pos, eol - pos);
            pos = eol + 1;

            if (!line.empty() && line[0] == '\t')
                return "\t";

            size_t spaces = line.find_first_not_of(' ');
            if (spaces == std::string_view::npos || spaces == 0)
                continue;   // blank or unindented
            if (line[spaces] == '\r' || line[spaces] == '\t')
                continue;

            if (smallest == 0 || spaces < smallest)
                smallest = spaces;
        }

        return smallest == 0 ? std::string("  ") : std::string(smallest, ' ');
    }

} // namespace jade

#endif // JADE_SERIALIZER_HPP
