// jade_parser.hpp - JSON Authored Document Engine (Jade) - Parser
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// The parser produces two things: the value tree, and a source map that
// remembers where every value, key and separator was authored. The
// serializer walks the source map to reproduce untouched text verbatim.

#ifndef JADE_PARSER_HPP
#define JADE_PARSER_HPP

#include "jade_core.hpp"
#include "jade_log.hpp"

#include <unordered_set>

namespace jade
{
//========================================================================
// Options and errors
//========================================================================

    struct parse_options
    {
        size_t max_depth = 512;
    };

    enum class parse_error_kind
    {
        unexpected_end,
        unexpected_character,
        invalid_literal,
        invalid_number,
        invalid_string,
        invalid_escape,
        control_character,
        duplicate_key,
        trailing_content,
        depth_exceeded,
        root_not_object,
    };

    using parse_error = error<parse_error_kind>;

    inline std::string_view to_string(parse_error_kind kind)
    {
        switch (kind)
        {
            case parse_error_kind::unexpected_end:       return "unexpected end of input";
            case parse_error_kind::unexpected_character: return "unexpected character";
            case parse_error_kind::invalid_literal:      return "invalid literal";
            case parse_error_kind::invalid_number:       return "invalid number";
            case parse_error_kind::invalid_string:       return "invalid string";
            case parse_error_kind::invalid_escape:       return "invalid escape sequence";
            case parse_error_kind::control_character:    return "unescaped control character in string";
            case parse_error_kind::duplicate_key:        return "duplicate key";
            case parse_error_kind::trailing_content:     return "trailing content after value";
            case parse_error_kind::depth_exceeded:       return "maximum nesting depth exceeded";
            case parse_error_kind::root_not_object:      return "top-level value is not an object";
        }
        return "parse error";
    }

//========================================================================
// Source map
//========================================================================

    namespace detail { struct parser_impl; }

    struct source_span
    {
        size_t begin = 0;
        size_t end   = 0;

        size_t size() const noexcept { return end - begin; }
    };

    struct source_member
    {
        std::string key;
        source_span key_span;   // including the quotes
        node_id     node;
    };

    struct source_node
    {
        value_type  type = value_type::null;
        source_span span;
        value       val;

        std::vector<source_member> members;   // objects, authored order
        std::vector<node_id>       elements;  // arrays, authored order
    };

    class source_tree
    {
    public:
        std::string_view text() const noexcept { return text_; }

        node_id root() const noexcept { return root_; }

        size_t node_count() const noexcept { return nodes_.size(); }

        source_node const* node(node_id id) const noexcept
        {
            if (id.val >= nodes_.size())
                return nullptr;
            return &nodes_[id.val];
        }

        std::string_view slice(source_span s) const noexcept
        {
            return std::string_view(text_).substr(s.begin, s.size());
        }

        source_member const* find_member(source_node const & obj, std::string_view key) const noexcept
        {
            for (auto const & m : obj.members)
                if (m.key == key) return &m;
            return nullptr;
        }

    private:
        std::string              text_;
        std::vector<source_node> nodes_;
        node_id                  root_ = invalid_id<node_tag>();

        friend struct detail::parser_impl;
    };

    struct parsed_text
    {
        value                              root;
        std::shared_ptr<const source_tree> source;
    };

    using parse_context = context<parsed_text, parse_error>;

//========================================================================
// PARSER API
//========================================================================

    parse_context parse(std::string_view text, parse_options opt = {});

    source_position position_of(std::string_view text, size_t offset);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        struct parser_impl
        {
            parser_impl(std::string_view text, parse_options opt)
                : opt_(opt)
            {
                tree_.text_ = std::string(text);
                src_ = tree_.text_;
            }

            parse_context run();

        private:
            parse_options    opt_;
            source_tree      tree_;
            std::string_view src_;
            size_t           pos_ = 0;
            std::optional<parse_error> failure_;

            bool at_end() const { return pos_ >= src_.size(); }
            char peek() const { return src_[pos_]; }

            void skip_ws()
            {
                while (!at_end() && is_ws(peek()))
                    ++pos_;
            }

            node_id fail(parse_error_kind kind, size_t at, std::string what = {});

            node_id add_node(value_type type, source_span span, value v);

            node_id parse_value(size_t depth);
            node_id parse_object(size_t depth);
            node_id parse_array(size_t depth);
            node_id parse_string_node();
            node_id parse_number();
            node_id parse_literal(std::string_view word, value v);

            std::optional<std::string> parse_string();
            bool parse_hex4(uint32_t & out);
        };

//---------------------------------------------------------------------------

        inline node_id parser_impl::fail(parse_error_kind kind, size_t at, std::string what)
        {
            if (!failure_)
            {
                std::string msg(to_string(kind));
                if (!what.empty())
                    msg += ": " + what;

                failure_ = parse_error{ kind, position_of(src_, at), std::move(msg) };
            }
            return invalid_id<node_tag>();
        }

        inline node_id parser_impl::add_node(value_type type, source_span span, value v)
        {
            node_id id{ tree_.nodes_.size() };

            source_node n;
            n.type = type;
            n.span = span;
            n.val  = std::move(v);

            tree_.nodes_.push_back(std::move(n));
            return id;
        }

//---------------------------------------------------------------------------

        inline parse_context parser_impl::run()
        {
            parse_context out;

            // UTF-8 byte order mark
            if (src_.substr(0, 3) == "\xEF\xBB\xBF")
                pos_ = 3;

            skip_ws();
            node_id root = parse_value(0);

            if (!failure_)
            {
                skip_ws();
                if (!at_end())
                    fail(parse_error_kind::trailing_content, pos_);
            }

            if (failure_)
            {
                out.errors.push_back(*failure_);
                return out;
            }

            tree_.root_ = root;
            value root_val = tree_.nodes_[root.val].val;

            out.result = parsed_text{ std::move(root_val), std::make_shared<const source_tree>(std::move(tree_)) };
            return out;
        }

//---------------------------------------------------------------------------

        inline node_id parser_impl::parse_value(size_t depth)
        {
            if (at_end())
                return fail(parse_error_kind::unexpected_end, pos_);

            switch (peek())
            {
                case '{': return parse_object(depth + 1);
                case '[': return parse_array(depth + 1);
                case '"': return parse_string_node();
                case 't': return parse_literal("true", value(true));
                case 'f': return parse_literal("false", value(false));
                case 'n': return parse_literal("null", value());
                default:
                    break;
            }

            char c = peek();
            if (c == '-' || (c >= '0' && c <= '9'))
                return parse_number();

            return fail(parse_error_kind::unexpected_character, pos_, std::string("'") + c + "'");
        }

//---------------------------------------------------------------------------

        inline node_id parser_impl::parse_object(size_t depth)
        {
            if (depth > opt_.max_depth)
                return fail(parse_error_kind::depth_exceeded, pos_);

            size_t begin = pos_++;   // '{'

            std::vector<source_member> members;
            std::unordered_set<std::string> seen;
            value::object_type obj;

            skip_ws();
            if (!at_end() && peek() == '}')
            {
                ++pos_;
                return add_node(value_type::object, { begin, pos_ }, value::from_unique_members({}));
            }

            while (true)
            {
                skip_ws();
                if (at_end())
                    return fail(parse_error_kind::unexpected_end, pos_);
                if (peek() != '"')
                    return fail(parse_error_kind::unexpected_character, pos_, "expected object key");

                size_t key_begin = pos_;
                auto key = parse_string();
                if (!key)
                    return invalid_id<node_tag>();
                size_t key_end = pos_;

                if (!seen.insert(*key).second)
                    return fail(parse_error_kind::duplicate_key, key_begin, "\"" + *key + "\"");

                skip_ws();
                if (at_end())
                    return fail(parse_error_kind::unexpected_end, pos_);
                if (peek() != ':')
                    return fail(parse_error_kind::unexpected_character, pos_, "expected ':'");
                ++pos_;

                skip_ws();
                node_id child = parse_value(depth);
                if (!valid(child))
                    return child;

                obj.emplace_back(*key, tree_.nodes_[child.val].val);
                members.push_back(source_member{ std::move(*key), { key_begin, key_end }, child });

                skip_ws();
                if (at_end())
                    return fail(parse_error_kind::unexpected_end, pos_);

                if (peek() == ',')
                {
                    ++pos_;
                    continue;
                }
                if (peek() == '}')
                {
                    ++pos_;
                    break;
                }
                return fail(parse_error_kind::unexpected_character, pos_, "expected ',' or '}'");
            }

            node_id id = add_node(value_type::object, { begin, pos_ }, value::from_unique_members(std::move(obj)));
            tree_.nodes_[id.val].members = std::move(members);
            return id;
        }

//---------------------------------------------------------------------------

        inline node_id parser_impl::parse_array(size_t depth)
        {
            if (depth > opt_.max_depth)
                return fail(parse_error_kind::depth_exceeded, pos_);

            size_t begin = pos_++;   // '['

            std::vector<node_id> elements;
            value::array_type arr;

            skip_ws();
            if (!at_end() && peek() == ']')
            {
                ++pos_;
                return add_node(value_type::array, { begin, pos_ }, value(value::array_type{}));
            }

            while (true)
            {
                skip_ws();
                node_id child = parse_value(depth);
                if (!valid(child))
                    return child;

                arr.push_back(tree_.nodes_[child.val].val);
                elements.push_back(child);

                skip_ws();
                if (at_end())
                    return fail(parse_error_kind::unexpected_end, pos_);

                if (peek() == ',')
                {
                    ++pos_;
                    continue;
                }
                if (peek() == ']')
                {
                    ++pos_;
                    break;
                }
                return fail(parse_error_kind::unexpected_character, pos_, "expected ',' or ']'");
            }

            node_id id = add_node(value_type::array, { begin, pos_ }, value(std::move(arr)));
            tree_.nodes_[id.val].elements = std::move(elements);
            return id;
        }

//---------------------------------------------------------------------------

        inline node_id parser_impl::parse_string_node()
        {
            size_t begin = pos_;
            auto s = parse_string();
            if (!s)
                return invalid_id<node_tag>();

            return add_node(value_type::string, { begin, pos_ }, value(std::move(*s)));
        }

        inline node_id parser_impl::parse_literal(std::string_view word, value v)
        {
            if (src_.substr(pos_, word.size()) != word)
                return fail(parse_error_kind::invalid_literal, pos_);

            size_t begin = pos_;
            pos_ += word.size();

            value_type type = v.type();
            return add_node(type, { begin, pos_ }, std::move(v));
        }

//---------------------------------------------------------------------------

        inline node_id parser_impl::parse_number()
        {
            size_t begin = pos_;
            bool integral = true;

            auto digits = [&]
            {
                size_t start = pos_;
                while (!at_end() && peek() >= '0' && peek() <= '9')
                    ++pos_;
                return pos_ - start;
            };

            if (peek() == '-')
                ++pos_;

            if (at_end())
                return fail(parse_error_kind::unexpected_end, pos_);

            if (peek() == '0')
            {
                ++pos_;
                if (!at_end() && peek() >= '0' && peek() <= '9')
                    return fail(parse_error_kind::invalid_number, begin, "leading zero");
            }
            else if (digits() == 0)
                return fail(parse_error_kind::invalid_number, begin);

            if (!at_end() && peek() == '.')
            {
                integral = false;
                ++pos_;
                if (digits() == 0)
                    return fail(parse_error_kind::invalid_number, begin, "missing fraction digits");
            }

            if (!at_end() && (peek() == 'e' || peek() == 'E'))
            {
                integral = false;
                ++pos_;
                if (!at_end() && (peek() == '+' || peek() == '-'))
                    ++pos_;
                if (digits() == 0)
                    return fail(parse_error_kind::invalid_number, begin, "missing exponent digits");
            }

            std::string_view lit = src_.substr(begin, pos_ - begin);
            source_span span{ begin, pos_ };

            if (integral)
            {
                int64_t i = 0;
                auto [ptr, ec] = std::from_chars(lit.data(), lit.data() + lit.size(), i);
                if (ec == std::errc{} && ptr == lit.data() + lit.size())
                    return add_node(value_type::integer, span, value(i));
                // Out of int64 range: kept as a decimal.
            }

            double d = 0.0;
            auto [ptr, ec] = std::from_chars(lit.data(), lit.data() + lit.size(), d);
            if (ec != std::errc{} || ptr != lit.data() + lit.size())
                return fail(parse_error_kind::invalid_number, begin, std::string(lit));

            return add_node(value_type::decimal, span, value(d));
        }

//---------------------------------------------------------------------------

        inline bool parser_impl::parse_hex4(uint32_t & out)
        {
            if (src_.size() - pos_ < 4)
                return false;

            out = 0;
            for (int i = 0; i < 4; ++i)
            {
                char c = src_[pos_++];
                out <<= 4;
                if (c >= '0' && c <= '9')      out |= static_cast<uint32_t>(c - '0');
                else if (c >= 'a' && c <= 'f') out |= static_cast<uint32_t>(c - 'a' + 10);
                else if (c >= 'A' && c <= 'F') out |= static_cast<uint32_t>(c - 'A' + 10);
                else return false;
            }
            return true;
        }

        inline void append_utf8(std::string & out, uint32_t cp)
        {
            if (cp < 0x80)
            {
                out += static_cast<char>(cp);
            }
            else if (cp < 0x800)
            {
                out += static_cast<char>(0xC0 | (cp >> 6));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            else if (cp < 0x10000)
            {
                out += static_cast<char>(0xE0 | (cp >> 12));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            else
            {
                out += static_cast<char>(0xF0 | (cp >> 18));
                out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
        }

        inline std::optional<std::string> parser_impl::parse_string()
        {
            size_t begin = pos_++;   // opening quote
            std::string out;

            while (true)
            {
                if (at_end())
                {
                    fail(parse_error_kind::invalid_string, begin, "unterminated string");
                    return std::nullopt;
                }

                char c = src_[pos_];

                if (c == '"')
                {
                    ++pos_;
                    return out;
                }

                if (static_cast<unsigned char>(c) < 0x20)
                {
                    fail(parse_error_kind::control_character, pos_);
                    return std::nullopt;
                }

                if (c != '\\')
                {
                    out += c;
                    ++pos_;
                    continue;
                }

                size_t esc = pos_++;
                if (at_end())
                {
                    fail(parse_error_kind::invalid_string, begin, "unterminated string");
                    return std::nullopt;
                }

                switch (src_[pos_++])
                {
                    case '"':  out += '"';  break;
                    case '\\': out += '\\'; break;
                    case '/':  out += '/';  break;
                    case 'b':  out += '\b'; break;
                    case 'f':  out += '\f'; break;
                    case 'n':  out += '\n'; break;
                    case 'r':  out += '\r'; break;
                    case 't':  out += '\t'; break;
                    case 'u':
                    {
                        uint32_t cp = 0;
                        if (!parse_hex4(cp))
                        {
                            fail(parse_error_kind::invalid_escape, esc);
                            return std::nullopt;
                        }

                        if (cp >= 0xD800 && cp <= 0xDBFF)
                        {
                            uint32_t low = 0;
                            if (src_.substr(pos_, 2) != "\\u")
                            {
                                fail(parse_error_kind::invalid_escape, esc, "unpaired surrogate");
                                return std::nullopt;
                            }
                            pos_ += 2;
                            if (!parse_hex4(low) || low < 0xDC00 || low > 0xDFFF)
                            {
                                fail(parse_error_kind::invalid_escape, esc, "unpaired surrogate");
                                return std::nullopt;
                            }
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        }
                        else if (cp >= 0xDC00 && cp <= 0xDFFF)
                        {
                            fail(parse_error_kind::invalid_escape, esc, "unpaired surrogate");
                            return std::nullopt;
                        }

                        append_utf8(out, cp);
                        break;
                    }
                    default:
                        fail(parse_error_kind::invalid_escape, esc);
                        return std::nullopt;
                }
            }
        }

    } // namespace detail

//========================================================================
// PUBLIC PARSER API IMPLEMENTATION
//========================================================================

    inline source_position position_of(std::string_view text, size_t offset)
    {
        source_position p;
        p.offset = offset;

        size_t limit = std::min(offset, text.size());
        for (size_t i = 0; i < limit; ++i)
        {
            if (text[i] == '\n')
            {
                ++p.line;
                p.column = 1;
            }
            else
                ++p.column;
        }
        return p;
    }

    inline parse_context parse(std::string_view text, parse_options opt)
    {
        detail::parser_impl impl(text, opt);
        auto ctx = impl.run();

        for (auto const & e : ctx.errors)
            JADE_LOG(debug) << "parse failed at " << e.where.line << ":" << e.where.column << ": " << e.message;

        return ctx;
    }

} // namespace jade

#endif // JADE_PARSER_HPP
