// jade_edit.hpp - JSON Authored Document Engine (Jade) - Edit Operations
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Edits are data. Applying one never mutates its input: the containers on
// the edited path are rebuilt from the leaf up and everything else is
// shared with the previous tree. A path that does not resolve yields no
// tree at all; nothing is created on the way down.

#ifndef JADE_EDIT_HPP
#define JADE_EDIT_HPP

#include "jade_core.hpp"
#include "jade_log.hpp"

#include <span>

namespace jade
{
//========================================================================
// Operations
//========================================================================

    struct set_value
    {
        path  where;
        value val;
    };

    // Sugar for set_value(parent + [key]).
    struct add_field
    {
        path        parent;
        std::string key;
        value       val;
    };

    struct delete_field
    {
        path where;
    };

    // The last segment of `where` is the element index.
    struct delete_array_element
    {
        path where;
    };

    // No index appends.
    struct insert_array_element
    {
        path                   where;
        value                  val;
        std::optional<int64_t> index;
    };

    // `to` counts positions in the array after `from` has been removed.
    struct move_array_element
    {
        path    where;
        int64_t from;
        int64_t to;
    };

    using edit_operation = std::variant<
        set_value,
        add_field,
        delete_field,
        delete_array_element,
        insert_array_element,
        move_array_element
    >;

//========================================================================
// EDIT API
//========================================================================

    std::optional<value> apply(edit_operation const & op, value const & root);

    std::string describe(edit_operation const & op);

    path target_path(edit_operation const & op);

    bool is_valid_field_key(std::string_view key);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        inline value replace_child(value const & parent, std::string const & segment, value v)
        {
            if (auto obj = parent.as_object())
            {
                value::object_type copy = *obj;
                for (auto & m : copy)
                {
                    if (m.first == segment)
                    {
                        m.second = std::move(v);
                        break;
                    }
                }
                return value::from_unique_members(std::move(copy));
            }

            // Only reached for a segment that already resolved, so the
            // parent is an array and the index is in range.
            value::array_type copy = *parent.as_array();
            copy[*parse_index(segment)] = std::move(v);
            return value(std::move(copy));
        }

        // Replaces the value at `p` with `fn(old)` and rebuilds every
        // container above it. Iterative, so depth is bounded only by the
        // path length.
        template <typename F>
        std::optional<value> update_at(value const & root, std::span<const std::string> p, F && fn)
        {
            std::vector<value const*> chain;
            chain.reserve(p.size() + 1);
            chain.push_back(&root);

            for (auto const & seg : p)
            {
                value const* next = child(*chain.back(), seg);
                if (!next)
                    return std::nullopt;
                chain.push_back(next);
            }

            std::optional<value> current = fn(*chain.back());
            if (!current)
                return std::nullopt;

            for (size_t i = p.size(); i-- > 0;)
                current = replace_child(*chain[i], p[i], std::move(*current));

            return current;
        }

        inline std::span<const std::string> parent_of(path const & p)
        {
            return std::span<const std::string>(p.data(), p.size() - 1);
        }

        inline bool in_range(int64_t i, size_t limit)
        {
            return i >= 0 && static_cast<uint64_t>(i) < limit;
        }

    //--------------------------------------------------------------------

        inline std::optional<value> apply_op(set_value const & op, value const & root)
        {
            if (op.where.empty())
                return std::nullopt;

            auto const & key = op.where.back();

            return update_at(root, parent_of(op.where), [&](value const & parent) -> std::optional<value>
            {
                if (auto obj = parent.as_object())
                {
                    value::object_type copy = *obj;
                    auto it = std::ranges::find_if(copy, [&](auto const & m) { return m.first == key; });

                    if (it != copy.end())
                        it->second = op.val;
                    else
                        copy.emplace_back(key, op.val);   // new keys append

                    return value::from_unique_members(std::move(copy));
                }

                if (auto arr = parent.as_array())
                {
                    auto idx = parse_index(key);
                    if (!idx || *idx >= arr->size())
                        return std::nullopt;

                    value::array_type copy = *arr;
                    copy[*idx] = op.val;
                    return value(std::move(copy));
                }

                return std::nullopt;
            });
        }

        inline std::optional<value> apply_op(add_field const & op, value const & root)
        {
            path full = op.parent;
            full.push_back(op.key);
            return apply_op(set_value{ std::move(full), op.val }, root);
        }

        inline std::optional<value> apply_op(delete_field const & op, value const & root)
        {
            if (op.where.empty())
                return std::nullopt;

            auto const & key = op.where.back();

            return update_at(root, parent_of(op.where), [&](value const & parent) -> std::optional<value>
            {
                auto obj = parent.as_object();
                if (!obj)
                    return std::nullopt;

                value::object_type copy = *obj;
                auto it = std::ranges::find_if(copy, [&](auto const & m) { return m.first == key; });
                if (it == copy.end())
                    return std::nullopt;

                copy.erase(it);
                return value::from_unique_members(std::move(copy));
            });
        }

        inline std::optional<value> apply_op(delete_array_element const & op, value const & root)
        {
            if (op.where.empty())
                return std::nullopt;

            auto idx = parse_index(op.where.back());
            if (!idx)
                return std::nullopt;

            return update_at(root, parent_of(op.where), [&](value const & target) -> std::optional<value>
            {
                auto arr = target.as_array();
                if (!arr || *idx >= arr->size())
                    return std::nullopt;

                value::array_type copy = *arr;
                copy.erase(copy.begin() + static_cast<std::ptrdiff_t>(*idx));
                return value(std::move(copy));
            });
        }

        inline std::optional<value> apply_op(insert_array_element const & op, value const & root)
        {
            return update_at(root, op.where, [&](value const & target) -> std::optional<value>
            {
                auto arr = target.as_array();
                if (!arr)
                    return std::nullopt;

                value::array_type copy = *arr;

                if (!op.index)
                {
                    copy.push_back(op.val);
                    return value(std::move(copy));
                }

                // Inserting at `size` is an append.
                if (!in_range(*op.index, arr->size() + 1))
                    return std::nullopt;

                copy.insert(copy.begin() + *op.index, op.val);
                return value(std::move(copy));
            });
        }

        inline std::optional<value> apply_op(move_array_element const & op, value const & root)
        {
            return update_at(root, op.where, [&](value const & target) -> std::optional<value>
            {
                auto arr = target.as_array();
                if (!arr)
                    return std::nullopt;

                if (!in_range(op.from, arr->size()) || !in_range(op.to, arr->size()))
                    return std::nullopt;

                value::array_type copy = *arr;
                value moved = std::move(copy[op.from]);
                copy.erase(copy.begin() + op.from);
                copy.insert(copy.begin() + op.to, std::move(moved));
                return value(std::move(copy));
            });
        }
    }

//========================================================================
// PUBLIC EDIT API IMPLEMENTATION
//========================================================================

    inline std::optional<value> apply(edit_operation const & op, value const & root)
    {
        auto out = std::visit([&](auto const & o) { return detail::apply_op(o, root); }, op);

        if (!out)
            JADE_LOG(debug) << describe(op) << ": path did not resolve";

        return out;
    }

    inline std::string describe(edit_operation const & op)
    {
        struct describer
        {
            std::string operator()(set_value const & o) const
            {
                return "Set value at " + join_path(o.where);
            }
            std::string operator()(add_field const & o) const
            {
                path full = o.parent;
                full.push_back(o.key);
                return "Add field at " + join_path(full);
            }
            std::string operator()(delete_field const & o) const
            {
                return "Delete field at " + join_path(o.where);
            }
            std::string operator()(delete_array_element const & o) const
            {
                return "Delete array element at " + join_path(o.where);
            }
            std::string operator()(insert_array_element const & o) const
            {
                if (o.index)
                    return "Insert array element at " + join_path(o.where) + "[" + std::to_string(*o.index) + "]";
                return "Append array element to " + join_path(o.where);
            }
            std::string operator()(move_array_element const & o) const
            {
                return "Move array element at " + join_path(o.where)
                    + " from [" + std::to_string(o.from) + "] to [" + std::to_string(o.to) + "]";
            }
        };

        return std::visit(describer{}, op);
    }

    inline path target_path(edit_operation const & op)
    {
        if (auto a = std::get_if<add_field>(&op))
        {
            path full = a->parent;
            full.push_back(a->key);
            return full;
        }

        return std::visit([](auto const & o) -> path
        {
            if constexpr (requires { o.where; })
                return o.where;
            else
                return {};
        }, op);
    }

    // Keys are joined with '.' when recorded as edited paths.
    inline bool is_valid_field_key(std::string_view key)
    {
        return !key.empty() && key.find('.') == std::string_view::npos;
    }

} // namespace jade

#endif // JADE_EDIT_HPP
