// jade_diff.hpp - JSON Authored Document Engine (Jade) - Change Tracking
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JADE_DIFF_HPP
#define JADE_DIFF_HPP

#include "jade_core.hpp"

#include <map>

namespace jade
{
    enum class change_status
    {
        added,
        modified,
        deleted
    };

    inline std::string_view to_string(change_status s)
    {
        switch (s)
        {
            case change_status::added:    return "added";
            case change_status::modified: return "modified";
            case change_status::deleted:  return "deleted";
        }
        return "unknown";
    }

    using change_map = std::map<std::string, change_status>;

    // Status of every changed leaf, keyed by dotted path. Array elements are
    // compared by index. Without an original nothing is reported.
    change_map compute_changes(value const & current, value const* original);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        inline path extend(path const & p, std::string segment)
        {
            path out = p;
            out.push_back(std::move(segment));
            return out;
        }

        inline void mark_deleted(value const & v, path const & at, change_map & out)
        {
            if (v.is_object())
            {
                for (auto const & [k, child] : v.members())
                {
                    path here = extend(at, k);
                    out[join_path(here)] = change_status::deleted;
                    mark_deleted(child, here, out);
                }
            }
            else if (v.is_array())
            {
                for (size_t i = 0; i < v.size(); ++i)
                {
                    path here = extend(at, std::to_string(i));
                    out[join_path(here)] = change_status::deleted;
                    mark_deleted(*v.at(i), here, out);
                }
            }
        }

        inline bool same_leaf(value const & a, value const & b)
        {
            if (a.is_number() && b.is_number())
                return *a.as_number() == *b.as_number();
            return a == b;
        }

        inline void collect_changes(value const & cur, value const* orig, path const & at, change_map & out)
        {
            if (orig && orig->shares_storage_with(cur))
                return;

            if (cur.is_object())
            {
                value const* orig_obj = (orig && orig->is_object()) ? orig : nullptr;

                for (auto const & [k, child] : cur.members())
                    collect_changes(child, orig_obj ? orig_obj->find(k) : nullptr, extend(at, k), out);

                if (orig_obj)
                {
                    for (auto const & [k, child] : orig_obj->members())
                    {
                        if (cur.contains(k))
                            continue;
                        path here = extend(at, k);
                        out[join_path(here)] = change_status::deleted;
                        mark_deleted(child, here, out);
                    }
                }
                return;
            }

            if (cur.is_array())
            {
                value const* orig_arr = (orig && orig->is_array()) ? orig : nullptr;

                for (size_t i = 0; i < cur.size(); ++i)
                    collect_changes(*cur.at(i), orig_arr ? orig_arr->at(i) : nullptr, extend(at, std::to_string(i)), out);

                if (orig_arr)
                {
                    for (size_t i = cur.size(); i < orig_arr->size(); ++i)
                    {
                        path here = extend(at, std::to_string(i));
                        out[join_path(here)] = change_status::deleted;
                        mark_deleted(*orig_arr->at(i), here, out);
                    }
                }
                return;
            }

            if (at.empty())
                return;

            if (!orig)
                out[join_path(at)] = change_status::added;
            else if (!same_leaf(cur, *orig))
                out[join_path(at)] = change_status::modified;
        }
    }

    inline change_map compute_changes(value const & current, value const* original)
    {
        change_map out;
        if (original)
            detail::collect_changes(current, original, {}, out);
        return out;
    }

} // namespace jade

#endif // JADE_DIFF_HPP
