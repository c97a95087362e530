// jade_document.hpp - JSON Authored Document Engine (Jade) - Document Model
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// A document is an immutable snapshot: content, the text it was loaded
// from, and the paths edited since. Every edit returns a new snapshot and
// leaves the previous one intact, so undo is simply keeping old snapshots.

#ifndef JADE_DOCUMENT_HPP
#define JADE_DOCUMENT_HPP

#include "jade_core.hpp"
#include "jade_edit.hpp"
#include "jade_log.hpp"
#include "jade_parser.hpp"
#include "jade_serializer.hpp"

#include <atomic>
#include <concepts>
#include <set>

namespace jade
{
    class document;

    using doc_context = context<document, parse_error>;

    doc_context load(std::string_view text, std::string location = {}, parse_options opt = {});

//========================================================================
// Editable documents
//========================================================================

    template <typename D>
    concept editable = requires(D const & d, value v, path const & p)
    {
        { d.content() }                -> std::convertible_to<value const &>;
        { d.original_text() }          -> std::convertible_to<std::optional<std::string_view>>;
        { d.with_updated_value(v, p) } -> std::same_as<std::optional<D>>;
        { d.serialize() }              -> std::convertible_to<std::optional<std::string>>;
    };

    // Compares serializations, never trees: a reverted edit is no change.
    template <editable D>
    bool has_changes(D const & doc)
    {
        auto original = doc.original_text();
        if (!original)
            return false;

        auto text = doc.serialize();
        return !text || *text != *original;
    }

//========================================================================
// Document
//========================================================================

    class document
    {
    public:
        //------------------------------------------------------------------------
        // Construction
        //------------------------------------------------------------------------

        // No original text: serializes canonically and never has changes.
        static std::optional<document> from_content(std::string location, value content);

        //------------------------------------------------------------------------
        // Access
        //------------------------------------------------------------------------

        document_id id() const noexcept { return id_; }

        std::string const & location() const noexcept { return location_; }

        value const & content() const noexcept { return content_; }

        std::optional<std::string_view> original_text() const noexcept
        {
            if (!source_)
                return std::nullopt;
            return source_->text();
        }

        std::shared_ptr<const source_tree> const & source() const noexcept { return source_; }

        std::set<std::string> const & edited_paths() const noexcept { return edited_paths_; }

        // "strings/en.json" gives "en" and "en.json".
        std::string name() const;
        std::string file_name() const;

        //------------------------------------------------------------------------
        // Snapshots
        //------------------------------------------------------------------------

        std::optional<document> with_updated_value(value v, path const & p) const;

        std::optional<document> with_edit(edit_operation const & op) const;

        // Replaces the whole tree and forgets edited paths. The original text
        // stays the baseline for diffs and change detection.
        std::optional<document> with_updated_content(value content) const;

        //------------------------------------------------------------------------
        // Output
        //------------------------------------------------------------------------

        std::optional<std::string> serialize(serializer_options const & opt = {}) const;

        bool has_changes() const;

    private:
        document(document_id id, std::string location, value content, std::shared_ptr<const source_tree> source)
            : id_(id)
            , location_(std::move(location))
            , content_(std::move(content))
            , source_(std::move(source))
        {}

        static document_id next_id()
        {
            static std::atomic<size_t> counter{ 0 };
            return document_id{ counter.fetch_add(1, std::memory_order_relaxed) };
        }

        document derive(value content, std::string const & edited) const
        {
            document out(id_, location_, std::move(content), source_);
            out.edited_paths_ = edited_paths_;
            out.edited_paths_.insert(edited);
            return out;
        }

        document_id                        id_;
        std::string                        location_;
        value                              content_;
        std::shared_ptr<const source_tree> source_;
        std::set<std::string>              edited_paths_;

        friend doc_context load(std::string_view text, std::string location, parse_options opt);
    };

//========================================================================
// DOCUMENT IMPLEMENTATION
//========================================================================

    inline std::optional<document> document::from_content(std::string location, value content)
    {
        if (!content.is_object())
        {
            JADE_LOG(debug) << "document content must be an object, got " << type_name(content.type());
            return std::nullopt;
        }
        return document(next_id(), std::move(location), std::move(content), nullptr);
    }

    inline std::string document::file_name() const
    {
        size_t slash = location_.find_last_of("/\\");
        return slash == std::string::npos ? location_ : location_.substr(slash + 1);
    }

    inline std::string document::name() const
    {
        std::string file = file_name();
        size_t dot = file.rfind('.');
        if (dot == std::string::npos || dot == 0)
            return file;
        return file.substr(0, dot);
    }

    inline std::optional<document> document::with_updated_value(value v, path const & p) const
    {
        return with_edit(set_value{ p, std::move(v) });
    }

    inline std::optional<document> document::with_edit(edit_operation const & op) const
    {
        auto updated = jade::apply(op, content_);
        if (!updated)
            return std::nullopt;

        return derive(std::move(*updated), join_path(target_path(op)));
    }

    inline std::optional<document> document::with_updated_content(value content) const
    {
        if (!content.is_object())
        {
            JADE_LOG(debug) << location_ << ": replacement content must be an object";
            return std::nullopt;
        }
        return document(id_, location_, std::move(content), source_);
    }

    inline std::optional<std::string> document::serialize(serializer_options const & opt) const
    {
        if (source_)
            return jade::serialize(content_, *source_, opt);
        return jade::serialize(content_, opt);
    }

    inline bool document::has_changes() const
    {
        return jade::has_changes(*this);
    }

    static_assert(editable<document>);

//========================================================================
// LOADING
//========================================================================

    inline doc_context load(std::string_view text, std::string location, parse_options opt)
    {
        doc_context out;

        auto parsed = parse(text, opt);
        if (!parsed.result)
        {
            out.errors = std::move(parsed.errors);
            return out;
        }

        if (!parsed.result->root.is_object())
        {
            auto const & root = *parsed.result->source->node(parsed.result->source->root());
            std::string msg(to_string(parse_error_kind::root_not_object));
            msg += ": found ";
            msg += type_name(root.type);

            out.errors.push_back(parse_error{
                parse_error_kind::root_not_object,
                position_of(text, root.span.begin),
                std::move(msg)
            });

            JADE_LOG(debug) << location << ": " << out.errors.back().message;
            return out;
        }

        out.result = document(
            document::next_id(),
            std::move(location),
            std::move(parsed.result->root),
            std::move(parsed.result->source));

        return out;
    }

} // namespace jade

#endif // JADE_DOCUMENT_HPP
