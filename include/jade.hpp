// jade.hpp - JSON Authored Document Engine (Jade)
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Jade Core Principles:
//========================================================================
//
// The Authored-Text Principle
// ---------------------------
// The file as written is meaningful.
// Key order, whitespace and layout belong to its authors.
// Jade rewrites only what an edit touched.
//
//
// The Snapshot Principle
// ----------------------
// Documents and values never change once built.
// An edit yields a new snapshot or nothing at all.
// Old snapshots stay valid, so undo is keeping them.
//
//
// The Exhaustive Validation Principle
// -----------------------------------
// A half-conforming document is still a document.
// Validation reports every finding and never stops early.
// Warnings inform; only errors block.
//
//========================================================================

#ifndef JADE_JSON_AUTHORED_DOCUMENT_ENGINE
#define JADE_JSON_AUTHORED_DOCUMENT_ENGINE

#include "jade_core.hpp"
#include "jade_log.hpp"
#include "jade_parser.hpp"
#include "jade_edit.hpp"
#include "jade_serializer.hpp"
#include "jade_document.hpp"
#include "jade_schema.hpp"
#include "jade_validator.hpp"
#include "jade_diff.hpp"

#endif // JADE_JSON_AUTHORED_DOCUMENT_ENGINE
