#pragma once

/// @file aywson.hpp
/// @brief Main header file for the aywson library.
///
/// aywson edits JSON-with-comments documents as text: every operation
/// takes the document and returns a new one in which only the edited span
/// differs. Comments, indentation and trailing commas elsewhere are kept.
///
/// @code
///   std::string doc = R"({
///     // listening port
///     "port": 8080,
///     "legacy": true
///   })";
///   doc = aywson::set(doc, "port", 9090);          // comment kept
///   doc = aywson::remove(doc, "legacy");
///   doc = aywson::merge(doc, {{"tls", {{"enabled", true}}}});
///   doc = aywson::sort(doc);
/// @endcode

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "options.hpp"
#include "value.hpp"
#include "serializer.hpp"
#include "path.hpp"
#include "scanner.hpp"
#include "tree.hpp"
#include "edit.hpp"
#include "comments.hpp"
#include "range.hpp"
#include "change.hpp"
#include "document.hpp"
#include "sort.hpp"
#include "format.hpp"
