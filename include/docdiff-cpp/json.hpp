/// @file json.hpp
/// @brief nlohmann/json interoperability for docdiff-cpp.
///
/// Provides ADL serialization (to_json/from_json) for documents, changes
/// and options, plus text helpers for the change wire format:
///
/// @code{.json}
/// {"op": "replace", "path": "/toys/toy2/name", "value": "Robot", "itemIds": ["toy2"]}
/// @endcode

#pragma once

#include <docdiff-cpp/change.hpp>
#include <docdiff-cpp/options.hpp>
#include <docdiff-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace docdiff_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Documents ----------------------------------------------------------------

/// Objects and arrays map directly. Integers become int64, or uint64 when
/// above INT64_MAX; floating-point numbers become double.
void to_json(nlohmann::json& j, const Value& v);

/// @throws DiffException{codec_error} for binary or discarded JSON values.
void from_json(const nlohmann::json& j, Value& v);

// -- Changes ------------------------------------------------------------------

void to_json(nlohmann::json& j, Op op);

/// @throws DiffException{unsupported_operation} for an unknown op string.
void from_json(const nlohmann::json& j, Op& op);

/// `itemIds` is always written; `value` only when present.
void to_json(nlohmann::json& j, const Change& c);

/// @throws DiffException{invalid_change} for a malformed change object.
/// @throws DiffException{unsupported_operation} for an unknown op.
/// @throws DiffException{invalid_pointer} for a malformed path.
void from_json(const nlohmann::json& j, Change& c);

// -- Options ------------------------------------------------------------------

void to_json(nlohmann::json& j, const DiffOptions& options);

/// @throws DiffException{invalid_config} naming the offending key.
void from_json(const nlohmann::json& j, DiffOptions& options);

// =============================================================================
// Text helpers
// =============================================================================

/// Parse a JSON document.
/// @throws DiffException{codec_error} if `text` is not valid JSON.
auto parse_value(std::string_view text) -> Value;

/// Serialize a document. `indent` follows nlohmann::json::dump().
auto dump_value(const Value& v, int indent = -1) -> std::string;

/// Convert a JSON array of change objects.
/// @throws DiffException{invalid_change} if `j` is not an array.
auto changes_from_json(const nlohmann::json& j) -> ChangeList;

/// Parse a JSON array of change objects.
/// @throws DiffException{codec_error} if `text` is not valid JSON.
auto parse_changes(std::string_view text) -> ChangeList;

/// Serialize changes as a JSON array.
auto dump_changes(const ChangeList& changes, int indent = -1) -> std::string;

}  // namespace docdiff_cpp
