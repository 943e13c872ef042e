/// @file path.hpp
/// @brief Logical paths and their RFC 6901 JSON Pointer wire form.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docdiff_cpp {

/// A path into the document tree. Each segment is a field name, an
/// identity token, a decimal array index, or the append marker "-".
using Path = std::vector<std::string>;

/// The array append marker.
inline constexpr std::string_view append_marker = "-";

/// Parse an RFC 6901 JSON Pointer into segments.
/// "" = root (0 segments), "/" = one empty segment, "/a/b/0" = ["a", "b", "0"].
/// @throws DiffException{invalid_pointer} if a non-empty pointer does not start with '/'.
auto parse_pointer(std::string_view pointer) -> Path;

/// Render a path as an RFC 6901 JSON Pointer ("" for the root).
auto to_pointer(const Path& path) -> std::string;

/// Escape a segment for RFC 6901: ~ -> ~0, / -> ~1
auto escape_pointer_segment(std::string_view segment) -> std::string;

/// Try to parse a segment as an array index.
/// Leading zeros are rejected (except "0" itself), as is "-".
auto try_parse_index(std::string_view segment) -> std::optional<std::size_t>;

}  // namespace docdiff_cpp
