/// @file change.hpp
/// @brief Change type: one recorded mutation of a document.

#pragma once

#include <docdiff-cpp/path.hpp>
#include <docdiff-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docdiff_cpp {

/// The three change operations.
enum class Op : std::uint8_t {
    add,      ///< Create a field or array element.
    remove,   ///< Delete a field or array element.
    replace,  ///< Overwrite an existing object field.
};

/// Convert an Op to its wire representation.
constexpr auto to_string_view(Op op) noexcept -> std::string_view {
    switch (op) {
        case Op::add:     return "add";
        case Op::remove:  return "remove";
        case Op::replace: return "replace";
    }
    return "unknown";
}

/// One recorded mutation.
///
/// `path` is a logical path: identity-resolved array levels carry the
/// element's identity token instead of a position, and that same token
/// is listed in `item_ids` (one token per identity-resolved level, in
/// path order). Positional array levels carry a decimal index or "-"
/// and contribute no token.
///
/// @code
/// // Rename the toy with id "toy2", wherever it sits in the array.
/// auto c = Change{Op::replace, {"toys", "toy2", "name"}, Value{"Robot"}, {"toy2"}};
/// @endcode
struct Change {
    Op op{Op::add};
    Path path;
    std::optional<Value> value;         ///< Required for add and replace.
    std::vector<std::string> item_ids;  ///< Identity tokens crossed by `path`.

    auto operator==(const Change&) const -> bool = default;
};

/// An ordered change sequence. Order is significant: later changes may
/// rely on the tree state left by earlier ones.
using ChangeList = std::vector<Change>;

}  // namespace docdiff_cpp
