/// @file apply.hpp
/// @brief Replay changes against a concrete document instance.

#pragma once

#include <docdiff-cpp/change.hpp>
#include <docdiff-cpp/identity.hpp>
#include <docdiff-cpp/value.hpp>

#include <span>
#include <string_view>

namespace docdiff_cpp {

/// Apply one change to `target` and return the resulting document.
///
/// `target` is never modified; the result shares every subtree the change
/// does not touch. Array levels whose path segment equals the next
/// item_ids token are resolved by identity against the target's actual
/// layout, so the change applies regardless of how the target orders its
/// identifiable arrays. Other array levels take a decimal index or "-".
///
/// An add whose terminal segment is an identity token appends `value`
/// with the token written into `identity_field`.
///
/// @code
/// auto c = Change{Op::replace, {"toys", "toy2", "name"}, Value{"Robot"}, {"toy2"}};
/// auto updated = apply_change(c, doc);
/// @endcode
///
/// @throws DiffException{path_not_found} for a missing intermediate node.
/// @throws DiffException{identity_not_found} if a token matches no sibling.
/// @throws DiffException{type_mismatch} for a replace on an array slot.
/// @throws DiffException{invalid_change} for add/replace without a value.
/// @throws DiffException{unsupported_operation} for an unknown op.
auto apply_change(const Change& change, const Value& target,
                  std::string_view identity_field = default_identity_field) -> Value;

/// Left fold of apply_change() over `changes`, in order.
/// Either every change applies or the call throws; `target` is untouched.
auto apply_change_sequence(std::span<const Change> changes, const Value& target,
                           std::string_view identity_field = default_identity_field) -> Value;

}  // namespace docdiff_cpp
