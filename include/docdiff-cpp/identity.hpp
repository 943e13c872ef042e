/// @file identity.hpp
/// @brief Identity extraction for array elements.

#pragma once

#include <docdiff-cpp/value.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace docdiff_cpp {

/// The default reserved identity field.
inline constexpr std::string_view default_identity_field = "id";

/// How an array's elements are addressed.
///
/// An identifiable array maps every element's identity token to its
/// position. A positional array is addressed by index only; it is diffed
/// and patched correctly only when no reordering occurs.
struct IdentityMode {
    bool identifiable{false};
    std::map<std::string, std::size_t, std::less<>> positions;  ///< id -> index (identifiable only)

    auto operator==(const IdentityMode&) const -> bool = default;
};

/// The identity token of an array element: the string value of its
/// identity field. nullopt if the element is not an object or the field
/// is missing or not a string.
auto identity_of(const Value& element,
                 std::string_view identity_field = default_identity_field)
    -> std::optional<std::string>;

/// Classify an array.
///
/// Identifiable if every element is an object carrying a string identity
/// (empty arrays are identifiable); positional if any element lacks one.
/// @throws DiffException{duplicate_identity} if two siblings share an id.
/// @throws DiffException{type_mismatch} if `array` is not an array.
auto extract_identity(const Value& array,
                      std::string_view identity_field = default_identity_field)
    -> IdentityMode;

/// Index of the first element whose identity equals `token`, or nullopt.
auto find_by_identity(const Array& array, std::string_view token,
                      std::string_view identity_field = default_identity_field)
    -> std::optional<std::size_t>;

}  // namespace docdiff_cpp
