/// @file value.hpp
/// @brief The document tree: Value, Object, Array, and ValueKind.

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docdiff_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

class Value;

/// Field name -> value. Key-sorted so that traversal order is deterministic.
using Object = std::map<std::string, Value, std::less<>>;

/// An ordered sequence of values.
using Array = std::vector<Value>;

/// The six kinds of document values.
enum class ValueKind : std::uint8_t {
    null,
    boolean,
    number,
    string,
    object,
    array,
};

/// Convert a ValueKind to its string representation.
constexpr auto to_string_view(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::null:    return "null";
        case ValueKind::boolean: return "boolean";
        case ValueKind::number:  return "number";
        case ValueKind::string:  return "string";
        case ValueKind::object:  return "object";
        case ValueKind::array:   return "array";
    }
    return "unknown";
}

/// An immutable document value.
///
/// Objects and arrays are held through shared pointers to const storage:
/// copying a Value is cheap, and the with_* / inserted / erased helpers
/// return a new Value that shares every child they did not touch.
///
/// @code
/// auto doc = Value{Object{{"id", "1"}, {"name", "Alice"}}};
/// auto renamed = doc.with_field("name", "Bob");   // doc is unchanged
/// @endcode
class Value {
public:
    using Storage = std::variant<
        Null,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        std::shared_ptr<const Object>,
        std::shared_ptr<const Array>
    >;

    Value() = default;
    Value(Null) {}
    Value(std::nullptr_t) {}
    Value(bool b) : data_{b} {}

    template <std::signed_integral T>
        requires (!std::same_as<T, bool>)
    Value(T i) : data_{static_cast<std::int64_t>(i)} {}

    template <std::unsigned_integral T>
        requires (!std::same_as<T, bool>)
    Value(T u) : data_{static_cast<std::uint64_t>(u)} {}

    Value(double d) : data_{d} {}
    Value(const char* s) : data_{std::string{s}} {}
    Value(std::string_view s) : data_{std::string{s}} {}
    Value(std::string s) : data_{std::move(s)} {}
    Value(Object o);
    Value(Array a);

    // -- Kind queries ---------------------------------------------------------

    auto kind() const noexcept -> ValueKind;

    auto is_null() const noexcept -> bool { return kind() == ValueKind::null; }
    auto is_bool() const noexcept -> bool { return kind() == ValueKind::boolean; }
    auto is_number() const noexcept -> bool { return kind() == ValueKind::number; }
    auto is_string() const noexcept -> bool { return kind() == ValueKind::string; }
    auto is_object() const noexcept -> bool { return kind() == ValueKind::object; }
    auto is_array() const noexcept -> bool { return kind() == ValueKind::array; }
    auto is_container() const noexcept -> bool { return is_object() || is_array(); }

    // -- Access ---------------------------------------------------------------

    /// The underlying variant, for std::visit.
    auto storage() const noexcept -> const Storage& { return data_; }

    /// Typed access to a scalar alternative, or nullptr on mismatch.
    template <typename T>
    auto get_if() const noexcept -> const T* { return std::get_if<T>(&data_); }

    /// The string payload, or nullptr if this is not a string.
    auto string_if() const noexcept -> const std::string* { return get_if<std::string>(); }

    /// The object payload, or nullptr if this is not an object.
    auto object_if() const noexcept -> const Object*;

    /// The array payload, or nullptr if this is not an array.
    auto array_if() const noexcept -> const Array*;

    /// The object payload. @throws DiffException{type_mismatch}
    auto as_object() const -> const Object&;

    /// The array payload. @throws DiffException{type_mismatch}
    auto as_array() const -> const Array&;

    /// The string payload. @throws DiffException{type_mismatch}
    auto as_string() const -> const std::string&;

    /// Look up a field of an object. Returns nullptr for a missing field
    /// or when this value is not an object.
    auto find(std::string_view key) const -> const Value*;

    /// Number of fields (object) or elements (array); 0 for scalars.
    auto size() const noexcept -> std::size_t;

    // -- Copy-on-write updates ------------------------------------------------

    /// A copy of this object with `key` set to `v`. @throws type_mismatch
    auto with_field(std::string_view key, Value v) const -> Value;

    /// A copy of this object without `key`. @throws type_mismatch
    auto without_field(std::string_view key) const -> Value;

    /// A copy of this array with element `index` replaced. @throws type_mismatch
    auto with_element(std::size_t index, Value v) const -> Value;

    /// A copy of this array with `v` inserted before `index`. @throws type_mismatch
    auto inserted(std::size_t index, Value v) const -> Value;

    /// A copy of this array without element `index`. @throws type_mismatch
    auto erased(std::size_t index) const -> Value;

    /// A copy of this array with `v` appended. @throws type_mismatch
    auto appended(Value v) const -> Value;

    // -- Comparison -----------------------------------------------------------

    /// Deep structural equality. Numbers compare numerically across
    /// int64 / uint64 / double; array order is significant.
    auto operator==(const Value& other) const -> bool;

    /// True if both values are containers sharing the same storage.
    /// A cheap check that never recurses.
    auto shares_storage_with(const Value& other) const noexcept -> bool;

private:
    Storage data_{Null{}};
};

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { ... },
///     [](auto&&) { ... },
/// }, value.storage());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed scalar extraction helpers ------------------------------------------

/// Extract a typed scalar from a Value, or nullopt on type mismatch.
/// @code
/// auto name = get_scalar<std::string>(value);
/// @endcode
template <typename T>
auto get_scalar(const Value& v) -> std::optional<T> {
    if (const auto* t = v.get_if<T>()) {
        return *t;
    }
    return std::nullopt;
}

/// Extract a typed scalar from a pointer returned by Value::find().
template <typename T>
auto get_scalar(const Value* v) -> std::optional<T> {
    if (!v) return std::nullopt;
    return get_scalar<T>(*v);
}

}  // namespace docdiff_cpp
