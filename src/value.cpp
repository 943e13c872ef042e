#include <docdiff-cpp/value.hpp>
#include <docdiff-cpp/error.hpp>

#include <string>
#include <utility>

namespace docdiff_cpp {

namespace {

[[noreturn]] void throw_kind_mismatch(ValueKind expected, ValueKind actual) {
    throw DiffException{ErrorKind::type_mismatch,
        "expected " + std::string{to_string_view(expected)} +
        ", found " + std::string{to_string_view(actual)}};
}

// Numeric equality across the three number representations.
auto numbers_equal(const Value::Storage& a, const Value::Storage& b) -> bool {
    return std::visit(overload{
        [](std::int64_t x, std::int64_t y) { return x == y; },
        [](std::uint64_t x, std::uint64_t y) { return x == y; },
        [](std::int64_t x, std::uint64_t y) {
            return x >= 0 && static_cast<std::uint64_t>(x) == y;
        },
        [](std::uint64_t x, std::int64_t y) {
            return y >= 0 && x == static_cast<std::uint64_t>(y);
        },
        [](double x, double y) { return x == y; },
        [](double x, std::int64_t y) { return x == static_cast<double>(y); },
        [](std::int64_t x, double y) { return static_cast<double>(x) == y; },
        [](double x, std::uint64_t y) { return x == static_cast<double>(y); },
        [](std::uint64_t x, double y) { return static_cast<double>(x) == y; },
        [](const auto&, const auto&) { return false; },
    }, a, b);
}

}  // anonymous namespace

Value::Value(Object o)
    : data_{std::make_shared<const Object>(std::move(o))} {}

Value::Value(Array a)
    : data_{std::make_shared<const Array>(std::move(a))} {}

auto Value::kind() const noexcept -> ValueKind {
    return std::visit(overload{
        [](Null) { return ValueKind::null; },
        [](bool) { return ValueKind::boolean; },
        [](std::int64_t) { return ValueKind::number; },
        [](std::uint64_t) { return ValueKind::number; },
        [](double) { return ValueKind::number; },
        [](const std::string&) { return ValueKind::string; },
        [](const std::shared_ptr<const Object>&) { return ValueKind::object; },
        [](const std::shared_ptr<const Array>&) { return ValueKind::array; },
    }, data_);
}

auto Value::object_if() const noexcept -> const Object* {
    if (const auto* p = std::get_if<std::shared_ptr<const Object>>(&data_)) {
        return p->get();
    }
    return nullptr;
}

auto Value::array_if() const noexcept -> const Array* {
    if (const auto* p = std::get_if<std::shared_ptr<const Array>>(&data_)) {
        return p->get();
    }
    return nullptr;
}

auto Value::as_object() const -> const Object& {
    if (const auto* o = object_if()) return *o;
    throw_kind_mismatch(ValueKind::object, kind());
}

auto Value::as_array() const -> const Array& {
    if (const auto* a = array_if()) return *a;
    throw_kind_mismatch(ValueKind::array, kind());
}

auto Value::as_string() const -> const std::string& {
    if (const auto* s = string_if()) return *s;
    throw_kind_mismatch(ValueKind::string, kind());
}

auto Value::find(std::string_view key) const -> const Value* {
    const auto* obj = object_if();
    if (!obj) return nullptr;
    auto it = obj->find(key);
    return it != obj->end() ? &it->second : nullptr;
}

auto Value::size() const noexcept -> std::size_t {
    if (const auto* o = object_if()) return o->size();
    if (const auto* a = array_if()) return a->size();
    return 0;
}

// -- Copy-on-write updates ----------------------------------------------------

auto Value::with_field(std::string_view key, Value v) const -> Value {
    auto copy = as_object();
    auto it = copy.find(key);
    if (it != copy.end()) {
        it->second = std::move(v);
    } else {
        copy.emplace(std::string{key}, std::move(v));
    }
    return Value{std::move(copy)};
}

auto Value::without_field(std::string_view key) const -> Value {
    auto copy = as_object();
    auto it = copy.find(key);
    if (it != copy.end()) copy.erase(it);
    return Value{std::move(copy)};
}

auto Value::with_element(std::size_t index, Value v) const -> Value {
    auto copy = as_array();
    if (index >= copy.size()) {
        throw DiffException{ErrorKind::path_not_found,
            "array index " + std::to_string(index) + " out of range"};
    }
    copy[index] = std::move(v);
    return Value{std::move(copy)};
}

auto Value::inserted(std::size_t index, Value v) const -> Value {
    auto copy = as_array();
    if (index > copy.size()) {
        throw DiffException{ErrorKind::path_not_found,
            "array index " + std::to_string(index) + " out of range"};
    }
    copy.insert(copy.begin() + static_cast<std::ptrdiff_t>(index), std::move(v));
    return Value{std::move(copy)};
}

auto Value::erased(std::size_t index) const -> Value {
    auto copy = as_array();
    if (index >= copy.size()) {
        throw DiffException{ErrorKind::path_not_found,
            "array index " + std::to_string(index) + " out of range"};
    }
    copy.erase(copy.begin() + static_cast<std::ptrdiff_t>(index));
    return Value{std::move(copy)};
}

auto Value::appended(Value v) const -> Value {
    auto copy = as_array();
    copy.push_back(std::move(v));
    return Value{std::move(copy)};
}

// -- Comparison ---------------------------------------------------------------

auto Value::shares_storage_with(const Value& other) const noexcept -> bool {
    if (const auto* a = std::get_if<std::shared_ptr<const Object>>(&data_)) {
        const auto* b = std::get_if<std::shared_ptr<const Object>>(&other.data_);
        return b && *a == *b;
    }
    if (const auto* a = std::get_if<std::shared_ptr<const Array>>(&data_)) {
        const auto* b = std::get_if<std::shared_ptr<const Array>>(&other.data_);
        return b && *a == *b;
    }
    return false;
}

auto Value::operator==(const Value& other) const -> bool {
    if (shares_storage_with(other)) return true;

    const auto k = kind();
    if (k != other.kind()) return false;

    switch (k) {
        case ValueKind::null:
            return true;
        case ValueKind::boolean:
            return std::get<bool>(data_) == std::get<bool>(other.data_);
        case ValueKind::number:
            return numbers_equal(data_, other.data_);
        case ValueKind::string:
            return std::get<std::string>(data_) == std::get<std::string>(other.data_);
        case ValueKind::object:
            return *object_if() == *other.object_if();
        case ValueKind::array:
            return *array_if() == *other.array_if();
    }
    return false;
}

}  // namespace docdiff_cpp
