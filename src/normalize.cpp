#include <docdiff-cpp/normalize.hpp>
#include <docdiff-cpp/error.hpp>
#include <docdiff-cpp/identity.hpp>

#include "logging.hpp"

#include <string>
#include <utility>

namespace docdiff_cpp {

namespace {

// `field_path` holds field names only; array levels do not extend it.
auto prune(const Value& value, const ExclusionSet& exclusions, Path& field_path) -> Value {
    if (const auto* obj = value.object_if()) {
        auto result = Object{};
        for (const auto& [key, child] : *obj) {
            field_path.push_back(key);
            if (!exclusions.excludes(field_path)) {
                result.emplace(key, prune(child, exclusions, field_path));
            }
            field_path.pop_back();
        }
        return Value{std::move(result)};
    }
    if (const auto* arr = value.array_if()) {
        auto result = Array{};
        result.reserve(arr->size());
        for (const auto& element : *arr) {
            result.push_back(prune(element, exclusions, field_path));
        }
        return Value{std::move(result)};
    }
    return value;
}

auto keyed(const Value& value, const DiffOptions& options, Path& field_path) -> Value {
    if (const auto* obj = value.object_if()) {
        auto result = Object{};
        for (const auto& [key, child] : *obj) {
            field_path.push_back(key);
            result.emplace(key, keyed(child, options, field_path));
            field_path.pop_back();
        }
        return Value{std::move(result)};
    }

    if (const auto* arr = value.array_if()) {
        auto mode = extract_identity(value, options.identity_field);
        if (mode.identifiable) {
            auto result = Object{};
            for (const auto& [id, index] : mode.positions) {
                result.emplace(id, keyed((*arr)[index], options, field_path));
            }
            return Value{std::move(result)};
        }

        if (options.requires_identity(field_path)) {
            throw DiffException{ErrorKind::missing_identity,
                "array at '" + to_pointer(field_path) + "' requires '" +
                options.identity_field + "' on every element"};
        }
        for (const auto& element : *arr) {
            if (identity_of(element, options.identity_field)) {
                detail::logger()->warn(
                    "array at '{}' mixes elements with and without '{}'; "
                    "diffing it by position, reordering will not be detected",
                    to_pointer(field_path), options.identity_field);
                break;
            }
        }

        auto result = Array{};
        result.reserve(arr->size());
        for (const auto& element : *arr) {
            result.push_back(keyed(element, options, field_path));
        }
        return Value{std::move(result)};
    }

    return value;
}

}  // anonymous namespace

auto apply_exclusions(const Value& value, const ExclusionSet& exclusions) -> Value {
    if (exclusions.empty()) return value;
    auto field_path = Path{};
    return prune(value, exclusions, field_path);
}

auto normalize(const Value& value, const DiffOptions& options) -> Value {
    auto field_path = Path{};
    return keyed(apply_exclusions(value, options.exclusions), options, field_path);
}

auto normalize(const Value& value, const ExclusionSet& exclusions) -> Value {
    auto options = DiffOptions{};
    options.exclusions = exclusions;
    return normalize(value, options);
}

}  // namespace docdiff_cpp
