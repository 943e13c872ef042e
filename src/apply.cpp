#include <docdiff-cpp/apply.hpp>
#include <docdiff-cpp/error.hpp>
#include <docdiff-cpp/identity.hpp>
#include <docdiff-cpp/path.hpp>

#include "logging.hpp"

#include <algorithm>
#include <string>

namespace docdiff_cpp {

namespace {

class ChangeApplier {
public:
    ChangeApplier(const Change& change, std::string_view identity_field)
        : change_{change}, identity_field_{identity_field} {}

    auto rewrite(const Value& node, std::size_t depth, std::size_t token) const -> Value {
        const auto& segment = change_.path[depth];
        const auto last = (depth + 1 == change_.path.size());

        if (node.is_object()) {
            if (last) return apply_to_object(node, segment);
            const auto* child = node.find(segment);
            if (!child) fail(ErrorKind::path_not_found, depth, "field does not exist");
            return node.with_field(segment, rewrite(*child, depth + 1, token));
        }

        if (const auto* arr = node.array_if()) {
            if (resolves_by_identity(*arr, segment, token)) {
                return apply_by_identity(node, *arr, depth, token);
            }
            return apply_by_index(node, *arr, depth, token);
        }

        fail(ErrorKind::path_not_found, depth, "parent is a scalar");
    }

private:
    // The segment names an element by identity only when it matches the next
    // token and the array is addressed that way; a positional index that
    // happens to equal a deeper token leaves the token for that level.
    auto resolves_by_identity(const Array& arr, const std::string& segment,
                              std::size_t token) const -> bool {
        if (token >= change_.item_ids.size() || change_.item_ids[token] != segment) return false;
        return std::ranges::all_of(arr, [this](const Value& element) {
            return identity_of(element, identity_field_).has_value();
        });
    }

    auto apply_to_object(const Value& node, const std::string& segment) const -> Value {
        const auto depth = change_.path.size() - 1;
        switch (change_.op) {
            case Op::add:
                return node.with_field(segment, *change_.value);
            case Op::remove:
                if (!node.find(segment)) fail(ErrorKind::path_not_found, depth, "field does not exist");
                return node.without_field(segment);
            case Op::replace:
                if (!node.find(segment)) fail(ErrorKind::path_not_found, depth, "field does not exist");
                return node.with_field(segment, *change_.value);
        }
        fail(ErrorKind::unsupported_operation, depth, "unknown op");
    }

    auto apply_by_identity(const Value& node, const Array& arr, std::size_t depth,
                           std::size_t token) const -> Value {
        const auto& segment = change_.path[depth];
        const auto last = (depth + 1 == change_.path.size());

        // New elements are appended without a lookup.
        if (last && change_.op == Op::add) {
            if (!change_.value->is_object()) {
                fail(ErrorKind::type_mismatch, depth, "identified element must be an object");
            }
            return node.appended(change_.value->with_field(identity_field_, segment));
        }

        auto index = find_by_identity(arr, segment, identity_field_);
        if (!index) fail(ErrorKind::identity_not_found, depth, "no element with this identity");

        if (!last) return node.with_element(*index, rewrite(arr[*index], depth + 1, token + 1));
        if (change_.op == Op::replace) {
            fail(ErrorKind::type_mismatch, depth, "cannot replace an array element");
        }
        return node.erased(*index);
    }

    auto apply_by_index(const Value& node, const Array& arr, std::size_t depth,
                        std::size_t token) const -> Value {
        const auto& segment = change_.path[depth];
        const auto last = (depth + 1 == change_.path.size());
        const auto index = try_parse_index(segment);

        if (!last) {
            if (!index || *index >= arr.size()) {
                fail(ErrorKind::path_not_found, depth, "array index out of range");
            }
            return node.with_element(*index, rewrite(arr[*index], depth + 1, token));
        }

        switch (change_.op) {
            case Op::add:
                if (segment == append_marker) return node.appended(*change_.value);
                if (!index || *index > arr.size()) {
                    fail(ErrorKind::path_not_found, depth, "array index out of range");
                }
                return node.inserted(*index, *change_.value);
            case Op::remove:
                if (!index || *index >= arr.size()) {
                    fail(ErrorKind::path_not_found, depth, "array index out of range");
                }
                return node.erased(*index);
            case Op::replace:
                fail(ErrorKind::type_mismatch, depth, "cannot replace an array element");
        }
        fail(ErrorKind::unsupported_operation, depth, "unknown op");
    }

    [[noreturn]] void fail(ErrorKind kind, std::size_t depth, const char* what) const {
        auto prefix = Path(change_.path.begin(),
                           change_.path.begin() + static_cast<std::ptrdiff_t>(depth) + 1);
        throw DiffException{kind,
            std::string{to_string_view(change_.op)} + " '" + to_pointer(change_.path) +
            "' at '" + to_pointer(prefix) + "': " + what};
    }

    const Change& change_;
    std::string_view identity_field_;
};

}  // anonymous namespace

auto apply_change(const Change& change, const Value& target,
                  std::string_view identity_field) -> Value {
    if (change.op != Op::add && change.op != Op::remove && change.op != Op::replace) {
        throw DiffException{ErrorKind::unsupported_operation,
            "unknown op " + std::to_string(static_cast<int>(change.op)) +
            " at '" + to_pointer(change.path) + "'"};
    }
    if (change.op != Op::remove && !change.value) {
        throw DiffException{ErrorKind::invalid_change,
            std::string{to_string_view(change.op)} + " '" + to_pointer(change.path) +
            "' carries no value"};
    }

    detail::logger()->trace("apply {} '{}' item_ids={}", to_string_view(change.op),
                            to_pointer(change.path), change.item_ids.size());

    if (change.path.empty()) {
        if (change.op == Op::remove) {
            throw DiffException{ErrorKind::type_mismatch, "cannot remove the document root"};
        }
        return *change.value;
    }
    return ChangeApplier{change, identity_field}.rewrite(target, 0, 0);
}

auto apply_change_sequence(std::span<const Change> changes, const Value& target,
                           std::string_view identity_field) -> Value {
    auto current = target;
    for (const auto& change : changes) {
        current = apply_change(change, current, identity_field);
    }
    return current;
}

}  // namespace docdiff_cpp
