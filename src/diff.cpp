#include <docdiff-cpp/diff.hpp>
#include <docdiff-cpp/error.hpp>
#include <docdiff-cpp/identity.hpp>
#include <docdiff-cpp/normalize.hpp>

#include "logging.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace docdiff_cpp {

namespace {

// One tree position seen from one side. The normalized node drives the
// comparison; the pruned source node supplies emitted values and the
// positions behind identity keys.
struct Side {
    const Value& norm;
    const Value& src;
};

enum class Shape : std::uint8_t {
    scalar,
    object,
    keyed_array,
    positional_array,
};

auto shape_of(const Side& side) -> Shape {
    if (side.src.is_object()) return Shape::object;
    if (side.src.is_array()) {
        return side.norm.is_object() ? Shape::keyed_array : Shape::positional_array;
    }
    return Shape::scalar;
}

auto is_array_shape(Shape shape) -> bool {
    return shape == Shape::keyed_array || shape == Shape::positional_array;
}

// Map an identity key of the normalized view back onto the source array.
auto source_element(const Value& src_array, const IdentityMode& mode,
                    const std::string& id, const Path& path) -> const Value& {
    auto it = mode.positions.find(id);
    if (it == mode.positions.end()) {
        throw DiffException{ErrorKind::path_not_found,
            "identity '" + id + "' at '" + to_pointer(path) + "' has no source element"};
    }
    return src_array.as_array()[it->second];
}

// Identity policy without exclusions, for normalizing already-pruned trees.
auto identity_policy(const DiffOptions& options) -> DiffOptions {
    auto policy = options;
    policy.exclusions = ExclusionSet{};
    return policy;
}

class DiffWalker {
public:
    DiffWalker(const DiffOptions& options, Path path, std::vector<std::string> item_ids)
        : options_{options}, path_{std::move(path)}, item_ids_{std::move(item_ids)} {}

    void diff(const Side& before, const Side& after, bool parent_is_array) {
        if (before.src.shares_storage_with(after.src)) return;

        auto old_shape = shape_of(before);
        auto new_shape = shape_of(after);

        // An empty array takes the identity mode of its counterpart.
        if (is_array_shape(old_shape) && is_array_shape(new_shape)) {
            if (before.src.size() == 0 && after.src.size() == 0) return;
            if (before.src.size() == 0) {
                old_shape = new_shape;
            } else if (after.src.size() == 0) {
                new_shape = old_shape;
            }
        }

        if (old_shape != new_shape) {
            replace_whole(after.src, parent_is_array);
            return;
        }

        switch (old_shape) {
            case Shape::scalar:
                if (!(before.src == after.src)) replace_whole(after.src, parent_is_array);
                break;
            case Shape::object:
                diff_objects(before, after);
                break;
            case Shape::keyed_array:
                diff_keyed(before, after);
                break;
            case Shape::positional_array:
                diff_positional(before, after);
                break;
        }
    }

    void emit(Op op, std::optional<Value> value = std::nullopt) {
        changes_.push_back(Change{op, path_, std::move(value), item_ids_});
    }

    auto take() -> ChangeList { return std::move(changes_); }

private:
    void enter_identity(const std::string& id) {
        path_.push_back(id);
        item_ids_.push_back(id);
    }

    void leave_identity() {
        path_.pop_back();
        item_ids_.pop_back();
    }

    // Array slots are never replaced in place: the applier only replaces
    // object fields.
    void replace_whole(const Value& replacement, bool parent_is_array) {
        if (parent_is_array) {
            emit(Op::remove);
            emit(Op::add, replacement);
        } else {
            emit(Op::replace, replacement);
        }
    }

    void diff_objects(const Side& before, const Side& after) {
        const auto& old_norm = before.norm.as_object();
        const auto& new_norm = after.norm.as_object();
        const auto& old_src = before.src.as_object();
        const auto& new_src = after.src.as_object();

        auto o = old_norm.begin();
        auto n = new_norm.begin();
        while (o != old_norm.end() || n != new_norm.end()) {
            if (n == new_norm.end() || (o != old_norm.end() && o->first < n->first)) {
                path_.push_back(o->first);
                emit(Op::remove);
                path_.pop_back();
                ++o;
            } else if (o == old_norm.end() || n->first < o->first) {
                path_.push_back(n->first);
                emit(Op::add, new_src.find(n->first)->second);
                path_.pop_back();
                ++n;
            } else {
                path_.push_back(o->first);
                diff(Side{o->second, old_src.find(o->first)->second},
                     Side{n->second, new_src.find(n->first)->second}, false);
                path_.pop_back();
                ++o;
                ++n;
            }
        }
    }

    void diff_keyed(const Side& before, const Side& after) {
        const auto& old_norm = before.norm.as_object();
        const auto& new_norm = after.norm.as_object();
        const auto old_mode = extract_identity(before.src, options_.identity_field);
        const auto new_mode = extract_identity(after.src, options_.identity_field);

        for (const auto& [id, old_element] : old_norm) {
            enter_identity(id);
            auto found = new_norm.find(id);
            if (found == new_norm.end()) {
                emit(Op::remove);
            } else {
                diff(Side{old_element, source_element(before.src, old_mode, id, path_)},
                     Side{found->second, source_element(after.src, new_mode, id, path_)},
                     true);
            }
            leave_identity();
        }

        for (const auto& [id, new_element] : new_norm) {
            if (old_norm.contains(id)) continue;
            enter_identity(id);
            emit(Op::add, source_element(after.src, new_mode, id, path_));
            leave_identity();
        }
    }

    // Pairwise over the common prefix, then trailing adds ascending or
    // trailing removes descending, so each index is valid when applied.
    void diff_positional(const Side& before, const Side& after) {
        const auto& old_src = before.src.as_array();
        const auto& new_src = after.src.as_array();
        const auto common = std::min(old_src.size(), new_src.size());

        for (std::size_t i = 0; i < common; ++i) {
            path_.push_back(std::to_string(i));
            diff(Side{before.norm.as_array()[i], old_src[i]},
                 Side{after.norm.as_array()[i], new_src[i]}, true);
            path_.pop_back();
        }
        for (auto i = common; i < new_src.size(); ++i) {
            path_.push_back(std::to_string(i));
            emit(Op::add, new_src[i]);
            path_.pop_back();
        }
        for (auto i = old_src.size(); i > common; --i) {
            path_.push_back(std::to_string(i - 1));
            emit(Op::remove);
            path_.pop_back();
        }
    }

    const DiffOptions& options_;
    Path path_;
    std::vector<std::string> item_ids_;
    ChangeList changes_;
};

// -- Scope resolution for compute_diff_at -------------------------------------

struct Located {
    const Value* node{nullptr};
    bool parent_is_array{false};
    std::vector<std::string> item_ids;
};

// Resolve `scope` in a pruned source tree. Identifiable arrays are entered
// by identity token, positional ones by index. A missing terminal segment
// yields node == nullptr. A missing parent throws when `strict`, and
// yields node == nullptr otherwise.
auto locate(const Value& root, const Path& scope, std::string_view identity_field,
            bool strict) -> Located {
    auto located = Located{};
    const auto* current = &root;

    for (std::size_t i = 0; i < scope.size(); ++i) {
        const auto& segment = scope[i];
        const auto last = (i + 1 == scope.size());

        if (!current->is_container()) {
            if (!strict) return Located{};
            throw DiffException{ErrorKind::path_not_found,
                "'" + to_pointer(Path(scope.begin(), scope.begin() + static_cast<std::ptrdiff_t>(i))) +
                "' is not an object or array"};
        }

        const Value* next = nullptr;
        auto via_identity = false;
        if (current->is_object()) {
            next = current->find(segment);
        } else {
            auto mode = extract_identity(*current, identity_field);
            auto index = try_parse_index(segment);
            if (mode.identifiable && !(current->size() == 0 && index)) {
                via_identity = true;
                auto it = mode.positions.find(segment);
                if (it != mode.positions.end()) next = &current->as_array()[it->second];
            } else if (index && *index < current->size()) {
                next = &current->as_array()[*index];
            }
        }

        if (via_identity) located.item_ids.push_back(segment);
        if (last) {
            located.parent_is_array = current->is_array();
            located.node = next;
            return located;
        }
        if (!next) {
            if (!strict) return Located{};
            throw DiffException{ErrorKind::path_not_found,
                "'" + to_pointer(Path(scope.begin(), scope.begin() + static_cast<std::ptrdiff_t>(i) + 1)) +
                "' does not exist"};
        }
        current = next;
    }

    located.node = current;
    return located;
}

// The same walk over a normalized tree, where identity keys are fields.
auto locate_normalized(const Value& root, const Path& scope) -> const Value* {
    const auto* current = &root;
    for (const auto& segment : scope) {
        if (current->is_object()) {
            current = current->find(segment);
        } else if (const auto* arr = current->array_if()) {
            auto index = try_parse_index(segment);
            current = (index && *index < arr->size()) ? &(*arr)[*index] : nullptr;
        } else {
            current = nullptr;
        }
        if (!current) return nullptr;
    }
    return current;
}

}  // anonymous namespace

auto compute_diff(const Value& old_doc, const Value& new_doc,
                  const DiffOptions& options) -> ChangeList {
    const auto old_src = apply_exclusions(old_doc, options.exclusions);
    const auto new_src = apply_exclusions(new_doc, options.exclusions);
    const auto policy = identity_policy(options);
    const auto old_norm = normalize(old_src, policy);
    const auto new_norm = normalize(new_src, policy);

    auto walker = DiffWalker{options, Path{}, {}};
    walker.diff(Side{old_norm, old_src}, Side{new_norm, new_src}, false);
    auto changes = walker.take();
    detail::logger()->debug("compute_diff: {} change(s)", changes.size());
    return changes;
}

auto compute_diff(const Value& old_doc, const Value& new_doc,
                  const ExclusionSet& exclusions) -> ChangeList {
    auto options = DiffOptions{};
    options.exclusions = exclusions;
    return compute_diff(old_doc, new_doc, options);
}

auto compute_diff_at(const Value& old_doc, const Value& new_doc, const Path& scope,
                     const DiffOptions& options) -> ChangeList {
    if (scope.empty()) return compute_diff(old_doc, new_doc, options);

    const auto old_src = apply_exclusions(old_doc, options.exclusions);
    const auto new_src = apply_exclusions(new_doc, options.exclusions);
    const auto policy = identity_policy(options);
    const auto old_norm = normalize(old_src, policy);
    const auto new_norm = normalize(new_src, policy);

    const auto before = locate(old_src, scope, options.identity_field, true);
    const auto after = locate(new_src, scope, options.identity_field, false);

    if (!before.node && !after.node) return {};
    if (!before.node) {
        auto walker = DiffWalker{options, scope, after.item_ids};
        walker.emit(Op::add, *after.node);
        return walker.take();
    }
    if (!after.node) {
        auto walker = DiffWalker{options, scope, before.item_ids};
        walker.emit(Op::remove);
        return walker.take();
    }

    const auto* old_norm_node = locate_normalized(old_norm, scope);
    const auto* new_norm_node = locate_normalized(new_norm, scope);
    if (!old_norm_node || !new_norm_node) {
        throw DiffException{ErrorKind::path_not_found,
            "'" + to_pointer(scope) + "' is missing from the normalized view"};
    }

    auto walker = DiffWalker{options, scope, before.item_ids};
    walker.diff(Side{*old_norm_node, *before.node}, Side{*new_norm_node, *after.node},
                before.parent_is_array);
    auto changes = walker.take();
    detail::logger()->debug("compute_diff_at '{}': {} change(s)", to_pointer(scope), changes.size());
    return changes;
}

auto equivalent(const Value& a, const Value& b, const DiffOptions& options) -> bool {
    return compute_diff(a, b, options).empty();
}

}  // namespace docdiff_cpp
