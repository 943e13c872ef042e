/// @file diff.hpp
/// @brief Identity-aware structural diff between two document states.

#pragma once

#include <docdiff-cpp/change.hpp>
#include <docdiff-cpp/options.hpp>
#include <docdiff-cpp/path.hpp>
#include <docdiff-cpp/value.hpp>

namespace docdiff_cpp {

/// Compute the changes that turn `old_doc` into `new_doc`.
///
/// Both sides are pruned of excluded fields and normalized, so that
/// identifiable arrays compare by element identity: a pure reordering
/// produces no changes, and a change to an element is addressed by its
/// identity token rather than its position. Positional arrays are diffed
/// index by index.
///
/// The result is ordered so that applying it front to back with
/// apply_change_sequence() reproduces `new_doc` (up to the order of
/// identifiable arrays) on any instance of `old_doc`.
///
/// @code
/// auto changes = compute_diff(old_doc, new_doc);
/// auto rebuilt = apply_change_sequence(changes, old_doc);
/// @endcode
///
/// @throws DiffException{duplicate_identity} if sibling ids collide on either side.
/// @throws DiffException{missing_identity} per options.require_identity.
auto compute_diff(const Value& old_doc, const Value& new_doc,
                  const DiffOptions& options = {}) -> ChangeList;

/// compute_diff() with the default identity policy and the given exclusions.
auto compute_diff(const Value& old_doc, const Value& new_doc,
                  const ExclusionSet& exclusions) -> ChangeList;

/// Compute the changes below the logical path `scope` only.
///
/// Changes are still addressed from the document root; scope segments
/// that cross identifiable arrays are identity tokens and contribute to
/// every change's item_ids. If `scope` is missing from `old_doc` but
/// present in `new_doc` the result is a single add, and vice versa a
/// single remove.
///
/// @throws DiffException{path_not_found} if the parent of `scope` does
///         not exist in `old_doc`.
auto compute_diff_at(const Value& old_doc, const Value& new_doc, const Path& scope,
                     const DiffOptions& options = {}) -> ChangeList;

/// True if compute_diff(a, b, options) is empty: the documents are equal
/// up to excluded fields and the order of identifiable arrays.
auto equivalent(const Value& a, const Value& b, const DiffOptions& options = {}) -> bool;

}  // namespace docdiff_cpp
