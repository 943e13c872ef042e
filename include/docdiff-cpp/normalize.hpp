/// @file normalize.hpp
/// @brief Exclusion pruning and the order-independent normalized view.

#pragma once

#include <docdiff-cpp/options.hpp>
#include <docdiff-cpp/value.hpp>

namespace docdiff_cpp {

/// Drop every excluded field (with its subtree). The result keeps the
/// original shape: arrays stay arrays, element order is preserved.
/// Returns `value` itself when `exclusions` is empty.
auto apply_exclusions(const Value& value, const ExclusionSet& exclusions) -> Value;

/// Build the normalized view of a document.
///
/// Excluded fields are dropped first; then every identifiable array is
/// rewritten as an object keyed by element identity, so that the same
/// content in a different order normalizes to equal values. Positional
/// arrays stay arrays of normalized elements; scalars pass through.
///
/// The normalized view is for comparison only: it cannot be patched or
/// mapped back without the original tree.
///
/// @throws DiffException{duplicate_identity} if sibling ids collide.
/// @throws DiffException{missing_identity} if an array listed in
///         options.require_identity has an element without identity.
auto normalize(const Value& value, const DiffOptions& options = {}) -> Value;

/// normalize() with the default identity policy and the given exclusions.
auto normalize(const Value& value, const ExclusionSet& exclusions) -> Value;

}  // namespace docdiff_cpp
