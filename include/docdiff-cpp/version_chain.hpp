/// @file version_chain.hpp
/// @brief Historical snapshots from a base document and per-version diffs.

#pragma once

#include <docdiff-cpp/change.hpp>
#include <docdiff-cpp/options.hpp>
#include <docdiff-cpp/value.hpp>

#include <cstddef>
#include <span>

namespace docdiff_cpp {

/// Fold `base` through every diff in `diffs`, in ascending version order.
/// Fails with whatever apply_change_sequence() raises; there is no
/// best-effort recovery.
auto reconstruct(const Value& base, std::span<const ChangeList> diffs,
                 const DiffOptions& options = {}) -> Value;

/// The snapshot at `version`: `base` folded through the first `version`
/// diffs. Version 0 is `base` itself.
/// @throws DiffException{version_out_of_range} if version > diffs.size().
auto snapshot_at(const Value& base, std::span<const ChangeList> diffs,
                 std::size_t version, const DiffOptions& options = {}) -> Value;

/// The changes that turn the snapshot at `from_version` into the snapshot
/// at `to_version`.
///
/// Both endpoints are reconstructed independently and diffed afresh;
/// intermediate diffs are never concatenated, so an element removed and
/// re-added with the same content along the way produces no change.
/// `from_version > to_version` yields the reverse delta.
///
/// @throws DiffException{version_out_of_range} if either version is
///         greater than diffs.size().
auto compare_versions(const Value& base, std::span<const ChangeList> diffs,
                      std::size_t from_version, std::size_t to_version,
                      const DiffOptions& options = {}) -> ChangeList;

}  // namespace docdiff_cpp
