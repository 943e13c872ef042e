/// @file options.hpp
/// @brief Per-document-type diff configuration: exclusions and identity policy.

#pragma once

#include <docdiff-cpp/path.hpp>

#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace docdiff_cpp {

/// Wildcard segment matching any single field name in a field path.
inline constexpr std::string_view any_field = "*";

/// True if `field_path` matches `pattern` segment by segment, where a
/// pattern segment "*" matches any field name.
auto field_path_matches(const Path& pattern, const Path& field_path) -> bool;

/// Field paths that are never compared or emitted by the diff engine.
///
/// Field paths consist of field names only: array levels are transparent,
/// so "/toys/price" names `price` inside every element of `toys`.
///
/// @code
/// auto excl = ExclusionSet{"/audit", "/toys/internalNote", "/*/updatedAt"};
/// @endcode
class ExclusionSet {
public:
    ExclusionSet() = default;

    /// Construct from JSON Pointer strings.
    /// @throws DiffException{invalid_pointer}
    ExclusionSet(std::initializer_list<std::string_view> pointers);

    /// Add a field path given as a JSON Pointer.
    void add(std::string_view pointer);

    /// Add a field path given as segments.
    void add(Path field_path);

    /// True if the field at `field_path` is excluded.
    auto excludes(const Path& field_path) const -> bool;

    auto empty() const noexcept -> bool { return paths_.empty(); }
    auto paths() const noexcept -> const std::vector<Path>& { return paths_; }

    auto operator==(const ExclusionSet&) const -> bool = default;

private:
    std::vector<Path> paths_;
};

/// Configuration consumed by normalize / compute_diff.
struct DiffOptions {
    ExclusionSet exclusions;              ///< Fields never compared or emitted.
    std::string identity_field{"id"};     ///< Reserved identity field on array elements.
    std::vector<Path> require_identity;   ///< Field paths whose arrays must be identifiable.

    /// True if the array at `field_path` must be identifiable.
    auto requires_identity(const Path& field_path) const -> bool;

    auto operator==(const DiffOptions&) const -> bool = default;
};

/// Parse options from a JSON configuration document:
///
/// @code{.json}
/// {"identity_field": "id",
///  "exclude": ["/audit", "/toys/internalNote"],
///  "require_identity": ["/toys"]}
/// @endcode
///
/// Every key is optional; unknown keys are ignored.
/// @throws DiffException{invalid_config} on malformed input.
auto load_options(std::string_view json_text) -> DiffOptions;

/// Read and parse an options file.
/// @throws DiffException{invalid_config} if the file cannot be read or parsed.
auto load_options_file(const std::filesystem::path& file) -> DiffOptions;

}  // namespace docdiff_cpp
