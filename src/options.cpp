#include <docdiff-cpp/options.hpp>
#include <docdiff-cpp/error.hpp>
#include <docdiff-cpp/json.hpp>

#include "logging.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace docdiff_cpp {

auto field_path_matches(const Path& pattern, const Path& field_path) -> bool {
    if (pattern.size() != field_path.size()) return false;
    return std::ranges::equal(pattern, field_path,
        [](const std::string& p, const std::string& f) {
            return p == any_field || p == f;
        });
}

ExclusionSet::ExclusionSet(std::initializer_list<std::string_view> pointers) {
    for (auto pointer : pointers) add(pointer);
}

void ExclusionSet::add(std::string_view pointer) {
    add(parse_pointer(pointer));
}

void ExclusionSet::add(Path field_path) {
    paths_.push_back(std::move(field_path));
}

auto ExclusionSet::excludes(const Path& field_path) const -> bool {
    return std::ranges::any_of(paths_, [&](const Path& pattern) {
        return field_path_matches(pattern, field_path);
    });
}

auto DiffOptions::requires_identity(const Path& field_path) const -> bool {
    return std::ranges::any_of(require_identity, [&](const Path& pattern) {
        return field_path_matches(pattern, field_path);
    });
}

// -- Loading ------------------------------------------------------------------

void from_json(const nlohmann::json& j, DiffOptions& options) {
    if (!j.is_object()) {
        throw DiffException{ErrorKind::invalid_config, "options must be a JSON object"};
    }

    auto pointer_list = [&](const char* key) -> std::vector<Path> {
        auto result = std::vector<Path>{};
        if (!j.contains(key)) return result;
        const auto& list = j.at(key);
        if (!list.is_array()) {
            throw DiffException{ErrorKind::invalid_config,
                std::string{"'"} + key + "' must be an array of pointers"};
        }
        for (const auto& entry : list) {
            if (!entry.is_string()) {
                throw DiffException{ErrorKind::invalid_config,
                    std::string{"'"} + key + "' entries must be strings"};
            }
            try {
                result.push_back(parse_pointer(entry.get<std::string>()));
            } catch (const DiffException& e) {
                throw DiffException{ErrorKind::invalid_config,
                    std::string{"'"} + key + "': " + e.error().message};
            }
        }
        return result;
    };

    auto parsed = DiffOptions{};
    if (j.contains("identity_field")) {
        const auto& field = j.at("identity_field");
        if (!field.is_string() || field.get<std::string>().empty()) {
            throw DiffException{ErrorKind::invalid_config,
                "'identity_field' must be a non-empty string"};
        }
        parsed.identity_field = field.get<std::string>();
    }
    for (auto& path : pointer_list("exclude")) {
        parsed.exclusions.add(std::move(path));
    }
    parsed.require_identity = pointer_list("require_identity");
    options = std::move(parsed);
}

auto load_options(std::string_view json_text) -> DiffOptions {
    auto j = nlohmann::json::parse(json_text, nullptr, false);
    if (j.is_discarded()) {
        throw DiffException{ErrorKind::invalid_config, "options are not valid JSON"};
    }
    auto options = j.get<DiffOptions>();
    detail::logger()->debug("loaded diff options: identity field '{}', {} exclusion(s), {} identity requirement(s)",
                            options.identity_field, options.exclusions.paths().size(),
                            options.require_identity.size());
    return options;
}

auto load_options_file(const std::filesystem::path& file) -> DiffOptions {
    auto in = std::ifstream{file};
    if (!in) {
        throw DiffException{ErrorKind::invalid_config,
            "cannot read options file '" + file.string() + "'"};
    }
    auto buffer = std::ostringstream{};
    buffer << in.rdbuf();
    return load_options(buffer.str());
}

}  // namespace docdiff_cpp
