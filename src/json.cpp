#include <docdiff-cpp/json.hpp>
#include <docdiff-cpp/error.hpp>
#include <docdiff-cpp/path.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace docdiff_cpp {

// =============================================================================
// ADL serialization
// =============================================================================

// -- Documents ----------------------------------------------------------------

void to_json(nlohmann::json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](std::uint64_t u) { j = u; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
        [&](const std::shared_ptr<const Object>& obj) {
            j = nlohmann::json::object();
            for (const auto& [key, child] : *obj) {
                to_json(j[key], child);
            }
        },
        [&](const std::shared_ptr<const Array>& arr) {
            j = nlohmann::json::array();
            for (const auto& element : *arr) {
                auto element_json = nlohmann::json{};
                to_json(element_json, element);
                j.push_back(std::move(element_json));
            }
        },
    }, v.storage());
}

void from_json(const nlohmann::json& j, Value& v) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            v = Value{};
            return;
        case nlohmann::json::value_t::boolean:
            v = Value{j.get<bool>()};
            return;
        case nlohmann::json::value_t::number_integer:
            v = Value{j.get<std::int64_t>()};
            return;
        case nlohmann::json::value_t::number_unsigned: {
            auto u = j.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                v = Value{static_cast<std::int64_t>(u)};
            } else {
                v = Value{u};
            }
            return;
        }
        case nlohmann::json::value_t::number_float:
            v = Value{j.get<double>()};
            return;
        case nlohmann::json::value_t::string:
            v = Value{j.get<std::string>()};
            return;
        case nlohmann::json::value_t::object: {
            auto obj = Object{};
            for (const auto& [key, child] : j.items()) {
                auto child_value = Value{};
                from_json(child, child_value);
                obj.emplace(key, std::move(child_value));
            }
            v = Value{std::move(obj)};
            return;
        }
        case nlohmann::json::value_t::array: {
            auto arr = Array{};
            arr.reserve(j.size());
            for (const auto& element : j) {
                auto element_value = Value{};
                from_json(element, element_value);
                arr.push_back(std::move(element_value));
            }
            v = Value{std::move(arr)};
            return;
        }
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            break;
    }
    throw DiffException{ErrorKind::codec_error,
        std::string{"unsupported JSON value type '"} + j.type_name() + "'"};
}

// -- Changes ------------------------------------------------------------------

void to_json(nlohmann::json& j, Op op) {
    j = std::string{to_string_view(op)};
}

void from_json(const nlohmann::json& j, Op& op) {
    if (!j.is_string()) {
        throw DiffException{ErrorKind::invalid_change, "'op' must be a string"};
    }
    const auto& name = j.get_ref<const std::string&>();
    for (auto candidate : {Op::add, Op::remove, Op::replace}) {
        if (name == to_string_view(candidate)) {
            op = candidate;
            return;
        }
    }
    throw DiffException{ErrorKind::unsupported_operation, "unsupported op '" + name + "'"};
}

void to_json(nlohmann::json& j, const Change& c) {
    j = nlohmann::json{
        {"op", c.op},
        {"path", to_pointer(c.path)},
    };
    if (c.value) {
        to_json(j["value"], *c.value);
    }
    j["itemIds"] = c.item_ids;
}

void from_json(const nlohmann::json& j, Change& c) {
    if (!j.is_object()) {
        throw DiffException{ErrorKind::invalid_change, "a change must be a JSON object"};
    }
    if (!j.contains("op")) {
        throw DiffException{ErrorKind::invalid_change, "change has no 'op'"};
    }
    if (!j.contains("path") || !j.at("path").is_string()) {
        throw DiffException{ErrorKind::invalid_change, "change has no string 'path'"};
    }

    auto parsed = Change{};
    from_json(j.at("op"), parsed.op);
    parsed.path = parse_pointer(j.at("path").get_ref<const std::string&>());

    if (auto it = j.find("value"); it != j.end()) {
        auto value = Value{};
        from_json(*it, value);
        parsed.value = std::move(value);
    } else if (parsed.op != Op::remove) {
        throw DiffException{ErrorKind::invalid_change,
            std::string{to_string_view(parsed.op)} + " '" + to_pointer(parsed.path) +
            "' has no 'value'"};
    }

    if (auto it = j.find("itemIds"); it != j.end()) {
        if (!it->is_array()) {
            throw DiffException{ErrorKind::invalid_change, "'itemIds' must be an array"};
        }
        for (const auto& token : *it) {
            if (!token.is_string()) {
                throw DiffException{ErrorKind::invalid_change, "'itemIds' entries must be strings"};
            }
            parsed.item_ids.push_back(token.get<std::string>());
        }
    }
    c = std::move(parsed);
}

// -- Options ------------------------------------------------------------------

void to_json(nlohmann::json& j, const DiffOptions& options) {
    auto pointers = [](const std::vector<Path>& paths) {
        auto list = nlohmann::json::array();
        for (const auto& path : paths) list.push_back(to_pointer(path));
        return list;
    };
    j = nlohmann::json{
        {"identity_field", options.identity_field},
        {"exclude", pointers(options.exclusions.paths())},
        {"require_identity", pointers(options.require_identity)},
    };
}

// =============================================================================
// Text helpers
// =============================================================================

auto parse_value(std::string_view text) -> Value {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw DiffException{ErrorKind::codec_error, "document is not valid JSON"};
    }
    auto v = Value{};
    from_json(j, v);
    return v;
}

auto dump_value(const Value& v, int indent) -> std::string {
    auto j = nlohmann::json{};
    to_json(j, v);
    return j.dump(indent);
}

auto changes_from_json(const nlohmann::json& j) -> ChangeList {
    if (!j.is_array()) {
        throw DiffException{ErrorKind::invalid_change, "changes must be a JSON array"};
    }
    auto changes = ChangeList{};
    changes.reserve(j.size());
    for (const auto& entry : j) {
        auto c = Change{};
        from_json(entry, c);
        changes.push_back(std::move(c));
    }
    return changes;
}

auto parse_changes(std::string_view text) -> ChangeList {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw DiffException{ErrorKind::codec_error, "changes are not valid JSON"};
    }
    return changes_from_json(j);
}

auto dump_changes(const ChangeList& changes, int indent) -> std::string {
    auto j = nlohmann::json::array();
    for (const auto& c : changes) {
        auto entry = nlohmann::json{};
        to_json(entry, c);
        j.push_back(std::move(entry));
    }
    return j.dump(indent);
}

}  // namespace docdiff_cpp
