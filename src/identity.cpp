#include <docdiff-cpp/identity.hpp>
#include <docdiff-cpp/error.hpp>

#include <string>

namespace docdiff_cpp {

auto identity_of(const Value& element, std::string_view identity_field)
    -> std::optional<std::string> {
    const auto* field = element.find(identity_field);
    if (!field) return std::nullopt;
    return get_scalar<std::string>(*field);
}

auto extract_identity(const Value& array, std::string_view identity_field)
    -> IdentityMode {
    const auto& elements = array.as_array();

    auto mode = IdentityMode{.identifiable = true, .positions = {}};
    auto missing = false;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        auto id = identity_of(elements[i], identity_field);
        if (!id) {
            missing = true;
            continue;
        }
        auto [it, inserted] = mode.positions.emplace(std::move(*id), i);
        if (!inserted) {
            throw DiffException{ErrorKind::duplicate_identity,
                "elements " + std::to_string(it->second) + " and " + std::to_string(i) +
                " share " + std::string{identity_field} + " '" + it->first + "'"};
        }
    }

    // Sibling ids must be unique even when the array ends up positional.
    if (missing) {
        mode.identifiable = false;
        mode.positions.clear();
    }
    return mode;
}

auto find_by_identity(const Array& array, std::string_view token,
                      std::string_view identity_field) -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < array.size(); ++i) {
        auto id = identity_of(array[i], identity_field);
        if (id && *id == token) return i;
    }
    return std::nullopt;
}

}  // namespace docdiff_cpp
