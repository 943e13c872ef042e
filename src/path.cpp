#include <docdiff-cpp/path.hpp>
#include <docdiff-cpp/error.hpp>

#include <algorithm>
#include <charconv>
#include <system_error>

namespace docdiff_cpp {

namespace {

// Unescape: ~1 -> /, ~0 -> ~ (single left-to-right pass, so "~01" -> "~1")
auto unescape_segment(std::string_view raw) -> std::string {
    auto segment = std::string{};
    segment.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '~') {
            if (i + 1 < raw.size() && raw[i + 1] == '1') {
                segment += '/';
                ++i;
                continue;
            }
            if (i + 1 < raw.size() && raw[i + 1] == '0') {
                segment += '~';
                ++i;
                continue;
            }
            throw DiffException{ErrorKind::invalid_pointer,
                "invalid escape sequence in pointer segment '" + std::string{raw} + "'"};
        }
        segment += raw[i];
    }
    return segment;
}

}  // anonymous namespace

auto parse_pointer(std::string_view pointer) -> Path {
    if (pointer.empty()) return {};
    if (pointer[0] != '/') {
        throw DiffException{ErrorKind::invalid_pointer,
            "JSON Pointer must start with '/' or be empty: '" + std::string{pointer} + "'"};
    }
    auto segments = Path{};
    auto pos = std::size_t{1};
    while (pos <= pointer.size()) {
        auto next = pointer.find('/', pos);
        segments.push_back(unescape_segment(pointer.substr(pos, next - pos)));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return segments;
}

auto escape_pointer_segment(std::string_view segment) -> std::string {
    auto escaped = std::string{segment};
    for (auto pos = escaped.find_first_of("~/"); pos != std::string::npos;
         pos = escaped.find_first_of("~/", pos + 2)) {
        escaped.replace(pos, 1, escaped[pos] == '~' ? "~0" : "~1");
    }
    return escaped;
}

auto to_pointer(const Path& path) -> std::string {
    auto result = std::string{};
    for (const auto& segment : path) {
        result += '/';
        result += escape_pointer_segment(segment);
    }
    return result;
}

auto try_parse_index(std::string_view segment) -> std::optional<std::size_t> {
    const auto all_digits = !segment.empty() &&
        std::ranges::all_of(segment, [](char c) { return c >= '0' && c <= '9'; });
    // "0" is the only index allowed to start with a zero.
    if (!all_digits || (segment.size() > 1 && segment.front() == '0')) return std::nullopt;

    auto index = std::size_t{0};
    const auto* end = segment.data() + segment.size();
    if (std::from_chars(segment.data(), end, index).ec != std::errc{}) return std::nullopt;
    return index;
}

}  // namespace docdiff_cpp
