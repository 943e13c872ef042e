// Fuzz target for the change wire format and the patch applier.
// Input is split at the first NUL byte: a change array, then a target
// document. Every failure must surface as a DiffException.

#include <docdiff-cpp/apply.hpp>
#include <docdiff-cpp/error.hpp>
#include <docdiff-cpp/json.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = std::min(text.find('\0'), text.size());

    try {
        const auto changes = docdiff_cpp::parse_changes(text.substr(0, split));
        const auto target = split < text.size()
            ? docdiff_cpp::parse_value(text.substr(split + 1))
            : docdiff_cpp::Value{docdiff_cpp::Object{}};

        auto patched = docdiff_cpp::apply_change_sequence(changes, target);
        (void)docdiff_cpp::dump_value(patched);
    } catch (const docdiff_cpp::DiffException&) {
        // Rejected input.
    }
    return 0;
}
