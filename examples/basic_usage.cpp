// basic_usage — demonstrates the core docdiff-cpp API
//
// Diffs two versions of a person document whose toy list was reordered,
// trimmed and edited, prints the identity-addressed changes, then applies
// them to a copy of the old document whose toys are in yet another order.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <docdiff-cpp/docdiff.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <string>

namespace dd = docdiff_cpp;

int main() {
    // Library diagnostics at debug level on stderr.
    auto log = spdlog::stderr_color_mt("example");
    log->set_level(spdlog::level::debug);
    dd::set_logger(log);

    const auto old_doc = dd::parse_value(R"({
        "id": "p1",
        "name": "Alice",
        "toys": [
            {"id": "toy1", "name": "Car"},
            {"id": "toy2", "name": "Doll"}
        ],
        "lastSeen": "2024-01-01T00:00:00Z"
    })");

    const auto new_doc = dd::parse_value(R"({
        "id": "p1",
        "name": "Alice",
        "toys": [
            {"id": "toy3", "name": "Kite"},
            {"id": "toy2", "name": "Robot"}
        ],
        "lastSeen": "2024-06-01T00:00:00Z"
    })");

    // -- Diff with an exclusion ------------------------------------------------
    auto options = dd::DiffOptions{};
    options.exclusions.add("/lastSeen");

    const auto changes = dd::compute_diff(old_doc, new_doc, options);
    std::printf("%zu changes:\n%s\n", changes.size(), dd::dump_changes(changes, 2).c_str());

    // -- Apply to a reordered target ------------------------------------------
    const auto reordered = dd::parse_value(R"({
        "id": "p1",
        "name": "Alice",
        "toys": [
            {"id": "toy2", "name": "Doll"},
            {"id": "toy1", "name": "Car"}
        ],
        "lastSeen": "2024-01-01T00:00:00Z"
    })");

    try {
        const auto patched = dd::apply_change_sequence(changes, reordered);
        std::printf("Patched:\n%s\n", dd::dump_value(patched, 2).c_str());
        std::printf("Equivalent to new document: %s\n",
                    dd::equivalent(patched, new_doc, options) ? "yes" : "no");
    } catch (const dd::DiffException& e) {
        std::printf("Apply failed: %s\n", e.what());
        return 1;
    }

    // -- Errors carry a kind and the failing path -----------------------------
    try {
        (void)dd::apply_change(
            dd::Change{dd::Op::replace, dd::parse_pointer("/toys/toy9/name"), dd::Value{"Ball"}, {"toy9"}},
            old_doc);
    } catch (const dd::DiffException& e) {
        std::printf("Expected failure [%s]: %s\n",
                    std::string{dd::to_string_view(e.kind())}.c_str(), e.what());
    }

    dd::set_logger(nullptr);
    return 0;
}
