// version_history — stores per-version diff records and compares versions
//
// Demonstrates:
//   - Encoding each version's diff as a compact record
//   - Reconstructing any historical snapshot from the base and the records
//   - Comparing two versions without concatenating the diffs between them
//
// Build: cmake --build build -DDOCDIFF_BUILD_EXAMPLES=ON
// Run:   ./build/examples/version_history

#include <docdiff-cpp/docdiff.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace dd = docdiff_cpp;

int main() {
    const auto base = dd::parse_value(R"({
        "id": "p1",
        "name": "Alice",
        "toys": [{"id": "toy1", "name": "Car"}]
    })");

    // Each edit produces the next version of the document.
    auto edits = std::vector<dd::Value>{};
    edits.push_back(base.with_field("name", "Alicia"));
    edits.push_back(dd::parse_value(R"({
        "id": "p1", "name": "Alicia",
        "toys": [{"id": "toy1", "name": "Car"}, {"id": "toy2", "name": "Doll"}]})"));
    edits.push_back(dd::parse_value(R"({
        "id": "p1", "name": "Alicia",
        "toys": [{"id": "toy2", "name": "Doll"}]})"));
    edits.push_back(dd::parse_value(R"({
        "id": "p1", "name": "Alicia",
        "toys": [{"id": "toy2", "name": "Doll"}, {"id": "toy1", "name": "Car"}]})"));

    // -- Record every version's diff ------------------------------------------
    auto records = std::vector<std::vector<std::uint8_t>>{};
    auto previous = base;
    for (const auto& next : edits) {
        const auto changes = dd::compute_diff(previous, next);
        records.push_back(dd::encode_changes(changes));
        std::printf("v%zu: %zu changes, %zu byte record (%s)\n",
                    records.size(), changes.size(), records.back().size(),
                    std::string{dd::to_string_view(dd::record_encoding(records.back()))}.c_str());
        previous = next;
    }

    // -- Load the records back -----------------------------------------------
    auto diffs = std::vector<dd::ChangeList>{};
    try {
        for (const auto& record : records) diffs.push_back(dd::decode_changes(record));
    } catch (const dd::DiffException& e) {
        std::printf("Corrupt record: %s\n", e.what());
        return 1;
    }

    for (std::size_t v = 0; v <= diffs.size(); ++v) {
        std::printf("snapshot v%zu: %s\n", v, dd::dump_value(dd::snapshot_at(base, diffs, v)).c_str());
    }

    // toy1 was removed in v3 and re-added unchanged in v4, so comparing
    // v2 with v4 reports nothing.
    const auto v2_v4 = dd::compare_versions(base, diffs, 2, 4);
    std::printf("v2 -> v4: %s\n", dd::dump_changes(v2_v4).c_str());

    const auto v0_v4 = dd::compare_versions(base, diffs, 0, 4);
    std::printf("v0 -> v4: %s\n", dd::dump_changes(v0_v4, 2).c_str());

    try {
        (void)dd::snapshot_at(base, diffs, 9);
    } catch (const dd::DiffException& e) {
        std::printf("Expected failure: %s\n", e.what());
    }
    return 0;
}
