// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself — just a corpus generator.

#include <docdiff-cpp/docdiff.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace dd = docdiff_cpp;

static void write_seed(const std::string& path, const std::vector<std::uint8_t>& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

static void write_seed(const std::string& path, const std::string& text) {
    write_seed(path, std::vector<std::uint8_t>(text.begin(), text.end()));
}

int main() {
    namespace fs = std::filesystem;
    fs::create_directories("fuzz/corpus/changes");
    fs::create_directories("fuzz/corpus/record");

    const auto old_doc = dd::parse_value(R"({"id": "p1", "name": "Alice",
        "toys": [{"id": "toy1", "name": "Car"}, {"id": "toy2", "name": "Doll"}],
        "tags": ["a", "b"]})");
    const auto new_doc = dd::parse_value(R"({"id": "p1", "name": "Alice",
        "toys": [{"id": "toy3", "name": "Kite"}, {"id": "toy2", "name": "Robot"}],
        "tags": ["a"]})");
    const auto changes = dd::compute_diff(old_doc, new_doc);

    // Change array, NUL, target document.
    write_seed("fuzz/corpus/changes/seed_toys.bin",
               dd::dump_changes(changes) + std::string(1, '\0') + dd::dump_value(old_doc));
    write_seed("fuzz/corpus/changes/seed_empty.bin", std::string{"[]"});

    write_seed("fuzz/corpus/record/seed_json.bin",
               dd::encode_changes(changes, dd::RecordEncoding::json));
    write_seed("fuzz/corpus/record/seed_cbor.bin",
               dd::encode_changes(changes, dd::RecordEncoding::cbor));
    write_seed("fuzz/corpus/record/seed_deflate.bin",
               dd::encode_changes(dd::compute_diff(dd::Value{dd::Object{}}, new_doc.with_field(
                   "notes", std::string(512, 'x'))), dd::RecordEncoding::cbor_deflate));
    return 0;
}
