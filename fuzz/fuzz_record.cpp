// Fuzz target for decode_changes() — exercises the tagged record decoder
// (JSON, CBOR and inflate paths). Any decoded record is re-encoded and
// decoded again.

#include <docdiff-cpp/error.hpp>
#include <docdiff-cpp/record_codec.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto record = std::span<const std::uint8_t>(data, size);

    try {
        const auto changes = docdiff_cpp::decode_changes(record);
        auto again = docdiff_cpp::decode_changes(docdiff_cpp::encode_changes(changes));
        (void)again;
    } catch (const docdiff_cpp::DiffException&) {
        // Rejected input.
    }
    return 0;
}
