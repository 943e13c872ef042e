/// @file record_codec.hpp
/// @brief Byte encoding of per-version diff records.
///
/// A record is one encoding tag byte followed by the payload:
///
///   0  JSON text of the change array (the wire format)
///   1  CBOR of the same JSON structure
///   2  CBOR compressed with raw DEFLATE
///
/// Records requested as cbor_deflate whose CBOR payload is below the
/// compression threshold are written with tag 1.

#pragma once

#include <docdiff-cpp/change.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace docdiff_cpp {

/// Encoding tag of a diff record.
enum class RecordEncoding : std::uint8_t {
    json         = 0,
    cbor         = 1,
    cbor_deflate = 2,
};

/// Convert a RecordEncoding to its string representation.
constexpr auto to_string_view(RecordEncoding encoding) noexcept -> std::string_view {
    switch (encoding) {
        case RecordEncoding::json:         return "json";
        case RecordEncoding::cbor:         return "cbor";
        case RecordEncoding::cbor_deflate: return "cbor_deflate";
    }
    return "unknown";
}

/// Encode a change list as a tagged record.
/// @throws DiffException{codec_error} if compression fails.
auto encode_changes(const ChangeList& changes,
                    RecordEncoding encoding = RecordEncoding::cbor_deflate)
    -> std::vector<std::uint8_t>;

/// The encoding tag of a record.
/// @throws DiffException{codec_error} for an empty record or unknown tag.
auto record_encoding(std::span<const std::uint8_t> record) -> RecordEncoding;

/// Decode a tagged record.
/// @throws DiffException{codec_error} for corrupt input, an unknown tag,
///         or a payload that does not hold a valid change array.
auto decode_changes(std::span<const std::uint8_t> record) -> ChangeList;

}  // namespace docdiff_cpp
