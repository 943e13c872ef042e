#include <docdiff-cpp/record_codec.hpp>
#include <docdiff-cpp/error.hpp>
#include <docdiff-cpp/json.hpp>

#include "logging.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

#include <zlib.h>

namespace docdiff_cpp {

namespace {

// CBOR payloads below this size are stored uncompressed under the cbor tag.
constexpr std::size_t deflate_threshold = 256;

// Inflating past this size rejects the record.
constexpr std::size_t max_inflated_size = std::size_t{64} * 1024 * 1024;

// Negative window bits select raw DEFLATE (no zlib or gzip header).
constexpr int raw_deflate_window = -15;

constexpr std::size_t inflate_step = std::size_t{16} * 1024;

// Owns a zlib stream for one direction and ends it on scope exit.
class ZStream {
public:
    enum class Direction { deflate, inflate };

    explicit ZStream(Direction direction) : direction_{direction} {
        const auto ret = direction == Direction::deflate
            ? ::deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                             raw_deflate_window, 8, Z_DEFAULT_STRATEGY)
            : ::inflateInit2(&stream_, raw_deflate_window);
        if (ret != Z_OK) {
            throw DiffException{ErrorKind::codec_error, "zlib stream initialization failed"};
        }
    }

    ~ZStream() {
        if (direction_ == Direction::deflate) {
            ::deflateEnd(&stream_);
        } else {
            ::inflateEnd(&stream_);
        }
    }

    ZStream(const ZStream&) = delete;
    auto operator=(const ZStream&) -> ZStream& = delete;

    auto get() noexcept -> z_stream* { return &stream_; }
    auto operator->() noexcept -> z_stream* { return &stream_; }

private:
    Direction direction_;
    z_stream stream_{};
};

auto tagged(RecordEncoding encoding, std::span<const std::uint8_t> payload)
    -> std::vector<std::uint8_t> {
    auto record = std::vector<std::uint8_t>{};
    record.reserve(payload.size() + 1);
    record.push_back(static_cast<std::uint8_t>(encoding));
    record.insert(record.end(), payload.begin(), payload.end());
    return record;
}

// The cbor_deflate tag followed by `cbor` compressed in a single pass.
auto deflate_record(std::span<const std::uint8_t> cbor) -> std::vector<std::uint8_t> {
    auto stream = ZStream{ZStream::Direction::deflate};
    const auto bound = ::deflateBound(stream.get(), static_cast<uLong>(cbor.size()));

    auto record = std::vector<std::uint8_t>(1 + bound);
    record[0] = static_cast<std::uint8_t>(RecordEncoding::cbor_deflate);

    stream->next_in = const_cast<Bytef*>(cbor.data());
    stream->avail_in = static_cast<uInt>(cbor.size());
    stream->next_out = record.data() + 1;
    stream->avail_out = static_cast<uInt>(bound);
    if (::deflate(stream.get(), Z_FINISH) != Z_STREAM_END) {
        throw DiffException{ErrorKind::codec_error, "DEFLATE compression failed"};
    }
    record.resize(1 + stream->total_out);

    detail::logger()->debug("diff record compressed {} -> {} bytes", cbor.size(), record.size() - 1);
    return record;
}

// Inflate a cbor_deflate payload, growing the output until the stream ends.
auto inflate_payload(std::span<const std::uint8_t> payload) -> std::vector<std::uint8_t> {
    auto stream = ZStream{ZStream::Direction::inflate};
    stream->next_in = const_cast<Bytef*>(payload.data());
    stream->avail_in = static_cast<uInt>(payload.size());

    auto inflated = std::vector<std::uint8_t>{};
    auto step = std::max(payload.size() * 4, inflate_step);
    for (auto ret = Z_OK; ret != Z_STREAM_END;) {
        const auto written = inflated.size();
        if (written >= max_inflated_size) {
            throw DiffException{ErrorKind::codec_error,
                "inflated diff record exceeds " + std::to_string(max_inflated_size) + " bytes"};
        }
        const auto room = std::min(step, max_inflated_size - written);
        inflated.resize(written + room);
        stream->next_out = inflated.data() + written;
        stream->avail_out = static_cast<uInt>(room);

        ret = ::inflate(stream.get(), Z_NO_FLUSH);
        inflated.resize(written + room - stream->avail_out);

        if (ret == Z_BUF_ERROR && stream->avail_in == 0) {
            throw DiffException{ErrorKind::codec_error, "truncated DEFLATE payload"};
        }
        if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
            throw DiffException{ErrorKind::codec_error,
                std::string{"corrupt DEFLATE payload: "} + (stream->msg ? stream->msg : "unknown error")};
        }
        step *= 2;
    }
    return inflated;
}

auto payload_to_json(RecordEncoding encoding, std::span<const std::uint8_t> payload)
    -> nlohmann::json {
    switch (encoding) {
        case RecordEncoding::json:
            return nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
        case RecordEncoding::cbor:
            return nlohmann::json::from_cbor(payload.begin(), payload.end(), true, false);
        case RecordEncoding::cbor_deflate: {
            const auto cbor = inflate_payload(payload);
            return nlohmann::json::from_cbor(cbor.begin(), cbor.end(), true, false);
        }
    }
    throw DiffException{ErrorKind::codec_error, "unknown record encoding"};
}

}  // anonymous namespace

auto encode_changes(const ChangeList& changes, RecordEncoding encoding)
    -> std::vector<std::uint8_t> {
    auto j = nlohmann::json::array();
    for (const auto& c : changes) {
        auto entry = nlohmann::json{};
        to_json(entry, c);
        j.push_back(std::move(entry));
    }

    if (encoding == RecordEncoding::json) {
        auto text = j.dump();
        return tagged(encoding, {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()});
    }

    const auto cbor = nlohmann::json::to_cbor(j);
    if (encoding == RecordEncoding::cbor || cbor.size() < deflate_threshold) {
        return tagged(RecordEncoding::cbor, cbor);
    }
    return deflate_record(cbor);
}

auto record_encoding(std::span<const std::uint8_t> record) -> RecordEncoding {
    if (record.empty()) {
        throw DiffException{ErrorKind::codec_error, "empty diff record"};
    }
    switch (record.front()) {
        case static_cast<std::uint8_t>(RecordEncoding::json):         return RecordEncoding::json;
        case static_cast<std::uint8_t>(RecordEncoding::cbor):         return RecordEncoding::cbor;
        case static_cast<std::uint8_t>(RecordEncoding::cbor_deflate): return RecordEncoding::cbor_deflate;
        default: break;
    }
    throw DiffException{ErrorKind::codec_error,
        "unknown diff record tag " + std::to_string(record.front())};
}

auto decode_changes(std::span<const std::uint8_t> record) -> ChangeList {
    const auto encoding = record_encoding(record);
    const auto j = payload_to_json(encoding, record.subspan(1));
    if (j.is_discarded()) {
        throw DiffException{ErrorKind::codec_error,
            std::string{"corrupt "} + std::string{to_string_view(encoding)} + " diff record"};
    }

    try {
        return changes_from_json(j);
    } catch (const DiffException& e) {
        throw DiffException{ErrorKind::codec_error, "diff record holds no valid changes: " + std::string{e.what()}};
    }
}

}  // namespace docdiff_cpp
