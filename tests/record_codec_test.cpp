#include <docdiff-cpp/record_codec.hpp>
#include <docdiff-cpp/error.hpp>
#include <docdiff-cpp/json.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include <zlib.h>

using namespace docdiff_cpp;
using test::change;
using test::doc;

namespace {

auto sample_changes() -> ChangeList {
    return {
        change(Op::remove, "/toys/toy1", std::nullopt, {"toy1"}),
        change(Op::replace, "/toys/toy2/name", Value{"Robot"}, {"toy2"}),
        change(Op::add, "/tags/-", doc(R"({"label": "new", "weight": 1.5})")),
    };
}

// Enough repetitive content to push the CBOR payload past the threshold.
auto large_changes() -> ChangeList {
    auto changes = ChangeList{};
    for (int i = 0; i < 64; ++i) {
        const auto id = "item-" + std::to_string(i);
        changes.push_back(change(Op::add, "/items/" + id,
                                 doc(R"({"description": "a fairly long repeated description"})"),
                                 {id}));
    }
    return changes;
}

void expect_codec_error(const std::vector<std::uint8_t>& record) {
    try {
        (void)decode_changes(record);
        ADD_FAILURE() << "expected codec_error";
    } catch (const DiffException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::codec_error) << e.what();
    }
}

// Tag 2 followed by `payload` compressed as raw DEFLATE by zlib directly.
auto raw_deflate_record(const std::vector<std::uint8_t>& payload) -> std::vector<std::uint8_t> {
    auto stream = z_stream{};
    EXPECT_EQ(deflateInit2(&stream, Z_BEST_SPEED, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY), Z_OK);
    auto record = std::vector<std::uint8_t>(1 + deflateBound(&stream, static_cast<uLong>(payload.size())));
    record[0] = 2;
    stream.next_in = const_cast<Bytef*>(payload.data());
    stream.avail_in = static_cast<uInt>(payload.size());
    stream.next_out = record.data() + 1;
    stream.avail_out = static_cast<uInt>(record.size() - 1);
    EXPECT_EQ(deflate(&stream, Z_FINISH), Z_STREAM_END);
    record.resize(1 + stream.total_out);
    deflateEnd(&stream);
    return record;
}

}  // namespace

TEST(RecordEncoding, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(RecordEncoding::json),         "json");
    EXPECT_EQ(to_string_view(RecordEncoding::cbor),         "cbor");
    EXPECT_EQ(to_string_view(RecordEncoding::cbor_deflate), "cbor_deflate");
}

// -- Encoding -----------------------------------------------------------------

TEST(EncodeChanges, json_record_is_tagged_wire_text) {
    const auto record = encode_changes(ChangeList{change(Op::remove, "/a")}, RecordEncoding::json);

    ASSERT_FALSE(record.empty());
    EXPECT_EQ(record[0], 0u);
    EXPECT_EQ(std::string(record.begin() + 1, record.end()),
              R"([{"itemIds":[],"op":"remove","path":"/a"}])");
}

TEST(EncodeChanges, each_encoding_decodes_back) {
    for (auto encoding : {RecordEncoding::json, RecordEncoding::cbor, RecordEncoding::cbor_deflate}) {
        const auto record = encode_changes(sample_changes(), encoding);
        EXPECT_EQ(decode_changes(record), sample_changes()) << to_string_view(encoding);
    }
}

TEST(EncodeChanges, small_payloads_are_not_compressed) {
    const auto record = encode_changes(sample_changes(), RecordEncoding::cbor_deflate);
    EXPECT_EQ(record_encoding(record), RecordEncoding::cbor);
}

TEST(EncodeChanges, large_payloads_are_compressed) {
    const auto changes = large_changes();
    const auto plain = encode_changes(changes, RecordEncoding::cbor);
    const auto compressed = encode_changes(changes, RecordEncoding::cbor_deflate);

    EXPECT_EQ(record_encoding(compressed), RecordEncoding::cbor_deflate);
    EXPECT_LT(compressed.size(), plain.size());
    EXPECT_EQ(decode_changes(compressed), changes);
}

TEST(EncodeChanges, empty_change_list) {
    const auto record = encode_changes(ChangeList{});
    EXPECT_TRUE(decode_changes(record).empty());
}

// -- Decoding errors ----------------------------------------------------------

TEST(DecodeChanges, empty_record) {
    expect_codec_error({});
}

TEST(DecodeChanges, unknown_tag) {
    expect_codec_error({7, '[', ']'});
}

TEST(DecodeChanges, corrupt_payloads) {
    expect_codec_error({0, '[', '{'});
    expect_codec_error({1, 0xFF, 0x00});
    expect_codec_error({2, 0xFF, 0xFF, 0xFF, 0xFF});
}

TEST(DecodeChanges, payload_that_is_not_a_change_array) {
    const auto text = std::string{R"({"op": "remove", "path": "/a"})"};
    auto record = std::vector<std::uint8_t>{0};
    record.insert(record.end(), text.begin(), text.end());
    expect_codec_error(record);
}

TEST(DecodeChanges, unsupported_op_in_record) {
    const auto text = std::string{R"([{"op": "move", "path": "/a"}])"};
    auto record = std::vector<std::uint8_t>{1};
    const auto cbor = nlohmann::json::to_cbor(nlohmann::json::parse(text));
    record.insert(record.end(), cbor.begin(), cbor.end());
    expect_codec_error(record);
}

TEST(DecodeChanges, truncated_deflate_payload) {
    auto record = encode_changes(large_changes(), RecordEncoding::cbor_deflate);
    ASSERT_EQ(record_encoding(record), RecordEncoding::cbor_deflate);
    record.resize(record.size() / 2);
    expect_codec_error(record);
}

TEST(DecodeChanges, reads_records_deflated_elsewhere) {
    const auto changes = large_changes();
    const auto cbor = nlohmann::json::to_cbor(nlohmann::json::parse(dump_changes(changes)));
    EXPECT_EQ(decode_changes(raw_deflate_record(cbor)), changes);
}

TEST(DecodeChanges, inflated_size_is_bounded) {
    const auto record = raw_deflate_record(std::vector<std::uint8_t>(std::size_t{64} * 1024 * 1024 + 1, 0));
    try {
        (void)decode_changes(record);
        ADD_FAILURE() << "expected codec_error";
    } catch (const DiffException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::codec_error);
        EXPECT_NE(std::string{e.what()}.find("exceeds"), std::string::npos) << e.what();
    }
}
