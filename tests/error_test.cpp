#include <docdiff-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace docdiff_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::duplicate_identity),    "duplicate_identity");
    EXPECT_EQ(to_string_view(ErrorKind::missing_identity),      "missing_identity");
    EXPECT_EQ(to_string_view(ErrorKind::path_not_found),        "path_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::identity_not_found),    "identity_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::type_mismatch),         "type_mismatch");
    EXPECT_EQ(to_string_view(ErrorKind::unsupported_operation), "unsupported_operation");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_change),        "invalid_change");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_pointer),       "invalid_pointer");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_config),        "invalid_config");
    EXPECT_EQ(to_string_view(ErrorKind::version_out_of_range),  "version_out_of_range");
    EXPECT_EQ(to_string_view(ErrorKind::version_conflict),      "version_conflict");
    EXPECT_EQ(to_string_view(ErrorKind::codec_error),           "codec_error");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::path_not_found, "/a/b"};
    const auto e2 = Error{ErrorKind::path_not_found, "/a/b"};
    const auto e3 = Error{ErrorKind::type_mismatch, "/a/b"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::codec_error, "foo"};
    const auto e2 = Error{ErrorKind::codec_error, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(DiffException, what_prefixes_the_kind) {
    const auto e = DiffException{ErrorKind::identity_not_found, "no toy3"};

    EXPECT_EQ(std::string{e.what()}, "identity_not_found: no toy3");
    EXPECT_EQ(e.kind(), ErrorKind::identity_not_found);
    EXPECT_EQ(e.error().message, "no toy3");
}

TEST(DiffException, constructible_from_error) {
    const auto e = DiffException{Error{ErrorKind::version_conflict, "stale"}};

    EXPECT_EQ(e.error(), (Error{ErrorKind::version_conflict, "stale"}));
}

TEST(DiffException, is_a_runtime_error) {
    try {
        throw DiffException{ErrorKind::invalid_config, "bad"};
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string{e.what()}, "invalid_config: bad");
    }
}
