#include <docdiff-cpp/normalize.hpp>
#include <docdiff-cpp/error.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace docdiff_cpp;
using test::doc;

// -- apply_exclusions ---------------------------------------------------------

TEST(ApplyExclusions, empty_set_returns_input) {
    const auto d = doc(R"({"a": {"b": 1}})");
    EXPECT_TRUE(apply_exclusions(d, ExclusionSet{}).shares_storage_with(d));
}

TEST(ApplyExclusions, drops_field_with_subtree) {
    const auto d = doc(R"({"name": "Alice", "audit": {"by": "x", "at": 1}})");
    EXPECT_EQ(apply_exclusions(d, ExclusionSet{"/audit"}), doc(R"({"name": "Alice"})"));
}

TEST(ApplyExclusions, array_levels_are_transparent) {
    const auto d = doc(R"({"toys": [{"id": "t1", "note": "a"}, {"id": "t2", "note": "b"}]})");
    EXPECT_EQ(apply_exclusions(d, ExclusionSet{"/toys/note"}),
              doc(R"({"toys": [{"id": "t1"}, {"id": "t2"}]})"));
}

TEST(ApplyExclusions, wildcard_matches_any_field) {
    const auto d = doc(R"({"a": {"updatedAt": 1, "v": 1}, "b": {"updatedAt": 2}, "updatedAt": 3})");
    EXPECT_EQ(apply_exclusions(d, ExclusionSet{"/*/updatedAt"}),
              doc(R"({"a": {"v": 1}, "b": {}, "updatedAt": 3})"));
}

TEST(ApplyExclusions, preserves_array_order) {
    const auto d = doc(R"({"list": [3, 1, 2], "x": 0})");
    EXPECT_EQ(apply_exclusions(d, ExclusionSet{"/x"}), doc(R"({"list": [3, 1, 2]})"));
}

// -- normalize ----------------------------------------------------------------

TEST(Normalize, identifiable_array_becomes_id_keyed_object) {
    const auto d = doc(R"({"toys": [{"id": "toy2", "name": "Doll"}, {"id": "toy1", "name": "Car"}]})");
    EXPECT_EQ(normalize(d), doc(R"({"toys": {
        "toy1": {"id": "toy1", "name": "Car"},
        "toy2": {"id": "toy2", "name": "Doll"}}})"));
}

TEST(Normalize, reordering_normalizes_equal) {
    const auto a = doc(R"([{"id": "1", "v": [{"id": "x"}, {"id": "y"}]}, {"id": "2"}])");
    const auto b = doc(R"([{"id": "2"}, {"id": "1", "v": [{"id": "y"}, {"id": "x"}]}])");

    EXPECT_NE(a, b);
    EXPECT_EQ(normalize(a), normalize(b));
}

TEST(Normalize, positional_array_stays_array) {
    const auto d = doc(R"({"tags": ["b", "a"], "mixed": [{"id": "a"}, {"x": 1}]})");
    const auto n = normalize(d);

    EXPECT_EQ(*n.find("tags"), doc(R"(["b", "a"])"));
    EXPECT_TRUE(n.find("mixed")->is_array());
}

TEST(Normalize, positional_array_elements_are_normalized) {
    const auto d = doc(R"([[{"id": "b"}, {"id": "a"}]])");
    EXPECT_EQ(normalize(d), doc(R"([{"a": {"id": "a"}, "b": {"id": "b"}}])"));
}

TEST(Normalize, empty_array_becomes_empty_object) {
    EXPECT_EQ(normalize(doc(R"({"toys": []})")), doc(R"({"toys": {}})"));
}

TEST(Normalize, scalars_pass_through) {
    EXPECT_EQ(normalize(Value{42}), Value{42});
    EXPECT_EQ(normalize(Value{"x"}), Value{"x"});
}

TEST(Normalize, exclusions_apply_before_keying) {
    const auto d = doc(R"({"toys": [{"id": "t1", "secret": 1}], "audit": 2})");
    EXPECT_EQ(normalize(d, ExclusionSet{"/toys/secret", "/audit"}),
              doc(R"({"toys": {"t1": {"id": "t1"}}})"));
}

TEST(Normalize, custom_identity_field) {
    auto options = DiffOptions{};
    options.identity_field = "sku";
    const auto d = doc(R"([{"sku": "b"}, {"sku": "a"}])");

    EXPECT_EQ(normalize(d, options), doc(R"({"a": {"sku": "a"}, "b": {"sku": "b"}})"));
}

TEST(Normalize, duplicate_identity_throws) {
    const auto d = doc(R"({"toys": [{"id": "t"}, {"id": "t"}]})");
    try {
        (void)normalize(d);
        FAIL() << "expected DiffException";
    } catch (const DiffException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::duplicate_identity);
    }
}

TEST(Normalize, required_identity_throws_for_missing_id) {
    auto options = DiffOptions{};
    options.require_identity = {Path{"toys"}};
    const auto d = doc(R"({"toys": [{"id": "t1"}, {"name": "anon"}], "tags": ["x"]})");

    try {
        (void)normalize(d, options);
        FAIL() << "expected DiffException";
    } catch (const DiffException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::missing_identity);
    }
}

TEST(Normalize, required_identity_ignores_other_arrays) {
    auto options = DiffOptions{};
    options.require_identity = {Path{"toys"}};
    const auto d = doc(R"({"toys": [{"id": "t1"}], "tags": ["x"]})");

    EXPECT_NO_THROW((void)normalize(d, options));
}
