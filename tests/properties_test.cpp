// properties_test.cpp — Randomized checks of the diff/apply laws over generated documents

#include <docdiff-cpp/apply.hpp>
#include <docdiff-cpp/diff.hpp>
#include <docdiff-cpp/identity.hpp>
#include <docdiff-cpp/normalize.hpp>
#include <docdiff-cpp/version_chain.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <random>
#include <string>
#include <string_view>
#include <vector>

using namespace docdiff_cpp;

namespace {

constexpr unsigned iterations = 200;

// Person-like documents: scalars, a positional tag list, an identifiable
// toy list whose elements carry an identifiable part list, a nested
// object, and a positional row list whose elements hold identifiable
// cells with numeric ids.
class DocumentGenerator {
public:
    explicit DocumentGenerator(unsigned seed) : rng_{seed} {}

    auto document() -> Value {
        auto toys = Array{};
        const auto count = pick(0, 4);
        for (int i = 0; i < count; ++i) toys.push_back(toy());

        return Value{Object{
            {"id", "person"},
            {"name", word()},
            {"count", pick(0, 100)},
            {"tags", tags()},
            {"toys", Value{std::move(toys)}},
            {"meta", Value{Object{{"flag", chance(0.5)}, {"note", word()}}}},
            {"rows", rows()},
        }};
    }

    auto mutate(const Value& doc) -> Value {
        auto result = doc;
        if (chance(0.3)) result = result.with_field("name", word());
        if (chance(0.2)) result = result.with_field("count", chance(0.5) ? Value{pick(0, 100)} : Value{word()});
        if (chance(0.3)) result = result.with_field("tags", tags());
        if (chance(0.1)) result = result.without_field("meta");
        if (chance(0.2) && result.find("meta")) {
            result = result.with_field("meta", result.find("meta")->with_field("note", word()));
        }
        if (chance(0.1)) result = result.with_field("extra", Value{Array{1, 2}});

        auto toys = Array{};
        for (const auto& t : result.find("toys")->as_array()) {
            if (chance(0.2)) continue;
            auto edited = t;
            if (chance(0.3)) edited = edited.with_field("name", word());
            if (chance(0.2)) edited = edited.with_field("price", pick(1, 50));
            if (chance(0.2)) edited = edited.with_field("parts", parts());
            toys.push_back(std::move(edited));
        }
        while (chance(0.3)) toys.push_back(toy());

        auto rows = Array{};
        for (const auto& r : result.find("rows")->as_array()) {
            rows.push_back(chance(0.4) ? r.with_field("cells", cells()) : r);
        }
        if (chance(0.2) && !rows.empty()) rows.pop_back();
        if (chance(0.2)) rows.push_back(row());

        return result.with_field("toys", Value{std::move(toys)})
                     .with_field("rows", Value{std::move(rows)});
    }

    // Shuffle every identifiable array, recursively.
    auto permuted(const Value& v) -> Value {
        if (const auto* obj = v.object_if()) {
            auto result = Object{};
            for (const auto& [key, child] : *obj) result.emplace(key, permuted(child));
            return Value{std::move(result)};
        }
        if (const auto* arr = v.array_if()) {
            auto result = Array{};
            for (const auto& element : *arr) result.push_back(permuted(element));
            if (extract_identity(v).identifiable) std::shuffle(result.begin(), result.end(), rng_);
            return Value{std::move(result)};
        }
        return v;
    }

private:
    auto pick(int lo, int hi) -> int {
        return std::uniform_int_distribution<int>{lo, hi}(rng_);
    }

    auto chance(double p) -> bool {
        return std::bernoulli_distribution{p}(rng_);
    }

    auto word() -> std::string {
        static constexpr auto words = std::array{"Car", "Doll", "Robot", "Kite", "Ball", "Train"};
        return words[static_cast<std::size_t>(pick(0, static_cast<int>(words.size()) - 1))];
    }

    auto tags() -> Value {
        auto result = Array{};
        const auto count = pick(0, 3);
        for (int i = 0; i < count; ++i) result.push_back(chance(0.5) ? Value{word()} : Value{pick(0, 9)});
        return Value{std::move(result)};
    }

    auto parts() -> Value {
        auto result = Array{};
        const auto count = pick(0, 2);
        for (int i = 0; i < count; ++i) {
            result.push_back(Value{Object{
                {"id", "part" + std::to_string(next_id_++)},
                {"kind", word()},
            }});
        }
        return Value{std::move(result)};
    }

    auto toy() -> Value {
        return Value{Object{
            {"id", "toy" + std::to_string(next_id_++)},
            {"name", word()},
            {"price", pick(1, 50)},
            {"parts", parts()},
        }};
    }

    // Ids "0".."3" collide with the row indices on purpose.
    auto cells() -> Value {
        auto result = Array{};
        for (int id = 0; id < 4; ++id) {
            if (!chance(0.6)) continue;
            result.push_back(Value{Object{{"id", std::to_string(id)}, {"v", pick(0, 3)}}});
        }
        return Value{std::move(result)};
    }

    auto row() -> Value {
        return Value{Object{{"label", word()}, {"cells", cells()}}};
    }

    auto rows() -> Value {
        auto result = Array{};
        const auto count = pick(1, 3);
        for (int i = 0; i < count; ++i) result.push_back(row());
        return Value{std::move(result)};
    }

    std::mt19937 rng_;
    int next_id_{0};
};

auto contains_field(const Value& v, std::string_view field) -> bool {
    if (const auto* obj = v.object_if()) {
        for (const auto& [key, child] : *obj) {
            if (key == field || contains_field(child, field)) return true;
        }
    }
    if (const auto* arr = v.array_if()) {
        return std::ranges::any_of(*arr, [&](const Value& e) { return contains_field(e, field); });
    }
    return false;
}

}  // namespace

// -- Round trip ---------------------------------------------------------------

TEST(Properties, round_trip) {
    for (unsigned seed = 0; seed < iterations; ++seed) {
        auto gen = DocumentGenerator{seed};
        const auto a = gen.document();
        const auto b = gen.mutate(a);

        const auto rebuilt = apply_change_sequence(compute_diff(a, b), a);
        EXPECT_TRUE(equivalent(rebuilt, b)) << "seed " << seed;
    }
}

TEST(Properties, round_trip_on_permuted_target) {
    for (unsigned seed = 0; seed < iterations; ++seed) {
        auto gen = DocumentGenerator{seed};
        const auto a = gen.document();
        const auto b = gen.mutate(a);
        const auto target = gen.permuted(a);

        const auto rebuilt = apply_change_sequence(compute_diff(a, b), target);
        EXPECT_TRUE(equivalent(rebuilt, b)) << "seed " << seed;
    }
}

// -- Idempotence --------------------------------------------------------------

TEST(Properties, idempotence) {
    for (unsigned seed = 0; seed < iterations; ++seed) {
        auto gen = DocumentGenerator{seed};
        const auto a = gen.document();

        EXPECT_TRUE(compute_diff(a, a).empty()) << "seed " << seed;
        EXPECT_EQ(apply_change_sequence(ChangeList{}, a), a);
    }
}

// -- Reorder invariance -------------------------------------------------------

TEST(Properties, reorder_invariance) {
    for (unsigned seed = 0; seed < iterations; ++seed) {
        auto gen = DocumentGenerator{seed};
        const auto a = gen.document();

        EXPECT_TRUE(compute_diff(a, gen.permuted(a)).empty()) << "seed " << seed;
    }
}

// -- Exclusion ----------------------------------------------------------------

TEST(Properties, excluded_fields_never_surface) {
    const auto exclusions = ExclusionSet{"/meta/note", "/toys/price"};

    for (unsigned seed = 0; seed < iterations; ++seed) {
        auto gen = DocumentGenerator{seed};
        const auto a = gen.document();
        const auto b = gen.mutate(a);

        for (const auto& c : compute_diff(a, b, exclusions)) {
            EXPECT_EQ(std::ranges::count(c.path, std::string{"price"}), 0) << "seed " << seed;
            EXPECT_NE(c.path, (Path{"meta", "note"})) << "seed " << seed;
            if (c.value) {
                EXPECT_FALSE(contains_field(*c.value, "price")) << "seed " << seed;
            }
        }
    }
}

TEST(Properties, differences_under_excluded_fields_are_invisible) {
    const auto exclusions = ExclusionSet{"/meta/note", "/toys/price"};

    for (unsigned seed = 0; seed < iterations; ++seed) {
        auto gen = DocumentGenerator{seed};
        const auto a = gen.document();

        auto toys = Array{};
        for (const auto& t : a.find("toys")->as_array()) toys.push_back(t.with_field("price", 999));
        const auto b = a.with_field("toys", Value{std::move(toys)})
                        .with_field("meta", a.find("meta")->with_field("note", "changed"));

        EXPECT_TRUE(compute_diff(a, b, exclusions).empty()) << "seed " << seed;
    }
}

// -- Minimality across versions -----------------------------------------------

TEST(Properties, compare_versions_is_minimal) {
    for (unsigned seed = 0; seed < iterations / 4; ++seed) {
        auto gen = DocumentGenerator{seed};
        auto snapshots = std::vector<Value>{gen.document()};
        auto diffs = std::vector<ChangeList>{};
        for (int v = 0; v < 5; ++v) {
            snapshots.push_back(gen.mutate(snapshots.back()));
            diffs.push_back(compute_diff(snapshots[snapshots.size() - 2], snapshots.back()));
        }

        for (std::size_t from = 0; from < snapshots.size(); ++from) {
            for (std::size_t to = 0; to < snapshots.size(); ++to) {
                const auto changes = compare_versions(snapshots[0], diffs, from, to);
                EXPECT_TRUE(equivalent(apply_change_sequence(changes, snapshots[from]), snapshots[to]))
                    << "seed " << seed << " " << from << " -> " << to;

                for (const auto& added : changes) {
                    if (added.op != Op::add || added.item_ids.empty()) continue;
                    for (const auto& removed : changes) {
                        EXPECT_FALSE(removed.op == Op::remove && removed.path == added.path)
                            << "seed " << seed << " identity " << added.item_ids.back();
                    }
                }
            }
        }
    }
}
