#include <docdiff-cpp/version_chain.hpp>
#include <docdiff-cpp/apply.hpp>
#include <docdiff-cpp/diff.hpp>
#include <docdiff-cpp/error.hpp>

#include "executor.hpp"
#include "logging.hpp"

#include <exception>
#include <string>

namespace docdiff_cpp {

namespace {

void check_version(std::span<const ChangeList> diffs, std::size_t version) {
    if (version > diffs.size()) {
        throw DiffException{ErrorKind::version_out_of_range,
            "version " + std::to_string(version) + " requested, chain holds versions 0.." +
            std::to_string(diffs.size())};
    }
}

}  // anonymous namespace

auto reconstruct(const Value& base, std::span<const ChangeList> diffs,
                 const DiffOptions& options) -> Value {
    auto current = base;
    for (const auto& diff : diffs) {
        current = apply_change_sequence(diff, current, options.identity_field);
    }
    detail::logger()->debug("reconstructed snapshot from {} diff(s)", diffs.size());
    return current;
}

auto snapshot_at(const Value& base, std::span<const ChangeList> diffs,
                 std::size_t version, const DiffOptions& options) -> Value {
    check_version(diffs, version);
    return reconstruct(base, diffs.first(version), options);
}

auto compare_versions(const Value& base, std::span<const ChangeList> diffs,
                      std::size_t from_version, std::size_t to_version,
                      const DiffOptions& options) -> ChangeList {
    check_version(diffs, from_version);
    check_version(diffs, to_version);

    auto from = Value{};
    auto to = Value{};
    std::exception_ptr from_error;
    std::exception_ptr to_error;

    auto folds = tf::Taskflow{};
    folds.emplace([&] {
        try { from = snapshot_at(base, diffs, from_version, options); }
        catch (...) { from_error = std::current_exception(); }
    });
    folds.emplace([&] {
        try { to = snapshot_at(base, diffs, to_version, options); }
        catch (...) { to_error = std::current_exception(); }
    });

    // A worker of the executor keeps executing other tasks while the folds
    // run instead of blocking on them.
    auto& executor = detail::global_executor();
    if (executor.this_worker_id() >= 0) {
        executor.corun(folds);
    } else {
        executor.run(folds).wait();
    }
    if (from_error) std::rethrow_exception(from_error);
    if (to_error) std::rethrow_exception(to_error);

    auto changes = compute_diff(from, to, options);
    detail::logger()->debug("compare_versions {} -> {}: {} change(s)",
                            from_version, to_version, changes.size());
    return changes;
}

}  // namespace docdiff_cpp
