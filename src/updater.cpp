#include <docdiff-cpp/updater.hpp>
#include <docdiff-cpp/diff.hpp>
#include <docdiff-cpp/error.hpp>
#include <docdiff-cpp/version_chain.hpp>

#include "logging.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>

namespace docdiff_cpp {

DocumentUpdater::DocumentUpdater(DocumentStore& store, DiffRecordStore& records,
                                 ChangeSink* sink, DiffOptions options, UpdaterConfig config)
    : store_{store},
      records_{records},
      sink_{sink},
      options_{std::move(options)},
      config_{config} {
    if (config_.max_attempts == 0) {
        throw DiffException{ErrorKind::invalid_config, "max_attempts must be at least 1"};
    }
}

auto DocumentUpdater::update(std::string_view id, const Mutation& mutate) -> UpdateResult {
    for (std::size_t attempt = 1;; ++attempt) {
        auto current = store_.load(id);
        auto updated = mutate(current.value);
        auto changes = compute_diff(current.value, updated, options_);

        if (changes.empty()) {
            detail::logger()->debug("update '{}': no changes at version {}", id, current.version);
            return UpdateResult{current.version, {}, attempt};
        }

        std::uint64_t version = 0;
        try {
            version = store_.save(id, updated, current.version);
        } catch (const DiffException& e) {
            if (e.kind() != ErrorKind::version_conflict) throw;
            if (attempt >= config_.max_attempts) {
                detail::logger()->warn("update '{}': giving up after {} conflicting attempt(s)",
                                       id, attempt);
                throw;
            }
            detail::logger()->info("update '{}': version {} was superseded, retrying ({}/{})",
                                   id, current.version, attempt + 1, config_.max_attempts);
            continue;
        }

        // The document is saved; failures from here on are not retried.
        records_.append(id, version, changes);
        if (sink_) sink_->publish(id, version, changes);
        detail::logger()->debug("update '{}': version {} -> {}, {} change(s)",
                                id, current.version, version, changes.size());
        return UpdateResult{version, std::move(changes), attempt};
    }
}

auto DocumentUpdater::compare(std::string_view id, const Value& base,
                              std::uint64_t from_version, std::uint64_t to_version) -> ChangeList {
    const auto latest = std::max(from_version, to_version);
    auto diffs = latest == 0 ? std::vector<ChangeList>{} : records_.load_range(id, 1, latest);
    return compare_versions(base, diffs, from_version, to_version, options_);
}

}  // namespace docdiff_cpp
