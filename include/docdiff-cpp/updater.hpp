/// @file updater.hpp
/// @brief Optimistic update orchestration over external stores.
///
/// The diff engine itself never persists anything. DocumentUpdater is the
/// layer that loads a document, applies a caller mutation, records the
/// resulting diff and publishes it, retrying when another writer saved
/// first. Storage, diff history and notification are supplied by the
/// caller through the interfaces below.

#pragma once

#include <docdiff-cpp/change.hpp>
#include <docdiff-cpp/options.hpp>
#include <docdiff-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace docdiff_cpp {

/// A document as held by a DocumentStore.
struct StoredDocument {
    Value value;
    std::uint64_t version{0};
};

/// Persistence of the current document state, with optimistic
/// concurrency keyed on a version counter.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    /// @throws DiffException{path_not_found} if no document has this id.
    virtual auto load(std::string_view id) -> StoredDocument = 0;

    /// Store `value` if the stored version still equals `expected_version`,
    /// and return the new version.
    /// @throws DiffException{version_conflict} if the version moved on.
    virtual auto save(std::string_view id, const Value& value,
                      std::uint64_t expected_version) -> std::uint64_t = 0;
};

/// Per-version diff history of a document.
class DiffRecordStore {
public:
    virtual ~DiffRecordStore() = default;

    /// Record the changes that produced `version`.
    virtual void append(std::string_view id, std::uint64_t version,
                        const ChangeList& changes) = 0;

    /// The change lists of versions `from_version ..= to_version`, in
    /// ascending version order.
    virtual auto load_range(std::string_view id, std::uint64_t from_version,
                            std::uint64_t to_version) -> std::vector<ChangeList> = 0;
};

/// Receives the changes of every successful update.
class ChangeSink {
public:
    virtual ~ChangeSink() = default;
    virtual void publish(std::string_view id, std::uint64_t version,
                         const ChangeList& changes) = 0;
};

/// Retry policy for DocumentUpdater.
struct UpdaterConfig {
    std::size_t max_attempts{3};  ///< Attempts per update, including the first.
};

/// Outcome of DocumentUpdater::update().
struct UpdateResult {
    std::uint64_t version{0};  ///< Version after the update.
    ChangeList changes;        ///< Empty if the mutation changed nothing.
    std::size_t attempts{0};   ///< Attempts used, including the successful one.
};

/// Load, mutate, diff, save, record, publish.
///
/// @code
/// auto updater = DocumentUpdater{store, records, &sink, options};
/// auto result = updater.update("person-1", [](const Value& doc) {
///     return doc.with_field("name", "Bob");
/// });
/// @endcode
class DocumentUpdater {
public:
    using Mutation = std::function<Value(const Value&)>;

    /// `sink` may be nullptr. The stores and sink must outlive the updater.
    DocumentUpdater(DocumentStore& store, DiffRecordStore& records, ChangeSink* sink,
                    DiffOptions options = {}, UpdaterConfig config = {});

    /// Apply `mutate` to the current document and persist the result.
    ///
    /// If the mutation produces no changes nothing is saved, recorded or
    /// published. On a version conflict the document is reloaded and the
    /// mutation re-run against the fresh state.
    ///
    /// @throws DiffException{version_conflict} once config.max_attempts
    ///         attempts have all conflicted.
    auto update(std::string_view id, const Mutation& mutate) -> UpdateResult;

    /// The changes between two recorded versions of a document, given the
    /// document's version-0 state `base`.
    auto compare(std::string_view id, const Value& base, std::uint64_t from_version,
                 std::uint64_t to_version) -> ChangeList;

    auto options() const noexcept -> const DiffOptions& { return options_; }
    auto config() const noexcept -> const UpdaterConfig& { return config_; }

private:
    DocumentStore& store_;
    DiffRecordStore& records_;
    ChangeSink* sink_;
    DiffOptions options_;
    UpdaterConfig config_;
};

}  // namespace docdiff_cpp
