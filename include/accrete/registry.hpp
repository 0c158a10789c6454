#pragma once

#include "accrete/atomic_file.hpp"
#include "accrete/domain.hpp"
#include "accrete/utility.hpp"

#include <filesystem>
#include <vector>

namespace accrete {

/**
 * @brief Persistent, ordered store of job records shared across invocations.
 *
 * The whole document is read, modified in memory and rewritten on every
 * append. Writes go through a temporary file and a rename, so readers never see
 * a half-written document. There is no lock; a writer that raced with another
 * one is detected through the file stamp and fails with ConcurrentModification.
 */
class JobRegistry {
public:
    /** @brief A loaded document together with the stamp it was read under. */
    struct Snapshot {
        std::vector<JobRecord> jobs;
        FileStamp stamp;
    };

    explicit JobRegistry(std::filesystem::path path) : path_(std::move(path)) {
    }

    const std::filesystem::path &path() const {
        return path_;
    }

    /**
     * @brief Loads every record in insertion order.
     * @return The records (empty if the document does not exist yet), or
     *         MalformedCache if it exists but cannot be parsed.
     */
    Result<std::vector<JobRecord>> load() const;

    Result<Snapshot> load_snapshot() const;

    /**
     * @brief Persists `snapshot.jobs` as the full document.
     *
     * Fails with ConcurrentModification if the document changed since the
     * snapshot was taken; the on-disk document is left untouched then.
     */
    Result<void> store(const Snapshot &snapshot) const;

    /** @brief load, push back `job`, store. */
    Result<void> append(JobRecord job) const;

private:
    std::filesystem::path path_;
};

/**
 * @brief Renders the registry document, two-space indented with a trailing newline.
 *
 * JSON strings must be UTF-8. A record holding other bytes is an
 * InvalidEncoding error and nothing is rendered.
 */
Result<std::string> serialize_registry(const std::vector<JobRecord> &jobs);

/** @brief Parses a registry document. `origin` names the document in error messages. */
Result<std::vector<JobRecord>> parse_registry(std::string_view content, std::string_view origin);

} // namespace accrete
