#pragma once

#include "accrete/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace accrete {

/**
 * @brief Cheap fingerprint of a file used to detect writers racing with us.
 */
struct FileStamp {
    bool exists = false;
    std::uintmax_t size = 0;
    std::filesystem::file_time_type mtime{};

    bool operator==(const FileStamp &) const = default;
};

FileStamp stamp_of(const std::filesystem::path &path);

/** @brief Reads a whole file. A missing file is an Io error. */
Result<std::string> read_file(const std::filesystem::path &path);

/**
 * @brief Writes `content` to a temporary file next to `path`.
 *
 * Parent directories of `path` are created if needed.
 * @return The temporary file's path.
 */
Result<std::filesystem::path> write_temp_sibling(const std::filesystem::path &path, std::string_view content);

/** @brief Renames `tmp` over `path`. On failure `tmp` is removed. */
Result<void> commit_temp(const std::filesystem::path &tmp, const std::filesystem::path &path);

/** @brief write_temp_sibling followed by commit_temp. */
Result<void> write_atomically(const std::filesystem::path &path, std::string_view content);

} // namespace accrete
