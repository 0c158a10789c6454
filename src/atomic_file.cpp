#include "accrete/atomic_file.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace accrete {

FileStamp stamp_of(const fs::path &path) {
    std::error_code ec;
    FileStamp stamp;
    if (!fs::exists(path, ec) || ec)
        return stamp;
    stamp.exists = true;
    stamp.size = fs::file_size(path, ec);
    if (ec)
        stamp.size = 0;
    stamp.mtime = fs::last_write_time(path, ec);
    return stamp;
}

Result<std::string> read_file(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return fail(ErrorKind::Io, std::format("Could not open {}", path.string()));
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return fail(ErrorKind::Io, std::format("Failed reading {}", path.string()));
    }
    return content;
}

Result<fs::path> write_temp_sibling(const fs::path &path, std::string_view content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return fail(ErrorKind::Io,
                        std::format("Failed to create directory {}: {}", path.parent_path().string(), ec.message()));
        }
    }

    fs::path tmp = path;
    tmp += std::format(".tmp.{}", ::getpid());

    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fail(ErrorKind::Io, std::format("Failed to open {} for writing", tmp.string()));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        fs::remove(tmp, ec);
        return fail(ErrorKind::Io, std::format("Failed to write {}", tmp.string()));
    }
    return tmp;
}

Result<void> commit_temp(const fs::path &tmp, const fs::path &path) {
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return fail(ErrorKind::Io, std::format("Failed to replace {}: {}", path.string(), ec.message()));
    }
    return {};
}

Result<void> write_atomically(const fs::path &path, std::string_view content) {
    auto tmp = write_temp_sibling(path, content);
    if (!tmp)
        return std::unexpected(tmp.error());
    return commit_temp(*tmp, path);
}

} // namespace accrete
