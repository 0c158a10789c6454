#include "accrete/registry.hpp"

#include "accrete/codec.hpp"

#include <format>
#include <string>

namespace fs = std::filesystem;

namespace accrete {

Result<std::string> serialize_registry(const std::vector<JobRecord> &jobs) {
    json doc = json::object();
    doc["jobs"] = json::array();
    for (const auto &job : jobs) {
        doc["jobs"].push_back(record_to_json(job));
    }
    try {
        return doc.dump(2) + "\n";
    } catch (const json::type_error &err) {
        return fail(ErrorKind::InvalidEncoding, std::format("Job cannot be stored, JSON requires UTF-8: {}", err.what()));
    }
}

Result<std::vector<JobRecord>> parse_registry(std::string_view content, std::string_view origin) {
    json doc;
    try {
        doc = json::parse(content);
    } catch (const json::parse_error &err) {
        return fail(ErrorKind::MalformedCache, std::format("{} is not valid JSON: {}", origin, err.what()));
    }

    if (!doc.is_object()) {
        return fail(ErrorKind::MalformedCache, std::format("{}: top level is not an object", origin));
    }
    auto it = doc.find("jobs");
    if (it == doc.end() || !it->is_array()) {
        return fail(ErrorKind::MalformedCache, std::format("{}: missing 'jobs' array", origin));
    }

    std::vector<JobRecord> jobs;
    jobs.reserve(it->size());
    for (size_t i = 0; i < it->size(); ++i) {
        auto record = record_from_json((*it)[i], i);
        if (!record) {
            return fail(ErrorKind::MalformedCache, std::format("{}: {}", origin, record.error().message));
        }
        jobs.push_back(std::move(*record));
    }
    return jobs;
}

Result<JobRegistry::Snapshot> JobRegistry::load_snapshot() const {
    Snapshot snapshot;
    snapshot.stamp = stamp_of(path_);
    if (!snapshot.stamp.exists) {
        return snapshot;
    }

    auto content = read_file(path_);
    if (!content)
        return std::unexpected(content.error());

    auto jobs = parse_registry(*content, path_.string());
    if (!jobs)
        return std::unexpected(jobs.error());
    snapshot.jobs = std::move(*jobs);
    return snapshot;
}

Result<std::vector<JobRecord>> JobRegistry::load() const {
    auto snapshot = load_snapshot();
    if (!snapshot)
        return std::unexpected(snapshot.error());
    return std::move(snapshot->jobs);
}

Result<void> JobRegistry::store(const Snapshot &snapshot) const {
    auto content = serialize_registry(snapshot.jobs);
    if (!content)
        return std::unexpected(content.error());

    auto tmp = write_temp_sibling(path_, *content);
    if (!tmp)
        return std::unexpected(tmp.error());

    if (stamp_of(path_) != snapshot.stamp) {
        std::error_code ec;
        fs::remove(*tmp, ec);
        return fail(ErrorKind::ConcurrentModification,
                    std::format("{} was modified by another process, job not recorded", path_.string()));
    }
    return commit_temp(*tmp, path_);
}

Result<void> JobRegistry::append(JobRecord job) const {
    auto snapshot = load_snapshot();
    if (!snapshot)
        return std::unexpected(snapshot.error());
    snapshot->jobs.push_back(std::move(job));
    return store(*snapshot);
}

} // namespace accrete
