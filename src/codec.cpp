#include "accrete/codec.hpp"

#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <vector>

namespace accrete {

namespace {

Result<std::vector<std::string>> string_list(const json &value, std::string_view key, size_t index) {
    if (!value.is_array()) {
        return fail(ErrorKind::MalformedCache, std::format("jobs[{}].{} is not an array", index, key));
    }
    std::vector<std::string> out;
    out.reserve(value.size());
    for (const auto &item : value) {
        if (!item.is_string()) {
            return fail(ErrorKind::MalformedCache, std::format("jobs[{}].{} holds a non-string element", index, key));
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

Result<std::string> string_field(const json &value, std::string_view key, size_t index) {
    if (!value.is_string()) {
        return fail(ErrorKind::MalformedCache, std::format("jobs[{}].{} is not a string", index, key));
    }
    return value.get<std::string>();
}

} // namespace

json record_to_json(const JobRecord &record) {
    json out = json::object();
    if (record.inputs)
        out["inputs"] = *record.inputs;
    if (record.outputs)
        out["outputs"] = *record.outputs;
    if (record.command)
        out["command"] = *record.command;
    if (record.description)
        out["description"] = *record.description;
    if (record.pipeline_name)
        out["pipeline_name"] = *record.pipeline_name;
    if (record.ci_stage)
        out["ci_stage"] = std::string(to_string(*record.ci_stage));
    if (record.timeout)
        out["timeout"] = *record.timeout;
    if (record.timeout_ok)
        out["timeout_ok"] = true;
    if (record.ok_returns)
        out["ok_returns"] = *record.ok_returns;
    return out;
}

std::string describe_record(const JobRecord &record) {
    return record_to_json(record).dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<JobRecord> record_from_json(const json &entry, size_t index) {
    if (!entry.is_object()) {
        return fail(ErrorKind::MalformedCache, std::format("jobs[{}] is not an object", index));
    }

    JobRecord record;

    for (auto [key, target] : {std::pair{"inputs", &record.inputs}, std::pair{"outputs", &record.outputs}}) {
        if (auto it = entry.find(key); it != entry.end()) {
            auto list = string_list(*it, key, index);
            if (!list)
                return std::unexpected(list.error());
            *target = std::move(*list);
        }
    }

    for (auto [key, target] : {std::pair{"command", &record.command},
                               std::pair{"description", &record.description},
                               std::pair{"pipeline_name", &record.pipeline_name}}) {
        if (auto it = entry.find(key); it != entry.end()) {
            auto str = string_field(*it, key, index);
            if (!str)
                return std::unexpected(str.error());
            *target = std::move(*str);
        }
    }

    if (auto it = entry.find("ci_stage"); it != entry.end()) {
        auto str = string_field(*it, "ci_stage", index);
        if (!str)
            return std::unexpected(str.error());
        record.ci_stage = parse_ci_stage(*str);
        if (!record.ci_stage) {
            return fail(ErrorKind::MalformedCache, std::format("jobs[{}].ci_stage has unknown value '{}'", index, *str));
        }
    }

    if (auto it = entry.find("timeout"); it != entry.end()) {
        if (!it->is_number_integer() || it->get<int64_t>() < 0) {
            return fail(ErrorKind::MalformedCache,
                        std::format("jobs[{}].timeout is not a non-negative integer", index));
        }
        record.timeout = it->get<int64_t>();
    }

    if (auto it = entry.find("timeout_ok"); it != entry.end()) {
        if (!it->is_boolean()) {
            return fail(ErrorKind::MalformedCache, std::format("jobs[{}].timeout_ok is not a boolean", index));
        }
        record.timeout_ok = it->get<bool>();
    }

    if (auto it = entry.find("ok_returns"); it != entry.end()) {
        if (!it->is_array()) {
            return fail(ErrorKind::MalformedCache, std::format("jobs[{}].ok_returns is not an array", index));
        }
        std::vector<int> codes;
        for (const auto &code : *it) {
            if (!code.is_number_integer()) {
                return fail(ErrorKind::MalformedCache,
                            std::format("jobs[{}].ok_returns holds a non-integer element", index));
            }
            bool in_range = code.is_number_unsigned()
                                ? code.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
                                : code.get<int64_t>() >= std::numeric_limits<int>::min() &&
                                      code.get<int64_t>() <= std::numeric_limits<int>::max();
            if (!in_range) {
                return fail(ErrorKind::MalformedCache,
                            std::format("jobs[{}].ok_returns value {} is out of range", index, code.dump()));
            }
            codes.push_back(code.get<int>());
        }
        record.ok_returns = std::move(codes);
    }

    return record;
}

} // namespace accrete
