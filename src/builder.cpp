#include "accrete/builder.hpp"

#include "accrete/codec.hpp"
#include "accrete/sanitize.hpp"

#include <format>

namespace accrete {

namespace {

Result<void> require(bool present, std::string_view field, const JobRecord &record, size_t index) {
    if (present)
        return {};
    return fail(ErrorKind::MissingField,
                std::format("Job #{} has no {}: {}", index, field, describe_record(record)));
}

// Ninja paths cannot span lines and cannot be empty.
Result<void> check_paths(const std::vector<std::string> &paths, std::string_view field, size_t index) {
    for (const auto &path : paths) {
        if (path.empty()) {
            return fail(ErrorKind::InvalidPath, std::format("Job #{}: {} contains an empty path", index, field));
        }
        if (path.find_first_of("\r\n") != std::string::npos) {
            return fail(ErrorKind::InvalidPath, std::format("Job #{}: {} path contains a line break", index, field));
        }
    }
    return {};
}

std::string join(const std::vector<int> &codes) {
    std::string out;
    for (int code : codes) {
        if (!out.empty())
            out += ' ';
        out += std::to_string(code);
    }
    return out;
}

} // namespace

std::string default_description(std::string_view command) {
    return std::format("Running '{}...'", command);
}

Variables metadata_variables(const JobRecord &record) {
    Variables vars;
    if (record.pipeline_name)
        vars.emplace_back("pipeline_name", *record.pipeline_name);
    if (record.ci_stage)
        vars.emplace_back("ci_stage", std::string(to_string(*record.ci_stage)));
    if (record.timeout)
        vars.emplace_back("timeout", std::to_string(*record.timeout));
    if (record.timeout_ok)
        vars.emplace_back("timeout_ok", "true");
    if (record.ok_returns)
        vars.emplace_back("ok_returns", join(*record.ok_returns));
    return vars;
}

Result<void> GraphBuilder::add_job(const JobRecord &record, size_t index) {
    if (auto res = require(record.inputs && !record.inputs->empty(), "inputs", record, index); !res)
        return res;
    if (auto res = require(record.outputs && !record.outputs->empty(), "outputs", record, index); !res)
        return res;
    if (auto res = require(record.command.has_value(), "command", record, index); !res)
        return res;

    if (auto res = check_paths(*record.inputs, "inputs", index); !res)
        return res;
    if (auto res = check_paths(*record.outputs, "outputs", index); !res)
        return res;

    const std::string &command = *record.command;
    std::string name = to_rule_name(command);
    if (!is_valid_rule_name(name)) {
        return fail(ErrorKind::EmptyIdentifier,
                    std::format("Job #{}: command '{}' yields an empty rule name", index, command));
    }

    auto rule = graph_.add_rule({.name = name,
                                 .description = record.description.value_or(default_description(command)),
                                 .command = command});
    if (!rule)
        return std::unexpected(rule.error());

    auto edge = graph_.add_edge({.inputs = *record.inputs,
                                 .outputs = *record.outputs,
                                 .rule = std::move(name),
                                 .variables = metadata_variables(record)});
    if (!edge)
        return std::unexpected(edge.error());
    return {};
}

} // namespace accrete
