#include "accrete/commands.hpp"

#include "accrete/codec.hpp"
#include "accrete/compiler.hpp"
#include "accrete/ninja_writer.hpp"
#include "accrete/registry.hpp"

#include <print>

namespace accrete {

Result<void> add_job(const Config &config, const AddJobOptions &options) {
    JobRecord record = to_record(options);
    if (config.verbosity == Verbosity::VeryVerbose) {
        std::println("Recording job: {}", describe_record(record));
    }

    JobRegistry registry(config.cache_path);
    if (auto res = registry.append(std::move(record)); !res)
        return res;

    if (config.verbosity != Verbosity::Quiet) {
        std::println("Added job '{}' to {}", options.command, config.cache_path.string());
    }
    return {};
}

Result<void> run_build(const Config &config) {
    JobRegistry registry(config.cache_path);
    auto jobs = registry.load();
    if (!jobs)
        return std::unexpected(jobs.error());

    auto graph = compile(*jobs);
    if (!graph)
        return std::unexpected(graph.error());

    if (config.verbosity != Verbosity::Quiet) {
        for (const auto &edge : graph->edges()) {
            std::println("  {} <- {}", edge.outputs.front(), edge.rule);
        }
    }

    if (auto res = write_build_file(*graph, config.build_file); !res)
        return res;

    std::println("Wrote {} ({} rules, {} build edges)",
                 config.build_file.string(),
                 graph->rules().size(),
                 graph->edges().size());
    return {};
}

int exit_code(const Error &err) {
    return err.kind == ErrorKind::Usage ? 2 : 1;
}

} // namespace accrete
