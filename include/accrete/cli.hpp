#pragma once

#include "accrete/domain.hpp"
#include "accrete/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace accrete {

enum class Verbosity : uint8_t { Quiet, Verbose, VeryVerbose };

struct Config {
    std::filesystem::path cache_path = "/tmp/accrete_cache.json";
    std::filesystem::path build_file = "accrete.ninja";
    std::filesystem::path work_dir = ".";
    Verbosity verbosity = Verbosity::Quiet;
};

struct AddJobOptions {
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
    std::string command;
    std::optional<std::string> description;
    std::optional<std::string> pipeline_name;
    std::optional<CiStage> ci_stage;
    std::optional<int64_t> timeout;
    bool timeout_ok = false;
    std::optional<std::vector<int>> ok_returns;
};

struct ShowHelp {};
struct ShowVersion {};
struct RunBuild {};

using Action = std::variant<ShowHelp, ShowVersion, AddJobOptions, RunBuild>;

struct Invocation {
    Config config;
    Action action;
};

/**
 * @brief Parses the arguments following the program name.
 *
 * Global options come first, then the subcommand and its options. Every
 * problem is reported as a Usage error.
 */
Result<Invocation> parse_args(const std::vector<std::string_view> &args);

/** @brief Builds the record `add-job` appends to the registry. */
JobRecord to_record(const AddJobOptions &options);

std::string usage();

} // namespace accrete
