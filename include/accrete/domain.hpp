#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace accrete {

enum class CiStage : uint8_t { Build, Test, Report };

std::string_view to_string(CiStage stage);
std::optional<CiStage> parse_ci_stage(std::string_view text);

/**
 * @brief One job as persisted in the registry document.
 *
 * The required fields are optional here so that a record missing one can still
 * be loaded and reported by the compiler instead of being rejected as a corrupt
 * document.
 */
struct JobRecord {
    std::optional<std::vector<std::string>> inputs;
    std::optional<std::vector<std::string>> outputs;
    std::optional<std::string> command;
    std::optional<std::string> description;

    // Metadata for the build executor, never interpreted here.
    std::optional<std::string> pipeline_name;
    std::optional<CiStage> ci_stage;
    std::optional<int64_t> timeout;
    bool timeout_ok = false;
    std::optional<std::vector<int>> ok_returns;

    bool operator==(const JobRecord &) const = default;
};

struct Rule {
    std::string name;
    std::string description;
    std::string command;

    bool operator==(const Rule &) const = default;
};

using Variables = std::vector<std::pair<std::string, std::string>>;

struct BuildEdge {
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
    std::string rule;
    Variables variables; ///< Job metadata passed through to the build file.

    bool operator==(const BuildEdge &) const = default;
};

} // namespace accrete
