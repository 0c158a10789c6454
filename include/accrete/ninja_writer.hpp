#pragma once

#include "accrete/domain.hpp"
#include "accrete/graph.hpp"
#include "accrete/utility.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace accrete {

/** @brief Escapes a path for use in a `build` line. */
std::string escape_path(std::string_view path);

/**
 * @brief Escapes a variable value so it is taken literally.
 *
 * Job commands are plain shell commands: `$out` in a command reaches the shell
 * as `$out`, it is not Ninja's `$out`.
 */
std::string escape_value(std::string_view value);

/**
 * @brief Writes Ninja build file syntax to a stream.
 *
 * Lines longer than `width` are wrapped on an unescaped space with a ` $`
 * continuation. A single token longer than the width is never split.
 */
class NinjaWriter {
public:
    explicit NinjaWriter(std::ostream &out, size_t width = 70) : out_(out), width_(width) {
    }

    void newline();
    void comment(std::string_view text);
    void variable(std::string_view key, std::string_view value, size_t indent = 0);
    void rule(const Rule &rule);
    void build(const BuildEdge &edge);

private:
    void line(std::string_view text, size_t indent = 0);

    std::ostream &out_;
    size_t width_;
};

/** @brief Renders the whole graph: header comment, rules, then build edges. */
void write_graph(NinjaWriter &writer, const BuildGraph &graph);

/**
 * @brief Renders `graph` and atomically replaces `path` with the result.
 */
Result<void> write_build_file(const BuildGraph &graph, const std::filesystem::path &path);

} // namespace accrete
