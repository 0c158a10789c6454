#include "accrete/ninja_writer.hpp"

#include "accrete/atomic_file.hpp"

#include <algorithm>
#include <sstream>

namespace accrete {

namespace {

// A space preceded by an odd number of '$' is escaped and must not be split.
bool escaped_space(std::string_view text, size_t pos) {
    size_t dollars = 0;
    while (pos > 0 && text[pos - 1] == '$') {
        ++dollars;
        --pos;
    }
    return dollars % 2 == 1;
}

size_t last_split_before(std::string_view text, size_t limit) {
    size_t pos = std::min(limit, text.size());
    while (pos > 0) {
        size_t space = text.rfind(' ', pos - 1);
        if (space == std::string_view::npos)
            return std::string_view::npos;
        if (!escaped_space(text, space))
            return space;
        pos = space;
    }
    return std::string_view::npos;
}

size_t first_split_after(std::string_view text, size_t from) {
    size_t space = text.find(' ', from);
    while (space != std::string_view::npos && escaped_space(text, space)) {
        space = text.find(' ', space + 1);
    }
    return space;
}

} // namespace

std::string escape_path(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '$' || c == ' ' || c == ':')
            out += '$';
        out += c;
    }
    return out;
}

std::string escape_value(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '$') {
            out += "$$";
        } else if (c == '\n' || c == '\r') {
            out += ' ';
        } else {
            out += c;
        }
    }
    return out;
}

void NinjaWriter::line(std::string_view text, size_t indent) {
    std::string leading(indent * 2, ' ');
    constexpr std::string_view continuation = " $";

    while (leading.size() + text.size() > width_) {
        size_t available =
            width_ > leading.size() + continuation.size() ? width_ - leading.size() - continuation.size() : 0;
        size_t space = last_split_before(text, available);
        if (space == std::string_view::npos || space == 0) {
            space = first_split_after(text, available);
        }
        if (space == std::string_view::npos)
            break;

        out_ << leading << text.substr(0, space) << continuation << '\n';
        text.remove_prefix(space + 1);
        leading.assign((indent + 2) * 2, ' ');
    }
    out_ << leading << text << '\n';
}

void NinjaWriter::newline() {
    out_ << '\n';
}

void NinjaWriter::comment(std::string_view text) {
    out_ << "# " << text << '\n';
}

void NinjaWriter::variable(std::string_view key, std::string_view value, size_t indent) {
    std::string text(key);
    text += " = ";
    text += escape_value(value);
    line(text, indent);
}

void NinjaWriter::rule(const Rule &rule) {
    line("rule " + rule.name);
    variable("command", rule.command, 1);
    variable("description", rule.description, 1);
}

void NinjaWriter::build(const BuildEdge &edge) {
    std::string text = "build";
    for (const auto &output : edge.outputs) {
        text += ' ';
        text += escape_path(output);
    }
    text += ": ";
    text += edge.rule;
    for (const auto &input : edge.inputs) {
        text += ' ';
        text += escape_path(input);
    }
    line(text);
    for (const auto &[key, value] : edge.variables) {
        variable(key, value, 1);
    }
}

void write_graph(NinjaWriter &writer, const BuildGraph &graph) {
    writer.comment("Generated by accrete run-build. Do not edit.");
    writer.newline();
    for (const auto &rule : graph.rules()) {
        writer.rule(rule);
        writer.newline();
    }
    for (const auto &edge : graph.edges()) {
        writer.build(edge);
    }
}

Result<void> write_build_file(const BuildGraph &graph, const std::filesystem::path &path) {
    std::ostringstream buffer;
    NinjaWriter writer(buffer);
    write_graph(writer, graph);
    return write_atomically(path, buffer.str());
}

} // namespace accrete
