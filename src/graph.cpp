#include "accrete/graph.hpp"

#include <algorithm>
#include <format>

namespace accrete {

Result<size_t> BuildGraph::add_rule(Rule rule) {
    if (auto it = rule_index_.find(rule.name); it != rule_index_.end()) {
        const Rule &existing = rules_[it->second];
        if (existing == rule) {
            return it->second;
        }
        return fail(ErrorKind::DuplicateRuleName,
                    std::format("Rule name '{}' derived from command '{}' is already used by command '{}'",
                                rule.name,
                                rule.command,
                                existing.command));
    }

    size_t id = rules_.size();
    rule_index_.emplace(rule.name, id);
    rules_.push_back(std::move(rule));
    return id;
}

Result<size_t> BuildGraph::add_edge(BuildEdge edge) {
    for (auto it = edge.outputs.begin(); it != edge.outputs.end(); ++it) {
        if (producer_.contains(*it) || std::find(edge.outputs.begin(), it, *it) != it) {
            return fail(ErrorKind::DuplicateOutput, std::format("Duplicate producer for output: {}", *it));
        }
    }

    size_t edge_id = edges_.size();
    for (const auto &output : edge.outputs) {
        producer_.emplace(output, edge_id);
    }
    edges_.push_back(std::move(edge));
    return edge_id;
}

Result<void> BuildGraph::check_acyclic() const {
    // Peel off edges whose inputs are all sources or already peeled outputs.
    // Whatever is left sits on a cycle or downstream of one.
    std::vector<size_t> waiting_on(edges_.size(), 0);
    std::vector<std::vector<size_t>> consumers(edges_.size());
    for (size_t id = 0; id < edges_.size(); ++id) {
        for (const auto &input : edges_[id].inputs) {
            if (auto it = producer_.find(input); it != producer_.end()) {
                consumers[it->second].push_back(id);
                ++waiting_on[id];
            }
        }
    }

    std::vector<size_t> ready;
    for (size_t id = 0; id < edges_.size(); ++id) {
        if (waiting_on[id] == 0)
            ready.push_back(id);
    }

    size_t peeled = 0;
    while (!ready.empty()) {
        size_t id = ready.back();
        ready.pop_back();
        ++peeled;
        for (size_t consumer : consumers[id]) {
            if (--waiting_on[consumer] == 0)
                ready.push_back(consumer);
        }
    }

    if (peeled == edges_.size())
        return {};

    // Every stuck edge has a stuck producer; edges_.size() steps back from one
    // end on the cycle.
    auto stuck = static_cast<size_t>(std::ranges::find_if(waiting_on, [](size_t n) { return n > 0; }) -
                                     waiting_on.begin());
    for (size_t step = 0; step < edges_.size(); ++step) {
        for (const auto &input : edges_[stuck].inputs) {
            if (auto it = producer_.find(input); it != producer_.end() && waiting_on[it->second] > 0) {
                stuck = it->second;
                break;
            }
        }
    }
    const BuildEdge &edge = edges_[stuck];
    return fail(ErrorKind::DependencyCycle,
                std::format("Dependency cycle: {} (rule {}) depends on its own outputs", edge.outputs.front(), edge.rule));
}

} // namespace accrete
