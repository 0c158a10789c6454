#pragma once

#include "accrete/domain.hpp"
#include "accrete/utility.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace accrete {

/**
 * @brief Compiled form of the registry: rule and build edge declarations.
 *
 * Rules and edges keep registry order. Every output path maps to the single
 * edge producing it.
 */
class BuildGraph {
public:
    /**
     * @brief Declares a rule.
     *
     * A rule identical to an already declared one with the same name is merged
     * into it. A different rule under an existing name is a DuplicateRuleName
     * error.
     *
     * @return Index of the (possibly pre-existing) rule.
     */
    Result<size_t> add_rule(Rule rule);

    /**
     * @brief Appends a build edge.
     * @return Its index, or DuplicateOutput if one of its outputs already has a
     *         producer.
     */
    Result<size_t> add_edge(BuildEdge edge);

    const std::vector<Rule> &rules() const {
        return rules_;
    }
    const std::vector<BuildEdge> &edges() const {
        return edges_;
    }

    // Fails with DependencyCycle if an edge needs, directly or through other
    // edges, one of its own outputs.
    Result<void> check_acyclic() const;

private:
    std::vector<Rule> rules_;
    std::vector<BuildEdge> edges_;
    std::unordered_map<std::string, size_t> rule_index_;
    std::unordered_map<std::string, size_t> producer_; ///< output path -> edge index
};

} // namespace accrete
