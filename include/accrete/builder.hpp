#pragma once

#include "accrete/domain.hpp"
#include "accrete/graph.hpp"
#include "accrete/utility.hpp"

#include <string>

namespace accrete {

/**
 * @brief Turns job records into rule and edge declarations.
 *
 * Facade over `BuildGraph` that performs per-record validation. Records are
 * expected in registry order.
 */
class GraphBuilder {
public:
    /**
     * @brief Validates one record and adds its rule and build edge.
     * @param record The record as loaded from the registry.
     * @param index Position of the record in the registry, used in messages.
     * @return MissingField, EmptyIdentifier, DuplicateRuleName or
     *         DuplicateOutput on failure.
     */
    Result<void> add_job(const JobRecord &record, size_t index);

    const BuildGraph &graph() const {
        return graph_;
    }

    // Leaves the builder empty.
    BuildGraph &&emit_graph() {
        return std::move(graph_);
    }

private:
    BuildGraph graph_;
};

/** @brief Description used when a record has none. */
std::string default_description(std::string_view command);

/** @brief Edge variables carrying a record's executor metadata, in fixed order. */
Variables metadata_variables(const JobRecord &record);

} // namespace accrete
