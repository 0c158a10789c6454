#pragma once

#include "accrete/domain.hpp"
#include "accrete/graph.hpp"
#include "accrete/utility.hpp"

#include <vector>

namespace accrete {

/**
 * @brief Compiles the whole registry into a build graph.
 *
 * All or nothing: the first invalid record, rule name collision, duplicate
 * producer or dependency cycle aborts compilation and no graph is returned.
 * Compiling the same records again yields an identical graph.
 */
Result<BuildGraph> compile(const std::vector<JobRecord> &jobs);

} // namespace accrete
