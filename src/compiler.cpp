#include "accrete/compiler.hpp"

#include "accrete/builder.hpp"

namespace accrete {

Result<BuildGraph> compile(const std::vector<JobRecord> &jobs) {
    GraphBuilder builder;
    for (size_t i = 0; i < jobs.size(); ++i) {
        if (auto res = builder.add_job(jobs[i], i); !res)
            return std::unexpected(res.error());
    }

    if (auto res = builder.graph().check_acyclic(); !res)
        return std::unexpected(res.error());

    return builder.emit_graph();
}

} // namespace accrete
