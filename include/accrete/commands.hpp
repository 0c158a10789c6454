#pragma once

#include "accrete/cli.hpp"
#include "accrete/utility.hpp"

namespace accrete {

/**
 * @brief Appends the job described by `options` to the registry at
 *        `config.cache_path`.
 */
Result<void> add_job(const Config &config, const AddJobOptions &options);

/**
 * @brief Compiles the registry at `config.cache_path` and writes
 *        `config.build_file`.
 *
 * Nothing is written unless every record compiles.
 */
Result<void> run_build(const Config &config);

/** @brief Process exit status for an error: 2 for usage errors, 1 otherwise. */
int exit_code(const Error &err);

} // namespace accrete
