#pragma once

#include "accrete/domain.hpp"
#include "accrete/utility.hpp"

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace accrete {

using json = nlohmann::ordered_json;

/**
 * @brief Serializes a record with keys in their canonical order.
 *
 * Optional fields that are absent (and `timeout_ok` when false) are omitted.
 */
json record_to_json(const JobRecord &record);

/**
 * @brief Compact one-line rendering of a record for messages.
 *
 * Bytes that are not valid UTF-8 are shown as U+FFFD instead of failing.
 */
std::string describe_record(const JobRecord &record);

/**
 * @brief Reads one registry entry.
 *
 * Missing keys stay empty in the returned record. A key that is present with
 * the wrong type is a MalformedCache error.
 *
 * @param entry The JSON value of the entry.
 * @param index Position of the entry in the `jobs` array, used in messages.
 */
Result<JobRecord> record_from_json(const json &entry, size_t index);

} // namespace accrete
