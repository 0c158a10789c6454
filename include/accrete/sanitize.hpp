#pragma once

#include <string>
#include <string_view>

namespace accrete {

/**
 * @brief Derives a rule name from a command string.
 *
 * Keeps ASCII letters, digits and underscores in their original order and drops
 * every other character. Different commands can map to the same name; the
 * graph builder is responsible for catching that. The result may be empty.
 */
std::string to_rule_name(std::string_view command);

/** @brief True if `name` is non-empty and only holds `[A-Za-z0-9_]`. */
bool is_valid_rule_name(std::string_view name);

} // namespace accrete
