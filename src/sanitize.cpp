#include "accrete/sanitize.hpp"

#include <algorithm>
#include <iterator>

namespace accrete {

namespace {

// std::isalnum is locale dependent, rule names must not be.
constexpr bool is_rule_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

} // namespace

std::string to_rule_name(std::string_view command) {
    std::string name;
    name.reserve(command.size());
    std::ranges::copy_if(command, std::back_inserter(name), is_rule_char);
    return name;
}

bool is_valid_rule_name(std::string_view name) {
    return !name.empty() && std::ranges::all_of(name, is_rule_char);
}

} // namespace accrete
