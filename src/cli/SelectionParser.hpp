#pragma once

/**
 * SelectionParser.hpp
 * 
 * Parsing of interactive answers: archive selections and yes/no prompts.
 */

#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace takeout::cli {

/**
 * Parse "all" or a comma-separated list of 1-based indices
 * @param input Raw user input, e.g. "1, 3,4"
 * @param count Number of listed archives
 * @return 0-based indices in input order without repeats, or nullopt if invalid
 */
std::optional<std::vector<size_t>> parseSelection(const std::string& input, size_t count);

/**
 * Interpret an answer to a [Y/n] prompt; empty means yes
 */
bool parseConfirmation(const std::string& input);

} // namespace takeout::cli
