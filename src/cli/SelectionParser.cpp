/**
 * SelectionParser.cpp
 */

#include "SelectionParser.hpp"
#include "../utils/StringUtils.hpp"

#include <algorithm>

namespace takeout::cli {

using utils::StringUtils;

std::optional<std::vector<size_t>> parseSelection(const std::string& input, size_t count) {
    std::string trimmed = StringUtils::toLower(StringUtils::trim(input));
    if (trimmed.empty() || count == 0) {
        return std::nullopt;
    }
    
    std::vector<size_t> indices;
    if (trimmed == "all") {
        for (size_t i = 0; i < count; ++i) {
            indices.push_back(i);
        }
        return indices;
    }
    
    for (const auto& part : StringUtils::split(trimmed, ',')) {
        if (StringUtils::trim(part).empty()) {
            continue;
        }
        auto number = StringUtils::parseInt(part);
        if (!number || *number < 1 || static_cast<size_t>(*number) > count) {
            return std::nullopt;
        }
        
        size_t index = static_cast<size_t>(*number - 1);
        if (std::find(indices.begin(), indices.end(), index) == indices.end()) {
            indices.push_back(index);
        }
    }
    
    if (indices.empty()) {
        return std::nullopt;
    }
    return indices;
}

bool parseConfirmation(const std::string& input) {
    std::string answer = StringUtils::toLower(StringUtils::trim(input));
    return answer.empty() || answer == "y" || answer == "yes";
}

} // namespace takeout::cli
