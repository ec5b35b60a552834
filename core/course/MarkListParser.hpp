#pragma once

#include "Mark.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sailtrack::course {

struct MarkListResult {
    bool success = false;
    std::vector<Mark> marks;
    std::vector<std::string> errors;
};

/**
 * @brief Reads a course mark table
 *
 * Header line with name, lat and lng required; id, type, rounding and order
 * optional. Coordinates may use any notation Coordinate::toDecimal accepts.
 * Unknown type and rounding text is kept on the mark for validation to report.
 */
class MarkListParser {
public:
    MarkListResult parse(const std::string& text, const std::string& sourceName) const;
    MarkListResult parseFile(const std::string& path) const;
};

} // namespace sailtrack::course
