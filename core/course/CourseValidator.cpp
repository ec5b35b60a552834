#include "CourseValidator.hpp"
#include "../Geo.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

namespace sailtrack::course {

namespace {

std::string uppercase(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

std::string lowercase(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string labelFor(const Mark& mark, std::size_t index) {
    return mark.name.empty() ? "Mark #" + std::to_string(index + 1) : mark.name;
}

bool hasValidPosition(const Mark& mark) {
    return isValidLatitude(mark.lat) && isValidLongitude(mark.lng);
}

} // namespace

void ValidationResult::addError(const std::string& message) {
    errors.push_back(message);
    valid = false;
}

void ValidationResult::addWarning(const std::string& message) {
    warnings.push_back(message);
}

void ValidationResult::merge(const ValidationResult& other, const std::string& prefix) {
    for (const auto& error : other.errors) {
        addError(prefix + error);
    }
    for (const auto& warning : other.warnings) {
        addWarning(prefix + warning);
    }
}

void ValidationResult::promoteWarnings() {
    for (const auto& warning : warnings) {
        addError(warning);
    }
    warnings.clear();
}

CourseValidator::CourseValidator(ValidationConfig config) : config_(std::move(config)) {
}

int CourseValidator::decimalPlaces(double value) {
    if (!std::isfinite(value)) {
        return 0;
    }
    // Binary noise past the 12th digit is not counted
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(12) << value;
    std::string text = ss.str();
    auto dot = text.find('.');
    if (dot == std::string::npos) {
        return 0;
    }
    auto last = text.find_last_not_of('0');
    if (last == std::string::npos || last <= dot) {
        return 0;
    }
    return static_cast<int>(last - dot);
}

MarkType CourseValidator::inferMarkType(const std::string& name) {
    const std::string lower = lowercase(name);
    const bool start = contains(lower, "start");
    const bool finish = contains(lower, "finish");
    if (start && finish) return MarkType::StartFinish;
    if (start) return MarkType::StartLine;
    if (finish) return MarkType::FinishLine;
    if (contains(lower, "committee") || contains(lower, "rc boat")) return MarkType::CommitteeBoat;
    if (contains(lower, "pin")) return MarkType::Pin;
    if (contains(lower, "gate")) return MarkType::Gate;
    if (contains(lower, "offset")) return MarkType::Offset;
    return MarkType::Mark;
}

ValidationResult CourseValidator::validateMark(const Mark& mark) const {
    ValidationResult result;

    if (mark.id.empty()) {
        result.addError("id is required");
    }
    if (mark.name.empty()) {
        result.addError("name is required");
    }

    if (!isValidLatitude(mark.lat)) {
        result.addError("latitude " + std::to_string(mark.lat) + " is outside [-90, 90]");
    }
    if (!isValidLongitude(mark.lng)) {
        result.addError("longitude " + std::to_string(mark.lng) + " is outside [-180, 180]");
    }

    if (decimalPlaces(mark.lat) > config_.maxDecimalPlaces ||
        decimalPlaces(mark.lng) > config_.maxDecimalPlaces) {
        result.addWarning("coordinates have more than " + std::to_string(config_.maxDecimalPlaces) +
                          " decimal places");
    }

    if (!mark.type && !mark.rawType.empty()) {
        result.addWarning("unknown mark type '" + mark.rawType + "'");
    }
    if (!mark.rounding && !mark.rawRounding.empty()) {
        result.addWarning("unknown rounding '" + mark.rawRounding + "'");
    }

    if (mark.lat == 0.0 && mark.lng == 0.0) {
        result.addWarning("coordinates are 0,0 (placeholder?)");
    }

    const std::string upperName = uppercase(mark.name);
    for (const auto& token : config_.placeholderTokens) {
        if (contains(upperName, uppercase(token))) {
            result.addWarning("name contains placeholder '" + token + "'");
            break;
        }
    }

    return result;
}

ValidationResult CourseValidator::validateMarks(const std::vector<Mark>& marks) const {
    ValidationResult result;

    if (marks.size() < 2) {
        result.addError("At least 2 marks are required, got " + std::to_string(marks.size()));
    }

    for (std::size_t i = 0; i < marks.size(); ++i) {
        result.merge(validateMark(marks[i]), labelFor(marks[i], i) + ": ");
    }

    std::set<std::string> seen;
    std::set<std::string> reported;
    for (const auto& mark : marks) {
        if (mark.name.empty()) {
            continue;
        }
        if (!seen.insert(mark.name).second && reported.insert(mark.name).second) {
            result.addWarning("Duplicate mark name '" + mark.name + "'");
        }
    }

    for (std::size_t i = 0; i < marks.size(); ++i) {
        for (std::size_t j = i + 1; j < marks.size(); ++j) {
            if (!hasValidPosition(marks[i]) || !hasValidPosition(marks[j])) {
                continue;
            }
            double meters = Geo::distanceMeters(marks[i].lat, marks[i].lng, marks[j].lat, marks[j].lng);
            if (meters < config_.nearDuplicateMeters) {
                std::ostringstream ss;
                ss << labelFor(marks[i], i) << " and " << labelFor(marks[j], j) << " are only "
                   << std::fixed << std::setprecision(1) << meters << " m apart";
                result.addWarning(ss.str());
            }
        }
    }

    const bool hasStart = std::any_of(marks.begin(), marks.end(), [](const Mark& m) {
        return m.type == MarkType::StartLine || m.type == MarkType::StartFinish;
    });
    const bool hasFinish = std::any_of(marks.begin(), marks.end(), [](const Mark& m) {
        return m.type == MarkType::FinishLine || m.type == MarkType::StartFinish;
    });
    if (!hasStart) {
        result.addWarning("No start line mark");
    }
    if (!hasFinish) {
        result.addWarning("No finish line mark");
    }

    std::vector<LatLng> positions;
    for (const auto& mark : marks) {
        if (hasValidPosition(mark)) {
            positions.push_back({mark.lat, mark.lng});
        }
    }
    if (positions.size() >= 2) {
        BoundingBox box = Geo::boundingBox(positions, 0.0);
        double diagonal = Geo::distanceMeters(box.south, box.west, box.north, box.east);
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(0) << diagonal;
        if (diagonal < config_.minExtentMeters) {
            result.addWarning("Course extent " + ss.str() + " m is unusually small");
        } else if (diagonal > config_.maxExtentMeters) {
            result.addWarning("Course extent " + ss.str() + " m is unusually large");
        }
    }

    return result;
}

ValidationResult CourseValidator::validateLegs(const std::vector<CourseLeg>& legs,
                                               const std::vector<Mark>& marks) const {
    ValidationResult result;

    std::set<std::string> names;
    for (const auto& mark : marks) {
        names.insert(mark.name);
    }

    for (std::size_t i = 0; i < legs.size(); ++i) {
        const CourseLeg& leg = legs[i];
        const std::string label = "Leg " + std::to_string(i + 1) + " (" + leg.from + " -> " + leg.to + "): ";

        if (names.find(leg.from) == names.end()) {
            result.addError(label + "unknown start mark '" + leg.from + "'");
        }
        if (names.find(leg.to) == names.end()) {
            result.addError(label + "unknown end mark '" + leg.to + "'");
        }
        if (!std::isfinite(leg.distance) || leg.distance <= 0.0) {
            result.addError(label + "distance must be positive");
        }
        if (!std::isfinite(leg.bearing) || leg.bearing < 0.0 || leg.bearing >= 360.0) {
            result.addError(label + "bearing must be within [0, 360)");
        }
    }

    return result;
}

ValidationResult CourseValidator::validateCourse(const std::vector<Mark>& marks,
                                                 const std::vector<CourseLeg>& legs,
                                                 bool strict) const {
    ValidationResult result = validateMarks(marks);
    result.merge(validateLegs(legs, marks));
    if (strict) {
        result.promoteWarnings();
    }
    return result;
}

AutoFixResult CourseValidator::autoFixMarks(const std::vector<Mark>& marks) const {
    AutoFixResult result;
    result.marks = marks;

    std::set<std::string> usedIds;
    for (const auto& mark : marks) {
        if (!mark.id.empty()) {
            usedIds.insert(mark.id);
        }
    }

    int nextId = 1;
    for (std::size_t i = 0; i < result.marks.size(); ++i) {
        Mark& mark = result.marks[i];
        const std::string label = labelFor(mark, i);

        if (mark.id.empty()) {
            std::string id;
            do {
                id = "mark-" + std::to_string(nextId++);
            } while (usedIds.count(id) > 0);
            usedIds.insert(id);
            mark.id = id;
            result.fixes.push_back(label + ": assigned id '" + id + "'");
        }

        if (!mark.type) {
            MarkType inferred = inferMarkType(mark.name);
            if (mark.rawType.empty()) {
                result.fixes.push_back(label + ": set missing type to '" + markTypeToString(inferred) + "'");
            } else {
                result.fixes.push_back(label + ": replaced unknown type '" + mark.rawType + "' with '" +
                                       markTypeToString(inferred) + "'");
            }
            mark.type = inferred;
            mark.rawType.clear();
        }

        if (!mark.rounding && mark.type == MarkType::Mark) {
            if (mark.rawRounding.empty()) {
                result.fixes.push_back(label + ": defaulted rounding to port");
            } else {
                result.fixes.push_back(label + ": replaced unknown rounding '" + mark.rawRounding +
                                       "' with port");
            }
            mark.rounding = Rounding::Port;
            mark.rawRounding.clear();
        }
    }

    return result;
}

} // namespace sailtrack::course
