#include "Mark.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace sailtrack::course {

namespace {

// "Start_Line", "start line" and "START-LINE" all become "start-line".
std::string normalizeKey(const std::string& str) {
    std::string key;
    for (char c : str) {
        if (c == '_' || c == ' ') {
            key.push_back('-');
        } else {
            key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    auto begin = key.find_first_not_of('-');
    if (begin == std::string::npos) {
        return "";
    }
    auto end = key.find_last_not_of('-');
    return key.substr(begin, end - begin + 1);
}

} // namespace

Mark Mark::fromText(const std::string& id, const std::string& name, double lat, double lng,
                    const std::string& typeText, const std::string& roundingText,
                    std::optional<int> order) {
    Mark mark;
    mark.id = id;
    mark.name = name;
    mark.lat = lat;
    mark.lng = lng;
    mark.order = order;

    mark.type = stringToMarkType(typeText);
    if (!mark.type) {
        mark.rawType = typeText;
    }
    mark.rounding = stringToRounding(roundingText);
    if (!mark.rounding) {
        mark.rawRounding = roundingText;
    }
    return mark;
}

std::string markTypeToString(MarkType type) {
    static const std::unordered_map<MarkType, std::string> typeMap = {
        {MarkType::StartLine, "start-line"},
        {MarkType::FinishLine, "finish-line"},
        {MarkType::StartFinish, "start-finish"},
        {MarkType::Mark, "mark"},
        {MarkType::Gate, "gate"},
        {MarkType::Offset, "offset"},
        {MarkType::CommitteeBoat, "committee-boat"},
        {MarkType::Pin, "pin"}
    };

    auto it = typeMap.find(type);
    return (it != typeMap.end()) ? it->second : "mark";
}

std::optional<MarkType> stringToMarkType(const std::string& str) {
    static const std::unordered_map<std::string, MarkType> stringMap = {
        {"start-line", MarkType::StartLine},
        {"start", MarkType::StartLine},
        {"finish-line", MarkType::FinishLine},
        {"finish", MarkType::FinishLine},
        {"start-finish", MarkType::StartFinish},
        {"mark", MarkType::Mark},
        {"gate", MarkType::Gate},
        {"offset", MarkType::Offset},
        {"committee-boat", MarkType::CommitteeBoat},
        {"committee", MarkType::CommitteeBoat},
        {"pin", MarkType::Pin}
    };

    auto it = stringMap.find(normalizeKey(str));
    if (it == stringMap.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string roundingToString(Rounding rounding) {
    switch (rounding) {
        case Rounding::Port: return "port";
        case Rounding::Starboard: return "starboard";
        case Rounding::Either: return "either";
    }
    return "port";
}

std::optional<Rounding> stringToRounding(const std::string& str) {
    static const std::unordered_map<std::string, Rounding> stringMap = {
        {"port", Rounding::Port},
        {"p", Rounding::Port},
        {"starboard", Rounding::Starboard},
        {"stbd", Rounding::Starboard},
        {"s", Rounding::Starboard},
        {"either", Rounding::Either}
    };

    auto it = stringMap.find(normalizeKey(str));
    if (it == stringMap.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string legTypeToString(LegType type) {
    switch (type) {
        case LegType::Upwind: return "upwind";
        case LegType::Downwind: return "downwind";
        case LegType::Reaching: return "reaching";
        case LegType::Run: return "run";
    }
    return "reaching";
}

std::string courseTypeToString(CourseType type) {
    switch (type) {
        case CourseType::WindwardLeeward: return "windward-leeward";
        case CourseType::Triangle: return "triangle";
        case CourseType::Trapezoid: return "trapezoid";
        case CourseType::Olympic: return "olympic";
        case CourseType::Custom: return "custom";
    }
    return "custom";
}

std::optional<CourseType> stringToCourseType(const std::string& str) {
    static const std::unordered_map<std::string, CourseType> stringMap = {
        {"windward-leeward", CourseType::WindwardLeeward},
        {"triangle", CourseType::Triangle},
        {"trapezoid", CourseType::Trapezoid},
        {"olympic", CourseType::Olympic},
        {"custom", CourseType::Custom}
    };

    auto it = stringMap.find(normalizeKey(str));
    if (it == stringMap.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace sailtrack::course
