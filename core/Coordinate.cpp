#include "Coordinate.hpp"
#include "Track.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <vector>

namespace sailtrack {

namespace {

const std::string kDegreeSign = "\xC2\xB0";          // °
const std::string kOrdinalSign = "\xC2\xBA";         // º, often typed for °
const std::string kPrime = "\xE2\x80\xB2";           // ′
const std::string kDoublePrime = "\xE2\x80\xB3";     // ″
const std::string kRightSingleQuote = "\xE2\x80\x99";
const std::string kRightDoubleQuote = "\xE2\x80\x9D";

enum class TokenKind {
    Number,
    DegreeMark,
    MinuteMark,
    SecondMark,
    Hemisphere
};

struct Token {
    TokenKind kind;
    double value = 0.0;
    bool negative = false;
    char hemisphere = 0;
};

struct Component {
    std::vector<double> numbers;
    bool negative = false;
    char hemisphere = 0;
    bool degreeMark = false;
    bool minuteMark = false;
    bool secondMark = false;

    bool isLatitudeHemisphere() const { return hemisphere == 'N' || hemisphere == 'S'; }
    bool isLongitudeHemisphere() const { return hemisphere == 'E' || hemisphere == 'W'; }

    CoordinateFormat format() const {
        if (degreeMark && secondMark) {
            return CoordinateFormat::DegreesMinutesSeconds;
        }
        if (degreeMark || minuteMark) {
            return CoordinateFormat::DegreesDecimalMinutes;
        }
        if (numbers.size() == 2 && hemisphere != 0) {
            return CoordinateFormat::DegreesDecimalMinutes;
        }
        return CoordinateFormat::Decimal;
    }

    double value(const std::string& source) const {
        auto fmt = format();
        std::size_t expectedMin = 1;
        std::size_t expectedMax = 1;
        if (fmt == CoordinateFormat::DegreesDecimalMinutes) {
            expectedMax = 2;
        } else if (fmt == CoordinateFormat::DegreesMinutesSeconds) {
            expectedMin = 3;
            expectedMax = 3;
        }

        if (numbers.size() < expectedMin || numbers.size() > expectedMax) {
            throw CoordinateParseError("Cannot parse " + coordinateFormatToString(fmt) +
                                       " coordinate: \"" + source + "\"");
        }
        if (negative && hemisphere != 0) {
            throw CoordinateParseError("Conflicting sign and hemisphere in \"" + source + "\"");
        }

        double degrees = numbers[0];
        if (numbers.size() > 1) {
            double minutes = numbers[1];
            if (minutes >= 60.0) {
                throw CoordinateParseError("Minutes out of range in \"" + source + "\"");
            }
            if (fmt == CoordinateFormat::DegreesMinutesSeconds && degrees != std::floor(degrees)) {
                throw CoordinateParseError("Fractional degrees in DMS value \"" + source + "\"");
            }
            degrees += minutes / 60.0;
        }
        if (numbers.size() > 2) {
            double seconds = numbers[2];
            if (seconds >= 60.0 || numbers[1] != std::floor(numbers[1])) {
                throw CoordinateParseError("Minutes/seconds out of range in \"" + source + "\"");
            }
            degrees += seconds / 3600.0;
        }

        bool flip = negative || hemisphere == 'S' || hemisphere == 'W';
        return flip ? -degrees : degrees;
    }
};

bool matchesAt(const std::string& text, std::size_t pos, const std::string& glyph) {
    return text.compare(pos, glyph.size(), glyph) == 0;
}

bool isHemisphereLetter(char c) {
    char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return upper == 'N' || upper == 'S' || upper == 'E' || upper == 'W';
}

std::vector<Token> tokenize(const std::string& text) {
    std::vector<Token> tokens;
    std::size_t i = 0;

    while (i < text.size()) {
        char c = text[i];
        auto next = [&](std::size_t offset) -> char {
            return i + offset < text.size() ? text[i + offset] : '\0';
        };

        if (std::isspace(static_cast<unsigned char>(c)) || c == ',' || c == ';') {
            ++i;
        } else if (matchesAt(text, i, kDegreeSign) || matchesAt(text, i, kOrdinalSign)) {
            tokens.push_back({TokenKind::DegreeMark});
            i += kDegreeSign.size();
        } else if (matchesAt(text, i, kDoublePrime) || matchesAt(text, i, kRightDoubleQuote)) {
            tokens.push_back({TokenKind::SecondMark});
            i += kDoublePrime.size();
        } else if (matchesAt(text, i, kPrime) || matchesAt(text, i, kRightSingleQuote)) {
            tokens.push_back({TokenKind::MinuteMark});
            i += kPrime.size();
        } else if (c == '"') {
            tokens.push_back({TokenKind::SecondMark});
            ++i;
        } else if (c == '\'') {
            if (next(1) == '\'') {
                tokens.push_back({TokenKind::SecondMark});
                i += 2;
            } else {
                tokens.push_back({TokenKind::MinuteMark});
                ++i;
            }
        } else if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' ||
                   ((c == '-' || c == '+') &&
                    (std::isdigit(static_cast<unsigned char>(next(1))) || next(1) == '.'))) {
            Token token{TokenKind::Number};
            if (c == '-' || c == '+') {
                token.negative = (c == '-');
                ++i;
            }
            std::size_t start = i;
            bool seenDot = false;
            while (i < text.size()) {
                char d = text[i];
                if (std::isdigit(static_cast<unsigned char>(d))) {
                    ++i;
                } else if (d == '.' && !seenDot) {
                    seenDot = true;
                    ++i;
                } else {
                    break;
                }
            }
            std::string digits = text.substr(start, i - start);
            if (digits == ".") {
                throw CoordinateParseError("Malformed number in \"" + text + "\"");
            }
            // Overflow is ERANGE with HUGE_VAL; an underflowing fraction rounds to zero
            errno = 0;
            token.value = std::strtod(digits.c_str(), nullptr);
            if (errno == ERANGE && !std::isfinite(token.value)) {
                throw CoordinateParseError("Number out of range in \"" + text + "\"");
            }
            tokens.push_back(token);
        } else if (isHemisphereLetter(c)) {
            Token token{TokenKind::Hemisphere};
            token.hemisphere = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            tokens.push_back(token);
            ++i;
        } else {
            throw CoordinateParseError("Unexpected character '" + std::string(1, c) +
                                       "' in coordinate \"" + text + "\"");
        }
    }

    return tokens;
}

void applyToken(Component& component, const Token& token, const std::string& source) {
    switch (token.kind) {
        case TokenKind::Number:
            if (token.negative) {
                if (!component.numbers.empty()) {
                    throw CoordinateParseError("Unexpected sign in \"" + source + "\"");
                }
                component.negative = true;
            }
            component.numbers.push_back(token.value);
            break;
        case TokenKind::DegreeMark:
            component.degreeMark = true;
            break;
        case TokenKind::MinuteMark:
            component.minuteMark = true;
            break;
        case TokenKind::SecondMark:
            component.secondMark = true;
            break;
        case TokenKind::Hemisphere:
            if (component.hemisphere != 0) {
                throw CoordinateParseError("Multiple hemisphere letters in \"" + source + "\"");
            }
            component.hemisphere = token.hemisphere;
            break;
    }
}

Component singleComponent(const std::string& text) {
    Component component;
    for (const auto& token : tokenize(text)) {
        applyToken(component, token, text);
    }
    if (component.numbers.empty()) {
        throw CoordinateParseError("No numeric value in \"" + text + "\"");
    }
    return component;
}

// Splits a comma-free pair such as "22°16'45.6\"N 114°09'46.08\"E" or
// "22.5 114.2" into its two components. With pairContext set, two bare
// numbers and a single hemisphere letter ("22.5 114.2W") are read as a
// decimal pair rather than one "deg min.dec" value.
std::vector<Component> groupComponents(const std::vector<Token>& tokens, const std::string& source,
                                       bool pairContext = true) {
    bool anyMarks = false;
    int numberCount = 0;
    int hemisphereCount = 0;
    for (const auto& token : tokens) {
        if (token.kind == TokenKind::Hemisphere) ++hemisphereCount;
        if (token.kind == TokenKind::Number) ++numberCount;
        if (token.kind == TokenKind::DegreeMark || token.kind == TokenKind::MinuteMark ||
            token.kind == TokenKind::SecondMark) anyMarks = true;
    }
    bool anyHemisphere = hemisphereCount > 0;
    bool decimalPair = pairContext && !anyMarks && numberCount == 2 && hemisphereCount == 1;
    bool prefixStyle = !tokens.empty() && tokens.front().kind == TokenKind::Hemisphere;

    std::vector<Component> components;
    Component current;
    bool open = false;
    auto flush = [&]() {
        if (open) {
            components.push_back(current);
            current = Component{};
            open = false;
        }
    };

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        bool nextIsDegree = i + 1 < tokens.size() && tokens[i + 1].kind == TokenKind::DegreeMark;

        if (token.kind == TokenKind::Hemisphere) {
            if (prefixStyle) {
                flush();
                applyToken(current, token, source);
                open = true;
            } else {
                if (!open) {
                    throw CoordinateParseError("Hemisphere letter without value in \"" + source + "\"");
                }
                applyToken(current, token, source);
                flush();
            }
            continue;
        }

        if (token.kind == TokenKind::Number && (!anyHemisphere || decimalPair)) {
            if (!current.numbers.empty() && (!anyMarks || nextIsDegree)) {
                flush();
            }
        }

        applyToken(current, token, source);
        open = true;
    }
    flush();

    return components;
}

std::string hemisphereFor(double value, bool isLatitude) {
    if (isLatitude) {
        return value < 0.0 ? "S" : "N";
    }
    return value < 0.0 ? "W" : "E";
}

double roundTo(double value, int precision) {
    double scale = std::pow(10.0, precision);
    return std::round(value * scale) / scale;
}

} // namespace

std::string coordinateFormatToString(CoordinateFormat format) {
    switch (format) {
        case CoordinateFormat::Decimal: return "decimal";
        case CoordinateFormat::DegreesDecimalMinutes: return "DDM";
        case CoordinateFormat::DegreesMinutesSeconds: return "DMS";
    }
    return "decimal";
}

CoordinateFormat Coordinate::detectFormat(const std::string& text) {
    std::vector<Token> tokens;
    try {
        tokens = tokenize(text);
    } catch (const CoordinateParseError&) {
        return CoordinateFormat::Decimal;
    }

    bool degree = false;
    bool minute = false;
    bool second = false;
    int numbers = 0;
    bool hemisphere = false;
    for (const auto& token : tokens) {
        switch (token.kind) {
            case TokenKind::DegreeMark: degree = true; break;
            case TokenKind::MinuteMark: minute = true; break;
            case TokenKind::SecondMark: second = true; break;
            case TokenKind::Number: ++numbers; break;
            case TokenKind::Hemisphere: hemisphere = true; break;
        }
    }

    if (degree && second) {
        return CoordinateFormat::DegreesMinutesSeconds;
    }
    if (degree || minute) {
        return CoordinateFormat::DegreesDecimalMinutes;
    }
    if (!hemisphere || numbers < 2) {
        return CoordinateFormat::Decimal;
    }

    // Unmarked "deg min.dec hemisphere", alone or repeated for a pair
    std::vector<Component> components;
    try {
        components = groupComponents(tokens, text, false);
    } catch (const CoordinateParseError&) {
        return CoordinateFormat::Decimal;
    }
    bool allDegMin = !components.empty() &&
        std::all_of(components.begin(), components.end(), [](const Component& c) {
            return c.numbers.size() == 2 && c.hemisphere != 0 &&
                   c.numbers[0] == std::floor(c.numbers[0]) && c.numbers[1] < 60.0;
        });
    return allDegMin ? CoordinateFormat::DegreesDecimalMinutes : CoordinateFormat::Decimal;
}

double Coordinate::toDecimal(const std::string& text) {
    return singleComponent(text).value(text);
}

CoordinatePair Coordinate::parsePair(const std::string& text) {
    std::vector<Component> components;
    std::vector<std::string> sources;

    if (text.find(',') != std::string::npos) {
        std::stringstream ss(text);
        std::string part;
        while (std::getline(ss, part, ',')) {
            if (part.find_first_not_of(" \t") == std::string::npos) {
                continue;
            }
            components.push_back(singleComponent(part));
            sources.push_back(part);
        }
    } else {
        components = groupComponents(tokenize(text), text);
        sources.assign(components.size(), text);
    }

    if (components.size() != 2) {
        throw CoordinateParseError("Expected a latitude/longitude pair in \"" + text + "\"");
    }

    CoordinatePair pair;
    pair.format = components[0].format();

    const Component* latComponent = &components[0];
    const Component* lngComponent = &components[1];
    const std::string* latSource = &sources[0];
    const std::string* lngSource = &sources[1];
    if (components[0].isLongitudeHemisphere() && components[1].isLatitudeHemisphere()) {
        std::swap(latComponent, lngComponent);
        std::swap(latSource, lngSource);
    } else if ((components[0].isLatitudeHemisphere() && components[1].isLatitudeHemisphere()) ||
               (components[0].isLongitudeHemisphere() && components[1].isLongitudeHemisphere())) {
        throw CoordinateParseError("Both components name the same axis in \"" + text + "\"");
    }

    pair.lat = latComponent->value(*latSource);
    pair.lng = lngComponent->value(*lngSource);
    validateRange(pair.lat, pair.lng);
    return pair;
}

void Coordinate::validateRange(double lat, double lng) {
    if (!isValidLatitude(lat)) {
        throw CoordinateRangeError("Latitude " + std::to_string(lat) + " outside [-90, 90]");
    }
    if (!isValidLongitude(lng)) {
        throw CoordinateRangeError("Longitude " + std::to_string(lng) + " outside [-180, 180]");
    }
}

std::string Coordinate::formatSingle(double value, bool isLatitude, CoordinateFormat target, int precision) {
    if (isLatitude ? !isValidLatitude(value) : !isValidLongitude(value)) {
        throw CoordinateRangeError(std::string(isLatitude ? "Latitude " : "Longitude ") +
                                   std::to_string(value) + " out of range");
    }
    precision = std::max(0, precision);

    std::ostringstream ss;
    ss << std::fixed;

    if (target == CoordinateFormat::Decimal) {
        ss << std::setprecision(precision) << value;
        return ss.str();
    }

    double magnitude = std::abs(value);
    int degrees = static_cast<int>(std::floor(magnitude));
    double minutes = (magnitude - degrees) * 60.0;
    int degreeWidth = isLatitude ? 2 : 3;
    int fieldWidth = precision > 0 ? precision + 3 : 2;

    if (target == CoordinateFormat::DegreesDecimalMinutes) {
        minutes = roundTo(minutes, precision);
        if (minutes >= 60.0) {
            minutes -= 60.0;
            ++degrees;
        }
        ss << std::setfill('0') << std::setw(degreeWidth) << degrees << kDegreeSign << ' '
           << std::setw(fieldWidth) << std::setprecision(precision) << minutes << "' "
           << hemisphereFor(value, isLatitude);
        return ss.str();
    }

    int wholeMinutes = static_cast<int>(std::floor(minutes));
    double seconds = roundTo((minutes - wholeMinutes) * 60.0, precision);
    if (seconds >= 60.0) {
        seconds -= 60.0;
        ++wholeMinutes;
    }
    if (wholeMinutes >= 60) {
        wholeMinutes -= 60;
        ++degrees;
    }
    ss << std::setfill('0') << std::setw(degreeWidth) << degrees << kDegreeSign << ' '
       << std::setw(2) << wholeMinutes << "' "
       << std::setw(fieldWidth) << std::setprecision(precision) << seconds << "\" "
       << hemisphereFor(value, isLatitude);
    return ss.str();
}

std::string Coordinate::format(double lat, double lng, CoordinateFormat target, int precision) {
    validateRange(lat, lng);
    return formatSingle(lat, true, target, precision) + ", " +
           formatSingle(lng, false, target, precision);
}

} // namespace sailtrack
