/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the sailtrack CLI
 *
 * Simple line-based reader for the subset of TOML the engine needs:
 * section headers, `key = value` pairs, quoted strings and `#` comments.
 *
 * Supported Sections:
 * - [track]: simplification, maneuver detection and session splitting
 * - [course]: course geometry output
 * - [validation]: course validation thresholds
 * - [live]: broker connection and session for the live position feed
 *
 * @note A missing file yields defaults; a malformed value throws
 */

#pragma once

#include "domain/LiveTrackingAdapter.hpp"
#include "domain/TrackAnalyzer.hpp"
#include "course/CourseValidator.hpp"
#include "parsers/TextUtil.hpp"
#include "Geo.hpp"
#include "Track.hpp"
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <istream>
#include <stdexcept>
#include <string>

namespace sailtrack {

struct TrackSettings {
    double simplifyToleranceMeters = 5.0;
    double maneuverThresholdDeg = domain::TrackAnalyzer::DEFAULT_MANEUVER_THRESHOLD_DEG;
    int64_t sessionGapSeconds = 600;
    DistanceUnit distanceUnit = DistanceUnit::NauticalMiles;
};

struct CourseSettings {
    double boundsPaddingDeg = Geo::DEFAULT_BOUNDS_PADDING_DEG;
    bool includeCourseLine = true;
};

struct ValidationSettings {
    bool strict = false;
    course::ValidationConfig thresholds;
};

struct EngineConfig {
    TrackSettings track;
    CourseSettings course;
    ValidationSettings validation;
    domain::LiveFeedConfig live;

    bool hasLiveConfig() const {
        return !live.credentials.host.empty() && !live.sessionId.empty();
    }
};

class TomlConfig {
public:
    /**
     * @brief Load and parse TOML configuration file
     * @param filename Path to TOML configuration file
     * @return Engine configuration; defaults when the file cannot be opened
     * @throws std::runtime_error on a malformed value
     */
    static EngineConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "[Config] Warning: could not open config file " << filename
                      << ", using defaults" << std::endl;
            return EngineConfig{};
        }
        return loadFromStream(file, filename);
    }

    static EngineConfig loadFromStream(std::istream& in, const std::string& sourceName = "<config>") {
        EngineConfig config;
        std::string currentSection;
        std::string line;
        int lineNumber = 0;

        while (std::getline(in, line)) {
            ++lineNumber;
            line = stripComment(line);
            line = parsers::trim(line);
            if (line.empty()) {
                continue;
            }

            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = parsers::trim(line.substr(1, line.length() - 2));
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                std::cerr << "[Config] " << sourceName << ":" << lineNumber
                          << ": ignoring line without '='" << std::endl;
                continue;
            }

            const std::string key = parsers::trim(line.substr(0, equalPos));
            const std::string value = parsers::unquote(parsers::trim(line.substr(equalPos + 1)));
            const std::string where = sourceName + ":" + std::to_string(lineNumber) + ": " + key;

            if (currentSection == "track") {
                applyTrack(config.track, key, value, where);
            } else if (currentSection == "course") {
                applyCourse(config.course, key, value, where);
            } else if (currentSection == "validation") {
                applyValidation(config.validation, key, value, where);
            } else if (currentSection == "live") {
                applyLive(config.live, key, value, where);
            }
        }

        return config;
    }

    /// SAILTRACK_LIVE_HOST and SAILTRACK_SESSION take precedence over the file.
    static void applyEnvironment(EngineConfig& config) {
        std::string host = safeGetEnv("SAILTRACK_LIVE_HOST");
        std::string session = safeGetEnv("SAILTRACK_SESSION");
        if (!host.empty()) {
            config.live.credentials.host = host;
        }
        if (!session.empty()) {
            config.live.sessionId = session;
        }
    }

    /// @throws std::runtime_error unless text is a finite number
    static double parseNumber(const std::string& text, const std::string& where) {
        auto value = parsers::parseDouble(text);
        if (!value) {
            throw std::runtime_error(where + ": expected a number, got '" + text + "'");
        }
        return *value;
    }

    /// @throws std::runtime_error unless text is a whole number in [minValue, maxValue]
    static int64_t parseInteger(const std::string& text, const std::string& where,
                                int64_t minValue, int64_t maxValue) {
        double value = parseNumber(text, where);
        if (value < static_cast<double>(minValue) || value > static_cast<double>(maxValue) ||
            value != std::floor(value)) {
            throw std::runtime_error(where + ": expected an integer in [" + std::to_string(minValue) +
                                     ", " + std::to_string(maxValue) + "], got '" + text + "'");
        }
        return static_cast<int64_t>(value);
    }

    /// @throws std::runtime_error unless text is true/false/1/0
    static bool parseBool(const std::string& text, const std::string& where) {
        const std::string value = parsers::toLower(text);
        if (value == "true" || value == "1") {
            return true;
        }
        if (value == "false" || value == "0") {
            return false;
        }
        throw std::runtime_error(where + ": expected true or false, got '" + text + "'");
    }

private:
    static void applyTrack(TrackSettings& track, const std::string& key, const std::string& value,
                           const std::string& where) {
        if (key == "simplify_tolerance_m") {
            track.simplifyToleranceMeters = parseNumber(value, where);
        } else if (key == "maneuver_threshold_deg") {
            track.maneuverThresholdDeg = parseNumber(value, where);
        } else if (key == "session_gap_seconds") {
            track.sessionGapSeconds = parseInteger(value, where, 1, 7 * 24 * 3600);
        } else if (key == "distance_unit") {
            const std::string unit = parsers::toLower(value);
            if (unit != "nm" && unit != "nmi" && unit != "km" && unit != "m") {
                throw std::runtime_error(where + ": expected nm, km or m, got '" + value + "'");
            }
            track.distanceUnit = stringToDistanceUnit(unit);
        } else {
            warnUnknownKey(where);
        }
    }

    static void applyCourse(CourseSettings& course, const std::string& key, const std::string& value,
                            const std::string& where) {
        if (key == "bounds_padding_deg") {
            course.boundsPaddingDeg = parseNumber(value, where);
        } else if (key == "include_course_line") {
            course.includeCourseLine = parseBool(value, where);
        } else {
            warnUnknownKey(where);
        }
    }

    static void applyValidation(ValidationSettings& validation, const std::string& key,
                                const std::string& value, const std::string& where) {
        if (key == "strict") {
            validation.strict = parseBool(value, where);
        } else if (key == "near_duplicate_m") {
            validation.thresholds.nearDuplicateMeters = parseNumber(value, where);
        } else if (key == "min_extent_m") {
            validation.thresholds.minExtentMeters = parseNumber(value, where);
        } else if (key == "max_extent_m") {
            validation.thresholds.maxExtentMeters = parseNumber(value, where);
        } else if (key == "max_decimal_places") {
            validation.thresholds.maxDecimalPlaces = static_cast<int>(parseInteger(value, where, 0, 15));
        } else {
            warnUnknownKey(where);
        }
    }

    static void applyLive(domain::LiveFeedConfig& live, const std::string& key, const std::string& value,
                          const std::string& where) {
        if (key == "host") {
            live.credentials.host = value;
        } else if (key == "port") {
            live.credentials.port = static_cast<int>(parseInteger(value, where, 1, 65535));
        } else if (key == "client_id") {
            live.credentials.clientId = value;
        } else if (key == "username") {
            live.credentials.username = value;
        } else if (key == "password") {
            live.credentials.password = value;
        } else if (key == "use_tls") {
            live.credentials.useTls = parseBool(value, where);
        } else if (key == "session_id") {
            live.sessionId = value;
        } else if (key == "topic_prefix") {
            live.topicPrefix = value;
        } else if (key == "channel_capacity") {
            live.channelCapacity = static_cast<std::size_t>(parseInteger(value, where, 1, 1000000));
        } else {
            warnUnknownKey(where);
        }
    }

    static void warnUnknownKey(const std::string& where) {
        std::cerr << "[Config] Warning: unknown key " << where << std::endl;
    }

    // A '#' inside a quoted value is data.
    static std::string stripComment(const std::string& line) {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                return line.substr(0, i);
            }
        }
        return line;
    }

    static std::string safeGetEnv(const char* name) {
#ifdef _WIN32
        char* buffer = nullptr;
        size_t size = 0;
        if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
            std::string result(buffer);
            free(buffer);
            return result;
        }
        return "";
#else
        const char* value = std::getenv(name);
        return value ? std::string(value) : "";
#endif
    }
};

} // namespace sailtrack
