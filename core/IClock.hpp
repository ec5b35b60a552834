#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sailtrack {

class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual int64_t epochMillis() const = 0;
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }

    int64_t epochMillis() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now().time_since_epoch()).count();
    }
};

// "2024-03-09T14:30:15.250Z"
std::string formatIso8601(int64_t epochMillis);

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]"; a missing zone is UTC.
std::optional<int64_t> parseIso8601(const std::string& text);

} // namespace sailtrack
