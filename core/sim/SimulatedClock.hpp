#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <cstdint>

namespace sailtrack::sim {

// Manually driven clock; time only moves when advance() or setEpochMillis() is called.
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(int64_t startEpochMillis = 0);
    ~SimulatedClock() override = default;

    // IClock interface
    std::chrono::system_clock::time_point now() const override;
    int64_t epochMillis() const override;

    // Simulation controls
    void advance(std::chrono::milliseconds duration);
    void setEpochMillis(int64_t epochMillis);

private:
    int64_t epochMillis_;
};

} // namespace sailtrack::sim
