#include "SimulatedClock.hpp"

namespace sailtrack::sim {

SimulatedClock::SimulatedClock(int64_t startEpochMillis) : epochMillis_(startEpochMillis) {
}

std::chrono::system_clock::time_point SimulatedClock::now() const {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(epochMillis_));
}

int64_t SimulatedClock::epochMillis() const {
    return epochMillis_;
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    epochMillis_ += duration.count();
}

void SimulatedClock::setEpochMillis(int64_t epochMillis) {
    epochMillis_ = epochMillis;
}

} // namespace sailtrack::sim
