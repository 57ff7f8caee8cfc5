#include "Clocks.hpp"
#include <chrono>
#include <stdexcept>

namespace auction {

    Timestamp SystemClock::now() const {
        return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }

    ManualClock::ManualClock(Timestamp start) : current(start) {}

    void ManualClock::set(Timestamp timestamp) {
        // El tiempo no retrocede
        if (timestamp < current) {
            throw std::invalid_argument("Clock cannot move backwards to " + std::to_string(timestamp));
        }
        current = timestamp;
    }

    void ManualClock::advance(uint64_t seconds) {
        current += seconds;
    }

} // namespace auction
