#ifndef COLLECT_AUCTION_CLOCKS_HPP
#define COLLECT_AUCTION_CLOCKS_HPP

#include "Collaborators.hpp"

namespace auction {

    /** Segundos desde epoch del reloj del sistema */
    class SystemClock : public Clock {
        public:
            Timestamp now() const override;
    };

    /** Reloj controlado a mano (scripts y tests) */
    class ManualClock : public Clock {
        public:
            explicit ManualClock(Timestamp start = 1);

            Timestamp now() const override { return current; }

            void set(Timestamp timestamp);
            void advance(uint64_t seconds);

        private:
            Timestamp current;
    };

} // namespace auction

#endif // COLLECT_AUCTION_CLOCKS_HPP
