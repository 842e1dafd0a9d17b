#ifndef ___COOKTIMER_TICK_GENERATOR_H___
#define ___COOKTIMER_TICK_GENERATOR_H___

#include <cstdint>

#include "cooktimer_setup.h"

namespace cooktimer
{
    /**
     * Derives a 1Hz square signal from the reference clock.
     * The signal flips every COOKTIMER_TICK_THRESHOLD+1 reference ticks, so a full
     * low->high->low period is one second. Consumers must act on rising edges, not on the level.
     */
    class TickGenerator
    {
    public:
        TickGenerator() : m_counter(0), m_level(false) {}

        uint32_t process(uint32_t ref_ticks);

        void reset()
        {
            m_counter = 0;
            m_level = false;
        }

        inline bool level() const { return m_level; }
        inline uint32_t counter() const { return m_counter; }

    protected:
        uint32_t m_counter;
        bool m_level;
    };
}


#endif // ___COOKTIMER_TICK_GENERATOR_H___
