#include "cooktimer_tick_generator.h"

namespace cooktimer
{
    // Advance by ref_ticks reference clock cycles. Returns the number of rising edges produced.
    uint32_t TickGenerator::process(uint32_t ref_ticks)
    {
        uint32_t rising_edges = 0;
        uint32_t remaining = ref_ticks;

        while (remaining > 0)
        {
            // The cycle that finds the counter at threshold flips the output and clears the counter.
            const uint32_t ticks_to_flip = COOKTIMER_TICK_THRESHOLD - m_counter + 1u;
            if (remaining >= ticks_to_flip)
            {
                remaining -= ticks_to_flip;
                m_counter = 0;
                m_level = !m_level;
                if (m_level)
                {
                    rising_edges++;
                }
            }
            else
            {
                m_counter += remaining;
                remaining = 0;
            }
        }

        return rising_edges;
    }
}
