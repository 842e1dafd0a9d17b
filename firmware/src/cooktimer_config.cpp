#include "cooktimer_config.h"

namespace cooktimer
{
    Config::Config()
    {
        clear();
    }


    void Config::copy_from(const Config* src)
    {
        clear();
        set_power_slot(src->m_power_slot);
        m_separator_dp = src->m_separator_dp;
        m_state_change_callback = src->m_state_change_callback;

        for (uint8_t i=0; i<sizeof(m_indicator_codes); i++)
        {
            set_indicator_code(static_cast<PowerBracket>(i), src->m_indicator_codes[i]);
        }
    }

    void Config::clear()
    {
        m_power_slot = COOKTIMER_DEFAULT_POWER_SLOT;
        m_separator_dp = true;
        m_state_change_callback = nullptr;

        m_indicator_codes[ePowerLow] = 0x1;     // Blue
        m_indicator_codes[ePowerMedium] = 0x2;  // Green
        m_indicator_codes[ePowerHigh] = 0x4;    // Red
    }

    bool Config::set_power_slot(const uint8_t slot)
    {
        if (slot < COOKTIMER_TIME_DIGIT_COUNT || slot >= COOKTIMER_DIGIT_COUNT)
        {
            return false;   // Would hide a time digit.
        }

        m_power_slot = slot;
        return true;
    }

    bool Config::set_indicator_code(const PowerBracket bracket, const uint8_t code)
    {
        if (code > COOKTIMER_INDICATOR_MAX)
        {
            return false;
        }

        switch (bracket)
        {
        case ePowerLow:
        case ePowerMedium:
        case ePowerHigh:
            m_indicator_codes[bracket] = code;
            return true;
        default:
            return false;
        }
    }

    uint8_t Config::get_indicator_code(const PowerBracket bracket) const
    {
        switch (bracket)
        {
        case ePowerLow:
        case ePowerMedium:
            return m_indicator_codes[bracket];
        case ePowerHigh:
        default:
            return m_indicator_codes[ePowerHigh];
        }
    }

}
