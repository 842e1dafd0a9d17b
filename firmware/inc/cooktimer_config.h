#ifndef ___COOKTIMER_CONFIG_H___
#define ___COOKTIMER_CONFIG_H___

#include <cstdint>

#include "cooktimer_setup.h"
#include "cooktimer_types.h"

namespace cooktimer
{
	class Config
	{
	public:

		Config();
		bool set_power_slot(const uint8_t slot);
		bool set_indicator_code(const PowerBracket bracket, const uint8_t code);
		uint8_t get_indicator_code(const PowerBracket bracket) const;
		void copy_from(const Config* src);
		void clear();

		inline uint8_t get_power_slot() const { return m_power_slot; }
		inline bool get_separator_dp() const { return m_separator_dp; }
		inline void set_separator_dp(const bool val) { m_separator_dp = val; }
		inline void set_state_change_callback(state_change_callback_t callback) { m_state_change_callback = callback; }
		inline state_change_callback_t get_state_change_callback() const { return m_state_change_callback; }

	private:
		uint8_t m_power_slot;
		bool m_separator_dp;
		uint8_t m_indicator_codes[3];
		state_change_callback_t m_state_change_callback;
	};
}

#endif // ___COOKTIMER_CONFIG_H___
