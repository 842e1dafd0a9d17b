#ifndef ___COOKTIMER_APPLIANCE_CONTROLLER_H___
#define ___COOKTIMER_APPLIANCE_CONTROLLER_H___

#include <cstdint>

#include "cooktimer_types.h"
#include "cooktimer_config.h"

namespace cooktimer
{
	/**
	 * Outer state machine of the appliance.
	 * Gates the countdown timer with the door and the buttons, owns the target time,
	 * the power level and the power indicator. Drives the timer only through TimerCommands
	 * and only reads back its done output.
	 */
	class ApplianceController
	{
	public:
		ApplianceController();

		void init(const Config* config);
		void reset();
		void process(const Inputs& inputs, const bool timer_done, TimerCommands* commands);
		void compose(const DisplayFrame& timer_frame, const uint8_t scan_slot, Outputs* outputs) const;

		inline ApplianceState state() const { return m_state; }
		inline TimeValue target() const { return m_target; }
		inline uint8_t power_level() const { return m_power_level; }
		inline uint8_t indicator() const { return m_indicator; }
		inline AdjustMode adjust_mode() const { return m_adjust_mode; }
		inline bool door_open() const { return m_door_open; }
		PowerBracket power_bracket() const;

	protected:
		ApplianceState next_state(const Inputs& inputs, const bool timer_done, TimerCommands* commands) const;
		void update_indicator();

		const Config* m_config;
		ApplianceState m_state;
		ApplianceState m_last_state;	// State seen by the last indicator update
		TimeValue m_target;
		uint8_t m_power_level;
		uint8_t m_indicator;
		AdjustMode m_adjust_mode;
		bool m_door_open;
	};
}

#endif // ___COOKTIMER_APPLIANCE_CONTROLLER_H___
