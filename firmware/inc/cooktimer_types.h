#ifndef ___COOKTIMER_TYPES_H___
#define ___COOKTIMER_TYPES_H___

#include <cstdint>

#include "cooktimer_setup.h"

namespace cooktimer
{
	typedef uint8_t digit_code_t;	// 7 segments code. Bit 0 to 6 : segment a to g. Bit 7 : decimal point

	// Outer state machine. Door aware.
	enum ApplianceState
	{
		eApplianceIdle = 0,
		eApplianceCountingDown,
		eAppliancePaused
	};

	// Inner state machine. Pure time tracking.
	enum TimerState
	{
		eTimerIdle = 0,
		eTimerCountingDown,
		eTimerPaused
	};

	// Digit group that responds to increment/decrement events
	enum AdjustMode
	{
		eAdjustSecondsUnits = 0,
		eAdjustSecondsTens,
		eAdjustMinutesUnits,
		eAdjustMinutesTens
	};

	enum PowerBracket
	{
		ePowerLow = 0,
		ePowerMedium,
		ePowerHigh
	};

	struct TimeValue
	{
		uint8_t minutes;
		uint8_t seconds;
	};

	struct TimerCommands
	{
		void reset()
		{
			start = false;
			pause = false;
			stop = false;
		}

		bool start;
		bool pause;
		bool stop;
	};

	struct DisplayFrame
	{
		digit_code_t digits[COOKTIMER_DIGIT_COUNT];
	};

	struct Inputs
	{
		void reset()
		{
			clear_events();
			power_enable = false;
			door_open = false;
			adjust_mode = eAdjustSecondsUnits;
			scan_slot = 0;
		}

		inline void clear_events()
		{
			events.start = false;
			events.pause = false;
			events.stop = false;
			events.increment = false;
			events.decrement = false;
		}

		struct
		{
			bool start;		// One shot events. Already debounced.
			bool pause;
			bool stop;
			bool increment;
			bool decrement;
		} events;

		bool power_enable;
		bool door_open;
		AdjustMode adjust_mode;
		uint8_t scan_slot;	// Slot currently enabled by the display multiplexer
	};

	struct Outputs
	{
		DisplayFrame frame;
		uint8_t active_slot;
		digit_code_t active_code;	// Data for the active slot after power level arbitration
		uint8_t indicator;			// 3 bits tri-color power indicator
	};

	typedef void (*state_change_callback_t)(ApplianceState previous, ApplianceState next);
}

#endif // ___COOKTIMER_TYPES_H___
