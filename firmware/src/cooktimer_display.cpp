#include <cstring>

#include "cooktimer_display.h"

namespace cooktimer
{
namespace Display
{
	static const digit_code_t digit_map[10] = {
		SEG_A | SEG_B | SEG_C | SEG_D | SEG_E | SEG_F,			// 0
		SEG_B | SEG_C,											// 1
		SEG_A | SEG_B | SEG_D | SEG_E | SEG_G,					// 2
		SEG_A | SEG_B | SEG_C | SEG_D | SEG_G,					// 3
		SEG_B | SEG_C | SEG_F | SEG_G,							// 4
		SEG_A | SEG_C | SEG_D | SEG_F | SEG_G,					// 5
		SEG_A | SEG_C | SEG_D | SEG_E | SEG_F | SEG_G,			// 6
		SEG_A | SEG_B | SEG_C,									// 7
		SEG_A | SEG_B | SEG_C | SEG_D | SEG_E | SEG_F | SEG_G,	// 8
		SEG_A | SEG_B | SEG_C | SEG_D | SEG_F | SEG_G			// 9
	};

	digit_code_t encode_digit(const uint8_t value, const bool dp)
	{
		digit_code_t code = (value < sizeof(digit_map)) ? digit_map[value] : CODE_DASH;
		if (dp)
		{
			code |= SEG_DP;
		}
		return code;
	}

	void compose_time(const TimeValue& time, const bool separator_dp, DisplayFrame* frame)
	{
		std::memset(frame->digits, CODE_BLANK, sizeof(frame->digits));

		frame->digits[eSlotSecondsUnits] = encode_digit(time.seconds % 10, false);
		frame->digits[eSlotSecondsTens] = encode_digit(time.seconds / 10, false);
		frame->digits[eSlotMinutesUnits] = encode_digit(time.minutes % 10, separator_dp);
		frame->digits[eSlotMinutesTens] = encode_digit(time.minutes / 10, false);
		frame->digits[eSlotMarker] = CODE_LETTER_P;
	}

	PowerBracket power_bracket(const uint8_t power_level)
	{
		if (power_level == 0)
		{
			return ePowerLow;
		}
		else if (power_level == 1)
		{
			return ePowerMedium;
		}

		return ePowerHigh;	// 2 and the transient 3
	}

	digit_code_t power_code(const PowerBracket bracket)
	{
		switch (bracket)
		{
		case ePowerLow:
			return CODE_POWER_LOW;
		case ePowerMedium:
			return CODE_POWER_MEDIUM;
		case ePowerHigh:
		default:
			return CODE_POWER_HIGH;
		}
	}

	void arbitrate(const DisplayFrame& frame, const uint8_t scan_slot, const uint8_t power_slot, const digit_code_t power, Outputs* outputs)
	{
		const uint8_t slot = scan_slot % COOKTIMER_DIGIT_COUNT;

		std::memcpy(outputs->frame.digits, frame.digits, sizeof(outputs->frame.digits));
		outputs->active_slot = slot;
		outputs->active_code = (slot == power_slot) ? power : frame.digits[slot];
	}
}
}
