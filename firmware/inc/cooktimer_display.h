#ifndef ___COOKTIMER_DISPLAY_H___
#define ___COOKTIMER_DISPLAY_H___

#include <cstdint>

#include "cooktimer_setup.h"
#include "cooktimer_types.h"

namespace cooktimer
{
	namespace Display
	{
		// Segment masks. Active high.
		constexpr digit_code_t SEG_A = 1u << 0;
		constexpr digit_code_t SEG_B = 1u << 1;
		constexpr digit_code_t SEG_C = 1u << 2;
		constexpr digit_code_t SEG_D = 1u << 3;
		constexpr digit_code_t SEG_E = 1u << 4;
		constexpr digit_code_t SEG_F = 1u << 5;
		constexpr digit_code_t SEG_G = 1u << 6;
		constexpr digit_code_t SEG_DP = 1u << 7;

		constexpr digit_code_t CODE_BLANK = 0x00;
		constexpr digit_code_t CODE_DASH = SEG_G;
		constexpr digit_code_t CODE_LETTER_P = SEG_A | SEG_B | SEG_E | SEG_F | SEG_G;

		// Power level bar graph
		constexpr digit_code_t CODE_POWER_LOW = SEG_D;
		constexpr digit_code_t CODE_POWER_MEDIUM = SEG_D | SEG_G;
		constexpr digit_code_t CODE_POWER_HIGH = SEG_A | SEG_D | SEG_G;

		enum TimeSlot
		{
			eSlotSecondsUnits = 0,
			eSlotSecondsTens = 1,
			eSlotMinutesUnits = 2,
			eSlotMinutesTens = 3,
			eSlotMarker = 6
		};

		digit_code_t encode_digit(const uint8_t value, const bool dp = false);
		void compose_time(const TimeValue& time, const bool separator_dp, DisplayFrame* frame);

		PowerBracket power_bracket(const uint8_t power_level);
		digit_code_t power_code(const PowerBracket bracket);

		void arbitrate(const DisplayFrame& frame, const uint8_t scan_slot, const uint8_t power_slot, const digit_code_t power, Outputs* outputs);
	}
}

#endif // ___COOKTIMER_DISPLAY_H___
