#include "cooktimer_time_adjust.h"

namespace cooktimer
{
	void increment_time(TimeValue* time, const AdjustMode mode)
	{
		switch (mode)
		{
		case eAdjustMinutesTens:
			if (time->minutes <= COOKTIMER_MINUTES_TENS_LIMIT)
			{
				time->minutes += 10;
			}
			break;

		case eAdjustMinutesUnits:
			if (time->minutes < COOKTIMER_MAX_MINUTES)
			{
				time->minutes += 1;
			}
			break;

		case eAdjustSecondsTens:
			if (time->seconds + 10u <= COOKTIMER_MAX_SECONDS)
			{
				time->seconds += 10;
			}
			else
			{
				time->seconds = static_cast<uint8_t>(time->seconds + 10u - 60u);
				if (time->minutes < COOKTIMER_MAX_MINUTES)
				{
					time->minutes += 1;
				}
			}
			break;

		case eAdjustSecondsUnits:
		default:
			if (time->seconds < COOKTIMER_MAX_SECONDS)
			{
				time->seconds += 1;
			}
			else
			{
				time->seconds = 0;
				if (time->minutes < COOKTIMER_MAX_MINUTES)
				{
					time->minutes += 1;
				}
			}
			break;
		}
	}

	void decrement_time(TimeValue* time, const AdjustMode mode)
	{
		switch (mode)
		{
		case eAdjustMinutesTens:
			if (time->minutes >= 10)
			{
				time->minutes -= 10;
			}
			break;

		case eAdjustMinutesUnits:
			if (time->minutes >= 1)
			{
				time->minutes -= 1;
			}
			break;

		case eAdjustSecondsTens:
			if (time->seconds >= 10)
			{
				time->seconds -= 10;
			}
			else if (time->minutes > 0)
			{
				time->seconds = static_cast<uint8_t>(time->seconds + 60u - 10u);
				time->minutes -= 1;
			}
			break;

		case eAdjustSecondsUnits:
		default:
			if (time->seconds > 0)
			{
				time->seconds -= 1;
			}
			else if (time->minutes > 0)
			{
				time->seconds = COOKTIMER_MAX_SECONDS;
				time->minutes -= 1;
			}
			break;
		}
	}
}
