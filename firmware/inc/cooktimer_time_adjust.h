#ifndef ___COOKTIMER_TIME_ADJUST_H___
#define ___COOKTIMER_TIME_ADJUST_H___

#include "cooktimer_types.h"

namespace cooktimer
{
	// Step the digit group selected by mode. Minutes never exceed COOKTIMER_MAX_MINUTES, seconds never exceed 59.
	void increment_time(TimeValue* time, const AdjustMode mode);

	// Mirror of increment_time. Borrows 60 seconds from minutes on underflow, never goes below 00:00.
	void decrement_time(TimeValue* time, const AdjustMode mode);

	inline bool is_zero(const TimeValue& time) { return time.minutes == 0 && time.seconds == 0; }
}

#endif // ___COOKTIMER_TIME_ADJUST_H___
