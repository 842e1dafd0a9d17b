#ifndef ___COOKTIMER_SETUP_H___
#define ___COOKTIMER_SETUP_H___

// ========== Parameters ==========

#define COOKTIMER_REFERENCE_CLOCK_HZ 100000000u								// Frequency of the reference clock feeding the tick generator.
#define COOKTIMER_TICK_THRESHOLD ((COOKTIMER_REFERENCE_CLOCK_HZ / 2u) - 1u)	// Counter value that flips the 1Hz signal. One flip per half period.

#define COOKTIMER_DIGIT_COUNT 8u				// Number of slots on the multiplexed display
#define COOKTIMER_TIME_DIGIT_COUNT 4u			// Slots 0 to 3 : seconds units, seconds tens, minutes units, minutes tens
#define COOKTIMER_DEFAULT_POWER_SLOT 7u			// Slot where the power level is routed when the multiplexer scans it

#define COOKTIMER_MAX_MINUTES 99u
#define COOKTIMER_MAX_SECONDS 59u
#define COOKTIMER_MINUTES_TENS_LIMIT 89u		// Adding 10 minutes is refused above this value
#define COOKTIMER_POWER_LEVEL_MAX 3u			// Internal headroom. Display saturates at the third bracket.
#define COOKTIMER_INDICATOR_MAX 7u				// 3 bits tri-color output
// ================================


// ========================= Sanity check =====================
#if COOKTIMER_TICK_THRESHOLD != ((COOKTIMER_REFERENCE_CLOCK_HZ / 2u) - 1u)
#error The tick threshold must be half the reference frequency minus one to get a 1Hz tick
#endif

#if COOKTIMER_REFERENCE_CLOCK_HZ != 100000000u
#error Only a 100MHz reference clock is supported
#endif

#if COOKTIMER_DIGIT_COUNT != 8
#error Only 8 digits displays are supported
#endif

#if COOKTIMER_DEFAULT_POWER_SLOT < COOKTIMER_TIME_DIGIT_COUNT || COOKTIMER_DEFAULT_POWER_SLOT >= COOKTIMER_DIGIT_COUNT
#error The power slot cannot overlap a time digit
#endif

#if COOKTIMER_MINUTES_TENS_LIMIT + 10 > COOKTIMER_MAX_MINUTES
#error Invalid value for COOKTIMER_MINUTES_TENS_LIMIT
#endif

#endif  // ___COOKTIMER_SETUP_H___
