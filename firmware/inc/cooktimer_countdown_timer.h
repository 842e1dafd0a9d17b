#ifndef ___COOKTIMER_COUNTDOWN_TIMER_H___
#define ___COOKTIMER_COUNTDOWN_TIMER_H___

#include <cstdint>

#include "cooktimer_types.h"

namespace cooktimer
{
	class CountdownTimer
	{
	public:
		CountdownTimer();

		void reset();
		void process(const TimerCommands& commands, const TimeValue& target, const uint32_t ticks);
		void get_display(DisplayFrame* frame, const bool separator_dp) const;

		// Level, not a pulse. Already true after reset or with a zero target.
		inline bool done() const { return m_state == eTimerIdle && m_time.minutes == 0 && m_time.seconds == 0; }

		inline TimerState state() const { return m_state; }
		inline TimeValue time() const { return m_time; }
		inline uint8_t minutes() const { return m_time.minutes; }
		inline uint8_t seconds() const { return m_time.seconds; }

	protected:
		TimerState next_state(const TimerCommands& commands) const;

		TimerState m_state;
		TimeValue m_time;
	};
}

#endif // ___COOKTIMER_COUNTDOWN_TIMER_H___
