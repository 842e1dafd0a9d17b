#include "cooktimer_countdown_timer.h"
#include "cooktimer_display.h"
#include "cooktimer_time_adjust.h"

namespace cooktimer
{
	CountdownTimer::CountdownTimer()
	{
		reset();
	}

	void CountdownTimer::reset()
	{
		m_state = eTimerIdle;
		m_time.minutes = 0;
		m_time.seconds = 0;
	}

	/**
	 * One evaluation cycle. Next state and next time are both computed from the values
	 * committed by the previous cycle, then committed together.
	 * ticks is the number of 1Hz rising edges seen during this cycle.
	 */
	void CountdownTimer::process(const TimerCommands& commands, const TimeValue& target, const uint32_t ticks)
	{
		const TimerState state = next_state(commands);
		TimeValue time = m_time;

		switch (m_state)
		{
		case eTimerIdle:
			time = target;	// Live mirror of the target while nothing runs
			break;

		case eTimerCountingDown:
			for (uint32_t i = 0; i < ticks && !is_zero(time); i++)
			{
				decrement_time(&time, eAdjustSecondsUnits);	// Same borrow rule as a user decrement
			}
			break;

		case eTimerPaused:
		default:
			break;
		}

		m_state = state;
		m_time = time;
	}

	TimerState CountdownTimer::next_state(const TimerCommands& commands) const
	{
		TimerState state = m_state;

		switch (m_state)
		{
		case eTimerIdle:
			if (commands.start)
			{
				state = eTimerCountingDown;
			}
			break;

		case eTimerCountingDown:
			if (commands.stop || is_zero(m_time))
			{
				state = eTimerIdle;
			}
			else if (commands.pause)
			{
				state = eTimerPaused;
			}
			break;

		case eTimerPaused:
			if (commands.stop)
			{
				state = eTimerIdle;
			}
			else if (commands.pause)
			{
				state = eTimerCountingDown;	// Pause toggles
			}
			break;

		default:
			state = eTimerIdle;
			break;
		}

		return state;
	}

	void CountdownTimer::get_display(DisplayFrame* frame, const bool separator_dp) const
	{
		Display::compose_time(m_time, separator_dp, frame);
	}
}
