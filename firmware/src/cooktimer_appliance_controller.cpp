#include "cooktimer_appliance_controller.h"
#include "cooktimer_display.h"
#include "cooktimer_time_adjust.h"

namespace cooktimer
{
	ApplianceController::ApplianceController() :
		m_config(nullptr)
	{
		reset();
	}

	void ApplianceController::init(const Config* config)
	{
		m_config = config;
		reset();
	}

	void ApplianceController::reset()
	{
		m_state = eApplianceIdle;
		m_last_state = eApplianceIdle;
		m_target.minutes = 0;
		m_target.seconds = 0;
		m_power_level = 0;
		m_indicator = 0;
		m_adjust_mode = eAdjustSecondsUnits;
		m_door_open = false;
	}

	void ApplianceController::process(const Inputs& inputs, const bool timer_done, TimerCommands* commands)
	{
		commands->reset();

		// The indicator follows the state only on a state change. Power changes alone do not refresh it.
		if (m_last_state != m_state)
		{
			update_indicator();
			m_last_state = m_state;
		}

		const ApplianceState state = next_state(inputs, timer_done, commands);

		// Adjustments are accepted in every state
		TimeValue target = m_target;
		if (inputs.events.increment)
		{
			increment_time(&target, inputs.adjust_mode);
		}
		if (inputs.events.decrement)
		{
			decrement_time(&target, inputs.adjust_mode);
		}

		uint8_t power_level = m_power_level;
		if (inputs.power_enable)
		{
			if (inputs.events.increment && power_level < COOKTIMER_POWER_LEVEL_MAX)
			{
				power_level++;
			}
			if (inputs.events.decrement && power_level > 0)
			{
				power_level--;
			}
		}

		const ApplianceState previous = m_state;
		m_state = state;
		m_target = target;
		m_power_level = power_level;
		m_adjust_mode = inputs.adjust_mode;
		m_door_open = inputs.door_open;

		if (previous != m_state && m_config != nullptr)
		{
			state_change_callback_t callback = m_config->get_state_change_callback();
			if (callback != nullptr)
			{
				callback(previous, m_state);
			}
		}
	}

	ApplianceState ApplianceController::next_state(const Inputs& inputs, const bool timer_done, TimerCommands* commands) const
	{
		ApplianceState state = m_state;

		switch (m_state)
		{
		case eApplianceIdle:
			if (inputs.events.start && !inputs.door_open)
			{
				state = eApplianceCountingDown;
				commands->start = true;
			}
			break;

		case eApplianceCountingDown:
			if (timer_done || inputs.events.stop)
			{
				state = eApplianceIdle;
				commands->stop = inputs.events.stop;
			}
			else if (inputs.events.pause || inputs.door_open)	// Open door is a level. Pauses with no button.
			{
				state = eAppliancePaused;
				commands->pause = true;
			}
			break;

		case eAppliancePaused:
			if (inputs.events.stop)
			{
				state = eApplianceIdle;
				commands->stop = true;
			}
			else if (inputs.events.start && !inputs.door_open)
			{
				state = eApplianceCountingDown;
				// A paused timer resumes on a second pause. One that reached zero
				// while the controller was pausing sits in Idle and needs a start.
				commands->start = true;
				commands->pause = true;
			}
			break;

		default:
			state = eApplianceIdle;
			commands->stop = true;
			break;
		}

		return state;
	}

	void ApplianceController::update_indicator()
	{
		switch (m_state)
		{
		case eApplianceCountingDown:
		case eAppliancePaused:
			if (m_config != nullptr)
			{
				m_indicator = m_config->get_indicator_code(power_bracket());
			}
			else
			{
				m_indicator = static_cast<uint8_t>(1u << power_bracket());
			}
			break;

		case eApplianceIdle:
		default:
			m_indicator = 0;
			break;
		}
	}

	PowerBracket ApplianceController::power_bracket() const
	{
		return Display::power_bracket(m_power_level);
	}

	void ApplianceController::compose(const DisplayFrame& timer_frame, const uint8_t scan_slot, Outputs* outputs) const
	{
		const uint8_t power_slot = (m_config != nullptr) ? m_config->get_power_slot() : static_cast<uint8_t>(COOKTIMER_DEFAULT_POWER_SLOT);
		Display::arbitrate(timer_frame, scan_slot, power_slot, Display::power_code(power_bracket()), outputs);
		outputs->indicator = m_indicator;
	}
}
