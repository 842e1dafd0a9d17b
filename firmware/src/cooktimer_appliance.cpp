#include "cooktimer_appliance.h"

namespace cooktimer
{
	Appliance::Appliance() :
		m_initialized(false)
	{
		update_outputs(0);
	}

	void Appliance::init(const Config* config)
	{
		m_config.copy_from(config);
		m_controller.init(&m_config);
		m_initialized = true;
		reset();
	}

	void Appliance::reset()
	{
		m_tick_generator.reset();
		m_timer.reset();
		m_controller.reset();
		update_outputs(0);
	}

	/**
	 * One synchronous evaluation cycle.
	 * Both state machines read the values committed by the previous cycle, so a decision
	 * taken here is only visible to the other block on the next call.
	 */
	void Appliance::process(const Inputs& inputs, uint32_t ref_ticks)
	{
		if (!m_initialized)
		{
			return;
		}

		const uint32_t ticks = m_tick_generator.process(ref_ticks);
		const TimeValue target = m_controller.target();
		const bool timer_done = m_timer.done();

		TimerCommands commands;
		m_controller.process(inputs, timer_done, &commands);
		m_timer.process(commands, target, ticks);

		update_outputs(inputs.scan_slot);
	}

	void Appliance::update_outputs(const uint8_t scan_slot)
	{
		DisplayFrame frame;
		m_timer.get_display(&frame, m_config.get_separator_dp());
		m_controller.compose(frame, scan_slot, &m_outputs);
	}
}
