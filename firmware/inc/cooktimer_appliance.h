#ifndef ___COOKTIMER_APPLIANCE_H___
#define ___COOKTIMER_APPLIANCE_H___

#include <cstdint>

#include "cooktimer_setup.h"
#include "cooktimer_types.h"
#include "cooktimer_config.h"
#include "cooktimer_tick_generator.h"
#include "cooktimer_countdown_timer.h"
#include "cooktimer_appliance_controller.h"

namespace cooktimer
{
	class Appliance
	{

	public:
		Appliance();

		void init(const Config* config);
		void reset();

		void process(const Inputs& inputs, uint32_t ref_ticks);

		inline const Outputs& outputs() const { return m_outputs; }
		inline const CountdownTimer* timer() const { return &m_timer; }
		inline const ApplianceController* controller() const { return &m_controller; }
		inline const TickGenerator* tick_generator() const { return &m_tick_generator; }
		inline const Config* get_config() const { return &m_config; }

	private:
		void update_outputs(const uint8_t scan_slot);

		bool m_initialized;
		Config m_config;
		TickGenerator m_tick_generator;
		CountdownTimer m_timer;
		ApplianceController m_controller;
		Outputs m_outputs;
	};
}

#endif // ___COOKTIMER_APPLIANCE_H___
