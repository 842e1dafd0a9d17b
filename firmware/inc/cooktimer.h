#ifndef ___COOKTIMER_H___
#define ___COOKTIMER_H___

#include "cooktimer_setup.h"
#include "cooktimer_types.h"
#include "cooktimer_config.h"
#include "cooktimer_tick_generator.h"
#include "cooktimer_time_adjust.h"
#include "cooktimer_display.h"
#include "cooktimer_countdown_timer.h"
#include "cooktimer_appliance_controller.h"
#include "cooktimer_appliance.h"

#endif // ___COOKTIMER_H___
