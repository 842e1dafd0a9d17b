#include <gtest/gtest.h>
#include "cooktimer.h"
#include "cooktimer_test.h"

class TestAppliance : public CookTimerTest
{
protected:
   const cooktimer::CountdownTimer* timer() { return appliance.timer(); }
   const cooktimer::ApplianceController* controller() { return appliance.controller(); }
};


TEST_F(TestAppliance, DoneRightAfterReset)
{
   EXPECT_TRUE(timer()->done());
   EXPECT_EQ(timer()->state(), cooktimer::eTimerIdle);
   EXPECT_EQ(controller()->state(), cooktimer::eApplianceIdle);
   EXPECT_EQ(appliance.outputs().indicator, 0u);

   appliance.reset();
   EXPECT_TRUE(timer()->done());
}

TEST_F(TestAppliance, NothingHappensBeforeInit)
{
   cooktimer::Appliance fresh;
   inputs.events.start = true;
   fresh.process(inputs, COOKTIMER_REFERENCE_CLOCK_HZ);
   EXPECT_EQ(fresh.controller()->state(), cooktimer::eApplianceIdle);
   EXPECT_EQ(fresh.tick_generator()->counter(), 0u);
   EXPECT_FALSE(fresh.tick_generator()->level());
}

TEST_F(TestAppliance, TargetMirroredWhileIdle)
{
   set_target(2, 15);
   EXPECT_TIME_EQ(controller()->target(), 2, 15);
   EXPECT_TIME_EQ(timer()->time(), 2, 15);
   EXPECT_FALSE(timer()->done());

   run_seconds(3);
   EXPECT_TIME_EQ(timer()->time(), 2, 15);
}

TEST_F(TestAppliance, FiveSecondsCountdown)
{
   set_target(0, 5);
   press(&inputs.events.start);
   EXPECT_EQ(controller()->state(), cooktimer::eApplianceCountingDown);
   EXPECT_EQ(timer()->state(), cooktimer::eTimerCountingDown);

   for (uint8_t s=4; s>0; s--)
   {
      run_seconds(1);
      EXPECT_TIME_EQ(timer()->time(), 0, s);
   }
   run_seconds(1);
   EXPECT_TIME_EQ(timer()->time(), 0, 0);
   EXPECT_FALSE(timer()->done());

   step();   // Timer sees zero and goes idle
   EXPECT_EQ(timer()->state(), cooktimer::eTimerIdle);
   EXPECT_TRUE(timer()->done());
   EXPECT_EQ(controller()->state(), cooktimer::eApplianceCountingDown);

   step();   // Controller sees done
   EXPECT_EQ(controller()->state(), cooktimer::eApplianceIdle);
   EXPECT_TIME_EQ(timer()->time(), 0, 5);   // Ready for another run
}

TEST_F(TestAppliance, ZeroTargetStartEndsImmediately)
{
   EXPECT_TRUE(timer()->done());
   press(&inputs.events.start);
   EXPECT_EQ(controller()->state(), cooktimer::eApplianceCountingDown);
   step();
   step();
   step();
   EXPECT_EQ(controller()->state(), cooktimer::eApplianceIdle);
   EXPECT_TRUE(timer()->done());
}

TEST_F(TestAppliance, DoorOpenPausesCountdown)
{
   set_target(1, 0);
   press(&inputs.events.start);
   run_seconds(3);
   EXPECT_TIME_EQ(timer()->time(), 0, 57);

   inputs.door_open = true;
   step();
   EXPECT_EQ(controller()->state(), cooktimer::eAppliancePaused);
   EXPECT_EQ(timer()->state(), cooktimer::eTimerPaused);

   run_seconds(5);
   EXPECT_TIME_EQ(timer()->time(), 0, 57);

   inputs.door_open = false;
   run_seconds(2);
   EXPECT_EQ(controller()->state(), cooktimer::eAppliancePaused);
   EXPECT_TIME_EQ(timer()->time(), 0, 57);

   press(&inputs.events.start);
   EXPECT_EQ(controller()->state(), cooktimer::eApplianceCountingDown);
   EXPECT_EQ(timer()->state(), cooktimer::eTimerCountingDown);
   run_seconds(2);
   EXPECT_TIME_EQ(timer()->time(), 0, 55);
}

TEST_F(TestAppliance, StartRefusedWithDoorOpen)
{
   set_target(0, 30);
   inputs.door_open = true;
   press(&inputs.events.start);
   run_seconds(2);
   EXPECT_EQ(controller()->state(), cooktimer::eApplianceIdle);
   EXPECT_EQ(timer()->state(), cooktimer::eTimerIdle);
   EXPECT_TIME_EQ(timer()->time(), 0, 30);
}

TEST_F(TestAppliance, PauseResumeAndRepeatedPause)
{
   set_target(0, 20);
   press(&inputs.events.start);
   run_seconds(2);

   press(&inputs.events.pause);
   EXPECT_EQ(controller()->state(), cooktimer::eAppliancePaused);
   EXPECT_EQ(timer()->state(), cooktimer::eTimerPaused);

   // Extra pause presses are not forwarded, the timer does not toggle back
   press(&inputs.events.pause);
   press(&inputs.events.pause);
   EXPECT_EQ(controller()->state(), cooktimer::eAppliancePaused);
   EXPECT_EQ(timer()->state(), cooktimer::eTimerPaused);
   run_seconds(3);
   EXPECT_TIME_EQ(timer()->time(), 0, 18);

   press(&inputs.events.start);
   run_seconds(1);
   EXPECT_TIME_EQ(timer()->time(), 0, 17);
}

TEST_F(TestAppliance, StopReloadsTarget)
{
   set_target(0, 40);
   press(&inputs.events.start);
   run_seconds(10);
   EXPECT_TIME_EQ(timer()->time(), 0, 30);

   press(&inputs.events.stop);
   EXPECT_EQ(controller()->state(), cooktimer::eApplianceIdle);
   EXPECT_EQ(timer()->state(), cooktimer::eTimerIdle);
   step();
   EXPECT_TIME_EQ(timer()->time(), 0, 40);
}

TEST_F(TestAppliance, AdjustDuringCountdownOnlyMovesTarget)
{
   set_target(0, 40);
   press(&inputs.events.start);
   run_seconds(1);

   inputs.adjust_mode = cooktimer::eAdjustMinutesUnits;
   press(&inputs.events.increment);
   EXPECT_TIME_EQ(controller()->target(), 1, 40);
   EXPECT_TIME_EQ(timer()->time(), 0, 39);

   press(&inputs.events.stop);
   step();
   EXPECT_TIME_EQ(timer()->time(), 1, 40);
}

TEST_F(TestAppliance, PowerLevelScenario)
{
   inputs.power_enable = true;
   inputs.adjust_mode = cooktimer::eAdjustMinutesTens;
   for (int i=0; i<3; i++)
   {
      press(&inputs.events.increment);
      EXPECT_LE(controller()->power_level(), 3u);
   }
   EXPECT_EQ(controller()->power_bracket(), cooktimer::ePowerHigh);
   press(&inputs.events.increment);
   EXPECT_EQ(controller()->power_level(), 3u);

   inputs.scan_slot = config.get_power_slot();
   step();
   EXPECT_EQ(appliance.outputs().active_code, cooktimer::Display::CODE_POWER_HIGH);
}

TEST_F(TestAppliance, IndicatorFollowsStateChanges)
{
   set_target(0, 30);
   press(&inputs.events.start);
   step();
   EXPECT_EQ(appliance.outputs().indicator, config.get_indicator_code(cooktimer::ePowerLow));

   inputs.power_enable = true;
   press(&inputs.events.increment);
   step();
   EXPECT_EQ(controller()->power_bracket(), cooktimer::ePowerMedium);
   EXPECT_EQ(appliance.outputs().indicator, config.get_indicator_code(cooktimer::ePowerLow));   // Stale until the next state change
   inputs.power_enable = false;

   press(&inputs.events.pause);
   step();
   EXPECT_EQ(appliance.outputs().indicator, config.get_indicator_code(cooktimer::ePowerMedium));
}

TEST_F(TestAppliance, DisplayOutputs)
{
   set_target(12, 34);

   inputs.scan_slot = cooktimer::Display::eSlotMinutesUnits;
   step();
   const cooktimer::Outputs& out = appliance.outputs();
   EXPECT_EQ(out.active_slot, static_cast<uint8_t>(cooktimer::Display::eSlotMinutesUnits));
   EXPECT_EQ(out.active_code, cooktimer::Display::encode_digit(2, true));
   EXPECT_EQ(out.frame.digits[cooktimer::Display::eSlotSecondsUnits], cooktimer::Display::encode_digit(4));
   EXPECT_EQ(out.frame.digits[cooktimer::Display::eSlotSecondsTens], cooktimer::Display::encode_digit(3));
   EXPECT_EQ(out.frame.digits[cooktimer::Display::eSlotMinutesTens], cooktimer::Display::encode_digit(1));

   inputs.scan_slot = COOKTIMER_DEFAULT_POWER_SLOT;
   step();
   EXPECT_EQ(out.active_code, cooktimer::Display::CODE_POWER_LOW);
   EXPECT_EQ(out.frame.digits[COOKTIMER_DEFAULT_POWER_SLOT], cooktimer::Display::CODE_BLANK);
}

TEST_F(TestAppliance, ConfigIsCopiedAtInit)
{
   config.set_separator_dp(false);
   config.set_power_slot(4);
   appliance.init(&config);
   config.set_power_slot(5);    // No effect after init

   set_target(1, 0);
   inputs.scan_slot = cooktimer::Display::eSlotMinutesUnits;
   step();
   EXPECT_EQ(appliance.outputs().active_code, cooktimer::Display::encode_digit(1));

   inputs.scan_slot = 4;
   step();
   EXPECT_EQ(appliance.outputs().active_code, cooktimer::Display::CODE_POWER_LOW);
   inputs.scan_slot = 5;
   step();
   EXPECT_EQ(appliance.outputs().active_code, cooktimer::Display::CODE_BLANK);
}

TEST_F(TestAppliance, TicksComeFromTheReferenceClock)
{
   set_target(0, 10);
   press(&inputs.events.start);

   step(COOKTIMER_REFERENCE_CLOCK_HZ / 2 - 1);
   EXPECT_TIME_EQ(timer()->time(), 0, 10);
   step(1);   // First rising edge
   EXPECT_TIME_EQ(timer()->time(), 0, 9);
   step(COOKTIMER_REFERENCE_CLOCK_HZ - 1);
   EXPECT_TIME_EQ(timer()->time(), 0, 9);
   step(1);
   EXPECT_TIME_EQ(timer()->time(), 0, 8);
   step(3u * COOKTIMER_REFERENCE_CLOCK_HZ);
   EXPECT_TIME_EQ(timer()->time(), 0, 5);
}

TEST_F(TestAppliance, DoorOpenedOnTheCycleTheTimerReachesZero)
{
   set_target(0, 2);
   press(&inputs.events.start);
   run_seconds(2);
   EXPECT_TIME_EQ(timer()->time(), 0, 0);
   EXPECT_EQ(timer()->state(), cooktimer::eTimerCountingDown);

   // Controller pauses while the timer leaves on zero
   inputs.door_open = true;
   step();
   EXPECT_EQ(controller()->state(), cooktimer::eAppliancePaused);
   EXPECT_EQ(timer()->state(), cooktimer::eTimerIdle);

   inputs.door_open = false;
   step();
   EXPECT_TIME_EQ(timer()->time(), 0, 2);

   press(&inputs.events.start);
   EXPECT_EQ(controller()->state(), cooktimer::eApplianceCountingDown);
   EXPECT_EQ(timer()->state(), cooktimer::eTimerCountingDown);

   run_seconds(2);
   EXPECT_TIME_EQ(timer()->time(), 0, 0);
   step();
   step();
   EXPECT_EQ(controller()->state(), cooktimer::eApplianceIdle);
   EXPECT_EQ(timer()->state(), cooktimer::eTimerIdle);
}

TEST_F(TestAppliance, PauseOnTheCycleTheTimerReachesZero)
{
   set_target(0, 1);
   press(&inputs.events.start);
   run_seconds(1);

   press(&inputs.events.pause);
   EXPECT_EQ(controller()->state(), cooktimer::eAppliancePaused);
   EXPECT_EQ(timer()->state(), cooktimer::eTimerIdle);
   step();

   press(&inputs.events.start);
   run_seconds(10);
   step();
   step();
   EXPECT_EQ(controller()->state(), cooktimer::eApplianceIdle);
}

TEST_F(TestAppliance, InputsReset)
{
   inputs.events.start = true;
   inputs.events.pause = true;
   inputs.events.stop = true;
   inputs.events.increment = true;
   inputs.events.decrement = true;
   inputs.power_enable = true;
   inputs.door_open = true;
   inputs.adjust_mode = cooktimer::eAdjustMinutesTens;
   inputs.scan_slot = 7;

   inputs.reset();
   EXPECT_FALSE(inputs.events.start);
   EXPECT_FALSE(inputs.events.pause);
   EXPECT_FALSE(inputs.events.stop);
   EXPECT_FALSE(inputs.events.increment);
   EXPECT_FALSE(inputs.events.decrement);
   EXPECT_FALSE(inputs.power_enable);
   EXPECT_FALSE(inputs.door_open);
   EXPECT_EQ(inputs.adjust_mode, cooktimer::eAdjustSecondsUnits);
   EXPECT_EQ(inputs.scan_slot, 0u);
}
