#include "argument_parser.h"
#include "cooktimer.h"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <cstdint>
#include <cstdlib>
#include <cctype>
#include <chrono>
#include <algorithm>


using namespace std;

static const char* state_name(cooktimer::ApplianceState state)
{
    switch (state)
    {
    case cooktimer::eApplianceIdle:
        return "Idle";
    case cooktimer::eApplianceCountingDown:
        return "CountingDown";
    case cooktimer::eAppliancePaused:
        return "Paused";
    default:
        return "?";
    }
}

static const char* timer_state_name(cooktimer::TimerState state)
{
    switch (state)
    {
    case cooktimer::eTimerIdle:
        return "Idle";
    case cooktimer::eTimerCountingDown:
        return "CountingDown";
    case cooktimer::eTimerPaused:
        return "Paused";
    default:
        return "?";
    }
}

void log_state_change(cooktimer::ApplianceState previous, cooktimer::ApplianceState next)
{
    cout << "[state] " << state_name(previous) << " -> " << state_name(next) << endl;
}

void print_status(const cooktimer::Appliance& appliance)
{
    const cooktimer::CountdownTimer* timer = appliance.timer();
    const cooktimer::ApplianceController* controller = appliance.controller();
    const cooktimer::Outputs& outputs = appliance.outputs();

    cout << dec << setfill('0')
        << "time " << setw(2) << static_cast<uint32_t>(timer->minutes()) << ":" << setw(2) << static_cast<uint32_t>(timer->seconds())
        << "  target " << setw(2) << static_cast<uint32_t>(controller->target().minutes) << ":" << setw(2) << static_cast<uint32_t>(controller->target().seconds)
        << "  outer " << state_name(controller->state())
        << "  inner " << timer_state_name(timer->state())
        << "  done " << timer->done()
        << "  power " << static_cast<uint32_t>(controller->power_level())
        << "  indicator " << static_cast<uint32_t>(outputs.indicator)
        << "  door " << (controller->door_open() ? "open" : "closed")
        << "  digits";

    for (uint32_t i = 0; i < COOKTIMER_DIGIT_COUNT; i++)
    {
        cout << " " << hex << setw(2) << static_cast<uint32_t>(outputs.frame.digits[i]);
    }
    cout << dec << endl;
}

// Press a button for a single cycle. Events are one shot.
void press(cooktimer::Appliance* appliance, cooktimer::Inputs* inputs, bool* event)
{
    *event = true;
    appliance->process(*inputs, 0);
    inputs->clear_events();
}

int run(uint8_t minutes, uint8_t seconds, cooktimer::Appliance* appliance)
{
    cooktimer::Inputs inputs;
    inputs.reset();

    inputs.adjust_mode = cooktimer::eAdjustMinutesUnits;
    for (uint8_t i = 0; i < minutes; i++)
    {
        press(appliance, &inputs, &inputs.events.increment);
    }

    inputs.adjust_mode = cooktimer::eAdjustSecondsUnits;
    for (uint8_t i = 0; i < seconds; i++)
    {
        press(appliance, &inputs, &inputs.events.increment);
    }

    appliance->process(inputs, 0);  // Let the timer mirror the target
    print_status(*appliance);
    press(appliance, &inputs, &inputs.events.start);

    uint32_t slot = 0;
    while (appliance->controller()->state() != cooktimer::eApplianceIdle)
    {
        inputs.scan_slot = static_cast<uint8_t>(slot++ % COOKTIMER_DIGIT_COUNT);
        appliance->process(inputs, COOKTIMER_REFERENCE_CLOCK_HZ);
        print_status(*appliance);
    }

    return 0;
}

bool apply_line(const string& line, cooktimer::Appliance* appliance, cooktimer::Inputs* inputs, bool* quit)
{
    istringstream stream(line);
    string cmd;
    string arg;
    stream >> cmd >> arg;
    transform(cmd.begin(), cmd.end(), cmd.begin(), [](unsigned char c) { return static_cast<unsigned char>(std::tolower(c)); });

    uint32_t ticks_to_run = 0;

    if (cmd.empty())
    {
        return true;
    }
    else if (cmd == "start")
    {
        inputs->events.start = true;
    }
    else if (cmd == "pause")
    {
        inputs->events.pause = true;
    }
    else if (cmd == "stop")
    {
        inputs->events.stop = true;
    }
    else if (cmd == "inc")
    {
        inputs->events.increment = true;
    }
    else if (cmd == "dec")
    {
        inputs->events.decrement = true;
    }
    else if (cmd == "door" && (arg == "open" || arg == "close"))
    {
        inputs->door_open = (arg == "open");
    }
    else if (cmd == "power" && (arg == "on" || arg == "off"))
    {
        inputs->power_enable = (arg == "on");
    }
    else if (cmd == "mode" && arg == "su")
    {
        inputs->adjust_mode = cooktimer::eAdjustSecondsUnits;
    }
    else if (cmd == "mode" && arg == "st")
    {
        inputs->adjust_mode = cooktimer::eAdjustSecondsTens;
    }
    else if (cmd == "mode" && arg == "mu")
    {
        inputs->adjust_mode = cooktimer::eAdjustMinutesUnits;
    }
    else if (cmd == "mode" && arg == "mt")
    {
        inputs->adjust_mode = cooktimer::eAdjustMinutesTens;
    }
    else if (cmd == "tick")
    {
        ticks_to_run = arg.empty() ? 1u : static_cast<uint32_t>(strtoul(arg.c_str(), nullptr, 10));
    }
    else if (cmd == "reset")
    {
        appliance->reset();
        inputs->reset();
        print_status(*appliance);
        return true;
    }
    else if (cmd == "show")
    {
        print_status(*appliance);
        return true;
    }
    else if (cmd == "quit")
    {
        *quit = true;
        return true;
    }
    else
    {
        return false;
    }

    appliance->process(*inputs, 0);
    inputs->clear_events();
    for (uint32_t i = 0; i < ticks_to_run; i++)
    {
        appliance->process(*inputs, COOKTIMER_REFERENCE_CLOCK_HZ);
    }
    print_status(*appliance);
    return true;
}

int run_pipe(cooktimer::Appliance* appliance)
{
    cooktimer::Inputs inputs;
    inputs.reset();

    chrono::time_point<chrono::steady_clock> last_timestamp, now_timestamp;
    last_timestamp = chrono::steady_clock::now();

    string line;
    bool quit = false;
    while (!quit && getline(cin, line))
    {
        // Real time elapsed between commands is fed to the reference clock
        now_timestamp = chrono::steady_clock::now();
        uint64_t timestep_us = static_cast<uint64_t>(chrono::duration_cast<chrono::microseconds>(now_timestamp - last_timestamp).count());
        uint64_t ref_ticks = timestep_us * (COOKTIMER_REFERENCE_CLOCK_HZ / 1000000u);
        while (ref_ticks > 0)
        {
            uint32_t chunk = static_cast<uint32_t>(min<uint64_t>(ref_ticks, COOKTIMER_REFERENCE_CLOCK_HZ));
            appliance->process(inputs, chunk);
            ref_ticks -= chunk;
        }
        last_timestamp = now_timestamp;

        if (!apply_line(line, appliance, &inputs, &quit))
        {
            cerr << "Unknown command: " << line << endl;
        }
    }

    return 0;
}

int main(int argc, char* argv[]) 
{
    int errorcode = 0;

    cooktimer::Appliance appliance;
    cooktimer::Config config;
    config.set_state_change_callback(log_state_change);
    appliance.init(&config);

    ArgumentParser parser;
    parser.parse(argc, argv);

    if (!parser.is_valid())
    {
        cerr << "Usage: " << argv[0] << " run <minutes> <seconds> | pipe" << endl;
        errorcode = -1;
    }
    else if (parser.command() == TestAppCommand::Run)
    {
        try
        {
            errorcode = run(parser.minutes(), parser.seconds(), &appliance);
        }
        catch (ArgumentParser::Error e)
        {
            cerr << "Invalid time argument (" << static_cast<int>(e) << ")" << endl;
            errorcode = -1;
        }
    }
    else if (parser.command() == TestAppCommand::Pipe)
    {
        errorcode = run_pipe(&appliance);
    }

    return errorcode;
}
