#include <cstdlib>
#include <cctype>
#include <string>
#include <algorithm>

#include "argument_parser.h"
#include "cooktimer_setup.h"


ArgumentParser::ArgumentParser() :
	m_valid(false),
	m_command(TestAppCommand::None),
	m_argc(0),
	m_argv(nullptr)
{

}

void ArgumentParser::parse(int argc, char* argv[])
{
	m_argc = argc;
	m_argv = argv;
	if (argc < 2)
	{
		m_valid = false;
		return;
	}

	std::string cmd(argv[1]);
	std::transform(cmd.begin(), cmd.end(), cmd.begin(), [](unsigned char c) { return static_cast<unsigned char>(std::tolower(c)); });

	if (cmd == "run")
	{
		m_command = TestAppCommand::Run;

		if (argc == 4)
		{
			m_valid = true;
		}
	}
	else if (cmd == "pipe")
	{
		m_command = TestAppCommand::Pipe;
		m_valid = true;
	}
}

uint8_t ArgumentParser::minutes()
{
	return read_time_field(2, COOKTIMER_MAX_MINUTES);
}

uint8_t ArgumentParser::seconds()
{
	return read_time_field(3, COOKTIMER_MAX_SECONDS);
}

uint8_t ArgumentParser::read_time_field(unsigned int index, unsigned long max)
{
	if (m_command != TestAppCommand::Run || !m_valid)
	{
		throw Error::WrongCommand;
	}

	if (index >= m_argc)
	{
		throw Error::Depleted;
	}

	std::string field(m_argv[index]);
	char* end = nullptr;
	unsigned long value = strtoul(field.c_str(), &end, 10);
	if (field.empty() || *end != '\0' || value > max)
	{
		throw Error::InvalidValue;
	}

	return static_cast<uint8_t>(value);
}
