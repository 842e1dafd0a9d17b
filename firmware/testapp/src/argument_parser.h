#ifndef ___ARGUMENT_PARSER_H___
#define ___ARGUMENT_PARSER_H___

#include <cstdint>

enum class TestAppCommand
{
	None,
	Run,
	Pipe
};


class ArgumentParser
{
public:

	enum class Error
	{
		WrongCommand,
		Depleted,
		InvalidValue
	};

	ArgumentParser();
	void parse(int argc, char* argv[]);
	uint8_t minutes();
	uint8_t seconds();
	inline TestAppCommand command() { return m_command; }
	inline bool is_valid() { return m_valid; }

protected:
	uint8_t read_time_field(unsigned int index, unsigned long max);

	bool m_valid;
	TestAppCommand m_command;
	unsigned int m_argc;
	char** m_argv;

};


#endif // ___ARGUMENT_PARSER_H___
