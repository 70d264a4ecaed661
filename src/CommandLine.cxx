// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"

#include <stdexcept>

#include <string.h>

CommandLine
ParseCommandLine(int argc, char **argv)
{
	CommandLine cmdline;

	for (int i = 1; i < argc; ++i) {
		const char *arg = argv[i];

		if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
			++cmdline.verbose;
		} else if (strcmp(arg, "--config") == 0) {
			if (++i >= argc)
				throw std::runtime_error("Option --config requires a value");

			cmdline.config_path = argv[i];
		} else if (strncmp(arg, "--config=", 9) == 0) {
			cmdline.config_path = arg + 9;
		} else
			throw std::runtime_error(std::string("Unknown option: ") + arg);
	}

	return cmdline;
}
