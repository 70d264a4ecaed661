// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

struct CommandLine {
	/**
	 * Path of the configuration file (may be empty).
	 */
	std::string config_path;

	/**
	 * The number of "-v" options.
	 */
	unsigned verbose = 0;
};

/**
 * Throws std::runtime_error on usage errors.
 */
CommandLine
ParseCommandLine(int argc, char **argv);
