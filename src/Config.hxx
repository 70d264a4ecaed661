// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

struct Config {
	std::string api_key;

	std::string api_url = "https://api.app.reclaim.ai/api/";

	/**
	 * Date/time values without an offset are interpreted in this
	 * time zone unless the call specifies one.  If empty, the
	 * account's time zone is used, and the machine's local time
	 * zone as a last resort.
	 */
	std::string default_time_zone;

	std::chrono::duration<long> connect_timeout = std::chrono::seconds{10};

	unsigned verbose = 1;

	/**
	 * Throws std::runtime_error if the configuration is not
	 * usable.
	 */
	void Check() const;
};

/**
 * Load a configuration file.
 *
 * Throws on error.
 */
void
LoadConfigFile(Config &config, const std::filesystem::path &path);

/**
 * Apply the environment variables RECLAIM_API_KEY, RECLAIM_API_URL
 * and MCP_DEFAULT_TIMEZONE; they override the configuration file.
 */
void
ApplyEnvironment(Config &config);
