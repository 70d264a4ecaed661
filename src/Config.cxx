// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "io/ConfigParser.hxx"
#include "io/LineParser.hxx"
#include "util/StringParser.hxx"

#include <stdexcept>

#include <stdlib.h>
#include <string.h>

class ReclaimConfigParser final : public ConfigParser {
	Config &config;

public:
	explicit ReclaimConfigParser(Config &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;
};

void
ReclaimConfigParser::ParseLine(LineParser &line)
{
	const char *word = line.ExpectWord();

	if (strcmp(word, "api_key") == 0) {
		config.api_key = line.ExpectValueAndEnd();
	} else if (strcmp(word, "api_url") == 0) {
		config.api_url = line.ExpectValueAndEnd();
	} else if (strcmp(word, "default_timezone") == 0) {
		config.default_time_zone = line.ExpectValueAndEnd();
	} else if (strcmp(word, "connect_timeout") == 0) {
		config.connect_timeout = std::chrono::seconds{line.NextPositiveInteger()};
		line.ExpectEnd();
	} else if (strcmp(word, "verbose") == 0) {
		const unsigned long level = ParseUnsignedLong(line.ExpectValueAndEnd());
		if (level > 10)
			throw LineParser::Error("Bad verbosity level");

		config.verbose = level;
	} else
		throw LineParser::Error("Unknown option");
}

void
LoadConfigFile(Config &config, const std::filesystem::path &path)
{
	ReclaimConfigParser parser(config);
	CommentConfigParser parser2(parser);
	ParseConfigFile(path, parser2);
}

static void
ApplyVariable(std::string &dest, const char *name) noexcept
{
	const char *value = getenv(name);
	if (value != nullptr && *value != 0)
		dest = value;
}

void
ApplyEnvironment(Config &config)
{
	ApplyVariable(config.api_key, "RECLAIM_API_KEY");
	ApplyVariable(config.api_url, "RECLAIM_API_URL");
	ApplyVariable(config.default_time_zone, "MCP_DEFAULT_TIMEZONE");
}

void
Config::Check() const
{
	if (api_key.empty())
		throw std::runtime_error("RECLAIM_API_KEY is not set; configure it in the environment or with \"api_key\" in the configuration file");

	if (api_url.empty())
		throw std::runtime_error("api_url must not be empty");
}
