// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Config.hxx"
#include "mcp/Server.hxx"
#include "mcp/ToolHandler.hxx"
#include "reclaim/AccountCache.hxx"
#include "reclaim/HttpClient.hxx"
#include "lib/curl/Global.hxx"
#include "co/InvokeTask.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <stdexcept>

#include <stdlib.h>
#include <stdio.h>

struct Instance final {
	const ScopeCurlInit curl_init;

	Reclaim::HttpClient client;
	Reclaim::AccountCache account;

	Mcp::ToolHandler tools;
	Mcp::Server server;

	Co::InvokeTask bootstrap;

	explicit Instance(const Config &config)
		:client(config.api_url, config.api_key, config.connect_timeout),
		 account(client),
		 tools(client, account, config.default_time_zone),
		 server(tools, stdout) {}

	/**
	 * Fetch the account (and its time zone) right away so the
	 * first request does not have to wait for it.
	 */
	void StartBootstrap() noexcept {
		bootstrap = Bootstrap();
		bootstrap.OnCompletion(BIND_THIS_METHOD(OnBootstrapComplete));
	}

private:
	Co::InvokeTask Bootstrap() {
		const auto defaults = co_await account.Get();
		if (defaults.time_zone.empty())
			throw std::runtime_error("Account has no time zone");

		LogFmt(1, "bootstrap", "Default timezone set from Reclaim account: {}",
		       defaults.time_zone);
	}

	void OnBootstrapComplete(std::exception_ptr error) noexcept {
		if (error)
			LoggerDetail::LogException(1, "bootstrap",
						   "Could not fetch Reclaim account timezone; falling back to the server machine timezone",
						   std::move(error));
	}
};

static int
Run(const Config &config)
{
	Instance instance{config};

	if (config.default_time_zone.empty())
		instance.StartBootstrap();
	else
		LogFmt(2, "bootstrap", "Default timezone: {}",
		       config.default_time_zone);

	instance.server.Run(stdin);
	return EXIT_SUCCESS;
}

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = ParseCommandLine(argc, argv);

	Config config;
	if (!cmdline.config_path.empty())
		LoadConfigFile(config, cmdline.config_path);
	ApplyEnvironment(config);
	config.Check();

	SetLogLevel(config.verbose + cmdline.verbose);

	return Run(config);
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
