// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "CommandLine.hxx"
#include "io/ConfigParser.hxx"
#include "io/LineParser.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

class MyConfigParser final
	: public ConfigParser, public std::vector<std::string> {
public:
	void ParseLine(LineParser &line) override {
		const char *value = line.ExpectValueAndEnd();
		emplace_back(value);
	}
};

static std::string
WriteTempFile(const char *contents)
{
	std::string path = testing::TempDir() + "reclaim-mcp-config-XXXXXX";
	const int fd = mkstemp(path.data());
	if (fd < 0)
		throw std::runtime_error("mkstemp() failed");

	const std::size_t length = strlen(contents);
	const bool ok = write(fd, contents, length) == ssize_t(length);
	close(fd);
	if (!ok)
		throw std::runtime_error("write() failed");

	return path;
}

TEST(LineParser, Words)
{
	char buffer[] = "  api_url https://example.com/api/  ";
	LineParser line(buffer);

	EXPECT_FALSE(line.SkipWord("api_key"));
	EXPECT_STREQ(line.ExpectWord(), "api_url");
	EXPECT_STREQ(line.ExpectValueAndEnd(), "https://example.com/api/");
	EXPECT_TRUE(line.IsEnd());
}

TEST(LineParser, Quoted)
{
	char buffer[] = "key \"a b#c\" 'x'";
	LineParser line(buffer);

	EXPECT_STREQ(line.ExpectWord(), "key");
	EXPECT_STREQ(line.NextValue(), "a b#c");
	EXPECT_STREQ(line.NextValue(), "x");
	EXPECT_NO_THROW(line.ExpectEnd());
}

TEST(LineParser, Errors)
{
	char unterminated[] = "key \"abc";
	LineParser l1(unterminated);
	l1.ExpectWord();
	EXPECT_THROW(l1.NextValue(), LineParser::Error);

	char garbage[] = "key value extra";
	LineParser l2(garbage);
	l2.ExpectWord();
	EXPECT_THROW(l2.ExpectValueAndEnd(), LineParser::Error);

	char number[] = "0";
	LineParser l3(number);
	EXPECT_THROW(l3.NextPositiveInteger(), LineParser::Error);

	char boolean[] = "yes";
	LineParser l4(boolean);
	EXPECT_TRUE(l4.NextBool());
}

TEST(ConfigParser, Comments)
{
	const auto path = WriteTempFile("# comment\n"
					"\n"
					"foo\n"
					"   \n"
					"  'bar baz'  \n");

	MyConfigParser parser;
	CommentConfigParser comment_parser(parser);
	ParseConfigFile(path, comment_parser);
	unlink(path.c_str());

	ASSERT_EQ(parser.size(), 2U);
	EXPECT_EQ(parser[0], "foo");
	EXPECT_EQ(parser[1], "bar baz");
}

TEST(Config, Load)
{
	const auto path = WriteTempFile("api_key \"secret-key_123\"\n"
					"api_url https://reclaim.example/api/\n"
					"default_timezone Europe/Berlin\n"
					"connect_timeout 5\n"
					"verbose 2\n");

	Config config;
	LoadConfigFile(config, path);
	unlink(path.c_str());

	EXPECT_EQ(config.api_key, "secret-key_123");
	EXPECT_EQ(config.api_url, "https://reclaim.example/api/");
	EXPECT_EQ(config.default_time_zone, "Europe/Berlin");
	EXPECT_EQ(config.connect_timeout, std::chrono::seconds{5});
	EXPECT_EQ(config.verbose, 2U);
	EXPECT_NO_THROW(config.Check());
}

TEST(Config, Error)
{
	const auto path = WriteTempFile("api_key x\n"
					"colour blue\n");

	Config config;
	try {
		LoadConfigFile(config, path);
		FAIL();
	} catch (const std::runtime_error &) {
		const auto msg = GetFullMessage(std::current_exception());
		EXPECT_NE(msg.find("line 2"), std::string::npos) << msg;
		EXPECT_NE(msg.find("Unknown option"), std::string::npos) << msg;
	}

	unlink(path.c_str());

	EXPECT_THROW(LoadConfigFile(config, "/nonexistent/reclaim-mcp.conf"),
		     std::system_error);
}

TEST(Config, Environment)
{
	setenv("RECLAIM_API_KEY", "env-key", 1);
	setenv("MCP_DEFAULT_TIMEZONE", "Asia/Tokyo", 1);
	unsetenv("RECLAIM_API_URL");

	Config config;
	config.api_key = "file-key";
	ApplyEnvironment(config);

	EXPECT_EQ(config.api_key, "env-key");
	EXPECT_EQ(config.default_time_zone, "Asia/Tokyo");
	EXPECT_EQ(config.api_url, "https://api.app.reclaim.ai/api/");

	unsetenv("RECLAIM_API_KEY");
	unsetenv("MCP_DEFAULT_TIMEZONE");

	EXPECT_THROW(Config{}.Check(), std::runtime_error);
}

TEST(CommandLine, Parse)
{
	char arg0[] = "reclaim-mcp", arg1[] = "-v", arg2[] = "--config",
		arg3[] = "/etc/reclaim.conf", arg4[] = "--verbose";
	char *argv[] = {arg0, arg1, arg2, arg3, arg4, nullptr};

	const auto cmdline = ParseCommandLine(5, argv);
	EXPECT_EQ(cmdline.verbose, 2U);
	EXPECT_EQ(cmdline.config_path, "/etc/reclaim.conf");

	char arg5[] = "--config=/tmp/x.conf";
	char *argv2[] = {arg0, arg5, nullptr};
	EXPECT_EQ(ParseCommandLine(2, argv2).config_path, "/tmp/x.conf");

	char arg6[] = "--bogus";
	char *argv3[] = {arg0, arg6, nullptr};
	EXPECT_THROW(ParseCommandLine(2, argv3), std::runtime_error);

	char *argv4[] = {arg0, arg2, nullptr};
	EXPECT_THROW(ParseCommandLine(2, argv4), std::runtime_error);
}
