// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "LineParser.hxx"

#include <fmt/format.h>

#include <cerrno>
#include <memory>
#include <system_error>

#include <stdio.h>

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (line.front() == '#' || line.IsEnd())
		/* ignore comments and empty lines */
		return true;

	return child.PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
}

struct FileCloser {
	void operator()(FILE *f) const noexcept {
		fclose(f);
	}
};

void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser)
{
	std::unique_ptr<FILE, FileCloser> file{fopen(path.c_str(), "r")};
	if (!file)
		throw std::system_error(errno, std::system_category(),
					fmt::format("Failed to open {}",
						    path.string()));

	char buffer[4096];
	unsigned no = 0;

	while (fgets(buffer, sizeof(buffer), file.get()) != nullptr) {
		++no;

		try {
			LineParser line(buffer);
			if (!parser.PreParseLine(line))
				parser.ParseLine(line);
		} catch (...) {
			std::throw_with_nested(std::runtime_error(fmt::format("Error in {} line {}",
									      path.string(), no)));
		}
	}

	parser.Finish();
}
