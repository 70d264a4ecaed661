// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <algorithm>

#include <sys/uio.h>
#include <unistd.h>

unsigned LoggerDetail::max_level = 1;

static struct iovec
MakeIovec(std::string_view s) noexcept
{
	return {const_cast<char *>(s.data()), s.size()};
}

void
LoggerDetail::WriteV(std::string_view domain,
		     std::initializer_list<std::string_view> buffers) noexcept
{
	struct iovec v[16];
	std::size_t n = 0;

	if (!domain.empty()) {
		v[n++] = MakeIovec("[");
		v[n++] = MakeIovec(domain);
		v[n++] = MakeIovec("] ");
	}

	for (const auto i : buffers) {
		if (n >= std::size(v) - 1)
			break;

		v[n++] = MakeIovec(i);
	}

	v[n++] = MakeIovec("\n");

	ssize_t nbytes = writev(STDERR_FILENO, v, n);
	(void)nbytes;
}

void
LoggerDetail::Fmt(unsigned level, std::string_view domain,
		  fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!CheckLevel(level))
		return;

	/* long messages are truncated */
	char buffer[1024];
	const auto result = fmt::vformat_to_n(buffer, sizeof(buffer),
					      format_str, args);
	const std::size_t length = std::min(result.size, sizeof(buffer));

	WriteV(domain, {std::string_view{buffer, length}});
}

void
LoggerDetail::LogException(unsigned level, std::string_view domain,
			   std::string_view msg, std::exception_ptr ep) noexcept
{
	if (!CheckLevel(level))
		return;

	const auto what = GetFullMessage(std::move(ep));
	WriteV(domain, {msg, ": ", what});
}
