// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AccountCache.hxx"
#include "RecordService.hxx"
#include "io/Logger.hxx"

namespace Reclaim {

Co::Task<AccountDefaults>
AccountCache::Load()
{
	const auto user = co_await source.FetchCurrentUser();
	co_return AccountDefaults::FromUser(user);
}

Co::Task<AccountDefaults>
AccountCache::Get()
{
	return loader.Get([this]{ return Load(); });
}

Co::Task<AccountDefaults>
AccountCache::GetOrEmpty()
{
	std::exception_ptr error;

	try {
		co_return co_await Get();
	} catch (...) {
		error = std::current_exception();
	}

	LoggerDetail::LogException(2, "account",
				   "Account defaults are not available",
				   error);
	co_return AccountDefaults{};
}

} // namespace Reclaim
