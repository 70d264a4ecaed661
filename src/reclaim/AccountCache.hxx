// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "AccountDefaults.hxx"
#include "co/SharedLoader.hxx"

namespace Reclaim {

class AccountInfoSource;

/**
 * Fetches the #AccountDefaults once per process and shares them.
 * Concurrent callers wait for the same request; a failure is
 * remembered as well and not retried.
 */
class AccountCache {
	AccountInfoSource &source;

	Co::SharedLoader<AccountDefaults> loader;

public:
	explicit AccountCache(AccountInfoSource &_source) noexcept
		:source(_source) {}

	AccountCache(const AccountCache &) = delete;
	AccountCache &operator=(const AccountCache &) = delete;

	/**
	 * Obtain the defaults.  Throws if fetching them has failed.
	 */
	Co::Task<AccountDefaults> Get();

	/**
	 * Like Get(), but return empty defaults if fetching them has
	 * failed.
	 */
	Co::Task<AccountDefaults> GetOrEmpty();

	bool IsReady() const noexcept {
		return loader.IsReady();
	}

private:
	Co::Task<AccountDefaults> Load();
};

} // namespace Reclaim
