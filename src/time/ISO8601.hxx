// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <string>

/**
 * Format the given time point in UTC with millisecond precision,
 * e.g. "2026-01-05T16:00:00.000Z".  Sub-millisecond fractions are
 * truncated.
 */
std::string
FormatISO8601(std::chrono::system_clock::time_point tp);
