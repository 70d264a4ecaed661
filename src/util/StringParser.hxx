// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Parse a bool represented by "yes"/"no" or "true"/"false"; throws
 * std::runtime_error on error.
 */
bool
ParseBool(const char *s);

unsigned long
ParseUnsignedLong(const char *s);

unsigned long
ParsePositiveLong(const char *s);

unsigned long
ParsePositiveLong(const char *s, unsigned long max_value);
