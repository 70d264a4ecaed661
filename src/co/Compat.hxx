// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <coroutine>

#ifndef __cpp_impl_coroutine
#error Need -fcoroutines
#endif
