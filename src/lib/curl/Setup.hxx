// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <chrono>

class CurlEasy;

namespace Curl {

/**
 * Apply the settings shared by all requests of this program.
 */
void
Setup(CurlEasy &easy,
      std::chrono::duration<long> connect_timeout=std::chrono::seconds{10});

} // namespace Curl
