// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Setup.hxx"
#include "Easy.hxx"
#include "version.h"

namespace Curl {

void
Setup(CurlEasy &easy, std::chrono::duration<long> connect_timeout)
{
	easy.SetUserAgent(PACKAGE " " VERSION);
	easy.SetNoProgress();
	easy.SetNoSignal();
	easy.SetConnectTimeout(connect_timeout);
}

} // namespace Curl
