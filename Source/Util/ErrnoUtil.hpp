/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cerrno>
#include <cstring>
#include <string>

class WErrnoUtil
{
public:
	static std::string StrError() { return std::string(strerror(errno)); }

	static std::string StrError(int Error) { return std::string(strerror(Error)); }

	[[nodiscard]] static bool IsAddressInUse(int Error) { return Error == EADDRINUSE; }

	[[nodiscard]] static bool IsPermissionDenied(int Error) { return Error == EACCES || Error == EPERM; }

	// Errors that mean the peer or the local side closed the connection
	[[nodiscard]] static bool IsConnectionEnded(int Error)
	{
		return Error == EBADF || Error == ECONNRESET || Error == ENOTCONN || Error == EPIPE || Error == ESHUTDOWN
			|| Error == EINVAL;
	}
};
