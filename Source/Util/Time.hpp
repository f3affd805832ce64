#pragma once
#include <chrono>
#include <ctime>
#include <string>
#include <spdlog/fmt/fmt.h>

#include "Types.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-function"

namespace WTime
{
	static WMsec GetEpochMs()
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::system_clock::now().time_since_epoch())
			.count();
	}

	// RFC3339 in UTC, e.g. 2025-11-02T14:03:00Z
	static std::string FormatRfc3339(WMsec EpochMs)
	{
		if (EpochMs <= 0)
		{
			return {};
		}
		std::time_t Seconds = static_cast<std::time_t>(EpochMs / 1000);
		std::tm     Tm{};
		gmtime_r(&Seconds, &Tm);
		char Buf[32];
		std::strftime(Buf, sizeof(Buf), "%Y-%m-%dT%H:%M:%SZ", &Tm);
		return Buf;
	}

	static std::string FormatDuration(WMsec DurationMs)
	{
		long Time = static_cast<long>(DurationMs / 1000);
		long Hours = Time / 3600;
		long Minutes = (Time % 3600) / 60;
		long Seconds = Time % 60;
		return fmt::format("{:02}:{:02}:{:02}", Hours, Minutes, Seconds);
	}
} // namespace WTime

#pragma GCC diagnostic pop
