//
// Created by usr on 28/10/2025.
//

#pragma once
#include <string>
#include <vector>
#include <spdlog/fmt/fmt.h>

#include "Types.hpp"

class WStorageFormat
{
public:
	static std::string AutoFormat(WBytes Bytes_)
	{
		auto Bytes = static_cast<double>(Bytes_);
		if (Bytes < 1024)
		{
			return fmt::format("{} B", Bytes_);
		}
		if (Bytes < 1024 * 1024)
		{
			return fmt::format("{:.2f} KiB", Bytes / 1024.0);
		}
		if (Bytes < 1024 * 1024 * 1024)
		{
			return fmt::format("{:.2f} MiB", Bytes / (1024.0 * 1024.0));
		}
		return fmt::format("{:.2f} GiB", Bytes / (1024.0 * 1024.0 * 1024.0));
	}
};

class WStringFormat
{
public:
	static std::vector<std::string> Split(std::string const& Str, char Sep)
	{
		std::vector<std::string> Parts{};
		std::string              Current{};
		for (char C : Str)
		{
			if (C == Sep)
			{
				Parts.emplace_back(std::move(Current));
				Current.clear();
			}
			else
			{
				Current.push_back(C);
			}
		}
		Parts.emplace_back(std::move(Current));
		return Parts;
	}

	static std::string Trim(std::string const& Str)
	{
		auto Begin = Str.find_first_not_of(" \t\r\n");
		if (Begin == std::string::npos)
		{
			return {};
		}
		auto End = Str.find_last_not_of(" \t\r\n");
		return Str.substr(Begin, End - Begin + 1);
	}

	// Parses "host:port", the host may be empty (":8080")
	static bool ParseHostPort(std::string const& Addr, std::string& OutHost, int& OutPort)
	{
		auto Colon = Addr.rfind(':');
		if (Colon == std::string::npos)
		{
			return false;
		}
		OutHost = Addr.substr(0, Colon);
		try
		{
			OutPort = std::stoi(Addr.substr(Colon + 1));
		}
		catch (std::exception const&)
		{
			return false;
		}
		return OutPort > 0 && OutPort <= 65535;
	}
};
