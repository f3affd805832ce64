//
// Created by usr on 09/10/2025.
//

#pragma once

#include "ErrnoUtil.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <cstdlib>
#include <vector>

namespace stdfs = std::filesystem;

class WFilesystem
{
public:
	static bool Exists(stdfs::path const& p)
	{
		std::error_code Ec;
		return stdfs::exists(p, Ec);
	}

	static bool Writable(stdfs::path const& p)
	{
		return access(p.c_str(), W_OK) == 0;
	}

	static bool EnsureDirectory(stdfs::path const& p)
	{
		std::error_code Ec;
		if (stdfs::is_directory(p, Ec))
		{
			return true;
		}
		if (!stdfs::create_directories(p, Ec) && Ec)
		{
			spdlog::error("Failed to create directory '{}': {}", p.string(), Ec.message());
			return false;
		}
		return true;
	}

	static bool ReadFile(stdfs::path const& p, std::string& OutContent)
	{
		std::ifstream FileStream(p, std::ios::in | std::ios::binary);
		if (!FileStream)
			return false;

		std::ostringstream ss;
		ss << FileStream.rdbuf();
		OutContent = ss.str();
		return true;
	}

	// Writes to a sibling temp file and renames it over the target
	static bool WriteFileAtomic(stdfs::path const& p, std::string const& Content)
	{
		stdfs::path Tmp = p;
		Tmp += ".tmp";
		{
			std::ofstream FileStream(Tmp, std::ios::out | std::ios::binary | std::ios::trunc);
			if (!FileStream)
			{
				spdlog::error("Failed to open '{}' for writing", Tmp.string());
				return false;
			}
			FileStream << Content;
			if (!FileStream.flush())
			{
				spdlog::error("Failed to write '{}'", Tmp.string());
				return false;
			}
		}

		std::error_code Ec;
		stdfs::rename(Tmp, p, Ec);
		if (Ec)
		{
			spdlog::error("Failed to move '{}' to '{}': {}", Tmp.string(), p.string(), Ec.message());
			stdfs::remove(Tmp, Ec);
			return false;
		}
		return true;
	}

	static void RemoveFile(stdfs::path const& p)
	{
		std::error_code Ec;
		stdfs::remove(p, Ec);
	}

	static bool SetPermissions(std::string const& Path, mode_t Mode)
	{
		if (chmod(Path.c_str(), Mode) != 0)
		{
			spdlog::error("chmod({}) failed: {} ({})", Path, WErrnoUtil::StrError(), errno);
			return false;
		}
		return true;
	}

	// Readlink helper that returns the symlink target as string; returns empty on failure.
	static std::string ReadLink(std::string const& Path)
	{
		std::vector<char> Buf(256);
		while (true)
		{
			ssize_t N = ::readlink(Path.c_str(), Buf.data(), Buf.size());
			if (N < 0)
			{
				return {};
			}
			if (static_cast<size_t>(N) < Buf.size())
			{
				return { Buf.data(), static_cast<size_t>(N) };
			}
			Buf.resize(Buf.size() * 2);
		}
	}

	static stdfs::path GetExecutableFolder()
	{
		std::string Exe = ReadLink("/proc/self/exe");
		if (Exe.empty())
		{
			return {};
		}
		return stdfs::path(Exe).parent_path();
	}

	// $XDG_CONFIG_HOME or ~/.config, empty if neither can be determined
	static stdfs::path GetConfigFolder()
	{
		if (char const* Xdg = std::getenv("XDG_CONFIG_HOME"); Xdg && *Xdg)
		{
			return stdfs::path(Xdg);
		}
		if (char const* Home = std::getenv("HOME"); Home && *Home)
		{
			return stdfs::path(Home) / ".config";
		}
		return {};
	}
};
