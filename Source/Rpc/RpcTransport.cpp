/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RpcTransport.hpp"

#include <algorithm>
#include <charconv>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"
#include "Format.hpp"

std::unique_ptr<WServerSocket> WUnixRpcTransport::Listen()
{
	if (WFilesystem::Exists(SocketPath))
	{
		// A file nobody answers on is left over from a crashed server
		if (Dial(500))
		{
			spdlog::error("Another server is already listening on {}", SocketPath);
			return nullptr;
		}
		spdlog::info("Removing stale socket {}", SocketPath);
		WFilesystem::RemoveFile(SocketPath);
	}

	auto Socket = std::make_unique<WServerSocket>(WSocketAddress::Unix(SocketPath));
	if (!Socket->BindAndListen())
	{
		spdlog::error("Failed to listen on {}: {}", SocketPath, WErrnoUtil::StrError(Socket->GetLastError()));
		return nullptr;
	}
	if (!WFilesystem::SetPermissions(SocketPath, Permissions))
	{
		spdlog::warn("Failed to set permissions {:o} on {}: {}", Permissions, SocketPath, WErrnoUtil::StrError());
	}
	return Socket;
}

std::shared_ptr<WClientSocket> WUnixRpcTransport::Dial(int TimeoutMs)
{
	auto Socket = std::make_shared<WClientSocket>(WSocketAddress::Unix(SocketPath));
	if (!Socket->Connect(TimeoutMs))
	{
		return nullptr;
	}
	return Socket;
}

void WUnixRpcTransport::Cleanup()
{
	WFilesystem::RemoveFile(SocketPath);
}

WTcpRpcTransport::WTcpRpcTransport(std::vector<WPort> Ports_, std::vector<std::string> PortFiles_)
	: Ports(std::move(Ports_))
{
	for (auto& File : PortFiles_)
	{
		if (!File.empty())
		{
			PortFiles.push_back(std::move(File));
		}
	}
}

std::string WTcpRpcTransport::Describe() const
{
	if (ListeningPort != 0)
	{
		return fmt::format("tcp:127.0.0.1:{}", ListeningPort);
	}
	std::string Names{};
	for (WPort Port : Ports)
	{
		Names += (Names.empty() ? "" : ",") + std::to_string(Port);
	}
	return fmt::format("tcp:127.0.0.1:{{{}}}", Names);
}

std::unique_ptr<WServerSocket> WTcpRpcTransport::Listen()
{
	for (WPort Port : Ports)
	{
		auto Socket = std::make_unique<WServerSocket>(WSocketAddress::Tcp("127.0.0.1", Port));
		if (!Socket->BindAndListen())
		{
			spdlog::debug("Port {} unavailable: {}", Port, WErrnoUtil::StrError(Socket->GetLastError()));
			continue;
		}

		ListeningPort = Socket->GetBoundPort();
		WritePortFiles(ListeningPort);
		return Socket;
	}

	spdlog::error("None of the candidate ports could be bound");
	return nullptr;
}

void WTcpRpcTransport::WritePortFiles(WPort Port) const
{
	for (auto const& File : PortFiles)
	{
		stdfs::path Path(File);
		if (!WFilesystem::EnsureDirectory(Path.parent_path()) || !WFilesystem::WriteFileAtomic(Path, std::to_string(Port)))
		{
			// The per-user file is enough for clients of the same user
			spdlog::warn("Failed to write port file {}", File);
			continue;
		}
		spdlog::debug("Wrote port {} to {}", Port, File);
	}
}

bool WTcpRpcTransport::ReadDiscoveredPort(WPort& OutPort) const
{
	for (auto const& File : PortFiles)
	{
		std::string Content{};
		if (!WFilesystem::ReadFile(File, Content))
		{
			continue;
		}
		Content = WStringFormat::Trim(Content);

		unsigned Value = 0;
		auto [Ptr, Ec] = std::from_chars(Content.data(), Content.data() + Content.size(), Value);
		if (Ec != std::errc{} || Value == 0 || Value > 65535)
		{
			spdlog::debug("Ignoring malformed port file {}", File);
			continue;
		}
		OutPort = static_cast<WPort>(Value);
		return true;
	}
	return false;
}

std::shared_ptr<WClientSocket> WTcpRpcTransport::Dial(int TimeoutMs)
{
	std::vector<WPort> Candidates{};
	if (WPort Discovered = 0; ReadDiscoveredPort(Discovered))
	{
		Candidates.push_back(Discovered);
	}
	for (WPort Port : Ports)
	{
		if (Port != 0 && std::ranges::find(Candidates, Port) == Candidates.end())
		{
			Candidates.push_back(Port);
		}
	}
	if (Candidates.empty())
	{
		return nullptr;
	}

	int PerAttempt = std::max(1, TimeoutMs / static_cast<int>(Candidates.size()));
	for (WPort Port : Candidates)
	{
		auto Socket = std::make_shared<WClientSocket>(WSocketAddress::Tcp("127.0.0.1", Port));
		if (Socket->Connect(PerAttempt))
		{
			return Socket;
		}
	}
	return nullptr;
}

void WTcpRpcTransport::Cleanup()
{
	if (ListeningPort == 0)
	{
		return;
	}

	for (auto const& File : PortFiles)
	{
		// Only remove files that still point at us
		std::string Content{};
		if (WFilesystem::ReadFile(File, Content) && WStringFormat::Trim(Content) == std::to_string(ListeningPort))
		{
			WFilesystem::RemoveFile(File);
		}
	}
	ListeningPort = 0;
}

std::shared_ptr<IRpcTransport> WRpcTransportFactory::Create(WRpcTransportConfig const& Config)
{
	ERpcTransportKind Kind = Config.Kind;
	if (Kind == RK_Default)
	{
#ifdef _WIN32
		Kind = RK_Tcp;
#else
		Kind = RK_Unix;
#endif
	}

	if (Kind == RK_Tcp)
	{
		std::vector<std::string> PortFiles{};
		if (Config.bUsePortFiles)
		{
			PortFiles.push_back(Config.MachinePortFile);
			PortFiles.push_back(
				Config.UserPortFile.empty() ? WRpcTransportConfig::DefaultUserPortFile() : Config.UserPortFile);
		}
		return std::make_shared<WTcpRpcTransport>(Config.Ports, std::move(PortFiles));
	}
	return std::make_shared<WUnixRpcTransport>(Config.SocketPath, Config.SocketPermissions);
}
