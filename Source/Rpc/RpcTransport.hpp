/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include <sys/stat.h>

#include "Filesystem.hpp"
#include "Socket.hpp"

enum ERpcTransportKind
{
	RK_Default,
	RK_Unix,
	RK_Tcp
};

struct WRpcTransportConfig
{
	ERpcTransportKind Kind{ RK_Default };

	std::string SocketPath{ "/tmp/weiche.sock" };
	mode_t      SocketPermissions{ 0666 };

	std::vector<WPort> Ports{ 19846, 19856, 19866, 19876, 19886 };

	// Discovery files, written in this order and read in this order
	std::string MachinePortFile{ "/run/weiche/ipc_port" };
	std::string UserPortFile{};
	bool        bUsePortFiles{ true };

	static std::string DefaultUserPortFile()
	{
		stdfs::path Config = WFilesystem::GetConfigFolder();
		return Config.empty() ? std::string{} : (Config / "weiche" / "ipc_port").string();
	}
};

class IRpcTransport
{
public:
	IRpcTransport() = default;
	virtual ~IRpcTransport() = default;

	// Bound and listening socket, nullptr if no endpoint could be claimed
	virtual std::unique_ptr<WServerSocket> Listen() = 0;

	virtual std::shared_ptr<WClientSocket> Dial(int TimeoutMs) = 0;

	// Removes whatever Listen() left on disk
	virtual void Cleanup() = 0;

	[[nodiscard]] virtual std::string Describe() const = 0;

	// Number of endpoints Dial() may have to try
	[[nodiscard]] virtual size_t GetEndpointCount() const { return 1; }
};

class WUnixRpcTransport final : public IRpcTransport
{
	std::string SocketPath{};
	mode_t      Permissions{ 0666 };

public:
	WUnixRpcTransport(std::string SocketPath_, mode_t Permissions_)
		: SocketPath(std::move(SocketPath_)), Permissions(Permissions_)
	{
	}

	std::unique_ptr<WServerSocket> Listen() override;
	std::shared_ptr<WClientSocket> Dial(int TimeoutMs) override;
	void                           Cleanup() override;

	[[nodiscard]] std::string Describe() const override { return "unix:" + SocketPath; }
};

class WTcpRpcTransport final : public IRpcTransport
{
	std::vector<WPort>       Ports{};
	std::vector<std::string> PortFiles{};
	WPort                    ListeningPort{ 0 };

	// First port found in a readable discovery file
	[[nodiscard]] bool ReadDiscoveredPort(WPort& OutPort) const;

	void WritePortFiles(WPort Port) const;

public:
	WTcpRpcTransport(std::vector<WPort> Ports_, std::vector<std::string> PortFiles_);

	std::unique_ptr<WServerSocket> Listen() override;
	std::shared_ptr<WClientSocket> Dial(int TimeoutMs) override;
	void                           Cleanup() override;

	[[nodiscard]] WPort GetListeningPort() const { return ListeningPort; }

	[[nodiscard]] size_t GetEndpointCount() const override { return Ports.size(); }

	[[nodiscard]] std::string Describe() const override;
};

class WRpcTransportFactory
{
public:
	static std::shared_ptr<IRpcTransport> Create(WRpcTransportConfig const& Config = {});
};
