/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <memory>
#include <utility>
#include <atomic>
#include <mutex>

#include "Buffer.hpp"
#include "Types.hpp"

enum ESocketFamily
{
	SF_Unix,
	SF_Tcp
};

struct WSocketAddress
{
	ESocketFamily Family{ SF_Unix };
	std::string   Path{};
	std::string   Host{ "127.0.0.1" };
	WPort         Port{ 0 };

	static WSocketAddress Unix(std::string Path_)
	{
		WSocketAddress Addr{};
		Addr.Family = SF_Unix;
		Addr.Path = std::move(Path_);
		return Addr;
	}

	static WSocketAddress Tcp(std::string Host_, WPort Port_)
	{
		WSocketAddress Addr{};
		Addr.Family = SF_Tcp;
		Addr.Host = std::move(Host_);
		Addr.Port = Port_;
		return Addr;
	}

	// IPv4 address for the Tcp family, resolving host names
	bool Resolve(sockaddr_in& Out) const;

	[[nodiscard]] std::string ToString() const
	{
		if (Family == SF_Unix)
		{
			return Path;
		}
		return Host + ":" + std::to_string(Port);
	}
};

class WSocket
{
protected:
	int            SocketFd{ -1 };
	WSocketAddress Address{};

	explicit WSocket(int SocketFd_)
		: SocketFd(SocketFd_)
	{
	}

	bool OpenFd();

public:
	explicit WSocket(WSocketAddress Address_)
		: Address(std::move(Address_))
	{
	}

	virtual ~WSocket() = default;

	WSocket(WSocket const&) = delete;
	WSocket& operator=(WSocket const&) = delete;

	[[nodiscard]] int GetFd() const
	{
		return SocketFd;
	}

	[[nodiscard]] WSocketAddress const& GetAddress() const
	{
		return Address;
	}
};

enum ESocketState
{
	ES_Initial,
	ES_Opened,
	ES_Connected
};

enum EReceiveResult
{
	RR_Data,
	RR_Timeout,
	RR_Closed,
	RR_Error
};

class WClientSocket : public WSocket
{
	std::atomic<ESocketState> State{};
	std::mutex                SendMutex{};
	WBuffer                   Accum{};
	WBuffer                   FrameBuffer{};

	// Waits until the fd is readable, returns RR_Data when it is
	EReceiveResult WaitReadable(int TimeoutMs) const;

public:
	explicit WClientSocket(int SocketFd_)
		: WSocket(SocketFd_)
	{
		State = SocketFd_ >= 0 ? ES_Connected : ES_Initial;
	}

	explicit WClientSocket(WSocketAddress const& Address_)
		: WSocket(Address_)
	{
	}

	~WClientSocket() override
	{
		Close();
	}

	void Close();

	// Unblocks a reader on another thread without releasing the fd
	void Shutdown() const;

	// Signals EOF to the peer, reading stays possible
	void ShutdownWrite() const;

	bool Open();

	bool Connect(int TimeoutMs = -1);

	ssize_t Send(char const* Data, size_t Len);

	ssize_t SendFramed(std::string const& Payload);

	// Reads one length-prefixed frame, TimeoutMs < 0 waits forever
	EReceiveResult ReceiveFrame(std::string& OutPayload, int TimeoutMs);

	// Reads whatever is available up to Len bytes
	EReceiveResult ReceiveSome(char* Buf, size_t Len, size_t& OutRead, int TimeoutMs);

	[[nodiscard]] ESocketState GetState() const
	{
		return State.load(std::memory_order_acquire);
	}

	[[nodiscard]] bool IsConnected() const
	{
		return GetState() == ES_Connected;
	}
};

class WServerSocket : public WSocket
{
	int  LastError{ 0 };
	bool bUnlinkOnClose{ true };

public:
	explicit WServerSocket(WSocketAddress const& Address_)
		: WSocket(Address_)
	{
	}

	~WServerSocket() override
	{
		Close();
	}

	void Close();

	bool BindAndListen(int Backlog = 16);

	std::shared_ptr<WClientSocket> Accept(int TimeoutMs = -1, bool* bTimedOut = nullptr) const;

	// errno of the last failed bind or listen
	[[nodiscard]] int GetLastError() const
	{
		return LastError;
	}

	[[nodiscard]] bool IsListening() const
	{
		return SocketFd >= 0;
	}

	// Actual port after binding port 0
	[[nodiscard]] WPort GetBoundPort() const;

	void SetUnlinkOnClose(bool bUnlink)
	{
		bUnlinkOnClose = bUnlink;
	}
};
