/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Socket.hpp"

#include <arpa/inet.h>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"

namespace
{
	bool ResolveInet(std::string const& Host, WPort Port, sockaddr_in& Out)
	{
		Out = {};
		Out.sin_family = AF_INET;
		Out.sin_port = htons(Port);
		if (Host.empty() || Host == "0.0.0.0")
		{
			Out.sin_addr.s_addr = htonl(INADDR_ANY);
			return true;
		}
		if (inet_pton(AF_INET, Host.c_str(), &Out.sin_addr) == 1)
		{
			return true;
		}

		addrinfo  Hints{};
		addrinfo* Res = nullptr;
		Hints.ai_family = AF_INET;
		Hints.ai_socktype = SOCK_STREAM;
		if (int Err = getaddrinfo(Host.c_str(), nullptr, &Hints, &Res); Err != 0 || Res == nullptr)
		{
			spdlog::debug("Failed to resolve {}: {}", Host, gai_strerror(Err));
			return false;
		}
		Out.sin_addr = reinterpret_cast<sockaddr_in*>(Res->ai_addr)->sin_addr;
		freeaddrinfo(Res);
		return true;
	}

	bool FillUnix(std::string const& Path, sockaddr_un& Out, socklen_t& OutLen)
	{
		Out = {};
		Out.sun_family = AF_UNIX;
		if (Path.size() >= sizeof(Out.sun_path))
		{
			spdlog::error("Socket path too long: {}", Path);
			return false;
		}
		std::strncpy(Out.sun_path, Path.c_str(), sizeof(Out.sun_path) - 1);
		OutLen = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + Path.size() + 1);
		return true;
	}

	using WClock = std::chrono::steady_clock;

	int RemainingMs(WClock::time_point Deadline)
	{
		auto Left = std::chrono::duration_cast<std::chrono::milliseconds>(Deadline - WClock::now()).count();
		return Left > 0 ? static_cast<int>(Left) : 0;
	}
} // namespace

bool WSocketAddress::Resolve(sockaddr_in& Out) const
{
	return ResolveInet(Host, Port, Out);
}

bool WSocket::OpenFd()
{
	int Domain = Address.Family == SF_Unix ? AF_UNIX : AF_INET;
	SocketFd = socket(Domain, SOCK_STREAM | SOCK_CLOEXEC, 0);
	return SocketFd >= 0;
}

void WClientSocket::Close()
{
	if (SocketFd < 0)
	{
		return;
	}

	close(SocketFd);
	SocketFd = -1;
	State = ES_Initial;
	Accum.Reset();
}

void WClientSocket::Shutdown() const
{
	if (SocketFd >= 0)
	{
		shutdown(SocketFd, SHUT_RDWR);
	}
}

void WClientSocket::ShutdownWrite() const
{
	if (SocketFd >= 0)
	{
		shutdown(SocketFd, SHUT_WR);
	}
}

bool WClientSocket::Open()
{
	if (State == ES_Opened)
	{
		return true;
	}

	if (!OpenFd())
	{
		return false;
	}
	State = ES_Opened;
	return true;
}

bool WClientSocket::Connect(int TimeoutMs)
{
	if (State == ES_Connected)
	{
		return true;
	}

	if (SocketFd < 0 && !Open())
	{
		return false;
	}

	sockaddr_storage Storage{};
	socklen_t        AddrLen{};
	if (Address.Family == SF_Unix)
	{
		if (!FillUnix(Address.Path, reinterpret_cast<sockaddr_un&>(Storage), AddrLen))
		{
			Close();
			return false;
		}
	}
	else
	{
		if (!ResolveInet(Address.Host, Address.Port, reinterpret_cast<sockaddr_in&>(Storage)))
		{
			Close();
			return false;
		}
		AddrLen = sizeof(sockaddr_in);
	}

	int const Flags = fcntl(SocketFd, F_GETFL, 0);
	if (TimeoutMs >= 0)
	{
		fcntl(SocketFd, F_SETFL, Flags | O_NONBLOCK);
	}

	int Ret = connect(SocketFd, reinterpret_cast<sockaddr*>(&Storage), AddrLen);
	if (Ret < 0 && TimeoutMs >= 0 && (errno == EINPROGRESS || errno == EAGAIN))
	{
		pollfd pfd{};
		pfd.fd = SocketFd;
		pfd.events = POLLOUT;
		Ret = poll(&pfd, 1, TimeoutMs);
		if (Ret == 0)
		{
			spdlog::debug("Timed out connecting to {}", Address.ToString());
			Close();
			return false;
		}
		int       SoError = 0;
		socklen_t Len = sizeof(SoError);
		if (Ret < 0 || getsockopt(SocketFd, SOL_SOCKET, SO_ERROR, &SoError, &Len) < 0 || SoError != 0)
		{
			spdlog::debug("Failed to connect to {}: {}", Address.ToString(), WErrnoUtil::StrError(SoError ? SoError : errno));
			Close();
			return false;
		}
		Ret = 0;
	}

	if (Ret < 0)
	{
		spdlog::debug("Failed to connect to {}: {} ({})", Address.ToString(), WErrnoUtil::StrError(), errno);
		Close();
		return false;
	}

	fcntl(SocketFd, F_SETFL, Flags);
	if (Address.Family == SF_Tcp)
	{
		int One = 1;
		setsockopt(SocketFd, IPPROTO_TCP, TCP_NODELAY, &One, sizeof(One));
	}
	State = ES_Connected;
	return true;
}

ssize_t WClientSocket::Send(char const* Data, size_t Len)
{
	size_t Total = 0;
	while (Total < Len)
	{
		ssize_t Sent = send(SocketFd, Data + Total, Len - Total, MSG_NOSIGNAL);
		if (Sent < 0)
		{
			if (errno == EINTR)
				continue;
			if (!WErrnoUtil::IsConnectionEnded(errno))
			{
				spdlog::error("Socket send error: {} ({})", WErrnoUtil::StrError(), errno);
			}
			State = ES_Initial;
			return -1;
		}
		if (Sent == 0)
			break;
		Total += static_cast<size_t>(Sent);
	}
	return static_cast<ssize_t>(Total);
}

ssize_t WClientSocket::SendFramed(std::string const& Payload)
{
	std::lock_guard Lock(SendMutex);
	FrameBuffer.Reset();
	FrameBuffer.WriteFrame(Payload);
	return Send(FrameBuffer.GetData(), FrameBuffer.GetWritePos());
}

EReceiveResult WClientSocket::WaitReadable(int TimeoutMs) const
{
	if (SocketFd < 0)
	{
		return RR_Closed;
	}

	pollfd pfd{};
	pfd.fd = SocketFd;
	pfd.events = POLLIN;
	for (;;)
	{
		int Ret = poll(&pfd, 1, TimeoutMs);
		if (Ret > 0)
		{
			return RR_Data;
		}
		if (Ret == 0)
		{
			return RR_Timeout;
		}
		if (errno != EINTR)
		{
			return RR_Error;
		}
	}
}

EReceiveResult WClientSocket::ReceiveSome(char* Buf, size_t Len, size_t& OutRead, int TimeoutMs)
{
	OutRead = 0;
	if (EReceiveResult Wait = WaitReadable(TimeoutMs); Wait != RR_Data)
	{
		return Wait;
	}

	for (;;)
	{
		ssize_t Got = recv(SocketFd, Buf, Len, 0);
		if (Got > 0)
		{
			OutRead = static_cast<size_t>(Got);
			return RR_Data;
		}
		if (Got == 0)
		{
			State = ES_Initial;
			return RR_Closed;
		}
		if (errno == EINTR)
		{
			continue;
		}
		if (errno == EAGAIN || errno == EWOULDBLOCK)
		{
			return RR_Timeout;
		}
		State = ES_Initial;
		return WErrnoUtil::IsConnectionEnded(errno) ? RR_Closed : RR_Error;
	}
}

EReceiveResult WClientSocket::ReceiveFrame(std::string& OutPayload, int TimeoutMs)
{
	auto const Deadline = WClock::now() + std::chrono::milliseconds(TimeoutMs < 0 ? 0 : TimeoutMs);
	char       Chunk[4096];

	for (;;)
	{
		switch (Accum.TryReadFrame(OutPayload))
		{
			case FR_Complete:
				Accum.Compact();
				return RR_Data;
			case FR_TooLarge:
				spdlog::error("Received absurdly large frame from {}", Address.ToString());
				Accum.Reset();
				return RR_Error;
			case FR_Incomplete:
			default:
				break;
		}

		size_t         Got = 0;
		EReceiveResult Result = ReceiveSome(Chunk, sizeof(Chunk), Got, TimeoutMs < 0 ? -1 : RemainingMs(Deadline));
		if (Result != RR_Data)
		{
			return Result;
		}
		Accum.Write(Chunk, Got);
	}
}

void WServerSocket::Close()
{
	if (SocketFd < 0)
	{
		return;
	}

	close(SocketFd);
	if (Address.Family == SF_Unix && bUnlinkOnClose)
	{
		unlink(Address.Path.c_str());
	}
	SocketFd = -1;
}

bool WServerSocket::BindAndListen(int Backlog)
{
	LastError = 0;
	if (!OpenFd())
	{
		LastError = errno;
		return false;
	}

	sockaddr_storage Storage{};
	socklen_t        AddrLen{};
	if (Address.Family == SF_Unix)
	{
		if (!FillUnix(Address.Path, reinterpret_cast<sockaddr_un&>(Storage), AddrLen))
		{
			LastError = ENAMETOOLONG;
			close(SocketFd);
			SocketFd = -1;
			return false;
		}
	}
	else
	{
		int One = 1;
		setsockopt(SocketFd, SOL_SOCKET, SO_REUSEADDR, &One, sizeof(One));
		if (!ResolveInet(Address.Host, Address.Port, reinterpret_cast<sockaddr_in&>(Storage)))
		{
			LastError = EADDRNOTAVAIL;
			close(SocketFd);
			SocketFd = -1;
			return false;
		}
		AddrLen = sizeof(sockaddr_in);
	}

	// On failure the fd is dropped without unlinking, the path may belong to a live server
	if (bind(SocketFd, reinterpret_cast<sockaddr*>(&Storage), AddrLen) < 0 || listen(SocketFd, Backlog) < 0)
	{
		LastError = errno;
		close(SocketFd);
		SocketFd = -1;
		return false;
	}

	return true;
}

std::shared_ptr<WClientSocket> WServerSocket::Accept(int TimeoutMs, bool* bTimedOut) const
{
	pollfd pfd{};
	pfd.fd = SocketFd;
	pfd.events = POLLIN;

	if (int const Ret = poll(&pfd, 1, TimeoutMs); Ret > 0)
	{
		if (pfd.revents & POLLIN)
		{
			int ClientFd = accept4(SocketFd, nullptr, nullptr, SOCK_CLOEXEC);
			if (ClientFd < 0)
			{
				return nullptr;
			}
			return std::make_shared<WClientSocket>(ClientFd);
		}
	}
	else if (Ret == 0 && bTimedOut)
	{
		*bTimedOut = true;
	}
	return nullptr;
}

WPort WServerSocket::GetBoundPort() const
{
	if (SocketFd < 0 || Address.Family != SF_Tcp)
	{
		return 0;
	}
	sockaddr_in Addr{};
	socklen_t   Len = sizeof(Addr);
	if (getsockname(SocketFd, reinterpret_cast<sockaddr*>(&Addr), &Len) < 0)
	{
		return 0;
	}
	return ntohs(Addr.sin_port);
}
