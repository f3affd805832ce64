/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "Filesystem.hpp"
#include "Rpc/RpcTransport.hpp"

enum ELockResult
{
	LR_Acquired,
	LR_AlreadyRunning,
	LR_Error
};

// Keeps a second interactive instance from running and lets it wake up the first one
class WSingleInstance
{
	std::string Name{};
	stdfs::path LockPath{};
	int         LockFd{ -1 };

	std::shared_ptr<IRpcTransport> WakeupChannel{};

	std::mutex                     ListenerMutex{};
	std::unique_ptr<WServerSocket> Listener{};
	std::atomic<bool>              bListening{ false };
	std::thread                    ListenThread{};
	std::function<void()>          OnWakeup{};

	void ListenThreadFunction();
	void StopListener();

public:
	static constexpr char const* WakeupToken{ "WAKEUP" };

	// Lock and wake-up socket live in Dir. Tcp uses the loopback wake-up ports.
	explicit WSingleInstance(std::string Name_, stdfs::path const& Dir = "/tmp", ERpcTransportKind Kind = RK_Default);
	~WSingleInstance();

	WSingleInstance(WSingleInstance const&) = delete;
	WSingleInstance& operator=(WSingleInstance const&) = delete;

	// Never blocks
	ELockResult TryLock();

	// Tells the running instance to show itself, false if it could not be reached
	bool SendWakeup();

	// Failures are logged and reported, the instance keeps the lock either way
	bool StartWakeupListener(std::function<void()> Callback);

	// Safe to call repeatedly
	void Unlock();

	[[nodiscard]] bool IsLocked() const { return LockFd >= 0; }

	[[nodiscard]] stdfs::path const& GetLockPath() const { return LockPath; }
};
