/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// One-shot cancellation flag that sleeping threads can wait on
class WCancelToken
{
	std::atomic<bool>       bCancelled{ false };
	std::mutex              Mutex{};
	std::condition_variable Condition{};

public:
	void Cancel()
	{
		{
			std::lock_guard Lock(Mutex);
			bCancelled = true;
		}
		Condition.notify_all();
	}

	[[nodiscard]] bool IsCancelled() const { return bCancelled.load(); }

	// Returns true if cancelled before the timeout elapsed
	bool WaitFor(int Milliseconds)
	{
		std::unique_lock Lock(Mutex);
		return Condition.wait_for(Lock, std::chrono::milliseconds(Milliseconds), [this] { return bCancelled.load(); });
	}
};
