/*
 * Copyright (c) 2025-2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <deque>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include <sigslot/signal.hpp>

#include "Data/LogEntry.hpp"

// Bounded ring of log entries with ids that are never reused
class WLogManager
{
	mutable std::shared_mutex Mutex;
	std::deque<WLogEntry>     Entries{};
	size_t                    MaxEntries{ 1000 };
	WLogId                    NextId{ 1 };

public:
	static constexpr size_t DefaultCapacity{ 1000 };

	explicit WLogManager(int Capacity = DefaultCapacity);

	// Fired after an entry was added, never while the ring is locked
	sigslot::signal<WLogEntry const&> OnEntryAdded;

	void Add(ELogLevel Level, WRuleId const& RuleId, std::string const& RuleName, std::string const& Message,
		std::string const& Details = {});

	void Debug(WRuleId const& RuleId, std::string const& RuleName, std::string const& Message,
		std::string const& Details = {})
	{
		Add(LL_Debug, RuleId, RuleName, Message, Details);
	}

	void Info(WRuleId const& RuleId, std::string const& RuleName, std::string const& Message,
		std::string const& Details = {})
	{
		Add(LL_Info, RuleId, RuleName, Message, Details);
	}

	void Warn(WRuleId const& RuleId, std::string const& RuleName, std::string const& Message,
		std::string const& Details = {})
	{
		Add(LL_Warn, RuleId, RuleName, Message, Details);
	}

	void Error(WRuleId const& RuleId, std::string const& RuleName, std::string const& Message,
		std::string const& Details = {})
	{
		Add(LL_Error, RuleId, RuleName, Message, Details);
	}

	[[nodiscard]] std::vector<WLogEntry> GetAll() const;

	// Last Count entries in insertion order, everything if Count <= 0
	[[nodiscard]] std::vector<WLogEntry> GetRecent(int Count) const;

	[[nodiscard]] std::vector<WLogEntry> GetByRule(WRuleId const& RuleId) const;

	// Entries with an id strictly greater than SinceId
	[[nodiscard]] std::vector<WLogEntry> GetSince(WLogId SinceId) const;

	void Clear();

	[[nodiscard]] size_t Size() const;

	[[nodiscard]] size_t GetCapacity() const { return MaxEntries; }
};
