/*
 * Copyright (c) 2025-2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "LogManager.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>

#include "Time.hpp"

WLogManager::WLogManager(int Capacity)
{
	MaxEntries = Capacity > 0 ? static_cast<size_t>(Capacity) : DefaultCapacity;
}

void WLogManager::Add(ELogLevel Level, WRuleId const& RuleId, std::string const& RuleName,
	std::string const& Message, std::string const& Details)
{
	WLogEntry Entry{};
	{
		std::unique_lock Lock(Mutex);
		Entry.Id = NextId++;
		Entry.Timestamp = WTime::FormatRfc3339(WTime::GetEpochMs());
		Entry.Level = Level;
		Entry.RuleId = RuleId;
		Entry.RuleName = RuleName;
		Entry.Message = Message;
		Entry.Details = Details;

		Entries.push_back(Entry);
		while (Entries.size() > MaxEntries)
		{
			Entries.pop_front();
		}
	}

	OnEntryAdded(Entry);
}

std::vector<WLogEntry> WLogManager::GetAll() const
{
	std::shared_lock Lock(Mutex);
	return { Entries.begin(), Entries.end() };
}

std::vector<WLogEntry> WLogManager::GetRecent(int Count) const
{
	std::shared_lock Lock(Mutex);
	if (Count <= 0 || static_cast<size_t>(Count) >= Entries.size())
	{
		return { Entries.begin(), Entries.end() };
	}
	return { Entries.end() - Count, Entries.end() };
}

std::vector<WLogEntry> WLogManager::GetByRule(WRuleId const& RuleId) const
{
	std::shared_lock       Lock(Mutex);
	std::vector<WLogEntry> Result{};
	std::ranges::copy_if(Entries, std::back_inserter(Result), [&](WLogEntry const& E) { return E.RuleId == RuleId; });
	return Result;
}

std::vector<WLogEntry> WLogManager::GetSince(WLogId SinceId) const
{
	std::shared_lock Lock(Mutex);
	// Ids grow with the deque, so the first match starts the tail
	auto It = std::ranges::find_if(Entries, [&](WLogEntry const& E) { return E.Id > SinceId; });
	return { It, Entries.end() };
}

void WLogManager::Clear()
{
	std::unique_lock Lock(Mutex);
	Entries.clear();
}

size_t WLogManager::Size() const
{
	std::shared_lock Lock(Mutex);
	return Entries.size();
}
