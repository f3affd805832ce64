/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Store.hpp"

#include <algorithm>
#include <mutex>
#include <sstream>
#include <unistd.h>
#include <spdlog/spdlog.h>

// ReSharper disable CppUnusedIncludeDirective
#include <cereal/archives/json.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
// ReSharper restore CppUnusedIncludeDirective

#include "Time.hpp"

namespace
{
	// Later entries win on duplicate ids, in the position of the first one
	template <class T>
	std::vector<T> UniqueById(std::vector<T> const& Items)
	{
		std::vector<T> Out{};
		for (T const& Item : Items)
		{
			auto It = std::ranges::find_if(Out, [&](T const& Other) { return Other.Id == Item.Id; });
			if (It != Out.end())
			{
				*It = Item;
			}
			else
			{
				Out.push_back(Item);
			}
		}
		return Out;
	}

	// Imported documents may carry the runtime status of another host
	void NormalizeImported(WAppData& Data)
	{
		Data.Rules = UniqueById(Data.Rules);
		Data.Chains = UniqueById(Data.Chains);
		for (WRule& Rule : Data.Rules)
		{
			if (!Rule.bEnabled && Rule.Status == RS_Running)
			{
				Rule.Status = RS_Stopped;
				Rule.ErrorMsg.clear();
			}
		}
	}
} // namespace

WStore::WStore(stdfs::path DataDir_)
	: DataDir(std::move(DataDir_))
	, DataFile(DataDir / "data.json")
{
}

stdfs::path WStore::ResolveDataDir(std::string const& Override)
{
	if (char const* Env = std::getenv("WEICHE_DATA_DIR"); Env && *Env)
	{
		return Env;
	}
	if (!Override.empty())
	{
		return Override;
	}
	if (geteuid() == 0)
	{
		return "/var/lib/weiche";
	}
	if (stdfs::path Config = WFilesystem::GetConfigFolder(); !Config.empty())
	{
		return Config / "weiche";
	}
	return "data";
}

WResult WStore::ParseData(std::string const& Json, WAppData& OutData)
{
	std::istringstream Is(Json);
	WAppData           Parsed{};
	try
	{
		cereal::JSONInputArchive Archive(Is);
		Parsed.serialize(Archive);
	}
	catch (std::exception const& e)
	{
		return WResult::Error(EC_Storage, fmt::format("invalid data: {}", e.what()));
	}
	OutData = std::move(Parsed);
	return WResult::Success();
}

WResult WStore::SerializeData(WAppData const& AppData, std::string& OutJson)
{
	std::ostringstream Os;
	try
	{
		cereal::JSONOutputArchive Archive(Os);
		const_cast<WAppData&>(AppData).serialize(Archive);
	}
	catch (std::exception const& e)
	{
		return WResult::Error(EC_Storage, fmt::format("failed to serialize data: {}", e.what()));
	}
	OutJson = Os.str();
	return WResult::Success();
}

WResult WStore::Load()
{
	std::unique_lock Lock(Mutex);
	if (!WFilesystem::EnsureDirectory(DataDir))
	{
		return WResult::Error(EC_Storage, fmt::format("failed to create data directory {}", DataDir.string()));
	}

	if (!WFilesystem::Exists(DataFile))
	{
		spdlog::info("No data file at '{}', starting with defaults", DataFile.string());
		Data = WAppData{};
		return SaveLocked();
	}

	std::string Json{};
	if (!WFilesystem::ReadFile(DataFile, Json))
	{
		return WResult::Error(EC_Storage, fmt::format("failed to read {}", DataFile.string()));
	}

	WAppData Loaded{};
	if (WResult Parsed = ParseData(Json, Loaded); !Parsed.Ok())
	{
		spdlog::error("Failed to load '{}': {}", DataFile.string(), Parsed.Message);
		return Parsed;
	}
	Data = std::move(Loaded);
	spdlog::info("Loaded {} rules and {} chains from '{}'", Data.Rules.size(), Data.Chains.size(), DataFile.string());
	return WResult::Success();
}

WResult WStore::SaveLocked() const
{
	std::string Json{};
	if (WResult Serialized = SerializeData(Data, Json); !Serialized.Ok())
	{
		return Serialized;
	}
	if (!WFilesystem::WriteFileAtomic(DataFile, Json))
	{
		return WResult::Error(EC_Storage, fmt::format("failed to write {}", DataFile.string()));
	}
	return WResult::Success();
}

WRule* WStore::FindRule(WRuleId const& RuleId)
{
	auto It = std::ranges::find_if(Data.Rules, [&](WRule const& R) { return R.Id == RuleId; });
	return It == Data.Rules.end() ? nullptr : &*It;
}

WChain* WStore::FindChain(WChainId const& ChainId)
{
	auto It = std::ranges::find_if(Data.Chains, [&](WChain const& C) { return C.Id == ChainId; });
	return It == Data.Chains.end() ? nullptr : &*It;
}

void WStore::GetRules(std::vector<WRule>& OutRules) const
{
	std::shared_lock Lock(Mutex);
	OutRules = Data.Rules;
}

WResult WStore::GetRule(WRuleId const& RuleId, WRule& OutRule) const
{
	std::shared_lock Lock(Mutex);
	auto It = std::ranges::find_if(Data.Rules, [&](WRule const& R) { return R.Id == RuleId; });
	if (It == Data.Rules.end())
	{
		return WResult::RuleNotFound();
	}
	OutRule = *It;
	return WResult::Success();
}

size_t WStore::GetRuleCount() const
{
	std::shared_lock Lock(Mutex);
	return Data.Rules.size();
}

WResult WStore::CreateRule(WRule& Rule)
{
	std::unique_lock Lock(Mutex);
	if (FindRule(Rule.Id))
	{
		return WResult::RuleExists();
	}
	Rule.CreatedAt = WTime::GetEpochMs();
	Rule.UpdatedAt = Rule.CreatedAt;
	Data.Rules.push_back(Rule);
	return SaveLocked();
}

WResult WStore::UpdateRule(WRule& Rule)
{
	std::unique_lock Lock(Mutex);
	WRule* Existing = FindRule(Rule.Id);
	if (!Existing)
	{
		return WResult::RuleNotFound();
	}
	Rule.CreatedAt = Existing->CreatedAt;
	Rule.UpdatedAt = WTime::GetEpochMs();
	*Existing = Rule;
	return SaveLocked();
}

WResult WStore::DeleteRule(WRuleId const& RuleId)
{
	std::unique_lock Lock(Mutex);
	if (std::erase_if(Data.Rules, [&](WRule const& R) { return R.Id == RuleId; }) == 0)
	{
		return WResult::RuleNotFound();
	}
	return SaveLocked();
}

WResult WStore::UpdateRuleStatus(WRuleId const& RuleId, ERuleStatus Status, std::string const& ErrorMsg)
{
	std::unique_lock Lock(Mutex);
	WRule* Rule = FindRule(RuleId);
	if (!Rule)
	{
		return WResult::RuleNotFound();
	}
	Rule->Status = Status;
	Rule->ErrorMsg = ErrorMsg;
	Rule->UpdatedAt = WTime::GetEpochMs();
	return SaveLocked();
}

WResult WStore::SetRuleEnabled(WRuleId const& RuleId, bool bEnabled)
{
	std::unique_lock Lock(Mutex);
	WRule* Rule = FindRule(RuleId);
	if (!Rule)
	{
		return WResult::RuleNotFound();
	}
	if (Rule->bEnabled == bEnabled)
	{
		return WResult::Success();
	}
	Rule->bEnabled = bEnabled;
	Rule->UpdatedAt = WTime::GetEpochMs();
	return SaveLocked();
}

void WStore::GetChains(std::vector<WChain>& OutChains) const
{
	std::shared_lock Lock(Mutex);
	OutChains = Data.Chains;
}

WResult WStore::GetChain(WChainId const& ChainId, WChain& OutChain) const
{
	std::shared_lock Lock(Mutex);
	auto It = std::ranges::find_if(Data.Chains, [&](WChain const& C) { return C.Id == ChainId; });
	if (It == Data.Chains.end())
	{
		return WResult::ChainNotFound();
	}
	OutChain = *It;
	return WResult::Success();
}

WResult WStore::CreateChain(WChain& Chain)
{
	std::unique_lock Lock(Mutex);
	if (FindChain(Chain.Id))
	{
		return WResult::ChainExists();
	}
	Chain.CreatedAt = WTime::GetEpochMs();
	Chain.UpdatedAt = Chain.CreatedAt;
	Data.Chains.push_back(Chain);
	return SaveLocked();
}

WResult WStore::UpdateChain(WChain& Chain)
{
	std::unique_lock Lock(Mutex);
	WChain* Existing = FindChain(Chain.Id);
	if (!Existing)
	{
		return WResult::ChainNotFound();
	}
	Chain.CreatedAt = Existing->CreatedAt;
	Chain.UpdatedAt = WTime::GetEpochMs();
	*Existing = Chain;
	return SaveLocked();
}

WResult WStore::DeleteChain(WChainId const& ChainId)
{
	std::unique_lock Lock(Mutex);
	if (!FindChain(ChainId))
	{
		return WResult::ChainNotFound();
	}
	if (std::ranges::any_of(Data.Rules, [&](WRule const& R) { return R.ChainId == ChainId; }))
	{
		return WResult::ChainInUse();
	}
	std::erase_if(Data.Chains, [&](WChain const& C) { return C.Id == ChainId; });
	return SaveLocked();
}

void WStore::GetConfig(WAppConfig& OutConfig) const
{
	std::shared_lock Lock(Mutex);
	OutConfig = Data.Config;
}

WResult WStore::UpdateConfig(WAppConfig const& Config)
{
	std::unique_lock Lock(Mutex);
	Data.Config = Config;
	return SaveLocked();
}

void WStore::GetData(WAppData& OutData) const
{
	std::shared_lock Lock(Mutex);
	OutData = Data;
}

WResult WStore::ImportData(WAppData const& Payload, bool bMerge)
{
	WAppData Imported = Payload;
	NormalizeImported(Imported);

	std::unique_lock Lock(Mutex);
	if (!bMerge)
	{
		Data = std::move(Imported);
		return SaveLocked();
	}

	for (WRule const& Rule : Imported.Rules)
	{
		if (WRule* Existing = FindRule(Rule.Id))
		{
			*Existing = Rule;
		}
		else
		{
			Data.Rules.push_back(Rule);
		}
	}
	for (WChain const& Chain : Imported.Chains)
	{
		if (WChain* Existing = FindChain(Chain.Id))
		{
			*Existing = Chain;
		}
		else
		{
			Data.Chains.push_back(Chain);
		}
	}
	return SaveLocked();
}

WResult WStore::ExportData(std::string& OutJson) const
{
	std::shared_lock Lock(Mutex);
	return SerializeData(Data, OutJson);
}

WResult WStore::ImportData(std::string const& Json, bool bMerge)
{
	WAppData Imported{};
	if (WResult Parsed = ParseData(Json, Imported); !Parsed.Ok())
	{
		return Parsed;
	}
	return ImportData(Imported, bMerge);
}
