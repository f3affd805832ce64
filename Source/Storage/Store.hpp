/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <shared_mutex>
#include <string>
#include <vector>

#include "Filesystem.hpp"
#include "Result.hpp"
#include "Data/AppData.hpp"

// Rules, chains and config persisted as one json document in the data directory
class WStore
{
	mutable std::shared_mutex Mutex;
	stdfs::path               DataDir{};
	stdfs::path               DataFile{};
	WAppData                  Data{};

	WResult SaveLocked() const;

	WRule*  FindRule(WRuleId const& RuleId);
	WChain* FindChain(WChainId const& ChainId);

public:
	explicit WStore(stdfs::path DataDir_);

	// WEICHE_DATA_DIR, then Override, then the system or per-user default
	static stdfs::path ResolveDataDir(std::string const& Override = {});

	// Reads the data file, a missing file starts from defaults
	WResult Load();

	[[nodiscard]] stdfs::path const& GetDataDir() const { return DataDir; }
	[[nodiscard]] stdfs::path const& GetDataFile() const { return DataFile; }

	void GetRules(std::vector<WRule>& OutRules) const;
	WResult GetRule(WRuleId const& RuleId, WRule& OutRule) const;
	[[nodiscard]] size_t GetRuleCount() const;

	// Stamps the timestamps into Rule
	WResult CreateRule(WRule& Rule);
	WResult UpdateRule(WRule& Rule);
	WResult DeleteRule(WRuleId const& RuleId);
	WResult UpdateRuleStatus(WRuleId const& RuleId, ERuleStatus Status, std::string const& ErrorMsg);
	WResult SetRuleEnabled(WRuleId const& RuleId, bool bEnabled);

	void GetChains(std::vector<WChain>& OutChains) const;
	WResult GetChain(WChainId const& ChainId, WChain& OutChain) const;
	WResult CreateChain(WChain& Chain);
	WResult UpdateChain(WChain& Chain);
	WResult DeleteChain(WChainId const& ChainId);

	void GetConfig(WAppConfig& OutConfig) const;
	WResult UpdateConfig(WAppConfig const& Config);

	void GetData(WAppData& OutData) const;

	// Merge replaces rules and chains by id and appends new ones, otherwise everything is swapped
	WResult ImportData(WAppData const& Imported, bool bMerge);

	// Indented json of everything
	WResult ExportData(std::string& OutJson) const;
	WResult ImportData(std::string const& Json, bool bMerge);

	static WResult ParseData(std::string const& Json, WAppData& OutData);
	static WResult SerializeData(WAppData const& AppData, std::string& OutJson);
};
