/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <vector>
#include <cereal/cereal.hpp>

#include "Chain.hpp"
#include "Rule.hpp"

struct WAppConfig
{
	std::string LogLevel{ "info" };
	bool        bAutoStart{ true };
	bool        bStartMinimized{ false };

	bool bTrayEnabled{ true };

	bool        bHotkeyEnabled{ true };
	std::string HotkeyModifiers{ "ctrl+shift" };
	std::string HotkeyKey{ "p" };

	bool bServiceEnabled{ false };
	int  ServicePort{ 0 };

	bool        bApiEnabled{ false };
	std::string ApiAddr{ ":18080" };

	bool        bMetricsEnabled{ false };
	std::string MetricsAddr{ ":9000" };

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(LogLevel), CEREAL_NVP(bAutoStart), CEREAL_NVP(bStartMinimized), CEREAL_NVP(bTrayEnabled),
			CEREAL_NVP(bHotkeyEnabled), CEREAL_NVP(HotkeyModifiers), CEREAL_NVP(HotkeyKey), CEREAL_NVP(bServiceEnabled),
			CEREAL_NVP(ServicePort), CEREAL_NVP(bApiEnabled), CEREAL_NVP(ApiAddr), CEREAL_NVP(bMetricsEnabled),
			CEREAL_NVP(MetricsAddr));
	}

	bool operator==(WAppConfig const&) const = default;
};

// Everything that is persisted, also the import/export document
struct WAppData
{
	WAppConfig          Config{};
	std::vector<WRule>  Rules{};
	std::vector<WChain> Chains{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Config), CEREAL_NVP(Rules), CEREAL_NVP(Chains));
	}
};

struct WServiceStatus
{
	bool        bRunning{ false };
	WProcessId  Pid{ 0 };
	std::string StartTime{};
	int         RulesActive{ 0 };
	int         RulesTotal{ 0 };
	std::string Version{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(bRunning), CEREAL_NVP(Pid), CEREAL_NVP(StartTime), CEREAL_NVP(RulesActive),
			CEREAL_NVP(RulesTotal), CEREAL_NVP(Version));
	}
};
