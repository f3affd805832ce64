/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

// ReSharper disable CppUnusedIncludeDirective
#include <cereal/cereal.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
// ReSharper restore CppUnusedIncludeDirective

#include "Types.hpp"
#include "Data/AppData.hpp"

struct WEmptyArgs
{
	template <class Archive>
	void serialize(Archive&)
	{
	}
};

struct WIdArgs
{
	std::string Id{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Id);
	}
};

// Also used for updates
struct WCreateRuleArgs
{
	WRule Rule{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Rule);
	}
};

struct WCreateChainArgs
{
	WChain Chain{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Chain);
	}
};

struct WImportDataArgs
{
	std::string Data{}; // json document
	bool        bMerge{ false };

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Data, bMerge);
	}
};

struct WGetLogsArgs
{
	int Count{ 0 };

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Count);
	}
};

struct WGetLogsSinceArgs
{
	WLogId SinceId{ 0 };

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(SinceId);
	}
};

struct WGetLogsByRuleArgs
{
	WRuleId RuleId{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(RuleId);
	}
};
