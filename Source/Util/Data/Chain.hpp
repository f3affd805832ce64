/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include <cereal/cereal.hpp>

#include "Rule.hpp"

struct WHop
{
	std::string                Name{};
	std::string                Addr{};
	EProtocol                  Protocol{ P_Socks5 };
	std::optional<WAuthConfig> Auth{};
	std::optional<WTlsConfig>  Tls{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Name), CEREAL_NVP(Addr), CEREAL_NVP(Protocol), CEREAL_NVP(Auth), CEREAL_NVP(Tls));
	}

	bool operator==(WHop const&) const = default;
};

struct WChain
{
	WChainId          Id{};
	std::string       Name{};
	std::vector<WHop> Hops{};
	std::string       Description{};
	WMsec             CreatedAt{ 0 };
	WMsec             UpdatedAt{ 0 };

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Id), CEREAL_NVP(Name), CEREAL_NVP(Hops), CEREAL_NVP(Description), CEREAL_NVP(CreatedAt),
			CEREAL_NVP(UpdatedAt));
	}

	bool operator==(WChain const&) const = default;

	WResult Validate() const;
};
