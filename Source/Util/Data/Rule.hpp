/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <cereal/cereal.hpp>

#include "Result.hpp"
#include "Types.hpp"

enum ERuleType : uint8_t
{
	RT_Forward,
	RT_Reverse,
	RT_Chain
};

enum EProtocol : uint8_t
{
	P_Tcp,
	P_Udp,
	P_Http,
	P_Https,
	P_Socks5,
	P_Shadowsocks
};

enum ERuleStatus : uint8_t
{
	RS_Stopped,
	RS_Running,
	RS_Error
};

char const* RuleTypeToString(ERuleType Type);
char const* ProtocolToString(EProtocol Protocol);
char const* RuleStatusToString(ERuleStatus Status);

bool ParseRuleType(std::string const& Str, ERuleType& OutType);
bool ParseProtocol(std::string const& Str, EProtocol& OutProtocol);

struct WTarget
{
	std::string Host{};
	int         Port{ 0 };
	int         Weight{ 1 };

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Host), CEREAL_NVP(Port), CEREAL_NVP(Weight));
	}

	bool operator==(WTarget const&) const = default;
};

struct WAuthConfig
{
	std::string Username{};
	std::string Password{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Username), CEREAL_NVP(Password));
	}

	bool operator==(WAuthConfig const&) const = default;
};

struct WTlsConfig
{
	bool        bEnabled{ false };
	std::string CertFile{};
	std::string KeyFile{};
	std::string CAFile{};
	std::string ServerName{};
	bool        bSecure{ false };

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(bEnabled), CEREAL_NVP(CertFile), CEREAL_NVP(KeyFile), CEREAL_NVP(CAFile),
			CEREAL_NVP(ServerName), CEREAL_NVP(bSecure));
	}

	bool operator==(WTlsConfig const&) const = default;
};

struct WRule
{
	WRuleId     Id{};
	std::string Name{};
	std::string Environment{};
	ERuleType   Type{ RT_Forward };
	bool        bEnabled{ false };
	int         LocalPort{ 0 };
	EProtocol   Protocol{ P_Tcp };

	// Primary target, takes precedence over Targets when set
	std::string TargetHost{};
	int         TargetPort{ 0 };

	std::vector<WTarget>       Targets{};
	WChainId                   ChainId{};
	std::optional<WAuthConfig> Auth{};
	std::optional<WTlsConfig>  Tls{};

	ERuleStatus Status{ RS_Stopped };
	std::string ErrorMsg{};
	std::string Description{};
	std::string Remark{};
	WMsec       CreatedAt{ 0 };
	WMsec       UpdatedAt{ 0 };

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Id), CEREAL_NVP(Name), CEREAL_NVP(Environment), CEREAL_NVP(Type), CEREAL_NVP(bEnabled),
			CEREAL_NVP(LocalPort), CEREAL_NVP(Protocol), CEREAL_NVP(TargetHost), CEREAL_NVP(TargetPort),
			CEREAL_NVP(Targets), CEREAL_NVP(ChainId), CEREAL_NVP(Auth), CEREAL_NVP(Tls), CEREAL_NVP(Status),
			CEREAL_NVP(ErrorMsg), CEREAL_NVP(Description), CEREAL_NVP(Remark), CEREAL_NVP(CreatedAt),
			CEREAL_NVP(UpdatedAt));
	}

	bool operator==(WRule const&) const = default;

	WResult Validate() const;

	[[nodiscard]] bool HasPrimaryTarget() const { return !TargetHost.empty() && TargetPort > 0; }

	// Primary target first, otherwise the target list
	[[nodiscard]] std::vector<WTarget> GetEffectiveTargets() const;

	[[nodiscard]] std::string GetListenAddr() const { return ":" + std::to_string(LocalPort); }

	[[nodiscard]] std::string GetTargetAddr() const;
};
