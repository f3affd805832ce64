/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

// ReSharper disable CppUnusedIncludeDirective
#include <cereal/types/string.hpp>
#include <cereal/archives/binary.hpp>
// ReSharper restore CppUnusedIncludeDirective

#include "Result.hpp"

#define WEICHE_PROTOCOL_VERSION 1
#define WEICHE_METHOD_PREFIX "Weiche."

enum EMessageType : int8_t
{
	MT_Invalid = -1,
	MT_RpcRequest,
	MT_RpcResponse
};

struct WRpcRequest
{
	uint32_t    Version{ WEICHE_PROTOCOL_VERSION };
	uint32_t    CallId{ 0 };
	std::string Method{};
	std::string Args{}; // cereal binary blob of the argument record

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Version, CallId, Method, Args);
	}
};

struct WRpcResponse
{
	uint32_t    CallId{ 0 };
	bool        bSuccess{ false };
	EErrorCode  ErrorCode{ EC_Ok };
	std::string Error{};
	std::string Payload{}; // cereal binary blob of the reply record

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CallId, bSuccess, ErrorCode, Error, Payload);
	}
};

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-function"

static EMessageType ReadMessageType(std::string const& Frame)
{
	if (Frame.empty())
	{
		return MT_Invalid;
	}
	auto Type = static_cast<EMessageType>(Frame[0]);
	if (Type != MT_RpcRequest && Type != MT_RpcResponse)
	{
		return MT_Invalid;
	}
	return Type;
}

#pragma GCC diagnostic pop

// Type byte followed by the cereal binary archive of Data
template <class T>
std::string EncodeMessage(EMessageType Type, T const& Data)
{
	std::stringstream Os{};
	Os << static_cast<char>(Type);
	{
		cereal::BinaryOutputArchive Archive(Os);
		Archive(Data);
	}
	return Os.str();
}

template <class T>
bool DecodeMessage(std::string const& Frame, EMessageType Expected, T& Out)
{
	if (ReadMessageType(Frame) != Expected)
	{
		spdlog::warn("Received unexpected message type {}", Frame.empty() ? -1 : static_cast<int>(Frame[0]));
		return false;
	}

	std::stringstream ss(Frame);
	try
	{
		ss.seekg(1); // Skip message type
		cereal::BinaryInputArchive Archive(ss);
		Archive(Out);
	}
	catch (std::exception const& e)
	{
		spdlog::error("Failed to decode message: {}", e.what());
		return false;
	}
	return true;
}

// Argument and reply records travel as nested binary blobs
template <class T>
std::string PackRecord(T const& Record)
{
	std::stringstream Os{};
	{
		cereal::BinaryOutputArchive Archive(Os);
		Archive(Record);
	}
	return Os.str();
}

template <class T>
bool UnpackRecord(std::string const& Blob, T& Out)
{
	std::stringstream ss(Blob);
	try
	{
		cereal::BinaryInputArchive Archive(ss);
		Archive(Out);
	}
	catch (std::exception const& e)
	{
		spdlog::error("Failed to decode record: {}", e.what());
		return false;
	}
	return true;
}
