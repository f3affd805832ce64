/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>
#include <string>
#include <algorithm>
#include <limits>
#include <type_traits>

// Upper bound for a single length-prefixed frame
constexpr uint32_t MAX_FRAME_LENGTH = 16 * 1024 * 1024; // 16 MiB

enum EFrameResult
{
	FR_Incomplete,
	FR_Complete,
	FR_TooLarge
};

class WBuffer
{
	std::vector<char> Data{};
	std::size_t       ReadPos{};
	std::size_t       WritePos{};

	void EnsureCapacity(std::size_t Needed)
	{
		if (Needed <= Data.size())
			return;

		std::size_t NewCap = !Data.empty() ? Data.size() : static_cast<std::size_t>(1024);
		while (NewCap < Needed)
		{
			if (NewCap > (std::numeric_limits<std::size_t>::max)() / 2)
			{
				NewCap = Needed;
				break;
			}
			NewCap *= 2;
		}
		Data.resize(NewCap);
	}

public:
	explicit WBuffer(std::size_t Size = 1024) : Data(Size) {}

	[[nodiscard]] std::size_t GetWritePos() const { return WritePos; }
	[[nodiscard]] std::size_t GetReadableSize() const { return WritePos - ReadPos; }
	[[nodiscard]] char const* PeekReadPtr() const { return Data.data() + ReadPos; }

	void Consume(std::size_t N)
	{
		ReadPos += std::min(N, GetReadableSize());
		if (ReadPos == WritePos)
		{
			Reset();
		}
	}

	// Move unread data to the start
	void Compact()
	{
		if (ReadPos == 0 || ReadPos >= WritePos)
			return;
		std::size_t Remaining = WritePos - ReadPos;
		std::memmove(Data.data(), Data.data() + ReadPos, Remaining);
		ReadPos = 0;
		WritePos = Remaining;
	}

	std::size_t Read(char* Buf, std::size_t Len)
	{
		if (Buf == nullptr || Len == 0)
			return 0;

		std::size_t const N = std::min(Len, GetReadableSize());
		if (N > 0)
		{
			std::memcpy(Buf, Data.data() + ReadPos, N);
			ReadPos += N;
		}
		return N;
	}

	void Write(char const* Buf, std::size_t BytesToWrite)
	{
		if (Buf == nullptr || BytesToWrite == 0)
			return;

		EnsureCapacity(WritePos + BytesToWrite);
		std::memcpy(Data.data() + WritePos, Buf, BytesToWrite);
		WritePos += BytesToWrite;
	}

	void Reset()
	{
		ReadPos = 0;
		WritePos = 0;
	}

	[[nodiscard]] char const* GetData() const { return Data.data(); }

	template <typename T>
	void Write(T const& Value)
	{
		static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
		Write(reinterpret_cast<char const*>(&Value), sizeof(T));
	}

	template <typename T>
	bool Read(T& Value)
	{
		static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
		return Read(reinterpret_cast<char*>(&Value), sizeof(T)) == sizeof(T);
	}

	// Appends a u32 length prefix followed by the payload
	void WriteFrame(std::string const& Payload)
	{
		Write(static_cast<uint32_t>(Payload.size()));
		Write(Payload.data(), Payload.size());
	}

	// Pops one complete frame off the readable range, leaves partial frames in place
	EFrameResult TryReadFrame(std::string& OutPayload)
	{
		if (GetReadableSize() < sizeof(uint32_t))
			return FR_Incomplete;

		uint32_t FrameLength = 0;
		std::memcpy(&FrameLength, PeekReadPtr(), sizeof(uint32_t));
		if (FrameLength > MAX_FRAME_LENGTH)
			return FR_TooLarge;

		if (GetReadableSize() < sizeof(uint32_t) + FrameLength)
			return FR_Incomplete;

		Consume(sizeof(uint32_t));
		OutPayload.assign(PeekReadPtr(), FrameLength);
		Consume(FrameLength);
		return FR_Complete;
	}
};
