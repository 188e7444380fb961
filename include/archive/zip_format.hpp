#pragma once

#include <cstdint>

namespace zipline::zip {

// Record signatures (APPNOTE 6.3.x).
constexpr std::uint32_t kLocalHeaderSig = 0x04034b50;
constexpr std::uint32_t kDataDescriptorSig = 0x08074b50;
constexpr std::uint32_t kCentralHeaderSig = 0x02014b50;
constexpr std::uint32_t kZip64EndOfCentralDirSig = 0x06064b50;
constexpr std::uint32_t kZip64LocatorSig = 0x07064b50;
constexpr std::uint32_t kEndOfCentralDirSig = 0x06054b50;

// Fixed record sizes, file names excluded.
constexpr std::uint64_t kLocalHeaderSize = 30;
constexpr std::uint64_t kDataDescriptorSize = 16;
constexpr std::uint64_t kCentralHeaderSize = 46;
constexpr std::uint64_t kEndOfCentralDirSize = 22;
constexpr std::uint64_t kZip64EndOfCentralDirSize = 56;
constexpr std::uint16_t kZip64ExtraId = 0x0001;

// Local header + data descriptor + central header of one stored entry.
constexpr std::uint64_t kStoredEntryOverhead =
    kLocalHeaderSize + kDataDescriptorSize + kCentralHeaderSize;

// Values at or above these limits need ZIP64 records.
constexpr std::uint64_t kMax32 = 0xFFFFFFFFULL;
constexpr std::uint64_t kMax16 = 0xFFFFULL;

constexpr std::uint16_t kVersionDefault = 20;
constexpr std::uint16_t kVersionZip64 = 45;
constexpr std::uint16_t kHostUnix = 3;

constexpr std::uint16_t kFlagDataDescriptor = 0x0008;
constexpr std::uint16_t kFlagUtf8 = 0x0800;
constexpr std::uint16_t kMethodStore = 0;

} // namespace zipline::zip
