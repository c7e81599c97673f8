/*
 * GameNet P2P SDK
 * Session configuration parsing and validation
 */

#pragma once

#include <cstdint>
#include <string>

#include "gamenet-common.h"

namespace gamenet
{

constexpr int kMaxPeersLimit = 64;
constexpr uint32_t kMaxChannelsLimit = 256;
constexpr uint32_t kMaxSlotCount = 65536;
constexpr uint32_t kMinSlotSize = kFrameHeaderSize + 8;
constexpr uint32_t kMaxSlotSize = 1024 * 1024;
// Upper bound on the shared region a session allocates for its queues
constexpr uint64_t kMaxQueueRegionSize = 256ull * 1024 * 1024;

// Reads a JSON object onto config. Missing keys keep their current values,
// unknown keys are ignored and out-of-range numbers are clamped.
bool parseSessionConfig(const std::string &json, SessionConfig &config, std::string *error = nullptr);

bool validateSessionConfig(const SessionConfig &config, std::string *error = nullptr);

} // namespace gamenet
