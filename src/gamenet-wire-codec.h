/*
 * GameNet P2P SDK
 * Binary message frame codec
 *
 * Frame layout (little-endian):
 *   [senderUserId: 32 bytes, zero-padded][logicalChannel: u32][payloadLength: u32][payload]
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "gamenet-common.h"

namespace gamenet
{

size_t encodedFrameSize(size_t payloadSize);

// Sender ids longer than 32 bytes are truncated.
std::vector<uint8_t> encodeFrame(const MessageFrame &frame);
std::vector<uint8_t> encodeFrame(const std::string &senderUserId, uint32_t channel, const uint8_t *payload,
                                 size_t payloadSize);

// Returns false for a buffer shorter than the header or a payload length that overruns the buffer.
// Bytes following the declared payload are ignored.
bool decodeFrame(const uint8_t *data, size_t size, MessageFrame &frame, std::string *error = nullptr);
bool decodeFrame(const std::vector<uint8_t> &data, MessageFrame &frame, std::string *error = nullptr);

} // namespace gamenet
