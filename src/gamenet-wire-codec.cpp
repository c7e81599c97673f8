/*
 * GameNet P2P SDK
 * Binary message frame codec
 */

#include "gamenet-wire-codec.h"

#include <algorithm>
#include <cstring>

namespace gamenet
{

namespace
{

constexpr size_t kChannelOffset = kSenderIdSize;
constexpr size_t kLengthOffset = kSenderIdSize + 4;

void writeU32(uint8_t *out, uint32_t value)
{
	out[0] = static_cast<uint8_t>(value & 0xFF);
	out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
	out[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
	out[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

uint32_t readU32(const uint8_t *in)
{
	return static_cast<uint32_t>(in[0]) | (static_cast<uint32_t>(in[1]) << 8) |
	       (static_cast<uint32_t>(in[2]) << 16) | (static_cast<uint32_t>(in[3]) << 24);
}

std::string readSenderId(const uint8_t *data)
{
	size_t length = kSenderIdSize;
	while (length > 0 && data[length - 1] == 0x00) {
		--length;
	}
	return std::string(reinterpret_cast<const char *>(data), length);
}

} // namespace

size_t encodedFrameSize(size_t payloadSize)
{
	return kFrameHeaderSize + payloadSize;
}

std::vector<uint8_t> encodeFrame(const std::string &senderUserId, uint32_t channel, const uint8_t *payload,
                                 size_t payloadSize)
{
	std::vector<uint8_t> buffer(encodedFrameSize(payloadSize), 0x00);

	const size_t idLength = std::min(senderUserId.size(), kSenderIdSize);
	if (idLength > 0) {
		std::memcpy(buffer.data(), senderUserId.data(), idLength);
	}

	writeU32(buffer.data() + kChannelOffset, channel);
	writeU32(buffer.data() + kLengthOffset, static_cast<uint32_t>(payloadSize));

	if (payload && payloadSize > 0) {
		std::memcpy(buffer.data() + kFrameHeaderSize, payload, payloadSize);
	}

	return buffer;
}

std::vector<uint8_t> encodeFrame(const MessageFrame &frame)
{
	return encodeFrame(frame.senderUserId, frame.channel, frame.payload.data(), frame.payload.size());
}

bool decodeFrame(const uint8_t *data, size_t size, MessageFrame &frame, std::string *error)
{
	if (!data || size < kFrameHeaderSize) {
		if (error) {
			*error = "frame shorter than header (" + std::to_string(size) + " bytes)";
		}
		return false;
	}

	const uint32_t payloadLength = readU32(data + kLengthOffset);
	if (payloadLength > size - kFrameHeaderSize) {
		if (error) {
			*error = "declared payload length " + std::to_string(payloadLength) + " exceeds " +
			         std::to_string(size - kFrameHeaderSize) + " available bytes";
		}
		return false;
	}

	frame.senderUserId = readSenderId(data);
	frame.channel = readU32(data + kChannelOffset);
	frame.payload.assign(data + kFrameHeaderSize, data + kFrameHeaderSize + payloadLength);
	return true;
}

bool decodeFrame(const std::vector<uint8_t> &data, MessageFrame &frame, std::string *error)
{
	return decodeFrame(data.data(), data.size(), frame, error);
}

} // namespace gamenet
