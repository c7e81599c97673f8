/*
 * GameNet P2P SDK
 * Common types and constants
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#define GAMENET_VERSION "0.4.0"

namespace gamenet
{

// Default STUN servers used when no ICE servers are configured
constexpr const char *DEFAULT_STUN_SERVERS[] = {"stun:stun.l.google.com:19302", "stun:stun1.l.google.com:19302"};

constexpr const char *kReliableChannelLabel = "reliable";
constexpr const char *kUnreliableChannelLabel = "unreliable";
constexpr const char *kDefaultEngineReceiver = "GameNet";

// Wire frame: [senderUserId:32][logicalChannel:u32][payloadLength:u32][payload]
constexpr size_t kSenderIdSize = 32;
constexpr size_t kFrameHeaderSize = kSenderIdSize + 4 + 4;

// Shared queue layout
constexpr uint32_t kQueueFormatVersion = 1;
constexpr size_t kRingHeaderWords = 4;
constexpr size_t kRingHeaderSize = kRingHeaderWords * 4;
constexpr size_t kSlotLengthPrefixSize = 4;

constexpr uint32_t kDefaultMaxChannels = 8;
constexpr uint32_t kDefaultSlotCount = 64;
constexpr uint32_t kDefaultSlotSize = 2048;
constexpr int kDefaultMaxPeers = 8;

enum class LogLevel { Debug, Info, Warning, Error };

// Aggregate state of a lobby connection
enum class ConnectionState { Connecting, Connected, Disconnected, Failed };

// Per-peer establishment state
enum class LinkState { Idle, Connecting, Connected, Failed, Disconnected };

enum class LinkRole { Offerer, Answerer };

enum class TransportChannel { Reliable, Unreliable };

enum class SignalType { Offer, Answer, IceCandidate };

enum class QueueDirection { Inbound, Outbound };

struct Peer {
	std::string userId;
	std::string username;
};

struct SessionDescription {
	std::string type;
	std::string sdp;
};

struct IceCandidate {
	std::string candidate;
	std::string mid;
	int mLineIndex = 0;
};

using SignalPayload = std::variant<SessionDescription, IceCandidate>;

struct SignalingEnvelope {
	std::string id;
	SignalType type = SignalType::Offer;
	std::string fromUserId;
	std::string toUserId; // empty when the relay did not address it
	SignalPayload payload;
};

struct MessageFrame {
	std::string senderUserId;
	uint32_t channel = 0;
	std::vector<uint8_t> payload;

	bool operator==(const MessageFrame &other) const
	{
		return senderUserId == other.senderUserId && channel == other.channel && payload == other.payload;
	}
	bool operator!=(const MessageFrame &other) const { return !(*this == other); }
};

struct IceServer {
	std::string urls;
	std::string username;
	std::string credential;
};

struct SessionConfig {
	std::vector<IceServer> iceServers;
	bool forceTurn = false;
	int maxPeers = kDefaultMaxPeers;
	bool enableReliableChannel = true;
	bool enableUnreliableChannel = true;

	uint32_t maxChannels = kDefaultMaxChannels;
	uint32_t slotCount = kDefaultSlotCount;
	uint32_t slotSize = kDefaultSlotSize;

	// Logical channels drained from the outbound queue over the unreliable transport channel
	std::vector<uint32_t> unreliableChannels;

	bool enableStats = false;
	LogLevel logLevel = LogLevel::Warning;
};

struct PeerStatus {
	bool reliableReady = false;
	bool unreliableReady = false;
	bool ready = false;
	LinkState state = LinkState::Idle;
};

const char *connectionStateName(ConnectionState state);
const char *linkStateName(LinkState state);
const char *signalTypeName(SignalType type);
const char *transportChannelLabel(TransportChannel channel);

} // namespace gamenet
