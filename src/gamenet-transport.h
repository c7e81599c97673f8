/*
 * GameNet P2P SDK
 * Transport capability consumed by peer links
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "gamenet-common.h"

namespace gamenet
{

struct TransportEvent {
	enum class Type {
		LocalDescription, // description produced by createOffer/createAnswer
		LocalCandidate,
		ChannelOpen,
		ChannelClosed,
		ChannelError,
		Message,
		StateFailed
	};

	Type type = Type::StateFailed;
	std::string peerId;
	uint64_t linkGeneration = 0; // stamped by the registry so stale events can be discarded
	TransportChannel channel = TransportChannel::Reliable;
	SessionDescription description;
	IceCandidate candidate;
	std::vector<uint8_t> data;
	std::string error;
};

const char *transportEventName(TransportEvent::Type type);

// Called from transport threads; implementations must be thread-safe
using TransportEventSink = std::function<void(TransportEvent event)>;

// One connection to one remote peer. Methods are called from the session thread only.
class PeerTransport
{
public:
	virtual ~PeerTransport() = default;

	// Offerer side only; the answerer learns its channels through ChannelOpen events
	virtual void createChannel(TransportChannel channel) = 0;
	virtual void createOffer() = 0;
	virtual void createAnswer() = 0;
	// Throws when the description is rejected
	virtual void setRemoteDescription(const SessionDescription &description) = 0;
	virtual void addRemoteCandidate(const IceCandidate &candidate) = 0;

	virtual bool send(TransportChannel channel, const std::vector<uint8_t> &data) = 0;
	virtual bool isChannelOpen(TransportChannel channel) const = 0;

	// Idempotent; no events are delivered after close returns
	virtual void close() = 0;
};

class TransportFactory
{
public:
	virtual ~TransportFactory() = default;
	virtual std::unique_ptr<PeerTransport> create(const std::string &peerId, TransportEventSink sink) = 0;
};

} // namespace gamenet
