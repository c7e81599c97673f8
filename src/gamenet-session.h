/*
 * GameNet P2P SDK
 * P2P session facade: one lobby connection per instance
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "gamenet-common.h"
#include "gamenet-engine-bridge.h"
#include "gamenet-message-queue.h"
#include "gamenet-peer-manager.h"
#include "gamenet-signaling.h"
#include "gamenet-stats.h"
#include "gamenet-transport.h"

namespace gamenet
{

struct Connection {
	std::string lobbyId;
	std::map<std::string, Peer> peers;
	ConnectionState state = ConnectionState::Disconnected;
};

// Callback output converted into a message for the session thread
struct SessionEvent {
	enum class Type { SignalBatch, SignalError, Transport };

	Type type = Type::Transport;
	uint64_t epoch = 0;
	std::vector<SignalingEnvelope> batch;
	std::string error;
	TransportEvent transport;
};

class SessionInbox
{
public:
	void push(SessionEvent event);
	std::deque<SessionEvent> drain();
	void clear();
	size_t size() const;

private:
	mutable std::mutex mutex_;
	std::deque<SessionEvent> events_;
};

class P2PSession
{
public:
	P2PSession(const std::string &localUserId, SignalingRelay *relay, TransportFactory *transportFactory,
	           const SessionConfig &config = SessionConfig());
	~P2PSession();

	P2PSession(const P2PSession &) = delete;
	P2PSession &operator=(const P2PSession &) = delete;

	// Establishing a different lobby tears down the current one; the same lobby updates members
	Connection establish(const std::string &lobbyId, const std::vector<Peer> &members);
	void updateMembers(const std::vector<Peer> &members);
	void disconnect();

	// Processes queued callbacks, retries pending signals and drains the outbound queue
	void tick();

	// An empty toUserId broadcasts to every ready peer
	bool send(const std::string &toUserId, uint32_t channel, bool reliable, const std::vector<uint8_t> &payload);

	// Engine-side queue access. Frames from or for users outside the current lobby are dropped.
	bool receive(uint32_t channel, MessageFrame &frame);
	bool queueOutbound(const std::string &toUserId, uint32_t channel, const std::vector<uint8_t> &payload);

	std::map<std::string, PeerStatus> peerStatuses() const;
	bool isPeerReady(const std::string &userId) const;
	ConnectionState state() const { return connection_.state; }
	Connection connection() const { return connection_; }
	bool isActive() const { return active_; }

	const std::string &localUserId() const { return localUserId_; }
	const SessionConfig &config() const { return config_; }
	MessageQueue &queue() { return *queue_; }
	P2PStats &stats() { return stats_; }
	size_t pendingEventCount() const { return inbox_.size(); }

	void setEngineSink(EngineSink *sink, const std::string &receiver = kDefaultEngineReceiver);
	void reportStats();

private:
	// Guards callbacks arriving on foreign threads against session destruction
	struct CallbackGuard {
		std::mutex mutex;
		P2PSession *session = nullptr;
	};

	void startConnection(const std::string &lobbyId);
	void postEvent(SessionEvent event);
	void onTransportEvent(TransportEvent event, uint64_t epoch);
	void handleInboundMessage(const TransportEvent &event);
	void processEvent(const SessionEvent &event);
	void drainOutbound();
	bool isUnreliableChannel(uint32_t channel) const;
	void updateAggregateState();
	void setState(ConnectionState state);

	std::string localUserId_;
	SignalingRelay *relay_;
	TransportFactory *transportFactory_;
	SessionConfig config_;

	std::shared_ptr<CallbackGuard> guard_;
	std::atomic<uint64_t> epoch_{0};
	SessionInbox inbox_;

	Connection connection_;
	bool active_ = false;
	bool disconnecting_ = false;

	std::unique_ptr<SignalingRelayClient> relayClient_;
	std::unique_ptr<PeerManager> peers_;

	P2PStats stats_;
	std::unique_ptr<MessageQueue> queue_;
	EngineBridge engine_;
};

} // namespace gamenet
