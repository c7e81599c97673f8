/*
 * GameNet P2P SDK
 * P2P session facade implementation
 */

#include "gamenet-session.h"

#include <algorithm>

#include "gamenet-config.h"
#include "gamenet-utils.h"
#include "gamenet-wire-codec.h"

namespace gamenet
{

void SessionInbox::push(SessionEvent event)
{
	std::lock_guard<std::mutex> lock(mutex_);
	events_.push_back(std::move(event));
}

std::deque<SessionEvent> SessionInbox::drain()
{
	std::lock_guard<std::mutex> lock(mutex_);
	std::deque<SessionEvent> events;
	events.swap(events_);
	return events;
}

void SessionInbox::clear()
{
	std::lock_guard<std::mutex> lock(mutex_);
	events_.clear();
}

size_t SessionInbox::size() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return events_.size();
}

P2PSession::P2PSession(const std::string &localUserId, SignalingRelay *relay, TransportFactory *transportFactory,
                       const SessionConfig &config)
	: localUserId_(localUserId),
	  relay_(relay),
	  transportFactory_(transportFactory),
	  config_(config),
	  guard_(std::make_shared<CallbackGuard>())
{
	std::string error;
	if (!validateSessionConfig(config_, &error)) {
		logError("Invalid session config (%s), using defaults", error.c_str());
		config_ = SessionConfig();
	}
	setLogLevel(config_.logLevel);

	guard_->session = this;

	relayClient_ = std::make_unique<SignalingRelayClient>(relay_, localUserId_);
	relayClient_->setPeerFilter([this](const std::string &userId) { return connection_.peers.count(userId) > 0; });
	relayClient_->setOnOffer([this](const std::string &fromUserId, const SessionDescription &offer) {
		if (peers_) {
			peers_->handleOffer(fromUserId, offer);
		}
	});
	relayClient_->setOnAnswer([this](const std::string &fromUserId, const SessionDescription &answer) {
		if (peers_) {
			peers_->handleAnswer(fromUserId, answer);
		}
	});
	relayClient_->setOnIceCandidate([this](const std::string &fromUserId, const IceCandidate &candidate) {
		if (peers_) {
			peers_->handleRemoteCandidate(fromUserId, candidate);
		}
	});

	try {
		queue_ = std::make_unique<MessageQueue>(QueueLayout::fromConfig(config_));
	} catch (const std::exception &ex) {
		logError("Cannot allocate message queue (%s), using default geometry", ex.what());
		config_.maxChannels = kDefaultMaxChannels;
		config_.slotCount = kDefaultSlotCount;
		config_.slotSize = kDefaultSlotSize;
		config_.unreliableChannels.clear();
		queue_ = std::make_unique<MessageQueue>(QueueLayout::fromConfig(config_));
	}
	stats_.setQueueCapacity(config_.slotCount);
	if (config_.enableStats) {
		stats_.enable();
	}
	queue_->setStats(&stats_);

	logInfo("P2P session created for %s (GameNet %s)", localUserId_.c_str(), GAMENET_VERSION);
}

P2PSession::~P2PSession()
{
	{
		std::lock_guard<std::mutex> lock(guard_->mutex);
		guard_->session = nullptr;
	}
	disconnect();
}

void P2PSession::setEngineSink(EngineSink *sink, const std::string &receiver)
{
	engine_.setSink(sink);
	engine_.setReceiver(receiver);
}

Connection P2PSession::establish(const std::string &lobbyId, const std::vector<Peer> &members)
{
	if (lobbyId.empty()) {
		logWarning("Cannot establish P2P connection without a lobby id");
		return connection_;
	}

	if (active_ && connection_.lobbyId == lobbyId) {
		updateMembers(members);
		return connection_;
	}

	if (active_) {
		logInfo("Switching P2P connection from lobby %s to %s", connection_.lobbyId.c_str(), lobbyId.c_str());
		disconnect();
	}

	startConnection(lobbyId);
	updateMembers(members);
	return connection_;
}

void P2PSession::startConnection(const std::string &lobbyId)
{
	const uint64_t epoch = ++epoch_;
	std::weak_ptr<CallbackGuard> weakGuard = guard_;

	connection_ = Connection();
	connection_.lobbyId = lobbyId;
	active_ = true;

	peers_ = std::make_unique<PeerManager>(localUserId_, transportFactory_, config_);
	peers_->setSignalSender([this](const std::string &toUserId, SignalType type, const SignalPayload &payload) {
		relayClient_->send(toUserId, type, payload);
	});
	peers_->setTransportEventSink([weakGuard, epoch](TransportEvent event) {
		auto guard = weakGuard.lock();
		if (!guard)
			return;
		std::lock_guard<std::mutex> lock(guard->mutex);
		if (guard->session) {
			guard->session->onTransportEvent(std::move(event), epoch);
		}
	});
	peers_->setOnPeerReady([this](const Peer &peer) {
		engine_.connectionEstablished(peer);
		updateAggregateState();
	});
	peers_->setOnPeerFailed([this](const Peer &peer, const std::string &error) {
		engine_.connectionFailed(peer, error);
		updateAggregateState();
	});
	peers_->setOnPeerClosed([this](const Peer &peer) { engine_.peerDisconnected(peer); });

	relayClient_->start(
	    lobbyId,
	    [weakGuard, epoch](const std::vector<SignalingEnvelope> &batch) {
		    auto guard = weakGuard.lock();
		    if (!guard)
			    return;
		    std::lock_guard<std::mutex> lock(guard->mutex);
		    if (guard->session) {
			    SessionEvent event;
			    event.type = SessionEvent::Type::SignalBatch;
			    event.epoch = epoch;
			    event.batch = batch;
			    guard->session->postEvent(std::move(event));
		    }
	    },
	    [weakGuard, epoch](const std::string &error) {
		    auto guard = weakGuard.lock();
		    if (!guard)
			    return;
		    std::lock_guard<std::mutex> lock(guard->mutex);
		    if (guard->session) {
			    SessionEvent event;
			    event.type = SessionEvent::Type::SignalError;
			    event.epoch = epoch;
			    event.error = error;
			    guard->session->postEvent(std::move(event));
		    }
	    });

	setState(ConnectionState::Connecting);
}

void P2PSession::updateMembers(const std::vector<Peer> &members)
{
	if (!active_) {
		logWarning("Ignoring member update: no active P2P connection");
		return;
	}

	std::map<std::string, Peer> others;
	for (const auto &member : members) {
		if (!member.userId.empty() && member.userId != localUserId_) {
			others.emplace(member.userId, member);
		}
	}

	if (members.size() <= 1 || others.empty()) {
		logInfo("Lobby %s has no other members, disconnecting", connection_.lobbyId.c_str());
		disconnect();
		return;
	}

	connection_.peers = others;
	peers_->reconcile(members);
	updateAggregateState();
}

void P2PSession::disconnect()
{
	if (disconnecting_ || !active_) {
		return;
	}
	disconnecting_ = true;

	const std::string lobbyId = connection_.lobbyId;
	++epoch_;

	relayClient_->stop();
	if (peers_) {
		peers_->removeAll();
		peers_.reset();
	}
	inbox_.clear();

	active_ = false;
	connection_.peers.clear();
	setState(ConnectionState::Disconnected);
	logInfo("Disconnected P2P from lobby %s", lobbyId.c_str());

	disconnecting_ = false;
}

void P2PSession::postEvent(SessionEvent event)
{
	inbox_.push(std::move(event));
}

void P2PSession::onTransportEvent(TransportEvent event, uint64_t epoch)
{
	if (epoch != epoch_.load()) {
		return;
	}

	if (event.type == TransportEvent::Type::Message) {
		handleInboundMessage(event);
		return;
	}

	SessionEvent sessionEvent;
	sessionEvent.type = SessionEvent::Type::Transport;
	sessionEvent.epoch = epoch;
	sessionEvent.transport = std::move(event);
	postEvent(std::move(sessionEvent));
}

void P2PSession::handleInboundMessage(const TransportEvent &event)
{
	MessageFrame frame;
	std::string error;
	if (!decodeFrame(event.data, frame, &error)) {
		logWarning("Dropping malformed frame from %s: %s", event.peerId.c_str(), error.c_str());
		return;
	}

	if (frame.senderUserId != event.peerId) {
		logWarning("Dropping frame from %s claiming sender %s", event.peerId.c_str(), frame.senderUserId.c_str());
		return;
	}

	queue_->enqueue(QueueDirection::Inbound, frame.channel, event.data);
}

void P2PSession::tick()
{
	std::deque<SessionEvent> events = inbox_.drain();
	if (!active_) {
		return;
	}

	relayClient_->resubscribe();

	for (const auto &event : events) {
		if (!active_ || event.epoch != epoch_.load()) {
			continue;
		}
		processEvent(event);
	}

	if (!active_) {
		return;
	}

	peers_->flushPendingSignals();
	drainOutbound();
	updateAggregateState();
}

void P2PSession::processEvent(const SessionEvent &event)
{
	switch (event.type) {
	case SessionEvent::Type::SignalBatch:
		relayClient_->processBatch(event.batch);
		break;
	case SessionEvent::Type::SignalError:
		relayClient_->handleSubscriptionError(event.error);
		break;
	case SessionEvent::Type::Transport:
		peers_->handleTransportEvent(event.transport);
		break;
	}
}

bool P2PSession::isUnreliableChannel(uint32_t channel) const
{
	return std::find(config_.unreliableChannels.begin(), config_.unreliableChannels.end(), channel) !=
	       config_.unreliableChannels.end();
}

void P2PSession::drainOutbound()
{
	std::vector<uint8_t> bytes;
	for (uint32_t channel = 0; channel < queue_->maxChannels(); ++channel) {
		while (queue_->dequeue(QueueDirection::Outbound, channel, bytes)) {
			MessageFrame frame;
			std::string error;
			if (!decodeFrame(bytes, frame, &error)) {
				logWarning("Dropping malformed outbound frame on channel %u: %s", channel, error.c_str());
				continue;
			}
			// The sender field of an outbound frame names the recipient
			if (!frame.senderUserId.empty() && !connection_.peers.count(frame.senderUserId)) {
				logWarning("Dropping outbound frame on channel %u for %s: not in lobby %s", channel,
				           frame.senderUserId.c_str(), connection_.lobbyId.c_str());
				continue;
			}
			send(frame.senderUserId, channel, !isUnreliableChannel(channel), frame.payload);
		}
	}
}

bool P2PSession::send(const std::string &toUserId, uint32_t channel, bool reliable,
                      const std::vector<uint8_t> &payload)
{
	if (!active_ || !peers_) {
		logWarning("Cannot send: no active P2P connection");
		return false;
	}
	if (channel >= config_.maxChannels) {
		logWarning("Cannot send on channel %u: channel out of range (max %u)", channel, config_.maxChannels);
		return false;
	}

	const TransportChannel transportChannel = reliable ? TransportChannel::Reliable : TransportChannel::Unreliable;
	if ((reliable && !config_.enableReliableChannel) || (!reliable && !config_.enableUnreliableChannel)) {
		logWarning("Cannot send: %s channel is disabled", transportChannelLabel(transportChannel));
		return false;
	}

	if (encodedFrameSize(payload.size()) > queue_->maxMessageSize()) {
		logWarning("Cannot send %zu byte payload: frame exceeds slot limit of %zu", payload.size(),
		           queue_->maxMessageSize());
		return false;
	}

	const std::vector<uint8_t> frame = encodeFrame(localUserId_, channel, payload.data(), payload.size());

	bool sent = false;
	if (toUserId.empty()) {
		sent = peers_->broadcast(transportChannel, frame) > 0;
		if (!sent) {
			logDebug("Broadcast on channel %u reached no peers", channel);
		}
	} else {
		sent = peers_->send(toUserId, transportChannel, frame);
		if (!sent) {
			logWarning("No open %s channel to peer %s", transportChannelLabel(transportChannel), toUserId.c_str());
		}
	}

	if (sent) {
		stats_.trackSend(frame.size());
	}
	return sent;
}

bool P2PSession::receive(uint32_t channel, MessageFrame &frame)
{
	std::vector<uint8_t> bytes;
	while (queue_->dequeue(QueueDirection::Inbound, channel, bytes)) {
		std::string error;
		if (!decodeFrame(bytes, frame, &error)) {
			logWarning("Discarding corrupt inbound frame on channel %u: %s", channel, error.c_str());
			continue;
		}
		// Frames left over from an earlier lobby or from a departed peer
		if (!connection_.peers.count(frame.senderUserId)) {
			logWarning("Discarding inbound frame on channel %u from %s: not in the current lobby", channel,
			           frame.senderUserId.c_str());
			continue;
		}
		return true;
	}
	return false;
}

bool P2PSession::queueOutbound(const std::string &toUserId, uint32_t channel, const std::vector<uint8_t> &payload)
{
	const std::vector<uint8_t> frame = encodeFrame(toUserId, channel, payload.data(), payload.size());
	return queue_->enqueue(QueueDirection::Outbound, channel, frame);
}

std::map<std::string, PeerStatus> P2PSession::peerStatuses() const
{
	if (!peers_) {
		return {};
	}
	return peers_->peerStatuses();
}

bool P2PSession::isPeerReady(const std::string &userId) const
{
	if (!peers_) {
		return false;
	}
	const PeerLink *link = peers_->link(userId);
	return link && link->isReady();
}

void P2PSession::updateAggregateState()
{
	if (!active_ || !peers_ || disconnecting_) {
		return;
	}

	if (peers_->allReady()) {
		setState(ConnectionState::Connected);
	} else if (peers_->allFailed()) {
		setState(ConnectionState::Failed);
	} else {
		setState(ConnectionState::Connecting);
	}
}

void P2PSession::setState(ConnectionState state)
{
	if (connection_.state == state) {
		return;
	}

	logInfo("P2P connection %s: %s -> %s", connection_.lobbyId.c_str(), connectionStateName(connection_.state),
	        connectionStateName(state));
	connection_.state = state;
	engine_.connectionStateChanged(connection_.lobbyId, state);
}

void P2PSession::reportStats()
{
	engine_.stats(stats_.snapshot());
}

} // namespace gamenet
