/*
 * GameNet P2P SDK
 * Per-peer connection establishment state machine
 */

#include "gamenet-peer-link.h"

#include <stdexcept>

#include "gamenet-signaling.h"
#include "gamenet-utils.h"

namespace gamenet
{

PeerLink::PeerLink(const std::string &localUserId, const Peer &peer, std::unique_ptr<PeerTransport> transport,
                   SignalSender sender, const SessionConfig &config)
	: localUserId_(localUserId),
	  peer_(peer),
	  role_(roleFor(localUserId, peer.userId)),
	  transport_(std::move(transport)),
	  sender_(std::move(sender)),
	  reliableEnabled_(config.enableReliableChannel),
	  unreliableEnabled_(config.enableUnreliableChannel)
{
	if (!transport_) {
		throw std::invalid_argument("peer link for " + peer.userId + " has no transport");
	}
}

PeerLink::~PeerLink()
{
	// Callbacks reference the owner, which is going away too
	onReady_ = nullptr;
	onFailed_ = nullptr;
	onClosed_ = nullptr;
	closeTransport();
}

LinkRole PeerLink::roleFor(const std::string &localUserId, const std::string &remoteUserId)
{
	return localUserId < remoteUserId ? LinkRole::Offerer : LinkRole::Answerer;
}

void PeerLink::start()
{
	if (state_ != LinkState::Idle) {
		return;
	}

	state_ = LinkState::Connecting;
	logInfo("Connecting to %s as %s", peer_.userId.c_str(), role_ == LinkRole::Offerer ? "offerer" : "answerer");

	if (role_ != LinkRole::Offerer) {
		return;
	}

	try {
		if (reliableEnabled_) {
			transport_->createChannel(TransportChannel::Reliable);
		}
		if (unreliableEnabled_) {
			transport_->createChannel(TransportChannel::Unreliable);
		}
		transport_->createOffer();
	} catch (const std::exception &ex) {
		fail(std::string("failed to create offer: ") + ex.what());
	}
}

bool PeerLink::channelEnabled(TransportChannel channel) const
{
	return channel == TransportChannel::Reliable ? reliableEnabled_ : unreliableEnabled_;
}

bool PeerLink::allChannelsOpen() const
{
	return (!reliableEnabled_ || reliableOpen_) && (!unreliableEnabled_ || unreliableOpen_);
}

void PeerLink::setChannelOpen(TransportChannel channel, bool open)
{
	if (channel == TransportChannel::Reliable) {
		reliableOpen_ = open;
	} else {
		unreliableOpen_ = open;
	}
}

void PeerLink::applyRemoteDescription(const SessionDescription &description)
{
	transport_->setRemoteDescription(description);
	remoteDescriptionSet_ = true;

	if (!bufferedCandidates_.empty()) {
		logDebug("Applying %zu buffered candidates from %s", bufferedCandidates_.size(), peer_.userId.c_str());
	}
	std::vector<IceCandidate> buffered;
	buffered.swap(bufferedCandidates_);
	for (const auto &candidate : buffered) {
		applyCandidate(candidate);
	}
}

void PeerLink::applyCandidate(const IceCandidate &candidate)
{
	try {
		transport_->addRemoteCandidate(candidate);
	} catch (const std::exception &ex) {
		// One unusable candidate does not doom the connection
		logWarning("Rejected candidate from %s: %s", peer_.userId.c_str(), ex.what());
	}
}

void PeerLink::handleOffer(const SessionDescription &offer)
{
	if (isTerminal()) {
		return;
	}
	if (role_ == LinkRole::Offerer) {
		logWarning("Ignoring offer from %s: local side is the offerer", peer_.userId.c_str());
		return;
	}
	if (remoteDescriptionSet_) {
		logWarning("Ignoring repeated offer from %s", peer_.userId.c_str());
		return;
	}
	if (state_ == LinkState::Idle) {
		start();
	}

	try {
		applyRemoteDescription(offer);
		transport_->createAnswer();
	} catch (const std::exception &ex) {
		fail(std::string("failed to apply offer: ") + ex.what());
	}
}

void PeerLink::handleAnswer(const SessionDescription &answer)
{
	if (isTerminal()) {
		return;
	}
	if (role_ == LinkRole::Answerer) {
		logWarning("Ignoring answer from %s: local side is the answerer", peer_.userId.c_str());
		return;
	}
	if (remoteDescriptionSet_) {
		logWarning("Ignoring duplicate answer from %s", peer_.userId.c_str());
		return;
	}

	try {
		applyRemoteDescription(answer);
	} catch (const std::exception &ex) {
		fail(std::string("failed to apply answer: ") + ex.what());
	}
}

void PeerLink::handleRemoteCandidate(const IceCandidate &candidate)
{
	if (isTerminal()) {
		return;
	}
	if (!remoteDescriptionSet_) {
		bufferedCandidates_.push_back(candidate);
		return;
	}
	applyCandidate(candidate);
}

void PeerLink::handleTransportEvent(const TransportEvent &event)
{
	if (isTerminal()) {
		return;
	}

	switch (event.type) {
	case TransportEvent::Type::LocalDescription:
		sendSignal(role_ == LinkRole::Offerer ? SignalType::Offer : SignalType::Answer, event.description);
		break;

	case TransportEvent::Type::LocalCandidate:
		sendSignal(SignalType::IceCandidate, event.candidate);
		break;

	case TransportEvent::Type::ChannelOpen:
		if (!channelEnabled(event.channel)) {
			logWarning("Peer %s opened disabled %s channel", peer_.userId.c_str(),
			           transportChannelLabel(event.channel));
			break;
		}
		setChannelOpen(event.channel, true);
		logDebug("%s channel open with %s", transportChannelLabel(event.channel), peer_.userId.c_str());
		if (state_ == LinkState::Connecting && allChannelsOpen()) {
			state_ = LinkState::Connected;
			logInfo("Peer %s ready", peer_.userId.c_str());
			if (onReady_) {
				onReady_(peer_);
			}
		}
		break;

	case TransportEvent::Type::ChannelClosed:
		if (!channelEnabled(event.channel)) {
			break;
		}
		setChannelOpen(event.channel, false);
		if (state_ == LinkState::Connected) {
			logInfo("Peer %s closed its %s channel", peer_.userId.c_str(), transportChannelLabel(event.channel));
			state_ = LinkState::Disconnected;
			closeTransport();
			if (onClosed_) {
				onClosed_(peer_);
			}
		} else {
			fail(std::string(transportChannelLabel(event.channel)) + " channel closed before ready");
		}
		break;

	case TransportEvent::Type::ChannelError:
		fail(std::string(transportChannelLabel(event.channel)) + " channel error: " + event.error);
		break;

	case TransportEvent::Type::StateFailed:
		fail(event.error.empty() ? "transport failed" : event.error);
		break;

	case TransportEvent::Type::Message:
		// Inbound data bypasses the state machine
		break;
	}
}

void PeerLink::sendSignal(SignalType type, const SignalPayload &payload)
{
	PendingSignal signal{type, payload};

	// Keep order: nothing overtakes an envelope still waiting for retry
	if (!pendingSignals_.empty() || !trySendSignal(signal)) {
		pendingSignals_.push_back(std::move(signal));
	}
}

bool PeerLink::trySendSignal(const PendingSignal &signal)
{
	try {
		sender_(peer_.userId, signal.type, signal.payload);
		return true;
	} catch (const RelayError &ex) {
		logWarning("Relay refused %s for %s, will retry: %s", signalTypeName(signal.type), peer_.userId.c_str(),
		           ex.what());
		return false;
	} catch (const std::exception &ex) {
		logWarning("Dropping %s for %s: %s", signalTypeName(signal.type), peer_.userId.c_str(), ex.what());
		return true;
	}
}

void PeerLink::flushPendingSignals()
{
	while (!pendingSignals_.empty() && !isTerminal()) {
		if (!trySendSignal(pendingSignals_.front())) {
			return;
		}
		pendingSignals_.pop_front();
	}
}

void PeerLink::fail(const std::string &error)
{
	if (isTerminal()) {
		return;
	}

	logError("Connection to %s failed: %s", peer_.userId.c_str(), error.c_str());
	state_ = LinkState::Failed;
	reliableOpen_ = false;
	unreliableOpen_ = false;
	pendingSignals_.clear();
	bufferedCandidates_.clear();
	closeTransport();

	if (onFailed_) {
		onFailed_(peer_, error);
	}
}

void PeerLink::teardown()
{
	const bool wasReady = state_ == LinkState::Connected;
	closeTransport();

	if (state_ == LinkState::Disconnected) {
		return;
	}
	state_ = LinkState::Disconnected;
	reliableOpen_ = false;
	unreliableOpen_ = false;
	pendingSignals_.clear();
	bufferedCandidates_.clear();

	if (wasReady && onClosed_) {
		onClosed_(peer_);
	}
}

void PeerLink::closeTransport()
{
	if (transportClosed_ || !transport_) {
		return;
	}
	transportClosed_ = true;

	try {
		transport_->close();
	} catch (const std::exception &ex) {
		logWarning("Error closing transport to %s: %s", peer_.userId.c_str(), ex.what());
	}
}

bool PeerLink::send(TransportChannel channel, const std::vector<uint8_t> &data)
{
	if (state_ != LinkState::Connected || !channelEnabled(channel)) {
		return false;
	}
	return transport_->send(channel, data);
}

PeerStatus PeerLink::status() const
{
	PeerStatus status;
	status.reliableReady = reliableOpen_;
	status.unreliableReady = unreliableOpen_;
	status.ready = isReady();
	status.state = state_;
	return status;
}

} // namespace gamenet
