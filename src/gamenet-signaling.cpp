/*
 * GameNet P2P SDK
 * Signaling relay client implementation
 */

#include "gamenet-signaling.h"

#include "gamenet-utils.h"

namespace gamenet
{

SignalingRelayClient::SignalingRelayClient(SignalingRelay *relay, const std::string &localUserId)
	: relay_(relay), localUserId_(localUserId)
{
	if (!relay_) {
		throw std::invalid_argument("signaling relay is required");
	}
}

SignalingRelayClient::~SignalingRelayClient()
{
	stop();
}

bool SignalingRelayClient::start(const std::string &lobbyId, SignalingRelay::BatchCallback onBatch,
                                 SignalingRelay::ErrorCallback onError)
{
	stop();

	lobbyId_ = lobbyId;
	onBatch_ = std::move(onBatch);
	onError_ = std::move(onError);
	return resubscribe();
}

bool SignalingRelayClient::resubscribe()
{
	if (lobbyId_.empty()) {
		return false;
	}
	if (unsubscribe_) {
		return true;
	}

	try {
		unsubscribe_ = relay_->subscribeSignalingEnvelopes(lobbyId_, onBatch_, onError_);
		logInfo("Subscribed to signaling for lobby %s", lobbyId_.c_str());
		return true;
	} catch (const std::exception &ex) {
		logWarning("Signaling subscription for lobby %s failed: %s", lobbyId_.c_str(), ex.what());
		return false;
	}
}

void SignalingRelayClient::handleSubscriptionError(const std::string &error)
{
	logWarning("Signaling subscription error for lobby %s: %s", lobbyId_.c_str(), error.c_str());

	// Drop the broken subscription; the next resubscribe() opens a fresh one
	if (unsubscribe_) {
		auto unsubscribe = std::move(unsubscribe_);
		unsubscribe_ = nullptr;
		try {
			unsubscribe();
		} catch (const std::exception &ex) {
			logDebug("Ignoring unsubscribe failure: %s", ex.what());
		}
	}
}

void SignalingRelayClient::stop()
{
	if (unsubscribe_) {
		auto unsubscribe = std::move(unsubscribe_);
		unsubscribe_ = nullptr;
		try {
			unsubscribe();
		} catch (const std::exception &ex) {
			logWarning("Failed to cancel signaling subscription: %s", ex.what());
		}
		logInfo("Unsubscribed from signaling for lobby %s", lobbyId_.c_str());
	}

	onBatch_ = nullptr;
	onError_ = nullptr;
	processed_.clear();
	lobbyId_.clear();
}

bool SignalingRelayClient::isKnownPeer(const std::string &userId) const
{
	if (userId.empty() || userId == localUserId_) {
		return false;
	}
	return !peerFilter_ || peerFilter_(userId);
}

void SignalingRelayClient::send(const std::string &toUserId, SignalType type, const SignalPayload &payload)
{
	if (!isKnownPeer(toUserId)) {
		throw std::invalid_argument("recipient " + toUserId + " is not a lobby peer");
	}

	relay_->sendSignalingEnvelope(lobbyId_, toUserId, type, payload);
	logDebug("Sent %s to %s", signalTypeName(type), toUserId.c_str());
}

void SignalingRelayClient::dispatch(const SignalingEnvelope &envelope)
{
	switch (envelope.type) {
	case SignalType::Offer:
	case SignalType::Answer: {
		const auto *description = std::get_if<SessionDescription>(&envelope.payload);
		if (!description) {
			throw std::invalid_argument("expected a session description payload");
		}
		const auto &callback = envelope.type == SignalType::Offer ? onOffer_ : onAnswer_;
		if (callback) {
			callback(envelope.fromUserId, *description);
		}
		break;
	}
	case SignalType::IceCandidate: {
		const auto *candidate = std::get_if<IceCandidate>(&envelope.payload);
		if (!candidate) {
			throw std::invalid_argument("expected an ice candidate payload");
		}
		if (onIceCandidate_) {
			onIceCandidate_(envelope.fromUserId, *candidate);
		}
		break;
	}
	}
}

void SignalingRelayClient::processBatch(const std::vector<SignalingEnvelope> &batch)
{
	std::vector<std::string> toAcknowledge;

	for (const auto &envelope : batch) {
		if (processed_.count(envelope.id)) {
			logDebug("Skipping redelivered envelope %s", envelope.id.c_str());
			toAcknowledge.push_back(envelope.id);
			continue;
		}

		if (!envelope.toUserId.empty() && envelope.toUserId != localUserId_) {
			// Someone else's mail; leave it for them
			continue;
		}

		if (envelope.fromUserId == localUserId_) {
			processed_.insert(envelope.id);
			toAcknowledge.push_back(envelope.id);
			continue;
		}

		if (!isKnownPeer(envelope.fromUserId)) {
			logWarning("Ignoring %s from unknown user %s", signalTypeName(envelope.type),
			           envelope.fromUserId.c_str());
			processed_.insert(envelope.id);
			toAcknowledge.push_back(envelope.id);
			continue;
		}

		try {
			dispatch(envelope);
		} catch (const RelayError &ex) {
			// Leave unprocessed and unacknowledged so the relay hands it back
			logWarning("Deferring %s from %s: %s", signalTypeName(envelope.type), envelope.fromUserId.c_str(),
			           ex.what());
			continue;
		} catch (const std::exception &ex) {
			logWarning("Dropping %s from %s: %s", signalTypeName(envelope.type), envelope.fromUserId.c_str(),
			           ex.what());
		}

		processed_.insert(envelope.id);
		toAcknowledge.push_back(envelope.id);
	}

	acknowledge(toAcknowledge);
}

void SignalingRelayClient::acknowledge(const std::vector<std::string> &ids)
{
	if (ids.empty()) {
		return;
	}

	try {
		relay_->acknowledgeEnvelopes(ids);
	} catch (const std::exception &ex) {
		logWarning("Failed to acknowledge %zu envelopes: %s", ids.size(), ex.what());
		return;
	}

	for (const auto &id : ids) {
		processed_.erase(id);
	}
}

} // namespace gamenet
