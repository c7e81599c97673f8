/*
 * GameNet P2P SDK
 * Signaling relay contract and relay client
 */

#pragma once

#include <functional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "gamenet-common.h"

namespace gamenet
{

// Raised by relay implementations for any transient backend failure
class RelayError : public std::runtime_error
{
public:
	using std::runtime_error::runtime_error;
};

// Backend mailbox that stores envelopes until the recipient acknowledges them.
// Batch and error callbacks may be invoked from any thread.
class SignalingRelay
{
public:
	using BatchCallback = std::function<void(const std::vector<SignalingEnvelope> &batch)>;
	using ErrorCallback = std::function<void(const std::string &error)>;
	using Unsubscribe = std::function<void()>;

	virtual ~SignalingRelay() = default;

	virtual void sendSignalingEnvelope(const std::string &lobbyId, const std::string &toUserId, SignalType type,
	                                   const SignalPayload &payload) = 0;
	virtual Unsubscribe subscribeSignalingEnvelopes(const std::string &lobbyId, BatchCallback onBatch,
	                                                ErrorCallback onError) = 0;
	virtual void acknowledgeEnvelopes(const std::vector<std::string> &ids) = 0;
};

class SignalingRelayClient
{
public:
	using OnDescriptionCallback = std::function<void(const std::string &fromUserId, const SessionDescription &desc)>;
	using OnCandidateCallback = std::function<void(const std::string &fromUserId, const IceCandidate &candidate)>;
	using PeerFilter = std::function<bool(const std::string &userId)>;

	SignalingRelayClient(SignalingRelay *relay, const std::string &localUserId);
	~SignalingRelayClient();

	SignalingRelayClient(const SignalingRelayClient &) = delete;
	SignalingRelayClient &operator=(const SignalingRelayClient &) = delete;

	// Subscribes to the lobby mailbox. Batches and errors are forwarded untouched so the
	// caller can hop them onto its own thread before calling processBatch().
	bool start(const std::string &lobbyId, SignalingRelay::BatchCallback onBatch,
	           SignalingRelay::ErrorCallback onError);
	bool resubscribe();
	void handleSubscriptionError(const std::string &error);
	void stop();

	bool isSubscribed() const { return static_cast<bool>(unsubscribe_); }
	const std::string &lobbyId() const { return lobbyId_; }
	const std::string &localUserId() const { return localUserId_; }

	// Throws std::invalid_argument for an unknown recipient and RelayError when the relay fails
	void send(const std::string &toUserId, SignalType type, const SignalPayload &payload);

	void processBatch(const std::vector<SignalingEnvelope> &batch);

	void setPeerFilter(PeerFilter filter) { peerFilter_ = std::move(filter); }
	void setOnOffer(OnDescriptionCallback callback) { onOffer_ = std::move(callback); }
	void setOnAnswer(OnDescriptionCallback callback) { onAnswer_ = std::move(callback); }
	void setOnIceCandidate(OnCandidateCallback callback) { onIceCandidate_ = std::move(callback); }

	size_t processedCount() const { return processed_.size(); }
	bool hasProcessed(const std::string &id) const { return processed_.count(id) > 0; }

private:
	bool isKnownPeer(const std::string &userId) const;
	void dispatch(const SignalingEnvelope &envelope);
	void acknowledge(const std::vector<std::string> &ids);

	SignalingRelay *relay_;
	std::string localUserId_;
	std::string lobbyId_;

	SignalingRelay::BatchCallback onBatch_;
	SignalingRelay::ErrorCallback onError_;
	SignalingRelay::Unsubscribe unsubscribe_;

	// Ids dispatched but not yet acknowledged
	std::set<std::string> processed_;

	PeerFilter peerFilter_;
	OnDescriptionCallback onOffer_;
	OnDescriptionCallback onAnswer_;
	OnCandidateCallback onIceCandidate_;
};

} // namespace gamenet
