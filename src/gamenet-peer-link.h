/*
 * GameNet P2P SDK
 * Per-peer connection establishment state machine
 */

#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "gamenet-common.h"
#include "gamenet-transport.h"

namespace gamenet
{

class PeerLink
{
public:
	// Throws RelayError when the relay is unavailable
	using SignalSender =
	    std::function<void(const std::string &toUserId, SignalType type, const SignalPayload &payload)>;
	using OnReadyCallback = std::function<void(const Peer &peer)>;
	using OnFailedCallback = std::function<void(const Peer &peer, const std::string &error)>;
	using OnClosedCallback = std::function<void(const Peer &peer)>;

	PeerLink(const std::string &localUserId, const Peer &peer, std::unique_ptr<PeerTransport> transport,
	         SignalSender sender, const SessionConfig &config);
	~PeerLink();

	PeerLink(const PeerLink &) = delete;
	PeerLink &operator=(const PeerLink &) = delete;

	// The lexicographically lower user id makes the offer
	static LinkRole roleFor(const std::string &localUserId, const std::string &remoteUserId);

	void start();

	void handleOffer(const SessionDescription &offer);
	void handleAnswer(const SessionDescription &answer);
	void handleRemoteCandidate(const IceCandidate &candidate);
	void handleTransportEvent(const TransportEvent &event);

	// Retries envelopes the relay refused earlier, oldest first
	void flushPendingSignals();

	void fail(const std::string &error);
	void teardown();

	bool send(TransportChannel channel, const std::vector<uint8_t> &data);

	const Peer &peer() const { return peer_; }
	LinkRole role() const { return role_; }
	LinkState state() const { return state_; }
	bool isReady() const { return state_ == LinkState::Connected; }
	bool isTerminal() const { return state_ == LinkState::Failed || state_ == LinkState::Disconnected; }
	PeerStatus status() const;
	size_t pendingSignalCount() const { return pendingSignals_.size(); }
	size_t bufferedCandidateCount() const { return bufferedCandidates_.size(); }

	void setOnReady(OnReadyCallback callback) { onReady_ = std::move(callback); }
	void setOnFailed(OnFailedCallback callback) { onFailed_ = std::move(callback); }
	void setOnClosed(OnClosedCallback callback) { onClosed_ = std::move(callback); }

private:
	struct PendingSignal {
		SignalType type;
		SignalPayload payload;
	};

	bool channelEnabled(TransportChannel channel) const;
	bool allChannelsOpen() const;
	void setChannelOpen(TransportChannel channel, bool open);
	void applyRemoteDescription(const SessionDescription &description);
	void applyCandidate(const IceCandidate &candidate);
	void sendSignal(SignalType type, const SignalPayload &payload);
	bool trySendSignal(const PendingSignal &signal);
	void closeTransport();

	std::string localUserId_;
	Peer peer_;
	LinkRole role_;
	LinkState state_ = LinkState::Idle;

	std::unique_ptr<PeerTransport> transport_;
	SignalSender sender_;

	bool reliableEnabled_;
	bool unreliableEnabled_;
	bool reliableOpen_ = false;
	bool unreliableOpen_ = false;

	bool remoteDescriptionSet_ = false;
	bool transportClosed_ = false;
	std::vector<IceCandidate> bufferedCandidates_;
	std::deque<PendingSignal> pendingSignals_;

	OnReadyCallback onReady_;
	OnFailedCallback onFailed_;
	OnClosedCallback onClosed_;
};

} // namespace gamenet
