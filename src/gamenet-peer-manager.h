/*
 * GameNet P2P SDK
 * Connection registry: one peer link per lobby member
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "gamenet-common.h"
#include "gamenet-peer-link.h"
#include "gamenet-transport.h"

namespace gamenet
{

struct RosterDiff {
	std::vector<Peer> added;
	std::vector<std::string> removed;
};

class PeerManager
{
public:
	PeerManager(const std::string &localUserId, TransportFactory *factory, const SessionConfig &config);
	~PeerManager();

	PeerManager(const PeerManager &) = delete;
	PeerManager &operator=(const PeerManager &) = delete;

	// Computes which roster members need links and which linked peers have left.
	// The local user and repeated entries are skipped.
	static RosterDiff diffRoster(const std::string &localUserId, const std::set<std::string> &linked,
	                             const std::vector<Peer> &roster);

	// Brings the link set in line with the full roster; returns what changed
	RosterDiff reconcile(const std::vector<Peer> &roster);

	bool addPeer(const Peer &peer);
	bool removePeer(const std::string &userId);
	void removeAll();

	void handleOffer(const std::string &fromUserId, const SessionDescription &offer);
	void handleAnswer(const std::string &fromUserId, const SessionDescription &answer);
	void handleRemoteCandidate(const std::string &fromUserId, const IceCandidate &candidate);
	void handleTransportEvent(const TransportEvent &event);
	void flushPendingSignals();

	bool send(const std::string &toUserId, TransportChannel channel, const std::vector<uint8_t> &data);
	size_t broadcast(TransportChannel channel, const std::vector<uint8_t> &data);

	bool hasPeer(const std::string &userId) const;
	const PeerLink *link(const std::string &userId) const;
	std::set<std::string> peerIds() const;
	size_t peerCount() const { return links_.size(); }
	size_t readyCount() const;
	bool allReady() const;
	bool allFailed() const;
	std::map<std::string, PeerStatus> peerStatuses() const;

	void setSignalSender(PeerLink::SignalSender sender) { signalSender_ = std::move(sender); }
	void setTransportEventSink(TransportEventSink sink) { eventSink_ = std::move(sink); }
	void setOnPeerReady(PeerLink::OnReadyCallback callback) { onPeerReady_ = std::move(callback); }
	void setOnPeerFailed(PeerLink::OnFailedCallback callback) { onPeerFailed_ = std::move(callback); }
	void setOnPeerClosed(PeerLink::OnClosedCallback callback) { onPeerClosed_ = std::move(callback); }

private:
	struct LinkEntry {
		uint64_t generation = 0;
		std::unique_ptr<PeerLink> link;
	};

	PeerLink *findLink(const std::string &userId);

	std::string localUserId_;
	TransportFactory *factory_;
	SessionConfig config_;

	std::map<std::string, LinkEntry> links_;
	uint64_t nextGeneration_ = 1;

	PeerLink::SignalSender signalSender_;
	TransportEventSink eventSink_;
	PeerLink::OnReadyCallback onPeerReady_;
	PeerLink::OnFailedCallback onPeerFailed_;
	PeerLink::OnClosedCallback onPeerClosed_;
};

} // namespace gamenet
