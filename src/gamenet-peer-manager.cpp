/*
 * GameNet P2P SDK
 * Connection registry implementation
 */

#include "gamenet-peer-manager.h"

#include <stdexcept>

#include "gamenet-utils.h"

namespace gamenet
{

PeerManager::PeerManager(const std::string &localUserId, TransportFactory *factory, const SessionConfig &config)
	: localUserId_(localUserId), factory_(factory), config_(config)
{
	if (!factory_) {
		throw std::invalid_argument("transport factory is required");
	}
}

PeerManager::~PeerManager()
{
	onPeerReady_ = nullptr;
	onPeerFailed_ = nullptr;
	onPeerClosed_ = nullptr;
	removeAll();
}

RosterDiff PeerManager::diffRoster(const std::string &localUserId, const std::set<std::string> &linked,
                                   const std::vector<Peer> &roster)
{
	RosterDiff diff;
	std::set<std::string> wanted;

	for (const auto &member : roster) {
		if (member.userId.empty() || member.userId == localUserId) {
			continue;
		}
		if (!wanted.insert(member.userId).second) {
			continue;
		}
		if (!linked.count(member.userId)) {
			diff.added.push_back(member);
		}
	}

	for (const auto &userId : linked) {
		if (!wanted.count(userId)) {
			diff.removed.push_back(userId);
		}
	}

	return diff;
}

RosterDiff PeerManager::reconcile(const std::vector<Peer> &roster)
{
	RosterDiff diff = diffRoster(localUserId_, peerIds(), roster);

	// Departures first so their slots count toward maxPeers again
	for (const auto &userId : diff.removed) {
		removePeer(userId);
	}

	std::vector<Peer> added;
	for (const auto &peer : diff.added) {
		if (addPeer(peer)) {
			added.push_back(peer);
		}
	}
	diff.added = std::move(added);

	if (!diff.added.empty() || !diff.removed.empty()) {
		logInfo("Roster reconciled: %zu added, %zu removed, %zu linked", diff.added.size(), diff.removed.size(),
		        links_.size());
	}
	return diff;
}

bool PeerManager::addPeer(const Peer &peer)
{
	if (peer.userId.empty() || peer.userId == localUserId_) {
		return false;
	}
	if (links_.count(peer.userId)) {
		return false;
	}
	if (config_.maxPeers > 0 && links_.size() >= static_cast<size_t>(config_.maxPeers)) {
		logWarning("Peer limit reached (%d), not connecting to %s", config_.maxPeers, peer.userId.c_str());
		return false;
	}

	const uint64_t generation = nextGeneration_++;
	TransportEventSink sink = eventSink_;
	TransportEventSink stampedSink = [sink, generation](TransportEvent event) {
		event.linkGeneration = generation;
		if (sink) {
			sink(std::move(event));
		}
	};

	std::unique_ptr<PeerLink> link;
	try {
		auto transport = factory_->create(peer.userId, std::move(stampedSink));
		link = std::make_unique<PeerLink>(localUserId_, peer, std::move(transport), signalSender_, config_);
	} catch (const std::exception &ex) {
		logError("Failed to create transport for %s: %s", peer.userId.c_str(), ex.what());
		return false;
	}

	link->setOnReady([this](const Peer &readyPeer) {
		if (onPeerReady_) {
			onPeerReady_(readyPeer);
		}
	});
	link->setOnFailed([this](const Peer &failedPeer, const std::string &error) {
		if (onPeerFailed_) {
			onPeerFailed_(failedPeer, error);
		}
	});
	link->setOnClosed([this](const Peer &closedPeer) {
		if (onPeerClosed_) {
			onPeerClosed_(closedPeer);
		}
	});

	PeerLink *raw = link.get();
	LinkEntry entry;
	entry.generation = generation;
	entry.link = std::move(link);
	links_.emplace(peer.userId, std::move(entry));

	raw->start();
	return true;
}

bool PeerManager::removePeer(const std::string &userId)
{
	auto it = links_.find(userId);
	if (it == links_.end()) {
		return false;
	}

	// Detach first so callbacks fired during teardown see a consistent registry
	std::unique_ptr<PeerLink> link = std::move(it->second.link);
	links_.erase(it);

	link->teardown();
	logInfo("Removed peer %s", userId.c_str());
	return true;
}

void PeerManager::removeAll()
{
	while (!links_.empty()) {
		removePeer(links_.begin()->first);
	}
}

PeerLink *PeerManager::findLink(const std::string &userId)
{
	auto it = links_.find(userId);
	return it == links_.end() ? nullptr : it->second.link.get();
}

void PeerManager::handleOffer(const std::string &fromUserId, const SessionDescription &offer)
{
	PeerLink *link = findLink(fromUserId);
	if (!link) {
		logWarning("Ignoring offer from unlinked peer %s", fromUserId.c_str());
		return;
	}
	link->handleOffer(offer);
}

void PeerManager::handleAnswer(const std::string &fromUserId, const SessionDescription &answer)
{
	PeerLink *link = findLink(fromUserId);
	if (!link) {
		logWarning("Ignoring answer from unlinked peer %s", fromUserId.c_str());
		return;
	}
	link->handleAnswer(answer);
}

void PeerManager::handleRemoteCandidate(const std::string &fromUserId, const IceCandidate &candidate)
{
	PeerLink *link = findLink(fromUserId);
	if (!link) {
		logDebug("Ignoring candidate from unlinked peer %s", fromUserId.c_str());
		return;
	}
	link->handleRemoteCandidate(candidate);
}

void PeerManager::handleTransportEvent(const TransportEvent &event)
{
	auto it = links_.find(event.peerId);
	if (it == links_.end() || it->second.generation != event.linkGeneration) {
		logDebug("Dropping stale %s event for %s", transportEventName(event.type), event.peerId.c_str());
		return;
	}
	it->second.link->handleTransportEvent(event);
}

void PeerManager::flushPendingSignals()
{
	for (auto &pair : links_) {
		pair.second.link->flushPendingSignals();
	}
}

bool PeerManager::send(const std::string &toUserId, TransportChannel channel, const std::vector<uint8_t> &data)
{
	PeerLink *link = findLink(toUserId);
	return link && link->send(channel, data);
}

size_t PeerManager::broadcast(TransportChannel channel, const std::vector<uint8_t> &data)
{
	size_t sent = 0;
	for (auto &pair : links_) {
		if (pair.second.link->send(channel, data)) {
			sent++;
		}
	}
	return sent;
}

bool PeerManager::hasPeer(const std::string &userId) const
{
	return links_.count(userId) > 0;
}

const PeerLink *PeerManager::link(const std::string &userId) const
{
	auto it = links_.find(userId);
	return it == links_.end() ? nullptr : it->second.link.get();
}

std::set<std::string> PeerManager::peerIds() const
{
	std::set<std::string> ids;
	for (const auto &pair : links_) {
		ids.insert(pair.first);
	}
	return ids;
}

size_t PeerManager::readyCount() const
{
	size_t count = 0;
	for (const auto &pair : links_) {
		if (pair.second.link->isReady()) {
			count++;
		}
	}
	return count;
}

bool PeerManager::allReady() const
{
	return !links_.empty() && readyCount() == links_.size();
}

bool PeerManager::allFailed() const
{
	if (links_.empty()) {
		return false;
	}
	for (const auto &pair : links_) {
		if (pair.second.link->state() != LinkState::Failed) {
			return false;
		}
	}
	return true;
}

std::map<std::string, PeerStatus> PeerManager::peerStatuses() const
{
	std::map<std::string, PeerStatus> statuses;
	for (const auto &pair : links_) {
		statuses[pair.first] = pair.second.link->status();
	}
	return statuses;
}

} // namespace gamenet
