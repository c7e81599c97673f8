/*
 * Unit tests for the connection registry
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <algorithm>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "gamenet-peer-manager.h"
#include "gamenet-utils.h"
#include "test-fakes.h"

using namespace gamenet;
using namespace gamenet::fakes;

namespace
{

std::vector<Peer> roster(const std::vector<std::string> &ids)
{
	std::vector<Peer> peers;
	for (const auto &id : ids) {
		peers.push_back({id, id + "-name"});
	}
	return peers;
}

std::set<std::string> idsOf(const std::vector<Peer> &peers)
{
	std::set<std::string> ids;
	for (const auto &peer : peers) {
		ids.insert(peer.userId);
	}
	return ids;
}

} // namespace

class PeerManagerTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		previousLevel_ = getLogLevel();
		setLogLevel(LogLevel::Error);
		createManager("bob");
	}

	void TearDown() override
	{
		manager_.reset();
		setLogLevel(previousLevel_);
	}

	void createManager(const std::string &localUserId)
	{
		manager_ = std::make_unique<PeerManager>(localUserId, &factory_, config_);
		manager_->setSignalSender([this](const std::string &toUserId, SignalType type, const SignalPayload &) {
			signals_.push_back(toUserId + ":" + signalTypeName(type));
		});
		manager_->setTransportEventSink([this](TransportEvent event) { manager_->handleTransportEvent(event); });
		manager_->setOnPeerReady([this](const Peer &peer) { ready_.push_back(peer.userId); });
		manager_->setOnPeerFailed([this](const Peer &peer, const std::string &) { failed_.push_back(peer.userId); });
		manager_->setOnPeerClosed([this](const Peer &peer) { closed_.push_back(peer.userId); });
	}

	void connect(const std::string &peerId)
	{
		auto record = factory_.record(peerId);
		ASSERT_NE(record, nullptr);
		record->openChannel(TransportChannel::Reliable);
		record->openChannel(TransportChannel::Unreliable);
	}

	SessionConfig config_;
	FakeTransportFactory factory_;
	std::unique_ptr<PeerManager> manager_;
	std::vector<std::string> signals_;
	std::vector<std::string> ready_;
	std::vector<std::string> failed_;
	std::vector<std::string> closed_;
	LogLevel previousLevel_ = LogLevel::Warning;
};

TEST(RosterDiffTest, SkipsLocalUserAndDuplicates)
{
	RosterDiff diff = PeerManager::diffRoster("bob", {}, roster({"alice", "bob", "carol", "alice", ""}));
	EXPECT_EQ(idsOf(diff.added), (std::set<std::string>{"alice", "carol"}));
	EXPECT_EQ(diff.added.size(), 2u);
	EXPECT_TRUE(diff.removed.empty());
}

TEST(RosterDiffTest, ReportsDepartures)
{
	RosterDiff diff = PeerManager::diffRoster("bob", {"alice", "carol"}, roster({"bob", "carol", "dave"}));
	EXPECT_EQ(idsOf(diff.added), std::set<std::string>{"dave"});
	EXPECT_EQ(diff.removed, std::vector<std::string>{"alice"});
}

TEST_F(PeerManagerTest, RejectsMissingFactory)
{
	EXPECT_THROW(PeerManager("bob", nullptr, config_), std::invalid_argument);
}

TEST_F(PeerManagerTest, ReconcileConvergesToLatestRoster)
{
	const std::vector<std::vector<std::string>> rosters = {
	    {"alice", "bob", "carol"},
	    {"bob", "carol", "dave", "erin"},
	    {"erin", "bob"},
	    {"bob"},
	    {"zed", "bob", "alice"},
	};

	for (const auto &ids : rosters) {
		std::vector<std::string> shuffled(ids.rbegin(), ids.rend());
		manager_->reconcile(roster(shuffled));

		std::set<std::string> expected(ids.begin(), ids.end());
		expected.erase("bob");
		EXPECT_EQ(manager_->peerIds(), expected);
	}
}

TEST_F(PeerManagerTest, ReconcileReturnsWhatChanged)
{
	manager_->reconcile(roster({"alice", "bob", "carol"}));
	RosterDiff diff = manager_->reconcile(roster({"bob", "carol", "dave"}));

	EXPECT_EQ(idsOf(diff.added), std::set<std::string>{"dave"});
	EXPECT_EQ(diff.removed, std::vector<std::string>{"alice"});
	EXPECT_TRUE(factory_.record("alice")->closed);
	EXPECT_FALSE(factory_.record("carol")->closed);

	// Unchanged roster leaves existing transports alone
	const size_t created = factory_.history.size();
	diff = manager_->reconcile(roster({"bob", "carol", "dave"}));
	EXPECT_TRUE(diff.added.empty());
	EXPECT_TRUE(diff.removed.empty());
	EXPECT_EQ(factory_.history.size(), created);
}

TEST_F(PeerManagerTest, RolesFollowUserIdOrder)
{
	manager_->reconcile(roster({"alice", "bob", "carol"}));

	// bob answers alice and offers to carol
	EXPECT_EQ(manager_->link("alice")->role(), LinkRole::Answerer);
	EXPECT_EQ(manager_->link("carol")->role(), LinkRole::Offerer);
	EXPECT_EQ(factory_.record("alice")->offersCreated, 0);
	EXPECT_EQ(factory_.record("carol")->offersCreated, 1);
}

TEST_F(PeerManagerTest, EnforcesPeerLimit)
{
	config_.maxPeers = 2;
	createManager("bob");

	RosterDiff diff = manager_->reconcile(roster({"alice", "bob", "carol", "dave"}));
	EXPECT_EQ(diff.added.size(), 2u);
	EXPECT_EQ(manager_->peerCount(), 2u);

	// A departure frees a slot for the member left out
	const std::set<std::string> linked = manager_->peerIds();
	std::vector<std::string> next = {"bob", "alice", "carol", "dave"};
	next.erase(std::find(next.begin(), next.end(), *linked.begin()));
	manager_->reconcile(roster(next));
	EXPECT_EQ(manager_->peerCount(), 2u);
}

TEST_F(PeerManagerTest, FactoryFailureSkipsPeer)
{
	factory_.failCreate = true;
	RosterDiff diff = manager_->reconcile(roster({"alice", "bob"}));
	EXPECT_TRUE(diff.added.empty());
	EXPECT_EQ(manager_->peerCount(), 0u);

	factory_.failCreate = false;
	diff = manager_->reconcile(roster({"alice", "bob"}));
	EXPECT_EQ(diff.added.size(), 1u);
}

TEST_F(PeerManagerTest, RoutesSignalsToLinks)
{
	manager_->reconcile(roster({"alice", "bob", "carol"}));

	manager_->handleOffer("alice", {"offer", "v=0"});
	EXPECT_EQ(factory_.record("alice")->answersCreated, 1);

	manager_->handleAnswer("carol", {"answer", "v=0"});
	manager_->handleRemoteCandidate("carol", {"candidate:1", "0", 0});
	EXPECT_EQ(factory_.record("carol")->remoteDescriptions.size(), 1u);
	EXPECT_EQ(factory_.record("carol")->remoteCandidates.size(), 1u);

	// Unlinked senders are ignored
	manager_->handleOffer("mallory", {"offer", "v=0"});
	EXPECT_FALSE(manager_->hasPeer("mallory"));
}

TEST_F(PeerManagerTest, TransportEventsReachSignalSender)
{
	manager_->reconcile(roster({"bob", "carol"}));
	factory_.record("carol")->emitLocalDescription("offer", "v=0");
	EXPECT_EQ(signals_, std::vector<std::string>{"carol:offer"});
}

TEST_F(PeerManagerTest, DropsEventsFromReplacedLink)
{
	manager_->reconcile(roster({"bob", "carol"}));
	auto stale = factory_.record("carol");

	manager_->reconcile(roster({"bob"}));
	manager_->reconcile(roster({"bob", "carol"}));
	auto fresh = factory_.record("carol");
	ASSERT_NE(stale, fresh);

	// The old transport still holds its sink; its events must not touch the new link
	TransportEvent event;
	event.type = TransportEvent::Type::ChannelOpen;
	event.peerId = "carol";
	event.channel = TransportChannel::Reliable;
	stale->sink(event);
	event.channel = TransportChannel::Unreliable;
	stale->sink(event);

	EXPECT_FALSE(manager_->link("carol")->isReady());
	EXPECT_TRUE(ready_.empty());

	connect("carol");
	EXPECT_TRUE(manager_->link("carol")->isReady());
}

TEST_F(PeerManagerTest, AggregatesReadiness)
{
	EXPECT_FALSE(manager_->allReady());
	EXPECT_FALSE(manager_->allFailed());

	manager_->reconcile(roster({"alice", "bob", "carol"}));
	connect("alice");
	EXPECT_EQ(manager_->readyCount(), 1u);
	EXPECT_FALSE(manager_->allReady());

	connect("carol");
	EXPECT_TRUE(manager_->allReady());
	EXPECT_EQ(ready_.size(), 2u);

	auto statuses = manager_->peerStatuses();
	ASSERT_EQ(statuses.size(), 2u);
	EXPECT_TRUE(statuses["alice"].ready);
	EXPECT_EQ(statuses["carol"].state, LinkState::Connected);
}

TEST_F(PeerManagerTest, AllFailedOnlyWhenEveryLinkFailed)
{
	manager_->reconcile(roster({"alice", "bob", "carol"}));

	TransportEvent failure;
	failure.type = TransportEvent::Type::StateFailed;
	factory_.record("alice")->emit(failure);
	EXPECT_FALSE(manager_->allFailed());

	factory_.record("carol")->emit(failure);
	EXPECT_TRUE(manager_->allFailed());
	EXPECT_EQ(failed_.size(), 2u);
}

TEST_F(PeerManagerTest, SendAndBroadcastUseReadyLinks)
{
	manager_->reconcile(roster({"alice", "bob", "carol"}));
	connect("alice");

	EXPECT_TRUE(manager_->send("alice", TransportChannel::Reliable, {7}));
	EXPECT_FALSE(manager_->send("carol", TransportChannel::Reliable, {7}));
	EXPECT_FALSE(manager_->send("nobody", TransportChannel::Reliable, {7}));
	EXPECT_EQ(manager_->broadcast(TransportChannel::Unreliable, {8}), 1u);
}

TEST_F(PeerManagerTest, RemovingReadyPeerReportsClose)
{
	manager_->reconcile(roster({"alice", "bob"}));
	connect("alice");

	EXPECT_TRUE(manager_->removePeer("alice"));
	EXPECT_FALSE(manager_->removePeer("alice"));
	EXPECT_EQ(closed_, std::vector<std::string>{"alice"});
	EXPECT_TRUE(factory_.record("alice")->closed);
}

TEST_F(PeerManagerTest, RemoveAllTearsDownEveryLink)
{
	manager_->reconcile(roster({"alice", "bob", "carol", "dave"}));
	manager_->removeAll();
	EXPECT_EQ(manager_->peerCount(), 0u);
	for (const auto &record : factory_.history) {
		EXPECT_TRUE(record->closed);
	}
}
