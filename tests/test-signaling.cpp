/*
 * Unit tests for the signaling relay client
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "gamenet-signaling.h"
#include "gamenet-utils.h"
#include "test-fakes.h"

using namespace gamenet;
using namespace gamenet::fakes;

class SignalingRelayClientTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		previousLevel_ = getLogLevel();
		setLogLevel(LogLevel::Error);

		client_ = std::make_unique<SignalingRelayClient>(&relay_, "alice");
		client_->setPeerFilter([this](const std::string &userId) { return roster_.count(userId) > 0; });
		client_->setOnOffer([this](const std::string &from, const SessionDescription &offer) {
			offers_.push_back(from + ":" + offer.sdp);
			if (failDispatches_ > 0) {
				failDispatches_--;
				throw RelayError("answer could not be sent");
			}
		});
		client_->setOnAnswer([this](const std::string &from, const SessionDescription &) { answers_.push_back(from); });
		client_->setOnIceCandidate(
		    [this](const std::string &from, const IceCandidate &candidate) { candidates_.push_back(from + ":" + candidate.candidate); });
		ASSERT_TRUE(client_->start("lobby-1", [this](const std::vector<SignalingEnvelope> &batch) { client_->processBatch(batch); },
		                           [](const std::string &) {}));
	}

	void TearDown() override
	{
		client_.reset();
		setLogLevel(previousLevel_);
	}

	FakeRelay relay_;
	std::unique_ptr<SignalingRelayClient> client_;
	std::set<std::string> roster_ = {"alice", "bob", "carol"};
	std::vector<std::string> offers_;
	std::vector<std::string> answers_;
	std::vector<std::string> candidates_;
	int failDispatches_ = 0;
	LogLevel previousLevel_ = LogLevel::Warning;
};

TEST_F(SignalingRelayClientTest, SubscribesToLobby)
{
	EXPECT_TRUE(client_->isSubscribed());
	EXPECT_EQ(relay_.subscribedLobby, "lobby-1");
	EXPECT_EQ(relay_.subscribeCount, 1);
}

TEST_F(SignalingRelayClientTest, DispatchesInRelayOrderAndAcksOncePerBatch)
{
	relay_.deliver({makeDescriptionEnvelope("1", SignalType::Offer, "bob", "alice", "sdp-b"),
	                makeCandidateEnvelope("2", "bob", "alice", "cand-1"),
	                makeDescriptionEnvelope("3", SignalType::Answer, "carol", "alice")});

	EXPECT_EQ(offers_, std::vector<std::string>{"bob:sdp-b"});
	EXPECT_EQ(candidates_, std::vector<std::string>{"bob:cand-1"});
	EXPECT_EQ(answers_, std::vector<std::string>{"carol"});

	ASSERT_EQ(relay_.acked.size(), 1u);
	EXPECT_EQ(relay_.acked[0], (std::vector<std::string>{"1", "2", "3"}));
}

TEST_F(SignalingRelayClientTest, EvictsIdsAfterSuccessfulAck)
{
	relay_.deliver({makeCandidateEnvelope("1", "bob", "alice", "cand-1")});
	EXPECT_EQ(client_->processedCount(), 0u);
	EXPECT_FALSE(client_->hasProcessed("1"));
}

TEST_F(SignalingRelayClientTest, KeepsIdsWhenAckFailsAndSkipsRedelivery)
{
	relay_.failAcks = 1;
	relay_.deliver({makeCandidateEnvelope("1", "bob", "alice", "cand-1")});

	EXPECT_TRUE(client_->hasProcessed("1"));
	EXPECT_TRUE(relay_.acked.empty());

	// Redelivered after the failed ack: acknowledged again, not dispatched twice
	relay_.deliver({makeCandidateEnvelope("1", "bob", "alice", "cand-1")});
	EXPECT_EQ(candidates_.size(), 1u);
	ASSERT_EQ(relay_.acked.size(), 1u);
	EXPECT_EQ(relay_.acked[0], std::vector<std::string>{"1"});
	EXPECT_FALSE(client_->hasProcessed("1"));
}

TEST_F(SignalingRelayClientTest, SkipsOwnEnvelopesButAcksThem)
{
	relay_.deliver({makeCandidateEnvelope("1", "alice", "", "echo")});
	EXPECT_TRUE(candidates_.empty());
	ASSERT_EQ(relay_.acked.size(), 1u);
	EXPECT_EQ(relay_.acked[0], std::vector<std::string>{"1"});
}

TEST_F(SignalingRelayClientTest, IgnoresUnknownSendersAndAcksThem)
{
	relay_.deliver({makeDescriptionEnvelope("1", SignalType::Offer, "mallory", "alice")});
	EXPECT_TRUE(offers_.empty());
	ASSERT_EQ(relay_.acked.size(), 1u);
}

TEST_F(SignalingRelayClientTest, LeavesOtherRecipientsMailUnacknowledged)
{
	relay_.deliver({makeDescriptionEnvelope("1", SignalType::Offer, "bob", "carol")});
	EXPECT_TRUE(offers_.empty());
	EXPECT_TRUE(relay_.acked.empty());
	EXPECT_EQ(relay_.ackAttempts, 0);
}

TEST_F(SignalingRelayClientTest, TransientDispatchFailureIsRetriedOnRedelivery)
{
	failDispatches_ = 1;
	relay_.deliver({makeDescriptionEnvelope("1", SignalType::Offer, "bob", "alice")});
	EXPECT_FALSE(client_->hasProcessed("1"));
	EXPECT_TRUE(relay_.acked.empty());

	relay_.deliver({makeDescriptionEnvelope("1", SignalType::Offer, "bob", "alice")});
	EXPECT_EQ(offers_.size(), 2u);
	ASSERT_EQ(relay_.acked.size(), 1u);
}

TEST_F(SignalingRelayClientTest, MismatchedPayloadIsDroppedAndAcked)
{
	SignalingEnvelope envelope = makeCandidateEnvelope("1", "bob", "alice", "cand");
	envelope.type = SignalType::Offer;
	relay_.deliver({envelope});
	EXPECT_TRUE(offers_.empty());
	ASSERT_EQ(relay_.acked.size(), 1u);
}

TEST_F(SignalingRelayClientTest, SendRejectsUnknownRecipient)
{
	EXPECT_THROW(client_->send("mallory", SignalType::Offer, SessionDescription{"offer", "v=0"}),
	             std::invalid_argument);
	EXPECT_THROW(client_->send("alice", SignalType::Offer, SessionDescription{"offer", "v=0"}),
	             std::invalid_argument);
	EXPECT_TRUE(relay_.sent.empty());
}

TEST_F(SignalingRelayClientTest, SendPropagatesRelayFailure)
{
	relay_.failSends = 1;
	EXPECT_THROW(client_->send("bob", SignalType::Offer, SessionDescription{"offer", "v=0"}), RelayError);

	client_->send("bob", SignalType::Offer, SessionDescription{"offer", "v=0"});
	ASSERT_EQ(relay_.sent.size(), 1u);
	EXPECT_EQ(relay_.sent[0].lobbyId, "lobby-1");
	EXPECT_EQ(relay_.sent[0].toUserId, "bob");
}

TEST_F(SignalingRelayClientTest, StopUnsubscribesAndClearsDedup)
{
	relay_.failAcks = 1;
	relay_.deliver({makeCandidateEnvelope("1", "bob", "alice", "cand-1")});
	ASSERT_TRUE(client_->hasProcessed("1"));

	client_->stop();
	EXPECT_FALSE(client_->isSubscribed());
	EXPECT_EQ(relay_.unsubscribeCount, 1);
	EXPECT_EQ(client_->processedCount(), 0u);
}

TEST_F(SignalingRelayClientTest, ResubscribesAfterSubscriptionError)
{
	client_->handleSubscriptionError("socket closed");
	EXPECT_FALSE(client_->isSubscribed());
	EXPECT_EQ(relay_.unsubscribeCount, 1);

	relay_.failSubscribes = 1;
	EXPECT_FALSE(client_->resubscribe());
	EXPECT_TRUE(client_->resubscribe());
	EXPECT_EQ(relay_.subscribeCount, 2);
}
