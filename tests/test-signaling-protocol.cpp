/*
 * Unit tests for signaling envelope normalization
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <gtest/gtest.h>

#include "gamenet-signaling-protocol.h"

using namespace gamenet;

TEST(SignalingProtocolTest, ParsesOfferRecord)
{
	const std::string raw = R"({"_id":"env-1","messageType":"offer","fromUserId":"user-a","toUserId":"user-b",
		"data":{"type":"offer","sdp":"v=0\r\na=mid:0"}})";
	SignalingEnvelope envelope;
	std::string error;

	ASSERT_TRUE(parseSignalingEnvelope(raw, envelope, &error)) << error;
	EXPECT_EQ(envelope.id, "env-1");
	EXPECT_EQ(envelope.type, SignalType::Offer);
	EXPECT_EQ(envelope.fromUserId, "user-a");
	EXPECT_EQ(envelope.toUserId, "user-b");

	const auto *description = std::get_if<SessionDescription>(&envelope.payload);
	ASSERT_NE(description, nullptr);
	EXPECT_EQ(description->type, "offer");
	EXPECT_NE(description->sdp.find("a=mid:0"), std::string::npos);
}

TEST(SignalingProtocolTest, ParsesCandidateWithAliases)
{
	const std::string raw = R"({"id":"env-2","type":"candidate","from":"user-b",
		"data":{"candidate":"candidate:1 1 udp 2122260223 10.0.0.2 5000 typ host","mid":"0","mLineIndex":1}})";
	SignalingEnvelope envelope;

	ASSERT_TRUE(parseSignalingEnvelope(raw, envelope));
	EXPECT_EQ(envelope.type, SignalType::IceCandidate);
	EXPECT_TRUE(envelope.toUserId.empty());

	const auto *candidate = std::get_if<IceCandidate>(&envelope.payload);
	ASSERT_NE(candidate, nullptr);
	EXPECT_EQ(candidate->mid, "0");
	EXPECT_EQ(candidate->mLineIndex, 1);
}

TEST(SignalingProtocolTest, ParsesNestedBrowserCandidate)
{
	const std::string raw = R"({"_id":"env-3","messageType":"ice-candidate","fromUserId":"user-b",
		"data":{"candidate":{"candidate":"candidate:2 1 udp 1 10.0.0.3 6000 typ host","sdpMid":"data","sdpMLineIndex":0}}})";
	SignalingEnvelope envelope;

	ASSERT_TRUE(parseSignalingEnvelope(raw, envelope));
	const auto *candidate = std::get_if<IceCandidate>(&envelope.payload);
	ASSERT_NE(candidate, nullptr);
	EXPECT_EQ(candidate->mid, "data");
	EXPECT_NE(candidate->candidate.find("10.0.0.3"), std::string::npos);
}

TEST(SignalingProtocolTest, RejectsEmptySdp)
{
	SignalPayload payload;
	std::string error;
	EXPECT_FALSE(parseSignalPayload(SignalType::Answer, R"({"type":"answer","sdp":""})", payload, &error));
	EXPECT_FALSE(error.empty());
}

TEST(SignalingProtocolTest, RejectsMismatchedDescriptionType)
{
	SignalPayload payload;
	EXPECT_FALSE(parseSignalPayload(SignalType::Offer, R"({"type":"answer","sdp":"v=0"})", payload));
}

TEST(SignalingProtocolTest, RejectsEmptyCandidate)
{
	SignalPayload payload;
	EXPECT_FALSE(parseSignalPayload(SignalType::IceCandidate, R"({"candidate":"","sdpMid":"0"})", payload));
}

TEST(SignalingProtocolTest, RejectsUnknownTypeAndMissingFields)
{
	SignalingEnvelope envelope;
	EXPECT_FALSE(parseSignalingEnvelope(R"({"_id":"x","messageType":"hello","fromUserId":"a","data":{}})", envelope));
	EXPECT_FALSE(parseSignalingEnvelope(R"({"messageType":"offer","fromUserId":"a","data":{"sdp":"v=0"}})", envelope));
	EXPECT_FALSE(parseSignalingEnvelope(R"({"_id":"x","messageType":"offer","data":{"sdp":"v=0"}})", envelope));
	EXPECT_FALSE(parseSignalingEnvelope(R"({"_id":"x","messageType":"offer","fromUserId":"a"})", envelope));
}

TEST(SignalingProtocolTest, SerializesEnvelopeThatParsesBack)
{
	SignalingEnvelope original;
	original.id = "env-9";
	original.type = SignalType::Answer;
	original.fromUserId = "user-b";
	original.toUserId = "user-a";
	original.payload = SessionDescription{"answer", "v=0\r\no=- 1 1 IN IP4 0.0.0.0\r\n"};

	SignalingEnvelope parsed;
	ASSERT_TRUE(parseSignalingEnvelope(serializeSignalingEnvelope(original), parsed));
	EXPECT_EQ(parsed.id, original.id);
	EXPECT_EQ(parsed.type, SignalType::Answer);
	EXPECT_EQ(parsed.toUserId, "user-a");
	EXPECT_EQ(std::get<SessionDescription>(parsed.payload).sdp, "v=0\r\no=- 1 1 IN IP4 0.0.0.0\r\n");
}

TEST(SignalingProtocolTest, ParsesSignalTypeSpellings)
{
	SignalType type = SignalType::Offer;
	EXPECT_TRUE(parseSignalType("ICE-CANDIDATE", type));
	EXPECT_EQ(type, SignalType::IceCandidate);
	EXPECT_TRUE(parseSignalType("answer", type));
	EXPECT_EQ(type, SignalType::Answer);
	EXPECT_FALSE(parseSignalType("bye", type));
}
