/*
 * Unit tests for networking statistics
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "gamenet-stats.h"
#include "gamenet-utils.h"

using namespace gamenet;

TEST(StatsTest, DisabledByDefault)
{
	P2PStats stats(64);
	stats.trackEnqueue(0, 100);
	stats.trackDequeue(0);
	stats.trackSend(100);

	const StatsSnapshot snapshot = stats.snapshot();
	EXPECT_FALSE(snapshot.enabled);
	EXPECT_EQ(snapshot.totalPacketsReceived, 0u);
	EXPECT_EQ(snapshot.totalPacketsSent, 0u);
	EXPECT_TRUE(snapshot.channelStats.empty());
}

TEST(StatsTest, TracksSizesAndCounts)
{
	P2PStats stats(10);
	stats.enable();

	stats.trackEnqueue(0, 100);
	stats.trackEnqueue(0, 300);
	stats.trackEnqueue(3, 50);
	stats.trackSend(20);

	StatsSnapshot snapshot = stats.snapshot();
	EXPECT_EQ(snapshot.currentQueueSize, 3u);
	EXPECT_EQ(snapshot.maxQueueSize, 20u);
	EXPECT_DOUBLE_EQ(snapshot.queueUtilizationPercent, 15.0);
	EXPECT_EQ(snapshot.channelStats[0].messagesInQueue, 2u);
	EXPECT_EQ(snapshot.channelStats[3].queueCapacity, 10u);
	EXPECT_EQ(snapshot.totalPacketsSent, 1u);

	stats.trackDequeue(0);
	stats.trackDequeue(0);
	stats.trackDequeue(3);

	snapshot = stats.snapshot();
	EXPECT_EQ(snapshot.currentQueueSize, 0u);
	EXPECT_EQ(snapshot.totalPacketsReceived, 3u);
	EXPECT_EQ(snapshot.totalBytesReceived, 450u);
	EXPECT_EQ(snapshot.maxPacketSizeBytes, 300u);
	EXPECT_EQ(snapshot.minPacketSizeBytes, 50u);
	EXPECT_DOUBLE_EQ(snapshot.averagePacketSizeBytes, 150.0);
}

TEST(StatsTest, MeasuresQueueWaitTime)
{
	P2PStats stats(4);
	stats.enable();

	stats.trackEnqueue(1, 8);
	std::this_thread::sleep_for(std::chrono::milliseconds(5));
	stats.trackDequeue(1);

	const StatsSnapshot snapshot = stats.snapshot();
	EXPECT_GE(snapshot.maxQueueWaitTimeMs, 4.0);
	EXPECT_GE(snapshot.averageQueueWaitTimeMs, 4.0);
	EXPECT_GT(snapshot.minQueueWaitTimeMs, 0.0);
}

TEST(StatsTest, DequeueWithoutEnqueueIsIgnored)
{
	P2PStats stats(4);
	stats.enable();
	stats.trackDequeue(2);
	EXPECT_EQ(stats.snapshot().totalPacketsReceived, 0u);
}

TEST(StatsTest, ResetClearsEverything)
{
	P2PStats stats(4);
	stats.enable();
	stats.trackEnqueue(0, 10);
	stats.trackDequeue(0);
	stats.trackSend(10);
	stats.reset();

	const StatsSnapshot snapshot = stats.snapshot();
	EXPECT_TRUE(snapshot.enabled);
	EXPECT_EQ(snapshot.totalPacketsReceived, 0u);
	EXPECT_EQ(snapshot.totalPacketsSent, 0u);
	EXPECT_EQ(snapshot.maxPacketSizeBytes, 0u);
	EXPECT_TRUE(snapshot.channelStats.empty());
}

TEST(StatsTest, SerializesSnapshotToJson)
{
	P2PStats stats(8);
	stats.enable();
	stats.trackEnqueue(2, 40);

	const std::string json = statsToJson(stats.snapshot());
	JsonParser parsed(json);
	EXPECT_TRUE(parsed.getBool("enabled"));
	EXPECT_EQ(parsed.getInt("currentQueueSize"), 1);
	EXPECT_EQ(parsed.getInt("maxQueueSize"), 8);

	JsonParser channels(parsed.getObject("channelStats"));
	JsonParser channel2(channels.getObject("2"));
	EXPECT_EQ(channel2.getInt("messagesInQueue"), 1);
	EXPECT_EQ(channel2.getInt("queueCapacity"), 8);
}
