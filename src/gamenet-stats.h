/*
 * GameNet P2P SDK
 * Networking statistics for debugging queue pressure
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>

namespace gamenet
{

struct ChannelQueueStats {
	uint32_t messagesInQueue = 0;
	uint32_t queueCapacity = 0;
};

struct StatsSnapshot {
	bool enabled = false;
	double averageQueueWaitTimeMs = 0.0;
	double maxQueueWaitTimeMs = 0.0;
	double minQueueWaitTimeMs = 0.0;
	uint32_t currentQueueSize = 0;
	uint32_t maxQueueSize = 0;
	double queueUtilizationPercent = 0.0;
	double averagePacketSizeBytes = 0.0;
	uint32_t maxPacketSizeBytes = 0;
	uint32_t minPacketSizeBytes = 0;
	uint64_t totalPacketsSent = 0;
	uint64_t totalPacketsReceived = 0;
	uint64_t totalBytesReceived = 0;
	std::map<uint32_t, ChannelQueueStats> channelStats;
};

// Producer and consumer threads both report here, so every method locks.
class P2PStats
{
public:
	static constexpr size_t kMaxSamples = 1000;

	explicit P2PStats(uint32_t queueCapacity = 0);

	void enable();
	void disable();
	bool isEnabled() const;
	void setQueueCapacity(uint32_t capacity);

	void trackEnqueue(uint32_t channel, size_t sizeBytes);
	void trackDequeue(uint32_t channel);
	void trackSend(size_t sizeBytes);

	StatsSnapshot snapshot() const;
	void reset();

private:
	using Clock = std::chrono::steady_clock;

	struct QueuedPacket {
		Clock::time_point enqueuedAt;
		size_t sizeBytes = 0;
	};

	void resetLocked();

	mutable std::mutex mutex_;
	bool enabled_ = false;
	uint32_t queueCapacity_ = 0;

	std::deque<double> queueWaitTimes_;
	double maxWaitTimeMs_ = 0.0;
	double minWaitTimeMs_ = -1.0;

	std::deque<size_t> packetSizes_;
	size_t maxPacketSize_ = 0;
	size_t minPacketSize_ = 0;
	bool hasPacketSize_ = false;

	uint64_t totalPacketsSent_ = 0;
	uint64_t totalPacketsReceived_ = 0;
	uint64_t totalBytesReceived_ = 0;

	std::map<uint32_t, uint32_t> channelMessageCounts_;
	std::map<uint32_t, std::deque<QueuedPacket>> packetMetadata_;
};

std::string statsToJson(const StatsSnapshot &stats);

} // namespace gamenet
