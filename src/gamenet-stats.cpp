/*
 * GameNet P2P SDK
 * Networking statistics
 */

#include "gamenet-stats.h"

#include <algorithm>
#include <numeric>
#include <sstream>

#include "gamenet-utils.h"

namespace gamenet
{

P2PStats::P2PStats(uint32_t queueCapacity) : queueCapacity_(queueCapacity) {}

void P2PStats::enable()
{
	std::lock_guard<std::mutex> lock(mutex_);
	enabled_ = true;
}

void P2PStats::disable()
{
	std::lock_guard<std::mutex> lock(mutex_);
	enabled_ = false;
}

bool P2PStats::isEnabled() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return enabled_;
}

void P2PStats::setQueueCapacity(uint32_t capacity)
{
	std::lock_guard<std::mutex> lock(mutex_);
	queueCapacity_ = capacity;
}

void P2PStats::trackEnqueue(uint32_t channel, size_t sizeBytes)
{
	std::lock_guard<std::mutex> lock(mutex_);
	if (!enabled_) {
		return;
	}

	packetMetadata_[channel].push_back({Clock::now(), sizeBytes});
	channelMessageCounts_[channel]++;
}

void P2PStats::trackDequeue(uint32_t channel)
{
	std::lock_guard<std::mutex> lock(mutex_);
	if (!enabled_) {
		return;
	}

	auto it = packetMetadata_.find(channel);
	if (it == packetMetadata_.end() || it->second.empty()) {
		return;
	}

	// FIFO: the oldest tracked packet is the one being dequeued
	const QueuedPacket packet = it->second.front();
	it->second.pop_front();

	const double waitTimeMs =
	    std::chrono::duration<double, std::milli>(Clock::now() - packet.enqueuedAt).count();

	queueWaitTimes_.push_back(waitTimeMs);
	if (queueWaitTimes_.size() > kMaxSamples) {
		queueWaitTimes_.pop_front();
	}
	maxWaitTimeMs_ = std::max(maxWaitTimeMs_, waitTimeMs);
	if (waitTimeMs > 0.0 && (minWaitTimeMs_ < 0.0 || waitTimeMs < minWaitTimeMs_)) {
		minWaitTimeMs_ = waitTimeMs;
	}

	packetSizes_.push_back(packet.sizeBytes);
	if (packetSizes_.size() > kMaxSamples) {
		packetSizes_.pop_front();
	}
	maxPacketSize_ = std::max(maxPacketSize_, packet.sizeBytes);
	minPacketSize_ = hasPacketSize_ ? std::min(minPacketSize_, packet.sizeBytes) : packet.sizeBytes;
	hasPacketSize_ = true;

	totalPacketsReceived_++;
	totalBytesReceived_ += packet.sizeBytes;

	uint32_t &count = channelMessageCounts_[channel];
	if (count > 0) {
		count--;
	}
}

void P2PStats::trackSend(size_t sizeBytes)
{
	(void)sizeBytes;
	std::lock_guard<std::mutex> lock(mutex_);
	if (!enabled_) {
		return;
	}
	totalPacketsSent_++;
}

StatsSnapshot P2PStats::snapshot() const
{
	std::lock_guard<std::mutex> lock(mutex_);

	StatsSnapshot stats;
	stats.enabled = enabled_;

	uint32_t totalCurrentMessages = 0;
	for (const auto &pair : channelMessageCounts_) {
		ChannelQueueStats channel;
		channel.messagesInQueue = pair.second;
		channel.queueCapacity = queueCapacity_;
		stats.channelStats[pair.first] = channel;
		totalCurrentMessages += pair.second;
	}

	if (!queueWaitTimes_.empty()) {
		stats.averageQueueWaitTimeMs = std::accumulate(queueWaitTimes_.begin(), queueWaitTimes_.end(), 0.0) /
		                               static_cast<double>(queueWaitTimes_.size());
	}
	if (!packetSizes_.empty()) {
		stats.averagePacketSizeBytes =
		    static_cast<double>(std::accumulate(packetSizes_.begin(), packetSizes_.end(), static_cast<size_t>(0))) /
		    static_cast<double>(packetSizes_.size());
	}

	const uint32_t totalCapacity = static_cast<uint32_t>(channelMessageCounts_.size()) * queueCapacity_;

	stats.maxQueueWaitTimeMs = maxWaitTimeMs_;
	stats.minQueueWaitTimeMs = minWaitTimeMs_ < 0.0 ? 0.0 : minWaitTimeMs_;
	stats.currentQueueSize = totalCurrentMessages;
	stats.maxQueueSize = totalCapacity;
	stats.queueUtilizationPercent =
	    totalCapacity > 0 ? (static_cast<double>(totalCurrentMessages) / totalCapacity) * 100.0 : 0.0;
	stats.maxPacketSizeBytes = static_cast<uint32_t>(maxPacketSize_);
	stats.minPacketSizeBytes = hasPacketSize_ ? static_cast<uint32_t>(minPacketSize_) : 0;
	stats.totalPacketsSent = totalPacketsSent_;
	stats.totalPacketsReceived = totalPacketsReceived_;
	stats.totalBytesReceived = totalBytesReceived_;
	return stats;
}

void P2PStats::reset()
{
	std::lock_guard<std::mutex> lock(mutex_);
	resetLocked();
}

void P2PStats::resetLocked()
{
	queueWaitTimes_.clear();
	maxWaitTimeMs_ = 0.0;
	minWaitTimeMs_ = -1.0;
	packetSizes_.clear();
	maxPacketSize_ = 0;
	minPacketSize_ = 0;
	hasPacketSize_ = false;
	totalPacketsSent_ = 0;
	totalPacketsReceived_ = 0;
	totalBytesReceived_ = 0;
	channelMessageCounts_.clear();
	packetMetadata_.clear();
}

std::string statsToJson(const StatsSnapshot &stats)
{
	std::stringstream channels;
	channels << "{";
	bool first = true;
	for (const auto &pair : stats.channelStats) {
		JsonBuilder channel;
		channel.add("messagesInQueue", pair.second.messagesInQueue);
		channel.add("queueCapacity", pair.second.queueCapacity);
		if (!first) {
			channels << ",";
		}
		channels << "\"" << pair.first << "\":" << channel.build();
		first = false;
	}
	channels << "}";

	JsonBuilder json;
	json.add("enabled", stats.enabled);
	json.add("averageQueueWaitTimeMs", stats.averageQueueWaitTimeMs);
	json.add("maxQueueWaitTimeMs", stats.maxQueueWaitTimeMs);
	json.add("minQueueWaitTimeMs", stats.minQueueWaitTimeMs);
	json.add("currentQueueSize", stats.currentQueueSize);
	json.add("maxQueueSize", stats.maxQueueSize);
	json.add("queueUtilizationPercent", stats.queueUtilizationPercent);
	json.add("averagePacketSizeBytes", stats.averagePacketSizeBytes);
	json.add("maxPacketSizeBytes", stats.maxPacketSizeBytes);
	json.add("minPacketSizeBytes", stats.minPacketSizeBytes);
	json.add("totalPacketsSent", static_cast<int64_t>(stats.totalPacketsSent));
	json.add("totalPacketsReceived", static_cast<int64_t>(stats.totalPacketsReceived));
	json.add("totalBytesReceived", static_cast<int64_t>(stats.totalBytesReceived));
	json.addRaw("channelStats", channels.str());
	return json.build();
}

} // namespace gamenet
