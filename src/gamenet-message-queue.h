/*
 * GameNet P2P SDK
 * Fixed-capacity message queues shared with the engine
 *
 * Region layout, repeated for every logical channel in channel order:
 *   [inbound header: 4 x u32][outbound header: 4 x u32]
 *   [inbound slots: slotCount x slotSize][outbound slots: slotCount x slotSize]
 * Header words are write index, read index, message count and format version.
 * Every slot starts with a u32 little-endian length followed by the frame bytes.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "gamenet-common.h"
#include "gamenet-stats.h"

namespace gamenet
{

struct RingHeader {
	std::atomic<uint32_t> writeIndex;
	std::atomic<uint32_t> readIndex;
	std::atomic<uint32_t> messageCount;
	std::atomic<uint32_t> formatVersion;
};

static_assert(sizeof(RingHeader) == kRingHeaderSize, "ring header must be four 32-bit words");
static_assert(std::atomic<uint32_t>::is_always_lock_free, "ring indices must be lock-free");

enum class EnqueueResult { Queued, Full, TooLarge };

// Single-producer/single-consumer ring over memory it does not own.
// The header must already hold a constructed RingHeader.
class RingBuffer
{
public:
	RingBuffer(uint8_t *header, uint8_t *slots, uint32_t slotCount, uint32_t slotSize);

	void reset();

	EnqueueResult push(const uint8_t *data, size_t size);
	bool pop(std::vector<uint8_t> &out);

	uint32_t size() const;
	uint32_t capacity() const { return slotCount_; }
	size_t maxMessageSize() const { return slotSize_ - kSlotLengthPrefixSize; }
	uint32_t writeIndex() const;
	uint32_t readIndex() const;
	uint32_t formatVersion() const;

	uint64_t droppedFull() const { return droppedFull_.load(); }
	uint64_t droppedTooLarge() const { return droppedTooLarge_.load(); }

private:
	RingHeader *header_;
	uint8_t *slots_;
	uint32_t slotCount_;
	uint32_t slotSize_;

	std::atomic<uint64_t> droppedFull_{0};
	std::atomic<uint64_t> droppedTooLarge_{0};
};

struct QueueLayout {
	uint32_t maxChannels = kDefaultMaxChannels;
	uint32_t slotCount = kDefaultSlotCount;
	uint32_t slotSize = kDefaultSlotSize;

	static QueueLayout fromConfig(const SessionConfig &config);
	size_t channelRegionSize() const;
	size_t regionSize() const;
};

class MessageQueue
{
public:
	// Owns a zeroed region sized for the layout
	explicit MessageQueue(const QueueLayout &layout);
	// Attaches to an engine-provided region; headers are initialized when initialize is true
	MessageQueue(const QueueLayout &layout, uint8_t *region, size_t regionSize, bool initialize = true);
	~MessageQueue();

	MessageQueue(const MessageQueue &) = delete;
	MessageQueue &operator=(const MessageQueue &) = delete;

	bool enqueue(QueueDirection direction, uint32_t channel, const uint8_t *data, size_t size);
	bool enqueue(QueueDirection direction, uint32_t channel, const std::vector<uint8_t> &data);
	bool dequeue(QueueDirection direction, uint32_t channel, std::vector<uint8_t> &out);

	uint32_t count(QueueDirection direction, uint32_t channel) const;
	uint64_t droppedMessages(QueueDirection direction, uint32_t channel) const;
	const RingBuffer *ring(QueueDirection direction, uint32_t channel) const;

	const QueueLayout &layout() const { return layout_; }
	uint32_t maxChannels() const { return layout_.maxChannels; }
	size_t maxMessageSize() const;
	uint8_t *region() { return region_; }
	size_t regionSize() const { return layout_.regionSize(); }

	void setStats(P2PStats *stats) { stats_ = stats; }

private:
	void buildRings(bool initialize);
	RingBuffer *ringFor(QueueDirection direction, uint32_t channel);

	QueueLayout layout_;
	std::unique_ptr<uint8_t[]> ownedRegion_;
	uint8_t *region_ = nullptr;
	std::vector<std::unique_ptr<RingBuffer>> inbound_;
	std::vector<std::unique_ptr<RingBuffer>> outbound_;
	P2PStats *stats_ = nullptr;
};

} // namespace gamenet
