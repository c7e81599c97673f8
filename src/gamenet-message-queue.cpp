/*
 * GameNet P2P SDK
 * Fixed-capacity message queues shared with the engine
 */

#include "gamenet-message-queue.h"

#include <cstring>
#include <new>
#include <stdexcept>
#include <string>

#include "gamenet-utils.h"

namespace gamenet
{

namespace
{

const char *directionName(QueueDirection direction)
{
	return direction == QueueDirection::Inbound ? "inbound" : "outbound";
}

void writeLength(uint8_t *out, uint32_t value)
{
	out[0] = static_cast<uint8_t>(value & 0xFF);
	out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
	out[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
	out[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

uint32_t readLength(const uint8_t *in)
{
	return static_cast<uint32_t>(in[0]) | (static_cast<uint32_t>(in[1]) << 8) |
	       (static_cast<uint32_t>(in[2]) << 16) | (static_cast<uint32_t>(in[3]) << 24);
}

} // namespace

RingBuffer::RingBuffer(uint8_t *header, uint8_t *slots, uint32_t slotCount, uint32_t slotSize)
	: header_(std::launder(reinterpret_cast<RingHeader *>(header))),
	  slots_(slots),
	  slotCount_(slotCount),
	  slotSize_(slotSize)
{
}

void RingBuffer::reset()
{
	header_->writeIndex.store(0);
	header_->readIndex.store(0);
	header_->messageCount.store(0);
	header_->formatVersion.store(kQueueFormatVersion);
	droppedFull_ = 0;
	droppedTooLarge_ = 0;
}

EnqueueResult RingBuffer::push(const uint8_t *data, size_t size)
{
	if (size > maxMessageSize()) {
		droppedTooLarge_++;
		return EnqueueResult::TooLarge;
	}

	// Drop-newest: a full ring never overwrites a slot the consumer may be reading
	const uint32_t count = header_->messageCount.load(std::memory_order_acquire);
	if (count >= slotCount_) {
		droppedFull_++;
		return EnqueueResult::Full;
	}

	const uint32_t writeIndex = header_->writeIndex.load(std::memory_order_relaxed);
	uint8_t *slot = slots_ + static_cast<size_t>(writeIndex) * slotSize_;
	writeLength(slot, static_cast<uint32_t>(size));
	if (size > 0) {
		std::memcpy(slot + kSlotLengthPrefixSize, data, size);
	}

	header_->writeIndex.store((writeIndex + 1) % slotCount_, std::memory_order_relaxed);
	header_->messageCount.fetch_add(1, std::memory_order_release);
	return EnqueueResult::Queued;
}

bool RingBuffer::pop(std::vector<uint8_t> &out)
{
	const uint32_t count = header_->messageCount.load(std::memory_order_acquire);
	if (count == 0) {
		return false;
	}

	const uint32_t readIndex = header_->readIndex.load(std::memory_order_relaxed);
	const uint8_t *slot = slots_ + static_cast<size_t>(readIndex) * slotSize_;
	uint32_t length = readLength(slot);
	if (length > maxMessageSize()) {
		// Corrupt length from a foreign writer; consume the slot without reading past it
		length = 0;
	}
	out.assign(slot + kSlotLengthPrefixSize, slot + kSlotLengthPrefixSize + length);

	header_->readIndex.store((readIndex + 1) % slotCount_, std::memory_order_relaxed);
	header_->messageCount.fetch_sub(1, std::memory_order_release);
	return true;
}

uint32_t RingBuffer::size() const
{
	return header_->messageCount.load(std::memory_order_acquire);
}

uint32_t RingBuffer::writeIndex() const
{
	return header_->writeIndex.load(std::memory_order_acquire);
}

uint32_t RingBuffer::readIndex() const
{
	return header_->readIndex.load(std::memory_order_acquire);
}

uint32_t RingBuffer::formatVersion() const
{
	return header_->formatVersion.load(std::memory_order_acquire);
}

QueueLayout QueueLayout::fromConfig(const SessionConfig &config)
{
	QueueLayout layout;
	layout.maxChannels = config.maxChannels;
	layout.slotCount = config.slotCount;
	// Round up to a word multiple; a size within 3 of UINT32_MAX rounds down instead of wrapping
	const uint64_t rounded = (static_cast<uint64_t>(config.slotSize) + 3) & ~static_cast<uint64_t>(3);
	layout.slotSize = rounded > UINT32_MAX ? (config.slotSize & ~3u) : static_cast<uint32_t>(rounded);
	return layout;
}

size_t QueueLayout::channelRegionSize() const
{
	return 2 * kRingHeaderSize + 2 * static_cast<size_t>(slotCount) * slotSize;
}

size_t QueueLayout::regionSize() const
{
	return channelRegionSize() * maxChannels;
}

MessageQueue::MessageQueue(const QueueLayout &layout) : layout_(layout)
{
	ownedRegion_.reset(new uint8_t[layout_.regionSize()]());
	region_ = ownedRegion_.get();
	buildRings(true);
}

MessageQueue::MessageQueue(const QueueLayout &layout, uint8_t *region, size_t regionSize, bool initialize)
	: layout_(layout), region_(region)
{
	if (!region_ || regionSize < layout_.regionSize()) {
		throw std::invalid_argument("queue region of " + std::to_string(regionSize) + " bytes is smaller than " +
		                            std::to_string(layout_.regionSize()));
	}
	if (reinterpret_cast<uintptr_t>(region_) % alignof(RingHeader) != 0) {
		throw std::invalid_argument("queue region is not word aligned");
	}
	buildRings(initialize);
}

MessageQueue::~MessageQueue() = default;

void MessageQueue::buildRings(bool initialize)
{
	if (layout_.slotCount == 0 || layout_.slotSize <= kSlotLengthPrefixSize || layout_.slotSize % 4 != 0) {
		throw std::invalid_argument("invalid queue layout");
	}

	const size_t dataSize = static_cast<size_t>(layout_.slotCount) * layout_.slotSize;
	inbound_.reserve(layout_.maxChannels);
	outbound_.reserve(layout_.maxChannels);

	for (uint32_t channel = 0; channel < layout_.maxChannels; ++channel) {
		uint8_t *base = region_ + channel * layout_.channelRegionSize();
		uint8_t *inboundHeader = base;
		uint8_t *outboundHeader = base + kRingHeaderSize;
		uint8_t *inboundSlots = base + 2 * kRingHeaderSize;
		uint8_t *outboundSlots = inboundSlots + dataSize;

		if (initialize) {
			// Start the lifetime of the atomics before any ring touches them
			new (inboundHeader) RingHeader();
			new (outboundHeader) RingHeader();
		}

		inbound_.push_back(
		    std::make_unique<RingBuffer>(inboundHeader, inboundSlots, layout_.slotCount, layout_.slotSize));
		outbound_.push_back(
		    std::make_unique<RingBuffer>(outboundHeader, outboundSlots, layout_.slotCount, layout_.slotSize));

		if (initialize) {
			inbound_.back()->reset();
			outbound_.back()->reset();
		}
	}

	logDebug("Message queue ready: %u channels x %u slots x %u bytes (%zu bytes total)", layout_.maxChannels,
	         layout_.slotCount, layout_.slotSize, layout_.regionSize());
}

RingBuffer *MessageQueue::ringFor(QueueDirection direction, uint32_t channel)
{
	if (channel >= layout_.maxChannels) {
		return nullptr;
	}
	return direction == QueueDirection::Inbound ? inbound_[channel].get() : outbound_[channel].get();
}

const RingBuffer *MessageQueue::ring(QueueDirection direction, uint32_t channel) const
{
	if (channel >= layout_.maxChannels) {
		return nullptr;
	}
	return direction == QueueDirection::Inbound ? inbound_[channel].get() : outbound_[channel].get();
}

bool MessageQueue::enqueue(QueueDirection direction, uint32_t channel, const uint8_t *data, size_t size)
{
	RingBuffer *ringBuffer = ringFor(direction, channel);
	if (!ringBuffer) {
		logWarning("Dropping %s message for channel %u: channel out of range (max %u)", directionName(direction),
		           channel, layout_.maxChannels);
		return false;
	}

	switch (ringBuffer->push(data, size)) {
	case EnqueueResult::Queued:
		if (stats_ && direction == QueueDirection::Inbound) {
			stats_->trackEnqueue(channel, size);
		}
		return true;
	case EnqueueResult::Full:
		logWarning("Dropping %s message on channel %u: queue full (%u messages)", directionName(direction), channel,
		           ringBuffer->capacity());
		return false;
	case EnqueueResult::TooLarge:
		logWarning("Dropping %s message on channel %u: %zu bytes exceeds slot limit of %zu",
		           directionName(direction), channel, size, ringBuffer->maxMessageSize());
		return false;
	}
	return false;
}

bool MessageQueue::enqueue(QueueDirection direction, uint32_t channel, const std::vector<uint8_t> &data)
{
	return enqueue(direction, channel, data.data(), data.size());
}

bool MessageQueue::dequeue(QueueDirection direction, uint32_t channel, std::vector<uint8_t> &out)
{
	RingBuffer *ringBuffer = ringFor(direction, channel);
	if (!ringBuffer) {
		return false;
	}

	if (!ringBuffer->pop(out)) {
		return false;
	}

	if (stats_ && direction == QueueDirection::Inbound) {
		stats_->trackDequeue(channel);
	}
	return true;
}

uint32_t MessageQueue::count(QueueDirection direction, uint32_t channel) const
{
	const RingBuffer *ringBuffer = ring(direction, channel);
	return ringBuffer ? ringBuffer->size() : 0;
}

uint64_t MessageQueue::droppedMessages(QueueDirection direction, uint32_t channel) const
{
	const RingBuffer *ringBuffer = ring(direction, channel);
	return ringBuffer ? ringBuffer->droppedFull() + ringBuffer->droppedTooLarge() : 0;
}

size_t MessageQueue::maxMessageSize() const
{
	return layout_.slotSize - kSlotLengthPrefixSize;
}

} // namespace gamenet
