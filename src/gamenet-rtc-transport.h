/*
 * GameNet P2P SDK
 * libdatachannel-backed peer transport
 */

#pragma once

#include <rtc/rtc.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "gamenet-transport.h"

namespace gamenet
{

// Default STUN list unless custom servers are given; forceTurn restricts ICE to relays
rtc::Configuration buildRtcConfiguration(const SessionConfig &config);

class RtcPeerTransport : public PeerTransport
{
public:
	RtcPeerTransport(const std::string &peerId, const rtc::Configuration &config, TransportEventSink sink);
	~RtcPeerTransport() override;

	void createChannel(TransportChannel channel) override;
	void createOffer() override;
	void createAnswer() override;
	void setRemoteDescription(const SessionDescription &description) override;
	void addRemoteCandidate(const IceCandidate &candidate) override;

	bool send(TransportChannel channel, const std::vector<uint8_t> &data) override;
	bool isChannelOpen(TransportChannel channel) const override;

	void close() override;

private:
	// Shared with libdatachannel callbacks, which may outlive this object
	struct CallbackState {
		std::string peerId;
		TransportEventSink sink;
		std::atomic<bool> closed{false};

		mutable std::mutex channelsMutex;
		std::shared_ptr<rtc::DataChannel> reliable;
		std::shared_ptr<rtc::DataChannel> unreliable;

		void emit(TransportEvent event);
		std::shared_ptr<rtc::DataChannel> channel(TransportChannel which) const;
	};

	static void attachChannel(const std::shared_ptr<CallbackState> &state, std::shared_ptr<rtc::DataChannel> dc,
	                          TransportChannel channel);
	void clearCallbacks();

	std::shared_ptr<CallbackState> state_;
	std::shared_ptr<rtc::PeerConnection> pc_;
};

class RtcTransportFactory : public TransportFactory
{
public:
	explicit RtcTransportFactory(const SessionConfig &config);

	std::unique_ptr<PeerTransport> create(const std::string &peerId, TransportEventSink sink) override;

private:
	rtc::Configuration rtcConfig_;
};

} // namespace gamenet
