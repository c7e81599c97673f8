/*
 * GameNet P2P SDK
 * libdatachannel-backed peer transport implementation
 */

#include "gamenet-rtc-transport.h"

#include <cstddef>
#include <variant>

#include "gamenet-utils.h"

namespace gamenet
{

namespace
{

bool labelToChannel(const std::string &label, TransportChannel &channel)
{
	if (label == kReliableChannelLabel) {
		channel = TransportChannel::Reliable;
		return true;
	}
	if (label == kUnreliableChannelLabel) {
		channel = TransportChannel::Unreliable;
		return true;
	}
	return false;
}

} // namespace

rtc::Configuration buildRtcConfiguration(const SessionConfig &sessionConfig)
{
	rtc::Configuration config;
	bool hasTurnServer = false;

	// If custom servers are set, use only those; otherwise use built-in defaults.
	if (sessionConfig.iceServers.empty()) {
		for (const auto &stun : DEFAULT_STUN_SERVERS) {
			config.iceServers.emplace_back(std::string(stun));
		}
	} else {
		for (const auto &server : sessionConfig.iceServers) {
			try {
				rtc::IceServer iceServer(server.urls);
				if (!server.username.empty()) {
					iceServer.username = server.username;
					iceServer.password = server.credential;
				}
				config.iceServers.push_back(iceServer);
				if (isTurnUrl(server.urls)) {
					hasTurnServer = true;
				}
			} catch (const std::exception &ex) {
				logWarning("Skipping invalid ICE server '%s': %s", server.urls.c_str(), ex.what());
			}
		}
	}

	if (sessionConfig.forceTurn) {
		config.iceTransportPolicy = rtc::TransportPolicy::Relay;
		if (!hasTurnServer) {
			logWarning("Force TURN is enabled but no TURN servers are configured; connections may fail.");
		}
	}

	// Offer and answer are driven explicitly by the peer link
	config.disableAutoNegotiation = true;
	return config;
}

void RtcPeerTransport::CallbackState::emit(TransportEvent event)
{
	if (closed) {
		return;
	}
	event.peerId = peerId;
	if (sink) {
		sink(std::move(event));
	}
}

std::shared_ptr<rtc::DataChannel> RtcPeerTransport::CallbackState::channel(TransportChannel which) const
{
	std::lock_guard<std::mutex> lock(channelsMutex);
	return which == TransportChannel::Reliable ? reliable : unreliable;
}

RtcPeerTransport::RtcPeerTransport(const std::string &peerId, const rtc::Configuration &config,
                                   TransportEventSink sink)
	: state_(std::make_shared<CallbackState>())
{
	state_->peerId = peerId;
	state_->sink = std::move(sink);

	pc_ = std::make_shared<rtc::PeerConnection>(config);
	std::weak_ptr<CallbackState> weakState = state_;

	pc_->onLocalDescription([weakState](rtc::Description description) {
		auto state = weakState.lock();
		if (!state)
			return;

		TransportEvent event;
		event.type = TransportEvent::Type::LocalDescription;
		event.description.type = description.typeString();
		event.description.sdp = std::string(description);
		state->emit(std::move(event));
	});

	pc_->onLocalCandidate([weakState](rtc::Candidate candidate) {
		auto state = weakState.lock();
		if (!state)
			return;

		TransportEvent event;
		event.type = TransportEvent::Type::LocalCandidate;
		event.candidate.candidate = candidate.candidate();
		event.candidate.mid = candidate.mid();
		state->emit(std::move(event));
	});

	pc_->onStateChange([weakState](rtc::PeerConnection::State pcState) {
		auto state = weakState.lock();
		if (!state)
			return;

		switch (pcState) {
		case rtc::PeerConnection::State::Connected:
			logDebug("Peer connection to %s connected", state->peerId.c_str());
			break;
		case rtc::PeerConnection::State::Failed: {
			TransportEvent event;
			event.type = TransportEvent::Type::StateFailed;
			event.error = "peer connection failed";
			state->emit(std::move(event));
			break;
		}
		default:
			break;
		}
	});

	pc_->onDataChannel([weakState](std::shared_ptr<rtc::DataChannel> dc) {
		auto state = weakState.lock();
		if (!state || state->closed)
			return;

		TransportChannel channel;
		if (!labelToChannel(dc->label(), channel)) {
			logWarning("Ignoring unexpected data channel '%s' from %s", dc->label().c_str(),
			           state->peerId.c_str());
			return;
		}
		attachChannel(state, dc, channel);

		// Channels announced by the remote side may already be open
		if (dc->isOpen()) {
			TransportEvent event;
			event.type = TransportEvent::Type::ChannelOpen;
			event.channel = channel;
			state->emit(std::move(event));
		}
	});
}

RtcPeerTransport::~RtcPeerTransport()
{
	close();
}

void RtcPeerTransport::attachChannel(const std::shared_ptr<CallbackState> &state,
                                     std::shared_ptr<rtc::DataChannel> dc, TransportChannel channel)
{
	{
		std::lock_guard<std::mutex> lock(state->channelsMutex);
		if (channel == TransportChannel::Reliable) {
			state->reliable = dc;
		} else {
			state->unreliable = dc;
		}
	}

	std::weak_ptr<CallbackState> weakState = state;

	dc->onOpen([weakState, channel]() {
		auto state = weakState.lock();
		if (!state)
			return;
		TransportEvent event;
		event.type = TransportEvent::Type::ChannelOpen;
		event.channel = channel;
		state->emit(std::move(event));
	});

	dc->onClosed([weakState, channel]() {
		auto state = weakState.lock();
		if (!state)
			return;
		TransportEvent event;
		event.type = TransportEvent::Type::ChannelClosed;
		event.channel = channel;
		state->emit(std::move(event));
	});

	dc->onError([weakState, channel](std::string error) {
		auto state = weakState.lock();
		if (!state)
			return;
		TransportEvent event;
		event.type = TransportEvent::Type::ChannelError;
		event.channel = channel;
		event.error = error;
		state->emit(std::move(event));
	});

	dc->onMessage([weakState, channel](rtc::message_variant data) {
		auto state = weakState.lock();
		if (!state)
			return;

		if (!std::holds_alternative<rtc::binary>(data)) {
			logDebug("Ignoring text message on %s channel from %s", transportChannelLabel(channel),
			         state->peerId.c_str());
			return;
		}

		const auto &bytes = std::get<rtc::binary>(data);
		TransportEvent event;
		event.type = TransportEvent::Type::Message;
		event.channel = channel;
		event.data.resize(bytes.size());
		for (size_t i = 0; i < bytes.size(); ++i) {
			event.data[i] = static_cast<uint8_t>(bytes[i]);
		}
		state->emit(std::move(event));
	});
}

void RtcPeerTransport::createChannel(TransportChannel channel)
{
	rtc::DataChannelInit init;
	if (channel == TransportChannel::Unreliable) {
		init.reliability.unordered = true;
		init.reliability.maxRetransmits = 0;
	}

	auto dc = pc_->createDataChannel(transportChannelLabel(channel), init);
	attachChannel(state_, dc, channel);
	logDebug("Created %s channel for %s", transportChannelLabel(channel), state_->peerId.c_str());
}

void RtcPeerTransport::createOffer()
{
	pc_->setLocalDescription(rtc::Description::Type::Offer);
}

void RtcPeerTransport::createAnswer()
{
	pc_->setLocalDescription(rtc::Description::Type::Answer);
}

void RtcPeerTransport::setRemoteDescription(const SessionDescription &description)
{
	pc_->setRemoteDescription(rtc::Description(description.sdp, description.type));
}

void RtcPeerTransport::addRemoteCandidate(const IceCandidate &candidate)
{
	pc_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.mid));
}

bool RtcPeerTransport::send(TransportChannel channel, const std::vector<uint8_t> &data)
{
	auto dc = state_->channel(channel);
	if (!dc || !dc->isOpen()) {
		return false;
	}

	try {
		return dc->send(reinterpret_cast<const std::byte *>(data.data()), data.size());
	} catch (const std::exception &ex) {
		logWarning("Send on %s channel to %s failed: %s", transportChannelLabel(channel),
		           state_->peerId.c_str(), ex.what());
		return false;
	}
}

bool RtcPeerTransport::isChannelOpen(TransportChannel channel) const
{
	auto dc = state_->channel(channel);
	return dc && dc->isOpen();
}

void RtcPeerTransport::clearCallbacks()
{
	try {
		pc_->onLocalDescription(nullptr);
		pc_->onLocalCandidate(nullptr);
		pc_->onStateChange(nullptr);
		pc_->onDataChannel(nullptr);
	} catch (const std::exception &ex) {
		logDebug("Clearing peer callbacks for %s failed: %s", state_->peerId.c_str(), ex.what());
	}

	for (auto channel : {TransportChannel::Reliable, TransportChannel::Unreliable}) {
		auto dc = state_->channel(channel);
		if (!dc) {
			continue;
		}
		try {
			dc->onOpen(nullptr);
			dc->onClosed(nullptr);
			dc->onError(nullptr);
			dc->onMessage(nullptr);
		} catch (const std::exception &ex) {
			logDebug("Clearing channel callbacks for %s failed: %s", state_->peerId.c_str(), ex.what());
		}
	}
}

void RtcPeerTransport::close()
{
	if (state_->closed.exchange(true)) {
		return;
	}

	clearCallbacks();

	std::shared_ptr<rtc::DataChannel> reliable;
	std::shared_ptr<rtc::DataChannel> unreliable;
	{
		std::lock_guard<std::mutex> lock(state_->channelsMutex);
		reliable = std::move(state_->reliable);
		unreliable = std::move(state_->unreliable);
	}

	try {
		if (reliable) {
			reliable->close();
		}
		if (unreliable) {
			unreliable->close();
		}
		pc_->close();
	} catch (const std::exception &ex) {
		logWarning("Error closing transport to %s: %s", state_->peerId.c_str(), ex.what());
	}

	logDebug("Closed transport to %s", state_->peerId.c_str());
}

RtcTransportFactory::RtcTransportFactory(const SessionConfig &config) : rtcConfig_(buildRtcConfiguration(config))
{
}

std::unique_ptr<PeerTransport> RtcTransportFactory::create(const std::string &peerId, TransportEventSink sink)
{
	return std::make_unique<RtcPeerTransport>(peerId, rtcConfig_, std::move(sink));
}

} // namespace gamenet
