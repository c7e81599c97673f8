/*
 * GameNet P2P SDK
 * One-way notifications to the host game engine
 */

#pragma once

#include <string>

#include "gamenet-common.h"
#include "gamenet-stats.h"

namespace gamenet
{

// Fire-and-forget channel into the engine, e.g. Unity SendMessage or a Godot signal
class EngineSink
{
public:
	virtual ~EngineSink() = default;
	virtual void sendMessage(const std::string &receiver, const std::string &method, const std::string &payload) = 0;
};

class EngineBridge
{
public:
	explicit EngineBridge(EngineSink *sink = nullptr, const std::string &receiver = kDefaultEngineReceiver);

	void setSink(EngineSink *sink) { sink_ = sink; }
	void setReceiver(const std::string &receiver) { receiver_ = receiver; }
	const std::string &receiver() const { return receiver_; }
	bool hasSink() const { return sink_ != nullptr; }

	void connectionEstablished(const Peer &peer);
	void connectionFailed(const Peer &peer, const std::string &error);
	void peerDisconnected(const Peer &peer);
	void connectionStateChanged(const std::string &lobbyId, ConnectionState state);
	void stats(const StatsSnapshot &snapshot);

private:
	void notify(const char *method, const std::string &payload);

	EngineSink *sink_;
	std::string receiver_;
};

} // namespace gamenet
