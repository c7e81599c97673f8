/*
 * GameNet P2P SDK
 * Engine notification formatting
 */

#include "gamenet-engine-bridge.h"

#include "gamenet-utils.h"

namespace gamenet
{

namespace
{

std::string peerJson(const Peer &peer)
{
	JsonBuilder json;
	json.add("userId", peer.userId);
	json.add("username", peer.username);
	return json.build();
}

} // namespace

EngineBridge::EngineBridge(EngineSink *sink, const std::string &receiver) : sink_(sink), receiver_(receiver) {}

void EngineBridge::notify(const char *method, const std::string &payload)
{
	if (!sink_) {
		return;
	}

	try {
		sink_->sendMessage(receiver_, method, payload);
	} catch (const std::exception &ex) {
		logWarning("Engine notification %s failed: %s", method, ex.what());
	}
}

void EngineBridge::connectionEstablished(const Peer &peer)
{
	notify("P2PConnectionEstablished", peerJson(peer));
}

void EngineBridge::connectionFailed(const Peer &peer, const std::string &error)
{
	JsonBuilder json;
	json.add("userId", peer.userId);
	json.add("username", peer.username);
	json.add("error", error);
	notify("P2PConnectionFailed", json.build());
}

void EngineBridge::peerDisconnected(const Peer &peer)
{
	notify("P2PPeerDisconnected", peerJson(peer));
}

void EngineBridge::connectionStateChanged(const std::string &lobbyId, ConnectionState state)
{
	JsonBuilder json;
	json.add("lobbyId", lobbyId);
	json.add("state", connectionStateName(state));
	notify("P2PConnectionStateChanged", json.build());
}

void EngineBridge::stats(const StatsSnapshot &snapshot)
{
	notify("P2PStats", statsToJson(snapshot));
}

} // namespace gamenet
