/*
 * GameNet P2P SDK
 * Signaling envelope normalization helpers
 */

#include "gamenet-signaling-protocol.h"

#include <initializer_list>

#include "gamenet-utils.h"

namespace gamenet
{

namespace
{

std::string getAnyString(const JsonParser &json, const std::initializer_list<const char *> &keys)
{
	for (const char *key : keys) {
		if (json.hasKey(key)) {
			return json.getString(key);
		}
	}
	return "";
}

int getAnyInt(const JsonParser &json, const std::initializer_list<const char *> &keys, int defaultValue)
{
	for (const char *key : keys) {
		if (json.hasKey(key)) {
			return json.getInt(key, defaultValue);
		}
	}
	return defaultValue;
}

void setError(std::string *error, const std::string &message)
{
	if (error) {
		*error = message;
	}
}

bool parseDescription(SignalType type, const JsonParser &json, SignalPayload &payload, std::string *error)
{
	SessionDescription description;
	description.sdp = getAnyString(json, {"sdp", "SDP"});
	description.type = asciiLower(getAnyString(json, {"type", "Type"}));

	if (description.sdp.empty()) {
		setError(error, "session description has no sdp");
		return false;
	}

	const std::string expected = signalTypeName(type);
	if (description.type.empty()) {
		description.type = expected;
	} else if (description.type != expected) {
		setError(error, "session description type '" + description.type + "' does not match " + expected);
		return false;
	}

	payload = description;
	return true;
}

bool parseCandidate(const JsonParser &json, SignalPayload &payload, std::string *error)
{
	IceCandidate candidate;
	const std::string candidateRaw = json.getRaw("candidate");
	if (!candidateRaw.empty() && candidateRaw[0] == '{') {
		// Browser RTCIceCandidate serialized whole
		JsonParser nested(candidateRaw);
		candidate.candidate = getAnyString(nested, {"candidate"});
		candidate.mid = getAnyString(nested, {"sdpMid", "mid", "smid"});
		candidate.mLineIndex = getAnyInt(nested, {"sdpMLineIndex", "mLineIndex"}, 0);
	} else {
		candidate.candidate = candidateRaw;
		candidate.mid = getAnyString(json, {"sdpMid", "mid", "smid"});
		candidate.mLineIndex = getAnyInt(json, {"sdpMLineIndex", "mLineIndex"}, 0);
	}

	if (candidate.candidate.empty()) {
		setError(error, "ice candidate is empty");
		return false;
	}
	if (candidate.mLineIndex < 0) {
		candidate.mLineIndex = 0;
	}

	payload = candidate;
	return true;
}

} // namespace

bool parseSignalType(const std::string &name, SignalType &type)
{
	const std::string lower = asciiLower(trim(name));
	if (lower == "offer") {
		type = SignalType::Offer;
		return true;
	}
	if (lower == "answer") {
		type = SignalType::Answer;
		return true;
	}
	if (lower == "ice-candidate" || lower == "candidate" || lower == "icecandidate") {
		type = SignalType::IceCandidate;
		return true;
	}
	return false;
}

std::string serializeSignalPayload(const SignalPayload &payload)
{
	JsonBuilder json;
	if (const auto *description = std::get_if<SessionDescription>(&payload)) {
		json.add("type", description->type);
		json.add("sdp", description->sdp);
	} else if (const auto *candidate = std::get_if<IceCandidate>(&payload)) {
		json.add("candidate", candidate->candidate);
		json.add("sdpMid", candidate->mid);
		json.add("sdpMLineIndex", candidate->mLineIndex);
	}
	return json.build();
}

bool parseSignalPayload(SignalType type, const std::string &json, SignalPayload &payload, std::string *error)
{
	try {
		JsonParser parsed(json);
		if (type == SignalType::IceCandidate) {
			return parseCandidate(parsed, payload, error);
		}
		return parseDescription(type, parsed, payload, error);
	} catch (const std::exception &ex) {
		setError(error, ex.what());
		return false;
	}
}

std::string serializeSignalingEnvelope(const SignalingEnvelope &envelope)
{
	JsonBuilder json;
	json.add("_id", envelope.id);
	json.add("messageType", signalTypeName(envelope.type));
	json.add("fromUserId", envelope.fromUserId);
	if (!envelope.toUserId.empty()) {
		json.add("toUserId", envelope.toUserId);
	}
	json.addRaw("data", serializeSignalPayload(envelope.payload));
	return json.build();
}

bool parseSignalingEnvelope(const std::string &message, SignalingEnvelope &envelope, std::string *error)
{
	try {
		JsonParser json(message);

		envelope.id = getAnyString(json, {"_id", "id"});
		envelope.fromUserId = getAnyString(json, {"fromUserId", "from", "UUID", "uuid"});
		envelope.toUserId = getAnyString(json, {"toUserId", "to"});

		if (envelope.id.empty()) {
			setError(error, "envelope has no id");
			return false;
		}
		if (envelope.fromUserId.empty()) {
			setError(error, "envelope " + envelope.id + " has no sender");
			return false;
		}

		const std::string typeName = getAnyString(json, {"messageType", "type"});
		if (!parseSignalType(typeName, envelope.type)) {
			setError(error, "envelope " + envelope.id + " has unknown type '" + typeName + "'");
			return false;
		}

		const std::string data = json.getObject("data");
		if (data.empty() || data[0] != '{') {
			setError(error, "envelope " + envelope.id + " has no data object");
			return false;
		}
		return parseSignalPayload(envelope.type, data, envelope.payload, error);
	} catch (const std::exception &ex) {
		setError(error, ex.what());
		return false;
	}
}

} // namespace gamenet
