/*
 * GameNet P2P SDK
 * Signaling envelope normalization helpers
 */

#pragma once

#include <string>

#include "gamenet-common.h"

namespace gamenet
{

// Accepts "offer", "answer", "ice-candidate" and the "candidate"/"icecandidate" spellings.
bool parseSignalType(const std::string &name, SignalType &type);

std::string serializeSignalPayload(const SignalPayload &payload);
bool parseSignalPayload(SignalType type, const std::string &json, SignalPayload &payload, std::string *error = nullptr);

std::string serializeSignalingEnvelope(const SignalingEnvelope &envelope);
bool parseSignalingEnvelope(const std::string &json, SignalingEnvelope &envelope, std::string *error = nullptr);

} // namespace gamenet
