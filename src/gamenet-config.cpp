/*
 * GameNet P2P SDK
 * Session configuration parsing and validation
 */

#include "gamenet-config.h"

#include <string>

#include "gamenet-utils.h"

namespace gamenet
{

namespace
{

void setError(std::string *error, const std::string &message)
{
	if (error) {
		*error = message;
	}
}

template<typename T> T clampSetting(const char *key, long long value, T minValue, T maxValue)
{
	if (value < static_cast<long long>(minValue)) {
		logWarning("Config %s=%lld below minimum, using %lld", key, value, static_cast<long long>(minValue));
		return minValue;
	}
	if (value > static_cast<long long>(maxValue)) {
		logWarning("Config %s=%lld above maximum, using %lld", key, value, static_cast<long long>(maxValue));
		return maxValue;
	}
	return static_cast<T>(value);
}

bool readNumber(const JsonParser &json, const char *key, long long &value)
{
	if (!json.hasKey(key)) {
		return false;
	}
	const std::string raw = json.getRaw(key);
	try {
		value = std::stoll(raw);
		return true;
	} catch (const std::exception &) {
		logWarning("Config %s has non-numeric value '%s', keeping default", key, raw.c_str());
		return false;
	}
}

void readIceServerObject(const std::string &raw, std::vector<IceServer> &servers)
{
	JsonParser entry(raw);
	const std::string username = entry.getString("username");
	const std::string credential = entry.getString("credential");

	std::vector<std::string> urls;
	const std::string rawUrls = entry.getRaw("urls").empty() ? entry.getRaw("url") : entry.getRaw("urls");
	if (!rawUrls.empty() && rawUrls[0] == '[') {
		urls = entry.hasKey("urls") ? entry.getArray("urls") : entry.getArray("url");
	} else if (!rawUrls.empty()) {
		urls.push_back(rawUrls);
	}

	for (const auto &url : urls) {
		IceServer server;
		server.urls = trim(url);
		server.username = username;
		server.credential = credential;
		if (!server.urls.empty()) {
			servers.push_back(server);
		}
	}
}

std::vector<IceServer> readIceServers(const JsonParser &json)
{
	const std::string raw = json.getRaw("iceServers");
	if (raw.empty() || raw[0] != '[') {
		// Text form: "stun:host:3478; turn:host:3478|user|pass"
		return parseIceServers(raw);
	}

	std::vector<IceServer> servers;
	for (const auto &entry : json.getArray("iceServers")) {
		if (!entry.empty() && entry[0] == '{') {
			readIceServerObject(entry, servers);
		} else {
			auto parsed = parseIceServers(entry);
			servers.insert(servers.end(), parsed.begin(), parsed.end());
		}
	}
	return servers;
}

} // namespace

bool parseSessionConfig(const std::string &json, SessionConfig &config, std::string *error)
{
	const std::string trimmed = trim(json);
	if (trimmed.empty() || trimmed.front() != '{') {
		setError(error, "configuration must be a JSON object");
		return false;
	}

	try {
		JsonParser parsed(trimmed);
		long long number = 0;

		if (parsed.hasKey("iceServers")) {
			config.iceServers = readIceServers(parsed);
		}
		config.forceTurn = parsed.getBool("forceTurn", config.forceTurn);
		if (readNumber(parsed, "maxPeers", number)) {
			config.maxPeers = clampSetting<int>("maxPeers", number, 1, kMaxPeersLimit);
		}
		config.enableReliableChannel = parsed.getBool("enableReliableChannel", config.enableReliableChannel);
		config.enableUnreliableChannel = parsed.getBool("enableUnreliableChannel", config.enableUnreliableChannel);

		if (readNumber(parsed, "maxChannels", number)) {
			config.maxChannels = clampSetting<uint32_t>("maxChannels", number, 1, kMaxChannelsLimit);
		}
		if (readNumber(parsed, "slotCount", number)) {
			config.slotCount = clampSetting<uint32_t>("slotCount", number, 1, kMaxSlotCount);
		}
		if (readNumber(parsed, "slotSize", number)) {
			config.slotSize = clampSetting<uint32_t>("slotSize", number, kMinSlotSize, kMaxSlotSize);
		}

		if (parsed.hasKey("unreliableChannels")) {
			config.unreliableChannels.clear();
			for (const auto &entry : parsed.getArray("unreliableChannels")) {
				try {
					const long long channel = std::stoll(entry);
					if (channel < 0 || channel >= static_cast<long long>(config.maxChannels)) {
						logWarning("Ignoring unreliable channel %lld outside [0, %u)", channel, config.maxChannels);
						continue;
					}
					config.unreliableChannels.push_back(static_cast<uint32_t>(channel));
				} catch (const std::exception &) {
					logWarning("Ignoring non-numeric unreliable channel '%s'", entry.c_str());
				}
			}
		}

		config.enableStats = parsed.getBool("enableStats", config.enableStats);
		if (parsed.hasKey("logLevel")) {
			const std::string levelName = parsed.getString("logLevel");
			if (!parseLogLevel(levelName, config.logLevel)) {
				logWarning("Unknown log level '%s', keeping %s", levelName.c_str(), logLevelName(config.logLevel));
			}
		}
	} catch (const std::exception &ex) {
		setError(error, ex.what());
		return false;
	}

	return validateSessionConfig(config, error);
}

bool validateSessionConfig(const SessionConfig &config, std::string *error)
{
	if (!config.enableReliableChannel && !config.enableUnreliableChannel) {
		setError(error, "at least one transport channel must be enabled");
		return false;
	}
	if (config.slotSize <= kFrameHeaderSize + kSlotLengthPrefixSize) {
		setError(error, "slotSize must exceed the frame header and length prefix");
		return false;
	}
	if (config.slotSize > kMaxSlotSize) {
		setError(error, "slotSize exceeds " + std::to_string(kMaxSlotSize));
		return false;
	}
	if (config.slotCount == 0 || config.slotCount > kMaxSlotCount) {
		setError(error, "slotCount must be between 1 and " + std::to_string(kMaxSlotCount));
		return false;
	}
	if (config.maxChannels == 0 || config.maxChannels > kMaxChannelsLimit) {
		setError(error, "maxChannels must be between 1 and " + std::to_string(kMaxChannelsLimit));
		return false;
	}
	if (config.maxPeers < 1 || config.maxPeers > kMaxPeersLimit) {
		setError(error, "maxPeers must be between 1 and " + std::to_string(kMaxPeersLimit));
		return false;
	}

	const uint64_t roundedSlot = (static_cast<uint64_t>(config.slotSize) + 3) & ~static_cast<uint64_t>(3);
	const uint64_t regionSize = static_cast<uint64_t>(config.maxChannels) *
	                            (2 * kRingHeaderSize + 2 * static_cast<uint64_t>(config.slotCount) * roundedSlot);
	if (regionSize > kMaxQueueRegionSize) {
		setError(error, "queue region of " + std::to_string(regionSize) + " bytes exceeds " +
		                    std::to_string(kMaxQueueRegionSize));
		return false;
	}
	for (uint32_t channel : config.unreliableChannels) {
		if (channel >= config.maxChannels) {
			setError(error, "unreliable channel " + std::to_string(channel) + " is out of range");
			return false;
		}
	}
	return true;
}

} // namespace gamenet
