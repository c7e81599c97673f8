/*
 * GameNet P2P SDK
 * Utility function implementations
 */

#include "gamenet-utils.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <sstream>

#include "gamenet-transport.h"

namespace gamenet
{

namespace
{

std::atomic<LogLevel> gLogLevel{LogLevel::Warning};
std::mutex gLogHandlerMutex;
LogHandler gLogHandler;

bool startsWithInsensitive(const std::string &value, const char *prefix)
{
	size_t idx = 0;
	for (; prefix[idx] != '\0'; ++idx) {
		if (idx >= value.size()) {
			return false;
		}
		const char a = static_cast<char>(std::tolower(static_cast<unsigned char>(value[idx])));
		const char b = static_cast<char>(std::tolower(static_cast<unsigned char>(prefix[idx])));
		if (a != b) {
			return false;
		}
	}
	return true;
}

bool isIceUrl(const std::string &url)
{
	return startsWithInsensitive(url, "stun:") || startsWithInsensitive(url, "stuns:") ||
	       startsWithInsensitive(url, "turn:") || startsWithInsensitive(url, "turns:");
}

void emitLog(LogLevel level, const char *format, va_list args)
{
	if (level < gLogLevel.load()) {
		return;
	}

	char buffer[1024];
	vsnprintf(buffer, sizeof(buffer), format, args);
	const std::string message = std::string("[GameNet] ") + buffer;

	LogHandler handler;
	{
		std::lock_guard<std::mutex> lock(gLogHandlerMutex);
		handler = gLogHandler;
	}

	if (handler) {
		handler(level, message);
		return;
	}

	std::fprintf(stderr, "%s %-7s %s\n", formatTimestamp(currentTimeMs()).c_str(), logLevelName(level),
	             message.c_str());
}

} // namespace

const char *connectionStateName(ConnectionState state)
{
	switch (state) {
	case ConnectionState::Connecting:
		return "connecting";
	case ConnectionState::Connected:
		return "connected";
	case ConnectionState::Disconnected:
		return "disconnected";
	case ConnectionState::Failed:
		return "failed";
	}
	return "unknown";
}

const char *linkStateName(LinkState state)
{
	switch (state) {
	case LinkState::Idle:
		return "idle";
	case LinkState::Connecting:
		return "connecting";
	case LinkState::Connected:
		return "connected";
	case LinkState::Failed:
		return "failed";
	case LinkState::Disconnected:
		return "disconnected";
	}
	return "unknown";
}

const char *signalTypeName(SignalType type)
{
	switch (type) {
	case SignalType::Offer:
		return "offer";
	case SignalType::Answer:
		return "answer";
	case SignalType::IceCandidate:
		return "ice-candidate";
	}
	return "unknown";
}

const char *transportChannelLabel(TransportChannel channel)
{
	return channel == TransportChannel::Reliable ? kReliableChannelLabel : kUnreliableChannelLabel;
}

const char *transportEventName(TransportEvent::Type type)
{
	switch (type) {
	case TransportEvent::Type::LocalDescription:
		return "local-description";
	case TransportEvent::Type::LocalCandidate:
		return "local-candidate";
	case TransportEvent::Type::ChannelOpen:
		return "channel-open";
	case TransportEvent::Type::ChannelClosed:
		return "channel-closed";
	case TransportEvent::Type::ChannelError:
		return "channel-error";
	case TransportEvent::Type::Message:
		return "message";
	case TransportEvent::Type::StateFailed:
		return "state-failed";
	}
	return "unknown";
}

std::string trim(const std::string &str)
{
	size_t start = str.find_first_not_of(" \t\r\n");
	if (start == std::string::npos)
		return "";
	size_t end = str.find_last_not_of(" \t\r\n");
	return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string &str, char delimiter)
{
	std::vector<std::string> result;
	if (str.empty()) {
		result.push_back("");
		return result;
	}
	std::stringstream ss(str);
	std::string item;
	while (std::getline(ss, item, delimiter)) {
		result.push_back(item);
	}
	return result;
}

std::string asciiLower(std::string value)
{
	std::transform(value.begin(), value.end(), value.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return value;
}

bool isTurnUrl(const std::string &url)
{
	return startsWithInsensitive(url, "turn:") || startsWithInsensitive(url, "turns:");
}

std::vector<IceServer> parseIceServers(const std::string &config)
{
	std::vector<IceServer> servers;
	std::stringstream lines(config);
	std::string rawLine;

	auto assignFields = [](IceServer &server, const std::vector<std::string> &parts) {
		if (!parts.empty()) {
			server.urls = trim(parts[0]);
		}
		if (parts.size() > 1) {
			server.username = trim(parts[1]);
		}
		if (parts.size() > 2) {
			server.credential = trim(parts[2]);
		}
	};

	auto parseEntry = [&](const std::string &entryValue) {
		std::string line = trim(entryValue);
		if (line.empty() || startsWithInsensitive(line, "#") || startsWithInsensitive(line, "//")) {
			return;
		}

		IceServer server;

		if (line.find('|') != std::string::npos) {
			assignFields(server, split(line, '|'));
		} else if (line.find(',') != std::string::npos) {
			assignFields(server, split(line, ','));
		} else {
			std::stringstream tokenStream(line);
			std::string token;
			std::vector<std::string> tokens;
			while (tokenStream >> token) {
				tokens.push_back(token);
			}

			if (!tokens.empty()) {
				server.urls = trim(tokens[0]);
			}

			for (size_t i = 1; i < tokens.size(); ++i) {
				std::string value = trim(tokens[i]);
				const size_t equalsPos = value.find('=');
				if (equalsPos != std::string::npos) {
					const std::string key = asciiLower(value.substr(0, equalsPos));
					std::string mapped = value.substr(equalsPos + 1);
					if (key == "username" || key == "user") {
						server.username = mapped;
						continue;
					}
					if (key == "credential" || key == "password" || key == "pass") {
						server.credential = mapped;
						continue;
					}
				}

				if (server.username.empty()) {
					server.username = value;
				} else if (server.credential.empty()) {
					server.credential = value;
				}
			}
		}

		server.urls = trim(server.urls);
		server.username = trim(server.username);
		server.credential = trim(server.credential);
		if (!server.urls.empty() && isIceUrl(server.urls)) {
			servers.push_back(std::move(server));
		}
	};

	while (std::getline(lines, rawLine)) {
		const std::vector<std::string> entries = split(rawLine, ';');
		for (const auto &entry : entries) {
			parseEntry(entry);
		}
	}

	return servers;
}

// Time utilities
int64_t currentTimeMs()
{
	using namespace std::chrono;
	return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string formatTimestamp(int64_t ms)
{
	time_t seconds = ms / 1000;
	struct tm timeinfo;
#ifdef _WIN32
	localtime_s(&timeinfo, &seconds);
#else
	localtime_r(&seconds, &timeinfo);
#endif
	char buffer[32];
	strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &timeinfo);
	return std::string(buffer);
}

// JSON Builder implementation
std::string JsonBuilder::quote(const std::string &value)
{
	std::string escaped;
	escaped.reserve(value.size() + 2);
	escaped += '"';
	for (char c : value) {
		switch (c) {
		case '"':
			escaped += "\\\"";
			break;
		case '\\':
			escaped += "\\\\";
			break;
		case '\b':
			escaped += "\\b";
			break;
		case '\f':
			escaped += "\\f";
			break;
		case '\n':
			escaped += "\\n";
			break;
		case '\r':
			escaped += "\\r";
			break;
		case '\t':
			escaped += "\\t";
			break;
		default:
			escaped += c;
			break;
		}
	}
	escaped += '"';
	return escaped;
}

JsonBuilder &JsonBuilder::add(const std::string &key, const std::string &value)
{
	entries_.emplace_back(key, quote(value));
	return *this;
}

JsonBuilder &JsonBuilder::add(const std::string &key, const char *value)
{
	return add(key, std::string(value ? value : ""));
}

JsonBuilder &JsonBuilder::add(const std::string &key, int value)
{
	entries_.emplace_back(key, std::to_string(value));
	return *this;
}

JsonBuilder &JsonBuilder::add(const std::string &key, int64_t value)
{
	entries_.emplace_back(key, std::to_string(value));
	return *this;
}

JsonBuilder &JsonBuilder::add(const std::string &key, uint32_t value)
{
	entries_.emplace_back(key, std::to_string(value));
	return *this;
}

JsonBuilder &JsonBuilder::add(const std::string &key, double value)
{
	char buffer[64];
	std::snprintf(buffer, sizeof(buffer), "%.3f", value);
	entries_.emplace_back(key, buffer);
	return *this;
}

JsonBuilder &JsonBuilder::add(const std::string &key, bool value)
{
	entries_.emplace_back(key, value ? "true" : "false");
	return *this;
}

JsonBuilder &JsonBuilder::addRaw(const std::string &key, const std::string &rawJson)
{
	entries_.emplace_back(key, rawJson);
	return *this;
}

std::string JsonBuilder::build() const
{
	std::stringstream ss;
	ss << "{";
	for (size_t i = 0; i < entries_.size(); i++) {
		if (i > 0)
			ss << ",";
		ss << "\"" << entries_[i].first << "\":" << entries_[i].second;
	}
	ss << "}";
	return ss.str();
}

// JSON Parser implementation
JsonParser::JsonParser(const std::string &json) : json_(json)
{
	parse();
}

void JsonParser::parse()
{
	// Simple JSON parser - handles basic key-value pairs
	size_t pos = 0;

	// Skip whitespace and opening brace
	while (pos < json_.size() && (std::isspace(static_cast<unsigned char>(json_[pos])) || json_[pos] == '{'))
		pos++;

	while (pos < json_.size() && json_[pos] != '}') {
		while (pos < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos])))
			pos++;

		if (pos >= json_.size() || json_[pos] != '"')
			break;
		pos++; // Skip opening quote

		std::string key;
		while (pos < json_.size() && json_[pos] != '"') {
			key += json_[pos++];
		}
		pos++; // Skip closing quote

		while (pos < json_.size() && json_[pos] != ':')
			pos++;
		pos++; // Skip colon

		while (pos < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos])))
			pos++;

		if (pos >= json_.size())
			break;

		std::string value = extractValue(pos);
		if (value != "null") {
			values_[key] = value;
		}

		while (pos < json_.size() && (std::isspace(static_cast<unsigned char>(json_[pos])) || json_[pos] == ','))
			pos++;
	}
}

std::string JsonParser::extractValue(size_t &pos) const
{
	std::string value;

	if (json_[pos] == '"') {
		pos++; // Skip opening quote
		while (pos < json_.size() && json_[pos] != '"') {
			if (json_[pos] == '\\' && pos + 1 < json_.size()) {
				pos++;
				switch (json_[pos]) {
				case 'n':
					value += '\n';
					break;
				case 'r':
					value += '\r';
					break;
				case 't':
					value += '\t';
					break;
				case 'b':
					value += '\b';
					break;
				case 'f':
					value += '\f';
					break;
				default:
					value += json_[pos];
					break;
				}
			} else {
				value += json_[pos];
			}
			pos++;
		}
		pos++; // Skip closing quote
	} else if (json_[pos] == '{' || json_[pos] == '[') {
		// Object or array - capture the whole thing, skipping brackets inside strings
		const char open = json_[pos];
		const char close = open == '{' ? '}' : ']';
		int depth = 1;
		bool inString = false;
		value += json_[pos++];
		while (pos < json_.size() && depth > 0) {
			const char c = json_[pos];
			if (inString) {
				if (c == '\\' && pos + 1 < json_.size()) {
					value += c;
					value += json_[++pos];
					pos++;
					continue;
				}
				if (c == '"')
					inString = false;
			} else if (c == '"') {
				inString = true;
			} else if (c == open) {
				depth++;
			} else if (c == close) {
				depth--;
			}
			value += json_[pos++];
		}
	} else {
		// Number, boolean, or null
		while (pos < json_.size() && json_[pos] != ',' && json_[pos] != '}' &&
		       !std::isspace(static_cast<unsigned char>(json_[pos]))) {
			value += json_[pos++];
		}
	}

	return value;
}

bool JsonParser::hasKey(const std::string &key) const
{
	return values_.find(key) != values_.end();
}

std::string JsonParser::getString(const std::string &key, const std::string &defaultValue) const
{
	auto it = values_.find(key);
	if (it != values_.end()) {
		return it->second;
	}
	return defaultValue;
}

int JsonParser::getInt(const std::string &key, int defaultValue) const
{
	auto it = values_.find(key);
	if (it == values_.end()) {
		return defaultValue;
	}
	try {
		return std::stoi(it->second);
	} catch (const std::exception &) {
		return defaultValue;
	}
}

bool JsonParser::getBool(const std::string &key, bool defaultValue) const
{
	auto it = values_.find(key);
	if (it != values_.end()) {
		return it->second == "true";
	}
	return defaultValue;
}

std::string JsonParser::getRaw(const std::string &key) const
{
	auto it = values_.find(key);
	if (it != values_.end()) {
		return it->second;
	}
	return "";
}

std::string JsonParser::getObject(const std::string &key) const
{
	return getRaw(key);
}

std::vector<std::string> JsonParser::getArray(const std::string &key) const
{
	std::vector<std::string> result;
	std::string arr = getRaw(key);

	if (arr.empty() || arr[0] != '[')
		return result;

	size_t pos = 1;
	while (pos < arr.size() && arr[pos] != ']') {
		while (pos < arr.size() && std::isspace(static_cast<unsigned char>(arr[pos])))
			pos++;

		if (pos >= arr.size() || arr[pos] == ']')
			break;

		std::string value;
		if (arr[pos] == '"') {
			pos++;
			while (pos < arr.size() && arr[pos] != '"') {
				if (arr[pos] == '\\' && pos + 1 < arr.size()) {
					pos++;
				}
				value += arr[pos++];
			}
			pos++;
		} else if (arr[pos] == '{') {
			int depth = 1;
			value += arr[pos++];
			while (pos < arr.size() && depth > 0) {
				if (arr[pos] == '{')
					depth++;
				else if (arr[pos] == '}')
					depth--;
				value += arr[pos++];
			}
		} else {
			// Number or literal
			while (pos < arr.size() && arr[pos] != ',' && arr[pos] != ']' &&
			       !std::isspace(static_cast<unsigned char>(arr[pos]))) {
				value += arr[pos++];
			}
		}

		if (!value.empty()) {
			result.push_back(value);
		}

		while (pos < arr.size() && (std::isspace(static_cast<unsigned char>(arr[pos])) || arr[pos] == ','))
			pos++;
	}

	return result;
}

// Logging
void setLogLevel(LogLevel level)
{
	gLogLevel = level;
}

LogLevel getLogLevel()
{
	return gLogLevel.load();
}

void setLogHandler(LogHandler handler)
{
	std::lock_guard<std::mutex> lock(gLogHandlerMutex);
	gLogHandler = std::move(handler);
}

const char *logLevelName(LogLevel level)
{
	switch (level) {
	case LogLevel::Debug:
		return "debug";
	case LogLevel::Info:
		return "info";
	case LogLevel::Warning:
		return "warning";
	case LogLevel::Error:
		return "error";
	}
	return "unknown";
}

bool parseLogLevel(const std::string &name, LogLevel &level)
{
	const std::string lowered = asciiLower(trim(name));
	if (lowered == "debug") {
		level = LogLevel::Debug;
	} else if (lowered == "info") {
		level = LogLevel::Info;
	} else if (lowered == "warn" || lowered == "warning") {
		level = LogLevel::Warning;
	} else if (lowered == "error") {
		level = LogLevel::Error;
	} else {
		return false;
	}
	return true;
}

void logInfo(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	emitLog(LogLevel::Info, format, args);
	va_end(args);
}

void logWarning(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	emitLog(LogLevel::Warning, format, args);
	va_end(args);
}

void logError(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	emitLog(LogLevel::Error, format, args);
	va_end(args);
}

void logDebug(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	emitLog(LogLevel::Debug, format, args);
	va_end(args);
}

} // namespace gamenet
