/*
 * GameNet P2P SDK
 * Utility functions: logging, JSON helpers, string helpers
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "gamenet-common.h"

namespace gamenet
{

// String helpers
std::string trim(const std::string &str);
std::vector<std::string> split(const std::string &str, char delimiter);
std::string asciiLower(std::string value);

// ICE server list parsing (one entry per line or ';', fields by '|', ',' or whitespace)
std::vector<IceServer> parseIceServers(const std::string &config);
bool isTurnUrl(const std::string &url);

// Time utilities
int64_t currentTimeMs();
std::string formatTimestamp(int64_t ms);

// Simple JSON builder
class JsonBuilder
{
public:
	JsonBuilder &add(const std::string &key, const std::string &value);
	JsonBuilder &add(const std::string &key, const char *value);
	JsonBuilder &add(const std::string &key, int value);
	JsonBuilder &add(const std::string &key, int64_t value);
	JsonBuilder &add(const std::string &key, uint32_t value);
	JsonBuilder &add(const std::string &key, double value);
	JsonBuilder &add(const std::string &key, bool value);
	JsonBuilder &addRaw(const std::string &key, const std::string &rawJson);
	std::string build() const;

	static std::string quote(const std::string &value);

private:
	std::vector<std::pair<std::string, std::string>> entries_;
};

// Simple flat JSON parser. Nested objects and arrays are kept as raw text.
class JsonParser
{
public:
	explicit JsonParser(const std::string &json);

	bool hasKey(const std::string &key) const;
	std::string getString(const std::string &key, const std::string &defaultValue = "") const;
	int getInt(const std::string &key, int defaultValue = 0) const;
	bool getBool(const std::string &key, bool defaultValue = false) const;
	std::string getRaw(const std::string &key) const;
	std::string getObject(const std::string &key) const;
	std::vector<std::string> getArray(const std::string &key) const;

private:
	void parse();
	std::string extractValue(size_t &pos) const;

	std::string json_;
	std::map<std::string, std::string> values_;
};

// Logging
using LogHandler = std::function<void(LogLevel level, const std::string &message)>;

void setLogLevel(LogLevel level);
LogLevel getLogLevel();
void setLogHandler(LogHandler handler);
const char *logLevelName(LogLevel level);
bool parseLogLevel(const std::string &name, LogLevel &level);

void logInfo(const char *format, ...);
void logWarning(const char *format, ...);
void logError(const char *format, ...);
void logDebug(const char *format, ...);

} // namespace gamenet
