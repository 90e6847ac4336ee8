// Runtime policy helpers for diagnostics/sensitive logging.
#pragma once

#include "RemoteTypes.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace scpnator {

inline std::string normalizedEnv(const char *name) {
    if (!name)
        return {};
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return {};
    std::string out(raw);
    std::size_t start = 0;
    while (start < out.size() &&
           std::isspace(static_cast<unsigned char>(out[start]))) {
        ++start;
    }
    std::size_t end = out.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(out[end - 1]))) {
        --end;
    }
    out = out.substr(start, end - start);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("SCPNATOR_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

// Full ssh/scp diagnostic output and paths are only logged when this holds.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("SCPNATOR_LOG_SENSITIVE");
}

inline bool mockRemoteRequested() {
    return isDevEnvironment() && envFlagEnabled("SCPNATOR_MOCK_REMOTE");
}

inline void emitLog(const LogSink &sink, LogLevel level, const std::string &msg) {
    if (sink)
        sink(level, msg);
}

} // namespace scpnator
