// Runtime policy helpers for diagnostics (environment driven).
#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace nmf {

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

// True when the variable is set to an explicit "off" value.
inline bool envFlagDisabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "0" || v == "false" || v == "no" || v == "off";
}

// NMF_JOBS_DEBUG=1 turns on per-path tracing of the job worker.
inline bool jobsDebugRequested() { return envFlagEnabled("NMF_JOBS_DEBUG"); }

inline bool jobsDebugSuppressed() { return envFlagDisabled("NMF_JOBS_DEBUG"); }

} // namespace nmf
