#pragma once

#include <cstdlib>
#include <iostream>
#include <string>

namespace star_etl {

// Runtime logging control via environment variable
inline bool IsDebugLoggingEnabled() {
    static bool initialized = false;
    static bool enabled = false;

    if (!initialized) {
        const char* env = std::getenv("STAR_ETL_DEBUG");
        enabled = (env != nullptr && std::string(env) == "1");
        initialized = true;
    }

    return enabled;
}

} // namespace star_etl

// Compile-time logging macros
// Usage:
//   STAR_ETL_LOG_PARSER("Parsed mapping " << name);
//   STAR_ETL_LOG_EXECUTOR("Pass 1 produced " << count << " triples");
//
// Control:
//   Compile-time: cmake -DSTAR_ETL_ENABLE_DEBUG_LOGGING=ON
//   Runtime: export STAR_ETL_DEBUG=1

#ifdef STAR_ETL_ENABLE_DEBUG_LOGGING

#define STAR_ETL_LOG(category, message) \
    do { \
        if (::star_etl::IsDebugLoggingEnabled()) { \
            std::cout << "[" << category << "] " << message << "\n" << std::flush; \
        } \
    } while (0)

#else

#define STAR_ETL_LOG(category, message) \
    do { } while (0)

#endif

// Warnings are user-facing (skipped maps, skipped rows) and never compiled out
#define STAR_ETL_WARN(message) \
    do { \
        std::cerr << "[WARNING] " << message << "\n" << std::flush; \
    } while (0)

// Category-specific logging macros
#define STAR_ETL_LOG_PARSER(message)   STAR_ETL_LOG("PARSER", message)
#define STAR_ETL_LOG_TEMPLATE(message) STAR_ETL_LOG("TEMPLATE", message)
#define STAR_ETL_LOG_SOURCE(message)   STAR_ETL_LOG("SOURCE", message)
#define STAR_ETL_LOG_EXECUTOR(message) STAR_ETL_LOG("EXECUTOR", message)
#define STAR_ETL_LOG_JOIN(message)     STAR_ETL_LOG("JOIN", message)
#define STAR_ETL_LOG_OUTPUT(message)   STAR_ETL_LOG("OUTPUT", message)
