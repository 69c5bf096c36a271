// NEBULA - Time Utilities
// Copyright (c) 2024 NEBULA Developers
// MIT License
//
// Unix timestamps with a process-wide mock clock for tests.

#ifndef NEBULA_UTIL_TIME_H
#define NEBULA_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace nebula {
namespace util {

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Convert Unix timestamp to system time point
SystemTimePoint FromUnixTime(int64_t timestamp);

/// Format Unix timestamp as ISO 8601 (e.g., "2024-01-15T10:30:00Z")
std::string FormatISO8601(int64_t timestamp);

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime();
void DisableMockTime();
bool IsMockTimeEnabled();
void SetMockTime(int64_t timestamp);
void AdvanceMockTime(Seconds duration);
int64_t GetMockTime();

} // namespace util
} // namespace nebula

#endif // NEBULA_UTIL_TIME_H
