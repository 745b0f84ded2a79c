#pragma once

#include <string>
#include <string_view>

namespace guardian {

// "YYYY-MM-DD HH:MM:SS.mmm" in local time.
std::string timestamp_now();

// "YYYY-MM-DDTHH:MM:SSZ" in UTC; used for record and bundle timestamps.
std::string utc_timestamp();

// Writes "[component timestamp] message" to stderr. Thread-safe.
void log(std::string_view component, std::string_view message);

} // namespace guardian
