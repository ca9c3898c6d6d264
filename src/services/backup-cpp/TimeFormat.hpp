#pragma once

#include <chrono>
#include <functional>
#include <string>

using Clock = std::function<std::chrono::system_clock::time_point()>;

// strftime-style formatting in the local time zone.
std::string FormatLocalTime(std::chrono::system_clock::time_point time, const char* format);

std::chrono::system_clock::time_point SystemNow();
