#include "TimeFormat.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

std::string FormatLocalTime(std::chrono::system_clock::time_point time, const char* format) {
    const auto timeValue = std::chrono::system_clock::to_time_t(time);
    std::tm localTime = {};
#ifdef _WIN32
    localtime_s(&localTime, &timeValue);
#else
    localtime_r(&timeValue, &localTime);
#endif

    std::ostringstream output;
    output << std::put_time(&localTime, format);
    return output.str();
}

std::chrono::system_clock::time_point SystemNow() {
    return std::chrono::system_clock::now();
}
