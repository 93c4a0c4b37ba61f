#include "TimeUtils.h"
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace cadenceopt
{
namespace utils
{

std::string getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%b_%d_%Y_%H%M");
    return ss.str();
}

std::string formatElapsed(double seconds)
{
    std::stringstream ss;

    if (seconds < 60.0)
    {
        ss << std::fixed << std::setprecision(1) << seconds << "s";
        return ss.str();
    }

    const long total = static_cast<long>(seconds);
    const long hours = total / 3600;
    const long minutes = (total % 3600) / 60;
    const long secs = total % 60;

    if (hours > 0)
        ss << hours << "h " << std::setw(2) << std::setfill('0') << minutes << "m ";
    else
        ss << minutes << "m ";

    ss << std::setw(2) << std::setfill('0') << secs << "s";
    return ss.str();
}

} // namespace utils
} // namespace cadenceopt
