#pragma once

#include <string>

namespace cadenceopt
{
namespace utils
{

/**
 * @brief Local wall clock time for log banners, e.g. "Aug_25_2024_1430"
 */
std::string getCurrentTimestamp();

/**
 * @brief Render an elapsed number of seconds as "1h 02m 03s" / "2m 03s" / "3.2s"
 */
std::string formatElapsed(double seconds);

} // namespace utils
} // namespace cadenceopt
