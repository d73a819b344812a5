#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <algorithm>

namespace binbot {
namespace time_utils {

std::string to_iso8601(WallClock t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

std::string now_iso8601() {
    return to_iso8601(wall_now());
}

std::string format_duration_ms(int64_t ms) {
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        double sec = ms / 1000.0;
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << sec << "s";
        return ss.str();
    } else {
        int64_t min = ms / 60000;
        int64_t sec = (ms % 60000) / 1000;
        std::ostringstream ss;
        ss << min << "m" << std::setfill('0') << std::setw(2) << sec << "s";
        return ss.str();
    }
}

int64_t backoff_delay_ms(int64_t base_ms, int attempt, int64_t max_ms) {
    if (attempt < 1) attempt = 1;
    // Cap the shift so the product cannot overflow before the max_ms clamp
    int shift = std::min(attempt - 1, 20);
    int64_t delay = base_ms * (int64_t{1} << shift);
    return std::min(delay, max_ms);
}

int64_t elapsed_ms(Timestamp since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now() - since).count();
}

} // namespace time_utils
} // namespace binbot
