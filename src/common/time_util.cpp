#include "common/time_util.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm     tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(std::string_view text) {
    if (text.size() < 20 || text.back() != 'Z') {
        return std::nullopt;
    }

    std::tm     tm_val{};
    std::string head(text.substr(0, 19));
    std::istringstream iss(head);
    iss >> std::get_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    // 소수 초: ".fff..." 밀리초까지만 반영
    std::chrono::milliseconds millis{0};
    const auto fraction = text.substr(19, text.size() - 20);
    if (!fraction.empty()) {
        if (fraction.front() != '.' || fraction.size() < 2) {
            return std::nullopt;
        }
        int scale = 100;
        for (std::size_t i = 1; i < fraction.size(); ++i) {
            const char c = fraction[i];
            if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
                return std::nullopt;
            }
            if (scale > 0) {
                millis += std::chrono::milliseconds((c - '0') * scale);
                scale /= 10;
            }
        }
    }

    const std::time_t seconds = timegm(&tm_val);
    return std::chrono::system_clock::from_time_t(seconds) + millis;
}
