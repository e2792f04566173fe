/**
 * @file transfer_record.cpp
 * @brief Transfer record helpers
 */

#include <kcenon/secure_transfer/storage/transfer_record.h>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace kcenon::secure_transfer {

auto format_timestamp(time_point tp) -> std::string {
    auto time_t_val = clock_type::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        --time_t_val;
    }

    std::tm tm_buf{};
#if defined(_WIN32)
    gmtime_s(&tm_buf, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

}  // namespace kcenon::secure_transfer
