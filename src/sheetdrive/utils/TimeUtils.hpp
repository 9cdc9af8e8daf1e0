#pragma once

#include <string>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace sheetdrive {
namespace utils {

/**
 * @brief 时间工具类 - 统一处理时间相关操作
 */
class TimeUtils {
public:
    /**
     * @brief 获取当前UTC时间的 std::tm 结构
     */
    static std::tm getCurrentUTCTime() {
        std::time_t now = std::time(nullptr);
        std::tm result{};
#ifdef _WIN32
        gmtime_s(&result, &now);
#else
        gmtime_r(&now, &result);
#endif
        return result;
    }

    /**
     * @brief 格式化时间为ISO 8601格式 (YYYY-MM-DDTHH:MM:SSZ)
     */
    static std::string formatTimeISO8601(const std::tm& time) {
        std::ostringstream oss;
        oss << std::put_time(&time, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    /**
     * @brief 当前UTC时间的ISO 8601字符串，用于记录时间戳
     */
    static std::string nowISO8601() {
        return formatTimeISO8601(getCurrentUTCTime());
    }
};

}} // namespace sheetdrive::utils
