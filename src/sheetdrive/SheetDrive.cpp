#include "SheetDrive.hpp"
#include "sheetdrive/utils/Logger.hpp"
#include <iostream>

namespace sheetdrive {

SHEETDRIVE_API bool initialize(const std::string& log_file_path, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, Logger::Level::INFO, enable_console);
        SHEETDRIVE_LOG_INFO("SheetDrive library initialized successfully");
        SHEETDRIVE_LOG_INFO("Version: {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统不可用时输出到标准错误
        if (enable_console) {
            std::cerr << "Failed to initialize SheetDrive: " << e.what() << std::endl;
        }
        return false;
    }
}

SHEETDRIVE_API void cleanup() {
    SHEETDRIVE_LOG_INFO("SheetDrive library cleanup completed");
    Logger::getInstance().shutdown();
}

} // namespace sheetdrive
