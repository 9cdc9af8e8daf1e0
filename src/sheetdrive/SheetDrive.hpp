#pragma once

// SheetDrive - 带公式求值与持久化的电子表格文档库

#include <string>

// 公共类型定义
#include "sheetdrive/core/DocumentTypes.hpp"
#include "sheetdrive/core/ErrorCode.hpp"
#include "sheetdrive/core/Exception.hpp"
#include "sheetdrive/core/Expected.hpp"
#include "sheetdrive/core/Cell.hpp"
#include "sheetdrive/core/Document.hpp"
#include "sheetdrive/api/SpreadsheetSession.hpp"

// 版本信息
#define SHEETDRIVE_VERSION_MAJOR 1
#define SHEETDRIVE_VERSION_MINOR 0
#define SHEETDRIVE_VERSION_PATCH 0
#define SHEETDRIVE_VERSION_STRING "1.0.0"

// 平台检测
#ifdef _WIN32
    #define SHEETDRIVE_WINDOWS
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#elif defined(__linux__)
    #define SHEETDRIVE_LINUX
#elif defined(__APPLE__)
    #define SHEETDRIVE_MACOS
#endif

// 导出宏定义
#ifdef SHEETDRIVE_WINDOWS
    #ifdef SHEETDRIVE_SHARED
        #ifdef SHEETDRIVE_EXPORTS
            #define SHEETDRIVE_API __declspec(dllexport)
        #else
            #define SHEETDRIVE_API __declspec(dllimport)
        #endif
    #else
        #define SHEETDRIVE_API
    #endif
#else
    #define SHEETDRIVE_API
#endif

namespace sheetdrive {

inline std::string getVersion() {
    return SHEETDRIVE_VERSION_STRING;
}

/**
 * @brief 初始化SheetDrive库（日志系统）
 * @param log_file_path 日志文件路径，为空时只输出到控制台
 * @param enable_console 是否启用控制台日志
 * @return 初始化是否成功
 */
SHEETDRIVE_API bool initialize(const std::string& log_file_path = "logs/sheetdrive.log",
                               bool enable_console = true);

/**
 * @brief 清理SheetDrive库资源，刷新并关闭日志文件
 */
SHEETDRIVE_API void cleanup();

// 类型别名
using Session = SpreadsheetSession;
using DriveOptions = core::DriveOptions;
using CellUpdate = core::CellUpdate;

} // namespace sheetdrive
