#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 格式: [等级][模块] 消息，首个参数必须是字符串字面量
 */

// 单元格存储 (core)
#define CORE_TRACE(...)    SHEETDRIVE_LOG_TRACE("[TRC][core] " __VA_ARGS__)
#define CORE_DEBUG(...)    SHEETDRIVE_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     SHEETDRIVE_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     SHEETDRIVE_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    SHEETDRIVE_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 公式求值 (formula)
#define FORMULA_TRACE(...) SHEETDRIVE_LOG_TRACE("[TRC][fmla] " __VA_ARGS__)
#define FORMULA_DEBUG(...) SHEETDRIVE_LOG_DEBUG("[DBG][fmla] " __VA_ARGS__)
#define FORMULA_WARN(...)  SHEETDRIVE_LOG_WARN("[WRN][fmla] " __VA_ARGS__)

// 持久化 (persistence)
#define STORE_DEBUG(...)   SHEETDRIVE_LOG_DEBUG("[DBG][stor] " __VA_ARGS__)
#define STORE_INFO(...)    SHEETDRIVE_LOG_INFO("[INF][stor] " __VA_ARGS__)
#define STORE_WARN(...)    SHEETDRIVE_LOG_WARN("[WRN][stor] " __VA_ARGS__)
#define STORE_ERROR(...)   SHEETDRIVE_LOG_ERROR("[ERR][stor] " __VA_ARGS__)

// XML模块 (xml)
#define XML_TRACE(...)     SHEETDRIVE_LOG_TRACE("[TRC][xml ] " __VA_ARGS__)
#define XML_DEBUG(...)     SHEETDRIVE_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)      SHEETDRIVE_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)     SHEETDRIVE_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)   SHEETDRIVE_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_WARN(...)    SHEETDRIVE_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)   SHEETDRIVE_LOG_ERROR("[ERR][util] " __VA_ARGS__)

// 命令行工具 (cli)
#define CLI_INFO(...)      SHEETDRIVE_LOG_INFO("[INF][cli ] " __VA_ARGS__)
#define CLI_DEBUG(...)     SHEETDRIVE_LOG_DEBUG("[DBG][cli ] " __VA_ARGS__)
