#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace sheetdrive {
namespace core {

/**
 * @brief SheetDrive统一错误码
 *
 * 双通道模型：可返回错误码（Expected）或抛出异常（throwError）。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 3,

    // 文件/记录错误 (20-39)
    FileNotFound = 20,
    FileAccessDenied = 21,
    FileCorrupted = 22,
    FileWriteError = 23,
    FileReadError = 24,

    // 表格模型错误 (40-59)
    InvalidDocument = 40,
    SheetNotFound = 41,
    InvalidCellReference = 42,
    InvalidFormula = 44,

    // XML处理错误 (60-79)
    XmlParseError = 61,
    XmlMissingElement = 63
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    explicit operator bool() const noexcept { return isError(); }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

inline Error success() {
    return Error(ErrorCode::Ok);
}

/**
 * @brief 将错误对象转换为对应的异常类型抛出（实现见 Exception.cpp）
 */
[[noreturn]] void throwError(const Error& error);

}} // namespace sheetdrive::core
