/**
 * @file Exception.hpp
 * @brief SheetDrive异常类定义
 */

#ifndef SHEETDRIVE_EXCEPTION_HPP
#define SHEETDRIVE_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace sheetdrive {
namespace core {

/**
 * @brief SheetDrive基础异常类
 */
class SheetDriveException : public std::runtime_error {
public:
    /**
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的源文件
     * @param line 发生错误的行号
     */
    SheetDriveException(const std::string& message,
                        ErrorCode code = ErrorCode::InternalError,
                        const char* file = nullptr,
                        int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const { return toString(error_code_); }

    /**
     * @brief 获取详细错误信息（含错误码、源码位置与上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

    /**
     * @brief 转换为错误对象，用于 Expected 通道
     */
    Error toError() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件/记录相关异常
 */
class FileException : public SheetDriveException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public SheetDriveException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 操作相关异常
 */
class OperationException : public SheetDriveException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       ErrorCode code = ErrorCode::InvalidArgument,
                       const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief 单元格引用解析异常
 */
class AddressParseException : public SheetDriveException {
public:
    AddressParseException(const std::string& message,
                          const std::string& reference,
                          const char* file = nullptr, int line = 0);

    const std::string& getReference() const { return reference_; }

private:
    std::string reference_;
};

/**
 * @brief 工作表不存在
 */
class SheetNotFoundException : public SheetDriveException {
public:
    SheetNotFoundException(const std::string& sheet_id,
                           const char* file = nullptr, int line = 0);

    const std::string& getSheetId() const { return sheet_id_; }

private:
    std::string sheet_id_;
};

} // namespace core
} // namespace sheetdrive

#define SHEETDRIVE_THROW(ExceptionType, ...) \
    throw ExceptionType(__VA_ARGS__, __FILE__, __LINE__)

#define SHEETDRIVE_THROW_IF(condition, ExceptionType, ...) \
    do { if (condition) { SHEETDRIVE_THROW(ExceptionType, __VA_ARGS__); } } while (0)

#endif // SHEETDRIVE_EXCEPTION_HPP
