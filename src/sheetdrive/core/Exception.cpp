/**
 * @file Exception.cpp
 * @brief SheetDrive异常类实现
 */

#include "Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace sheetdrive {
namespace core {

SheetDriveException::SheetDriveException(const std::string& message,
                                         ErrorCode code,
                                         const char* file,
                                         int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string SheetDriveException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void SheetDriveException::addContext(const std::string& context) {
    context_.push_back(context);
}

Error SheetDriveException::toError() const {
    std::string ctx;
    for (const auto& c : context_) {
        if (!ctx.empty()) ctx += "; ";
        ctx += c;
    }
    return Error(error_code_, what(), ctx);
}

// FileException 实现
FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : SheetDriveException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

// ParameterException 实现
ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : SheetDriveException(parameter_name.empty() ? message
                              : fmt::format("{} (parameter: {})", message, parameter_name),
                          ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

// OperationException 实现
OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       ErrorCode code,
                                       const char* file, int line)
    : SheetDriveException(operation.empty() ? message
                              : fmt::format("{} (operation: {})", message, operation),
                          code, file, line)
    , operation_(operation) {
}

// AddressParseException 实现
AddressParseException::AddressParseException(const std::string& message,
                                             const std::string& reference,
                                             const char* file, int line)
    : SheetDriveException(fmt::format("{}: '{}'", message, reference),
                          ErrorCode::InvalidCellReference, file, line)
    , reference_(reference) {
}

// SheetNotFoundException 实现
SheetNotFoundException::SheetNotFoundException(const std::string& sheet_id,
                                               const char* file, int line)
    : SheetDriveException(fmt::format("Sheet not found: '{}'", sheet_id),
                          ErrorCode::SheetNotFound, file, line)
    , sheet_id_(sheet_id) {
}

void throwError(const Error& error) {
    const std::string message = error.fullMessage().empty() ? toString(error.code) : error.fullMessage();
    switch (error.code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::FileAccessDenied:
        case ErrorCode::FileCorrupted:
        case ErrorCode::FileWriteError:
        case ErrorCode::FileReadError:
            throw FileException(message, error.context, error.code);
        case ErrorCode::InvalidCellReference:
            throw AddressParseException(error.message, error.context);
        case ErrorCode::SheetNotFound:
            throw SheetNotFoundException(error.context.empty() ? error.message : error.context);
        case ErrorCode::InvalidArgument:
            throw ParameterException(message);
        default:
            throw SheetDriveException(message, error.code);
    }
}

} // namespace core
} // namespace sheetdrive
