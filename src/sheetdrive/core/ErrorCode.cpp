#include "sheetdrive/core/ErrorCode.hpp"

namespace sheetdrive {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InternalError:
            return "Internal error";

        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileAccessDenied:
            return "File access denied";
        case ErrorCode::FileCorrupted:
            return "File corrupted";
        case ErrorCode::FileWriteError:
            return "File write error";
        case ErrorCode::FileReadError:
            return "File read error";

        case ErrorCode::InvalidDocument:
            return "Invalid document";
        case ErrorCode::SheetNotFound:
            return "Sheet not found";
        case ErrorCode::InvalidCellReference:
            return "Invalid cell reference";
        case ErrorCode::InvalidFormula:
            return "Invalid formula";

        case ErrorCode::XmlParseError:
            return "XML parse error";
        case ErrorCode::XmlMissingElement:
            return "Missing XML element";

        default:
            return "Unknown error";
    }
}

}} // namespace sheetdrive::core
