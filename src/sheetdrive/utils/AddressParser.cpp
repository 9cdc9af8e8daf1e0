#include "AddressParser.hpp"
#include "sheetdrive/core/Exception.hpp"
#include <limits>

namespace sheetdrive {
namespace utils {

namespace {

constexpr int kMaxInt = std::numeric_limits<int>::max();

core::Error invalidReference(std::string_view text, const char* reason) {
    return core::Error(core::ErrorCode::InvalidCellReference,
                       fmt::format("Invalid cell reference ({})", reason),
                       std::string(text));
}

} // namespace

std::string AddressParser::encodeColumn(int index) {
    if (index < 0) {
        SHEETDRIVE_THROW(core::ParameterException, "Column index cannot be negative", "index");
    }

    std::string result;
    // 使用 long long 避免 index + 1 在 INT_MAX 处溢出
    long long n = static_cast<long long>(index) + 1;
    while (n > 0) {
        --n;
        result.insert(result.begin(), static_cast<char>('A' + (n % 26)));
        n /= 26;
    }
    return result;
}

int AddressParser::decodeColumn(std::string_view letters) {
    if (letters.empty()) {
        SHEETDRIVE_THROW(core::AddressParseException, "Empty column letters", std::string(letters));
    }

    long long result = 0;
    for (char c : letters) {
        if (!isUpper(c)) {
            SHEETDRIVE_THROW(core::AddressParseException, "Invalid column letter", std::string(letters));
        }
        result = result * 26 + (c - 'A' + 1);
        if (result - 1 > kMaxInt) {
            SHEETDRIVE_THROW(core::AddressParseException, "Column out of range", std::string(letters));
        }
    }
    return static_cast<int>(result - 1);
}

std::string AddressParser::toReference(int row, int col) {
    if (row < 0) {
        SHEETDRIVE_THROW(core::ParameterException, "Row index cannot be negative", "row");
    }
    if (row == kMaxInt) {
        SHEETDRIVE_THROW(core::ParameterException, "Row index out of range", "row");
    }
    return encodeColumn(col) + std::to_string(row + 1);
}

AddressParser::Position AddressParser::parseReference(std::string_view text) {
    return tryParseReference(text).valueOrThrow();
}

core::Result<AddressParser::Position> AddressParser::tryParseReference(std::string_view text) {
    if (text.empty()) {
        return invalidReference(text, "empty");
    }

    size_t i = 0;
    long long col = 0;
    while (i < text.size() && isUpper(text[i])) {
        col = col * 26 + (text[i] - 'A' + 1);
        if (col - 1 > kMaxInt) {
            return invalidReference(text, "column out of range");
        }
        ++i;
    }
    if (i == 0) {
        return invalidReference(text, "missing column letters");
    }

    const size_t digits_begin = i;
    long long row = 0;
    while (i < text.size() && isDigit(text[i])) {
        row = row * 10 + (text[i] - '0');
        if (row > kMaxInt) {
            return invalidReference(text, "row out of range");
        }
        ++i;
    }
    if (i == digits_begin) {
        return invalidReference(text, "missing row number");
    }
    if (i != text.size()) {
        return invalidReference(text, "trailing characters");
    }
    if (row == 0) {
        return invalidReference(text, "row number must be positive");
    }

    return Position(static_cast<int>(row - 1), static_cast<int>(col - 1));
}

}} // namespace sheetdrive::utils
