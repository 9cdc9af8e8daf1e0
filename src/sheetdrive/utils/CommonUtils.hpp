#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <system_error>
#include <random>
#include <cstdint>
#include <fmt/format.h>
#include <fast_float/fast_float.h>

namespace sheetdrive {
namespace utils {

/**
 * @brief 通用工具类 - 提供常用的字符串与数值辅助函数
 */
class CommonUtils {
public:
    // ========== 字符串工具 ==========

    static constexpr const char* kWhitespace = " \t\n\r\f\v";

    /**
     * @brief 去除首尾空白
     */
    static std::string_view trim(std::string_view text) {
        size_t start = text.find_first_not_of(kWhitespace);
        if (start == std::string_view::npos) {
            return std::string_view{};
        }
        size_t end = text.find_last_not_of(kWhitespace);
        return text.substr(start, end - start + 1);
    }

    /**
     * @brief 按分隔符切分，保留空段
     */
    static std::vector<std::string_view> split(std::string_view text, char delimiter) {
        std::vector<std::string_view> parts;
        size_t start = 0;
        while (true) {
            size_t pos = text.find(delimiter, start);
            if (pos == std::string_view::npos) {
                parts.push_back(text.substr(start));
                break;
            }
            parts.push_back(text.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }

    static bool startsWith(std::string_view text, std::string_view prefix) {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }

    // ========== 数值工具 ==========

    /**
     * @brief 把单元格文本解析为浮点数
     *
     * 允许首尾空白、正负号、小数点、指数以及 inf/nan，整个文本必须被完全消耗。
     * @return 解析失败返回 std::nullopt
     */
    static std::optional<double> parseDouble(std::string_view text) {
        std::string_view body = trim(text);
        if (body.empty()) {
            return std::nullopt;
        }

        // fast_float 默认不接受前导 '+'
        if (body.front() == '+') {
            body.remove_prefix(1);
            if (body.empty() || body.front() == '+' || body.front() == '-') {
                return std::nullopt;
            }
        }

        double value = 0.0;
        auto result = fast_float::from_chars(body.data(), body.data() + body.size(), value);
        if (result.ec != std::errc{} || result.ptr != body.data() + body.size()) {
            return std::nullopt;
        }
        return value;
    }

    // ========== Base64 ==========

    static constexpr const char* kBase64Alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    /**
     * @brief 标准 Base64 编码（带 '=' 填充），按字节处理，任意二进制内容均可
     */
    static std::string base64Encode(std::string_view input) {
        std::string out;
        out.reserve((input.size() + 2) / 3 * 4);
        int val = 0;
        int valb = -6;
        for (unsigned char c : input) {
            val = ((val << 8) + c) & 0xFFFFFF;
            valb += 8;
            while (valb >= 0) {
                out.push_back(kBase64Alphabet[(val >> valb) & 0x3F]);
                valb -= 6;
            }
        }
        if (valb > -6) {
            out.push_back(kBase64Alphabet[(val << -valb) & 0x3F]);
        }
        while (out.size() % 4) {
            out.push_back('=');
        }
        return out;
    }

    /**
     * @brief 严格 Base64 解码
     * @return 长度不是4的倍数、出现字母表外字符或填充位置错误时返回 std::nullopt
     */
    static std::optional<std::string> base64Decode(std::string_view input) {
        if (input.size() % 4 != 0) {
            return std::nullopt;
        }
        size_t padding = 0;
        while (padding < 2 && padding < input.size() && input[input.size() - 1 - padding] == '=') {
            ++padding;
        }
        const std::string_view body = input.substr(0, input.size() - padding);

        std::string out;
        out.reserve(input.size() / 4 * 3);
        int val = 0;
        int valb = -8;
        for (char c : body) {
            const char* pos = std::char_traits<char>::find(kBase64Alphabet, 64, c);
            if (!pos) {
                return std::nullopt;
            }
            val = ((val << 6) + static_cast<int>(pos - kBase64Alphabet)) & 0xFFFFFF;
            valb += 6;
            if (valb >= 0) {
                out.push_back(static_cast<char>((val >> valb) & 0xFF));
                valb -= 8;
            }
        }
        // 剩余位必须为零，拒绝非规范编码
        if (valb > -8 && (val & ((1 << (valb + 8)) - 1)) != 0) {
            return std::nullopt;
        }
        return out;
    }

    // ========== 标识符 ==========

    /**
     * @brief 生成随机 UUID v4 文本，如 "3f2b8c1e-9a4d-4e7f-b2c1-0d9e8f7a6b5c"
     */
    static std::string generateUuid() {
        static thread_local std::mt19937_64 engine{std::random_device{}()};
        uint64_t high = engine();
        uint64_t low = engine();

        // version 4 与 RFC 4122 variant 位
        high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

        return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                           static_cast<uint32_t>(high >> 32),
                           static_cast<uint32_t>((high >> 16) & 0xFFFF),
                           static_cast<uint32_t>(high & 0xFFFF),
                           static_cast<uint32_t>(low >> 48),
                           low & 0xFFFFFFFFFFFFULL);
    }
};

}} // namespace sheetdrive::utils
