/**
 * @file FileWrapper.hpp
 * @brief RAII文件句柄包装器，提供异常安全的文件管理
 */

#pragma once

#include <memory>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>
#include "sheetdrive/core/Exception.hpp"
#include "sheetdrive/core/Path.hpp"

namespace sheetdrive {
namespace utils {

/**
 * @brief RAII文件句柄包装器
 *
 * 提供异常安全的文件资源管理，自动关闭文件句柄。
 * 写入场景应显式调用 close()，以便发现延迟到关闭时才暴露的写入错误。
 */
class FileWrapper {
public:
    /**
     * @brief 构造函数，打开文件
     * @param filename 文件名
     * @param mode 文件打开模式，"w"/"wb" 为写入，其余按读取处理
     * @throws FileException 文件打开失败时
     */
    FileWrapper(const std::string& filename, const char* mode)
        : filename_(filename) {
        core::Path path(filename);
        FILE* raw_file = nullptr;
        const bool for_write = std::strcmp(mode, "w") == 0 || std::strcmp(mode, "wb") == 0;
        if (for_write) {
            raw_file = path.openForWrite(true);
        } else {
            raw_file = path.openForRead(true);
        }

        if (!raw_file) {
            throw core::FileException(
                "Failed to open file", filename,
                for_write ? core::ErrorCode::FileWriteError : core::ErrorCode::FileNotFound,
                __FILE__, __LINE__);
        }
        file_.reset(raw_file);
    }

    FileWrapper(FileWrapper&& other) noexcept = default;
    FileWrapper& operator=(FileWrapper&& other) noexcept = default;

    FileWrapper(const FileWrapper&) = delete;
    FileWrapper& operator=(const FileWrapper&) = delete;

    FILE* get() const noexcept {
        return file_.get();
    }

    explicit operator bool() const noexcept {
        return file_ != nullptr;
    }

    /**
     * @brief 读取剩余的全部内容
     * @throws FileException 读取失败
     */
    std::string readAll() {
        std::string content;
        char buffer[8192];
        size_t n = 0;
        while ((n = std::fread(buffer, 1, sizeof(buffer), file_.get())) > 0) {
            content.append(buffer, n);
        }
        if (std::ferror(file_.get())) {
            throw core::FileException("Failed to read file", filename_,
                                      core::ErrorCode::FileReadError, __FILE__, __LINE__);
        }
        return content;
    }

    /**
     * @brief 写入全部数据
     * @throws FileException 写入不完整
     */
    void writeAll(std::string_view data) {
        if (data.empty()) return;
        size_t written = std::fwrite(data.data(), 1, data.size(), file_.get());
        if (written != data.size()) {
            throw core::FileException("Failed to write data to file", filename_,
                                      core::ErrorCode::FileWriteError, __FILE__, __LINE__);
        }
    }

    /**
     * @brief 刷新并关闭文件
     * @throws FileException 刷新或关闭失败
     */
    void close() {
        if (!file_) return;
        FILE* raw = file_.release();
        const bool flushed = std::fflush(raw) == 0;
        const bool closed = std::fclose(raw) == 0;
        if (!flushed || !closed) {
            throw core::FileException("Failed to close file", filename_,
                                      core::ErrorCode::FileWriteError, __FILE__, __LINE__);
        }
    }

    const std::string& filename() const { return filename_; }

private:
    struct FileCloser {
        void operator()(FILE* f) const noexcept {
            if (f) std::fclose(f);
        }
    };

    std::unique_ptr<FILE, FileCloser> file_;
    std::string filename_;
};

}} // namespace sheetdrive::utils
