#pragma once

#include <string>
#include <vector>
#include <cstdio>
#include <ostream>

namespace sheetdrive {
namespace core {

/**
 * @brief UTF-8路径处理类，封装文件路径操作
 *
 * 所有查询与修改操作都不抛异常，失败时返回 false 并记录调试日志。
 */
class Path {
private:
    std::string utf8_path_;

public:
    explicit Path(const std::string& path);
    explicit Path(const char* path);
    Path() = default;

    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    /**
     * @brief 拼接子路径
     */
    Path operator/(const std::string& child) const;

    /**
     * @brief 文件名（不含目录）
     */
    std::string filename() const;

    /**
     * @brief 文件名去掉扩展名
     */
    std::string stem() const;

    /**
     * @brief 扩展名（含点号），没有扩展名返回空串
     */
    std::string extension() const;

    // 文件操作
    bool exists() const;
    bool isFile() const;
    bool isDirectory() const;

    /**
     * @brief 删除文件
     * @return 是否删除成功
     */
    bool remove() const;

    /**
     * @brief 移动（重命名）文件到目标路径，目标存在时覆盖
     * @return 是否移动成功
     */
    bool moveTo(const Path& target) const;

    /**
     * @brief 递归创建目录
     * @return 目录最终存在返回 true
     */
    bool createDirectories() const;

    /**
     * @brief 列出目录下的普通文件，按文件名排序
     */
    std::vector<Path> listFiles() const;

    // 文件流操作
    FILE* openForRead(bool binary = true) const;
    FILE* openForWrite(bool binary = true) const;

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }
    bool operator<(const Path& other) const { return utf8_path_ < other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

}} // namespace sheetdrive::core
