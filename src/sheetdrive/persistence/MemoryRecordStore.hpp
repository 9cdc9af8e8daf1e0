#pragma once

#include "sheetdrive/persistence/IRecordStore.hpp"
#include <map>

namespace sheetdrive {
namespace persistence {

/**
 * @brief 进程内记录存储，用于测试与临时会话
 */
class MemoryRecordStore : public IRecordStore {
public:
    core::VoidResult writeRecord(const std::string& id, const std::string& content) override {
        if (id.empty()) {
            return core::Error(core::ErrorCode::InvalidArgument, "Invalid record id", id);
        }
        records_[id] = content;
        return {};
    }

    core::Result<std::string> readRecord(const std::string& id) const override {
        auto it = records_.find(id);
        if (it == records_.end()) {
            return core::Error(core::ErrorCode::FileNotFound, "Record not found", id);
        }
        return it->second;
    }

    std::vector<std::string> listRecordIds() const override {
        std::vector<std::string> ids;
        ids.reserve(records_.size());
        for (const auto& entry : records_) {
            ids.push_back(entry.first);
        }
        return ids;
    }

    core::VoidResult removeRecord(const std::string& id) override {
        if (records_.erase(id) == 0) {
            return core::Error(core::ErrorCode::FileNotFound, "Record not found", id);
        }
        return {};
    }

    std::string getTypeName() const override { return "MemoryRecordStore"; }

    size_t size() const { return records_.size(); }

private:
    std::map<std::string, std::string> records_;
};

}} // namespace sheetdrive::persistence
