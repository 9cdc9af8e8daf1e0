#include "sheetdrive/persistence/DocumentRepository.hpp"
#include "sheetdrive/persistence/DocumentSerializer.hpp"
#include "sheetdrive/core/Exception.hpp"
#include "sheetdrive/utils/CommonUtils.hpp"
#include "sheetdrive/utils/TimeUtils.hpp"
#include "sheetdrive/utils/ModuleLoggers.hpp"

namespace sheetdrive {
namespace persistence {

DocumentRepository::DocumentRepository(std::unique_ptr<IRecordStore> store, core::DriveOptions options)
    : store_(std::move(store)), options_(std::move(options)) {
    if (!store_) {
        SHEETDRIVE_THROW(core::ParameterException, "Record store cannot be null", "store");
    }
    STORE_DEBUG("DocumentRepository created on {}", store_->getTypeName());
}

core::Result<std::string> DocumentRepository::save(core::Document& document, const std::string& display_name) {
    // 先在副本上准备元数据，写入成功后才提交到文档
    core::DocumentMetadata metadata = document.getMetadata();

    if (!display_name.empty()) {
        metadata.name = display_name;
    }
    if (metadata.name.empty()) {
        metadata.name = options_.default_document_name;
    }
    if (metadata.name.empty()) {
        core::Error error(core::ErrorCode::InvalidArgument, "Document name is required for the first save");
        STORE_DEBUG("Save failed: {}", error.fullMessage());
        return error;
    }

    if (metadata.id.empty()) {
        metadata.id = utils::CommonUtils::generateUuid();
    }
    const std::string now = utils::TimeUtils::nowISO8601();
    if (metadata.created_at.empty()) {
        metadata.created_at = now;
    }
    metadata.updated_at = now;
    if (metadata.user_id.empty()) {
        metadata.user_id = options_.user_id;
    }

    const std::string record = DocumentSerializer::serialize(document, metadata);
    auto written = store_->writeRecord(metadata.id, record);
    if (!written) {
        STORE_DEBUG("Save failed: {}", written.error().fullMessage());
        return written.error();
    }

    std::string id = metadata.id;
    document.setMetadata(std::move(metadata));
    document.markClean();

    STORE_INFO("Saved document '{}' as {}", document.getMetadata().name, id);
    return id;
}

core::Result<core::Document> DocumentRepository::load(const std::string& id) const {
    auto content = store_->readRecord(id);
    if (!content) {
        STORE_DEBUG("Load failed: {}", content.error().fullMessage());
        return content.error();
    }

    auto document = DocumentSerializer::deserialize(content.value());
    if (!document) {
        STORE_DEBUG("Load failed for {}: {}", id, document.error().fullMessage());
        return document.error();
    }

    core::Document& loaded = document.value();
    if (loaded.getMetadata().id != id) {
        STORE_WARN("Record {} carries id '{}', using the record key", id, loaded.getMetadata().id);
        core::DocumentMetadata metadata = loaded.getMetadata();
        metadata.id = id;
        loaded.setMetadata(std::move(metadata));
    }

    loaded.setFormulaPrefix(options_.formula_prefix);
    loaded.recalculateAll();
    loaded.markClean();

    STORE_INFO("Loaded document '{}' ({})", loaded.getMetadata().name, id);
    return document;
}

std::vector<core::RecordInfo> DocumentRepository::listAvailable() const {
    std::vector<core::RecordInfo> result;
    for (const auto& id : store_->listRecordIds()) {
        auto content = store_->readRecord(id);
        if (!content) {
            STORE_WARN("Skipping unreadable record {}: {}", id, content.error().fullMessage());
            continue;
        }
        auto document = DocumentSerializer::deserialize(content.value());
        if (!document) {
            STORE_WARN("Skipping corrupt record {}: {}", id, document.error().fullMessage());
            continue;
        }
        result.push_back(core::RecordInfo{id, document->getMetadata().name});
    }
    return result;
}

core::VoidResult DocumentRepository::remove(const std::string& id) {
    auto removed = store_->removeRecord(id);
    if (!removed) {
        STORE_DEBUG("Remove failed: {}", removed.error().fullMessage());
    }
    return removed;
}

}} // namespace sheetdrive::persistence
