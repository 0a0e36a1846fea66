#include "opens3/AuditEmitter.hpp"
#include "opens3/Log.hpp"
#include <chrono>
#include <exception>

namespace opens3 {

const char* toString(OperationKind k) {
    switch (k) {
    case OperationKind::Upload:       return "upload";
    case OperationKind::Download:     return "download";
    case OperationKind::Copy:         return "copy";
    case OperationKind::Move:         return "move";
    case OperationKind::Rename:       return "rename";
    case OperationKind::Delete:       return "delete";
    case OperationKind::CreateFolder: return "create_folder";
    }
    return "unknown";
}

OperationRecord AuditEmitter::makeRecord(const TransferItem& item) {
    OperationRecord r;
    r.accountId = item.spec.accountId;
    r.bucket = item.spec.bucket;
    if (item.spec.direction == TransferDirection::Upload) {
        r.operation = OperationKind::Upload;
        r.sourceKey = item.spec.destination;
    } else {
        r.operation = OperationKind::Download;
        r.sourceKey = item.spec.source.key;
    }
    if (item.totalBytes > 0) r.size = item.totalBytes;
    else if (item.bytesTransferred > 0) r.size = item.bytesTransferred;
    r.status = item.status;
    if (item.startedAt && item.finishedAt) {
        r.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                           *item.finishedAt - *item.startedAt).count();
    }
    if (item.status == TransferStatus::Failed && item.error) r.errorMessage = item.error->message;
    return r;
}

void AuditEmitter::record(const TransferItem& item) {
    if (!log_ || !item.isTerminal()) return;
    const OperationRecord r = makeRecord(item);
    std::string err;
    try {
        if (!log_->append(r, err)) {
            LOGW("history: could not log %s of '%s': %s",
                 toString(r.operation), r.sourceKey.c_str(), err.c_str());
        }
    } catch (const std::exception& e) {
        LOGE("history: append threw for '%s': %s", r.sourceKey.c_str(), e.what());
    }
}

} // namespace opens3
