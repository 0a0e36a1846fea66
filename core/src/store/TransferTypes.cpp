#include "opens3/TransferTypes.hpp"

namespace opens3 {

TransferSource TransferSource::memory(std::vector<std::uint8_t> data) {
    TransferSource s;
    s.kind = Kind::Memory;
    s.bytes = std::make_shared<const std::vector<std::uint8_t>>(std::move(data));
    return s;
}

TransferSource TransferSource::localFile(std::string localPath) {
    TransferSource s;
    s.kind = Kind::LocalFile;
    s.path = std::move(localPath);
    return s;
}

TransferSource TransferSource::remoteKey(std::string objectKey) {
    TransferSource s;
    s.kind = Kind::RemoteKey;
    s.key = std::move(objectKey);
    return s;
}

bool TransferItem::isTerminal() const {
    return status == TransferStatus::Completed ||
           status == TransferStatus::Failed ||
           status == TransferStatus::Cancelled;
}

int TransferItem::percent() const {
    if (totalBytes == 0) return status == TransferStatus::Completed ? 100 : 0;
    return int((bytesTransferred * 100) / totalBytes);
}

TransferOutcome TransferOutcome::completed(std::string resultPath) {
    TransferOutcome o;
    o.status = TransferStatus::Completed;
    o.resultPath = std::move(resultPath);
    return o;
}

TransferOutcome TransferOutcome::failed(TransferErrorKind kind, std::string message) {
    TransferOutcome o;
    o.status = TransferStatus::Failed;
    o.error = TransferError{kind, std::move(message)};
    return o;
}

int StatusCounts::operator[](TransferStatus s) const {
    switch (s) {
    case TransferStatus::Pending:   return pending;
    case TransferStatus::Active:    return active;
    case TransferStatus::Completed: return completed;
    case TransferStatus::Failed:    return failed;
    case TransferStatus::Cancelled: return cancelled;
    }
    return 0;
}

int& StatusCounts::operator[](TransferStatus s) {
    switch (s) {
    case TransferStatus::Pending:   return pending;
    case TransferStatus::Active:    return active;
    case TransferStatus::Completed: return completed;
    case TransferStatus::Failed:    return failed;
    case TransferStatus::Cancelled: break;
    }
    return cancelled;
}

const char* toString(TransferDirection d) {
    return d == TransferDirection::Upload ? "upload" : "download";
}

const char* toString(TransferStatus s) {
    switch (s) {
    case TransferStatus::Pending:   return "pending";
    case TransferStatus::Active:    return "active";
    case TransferStatus::Completed: return "completed";
    case TransferStatus::Failed:    return "failed";
    case TransferStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* toString(TransferErrorKind k) {
    switch (k) {
    case TransferErrorKind::DuplicateId: return "duplicate_id";
    case TransferErrorKind::Preflight:   return "preflight";
    case TransferErrorKind::Engine:      return "engine";
    }
    return "unknown";
}

} // namespace opens3
