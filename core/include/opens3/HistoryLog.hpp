// Operation history: one record per finished object operation.
#pragma once
#include "TransferTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace opens3 {

enum class OperationKind { Upload, Download, Copy, Move, Rename, Delete, CreateFolder };

struct OperationRecord {
    std::string accountId;
    std::string bucket;
    OperationKind operation = OperationKind::Upload;
    std::string sourceKey;
    std::optional<std::string> destKey;
    std::optional<std::uint64_t> size;
    TransferStatus status = TransferStatus::Completed;
    std::optional<std::int64_t> durationMs;
    std::optional<std::string> errorMessage;
};

const char* toString(OperationKind k);

// Sink for operation records. Implementations must be callable from the queue's
// thread; a false return is reported but never affects the transfer.
class HistoryLog {
public:
    virtual ~HistoryLog() = default;
    virtual bool append(const OperationRecord& record, std::string& err) = 0;
};

} // namespace opens3
