// Turns terminal transfer items into history records. Best effort: a failing
// history log is logged and otherwise ignored.
#pragma once
#include "HistoryLog.hpp"
#include "TransferTypes.hpp"

namespace opens3 {

class AuditEmitter {
public:
    // log may be null (auditing disabled); it is not owned.
    explicit AuditEmitter(HistoryLog* log = nullptr) : log_(log) {}

    void setLog(HistoryLog* log) { log_ = log; }

    // Append the record for a terminal item. Non-terminal items are ignored.
    void record(const TransferItem& item);

    static OperationRecord makeRecord(const TransferItem& item);

private:
    HistoryLog* log_ = nullptr;
};

} // namespace opens3
