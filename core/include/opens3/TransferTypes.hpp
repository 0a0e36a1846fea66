// Basic types shared between the queue core and the UI for transfer items.
// Kept as plain structures so the UI can copy snapshots out of the store freely.
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace opens3 {

using TimePoint = std::chrono::system_clock::time_point;

enum class TransferDirection { Upload, Download };

// Item state:
//  - Pending: in queue, waiting for a free slot
//  - Active: admitted, executor running or engine working
//  - Completed: engine reported success
//  - Failed: engine or local (preflight) error
//  - Cancelled: cancelled by the user
enum class TransferStatus { Pending, Active, Completed, Failed, Cancelled };

enum class TransferErrorKind {
    DuplicateId, // enqueue collision
    Preflight,   // staging I/O, invalid request, synchronous engine rejection
    Engine       // reported asynchronously by the engine
};

struct TransferError {
    TransferErrorKind kind = TransferErrorKind::Engine;
    std::string message;
};

// Where the bytes of a transfer come from. Exactly one member is meaningful,
// selected by kind.
struct TransferSource {
    enum class Kind { None, Memory, LocalFile, RemoteKey } kind = Kind::None;
    std::shared_ptr<const std::vector<std::uint8_t>> bytes; // Memory
    std::string path;                                       // LocalFile
    std::string key;                                        // RemoteKey (or prefix for aggregates)

    static TransferSource memory(std::vector<std::uint8_t> data);
    static TransferSource localFile(std::string localPath);
    static TransferSource remoteKey(std::string objectKey);
};

// What the caller asks for. An empty id lets the store assign one.
struct TransferSpec {
    std::string id;
    TransferDirection direction = TransferDirection::Upload;
    std::string accountId;
    std::string bucket;
    TransferSource source;
    std::string destination;   // object key (upload) or local directory (download)
    std::string fileName;      // display name / staging name / archive name
    std::string contentType;   // optional, in-memory uploads only
    std::uint64_t totalBytes = 0;
    bool aggregate = false;    // prefix downloaded as a single archive
};

struct TransferItem {
    TransferSpec spec;
    TransferStatus status = TransferStatus::Pending;
    std::uint64_t bytesTransferred = 0;
    std::uint64_t totalBytes = 0;
    std::optional<TransferError> error; // present iff status == Failed
    std::string resultPath;             // local path of a completed download
    std::uint64_t sequence = 0;         // enqueue order, strictly increasing
    TimePoint enqueuedAt{};
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> finishedAt;

    const std::string& id() const { return spec.id; }
    bool isTerminal() const;
    int percent() const; // 0..100, 0 while the total is unknown
};

// Result of an active transfer as applied by setTerminal.
struct TransferOutcome {
    TransferStatus status = TransferStatus::Completed;
    std::optional<TransferError> error;
    std::string resultPath;

    static TransferOutcome completed(std::string resultPath = {});
    static TransferOutcome failed(TransferErrorKind kind, std::string message);
};

struct StatusCounts {
    int pending = 0;
    int active = 0;
    int completed = 0;
    int failed = 0;
    int cancelled = 0;

    int total() const { return pending + active + completed + failed + cancelled; }
    int operator[](TransferStatus s) const;
    int& operator[](TransferStatus s);
};

const char* toString(TransferDirection d);
const char* toString(TransferStatus s);
const char* toString(TransferErrorKind k);

} // namespace opens3
