// Runs one admitted item: stage input, call the engine, clean up.
// The final outcome normally arrives later through the event bridge; the
// executor only records failures it detects itself.
#pragma once
#include "CancellationToken.hpp"
#include "LocalFileSystem.hpp"
#include "TransferEngine.hpp"
#include "TransferStore.hpp"
#include <string>

namespace opens3 {

enum class ExecutionResult {
    Dispatched,      // engine ran; outcome reported through events
    PreflightFailed, // item set to Failed here, engine events not involved
    Skipped          // cancelled before or during the engine call
};

// Temporary copy of an in-memory payload. Removed when destroyed.
class StagedFile {
public:
    explicit StagedFile(LocalFileSystem& fs) : fs_(fs) {}
    ~StagedFile();
    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    bool create(const std::string& path, const std::vector<std::uint8_t>& bytes, std::string& err);
    const std::string& path() const { return path_; }

private:
    LocalFileSystem& fs_;
    std::string path_;
};

class TransferExecutor {
public:
    TransferExecutor(TransferStore& store, TransferEngine& engine, LocalFileSystem& fs)
        : store_(store), engine_(engine), fs_(fs) {}

    // Blocks for as long as the engine call does; run it off the UI thread.
    ExecutionResult run(const TransferItem& item, const CancellationToken& token);

    // Temp location used for an in-memory upload of item.
    std::string stagingPath(const TransferItem& item) const;

private:
    bool buildRequest(const TransferItem& item, StagedFile& staged,
                      TransferRequest& req, std::string& err);
    ExecutionResult failPreflight(const std::string& id, const std::string& err);

    TransferStore& store_;
    TransferEngine& engine_;
    LocalFileSystem& fs_;
};

} // namespace opens3
