// Executor: staging of in-memory uploads, request resolution and the engine call.
#include "opens3/TransferExecutor.hpp"
#include "opens3/Log.hpp"

namespace opens3 {

StagedFile::~StagedFile() {
    if (path_.empty()) return;
    std::string err;
    if (!fs_.remove(path_, err)) LOGW("staging: could not remove %s: %s", path_.c_str(), err.c_str());
}

bool StagedFile::create(const std::string& path, const std::vector<std::uint8_t>& bytes, std::string& err) {
    if (!fs_.write(path, bytes, err)) {
        // A partial file may exist; try to drop it but report the write error.
        std::string rmErr;
        fs_.remove(path, rmErr);
        return false;
    }
    path_ = path;
    return true;
}

std::string TransferExecutor::stagingPath(const TransferItem& item) const {
    std::string name = item.spec.fileName.empty() ? std::string("upload") : item.spec.fileName;
    for (char& c : name)
        if (c == '/' || c == '\\') c = '_';
    return fs_.tempDirectory() + "/opens3-" + item.id() + "_" + name;
}

ExecutionResult TransferExecutor::failPreflight(const std::string& id, const std::string& err) {
    LOGE("transfer %s: preflight failed: %s", id.c_str(), err.c_str());
    if (store_.setTerminal(id, TransferOutcome::failed(TransferErrorKind::Preflight, err)))
        return ExecutionResult::PreflightFailed;
    // Already terminal: cancelled meanwhile, or the engine reported it first.
    return ExecutionResult::Skipped;
}

bool TransferExecutor::buildRequest(const TransferItem& item, StagedFile& staged,
                                    TransferRequest& req, std::string& err) {
    const auto& spec = item.spec;
    req.id = spec.id;
    req.direction = spec.direction;
    req.accountId = spec.accountId;
    req.bucket = spec.bucket;
    req.fileName = spec.fileName;
    req.aggregate = spec.aggregate;

    if (spec.direction == TransferDirection::Upload) {
        if (spec.destination.empty()) {
            err = "Missing destination key";
            return false;
        }
        req.key = spec.destination;
        switch (spec.source.kind) {
        case TransferSource::Kind::LocalFile:
            // Native file path: upload in place, let the engine detect the type.
            req.localPath = spec.source.path;
            return true;
        case TransferSource::Kind::Memory:
            if (!spec.source.bytes) break;
            if (!staged.create(stagingPath(item), *spec.source.bytes, err)) return false;
            req.localPath = staged.path();
            req.contentType = spec.contentType;
            LOGI("transfer %s: staged %zu bytes at %s", spec.id.c_str(),
                 spec.source.bytes->size(), req.localPath.c_str());
            return true;
        default:
            break;
        }
        err = "No file or file path provided";
        return false;
    }

    if (spec.source.kind != TransferSource::Kind::RemoteKey || spec.source.key.empty()) {
        err = "No object key provided";
        return false;
    }
    if (spec.destination.empty()) {
        err = "No destination directory";
        return false;
    }
    req.key = spec.source.key;
    req.localPath = spec.destination;
    return true;
}

ExecutionResult TransferExecutor::run(const TransferItem& item, const CancellationToken& token) {
    const std::string& id = item.id();
    if (token.isCancelled()) return ExecutionResult::Skipped;

    StagedFile staged(fs_);
    TransferRequest req;
    std::string err;
    if (!buildRequest(item, staged, req, err)) return failPreflight(id, err);

    // Staging may have taken a while.
    if (token.isCancelled()) return ExecutionResult::Skipped;

    LOGI("transfer %s: %s %s", id.c_str(), toString(req.direction), req.key.c_str());
    const bool ok = engine_.transfer(req, err, [&token]() { return token.isCancelled(); });
    if (!ok) {
        if (token.isCancelled()) return ExecutionResult::Skipped;
        return failPreflight(id, err);
    }
    return token.isCancelled() ? ExecutionResult::Skipped : ExecutionResult::Dispatched;
}

} // namespace opens3
