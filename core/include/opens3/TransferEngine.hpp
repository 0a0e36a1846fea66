// Abstract interface for the storage engine that moves the bytes. Concrete
// engines (S3 SDK bindings, the local-directory engine, the mock) implement it so
// the queue stays decoupled from the backend.
#pragma once
#include "TransferTypes.hpp"
#include <atomic>
#include <functional>
#include <string>

namespace opens3 {

// Fully resolved transfer handed to the engine.
struct TransferRequest {
    std::string id;
    TransferDirection direction = TransferDirection::Upload;
    std::string accountId;
    std::string bucket;
    std::string localPath;   // upload: file to read; download: destination directory
    std::string key;         // upload: target key; download: source key or prefix
    std::string fileName;
    std::string contentType; // empty: let the engine detect it
    bool aggregate = false;
};

// Notification channel of the engine. Calls may arrive on any thread.
class TransferEventSink {
public:
    virtual ~TransferEventSink() = default;

    virtual void onProgress(TransferDirection dir,
                            const std::string& id,
                            std::uint64_t bytesTransferred,
                            std::uint64_t totalBytes) = 0;

    virtual void onCompleted(TransferDirection dir,
                             const std::string& id,
                             const std::string& resultPath) = 0;

    virtual void onFailed(TransferDirection dir,
                          const std::string& id,
                          const std::string& error) = 0;
};

class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    // One sink for the process lifetime; nullptr detaches.
    void setEventSink(TransferEventSink* sink) { sink_.store(sink); }

    // Run one transfer. Progress and exactly one terminal event are published on
    // the sink, tagged with req.id. Returns false with err only when the request
    // is rejected before any engine-side work started (no event is published
    // then). May block until the engine no longer needs the local file.
    virtual bool transfer(const TransferRequest& req,
                          std::string& err,
                          std::function<bool()> shouldCancel = {}) = 0;

    // Best-effort cancellation of an in-flight transfer.
    virtual void cancel(const std::string& id) = 0;

protected:
    void publishProgress(TransferDirection dir, const std::string& id,
                         std::uint64_t done, std::uint64_t total) {
        if (auto* s = sink_.load()) s->onProgress(dir, id, done, total);
    }
    void publishCompleted(TransferDirection dir, const std::string& id, const std::string& path) {
        if (auto* s = sink_.load()) s->onCompleted(dir, id, path);
    }
    void publishFailed(TransferDirection dir, const std::string& id, const std::string& error) {
        if (auto* s = sink_.load()) s->onFailed(dir, id, error);
    }

private:
    std::atomic<TransferEventSink*> sink_{nullptr};
};

} // namespace opens3
