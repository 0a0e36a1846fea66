// Storage engine backed by a local directory: object <bucket>/<key> lives at
// <root>/<bucket>/<key>. Useful for dry runs and integration tests against a
// real filesystem.
#pragma once
#include "TransferEngine.hpp"
#include <mutex>
#include <string>
#include <unordered_set>

namespace opens3 {

class LocalDirTransferEngine : public TransferEngine {
public:
    explicit LocalDirTransferEngine(std::string root);

    bool transfer(const TransferRequest& req,
                  std::string& err,
                  std::function<bool()> shouldCancel = {}) override;

    // Ids that are not in flight are ignored.
    void cancel(const std::string& id) override;

    bool isInFlight(const std::string& id) const;

    const std::string& root() const { return root_; }
    std::string objectPath(const std::string& bucket, const std::string& key) const;

private:
    bool upload(const TransferRequest& req, std::string& err, const std::function<bool()>& stop);
    bool download(const TransferRequest& req, std::string& err, const std::function<bool()>& stop);
    bool downloadPrefix(const TransferRequest& req, std::string& err, const std::function<bool()>& stop);
    // Streams src into dst in chunks. Returns false with err on I/O error or stop.
    bool copyFile(const std::string& src, const std::string& dst, std::string& err,
                  const std::function<bool()>& stop,
                  const std::function<void(std::uint64_t, std::uint64_t)>& progress);

    std::string root_;
    mutable std::mutex mtx_;
    std::unordered_set<std::string> inFlight_;
    std::unordered_set<std::string> cancelled_; // subset of inFlight_
};

} // namespace opens3
