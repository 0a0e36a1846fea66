// Simulated storage engine for tests without network.
// Transfers are held open until the driver completes, fails or releases them,
// which lets tests decide exactly when each engine event happens.
#pragma once
#include "TransferEngine.hpp"
#include <condition_variable>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace opens3 {

class MockTransferEngine : public TransferEngine {
public:
    bool transfer(const TransferRequest& req,
                  std::string& err,
                  std::function<bool()> shouldCancel = {}) override;

    void cancel(const std::string& id) override;

    // When false, transfer() returns right away without publishing anything.
    void setHoldTransfers(bool hold);
    // Make the next transfer() for id fail synchronously with err.
    void rejectWith(const std::string& id, const std::string& err);

    // Driver side: publish events for id. complete/fail also release it, unless
    // releaseHeld is false (the event then arrives while transfer() still runs).
    void progress(const std::string& id, std::uint64_t done, std::uint64_t total);
    void complete(const std::string& id, const std::string& resultPath = {}, bool releaseHeld = true);
    void fail(const std::string& id, const std::string& error);
    // Let a held transfer() return without publishing anything.
    void release(const std::string& id);

    std::vector<TransferRequest> requests() const;
    std::vector<std::string> startedIds() const;
    std::vector<std::string> cancelledIds() const;
    std::size_t heldCount() const;
    bool isHeld(const std::string& id) const;

private:
    TransferDirection directionOf(const std::string& id) const;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool hold_ = true;
    std::vector<TransferRequest> requests_;
    std::unordered_map<std::string, std::string> rejects_;
    std::unordered_set<std::string> held_;
    std::unordered_set<std::string> released_;
    std::vector<std::string> cancelled_;
};

} // namespace opens3
