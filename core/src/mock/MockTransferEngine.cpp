// Mock implementation: records requests and parks each transfer on a condition
// variable until the driver settles it.
#include "opens3/MockTransferEngine.hpp"
#include <chrono>

namespace opens3 {

bool MockTransferEngine::transfer(const TransferRequest& req,
                                  std::string& err,
                                  std::function<bool()> shouldCancel) {
    std::unique_lock<std::mutex> lk(mtx_);
    requests_.push_back(req);
    auto rj = rejects_.find(req.id);
    if (rj != rejects_.end()) {
        err = rj->second;
        rejects_.erase(rj);
        return false;
    }
    if (!hold_) return true;

    held_.insert(req.id);
    using namespace std::chrono_literals;
    while (!released_.count(req.id)) {
        if (shouldCancel && shouldCancel()) break;
        cv_.wait_for(lk, 10ms);
    }
    held_.erase(req.id);
    released_.erase(req.id);
    return true;
}

void MockTransferEngine::cancel(const std::string& id) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        cancelled_.push_back(id);
        released_.insert(id);
    }
    cv_.notify_all();
}

void MockTransferEngine::setHoldTransfers(bool hold) {
    std::lock_guard<std::mutex> lk(mtx_);
    hold_ = hold;
}

void MockTransferEngine::rejectWith(const std::string& id, const std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    rejects_[id] = err;
}

TransferDirection MockTransferEngine::directionOf(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& r : requests_)
        if (r.id == id) return r.direction;
    return TransferDirection::Upload;
}

void MockTransferEngine::progress(const std::string& id, std::uint64_t done, std::uint64_t total) {
    publishProgress(directionOf(id), id, done, total);
}

void MockTransferEngine::complete(const std::string& id, const std::string& resultPath, bool releaseHeld) {
    publishCompleted(directionOf(id), id, resultPath);
    if (releaseHeld) release(id);
}

void MockTransferEngine::fail(const std::string& id, const std::string& error) {
    publishFailed(directionOf(id), id, error);
    release(id);
}

void MockTransferEngine::release(const std::string& id) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        released_.insert(id);
    }
    cv_.notify_all();
}

std::vector<TransferRequest> MockTransferEngine::requests() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return requests_;
}

std::vector<std::string> MockTransferEngine::startedIds() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::string> out;
    out.reserve(requests_.size());
    for (const auto& r : requests_) out.push_back(r.id);
    return out;
}

std::vector<std::string> MockTransferEngine::cancelledIds() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return cancelled_;
}

std::size_t MockTransferEngine::heldCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return held_.size();
}

bool MockTransferEngine::isHeld(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return held_.count(id) > 0;
}

} // namespace opens3
