// Store implementation: linear vector in enqueue order plus incremental counters.
#include "opens3/TransferStore.hpp"
#include <algorithm>
#include <cstdio>
#include <random>

namespace opens3 {

namespace {

// Random UUID (version 4 layout) used for ids the caller did not supply.
std::string randomUuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uint64_t hi = rng();
    std::uint64_t lo = rng();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  unsigned(hi >> 32), unsigned((hi >> 16) & 0xFFFF), unsigned(hi & 0xFFFF),
                  unsigned(lo >> 48), (unsigned long long)(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

} // namespace

std::string TransferStore::freshId() const {
    std::string id = randomUuid();
    while (knownIds_.count(id)) id = randomUuid();
    return id;
}

int TransferStore::indexForId(const std::string& id) const {
    for (std::size_t i = 0; i < items_.size(); ++i)
        if (items_[i].spec.id == id) return int(i);
    return -1;
}

bool TransferStore::enqueue(const std::vector<TransferSpec>& specs,
                            std::vector<std::string>& ids,
                            std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);

    // Validate the whole batch first: nothing is added on collision.
    std::unordered_set<std::string> batch;
    for (const auto& s : specs) {
        if (s.id.empty()) continue;
        if (knownIds_.count(s.id) || !batch.insert(s.id).second) {
            err = "Duplicate transfer id: " + s.id;
            return false;
        }
    }

    const TimePoint now = std::chrono::system_clock::now();
    ids.clear();
    ids.reserve(specs.size());
    for (const auto& s : specs) {
        TransferItem t;
        t.spec = s;
        if (t.spec.id.empty()) {
            t.spec.id = freshId();
            // A generated id must not shadow a caller id later in this batch.
            while (batch.count(t.spec.id)) t.spec.id = freshId();
        }
        t.status = TransferStatus::Pending;
        t.totalBytes = s.totalBytes;
        t.sequence = nextSequence_++;
        t.enqueuedAt = now;
        knownIds_.insert(t.spec.id);
        ids.push_back(t.spec.id);
        items_.push_back(std::move(t));
        counts_.pending += 1;
    }
    return true;
}

std::optional<TransferItem> TransferStore::nextPending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    const TransferItem* best = nullptr;
    for (const auto& t : items_) {
        if (t.status != TransferStatus::Pending) continue;
        if (!best || t.sequence < best->sequence) best = &t;
    }
    if (!best) return std::nullopt;
    return *best;
}

bool TransferStore::setActive(const std::string& id) {
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0 || items_[i].status != TransferStatus::Pending) return false;
    items_[i].status = TransferStatus::Active;
    items_[i].startedAt = std::chrono::system_clock::now();
    counts_.pending -= 1;
    counts_.active += 1;
    return true;
}

bool TransferStore::setTerminal(const std::string& id, const TransferOutcome& outcome) {
    if (outcome.status != TransferStatus::Completed && outcome.status != TransferStatus::Failed)
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0 || items_[i].status != TransferStatus::Active) return false;
    auto& t = items_[i];
    t.status = outcome.status;
    t.finishedAt = std::chrono::system_clock::now();
    if (outcome.status == TransferStatus::Completed) {
        t.error.reset();
        t.resultPath = outcome.resultPath;
        if (t.totalBytes > 0) t.bytesTransferred = t.totalBytes;
    } else {
        t.error = outcome.error ? *outcome.error : TransferError{TransferErrorKind::Engine, "Unknown error"};
    }
    counts_.active -= 1;
    counts_[outcome.status] += 1;
    return true;
}

bool TransferStore::updateProgress(const std::string& id,
                                   std::uint64_t bytesTransferred,
                                   std::uint64_t totalBytes) {
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0 || items_[i].status != TransferStatus::Active) return false;
    auto& t = items_[i];
    const std::uint64_t total = std::max(t.totalBytes, totalBytes);
    std::uint64_t done = std::max(t.bytesTransferred, bytesTransferred);
    if (total > 0 && done > total) done = total;
    t.totalBytes = total;
    t.bytesTransferred = done;
    return true;
}

bool TransferStore::cancel(const std::string& id, TransferStatus* previous) {
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0) return false;
    auto& t = items_[i];
    if (previous) *previous = t.status;
    if (t.status != TransferStatus::Pending && t.status != TransferStatus::Active) return false;
    counts_[t.status] -= 1;
    counts_.cancelled += 1;
    t.status = TransferStatus::Cancelled;
    t.finishedAt = std::chrono::system_clock::now();
    return true;
}

bool TransferStore::retry(const std::string& id, std::string& newId, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0) {
        err = "Unknown transfer id: " + id;
        return false;
    }
    if (items_[i].status != TransferStatus::Failed && items_[i].status != TransferStatus::Cancelled) {
        err = "Only failed or cancelled transfers can be retried";
        return false;
    }
    TransferItem t;
    t.spec = items_[i].spec;
    t.spec.id = freshId();
    t.totalBytes = t.spec.totalBytes;
    t.sequence = nextSequence_++;
    t.enqueuedAt = std::chrono::system_clock::now();
    knownIds_.insert(t.spec.id);
    newId = t.spec.id;
    items_.push_back(std::move(t));
    counts_.pending += 1;
    return true;
}

int TransferStore::clearCompleted() {
    std::lock_guard<std::mutex> lk(mtx_);
    const auto before = items_.size();
    items_.erase(std::remove_if(items_.begin(), items_.end(),
                                [](const TransferItem& t) { return t.status == TransferStatus::Completed; }),
                 items_.end());
    const int removed = int(before - items_.size());
    counts_.completed -= removed;
    return removed;
}

bool TransferStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0 || !items_[i].isTerminal()) return false;
    counts_[items_[i].status] -= 1;
    items_.erase(items_.begin() + i);
    return true;
}

int TransferStore::clearAll() {
    std::lock_guard<std::mutex> lk(mtx_);
    int removed = 0;
    for (auto it = items_.begin(); it != items_.end();) {
        if (!it->isTerminal()) {
            ++it;
            continue;
        }
        counts_[it->status] -= 1;
        it = items_.erase(it);
        ++removed;
    }
    return removed;
}

StatusCounts TransferStore::countByStatus() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return counts_;
}

std::optional<TransferItem> TransferStore::find(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0) return std::nullopt;
    return items_[i];
}

std::vector<TransferItem> TransferStore::items() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return items_;
}

std::vector<std::string> TransferStore::idsWithStatus(TransferStatus s) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::string> out;
    for (const auto& t : items_)
        if (t.status == s) out.push_back(t.spec.id);
    return out;
}

int TransferStore::totalProgress() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::uint64_t total = 0;
    std::uint64_t done = 0;
    for (const auto& t : items_) {
        total += t.totalBytes;
        done += t.bytesTransferred;
    }
    return total > 0 ? int((done * 100) / total) : 0;
}

} // namespace opens3
