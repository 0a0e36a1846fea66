// Transfer item store: single owner of item state for one queue.
// Every mutation goes through a transition method below; each transition is one
// locked update, so the store can be shared by the scheduler, executor threads
// and the event bridge.
#pragma once
#include "TransferTypes.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace opens3 {

class TransferStore {
public:
    // Append items as Pending, in the given order. Empty ids are assigned.
    // Fails without adding anything if an id is already known (even a removed
    // one) or repeated inside the batch.
    bool enqueue(const std::vector<TransferSpec>& specs,
                 std::vector<std::string>& ids,
                 std::string& err);

    // Oldest Pending item (copy), or nullopt.
    std::optional<TransferItem> nextPending() const;

    // Pending -> Active. Returns false (and changes nothing) otherwise.
    bool setActive(const std::string& id);

    // Active -> Completed/Failed. No-op on items that are not Active, so late or
    // duplicate engine events cannot resurrect a terminal item.
    bool setTerminal(const std::string& id, const TransferOutcome& outcome);

    // Apply an engine progress report. No-op unless Active. Both counters stay
    // monotone and bytesTransferred never exceeds a known total.
    bool updateProgress(const std::string& id,
                        std::uint64_t bytesTransferred,
                        std::uint64_t totalBytes);

    // Pending/Active -> Cancelled. Returns false if unknown or already terminal.
    // previous receives the status before the transition.
    bool cancel(const std::string& id, TransferStatus* previous = nullptr);

    // Re-enqueue a Failed or Cancelled item as a new Pending item.
    bool retry(const std::string& id, std::string& newId, std::string& err);

    // Drop Completed items. Their ids stay reserved. Returns how many were removed.
    int clearCompleted();

    // Drop one finished (completed, failed or cancelled) item. Its id stays
    // reserved. False if unknown or still pending/active.
    bool remove(const std::string& id);

    // Drop every finished item. Returns how many were removed.
    int clearAll();

    StatusCounts countByStatus() const;
    std::optional<TransferItem> find(const std::string& id) const;
    std::vector<TransferItem> items() const;
    std::vector<std::string> idsWithStatus(TransferStatus s) const;
    // Aggregate percent over all items with a known size (0..100).
    int totalProgress() const;

private:
    int indexForId(const std::string& id) const;
    std::string freshId() const;

    mutable std::mutex mtx_; // protects everything below
    std::vector<TransferItem> items_; // enqueue order
    std::unordered_set<std::string> knownIds_;
    StatusCounts counts_;
    std::uint64_t nextSequence_ = 1;
};

} // namespace opens3
