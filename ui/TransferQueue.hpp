// Transfer queue for one direction: FIFO admission up to maxConcurrent, one
// worker thread per active item, cooperative cancellation.
#pragma once
#include <QObject>
#include <QString>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "opens3/AdmissionController.hpp"
#include "opens3/CancellationToken.hpp"
#include "opens3/TransferExecutor.hpp"
#include "opens3/TransferStore.hpp"

namespace opens3 {
class AuditEmitter;
class LocalFileSystem;
class TransferEngine;
}

class TransferQueue : public QObject {
    Q_OBJECT
public:
    // engine, fs and audit are not owned and must outlive the queue.
    TransferQueue(opens3::TransferDirection direction,
                  int maxConcurrent,
                  opens3::TransferEngine& engine,
                  opens3::LocalFileSystem& fs,
                  opens3::AuditEmitter& audit,
                  QObject* parent = nullptr);
    ~TransferQueue();

    opens3::TransferDirection direction() const { return direction_; }
    int maxConcurrent() const { return admission_.budget(); }
    const opens3::TransferStore& store() const { return store_; }

    // All methods below must be called from the queue's thread.

    // Append items (direction is forced to this queue's). Fails on duplicate id.
    bool enqueue(std::vector<opens3::TransferSpec> specs,
                 std::vector<std::string>& ids,
                 std::string& err);
    // Cancel a pending or active item. False if unknown or already finished.
    bool cancelTask(const std::string& id);
    // Cancel every pending and active item
    void cancelAll();
    bool retryTask(const std::string& id, std::string& newId, std::string& err);
    int clearCompleted();
    // Drop one finished item from the list
    bool removeTask(const std::string& id);
    // Cancel whatever is still running, then drop every item
    int clearAll();
    bool contains(const std::string& id) const { return store_.find(id).has_value(); }

    // Engine notifications, delivered on the queue's thread by the event bridge.
    void handleProgress(const std::string& id, std::uint64_t done, std::uint64_t total);
    void handleCompleted(const std::string& id, const std::string& resultPath);
    void handleFailed(const std::string& id, const std::string& error);

signals:
    // Emitted when the item list/state changes (to refresh the UI)
    void tasksChanged();
    // Emitted once per item when it reaches a terminal state
    void transferFinished(const QString& id);

public slots:
    // Admit pending items while the budget allows. Reentrant calls are dropped.
    void schedule();

private:
    void dispatch(const opens3::TransferItem& item);
    void onWorkerFinished(const std::string& id, opens3::ExecutionResult result);
    void finishItem(const std::string& id);
    void applyOutcome(const std::string& id, const opens3::TransferOutcome& outcome);
    std::shared_ptr<opens3::CancellationToken> tokenFor(const std::string& id) const;

    const opens3::TransferDirection direction_;
    opens3::TransferEngine& engine_;
    opens3::AuditEmitter& audit_;
    opens3::TransferStore store_;
    opens3::AdmissionController admission_;
    opens3::TransferExecutor executor_;
    bool draining_ = false;
    // Engine outcomes received while the item's worker was still running
    std::unordered_map<std::string, opens3::TransferOutcome> deferred_;

    // Worker threads and cancellation tokens per active id
    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::thread> workers_;
    std::unordered_map<std::string, std::shared_ptr<opens3::CancellationToken>> tokens_;
};
