// Queue implementation: admits in FIFO order up to maxConcurrent, runs each item
// on its own worker and reconciles engine events into the store.
#include "TransferQueue.hpp"
#include "opens3/AuditEmitter.hpp"
#include "opens3/Log.hpp"
#include "opens3/TransferEngine.hpp"
#include <QMetaObject>
#include <QScopedValueRollback>

using opens3::ExecutionResult;
using opens3::TransferStatus;

TransferQueue::TransferQueue(opens3::TransferDirection direction,
                             int maxConcurrent,
                             opens3::TransferEngine& engine,
                             opens3::LocalFileSystem& fs,
                             opens3::AuditEmitter& audit,
                             QObject* parent)
    : QObject(parent),
      direction_(direction),
      engine_(engine),
      audit_(audit),
      admission_(store_, maxConcurrent),
      executor_(store_, engine, fs) {}

TransferQueue::~TransferQueue() {
    // Ask every running worker to stop, then wait for all of them
    std::vector<std::string> running;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto& kv : tokens_) {
            kv.second->cancel();
            running.push_back(kv.first);
        }
    }
    for (const auto& id : running) engine_.cancel(id);
    for (auto& kv : workers_) {
        if (kv.second.joinable()) kv.second.join();
    }
    workers_.clear();
}

bool TransferQueue::enqueue(std::vector<opens3::TransferSpec> specs,
                            std::vector<std::string>& ids,
                            std::string& err) {
    for (auto& s : specs) s.direction = direction_;
    if (!store_.enqueue(specs, ids, err)) {
        LOGE("%s queue: enqueue rejected: %s", opens3::toString(direction_), err.c_str());
        return false;
    }
    LOGI("%s queue: %zu item(s) enqueued", opens3::toString(direction_), ids.size());
    emit tasksChanged();
    schedule();
    return true;
}

void TransferQueue::schedule() {
    if (draining_) return;
    QScopedValueRollback<bool> guard(draining_, true);

    int admitted = 0;
    while (admission_.canAdmit()) {
        auto next = store_.nextPending();
        if (!next) break;
        if (!store_.setActive(next->id())) continue;
        auto active = store_.find(next->id());
        dispatch(active ? *active : *next);
        ++admitted;
    }
    if (admitted > 0) emit tasksChanged();
}

std::shared_ptr<opens3::CancellationToken> TransferQueue::tokenFor(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tokens_.find(id);
    return it == tokens_.end() ? nullptr : it->second;
}

void TransferQueue::dispatch(const opens3::TransferItem& item) {
    const std::string id = item.id();
    auto token = std::make_shared<opens3::CancellationToken>();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        tokens_[id] = token;
    }
    LOGI("%s queue: starting %s", opens3::toString(direction_), id.c_str());

    // Ids are never reused, but never leave a joinable thread behind either
    auto& slot = workers_[id];
    if (slot.joinable()) slot.join();
    slot = std::thread([this, item, token, id]() {
        const ExecutionResult result = executor_.run(item, *token);
        // Report back on the queue's thread
        QMetaObject::invokeMethod(this, [this, id, result]() { onWorkerFinished(id, result); },
                                  Qt::QueuedConnection);
    });
}

void TransferQueue::onWorkerFinished(const std::string& id, ExecutionResult result) {
    auto it = workers_.find(id);
    if (it != workers_.end()) {
        if (it->second.joinable()) it->second.join();
        workers_.erase(it);
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        tokens_.erase(id);
    }
    if (result == ExecutionResult::PreflightFailed) finishItem(id);
    auto d = deferred_.find(id);
    if (d != deferred_.end()) {
        const opens3::TransferOutcome outcome = d->second;
        deferred_.erase(d);
        applyOutcome(id, outcome);
    }
    schedule();
}

void TransferQueue::finishItem(const std::string& id) {
    if (auto item = store_.find(id)) audit_.record(*item);
    emit transferFinished(QString::fromStdString(id));
    emit tasksChanged();
}

bool TransferQueue::cancelTask(const std::string& id) {
    TransferStatus previous = TransferStatus::Pending;
    if (!store_.cancel(id, &previous)) return false;
    if (previous == TransferStatus::Active) {
        if (auto token = tokenFor(id)) token->cancel();
        engine_.cancel(id);
    }
    LOGI("%s queue: cancelled %s (was %s)", opens3::toString(direction_), id.c_str(),
         opens3::toString(previous));
    finishItem(id);
    if (previous == TransferStatus::Active) schedule();
    return true;
}

void TransferQueue::cancelAll() {
    // Pending first so that no freed slot admits an item about to be cancelled
    for (const auto& id : store_.idsWithStatus(TransferStatus::Pending)) cancelTask(id);
    for (const auto& id : store_.idsWithStatus(TransferStatus::Active)) cancelTask(id);
}

bool TransferQueue::retryTask(const std::string& id, std::string& newId, std::string& err) {
    if (!store_.retry(id, newId, err)) return false;
    emit tasksChanged();
    schedule();
    return true;
}

int TransferQueue::clearCompleted() {
    const int removed = store_.clearCompleted();
    if (removed > 0) emit tasksChanged();
    return removed;
}

bool TransferQueue::removeTask(const std::string& id) {
    if (!store_.remove(id)) return false;
    emit tasksChanged();
    return true;
}

int TransferQueue::clearAll() {
    cancelAll();
    const int removed = store_.clearAll();
    if (removed > 0) emit tasksChanged();
    return removed;
}

void TransferQueue::handleProgress(const std::string& id, std::uint64_t done, std::uint64_t total) {
    if (store_.updateProgress(id, done, total)) emit tasksChanged();
}

// The engine may report the outcome before transfer() has returned, while the
// worker still owns the staged input. Such outcomes wait for onWorkerFinished.
void TransferQueue::applyOutcome(const std::string& id, const opens3::TransferOutcome& outcome) {
    if (workers_.count(id)) {
        deferred_.emplace(id, outcome);
        return;
    }
    const bool failed = outcome.status == TransferStatus::Failed;
    if (!store_.setTerminal(id, outcome)) {
        LOGI("%s queue: ignoring %s of %s", opens3::toString(direction_),
             failed ? "failure" : "completion", id.c_str());
        return;
    }
    if (failed) {
        LOGE("%s queue: %s failed: %s", opens3::toString(direction_), id.c_str(),
             outcome.error ? outcome.error->message.c_str() : "");
    } else {
        LOGI("%s queue: completed %s", opens3::toString(direction_), id.c_str());
    }
    finishItem(id);
    schedule();
}

void TransferQueue::handleCompleted(const std::string& id, const std::string& resultPath) {
    applyOutcome(id, opens3::TransferOutcome::completed(resultPath));
}

void TransferQueue::handleFailed(const std::string& id, const std::string& error) {
    applyOutcome(id, opens3::TransferOutcome::failed(opens3::TransferErrorKind::Engine, error));
}
