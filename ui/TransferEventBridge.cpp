#include "TransferEventBridge.hpp"
#include "TransferQueue.hpp"
#include "opens3/Log.hpp"
#include <QMetaObject>

TransferEventBridge::TransferEventBridge(QObject* parent) : QObject(parent) {}

void TransferEventBridge::attach(opens3::TransferDirection dir, TransferQueue* queue) {
    if (dir == opens3::TransferDirection::Upload) uploads_ = queue;
    else downloads_ = queue;
}

TransferQueue* TransferEventBridge::queueFor(opens3::TransferDirection dir) const {
    return dir == opens3::TransferDirection::Upload ? uploads_.data() : downloads_.data();
}

// Each handler is queued even when called from the bridge's own thread, so
// events are applied in emission order and never inside an engine call.

void TransferEventBridge::onProgress(opens3::TransferDirection dir,
                                     const std::string& id,
                                     std::uint64_t bytesTransferred,
                                     std::uint64_t totalBytes) {
    QMetaObject::invokeMethod(this, [this, dir, id, bytesTransferred, totalBytes]() {
        if (auto* q = queueFor(dir)) q->handleProgress(id, bytesTransferred, totalBytes);
    }, Qt::QueuedConnection);
}

void TransferEventBridge::onCompleted(opens3::TransferDirection dir,
                                      const std::string& id,
                                      const std::string& resultPath) {
    QMetaObject::invokeMethod(this, [this, dir, id, resultPath]() {
        if (auto* q = queueFor(dir)) q->handleCompleted(id, resultPath);
        else LOGW("bridge: no %s queue for completed %s", opens3::toString(dir), id.c_str());
    }, Qt::QueuedConnection);
}

void TransferEventBridge::onFailed(opens3::TransferDirection dir,
                                   const std::string& id,
                                   const std::string& error) {
    QMetaObject::invokeMethod(this, [this, dir, id, error]() {
        if (auto* q = queueFor(dir)) q->handleFailed(id, error);
        else LOGW("bridge: no %s queue for failed %s", opens3::toString(dir), id.c_str());
    }, Qt::QueuedConnection);
}
