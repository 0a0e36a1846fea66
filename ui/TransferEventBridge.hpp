// Single subscriber of the engine's notification channel. Engine threads call
// the sink methods; the bridge hops to its own thread and forwards each event to
// the queue of the matching direction.
#pragma once
#include <QObject>
#include <QPointer>
#include "opens3/TransferEngine.hpp"

class TransferQueue;

class TransferEventBridge : public QObject, public opens3::TransferEventSink {
    Q_OBJECT
public:
    explicit TransferEventBridge(QObject* parent = nullptr);

    // Route events of direction dir to queue (not owned).
    void attach(opens3::TransferDirection dir, TransferQueue* queue);

    void onProgress(opens3::TransferDirection dir,
                    const std::string& id,
                    std::uint64_t bytesTransferred,
                    std::uint64_t totalBytes) override;

    void onCompleted(opens3::TransferDirection dir,
                     const std::string& id,
                     const std::string& resultPath) override;

    void onFailed(opens3::TransferDirection dir,
                  const std::string& id,
                  const std::string& error) override;

private:
    TransferQueue* queueFor(opens3::TransferDirection dir) const;

    QPointer<TransferQueue> uploads_;
    QPointer<TransferQueue> downloads_;
};
