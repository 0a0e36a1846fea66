// Application-level transfer manager: one queue per direction sharing a single
// engine, the event bridge and the audit emitter. Holds the selected account
// and bucket used to build new items.
#pragma once
#include <QObject>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include "TransferSettings.hpp"
#include "opens3/AuditEmitter.hpp"
#include "opens3/TransferTypes.hpp"

namespace opens3 {
class HistoryLog;
class LocalFileSystem;
class TransferEngine;
}
class TransferEventBridge;
class TransferQueue;

class TransferManager : public QObject {
    Q_OBJECT
public:
    // engine, fs and history (may be null) are not owned by the manager.
    TransferManager(opens3::TransferEngine& engine,
                    opens3::LocalFileSystem& fs,
                    opens3::HistoryLog* history,
                    const TransferSettings& settings,
                    QObject* parent = nullptr);
    ~TransferManager();

    // Account context for newly queued items
    void setAccount(const QString& accountId, const QString& bucket);
    const QString& accountId() const { return accountId_; }
    const QString& bucket() const { return bucket_; }

    // Upload an in-memory payload as <keyPrefix><fileName>
    bool enqueueUploadData(const QString& fileName,
                           const QByteArray& data,
                           const QString& keyPrefix,
                           const QString& contentType,
                           QString& err,
                           QStringList* ids = nullptr);
    // Upload local files as <keyPrefix><file name>. Unreadable files are skipped.
    bool enqueueUploadFiles(const QStringList& paths,
                            const QString& keyPrefix,
                            QString& err,
                            QStringList* ids = nullptr);
    // Download objects into the configured download directory
    bool enqueueDownloads(const QStringList& keys, QString& err, QStringList* ids = nullptr);
    // Download everything under prefix as a single item
    bool enqueueFolderDownload(const QString& prefix, QString& err, QString* id = nullptr);

    bool cancel(const QString& id);
    void cancelAll();
    bool retry(const QString& id, QString& newId, QString& err);
    int clearCompleted();
    // Drop a finished item from its queue
    bool remove(const QString& id);
    // Cancel everything still running and empty both queues
    int clearAll();

    TransferQueue* uploads() const { return uploads_; }
    TransferQueue* downloads() const { return downloads_; }
    const TransferSettings& settings() const { return settings_; }
    // True while any item of either direction is pending or active
    bool busy() const;

signals:
    void tasksChanged();
    void transferFinished(const QString& id);

private:
    bool requireBucket(QString& err) const;
    bool enqueueInto(TransferQueue* queue,
                     std::vector<opens3::TransferSpec> specs,
                     QString& err,
                     QStringList* ids);
    TransferQueue* owner(const QString& id) const;
    opens3::TransferSpec baseSpec() const;

    opens3::TransferEngine& engine_;
    opens3::LocalFileSystem& fs_;
    TransferSettings settings_;
    opens3::AuditEmitter audit_;
    TransferEventBridge* bridge_ = nullptr;
    TransferQueue* uploads_ = nullptr;
    TransferQueue* downloads_ = nullptr;
    QString accountId_;
    QString bucket_;
};
