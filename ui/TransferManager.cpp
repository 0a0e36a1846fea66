// Manager implementation: builds items from UI requests and routes them to the
// queue of their direction.
#include "TransferManager.hpp"
#include "TransferEventBridge.hpp"
#include "TransferQueue.hpp"
#include "opens3/LocalFileSystem.hpp"
#include "opens3/Log.hpp"
#include "opens3/TransferEngine.hpp"
#include <QFileInfo>

using opens3::TransferDirection;
using opens3::TransferSource;
using opens3::TransferSpec;

namespace {

QString normalizedPrefix(const QString& prefix) {
    if (prefix.isEmpty() || prefix.endsWith('/')) return prefix;
    return prefix + '/';
}

QString lastSegment(QString key) {
    while (key.endsWith('/')) key.chop(1);
    const int pos = key.lastIndexOf('/');
    return pos < 0 ? key : key.mid(pos + 1);
}

} // namespace

TransferManager::TransferManager(opens3::TransferEngine& engine,
                                 opens3::LocalFileSystem& fs,
                                 opens3::HistoryLog* history,
                                 const TransferSettings& settings,
                                 QObject* parent)
    : QObject(parent), engine_(engine), fs_(fs), settings_(settings), audit_(history) {
    bridge_ = new TransferEventBridge(this);
    uploads_ = new TransferQueue(TransferDirection::Upload, settings_.maxConcurrentUploads,
                                 engine_, fs_, audit_, this);
    downloads_ = new TransferQueue(TransferDirection::Download, settings_.maxConcurrentDownloads,
                                   engine_, fs_, audit_, this);
    bridge_->attach(TransferDirection::Upload, uploads_);
    bridge_->attach(TransferDirection::Download, downloads_);
    // Subscribe once for the manager's lifetime
    engine_.setEventSink(bridge_);

    for (TransferQueue* q : {uploads_, downloads_}) {
        connect(q, &TransferQueue::tasksChanged, this, &TransferManager::tasksChanged);
        connect(q, &TransferQueue::transferFinished, this, &TransferManager::transferFinished);
    }
}

TransferManager::~TransferManager() {
    engine_.setEventSink(nullptr);
    // Queues join their workers; they must go before the audit emitter
    delete uploads_;
    delete downloads_;
    uploads_ = nullptr;
    downloads_ = nullptr;
}

void TransferManager::setAccount(const QString& accountId, const QString& bucket) {
    accountId_ = accountId;
    bucket_ = bucket;
}

bool TransferManager::requireBucket(QString& err) const {
    if (accountId_.isEmpty() || bucket_.isEmpty()) {
        err = tr("Please select a bucket first");
        return false;
    }
    return true;
}

TransferSpec TransferManager::baseSpec() const {
    TransferSpec s;
    s.accountId = accountId_.toStdString();
    s.bucket = bucket_.toStdString();
    return s;
}

bool TransferManager::enqueueInto(TransferQueue* queue,
                                  std::vector<TransferSpec> specs,
                                  QString& err,
                                  QStringList* ids) {
    std::vector<std::string> assigned;
    std::string e;
    if (!queue->enqueue(std::move(specs), assigned, e)) {
        err = QString::fromStdString(e);
        return false;
    }
    if (ids) {
        ids->clear();
        for (const auto& id : assigned) ids->push_back(QString::fromStdString(id));
    }
    return true;
}

bool TransferManager::enqueueUploadData(const QString& fileName,
                                        const QByteArray& data,
                                        const QString& keyPrefix,
                                        const QString& contentType,
                                        QString& err,
                                        QStringList* ids) {
    if (!requireBucket(err)) return false;
    TransferSpec s = baseSpec();
    s.source = TransferSource::memory(std::vector<std::uint8_t>(data.begin(), data.end()));
    s.destination = (normalizedPrefix(keyPrefix) + fileName).toStdString();
    s.fileName = fileName.toStdString();
    s.contentType = contentType.toStdString();
    s.totalBytes = std::uint64_t(data.size());
    return enqueueInto(uploads_, {std::move(s)}, err, ids);
}

bool TransferManager::enqueueUploadFiles(const QStringList& paths,
                                         const QString& keyPrefix,
                                         QString& err,
                                         QStringList* ids) {
    if (!requireBucket(err)) return false;
    if (paths.isEmpty()) {
        err = tr("No files selected");
        return false;
    }
    const QString prefix = normalizedPrefix(keyPrefix);
    std::vector<TransferSpec> specs;
    QStringList skipped;
    for (const QString& path : paths) {
        std::uint64_t size = 0;
        std::string statErr;
        if (!fs_.stat(path.toStdString(), size, statErr)) {
            LOGE("upload: skipping %s: %s", qPrintable(path), statErr.c_str());
            skipped << QFileInfo(path).fileName();
            continue;
        }
        const QString name = QFileInfo(path).fileName();
        TransferSpec s = baseSpec();
        s.source = TransferSource::localFile(path.toStdString());
        s.destination = (prefix + name).toStdString();
        s.fileName = name.toStdString();
        s.totalBytes = size;
        specs.push_back(std::move(s));
    }
    if (specs.empty()) {
        err = tr("Failed to read file: %1").arg(skipped.join(", "));
        return false;
    }
    if (!enqueueInto(uploads_, std::move(specs), err, ids)) return false;
    if (!skipped.isEmpty()) err = tr("Failed to read file: %1").arg(skipped.join(", "));
    return true;
}

bool TransferManager::enqueueDownloads(const QStringList& keys, QString& err, QStringList* ids) {
    if (!requireBucket(err)) return false;
    if (keys.isEmpty()) {
        err = tr("No objects selected");
        return false;
    }
    std::vector<TransferSpec> specs;
    specs.reserve(keys.size());
    for (const QString& key : keys) {
        TransferSpec s = baseSpec();
        s.source = TransferSource::remoteKey(key.toStdString());
        s.destination = settings_.downloadDir.toStdString();
        const QString name = lastSegment(key);
        s.fileName = (name.isEmpty() ? key : name).toStdString();
        specs.push_back(std::move(s));
    }
    return enqueueInto(downloads_, std::move(specs), err, ids);
}

bool TransferManager::enqueueFolderDownload(const QString& prefix, QString& err, QString* id) {
    if (!requireBucket(err)) return false;
    QString folder = lastSegment(prefix.trimmed());
    if (folder.isEmpty()) folder = "folder";
    TransferSpec s = baseSpec();
    s.source = TransferSource::remoteKey(prefix.trimmed().toStdString());
    s.destination = settings_.downloadDir.toStdString();
    s.fileName = (folder + ".zip").toStdString();
    s.aggregate = true;
    QStringList ids;
    if (!enqueueInto(downloads_, {std::move(s)}, err, &ids)) return false;
    if (id && !ids.isEmpty()) *id = ids.front();
    return true;
}

TransferQueue* TransferManager::owner(const QString& id) const {
    const std::string key = id.toStdString();
    if (uploads_->contains(key)) return uploads_;
    if (downloads_->contains(key)) return downloads_;
    return nullptr;
}

bool TransferManager::cancel(const QString& id) {
    TransferQueue* q = owner(id);
    return q && q->cancelTask(id.toStdString());
}

void TransferManager::cancelAll() {
    uploads_->cancelAll();
    downloads_->cancelAll();
}

bool TransferManager::retry(const QString& id, QString& newId, QString& err) {
    TransferQueue* q = owner(id);
    if (!q) {
        err = tr("Unknown transfer: %1").arg(id);
        return false;
    }
    std::string nid;
    std::string e;
    if (!q->retryTask(id.toStdString(), nid, e)) {
        err = QString::fromStdString(e);
        return false;
    }
    newId = QString::fromStdString(nid);
    return true;
}

int TransferManager::clearCompleted() {
    return uploads_->clearCompleted() + downloads_->clearCompleted();
}

bool TransferManager::remove(const QString& id) {
    TransferQueue* q = owner(id);
    return q && q->removeTask(id.toStdString());
}

int TransferManager::clearAll() {
    return uploads_->clearAll() + downloads_->clearAll();
}

bool TransferManager::busy() const {
    for (TransferQueue* q : {uploads_, downloads_}) {
        const auto c = q->store().countByStatus();
        if (c.pending > 0 || c.active > 0) return true;
    }
    return false;
}
