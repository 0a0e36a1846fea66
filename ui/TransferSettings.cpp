#include "TransferSettings.hpp"
#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace {

int clampLimit(int n) { return n < 1 ? 1 : n; }

QString defaultDownloadDir() {
    QString dir = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (dir.isEmpty()) dir = QDir::homePath();
    return dir;
}

QString defaultHistoryPath() {
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) return QString();
    return QDir(base).filePath("history.jsonl");
}

} // namespace

TransferSettings TransferSettings::load(QSettings& s) {
    TransferSettings t;
    t.maxConcurrentUploads = clampLimit(s.value("Transfers/maxConcurrentUploads", 3).toInt());
    t.maxConcurrentDownloads = clampLimit(s.value("Transfers/maxConcurrentDownloads", 3).toInt());
    t.downloadDir = s.value("Transfers/downloadDir", defaultDownloadDir()).toString();
    t.historyPath = s.value("History/path", defaultHistoryPath()).toString();
    return t;
}

TransferSettings TransferSettings::load() {
    QSettings s("OpenS3", "OpenS3");
    return load(s);
}

void TransferSettings::save(QSettings& s) const {
    s.setValue("Transfers/maxConcurrentUploads", maxConcurrentUploads);
    s.setValue("Transfers/maxConcurrentDownloads", maxConcurrentDownloads);
    s.setValue("Transfers/downloadDir", downloadDir);
    s.setValue("History/path", historyPath);
}
