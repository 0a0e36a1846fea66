// Transfer preferences persisted with QSettings.
#pragma once
#include <QString>

class QSettings;

struct TransferSettings {
    int maxConcurrentUploads = 3;
    int maxConcurrentDownloads = 3;
    QString downloadDir; // local directory for downloads
    QString historyPath; // JSON-lines operation history; empty disables it

    // Read from the given settings, falling back to defaults (limits clamped to >= 1).
    static TransferSettings load(QSettings& s);
    // Same, from the application settings ("OpenS3", "OpenS3").
    static TransferSettings load();
    void save(QSettings& s) const;
};
