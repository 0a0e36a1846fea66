#include "QtLocalFileSystem.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>

bool QtLocalFileSystem::write(const std::string& path,
                              const std::vector<std::uint8_t>& bytes,
                              std::string& err) {
    QFile f(QString::fromStdString(path));
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        err = "Could not create " + path + ": " + f.errorString().toStdString();
        return false;
    }
    const qint64 n = bytes.empty() ? 0
                                   : f.write(reinterpret_cast<const char*>(bytes.data()), qint64(bytes.size()));
    if (n != qint64(bytes.size()) || !f.flush()) {
        err = "Write failed for " + path + ": " + f.errorString().toStdString();
        return false;
    }
    return true;
}

bool QtLocalFileSystem::remove(const std::string& path, std::string& err) {
    QFile f(QString::fromStdString(path));
    if (!f.exists()) return true;
    if (!f.remove()) {
        err = "Could not remove " + path + ": " + f.errorString().toStdString();
        return false;
    }
    return true;
}

bool QtLocalFileSystem::stat(const std::string& path, std::uint64_t& size, std::string& err) {
    QFileInfo fi(QString::fromStdString(path));
    if (!fi.exists() || !fi.isFile() || !fi.isReadable()) {
        err = "Failed to read file: " + path;
        return false;
    }
    size = std::uint64_t(fi.size());
    return true;
}

std::string QtLocalFileSystem::tempDirectory() const {
    return QDir::tempPath().toStdString();
}
