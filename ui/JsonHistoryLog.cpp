#include "JsonHistoryLog.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>

QByteArray JsonHistoryLog::toJson(const opens3::OperationRecord& r) {
    QJsonObject o;
    o["timestamp"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    o["accountId"] = QString::fromStdString(r.accountId);
    o["bucket"] = QString::fromStdString(r.bucket);
    o["operation"] = QString::fromLatin1(opens3::toString(r.operation));
    o["sourceKey"] = QString::fromStdString(r.sourceKey);
    if (r.destKey) o["destKey"] = QString::fromStdString(*r.destKey);
    if (r.size) o["size"] = qint64(*r.size);
    o["status"] = QString::fromLatin1(opens3::toString(r.status));
    if (r.durationMs) o["durationMs"] = qint64(*r.durationMs);
    if (r.errorMessage) o["errorMessage"] = QString::fromStdString(*r.errorMessage);
    return QJsonDocument(o).toJson(QJsonDocument::Compact);
}

bool JsonHistoryLog::append(const opens3::OperationRecord& record, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (path_.isEmpty()) {
        err = "No history file configured";
        return false;
    }
    QDir().mkpath(QFileInfo(path_).absolutePath());
    QFile f(path_);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Append)) {
        err = f.errorString().toStdString();
        return false;
    }
    QByteArray line = toJson(record);
    line.append('\n');
    if (f.write(line) != line.size()) {
        err = f.errorString().toStdString();
        return false;
    }
    return true;
}
