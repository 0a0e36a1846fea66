// Operation history stored as one JSON object per line.
#pragma once
#include <QByteArray>
#include <QString>
#include <mutex>
#include "opens3/HistoryLog.hpp"

class JsonHistoryLog : public opens3::HistoryLog {
public:
    explicit JsonHistoryLog(QString path) : path_(std::move(path)) {}

    bool append(const opens3::OperationRecord& record, std::string& err) override;

    const QString& path() const { return path_; }

    // JSON form of a record (camelCase keys, optional fields omitted).
    static QByteArray toJson(const opens3::OperationRecord& record);

private:
    QString path_;
    std::mutex mtx_;
};
