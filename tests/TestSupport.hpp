// Shared fakes and helpers for the unit tests.
#pragma once
#include <QCoreApplication>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "opens3/HistoryLog.hpp"
#include "opens3/LocalFileSystem.hpp"
#include "opens3/TransferTypes.hpp"

namespace opens3::test {

// Pump the Qt event loop until pred holds or the timeout expires.
inline bool waitUntil(const std::function<bool()>& pred, int timeoutMs = 3000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        QCoreApplication::processEvents();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

// Drain whatever is already queued (worker notifications, bridged events).
inline void settle(int ms = 50) {
    const auto end = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (std::chrono::steady_clock::now() < end) {
        QCoreApplication::processEvents();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

// In-memory filesystem. Thread-safe: executors call it from worker threads.
class MemoryFileSystem : public LocalFileSystem {
public:
    bool write(const std::string& path, const std::vector<std::uint8_t>& bytes, std::string& err) override {
        std::lock_guard<std::mutex> lk(mtx_);
        writes_.push_back(path);
        if (failWrites_) {
            err = "Disk full";
            return false;
        }
        files_[path] = bytes;
        return true;
    }

    bool remove(const std::string& path, std::string& err) override {
        std::lock_guard<std::mutex> lk(mtx_);
        removes_.push_back(path);
        if (failRemoves_) {
            err = "Permission denied";
            return false;
        }
        files_.erase(path);
        return true;
    }

    bool stat(const std::string& path, std::uint64_t& size, std::string& err) override {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = files_.find(path);
        if (it == files_.end()) {
            err = "Failed to read file: " + path;
            return false;
        }
        size = it->second.size();
        return true;
    }

    std::string tempDirectory() const override { return "/tmp/opens3-test"; }

    void put(const std::string& path, std::vector<std::uint8_t> bytes) {
        std::lock_guard<std::mutex> lk(mtx_);
        files_[path] = std::move(bytes);
    }
    bool exists(const std::string& path) const {
        std::lock_guard<std::mutex> lk(mtx_);
        return files_.count(path) > 0;
    }
    std::vector<std::uint8_t> contents(const std::string& path) const {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = files_.find(path);
        return it == files_.end() ? std::vector<std::uint8_t>{} : it->second;
    }
    std::vector<std::string> writes() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return writes_;
    }
    std::vector<std::string> removes() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return removes_;
    }
    void setFailWrites(bool v) {
        std::lock_guard<std::mutex> lk(mtx_);
        failWrites_ = v;
    }
    void setFailRemoves(bool v) {
        std::lock_guard<std::mutex> lk(mtx_);
        failRemoves_ = v;
    }

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::vector<std::uint8_t>> files_;
    std::vector<std::string> writes_;
    std::vector<std::string> removes_;
    bool failWrites_ = false;
    bool failRemoves_ = false;
};

class RecordingHistoryLog : public HistoryLog {
public:
    enum class Mode { Accept, Reject, Throw };

    explicit RecordingHistoryLog(Mode mode = Mode::Accept) : mode_(mode) {}

    bool append(const OperationRecord& record, std::string& err) override {
        std::lock_guard<std::mutex> lk(mtx_);
        ++attempts_;
        if (mode_ == Mode::Throw) throw std::runtime_error("history backend exploded");
        if (mode_ == Mode::Reject) {
            err = "read-only history";
            return false;
        }
        records_.push_back(record);
        return true;
    }

    std::vector<OperationRecord> records() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return records_;
    }
    int attempts() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return attempts_;
    }

private:
    mutable std::mutex mtx_;
    Mode mode_;
    std::vector<OperationRecord> records_;
    int attempts_ = 0;
};

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("opens3_test_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

    std::filesystem::path writeFile(const std::string& rel, const std::string& content) const {
        const auto p = path_ / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

private:
    std::filesystem::path path_;
};

inline std::string readFile(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::vector<std::uint8_t> bytesOf(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

inline TransferSpec uploadSpec(const std::string& id, const std::string& key, const std::string& content = "data") {
    TransferSpec s;
    s.id = id;
    s.direction = TransferDirection::Upload;
    s.accountId = "acc";
    s.bucket = "bucket";
    s.source = TransferSource::memory(bytesOf(content));
    s.destination = key;
    s.fileName = key.substr(key.rfind('/') == std::string::npos ? 0 : key.rfind('/') + 1);
    s.totalBytes = content.size();
    return s;
}

inline TransferSpec downloadSpec(const std::string& id, const std::string& key, const std::string& dir = "/downloads") {
    TransferSpec s;
    s.id = id;
    s.direction = TransferDirection::Download;
    s.accountId = "acc";
    s.bucket = "bucket";
    s.source = TransferSource::remoteKey(key);
    s.destination = dir;
    s.fileName = key;
    return s;
}

} // namespace opens3::test
