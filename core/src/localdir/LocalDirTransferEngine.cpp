// Local-directory backend: chunked copies with progress and cooperative cancel.
#include "opens3/LocalDirTransferEngine.hpp"
#include "opens3/Log.hpp"
#include <cstdio>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace opens3 {

namespace {

bool validKey(const std::string& key) {
    if (key.empty() || key.front() == '/') return false;
    std::size_t start = 0;
    while (start <= key.size()) {
        std::size_t end = key.find('/', start);
        if (end == std::string::npos) end = key.size();
        if (key.compare(start, end - start, "..") == 0) return false;
        start = end + 1;
    }
    return true;
}

std::string lastSegment(std::string key) {
    while (!key.empty() && key.back() == '/') key.pop_back();
    const auto pos = key.rfind('/');
    return pos == std::string::npos ? key : key.substr(pos + 1);
}

} // namespace

LocalDirTransferEngine::LocalDirTransferEngine(std::string root) : root_(std::move(root)) {
    while (root_.size() > 1 && root_.back() == '/') root_.pop_back();
}

std::string LocalDirTransferEngine::objectPath(const std::string& bucket, const std::string& key) const {
    return root_ + "/" + bucket + "/" + key;
}

void LocalDirTransferEngine::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (inFlight_.count(id)) cancelled_.insert(id);
}

bool LocalDirTransferEngine::isInFlight(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return inFlight_.count(id) > 0;
}

bool LocalDirTransferEngine::transfer(const TransferRequest& req,
                                      std::string& err,
                                      std::function<bool()> shouldCancel) {
    if (req.bucket.empty() || req.bucket.find('/') != std::string::npos || req.bucket == "..") {
        err = "Invalid bucket name";
        return false;
    }
    const std::string id = req.id;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        inFlight_.insert(id);
    }
    auto stop = [this, id, shouldCancel]() -> bool {
        if (shouldCancel && shouldCancel()) return true;
        std::lock_guard<std::mutex> lk(mtx_);
        return cancelled_.count(id) > 0;
    };

    bool ok = false;
    if (req.direction == TransferDirection::Upload) ok = upload(req, err, stop);
    else if (req.aggregate) ok = downloadPrefix(req, err, stop);
    else ok = download(req, err, stop);

    std::lock_guard<std::mutex> lk(mtx_);
    inFlight_.erase(id);
    cancelled_.erase(id);
    return ok;
}

bool LocalDirTransferEngine::copyFile(const std::string& src, const std::string& dst, std::string& err,
                                      const std::function<bool()>& stop,
                                      const std::function<void(std::uint64_t, std::uint64_t)>& progress) {
    FILE* in = std::fopen(src.c_str(), "rb");
    if (!in) {
        err = "Could not open " + src + " for reading";
        return false;
    }
    std::fseek(in, 0, SEEK_END);
    long sz = std::ftell(in);
    std::fseek(in, 0, SEEK_SET);
    const std::uint64_t total = sz > 0 ? std::uint64_t(sz) : 0;

    FILE* out = std::fopen(dst.c_str(), "wb");
    if (!out) {
        std::fclose(in);
        err = "Could not open " + dst + " for writing";
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::uint64_t done = 0;
    bool ok = true;
    while (true) {
        if (stop()) {
            err = "Cancelled by user";
            ok = false;
            break;
        }
        std::size_t n = std::fread(buf.data(), 1, buf.size(), in);
        if (n == 0) {
            if (std::ferror(in)) {
                err = "Local read failed";
                ok = false;
            }
            break; // EOF
        }
        if (std::fwrite(buf.data(), 1, n, out) != n) {
            err = "Write failed: " + dst;
            ok = false;
            break;
        }
        done += n;
        if (progress) progress(done, total);
    }
    if (std::fclose(out) != 0 && ok) {
        err = "Write failed: " + dst;
        ok = false;
    }
    std::fclose(in);
    if (!ok) {
        std::error_code ec;
        fs::remove(dst, ec);
    }
    return ok;
}

bool LocalDirTransferEngine::upload(const TransferRequest& req, std::string& err,
                                    const std::function<bool()>& stop) {
    if (!validKey(req.key)) {
        err = "Invalid object key: " + req.key;
        return false;
    }
    std::error_code ec;
    if (!fs::is_regular_file(req.localPath, ec)) {
        err = "Local file not found: " + req.localPath;
        return false;
    }
    const std::string target = objectPath(req.bucket, req.key);
    fs::create_directories(fs::path(target).parent_path(), ec);
    if (ec) {
        err = "Failed to create directory: " + ec.message();
        return false;
    }

    std::string copyErr;
    auto progress = [this, &req](std::uint64_t done, std::uint64_t total) {
        publishProgress(req.direction, req.id, done, total);
    };
    if (!copyFile(req.localPath, target, copyErr, stop, progress)) {
        LOGE("localdir: upload %s failed: %s", req.key.c_str(), copyErr.c_str());
        publishFailed(req.direction, req.id, copyErr);
        return true;
    }
    publishCompleted(req.direction, req.id, std::string());
    return true;
}

bool LocalDirTransferEngine::download(const TransferRequest& req, std::string& err,
                                      const std::function<bool()>& stop) {
    if (!validKey(req.key)) {
        err = "Invalid object key: " + req.key;
        return false;
    }
    const std::string src = objectPath(req.bucket, req.key);
    std::error_code ec;
    if (!fs::is_regular_file(src, ec)) {
        err = "Object not found: " + req.key;
        return false;
    }
    fs::create_directories(req.localPath, ec);
    if (ec) {
        err = "Failed to create directory: " + ec.message();
        return false;
    }
    const std::string target = (fs::path(req.localPath) / lastSegment(req.key)).string();

    std::string copyErr;
    auto progress = [this, &req](std::uint64_t done, std::uint64_t total) {
        publishProgress(req.direction, req.id, done, total);
    };
    if (!copyFile(src, target, copyErr, stop, progress)) {
        LOGE("localdir: download %s failed: %s", req.key.c_str(), copyErr.c_str());
        publishFailed(req.direction, req.id, copyErr);
        return true;
    }
    publishCompleted(req.direction, req.id, target);
    return true;
}

// Folder download: every object under the prefix is copied into
// <destination>/<folder>/ keeping relative paths. Only the terminal event is
// published.
bool LocalDirTransferEngine::downloadPrefix(const TransferRequest& req, std::string& err,
                                            const std::function<bool()>& stop) {
    std::string prefix = req.key;
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    if (!prefix.empty() && !validKey(prefix)) {
        err = "Invalid object key: " + req.key;
        return false;
    }
    const fs::path base = prefix.empty() ? fs::path(root_) / req.bucket
                                         : fs::path(objectPath(req.bucket, prefix));
    std::error_code ec;
    std::vector<fs::path> files;
    if (fs::is_directory(base, ec)) {
        for (auto it = fs::recursive_directory_iterator(base, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec)) files.push_back(it->path());
        }
    }
    if (files.empty()) {
        err = "Folder is empty";
        return false;
    }

    std::string folder = lastSegment(prefix);
    if (folder.empty()) folder = "folder";
    const fs::path out = fs::path(req.localPath) / folder;
    fs::create_directories(out, ec);
    if (ec) {
        err = "Failed to create directory: " + ec.message();
        return false;
    }

    std::size_t copied = 0;
    for (const auto& f : files) {
        if (stop()) {
            publishFailed(req.direction, req.id, "Cancelled by user");
            return true;
        }
        const fs::path rel = fs::relative(f, base, ec);
        const fs::path dst = out / rel;
        fs::create_directories(dst.parent_path(), ec);
        std::string copyErr;
        if (ec || !copyFile(f.string(), dst.string(), copyErr, stop, {})) {
            // Keep going with the rest of the folder.
            LOGW("localdir: skipped %s: %s", f.string().c_str(),
                 ec ? ec.message().c_str() : copyErr.c_str());
            continue;
        }
        ++copied;
    }
    if (copied == 0) {
        publishFailed(req.direction, req.id, "No object of the folder could be downloaded");
        return true;
    }
    publishCompleted(req.direction, req.id, out.string());
    return true;
}

} // namespace opens3
