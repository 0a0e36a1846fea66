// Local filesystem primitives needed for staging in-memory uploads.
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace opens3 {

class LocalFileSystem {
public:
    virtual ~LocalFileSystem() = default;

    // Create or truncate path with the given content.
    virtual bool write(const std::string& path,
                       const std::vector<std::uint8_t>& bytes,
                       std::string& err) = 0;

    virtual bool remove(const std::string& path, std::string& err) = 0;

    // Size of a regular file. Returns false if it cannot be read.
    virtual bool stat(const std::string& path, std::uint64_t& size, std::string& err) = 0;

    // Process-temporary directory, without trailing separator.
    virtual std::string tempDirectory() const = 0;
};

} // namespace opens3
