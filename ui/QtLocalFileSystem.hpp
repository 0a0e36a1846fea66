// LocalFileSystem on top of QFile/QDir.
#pragma once
#include "opens3/LocalFileSystem.hpp"

class QtLocalFileSystem : public opens3::LocalFileSystem {
public:
    bool write(const std::string& path,
               const std::vector<std::uint8_t>& bytes,
               std::string& err) override;

    bool remove(const std::string& path, std::string& err) override;

    bool stat(const std::string& path, std::uint64_t& size, std::string& err) override;

    std::string tempDirectory() const override;
};
