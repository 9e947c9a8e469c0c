#pragma once

#include <string>
#include <fstream>
#include <filesystem>
#include "nostrfs/server/server.hpp"
#include "nostrfs/types.hpp"

namespace nostrfs {
namespace server {
namespace storage {

// 上传中的临时文件名: .<文件名>.<uuid>.part，不对外提供读取
bool IsUploadTempName(const std::string& filename);

// 先写临时文件，Commit时重命名到目标路径
class FileStreamWriter : public FileWriter {
public:
    FileStreamWriter(std::filesystem::path target, std::filesystem::path tempPath);
    ~FileStreamWriter() override;

    nostrfs::Error Open();
    nostrfs::Error Write(const char* data, size_t length) override;
    nostrfs::Error Commit() override;
    void Abort() override;

private:
    std::filesystem::path target_;
    std::filesystem::path tempPath_;
    std::ofstream file_;
    bool finished_ = false;
};

// 文件系统存储服务，文件位于 根目录 + 请求路径
class FileStorageService : public StorageService {
public:
    explicit FileStorageService(const std::string& rootDir);

    Result<bool> EnsureParentDirectory(const std::string& requestPath) override;

    Result<std::shared_ptr<FileWriter>> OpenWriter(const std::string& requestPath) override;

    Result<std::string> ReadFile(const std::string& requestPath) override;

    // 把请求路径解析为根目录下的路径，越出根目录时返回错误
    Result<std::filesystem::path> ResolvePath(const std::string& requestPath) const;

private:
    std::filesystem::path rootDir_;
};

} // namespace storage
} // namespace server
} // namespace nostrfs
