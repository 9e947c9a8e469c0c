#include "nostrfs/server/storage/file_storage.hpp"
#include <sstream>
#include <system_error>
#include <uuid/uuid.h>
#include "nostrfs/utils/logger.hpp"

namespace fs = std::filesystem;

namespace nostrfs {
namespace server {
namespace storage {

namespace {

const std::string TEMP_PREFIX = ".";
const std::string TEMP_SUFFIX = ".part";

std::string newUploadID() {
    uuid_t uuid;
    uuid_generate(uuid);
    char uuidStr[37];
    uuid_unparse_lower(uuid, uuidStr);
    return uuidStr;
}

} // namespace

bool IsUploadTempName(const std::string& filename) {
    return filename.size() > TEMP_PREFIX.size() + TEMP_SUFFIX.size() &&
           filename.compare(0, TEMP_PREFIX.size(), TEMP_PREFIX) == 0 &&
           filename.compare(filename.size() - TEMP_SUFFIX.size(), TEMP_SUFFIX.size(), TEMP_SUFFIX) == 0;
}

FileStreamWriter::FileStreamWriter(fs::path target, fs::path tempPath)
    : target_(std::move(target)), tempPath_(std::move(tempPath)) {}

FileStreamWriter::~FileStreamWriter() {
    if (!finished_) {
        Abort();
    }
}

nostrfs::Error FileStreamWriter::Open() {
    file_.open(tempPath_, std::ios::binary | std::ios::trunc);
    if (!file_) {
        return nostrfs::Error("Cannot create file: " + tempPath_.string());
    }
    return nostrfs::Error();
}

nostrfs::Error FileStreamWriter::Write(const char* data, size_t length) {
    if (finished_) {
        return nostrfs::Error("Writer already finished: " + target_.string());
    }
    file_.write(data, static_cast<std::streamsize>(length));
    if (!file_) {
        return nostrfs::Error("Failed writing file: " + tempPath_.string());
    }
    return nostrfs::Error();
}

nostrfs::Error FileStreamWriter::Commit() {
    if (finished_) {
        return nostrfs::Error("Writer already finished: " + target_.string());
    }

    file_.close();
    if (file_.fail()) {
        Abort();
        return nostrfs::Error("Failed flushing file: " + tempPath_.string());
    }

    // 重命名是原子的，并发写同一路径时最后提交的胜出
    std::error_code ec;
    fs::rename(tempPath_, target_, ec);
    if (ec) {
        Abort();
        return nostrfs::Error("Failed moving file into place: " + ec.message());
    }

    finished_ = true;
    return nostrfs::Error();
}

void FileStreamWriter::Abort() {
    finished_ = true;
    if (file_.is_open()) {
        file_.close();
    }
    std::error_code ec;
    fs::remove(tempPath_, ec);
    if (ec) {
        utils::GetLogger().Warn("无法删除临时文件",
            utils::LogContext()
                .With("path", tempPath_.string())
                .With("error", ec.message()));
    }
}

FileStorageService::FileStorageService(const std::string& rootDir)
    : rootDir_(fs::path(rootDir).lexically_normal()) {
    if (rootDir_.filename().empty() && rootDir_.has_relative_path()) {
        rootDir_ = rootDir_.parent_path();
    }
    std::error_code ec;
    fs::create_directories(rootDir_, ec);
    if (ec) {
        utils::GetLogger().Error("无法创建存储根目录",
            utils::LogContext()
                .With("rootDir", rootDir_.string())
                .With("error", ec.message()));
    }
    utils::GetLogger().Info("初始化文件存储服务",
        utils::LogContext().With("rootDir", rootDir_.string()));
}

Result<fs::path> FileStorageService::ResolvePath(const std::string& requestPath) const {
    // 系统调用会在'\0'处截断路径
    if (requestPath.find('\0') != std::string::npos) {
        return nostrfs::Error("request path contains NUL byte");
    }

    size_t begin = requestPath.find_first_not_of('/');
    if (begin == std::string::npos) {
        return nostrfs::Error("empty request path");
    }

    fs::path candidate = (rootDir_ / requestPath.substr(begin)).lexically_normal();
    if (candidate.filename().empty()) {
        candidate = candidate.parent_path();
    }

    // 规范化后仍须位于根目录之下
    fs::path relative = candidate.lexically_relative(rootDir_);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        return nostrfs::Error("request path escapes storage root: " + requestPath);
    }
    return candidate;
}

Result<bool> FileStorageService::EnsureParentDirectory(const std::string& requestPath) {
    auto target = ResolvePath(requestPath);
    if (!target.ok()) {
        return target.error();
    }

    std::error_code ec;
    fs::create_directories(target.value().parent_path(), ec);
    if (ec) {
        return nostrfs::Error("Cannot create directory " + target.value().parent_path().string() + ": " + ec.message());
    }
    return true;
}

Result<std::shared_ptr<FileWriter>> FileStorageService::OpenWriter(const std::string& requestPath) {
    auto target = ResolvePath(requestPath);
    if (!target.ok()) {
        return target.error();
    }

    const fs::path& targetPath = target.value();
    fs::path tempPath = targetPath.parent_path() /
        (TEMP_PREFIX + targetPath.filename().string() + "." + newUploadID() + TEMP_SUFFIX);

    auto writer = std::make_shared<FileStreamWriter>(targetPath, tempPath);
    nostrfs::Error err = writer->Open();
    if (err.hasError()) {
        writer->Abort();
        return err;
    }

    utils::GetLogger().Debug("打开上传文件",
        utils::LogContext()
            .With("target", targetPath.string())
            .With("temp", tempPath.string()));
    return std::shared_ptr<FileWriter>(writer);
}

Result<std::string> FileStorageService::ReadFile(const std::string& requestPath) {
    auto target = ResolvePath(requestPath);
    if (!target.ok()) {
        return target.error();
    }

    const fs::path& path = target.value();
    if (IsUploadTempName(path.filename().string())) {
        return nostrfs::Error("File not found: " + path.string());
    }

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return nostrfs::Error("File not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return nostrfs::Error("Cannot open file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return nostrfs::Error("Failed reading file: " + path.string());
    }
    return buffer.str();
}

} // namespace storage
} // namespace server
} // namespace nostrfs
