#include "nostrfs/server/server.hpp"
#include "nostrfs/server/handlers/authorization.hpp"
#include "nostrfs/utils/logger.hpp"
#include "nostrfs/utils/tools.hpp"
#include <filesystem>

namespace nostrfs {
namespace server {
namespace handlers {

const std::string TEXT_PLAIN = "text/plain";

std::string GetContentType(const std::string& extension) {
    if (extension == ".txt") return "text/plain";
    if (extension == ".html") return "text/html";
    if (extension == ".json") return "application/json";
    return "application/octet-stream";
}

void SetCorsHeaders(Response& resp) {
    resp.headers["Access-Control-Allow-Origin"] = "*";
    resp.headers["Access-Control-Allow-Methods"] = "GET, PUT, OPTIONS";
    resp.headers["Access-Control-Allow-Headers"] = "Content-Type, Authorization";
}

// CORS预检
Error OptionsHandler(const Context& ctx, Response& resp) {
    utils::GetLogger().Debug("处理预检请求",
        utils::LogContext().With("path", ctx.request.path));
    resp.status = 204;
    resp.body.clear();
    return Error();
}

// 404处理程序
Error NotFoundHandler(const Context& ctx, Response& resp) {
    utils::GetLogger().Warn("资源未找到",
        utils::LogContext()
            .With("method", ctx.request.method)
            .With("path", ctx.request.path));
    return Error::ErrFileNotFound.WithDetail("Not found");
}

// 读取文件，不做授权
Error GetHandler(const Context& ctx, Response& resp) {
    const std::string& requestPath = ctx.request.path;

    if (!ctx.storageService) {
        utils::GetLogger().Error("存储服务不可用");
        return Error::ErrNoStorage;
    }

    auto data = ctx.storageService->ReadFile(requestPath);
    if (!data.ok()) {
        utils::GetLogger().Warn("读取文件失败",
            utils::LogContext()
                .With("path", requestPath)
                .With("error", data.error().what()));
        return Error::ErrFileNotFound;
    }

    std::string extension = std::filesystem::path(requestPath).extension().string();
    resp.status = 200;
    resp.body = std::move(data).value();
    resp.headers["Content-Type"] = GetContentType(extension);

    utils::GetLogger().Debug("返回文件",
        utils::LogContext()
            .With("path", requestPath)
            .With("size", std::to_string(resp.body.size())));
    return Error();
}

// 上传文件：验证签名事件 -> 检查命名空间 -> 创建目录 -> 流式写入
Error PutHandler(const Context& ctx, Response& resp) {
    const std::string& requestPath = ctx.request.path;

    // 目标目录是去掉首尾'/'的请求路径
    auto pathIt = ctx.request.params.find("path");
    std::string targetDir = utils::TrimSlashes(
        pathIt != ctx.request.params.end() ? pathIt->second : requestPath);

    if (!ctx.storageService) {
        utils::GetLogger().Error("存储服务不可用");
        return Error::ErrNoStorage;
    }

    if (!ctx.verifier) {
        utils::GetLogger().Error("签名验证器不可用");
        return Error::ErrUnknown;
    }

    if (!ctx.request.HasHeader(AUTHORIZATION_HEADER)) {
        utils::GetLogger().Warn("缺少授权头",
            utils::LogContext().With("path", requestPath));
        return Error::ErrUnauthorized;
    }

    auto pubkey = VerifyAuthorizationHeader(ctx.request.GetHeader(AUTHORIZATION_HEADER), *ctx.verifier);
    if (!pubkey.ok()) {
        utils::GetLogger().Warn("授权验证失败",
            utils::LogContext().With("path", requestPath));
        return Error::ErrUnauthorized;
    }

    Error err = CheckTargetDir(targetDir, pubkey.value());
    if (err.Code() != 0) {
        utils::GetLogger().Warn("拒绝写入",
            utils::LogContext()
                .With("reason", err.Detail())
                .With("targetDir", targetDir)
                .With("pubkey", pubkey.value()));
        return err;
    }

    auto dirResult = ctx.storageService->EnsureParentDirectory(requestPath);
    if (!dirResult.ok()) {
        utils::GetLogger().Error("创建目录失败",
            utils::LogContext()
                .With("path", requestPath)
                .With("error", dirResult.error().what()));
        return Error::ErrCreatingDirectory;
    }

    auto writerResult = ctx.storageService->OpenWriter(requestPath);
    if (!writerResult.ok()) {
        utils::GetLogger().Error("打开写入文件失败",
            utils::LogContext()
                .With("path", requestPath)
                .With("error", writerResult.error().what()));
        return Error::ErrWritingFile;
    }
    std::shared_ptr<FileWriter> writer = writerResult.value();

    nostrfs::Error writeErr;
    size_t written = 0;
    bool complete = true;
    if (ctx.request.bodyReader) {
        complete = ctx.request.bodyReader([&](const char* data, size_t length) {
            writeErr = writer->Write(data, length);
            written += length;
            return !writeErr.hasError();
        });
    }

    if (!complete || writeErr.hasError()) {
        writer->Abort();
        utils::GetLogger().Error("写入文件失败",
            utils::LogContext()
                .With("path", requestPath)
                .With("error", writeErr.hasError() ? writeErr.what() : "request body aborted"));
        return Error::ErrWritingFile;
    }

    writeErr = writer->Commit();
    if (writeErr.hasError()) {
        utils::GetLogger().Error("提交文件失败",
            utils::LogContext()
                .With("path", requestPath)
                .With("error", writeErr.what()));
        return Error::ErrWritingFile;
    }

    resp.status = 201;
    resp.body = "File created";
    resp.headers["Content-Type"] = TEXT_PLAIN;

    utils::GetLogger().Info("文件已保存",
        utils::LogContext()
            .With("path", requestPath)
            .With("pubkey", pubkey.value())
            .With("size", std::to_string(written)));
    return Error();
}

} // namespace handlers
} // namespace server
} // namespace nostrfs
