#include <string>
#include <CLI/CLI.hpp>
#include "nostrfs/server/server.hpp"
#include "nostrfs/crypto/schnorr.hpp"
#include "nostrfs/utils/logger.hpp"
#include "nostrfs/server/storage/file_storage.hpp"

int main(int argc, char* argv[]) {
    CLI::App app{"nostrfs服务器 - 按公钥划分命名空间的文件存储"};

    std::string addr = "0.0.0.0:3000";
    std::string rootDir = "data";

    // 日志配置
    std::string logLevel = "info";
    std::string logFormat = "json";
    std::string logOutput = "console";
    std::string logFile = "nostrfs-server.log";

    app.add_option("--addr", addr, "服务器监听地址, 格式: host:port");
    app.add_option("--root-dir", rootDir, "文件存储根目录");

    app.add_option("--log-level", logLevel, "日志级别: debug, info, warn, error, fatal, panic");
    app.add_option("--log-format", logFormat, "日志格式: json, text");
    app.add_option("--log-output", logOutput, "日志输出: console, file");
    app.add_option("--log-file", logFile, "日志文件路径(当log-output为file时使用)");

    try {
        app.parse(argc, argv);
    } catch(const CLI::ParseError& e) {
        return app.exit(e);
    }

    nostrfs::utils::GetLogger().Initialize(logLevel, logFormat, logOutput, logFile);
    nostrfs::utils::GetLogger().WithField("service", "nostrfs-server");

    nostrfs::utils::GetLogger().Info("nostrfs服务器配置",
        nostrfs::utils::LogContext()
            .With("addr", addr)
            .With("rootDir", rootDir)
            .With("logLevel", logLevel)
            .With("logFormat", logFormat)
            .With("logOutput", logOutput));

    nostrfs::crypto::SchnorrVerifier verifier;
    nostrfs::server::storage::FileStorageService storage(rootDir);

    nostrfs::server::Config config;
    config.addr = addr;
    config.rootDir = rootDir;
    config.verifier = &verifier;
    config.storageService = &storage;

    config.logging.level = logLevel;
    config.logging.format = logFormat;
    config.logging.output = logOutput;
    config.logging.file = logFile;

    nostrfs::server::Server server(config);
    auto err = server.Run();
    if (err.Code() != 0) { // 0 = NoError
        nostrfs::utils::GetLogger().Fatal("服务器启动失败",
            nostrfs::utils::LogContext().With("error", err.Detail()));
        return 1;
    }

    return 0;
}
