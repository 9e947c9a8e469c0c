#pragma once

#include <string>
#include <functional>
#include <memory>
#include <vector>
#include <map>
#include "nostrfs/crypto/schnorr.hpp"
#include "nostrfs/server/errors.hpp"
#include "nostrfs/types.hpp"

// 前向声明
namespace httplib {
    class Request;
    class Response;
    class ContentReader;
}

namespace nostrfs {
namespace server {

// 接收一块请求体数据，返回false表示中止读取
using ContentReceiver = std::function<bool(const char* data, size_t length)>;
// 逐块读取请求体，全部读完返回true，客户端断开等情况返回false
using BodyReader = std::function<bool(const ContentReceiver& receiver)>;

// 流式写入目标文件，Commit之前目标文件不可见
class FileWriter {
public:
    virtual ~FileWriter() = default;
    virtual nostrfs::Error Write(const char* data, size_t length) = 0;
    virtual nostrfs::Error Commit() = 0;
    virtual void Abort() = 0;
};

// 存储服务接口，路径均为请求路径（相对存储根目录）
class StorageService {
public:
    virtual ~StorageService() = default;

    // 递归创建目标文件的父目录
    virtual Result<bool> EnsureParentDirectory(const std::string& requestPath) = 0;

    // 打开目标文件的写入器
    virtual Result<std::shared_ptr<FileWriter>> OpenWriter(const std::string& requestPath) = 0;

    // 读取整个文件
    virtual Result<std::string> ReadFile(const std::string& requestPath) = 0;
};

// 请求和响应结构
struct Request {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    BodyReader bodyReader;
    std::map<std::string, std::string> params; // 路径参数

    // 头部名称不区分大小写
    bool HasHeader(const std::string& name) const;
    std::string GetHeader(const std::string& name) const;
};

struct Response {
    int status;
    std::map<std::string, std::string> headers;
    std::string body;
};

// 上下文
struct Context {
    Request request;
    crypto::Verifier* verifier;
    StorageService* storageService;
};

// 处理器函数类型
using Handler = std::function<Error(const Context&, Response&)>;

// 路由器
class Router {
public:
    void AddRoute(const std::string& method, const std::string& path, Handler handler);
    Error HandleRequest(const Context& ctx, Response& response);

private:
    struct Route {
        std::string method;
        std::string path;
        Handler handler;
    };
    std::vector<Route> routes_;

    // 匹配路由并提取参数
    bool matchRoute(const std::string& path, const std::string& routePath,
                   std::map<std::string, std::string>& params);
};

// 日志配置
struct LoggingConfig {
    std::string level = "info";     // 日志级别: debug, info, warn, error, fatal, panic
    std::string format = "json";    // 日志格式: json, text
    std::string output = "console"; // 日志输出: console, file
    std::string file = "nostrfs-server.log"; // 日志文件路径(当output为file时使用)
};

// 服务器配置
struct Config {
    std::string addr;
    std::string rootDir;
    LoggingConfig logging;
    crypto::Verifier* verifier;
    StorageService* storageService;
};

// 服务器
class Server {
public:
    explicit Server(const Config& config);
    Error Run();

    // 路由请求并把错误映射为状态码和纯文本消息，所有响应都带CORS头
    Response Dispatch(const Request& request);

private:
    void setupRoutes();
    void setupLogger();
    void handleHttpRequest(const std::string& method, const httplib::Request& req, httplib::Response& res,
                           const httplib::ContentReader* reader);

    Config config_;
    Router router_;
};

// 处理函数声明
namespace handlers {
    Error OptionsHandler(const Context& ctx, Response& resp);
    Error GetHandler(const Context& ctx, Response& resp);
    Error PutHandler(const Context& ctx, Response& resp);
    Error NotFoundHandler(const Context& ctx, Response& resp);

    // 根据扩展名返回Content-Type
    std::string GetContentType(const std::string& extension);

    void SetCorsHeaders(Response& resp);
}

} // namespace server
} // namespace nostrfs
