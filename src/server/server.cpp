#include "nostrfs/server/server.hpp"
#include <regex>
#include <strings.h>
#include <httplib.h>
#include "nostrfs/utils/logger.hpp"

namespace nostrfs {
namespace server {

bool Request::HasHeader(const std::string& name) const {
    for (const auto& header : headers) {
        if (strcasecmp(header.first.c_str(), name.c_str()) == 0) {
            return true;
        }
    }
    return false;
}

std::string Request::GetHeader(const std::string& name) const {
    for (const auto& header : headers) {
        if (strcasecmp(header.first.c_str(), name.c_str()) == 0) {
            return header.second;
        }
    }
    return "";
}

void Router::AddRoute(const std::string& method, const std::string& path, Handler handler) {
    routes_.push_back({method, path, handler});
}

bool Router::matchRoute(const std::string& path, const std::string& routePath,
                       std::map<std::string, std::string>& params) {
    // 把 {name:regex} 形式的参数替换为捕获组
    std::regex paramRegex("\\{([a-zA-Z0-9]+):(.*?)\\}");
    std::string regexPattern;

    std::smatch matches;
    std::string::const_iterator searchStart(routePath.cbegin());

    std::vector<std::string> paramNames;

    while (std::regex_search(searchStart, routePath.cend(), matches, paramRegex)) {
        regexPattern += std::string(searchStart, searchStart + matches.position());
        regexPattern += "(" + std::string(matches[2]) + ")";

        paramNames.push_back(matches[1]);

        searchStart += matches.position() + matches.length();
    }

    regexPattern += std::string(searchStart, routePath.cend());
    regexPattern = "^" + regexPattern + "$";

    std::regex fullRegex(regexPattern);
    std::smatch pathMatches;

    if (std::regex_match(path, pathMatches, fullRegex)) {
        for (size_t i = 0; i < paramNames.size(); ++i) {
            params[paramNames[i]] = pathMatches[i + 1].str();
        }
        return true;
    }

    return false;
}

Error Router::HandleRequest(const Context& ctx, Response& response) {
    for (const auto& route : routes_) {
        if (route.method == ctx.request.method) {
            std::map<std::string, std::string> params;
            if (matchRoute(ctx.request.path, route.path, params)) {
                Context newCtx = ctx;
                newCtx.request.params = params;

                utils::GetLogger().Debug("匹配到路由",
                    utils::LogContext()
                        .With("method", route.method)
                        .With("path", route.path)
                        .With("requestPath", ctx.request.path));

                return route.handler(newCtx, response);
            }
        }
    }

    utils::GetLogger().Warn("未找到匹配的路由",
        utils::LogContext()
            .With("method", ctx.request.method)
            .With("path", ctx.request.path));

    return handlers::NotFoundHandler(ctx, response);
}

Server::Server(const Config& config) : config_(config) {
    setupLogger();
    setupRoutes();
}

void Server::setupLogger() {
    utils::GetLogger().Initialize(
        config_.logging.level,
        config_.logging.format,
        config_.logging.output,
        config_.logging.file
    );

    utils::GetLogger().Info("初始化nostrfs服务器",
        utils::LogContext()
            .With("address", config_.addr)
            .With("rootDir", config_.rootDir)
            .With("logLevel", config_.logging.level)
            .With("logFormat", config_.logging.format));
}

void Server::setupRoutes() {
    router_.AddRoute("OPTIONS", "/{path:.*}", handlers::OptionsHandler);
    router_.AddRoute("GET", "/{path:.+}", handlers::GetHandler);
    router_.AddRoute("PUT", "/{path:.+}", handlers::PutHandler);

    utils::GetLogger().Debug("路由设置完成");
}

Response Server::Dispatch(const Request& request) {
    Context ctx;
    ctx.request = request;
    ctx.verifier = config_.verifier;
    ctx.storageService = config_.storageService;

    Response response;
    response.status = 200;

    Error err;
    try {
        err = router_.HandleRequest(ctx, response);
    } catch (const std::exception& e) {
        utils::GetLogger().Error("处理请求时发生异常",
            utils::LogContext()
                .With("exception", e.what())
                .With("method", request.method)
                .With("path", request.path));
        err = Error::ErrUnknown;
    }

    if (err.Code() != 0) { // 0 = NoError
        response.status = err.HTTPStatusCode();

        utils::GetLogger().Warn("请求处理出错",
            utils::LogContext()
                .With("code", std::to_string(err.Code()))
                .With("message", err.Detail())
                .With("statusCode", std::to_string(response.status))
                .With("method", request.method)
                .With("path", request.path));

        // 失败时返回纯文本消息，没有固定格式
        response.headers.clear();
        response.body = err.Detail();
        response.headers["Content-Type"] = "text/plain";
    }

    handlers::SetCorsHeaders(response);
    return response;
}

Error Server::Run() {
    utils::GetLogger().Info("启动nostrfs服务器",
        utils::LogContext().With("address", config_.addr));

    std::string host;
    int port;

    size_t colonPos = config_.addr.rfind(':');
    try {
        if (colonPos != std::string::npos) {
            host = config_.addr.substr(0, colonPos);
            port = std::stoi(config_.addr.substr(colonPos + 1));
        } else {
            host = "0.0.0.0";
            port = std::stoi(config_.addr);
        }
    } catch (const std::exception& e) {
        utils::GetLogger().Fatal("无效的监听地址",
            utils::LogContext()
                .With("address", config_.addr)
                .With("error", e.what()));
        return Error::ErrUnknown.WithDetail("invalid listen address: " + config_.addr);
    }

    httplib::Server server;

    server.set_default_headers({{"Server", "nostrfs/1.0"}});

    server.set_exception_handler([](const auto& req, auto& res, std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            // 非std异常只能记录类别
        }
        utils::GetLogger().Error("服务器异常",
            utils::LogContext()
                .With("exception", what)
                .With("path", req.path)
                .With("method", req.method));

        res.status = 500;
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, PUT, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
        res.set_content(Error::ErrUnknown.Detail(), "text/plain");
    });

    server.set_logger([](const auto& req, const auto& res) {
        utils::LogContext ctx;
        ctx.WithField("method", req.method);
        ctx.WithField("path", req.path);
        ctx.WithField("status", std::to_string(res.status));
        ctx.WithField("remoteAddr", req.remote_addr);

        // 根据状态码选择日志级别
        if (res.status >= 500) {
            utils::GetLogger().Error("HTTP请求完成", ctx);
        } else if (res.status >= 400) {
            utils::GetLogger().Warn("HTTP请求完成", ctx);
        } else {
            utils::GetLogger().Info("HTTP请求完成", ctx);
        }
    });

    server.Get(".*", [this](const httplib::Request& req, httplib::Response& res) {
        handleHttpRequest("GET", req, res, nullptr);
    });

    // PUT请求体不缓存在内存中，按块交给处理器
    server.Put(".*", [this](const httplib::Request& req, httplib::Response& res,
                            const httplib::ContentReader& reader) {
        handleHttpRequest("PUT", req, res, &reader);
    });

    server.Options(".*", [this](const httplib::Request& req, httplib::Response& res) {
        handleHttpRequest("OPTIONS", req, res, nullptr);
    });

    utils::GetLogger().Info("服务器开始监听",
        utils::LogContext()
            .With("host", host)
            .With("port", std::to_string(port)));

    if (!server.listen(host.c_str(), port)) {
        utils::GetLogger().Fatal("无法启动服务器",
            utils::LogContext()
                .With("host", host)
                .With("port", std::to_string(port)));
        return Error::ErrUnknown.WithDetail("无法启动服务器");
    }

    return Error();
}

void Server::handleHttpRequest(const std::string& method, const httplib::Request& req, httplib::Response& res,
                               const httplib::ContentReader* reader) {
    utils::GetLogger().Debug("开始处理HTTP请求",
        utils::LogContext()
            .With("method", method)
            .With("path", req.path)
            .With("remoteAddr", req.remote_addr));

    Request request;
    request.method = method;
    request.path = req.path;

    // 授权头不写入日志
    for (const auto& header : req.headers) {
        request.headers[header.first] = header.second;
    }

    if (reader) {
        request.bodyReader = [reader](const ContentReceiver& receiver) {
            return (*reader)([&receiver](const char* data, size_t length) {
                return receiver(data, length);
            });
        };
    } else {
        const std::string* body = &req.body;
        request.bodyReader = [body](const ContentReceiver& receiver) {
            return body->empty() || receiver(body->data(), body->size());
        };
    }

    Response response = Dispatch(request);

    std::string contentType;
    for (const auto& header : response.headers) {
        if (header.first == "Content-Type") {
            contentType = header.second;
            continue;
        }
        res.set_header(header.first.c_str(), header.second.c_str());
    }

    res.status = response.status;
    if (!contentType.empty()) {
        res.set_content(response.body, contentType.c_str());
    }
}

} // namespace server
} // namespace nostrfs
