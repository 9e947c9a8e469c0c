#pragma once

#include <string>
#include <utility>

namespace nostrfs {
namespace server {

class Error {
public:
    Error() : code_(0), detail_("") {}
    Error(int code, std::string detail) : code_(code), detail_(std::move(detail)) {}

    int Code() const { return code_; }
    const std::string& Detail() const { return detail_; }

    Error WithDetail(const std::string& detail) const {
        return Error(code_, detail);
    }

    int HTTPStatusCode() const {
        switch (code_) {
            case 0: // NoError
                return 200; // OK
            case 1: // ErrUnauthorized
                return 401; // Unauthorized
            case 2: // ErrWrongPubkey
            case 3: // ErrInvalidTargetDir
                return 403; // Forbidden
            case 4: // ErrFileNotFound
                return 404; // Not Found
            case 5: // ErrCreatingDirectory
            case 6: // ErrWritingFile
            case 7: // ErrNoStorage
            case 8: // ErrUnknown
            default:
                return 500; // Internal Server Error
        }
    }

    // 静态错误定义
    static const Error ErrUnauthorized;
    static const Error ErrWrongPubkey;
    static const Error ErrInvalidTargetDir;
    static const Error ErrFileNotFound;
    static const Error ErrCreatingDirectory;
    static const Error ErrWritingFile;
    static const Error ErrNoStorage;
    static const Error ErrUnknown;

private:
    int code_;
    std::string detail_;
};

} // namespace server
} // namespace nostrfs
