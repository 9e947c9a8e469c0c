#include "nostrfs/server/handlers/authorization.hpp"
#include "nostrfs/crypto/event.hpp"
#include "nostrfs/utils/logger.hpp"
#include "nostrfs/utils/tools.hpp"
#include <stdexcept>

namespace nostrfs {
namespace server {
namespace handlers {

Result<PublicKeyHex> VerifyAuthorizationHeader(const std::string& header, crypto::Verifier& verifier) {
    // 不记录原始头和解码后的事件，只记录失败类别
    if (header.compare(0, AUTH_SCHEME_PREFIX.size(), AUTH_SCHEME_PREFIX) != 0) {
        utils::GetLogger().Debug("授权头缺少方案前缀");
        return nostrfs::Error("missing authorization scheme");
    }

    std::vector<uint8_t> decoded;
    try {
        decoded = utils::Base64Decode(header.substr(AUTH_SCHEME_PREFIX.size()));
    } catch (const std::runtime_error& e) {
        utils::GetLogger().Debug("授权头Base64解码失败",
            utils::LogContext().With("error", e.what()));
        return nostrfs::Error("malformed base64");
    }

    auto event = crypto::ParseEvent(std::string(decoded.begin(), decoded.end()));
    if (!event.ok()) {
        utils::GetLogger().Debug("授权事件解析失败",
            utils::LogContext().With("error", event.error().what()));
        return event.error();
    }

    nostrfs::Error err = crypto::VerifyEvent(event.value(), verifier);
    if (err.hasError()) {
        utils::GetLogger().Debug("授权事件签名验证失败",
            utils::LogContext().With("error", err.what()));
        return err;
    }

    return event.value().pubkey;
}

bool IsValidTargetDir(const std::string& targetDir, const PublicKeyHex& pubkey) {
    auto segments = utils::SplitPath(targetDir);
    return segments.size() == 1 && segments[0] == pubkey;
}

Error CheckTargetDir(const std::string& targetDir, const PublicKeyHex& pubkey) {
    auto segments = utils::SplitPath(targetDir);
    if (segments.size() != 1) {
        return Error::ErrInvalidTargetDir;
    }
    if (segments[0] != pubkey) {
        return Error::ErrWrongPubkey;
    }
    return Error();
}

} // namespace handlers
} // namespace server
} // namespace nostrfs
