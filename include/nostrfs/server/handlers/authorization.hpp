#pragma once

#include "nostrfs/server/server.hpp"
#include "nostrfs/crypto/schnorr.hpp"
#include "nostrfs/types.hpp"
#include <string>

namespace nostrfs {
namespace server {
namespace handlers {

// 解析 "Nostr <base64(事件JSON)>" 并验证签名，成功时返回事件公钥
Result<PublicKeyHex> VerifyAuthorizationHeader(const std::string& header, crypto::Verifier& verifier);

// 目标目录去掉空段后恰好只有一段且等于公钥时才可写
bool IsValidTargetDir(const std::string& targetDir, const PublicKeyHex& pubkey);

// 与IsValidTargetDir同一规则，失败时区分"公钥不符"和"目录结构无效"
Error CheckTargetDir(const std::string& targetDir, const PublicKeyHex& pubkey);

} // namespace handlers
} // namespace server
} // namespace nostrfs
