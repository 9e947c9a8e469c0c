#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "nostrfs/types.hpp"

namespace nostrfs {
namespace crypto {

// 验证器接口
class Verifier {
public:
    virtual ~Verifier() = default;
    virtual Error Verify(const std::vector<uint8_t>& publicKey,
                         const std::vector<uint8_t>& signature,
                         const std::vector<uint8_t>& message) = 0;
};

// BIP-340 Schnorr验证器（secp256k1，x-only公钥）
class SchnorrVerifier : public Verifier {
public:
    Error Verify(const std::vector<uint8_t>& publicKey,
                 const std::vector<uint8_t>& signature,
                 const std::vector<uint8_t>& message) override;
};

// BIP-340 标记哈希: sha256(sha256(tag) || sha256(tag) || data)
Result<std::vector<uint8_t>> TaggedHash(const std::string& tag, const std::vector<uint8_t>& data);

// 由32字节私钥计算x-only公钥
Result<std::vector<uint8_t>> SchnorrPublicKey(const std::vector<uint8_t>& secretKey);

// BIP-340签名，auxRand必须为32字节
Result<std::vector<uint8_t>> SchnorrSign(const std::vector<uint8_t>& secretKey,
                                         const std::vector<uint8_t>& message,
                                         const std::vector<uint8_t>& auxRand);

} // namespace crypto
} // namespace nostrfs
