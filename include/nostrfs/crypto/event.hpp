#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "nostrfs/types.hpp"
#include "nostrfs/crypto/schnorr.hpp"

namespace nostrfs {
namespace crypto {

using json = nlohmann::json;

// 签名事件（授权头里携带的身份声明）
struct Event {
    std::string id;          // 可选，存在时必须与计算出的id一致
    std::string pubkey;      // 64位小写十六进制x-only公钥
    int64_t createdAt = 0;
    int64_t kind = 0;
    std::vector<std::vector<std::string>> tags;
    std::string content;
    std::string sig;         // 128位小写十六进制Schnorr签名
};

// 从JSON对象解析事件，缺少字段或类型不符时返回错误
Result<Event> EventFromJSON(const json& j);

// 从JSON文本解析事件
Result<Event> ParseEvent(const std::string& text);

json EventToJSON(const Event& event);

// 规范序列化: [0,pubkey,created_at,kind,tags,content]
Result<std::string> SerializeEvent(const Event& event);

// 事件id = sha256(规范序列化)，十六进制
Result<std::string> ComputeEventID(const Event& event);

// 校验id（如有）与签名
Error VerifyEvent(const Event& event, Verifier& verifier);

// 用私钥填充pubkey、id和sig
Error SignEvent(Event& event, const std::vector<uint8_t>& secretKey,
                const std::vector<uint8_t>& auxRand = std::vector<uint8_t>(32, 0));

} // namespace crypto
} // namespace nostrfs
