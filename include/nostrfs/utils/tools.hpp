#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <openssl/evp.h>
#include "nostrfs/types.hpp"

namespace nostrfs {
namespace utils {

// 内部哈希计算函数
Result<std::vector<uint8_t>> _CalculateSHAHash(const std::vector<uint8_t>& data, const EVP_MD* algorithm);

// 计算数据的SHA-256哈希
Result<std::vector<uint8_t>> CalculateSHA256Hash(const std::vector<uint8_t>& data);

// 将字节数组转换为十六进制字符串（小写）
std::string HexEncode(const std::vector<uint8_t>& data);
// 将十六进制字符串转换为字节数组，格式错误时抛出std::invalid_argument
std::vector<uint8_t> HexDecode(const std::string& hex);
// 检查是否为指定长度的小写十六进制字符串
bool IsLowerHex(const std::string& str, size_t length);

// Base64编码
std::string Base64Encode(const std::vector<uint8_t>& data);
// Base64解码，输入不是合法Base64时抛出std::runtime_error
std::vector<uint8_t> Base64Decode(const std::string& base64);

// 按'/'切分路径并丢弃空段
std::vector<std::string> SplitPath(const std::string& path);
// 去掉首尾的'/'
std::string TrimSlashes(const std::string& path);

}
}
