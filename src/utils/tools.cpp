#include "nostrfs/utils/tools.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <cctype>

namespace nostrfs {
namespace utils {

Result<std::vector<uint8_t>> CalculateSHA256Hash(const std::vector<uint8_t>& data) {
    return _CalculateSHAHash(data, EVP_sha256());
}

Result<std::vector<uint8_t>> _CalculateSHAHash(const std::vector<uint8_t>& data, const EVP_MD* algorithm) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen;
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        return Error("创建MD上下文失败");
    }

    if (EVP_DigestInit_ex(mdctx, algorithm, nullptr) != 1) {
        EVP_MD_CTX_free(mdctx);
        return Error("初始化摘要失败");
    }

    if (EVP_DigestUpdate(mdctx, data.data(), data.size()) != 1) {
        EVP_MD_CTX_free(mdctx);
        return Error("更新摘要失败");
    }

    if (EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(mdctx);
        return Error("完成摘要失败");
    }

    EVP_MD_CTX_free(mdctx);
    return std::vector<uint8_t>(hash, hash + hashLen);
}

std::string HexEncode(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    ss << std::hex;
    for (size_t i = 0; i < data.size(); i++) {
        ss << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::vector<uint8_t> HexDecode(const std::string& hex) {
    std::vector<uint8_t> data;
    data.reserve(hex.size() / 2);

    // 验证输入格式
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    for (size_t i = 0; i < hex.size(); i += 2) {
        std::string byteString = hex.substr(i, 2);

        for (char c : byteString) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("Invalid hex character: " + std::string(1, c));
            }
        }

        data.push_back(static_cast<uint8_t>(std::stoul(byteString, nullptr, 16)));
    }
    return data;
}

bool IsLowerHex(const std::string& str, size_t length) {
    if (str.size() != length) {
        return false;
    }
    return std::all_of(str.begin(), str.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

std::string Base64Encode(const std::vector<uint8_t>& data) {
    // 每3字节输出4字符，外加结尾的'\0'
    std::string result(4 * ((data.size() + 2) / 3) + 1, '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&result[0]),
                              data.data(), static_cast<int>(data.size()));
    result.resize(len < 0 ? 0 : static_cast<size_t>(len));
    return result;
}

std::vector<uint8_t> Base64Decode(const std::string& base64) {
    // 同时接受标准和URL安全字母表，填充可省略
    std::string normalized = base64;
    std::replace(normalized.begin(), normalized.end(), '-', '+');
    std::replace(normalized.begin(), normalized.end(), '_', '/');

    size_t end = normalized.find_last_not_of('=');
    size_t padding = end == std::string::npos ? normalized.size() : normalized.size() - end - 1;
    normalized.resize(normalized.size() - padding);

    if (normalized.empty()) {
        throw std::runtime_error("Base64 decode failed: empty input");
    }
    if (padding > 2 || normalized.size() % 4 == 1) {
        throw std::runtime_error("Base64 decode failed: bad length");
    }
    for (char c : normalized) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '/') {
            throw std::runtime_error("Base64 decode failed: invalid character");
        }
    }

    size_t missing = (4 - normalized.size() % 4) % 4;
    normalized.append(missing, '=');

    std::vector<uint8_t> decoded(normalized.size() / 4 * 3);
    int decodedLen = EVP_DecodeBlock(decoded.data(),
                                     reinterpret_cast<const unsigned char*>(normalized.data()),
                                     static_cast<int>(normalized.size()));
    if (decodedLen < 0) {
        throw std::runtime_error("Base64 decode failed");
    }
    // EVP_DecodeBlock把填充也解码为0字节
    decoded.resize(static_cast<size_t>(decodedLen) - missing);
    return decoded;
}

std::vector<std::string> SplitPath(const std::string& path) {
    std::vector<std::string> segments;
    std::string segment;
    std::istringstream stream(path);
    while (std::getline(stream, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    return segments;
}

std::string TrimSlashes(const std::string& path) {
    size_t begin = path.find_first_not_of('/');
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = path.find_last_not_of('/');
    return path.substr(begin, end - begin + 1);
}

} // namespace utils
} // namespace nostrfs
