#pragma once

#include <string>
#include <cstddef>
#include <utility>

namespace nostrfs {

// 授权方案常量
const std::string AUTH_SCHEME_PREFIX = "Nostr ";
const std::string AUTHORIZATION_HEADER = "Authorization";

// 密钥和签名长度（字节）
constexpr size_t PUBLIC_KEY_SIZE = 32;   // BIP-340 x-only公钥
constexpr size_t SIGNATURE_SIZE = 64;    // BIP-340 Schnorr签名
constexpr size_t EVENT_ID_SIZE = 32;     // sha256

// 十六进制形式的长度
constexpr size_t PUBLIC_KEY_HEX_LENGTH = PUBLIC_KEY_SIZE * 2;
constexpr size_t SIGNATURE_HEX_LENGTH = SIGNATURE_SIZE * 2;
constexpr size_t EVENT_ID_HEX_LENGTH = EVENT_ID_SIZE * 2;

// 错误类型
class Error {
public:
    explicit Error(const std::string& message) : message_(message), isError_(true) {}
    Error() : isError_(false) {}

    const std::string& what() const { return message_; }
    bool ok() const { return !isError_; }
    bool hasError() const { return isError_; }

private:
    std::string message_;
    bool isError_;
};

// 结果类型
template<typename T>
class Result {
public:
    Result() : hasError_(true) {}
    Result(const T& value) : value_(value), hasError_(false) {}
    Result(T&& value) : value_(std::move(value)), hasError_(false) {}
    Result(const Error& error) : error_(error), hasError_(true) {}

    bool ok() const { return !hasError_; }
    const T& value() const & { return value_; }
    T&& value() && { return std::move(value_); }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasError_;
};

// 公钥（身份）的十六进制字符串
using PublicKeyHex = std::string;

} // namespace nostrfs
