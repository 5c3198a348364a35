#ifndef TRANSFER_ERRORS_HPP
#define TRANSFER_ERRORS_HPP

#include <string>
#include <stdexcept>

// 所有传输相关错误的基类
class TransferError : public std::runtime_error
{
public:
    explicit TransferError(const std::string& message)
        : std::runtime_error(message)
    {}
};

// 种子数据格式错误（add 时立即抛出，不重试）
class ParseError : public TransferError
{
public:
    explicit ParseError(const std::string& message)
        : TransferError("解析种子失败: " + message)
    {}
};

// 未知的 info_hash
class NotFoundError : public TransferError
{
public:
    explicit NotFoundError(const std::string& fingerprint)
        : TransferError("未找到指定的 torrent (info_hash: " + fingerprint + ")")
        , fingerprint_(fingerprint)
    {}

    const std::string& fingerprint() const { return fingerprint_; }

private:
    std::string fingerprint_;
};

// 会话初始化失败（例如监听端口范围全部不可用）
class EngineInitError : public TransferError
{
public:
    explicit EngineInitError(const std::string& message)
        : TransferError("初始化会话失败: " + message)
    {}
};

// 会话已关闭后继续调用
class SessionClosedError : public TransferError
{
public:
    SessionClosedError()
        : TransferError("会话已关闭")
    {}
};

#endif // TRANSFER_ERRORS_HPP
