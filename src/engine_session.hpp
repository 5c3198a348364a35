#ifndef ENGINE_SESSION_HPP
#define ENGINE_SESSION_HPP

#include <string>
#include <memory>
#include <vector>
#include <mutex>
#include "transfer_engine.hpp"
#include "session_config.hpp"

// 持有唯一的底层引擎实例，并串行化所有对引擎的调用
class EngineSession
{
public:
    explicit EngineSession(std::unique_ptr<TransferEngine> engine);
    ~EngineSession();

    // 禁止拷贝构造和赋值
    EngineSession(const EngineSession&) = delete;
    EngineSession& operator=(const EngineSession&) = delete;

    // 创建基于 libtorrent 的会话，失败时抛出 EngineInitError
    static std::unique_ptr<EngineSession> create(const SessionConfig& config);

    EngineHandle begin(const TransferDescriptor& descriptor, const std::string& save_path);
    void pause(EngineHandle handle);
    bool resume(EngineHandle handle);
    void force_recheck(EngineHandle handle);
    void stop(EngineHandle handle, bool delete_files);

    // 非阻塞地取出事件
    std::vector<EngineEvent> poll();

    TransferStats query_status(EngineHandle handle) const;

    void set_rate_limit(EngineHandle handle, int upload_rate, int download_rate);
    void set_global_rate_limit(int upload_rate, int download_rate);

    // 释放引擎，之后的调用抛出 SessionClosedError
    void release();
    bool is_released() const;

private:
    // 调用方必须已持有 mutex_
    TransferEngine& engine_unsafe() const;

private:
    mutable std::mutex mutex_;
    std::unique_ptr<TransferEngine> engine_;
};

#endif // ENGINE_SESSION_HPP
