#ifndef TRANSFER_ENGINE_HPP
#define TRANSFER_ENGINE_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include "transfer_types.hpp"
#include "transfer_descriptor.hpp"

// 引擎内部的传输句柄
using EngineHandle = std::uint64_t;

// 引擎事件类型
enum class EngineEventKind {
    VerifyStarted,     // 开始校验已有数据
    VerifyDone,        // 校验完成
    PieceVerified,     // 分片校验通过
    Completed,         // 全部分片下载完成
    PeerCountChanged,  // peer/seed 数量变化
    RateSample,        // 统计数据采样
    DiskError,         // 磁盘写入失败
    FatalError         // 致命错误
};

// 引擎事件
struct EngineEvent {
    EngineHandle handle = 0;
    EngineEventKind kind = EngineEventKind::RateSample;
    bool all_pieces_present = false;      // VerifyDone：数据是否已完整
    int piece_index = -1;                 // PieceVerified
    int peer_count = 0;                   // PeerCountChanged
    int seed_count = 0;                   // PeerCountChanged
    std::optional<TransferStats> stats;   // 附带的统计数据（可选）
    std::string message;                  // DiskError / FatalError
};

const char* to_string(EngineEventKind kind);

// 底层传输引擎（黑盒）
// 实现可以在内部使用工作线程，但调用方保证同一时刻只有一个线程调用
class TransferEngine
{
public:
    virtual ~TransferEngine() = default;

    // 开始传输，返回句柄
    virtual EngineHandle begin(const TransferDescriptor& descriptor, const std::string& save_path) = 0;

    virtual void pause(EngineHandle handle) = 0;

    // 恢复传输，返回 true 表示引擎认为磁盘数据已过期，将先进行校验
    virtual bool resume(EngineHandle handle) = 0;

    // 强制重新校验
    virtual void force_recheck(EngineHandle handle) = 0;

    // 停止传输并释放引擎资源
    virtual void stop(EngineHandle handle, bool delete_files) = 0;

    // 取出已积累的事件（非阻塞）
    virtual std::vector<EngineEvent> poll_events() = 0;

    virtual TransferStats query_status(EngineHandle handle) const = 0;

    // 速度限制（字节/秒，0 表示无限制）
    virtual void set_rate_limit(EngineHandle handle, int upload_rate, int download_rate) = 0;
    virtual void set_global_rate_limit(int upload_rate, int download_rate) = 0;
};

#endif // TRANSFER_ENGINE_HPP
