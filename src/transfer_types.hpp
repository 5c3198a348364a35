#ifndef TRANSFER_TYPES_HPP
#define TRANSFER_TYPES_HPP

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>

// 单调时钟（做种计时、ETA 均基于此时钟）
using Clock = std::chrono::steady_clock;

// 传输生命周期状态
enum class TransferState {
    Queued,       // 已加入，等待引擎处理
    Checking,     // 校验已有数据
    Downloading,  // 下载中
    Paused,       // 已暂停
    Seeding,      // 做种中
    Finished,     // 做种结束
    Error,        // 出错（需要显式 remove 才会清除）
    Removed       // 已移除
};

// 错误类型（记录在 TransferRecord 上，通过 snapshot 暴露）
enum class ErrorKind {
    None,
    Disk,   // 磁盘写入失败
    Fatal   // 引擎报告的致命错误
};

// 同时设置分享率和做种时长时的判定方式
enum class GoalPolicy {
    AnyGoal,   // 任一目标达成即停止
    AllGoals   // 所有已设置的目标都达成才停止
};

// 做种目标配置
struct GoalConfig {
    std::optional<double> target_ratio;                 // 目标分享率（上传量 / 总大小）
    std::optional<std::chrono::seconds> target_seed_time; // 目标做种时长
    GoalPolicy policy = GoalPolicy::AnyGoal;

    bool has_goal() const { return target_ratio.has_value() || target_seed_time.has_value(); }
};

// 引擎上报的统计数据
struct TransferStats {
    std::int64_t downloaded_bytes;  // 已下载（字节）
    std::int64_t uploaded_bytes;    // 已上传（字节）
    int download_rate;              // 下载速度（字节/秒）
    int upload_rate;                // 上传速度（字节/秒）
    int peer_count;                 // 连接的 peer 数量
    int seed_count;                 // 连接的 seed 数量

    TransferStats()
        : downloaded_bytes(0)
        , uploaded_bytes(0)
        , download_rate(0)
        , upload_rate(0)
        , peer_count(0)
        , seed_count(0)
    {}
};

// 传输记录（仅由 TransferRegistry 持有）
struct TransferRecord {
    std::string fingerprint;
    TransferState state;
    std::string save_path;
    GoalConfig goal;
    std::optional<Clock::time_point> seeding_started;  // 仅在进入 SEEDING 时设置一次
    Clock::time_point created;
    TransferStats stats;
    ErrorKind error_kind;
    std::string error_message;

    TransferRecord()
        : state(TransferState::Queued)
        , created(Clock::now())
        , error_kind(ErrorKind::None)
    {}
};

// 进度快照（不可变值对象）
struct ProgressSnapshot {
    std::string fingerprint;
    std::string name;
    TransferState state = TransferState::Queued;
    double progress = 0.0;               // 完成度 [0, 1]
    std::int64_t total_size = 0;
    std::int64_t downloaded_bytes = 0;
    std::int64_t uploaded_bytes = 0;
    double ratio = 0.0;                  // 上传量 / 总大小
    int download_rate = 0;
    int upload_rate = 0;
    int peer_count = 0;
    int seed_count = 0;
    std::optional<std::chrono::seconds> eta;           // 为空表示无法估计（无穷大）
    std::optional<std::chrono::seconds> seeding_time;  // 已做种时长
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

// 状态名称（用于日志和命令行输出）
const char* to_string(TransferState state);

// 终态：不再接受自动处理
bool is_terminal(TransferState state);

#endif // TRANSFER_TYPES_HPP
