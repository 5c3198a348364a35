#ifndef TRANSFER_MANAGER_HPP
#define TRANSFER_MANAGER_HPP

#include <string>
#include <memory>
#include <vector>
#include <mutex>
#include <atomic>
#include <chrono>
#include "session_config.hpp"
#include "transfer_types.hpp"
#include "transfer_descriptor.hpp"
#include "transfer_engine.hpp"
#include "engine_session.hpp"
#include "transfer_registry.hpp"
#include "seeding_policy.hpp"
#include "progress_reporter.hpp"
#include "event_bridge.hpp"

// 传输管理器：对外的控制接口
// 每个实例持有一个独立的引擎会话，析构时自动 shutdown
class TransferManager
{
public:
    // 使用 libtorrent 引擎，会话初始化失败时抛出 EngineInitError
    explicit TransferManager(const SessionConfig& config = SessionConfig());

    // 使用指定的引擎
    TransferManager(const SessionConfig& config, std::unique_ptr<TransferEngine> engine);

    ~TransferManager();

    // 禁止拷贝构造和赋值
    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // 添加传输
    // descriptor_bytes: torrent 文件内容
    // save_path: 保存目录（为空时使用配置中的默认目录，不存在时自动创建）
    // 返回: info_hash；相同内容重复添加时返回已有记录的 info_hash
    // 数据格式错误时抛出 ParseError
    std::string add(const std::vector<char>& descriptor_bytes, const std::string& save_path,
                    const GoalConfig& goal = GoalConfig());

    // 从 torrent 文件添加
    std::string add_file(const std::string& torrent_path, const std::string& save_path,
                         const GoalConfig& goal = GoalConfig());

    // 通过 tracker 客户端获取种子数据后添加
    std::string add_from_source(const std::string& content_id, const DescriptorSupplier& supplier,
                                const std::string& save_path, const GoalConfig& goal = GoalConfig());

    // 获取进度快照，未找到时抛出 NotFoundError
    ProgressSnapshot snapshot(const std::string& info_hash) const;

    // 获取所有传输的快照
    std::vector<ProgressSnapshot> snapshot_all() const;

    // 所有传输的 info_hash
    std::vector<std::string> list() const;

    bool has_transfer(const std::string& info_hash) const;
    size_t transfer_count() const;

    // 暂停/恢复：已处于目标状态时直接返回 true，当前状态不允许时返回 false
    // 未找到时抛出 NotFoundError
    bool pause(const std::string& info_hash);
    bool resume(const std::string& info_hash);

    // 显式停止做种（Seeding -> Finished）
    bool stop_seeding(const std::string& info_hash);

    // 强制重新校验磁盘数据
    bool force_recheck(const std::string& info_hash);

    // 移除传输，可选择删除已下载的文件，未找到时抛出 NotFoundError
    void remove(const std::string& info_hash, bool delete_files = false);

    // 阻塞等待传输进入 Seeding 或 Finished，超时返回 false（不影响传输）
    bool wait_for_completion(const std::string& info_hash, std::chrono::milliseconds timeout);

    // 速度限制（字节/秒，0 表示无限制）
    void set_rate_limit(const std::string& info_hash, int upload_rate, int download_rate);
    void set_global_rate_limit(int upload_rate, int download_rate);

    // 停止所有传输（不删除文件）并释放会话，可重复调用
    void shutdown();
    bool is_shut_down() const;

    // 打印所有传输的状态
    void print_all_status() const;

    const SessionConfig& config() const { return config_; }

private:
    void ensure_open() const;

    // 验证保存路径，不存在时创建
    void prepare_save_path(const std::string& save_path) const;

private:
    SessionConfig config_;
    std::unique_ptr<EngineSession> session_;
    TransferRegistry registry_;
    SeedingPolicyEnforcer enforcer_;
    ProgressReporter reporter_;
    EventBridge bridge_;

    std::mutex shutdown_mutex_;
    std::atomic<bool> closed_;
};

#endif // TRANSFER_MANAGER_HPP
