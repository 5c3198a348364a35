#include "transfer_manager.hpp"
#include "transfer_errors.hpp"
#include "state_machine.hpp"
#include "format_utils.hpp"
#include <iostream>
#include <filesystem>
#include <stdexcept>

// 校验后返回配置副本，保证成员初始化前配置有效
static const SessionConfig& validated(const SessionConfig& config)
{
    config.validate();
    return config;
}

TransferManager::TransferManager(const SessionConfig& config)
    : config_(validated(config))
    , session_(EngineSession::create(config_))
    , enforcer_(*session_)
    , reporter_(registry_)
    , bridge_(*session_, registry_, enforcer_, config_.poll_interval, config_.log_events)
    , closed_(false)
{
    bridge_.start();
}

TransferManager::TransferManager(const SessionConfig& config, std::unique_ptr<TransferEngine> engine)
    : config_(validated(config))
    , session_(std::make_unique<EngineSession>(std::move(engine)))
    , enforcer_(*session_)
    , reporter_(registry_)
    , bridge_(*session_, registry_, enforcer_, config_.poll_interval, config_.log_events)
    , closed_(false)
{
    bridge_.start();
}

TransferManager::~TransferManager()
{
    shutdown();
}

void TransferManager::ensure_open() const
{
    if (closed_) {
        throw SessionClosedError();
    }
}

// 验证路径
void TransferManager::prepare_save_path(const std::string& save_path) const
{
    namespace fs = std::filesystem;

    if (!fs::exists(save_path)) {
        // 下载时：如果路径不存在则创建
        std::error_code ec;
        fs::create_directories(save_path, ec);
        if (ec) {
            std::cerr << "错误: 无法创建保存目录: " << save_path << std::endl;
            std::cerr << "原因: " << ec.message() << std::endl;
            throw TransferError("无法创建保存目录: " + save_path);
        }
        std::cout << "已创建保存目录: " << save_path << std::endl;
    } else if (!fs::is_directory(save_path)) {
        std::cerr << "错误: 保存路径不是目录: " << save_path << std::endl;
        throw TransferError("保存路径不是目录: " + save_path);
    }
}

std::string TransferManager::add(const std::vector<char>& descriptor_bytes, const std::string& save_path,
                                 const GoalConfig& goal)
{
    ensure_open();

    TransferDescriptor descriptor = parse_descriptor(descriptor_bytes);

    if (goal.target_ratio && *goal.target_ratio < 0.0) {
        throw std::invalid_argument("目标分享率不能为负数");
    }
    if (goal.target_seed_time && goal.target_seed_time->count() < 0) {
        throw std::invalid_argument("目标做种时长不能为负数");
    }

    const std::string path = save_path.empty() ? config_.download_dir : save_path;

    // 注册表已关闭时 find_or_insert 抛出 SessionClosedError，不会再启动新的传输
    auto result = registry_.find_or_insert(descriptor, path, goal, [&]() {
        // 仅在真正创建记录时准备目录，重复添加沿用第一次的保存路径
        prepare_save_path(path);
        return session_->begin(descriptor, path);
    });

    const std::string& info_hash = descriptor.fingerprint;
    if (!result.second) {
        std::cout << "该 torrent 已存在，返回现有记录（info_hash: " << info_hash.substr(0, 8) << "...）" << std::endl;
        return info_hash;
    }

    std::cout << "开始下载 [info_hash: " << info_hash.substr(0, 8) << "...]" << std::endl;
    std::cout << "名称: " << descriptor.name << std::endl;
    std::cout << "保存路径: " << path << std::endl;
    std::cout << "文件大小: " << format_bytes(descriptor.total_size)
              << "（" << descriptor.files.size() << " 个文件，" << descriptor.piece_count << " 个分片）" << std::endl;
    std::cout << "当前任务数: " << registry_.size() << std::endl;
    std::cout << std::endl;

    return info_hash;
}

std::string TransferManager::add_file(const std::string& torrent_path, const std::string& save_path,
                                      const GoalConfig& goal)
{
    std::cout << "Torrent 文件: " << torrent_path << std::endl;
    return add(read_descriptor_file(torrent_path), save_path, goal);
}

std::string TransferManager::add_from_source(const std::string& content_id, const DescriptorSupplier& supplier,
                                             const std::string& save_path, const GoalConfig& goal)
{
    std::vector<char> bytes = supplier(content_id);
    if (bytes.empty()) {
        throw ParseError("未获取到种子数据（ID: " + content_id + "）");
    }
    return add(bytes, save_path, goal);
}

ProgressSnapshot TransferManager::snapshot(const std::string& info_hash) const
{
    return reporter_.snapshot(info_hash);
}

std::vector<ProgressSnapshot> TransferManager::snapshot_all() const
{
    return reporter_.snapshot_all();
}

std::vector<std::string> TransferManager::list() const
{
    return registry_.fingerprints();
}

bool TransferManager::has_transfer(const std::string& info_hash) const
{
    return registry_.contains(info_hash);
}

size_t TransferManager::transfer_count() const
{
    return registry_.size();
}

// 暂停指定的 torrent
bool TransferManager::pause(const std::string& info_hash)
{
    std::shared_ptr<TransferEntry> entry = registry_.get(info_hash);

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        TransferRecord& record = entry->record;

        if (record.state == TransferState::Paused) {
            return true;
        }
        if (!can_transition(record.state, TransferState::Paused)) {
            std::cerr << "当前状态无法暂停: " << to_string(record.state)
                      << " (info_hash: " << info_hash.substr(0, 8) << "...)" << std::endl;
            return false;
        }

        session_->pause(entry->handle);
        apply_transition(record, TransferState::Paused, Clock::now());
        record.stats.download_rate = 0;
        record.stats.upload_rate = 0;
    }
    entry->changed.notify_all();

    std::cout << "已暂停 torrent (info_hash: " << info_hash.substr(0, 8) << "...)" << std::endl;
    return true;
}

// 恢复指定的 torrent
bool TransferManager::resume(const std::string& info_hash)
{
    std::shared_ptr<TransferEntry> entry = registry_.get(info_hash);

    bool stale = false;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        TransferRecord& record = entry->record;

        if (record.state != TransferState::Paused) {
            // 已经处于活动状态时视为成功
            return !is_terminal(record.state);
        }

        stale = session_->resume(entry->handle);
        apply_transition(record, stale ? TransferState::Checking : TransferState::Downloading, Clock::now());
    }
    entry->changed.notify_all();

    std::cout << "已恢复 torrent (info_hash: " << info_hash.substr(0, 8) << "...)"
              << (stale ? "，先重新校验数据" : "") << std::endl;
    return true;
}

bool TransferManager::stop_seeding(const std::string& info_hash)
{
    std::shared_ptr<TransferEntry> entry = registry_.get(info_hash);

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        TransferRecord& record = entry->record;

        if (record.state == TransferState::Finished) {
            return true;
        }
        if (record.state != TransferState::Seeding) {
            return false;
        }

        session_->pause(entry->handle);
        apply_transition(record, TransferState::Finished, Clock::now());
        record.stats.download_rate = 0;
        record.stats.upload_rate = 0;
    }
    entry->changed.notify_all();

    std::cout << "已停止做种 (info_hash: " << info_hash.substr(0, 8) << "...)" << std::endl;
    return true;
}

bool TransferManager::force_recheck(const std::string& info_hash)
{
    std::shared_ptr<TransferEntry> entry = registry_.get(info_hash);

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        TransferRecord& record = entry->record;

        if (record.state == TransferState::Checking) {
            return true;
        }
        if (!can_transition(record.state, TransferState::Checking)) {
            return false;
        }

        session_->force_recheck(entry->handle);
        apply_transition(record, TransferState::Checking, Clock::now());
    }
    entry->changed.notify_all();

    std::cout << "开始重新校验 (info_hash: " << info_hash.substr(0, 8) << "...)" << std::endl;
    return true;
}

// 移除指定的 torrent
void TransferManager::remove(const std::string& info_hash, bool delete_files)
{
    registry_.erase(info_hash, [&](TransferEntry& entry) {
        try {
            session_->stop(entry.handle, delete_files);
        } catch (const std::exception& e) {
            // 引擎侧失败时记录仍然移除
            std::cerr << "停止 torrent 时出错: " << e.what() << std::endl;
        }
        apply_transition(entry.record, TransferState::Removed, Clock::now());
    });

    std::cout << "已移除 torrent (info_hash: " << info_hash.substr(0, 8) << "...)"
              << (delete_files ? "，已删除文件" : "") << std::endl;
}

bool TransferManager::wait_for_completion(const std::string& info_hash, std::chrono::milliseconds timeout)
{
    std::shared_ptr<TransferEntry> entry = registry_.get(info_hash);

    const auto deadline = Clock::now() + timeout;
    std::unique_lock<std::mutex> lock(entry->mutex);
    entry->changed.wait_until(lock, deadline, [&entry]() {
        TransferState state = entry->record.state;
        return state == TransferState::Seeding ||
               state == TransferState::Finished ||
               state == TransferState::Error ||
               state == TransferState::Removed;
    });

    return entry->record.state == TransferState::Seeding ||
           entry->record.state == TransferState::Finished;
}

void TransferManager::set_rate_limit(const std::string& info_hash, int upload_rate, int download_rate)
{
    if (upload_rate < 0 || download_rate < 0) {
        throw std::invalid_argument("速度限制不能为负数");
    }
    std::shared_ptr<TransferEntry> entry = registry_.get(info_hash);
    session_->set_rate_limit(entry->handle, upload_rate, download_rate);
}

void TransferManager::set_global_rate_limit(int upload_rate, int download_rate)
{
    if (upload_rate < 0 || download_rate < 0) {
        throw std::invalid_argument("速度限制不能为负数");
    }
    ensure_open();
    session_->set_global_rate_limit(upload_rate, download_rate);
    config_.upload_rate_limit = upload_rate;
    config_.download_rate_limit = download_rate;
}

void TransferManager::shutdown()
{
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;

    std::cout << "正在关闭会话..." << std::endl;

    // 先停止 EventBridge，处理完已排队的事件
    bridge_.stop();

    // 停止所有传输（不删除文件）
    for (const auto& entry : registry_.take_all()) {
        {
            std::lock_guard<std::mutex> entry_lock(entry->mutex);
            try {
                session_->stop(entry->handle, false);
            } catch (const std::exception& e) {
                std::cerr << "停止 torrent 时出错: " << e.what() << std::endl;
            }
            apply_transition(entry->record, TransferState::Removed, Clock::now());
        }
        entry->changed.notify_all();
    }

    session_->release();
    std::cout << "会话已关闭" << std::endl;
}

bool TransferManager::is_shut_down() const
{
    return closed_;
}

// 打印所有 torrent 的状态
void TransferManager::print_all_status() const
{
    std::vector<ProgressSnapshot> snapshots = reporter_.snapshot_all();
    if (snapshots.empty()) {
        std::cout << "当前没有活动的 torrent" << std::endl;
        return;
    }

    std::cout << "=== 当前 Torrent 状态 (总数: " << snapshots.size() << ") ===" << std::endl;
    std::cout << std::endl;
    for (const auto& snapshot : snapshots) {
        print_snapshot(snapshot);
    }
}
