#include "progress_reporter.hpp"
#include "seeding_policy.hpp"
#include "format_utils.hpp"
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cstdio>
#include <cctype>

ProgressSnapshot make_snapshot(const TransferRecord& record, const TransferDescriptor& descriptor,
                               Clock::time_point now)
{
    ProgressSnapshot snapshot;
    snapshot.fingerprint = record.fingerprint;
    snapshot.name = descriptor.name;
    snapshot.state = record.state;
    snapshot.total_size = descriptor.total_size;
    snapshot.downloaded_bytes = record.stats.downloaded_bytes;
    snapshot.uploaded_bytes = record.stats.uploaded_bytes;
    snapshot.download_rate = record.stats.download_rate;
    snapshot.upload_rate = record.stats.upload_rate;
    snapshot.peer_count = record.stats.peer_count;
    snapshot.seed_count = record.stats.seed_count;
    snapshot.ratio = seed_ratio(record.stats.uploaded_bytes, descriptor.total_size);
    snapshot.error_kind = record.error_kind;
    snapshot.error_message = record.error_message;

    if (descriptor.total_size > 0) {
        snapshot.progress = static_cast<double>(record.stats.downloaded_bytes) /
                            static_cast<double>(descriptor.total_size);
        snapshot.progress = std::min(1.0, std::max(0.0, snapshot.progress));
    }

    std::int64_t remaining = std::max<std::int64_t>(0, descriptor.total_size - record.stats.downloaded_bytes);
    if (remaining == 0) {
        snapshot.eta = std::chrono::seconds(0);
    } else if (record.stats.download_rate > 0) {
        // 向上取整，剩余字节不为 0 时 ETA 至少 1 秒
        std::int64_t rate = record.stats.download_rate;
        snapshot.eta = std::chrono::seconds((remaining + rate - 1) / rate);
    }

    if (record.seeding_started) {
        snapshot.seeding_time = std::chrono::duration_cast<std::chrono::seconds>(now - *record.seeding_started);
    }

    return snapshot;
}

std::string format_progress_line(const ProgressSnapshot& snapshot)
{
    std::string state = to_string(snapshot.state);
    std::transform(state.begin(), state.end(), state.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    // 进度条
    const int bar_width = 30;
    int filled = static_cast<int>(bar_width * snapshot.progress);
    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    char percent[16];
    snprintf(percent, sizeof(percent), "%.1f%%", snapshot.progress * 100.0);

    std::ostringstream oss;
    oss << state << " [" << bar << "] " << percent
        << " (" << format_bytes(snapshot.downloaded_bytes) << "/" << format_bytes(snapshot.total_size) << ")"
        << " ↓ " << format_speed(snapshot.download_rate)
        << " ↑ " << format_speed(snapshot.upload_rate)
        << " Peers: " << snapshot.peer_count
        << " Seeds: " << snapshot.seed_count
        << " ETA: " << (snapshot.eta ? format_duration(*snapshot.eta) : "∞");
    return oss.str();
}

void print_snapshot(const ProgressSnapshot& snapshot)
{
    char ratio[32];
    snprintf(ratio, sizeof(ratio), "%.2f", snapshot.ratio);

    std::cout << "=== Torrent 状态 ===" << std::endl;
    std::cout << "Info Hash: " << snapshot.fingerprint << std::endl;
    std::cout << "名称: " << snapshot.name << std::endl;
    std::cout << "状态: " << to_string(snapshot.state) << std::endl;
    std::cout << "进度: " << format_percent(snapshot.progress) << std::endl;
    std::cout << "已下载: " << format_bytes(snapshot.downloaded_bytes)
              << " / " << format_bytes(snapshot.total_size) << std::endl;
    std::cout << "已上传: " << format_bytes(snapshot.uploaded_bytes) << std::endl;
    std::cout << "分享率: " << ratio << std::endl;
    std::cout << "连接的对等节点数: " << snapshot.peer_count
              << " (做种: " << snapshot.seed_count << ")" << std::endl;
    std::cout << "上传速度: " << format_speed(snapshot.upload_rate) << std::endl;
    std::cout << "下载速度: " << format_speed(snapshot.download_rate) << std::endl;
    std::cout << "剩余时间: " << (snapshot.eta ? format_duration(*snapshot.eta) : "∞") << std::endl;
    if (snapshot.seeding_time) {
        std::cout << "做种时长: " << format_duration(*snapshot.seeding_time) << std::endl;
    }
    if (snapshot.error_kind != ErrorKind::None) {
        std::cout << "错误: " << snapshot.error_message << std::endl;
    }
    std::cout << std::endl;
}

ProgressReporter::ProgressReporter(const TransferRegistry& registry)
    : registry_(registry)
{
}

ProgressSnapshot ProgressReporter::snapshot(const std::string& fingerprint) const
{
    std::shared_ptr<TransferEntry> entry = registry_.get(fingerprint);

    std::lock_guard<std::mutex> lock(entry->mutex);
    return make_snapshot(entry->record, entry->descriptor, Clock::now());
}

std::vector<ProgressSnapshot> ProgressReporter::snapshot_all() const
{
    std::vector<ProgressSnapshot> result;
    const auto now = Clock::now();

    for (const auto& entry : registry_.entries()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        // 已被移除的记录不再返回
        if (entry->record.state == TransferState::Removed) {
            continue;
        }
        result.push_back(make_snapshot(entry->record, entry->descriptor, now));
    }

    return result;
}
