#ifndef PROGRESS_REPORTER_HPP
#define PROGRESS_REPORTER_HPP

#include <string>
#include <vector>
#include "transfer_types.hpp"
#include "transfer_registry.hpp"

// 根据记录计算进度快照（调用方需持有记录锁）
// ETA = (总大小 - 已下载) / 下载速度（向上取整）；速度为 0 且未完成时 ETA 为空
ProgressSnapshot make_snapshot(const TransferRecord& record, const TransferDescriptor& descriptor,
                               Clock::time_point now);

// 单行进度，例如 "DOWNLOADING [█████░░░] 42.0% (1.00 MB/2.00 MB) ↓ 10.00 KB/s ↑ 0 B/s Peers: 3 Seeds: 1 ETA: 1m 40s"
std::string format_progress_line(const ProgressSnapshot& snapshot);

// 打印多行状态
void print_snapshot(const ProgressSnapshot& snapshot);

// 进度查询
class ProgressReporter
{
public:
    explicit ProgressReporter(const TransferRegistry& registry);

    // 未找到时抛出 NotFoundError
    ProgressSnapshot snapshot(const std::string& fingerprint) const;

    std::vector<ProgressSnapshot> snapshot_all() const;

private:
    const TransferRegistry& registry_;
};

#endif // PROGRESS_REPORTER_HPP
