#include "state_machine.hpp"
#include <algorithm>

bool can_transition(TransferState from, TransferState to)
{
    if (from == TransferState::Removed) {
        return false;
    }
    if (to == TransferState::Removed) {
        return true;
    }

    switch (from) {
        case TransferState::Queued:
            return to == TransferState::Checking || to == TransferState::Error;
        case TransferState::Checking:
            return to == TransferState::Downloading ||
                   to == TransferState::Seeding ||
                   to == TransferState::Error;
        case TransferState::Downloading:
            return to == TransferState::Paused ||
                   to == TransferState::Seeding ||
                   to == TransferState::Checking ||
                   to == TransferState::Error;
        case TransferState::Paused:
            return to == TransferState::Downloading ||
                   to == TransferState::Checking ||
                   to == TransferState::Error;
        case TransferState::Seeding:
            return to == TransferState::Finished ||
                   to == TransferState::Checking ||
                   to == TransferState::Error;
        case TransferState::Finished:
        case TransferState::Error:
        case TransferState::Removed:
            return false;
    }
    return false;
}

bool apply_transition(TransferRecord& record, TransferState to, Clock::time_point now)
{
    if (!can_transition(record.state, to)) {
        return false;
    }

    if (to == TransferState::Seeding &&
        (record.state == TransferState::Checking || record.state == TransferState::Downloading) &&
        !record.seeding_started) {
        record.seeding_started = now;
    }

    record.state = to;
    return true;
}

// 合并统计数据：Checking 阶段以重新扫描的结果为准，其余阶段已下载量只增不减
static void merge_stats(TransferRecord& record, const TransferStats& stats)
{
    std::int64_t downloaded = stats.downloaded_bytes;
    if (record.state != TransferState::Checking) {
        downloaded = std::max(record.stats.downloaded_bytes, downloaded);
    }

    record.stats = stats;
    record.stats.downloaded_bytes = downloaded;
}

bool fold_event(TransferRecord& record, const EngineEvent& event,
                std::int64_t total_size, Clock::time_point now)
{
    // 终态不再接受引擎事件
    if (is_terminal(record.state)) {
        return false;
    }

    // 暂停期间统计数据冻结
    const bool frozen = record.state == TransferState::Paused;

    switch (event.kind) {
        case EngineEventKind::VerifyStarted:
            return apply_transition(record, TransferState::Checking, now);

        case EngineEventKind::VerifyDone: {
            bool changed = false;
            if (record.state == TransferState::Queued) {
                changed = apply_transition(record, TransferState::Checking, now);
            }
            if (record.state != TransferState::Checking) {
                return changed;
            }
            if (event.stats) {
                merge_stats(record, *event.stats);
            }
            return apply_transition(record,
                                    event.all_pieces_present ? TransferState::Seeding
                                                             : TransferState::Downloading,
                                    now) || changed;
        }

        case EngineEventKind::PieceVerified:
            return false;

        case EngineEventKind::Completed:
            if (record.state != TransferState::Downloading && record.state != TransferState::Checking) {
                return false;
            }
            if (event.stats) {
                merge_stats(record, *event.stats);
            }
            return apply_transition(record, TransferState::Seeding, now);

        case EngineEventKind::PeerCountChanged:
            if (!frozen) {
                record.stats.peer_count = event.peer_count;
                record.stats.seed_count = event.seed_count;
            }
            return false;

        case EngineEventKind::RateSample:
            if (frozen || !event.stats) {
                return false;
            }
            merge_stats(record, *event.stats);
            // 完成度达到 1.0 即进入做种
            if (record.state == TransferState::Downloading &&
                total_size > 0 && record.stats.downloaded_bytes >= total_size) {
                return apply_transition(record, TransferState::Seeding, now);
            }
            return false;

        case EngineEventKind::DiskError:
        case EngineEventKind::FatalError:
            if (!apply_transition(record, TransferState::Error, now)) {
                return false;
            }
            record.error_kind = event.kind == EngineEventKind::DiskError ? ErrorKind::Disk : ErrorKind::Fatal;
            record.error_message = event.message;
            return true;
    }

    return false;
}
