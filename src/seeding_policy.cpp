#include "seeding_policy.hpp"
#include "state_machine.hpp"
#include <iostream>
#include <cstdio>

double seed_ratio(std::int64_t uploaded_bytes, std::int64_t total_size)
{
    if (total_size <= 0) {
        return 0.0;
    }
    return static_cast<double>(uploaded_bytes) / static_cast<double>(total_size);
}

bool seeding_goal_met(const GoalConfig& goal, std::int64_t uploaded_bytes, std::int64_t total_size,
                      const std::optional<Clock::time_point>& seeding_started, Clock::time_point now)
{
    if (!goal.has_goal()) {
        return false;
    }

    bool ratio_met = false;
    if (goal.target_ratio) {
        // 用乘法比较，避免总大小为 0 时除零
        ratio_met = static_cast<double>(uploaded_bytes) >=
                    *goal.target_ratio * static_cast<double>(total_size);
    }

    bool time_met = false;
    if (goal.target_seed_time && seeding_started) {
        time_met = now - *seeding_started >= *goal.target_seed_time;
    }

    if (goal.policy == GoalPolicy::AllGoals) {
        return (!goal.target_ratio || ratio_met) && (!goal.target_seed_time || time_met);
    }
    return ratio_met || time_met;
}

SeedingPolicyEnforcer::SeedingPolicyEnforcer(EngineSession& session)
    : session_(session)
{
}

bool SeedingPolicyEnforcer::enforce(TransferRecord& record, EngineHandle handle,
                                    std::int64_t total_size, Clock::time_point now)
{
    if (record.state != TransferState::Seeding) {
        return false;
    }

    if (!seeding_goal_met(record.goal, record.stats.uploaded_bytes, total_size,
                          record.seeding_started, now)) {
        return false;
    }

    session_.pause(handle);
    apply_transition(record, TransferState::Finished, now);
    record.stats.download_rate = 0;
    record.stats.upload_rate = 0;

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        now - record.seeding_started.value_or(now));
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%.2f", seed_ratio(record.stats.uploaded_bytes, total_size));
    std::cout << "做种目标已达成 (info_hash: " << record.fingerprint.substr(0, 8)
              << "...，分享率: " << buffer << "，做种时长: " << elapsed.count() << "s)" << std::endl;
    return true;
}
