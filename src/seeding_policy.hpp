#ifndef SEEDING_POLICY_HPP
#define SEEDING_POLICY_HPP

#include <cstdint>
#include "transfer_types.hpp"
#include "engine_session.hpp"

// 分享率 = 上传量 / 总大小（按内容总大小计算，续传时之前下载的部分同样计入）
double seed_ratio(std::int64_t uploaded_bytes, std::int64_t total_size);

// 做种目标是否达成
// AnyGoal:  (设置了分享率 且 达到) 或 (设置了时长 且 达到)
// AllGoals: 所有已设置的目标均达到
// 两者都未设置时永远返回 false
bool seeding_goal_met(const GoalConfig& goal, std::int64_t uploaded_bytes, std::int64_t total_size,
                      const std::optional<Clock::time_point>& seeding_started, Clock::time_point now);

// 做种策略执行器：目标达成时停止做种
class SeedingPolicyEnforcer
{
public:
    explicit SeedingPolicyEnforcer(EngineSession& session);

    // 检查记录，若需要停止则暂停引擎并转为 Finished，返回是否停止
    bool enforce(TransferRecord& record, EngineHandle handle, std::int64_t total_size, Clock::time_point now);

private:
    EngineSession& session_;
};

#endif // SEEDING_POLICY_HPP
