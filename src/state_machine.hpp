#ifndef STATE_MACHINE_HPP
#define STATE_MACHINE_HPP

#include <cstdint>
#include "transfer_types.hpp"
#include "transfer_engine.hpp"

// 状态转换表：
//   Queued      -> Checking, Error, Removed
//   Checking    -> Downloading, Seeding, Error, Removed
//   Downloading -> Paused, Seeding, Checking(重新校验), Error, Removed
//   Paused      -> Downloading, Checking, Error, Removed
//   Seeding     -> Finished, Checking(重新校验), Error, Removed
//   Finished    -> Removed
//   Error       -> Removed
bool can_transition(TransferState from, TransferState to);

// 执行状态转换，不允许时返回 false 且不修改记录
// 从 Checking/Downloading 进入 Seeding 时记录做种开始时间（只记录一次）
bool apply_transition(TransferRecord& record, TransferState to, Clock::time_point now);

// 把一个引擎事件折叠进记录，返回状态是否发生变化
bool fold_event(TransferRecord& record, const EngineEvent& event,
                std::int64_t total_size, Clock::time_point now);

#endif // STATE_MACHINE_HPP
