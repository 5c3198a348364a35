#ifndef EVENT_BRIDGE_HPP
#define EVENT_BRIDGE_HPP

#include <mutex>
#include <thread>
#include <chrono>
#include <condition_variable>
#include "engine_session.hpp"
#include "transfer_registry.hpp"
#include "seeding_policy.hpp"

// 后台线程：不断取出引擎事件并折叠进注册表中的记录
// 每一轮在事件处理完之后检查做种目标
class EventBridge
{
public:
    EventBridge(EngineSession& session, TransferRegistry& registry,
                SeedingPolicyEnforcer& enforcer, std::chrono::milliseconds poll_interval,
                bool log_events);
    ~EventBridge();

    // 禁止拷贝构造和赋值
    EventBridge(const EventBridge&) = delete;
    EventBridge& operator=(const EventBridge&) = delete;

    void start();

    // 停止线程；线程退出前会处理完引擎中已排队的事件
    void stop();

    // 执行一轮，返回处理的事件数
    size_t run_once();

private:
    void run();
    void fold(EngineEvent event, Clock::time_point now);
    void enforce_policies(Clock::time_point now);

private:
    EngineSession& session_;
    TransferRegistry& registry_;
    SeedingPolicyEnforcer& enforcer_;
    std::chrono::milliseconds poll_interval_;
    bool log_events_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_;
    bool running_;
};

#endif // EVENT_BRIDGE_HPP
