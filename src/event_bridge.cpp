#include "event_bridge.hpp"
#include "state_machine.hpp"
#include <iostream>
#include <stdexcept>

EventBridge::EventBridge(EngineSession& session, TransferRegistry& registry,
                         SeedingPolicyEnforcer& enforcer, std::chrono::milliseconds poll_interval,
                         bool log_events)
    : session_(session)
    , registry_(registry)
    , enforcer_(enforcer)
    , poll_interval_(poll_interval)
    , log_events_(log_events)
    , stop_requested_(false)
    , running_(false)
{
}

EventBridge::~EventBridge()
{
    stop();
}

void EventBridge::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    stop_requested_ = false;
    running_ = true;
    thread_ = std::thread(&EventBridge::run, this);
}

void EventBridge::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }
    wake_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

void EventBridge::run()
{
    while (true) {
        try {
            run_once();
        } catch (const std::exception& e) {
            std::cerr << "处理事件时出错: " << e.what() << std::endl;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (wake_.wait_for(lock, poll_interval_, [this] { return stop_requested_; })) {
            break;
        }
    }

    // 退出前处理已排队的事件
    try {
        run_once();
    } catch (const std::exception& e) {
        std::cerr << "处理剩余事件时出错: " << e.what() << std::endl;
    }
}

size_t EventBridge::run_once()
{
    std::vector<EngineEvent> events = session_.poll();

    const auto now = Clock::now();
    for (EngineEvent& event : events) {
        fold(std::move(event), now);
    }

    enforce_policies(now);
    return events.size();
}

void EventBridge::fold(EngineEvent event, Clock::time_point now)
{
    std::shared_ptr<TransferEntry> entry = registry_.find_by_handle(event.handle);
    if (!entry) {
        // 已移除的传输，忽略其剩余事件
        return;
    }

    if (log_events_) {
        std::cout << "事件 [info_hash: " << entry->descriptor.fingerprint.substr(0, 8) << "...] "
                  << to_string(event.kind) << std::endl;
    }

    // 状态推进类事件需要最新统计数据
    if (!event.stats &&
        (event.kind == EngineEventKind::VerifyDone || event.kind == EngineEventKind::Completed)) {
        try {
            event.stats = session_.query_status(entry->handle);
        } catch (const std::invalid_argument& e) {
            std::cerr << "查询状态失败: " << e.what() << std::endl;
        }
    }

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        TransferRecord& record = entry->record;
        TransferState previous = record.state;

        changed = fold_event(record, event, entry->descriptor.total_size, now);
        if (changed) {
            std::cout << "状态变化 [info_hash: " << record.fingerprint.substr(0, 8) << "...] "
                      << to_string(previous) << " -> " << to_string(record.state) << std::endl;
            if (record.state == TransferState::Seeding && previous != TransferState::Checking) {
                std::cout << "=== Torrent 完成！===" << std::endl;
            }
            if (record.state == TransferState::Error) {
                std::cerr << "Torrent 错误 [info_hash: " << record.fingerprint.substr(0, 8) << "...]: "
                          << record.error_message << std::endl;
            }
        }
    }

    if (changed) {
        entry->changed.notify_all();
    }
}

void EventBridge::enforce_policies(Clock::time_point now)
{
    for (const auto& entry : registry_.entries()) {
        bool stopped = false;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            stopped = enforcer_.enforce(entry->record, entry->handle, entry->descriptor.total_size, now);
        }
        if (stopped) {
            entry->changed.notify_all();
        }
    }
}
