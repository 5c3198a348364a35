#include "engine_session.hpp"
#include "libtorrent_engine.hpp"
#include "transfer_errors.hpp"

EngineSession::EngineSession(std::unique_ptr<TransferEngine> engine)
    : engine_(std::move(engine))
{
}

EngineSession::~EngineSession()
{
    release();
}

std::unique_ptr<EngineSession> EngineSession::create(const SessionConfig& config)
{
    return std::make_unique<EngineSession>(std::make_unique<LibtorrentEngine>(config));
}

TransferEngine& EngineSession::engine_unsafe() const
{
    if (!engine_) {
        throw SessionClosedError();
    }
    return *engine_;
}

EngineHandle EngineSession::begin(const TransferDescriptor& descriptor, const std::string& save_path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_unsafe().begin(descriptor, save_path);
}

void EngineSession::pause(EngineHandle handle)
{
    std::lock_guard<std::mutex> lock(mutex_);
    engine_unsafe().pause(handle);
}

bool EngineSession::resume(EngineHandle handle)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_unsafe().resume(handle);
}

void EngineSession::force_recheck(EngineHandle handle)
{
    std::lock_guard<std::mutex> lock(mutex_);
    engine_unsafe().force_recheck(handle);
}

void EngineSession::stop(EngineHandle handle, bool delete_files)
{
    std::lock_guard<std::mutex> lock(mutex_);
    engine_unsafe().stop(handle, delete_files);
}

std::vector<EngineEvent> EngineSession::poll()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_unsafe().poll_events();
}

TransferStats EngineSession::query_status(EngineHandle handle) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_unsafe().query_status(handle);
}

void EngineSession::set_rate_limit(EngineHandle handle, int upload_rate, int download_rate)
{
    std::lock_guard<std::mutex> lock(mutex_);
    engine_unsafe().set_rate_limit(handle, upload_rate, download_rate);
}

void EngineSession::set_global_rate_limit(int upload_rate, int download_rate)
{
    std::lock_guard<std::mutex> lock(mutex_);
    engine_unsafe().set_global_rate_limit(upload_rate, download_rate);
}

void EngineSession::release()
{
    std::unique_ptr<TransferEngine> engine;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        engine = std::move(engine_);
    }
    // 在锁外析构，引擎关闭可能比较耗时
    engine.reset();
}

bool EngineSession::is_released() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return !engine_;
}
