#ifndef LIBTORRENT_ENGINE_HPP
#define LIBTORRENT_ENGINE_HPP

#include <string>
#include <memory>
#include <vector>
#include <map>
#include <libtorrent/session.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/torrent_status.hpp>
#include <libtorrent/alert.hpp>
#include "transfer_engine.hpp"
#include "session_config.hpp"

// 基于 libtorrent 的传输引擎
class LibtorrentEngine : public TransferEngine
{
public:
    // 创建 session 并应用配置，监听端口全部不可用时抛出 EngineInitError
    explicit LibtorrentEngine(const SessionConfig& config);
    ~LibtorrentEngine() override;

    // 禁止拷贝构造和赋值
    LibtorrentEngine(const LibtorrentEngine&) = delete;
    LibtorrentEngine& operator=(const LibtorrentEngine&) = delete;

    EngineHandle begin(const TransferDescriptor& descriptor, const std::string& save_path) override;
    void pause(EngineHandle handle) override;
    bool resume(EngineHandle handle) override;
    void force_recheck(EngineHandle handle) override;
    void stop(EngineHandle handle, bool delete_files) override;
    std::vector<EngineEvent> poll_events() override;
    TransferStats query_status(EngineHandle handle) const override;
    void set_rate_limit(EngineHandle handle, int upload_rate, int download_rate) override;
    void set_global_rate_limit(int upload_rate, int download_rate) override;

private:
    // 每个 torrent 的跟踪信息（用于把 alert 转换为事件）
    struct TrackedTorrent {
        lt::torrent_handle handle;
        bool checking = false;   // 是否已上报 VerifyStarted
        bool verified = false;   // 是否已上报过 VerifyDone
        int last_peers = -1;
        int last_seeds = -1;
    };

    // 初始化 session 设置
    void configure_session();

    // 等待监听端口就绪
    void wait_for_listen();

    const TrackedTorrent& find_torrent(EngineHandle handle) const;
    TrackedTorrent* find_torrent(const lt::torrent_handle& handle, EngineHandle& id);

    // 把单个 alert 转换为零个或多个事件
    void translate_alert(lt::alert* alert, std::vector<EngineEvent>& events);

    static TransferStats make_stats(const lt::torrent_status& status);

private:
    SessionConfig config_;
    std::unique_ptr<lt::session> session_;                // libtorrent 会话
    std::map<EngineHandle, TrackedTorrent> torrents_;
    std::map<lt::torrent_handle, EngineHandle> ids_;
    EngineHandle next_id_;
};

#endif // LIBTORRENT_ENGINE_HPP
