#include "libtorrent_engine.hpp"
#include "transfer_errors.hpp"
#include <iostream>
#include <chrono>
#include <stdexcept>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/error_code.hpp>

LibtorrentEngine::LibtorrentEngine(const SessionConfig& config)
    : config_(config)
    , session_(nullptr)
    , next_id_(1)
{
    config_.validate();
    configure_session();
    wait_for_listen();
}

LibtorrentEngine::~LibtorrentEngine()
{
    // lt::session 析构时会等待内部线程退出
    session_.reset();
    std::cout << "libtorrent 会话已关闭" << std::endl;
}

// 初始化 session 设置
void LibtorrentEngine::configure_session()
{
    try {
        lt::settings_pack settings;
        settings.set_int(lt::settings_pack::alert_mask,
                         lt::alert_category::status |
                         lt::alert_category::error |
                         lt::alert_category::storage |
                         lt::alert_category::piece_progress);

        // 监听端口范围：从第一个端口开始依次尝试
        settings.set_str(lt::settings_pack::listen_interfaces, config_.listen_interfaces());
        settings.set_int(lt::settings_pack::max_retry_port_bind,
                         config_.listen_port_last - config_.listen_port_first);
        // 范围内端口全部不可用时不退回到系统分配的端口
        settings.set_bool(lt::settings_pack::listen_system_port_fallback, false);

        // DHT 及引导节点
        settings.set_bool(lt::settings_pack::enable_dht, config_.enable_dht);
        std::string routers;
        for (const auto& router : config_.dht_routers) {
            if (!routers.empty()) {
                routers += ",";
            }
            routers += router.first + ":" + std::to_string(router.second);
        }
        settings.set_str(lt::settings_pack::dht_bootstrap_nodes, routers);

        // 本地服务发现
        settings.set_bool(lt::settings_pack::enable_lsd, config_.enable_lsd);

        // UPnP 和 NAT-PMP
        settings.set_bool(lt::settings_pack::enable_upnp, config_.enable_upnp);
        settings.set_bool(lt::settings_pack::enable_natpmp, config_.enable_natpmp);

        // 上传/下载速度限制（0 表示无限制）
        settings.set_int(lt::settings_pack::download_rate_limit, config_.download_rate_limit);
        settings.set_int(lt::settings_pack::upload_rate_limit, config_.upload_rate_limit);

        // 最大连接数（支持并发下载和做种）
        settings.set_int(lt::settings_pack::connections_limit, config_.connections_limit);

        session_ = std::make_unique<lt::session>(settings);

        std::cout << "libtorrent 会话已初始化（监听端口 " << config_.listen_port_first
                  << "-" << config_.listen_port_last << "）" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "初始化 libtorrent 会话失败: " << e.what() << std::endl;
        throw EngineInitError(e.what());
    }
}

void LibtorrentEngine::wait_for_listen()
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    std::string last_error;

    while (std::chrono::steady_clock::now() < deadline) {
        if (session_->wait_for_alert(std::chrono::milliseconds(100)) == nullptr) {
            continue;
        }

        std::vector<lt::alert*> alerts;
        session_->pop_alerts(&alerts);

        bool succeeded = false;
        for (lt::alert* alert : alerts) {
            if (auto* lsa = lt::alert_cast<lt::listen_succeeded_alert>(alert)) {
                std::cout << "正在监听: " << lsa->message() << std::endl;
                succeeded = true;
            } else if (auto* lfa = lt::alert_cast<lt::listen_failed_alert>(alert)) {
                last_error = lfa->error.message();
                std::cerr << "监听失败: " << lfa->message() << std::endl;
            }
        }

        if (succeeded) {
            return;
        }
    }

    if (!session_->is_listening()) {
        session_.reset();
        throw EngineInitError("监听端口 " + std::to_string(config_.listen_port_first) + "-" +
                              std::to_string(config_.listen_port_last) + " 均不可用" +
                              (last_error.empty() ? "" : ": " + last_error));
    }
}

const LibtorrentEngine::TrackedTorrent& LibtorrentEngine::find_torrent(EngineHandle handle) const
{
    auto it = torrents_.find(handle);
    if (it == torrents_.end() || !it->second.handle.is_valid()) {
        throw std::invalid_argument("无效的引擎句柄: " + std::to_string(handle));
    }
    return it->second;
}

LibtorrentEngine::TrackedTorrent* LibtorrentEngine::find_torrent(const lt::torrent_handle& handle, EngineHandle& id)
{
    auto it = ids_.find(handle);
    if (it == ids_.end()) {
        return nullptr;
    }
    id = it->second;
    return &torrents_.at(id);
}

EngineHandle LibtorrentEngine::begin(const TransferDescriptor& descriptor, const std::string& save_path)
{
    lt::add_torrent_params params;
    params.ti = std::make_shared<lt::torrent_info>(*descriptor.info);
    params.save_path = save_path;
    params.flags |= lt::torrent_flags::auto_managed;
    params.flags &= ~lt::torrent_flags::paused;
    if (!config_.enable_pex) {
        params.flags |= lt::torrent_flags::disable_pex;
    }

    // 添加 torrent 到 session
    lt::error_code ec;
    lt::torrent_handle th = session_->add_torrent(std::move(params), ec);
    if (ec) {
        std::cerr << "错误: 添加 torrent 失败: " << ec.message() << std::endl;
        throw TransferError("添加 torrent 失败: " + ec.message());
    }

    th.set_max_connections(config_.max_connections_per_torrent);

    // 确保下载已开始
    th.resume();

    EngineHandle id = next_id_++;
    TrackedTorrent tracked;
    tracked.handle = th;
    torrents_[id] = tracked;
    ids_[th] = id;
    return id;
}

void LibtorrentEngine::pause(EngineHandle handle)
{
    const lt::torrent_handle& th = find_torrent(handle).handle;
    // 取消自动管理，否则队列调度会重新启动它
    th.unset_flags(lt::torrent_flags::auto_managed);
    th.pause();
}

bool LibtorrentEngine::resume(EngineHandle handle)
{
    const lt::torrent_handle& th = find_torrent(handle).handle;
    lt::torrent_status status = th.status();

    bool stale = false;
    if (status.errc) {
        // 暂停期间出现过存储错误，磁盘数据需要重新校验
        std::cout << "磁盘数据已过期，恢复前重新校验: " << status.errc.message() << std::endl;
        th.clear_error();
        th.force_recheck();
        stale = true;
    }

    th.set_flags(lt::torrent_flags::auto_managed);
    th.resume();
    return stale;
}

void LibtorrentEngine::force_recheck(EngineHandle handle)
{
    auto it = torrents_.find(handle);
    if (it == torrents_.end()) {
        throw std::invalid_argument("无效的引擎句柄: " + std::to_string(handle));
    }
    it->second.checking = false;
    it->second.verified = false;

    it->second.handle.force_recheck();
    it->second.handle.set_flags(lt::torrent_flags::auto_managed);
    it->second.handle.resume();
}

void LibtorrentEngine::stop(EngineHandle handle, bool delete_files)
{
    auto it = torrents_.find(handle);
    if (it == torrents_.end()) {
        throw std::invalid_argument("无效的引擎句柄: " + std::to_string(handle));
    }

    lt::torrent_handle th = it->second.handle;
    if (th.is_valid()) {
        lt::remove_flags_t flags = {};
        if (delete_files) {
            flags = lt::session::delete_files;
        }
        session_->remove_torrent(th, flags);
    }

    ids_.erase(th);
    torrents_.erase(it);
}

std::vector<EngineEvent> LibtorrentEngine::poll_events()
{
    std::vector<EngineEvent> events;

    // 请求状态更新，结果以 state_update_alert 的形式在下一次轮询中取到
    session_->post_torrent_updates();

    std::vector<lt::alert*> alerts;
    session_->pop_alerts(&alerts);
    for (lt::alert* alert : alerts) {
        translate_alert(alert, events);
    }

    return events;
}

void LibtorrentEngine::translate_alert(lt::alert* alert, std::vector<EngineEvent>& events)
{
    EngineHandle id = 0;

    if (auto* sca = lt::alert_cast<lt::state_changed_alert>(alert)) {
        TrackedTorrent* tracked = find_torrent(sca->handle, id);
        if (!tracked) {
            return;
        }

        EngineEvent event;
        event.handle = id;

        if (sca->state == lt::torrent_status::checking_files ||
            sca->state == lt::torrent_status::checking_resume_data) {
            if (!tracked->checking) {
                tracked->checking = true;
                event.kind = EngineEventKind::VerifyStarted;
                events.push_back(event);
            }
        } else if (sca->state == lt::torrent_status::downloading ||
                   sca->state == lt::torrent_status::finished ||
                   sca->state == lt::torrent_status::seeding) {
            // 没有经过校验阶段的 torrent 也补发一对校验事件，保证状态机按顺序推进
            if (tracked->checking || !tracked->verified) {
                if (!tracked->checking) {
                    event.kind = EngineEventKind::VerifyStarted;
                    events.push_back(event);
                }
                event.kind = EngineEventKind::VerifyDone;
                event.all_pieces_present = sca->state != lt::torrent_status::downloading;
                event.stats = make_stats(tracked->handle.status());
                events.push_back(event);
                tracked->checking = false;
                tracked->verified = true;
            }
        }
    } else if (auto* tfa = lt::alert_cast<lt::torrent_finished_alert>(alert)) {
        TrackedTorrent* tracked = find_torrent(tfa->handle, id);
        if (!tracked) {
            return;
        }
        EngineEvent event;
        event.handle = id;
        event.kind = EngineEventKind::Completed;
        event.stats = make_stats(tracked->handle.status());
        events.push_back(event);
    } else if (auto* pfa = lt::alert_cast<lt::piece_finished_alert>(alert)) {
        if (!find_torrent(pfa->handle, id)) {
            return;
        }
        EngineEvent event;
        event.handle = id;
        event.kind = EngineEventKind::PieceVerified;
        event.piece_index = static_cast<int>(pfa->piece_index);
        events.push_back(event);
    } else if (auto* hfa = lt::alert_cast<lt::hash_failed_alert>(alert)) {
        // 分片校验失败由引擎重新请求，不上报
        if (config_.log_events) {
            std::cout << "分片 " << static_cast<int>(hfa->piece_index) << " 校验失败，重新请求" << std::endl;
        }
    } else if (auto* fea = lt::alert_cast<lt::file_error_alert>(alert)) {
        std::cerr << "文件错误: " << fea->error.message() << std::endl;
        std::cerr << "  文件路径: " << fea->filename() << std::endl;
        if (!find_torrent(fea->handle, id)) {
            return;
        }
        EngineEvent event;
        event.handle = id;
        event.kind = EngineEventKind::DiskError;
        event.message = fea->error.message() + " (" + fea->filename() + ")";
        events.push_back(event);
    } else if (auto* tea = lt::alert_cast<lt::torrent_error_alert>(alert)) {
        std::cerr << "Torrent 错误: " << tea->error.message() << std::endl;
        if (!find_torrent(tea->handle, id)) {
            return;
        }
        EngineEvent event;
        event.handle = id;
        event.kind = EngineEventKind::FatalError;
        event.message = tea->error.message();
        events.push_back(event);
    } else if (auto* sua = lt::alert_cast<lt::state_update_alert>(alert)) {
        for (const lt::torrent_status& status : sua->status) {
            TrackedTorrent* tracked = find_torrent(status.handle, id);
            if (!tracked) {
                continue;
            }

            EngineEvent sample;
            sample.handle = id;
            sample.kind = EngineEventKind::RateSample;
            sample.stats = make_stats(status);
            events.push_back(sample);

            if (status.num_peers != tracked->last_peers || status.num_seeds != tracked->last_seeds) {
                tracked->last_peers = status.num_peers;
                tracked->last_seeds = status.num_seeds;

                EngineEvent peers;
                peers.handle = id;
                peers.kind = EngineEventKind::PeerCountChanged;
                peers.peer_count = status.num_peers;
                peers.seed_count = status.num_seeds;
                events.push_back(peers);
            }
        }
    } else if (auto* lfa = lt::alert_cast<lt::listen_failed_alert>(alert)) {
        std::cerr << "监听失败: " << lfa->message() << std::endl;
    }
}

TransferStats LibtorrentEngine::query_status(EngineHandle handle) const
{
    return make_stats(find_torrent(handle).handle.status());
}

void LibtorrentEngine::set_rate_limit(EngineHandle handle, int upload_rate, int download_rate)
{
    const lt::torrent_handle& th = find_torrent(handle).handle;
    // torrent 级别用 -1 表示无限制
    th.set_upload_limit(upload_rate > 0 ? upload_rate : -1);
    th.set_download_limit(download_rate > 0 ? download_rate : -1);
}

void LibtorrentEngine::set_global_rate_limit(int upload_rate, int download_rate)
{
    lt::settings_pack settings;
    settings.set_int(lt::settings_pack::upload_rate_limit, upload_rate);
    settings.set_int(lt::settings_pack::download_rate_limit, download_rate);
    session_->apply_settings(settings);

    config_.upload_rate_limit = upload_rate;
    config_.download_rate_limit = download_rate;
}

TransferStats LibtorrentEngine::make_stats(const lt::torrent_status& status)
{
    TransferStats stats;
    stats.downloaded_bytes = status.total_wanted_done;
    stats.uploaded_bytes = status.all_time_upload;
    stats.download_rate = status.download_rate;
    stats.upload_rate = status.upload_rate;
    stats.peer_count = status.num_peers;
    stats.seed_count = status.num_seeds;
    return stats;
}
