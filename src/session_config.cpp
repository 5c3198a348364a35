#include "session_config.hpp"
#include <stdexcept>
#include <limits>

SessionConfig::SessionConfig()
    : listen_port_first(6881)
    , listen_port_last(6891)
    , enable_dht(true)
    , enable_pex(true)
    , enable_lsd(true)
    , enable_upnp(true)
    , enable_natpmp(true)
    , upload_rate_limit(0)
    , download_rate_limit(0)
    , connections_limit(200)
    , max_connections_per_torrent(50)
    , dht_routers{
          {"router.bittorrent.com", 6881},
          {"router.utorrent.com", 6881},
          {"dht.transmissionbt.com", 6881}}
    , download_dir("storage/downloads")
    , poll_interval(200)
    , log_events(false)
{
}

void SessionConfig::validate() const
{
    if (listen_port_first < 0 || listen_port_last > 65535) {
        throw std::invalid_argument("监听端口超出范围");
    }
    if (listen_port_last < listen_port_first) {
        throw std::invalid_argument("监听端口范围无效");
    }
    if (upload_rate_limit < 0 || download_rate_limit < 0) {
        throw std::invalid_argument("速度限制不能为负数");
    }
    if (connections_limit <= 0 || max_connections_per_torrent <= 0) {
        throw std::invalid_argument("最大连接数必须大于 0");
    }
    if (poll_interval.count() <= 0) {
        throw std::invalid_argument("轮询间隔必须大于 0");
    }
}

std::string SessionConfig::listen_interfaces() const
{
    return "0.0.0.0:" + std::to_string(listen_port_first) +
           ",[::]:" + std::to_string(listen_port_first);
}

int rate_from_kib(long long kib_per_sec)
{
    if (kib_per_sec < 0 || kib_per_sec > std::numeric_limits<int>::max() / 1024) {
        throw std::out_of_range("速度限制超出范围: " + std::to_string(kib_per_sec) + " KB/s");
    }
    return static_cast<int>(kib_per_sec * 1024);
}
