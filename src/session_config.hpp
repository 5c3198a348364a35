#ifndef SESSION_CONFIG_HPP
#define SESSION_CONFIG_HPP

#include <string>
#include <vector>
#include <chrono>
#include <utility>

// 会话配置（构造会话时一次性应用）
struct SessionConfig {
    // 监听端口范围 [listen_port_first, listen_port_last]
    int listen_port_first;
    int listen_port_last;

    bool enable_dht;      // DHT
    bool enable_pex;      // Peer Exchange
    bool enable_lsd;      // 本地服务发现
    bool enable_upnp;     // UPnP
    bool enable_natpmp;   // NAT-PMP

    // 全局速度限制（字节/秒，0 表示无限制）
    int upload_rate_limit;
    int download_rate_limit;

    int connections_limit;               // 全局最大连接数
    int max_connections_per_torrent;     // 每个 torrent 的最大连接数

    // DHT 引导节点
    std::vector<std::pair<std::string, int>> dht_routers;

    std::string download_dir;            // 默认保存目录

    std::chrono::milliseconds poll_interval;  // EventBridge 轮询间隔
    bool log_events;                          // 是否打印每个引擎事件

    SessionConfig();

    // 校验配置，出错时抛出 std::invalid_argument
    void validate() const;

    // 端口范围转换为 listen_interfaces 字符串
    std::string listen_interfaces() const;
};

// 命令行中的 KB/s 转换为字节/秒
// 负数或超出 int 范围时抛出 std::out_of_range
int rate_from_kib(long long kib_per_sec);

#endif // SESSION_CONFIG_HPP
