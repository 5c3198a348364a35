#include <iostream>
#include <string>
#ifdef _WIN32
#include <windows.h>
#endif
#include <libtorrent/version.hpp>
#include "transfer_manager.hpp"
#include "transfer_errors.hpp"
#include "progress_reporter.hpp"
#include "format_utils.hpp"
#include <cstdio>
#include <thread>
#include <chrono>

static void print_usage(const char* program)
{
    std::cout << "用法: " << program << " <torrent文件> [选项]" << std::endl;
    std::cout << std::endl;
    std::cout << "选项:" << std::endl;
    std::cout << "  -o, --output <目录>   下载保存目录（默认: storage/downloads）" << std::endl;
    std::cout << "  --seed                下载完成后继续做种" << std::endl;
    std::cout << "  --seed-ratio <R>      目标分享率（默认: 1.0）" << std::endl;
    std::cout << "  --seed-time <秒>      目标做种时长（默认: 3600）" << std::endl;
    std::cout << "  --all-goals           分享率和时长都达到才停止（默认任一达到即停止）" << std::endl;
    std::cout << "  --port <端口>         监听端口范围起点（默认: 6881）" << std::endl;
    std::cout << "  --up <KB/s>           上传速度限制（0 表示无限制）" << std::endl;
    std::cout << "  --down <KB/s>         下载速度限制（0 表示无限制）" << std::endl;
    std::cout << "  --no-dht              禁用 DHT" << std::endl;
    std::cout << "  --no-pex              禁用 Peer Exchange" << std::endl;
    std::cout << "  -v, --verbose         打印每个引擎事件" << std::endl;
    std::cout << std::endl;
    std::cout << "示例:" << std::endl;
    std::cout << "  " << program << " book.torrent -o downloads --seed --seed-ratio 2.0 --seed-time 7200" << std::endl;
}

int main(int argc, char* argv[])
{
#ifdef _WIN32
    // 设置控制台代码页为 UTF-8，解决中文乱码问题
    SetConsoleOutputCP(65001);
    SetConsoleCP(65001);
#endif

    std::cout << "=== torrent_fetch ===" << std::endl;
    std::cout << "LibTorrent Version: " << LIBTORRENT_VERSION << std::endl;
    std::cout << std::endl;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    SessionConfig config;
    GoalConfig goal;
    std::string torrent_path;
    std::string save_path;
    bool seed_after = false;
    double seed_ratio_target = 1.0;
    long long seed_time_target = 3600;
    bool all_goals = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if ((arg == "-o" || arg == "--output") && has_value) {
                save_path = argv[++i];
            } else if (arg == "--seed") {
                seed_after = true;
            } else if (arg == "--seed-ratio" && has_value) {
                seed_ratio_target = std::stod(argv[++i]);
            } else if (arg == "--seed-time" && has_value) {
                seed_time_target = std::stoll(argv[++i]);
            } else if (arg == "--all-goals") {
                all_goals = true;
            } else if (arg == "--port" && has_value) {
                config.listen_port_first = std::stoi(argv[++i]);
                config.listen_port_last = config.listen_port_first + 10;
            } else if (arg == "--up" && has_value) {
                config.upload_rate_limit = rate_from_kib(std::stoll(argv[++i]));
            } else if (arg == "--down" && has_value) {
                config.download_rate_limit = rate_from_kib(std::stoll(argv[++i]));
            } else if (arg == "--no-dht") {
                config.enable_dht = false;
            } else if (arg == "--no-pex") {
                config.enable_pex = false;
            } else if (arg == "-v" || arg == "--verbose") {
                config.log_events = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg[0] != '-' && torrent_path.empty()) {
                torrent_path = arg;
            } else {
                std::cerr << "未知参数: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "参数格式错误: " << e.what() << std::endl;
        return 1;
    }

    if (torrent_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    if (seed_after) {
        goal.target_ratio = seed_ratio_target;
        goal.target_seed_time = std::chrono::seconds(seed_time_target);
        goal.policy = all_goals ? GoalPolicy::AllGoals : GoalPolicy::AnyGoal;
    }

    try {
        TransferManager manager(config);

        std::string info_hash = manager.add_file(torrent_path, save_path, goal);

        // 等待下载完成
        while (!manager.wait_for_completion(info_hash, std::chrono::seconds(1))) {
            ProgressSnapshot snapshot = manager.snapshot(info_hash);
            if (snapshot.state == TransferState::Error) {
                std::cout << std::endl;
                std::cerr << "下载失败: " << snapshot.error_message << std::endl;
                return 1;
            }
            std::cout << "\r" << format_progress_line(snapshot) << std::flush;
        }

        std::cout << std::endl;
        std::cout << "✓ 下载完成: " << manager.snapshot(info_hash).name << std::endl;

        if (seed_after) {
            std::cout << std::endl;
            std::cout << "做种直到分享率达到 " << seed_ratio_target << (all_goals ? " 且" : " 或")
                      << "做种 " << format_duration(std::chrono::seconds(seed_time_target)) << "..." << std::endl;

            // 做种目标由 EventBridge 检查，达成后状态变为 Finished
            while (true) {
                ProgressSnapshot snapshot = manager.snapshot(info_hash);
                if (snapshot.state != TransferState::Seeding) {
                    break;
                }
                std::cout << "\r" << format_progress_line(snapshot) << std::flush;
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
            std::cout << std::endl;

            ProgressSnapshot final_snapshot = manager.snapshot(info_hash);
            if (final_snapshot.state == TransferState::Error) {
                std::cerr << "做种出错: " << final_snapshot.error_message << std::endl;
                return 1;
            }

            char ratio[32];
            snprintf(ratio, sizeof(ratio), "%.2f", final_snapshot.ratio);
            std::cout << "✓ 做种目标已达成 (分享率: " << ratio << ", 时长: "
                      << format_duration(final_snapshot.seeding_time.value_or(std::chrono::seconds(0)))
                      << ")" << std::endl;
        }

        std::cout << std::endl;
        manager.print_all_status();

        manager.shutdown();
        return 0;
    } catch (const ParseError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const EngineInitError& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "错误: " << e.what() << std::endl;
        return 1;
    }
}
