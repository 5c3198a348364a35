#include <catch2/catch.hpp>
#include <string>
#include <thread>
#include <vector>
#include <stdexcept>

#include "test_support.hpp"
#include "transfer_manager.hpp"
#include "transfer_errors.hpp"

using std::chrono::milliseconds;
using std::chrono::seconds;

static const std::int64_t kSize = 100000;

static std::unique_ptr<TransferManager> make_manager(const std::shared_ptr<FakeEngineState>& state)
{
  return std::make_unique<TransferManager>(fast_config(), std::make_unique<FakeEngine>(state));
}

// Queued -> Checking -> Downloading
static void start_downloading(FakeEngineState& state, EngineHandle handle)
{
  state.emit(handle, EngineEventKind::VerifyStarted);
  state.emit_verify_done(handle, false);
}

TEST_CASE("Add starts a transfer", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::vector<char> bytes = make_torrent_bytes("book.pdf", kSize);

  std::string fp = manager->add(bytes, test_save_path("add"));

  REQUIRE(fp == parse_descriptor(bytes).fingerprint);
  REQUIRE(manager->has_transfer(fp));
  REQUIRE(manager->transfer_count() == 1);
  REQUIRE(manager->list() == std::vector<std::string>{fp});
  REQUIRE(state->begin_count == 1);

  ProgressSnapshot snapshot = manager->snapshot(fp);
  REQUIRE(snapshot.name == "book.pdf");
  REQUIRE(snapshot.total_size == kSize);
  REQUIRE(snapshot.progress == 0.0);
  REQUIRE((snapshot.state == TransferState::Queued || snapshot.state == TransferState::Checking));
}

TEST_CASE("Adding the same torrent twice returns the existing record", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::vector<char> bytes = make_torrent_bytes("book.pdf", kSize);

  std::string first = manager->add(bytes, test_save_path("dup"));
  std::string second = manager->add(bytes, test_save_path("dup"));

  REQUIRE(first == second);
  REQUIRE(manager->transfer_count() == 1);
  REQUIRE(state->begin_count == 1);
}

TEST_CASE("Concurrent adds of the same torrent create one record", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::vector<char> bytes = make_torrent_bytes("shared.iso", kSize);

  const int thread_count = 8;
  std::vector<std::string> results(thread_count);
  std::vector<std::thread> threads;
  for (int i = 0; i < thread_count; ++i) {
    threads.emplace_back([&, i]() {
      results[i] = manager->add(bytes, test_save_path("concurrent"));
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  for (const auto& fp : results) {
    REQUIRE(fp == results[0]);
  }
  REQUIRE(manager->transfer_count() == 1);
  REQUIRE(state->begin_count == 1);
}

TEST_CASE("Invalid input is rejected", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);

  std::string garbage = "definitely not bencode";
  REQUIRE_THROWS_AS(manager->add(std::vector<char>(garbage.begin(), garbage.end()), test_save_path("bad")),
                    ParseError);
  REQUIRE(manager->transfer_count() == 0);
  REQUIRE(state->begin_count == 0);

  GoalConfig goal;
  goal.target_ratio = -1.0;
  REQUIRE_THROWS_AS(manager->add(make_torrent_bytes("a.bin", kSize), test_save_path("bad"), goal),
                    std::invalid_argument);
  REQUIRE(manager->transfer_count() == 0);
}

TEST_CASE("Unknown fingerprint", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  const std::string unknown = "ffffffffffffffffffffffffffffffffffffffff";

  REQUIRE_THROWS_AS(manager->snapshot(unknown), NotFoundError);
  REQUIRE_THROWS_AS(manager->pause(unknown), NotFoundError);
  REQUIRE_THROWS_AS(manager->resume(unknown), NotFoundError);
  REQUIRE_THROWS_AS(manager->remove(unknown), NotFoundError);
  REQUIRE_THROWS_AS(manager->wait_for_completion(unknown, milliseconds(10)), NotFoundError);
  REQUIRE_FALSE(manager->has_transfer(unknown));
}

TEST_CASE("Download completes and starts seeding", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::string fp = manager->add(make_torrent_bytes("movie.mkv", kSize), test_save_path("complete"));

  start_downloading(*state, 1);
  REQUIRE(wait_for_state(*manager, fp, TransferState::Downloading));

  state->emit_sample(1, kSize / 2, 0, 5000);
  state->emit(1, EngineEventKind::Completed);

  REQUIRE(manager->wait_for_completion(fp, seconds(2)));

  ProgressSnapshot snapshot = manager->snapshot(fp);
  REQUIRE(snapshot.state == TransferState::Seeding);
  REQUIRE(snapshot.seeding_time);
}

TEST_CASE("Wait for completion is woken by engine events", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::string fp = manager->add(make_torrent_bytes("movie.mkv", kSize), test_save_path("wake"));

  start_downloading(*state, 1);
  REQUIRE(wait_for_state(*manager, fp, TransferState::Downloading));

  std::thread engine([&state]() {
    std::this_thread::sleep_for(milliseconds(50));
    state->emit(1, EngineEventKind::Completed);
  });

  bool completed = manager->wait_for_completion(fp, seconds(5));
  engine.join();
  REQUIRE(completed);
}

TEST_CASE("Wait for completion timeout does not affect the transfer", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::string fp = manager->add(make_torrent_bytes("slow.bin", kSize), test_save_path("timeout"));

  start_downloading(*state, 1);
  REQUIRE(wait_for_state(*manager, fp, TransferState::Downloading));

  REQUIRE_FALSE(manager->wait_for_completion(fp, milliseconds(0)));
  REQUIRE_FALSE(manager->wait_for_completion(fp, milliseconds(30)));
  REQUIRE(manager->snapshot(fp).state == TransferState::Downloading);
  REQUIRE(state->stopped.empty());
}

TEST_CASE("Ratio goal finishes seeding", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);

  GoalConfig goal;
  goal.target_ratio = 1.0;
  std::string fp = manager->add(make_torrent_bytes("linux.iso", kSize), test_save_path("ratio"), goal);

  start_downloading(*state, 1);
  REQUIRE(wait_for_state(*manager, fp, TransferState::Downloading));

  state->emit_sample(1, kSize, kSize / 2, 0, 1000);
  REQUIRE(manager->wait_for_completion(fp, seconds(2)));
  wait_for_drain(*state);
  REQUIRE(manager->snapshot(fp).state == TransferState::Seeding);

  state->emit_sample(1, kSize, kSize, 0, 1000);
  REQUIRE(wait_for_state(*manager, fp, TransferState::Finished));

  ProgressSnapshot snapshot = manager->snapshot(fp);
  REQUIRE(snapshot.ratio >= 1.0);
  REQUIRE(snapshot.upload_rate == 0);
  REQUIRE(state->contains(state->paused, EngineHandle(1)));
}

TEST_CASE("Zero seed time finishes immediately", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);

  GoalConfig goal;
  goal.target_seed_time = seconds(0);
  std::string fp = manager->add(make_torrent_bytes("quick.bin", kSize), test_save_path("zero_time"), goal);

  state->emit(1, EngineEventKind::VerifyStarted);
  state->emit_verify_done(1, true);

  REQUIRE(wait_for_state(*manager, fp, TransferState::Finished));
  REQUIRE(manager->wait_for_completion(fp, milliseconds(10)));
}

TEST_CASE("Pause and resume keep progress", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::string fp = manager->add(make_torrent_bytes("big.bin", kSize), test_save_path("pause"));

  start_downloading(*state, 1);
  REQUIRE(wait_for_state(*manager, fp, TransferState::Downloading));
  state->emit_sample(1, 40000, 0, 2000);
  wait_for_drain(*state);
  REQUIRE(manager->snapshot(fp).downloaded_bytes == 40000);

  REQUIRE(manager->pause(fp));
  ProgressSnapshot paused = manager->snapshot(fp);
  REQUIRE(paused.state == TransferState::Paused);
  REQUIRE(paused.downloaded_bytes == 40000);
  REQUIRE(paused.download_rate == 0);
  REQUIRE(state->contains(state->paused, EngineHandle(1)));

  // 已暂停时再次暂停直接成功
  REQUIRE(manager->pause(fp));

  SECTION("resume continues downloading")
  {
    REQUIRE(manager->resume(fp));
    ProgressSnapshot resumed = manager->snapshot(fp);
    REQUIRE(resumed.state == TransferState::Downloading);
    REQUIRE(resumed.downloaded_bytes == 40000);
    REQUIRE(state->contains(state->resumed, EngineHandle(1)));

    // 活动状态下恢复视为成功
    REQUIRE(manager->resume(fp));
  }

  SECTION("resume with stale data rechecks first")
  {
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->stale_on_resume = true;
    }
    REQUIRE(manager->resume(fp));
    REQUIRE(manager->snapshot(fp).state == TransferState::Checking);

    state->emit_verify_done(1, false);
    REQUIRE(wait_for_state(*manager, fp, TransferState::Downloading));
  }
}

TEST_CASE("Pause is rejected while seeding", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::string fp = manager->add(make_torrent_bytes("seed.bin", kSize), test_save_path("seed_pause"));

  state->emit(1, EngineEventKind::VerifyStarted);
  state->emit_verify_done(1, true);
  REQUIRE(wait_for_state(*manager, fp, TransferState::Seeding));

  REQUIRE_FALSE(manager->pause(fp));
  REQUIRE(manager->snapshot(fp).state == TransferState::Seeding);
}

TEST_CASE("Stop seeding and recheck", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::string fp = manager->add(make_torrent_bytes("seed.bin", kSize), test_save_path("stop_seeding"));

  REQUIRE_FALSE(manager->stop_seeding(fp));

  state->emit(1, EngineEventKind::VerifyStarted);
  state->emit_verify_done(1, true);
  REQUIRE(wait_for_state(*manager, fp, TransferState::Seeding));
  const auto seeding_time = manager->snapshot(fp).seeding_time;
  REQUIRE(seeding_time);

  SECTION("recheck returns to seeding")
  {
    REQUIRE(manager->force_recheck(fp));
    REQUIRE(manager->snapshot(fp).state == TransferState::Checking);
    REQUIRE(state->contains(state->rechecked, EngineHandle(1)));

    state->emit_verify_done(1, true);
    REQUIRE(wait_for_state(*manager, fp, TransferState::Seeding));
    REQUIRE(*manager->snapshot(fp).seeding_time >= *seeding_time);
  }

  SECTION("stop seeding")
  {
    REQUIRE(manager->stop_seeding(fp));
    REQUIRE(manager->snapshot(fp).state == TransferState::Finished);
    REQUIRE(manager->stop_seeding(fp));
    REQUIRE_FALSE(manager->force_recheck(fp));
  }
}

TEST_CASE("Disk error is reported on the snapshot", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::string fp = manager->add(make_torrent_bytes("disk.bin", kSize), test_save_path("disk_error"));

  start_downloading(*state, 1);
  REQUIRE(wait_for_state(*manager, fp, TransferState::Downloading));

  EngineEvent event;
  event.handle = 1;
  event.kind = EngineEventKind::DiskError;
  event.message = "No space left on device";
  state->emit(event);

  REQUIRE_FALSE(manager->wait_for_completion(fp, seconds(2)));
  ProgressSnapshot snapshot = manager->snapshot(fp);
  REQUIRE(snapshot.state == TransferState::Error);
  REQUIRE(snapshot.error_kind == ErrorKind::Disk);
  REQUIRE(snapshot.error_message == "No space left on device");

  // 出错的记录保留，直到显式移除
  REQUIRE_FALSE(manager->pause(fp));
  REQUIRE_FALSE(manager->resume(fp));
  REQUIRE(manager->has_transfer(fp));

  manager->remove(fp);
  REQUIRE_FALSE(manager->has_transfer(fp));
}

TEST_CASE("Remove discards the record", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::vector<char> bytes = make_torrent_bytes("gone.bin", kSize);
  std::string fp = manager->add(bytes, test_save_path("remove"));

  manager->remove(fp, true);

  REQUIRE_THROWS_AS(manager->snapshot(fp), NotFoundError);
  REQUIRE_THROWS_AS(manager->remove(fp), NotFoundError);
  REQUIRE(manager->transfer_count() == 0);
  REQUIRE(state->contains(state->stopped, std::make_pair(EngineHandle(1), true)));

  // 已移除传输的剩余事件被忽略
  state->emit(1, EngineEventKind::Completed);
  wait_for_drain(*state);

  // 重新添加得到全新的记录
  std::string again = manager->add(bytes, test_save_path("remove"));
  REQUIRE(again == fp);
  REQUIRE(state->begin_count == 2);
  ProgressSnapshot snapshot = manager->snapshot(again);
  REQUIRE_FALSE(snapshot.seeding_time);
  REQUIRE(snapshot.state != TransferState::Seeding);
}

TEST_CASE("Remove wakes waiters", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::string fp = manager->add(make_torrent_bytes("waiter.bin", kSize), test_save_path("remove_wait"));

  std::thread remover([&]() {
    std::this_thread::sleep_for(milliseconds(50));
    manager->remove(fp);
  });

  REQUIRE_FALSE(manager->wait_for_completion(fp, seconds(5)));
  remover.join();
}

TEST_CASE("Add from source", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::vector<char> bytes = make_torrent_bytes("fetched.bin", kSize);

  std::string requested;
  DescriptorSupplier supplier = [&](const std::string& content_id) {
    requested = content_id;
    return bytes;
  };

  std::string fp = manager->add_from_source("42", supplier, test_save_path("source"));
  REQUIRE(requested == "42");
  REQUIRE(fp == parse_descriptor(bytes).fingerprint);

  DescriptorSupplier empty = [](const std::string&) { return std::vector<char>(); };
  REQUIRE_THROWS_AS(manager->add_from_source("43", empty, test_save_path("source")), ParseError);
}

TEST_CASE("Default save path comes from the config", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  SessionConfig config = fast_config();
  config.download_dir = test_save_path("default_dir");
  std::filesystem::remove_all(config.download_dir);

  TransferManager manager(config, std::make_unique<FakeEngine>(state));
  manager.add(make_torrent_bytes("default.bin", kSize), "");

  REQUIRE(std::filesystem::is_directory(config.download_dir));
}

TEST_CASE("Rate limits are forwarded to the engine", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::string fp = manager->add(make_torrent_bytes("limited.bin", kSize), test_save_path("limits"));

  manager->set_rate_limit(fp, 1000, 2000);
  manager->set_global_rate_limit(5000, 6000);
  REQUIRE_THROWS_AS(manager->set_rate_limit(fp, -1, 0), std::invalid_argument);

  std::lock_guard<std::mutex> lock(state->mutex);
  REQUIRE(state->limits[1] == std::make_pair(1000, 2000));
  REQUIRE(state->global_limit == std::make_pair(5000, 6000));
}

TEST_CASE("Snapshot all", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  manager->add(make_torrent_bytes("one.bin", kSize), test_save_path("all"));
  manager->add(make_torrent_bytes("two.bin", kSize), test_save_path("all"));

  std::vector<ProgressSnapshot> snapshots = manager->snapshot_all();
  REQUIRE(snapshots.size() == 2);
  for (const auto& snapshot : snapshots) {
    REQUIRE(snapshot.progress >= 0.0);
    REQUIRE(snapshot.progress <= 1.0);
  }
  REQUIRE_NOTHROW(manager->print_all_status());
}

TEST_CASE("Duplicate add does not create its save path", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::vector<char> bytes = make_torrent_bytes("dup_path.bin", kSize);

  std::string unused = test_save_path("dup_path_second");
  std::filesystem::remove_all(unused);

  manager->add(bytes, test_save_path("dup_path_first"));
  manager->add(bytes, unused);

  REQUIRE(std::filesystem::is_directory(test_save_path("dup_path_first")));
  REQUIRE_FALSE(std::filesystem::exists(unused));
  REQUIRE(state->begin_count == 1);
}

TEST_CASE("Shutdown stops all transfers", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);
  std::string first = manager->add(make_torrent_bytes("one.bin", kSize), test_save_path("shutdown"));
  manager->add(make_torrent_bytes("two.bin", kSize), test_save_path("shutdown"));

  manager->shutdown();

  REQUIRE(manager->is_shut_down());
  REQUIRE(manager->transfer_count() == 0);
  REQUIRE(state->contains(state->stopped, std::make_pair(EngineHandle(1), false)));
  REQUIRE(state->contains(state->stopped, std::make_pair(EngineHandle(2), false)));
  REQUIRE_THROWS_AS(manager->add(make_torrent_bytes("three.bin", kSize), test_save_path("shutdown")),
                    SessionClosedError);
  REQUIRE_THROWS_AS(manager->snapshot(first), NotFoundError);

  // 重复关闭无副作用
  REQUIRE_NOTHROW(manager->shutdown());
  REQUIRE(state->stopped.size() == 2);
}

TEST_CASE("Shutdown folds events queued before it", "[manager]")
{
  auto state = std::make_shared<FakeEngineState>();
  auto manager = make_manager(state);

  GoalConfig goal;
  goal.target_seed_time = seconds(0);
  std::string fp = manager->add(make_torrent_bytes("drain.bin", kSize), test_save_path("drain"), goal);

  start_downloading(*state, 1);
  REQUIRE(wait_for_state(*manager, fp, TransferState::Downloading));

  // 完成事件还在队列中时立即关闭
  state->emit(1, EngineEventKind::Completed);
  manager->shutdown();

  // 事件被折叠后做种目标生效（pause），之后才停止传输并释放引擎
  std::lock_guard<std::mutex> lock(state->mutex);
  REQUIRE(state->queue.empty());
  REQUIRE(state->queued_at_stop == std::vector<size_t>{0});
  REQUIRE(state->calls == std::vector<std::string>{"pause:1", "stop:1", "release"});
}

TEST_CASE("Add racing shutdown leaves no live transfer", "[manager]")
{
  for (int round = 0; round < 20; ++round) {
    auto state = std::make_shared<FakeEngineState>();
    auto manager = make_manager(state);

    std::vector<std::thread> adders;
    for (int i = 0; i < 4; ++i) {
      adders.emplace_back([&manager, round, i]() {
        std::string name = "race_" + std::to_string(round) + "_" + std::to_string(i) + ".bin";
        try {
          manager->add(make_torrent_bytes(name, kSize), test_save_path("race"));
        } catch (const SessionClosedError&) {
          // 关闭之后的添加被拒绝
        }
      });
    }
    manager->shutdown();
    for (auto& t : adders) {
      t.join();
    }

    REQUIRE(manager->transfer_count() == 0);

    // 每个已启动的传输都被停止
    std::lock_guard<std::mutex> lock(state->mutex);
    REQUIRE(state->stopped.size() == static_cast<size_t>(state->begin_count));
  }
}
