#ifndef TRANSFER_REGISTRY_HPP
#define TRANSFER_REGISTRY_HPP

#include <string>
#include <memory>
#include <vector>
#include <map>
#include <mutex>
#include <utility>
#include <functional>
#include <condition_variable>
#include "transfer_types.hpp"
#include "transfer_descriptor.hpp"
#include "transfer_engine.hpp"

// 注册表中的一项
// descriptor 和 handle 创建后不再修改；record 由 mutex 保护，状态变化时通知 changed
struct TransferEntry {
    TransferDescriptor descriptor;
    EngineHandle handle = 0;

    std::mutex mutex;
    std::condition_variable changed;
    TransferRecord record;
};

// info_hash -> 传输记录，唯一的数据来源
class TransferRegistry
{
public:
    TransferRegistry() = default;

    // 禁止拷贝构造和赋值
    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    // 查找或创建记录（整个过程持有注册表锁）
    // 已存在时直接返回 {entry, false}，不会调用 begin
    // 否则调用 begin 获取引擎句柄，创建 Queued 状态的记录并返回 {entry, true}
    // take_all 之后抛出 SessionClosedError
    std::pair<std::shared_ptr<TransferEntry>, bool> find_or_insert(
        const TransferDescriptor& descriptor,
        const std::string& save_path,
        const GoalConfig& goal,
        const std::function<EngineHandle()>& begin);

    // 未找到时返回空指针
    std::shared_ptr<TransferEntry> find(const std::string& fingerprint) const;
    std::shared_ptr<TransferEntry> find_by_handle(EngineHandle handle) const;

    // 未找到时抛出 NotFoundError
    std::shared_ptr<TransferEntry> get(const std::string& fingerprint) const;

    // 移除记录：持有注册表锁和记录锁调用 on_remove，随后删除记录并唤醒等待者
    // 未找到时抛出 NotFoundError
    void erase(const std::string& fingerprint, const std::function<void(TransferEntry&)>& on_remove);

    // 取出全部记录并清空注册表，之后不再接受新记录
    std::vector<std::shared_ptr<TransferEntry>> take_all();

    std::vector<std::shared_ptr<TransferEntry>> entries() const;
    std::vector<std::string> fingerprints() const;
    bool contains(const std::string& fingerprint) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<TransferEntry>> transfers_;
    std::map<EngineHandle, std::string> handles_;
    bool closed_ = false;
};

#endif // TRANSFER_REGISTRY_HPP
