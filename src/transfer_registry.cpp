#include "transfer_registry.hpp"
#include "transfer_errors.hpp"

std::pair<std::shared_ptr<TransferEntry>, bool> TransferRegistry::find_or_insert(
    const TransferDescriptor& descriptor,
    const std::string& save_path,
    const GoalConfig& goal,
    const std::function<EngineHandle()>& begin)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (closed_) {
        throw SessionClosedError();
    }

    auto it = transfers_.find(descriptor.fingerprint);
    if (it != transfers_.end()) {
        return {it->second, false};
    }

    // begin 抛出异常时不插入任何记录
    EngineHandle handle = begin();

    auto entry = std::make_shared<TransferEntry>();
    entry->descriptor = descriptor;
    entry->handle = handle;
    entry->record.fingerprint = descriptor.fingerprint;
    entry->record.save_path = save_path;
    entry->record.goal = goal;

    transfers_[descriptor.fingerprint] = entry;
    handles_[handle] = descriptor.fingerprint;
    return {entry, true};
}

std::shared_ptr<TransferEntry> TransferRegistry::find(const std::string& fingerprint) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(fingerprint);
    if (it == transfers_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<TransferEntry> TransferRegistry::find_by_handle(EngineHandle handle) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(handle);
    if (it == handles_.end()) {
        return nullptr;
    }
    return transfers_.at(it->second);
}

std::shared_ptr<TransferEntry> TransferRegistry::get(const std::string& fingerprint) const
{
    auto entry = find(fingerprint);
    if (!entry) {
        throw NotFoundError(fingerprint);
    }
    return entry;
}

void TransferRegistry::erase(const std::string& fingerprint, const std::function<void(TransferEntry&)>& on_remove)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = transfers_.find(fingerprint);
    if (it == transfers_.end()) {
        throw NotFoundError(fingerprint);
    }

    std::shared_ptr<TransferEntry> entry = it->second;
    {
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        on_remove(*entry);
    }
    entry->changed.notify_all();

    handles_.erase(entry->handle);
    transfers_.erase(it);
}

std::vector<std::shared_ptr<TransferEntry>> TransferRegistry::take_all()
{
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;

    std::vector<std::shared_ptr<TransferEntry>> result;
    for (auto& pair : transfers_) {
        result.push_back(pair.second);
    }
    transfers_.clear();
    handles_.clear();
    return result;
}

std::vector<std::shared_ptr<TransferEntry>> TransferRegistry::entries() const
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::shared_ptr<TransferEntry>> result;
    for (const auto& pair : transfers_) {
        result.push_back(pair.second);
    }
    return result;
}

std::vector<std::string> TransferRegistry::fingerprints() const
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> result;
    for (const auto& pair : transfers_) {
        result.push_back(pair.first);
    }
    return result;
}

bool TransferRegistry::contains(const std::string& fingerprint) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.find(fingerprint) != transfers_.end();
}

size_t TransferRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.size();
}
