#include "netsleuth/discovery/device_registry.h"

#include "netsleuth/core/logging.h"
#include "netsleuth/discovery/registry_store.h"
#include "netsleuth/discovery/scope.h"

#include <algorithm>
#include <exception>

namespace netsleuth::discovery {

static constexpr const char* TAG = "registry";

void rank_profiles(std::vector<ProfilePtr>& profiles)
{
    std::sort(profiles.begin(), profiles.end(), [](const ProfilePtr& a, const ProfilePtr& b) {
        if (a->overallConfidence != b->overallConfidence) {
            return a->overallConfidence > b->overallConfidence;
        }
        return compare_addresses(a->address, b->address) < 0;
    });
}

static bool same_scores(const DeviceProfile& a, const DeviceProfile& b)
{
    return a.candidates == b.candidates
        && a.firstSeenMs == b.firstSeenMs
        && a.lastSeenMs == b.lastSeenMs;
}

DeviceRegistry::DeviceRegistry(Correlator correlator)
    : _correlator(std::move(correlator))
{
}

std::vector<std::string> DeviceRegistry::upsert(const std::vector<EvidenceRecord>& batch)
{
    std::lock_guard<std::mutex> writeLock(_writeMx);

    // Only this (serialized) writer mutates _profiles, so reading the current
    // entries without _mapMx is safe here.
    ProfileMap existing;
    for (const auto& rec : batch) {
        auto it = _profiles.find(rec.address);
        if (it != _profiles.end() && existing.find(rec.address) == existing.end()) {
            existing.emplace(rec.address, *it->second);
        }
    }

    ProfileMap merged = _correlator.merge(existing, batch);

    std::vector<std::pair<std::string, ProfilePtr>> changes;
    for (auto& [address, profile] : merged) {
        auto prev = existing.find(address);
        if (prev != existing.end() && same_scores(prev->second, profile)) {
            continue;
        }
        changes.emplace_back(address, std::make_shared<const DeviceProfile>(std::move(profile)));
    }

    std::vector<std::string> touched;
    {
        std::unique_lock<std::shared_mutex> mapLock(_mapMx);
        for (auto& [address, profile] : changes) {
            const bool created = _profiles.find(address) == _profiles.end();
            NS_LOGD(TAG, "%s %s (overall %.3f)", created ? "created" : "updated",
                    address.c_str(), profile->overallConfidence);
            _profiles[address] = std::move(profile);
            touched.push_back(address);
        }
    }

    NS_LOGI(TAG, "Merged %zu evidence record(s); %zu profile(s) changed, %zu total",
            batch.size(), touched.size(), _profiles.size());
    return touched;
}

ProfilePtr DeviceRegistry::get(const std::string& address) const
{
    std::shared_lock<std::shared_mutex> lock(_mapMx);
    auto it = _profiles.find(address);
    return it == _profiles.end() ? nullptr : it->second;
}

std::vector<ProfilePtr> DeviceRegistry::list(double minConfidence) const
{
    std::vector<ProfilePtr> out;
    {
        std::shared_lock<std::shared_mutex> lock(_mapMx);
        for (const auto& kv : _profiles) {
            if (kv.second->overallConfidence >= minConfidence) {
                out.push_back(kv.second);
            }
        }
    }
    rank_profiles(out);
    return out;
}

std::vector<ProfilePtr> DeviceRegistry::list_seen_before(std::uint64_t cutoffMs) const
{
    std::vector<ProfilePtr> out;
    {
        std::shared_lock<std::shared_mutex> lock(_mapMx);
        for (const auto& kv : _profiles) {
            if (kv.second->lastSeenMs < cutoffMs) {
                out.push_back(kv.second);
            }
        }
    }
    std::sort(out.begin(), out.end(), [](const ProfilePtr& a, const ProfilePtr& b) {
        if (a->lastSeenMs != b->lastSeenMs) return a->lastSeenMs < b->lastSeenMs;
        return compare_addresses(a->address, b->address) < 0;
    });
    return out;
}

std::size_t DeviceRegistry::size() const
{
    std::shared_lock<std::shared_mutex> lock(_mapMx);
    return _profiles.size();
}

std::map<std::string, ProfilePtr> DeviceRegistry::snapshot() const
{
    std::shared_lock<std::shared_mutex> lock(_mapMx);
    return _profiles;
}

std::size_t DeviceRegistry::restore(RegistryStore& store)
{
    std::vector<EvidenceRecord> records;
    try {
        records = store.load();
    } catch (const std::exception& ex) {
        NS_LOGE(TAG, "Failed to load persisted registry: %s", ex.what());
        return 0;
    }

    if (records.empty()) {
        return 0;
    }

    // Persisted history goes through the same merge as fresh evidence.
    const auto touched = upsert(records);
    NS_LOGI(TAG, "Restored %zu profile(s) from %zu persisted candidate(s)",
            touched.size(), records.size());
    return touched.size();
}

bool DeviceRegistry::persist(RegistryStore& store) const
{
    try {
        store.save(snapshot());
    } catch (const std::exception& ex) {
        NS_LOGE(TAG, "Failed to persist registry: %s", ex.what());
        return false;
    }
    return true;
}

} // namespace netsleuth::discovery
