#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "netsleuth/discovery/correlator.h"
#include "netsleuth/discovery/device_profile.h"
#include "netsleuth/discovery/evidence.h"

namespace netsleuth::discovery {

class RegistryStore;

/**
 * Address -> DeviceProfile map, the only mutable shared state of the engine.
 *
 * Writers go through upsert(), which holds a registry-wide write lock for the
 * whole correlate step so overlapping discovery runs cannot interleave partial
 * merges. Profiles are published as immutable snapshots, swapped in together
 * once the batch is merged: readers see the pre- or post-batch profile, never
 * an intermediate one, and are only blocked for the pointer swap.
 *
 * There is no deletion API; staleness is exposed via lastSeenMs.
 */
class DeviceRegistry {
public:
    explicit DeviceRegistry(Correlator correlator = Correlator{});

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Merge a batch of evidence. Returns the addresses whose profile changed or
    // was created, sorted.
    std::vector<std::string> upsert(const std::vector<EvidenceRecord>& batch);

    // nullptr if no evidence has ever been seen for `address`.
    ProfilePtr get(const std::string& address) const;

    // Profiles with overallConfidence >= minConfidence, by descending
    // confidence then ascending address.
    std::vector<ProfilePtr> list(double minConfidence = 0.0) const;

    // Profiles whose last corroborating evidence is older than `cutoffMs`
    // (UNIX ms), oldest first. Nothing is removed.
    std::vector<ProfilePtr> list_seen_before(std::uint64_t cutoffMs) const;

    std::size_t size() const;

    // Consistent copy of every profile, keyed by address.
    std::map<std::string, ProfilePtr> snapshot() const;

    // Replays persisted evidence through upsert(). Returns the number of
    // profiles restored.
    std::size_t restore(RegistryStore& store);

    // Persist the current snapshot. Returns false if the store failed.
    bool persist(RegistryStore& store) const;

    const Correlator& correlator() const noexcept { return _correlator; }

private:
    const Correlator _correlator;

    std::mutex _writeMx;                  // serializes upsert()
    mutable std::shared_mutex _mapMx;     // guards _profiles
    std::map<std::string, ProfilePtr> _profiles;
};

// Sort helper shared with the discovery engine.
void rank_profiles(std::vector<ProfilePtr>& profiles);

} // namespace netsleuth::discovery
