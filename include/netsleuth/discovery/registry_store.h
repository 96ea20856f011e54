#pragma once

#include <map>
#include <string>
#include <vector>

#include "netsleuth/discovery/device_profile.h"
#include "netsleuth/discovery/evidence.h"
#include "netsleuth/fs/filesystem.h"

namespace netsleuth::discovery {

// Durable record of the registry, keyed by address.
// load() returns the retained candidate history as evidence so that restoring
// goes through the normal merge path.
class RegistryStore {
public:
    virtual ~RegistryStore() = default;

    virtual std::vector<EvidenceRecord> load() = 0;
    virtual void save(const std::map<std::string, ProfilePtr>& profiles) = 0;
};

// YAML file on an IFileSystem. Saves go to "<path>.tmp" and are renamed over
// the previous file.
class YamlRegistryStore : public RegistryStore {
public:
    // fs may be null (no persistence): load() returns nothing, save() is a no-op.
    YamlRegistryStore(fs::IFileSystem* fs, std::string relativePath);

    std::vector<EvidenceRecord> load() override;
    void save(const std::map<std::string, ProfilePtr>& profiles) override;

private:
    fs::IFileSystem* _fs;
    std::string      _relPath; // e.g. "registry.yaml"
};

} // namespace netsleuth::discovery
