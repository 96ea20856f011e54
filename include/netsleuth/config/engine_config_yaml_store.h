#pragma once

#include <string>

#include "netsleuth/config/engine_config.h"
#include "netsleuth/fs/filesystem.h"

namespace netsleuth::config {

class YamlEngineConfigStore : public EngineConfigStore {
public:
    // fs can be null: load() then returns defaults and save() does nothing.
    YamlEngineConfigStore(fs::IFileSystem* fs, std::string relativePath);

    // Missing file -> defaults are written so the file exists next time.
    // Unparseable file -> logged, defaults returned.
    EngineConfig load() override;
    void save(const EngineConfig& cfg) override;

    // Parse YAML text on top of defaults. Throws on malformed YAML.
    static EngineConfig parse(const std::string& yamlText);
    static std::string  emit(const EngineConfig& cfg);

private:
    fs::IFileSystem* _fs;
    std::string      _relPath; // e.g. "netsleuth.yaml"
};

} // namespace netsleuth::config
