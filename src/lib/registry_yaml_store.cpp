#include "netsleuth/discovery/registry_store.h"

#include "netsleuth/core/logging.h"

#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace netsleuth::discovery {

static constexpr const char* TAG = "store";
static constexpr int kFormatVersion = 1;

static void remove_stale(fs::IFileSystem& fs, const std::string& path)
{
    if (fs.exists(path) && !fs.removeFile(path)) {
        NS_LOGW(TAG, "Could not remove stale '%s'", path.c_str());
    }
}

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

// ---------- from_yaml ----------

static void from_yaml(const YAML::Node& dev, std::vector<EvidenceRecord>& out)
{
    const auto address = get_or<std::string>(dev, "address", "");
    if (address.empty()) {
        NS_LOGW(TAG, "Skipping persisted device without address");
        return;
    }

    auto cands = dev["candidates"];
    if (!cands || !cands.IsSequence()) {
        return;
    }

    for (const auto& cn : cands) {
        const auto attrName = get_or<std::string>(cn, "attribute", "");
        auto kind = parse_attribute_kind(attrName);
        if (!kind) {
            NS_LOGW(TAG, "%s: unknown attribute '%s' in store; skipped",
                    address.c_str(), attrName.c_str());
            continue;
        }

        EvidenceRecord rec;
        rec.address      = address;
        rec.probe        = get_or<std::string>(cn, "probe", "");
        rec.trustWeight  = get_or<double>(cn, "trust_weight", 0.0);
        rec.observedAtMs = get_or<std::uint64_t>(cn, "observed_at_ms", 0);

        auto value = get_or<std::string>(cn, "value", "");
        if (rec.probe.empty() || value.empty() || !(rec.trustWeight > 0.0)) {
            continue;
        }
        rec.attributes.emplace(*kind, std::move(value));
        out.push_back(std::move(rec));
    }
}

// ---------- to_yaml ----------

static void to_yaml(YAML::Emitter& out, const DeviceProfile& p)
{
    out << YAML::BeginMap;
    out << YAML::Key << "address"            << YAML::Value << p.address;
    out << YAML::Key << "overall_confidence" << YAML::Value << p.overallConfidence;
    out << YAML::Key << "first_seen_ms"      << YAML::Value << p.firstSeenMs;
    out << YAML::Key << "last_seen_ms"       << YAML::Value << p.lastSeenMs;

    out << YAML::Key << "candidates" << YAML::Value << YAML::BeginSeq;
    for (const auto& [kind, log] : p.candidates) {
        for (const Candidate& c : log) {
            out << YAML::BeginMap;
            out << YAML::Key << "attribute"      << YAML::Value << std::string(to_string(kind));
            out << YAML::Key << "value"          << YAML::Value << c.value;
            out << YAML::Key << "probe"          << YAML::Value << c.probe;
            out << YAML::Key << "trust_weight"   << YAML::Value << c.trustWeight;
            out << YAML::Key << "observed_at_ms" << YAML::Value << c.observedAtMs;
            out << YAML::EndMap;
        }
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
}

// ---------- YamlRegistryStore ----------

YamlRegistryStore::YamlRegistryStore(fs::IFileSystem* fs, std::string relativePath)
    : _fs(fs)
    , _relPath(std::move(relativePath))
{
}

std::vector<EvidenceRecord> YamlRegistryStore::load()
{
    std::vector<EvidenceRecord> out;

    if (!_fs || !_fs->exists(_relPath)) {
        return out;
    }

    auto file = _fs->open(_relPath, "rb");
    if (!file) {
        NS_LOGE(TAG, "Cannot open '%s' on '%s'", _relPath.c_str(), _fs->name().c_str());
        return out;
    }

    const std::string text = fs::read_all(*file);
    if (text.empty()) {
        return out;
    }

    try {
        YAML::Node root = YAML::Load(text);

        const int version = get_or<int>(root, "version", kFormatVersion);
        if (version != kFormatVersion) {
            NS_LOGW(TAG, "'%s' has format version %d, expected %d; ignoring",
                    _relPath.c_str(), version, kFormatVersion);
            return out;
        }

        if (auto devs = root["devices"]; devs && devs.IsSequence()) {
            for (const auto& dn : devs) {
                from_yaml(dn, out);
            }
        }
    } catch (const std::exception& ex) {
        NS_LOGE(TAG, "Malformed registry '%s' on '%s': %s",
                _relPath.c_str(), _fs->name().c_str(), ex.what());
        out.clear();
        return out;
    }

    NS_LOGI(TAG, "Loaded %zu candidate(s) from '%s' on '%s'",
            out.size(), _relPath.c_str(), _fs->name().c_str());
    return out;
}

void YamlRegistryStore::save(const std::map<std::string, ProfilePtr>& profiles)
{
    if (!_fs) {
        return;
    }

    YAML::Emitter out;
    out.SetDoublePrecision(17);

    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << kFormatVersion;
    out << YAML::Key << "devices" << YAML::Value << YAML::BeginSeq;
    for (const auto& kv : profiles) {
        if (kv.second) {
            to_yaml(out, *kv.second);
        }
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    const std::string tmpPath = _relPath + ".tmp";
    {
        auto file = _fs->open(tmpPath, "wb");
        if (!file) {
            throw std::runtime_error("open for write failed: " + tmpPath);
        }
        try {
            fs::write_all(*file, out.c_str());
        } catch (const std::exception&) {
            file.reset();
            remove_stale(*_fs, tmpPath);
            throw;
        }
    }

    if (!_fs->rename(tmpPath, _relPath)) {
        remove_stale(*_fs, tmpPath);
        throw std::runtime_error("rename failed: " + tmpPath + " -> " + _relPath);
    }

    NS_LOGI(TAG, "Saved %zu profile(s) to '%s' on '%s'",
            profiles.size(), _relPath.c_str(), _fs->name().c_str());
}

} // namespace netsleuth::discovery
