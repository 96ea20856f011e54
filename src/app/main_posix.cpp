#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "netsleuth/config/engine_config_yaml_store.h"
#include "netsleuth/core/logging.h"
#include "netsleuth/discovery/discovery_engine.h"
#include "netsleuth/discovery/iot_hints.h"
#include "netsleuth/discovery/registry_store.h"
#include "netsleuth/fs/fs_stdio.h"
#include "netsleuth/platform/tcp_socket_ops.h"
#include "netsleuth/platform/time.h"
#include "netsleuth/probes/builtin_probes.h"

using namespace netsleuth;

static const char* TAG = "scan";

static void usage(const char* argv0)
{
    std::cerr << "usage: " << argv0 << " [config.yaml] [scope] [probe,probe,...]\n"
              << "  config.yaml  defaults to ./netsleuth.yaml (created if missing)\n"
              << "  scope        a.b.c.d or a.b.c.d/n, overrides discovery.scope\n"
              << "  probes       comma-separated, default: every enabled probe\n";
}

static std::vector<std::string> split_list(const std::string& s)
{
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

static void print_profile(const discovery::DeviceProfile& p, const discovery::IotHints& hints)
{
    std::printf("%-15s  confidence %.3f%s\n",
                p.address.c_str(),
                p.overallConfidence,
                discovery::is_likely_iot_device(p, hints) ? "  [iot]" : "");

    for (const auto& [kind, a] : p.attributes) {
        std::string sources;
        for (const auto& s : a.sources) {
            if (!sources.empty()) sources += ",";
            sources += s;
        }
        std::printf("    %-20s %-32s %.3f  (%s)\n",
                    std::string(discovery::to_string(kind)).c_str(),
                    a.chosenValue.c_str(),
                    a.confidence,
                    sources.c_str());
    }
}

int main(int argc, char** argv)
{
    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        usage(argv[0]);
        return 0;
    }

    NS_ELOG("netsleuth-scan starting");

    if (std::getenv("NETSLEUTH_VERBOSE")) {
        netsleuth::log::set_level(netsleuth::log::Level::Debug);
    }

    const std::string configPath = argc > 1 ? argv[1] : "netsleuth.yaml";

    auto cwdFs = fs::create_stdio_filesystem(".", "cwd");
    config::YamlEngineConfigStore configStore(cwdFs.get(), configPath);
    const config::EngineConfig cfg = configStore.load();

    if (!platform::time_is_valid()) {
        NS_LOGW(TAG, "System clock looks unset; first/last seen times will be wrong");
    }

    discovery::DiscoveryEngine engine(cfg);

    std::shared_ptr<fs::IFileSystem> hostFs = fs::create_stdio_filesystem("/", "host");
    if (!probes::register_builtin_probes(engine.probes(), cfg, hostFs,
                                         platform::default_tcp_socket_ops())) {
        NS_LOGE(TAG, "Built-in probe registration failed");
        return 1;
    }

    auto stateFs = fs::create_stdio_filesystem(cfg.discovery.stateDir, "state");
    if (!stateFs->createDirectory("/")) {
        NS_LOGW(TAG, "Cannot create state directory '%s'; registry will not persist",
                cfg.discovery.stateDir.c_str());
    }
    discovery::YamlRegistryStore registryStore(stateFs.get(), cfg.discovery.registryFile);

    const std::size_t restored = engine.registry().restore(registryStore);
    NS_LOGI(TAG, "Restored %zu device profile(s)", restored);

    discovery::DiscoveryRequest req = engine.default_request();
    if (argc > 2) {
        req.scope = argv[2];
    }
    if (argc > 3) {
        req.probes = split_list(argv[3]);
    }

    const discovery::DiscoveryReport report = engine.discover(req);
    if (report.status != discovery::DiscoveryStatus::Ok) {
        std::cerr << "error: " << report.message << "\n";
        usage(argv[0]);
        return 2;
    }

    for (const auto& p : report.profiles) {
        if (p->overallConfidence >= cfg.discovery.minConfidence) {
            print_profile(*p, cfg.iot);
        }
    }

    for (const auto& f : report.failures) {
        std::printf("probe %s: %s (%s)\n",
                    f.probe.c_str(), discovery::to_string(f.reason), f.detail.c_str());
    }

    std::printf("%zu evidence record(s), %zu device(s) in this run, %zu known\n",
                report.evidenceCount, report.profiles.size(), engine.registry().size());

    if (!engine.registry().persist(registryStore)) {
        NS_LOGE(TAG, "Failed to persist registry");
        return 1;
    }

    return 0;
}
