#include "netsleuth/probes/tcp_port_probe.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "netsleuth/core/logging.h"
#include "netsleuth/platform/time.h"

namespace netsleuth::probes {

static constexpr const char* TAG = "tcpscan";

// Upper bound on sockets open at once.
static constexpr std::size_t kMaxInFlight = 128;
static constexpr std::size_t kBannerBytes = 128;
static constexpr auto kPollInterval = std::chrono::milliseconds(5);

namespace {

struct Attempt {
    enum class State { Connecting, Open, Closed };

    std::string   host;
    std::uint32_t addr{0};
    std::uint16_t port{0};
    int           fd{-1};
    State         state{State::Closed};
    bool          bannerDone{false};
    std::string   banner;
};

// Closes whatever is still open when a chunk is left, including on throw.
class AttemptBatch {
public:
    explicit AttemptBatch(net::ITcpSocketOps& ops) : _ops(ops) {}
    ~AttemptBatch()
    {
        for (auto& a : attempts) {
            close(a);
        }
    }

    AttemptBatch(const AttemptBatch&) = delete;
    AttemptBatch& operator=(const AttemptBatch&) = delete;

    void close(Attempt& a)
    {
        if (a.fd >= 0) {
            _ops.close(a.fd);
            a.fd = -1;
        }
    }

    std::vector<Attempt> attempts;

private:
    net::ITcpSocketOps& _ops;
};

void start_connect(net::ITcpSocketOps& ops, AttemptBatch& batch, Attempt& a)
{
    a.fd = ops.socket_tcp4();
    if (a.fd < 0) {
        const int err = ops.last_errno();
        throw std::runtime_error(std::string("socket() failed: ") + ops.err_string(err));
    }

    if (ops.set_nonblocking(a.fd) != 0) {
        const int err = ops.last_errno();
        batch.close(a);
        throw std::runtime_error(std::string("set_nonblocking failed: ") + ops.err_string(err));
    }

    const int rc = ops.connect_ipv4(a.fd, a.addr, a.port);
    if (rc == 0) {
        a.state = Attempt::State::Open;
        return;
    }

    const int err = ops.last_errno();
    if (ops.is_in_progress(err)) {
        a.state = Attempt::State::Connecting;
        return;
    }

    a.state = Attempt::State::Closed;
    batch.close(a);
}

// Returns false if the probe was told to stop.
bool await_connects(net::ITcpSocketOps& ops, AttemptBatch& batch,
                    const discovery::ProbeContext& ctx, std::uint32_t connectTimeoutMs)
{
    const std::uint64_t started = platform::monotonic_ms();

    for (;;) {
        if (ctx.should_stop()) {
            return false;
        }

        const bool timedOut = platform::monotonic_ms() - started >= connectTimeoutMs;
        bool pending = false;

        for (auto& a : batch.attempts) {
            if (a.state != Attempt::State::Connecting) {
                continue;
            }
            if (ops.poll_connect_complete(a.fd)) {
                if (ops.get_so_error(a.fd) == 0) {
                    a.state = Attempt::State::Open;
                } else {
                    a.state = Attempt::State::Closed;
                    batch.close(a);
                }
            } else if (timedOut) {
                a.state = Attempt::State::Closed;
                batch.close(a);
            } else {
                pending = true;
            }
        }

        if (!pending) {
            return true;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

void read_banners(net::ITcpSocketOps& ops, AttemptBatch& batch,
                  const discovery::ProbeContext& ctx, std::uint32_t bannerWaitMs)
{
    const std::uint64_t started = platform::monotonic_ms();

    for (;;) {
        bool pending = false;
        for (auto& a : batch.attempts) {
            if (a.state != Attempt::State::Open || a.bannerDone) {
                continue;
            }
            if (!ops.poll_readable(a.fd)) {
                pending = true;
                continue;
            }

            char buf[kBannerBytes];
            const net::SSize n = ops.recv(a.fd, buf, sizeof(buf));
            if (n > 0) {
                a.banner = clean_banner(std::string_view(buf, static_cast<std::size_t>(n)));
                a.bannerDone = true;
            } else if (n == 0 || !ops.is_would_block(ops.last_errno())) {
                a.bannerDone = true;
            } else {
                pending = true;
            }
        }

        if (!pending || ctx.should_stop() ||
            platform::monotonic_ms() - started >= bannerWaitMs) {
            return;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

} // namespace

std::string clean_banner(std::string_view raw)
{
    const std::size_t eol = raw.find_first_of("\r\n");
    if (eol != std::string_view::npos) {
        raw = raw.substr(0, eol);
    }

    std::string out;
    for (char ch : raw) {
        if (ch >= 0x20 && ch < 0x7f) {
            out.push_back(ch);
        }
    }

    const auto first = out.find_first_not_of(' ');
    if (first == std::string::npos) {
        return {};
    }
    return out.substr(first, out.find_last_not_of(' ') - first + 1);
}

discovery::Probe make_tcp_port_probe(const config::TcpProbeConfig& cfg,
                                     net::ITcpSocketOps& ops)
{
    discovery::Probe p;
    p.descriptor.name         = kTcpPortsProbe;
    p.descriptor.outputFormat = "tcp";
    p.descriptor.kinds        = {discovery::AttributeKind::OpenServicePort,
                                 discovery::AttributeKind::ProtocolCapability,
                                 discovery::AttributeKind::DeviceClass};
    p.descriptor.trustWeight  = cfg.settings.trustWeight;
    p.descriptor.timeoutMs    = cfg.settings.timeoutMs;

    const config::TcpProbeConfig c = cfg;
    net::ITcpSocketOps* sockets = &ops;

    p.run = [c, sockets](const discovery::Scope& scope, discovery::ProbeContext& ctx) {
        if (c.ports.empty()) {
            return;
        }

        const std::vector<std::string> hosts = scope.hosts();
        const std::size_t hostsPerChunk = std::max<std::size_t>(1, kMaxInFlight / c.ports.size());

        std::size_t openTotal = 0;
        for (std::size_t begin = 0; begin < hosts.size(); begin += hostsPerChunk) {
            if (ctx.should_stop()) {
                return;
            }

            AttemptBatch batch(*sockets);
            const std::size_t end = std::min(hosts.size(), begin + hostsPerChunk);
            for (std::size_t h = begin; h < end; ++h) {
                std::uint32_t addr = 0;
                if (!discovery::parse_ipv4(hosts[h], addr)) {
                    continue;
                }
                for (std::uint16_t port : c.ports) {
                    Attempt a;
                    a.host = hosts[h];
                    a.addr = addr;
                    a.port = port;
                    batch.attempts.push_back(std::move(a));
                }
            }

            for (auto& a : batch.attempts) {
                start_connect(*sockets, batch, a);
            }

            if (!await_connects(*sockets, batch, ctx, c.connectTimeoutMs)) {
                return;
            }
            read_banners(*sockets, batch, ctx, c.bannerWaitMs);

            // attempts are grouped by host in insertion order
            discovery::RawFields fields;
            std::string current;
            auto flush = [&]() {
                if (!fields.empty()) {
                    ctx.emit(current, std::move(fields));
                }
                fields.clear();
            };

            for (const auto& a : batch.attempts) {
                if (a.host != current) {
                    flush();
                    current = a.host;
                }
                if (a.state != Attempt::State::Open) {
                    continue;
                }
                ++openTotal;
                fields.emplace_back("port", std::to_string(a.port));
                if (!a.banner.empty()) {
                    fields.emplace_back("banner:" + std::to_string(a.port), a.banner);
                }
            }
            flush();
        }

        NS_LOGD(TAG, "%s: %zu open port(s) across %zu host(s)",
                scope.to_string().c_str(), openTotal, hosts.size());
    };
    return p;
}

} // namespace netsleuth::probes
