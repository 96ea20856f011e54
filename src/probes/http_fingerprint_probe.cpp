#include "netsleuth/probes/http_fingerprint_probe.h"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// curl headers are only included in curl-specific files
#include <curl/curl.h>

#include "netsleuth/core/logging.h"

namespace netsleuth::probes {

static constexpr const char* TAG = "httpfp";

static constexpr int kWaitSliceMs = 100;

static void ensure_curl_global_init()
{
    static const bool inited = []{
        curl_global_init(CURL_GLOBAL_DEFAULT);
        return true;
    }();
    (void)inited;
}

namespace {

struct Target {
    std::string   host;
    std::uint16_t port{0};
};

struct Transfer {
    Target                   target;
    std::string              scheme;
    std::string              url;
    std::vector<std::string> headers;
    std::string              body;
    std::size_t              bodyCap{0};
    CURL*                    easy{nullptr};
};

struct MultiDeleter {
    void operator()(CURLM* m) const { curl_multi_cleanup(m); }
};

std::size_t write_body_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata)
{
    auto* t = static_cast<Transfer*>(userdata);
    if (!t) {
        return 0;
    }

    // Guard overflow: n = size * nmemb
    if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
        return 0;
    }

    const std::size_t n = size * nmemb;
    if (t->body.size() < t->bodyCap) {
        t->body.append(ptr, std::min(n, t->bodyCap - t->body.size()));
    }
    // Past the preview cap the rest is read and discarded.
    return n;
}

std::size_t write_header_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata)
{
    auto* t = static_cast<Transfer*>(userdata);
    if (!t) {
        return 0;
    }
    if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
        return 0;
    }

    const std::size_t n = size * nmemb;
    std::string line(ptr, n);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A redirect or 100-continue starts a new header block.
    if (line.rfind("HTTP/", 0) == 0) {
        t->headers.clear();
    } else if (!line.empty()) {
        t->headers.push_back(std::move(line));
    }
    return n;
}

// Owns every transfer attached to the multi handle.
class TransferSet {
public:
    explicit TransferSet(CURLM* multi) : _multi(multi) {}
    ~TransferSet()
    {
        for (auto& t : _active) {
            curl_multi_remove_handle(_multi, t->easy);
            curl_easy_cleanup(t->easy);
        }
    }

    TransferSet(const TransferSet&) = delete;
    TransferSet& operator=(const TransferSet&) = delete;

    bool add(std::unique_ptr<Transfer> t)
    {
        if (curl_multi_add_handle(_multi, t->easy) != CURLM_OK) {
            curl_easy_cleanup(t->easy);
            return false;
        }
        _active.push_back(std::move(t));
        return true;
    }

    std::unique_ptr<Transfer> take(CURL* easy)
    {
        for (auto it = _active.begin(); it != _active.end(); ++it) {
            if ((*it)->easy == easy) {
                std::unique_ptr<Transfer> t = std::move(*it);
                _active.erase(it);
                curl_multi_remove_handle(_multi, t->easy);
                return t;
            }
        }
        return nullptr;
    }

    std::size_t size() const noexcept { return _active.size(); }

private:
    CURLM*                                 _multi;
    std::vector<std::unique_ptr<Transfer>> _active;
};

std::unique_ptr<Transfer> make_transfer(const Target& target,
                                        const config::HttpProbeConfig& cfg,
                                        std::uint64_t remainingMs)
{
    auto t = std::make_unique<Transfer>();
    t->target  = target;
    t->scheme  = scheme_for_port(target.port);
    t->url     = t->scheme + "://" + target.host + ":" + std::to_string(target.port) + "/";
    t->bodyCap = cfg.bodyPreviewBytes;

    t->easy = curl_easy_init();
    if (!t->easy) {
        return nullptr;
    }

    const long timeoutMs = static_cast<long>(
        std::max<std::uint64_t>(1, std::min<std::uint64_t>(cfg.requestTimeoutMs, remainingMs)));

    curl_easy_setopt(t->easy, CURLOPT_URL, t->url.c_str());
    curl_easy_setopt(t->easy, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(t->easy, CURLOPT_WRITEFUNCTION, &write_body_cb);
    curl_easy_setopt(t->easy, CURLOPT_WRITEDATA, t.get());
    curl_easy_setopt(t->easy, CURLOPT_HEADERFUNCTION, &write_header_cb);
    curl_easy_setopt(t->easy, CURLOPT_HEADERDATA, t.get());
    curl_easy_setopt(t->easy, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(t->easy, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(t->easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(t->easy, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(t->easy, CURLOPT_USERAGENT, "netsleuth/1.0");

    // Embedded devices nearly always present self-signed certificates.
    curl_easy_setopt(t->easy, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(t->easy, CURLOPT_SSL_VERIFYHOST, 0L);

    return t;
}

void report(const Transfer& t, long status, discovery::ProbeContext& ctx)
{
    discovery::RawFields fields;
    fields.emplace_back("url", t.url);
    fields.emplace_back("scheme", t.scheme);
    fields.emplace_back("port", std::to_string(t.target.port));
    fields.emplace_back("status", std::to_string(status));
    for (const auto& h : t.headers) {
        fields.emplace_back("header", h);
    }
    fields.emplace_back("body", t.body);
    ctx.emit(t.target.host, std::move(fields));
}

} // namespace

std::string scheme_for_port(std::uint16_t port)
{
    return (port == 443 || port == 8443) ? "https" : "http";
}

discovery::Probe make_http_fingerprint_probe(const config::HttpProbeConfig& cfg)
{
    discovery::Probe p;
    p.descriptor.name         = kHttpFingerprintProbe;
    p.descriptor.outputFormat = "http";
    p.descriptor.kinds        = {discovery::AttributeKind::Manufacturer,
                                 discovery::AttributeKind::DeviceClass,
                                 discovery::AttributeKind::ProtocolCapability};
    p.descriptor.trustWeight  = cfg.settings.trustWeight;
    p.descriptor.timeoutMs    = cfg.settings.timeoutMs;

    const config::HttpProbeConfig c = cfg;
    p.run = [c](const discovery::Scope& scope, discovery::ProbeContext& ctx) {
        ensure_curl_global_init();

        std::unique_ptr<CURLM, MultiDeleter> multi(curl_multi_init());
        if (!multi) {
            throw std::runtime_error("curl_multi_init failed");
        }

        std::deque<Target> queue;
        for (const auto& host : scope.hosts()) {
            for (std::uint16_t port : c.ports) {
                queue.push_back(Target{host, port});
            }
        }

        const std::size_t maxActive = std::max<std::uint32_t>(1, c.maxConcurrent);
        TransferSet active(multi.get());
        std::size_t responses = 0;

        while (!queue.empty() || active.size() > 0) {
            if (ctx.should_stop()) {
                return;
            }

            while (!queue.empty() && active.size() < maxActive) {
                auto t = make_transfer(queue.front(), c, ctx.remaining_ms());
                queue.pop_front();
                if (!t) {
                    throw std::runtime_error("curl_easy_init failed");
                }
                if (!active.add(std::move(t))) {
                    throw std::runtime_error("curl_multi_add_handle failed");
                }
            }

            int running = 0;
            const CURLMcode mc = curl_multi_perform(multi.get(), &running);
            if (mc != CURLM_OK) {
                throw std::runtime_error(std::string("curl_multi_perform: ") + curl_multi_strerror(mc));
            }

            int left = 0;
            while (CURLMsg* msg = curl_multi_info_read(multi.get(), &left)) {
                if (msg->msg != CURLMSG_DONE) {
                    continue;
                }
                const CURLcode res = msg->data.result;
                std::unique_ptr<Transfer> t = active.take(msg->easy_handle);
                if (!t) {
                    continue;
                }

                long status = 0;
                curl_easy_getinfo(t->easy, CURLINFO_RESPONSE_CODE, &status);
                if (res == CURLE_OK && status > 0) {
                    report(*t, status, ctx);
                    ++responses;
                } else {
                    NS_LOGV(TAG, "%s: %s", t->url.c_str(), curl_easy_strerror(res));
                }
                curl_easy_cleanup(t->easy);
            }

            if (active.size() > 0) {
                const CURLMcode wc = curl_multi_wait(multi.get(), nullptr, 0, kWaitSliceMs, nullptr);
                if (wc != CURLM_OK) {
                    throw std::runtime_error(std::string("curl_multi_wait: ") + curl_multi_strerror(wc));
                }
            }
        }

        NS_LOGD(TAG, "%s: %zu HTTP response(s)", scope.to_string().c_str(), responses);
    };
    return p;
}

} // namespace netsleuth::probes
