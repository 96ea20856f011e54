#include "netsleuth/discovery/probe_runner.h"

#include "netsleuth/core/logging.h"
#include "netsleuth/platform/time.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <set>
#include <thread>

namespace netsleuth::discovery {

static constexpr const char* TAG = "runner";

enum class SlotState : std::uint8_t {
    Running,
    Done,
    Failed,
    Abandoned,
};

struct ProbeSlot {
    ProbeDescriptor                    descriptor;
    std::uint64_t                      deadlineMs{0};
    std::uint32_t                      budgetMs{0};
    std::shared_ptr<std::atomic<bool>> cancel;
    SlotState                          state{SlotState::Running};
    std::string                        error;
    bool                               reported{false};
};

// Shared between the stream and the (possibly detached) probe threads.
struct RunState {
    std::mutex                 mx;
    std::condition_variable    cv;
    std::vector<ProbeSlot>     slots;   // fixed size after launch
    std::deque<std::pair<std::size_t, RawObservation>> pending;
    std::uint64_t              overallDeadlineMs{0};
};

// Must be called with state.mx held.
static void abandon(ProbeSlot& slot)
{
    slot.state = SlotState::Abandoned;
    slot.cancel->store(true);
}

DiscoveryStream::DiscoveryStream(std::shared_ptr<RunState> state, const Normalizer& normalizer)
    : _state(std::move(state))
    , _normalizer(normalizer)
{
}

DiscoveryStream::~DiscoveryStream()
{
    std::lock_guard<std::mutex> lock(_state->mx);
    for (auto& slot : _state->slots) {
        if (slot.state == SlotState::Running) {
            abandon(slot);
        }
    }
    _state->pending.clear();
}

bool DiscoveryStream::next(DiscoveryItem& out)
{
    if (_ended) {
        return false;
    }

    std::unique_lock<std::mutex> lock(_state->mx);

    for (;;) {
        const std::uint64_t now = platform::monotonic_ms();
        std::vector<ProbeFailure> fresh;

        if (now >= _state->overallDeadlineMs && !_overallTimedOut) {
            _overallTimedOut = true;
            for (auto& slot : _state->slots) {
                if (slot.state != SlotState::Running) continue;
                abandon(slot);
                slot.reported = true;
                fresh.push_back({slot.descriptor.name, FailureReason::Timeout, "overall timeout"});
                NS_LOGW(TAG, "Probe '%s' abandoned: overall timeout", slot.descriptor.name.c_str());
            }
        }

        std::uint64_t nextDeadline = _state->overallDeadlineMs;
        bool running = false;

        for (auto& slot : _state->slots) {
            if (slot.state == SlotState::Running && now >= slot.deadlineMs) {
                abandon(slot);
                slot.reported = true;
                fresh.push_back({slot.descriptor.name, FailureReason::Timeout,
                                 "exceeded " + std::to_string(slot.budgetMs) + "ms"});
                NS_LOGW(TAG, "Probe '%s' abandoned after %ums",
                        slot.descriptor.name.c_str(), static_cast<unsigned>(slot.budgetMs));
            }

            if (slot.state == SlotState::Running) {
                running = true;
                nextDeadline = std::min(nextDeadline, slot.deadlineMs);
                continue;
            }
            if (slot.reported) continue;
            slot.reported = true;

            if (slot.state == SlotState::Failed) {
                fresh.push_back({slot.descriptor.name, FailureReason::Error, slot.error});
                NS_LOGW(TAG, "Probe '%s' failed: %s", slot.descriptor.name.c_str(), slot.error.c_str());
            } else if (slot.state == SlotState::Done) {
                _completed.push_back(slot.descriptor.name);
                NS_LOGD(TAG, "Probe '%s' completed", slot.descriptor.name.c_str());
            }
        }

        if (!fresh.empty()) {
            _failures.insert(_failures.end(), fresh.begin(), fresh.end());
            _pendingFailures.insert(_pendingFailures.end(), fresh.begin(), fresh.end());
        }

        if (!_pendingFailures.empty()) {
            out.kind    = DiscoveryItem::Kind::Failure;
            out.failure = std::move(_pendingFailures.front());
            _pendingFailures.pop_front();
            return true;
        }

        if (!_state->pending.empty()) {
            auto [index, raw] = std::move(_state->pending.front());
            _state->pending.pop_front();
            const std::set<AttributeKind>& kinds = _state->slots[index].descriptor.kinds;

            lock.unlock();
            auto rec = _normalizer.normalize(raw, kinds);
            if (rec) {
                out.kind     = DiscoveryItem::Kind::Evidence;
                out.evidence = std::move(*rec);
                return true;
            }
            ++_dropped;
            lock.lock();
            continue;
        }

        if (!running) {
            _ended = true;
            return false;
        }

        const auto waitMs = nextDeadline > now ? nextDeadline - now : 0;
        _state->cv.wait_for(lock, std::chrono::milliseconds(waitMs));
    }
}

ProbeRunner::ProbeRunner(const ProbeRegistry& probes, const Normalizer& normalizer)
    : _probes(probes)
    , _normalizer(normalizer)
{
}

std::unique_ptr<DiscoveryStream> ProbeRunner::discover(const Scope& scope,
                                                       const std::vector<std::string>& enabled,
                                                       std::uint32_t perProbeTimeoutMs,
                                                       std::uint32_t overallTimeoutMs,
                                                       std::string* error) const
{
    auto fail = [error](std::string msg) -> std::unique_ptr<DiscoveryStream> {
        NS_LOGE(TAG, "discover rejected: %s", msg.c_str());
        if (error) *error = std::move(msg);
        return nullptr;
    };

    if (enabled.empty()) {
        return fail("no probes enabled");
    }
    if (perProbeTimeoutMs == 0 || overallTimeoutMs == 0) {
        return fail("timeouts must be non-zero");
    }

    // Validate everything before launching anything.
    std::vector<const Probe*> selected;
    std::set<std::string> seen;
    for (const auto& name : enabled) {
        const Probe* p = _probes.find(name);
        if (!p) {
            return fail("unknown probe '" + name + "'");
        }
        if (seen.insert(name).second) {
            selected.push_back(p);
        }
    }

    auto state = std::make_shared<RunState>();
    const std::uint64_t start = platform::monotonic_ms();
    state->overallDeadlineMs = start + overallTimeoutMs;

    state->slots.reserve(selected.size());
    for (const Probe* p : selected) {
        ProbeSlot slot;
        slot.descriptor = p->descriptor;
        slot.budgetMs   = std::min(perProbeTimeoutMs, p->descriptor.timeoutMs);
        slot.deadlineMs = std::min(start + slot.budgetMs, state->overallDeadlineMs);
        slot.cancel     = std::make_shared<std::atomic<bool>>(false);
        state->slots.push_back(std::move(slot));
    }

    NS_LOGI(TAG, "Discovering %s with %zu probe(s), per-probe %ums, overall %ums",
            scope.to_string().c_str(), selected.size(),
            static_cast<unsigned>(perProbeTimeoutMs), static_cast<unsigned>(overallTimeoutMs));

    for (std::size_t i = 0; i < selected.size(); ++i) {
        const ProbeSlot& slot = state->slots[i];

        ProbeContext::EmitFn emit = [state, i](const std::string& address, RawFields fields) {
            std::lock_guard<std::mutex> lock(state->mx);
            const ProbeSlot& s = state->slots[i];
            if (s.state != SlotState::Running) {
                return; // abandoned: late results are discarded
            }
            RawObservation raw;
            raw.probe        = s.descriptor.name;
            raw.format       = s.descriptor.outputFormat;
            raw.address      = address;
            raw.fields       = std::move(fields);
            raw.observedAtMs = platform::unix_time_ms();
            raw.trustWeight  = s.descriptor.trustWeight;
            state->pending.emplace_back(i, std::move(raw));
            state->cv.notify_all();
        };

        // Threads own copies of everything they touch, so an abandoned probe can
        // finish after the stream (and the runner) are gone.
        std::thread([state, i, run = selected[i]->run, scope,
                     ctx = ProbeContext(slot.deadlineMs, slot.cancel, std::move(emit))]() mutable {
            SlotState result = SlotState::Done;
            std::string err;
            try {
                run(scope, ctx);
            } catch (const std::exception& ex) {
                result = SlotState::Failed;
                err = ex.what();
            } catch (...) {
                result = SlotState::Failed;
                err = "non-standard exception";
            }

            std::lock_guard<std::mutex> lock(state->mx);
            ProbeSlot& s = state->slots[i];
            if (s.state == SlotState::Running) {
                s.state = result;
                s.error = std::move(err);
            }
            state->cv.notify_all();
        }).detach();
    }

    return std::make_unique<DiscoveryStream>(std::move(state), _normalizer);
}

} // namespace netsleuth::discovery
