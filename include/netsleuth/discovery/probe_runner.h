#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "netsleuth/discovery/evidence.h"
#include "netsleuth/discovery/normalizer.h"
#include "netsleuth/discovery/probe_registry.h"
#include "netsleuth/discovery/scope.h"

namespace netsleuth::discovery {

struct DiscoveryItem {
    enum class Kind : std::uint8_t { Evidence, Failure };

    Kind           kind{Kind::Evidence};
    EvidenceRecord evidence;   // valid when kind == Evidence
    ProbeFailure   failure;    // valid when kind == Failure
};

struct RunState;

/**
 * Lazy, finite sequence of discovery results for one run.
 *
 * Items arrive in completion order with no cross-probe ordering. The stream
 * ends once every probe has finished, failed or been abandoned. Destroying the
 * stream early abandons whatever is still running.
 *
 * Thread-safety: consume from a single thread. The Normalizer passed to the
 * runner must outlive the stream.
 */
class DiscoveryStream {
public:
    DiscoveryStream(std::shared_ptr<RunState> state, const Normalizer& normalizer);
    ~DiscoveryStream();

    DiscoveryStream(const DiscoveryStream&) = delete;
    DiscoveryStream& operator=(const DiscoveryStream&) = delete;

    // Blocks until the next item is ready, a timeout fires, or the run is over.
    // Returns false at the end of the sequence.
    bool next(DiscoveryItem& out);

    // Metadata, complete once next() has returned false.
    const std::vector<std::string>&  completed() const noexcept { return _completed; }
    const std::vector<ProbeFailure>& failures()  const noexcept { return _failures; }

    // Raw observations dropped because they normalized to nothing.
    std::size_t dropped() const noexcept { return _dropped; }

    bool overall_timed_out() const noexcept { return _overallTimedOut; }

private:
    std::shared_ptr<RunState> _state;
    const Normalizer&         _normalizer;

    std::vector<std::string>  _completed;
    std::vector<ProbeFailure> _failures;
    std::deque<ProbeFailure>  _pendingFailures;
    std::size_t               _dropped{0};
    bool                      _overallTimedOut{false};
    bool                      _ended{false};
};

// Fans probes out concurrently against a scope. Holds no device state.
class ProbeRunner {
public:
    ProbeRunner(const ProbeRegistry& probes, const Normalizer& normalizer);

    /**
     * Launch every probe named in `enabled` on its own thread.
     *
     * Each probe gets min(perProbeTimeoutMs, its own timeout) before it is
     * abandoned and reported as a timeout; `overallTimeoutMs` bounds the whole
     * run. Evidence emitted before abandonment is kept.
     *
     * Returns nullptr (and sets `error`) without launching anything if a name is
     * unknown, the list is empty, or a timeout is zero.
     */
    std::unique_ptr<DiscoveryStream> discover(const Scope& scope,
                                              const std::vector<std::string>& enabled,
                                              std::uint32_t perProbeTimeoutMs,
                                              std::uint32_t overallTimeoutMs,
                                              std::string* error = nullptr) const;

private:
    const ProbeRegistry& _probes;
    const Normalizer&    _normalizer;
};

} // namespace netsleuth::discovery
