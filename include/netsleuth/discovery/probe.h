#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>

#include "netsleuth/discovery/attribute.h"
#include "netsleuth/discovery/evidence.h"
#include "netsleuth/discovery/scope.h"

namespace netsleuth::discovery {

// Capability descriptor. Immutable after registration.
struct ProbeDescriptor {
    std::string             name;
    std::string             outputFormat;   // "arp", "oui", "tcp", "http", "mdns", "ssdp", "attributes"
    std::set<AttributeKind> kinds;          // attribute kinds this probe may produce
    double                  trustWeight{0.5};
    std::uint32_t           timeoutMs{5000};
};

// Handed to a running probe. A probe must poll `cancelled()` / `expired()` between
// network operations and unwind on its own; nothing interrupts it externally.
class ProbeContext {
public:
    using EmitFn = std::function<void(const std::string& address, RawFields fields)>;

    ProbeContext(std::uint64_t deadlineMs,
                 std::shared_ptr<std::atomic<bool>> cancel,
                 EmitFn emit)
        : _deadlineMs(deadlineMs)
        , _cancel(std::move(cancel))
        , _emit(std::move(emit))
    {}

    // Monotonic deadline (platform::monotonic_ms()) for this probe's budget.
    std::uint64_t deadline_ms() const noexcept { return _deadlineMs; }

    // Milliseconds left before the deadline, 0 once expired.
    std::uint64_t remaining_ms() const;

    bool cancelled() const noexcept { return _cancel && _cancel->load(); }
    bool expired() const;

    // True once the probe should stop doing work.
    bool should_stop() const { return cancelled() || expired(); }

    // Report an observation incrementally. Safe to call from the probe thread;
    // ignored once the probe has been abandoned.
    void emit(const std::string& address, RawFields fields) const
    {
        if (_emit && !cancelled()) {
            _emit(address, std::move(fields));
        }
    }

private:
    std::uint64_t                      _deadlineMs;
    std::shared_ptr<std::atomic<bool>> _cancel;
    EmitFn                             _emit;
};

// A pluggable discovery technique: descriptor plus a run callable.
// `run` reports failure by throwing; returning means the probe finished.
struct Probe {
    using RunFn = std::function<void(const Scope& scope, ProbeContext& ctx)>;

    ProbeDescriptor descriptor;
    RunFn           run;
};

} // namespace netsleuth::discovery
