#pragma once

#include <map>
#include <string>
#include <vector>

#include "netsleuth/discovery/attribute.h"
#include "netsleuth/discovery/device_profile.h"
#include "netsleuth/discovery/evidence.h"

namespace netsleuth::discovery {

using ProfileMap = std::map<std::string, DeviceProfile>;

/**
 * Folds evidence records into device profiles and scores them.
 *
 * Per attribute, candidates sharing a byte-identical value are aggregated by
 * summing trust weight over *distinct* probes (a probe agreeing with itself
 * is not corroboration). The chosen value has the highest aggregated weight;
 * ties go to the value with more distinct probes, then to the most recent
 * observation, then to the lexically smaller value.
 *
 *   confidence(attr) = agg(chosen) / sum(agg(v) for every candidate value v)
 *   overall          = sum(importance(k) * confidence(k)) / sum(importance(k))
 *
 * Profiles keep the full candidate history, so merging is commutative,
 * associative and idempotent over batches. The computation is pure: no
 * randomness and no clock reads beyond the recorded observation times.
 */
class Correlator {
public:
    explicit Correlator(ImportanceTable importance = default_importance());

    // Returns the profiles for every address touched by `records`, built from
    // `existing` (if present) plus the new evidence. Addresses with no usable
    // evidence produce no profile. `existing` is not modified.
    ProfileMap merge(const ProfileMap& existing,
                     const std::vector<EvidenceRecord>& records) const;

    // Fold `records` (all for `profile.address`) into `profile` in place.
    void fold(DeviceProfile& profile, const std::vector<const EvidenceRecord*>& records) const;

    // Recompute assessments and overall confidence from the candidate history.
    void rescore(DeviceProfile& profile) const;

    // Scores one attribute's candidate log. Returns false for an empty log.
    static bool assess(const CandidateLog& log, AttributeAssessment& out);

    const ImportanceTable& importance() const noexcept { return _importance; }

private:
    ImportanceTable _importance;
};

} // namespace netsleuth::discovery
