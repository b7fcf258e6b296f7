#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "common/clock.hpp"
#include "common/models.hpp"

namespace tongchi {

using StatusSnapshot = std::map<std::string, std::string>;

// Which status transitions raise alerts. Status comparison is case-insensitive.
struct AlertPolicy {
    std::set<std::string> failureStatuses{"dead", "failed"};
    bool alertOnRemoval = true;

    std::set<std::string> startStatuses{"running"};
    bool alertOnStart = false;

    AlertSeverity failureSeverity = AlertSeverity::Critical;
    AlertSeverity removalSeverity = AlertSeverity::Warning;
    AlertSeverity startSeverity = AlertSeverity::Info;

    // Noun used in alert titles ("Job failed: web").
    std::string resourceLabel = "Resource";
};

// ChangeDetector diffs consecutive status snapshots and reports transitions.
// observe() must be called by a single poller; a failed fetch skips the call.
class ChangeDetector {
public:
    explicit ChangeDetector(const Clock &clock, AlertPolicy policy = {});

    std::vector<Alert> observe(const StatusSnapshot &current);

    // Last committed snapshot, or nullptr before the first observe().
    std::shared_ptr<const StatusSnapshot> snapshot() const;
    void reset();

    void setPolicy(AlertPolicy policy);
    AlertPolicy policy() const;

private:
    const Clock &m_clock;

    mutable std::mutex m_mutex;
    AlertPolicy m_policy;
    std::shared_ptr<const StatusSnapshot> m_snapshot;

    Alert makeAlert(AlertKind kind,
                    const AlertPolicy &policy,
                    const std::string &resourceId,
                    const std::string &previousStatus,
                    const std::string &currentStatus) const;
};

} // namespace tongchi
