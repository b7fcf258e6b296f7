#include "core/change_detector.hpp"

#include <QUuid>

#include <algorithm>
#include <cctype>
#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace tongchi {

namespace {

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool inSet(const std::set<std::string> &values, const std::string &status)
{
    const std::string lowered = toLower(status);
    for (const auto &value : values) {
        if (toLower(value) == lowered) {
            return true;
        }
    }
    return false;
}

} // namespace

ChangeDetector::ChangeDetector(const Clock &clock, AlertPolicy policy)
    : m_clock(clock)
    , m_policy(std::move(policy))
{
}

std::vector<Alert> ChangeDetector::observe(const StatusSnapshot &current)
{
    std::shared_ptr<const StatusSnapshot> previous;
    AlertPolicy policy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = m_snapshot;
        policy = m_policy;
    }

    std::vector<Alert> alerts;
    if (previous) {
        for (const auto &entry : current) {
            auto prior = previous->find(entry.first);
            if (prior == previous->end()) {
                continue;
            }

            const std::string &before = prior->second;
            const std::string &after = entry.second;
            if (toLower(before) == toLower(after)) {
                continue;
            }

            if (inSet(policy.failureStatuses, after)
                && !inSet(policy.failureStatuses, before)) {
                alerts.push_back(makeAlert(AlertKind::Failed, policy, entry.first, before, after));
            } else if (policy.alertOnStart
                       && inSet(policy.startStatuses, after)
                       && !inSet(policy.startStatuses, before)) {
                alerts.push_back(makeAlert(AlertKind::Started, policy, entry.first, before, after));
            }
        }

        if (policy.alertOnRemoval) {
            for (const auto &entry : *previous) {
                if (current.count(entry.first) == 0) {
                    alerts.push_back(makeAlert(AlertKind::Removed, policy, entry.first,
                                               entry.second, std::string()));
                }
            }
        }
    }

    auto next = std::make_shared<const StatusSnapshot>(current);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_snapshot = std::move(next);
    }

    TLOG_DEBUG(QStringLiteral("ChangeDetector"),
               QStringLiteral("observe"),
               QStringLiteral("snapshot_committed"),
               QStringLiteral("poll_cycle"),
               QStringLiteral("snapshot_diff"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"resources", current.size()},
                              {"firstObservation", previous == nullptr},
                              {"alerts", alerts.size()}});

    for (const auto &alert : alerts) {
        TLOG_INFO(QStringLiteral("ChangeDetector"),
                  QStringLiteral("observe"),
                  QStringLiteral("alert_raised"),
                  QString::fromStdString(toAlertKindString(alert.kind)),
                  QStringLiteral("status_transition"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"resourceId", alert.resourceId},
                                 {"previousStatus", alert.previousStatus},
                                 {"currentStatus", alert.currentStatus},
                                 {"severity", toAlertSeverityString(alert.severity)}});
    }

    return alerts;
}

std::shared_ptr<const StatusSnapshot> ChangeDetector::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

void ChangeDetector::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_snapshot.reset();
}

void ChangeDetector::setPolicy(AlertPolicy policy)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_policy = std::move(policy);
}

AlertPolicy ChangeDetector::policy() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_policy;
}

Alert ChangeDetector::makeAlert(AlertKind kind,
                                const AlertPolicy &policy,
                                const std::string &resourceId,
                                const std::string &previousStatus,
                                const std::string &currentStatus) const
{
    Alert alert;
    alert.id = QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
    alert.timestamp = m_clock.now();
    alert.resourceId = resourceId;
    alert.kind = kind;
    alert.previousStatus = previousStatus;
    alert.currentStatus = currentStatus;

    switch (kind) {
    case AlertKind::Failed:
        alert.severity = policy.failureSeverity;
        alert.title = policy.resourceLabel + " failed: " + resourceId;
        alert.message = resourceId + " status changed from " + previousStatus
            + " to " + currentStatus;
        break;
    case AlertKind::Removed:
        alert.severity = policy.removalSeverity;
        alert.title = policy.resourceLabel + " removed: " + resourceId;
        alert.message = resourceId + " has been removed (last status " + previousStatus + ")";
        break;
    case AlertKind::Started:
        alert.severity = policy.startSeverity;
        alert.title = policy.resourceLabel + " started: " + resourceId;
        alert.message = resourceId + " is now " + currentStatus;
        break;
    }
    return alert;
}

} // namespace tongchi
