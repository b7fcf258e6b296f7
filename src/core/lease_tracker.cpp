#include "core/lease_tracker.hpp"

#include <exception>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace tongchi {

LeaseTracker::LeaseTracker(const Clock &clock, std::chrono::seconds renewWindow)
    : m_clock(clock)
    , m_renewWindow(renewWindow)
{
}

void LeaseTracker::addLease(const std::string &id, std::chrono::seconds ttl)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        TrackedLease &lease = m_leases[id];
        lease.id = id;
        lease.ttl = ttl;
        lease.expiresAt = m_clock.now() + ttl;
        lease.consecutiveFailures = 0;
        lease.lastError.clear();
    }

    TLOG_INFO(QStringLiteral("LeaseTracker"),
              QStringLiteral("addLease"),
              QStringLiteral("lease_tracked"),
              QStringLiteral("credential_issued"),
              QStringLiteral("expiry_window"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"leaseId", id}, {"ttlSeconds", ttl.count()}});
}

bool LeaseTracker::removeLease(const std::string &id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_leases.erase(id) > 0;
}

std::vector<TrackedLease> LeaseTracker::leases() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<TrackedLease> out;
    out.reserve(m_leases.size());
    for (const auto &entry : m_leases) {
        out.push_back(entry.second);
    }
    return out;
}

std::vector<LeaseEvent> LeaseTracker::renewDue(const RenewFunction &renew,
                                               const OperationContext &context)
{
    std::vector<std::string> due;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto horizon = m_clock.now() + m_renewWindow;
        for (const auto &entry : m_leases) {
            if (entry.second.expiresAt <= horizon) {
                due.push_back(entry.first);
            }
        }
    }

    std::vector<LeaseEvent> events;
    for (const std::string &id : due) {
        if (context.isDone()) {
            break;
        }

        LeaseRenewal renewal;
        try {
            renewal = renew(id, context);
        } catch (const std::exception &ex) {
            renewal.error = Error{ErrorKind::Internal, ex.what()};
        }

        LeaseEvent event;
        event.leaseId = id;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_leases.find(id);
            if (it == m_leases.end()) {
                // Removed while the renewal was in flight.
                continue;
            }
            TrackedLease &lease = it->second;
            const auto now = m_clock.now();

            if ((renewal.error && renewal.error->kind == ErrorKind::NotFound)
                || (!renewal.error && renewal.ttl.count() <= 0)) {
                event.outcome = LeaseOutcome::Expired;
                event.error = renewal.error;
                event.expiresAt = lease.expiresAt;
                m_leases.erase(it);
            } else if (renewal.error) {
                event.outcome = LeaseOutcome::Failed;
                event.error = renewal.error;
                event.expiresAt = lease.expiresAt;
                lease.consecutiveFailures += 1;
                lease.lastError = describeError(*renewal.error);
            } else {
                event.outcome = LeaseOutcome::Renewed;
                lease.ttl = renewal.ttl;
                lease.expiresAt = now + renewal.ttl;
                lease.lastRenewedAt = now;
                lease.consecutiveFailures = 0;
                lease.lastError.clear();
                event.expiresAt = lease.expiresAt;
            }
        }

        const nlohmann::json ctx{
            {"leaseId", id},
            {"outcome", toLeaseOutcomeString(event.outcome)},
            {"expiresAt", toIso8601Utc(event.expiresAt)},
            {"error", event.error ? describeError(*event.error) : std::string()}
        };
        if (event.outcome == LeaseOutcome::Renewed) {
            TLOG_DEBUG(QStringLiteral("LeaseTracker"),
                       QStringLiteral("renewDue"),
                       QStringLiteral("lease_renewed"),
                       QStringLiteral("inside_renew_window"),
                       QStringLiteral("renew_call"),
                       logging::defaultWho(),
                       QString(),
                       ctx);
        } else {
            TLOG_WARN(QStringLiteral("LeaseTracker"),
                      QStringLiteral("renewDue"),
                      event.outcome == LeaseOutcome::Expired ? QStringLiteral("lease_expired")
                                                             : QStringLiteral("lease_renew_failed"),
                      QStringLiteral("inside_renew_window"),
                      QStringLiteral("renew_call"),
                      logging::defaultWho(),
                      QString(),
                      ctx);
        }
        events.push_back(std::move(event));
    }

    return events;
}

void LeaseTracker::setRenewWindow(std::chrono::seconds window)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_renewWindow = window;
}

std::chrono::seconds LeaseTracker::renewWindow() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_renewWindow;
}

std::string toLeaseOutcomeString(LeaseOutcome outcome)
{
    switch (outcome) {
    case LeaseOutcome::Renewed:
        return "renewed";
    case LeaseOutcome::Expired:
        return "expired";
    case LeaseOutcome::Failed:
        return "failed";
    }
    return "failed";
}

} // namespace tongchi
