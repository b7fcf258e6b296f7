#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/clock.hpp"
#include "common/models.hpp"
#include "common/operation_context.hpp"

namespace tongchi {

struct LeaseRenewal {
    // New lease duration granted by the backend; zero means it was not extended.
    std::chrono::seconds ttl{0};
    std::optional<Error> error;
};

struct TrackedLease {
    std::string id;
    std::chrono::system_clock::time_point expiresAt;
    std::chrono::seconds ttl{0};
    std::optional<std::chrono::system_clock::time_point> lastRenewedAt;
    int consecutiveFailures = 0;
    std::string lastError;
};

enum class LeaseOutcome {
    Renewed,
    Expired,
    Failed
};

struct LeaseEvent {
    std::string leaseId;
    LeaseOutcome outcome = LeaseOutcome::Renewed;
    std::optional<Error> error;
    std::chrono::system_clock::time_point expiresAt;
};

// LeaseTracker keeps dynamic-credential leases alive. Each renewDue() call
// renews only leases expiring inside the renew window.
class LeaseTracker {
public:
    using RenewFunction = std::function<LeaseRenewal(const std::string &, const OperationContext &)>;

    LeaseTracker(const Clock &clock, std::chrono::seconds renewWindow = std::chrono::seconds(120));

    void addLease(const std::string &id, std::chrono::seconds ttl);
    bool removeLease(const std::string &id);
    std::vector<TrackedLease> leases() const;

    std::vector<LeaseEvent> renewDue(const RenewFunction &renew, const OperationContext &context);

    void setRenewWindow(std::chrono::seconds window);
    std::chrono::seconds renewWindow() const;

private:
    const Clock &m_clock;

    mutable std::mutex m_mutex;
    std::chrono::seconds m_renewWindow;
    std::map<std::string, TrackedLease> m_leases;
};

std::string toLeaseOutcomeString(LeaseOutcome outcome);

} // namespace tongchi
