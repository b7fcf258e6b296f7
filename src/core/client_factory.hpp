#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "common/operation_context.hpp"
#include "core/change_detector.hpp"
#include "core/lease_tracker.hpp"
#include "core/lister.hpp"

namespace tongchi {

struct ListerBinding {
    std::string prefix;
    std::string label;
    std::shared_ptr<Lister> lister;
    std::optional<std::chrono::seconds> ttl;
};

struct PollResult {
    StatusSnapshot statuses;
    std::optional<Error> error;
};

using RenewFunction = std::function<std::optional<Error>(const OperationContext &)>;
using PollFunction = std::function<PollResult(const OperationContext &)>;

// ClientFactory builds the backend collaborators handed to the coordinator.
// The coordinator calls it again on resetClients(); empty functions mean the
// matching task is not scheduled.
class ClientFactory {
public:
    virtual ~ClientFactory() = default;

    virtual std::vector<ListerBinding> createListers() = 0;
    virtual RenewFunction createTokenRenewer() = 0;
    virtual LeaseTracker::RenewFunction createLeaseRenewer() = 0;
    virtual PollFunction createStatusPoller() = 0;
};

} // namespace tongchi
