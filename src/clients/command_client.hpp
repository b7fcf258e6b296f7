#pragma once

#include <QByteArray>
#include <QString>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "common/operation_context.hpp"
#include "common/settings.hpp"
#include "core/client_factory.hpp"
#include "core/lister.hpp"

namespace tongchi {

struct CommandOutput {
    int exitCode = -1;
    QByteArray standardOutput;
    QString standardError;
    std::optional<Error> error;
};

// Runs the command with "{key}" placeholders substituted. Kills the child
// once the context is cancelled or past its deadline.
CommandOutput runCommand(const CommandSpec &spec,
                         const std::map<std::string, std::string> &substitutions,
                         const OperationContext &context);

// Output parsers for the JSON the backend CLIs print.
ListResult parseListing(const std::string &parentPath, const QByteArray &output);
PollResult parseStatusSnapshot(const QByteArray &output);
LeaseRenewal parseLeaseRenewal(const QByteArray &output);

class CommandLister : public Lister {
public:
    explicit CommandLister(CommandSpec spec);

    ListResult list(const std::string &path, const OperationContext &context) override;

private:
    CommandSpec m_spec;
};

class CommandPoller {
public:
    explicit CommandPoller(CommandSpec spec);

    PollResult poll(const OperationContext &context) const;

private:
    CommandSpec m_spec;
};

class CommandRenewer {
public:
    explicit CommandRenewer(CommandSpec spec);

    std::optional<Error> renewToken(const OperationContext &context) const;
    LeaseRenewal renewLease(const std::string &leaseId, const OperationContext &context) const;

private:
    CommandSpec m_spec;
};

class CommandClientFactory : public ClientFactory {
public:
    explicit CommandClientFactory(Settings settings);

    std::vector<ListerBinding> createListers() override;
    RenewFunction createTokenRenewer() override;
    LeaseTracker::RenewFunction createLeaseRenewer() override;
    PollFunction createStatusPoller() override;

private:
    Settings m_settings;
};

} // namespace tongchi
