#include "clients/command_client.hpp"

#include <QProcess>
#include <QStringList>

#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace tongchi {

namespace {

constexpr int kPollSliceMs = 100;

QString substitute(const std::string &argument,
                   const std::map<std::string, std::string> &substitutions)
{
    std::string out = argument;
    for (const auto &entry : substitutions) {
        const std::string token = "{" + entry.first + "}";
        std::string::size_type pos = 0;
        while ((pos = out.find(token, pos)) != std::string::npos) {
            out.replace(pos, token.size(), entry.second);
            pos += entry.second.size();
        }
    }
    return QString::fromStdString(out);
}

Error classifyFailure(const CommandSpec &spec, const CommandOutput &output)
{
    const QString message = output.standardError.trimmed().isEmpty()
        ? QStringLiteral("%1 exited with code %2")
              .arg(QString::fromStdString(spec.program))
              .arg(output.exitCode)
        : output.standardError.trimmed();

    const bool notFound = (spec.notFoundExitCode && *spec.notFoundExitCode == output.exitCode)
        || output.standardError.contains(QStringLiteral("not found"), Qt::CaseInsensitive);

    return Error{notFound ? ErrorKind::NotFound : ErrorKind::Transport, message.toStdString()};
}

std::optional<nlohmann::json> parseJson(const QByteArray &output, std::optional<Error> &error)
{
    const QByteArray trimmed = output.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }
    nlohmann::json document = nlohmann::json::parse(trimmed.constData(),
                                                    trimmed.constData() + trimmed.size(),
                                                    nullptr, false);
    if (document.is_discarded()) {
        error = Error{ErrorKind::Internal, "command output is not valid JSON"};
        return std::nullopt;
    }
    return document;
}

std::string joinPath(const std::string &parentPath, const std::string &name)
{
    if (parentPath.empty() || name.rfind(parentPath, 0) == 0) {
        return name;
    }
    if (parentPath.back() == '/') {
        return parentPath + name;
    }
    return parentPath + "/" + name;
}

ChildDescriptor childFromName(const std::string &parentPath, const std::string &name)
{
    ChildDescriptor child;
    child.path = joinPath(parentPath, name);
    child.isContainer = !name.empty() && name.back() == '/';
    child.displayLabel = name;
    return child;
}

void logCommandFailure(const CommandSpec &spec, const Error &error)
{
    TLOG_WARN(QStringLiteral("CommandClient"),
              QStringLiteral("runCommand"),
              QStringLiteral("command_failed"),
              QString::fromStdString(toErrorKindString(error.kind)),
              QStringLiteral("qprocess"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"program", spec.program}, {"error", error.message}});
}

} // namespace

CommandOutput runCommand(const CommandSpec &spec,
                         const std::map<std::string, std::string> &substitutions,
                         const OperationContext &context)
{
    CommandOutput output;

    QStringList arguments;
    for (const std::string &argument : spec.arguments) {
        arguments << substitute(argument, substitutions);
    }

    TLOG_DEBUG(QStringLiteral("CommandClient"),
               QStringLiteral("runCommand"),
               QStringLiteral("command_start"),
               QStringLiteral("collaborator_call"),
               QStringLiteral("qprocess"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"program", spec.program},
                              {"args", arguments.join(QLatin1Char(' ')).toStdString()}});

    QProcess process;
    process.start(QString::fromStdString(spec.program), arguments);
    if (!process.waitForStarted()) {
        output.error = Error{ErrorKind::Transport,
                             "failed to start " + spec.program + ": "
                                 + process.errorString().toStdString()};
        logCommandFailure(spec, *output.error);
        return output;
    }

    process.closeWriteChannel();

    while (!process.waitForFinished(kPollSliceMs)) {
        if (process.state() == QProcess::NotRunning) {
            break;
        }
        if (context.isDone()) {
            process.kill();
            process.waitForFinished();
            output.error = context.doneError();
            logCommandFailure(spec, *output.error);
            return output;
        }
    }

    output.standardOutput = process.readAllStandardOutput();
    output.standardError = QString::fromUtf8(process.readAllStandardError());

    if (process.exitStatus() != QProcess::NormalExit) {
        output.error = Error{ErrorKind::Transport, spec.program + " crashed"};
        logCommandFailure(spec, *output.error);
        return output;
    }

    output.exitCode = process.exitCode();
    if (output.exitCode != 0) {
        output.error = classifyFailure(spec, output);
        logCommandFailure(spec, *output.error);
    }
    return output;
}

ListResult parseListing(const std::string &parentPath, const QByteArray &output)
{
    ListResult result;
    const auto document = parseJson(output, result.error);
    if (!document) {
        return result;
    }

    const nlohmann::json *items = &*document;
    if (document->is_object()) {
        if (document->contains("keys")) {
            items = &(*document)["keys"];
        } else if (document->contains("data") && (*document)["data"].is_object()
                   && (*document)["data"].contains("keys")) {
            items = &(*document)["data"]["keys"];
        }
    }

    if (!items->is_array()) {
        result.error = Error{ErrorKind::Internal, "listing output is not an array"};
        return result;
    }

    for (const auto &item : *items) {
        if (item.is_string()) {
            result.children.push_back(childFromName(parentPath, item.get<std::string>()));
        } else if (item.is_object() && item.contains("path") && item["path"].is_string()) {
            const std::string name = item["path"].get<std::string>();
            ChildDescriptor child = childFromName(parentPath, name);
            child.isContainer = item.value("isContainer", child.isContainer);
            child.displayLabel = item.value("label", child.displayLabel);
            result.children.push_back(std::move(child));
        }
    }
    return result;
}

PollResult parseStatusSnapshot(const QByteArray &output)
{
    PollResult result;
    const auto document = parseJson(output, result.error);
    if (!document) {
        if (!result.error) {
            result.error = Error{ErrorKind::Internal, "status output is empty"};
        }
        return result;
    }

    if (document->is_object()) {
        for (const auto &item : document->items()) {
            if (item.value().is_string()) {
                result.statuses[item.key()] = item.value().get<std::string>();
            }
        }
        return result;
    }

    if (document->is_array()) {
        for (const auto &item : *document) {
            if (!item.is_object()) {
                continue;
            }
            const std::string id = item.contains("ID") ? item.value("ID", "") : item.value("id", "");
            const std::string status = item.contains("Status") ? item.value("Status", "")
                                                               : item.value("status", "");
            if (!id.empty()) {
                result.statuses[id] = status;
            }
        }
        return result;
    }

    result.error = Error{ErrorKind::Internal, "status output is neither an object nor an array"};
    return result;
}

LeaseRenewal parseLeaseRenewal(const QByteArray &output)
{
    LeaseRenewal renewal;
    const auto document = parseJson(output, renewal.error);
    if (!document || !document->is_object()) {
        return renewal;
    }

    for (const char *key : {"lease_duration", "ttl"}) {
        if (document->contains(key) && (*document)[key].is_number_integer()) {
            renewal.ttl = std::chrono::seconds((*document)[key].get<long long>());
            return renewal;
        }
    }
    return renewal;
}

CommandLister::CommandLister(CommandSpec spec)
    : m_spec(std::move(spec))
{
}

ListResult CommandLister::list(const std::string &path, const OperationContext &context)
{
    const CommandOutput output = runCommand(m_spec, {{"path", path}}, context);
    if (output.error) {
        return ListResult{{}, output.error};
    }
    return parseListing(path, output.standardOutput);
}

CommandPoller::CommandPoller(CommandSpec spec)
    : m_spec(std::move(spec))
{
}

PollResult CommandPoller::poll(const OperationContext &context) const
{
    const CommandOutput output = runCommand(m_spec, {}, context);
    if (output.error) {
        return PollResult{{}, output.error};
    }
    return parseStatusSnapshot(output.standardOutput);
}

CommandRenewer::CommandRenewer(CommandSpec spec)
    : m_spec(std::move(spec))
{
}

std::optional<Error> CommandRenewer::renewToken(const OperationContext &context) const
{
    return runCommand(m_spec, {}, context).error;
}

LeaseRenewal CommandRenewer::renewLease(const std::string &leaseId,
                                        const OperationContext &context) const
{
    const CommandOutput output = runCommand(m_spec, {{"lease", leaseId}}, context);
    if (output.error) {
        LeaseRenewal renewal;
        renewal.error = output.error;
        return renewal;
    }
    return parseLeaseRenewal(output.standardOutput);
}

CommandClientFactory::CommandClientFactory(Settings settings)
    : m_settings(std::move(settings))
{
}

std::vector<ListerBinding> CommandClientFactory::createListers()
{
    std::vector<ListerBinding> bindings;
    for (const BackendSettings &backend : m_settings.backends) {
        ListerBinding binding;
        binding.prefix = backend.root;
        binding.label = backend.label;
        binding.lister = std::make_shared<CommandLister>(backend.list);
        binding.ttl = backend.ttl;
        bindings.push_back(std::move(binding));
    }
    return bindings;
}

RenewFunction CommandClientFactory::createTokenRenewer()
{
    if (!m_settings.tokenRenew) {
        return {};
    }
    auto renewer = std::make_shared<CommandRenewer>(*m_settings.tokenRenew);
    return [renewer](const OperationContext &context) { return renewer->renewToken(context); };
}

LeaseTracker::RenewFunction CommandClientFactory::createLeaseRenewer()
{
    if (!m_settings.leaseRenew) {
        return {};
    }
    auto renewer = std::make_shared<CommandRenewer>(*m_settings.leaseRenew);
    return [renewer](const std::string &leaseId, const OperationContext &context) {
        return renewer->renewLease(leaseId, context);
    };
}

PollFunction CommandClientFactory::createStatusPoller()
{
    if (!m_settings.statusPoll) {
        return {};
    }
    auto poller = std::make_shared<CommandPoller>(*m_settings.statusPoll);
    return [poller](const OperationContext &context) { return poller->poll(context); };
}

} // namespace tongchi
