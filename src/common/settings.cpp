#include "common/settings.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "common/logging.hpp"

namespace tongchi {

namespace {

CommandSpec parseCommand(const nlohmann::json &j)
{
    CommandSpec spec;
    spec.program = j.value("program", "");
    if (j.contains("args") && j["args"].is_array()) {
        for (const auto &arg : j["args"]) {
            if (arg.is_string()) {
                spec.arguments.push_back(arg.get<std::string>());
            }
        }
    }
    if (j.contains("notFoundExitCode") && j["notFoundExitCode"].is_number_integer()) {
        spec.notFoundExitCode = j["notFoundExitCode"].get<int>();
    }
    return spec;
}

std::optional<CommandSpec> optionalCommand(const nlohmann::json &document, const char *key)
{
    if (!document.contains(key) || !document[key].is_object()) {
        return std::nullopt;
    }
    CommandSpec spec = parseCommand(document[key]);
    if (spec.program.empty()) {
        return std::nullopt;
    }
    return spec;
}

std::set<std::string> stringSet(const nlohmann::json &j, const std::set<std::string> &fallback)
{
    if (!j.is_array()) {
        return fallback;
    }
    std::set<std::string> out;
    for (const auto &value : j) {
        if (value.is_string()) {
            out.insert(value.get<std::string>());
        }
    }
    return out;
}

std::optional<long> envSeconds(const char *name)
{
    const char *raw = std::getenv(name);
    if (!raw || !*raw) {
        return std::nullopt;
    }
    char *end = nullptr;
    const long value = std::strtol(raw, &end, 10);
    if (end == raw || *end != '\0' || value < 0) {
        TLOG_WARN(QStringLiteral("Settings"),
                  QStringLiteral("envSeconds"),
                  QStringLiteral("env_override_ignored"),
                  QStringLiteral("not_a_non_negative_integer"),
                  QStringLiteral("getenv"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"name", name}, {"value", raw}});
        return std::nullopt;
    }
    return value;
}

// Intervals feed the scheduler directly; zero or negative would spin.
int positiveInterval(const std::string &key, int value, int fallback)
{
    if (value > 0) {
        return value;
    }
    TLOG_WARN(QStringLiteral("Settings"),
              QStringLiteral("positiveInterval"),
              QStringLiteral("interval_ignored"),
              QStringLiteral("not_positive"),
              QStringLiteral("keep_default"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"key", key}, {"value", value}, {"fallback", fallback}});
    return fallback;
}

} // namespace

TaskSettings Settings::task(const std::string &id) const
{
    auto it = tasks.find(id);
    if (it == tasks.end()) {
        return TaskSettings{};
    }
    return it->second;
}

Settings defaultSettings()
{
    Settings settings;
    settings.tasks[kTokenRenewalTask] = TaskSettings{300, true, 0};
    settings.tasks[kLeaseRenewalTask] = TaskSettings{60, true, 0};
    settings.tasks[kStatusPollTask] = TaskSettings{10, true, 0};
    return settings;
}

Settings parseSettings(const nlohmann::json &document)
{
    Settings settings = defaultSettings();
    if (!document.is_object()) {
        return settings;
    }

    if (document.contains("tree") && document["tree"].is_object()) {
        const auto &tree = document["tree"];
        settings.treeTtl = std::chrono::seconds(tree.value("ttlSeconds", 0));
        settings.listerTimeout = std::chrono::seconds(tree.value("listerTimeoutSeconds", 30));
    }

    if (document.contains("processes") && document["processes"].is_object()) {
        const auto &processes = document["processes"];
        settings.processRetention = std::chrono::seconds(processes.value("retentionSeconds", 3600));
        const int fallback = static_cast<int>(settings.sweepInterval.count());
        settings.sweepInterval = std::chrono::seconds(
            positiveInterval("processes.sweepIntervalSeconds",
                             processes.value("sweepIntervalSeconds", fallback), fallback));
    }

    if (document.contains("tasks") && document["tasks"].is_object()) {
        for (const auto &item : document["tasks"].items()) {
            if (!item.value().is_object()) {
                continue;
            }
            TaskSettings task = settings.task(item.key());
            task.intervalSeconds = positiveInterval(
                "tasks." + item.key() + ".intervalSeconds",
                item.value().value("intervalSeconds", task.intervalSeconds),
                task.intervalSeconds);
            task.enabled = item.value().value("enabled", task.enabled);
            task.timeoutSeconds = item.value().value("timeoutSeconds", task.timeoutSeconds);
            settings.tasks[item.key()] = task;
        }
    }

    if (document.contains("alerts") && document["alerts"].is_object()) {
        const auto &alerts = document["alerts"];
        AlertSettings &out = settings.alerts;
        out.enabled = alerts.value("enabled", out.enabled);
        if (alerts.contains("failureStatuses")) {
            out.failureStatuses = stringSet(alerts["failureStatuses"], out.failureStatuses);
        }
        out.alertOnRemoval = alerts.value("alertOnRemoval", out.alertOnRemoval);
        if (alerts.contains("startStatuses")) {
            out.startStatuses = stringSet(alerts["startStatuses"], out.startStatuses);
        }
        out.alertOnStart = alerts.value("alertOnStart", out.alertOnStart);
        out.resourceLabel = alerts.value("resourceLabel", out.resourceLabel);
    }

    if (document.contains("leases") && document["leases"].is_object()) {
        settings.leaseRenewWindow = std::chrono::seconds(
            document["leases"].value("renewWindowSeconds", 120));
    }

    if (document.contains("backends") && document["backends"].is_array()) {
        for (const auto &entry : document["backends"]) {
            if (!entry.is_object() || !entry.contains("list") || !entry["list"].is_object()) {
                continue;
            }
            BackendSettings backend;
            backend.name = entry.value("name", "");
            backend.root = entry.value("root", "");
            backend.label = entry.value("label", backend.name);
            backend.list = parseCommand(entry["list"]);
            if (entry.contains("ttlSeconds") && entry["ttlSeconds"].is_number_integer()) {
                backend.ttl = std::chrono::seconds(entry["ttlSeconds"].get<int>());
            }
            if (backend.root.empty() || backend.list.program.empty()) {
                continue;
            }
            settings.backends.push_back(std::move(backend));
        }
    }

    settings.statusPoll = optionalCommand(document, "statusPoll");
    settings.tokenRenew = optionalCommand(document, "tokenRenew");
    settings.leaseRenew = optionalCommand(document, "leaseRenew");

    return settings;
}

std::string settingsFilePath()
{
    const char *overridePath = std::getenv("TONGCHI_CONFIG");
    if (overridePath && *overridePath) {
        return overridePath;
    }
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".config/tongchi";
    return (basePath / "config.json").string();
}

Settings loadSettings()
{
    return loadSettingsFrom(settingsFilePath());
}

Settings loadSettingsFrom(const std::string &path)
{
    Settings settings = defaultSettings();

    std::ifstream in(path);
    if (!in) {
        TLOG_WARN(QStringLiteral("Settings"),
                  QStringLiteral("loadSettingsFrom"),
                  QStringLiteral("config_missing"),
                  QStringLiteral("file_not_readable"),
                  QStringLiteral("use_defaults"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"path", path}});
    } else {
        try {
            nlohmann::json document;
            in >> document;
            settings = parseSettings(document);
        } catch (const nlohmann::json::exception &ex) {
            TLOG_WARN(QStringLiteral("Settings"),
                      QStringLiteral("loadSettingsFrom"),
                      QStringLiteral("config_invalid"),
                      QStringLiteral("json_parse_error"),
                      QStringLiteral("use_defaults"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"path", path}, {"error", ex.what()}});
            settings = defaultSettings();
        }
    }

    applyEnvironmentOverrides(settings);
    return settings;
}

void applyEnvironmentOverrides(Settings &settings)
{
    if (const auto ttl = envSeconds("TONGCHI_TREE_TTL")) {
        settings.treeTtl = std::chrono::seconds(*ttl);
    }
    if (const auto retention = envSeconds("TONGCHI_PROCESS_RETENTION")) {
        settings.processRetention = std::chrono::seconds(*retention);
    }
}

} // namespace tongchi
