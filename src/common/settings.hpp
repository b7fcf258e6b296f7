#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tongchi {

// External CLI invocation. "{path}" and "{lease}" in arguments are replaced
// per call.
struct CommandSpec {
    std::string program;
    std::vector<std::string> arguments;
    std::optional<int> notFoundExitCode;
};

// One hierarchical namespace shown in the tray (secret engines, KV, jobs...).
struct BackendSettings {
    std::string name;
    std::string root;
    std::string label;
    CommandSpec list;
    std::optional<std::chrono::seconds> ttl;
};

struct TaskSettings {
    int intervalSeconds = 60;
    bool enabled = true;
    int timeoutSeconds = 0;
};

struct AlertSettings {
    bool enabled = true;
    std::set<std::string> failureStatuses{"dead", "failed"};
    bool alertOnRemoval = true;
    std::set<std::string> startStatuses{"running"};
    bool alertOnStart = false;
    std::string resourceLabel = "Resource";
};

struct Settings {
    std::chrono::seconds treeTtl{0};
    std::chrono::seconds listerTimeout{30};

    std::chrono::seconds processRetention{3600};
    std::chrono::seconds sweepInterval{60};

    std::map<std::string, TaskSettings> tasks;
    AlertSettings alerts;
    std::chrono::seconds leaseRenewWindow{120};

    std::vector<BackendSettings> backends;
    std::optional<CommandSpec> statusPoll;
    std::optional<CommandSpec> tokenRenew;
    std::optional<CommandSpec> leaseRenew;

    TaskSettings task(const std::string &id) const;
};

inline constexpr const char *kTokenRenewalTask = "token-renewal";
inline constexpr const char *kLeaseRenewalTask = "lease-renewal";
inline constexpr const char *kStatusPollTask = "status-poll";

Settings defaultSettings();

// Parses a config document on top of the defaults. Unknown keys are ignored.
Settings parseSettings(const nlohmann::json &document);

// $TONGCHI_CONFIG, or $HOME/.config/tongchi/config.json.
std::string settingsFilePath();

// Reads the config file and applies environment overrides. A missing or
// malformed file yields defaults.
Settings loadSettings();
Settings loadSettingsFrom(const std::string &path);

void applyEnvironmentOverrides(Settings &settings);

} // namespace tongchi
