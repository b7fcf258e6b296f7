#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace tongchi {

// TongchiStore is the SQLite history layer: raised alerts, finished
// processes and a small meta table. Failures throw std::runtime_error.
class TongchiStore {
public:
    // Opens $HOME/.local/share/tongchi/tongchi.db.
    TongchiStore();
    explicit TongchiStore(const std::string &dbPath);
    ~TongchiStore();

    TongchiStore(const TongchiStore &) = delete;
    TongchiStore &operator=(const TongchiStore &) = delete;

    void addAlert(const Alert &alert);
    std::vector<Alert> getAlertsSince(std::chrono::system_clock::time_point since) const;

    // Upserts by process id; call once the handle is terminal.
    void recordProcess(const ProcessHandle &handle);
    std::vector<ProcessHandle> listProcessHistory(std::size_t limit) const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck() const;

    static std::string defaultDatabasePath();

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace tongchi
