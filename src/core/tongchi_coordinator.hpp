#pragma once

#include <QMetaType>
#include <QObject>
#include <QString>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/clock.hpp"
#include "common/executor.hpp"
#include "common/models.hpp"
#include "common/settings.hpp"
#include "core/change_detector.hpp"
#include "core/client_factory.hpp"
#include "core/lease_tracker.hpp"
#include "core/process_registry.hpp"
#include "core/resource_tree.hpp"
#include "core/scheduled_task_runner.hpp"

class QTimer;

namespace tongchi {

class TongchiStore;

inline constexpr const char *kProcessSweepTask = "process-sweep";

// TongchiCoordinator owns the core components, wires the scheduled tasks to
// the backend clients and re-emits component events as Qt signals. Signals
// may be emitted from worker threads; connect with the default connection
// type from GUI objects.
class TongchiCoordinator : public QObject {
    Q_OBJECT

public:
    TongchiCoordinator(Settings settings,
                       std::shared_ptr<ClientFactory> factory,
                       TongchiStore *store = nullptr,
                       const Clock &clock = systemClock(),
                       QObject *parent = nullptr);
    ~TongchiCoordinator() override;

    // Starts the 1 s scheduler tick and runs the first status poll.
    void start();
    void stop();

    // Dispatches due scheduled tasks; driven by the timer after start().
    int tick();

    // Rebuilds listers and task functions from a new factory, dropping cached
    // listings and the alert baseline.
    void resetClients(std::shared_ptr<ClientFactory> factory);

    std::vector<ListerBinding> roots() const;

    ProcessHandle submitProcess(const std::string &name,
                                const std::string &description,
                                bool cancellable,
                                ProcessRegistry::OperationFunction function);
    void trackLease(const std::string &leaseId, std::chrono::seconds ttl);

    std::vector<Alert> todaysAlerts() const;

    const Settings &settings() const { return m_settings; }
    ResourceTree &tree() { return *m_tree; }
    ScheduledTaskRunner &runner() { return *m_runner; }
    ChangeDetector &detector() { return *m_detector; }
    ProcessRegistry &processes() { return *m_registry; }
    LeaseTracker &leases() { return *m_leases; }

signals:
    void nodeUpdated(const QString &path);
    void alertRaised(const QString &title, const QString &message);
    void alertDetected(const tongchi::Alert &alert);
    void processChanged(const tongchi::ProcessHandle &handle);
    void taskFinished(const QString &taskId, bool succeeded);
    void leaseExpired(const QString &leaseId);

private:
    std::optional<Error> runTokenRenewal(const OperationContext &context);
    std::optional<Error> runLeaseRenewal(const OperationContext &context);
    std::optional<Error> runStatusPoll(const OperationContext &context);
    void applyTaskSchedule();
    void scheduleTask(const char *id, bool available,
                      ScheduledTaskRunner::TaskFunction function);
    void handleProcessChange(const ProcessHandle &handle);

    Settings m_settings;
    const Clock &m_clock;
    TongchiStore *m_store = nullptr;

    mutable std::mutex m_clientsMutex;
    std::shared_ptr<ClientFactory> m_factory;
    std::vector<ListerBinding> m_roots;
    RenewFunction m_tokenRenew;
    LeaseTracker::RenewFunction m_leaseRenew;
    PollFunction m_statusPoll;
    // Bumped by resetClients(); polls started under an older value are dropped.
    std::uint64_t m_clientGeneration = 0;

    std::unique_ptr<ThreadPoolExecutor> m_treeExecutor;
    std::unique_ptr<ThreadPoolExecutor> m_taskExecutor;
    std::unique_ptr<ThreadPoolExecutor> m_processExecutor;

    std::unique_ptr<ResourceTree> m_tree;
    std::unique_ptr<ChangeDetector> m_detector;
    std::unique_ptr<LeaseTracker> m_leases;
    std::unique_ptr<ProcessRegistry> m_registry;
    std::unique_ptr<ScheduledTaskRunner> m_runner;

    QTimer *m_timer = nullptr;
};

AlertPolicy alertPolicyFromSettings(const AlertSettings &settings);

} // namespace tongchi

Q_DECLARE_METATYPE(tongchi::Alert)
Q_DECLARE_METATYPE(tongchi::ProcessHandle)
