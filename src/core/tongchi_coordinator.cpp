#include "core/tongchi_coordinator.hpp"

#include <QDate>
#include <QDateTime>
#include <QTime>
#include <QTimer>

#include <ctime>
#include <exception>
#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/tongchi_store.hpp"

namespace tongchi {

namespace {

constexpr int kTickIntervalMs = 1000;

} // namespace

AlertPolicy alertPolicyFromSettings(const AlertSettings &settings)
{
    AlertPolicy policy;
    policy.failureStatuses = settings.failureStatuses;
    policy.alertOnRemoval = settings.alertOnRemoval;
    policy.startStatuses = settings.startStatuses;
    policy.alertOnStart = settings.alertOnStart;
    policy.resourceLabel = settings.resourceLabel;
    return policy;
}

TongchiCoordinator::TongchiCoordinator(Settings settings,
                                       std::shared_ptr<ClientFactory> factory,
                                       TongchiStore *store,
                                       const Clock &clock,
                                       QObject *parent)
    : QObject(parent)
    , m_settings(std::move(settings))
    , m_clock(clock)
    , m_store(store)
{
    qRegisterMetaType<tongchi::Alert>();
    qRegisterMetaType<tongchi::ProcessHandle>();

    m_treeExecutor = std::make_unique<ThreadPoolExecutor>(4);
    m_taskExecutor = std::make_unique<ThreadPoolExecutor>(4);
    m_processExecutor = std::make_unique<ThreadPoolExecutor>(4);

    ResourceTreeOptions treeOptions;
    treeOptions.ttl = m_settings.treeTtl;
    treeOptions.listerTimeout = m_settings.listerTimeout;
    m_tree = std::make_unique<ResourceTree>(*m_treeExecutor, m_clock, treeOptions);

    m_detector = std::make_unique<ChangeDetector>(m_clock, alertPolicyFromSettings(m_settings.alerts));
    m_leases = std::make_unique<LeaseTracker>(m_clock, m_settings.leaseRenewWindow);

    ProcessRegistryOptions processOptions;
    processOptions.retention = m_settings.processRetention;
    m_registry = std::make_unique<ProcessRegistry>(*m_processExecutor, m_clock, processOptions);

    m_runner = std::make_unique<ScheduledTaskRunner>(*m_taskExecutor, m_clock);

    m_tree->setNodeListener([this](const std::string &path) {
        emit nodeUpdated(QString::fromStdString(path));
    });
    m_registry->setChangeListener([this](const ProcessHandle &handle) {
        handleProcessChange(handle);
    });
    m_runner->setTaskListener([this](const ScheduledTask &task) {
        emit taskFinished(QString::fromStdString(task.id), task.lastError.empty());
    });

    m_timer = new QTimer(this);
    m_timer->setInterval(kTickIntervalMs);
    connect(m_timer, &QTimer::timeout, this, [this]() { tick(); });

    resetClients(std::move(factory));

    ScheduledTask sweep;
    sweep.id = kProcessSweepTask;
    sweep.intervalSeconds = static_cast<int>(m_settings.sweepInterval.count());
    m_runner->schedule(sweep, [this](const OperationContext &) -> std::optional<Error> {
        m_registry->sweep();
        return std::nullopt;
    });
}

TongchiCoordinator::~TongchiCoordinator()
{
    stop();

    // Tear down while this object is still whole; workers may emit signals
    // until each component has drained.
    m_runner.reset();
    m_registry.reset();
    m_tree.reset();
}

void TongchiCoordinator::start()
{
    TLOG_INFO(QStringLiteral("TongchiCoordinator"),
              QStringLiteral("start"),
              QStringLiteral("coordinator_start"),
              QStringLiteral("startup"),
              QStringLiteral("qtimer_tick"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"backends", m_settings.backends.size()}});

    m_runner->trigger(kStatusPollTask);
    m_timer->start();
}

void TongchiCoordinator::stop()
{
    if (m_timer) {
        m_timer->stop();
    }
    if (m_runner && !m_runner->isStopped()) {
        m_runner->stop();
    }
}

int TongchiCoordinator::tick()
{
    return m_runner->runDue();
}

void TongchiCoordinator::resetClients(std::shared_ptr<ClientFactory> factory)
{
    std::vector<ListerBinding> bindings;
    RenewFunction tokenRenew;
    LeaseTracker::RenewFunction leaseRenew;
    PollFunction statusPoll;
    if (factory) {
        bindings = factory->createListers();
        tokenRenew = factory->createTokenRenewer();
        leaseRenew = factory->createLeaseRenewer();
        statusPoll = factory->createStatusPoller();
    }

    m_tree->unbindAll();
    m_tree->invalidateAll();
    for (const ListerBinding &binding : bindings) {
        if (binding.lister) {
            m_tree->bindLister(binding.prefix, binding.lister, binding.ttl);
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_clientsMutex);
        m_factory = std::move(factory);
        m_roots = std::move(bindings);
        m_tokenRenew = std::move(tokenRenew);
        m_leaseRenew = std::move(leaseRenew);
        m_statusPoll = std::move(statusPoll);
        ++m_clientGeneration;
        m_detector->reset();
    }

    applyTaskSchedule();

    TLOG_INFO(QStringLiteral("TongchiCoordinator"),
              QStringLiteral("resetClients"),
              QStringLiteral("clients_reset"),
              QStringLiteral("factory_injected"),
              QStringLiteral("rebind_listers"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"roots", roots().size()}});
}

std::vector<ListerBinding> TongchiCoordinator::roots() const
{
    std::lock_guard<std::mutex> lock(m_clientsMutex);
    return m_roots;
}

ProcessHandle TongchiCoordinator::submitProcess(const std::string &name,
                                                const std::string &description,
                                                bool cancellable,
                                                ProcessRegistry::OperationFunction function)
{
    return m_registry->submit(name, description, cancellable, std::move(function));
}

void TongchiCoordinator::trackLease(const std::string &leaseId, std::chrono::seconds ttl)
{
    m_leases->addLease(leaseId, ttl);
}

std::vector<Alert> TongchiCoordinator::todaysAlerts() const
{
    if (!m_store) {
        return {};
    }

    const auto nowSecs = std::chrono::duration_cast<std::chrono::seconds>(
                             m_clock.now().time_since_epoch())
                             .count();
    const QDate today = QDateTime::fromSecsSinceEpoch(nowSecs).toLocalTime().date();
    const QDateTime startOfDay(today, QTime(0, 0));
    const auto since = std::chrono::system_clock::from_time_t(
        static_cast<std::time_t>(startOfDay.toSecsSinceEpoch()));
    try {
        return m_store->getAlertsSince(since);
    } catch (const std::exception &ex) {
        TLOG_WARN(QStringLiteral("TongchiCoordinator"),
                  QStringLiteral("todaysAlerts"),
                  QStringLiteral("store_read_failed"),
                  QStringLiteral("sqlite_error"),
                  QStringLiteral("return_empty"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"error", ex.what()}});
        return {};
    }
}

std::optional<Error> TongchiCoordinator::runTokenRenewal(const OperationContext &context)
{
    RenewFunction renew;
    {
        std::lock_guard<std::mutex> lock(m_clientsMutex);
        renew = m_tokenRenew;
    }
    if (!renew) {
        return std::nullopt;
    }
    return renew(context);
}

std::optional<Error> TongchiCoordinator::runLeaseRenewal(const OperationContext &context)
{
    LeaseTracker::RenewFunction renew;
    {
        std::lock_guard<std::mutex> lock(m_clientsMutex);
        renew = m_leaseRenew;
    }
    if (!renew) {
        return std::nullopt;
    }

    std::optional<Error> firstFailure;
    for (const LeaseEvent &event : m_leases->renewDue(renew, context)) {
        if (event.outcome == LeaseOutcome::Expired) {
            emit leaseExpired(QString::fromStdString(event.leaseId));
        } else if (event.outcome == LeaseOutcome::Failed && !firstFailure) {
            firstFailure = event.error;
        }
    }
    return firstFailure;
}

std::optional<Error> TongchiCoordinator::runStatusPoll(const OperationContext &context)
{
    PollFunction poll;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_clientsMutex);
        poll = m_statusPoll;
        generation = m_clientGeneration;
    }
    if (!poll) {
        return std::nullopt;
    }

    PollResult result = poll(context);
    if (result.error) {
        // No observe() for this cycle; the next successful poll diffs against
        // the last good snapshot.
        TLOG_WARN(QStringLiteral("TongchiCoordinator"),
                  QStringLiteral("runStatusPoll"),
                  QStringLiteral("poll_failed"),
                  QString::fromStdString(toErrorKindString(result.error->kind)),
                  QStringLiteral("skip_observe"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"error", result.error->message}});
        return result.error;
    }

    std::vector<Alert> alerts;
    {
        std::lock_guard<std::mutex> lock(m_clientsMutex);
        if (generation != m_clientGeneration) {
            TLOG_INFO(QStringLiteral("TongchiCoordinator"),
                      QStringLiteral("runStatusPoll"),
                      QStringLiteral("poll_discarded"),
                      QStringLiteral("clients_reset_during_poll"),
                      QStringLiteral("skip_observe"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"statuses", result.statuses.size()}});
            return std::nullopt;
        }
        alerts = m_detector->observe(result.statuses);
    }
    if (!m_settings.alerts.enabled) {
        return std::nullopt;
    }

    for (const Alert &alert : alerts) {
        if (m_store) {
            try {
                m_store->addAlert(alert);
            } catch (const std::exception &ex) {
                TLOG_WARN(QStringLiteral("TongchiCoordinator"),
                          QStringLiteral("runStatusPoll"),
                          QStringLiteral("alert_persist_failed"),
                          QStringLiteral("sqlite_error"),
                          QStringLiteral("emit_anyway"),
                          logging::defaultWho(),
                          QString(),
                          nlohmann::json{{"alertId", alert.id}, {"error", ex.what()}});
            }
        }
        emit alertDetected(alert);
        emit alertRaised(QString::fromStdString(alert.title),
                         QString::fromStdString(alert.message));
    }
    return std::nullopt;
}

void TongchiCoordinator::applyTaskSchedule()
{
    bool hasToken = false;
    bool hasLease = false;
    bool hasPoll = false;
    {
        std::lock_guard<std::mutex> lock(m_clientsMutex);
        hasToken = static_cast<bool>(m_tokenRenew);
        hasLease = static_cast<bool>(m_leaseRenew);
        hasPoll = static_cast<bool>(m_statusPoll);
    }

    scheduleTask(kTokenRenewalTask, hasToken, [this](const OperationContext &context) {
        return runTokenRenewal(context);
    });
    scheduleTask(kLeaseRenewalTask, hasLease, [this](const OperationContext &context) {
        return runLeaseRenewal(context);
    });
    scheduleTask(kStatusPollTask, hasPoll, [this](const OperationContext &context) {
        return runStatusPoll(context);
    });
}

void TongchiCoordinator::scheduleTask(const char *id, bool available,
                                      ScheduledTaskRunner::TaskFunction function)
{
    if (!available) {
        // A running execution finds the cleared client and returns early.
        m_runner->unschedule(id);
        return;
    }

    const TaskSettings configured = m_settings.task(id);
    ScheduledTask task;
    task.id = id;
    task.intervalSeconds = configured.intervalSeconds;
    task.enabled = configured.enabled;
    task.timeoutSeconds = configured.timeoutSeconds;
    m_runner->schedule(task, std::move(function));
}

void TongchiCoordinator::handleProcessChange(const ProcessHandle &handle)
{
    if (m_store && isTerminal(handle.status)) {
        try {
            m_store->recordProcess(handle);
        } catch (const std::exception &ex) {
            TLOG_WARN(QStringLiteral("TongchiCoordinator"),
                      QStringLiteral("handleProcessChange"),
                      QStringLiteral("process_persist_failed"),
                      QStringLiteral("sqlite_error"),
                      QStringLiteral("keep_in_memory"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"processId", handle.id}, {"error", ex.what()}});
        }
    }
    emit processChanged(handle);
}

} // namespace tongchi
