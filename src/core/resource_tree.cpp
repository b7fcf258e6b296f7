#include "core/resource_tree.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace tongchi {

namespace {

QString qs(const std::string &value)
{
    return QString::fromStdString(value);
}

} // namespace

ResourceTree::ResourceTree(Executor &executor, const Clock &clock, ResourceTreeOptions options)
    : m_executor(executor)
    , m_clock(clock)
    , m_options(options)
{
}

ResourceTree::~ResourceTree()
{
    std::vector<std::shared_ptr<OperationContext>> inFlight;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shuttingDown = true;
        for (const auto &entry : m_nodes) {
            if (entry.second.load) {
                inFlight.push_back(entry.second.load->context);
            }
        }
    }

    for (const auto &context : inFlight) {
        context->cancel();
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this]() { return m_activeLoads == 0; });
}

void ResourceTree::bindLister(const std::string &prefix,
                              std::shared_ptr<Lister> lister,
                              std::optional<std::chrono::seconds> ttl)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_bindings[prefix] = Binding{std::move(lister), ttl};
    }
    TLOG_DEBUG(QStringLiteral("ResourceTree"),
               QStringLiteral("bindLister"),
               QStringLiteral("lister_bound"),
               QStringLiteral("client_setup"),
               QStringLiteral("prefix_binding"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"prefix", prefix},
                              {"ttlSeconds", ttl ? ttl->count() : -1}});
}

void ResourceTree::unbindAll()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_bindings.clear();
}

ExpandResult ResourceTree::expand(const std::string &path)
{
    OperationContext caller;
    return expand(path, caller);
}

ExpandResult ResourceTree::expand(const std::string &path, const OperationContext &caller)
{
    std::shared_ptr<Load> load;
    std::shared_ptr<Lister> lister;
    bool coalesced = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shuttingDown) {
            ExpandResult result;
            result.error = Error{ErrorKind::Internal, "resource tree is shutting down"};
            return result;
        }

        Node &node = nodeForLocked(path);
        if (node.status == NodeStatus::Loaded && !isStaleLocked(node)) {
            return cachedResultLocked(node);
        }

        if (node.load) {
            load = node.load;
            coalesced = true;
        } else {
            const Binding *binding = bindingForLocked(path);
            if (!binding) {
                node.status = NodeStatus::Error;
                node.lastError = "no lister bound for path";
                ExpandResult result = cachedResultLocked(node);
                result.status = NodeStatus::Error;
                result.error = Error{ErrorKind::Internal, node.lastError};
                return result;
            }
            lister = binding->lister;
            load = startLoadLocked(node, *binding);
        }
    }

    if (coalesced) {
        TLOG_DEBUG(QStringLiteral("ResourceTree"),
                   QStringLiteral("expand"),
                   QStringLiteral("expand_coalesced"),
                   QStringLiteral("load_in_flight"),
                   QStringLiteral("shared_wait"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"path", path}});
    } else {
        m_executor.post([this, path, lister, load]() {
            runLoad(path, lister, load);
        });
    }

    return waitForLoad(load, caller);
}

void ResourceTree::expandAsync(const std::string &path, ExpandCallback callback)
{
    std::shared_ptr<Load> load;
    std::shared_ptr<Lister> lister;
    ExpandResult immediate;
    bool answered = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shuttingDown) {
            immediate.error = Error{ErrorKind::Internal, "resource tree is shutting down"};
            answered = true;
        } else {
            Node &node = nodeForLocked(path);
            if (node.status == NodeStatus::Loaded && !isStaleLocked(node)) {
                immediate = cachedResultLocked(node);
                answered = true;
            } else if (node.load) {
                load = node.load;
            } else if (const Binding *binding = bindingForLocked(path)) {
                lister = binding->lister;
                load = startLoadLocked(node, *binding);
            } else {
                node.status = NodeStatus::Error;
                node.lastError = "no lister bound for path";
                immediate = cachedResultLocked(node);
                immediate.status = NodeStatus::Error;
                immediate.error = Error{ErrorKind::Internal, node.lastError};
                answered = true;
            }
        }
    }

    if (answered) {
        if (callback) {
            callback(path, immediate);
        }
        return;
    }

    bool alreadyDone = false;
    {
        std::lock_guard<std::mutex> lock(load->mutex);
        if (load->done) {
            alreadyDone = true;
            immediate = load->result;
        } else if (callback) {
            load->callbacks.push_back(callback);
        }
    }

    if (alreadyDone && callback) {
        callback(path, immediate);
    }

    if (lister) {
        m_executor.post([this, path, lister, load]() {
            runLoad(path, lister, load);
        });
    }
}

NodeView ResourceTree::peek(const std::string &path) const
{
    NodeView view;
    view.path = path;

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_nodes.find(path);
    if (it == m_nodes.end()) {
        return view;
    }

    const Node &node = it->second;
    view.status = node.status;
    view.children = node.children;
    view.loadedAt = node.loadedAt;
    view.lastError = node.lastError;
    view.stale = isStaleLocked(node);
    return view;
}

void ResourceTree::invalidate(const std::string &path, bool recursive)
{
    std::vector<std::string> paths;
    NodeListener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (recursive) {
            collectSubtreeLocked(path, paths);
        } else if (m_nodes.count(path) > 0) {
            paths.push_back(path);
        }

        for (const auto &target : paths) {
            auto it = m_nodes.find(target);
            if (it != m_nodes.end()) {
                resetNodeLocked(it->second);
            }
        }
        listener = m_listener;
    }

    TLOG_INFO(QStringLiteral("ResourceTree"),
              QStringLiteral("invalidate"),
              QStringLiteral("nodes_invalidated"),
              QStringLiteral("listing_changed"),
              recursive ? QStringLiteral("subtree") : QStringLiteral("single_node"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"path", path}, {"count", paths.size()}});

    if (listener) {
        for (const auto &target : paths) {
            listener(target);
        }
    }
}

void ResourceTree::invalidateAll()
{
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto &entry : m_nodes) {
            resetNodeLocked(entry.second);
        }
        count = m_nodes.size();
    }

    TLOG_INFO(QStringLiteral("ResourceTree"),
              QStringLiteral("invalidateAll"),
              QStringLiteral("tree_invalidated"),
              QStringLiteral("clients_reset"),
              QStringLiteral("all_nodes"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"count", count}});
}

void ResourceTree::prune(const std::string &path)
{
    std::vector<std::string> paths;
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        collectSubtreeLocked(path, paths);
        for (const auto &target : paths) {
            auto it = m_nodes.find(target);
            if (it == m_nodes.end()) {
                continue;
            }
            if (it->second.load) {
                // Keep the node while its load is in flight so a second Lister
                // call for the same path cannot start; it comes back NotLoaded.
                resetNodeLocked(it->second);
                it->second.childLinks.clear();
                continue;
            }
            m_nodes.erase(it);
            ++removed;
        }
    }

    TLOG_INFO(QStringLiteral("ResourceTree"),
              QStringLiteral("prune"),
              QStringLiteral("subtree_pruned"),
              QStringLiteral("resource_deleted"),
              QStringLiteral("erase_nodes"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"path", path}, {"removed", removed}});
}

void ResourceTree::setNodeListener(NodeListener listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

void ResourceTree::setOptions(ResourceTreeOptions options)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_options = options;
}

std::size_t ResourceTree::nodeCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_nodes.size();
}

bool ResourceTree::contains(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_nodes.count(path) > 0;
}

bool ResourceTree::waitForIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCv.wait_for(lock, timeout, [this]() { return m_activeLoads == 0; });
}

ResourceTree::Node &ResourceTree::nodeForLocked(const std::string &path)
{
    auto it = m_nodes.find(path);
    if (it != m_nodes.end()) {
        return it->second;
    }
    Node node;
    node.ttl = m_options.ttl;
    return m_nodes.emplace(path, std::move(node)).first->second;
}

const ResourceTree::Binding *ResourceTree::bindingForLocked(const std::string &path) const
{
    const Binding *best = nullptr;
    std::size_t bestLength = 0;
    for (const auto &entry : m_bindings) {
        const std::string &prefix = entry.first;
        if (path.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        if (!best || prefix.size() > bestLength) {
            best = &entry.second;
            bestLength = prefix.size();
        }
    }
    return best;
}

bool ResourceTree::isStaleLocked(const Node &node) const
{
    if (node.status != NodeStatus::Loaded || node.ttl.count() <= 0 || !node.loadedAt) {
        return false;
    }
    return m_clock.now() - *node.loadedAt >= node.ttl;
}

ExpandResult ResourceTree::cachedResultLocked(const Node &node) const
{
    ExpandResult result;
    result.status = node.status;
    result.children = node.children;
    result.stale = isStaleLocked(node);
    return result;
}

std::shared_ptr<ResourceTree::Load> ResourceTree::startLoadLocked(Node &node,
                                                                  const Binding &binding)
{
    auto load = std::make_shared<Load>();
    load->context = OperationContext::create(m_options.listerTimeout);
    load->generation = node.generation;

    node.load = load;
    node.status = NodeStatus::Loading;
    node.ttl = binding.ttl.value_or(m_options.ttl);
    ++m_activeLoads;
    return load;
}

void ResourceTree::runLoad(const std::string &path,
                           std::shared_ptr<Lister> lister,
                           std::shared_ptr<Load> load)
{
    logging::CorrelationScope corr(logging::newCorrelationId(QStringLiteral("load")));
    TLOG_INFO(QStringLiteral("ResourceTree"),
              QStringLiteral("runLoad"),
              QStringLiteral("load_started"),
              QStringLiteral("expand_miss"),
              QStringLiteral("lister_call"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"path", path}});

    ListResult listed;
    try {
        listed = lister->list(path, *load->context);
    } catch (const std::exception &ex) {
        listed.children.clear();
        listed.error = Error{ErrorKind::Internal, ex.what()};
    } catch (...) {
        listed.children.clear();
        listed.error = Error{ErrorKind::Internal, "lister raised an unknown exception"};
    }

    // A missing resource is an empty listing, not a failure.
    if (listed.error && listed.error->kind == ErrorKind::NotFound) {
        listed.error.reset();
        listed.children.clear();
    }

    if (listed.error) {
        TLOG_WARN(QStringLiteral("ResourceTree"),
                  QStringLiteral("runLoad"),
                  QStringLiteral("load_failed"),
                  qs(toErrorKindString(listed.error->kind)),
                  QStringLiteral("keep_previous_children"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"path", path}, {"error", listed.error->message}});
    } else {
        TLOG_INFO(QStringLiteral("ResourceTree"),
                  QStringLiteral("runLoad"),
                  QStringLiteral("load_finished"),
                  QStringLiteral("lister_returned"),
                  QStringLiteral("cache_children"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"path", path}, {"children", listed.children.size()}});
    }

    finishLoad(path, load, std::move(listed));
}

void ResourceTree::finishLoad(const std::string &path,
                              const std::shared_ptr<Load> &load,
                              ListResult listed)
{
    ExpandResult result;
    result.error = listed.error;
    NodeListener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_nodes.find(path);
        const bool current = it != m_nodes.end() && it->second.load == load;
        if (current) {
            Node &node = it->second;
            node.load.reset();
            if (listed.error) {
                node.status = NodeStatus::Error;
                node.lastError = describeError(*listed.error);
                result.status = NodeStatus::Error;
                result.children = node.children;
            } else if (node.generation != load->generation) {
                // Invalidated while loading: hand the result to the waiters
                // but do not trust it for later expands.
                node.status = NodeStatus::NotLoaded;
                node.children.clear();
                result.status = NodeStatus::Loaded;
                result.children = std::move(listed.children);
            } else {
                node.status = NodeStatus::Loaded;
                node.children = listed.children;
                node.childLinks.clear();
                for (const auto &child : node.children) {
                    node.childLinks.push_back(child.path);
                }
                node.loadedAt = m_clock.now();
                node.lastError.clear();
                result.status = NodeStatus::Loaded;
                result.children = std::move(listed.children);
            }
        } else {
            result.status = listed.error ? NodeStatus::Error : NodeStatus::Loaded;
            result.children = std::move(listed.children);
        }
        listener = m_listener;
    }

    std::vector<ExpandCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(load->mutex);
        load->done = true;
        load->result = result;
        callbacks.swap(load->callbacks);
    }
    load->cv.notify_all();

    for (const auto &callback : callbacks) {
        callback(path, result);
    }
    if (listener) {
        listener(path);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    --m_activeLoads;
    m_idleCv.notify_all();
}

ExpandResult ResourceTree::waitForLoad(const std::shared_ptr<Load> &load,
                                       const OperationContext &caller)
{
    CancelCallbackGuard wake(caller, [load]() {
        std::lock_guard<std::mutex> lock(load->mutex);
        load->cv.notify_all();
    });

    std::optional<OperationContext::SteadyClock::time_point> deadline =
        load->context->deadline();
    const auto callerDeadline = caller.deadline();
    if (callerDeadline && (!deadline || *callerDeadline < *deadline)) {
        deadline = callerDeadline;
    }

    std::unique_lock<std::mutex> lock(load->mutex);
    const auto finished = [&]() { return load->done || caller.isCancelled(); };
    if (deadline) {
        load->cv.wait_until(lock, *deadline, finished);
    } else {
        load->cv.wait(lock, finished);
    }

    if (load->done) {
        return load->result;
    }
    lock.unlock();

    // The caller stops waiting; the load itself keeps running for others.
    ExpandResult abandoned;
    abandoned.status = NodeStatus::Loading;
    if (caller.isCancelled()) {
        abandoned.error = Error{ErrorKind::Cancelled, "expand abandoned by caller"};
    } else {
        abandoned.error = Error{ErrorKind::Timeout, "listing did not finish in time"};
    }
    return abandoned;
}

void ResourceTree::collectSubtreeLocked(const std::string &path,
                                        std::vector<std::string> &out) const
{
    std::set<std::string> visited;
    std::vector<std::string> pending{path};
    while (!pending.empty()) {
        const std::string current = pending.back();
        pending.pop_back();
        if (!visited.insert(current).second) {
            continue;
        }
        auto it = m_nodes.find(current);
        if (it == m_nodes.end()) {
            continue;
        }
        out.push_back(current);
        for (const auto &child : it->second.childLinks) {
            pending.push_back(child);
        }
    }
}

void ResourceTree::resetNodeLocked(Node &node)
{
    ++node.generation;
    node.children.clear();
    node.loadedAt.reset();
    node.lastError.clear();
    if (!node.load) {
        node.status = NodeStatus::NotLoaded;
    }
}

} // namespace tongchi
