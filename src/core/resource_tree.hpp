#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/clock.hpp"
#include "common/executor.hpp"
#include "common/models.hpp"
#include "common/operation_context.hpp"
#include "core/lister.hpp"

namespace tongchi {

struct ResourceTreeOptions {
    // Zero means a loaded node never expires and must be invalidated explicitly.
    std::chrono::seconds ttl{0};
    std::chrono::milliseconds listerTimeout{30000};
};

/**
 * ResourceTree caches lazily-loaded listings of hierarchical remote namespaces.
 *
 * - Nodes are created on first reference and loaded through the Lister bound
 *   to the longest matching path prefix.
 * - Concurrent expands of one path share a single Lister call.
 * - Failed loads keep the previous children and surface the Error status.
 *
 * Lister calls run on the executor; callers block only in expand().
 */
class ResourceTree {
public:
    using ExpandCallback = std::function<void(const std::string &, const ExpandResult &)>;
    using NodeListener = std::function<void(const std::string &)>;

    ResourceTree(Executor &executor, const Clock &clock, ResourceTreeOptions options = {});
    ~ResourceTree();

    ResourceTree(const ResourceTree &) = delete;
    ResourceTree &operator=(const ResourceTree &) = delete;

    // A ttl set here overrides the tree-wide ttl for nodes under the prefix.
    void bindLister(const std::string &prefix,
                    std::shared_ptr<Lister> lister,
                    std::optional<std::chrono::seconds> ttl = std::nullopt);
    void unbindAll();

    ExpandResult expand(const std::string &path);
    ExpandResult expand(const std::string &path, const OperationContext &caller);
    void expandAsync(const std::string &path, ExpandCallback callback);

    NodeView peek(const std::string &path) const;

    void invalidate(const std::string &path, bool recursive = false);
    void invalidateAll();
    void prune(const std::string &path);

    void setNodeListener(NodeListener listener);
    void setOptions(ResourceTreeOptions options);

    std::size_t nodeCount() const;
    bool contains(const std::string &path) const;
    bool waitForIdle(std::chrono::milliseconds timeout);

private:
    struct Binding {
        std::shared_ptr<Lister> lister;
        std::optional<std::chrono::seconds> ttl;
    };

    struct Load {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        ExpandResult result;
        std::vector<ExpandCallback> callbacks;
        std::shared_ptr<OperationContext> context;
        std::uint64_t generation = 0;
    };

    struct Node {
        NodeStatus status = NodeStatus::NotLoaded;
        std::vector<ChildDescriptor> children;
        // Child paths from the last successful load, kept across invalidation
        // so recursive invalidate and prune can still walk the subtree.
        std::vector<std::string> childLinks;
        std::optional<std::chrono::system_clock::time_point> loadedAt;
        std::string lastError;
        std::chrono::seconds ttl{0};
        std::uint64_t generation = 0;
        std::shared_ptr<Load> load;
    };

    Executor &m_executor;
    const Clock &m_clock;

    mutable std::mutex m_mutex;
    std::condition_variable m_idleCv;
    ResourceTreeOptions m_options;
    std::map<std::string, Binding> m_bindings;
    std::unordered_map<std::string, Node> m_nodes;
    NodeListener m_listener;
    int m_activeLoads = 0;
    bool m_shuttingDown = false;

    Node &nodeForLocked(const std::string &path);
    const Binding *bindingForLocked(const std::string &path) const;
    bool isStaleLocked(const Node &node) const;
    ExpandResult cachedResultLocked(const Node &node) const;
    std::shared_ptr<Load> startLoadLocked(Node &node, const Binding &binding);
    void runLoad(const std::string &path, std::shared_ptr<Lister> lister,
                 std::shared_ptr<Load> load);
    void finishLoad(const std::string &path, const std::shared_ptr<Load> &load,
                    ListResult listed);
    ExpandResult waitForLoad(const std::shared_ptr<Load> &load,
                             const OperationContext &caller);
    void collectSubtreeLocked(const std::string &path,
                              std::vector<std::string> &out) const;
    void resetNodeLocked(Node &node);
};

} // namespace tongchi
