#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/models.hpp"
#include "common/operation_context.hpp"

namespace tongchi {

struct ListResult {
    std::vector<ChildDescriptor> children;
    std::optional<Error> error;
};

// Fetches one level of a hierarchical namespace. Implementations run on a
// worker thread and should return early once the context is done.
class Lister {
public:
    virtual ~Lister() = default;
    virtual ListResult list(const std::string &path, const OperationContext &context) = 0;
};

class FunctionLister : public Lister {
public:
    using Function = std::function<ListResult(const std::string &, const OperationContext &)>;

    explicit FunctionLister(Function function)
        : m_function(std::move(function))
    {
    }

    ListResult list(const std::string &path, const OperationContext &context) override
    {
        return m_function(path, context);
    }

private:
    Function m_function;
};

} // namespace tongchi
