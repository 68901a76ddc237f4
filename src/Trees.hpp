// Bridge between declaration symbols and the syntax tree nodes that declare them

#ifndef ANNOTRACE_TREES_HPP
#define ANNOTRACE_TREES_HPP

#include <format>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "Context.hpp"
#include "SyntaxTree.hpp"
#include "Symbols.hpp"

namespace Annotrace
{

struct TreeRef
{
    CompilationUnit * unit = nullptr;
    NodeId node = NoNode;

    bool operator==(const TreeRef & other) const = default;
};

class Trees
{
public:
    // Registered by the host; nullptr when the host did not provide one
    static Trees * instance(Context & context)
    {
        return context.get<Trees>();
    }

    void enter(const Element & element, TreeRef ref)
    {
        std::lock_guard<std::mutex> lock(mutex);
        trees.insert_or_assign(element, ref);
    }

    std::optional<TreeRef> getTree(const Element & element) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = trees.find(element);
        if (it == trees.end()) return std::nullopt;
        return it->second;
    }

    // Like getTree, but the element must be known and the node must carry the expected tag
    template <typename T>
    TreeRef getTreeAs(const Element & element) const
    {
        std::optional<TreeRef> ref = getTree(element);
        if (!ref || !ref->unit)
        {
            throw std::runtime_error(std::format("No tree for element {}", elementToString(element)));
        }
        // Throws if the tag does not match
        ref->unit->get<T>(ref->node);
        return *ref;
    }

    CompilationUnit & getCompilationUnit(const ClassSymbol & classSymbol) const
    {
        if (!classSymbol.unit)
        {
            throw std::runtime_error(std::format("No compilation unit for class {}", classSymbol.qualifiedName));
        }
        return *classSymbol.unit;
    }

private:
    mutable std::mutex mutex;
    std::unordered_map<Element, TreeRef> trees;
};

} // namespace Annotrace

#endif // ANNOTRACE_TREES_HPP
