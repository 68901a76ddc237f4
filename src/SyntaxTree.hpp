// Arena-indexed syntax tree.
// Every node is a tag plus a per-tag payload held in a std::variant; children are referenced by NodeId
// into the arena that owns them. A CompilationUnit owns the arena of one source file, and detached
// fragments (e.g. synthesized statements) own small arenas of their own until they are grafted.

#ifndef ANNOTRACE_SYNTAXTREE_HPP
#define ANNOTRACE_SYNTAXTREE_HPP

#include <cstdint>
#include <filesystem>
#include <format>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <boost/stacktrace.hpp>
#include <spdlog/spdlog.h>

#include "Util.hpp"
#include "Names.hpp"

namespace Annotrace
{

using NodeId = std::uint32_t;
constexpr NodeId NoNode = std::numeric_limits<NodeId>::max();

// Payload order in the variant below must follow this order
enum class Tag : std::uint8_t
{
    TopLevel,
    Import,
    ClassDef,
    MethodDef,
    Block,
    Exec,
    Apply,
    Select,
    Ident,
    Literal,
    NewClass,
    Verbatim
};

std::string_view tagName(Tag tag)
{
    switch (tag)
    {
        case Tag::TopLevel: return "TopLevel";
        case Tag::Import: return "Import";
        case Tag::ClassDef: return "ClassDef";
        case Tag::MethodDef: return "MethodDef";
        case Tag::Block: return "Block";
        case Tag::Exec: return "Exec";
        case Tag::Apply: return "Apply";
        case Tag::Select: return "Select";
        case Tag::Ident: return "Ident";
        case Tag::Literal: return "Literal";
        case Tag::NewClass: return "NewClass";
        case Tag::Verbatim: return "Verbatim";
    }
    return "Unknown";
}

// A source file: package clause and top-level definitions (imports, types, anything else verbatim)
struct TopLevelData
{
    static constexpr Tag tag = Tag::TopLevel;
    std::string packageName; // Empty for the default package
    std::vector<NodeId> defs;
};

struct ImportData
{
    static constexpr Tag tag = Tag::Import;
    std::string qualifiedName; // "org.slf4j.Logger" or "org.slf4j.*"
    bool isStatic = false;
};

// Class, interface, enum or record.
// The header (modifiers, keyword, name, extends, ...) is kept as source text.
struct ClassDefData
{
    static constexpr Tag tag = Tag::ClassDef;
    Name name;
    std::string header;
    std::vector<std::string> annotations; // As spelt in source
    std::vector<NodeId> members;
};

struct Parameter
{
    std::string type;
    Name name;
};

// Method or constructor. The header is everything before the body, annotations included.
struct MethodDefData
{
    static constexpr Tag tag = Tag::MethodDef;
    Name name;
    std::string header;
    std::vector<Parameter> params;
    std::vector<std::string> annotations; // As spelt in source, e.g. "Deprecated" or "java.lang.Deprecated"
    NodeId body = NoNode; // NoNode for abstract and interface methods
    bool isConstructor = false;
};

struct BlockData
{
    static constexpr Tag tag = Tag::Block;
    std::vector<NodeId> stats;
    std::size_t headInsertions = 0; // Statements spliced at the head so far
};

// Expression statement
struct ExecData
{
    static constexpr Tag tag = Tag::Exec;
    NodeId expr = NoNode;
};

// Method invocation: meth(args)
struct ApplyData
{
    static constexpr Tag tag = Tag::Apply;
    NodeId meth = NoNode;
    std::vector<NodeId> args;
};

// Field or member selection: selected.name
struct SelectData
{
    static constexpr Tag tag = Tag::Select;
    NodeId selected = NoNode;
    Name name;
};

struct IdentData
{
    static constexpr Tag tag = Tag::Ident;
    Name name;
};

using LiteralValue = std::variant<std::nullptr_t, bool, char, std::int32_t, std::int64_t, double, std::string>;

struct LiteralData
{
    static constexpr Tag tag = Tag::Literal;
    LiteralValue value;
};

// Object construction: new clazz(args)
struct NewClassData
{
    static constexpr Tag tag = Tag::NewClass;
    NodeId clazz = NoNode;
    std::vector<NodeId> args;
};

enum class VerbatimKind : std::uint8_t
{
    Statement,
    ConstructorCall, // Explicit this(...) or super(...) at the start of a constructor body
    Comment, // Line or block comment between statements
    Member,
    Declaration
};

// Source text the tree does not model structurally
struct VerbatimData
{
    static constexpr Tag tag = Tag::Verbatim;
    std::string text;
    VerbatimKind kind = VerbatimKind::Statement;
};

using Payload = std::variant
<
    TopLevelData,
    ImportData,
    ClassDefData,
    MethodDefData,
    BlockData,
    ExecData,
    ApplyData,
    SelectData,
    IdentData,
    LiteralData,
    NewClassData,
    VerbatimData
>;
static_assert(std::variant_size_v<Payload> == static_cast<std::size_t>(Tag::Verbatim) + 1);

struct Node
{
    Payload payload;
    NodeId parent = NoNode;

    Tag tag() const
    {
        return static_cast<Tag>(payload.index());
    }
};

// Call f(NodeId &) on every child slot of a payload that refers to a node
template <typename F>
void forEachChild(Payload & payload, F && f)
{
    auto each = [&f](std::vector<NodeId> & ids)
    {
        for (NodeId & id : ids) f(id);
    };
    auto one = [&f](NodeId & id)
    {
        if (id != NoNode) f(id);
    };
    std::visit
    (
        overloaded
        {
            [&](TopLevelData & p) { each(p.defs); },
            [&](ClassDefData & p) { each(p.members); },
            [&](MethodDefData & p) { one(p.body); },
            [&](BlockData & p) { each(p.stats); },
            [&](ExecData & p) { one(p.expr); },
            [&](ApplyData & p) { one(p.meth); each(p.args); },
            [&](SelectData & p) { one(p.selected); },
            [&](NewClassData & p) { one(p.clazz); each(p.args); },
            [](auto &) {}
        },
        payload
    );
}

class SyntaxTree
{
public:
    SyntaxTree() : rootId(NoNode) {}

    SyntaxTree(const SyntaxTree &) = delete;
    SyntaxTree(SyntaxTree && src) noexcept
        : nodes(std::move(src.nodes)), rootId(std::exchange(src.rootId, NoNode))
    {
    }
    SyntaxTree & operator=(const SyntaxTree &) = delete;
    SyntaxTree & operator=(SyntaxTree && src) noexcept
    {
        nodes = std::move(src.nodes);
        rootId = std::exchange(src.rootId, NoNode);
        return *this;
    }
    virtual ~SyntaxTree() = default;

    // Append a node to the arena and adopt its children
    NodeId add(Payload && payload)
    {
        if (nodes.size() >= NoNode)
        {
            throw std::length_error("Syntax tree arena is full");
        }
        NodeId id = static_cast<NodeId>(nodes.size());
        nodes.push_back(Node{std::move(payload), NoNode});
        forEachChild
        (
            nodes.back().payload,
            [this, id](NodeId & child)
            {
                at(child).parent = id;
            }
        );
        return id;
    }

    Node & at(NodeId id)
    {
        checkId(id);
        return nodes[id];
    }

    const Node & at(NodeId id) const
    {
        checkId(id);
        return nodes[id];
    }

    // Typed payload access; throws if the node carries another tag
    template <typename T>
    T & get(NodeId id)
    {
        Node & node = at(id);
        if (node.tag() != T::tag)
        {
            throw std::invalid_argument
            (
                std::format("Node {} is {}, expected {}", id, tagName(node.tag()), tagName(T::tag))
            );
        }
        return std::get<T>(node.payload);
    }

    template <typename T>
    const T & get(NodeId id) const
    {
        const Node & node = at(id);
        if (node.tag() != T::tag)
        {
            throw std::invalid_argument
            (
                std::format("Node {} is {}, expected {}", id, tagName(node.tag()), tagName(T::tag))
            );
        }
        return std::get<T>(node.payload);
    }

    bool contains(NodeId id) const
    {
        return id < nodes.size();
    }

    NodeId root() const
    {
        return rootId;
    }

    void setRoot(NodeId id)
    {
        checkId(id);
        rootId = id;
    }

    std::size_t size() const
    {
        return nodes.size();
    }

    bool empty() const
    {
        return nodes.empty();
    }

    // Move all nodes of a detached tree into this arena.
    // Returns the new id of the fragment's root; the fragment is left empty.
    NodeId graft(SyntaxTree && fragment)
    {
        if (fragment.rootId == NoNode)
        {
            throw std::invalid_argument("Cannot graft a tree without a root");
        }
        if (nodes.size() + fragment.nodes.size() >= NoNode)
        {
            throw std::length_error("Syntax tree arena is full");
        }
        NodeId base = static_cast<NodeId>(nodes.size());
        nodes.reserve(nodes.size() + fragment.nodes.size());
        for (Node & node : fragment.nodes)
        {
            forEachChild(node.payload, [base](NodeId & child) { child += base; });
            if (node.parent != NoNode) node.parent += base;
            nodes.push_back(std::move(node));
        }
        NodeId graftedRoot = fragment.rootId + base;
        fragment.nodes.clear();
        fragment.rootId = NoNode;
        SPDLOG_TRACE("Grafted fragment as node {} (arena size {})", graftedRoot, nodes.size());
        return graftedRoot;
    }

private:
    std::vector<Node> nodes;
    NodeId rootId;

    void checkId(NodeId id) const
    {
        if (id >= nodes.size())
        {
            #if DEBUG
                std::cerr << boost::stacktrace::stacktrace() << std::endl;
            #endif
            throw std::out_of_range(std::format("Node id {} out of range, arena size {}", id, nodes.size()));
        }
    }
};

// The tree of one source file. Its root is a TopLevel node.
class CompilationUnit : public SyntaxTree
{
public:
    explicit CompilationUnit(std::filesystem::path sourcePath)
        : sourcePath(std::move(sourcePath))
    {
    }

    CompilationUnit(CompilationUnit &&) = default;
    CompilationUnit & operator=(CompilationUnit &&) = default;

    const std::filesystem::path & getSourcePath() const
    {
        return sourcePath;
    }

    TopLevelData & topLevel()
    {
        return get<TopLevelData>(root());
    }

    const TopLevelData & topLevel() const
    {
        return get<TopLevelData>(root());
    }

    const std::string & packageName() const
    {
        return topLevel().packageName;
    }

private:
    std::filesystem::path sourcePath;
};

} // namespace Annotrace

#endif // ANNOTRACE_SYNTAXTREE_HPP
