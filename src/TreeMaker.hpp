// Factory for syntax tree nodes.
// Every method appends one node to the given arena and returns its id; child ids must already live in that arena.

#ifndef ANNOTRACE_TREEMAKER_HPP
#define ANNOTRACE_TREEMAKER_HPP

#include <string>
#include <vector>
#include <utility>

#include "SyntaxTree.hpp"
#include "Names.hpp"
#include "Context.hpp"

namespace Annotrace
{

class TreeMaker
{
public:
    static TreeMaker * instance(Context & context)
    {
        return context.instance<TreeMaker>();
    }

    NodeId topLevel(SyntaxTree & tree, std::string packageName, std::vector<NodeId> defs) const
    {
        return tree.add(TopLevelData{.packageName = std::move(packageName), .defs = std::move(defs)});
    }

    NodeId importDecl(SyntaxTree & tree, std::string qualifiedName, bool isStatic = false) const
    {
        return tree.add(ImportData{.qualifiedName = std::move(qualifiedName), .isStatic = isStatic});
    }

    NodeId classDef(SyntaxTree & tree, ClassDefData && classDef) const
    {
        return tree.add(std::move(classDef));
    }

    NodeId methodDef(SyntaxTree & tree, MethodDefData && method) const
    {
        return tree.add(std::move(method));
    }

    NodeId block(SyntaxTree & tree, std::vector<NodeId> stats) const
    {
        return tree.add(BlockData{.stats = std::move(stats)});
    }

    NodeId exec(SyntaxTree & tree, NodeId expr) const
    {
        return tree.add(ExecData{.expr = expr});
    }

    NodeId apply(SyntaxTree & tree, NodeId meth, std::vector<NodeId> args) const
    {
        return tree.add(ApplyData{.meth = meth, .args = std::move(args)});
    }

    NodeId select(SyntaxTree & tree, NodeId selected, Name name) const
    {
        return tree.add(SelectData{.selected = selected, .name = name});
    }

    NodeId ident(SyntaxTree & tree, Name name) const
    {
        return tree.add(IdentData{.name = name});
    }

    NodeId literal(SyntaxTree & tree, LiteralValue value) const
    {
        return tree.add(LiteralData{.value = std::move(value)});
    }

    NodeId newClass(SyntaxTree & tree, NodeId clazz, std::vector<NodeId> args) const
    {
        return tree.add(NewClassData{.clazz = clazz, .args = std::move(args)});
    }

    NodeId verbatim(SyntaxTree & tree, std::string text, VerbatimKind kind) const
    {
        return tree.add(VerbatimData{.text = std::move(text), .kind = kind});
    }
};

} // namespace Annotrace

#endif // ANNOTRACE_TREEMAKER_HPP
