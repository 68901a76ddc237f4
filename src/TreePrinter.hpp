// Renders syntax trees back to Java source text

#ifndef ANNOTRACE_TREEPRINTER_HPP
#define ANNOTRACE_TREEPRINTER_HPP

#include <cmath>
#include <format>
#include <sstream>
#include <string>
#include <variant>

#include "Util.hpp"
#include "SyntaxTree.hpp"

namespace Annotrace
{

class TreePrinter
{
public:
    explicit TreePrinter(const SyntaxTree & tree, std::string_view indentUnit = "    ")
        : tree(tree), indentUnit(indentUnit)
    {
    }

    static std::string print(const SyntaxTree & tree, NodeId id)
    {
        return TreePrinter(tree).render(id, 0);
    }

    static std::string print(const CompilationUnit & unit)
    {
        return TreePrinter(unit).render(unit.root(), 0);
    }

    std::string render(NodeId id, std::size_t depth) const
    {
        const Node & node = tree.at(id);
        return std::visit
        (
            overloaded
            {
                [&](const TopLevelData & p) { return renderTopLevel(p); },
                [&](const ImportData & p)
                {
                    return std::format("import {}{};", p.isStatic ? "static " : "", p.qualifiedName);
                },
                [&](const ClassDefData & p) { return renderClass(p, depth); },
                [&](const MethodDefData & p)
                {
                    if (p.body == NoNode) return p.header;
                    return p.header + " " + render(p.body, depth);
                },
                [&](const BlockData & p) { return renderBlock(p, depth); },
                [&](const ExecData & p) { return render(p.expr, depth) + ";"; },
                [&](const ApplyData & p)
                {
                    return render(p.meth, depth) + "(" + renderArgs(p.args, depth) + ")";
                },
                [&](const SelectData & p)
                {
                    return render(p.selected, depth) + "." + p.name.toString();
                },
                [&](const IdentData & p) { return p.name.toString(); },
                [&](const LiteralData & p) { return renderLiteral(p.value); },
                [&](const NewClassData & p)
                {
                    return "new " + render(p.clazz, depth) + "(" + renderArgs(p.args, depth) + ")";
                },
                [&](const VerbatimData & p) { return p.text; }
            },
            node.payload
        );
    }

    static std::string renderLiteral(const LiteralValue & value)
    {
        return std::visit
        (
            overloaded
            {
                [](std::nullptr_t) -> std::string { return "null"; },
                [](bool b) -> std::string { return b ? "true" : "false"; },
                [](char c) -> std::string
                {
                    if (c == '\'') return "'\\''";
                    return "'" + escapeString(std::string_view(&c, 1)) + "'";
                },
                [](std::int32_t i) -> std::string { return std::to_string(i); },
                [](std::int64_t l) -> std::string { return std::to_string(l) + "L"; },
                [](double d) -> std::string
                {
                    std::string s = std::format("{}", d);
                    // Keep it a floating point literal in Java
                    if (std::isfinite(d) && s.find_first_of(".eE") == std::string::npos) s += ".0";
                    return s;
                },
                [](const std::string & s) -> std::string { return "\"" + escapeString(s) + "\""; }
            },
            value
        );
    }

private:
    const SyntaxTree & tree;
    std::string indentUnit;

    std::string indent(std::size_t depth) const
    {
        std::string result;
        for (std::size_t i = 0; i < depth; ++i) result += indentUnit;
        return result;
    }

    std::string renderArgs(const std::vector<NodeId> & args, std::size_t depth) const
    {
        std::string result;
        for (std::size_t i = 0; i < args.size(); ++i)
        {
            if (i > 0) result += ", ";
            result += render(args[i], depth);
        }
        return result;
    }

    std::string renderBlock(const BlockData & block, std::size_t depth) const
    {
        std::stringstream ss;
        ss << "{\n";
        for (NodeId stat : block.stats)
        {
            ss << indent(depth + 1) << render(stat, depth + 1) << "\n";
        }
        ss << indent(depth) << "}";
        return ss.str();
    }

    std::string renderClass(const ClassDefData & classDef, std::size_t depth) const
    {
        std::stringstream ss;
        ss << classDef.header << " {\n";
        bool first = true;
        for (NodeId member : classDef.members)
        {
            if (!first) ss << "\n";
            ss << indent(depth + 1) << render(member, depth + 1) << "\n";
            first = false;
        }
        ss << indent(depth) << "}";
        return ss.str();
    }

    std::string renderTopLevel(const TopLevelData & topLevel) const
    {
        std::stringstream ss;
        if (!topLevel.packageName.empty())
        {
            ss << "package " << topLevel.packageName << ";\n\n";
        }
        bool sawImport = false;
        bool first = true;
        for (NodeId def : topLevel.defs)
        {
            bool isImport = tree.at(def).tag() == Tag::Import;
            if (!first)
            {
                // Imports are grouped, everything else is separated by a blank line
                ss << ((isImport && sawImport) ? "\n" : "\n\n");
            }
            ss << render(def, 0);
            sawImport = isImport;
            first = false;
        }
        ss << "\n";
        return ss.str();
    }
};

} // namespace Annotrace

#endif // ANNOTRACE_TREEPRINTER_HPP
