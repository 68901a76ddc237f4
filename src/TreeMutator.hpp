// Low-level in-place mutations of a compilation unit: splicing statements into method bodies and adding imports.
// Note: node references obtained before a graft or add are invalidated by it, so payloads are re-fetched after.

#ifndef ANNOTRACE_TREEMUTATOR_HPP
#define ANNOTRACE_TREEMUTATOR_HPP

#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "SyntaxTree.hpp"
#include "TreeMaker.hpp"

namespace Annotrace
{

class TreeMutator
{
public:
    // Insert a statement at the head of a method body.
    // Repeated insertions into the same body keep their call order, all ahead of the original statements.
    // In a constructor, an explicit this(...) or super(...) call stays first.
    static NodeId insertStatementAtHead
    (
        CompilationUnit & unit,
        NodeId body,
        NodeId methodDecl,
        SyntaxTree && statement
    )
    {
        const MethodDefData & method = unit.get<MethodDefData>(methodDecl);
        if (method.body != body)
        {
            throw std::invalid_argument(std::format("Node {} is not the body of method node {}", body, methodDecl));
        }
        bool isConstructor = method.isConstructor;
        unit.get<BlockData>(body);

        if (statement.root() == NoNode)
        {
            throw std::invalid_argument("Cannot insert an empty statement");
        }
        Tag statementTag = statement.at(statement.root()).tag();
        if (statementTag != Tag::Exec && statementTag != Tag::Block && statementTag != Tag::Verbatim)
        {
            throw std::invalid_argument(std::format("{} is not a statement", tagName(statementTag)));
        }

        NodeId stat = unit.graft(std::move(statement));

        BlockData & block = unit.get<BlockData>(body);
        std::size_t position = block.headInsertions;
        if (isConstructor)
        {
            if (std::optional<std::size_t> call = leadingConstructorCall(unit, block))
            {
                position += *call + 1;
            }
        }
        block.stats.insert(block.stats.begin() + position, stat);
        block.headInsertions += 1;
        unit.at(stat).parent = body;

        SPDLOG_TRACE("Inserted statement {} at position {} of block {}", stat, position, body);
        return stat;
    }

    // Add "import packageName.simpleName;" unless the unit already has it or the type is in the unit's own package.
    // A simple name already taken by another single-type import or a top-level type is not imported again.
    // Returns whether an import was added.
    static bool addImport
    (
        const TreeMaker & maker,
        CompilationUnit & unit,
        std::string_view packageName,
        std::string_view simpleName
    )
    {
        if (simpleName.empty())
        {
            throw std::invalid_argument("Cannot import an empty name");
        }
        std::string qualifiedName = packageName.empty()
            ? std::string(simpleName)
            : std::format("{}.{}", packageName, simpleName);

        if (packageName == unit.packageName())
        {
            SPDLOG_DEBUG("{} is in the package of {}, no import needed", qualifiedName, unit.getSourcePath().string());
            return false;
        }
        for (NodeId def : unit.topLevel().defs)
        {
            const Node & node = unit.at(def);
            if (node.tag() != Tag::Import) continue;
            const ImportData & existing = std::get<ImportData>(node.payload);
            if (!existing.isStatic && existing.qualifiedName == qualifiedName)
            {
                return false;
            }
        }
        for (NodeId def : unit.topLevel().defs)
        {
            if (std::optional<std::string> owner = simpleNameOwner(unit.at(def), simpleName))
            {
                SPDLOG_DEBUG
                (
                    "{} is not imported into {}: {} already uses the name",
                    qualifiedName,
                    unit.getSourcePath().string(),
                    *owner
                );
                return false;
            }
        }

        NodeId importId = maker.importDecl(unit, qualifiedName);

        TopLevelData & topLevel = unit.topLevel();
        std::size_t position = 0;
        for (std::size_t i = 0; i < topLevel.defs.size(); ++i)
        {
            if (unit.at(topLevel.defs[i]).tag() == Tag::Import) position = i + 1;
        }
        topLevel.defs.insert(topLevel.defs.begin() + position, importId);
        unit.at(importId).parent = unit.root();

        SPDLOG_DEBUG("Added import {} to {}", qualifiedName, unit.getSourcePath().string());
        return true;
    }

private:
    // What binds simpleName at the top level of a unit, if this definition does
    static std::optional<std::string> simpleNameOwner(const Node & def, std::string_view simpleName)
    {
        if (const ImportData * existing = std::get_if<ImportData>(&def.payload))
        {
            if (existing->isStatic) return std::nullopt;
            std::string_view name = existing->qualifiedName;
            std::size_t dot = name.rfind('.');
            if (dot != std::string_view::npos && name.substr(dot + 1) == simpleName)
            {
                return "import " + existing->qualifiedName;
            }
        }
        else if (const ClassDefData * classDef = std::get_if<ClassDefData>(&def.payload))
        {
            if (classDef->name.str() == simpleName) return "type " + classDef->name.toString();
        }
        return std::nullopt;
    }

    // Index of an explicit this(...) or super(...) call preceded by nothing but comments
    static std::optional<std::size_t> leadingConstructorCall(const CompilationUnit & unit, const BlockData & block)
    {
        for (std::size_t i = 0; i < block.stats.size(); ++i)
        {
            const Node & stat = unit.at(block.stats[i]);
            if (stat.tag() != Tag::Verbatim) return std::nullopt;
            VerbatimKind kind = std::get<VerbatimData>(stat.payload).kind;
            if (kind == VerbatimKind::ConstructorCall) return i;
            if (kind != VerbatimKind::Comment) return std::nullopt;
        }
        return std::nullopt;
    }
};

} // namespace Annotrace

#endif // ANNOTRACE_TREEMUTATOR_HPP
