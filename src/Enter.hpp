// Enters the declarations of compilation units into the symbol table and the symbol/tree bridge,
// and answers which elements of a unit carry a given annotation.

#ifndef ANNOTRACE_ENTER_HPP
#define ANNOTRACE_ENTER_HPP

#include <array>
#include <format>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "Util.hpp"
#include "Context.hpp"
#include "Names.hpp"
#include "SyntaxTree.hpp"
#include "Symbols.hpp"
#include "Trees.hpp"

namespace Annotrace
{

class Enter
{
public:
    // Annotation types visible without an import
    static constexpr std::array<std::string_view, 5> JavaLangAnnotations =
    {
        "Deprecated",
        "Override",
        "SuppressWarnings",
        "FunctionalInterface",
        "SafeVarargs"
    };

    explicit Enter(Context & context)
        : symbolTable(*SymbolTable::instance(context)), trees(context.get<Trees>())
    {
        if (!trees)
        {
            throw std::logic_error("Enter requires a Trees service in the context");
        }
    }

    void enterUnit(CompilationUnit & unit)
    {
        const TopLevelData & topLevel = unit.topLevel();
        std::vector<NodeId> defs = topLevel.defs;
        std::size_t entered = 0;
        for (NodeId def : defs)
        {
            if (unit.at(def).tag() != Tag::ClassDef) continue;
            entered += enterClass(unit, def, nullptr);
        }
        SPDLOG_DEBUG("Entered {} symbols from {}", entered, unit.getSourcePath().string());
    }

    // Resolve an annotation name as spelt in the unit to its fully qualified name
    static std::string resolveAnnotation(const CompilationUnit & unit, std::string_view spelt)
    {
        if (spelt.find('.') != std::string_view::npos) return std::string(spelt);

        for (NodeId def : unit.topLevel().defs)
        {
            const Node & node = unit.at(def);
            if (node.tag() != Tag::Import) continue;
            const ImportData & importDecl = std::get<ImportData>(node.payload);
            if (importDecl.isStatic) continue;
            std::string_view qualified = importDecl.qualifiedName;
            std::size_t dot = qualified.rfind('.');
            if (dot != std::string_view::npos && qualified.substr(dot + 1) == spelt)
            {
                return importDecl.qualifiedName;
            }
        }

        for (std::string_view javaLang : JavaLangAnnotations)
        {
            if (javaLang == spelt) return std::format("java.lang.{}", spelt);
        }

        const std::string & packageName = unit.packageName();
        return packageName.empty() ? std::string(spelt) : std::format("{}.{}", packageName, spelt);
    }

private:
    SymbolTable & symbolTable;
    Trees * trees;

    std::size_t enterClass(CompilationUnit & unit, NodeId id, const ClassSymbol * owner)
    {
        const ClassDefData & classDef = unit.get<ClassDefData>(id);

        ClassSymbol symbol;
        symbol.name = classDef.name;
        if (owner)
        {
            symbol.qualifiedName = std::format("{}.{}", owner->qualifiedName, classDef.name.str());
        }
        else if (unit.packageName().empty())
        {
            symbol.qualifiedName = classDef.name.toString();
        }
        else
        {
            symbol.qualifiedName = std::format("{}.{}", unit.packageName(), classDef.name.str());
        }
        symbol.unit = &unit;
        symbol.owner = owner;
        for (const std::string & annotation : classDef.annotations)
        {
            symbol.annotations.push_back(resolveAnnotation(unit, annotation));
        }

        const ClassSymbol * classSymbol = symbolTable.enterClass(std::move(symbol));
        trees->enter(classSymbol, TreeRef{&unit, id});
        std::size_t entered = 1;

        std::vector<NodeId> members = classDef.members;
        for (NodeId member : members)
        {
            Tag tag = unit.at(member).tag();
            if (tag == Tag::MethodDef)
            {
                enterMethod(unit, member, classSymbol);
                entered += 1;
            }
            else if (tag == Tag::ClassDef)
            {
                entered += enterClass(unit, member, classSymbol);
            }
        }
        return entered;
    }

    void enterMethod(CompilationUnit & unit, NodeId id, const ClassSymbol * owner)
    {
        const MethodDefData & methodDef = unit.get<MethodDefData>(id);

        MethodSymbol symbol;
        symbol.name = methodDef.name;
        symbol.owner = owner;
        for (const Parameter & param : methodDef.params)
        {
            symbol.params.push_back(VarSymbol{param.name, param.type});
        }
        for (const std::string & annotation : methodDef.annotations)
        {
            symbol.annotations.push_back(resolveAnnotation(unit, annotation));
        }

        const MethodSymbol * methodSymbol = symbolTable.enterMethod(std::move(symbol));
        trees->enter(methodSymbol, TreeRef{&unit, id});
    }
};

// The view of one processing round over one compilation unit
class RoundEnvironment
{
public:
    RoundEnvironment(const SymbolTable & symbolTable, const CompilationUnit & unit)
        : symbolTable(symbolTable), unit(unit)
    {
    }

    std::set<Element> getElementsAnnotatedWith(std::string_view annotation) const
    {
        std::set<Element> result;
        for (const Element & element : symbolTable.elementsOf(unit))
        {
            const std::vector<std::string> & annotations = std::visit
            (
                [](const auto * symbol) -> const std::vector<std::string> & { return symbol->annotations; },
                element
            );
            if (hasAnnotation(annotations, annotation)) result.insert(element);
        }
        return result;
    }

    const CompilationUnit & getUnit() const
    {
        return unit;
    }

private:
    const SymbolTable & symbolTable;
    const CompilationUnit & unit;
};

} // namespace Annotrace

#endif // ANNOTRACE_ENTER_HPP
