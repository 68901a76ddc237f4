// Declaration symbols entered from compilation units, and the table that owns them

#ifndef ANNOTRACE_SYMBOLS_HPP
#define ANNOTRACE_SYMBOLS_HPP

#include <algorithm>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "Util.hpp"
#include "Names.hpp"
#include "Context.hpp"
#include "SyntaxTree.hpp"

namespace Annotrace
{

struct VarSymbol
{
    Name name;
    std::string type;

    std::string toString() const
    {
        return name.toString();
    }
};

// Host's default rendering of a symbol list: element renderings joined by ","
std::string renderSymbolList(const std::vector<VarSymbol> & symbols)
{
    std::string result;
    for (std::size_t i = 0; i < symbols.size(); ++i)
    {
        if (i > 0) result += ",";
        result += symbols[i].toString();
    }
    return result;
}

class ClassSymbol
{
public:
    Name name; // Simple name
    std::string qualifiedName; // e.g. "com.example.Outer.Inner"
    CompilationUnit * unit = nullptr; // Unit declaring the class
    const ClassSymbol * owner = nullptr; // Enclosing class for nested types
    std::vector<std::string> annotations; // Fully qualified

    std::string toString() const
    {
        return qualifiedName;
    }
};

class MethodSymbol
{
public:
    Name name;
    const ClassSymbol * owner = nullptr;
    std::vector<VarSymbol> params;
    std::vector<std::string> annotations; // Fully qualified

    std::string toString() const
    {
        std::vector<std::string_view> types;
        for (const VarSymbol & param : params) types.push_back(param.type);
        return std::format("{}({})", name.str(), join(types, ","));
    }
};

// An element handed to annotation handlers
using Element = std::variant<const ClassSymbol *, const MethodSymbol *>;

std::string elementToString(const Element & element)
{
    return std::visit
    (
        overloaded
        {
            [](const ClassSymbol * s) { return s->toString(); },
            [](const MethodSymbol * s)
            {
                return std::format("{}.{}", s->owner ? s->owner->qualifiedName : "<unknown>", s->toString());
            }
        },
        element
    );
}

bool hasAnnotation(const std::vector<std::string> & annotations, std::string_view annotation)
{
    return std::find(annotations.begin(), annotations.end(), annotation) != annotations.end();
}

// Owns every symbol of one compilation
class SymbolTable
{
public:
    static SymbolTable * instance(Context & context)
    {
        return context.instance<SymbolTable>();
    }

    ClassSymbol * enterClass(ClassSymbol && symbol)
    {
        std::lock_guard<std::mutex> lock(mutex);
        classes.push_back(std::make_unique<ClassSymbol>(std::move(symbol)));
        ClassSymbol * entered = classes.back().get();
        classesByName.insert_or_assign(entered->qualifiedName, entered);
        return entered;
    }

    MethodSymbol * enterMethod(MethodSymbol && symbol)
    {
        std::lock_guard<std::mutex> lock(mutex);
        methods.push_back(std::make_unique<MethodSymbol>(std::move(symbol)));
        return methods.back().get();
    }

    std::optional<const ClassSymbol *> lookupClass(std::string_view qualifiedName) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = classesByName.find(qualifiedName);
        if (it != classesByName.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    // Elements declared in the given unit, in declaration order
    std::vector<Element> elementsOf(const CompilationUnit & unit) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<Element> elements;
        for (const auto & cls : classes)
        {
            if (cls->unit == &unit) elements.emplace_back(cls.get());
        }
        for (const auto & method : methods)
        {
            if (method->owner && method->owner->unit == &unit) elements.emplace_back(method.get());
        }
        return elements;
    }

private:
    mutable std::mutex mutex;
    std::vector<std::unique_ptr<ClassSymbol>> classes;
    std::vector<std::unique_ptr<MethodSymbol>> methods;
    std::unordered_map<std::string, const ClassSymbol *, TransparentStringHash, TransparentStringEqual> classesByName;
};

} // namespace Annotrace

#endif // ANNOTRACE_SYMBOLS_HPP
