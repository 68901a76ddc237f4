// Builds detached expression and statement fragments: method calls, object constructions and literals.
// Every build* function returns a fresh SyntaxTree whose root is the built node; argument fragments are
// moved into the result in the order given. Nothing here touches a compilation unit.

#ifndef ANNOTRACE_EXPRESSIONBUILDER_HPP
#define ANNOTRACE_EXPRESSIONBUILDER_HPP

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "Util.hpp"
#include "SyntaxTree.hpp"
#include "TreeMaker.hpp"
#include "ResolvedEnvironment.hpp"

namespace Annotrace
{

class ExpressionBuilder
{
public:
    // Collect fragments into an argument list, keeping their order
    template <typename... Fragments>
    static std::vector<SyntaxTree> list(Fragments &&... fragments)
    {
        std::vector<SyntaxTree> result;
        result.reserve(sizeof...(fragments));
        (result.push_back(std::move(fragments)), ...);
        return result;
    }

    // receiverPath {"a", "b"} and methodName "m" build a.b.m(args); an empty path builds m(args)
    static SyntaxTree buildCall
    (
        const ResolvedEnvironment & env,
        const std::vector<std::string_view> & receiverPath,
        std::string_view methodName,
        std::vector<SyntaxTree> && args
    )
    {
        checkIdentifier(methodName, "method name");
        const TreeMaker & maker = env.getTreeMaker();
        Names & names = env.getNames();

        SyntaxTree fragment;
        std::vector<NodeId> argIds = graftAll(fragment, std::move(args));
        NodeId meth;
        if (receiverPath.empty())
        {
            meth = maker.ident(fragment, names.fromString(methodName));
        }
        else
        {
            NodeId receiver = qualifiedName(env, fragment, receiverPath);
            meth = maker.select(fragment, receiver, names.fromString(methodName));
        }
        fragment.setRoot(maker.apply(fragment, meth, std::move(argIds)));
        return fragment;
    }

    // receiver.methodName(args) on an already built receiver expression
    static SyntaxTree buildMethodCall
    (
        const ResolvedEnvironment & env,
        SyntaxTree && receiver,
        std::string_view methodName,
        std::vector<SyntaxTree> && args
    )
    {
        checkIdentifier(methodName, "method name");
        const TreeMaker & maker = env.getTreeMaker();

        SyntaxTree fragment;
        NodeId receiverId = fragment.graft(std::move(receiver));
        std::vector<NodeId> argIds = graftAll(fragment, std::move(args));
        NodeId meth = maker.select(fragment, receiverId, env.getNames().fromString(methodName));
        fragment.setRoot(maker.apply(fragment, meth, std::move(argIds)));
        return fragment;
    }

    static SyntaxTree buildLiteral(const ResolvedEnvironment & env, LiteralValue value)
    {
        SyntaxTree fragment;
        fragment.setRoot(env.getTreeMaker().literal(fragment, std::move(value)));
        return fragment;
    }

    // new typeName(args); typeName may be simple ("Exception") or qualified ("java.lang.Exception")
    static SyntaxTree buildConstruction
    (
        const ResolvedEnvironment & env,
        std::string_view typeName,
        std::vector<SyntaxTree> && args
    )
    {
        std::vector<std::string> segments = splitQualifiedName(typeName);
        std::vector<std::string_view> path(segments.begin(), segments.end());

        SyntaxTree fragment;
        std::vector<NodeId> argIds = graftAll(fragment, std::move(args));
        NodeId clazz = qualifiedName(env, fragment, path);
        fragment.setRoot(env.getTreeMaker().newClass(fragment, clazz, std::move(argIds)));
        return fragment;
    }

    // Wrap an expression into an expression statement
    static SyntaxTree buildStatement(const ResolvedEnvironment & env, SyntaxTree && expression)
    {
        SyntaxTree fragment;
        NodeId expr = fragment.graft(std::move(expression));
        fragment.setRoot(env.getTreeMaker().exec(fragment, expr));
        return fragment;
    }

private:
    static void checkIdentifier(std::string_view identifier, std::string_view what)
    {
        if (identifier.empty() || identifier.find('.') != std::string_view::npos || isAllWhitespace(identifier))
        {
            throw std::invalid_argument(std::format("Invalid {}: \"{}\"", what, identifier));
        }
    }

    static std::vector<NodeId> graftAll(SyntaxTree & fragment, std::vector<SyntaxTree> && args)
    {
        std::vector<NodeId> ids;
        ids.reserve(args.size());
        for (SyntaxTree & arg : args)
        {
            ids.push_back(fragment.graft(std::move(arg)));
        }
        args.clear();
        return ids;
    }

    // a.b.c as Select(Select(Ident(a), b), c)
    static NodeId qualifiedName
    (
        const ResolvedEnvironment & env,
        SyntaxTree & fragment,
        const std::vector<std::string_view> & segments
    )
    {
        if (segments.empty())
        {
            throw std::invalid_argument("Empty qualified name");
        }
        const TreeMaker & maker = env.getTreeMaker();
        Names & names = env.getNames();

        checkIdentifier(segments.front(), "name segment");
        NodeId current = maker.ident(fragment, names.fromString(segments.front()));
        for (std::size_t i = 1; i < segments.size(); ++i)
        {
            checkIdentifier(segments[i], "name segment");
            current = maker.select(fragment, current, names.fromString(segments[i]));
        }
        return current;
    }
};

} // namespace Annotrace

#endif // ANNOTRACE_EXPRESSIONBUILDER_HPP
