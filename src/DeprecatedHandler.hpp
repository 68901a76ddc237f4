// Handles @Deprecated: reports every deprecated method and constructor, and instruments their bodies with
//     LoggerFactory.getLogger("pkg.Type").warn("Deprecated method called in pkg.Type", new Exception());
//     DeprecatedMethodInvocationCounter.onDeprecatedMethodCalled("pkg.Type.method(params)");
// ahead of the original statements. The runtime symbols are configurable, see InstrumentationConfig.

#ifndef ANNOTRACE_DEPRECATEDHANDLER_HPP
#define ANNOTRACE_DEPRECATEDHANDLER_HPP

#include <format>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include <spdlog/spdlog.h>

#include "AnnotationHandler.hpp"
#include "ExpressionBuilder.hpp"
#include "InstrumentationConfig.hpp"
#include "ResolvedEnvironment.hpp"
#include "Symbols.hpp"
#include "Trees.hpp"
#include "TreeMutator.hpp"

namespace Annotrace
{

class DeprecatedHandler : public AnnotationHandler
{
public:
    static constexpr std::string_view DeprecatedAnnotation = "java.lang.Deprecated";

    explicit DeprecatedHandler(InstrumentationConfig config = {})
        : config(std::move(config))
    {
        this->config.validate();
    }

    std::set<std::string> annotationsToHandle() const override
    {
        return {std::string(DeprecatedAnnotation)};
    }

    ProcessingReport process(const std::set<Element> & elements, const ResolvedEnvironment & env) override
    {
        ProcessingReport report;
        for (const Element & element : elements)
        {
            // Only methods and constructors are instrumented
            const MethodSymbol * const * method = std::get_if<const MethodSymbol *>(&element);
            if (!method)
            {
                SPDLOG_DEBUG("Ignoring deprecated element {}", elementToString(element));
                continue;
            }
            processMethod(element, **method, env, report);
        }
        SPDLOG_DEBUG
        (
            "Deprecated round: {} rewritten, {} skipped, {} failed",
            report.count(Outcome::Rewritten),
            report.count(Outcome::Skipped),
            report.count(Outcome::Failed)
        );
        return report;
    }

    // Heuristic: a method named like its enclosing type is a constructor
    static bool isConstructor(const ClassSymbol & classSymbol, const MethodSymbol & methodSymbol)
    {
        return methodSymbol.name.str() == classSymbol.name.str();
    }

    // "pkg.Type.method(a,b)"
    static std::string methodDefinition(const ClassSymbol & classSymbol, const MethodSymbol & methodSymbol)
    {
        return std::format
        (
            "{}.{}({})",
            classSymbol.qualifiedName,
            methodSymbol.name.str(),
            renderSymbolList(methodSymbol.params)
        );
    }

    // Example: LoggerFactory.getLogger("pkg.Type").warn("Deprecated method called in pkg.Type", new Exception());
    SyntaxTree generateLoggerStatement(const ResolvedEnvironment & env, const ClassSymbol & classSymbol) const
    {
        SyntaxTree loggerInit = ExpressionBuilder::buildCall
        (
            env,
            {config.loggerFactory.className},
            config.loggerFactory.methodName,
            ExpressionBuilder::list(ExpressionBuilder::buildLiteral(env, classSymbol.qualifiedName))
        );

        SyntaxTree logCall = ExpressionBuilder::buildMethodCall
        (
            env,
            std::move(loggerInit),
            config.logger.methodName,
            ExpressionBuilder::list
            (
                ExpressionBuilder::buildLiteral(env, config.messagePrefix + classSymbol.qualifiedName),
                ExpressionBuilder::buildConstruction(env, config.markerException, {})
            )
        );

        return ExpressionBuilder::buildStatement(env, std::move(logCall));
    }

    // Example: DeprecatedMethodInvocationCounter.onDeprecatedMethodCalled("pkg.Type.method(params)");
    SyntaxTree generateCounterStatement
    (
        const ResolvedEnvironment & env,
        const ClassSymbol & classSymbol,
        const MethodSymbol & methodSymbol
    ) const
    {
        SyntaxTree call = ExpressionBuilder::buildCall
        (
            env,
            {config.counter.className},
            config.counter.methodName,
            ExpressionBuilder::list(ExpressionBuilder::buildLiteral(env, methodDefinition(classSymbol, methodSymbol)))
        );
        return ExpressionBuilder::buildStatement(env, std::move(call));
    }

    const InstrumentationConfig & getConfig() const
    {
        return config;
    }

private:
    InstrumentationConfig config;

    void processMethod
    (
        const Element & element,
        const MethodSymbol & methodSymbol,
        const ResolvedEnvironment & env,
        ProcessingReport & report
    ) const
    {
        const ClassSymbol * classSymbol = methodSymbol.owner;
        if (!classSymbol)
        {
            report.fail(element, std::runtime_error("Method has no enclosing class"));
            return;
        }
        bool constructor = isConstructor(*classSymbol, methodSymbol);

        // Import requests go first; a failure here still lets the warning through
        std::optional<std::runtime_error> importFailure;
        try
        {
            CompilationUnit & unit = env.getTrees().getCompilationUnit(*classSymbol);
            for (const RuntimeTarget * target : {&config.counter, &config.loggerFactory, &config.logger})
            {
                TreeMutator::addImport(env.getTreeMaker(), unit, target->packageName, target->className);
            }
        }
        catch (const std::exception & e)
        {
            importFailure.emplace(e.what());
        }

        env.getMessager().printMessage
        (
            DiagnosticKind::Warning,
            std::format
            (
                "Usage of deprecated {} detected: {}",
                constructor ? "constructor" : "method",
                methodDefinition(*classSymbol, methodSymbol)
            )
        );

        if (importFailure)
        {
            report.fail(element, *importFailure);
            return;
        }

        try
        {
            TreeRef ref = env.getTrees().getTreeAs<MethodDefData>(element);
            NodeId body = ref.unit->get<MethodDefData>(ref.node).body;
            if (body == NoNode)
            {
                // Abstract or interface method
                SPDLOG_DEBUG("{} has no body, skipped", methodDefinition(*classSymbol, methodSymbol));
                report.record(element, Outcome::Skipped);
                return;
            }

            SyntaxTree loggerStatement = generateLoggerStatement(env, *classSymbol);
            SyntaxTree counterStatement = generateCounterStatement(env, *classSymbol, methodSymbol);
            TreeMutator::insertStatementAtHead(*ref.unit, body, ref.node, std::move(loggerStatement));
            TreeMutator::insertStatementAtHead(*ref.unit, body, ref.node, std::move(counterStatement));

            SPDLOG_DEBUG("Instrumented {}", methodDefinition(*classSymbol, methodSymbol));
            report.record(element, Outcome::Rewritten);
        }
        catch (const std::exception & e)
        {
            SPDLOG_ERROR("Failed to instrument {}: {}", methodDefinition(*classSymbol, methodSymbol), e.what());
            report.fail(element, e);
        }
    }
};

} // namespace Annotrace

#endif // ANNOTRACE_DEPRECATEDHANDLER_HPP
