// Host-side driver that dispatches annotated elements to the registered handlers

#ifndef ANNOTRACE_ANNOTATIONPROCESSOR_HPP
#define ANNOTRACE_ANNOTATIONPROCESSOR_HPP

#include <atomic>
#include <format>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "Util.hpp"
#include "Context.hpp"
#include "Trees.hpp"
#include "Messager.hpp"
#include "Symbols.hpp"
#include "Enter.hpp"
#include "ProcessingEnvironment.hpp"
#include "ResolvedEnvironment.hpp"
#include "AnnotationHandler.hpp"

namespace Annotrace
{

// A compilation context with the services only the host registers
std::unique_ptr<Context> makeHostContext()
{
    auto context = std::make_unique<Context>();
    context->put(std::make_shared<Trees>());
    context->put(std::make_shared<Messager>());
    return context;
}

class AnnotationProcessor
{
public:
    AnnotationProcessor(Context & context, EnvironmentProvider provider, bool failOnElementError = false)
        : context(context), provider(std::move(provider)), failOnElementError(failOnElementError), elementFailures(0)
    {
    }

    void registerHandler(std::shared_ptr<AnnotationHandler> handler)
    {
        if (!handler)
        {
            throw std::invalid_argument("Cannot register a null handler");
        }
        std::set<std::string> annotations = handler->annotationsToHandle();
        if (annotations.empty())
        {
            throw std::invalid_argument("Handler claims no annotation");
        }
        for (const std::string & annotation : annotations)
        {
            if (claims.contains(annotation))
            {
                throw std::invalid_argument(std::format("Annotation {} is already claimed by another handler", annotation));
            }
        }
        for (const std::string & annotation : annotations)
        {
            claims.emplace(annotation, handler.get());
        }
        handlers.push_back(std::move(handler));
    }

    std::set<std::string> claimedAnnotations() const
    {
        std::set<std::string> result;
        for (const auto & [annotation, handler] : claims) result.insert(annotation);
        return result;
    }

    // One round per handler over the elements of an entered unit.
    // Throws EnvironmentUnavailable if the environment cannot be resolved; element failures are only reported.
    ProcessingReport processUnit(const CompilationUnit & unit)
    {
        ProcessingReport report;
        RoundEnvironment round(*SymbolTable::instance(context), unit);
        for (const std::shared_ptr<AnnotationHandler> & handler : handlers)
        {
            std::set<Element> elements;
            for (const std::string & annotation : handler->annotationsToHandle())
            {
                std::set<Element> annotated = round.getElementsAnnotatedWith(annotation);
                elements.insert(annotated.begin(), annotated.end());
            }
            if (elements.empty()) continue;

            SPDLOG_DEBUG("Round over {}: {} element(s)", unit.getSourcePath().string(), elements.size());
            ResolvedEnvironment env = ResolvedEnvironment::resolve(provider);
            ProcessingReport roundReport = handler->process(elements, env);
            for (const ElementProcessingFailed & failure : roundReport.failures)
            {
                SPDLOG_WARN("{}", failure.what());
            }
            elementFailures += roundReport.failures.size();
            report.merge(std::move(roundReport));
        }
        return report;
    }

    std::size_t getElementFailures() const
    {
        return elementFailures;
    }

    // False once an element failed while failOnElementError is set
    bool succeeded() const
    {
        return !failOnElementError || elementFailures == 0;
    }

private:
    Context & context;
    EnvironmentProvider provider;
    bool failOnElementError;
    std::atomic<std::size_t> elementFailures;
    std::vector<std::shared_ptr<AnnotationHandler>> handlers;
    std::map<std::string, AnnotationHandler *> claims;
};

} // namespace Annotrace

#endif // ANNOTRACE_ANNOTATIONPROCESSOR_HPP
