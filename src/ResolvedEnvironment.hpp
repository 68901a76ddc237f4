// The compiler services annotation handlers work with, resolved once per round.
// Either every service is available or resolution throws EnvironmentUnavailable.

#ifndef ANNOTRACE_RESOLVEDENVIRONMENT_HPP
#define ANNOTRACE_RESOLVEDENVIRONMENT_HPP

#include <exception>
#include <format>
#include <functional>
#include <stdexcept>
#include <string>
#include <variant>

#include <spdlog/spdlog.h>

#include "Util.hpp"
#include "Context.hpp"
#include "Names.hpp"
#include "TreeMaker.hpp"
#include "Trees.hpp"
#include "Messager.hpp"
#include "ProcessingEnvironment.hpp"

namespace Annotrace
{

class EnvironmentUnavailable : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class ResolvedEnvironment
{
public:
    static ResolvedEnvironment resolve(const EnvironmentProvider & provider)
    {
        ProcessingEnvironment * handle = providerHandle(provider);
        if (handle == nullptr)
        {
            throw EnvironmentUnavailable("ProcessingEnvironment cannot be null");
        }

        ProcessingEnvironment * candidate = handle;
        if (!dynamic_cast<NativeProcessingEnvironment *>(handle))
        {
            candidate = tryUnwrap(provider, *handle);
        }

        auto * native = dynamic_cast<NativeProcessingEnvironment *>(candidate);
        if (!native)
        {
            throw EnvironmentUnavailable
            (
                std::format("Failed to obtain NativeProcessingEnvironment from {}", handle->toString())
            );
        }

        Context & context = native->getContext();
        ResolvedEnvironment env
        (
            native,
            &context,
            TreeMaker::instance(context),
            Names::instance(context),
            Trees::instance(context),
            native->getMessager()
        );

        // Ensure all required components are initialized
        if (!env.treeMaker || !env.names || !env.trees || !env.messager)
        {
            throw EnvironmentUnavailable
            (
                std::format("Failed to initialize ResolvedEnvironment due to missing components: {}", env.toString())
            );
        }

        SPDLOG_INFO("Successfully created ResolvedEnvironment.");
        return env;
    }

    NativeProcessingEnvironment & getProcessingEnvironment() const { return *processingEnvironment; }
    Context & getContext() const { return *context; }
    const TreeMaker & getTreeMaker() const { return *treeMaker; }
    Names & getNames() const { return *names; }
    Trees & getTrees() const { return *trees; }
    Messager & getMessager() const { return *messager; }

    bool operator==(const ResolvedEnvironment & other) const = default;

    std::string toString() const
    {
        return std::format
        (
            "ResolvedEnvironment{{processingEnvironment={}, context={}, treeMaker={}, names={}, trees={}, messager={}}}",
            static_cast<const void *>(processingEnvironment),
            static_cast<const void *>(context),
            static_cast<const void *>(treeMaker),
            static_cast<const void *>(names),
            static_cast<const void *>(trees),
            static_cast<const void *>(messager)
        );
    }

    struct Hasher
    {
        std::size_t operator()(const ResolvedEnvironment & env) const noexcept
        {
            std::size_t hash = 0;
            for (const void * p : {
                static_cast<const void *>(env.processingEnvironment),
                static_cast<const void *>(env.context),
                static_cast<const void *>(env.treeMaker),
                static_cast<const void *>(env.names),
                static_cast<const void *>(env.trees),
                static_cast<const void *>(env.messager)
            })
            {
                hash = hash * 31 + std::hash<const void *>{}(p);
            }
            return hash;
        }
    };

private:
    NativeProcessingEnvironment * processingEnvironment;
    Context * context;
    const TreeMaker * treeMaker;
    Names * names;
    Trees * trees;
    Messager * messager;

    ResolvedEnvironment
    (
        NativeProcessingEnvironment * processingEnvironment,
        Context * context,
        const TreeMaker * treeMaker,
        Names * names,
        Trees * trees,
        Messager * messager
    )
        : processingEnvironment(processingEnvironment),
          context(context),
          treeMaker(treeMaker),
          names(names),
          trees(trees),
          messager(messager)
    {
    }

    // Best effort: any failure falls back to the original handle
    static ProcessingEnvironment * tryUnwrap(const EnvironmentProvider & provider, ProcessingEnvironment & handle)
    {
        const auto * wrapped = std::get_if<WrappedProvider>(&provider);
        if (!wrapped || !wrapped->unwrap)
        {
            SPDLOG_WARN("Failed to unwrap ProcessingEnvironment: no unwrap facility for {}", handle.toString());
            return &handle;
        }

        ProcessingEnvironment * unwrapped = nullptr;
        try
        {
            unwrapped = wrapped->unwrap(handle);
        }
        catch (const std::exception & e)
        {
            SPDLOG_WARN("Failed to unwrap ProcessingEnvironment: {}", e.what());
            return &handle;
        }

        if (!dynamic_cast<NativeProcessingEnvironment *>(unwrapped))
        {
            SPDLOG_WARN("Failed to unwrap ProcessingEnvironment: facility did not yield a native environment");
            return &handle;
        }
        return unwrapped;
    }
};

} // namespace Annotrace

#endif // ANNOTRACE_RESOLVEDENVIRONMENT_HPP
