// Processing environments handed to annotation processors by the host.
// A build tool sitting between the host and the processors may wrap the native environment in a proxy;
// EnvironmentProvider records, once, whether a handle is native or wrapped and how to unwrap it.

#ifndef ANNOTRACE_PROCESSINGENVIRONMENT_HPP
#define ANNOTRACE_PROCESSINGENVIRONMENT_HPP

#include <format>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

#include <spdlog/spdlog.h>

#include "Util.hpp"
#include "Context.hpp"
#include "Messager.hpp"

namespace Annotrace
{

class ProcessingEnvironment
{
public:
    virtual ~ProcessingEnvironment() = default;

    virtual Messager * getMessager() const = 0;
    virtual std::string toString() const = 0;
};

// The host's own environment, backed by the compilation context
class NativeProcessingEnvironment final : public ProcessingEnvironment
{
public:
    explicit NativeProcessingEnvironment(Context & context)
        : context(context)
    {
    }

    Context & getContext() const
    {
        return context;
    }

    Messager * getMessager() const override
    {
        return Messager::instance(context);
    }

    std::string toString() const override
    {
        return std::format("NativeProcessingEnvironment@{}", static_cast<const void *>(this));
    }

private:
    Context & context;
};

// Proxy installed by an intermediate tool. Forwards the public surface, hides the native type.
class WrappedProcessingEnvironment : public ProcessingEnvironment
{
public:
    WrappedProcessingEnvironment(ProcessingEnvironment & delegate, std::string facility)
        : delegate(delegate), facility(std::move(facility))
    {
    }

    Messager * getMessager() const override
    {
        return delegate.getMessager();
    }

    std::string toString() const override
    {
        return std::format("WrappedProcessingEnvironment[{}]({})", facility, delegate.toString());
    }

    // Name of the facility able to unwrap this proxy
    const std::string & unwrapFacility() const
    {
        return facility;
    }

    ProcessingEnvironment & getDelegate() const
    {
        return delegate;
    }

private:
    ProcessingEnvironment & delegate;
    std::string facility;
};

// Returns the unwrapped environment, or nullptr if the wrapper is not understood. May throw.
using UnwrapStrategy = std::function<ProcessingEnvironment *(ProcessingEnvironment &)>;

struct NativeProvider
{
    ProcessingEnvironment * handle = nullptr;
};

struct WrappedProvider
{
    ProcessingEnvironment * handle = nullptr;
    UnwrapStrategy unwrap; // Empty when no facility was found
};

using EnvironmentProvider = std::variant<NativeProvider, WrappedProvider>;

ProcessingEnvironment * providerHandle(const EnvironmentProvider & provider)
{
    return std::visit([](const auto & p) { return p.handle; }, provider);
}

// Unwrap facilities known to the host integration layer, by name
class UnwrapperRegistry
{
public:
    static constexpr std::string_view BuildDaemonFacility = "build-daemon.api-wrappers";

    // Registry with the build daemon facility, which peels proxies until a non-proxy is reached
    static UnwrapperRegistry withDefaults()
    {
        UnwrapperRegistry registry;
        registry.add
        (
            std::string(BuildDaemonFacility),
            [](ProcessingEnvironment & wrapper) -> ProcessingEnvironment *
            {
                ProcessingEnvironment * current = &wrapper;
                while (auto * proxy = dynamic_cast<WrappedProcessingEnvironment *>(current))
                {
                    current = &proxy->getDelegate();
                }
                return current;
            }
        );
        return registry;
    }

    void add(std::string facility, UnwrapStrategy strategy)
    {
        strategies.insert_or_assign(std::move(facility), std::move(strategy));
    }

    std::optional<UnwrapStrategy> find(std::string_view facility) const
    {
        auto it = strategies.find(facility);
        if (it == strategies.end()) return std::nullopt;
        return it->second;
    }

    // Classify a handle once, at the boundary. Unknown wrappers get an empty strategy.
    EnvironmentProvider discover(ProcessingEnvironment * handle) const
    {
        if (handle == nullptr || dynamic_cast<NativeProcessingEnvironment *>(handle))
        {
            return NativeProvider{handle};
        }
        WrappedProvider provider{handle, nullptr};
        if (auto * proxy = dynamic_cast<WrappedProcessingEnvironment *>(handle))
        {
            if (std::optional<UnwrapStrategy> strategy = find(proxy->unwrapFacility()))
            {
                provider.unwrap = std::move(*strategy);
            }
            else
            {
                SPDLOG_DEBUG("No unwrap facility registered as {}", proxy->unwrapFacility());
            }
        }
        return provider;
    }

private:
    std::unordered_map<std::string, UnwrapStrategy, TransparentStringHash, TransparentStringEqual> strategies;
};

} // namespace Annotrace

#endif // ANNOTRACE_PROCESSINGENVIRONMENT_HPP
