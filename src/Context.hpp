// Per-compilation service registry.
// Each service type has at most one instance per context, keyed by its C++ type.

#ifndef ANNOTRACE_CONTEXT_HPP
#define ANNOTRACE_CONTEXT_HPP

#include <memory>
#include <mutex>
#include <stdexcept>
#include <typeindex>
#include <unordered_map>
#include <format>

#include <spdlog/spdlog.h>

namespace Annotrace
{

class Context
{
public:
    Context() = default;

    Context(const Context &) = delete;
    Context & operator=(const Context &) = delete;

    // Register a service instance. Registering the same type twice is an error.
    template <typename T>
    void put(std::shared_ptr<T> service)
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto [it, inserted] = services.try_emplace(std::type_index(typeid(T)), std::move(service));
        if (!inserted)
        {
            throw std::logic_error(std::format("Duplicate context service: {}", typeid(T).name()));
        }
    }

    // Look up a service instance, nullptr if none has been registered
    template <typename T>
    T * get() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = services.find(std::type_index(typeid(T)));
        if (it == services.end()) return nullptr;
        return static_cast<T *>(it->second.get());
    }

    // Look up a service instance, default-constructing it on first use
    template <typename T>
    T * instance()
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto [it, inserted] = services.try_emplace(std::type_index(typeid(T)), nullptr);
        if (inserted)
        {
            SPDLOG_TRACE("Creating context service: {}", typeid(T).name());
            it->second = std::make_shared<T>();
        }
        return static_cast<T *>(it->second.get());
    }

private:
    mutable std::mutex mutex;
    std::unordered_map<std::type_index, std::shared_ptr<void>> services;
};

} // namespace Annotrace

#endif // ANNOTRACE_CONTEXT_HPP
