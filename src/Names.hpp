// Name interner for one compilation.
// Identical text always maps to the identical Name handle, so Names compare by identity.

#ifndef ANNOTRACE_NAMES_HPP
#define ANNOTRACE_NAMES_HPP

#include <string>
#include <string_view>
#include <unordered_set>
#include <mutex>
#include <functional>

#include "Util.hpp"
#include "Context.hpp"

namespace Annotrace
{

class Names;

class Name
{
public:
    Name() : text(nullptr) {}

    std::string_view str() const
    {
        return text ? std::string_view(*text) : std::string_view();
    }

    std::string toString() const
    {
        return std::string(str());
    }

    operator std::string_view() const
    {
        return str();
    }

    bool isEmpty() const
    {
        return text == nullptr || text->empty();
    }

    // Handles from the same table are equal iff they point to the same entry
    bool operator==(const Name & other) const
    {
        return text == other.text;
    }

    bool contentEquals(std::string_view other) const
    {
        return str() == other;
    }

    struct Hasher
    {
        std::size_t operator()(const Name & name) const noexcept
        {
            return std::hash<const std::string *>{}(name.text);
        }
    };

private:
    friend class Names;
    explicit Name(const std::string * text) : text(text) {}

    const std::string * text;
};

class Names
{
public:
    Names() = default;

    Names(const Names &) = delete;
    Names & operator=(const Names &) = delete;

    static Names * instance(Context & context)
    {
        return context.instance<Names>();
    }

    Name fromString(std::string_view str)
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = table.find(str);
        if (it == table.end())
        {
            it = table.emplace(str).first;
        }
        // Elements of a node-based set keep their address across rehashing
        return Name(&*it);
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return table.size();
    }

private:
    mutable std::mutex mutex;
    std::unordered_set<std::string, TransparentStringHash, TransparentStringEqual> table;
};

} // namespace Annotrace

#endif // ANNOTRACE_NAMES_HPP
