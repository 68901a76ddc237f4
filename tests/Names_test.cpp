#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "Context.hpp"
#include "Names.hpp"

int main(int argc, char **argv)
{
    using namespace Annotrace;

    spdlog::set_level(spdlog::level::debug);

    Context context;
    Names * names = Names::instance(context);
    if (names != Names::instance(context))
    {
        std::cout << "Context created two Names tables" << std::endl;
        return 1;
    }

    Name a1 = names->fromString("warn");
    std::string buffer = "wa";
    buffer += "rn";
    Name a2 = names->fromString(buffer);
    Name b = names->fromString("getLogger");

    if (!(a1 == a2) || a1 == b)
    {
        std::cout << "Interned names should compare by identity of their text" << std::endl;
        return 1;
    }
    if (a1.str() != "warn" || !b.contentEquals("getLogger") || a1.isEmpty())
    {
        std::cout << "Unexpected name text: " << a1.toString() << ", " << b.toString() << std::endl;
        return 1;
    }
    if (!Name().isEmpty() || Name().str() != "")
    {
        std::cout << "Default name should be empty" << std::endl;
        return 1;
    }

    // Interning is thread-safe and stable across threads
    std::vector<std::thread> threads;
    std::vector<Name> results(8);
    for (std::size_t t = 0; t < results.size(); ++t)
    {
        threads.emplace_back([&, t]() { results[t] = names->fromString("onDeprecatedMethodCalled"); });
    }
    for (auto & th : threads) th.join();
    for (const Name & name : results)
    {
        if (!(name == results.front()))
        {
            std::cout << "Concurrent interning produced distinct handles" << std::endl;
            return 1;
        }
    }
    if (names->size() != 3)
    {
        std::cout << "Expected 3 distinct names, got " << names->size() << std::endl;
        return 1;
    }

    // Registered services are found, missing ones are null, duplicates are rejected
    if (context.get<std::string>() != nullptr)
    {
        std::cout << "Unregistered service should be null" << std::endl;
        return 1;
    }
    context.put(std::make_shared<std::string>("host"));
    if (!context.get<std::string>() || *context.get<std::string>() != "host")
    {
        std::cout << "Registered service not found" << std::endl;
        return 1;
    }
    try
    {
        context.put(std::make_shared<std::string>("again"));
        std::cout << "Duplicate service was accepted" << std::endl;
        return 1;
    }
    catch (const std::logic_error & e)
    {
        std::cout << "Rejected duplicate: " << e.what() << std::endl;
    }

    std::cout << "Test passed!" << std::endl;
    return 0;
}
