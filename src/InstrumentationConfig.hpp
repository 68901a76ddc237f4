// Which runtime symbols the injected code refers to, loadable from a JSON file.
// Example:
// {
//     "counter": { "packageName": "org.apache.dubbo.common", "className": "DeprecatedMethodInvocationCounter", "methodName": "onDeprecatedMethodCalled" },
//     "loggerFactory": { "packageName": "org.slf4j", "className": "LoggerFactory", "methodName": "getLogger" },
//     "logger": { "packageName": "org.slf4j", "className": "Logger", "methodName": "warn" },
//     "markerException": "Exception",
//     "messagePrefix": "Deprecated method called in ",
//     "failOnElementError": false
// }
// Every key is optional. Runtime types must live in a named package.

#ifndef ANNOTRACE_INSTRUMENTATIONCONFIG_HPP
#define ANNOTRACE_INSTRUMENTATIONCONFIG_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "Util.hpp"

namespace Annotrace
{

// A static method of a runtime type
struct RuntimeTarget
{
    std::string packageName;
    std::string className;
    std::string methodName;

    std::string qualifiedName() const
    {
        return packageName.empty() ? className : std::format("{}.{}", packageName, className);
    }
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RuntimeTarget, packageName, className, methodName)

struct InstrumentationConfig;
inline void from_json(const nlohmann::json & j, InstrumentationConfig & config);

struct InstrumentationConfig
{
    using json = nlohmann::json;

    RuntimeTarget counter{"org.apache.dubbo.common", "DeprecatedMethodInvocationCounter", "onDeprecatedMethodCalled"};
    RuntimeTarget loggerFactory{"org.slf4j", "LoggerFactory", "getLogger"};
    RuntimeTarget logger{"org.slf4j", "Logger", "warn"};
    std::string markerException = "Exception";
    std::string messagePrefix = "Deprecated method called in ";
    bool failOnElementError = false;

    static InstrumentationConfig fromJson(const json & j)
    {
        InstrumentationConfig config = j.get<InstrumentationConfig>();
        config.validate();
        return config;
    }

    static InstrumentationConfig fromJsonFile(const std::filesystem::path & path)
    {
        json j;
        try
        {
            j = json::parse(loadFileToString(path));
        }
        catch (const json::parse_error & e)
        {
            throw std::invalid_argument(std::format("Malformed config {}: {}", path.string(), e.what()));
        }
        SPDLOG_DEBUG("Loaded config from {}", path.string());
        return fromJson(j);
    }

    // Targets are imported, so they need a package; class and method are simple names
    void validate() const
    {
        auto check = [](const RuntimeTarget & target, std::string_view what)
        {
            if (target.className.empty() || target.methodName.empty())
            {
                throw std::invalid_argument(std::format("Config: {} needs a className and a methodName", what));
            }
            if (!isJavaIdentifier(target.className) || !isJavaIdentifier(target.methodName))
            {
                throw std::invalid_argument
                (
                    std::format
                    (
                        "Config: {} className \"{}\" and methodName \"{}\" must be simple identifiers",
                        what,
                        target.className,
                        target.methodName
                    )
                );
            }
            if (!isQualifiedJavaName(target.packageName))
            {
                throw std::invalid_argument
                (
                    std::format("Config: {} packageName \"{}\" is not a package name", what, target.packageName)
                );
            }
        };
        check(counter, "counter");
        check(loggerFactory, "loggerFactory");
        check(logger, "logger");
        if (!isQualifiedJavaName(markerException))
        {
            throw std::invalid_argument(std::format("Config: markerException \"{}\" is not a type name", markerException));
        }
    }

    static bool isJavaIdentifier(std::string_view name)
    {
        if (name.empty()) return false;
        auto isStart = [](char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$'; };
        auto isPart = [&isStart](char c) { return isStart(c) || std::isdigit(static_cast<unsigned char>(c)); };
        if (!isStart(name.front())) return false;
        return std::all_of(name.begin() + 1, name.end(), isPart);
    }

    // "a.b.C": non-empty, identifiers separated by single dots
    static bool isQualifiedJavaName(std::string_view name)
    {
        if (name.empty()) return false;
        std::vector<std::string> segments = splitQualifiedName(name);
        return std::all_of
        (
            segments.begin(),
            segments.end(),
            [](const std::string & segment) { return isJavaIdentifier(segment); }
        );
    }
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT
(
    InstrumentationConfig,
    counter,
    loggerFactory,
    logger,
    markerException,
    messagePrefix,
    failOnElementError
)

} // namespace Annotrace

#endif // ANNOTRACE_INSTRUMENTATIONCONFIG_HPP
