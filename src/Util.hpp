#ifndef ANNOTRACE_UTIL_HPP
#define ANNOTRACE_UTIL_HPP

#ifndef __GLIBCXX__
#error "Not using libstdc++"
#endif
#if __GLIBCXX__ < 20220719
#error "libstdc++ version is too old, require GCC 13 or above"
#endif

#define DEBUG (!NDEBUG)

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace Annotrace
{

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string loadFileToString(const std::filesystem::path & path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw std::runtime_error("Error: Could not open file " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    file.close();
    return content;
}

void saveStringToFile(std::string_view content, const std::filesystem::path & path)
{
    // Create parent directories if they do not exist
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path);
    if (!file.is_open())
    {
        throw std::runtime_error("Error: Could not open file " + path.string());
    }
    file << content;
    file.close();
}

// Escape a string so that it can be embedded in a Java string literal
std::string escapeString(std::string_view str)
{
    std::string result;
    result.reserve(str.size() + 8);
    for (char c : str)
    {
        switch (c)
        {
        case '\\':
            result += "\\\\";
            break;
        case '\"':
            result += "\\\"";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        default:
            result += c;
            break;
        }
    }
    return result;
}

// Join segments with a separator, e.g. {"a", "b"} with "." => "a.b"
template <typename Range>
std::string join(const Range & segments, std::string_view separator)
{
    std::string result;
    bool first = true;
    for (const auto & segment : segments)
    {
        if (!first) result.append(separator);
        result.append(std::string_view(segment));
        first = false;
    }
    return result;
}

// Split "org.slf4j.Logger" into {"org", "slf4j", "Logger"}
std::vector<std::string> splitQualifiedName(std::string_view qualifiedName)
{
    std::vector<std::string> segments;
    std::size_t pos = 0;
    while (pos <= qualifiedName.size())
    {
        std::size_t nextPos = qualifiedName.find('.', pos);
        if (nextPos == std::string_view::npos) nextPos = qualifiedName.size();
        segments.emplace_back(qualifiedName.substr(pos, nextPos - pos));
        pos = nextPos + 1;
    }
    return segments;
}

bool isAllWhitespace(std::string_view s)
{
    return s.find_first_not_of(" \t\n\v\f\r") == std::string_view::npos;
}

// In support of std::unordered_map<std::string, T> lookup using std::string_view
struct TransparentStringHash
{
    using is_transparent = void;

    size_t operator()(const std::string & s) const
    {
        return std::hash<std::string>{}(s);
    }
    size_t operator()(std::string_view sv) const
    {
        return std::hash<std::string_view>{}(sv);
    }
};

// In support of std::unordered_map<std::string, T> lookup using std::string_view
struct TransparentStringEqual
{
    using is_transparent = void;

    bool operator()(const std::string & lhs, const std::string & rhs) const
    {
        return lhs == rhs;
    }
    bool operator()(const std::string & lhs, std::string_view rhs) const
    {
        return lhs == rhs;
    }
    bool operator()(std::string_view lhs, const std::string & rhs) const
    {
        return lhs == rhs;
    }
    bool operator()(std::string_view lhs, std::string_view rhs) const
    {
        return lhs == rhs;
    }
};

} // namespace Annotrace

#endif // ANNOTRACE_UTIL_HPP
