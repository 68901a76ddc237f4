// Scratch directory removed on destruction, used to lay out source trees for runs

#ifndef ANNOTRACE_TEMPDIR_HPP
#define ANNOTRACE_TEMPDIR_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "Util.hpp"

namespace Annotrace
{

class TempDir
{
public:
    explicit TempDir(bool autoDelete = true)
        : path(std::filesystem::temp_directory_path() / generateUniqueName()),
          pathPtr(&path, autoDelete ? &deleteDir : &keepDir)
    {
        std::error_code ec;
        if (!std::filesystem::create_directory(path, ec))
        {
            throw std::runtime_error("Failed to create temp dir: " + ec.message());
        }
    }

    TempDir(const TempDir &) = delete;
    TempDir & operator=(const TempDir &) = delete;

    const std::filesystem::path & getPath() const noexcept
    {
        return path;
    }

    // Write a file below the directory, creating intermediate directories
    std::filesystem::path write(const std::filesystem::path & relative, std::string_view content) const
    {
        if (relative.is_absolute())
        {
            throw std::invalid_argument("TempDir::write expects a relative path: " + relative.string());
        }
        std::filesystem::path target = path / relative;
        saveStringToFile(content, target);
        return target;
    }

private:
    std::filesystem::path path;
    std::unique_ptr<std::filesystem::path, void (*)(const std::filesystem::path *)> pathPtr;

    static void deleteDir(const std::filesystem::path * path)
    {
        std::error_code ec;
        std::filesystem::remove_all(*path, ec);
    }

    static void keepDir(const std::filesystem::path *)
    {
    }

    static std::string generateUniqueName()
    {
        auto timestamp = std::chrono::system_clock::now().time_since_epoch().count();
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 9999);
        return "annotrace_" + std::to_string(timestamp) + "_" + std::to_string(dis(gen));
    }
};

} // namespace Annotrace

#endif // ANNOTRACE_TEMPDIR_HPP
