#include <iostream>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "Util.hpp"
#include "TempDir.hpp"

int main(int argc, char **argv)
{
    using namespace Annotrace;

    spdlog::set_level(spdlog::level::debug);

    // Directories and the files laid out in them go away with the TempDir
    for (int i = 0; i < 5; i++)
    {
        std::filesystem::path tmpPath;
        std::filesystem::path written;
        {
            TempDir tmpDir;
            tmpPath = tmpDir.getPath();
            written = tmpDir.write("org/example/Foo.java", "class Foo {}\n");
            std::cout << "Created: " << written << std::endl;
            if (written != tmpPath / "org" / "example" / "Foo.java" || loadFileToString(written) != "class Foo {}\n")
            {
                std::cout << "Unexpected file: " << written << std::endl;
                return 1;
            }
        }
        if (std::filesystem::exists(tmpPath))
        {
            std::cout << "Not removed: " << tmpPath << std::endl;
            return 1;
        }
        std::cout << "Removed: " << tmpPath << std::endl;
    }

    {
        TempDir tmpDir;
        try
        {
            tmpDir.write(tmpDir.getPath() / "Foo.java", "");
            std::cout << "Accepted an absolute path" << std::endl;
            return 1;
        }
        catch (const std::invalid_argument & e)
        {
            std::cout << "Rejected: " << e.what() << std::endl;
        }
    }

    // Kept directories survive their owner
    std::filesystem::path keptPath;
    {
        TempDir kept(false);
        keptPath = kept.getPath();
    }
    if (!std::filesystem::exists(keptPath))
    {
        std::cout << "Kept directory was removed: " << keptPath << std::endl;
        return 1;
    }
    std::filesystem::remove_all(keptPath);

    std::cout << "Test passed!" << std::endl;
    return 0;
}
