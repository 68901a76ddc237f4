#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include "InstrumentationConfig.hpp"
#include "Pipeline.hpp"

int main(const int argc, const char* argv[])
{
    using namespace Annotrace;

    std::size_t hardwareThreads = std::thread::hardware_concurrency();
    if (hardwareThreads == 0) hardwareThreads = 2;
    if (hardwareThreads > 16) hardwareThreads = 16;

    // Default logging level (can be raised with -v / -vv)
    spdlog::set_level(spdlog::level::info);

    std::vector<std::filesystem::path> inputs;
    std::filesystem::path outputDir;
    std::filesystem::path configPath;
    std::filesystem::path reportPath;
    bool wrapped = false;
    std::size_t jobs = 0;
    int verbose = 0;

    try
    {
        CLI::App app
        {
            "Annotrace: instruments @Deprecated Java methods and constructors with a logger warning and an invocation counter\n"
            "Pattern: annotrace <File.java>... [-o <output_dir>] [opts]"
        };
        app.set_help_flag("-h,--help", "Show help");

        app.add_option("inputs", inputs, "Java source files")
            ->required()
            ->check(CLI::ExistingFile);
        app.add_option("-o,--output-dir", outputDir,
            "Output directory for instrumented sources, laid out by package (defaults to stdout)")
            ->default_str("");
        app.add_option("-c,--config", configPath,
            "Instrumentation config json file, which names the counter and logger types to call")
            ->check(CLI::ExistingFile);
        app.add_option("-r,--report", reportPath,
            "Write diagnostics, per-element outcomes and timings to this json file")
            ->default_str("");
        app.add_flag("--wrapped", wrapped,
            "Hand the processor a proxied processing environment, as a build daemon would")
            ->default_val(false);
        app.add_option("-j,--jobs", jobs, "Worker threads")
            ->default_val(hardwareThreads);
        app.add_flag("-v,--verbose", verbose,
            "Increase verbosity (-v=debug, -vv=trace)")
            ->default_val(0);

        try
        {
            app.parse(argc, argv);
        }
        catch (const CLI::Error & e)
        {
            return app.exit(e);
        }

        // Apply verbosity
        switch (verbose)
        {
            case 0: spdlog::set_level(spdlog::level::info); break;
            case 1: spdlog::set_level(spdlog::level::debug); break;
            default: spdlog::set_level(spdlog::level::trace); break;
        }

        Pipeline::Options options;
        options.inputs = std::move(inputs);
        options.wrapped = wrapped;
        options.jobs = jobs;
        if (!outputDir.empty())
        {
            std::filesystem::create_directories(outputDir);
            options.outputDir = std::filesystem::canonical(outputDir);
        }
        if (!reportPath.empty())
        {
            options.reportPath = reportPath;
        }
        if (!configPath.empty())
        {
            options.config = InstrumentationConfig::fromJsonFile(configPath);
            SPDLOG_INFO("Using config: {}", configPath.string());
        }

        return Pipeline::run(options);
    }
    catch (const std::exception & e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
