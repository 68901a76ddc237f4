// End-to-end run over a set of Java sources: parse, enter, process, emit.
// One task per source file, spread over a pool of worker threads.

#ifndef ANNOTRACE_PIPELINE_HPP
#define ANNOTRACE_PIPELINE_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <format>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "Util.hpp"
#include "Context.hpp"
#include "Enter.hpp"
#include "Messager.hpp"
#include "ProcessingEnvironment.hpp"
#include "AnnotationProcessor.hpp"
#include "DeprecatedHandler.hpp"
#include "InstrumentationConfig.hpp"
#include "JavaFrontend.hpp"
#include "TreePrinter.hpp"

namespace Annotrace
{

class Pipeline
{
    using ordered_json = nlohmann::ordered_json;

public:
    struct StageNames
    {
        static constexpr std::string_view Parse = "Parse";
        static constexpr std::string_view Enter = "Enter";
        static constexpr std::string_view Process = "Process";
        static constexpr std::string_view Emit = "Emit";
        inline static constexpr std::initializer_list<std::string_view> Ordered =
        {
            Parse,
            Enter,
            Process,
            Emit
        };
    };

    class StageTimer
    {
    public:
        class Scope
        {
        public:
            Scope(StageTimer & timer, std::string_view stage)
                : timer(&timer), stage(stage)
            {
                this->timer->beginStage(stage);
            }

            Scope(const Scope &) = delete;
            Scope & operator=(const Scope &) = delete;

            Scope(Scope && other) noexcept
                : timer(std::exchange(other.timer, nullptr)), stage(std::move(other.stage))
            {
            }

            Scope & operator=(Scope &&) = delete;

            ~Scope()
            {
                if (timer) timer->endStage(stage);
            }

        private:
            StageTimer * timer;
            std::string stage;
        };

        [[nodiscard]] std::unordered_map<std::string, std::chrono::nanoseconds> getStageDurations() const
        {
            return elapsedDurations;
        }

        [[nodiscard]] std::chrono::nanoseconds totalDuration() const
        {
            return total;
        }

        static double toMillis(std::chrono::nanoseconds ns)
        {
            return std::chrono::duration<double, std::milli>(ns).count();
        }

    private:
        using clock = std::chrono::steady_clock;

        void beginStage(std::string_view stage)
        {
            runningStages.try_emplace(std::string(stage), clock::now());
        }

        void endStage(const std::string & stage)
        {
            auto it = runningStages.find(stage);
            if (it == runningStages.end())
            {
                return;
            }

            const auto delta = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - it->second);
            elapsedDurations[stage] += delta;
            total += delta;
            runningStages.erase(it);
        }

        std::unordered_map<std::string, clock::time_point> runningStages;
        std::unordered_map<std::string, std::chrono::nanoseconds> elapsedDurations;
        std::chrono::nanoseconds total{0};
    };

    struct Options
    {
        std::vector<std::filesystem::path> inputs;
        std::optional<std::filesystem::path> outputDir; // Instrumented sources go to stdout when absent
        std::optional<std::filesystem::path> reportPath;
        InstrumentationConfig config;
        bool wrapped = false; // Hand processors a proxied environment, as a build daemon would
        std::size_t jobs = 1;
    };

    // Where an instrumented unit is written: <outputDir>/<package path>/<file name>
    static std::filesystem::path outputPathFor(const std::filesystem::path & outputDir, const CompilationUnit & unit)
    {
        std::filesystem::path outPath = outputDir;
        if (!unit.packageName().empty())
        {
            for (const std::string & segment : splitQualifiedName(unit.packageName()))
            {
                outPath /= segment;
            }
        }
        return outPath / unit.getSourcePath().filename();
    }

    static int run(const Options & options)
    {
        const std::size_t numTasks = options.inputs.size();
        SPDLOG_INFO("Number of tasks: {}", numTasks);

        std::unique_ptr<Context> context = makeHostContext();
        NativeProcessingEnvironment nativeEnv(*context);
        WrappedProcessingEnvironment wrappedEnv(nativeEnv, std::string(UnwrapperRegistry::BuildDaemonFacility));
        ProcessingEnvironment * handle = options.wrapped
            ? static_cast<ProcessingEnvironment *>(&wrappedEnv)
            : static_cast<ProcessingEnvironment *>(&nativeEnv);
        EnvironmentProvider provider = UnwrapperRegistry::withDefaults().discover(handle);
        SPDLOG_DEBUG("Processing environment: {}", handle->toString());

        AnnotationProcessor processor(*context, std::move(provider), options.config.failOnElementError);
        processor.registerHandler(std::make_shared<DeprecatedHandler>(options.config));
        Enter enter(*context);

        // Units stay alive until the end: symbols and trees point into them
        std::vector<std::unique_ptr<CompilationUnit>> units(numTasks);
        std::vector<std::optional<std::filesystem::path>> outputPaths(numTasks);
        std::vector<ProcessingReport> reports(numTasks);
        std::vector<char> completed(numTasks, 0);
        std::vector<std::pair<std::filesystem::path, std::string>> failedTasks; // Failed file -> error
        std::mutex failedMutex;

        std::unordered_map<std::string, std::chrono::nanoseconds> performanceStageTotals;
        std::chrono::nanoseconds performanceTotal{0};
        std::mutex collectionMutex;

        std::atomic<std::size_t> nextIdx{0};
        std::size_t jobs = std::clamp<std::size_t>(options.jobs, 1, std::max<std::size_t>(numTasks, 1));
        SPDLOG_INFO("Using {} worker thread(s)", jobs);

        auto worker = [&]()
        {
            while (true)
            {
                std::size_t taskIdx = nextIdx.fetch_add(1, std::memory_order_relaxed);
                if (taskIdx >= numTasks) break;
                const std::filesystem::path & srcPath = options.inputs[taskIdx];
                StageTimer stageTimer;

                try
                {
                    {
                        StageTimer::Scope stage(stageTimer, StageNames::Parse);
                        // Parsers are not shareable between threads
                        JavaFrontend frontend(*context);
                        units[taskIdx] = std::make_unique<CompilationUnit>(frontend.parseFile(srcPath));
                    }
                    CompilationUnit & unit = *units[taskIdx];
                    {
                        StageTimer::Scope stage(stageTimer, StageNames::Enter);
                        enter.enterUnit(unit);
                    }
                    {
                        StageTimer::Scope stage(stageTimer, StageNames::Process);
                        reports[taskIdx] = processor.processUnit(unit);
                    }
                    if (options.outputDir)
                    {
                        StageTimer::Scope stage(stageTimer, StageNames::Emit);
                        std::filesystem::path outPath = outputPathFor(*options.outputDir, unit);
                        saveStringToFile(TreePrinter::print(unit), outPath);
                        outputPaths[taskIdx] = outPath;
                        SPDLOG_INFO("Instrumented {} saved to: {}", srcPath.string(), outPath.string());
                    }

                    completed[taskIdx] = 1;
                    SPDLOG_INFO("Task {}/{} {} completed", taskIdx + 1, numTasks, srcPath.string());
                }
                catch (const std::exception & e)
                {
                    std::lock_guard<std::mutex> lock(failedMutex);
                    failedTasks.emplace_back(srcPath, e.what());
                    SPDLOG_ERROR("Task {}/{} {} failed: {}", taskIdx + 1, numTasks, srcPath.string(), e.what());
                }

                {
                    const auto stageDurationsSnapshot = stageTimer.getStageDurations();
                    std::lock_guard<std::mutex> lock(collectionMutex);
                    for (const auto & [stageName, duration] : stageDurationsSnapshot)
                    {
                        performanceStageTotals[stageName] += duration;
                    }
                    performanceTotal += stageTimer.totalDuration();
                }
            }
        };

        std::vector<std::thread> threads;
        threads.reserve(jobs);
        for (std::size_t t = 0; t < jobs; ++t)
        {
            threads.emplace_back(worker);
        }
        for (auto & th : threads)
        {
            th.join();
        }

        if (!options.outputDir)
        {
            for (std::size_t i = 0; i < numTasks; ++i)
            {
                if (completed[i]) std::cout << TreePrinter::print(*units[i]);
            }
            std::cout << std::flush;
        }

        if (options.reportPath)
        {
            ordered_json report = buildReport
            (
                options.inputs,
                outputPaths,
                reports,
                failedTasks,
                *Messager::instance(*context),
                performanceStageTotals,
                performanceTotal
            );
            saveStringToFile(report.dump(4), *options.reportPath);
            SPDLOG_INFO("Report saved to: {}", options.reportPath->string());
        }

        std::size_t rewritten = 0;
        for (const ProcessingReport & report : reports) rewritten += report.count(Outcome::Rewritten);
        SPDLOG_INFO("{} method(s) instrumented, {} element failure(s)", rewritten, processor.getElementFailures());

        // Print final results
        if (!failedTasks.empty())
        {
            SPDLOG_ERROR("{} task(s) failed:", failedTasks.size());
            for (const auto & p : failedTasks)
            {
                SPDLOG_ERROR("  {} -> {}", p.first.string(), p.second);
            }
        }
        if (!processor.succeeded())
        {
            SPDLOG_ERROR("Element failures are fatal with failOnElementError");
        }

        return failedTasks.empty() && processor.succeeded() ? 0 : 1;
    }

private:
    static ordered_json buildReport
    (
        const std::vector<std::filesystem::path> & inputs,
        const std::vector<std::optional<std::filesystem::path>> & outputPaths,
        const std::vector<ProcessingReport> & reports,
        const std::vector<std::pair<std::filesystem::path, std::string>> & failedTasks,
        const Messager & messager,
        const std::unordered_map<std::string, std::chrono::nanoseconds> & stageTotals,
        std::chrono::nanoseconds total
    )
    {
        ordered_json files = ordered_json::array();
        ordered_json elements = ordered_json::array();
        ordered_json failures = ordered_json::array();
        for (std::size_t i = 0; i < inputs.size(); ++i)
        {
            const ProcessingReport & report = reports[i];
            ordered_json file = ordered_json::object();
            file["input"] = inputs[i].string();
            file["output"] = outputPaths[i] ? ordered_json(outputPaths[i]->string()) : ordered_json(nullptr);
            file["rewritten"] = report.count(Outcome::Rewritten);
            file["skipped"] = report.count(Outcome::Skipped);
            file["failed"] = report.count(Outcome::Failed);
            files.push_back(file);

            for (const ProcessingReport::Entry & entry : report.entries)
            {
                ordered_json element = ordered_json::object();
                element["file"] = inputs[i].string();
                element["element"] = elementToString(entry.element);
                element["outcome"] = outcomeName(entry.outcome);
                elements.push_back(element);
            }
            for (const ElementProcessingFailed & failure : report.failures)
            {
                ordered_json f = ordered_json::object();
                f["element"] = elementToString(failure.getElement());
                f["cause"] = failure.getCause();
                failures.push_back(f);
            }
        }

        ordered_json failedFiles = ordered_json::array();
        for (const auto & [path, error] : failedTasks)
        {
            ordered_json f = ordered_json::object();
            f["file"] = path.string();
            f["error"] = error;
            failedFiles.push_back(f);
        }

        ordered_json stages = ordered_json::object();
        for (std::string_view stageName : StageNames::Ordered)
        {
            const std::string stageKey(stageName);
            const auto it = stageTotals.find(stageKey);
            stages[stageKey] = (it != stageTotals.end()) ? StageTimer::toMillis(it->second) : 0.0;
        }
        ordered_json performance = ordered_json::object();
        performance["stages"] = stages;
        performance["total_ms"] = StageTimer::toMillis(total);
        performance["task_count"] = inputs.size();

        ordered_json result = ordered_json::object();
        result["files"] = files;
        result["elements"] = elements;
        result["failures"] = failures;
        result["failedFiles"] = failedFiles;
        result["diagnostics"] = messager.toJson();
        result["performance"] = performance;
        return result;
    }
};

} // namespace Annotrace

#endif // ANNOTRACE_PIPELINE_HPP
