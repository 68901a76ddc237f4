#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "Context.hpp"
#include "Messager.hpp"
#include "Symbols.hpp"
#include "Enter.hpp"
#include "JavaFrontend.hpp"
#include "TreePrinter.hpp"
#include "ProcessingEnvironment.hpp"
#include "ResolvedEnvironment.hpp"
#include "AnnotationHandler.hpp"
#include "AnnotationProcessor.hpp"
#include "DeprecatedHandler.hpp"

using namespace Annotrace;

const std::string ServiceSource = R"(package com.example;

import java.util.logging.Logger;

public class Service {
    @Deprecated
    public void legacy() {
        run();
    }

    @Audit
    public void audited() {
    }

    @Audit
    public void broken() {
    }

    public void plain() {
    }
}
)";

const std::string PlainSource = R"(package com.example;

class Plain {
    void f() {
        g();
    }
}
)";

// Records what it is handed; elements named "broken" fail
class AuditHandler : public AnnotationHandler
{
public:
    std::size_t rounds = 0;
    std::vector<std::string> seen;

    std::set<std::string> annotationsToHandle() const override
    {
        return {"com.example.Audit"};
    }

    ProcessingReport process(const std::set<Element> & elements, const ResolvedEnvironment & env) override
    {
        ++rounds;
        ProcessingReport report;
        for (const Element & element : elements)
        {
            seen.push_back(elementToString(element));
            if (seen.back().ends_with("broken()"))
            {
                report.fail(element, std::runtime_error("cannot audit"));
            }
            else
            {
                report.record(element, Outcome::Skipped);
            }
        }
        return report;
    }
};

class ClaimsNothing : public AnnotationHandler
{
public:
    std::set<std::string> annotationsToHandle() const override
    {
        return {};
    }

    ProcessingReport process(const std::set<Element> &, const ResolvedEnvironment &) override
    {
        return {};
    }
};

template <typename Exception, typename F>
bool expectThrow(F && f, std::string_view what)
{
    try
    {
        f();
    }
    catch (const Exception & e)
    {
        std::cout << "Rejected " << what << ": " << e.what() << std::endl;
        return true;
    }
    std::cout << "Accepted " << what << std::endl;
    return false;
}

int main(int argc, char **argv)
{
    spdlog::set_level(spdlog::level::debug);

    std::unique_ptr<Context> context = makeHostContext();
    NativeProcessingEnvironment nativeEnv(*context);
    UnwrapperRegistry registry = UnwrapperRegistry::withDefaults();

    // Registration
    {
        AnnotationProcessor processor(*context, registry.discover(&nativeEnv));
        if (!expectThrow<std::invalid_argument>([&] { processor.registerHandler(nullptr); }, "null handler")
            || !expectThrow<std::invalid_argument>
            (
                [&] { processor.registerHandler(std::make_shared<ClaimsNothing>()); },
                "empty claim"
            ))
        {
            return 1;
        }
        processor.registerHandler(std::make_shared<DeprecatedHandler>());
        if (!expectThrow<std::invalid_argument>
            (
                [&] { processor.registerHandler(std::make_shared<DeprecatedHandler>()); },
                "duplicate claim"
            ))
        {
            return 1;
        }
        processor.registerHandler(std::make_shared<AuditHandler>());
        std::set<std::string> expectedClaims{"com.example.Audit", "java.lang.Deprecated"};
        if (processor.claimedAnnotations() != expectedClaims)
        {
            std::cout << "Unexpected claimed annotations" << std::endl;
            return 1;
        }
    }

    JavaFrontend frontend(*context);
    Enter enter(*context);
    CompilationUnit service = frontend.parseSource(ServiceSource, "com/example/Service.java");
    CompilationUnit plain = frontend.parseSource(PlainSource, "com/example/Plain.java");
    enter.enterUnit(service);
    enter.enterUnit(plain);

    // Dispatch: each handler sees only its own annotation
    {
        auto audit = std::make_shared<AuditHandler>();
        AnnotationProcessor processor(*context, registry.discover(&nativeEnv));
        processor.registerHandler(std::make_shared<DeprecatedHandler>());
        processor.registerHandler(audit);

        ProcessingReport report = processor.processUnit(service);
        std::set<std::string> seen(audit->seen.begin(), audit->seen.end());
        std::set<std::string> expectedSeen{"com.example.Service.audited()", "com.example.Service.broken()"};
        if (audit->rounds != 1 || seen != expectedSeen)
        {
            std::cout << "Audit handler saw " << audit->seen.size() << " element(s) in " << audit->rounds << " round(s)" << std::endl;
            return 1;
        }
        if (report.entries.size() != 3
            || report.count(Outcome::Rewritten) != 1
            || report.count(Outcome::Skipped) != 1
            || report.count(Outcome::Failed) != 1)
        {
            std::cout << "Unexpected outcomes: " << report.entries.size() << " entries" << std::endl;
            return 1;
        }
        if (report.failures.size() != 1 || report.failures[0].getCause() != "cannot audit")
        {
            std::cout << "Unexpected failures" << std::endl;
            return 1;
        }
        if (processor.getElementFailures() != 1 || !processor.succeeded())
        {
            std::cout << "Element failures must not fail the run by default" << std::endl;
            return 1;
        }

        std::string printed = TreePrinter::print(service);
        std::cout << printed << std::endl;
        if (printed.find("import org.apache.dubbo.common.DeprecatedMethodInvocationCounter;") == std::string::npos
            || printed.find("import org.slf4j.LoggerFactory;") == std::string::npos
            || printed.find("onDeprecatedMethodCalled(\"com.example.Service.legacy()\");") == std::string::npos
            || printed.find("Deprecated method called in com.example.Service") == std::string::npos)
        {
            std::cout << "Deprecated method was not instrumented" << std::endl;
            return 1;
        }
        // The unit already names another Logger
        if (printed.find("import org.slf4j.Logger;") != std::string::npos)
        {
            std::cout << "Imported a clashing Logger" << std::endl;
            return 1;
        }
        if (context->get<Messager>()->count(DiagnosticKind::Warning) != 1)
        {
            std::cout << "Expected one warning" << std::endl;
            return 1;
        }

        // Nothing annotated: no round, no environment needed
        ProcessingReport empty = processor.processUnit(plain);
        if (!empty.entries.empty() || audit->rounds != 1)
        {
            std::cout << "A handler ran on a unit without its annotation" << std::endl;
            return 1;
        }
    }

    // Element failures fail the run when asked to
    {
        AnnotationProcessor processor(*context, registry.discover(&nativeEnv), true);
        processor.registerHandler(std::make_shared<AuditHandler>());
        processor.processUnit(service);
        if (processor.getElementFailures() != 1 || processor.succeeded())
        {
            std::cout << "Element failure did not fail the run" << std::endl;
            return 1;
        }
    }

    // An environment nobody can unwrap stops processing of annotated units only
    {
        WrappedProcessingEnvironment foreign(nativeEnv, "ide.remote-proxy");
        EnvironmentProvider provider = registry.discover(&foreign);
        if (!std::holds_alternative<WrappedProvider>(provider) || std::get<WrappedProvider>(provider).unwrap)
        {
            std::cout << "Foreign proxy was given an unwrap strategy" << std::endl;
            return 1;
        }

        AnnotationProcessor processor(*context, provider);
        processor.registerHandler(std::make_shared<AuditHandler>());
        if (!processor.processUnit(plain).entries.empty())
        {
            std::cout << "Unannotated unit produced entries" << std::endl;
            return 1;
        }
        if (!expectThrow<EnvironmentUnavailable>([&] { processor.processUnit(service); }, "foreign environment"))
        {
            return 1;
        }

        // The same proxy through the build daemon facility resolves
        WrappedProcessingEnvironment daemon(nativeEnv, std::string(UnwrapperRegistry::BuildDaemonFacility));
        AnnotationProcessor unwrapped(*context, registry.discover(&daemon));
        unwrapped.registerHandler(std::make_shared<AuditHandler>());
        if (unwrapped.processUnit(service).entries.size() != 2)
        {
            std::cout << "Build daemon proxy was not unwrapped" << std::endl;
            return 1;
        }
    }

    std::cout << "Test passed!" << std::endl;
    return 0;
}
