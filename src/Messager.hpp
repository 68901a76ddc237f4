// Diagnostic channel to the build output.
// Reported diagnostics are mirrored to the log and kept for the end-of-run report.

#ifndef ANNOTRACE_MESSAGER_HPP
#define ANNOTRACE_MESSAGER_HPP

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "Context.hpp"

namespace Annotrace
{

enum class DiagnosticKind
{
    Error,
    Warning,
    MandatoryWarning,
    Note,
    Other
};

NLOHMANN_JSON_SERIALIZE_ENUM
(
    DiagnosticKind,
    {
        {DiagnosticKind::Error, "error"},
        {DiagnosticKind::Warning, "warning"},
        {DiagnosticKind::MandatoryWarning, "mandatory_warning"},
        {DiagnosticKind::Note, "note"},
        {DiagnosticKind::Other, "other"},
    }
)

struct Diagnostic
{
    DiagnosticKind kind;
    std::string message;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Diagnostic, kind, message)
};

class Messager
{
    using json = nlohmann::json;

public:
    // Registered by the host; nullptr when the host did not provide one
    static Messager * instance(Context & context)
    {
        return context.get<Messager>();
    }

    void printMessage(DiagnosticKind kind, std::string_view message)
    {
        switch (kind)
        {
            case DiagnosticKind::Error: SPDLOG_ERROR("{}", message); break;
            case DiagnosticKind::Warning:
            case DiagnosticKind::MandatoryWarning: SPDLOG_WARN("{}", message); break;
            default: SPDLOG_INFO("{}", message); break;
        }
        std::lock_guard<std::mutex> lock(mutex);
        diagnostics.push_back(Diagnostic{kind, std::string(message)});
    }

    std::vector<Diagnostic> getDiagnostics() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return diagnostics;
    }

    std::size_t count(DiagnosticKind kind) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (const Diagnostic & diagnostic : diagnostics)
        {
            if (diagnostic.kind == kind) ++n;
        }
        return n;
    }

    json toJson() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return json(diagnostics);
    }

private:
    mutable std::mutex mutex;
    std::vector<Diagnostic> diagnostics;
};

} // namespace Annotrace

#endif // ANNOTRACE_MESSAGER_HPP
