// Contract for annotation-specific tree rewriters

#ifndef ANNOTRACE_ANNOTATIONHANDLER_HPP
#define ANNOTRACE_ANNOTATIONHANDLER_HPP

#include <cstddef>
#include <exception>
#include <format>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "Symbols.hpp"
#include "ResolvedEnvironment.hpp"

namespace Annotrace
{

// One element of a batch could not be processed. Siblings in the batch are unaffected.
class ElementProcessingFailed : public std::runtime_error
{
public:
    ElementProcessingFailed(const Element & element, const std::exception & cause)
        : std::runtime_error
        (
            std::format("Failed to process {}: {}", elementToString(element), cause.what())
        ),
        element(element),
        cause(cause.what())
    {
    }

    const Element & getElement() const
    {
        return element;
    }

    const std::string & getCause() const
    {
        return cause;
    }

private:
    Element element;
    std::string cause;
};

enum class Outcome
{
    Rewritten,
    Skipped,
    Failed
};

std::string_view outcomeName(Outcome outcome)
{
    switch (outcome)
    {
        case Outcome::Rewritten: return "Rewritten";
        case Outcome::Skipped: return "Skipped";
        case Outcome::Failed: return "Failed";
    }
    return "Unknown";
}

struct ProcessingReport
{
    struct Entry
    {
        Element element;
        Outcome outcome;
    };

    std::vector<Entry> entries;
    std::vector<ElementProcessingFailed> failures;

    void record(const Element & element, Outcome outcome)
    {
        entries.push_back(Entry{element, outcome});
    }

    void fail(const Element & element, const std::exception & cause)
    {
        entries.push_back(Entry{element, Outcome::Failed});
        failures.emplace_back(element, cause);
    }

    std::size_t count(Outcome outcome) const
    {
        std::size_t n = 0;
        for (const Entry & entry : entries)
        {
            if (entry.outcome == outcome) ++n;
        }
        return n;
    }

    std::optional<Outcome> outcomeOf(const Element & element) const
    {
        for (const Entry & entry : entries)
        {
            if (entry.element == element) return entry.outcome;
        }
        return std::nullopt;
    }

    void merge(ProcessingReport && other)
    {
        entries.insert(entries.end(), other.entries.begin(), other.entries.end());
        for (ElementProcessingFailed & failure : other.failures)
        {
            failures.push_back(std::move(failure));
        }
    }
};

class AnnotationHandler
{
public:
    virtual ~AnnotationHandler() = default;

    // Fully qualified names of the annotations this handler claims; never empty
    virtual std::set<std::string> annotationsToHandle() const = 0;

    // Process the elements carrying one of the claimed annotations.
    // The iteration order of elements carries no meaning. Failures are reported per element, never thrown.
    virtual ProcessingReport process(const std::set<Element> & elements, const ResolvedEnvironment & env) = 0;
};

} // namespace Annotrace

#endif // ANNOTRACE_ANNOTATIONHANDLER_HPP
