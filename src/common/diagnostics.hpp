#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "common/models.hpp"

namespace jobhist {

// Non-fatal problems found while streaming (missing files, bad lines, values
// kept as raw text). Kept apart from data output.
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;
    virtual void report(const Diagnostic &diagnostic) = 0;
};

// Writes "jobhist: warning: ..." lines to a stream (stderr in the CLI) and
// mirrors every diagnostic to the event log.
class StreamDiagnosticSink : public DiagnosticSink {
public:
    explicit StreamDiagnosticSink(std::ostream &out);

    void report(const Diagnostic &diagnostic) override;
    std::size_t count() const { return m_count; }

private:
    std::ostream &m_out;
    std::size_t m_count = 0;
};

std::string toDiagnosticKindString(DiagnosticKind kind);
std::string formatDiagnostic(const Diagnostic &diagnostic);

} // namespace jobhist
