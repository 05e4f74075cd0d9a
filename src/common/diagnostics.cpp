#include "common/diagnostics.hpp"

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace jobhist {

std::string toDiagnosticKindString(DiagnosticKind kind)
{
    switch (kind) {
    case DiagnosticKind::MissingFile:
        return "missing_file";
    case DiagnosticKind::MalformedRecord:
        return "malformed_record";
    case DiagnosticKind::FieldCoercion:
        return "field_coercion";
    }
    return "malformed_record";
}

std::string formatDiagnostic(const Diagnostic &diagnostic)
{
    std::string text = diagnostic.path;
    if (diagnostic.location >= 0 && !text.empty()) {
        text += ":" + std::to_string(diagnostic.location);
    }
    if (!diagnostic.date.empty()) {
        text += text.empty() ? diagnostic.date : " (" + diagnostic.date + ")";
    }
    if (!text.empty()) {
        text += ": ";
    }
    return text + diagnostic.message;
}

StreamDiagnosticSink::StreamDiagnosticSink(std::ostream &out)
    : m_out(out)
{
}

void StreamDiagnosticSink::report(const Diagnostic &diagnostic)
{
    ++m_count;
    m_out << "jobhist: warning: " << formatDiagnostic(diagnostic) << std::endl;

    JLOG_WARN(QStringLiteral("Diagnostics"),
              QStringLiteral("report"),
              QString::fromStdString(toDiagnosticKindString(diagnostic.kind)),
              QStringLiteral("stream_fault"),
              (nlohmann::json{{"path", diagnostic.path},
                              {"date", diagnostic.date},
                              {"location", diagnostic.location},
                              {"message", diagnostic.message}}));
}

} // namespace jobhist
