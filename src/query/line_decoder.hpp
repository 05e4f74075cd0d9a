#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/models.hpp"
#include "query/record_model.hpp"

namespace jobhist {

class DiagnosticSink;

// Columns of one accounting line:
//   MM/DD/YYYY HH:MM:SS;<tag>;<job id>;key=value key="quoted value" ...
struct DecodedLine {
    std::string timestamp;
    std::string typeTag;
    std::string jobId;
    RawFields fields;
};

// Pure split of a raw line. Returns nullopt when the semicolon header is
// incomplete. Does not validate values; makeRecord() does that.
std::optional<DecodedLine> decodeLine(std::string_view line);

// Tag column only, without touching the attribute list.
std::optional<std::string_view> peekTypeTag(std::string_view line);

// Space-separated tokens; double-quoted segments keep their spaces and lose
// the quotes. A quote inside an unquoted value is an ordinary character.
std::vector<std::string> tokenizeAttributes(std::string_view text);

// decodeLine() + makeRecord(). Throws MalformedRecordError.
Record decodeRecord(std::string_view line,
                    DiagnosticSink *diagnostics = nullptr,
                    const Diagnostic &origin = {});

} // namespace jobhist
