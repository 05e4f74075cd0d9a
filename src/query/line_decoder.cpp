#include "query/line_decoder.hpp"

#include <cctype>

#include "common/errors.hpp"

namespace jobhist {

namespace {

constexpr char kHeaderDelimiter = ';';

std::string trim(std::string_view value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return std::string(value.substr(start, end - start));
}

// key=value where key is [A-Za-z_][A-Za-z0-9_.]*
bool isAttributeToken(std::string_view token)
{
    if (token.empty()
        || !(std::isalpha(static_cast<unsigned char>(token.front())) || token.front() == '_')) {
        return false;
    }
    for (size_t i = 1; i < token.size(); ++i) {
        const char c = token[i];
        if (c == '=') {
            return true;
        }
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.')) {
            return false;
        }
    }
    return false;
}

void appendAttribute(RawFields &fields, std::string_view token)
{
    const size_t equals = token.find('=');
    fields.emplace_back(std::string(token.substr(0, equals)),
                        std::string(token.substr(equals + 1)));
}

// Leading free-text tokens may carry comma-separated items; key=value items
// become fields, the rest is kept as the message field.
void appendMetadata(RawFields &fields, const std::string &metadata)
{
    std::string message;
    size_t start = 0;
    while (start <= metadata.size()) {
        size_t comma = metadata.find(',', start);
        if (comma == std::string::npos) {
            comma = metadata.size();
        }
        const std::string item = trim(std::string_view(metadata).substr(start, comma - start));
        if (isAttributeToken(item)) {
            appendAttribute(fields, item);
        } else if (!item.empty()) {
            if (!message.empty()) {
                message += ", ";
            }
            message += item;
        }
        start = comma + 1;
    }
    if (!message.empty()) {
        fields.emplace_back("message", message);
    }
}

} // namespace

std::vector<std::string> tokenizeAttributes(std::string_view text)
{
    std::vector<std::string> tokens;
    std::string current;
    bool inQuotes = false;
    bool hasToken = false;

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (inQuotes) {
            if (c == '\\' && i + 1 < text.size() && text[i + 1] == '"') {
                current.push_back('"');
                ++i;
            } else if (c == '"') {
                inQuotes = false;
            } else {
                current.push_back(c);
            }
            continue;
        }

        // Quotes open a segment only at the start of a token or a value;
        // elsewhere they are literal characters.
        if (c == '"' && (!hasToken || (!current.empty() && current.back() == '='))) {
            inQuotes = true;
            hasToken = true;
            continue;
        }

        if (c == ' ' || c == '\t') {
            if (hasToken) {
                tokens.push_back(current);
                current.clear();
                hasToken = false;
            }
            continue;
        }

        current.push_back(c);
        hasToken = true;
    }

    // An unterminated quote keeps whatever was collected.
    if (hasToken) {
        tokens.push_back(current);
    }
    return tokens;
}

std::optional<std::string_view> peekTypeTag(std::string_view line)
{
    const size_t first = line.find(kHeaderDelimiter);
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    const size_t second = line.find(kHeaderDelimiter, first + 1);
    if (second == std::string_view::npos) {
        return std::nullopt;
    }
    return line.substr(first + 1, second - first - 1);
}

std::optional<DecodedLine> decodeLine(std::string_view line)
{
    const size_t first = line.find(kHeaderDelimiter);
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    const size_t second = line.find(kHeaderDelimiter, first + 1);
    if (second == std::string_view::npos) {
        return std::nullopt;
    }
    const size_t third = line.find(kHeaderDelimiter, second + 1);

    DecodedLine decoded;
    decoded.timestamp = trim(line.substr(0, first));
    decoded.typeTag = trim(line.substr(first + 1, second - first - 1));
    if (third == std::string_view::npos) {
        decoded.jobId = trim(line.substr(second + 1));
        return decoded;
    }
    decoded.jobId = trim(line.substr(second + 1, third - second - 1));

    const std::vector<std::string> tokens = tokenizeAttributes(line.substr(third + 1));

    std::string metadata;
    size_t index = 0;
    for (; index < tokens.size() && !isAttributeToken(tokens[index]); ++index) {
        if (!metadata.empty()) {
            metadata += ' ';
        }
        metadata += tokens[index];
    }
    appendMetadata(decoded.fields, metadata);

    for (; index < tokens.size(); ++index) {
        const std::string &token = tokens[index];
        if (isAttributeToken(token)) {
            appendAttribute(decoded.fields, token);
        } else {
            // Stray unquoted word: it belongs to the preceding value.
            decoded.fields.back().second += ' ' + token;
        }
    }
    return decoded;
}

Record decodeRecord(std::string_view line,
                    DiagnosticSink *diagnostics,
                    const Diagnostic &origin)
{
    const auto decoded = decodeLine(line);
    if (!decoded.has_value()) {
        throw MalformedRecordError("missing timestamp;type;job id header");
    }
    return makeRecord(decoded->typeTag, decoded->timestamp, decoded->jobId,
                      decoded->fields, diagnostics, origin);
}

} // namespace jobhist
