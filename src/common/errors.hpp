#pragma once

#include <stdexcept>
#include <string>

namespace jobhist {

// Base for every error the query core raises. Setup errors reach the caller
// before any output is written; MalformedRecordError is absorbed per line.
class QueryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MalformedRecordError : public QueryError {
public:
    using QueryError::QueryError;
};

class InvalidWindowError : public QueryError {
public:
    using QueryError::QueryError;
};

class UnknownFieldError : public QueryError {
public:
    explicit UnknownFieldError(const std::string &field)
        : QueryError("unknown field '" + field + "'")
        , m_field(field)
    {
    }

    const std::string &field() const { return m_field; }

private:
    std::string m_field;
};

class InvalidLiteralError : public QueryError {
public:
    using QueryError::QueryError;
};

class FilterSyntaxError : public QueryError {
public:
    using QueryError::QueryError;
};

class UnsupportedFormatSpecifierError : public QueryError {
public:
    using QueryError::QueryError;
};

class ConfigError : public QueryError {
public:
    using QueryError::QueryError;
};

} // namespace jobhist
