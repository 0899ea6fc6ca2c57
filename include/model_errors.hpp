// include/model_errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace roadvlm {

enum class ErrorKind {
    MalformedResponse,
    InvalidEnumValue,
    InvalidConfidence,
    IncompleteOutput,
    ModelInvocation
};

const char* to_string(ErrorKind kind);

// Base of every error raised by the parsing core. The raw model response is
// kept so a diagnostic can be rebuilt without parsing again.
class ModelOutputError : public std::runtime_error {
public:
    ModelOutputError(ErrorKind kind, const std::string& message,
                     std::string raw_content = {});

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& raw_content() const noexcept { return raw_content_; }

    // Validators throw without the response text; parsers fill it in before
    // rethrowing. An already attached text is never replaced.
    void attach_raw_content(const std::string& raw);

    // what() followed by the raw response, if any.
    std::string diagnostic() const;

private:
    ErrorKind   kind_;
    std::string raw_content_;
};

// Any failure of the parsing layer is reported through this type.
using ResponseParsingError = ModelOutputError;

// Wrong shape: line count, line pattern, unparsable JSON, missing key.
class MalformedResponse : public ModelOutputError {
public:
    MalformedResponse(std::string expected, std::string got,
                      std::string raw_content = {}, std::string scope = {});

    const std::string& expected() const noexcept { return expected_; }
    const std::string& got() const noexcept { return got_; }
    // sub-query the failure belongs to ("action", "context", "direction"),
    // empty for single-response grammars
    const std::string& scope() const noexcept { return scope_; }

private:
    std::string expected_;
    std::string got_;
    std::string scope_;
};

class InvalidEnumValue : public ModelOutputError {
public:
    InvalidEnumValue(std::string field, std::string raw_value,
                     std::string allowed_values);

    const std::string& field() const noexcept { return field_; }
    const std::string& raw_value() const noexcept { return raw_value_; }
    const std::string& allowed_values() const noexcept { return allowed_values_; }

private:
    std::string field_;
    std::string raw_value_;
    std::string allowed_values_;
};

class InvalidConfidence : public ModelOutputError {
public:
    explicit InvalidConfidence(std::string raw_value);

    const std::string& raw_value() const noexcept { return raw_value_; }

private:
    std::string raw_value_;
};

// Raised while assembling the aggregate result.
class IncompleteOutput : public ModelOutputError {
public:
    IncompleteOutput(std::string field, const std::string& reason);

    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

// The external model call failed; `stage` names the query that was running.
class ModelInvocationError : public ModelOutputError {
public:
    ModelInvocationError(std::string stage, const std::string& cause);

    const std::string& stage() const noexcept { return stage_; }

private:
    std::string stage_;
};

}  // namespace roadvlm
