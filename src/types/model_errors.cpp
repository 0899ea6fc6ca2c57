// src/types/model_errors.cpp

#include "model_errors.hpp"

#include <utility>

namespace roadvlm {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedResponse: return "MalformedResponse";
        case ErrorKind::InvalidEnumValue:  return "InvalidEnumValue";
        case ErrorKind::InvalidConfidence: return "InvalidConfidence";
        case ErrorKind::IncompleteOutput:  return "IncompleteOutput";
        case ErrorKind::ModelInvocation:   return "ModelInvocation";
    }
    return "Unknown";
}

ModelOutputError::ModelOutputError(ErrorKind kind, const std::string& message,
                                   std::string raw_content)
    : std::runtime_error(message), kind_(kind), raw_content_(std::move(raw_content)) {}

void ModelOutputError::attach_raw_content(const std::string& raw) {
    if (raw_content_.empty()) raw_content_ = raw;
}

std::string ModelOutputError::diagnostic() const {
    std::string out = std::string(to_string(kind_)) + ": " + what();
    if (!raw_content_.empty()) out += "\nResponse:\n" + raw_content_;
    return out;
}

// ─── variants ───────────────────────────────────

static std::string malformed_message(const std::string& expected, const std::string& got,
                                     const std::string& scope) {
    std::string msg = scope.empty() ? std::string() : scope + " response: ";
    msg += "expected " + expected + ", got " + got;
    return msg;
}

MalformedResponse::MalformedResponse(std::string expected, std::string got,
                                     std::string raw_content, std::string scope)
    : ModelOutputError(ErrorKind::MalformedResponse,
                       malformed_message(expected, got, scope), std::move(raw_content)),
      expected_(std::move(expected)),
      got_(std::move(got)),
      scope_(std::move(scope)) {}

InvalidEnumValue::InvalidEnumValue(std::string field, std::string raw_value,
                                   std::string allowed_values)
    : ModelOutputError(ErrorKind::InvalidEnumValue,
                       "invalid " + field + " value '" + raw_value +
                           "', allowed values are: " + allowed_values),
      field_(std::move(field)),
      raw_value_(std::move(raw_value)),
      allowed_values_(std::move(allowed_values)) {}

InvalidConfidence::InvalidConfidence(std::string raw_value)
    : ModelOutputError(ErrorKind::InvalidConfidence,
                       "confidence must be a number in [0,1], got '" + raw_value + "'"),
      raw_value_(std::move(raw_value)) {}

IncompleteOutput::IncompleteOutput(std::string field, const std::string& reason)
    : ModelOutputError(ErrorKind::IncompleteOutput, field + ": " + reason),
      field_(std::move(field)) {}

ModelInvocationError::ModelInvocationError(std::string stage, const std::string& cause)
    : ModelOutputError(ErrorKind::ModelInvocation,
                       "model call failed during " + stage + ": " + cause),
      stage_(std::move(stage)) {}

}  // namespace roadvlm
