#pragma once
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class ErrorCode
{
	INVALID_REQUEST,
	VALIDATION_ERROR,
	CONFIGURATION_ERROR,
	ASSIGNMENT_ERROR,
	UNKNOWN_TOOL,
	ACTOR_FAILED,
	INTERNAL_ERROR
};

inline std::string to_string(ErrorCode code)
{
	switch (code)
	{
	case ErrorCode::INVALID_REQUEST:
		return "INVALID_REQUEST";
	case ErrorCode::VALIDATION_ERROR:
		return "VALIDATION_ERROR";
	case ErrorCode::CONFIGURATION_ERROR:
		return "CONFIGURATION_ERROR";
	case ErrorCode::ASSIGNMENT_ERROR:
		return "ASSIGNMENT_ERROR";
	case ErrorCode::UNKNOWN_TOOL:
		return "UNKNOWN_TOOL";
	case ErrorCode::ACTOR_FAILED:
		return "ACTOR_FAILED";
	default:
		return "INTERNAL_ERROR";
	}
}

inline json make_error(
		ErrorCode code,
		const std::string &message,
		const std::string &field = "",
		const std::string &tool = "")
{
	json err = {
			{"code", to_string(code)},
			{"message", message}};

	if (!field.empty())
		err["field"] = field;
	if (!tool.empty())
		err["tool"] = tool;

	return err;
}

class EvalError : public std::runtime_error
{
public:
	EvalError(ErrorCode code, const std::string &message)
			: std::runtime_error(message), code_(code) {}

	ErrorCode code() const { return code_; }

private:
	ErrorCode code_;
};

// Invalid case, critic or rubric configuration, raised at construction time.
class ValidationError : public EvalError
{
public:
	explicit ValidationError(const std::string &message)
			: EvalError(ErrorCode::VALIDATION_ERROR, message) {}
};

// A critic cannot run with its own configuration, raised from evaluate().
class ConfigurationError : public EvalError
{
public:
	explicit ConfigurationError(const std::string &message)
			: EvalError(ErrorCode::CONFIGURATION_ERROR, message) {}
};

// Malformed cost matrix handed to the solver. Never expected at runtime.
class AssignmentError : public EvalError
{
public:
	explicit AssignmentError(const std::string &message)
			: EvalError(ErrorCode::ASSIGNMENT_ERROR, message) {}
};
