#include "critics/critic.h"
#include "core/error.h"

#include <cmath>

std::string to_string(CriticKind kind)
{
	switch (kind)
	{
	case CriticKind::BINARY:
		return "binary";
	case CriticKind::NUMERIC:
		return "numeric";
	case CriticKind::SIMILARITY:
		return "similarity";
	case CriticKind::TOOL_SELECTION:
		return "tool_selection";
	}
	return "unknown";
}

Critic::Critic(std::string field, double weight)
		: field_(std::move(field)), weight_(weight)
{
	if (field_.empty())
	{
		throw ValidationError("critic field must not be empty");
	}

	if (!std::isfinite(weight_) || weight_ <= 0.0 || weight_ > 1.0)
	{
		throw ValidationError("critic weight for '" + field_ + "' must be in (0, 1], got " + std::to_string(weight_));
	}
}

json Critic::describe() const
{
	return {
			{"type", to_string(kind())},
			{"field", field_},
			{"weight", weight_}};
}
