#include "actor/tool_call_parser.h"
#include "core/error.h"

json ToolCallParser::parse_arguments(const json &arguments)
{
	if (arguments.is_object())
		return arguments;

	if (arguments.is_string())
	{
		const std::string &raw = arguments.get_ref<const std::string &>();
		if (raw.empty())
			return json::object();

		json parsed = json::parse(raw, nullptr, false);
		if (parsed.is_object())
			return parsed;

		throw EvalError(ErrorCode::INVALID_REQUEST, "tool call arguments are not a JSON object: " + raw);
	}

	if (arguments.is_null())
		return json::object();

	throw EvalError(ErrorCode::INVALID_REQUEST, "tool call arguments must be an object");
}

bool ToolCallParser::to_call(const json &object, ActualToolCall &call)
{
	if (!object.is_object())
		return false;

	// {"function": {"name": ..., "arguments": ...}}
	if (object.contains("function") && object["function"].is_object())
		return to_call(object["function"], call);

	const json *name = nullptr;
	if (object.contains("tool") && object["tool"].is_string())
		name = &object["tool"];
	else if (object.contains("name") && object["name"].is_string())
		name = &object["name"];

	if (!name || !object.contains("arguments"))
		return false;

	call.name = name->get<std::string>();
	call.args = parse_arguments(object["arguments"]);
	return true;
}

std::vector<ActualToolCall> ToolCallParser::from_message(const json &message)
{
	std::vector<ActualToolCall> calls;

	if (!message.is_object() || !message.contains("tool_calls") || message["tool_calls"].is_null())
		return calls;

	if (!message["tool_calls"].is_array())
	{
		throw EvalError(ErrorCode::INVALID_REQUEST, "tool_calls must be an array");
	}

	for (const auto &entry : message["tool_calls"])
	{
		ActualToolCall call;
		if (!to_call(entry, call))
		{
			throw EvalError(ErrorCode::INVALID_REQUEST, "tool call entry must contain a function name and arguments");
		}
		calls.push_back(std::move(call));
	}

	return calls;
}

// Returns the index just past the brace closing the object opened at start,
// or npos when the object is not terminated.
static size_t find_object_end(const std::string &text, size_t start)
{
	int depth = 0;
	bool in_string = false;
	bool escaped = false;

	for (size_t i = start; i < text.size(); ++i)
	{
		char c = text[i];

		if (in_string)
		{
			if (escaped)
				escaped = false;
			else if (c == '\\')
				escaped = true;
			else if (c == '"')
				in_string = false;
			continue;
		}

		if (c == '"')
			in_string = true;
		else if (c == '{')
			++depth;
		else if (c == '}' && --depth == 0)
			return i + 1;
	}

	return std::string::npos;
}

std::vector<ActualToolCall> ToolCallParser::from_text(const std::string &text)
{
	std::vector<ActualToolCall> calls;
	size_t pos = text.find('{');

	while (pos != std::string::npos)
	{
		size_t end = find_object_end(text, pos);
		if (end == std::string::npos)
			break;

		json candidate = json::parse(text.begin() + pos, text.begin() + end, nullptr, false);
		ActualToolCall call;

		if (!candidate.is_discarded() && candidate.contains("tool_calls"))
		{
			for (auto &parsed : from_message(candidate))
				calls.push_back(std::move(parsed));
			pos = text.find('{', end);
		}
		else if (!candidate.is_discarded() && to_call(candidate, call))
		{
			calls.push_back(std::move(call));
			pos = text.find('{', end);
		}
		else
		{
			// not a tool call; look for one nested inside
			pos = text.find('{', pos + 1);
		}
	}

	return calls;
}
