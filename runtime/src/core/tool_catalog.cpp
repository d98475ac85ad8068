#include "core/tool_catalog.h"
#include "core/error.h"

void ToolCatalog::register_tool(ToolDefinition tool)
{
	if (tool.name.empty())
	{
		throw ValidationError("tool definition must have a name");
	}
	std::string name = tool.name;
	tools_[name] = std::move(tool);
}

bool ToolCatalog::has(const std::string &name) const
{
	return tools_.count(name) > 0;
}

const ToolDefinition *ToolCatalog::find(const std::string &name) const
{
	auto it = tools_.find(name);
	if (it == tools_.end())
		return nullptr;
	return &it->second;
}

std::optional<ArgumentError> ToolCatalog::validate(const std::string &name, json &arguments) const
{
	const ToolDefinition *tool = find(name);
	if (!tool)
	{
		return ArgumentError{"$", "tool not found: " + name};
	}

	return ArgumentValidator::validate(arguments, tool->parameters);
}

void ToolCatalog::apply_defaults(ActualToolCall &call) const
{
	const ToolDefinition *tool = find(call.name);
	if (!tool)
		return;

	ArgumentValidator::apply_defaults(call.args, tool->parameters);
}

json ToolCatalog::list() const
{
	json tools = json::array();

	for (const auto &[_, tool] : tools_)
	{
		tools.push_back({{"type", "function"},
										 {"function", {{"name", tool.name}, {"description", tool.description}, {"parameters", tool.parameters}}}});
	}

	return tools;
}
