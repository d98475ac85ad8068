#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <optional>

using json = nlohmann::json;

// First problem found in a set of arguments. field is a path such as
// "recipient.address" or "attachments[2]"; "$" names the arguments object.
struct ArgumentError
{
	std::string field;
	std::string message;
};

// Checks tool arguments against the JSON-schema subset used by tool
// definitions: type, required, properties, enum, items, minimum, maximum.
class ArgumentValidator
{
public:
	// Fills in defaults before checking, so args is modified.
	static std::optional<ArgumentError>
	validate(json &args, const json &schema);

	// Recurses into nested object properties.
	static void apply_defaults(json &args, const json &schema);

private:
	static std::optional<ArgumentError>
	check_value(const json &value, const json &schema, const std::string &path);

	static std::optional<ArgumentError>
	check_object(const json &object, const json &schema, const std::string &path);
};
