#pragma once

#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/tool_call.h"
#include "critics/critic.h"
#include "critics/tool_selection_critic.h"

using json = nlohmann::json;

using CostMatrix = std::vector<std::vector<double>>;
using CriticList = std::vector<std::shared_ptr<const Critic>>;

// True when both argument objects carry the critic's field with a non-null value.
bool critic_applies(const Critic &critic, const json &expected_args, const json &actual_args);

// Square matrix of side max(n, m). Entry (i, j) is the score of pairing
// expected[i] with actual[j]; padding rows and columns stay zero.
CostMatrix build_cost_matrix(
		const std::vector<ExpectedToolCall> &expected,
		const std::vector<ActualToolCall> &actual,
		const ToolSelectionCritic &tool_selection,
		const CriticList &critics);
