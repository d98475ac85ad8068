#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "critics/similarity_metric.h"
#include "eval/eval_suite.h"

using json = nlohmann::json;

// Builds a critic from {"type": "binary"|"numeric"|"similarity", "field", "weight", ...}.
std::shared_ptr<const Critic> make_critic(
		const json &spec,
		const std::shared_ptr<const SimilarityMetricRegistry> &metrics);

// Builds a suite from its JSON definition. Throws ValidationError naming the
// offending case or field.
EvalSuite load_suite(
		const json &definition,
		std::shared_ptr<const SimilarityMetricRegistry> metrics = SimilarityMetricRegistry::with_defaults());

EvalSuite load_suite_file(
		const std::string &path,
		std::shared_ptr<const SimilarityMetricRegistry> metrics = SimilarityMetricRegistry::with_defaults());
