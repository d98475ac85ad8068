#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "llm/llama_config.h"

// Forward declarations from llama.cpp
struct llama_model;
struct llama_context;
struct llama_sampler;

using json = nlohmann::json;

struct GenerateResult
{
	std::string text;
	int tokens_generated = 0;
	float tokens_per_second = 0.0f;
	std::string stop_reason;
};

class LlamaEngine
{
public:
	explicit LlamaEngine(const LlamaConfig &config);
	~LlamaEngine();

	LlamaEngine(const LlamaEngine &) = delete;
	LlamaEngine &operator=(const LlamaEngine &) = delete;

	bool load();
	void unload();
	bool is_loaded() const { return model_ != nullptr; }

	// Throws std::runtime_error when the model is missing or decoding fails.
	GenerateResult generate(const std::string &prompt, int max_tokens = -1);

	// Renders the conversation and the available tools into a prompt.
	GenerateResult chat(const std::vector<json> &messages, const json &tools);

	std::string build_chat_prompt(const std::vector<json> &messages, const json &tools) const;

	std::string model_name() const;
	int context_size() const;

private:
	LlamaConfig config_;
	llama_model *model_;
	llama_context *ctx_;
	llama_sampler *sampler_;

	void reset_context();
	void init_sampler();
	std::vector<int> tokenize(const std::string &text, bool add_bos = true);
	bool check_stop_sequence(const std::string &text) const;
};
