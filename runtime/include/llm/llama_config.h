#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct LlamaConfig
{
	// Model path
	std::string model_path;

	// CPU optimization
	int n_threads = 4;
	int n_threads_batch = 4;

	// Context and memory
	int n_ctx = 4096;
	int n_batch = 512;
	int n_ubatch = 512;
	bool use_mmap = true;
	bool use_mlock = false;

	// Generation defaults. Temperature 0 samples greedily so repeated
	// evaluation runs see the same tool calls.
	int max_tokens = 512;
	float temperature = 0.0f;
	float top_p = 0.9f;
	int top_k = 40;
	uint32_t seed = 42;

	std::vector<std::string> stop_sequences = {"\nUser:", "###"};

	// Instructions placed ahead of the tool list
	std::string system_prompt =
			"You are being evaluated on choosing the right tools. "
			"Reply only with tool calls, one JSON object per call, in this format:\n"
			"{\"tool\":\"tool_name\",\"arguments\":{...}}";

	// Logging
	bool verbose = false;

	static LlamaConfig from_file(const std::string &path);
	void save_to_file(const std::string &path) const;
};
