#include "llm/llama_engine.h"
#include "llama.h"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

LlamaEngine::LlamaEngine(const LlamaConfig &config)
		: config_(config), model_(nullptr), ctx_(nullptr), sampler_(nullptr)
{
}

LlamaEngine::~LlamaEngine()
{
	unload();
}

bool LlamaEngine::load()
{
	if (is_loaded())
		return true;

	std::cerr << "[LlamaEngine] Loading model: " << config_.model_path << "\n";

	llama_backend_init();

	if (!config_.verbose)
	{
		llama_log_set([](ggml_log_level, const char *, void *) {}, nullptr);
	}

	llama_model_params model_params = llama_model_default_params();
	model_params.use_mmap = config_.use_mmap;
	model_params.use_mlock = config_.use_mlock;

	model_ = llama_load_model_from_file(config_.model_path.c_str(), model_params);
	if (!model_)
	{
		std::cerr << "[LlamaEngine] Failed to load model: " << config_.model_path << "\n";
		return false;
	}

	init_sampler();

	std::cerr << "[LlamaEngine] Model loaded: " << model_name() << "\n";
	return true;
}

void LlamaEngine::unload()
{
	if (sampler_)
	{
		llama_sampler_free(sampler_);
		sampler_ = nullptr;
	}

	if (ctx_)
	{
		llama_free(ctx_);
		ctx_ = nullptr;
	}

	if (model_)
	{
		llama_free_model(model_);
		model_ = nullptr;
		llama_backend_free();
	}
}

void LlamaEngine::reset_context()
{
	// Every case starts from an empty KV cache.
	if (ctx_)
	{
		llama_free(ctx_);
		ctx_ = nullptr;
	}

	llama_context_params ctx_params = llama_context_default_params();
	ctx_params.n_ctx = config_.n_ctx;
	ctx_params.n_batch = config_.n_batch;
	ctx_params.n_ubatch = config_.n_ubatch;
	ctx_params.n_threads = config_.n_threads;
	ctx_params.n_threads_batch = config_.n_threads_batch;

	ctx_ = llama_new_context_with_model(model_, ctx_params);
	if (!ctx_)
	{
		throw std::runtime_error("Failed to create llama context");
	}
}

void LlamaEngine::init_sampler()
{
	if (sampler_)
		llama_sampler_free(sampler_);

	sampler_ = llama_sampler_chain_init(llama_sampler_chain_default_params());

	if (config_.temperature <= 0.0f)
	{
		llama_sampler_chain_add(sampler_, llama_sampler_init_greedy());
		return;
	}

	llama_sampler_chain_add(sampler_, llama_sampler_init_top_k(config_.top_k));
	llama_sampler_chain_add(sampler_, llama_sampler_init_top_p(config_.top_p, 1));
	llama_sampler_chain_add(sampler_, llama_sampler_init_temp(config_.temperature));
	llama_sampler_chain_add(sampler_, llama_sampler_init_dist(config_.seed));
}

std::vector<int> LlamaEngine::tokenize(const std::string &text, bool add_bos)
{
	const llama_vocab *vocab = llama_model_get_vocab(model_);

	std::vector<int> tokens(text.length() + (add_bos ? 1 : 0) + 1);
	int n_tokens = llama_tokenize(vocab, text.c_str(), text.length(), tokens.data(), tokens.size(), add_bos, false);

	if (n_tokens < 0)
	{
		tokens.resize(-n_tokens);
		n_tokens = llama_tokenize(vocab, text.c_str(), text.length(), tokens.data(), tokens.size(), add_bos, false);
	}

	if (n_tokens < 0)
	{
		throw std::runtime_error("Failed to tokenize prompt");
	}

	tokens.resize(n_tokens);
	return tokens;
}

bool LlamaEngine::check_stop_sequence(const std::string &text) const
{
	for (const auto &stop : config_.stop_sequences)
	{
		if (!stop.empty() && text.length() >= stop.length() &&
				text.compare(text.length() - stop.length(), stop.length(), stop) == 0)
			return true;
	}
	return false;
}

GenerateResult LlamaEngine::generate(const std::string &prompt, int max_tokens)
{
	if (!model_)
	{
		throw std::runtime_error("Model not loaded");
	}

	reset_context();
	llama_sampler_reset(sampler_);

	GenerateResult result;
	result.stop_reason = "length";
	int max_gen = max_tokens > 0 ? max_tokens : config_.max_tokens;

	auto tokens = tokenize(prompt, true);
	if (static_cast<int>(tokens.size()) >= config_.n_ctx)
	{
		throw std::runtime_error("Prompt of " + std::to_string(tokens.size()) + " tokens exceeds the context size");
	}

	auto start_time = std::chrono::steady_clock::now();

	for (size_t i = 0; i < tokens.size(); i += config_.n_batch)
	{
		size_t n_eval = std::min(static_cast<size_t>(config_.n_batch), tokens.size() - i);
		if (llama_decode(ctx_, llama_batch_get_one(&tokens[i], n_eval)))
		{
			throw std::runtime_error("Failed to evaluate prompt");
		}
	}

	const llama_vocab *vocab = llama_model_get_vocab(model_);

	for (int i = 0; i < max_gen; ++i)
	{
		int token = llama_sampler_sample(sampler_, ctx_, -1);

		if (llama_vocab_is_eog(vocab, token))
		{
			result.stop_reason = "eos";
			break;
		}

		char buf[128];
		int n = llama_token_to_piece(vocab, token, buf, sizeof(buf), 0, false);
		if (n > 0)
			result.text.append(buf, n);
		result.tokens_generated++;

		if (check_stop_sequence(result.text))
		{
			result.stop_reason = "stop_sequence";
			break;
		}

		if (llama_decode(ctx_, llama_batch_get_one(&token, 1)))
		{
			throw std::runtime_error("Failed to evaluate token");
		}
	}

	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);
	if (elapsed.count() > 0)
		result.tokens_per_second = result.tokens_generated / (elapsed.count() / 1000.0f);

	if (config_.verbose)
	{
		std::cerr << "[LlamaEngine] Generated " << result.tokens_generated
							<< " tokens in " << elapsed.count() << "ms"
							<< " (" << result.tokens_per_second << " t/s, " << result.stop_reason << ")\n";
	}

	return result;
}

std::string LlamaEngine::build_chat_prompt(const std::vector<json> &messages, const json &tools) const
{
	std::ostringstream oss;

	oss << config_.system_prompt << "\n\nAvailable tools:\n";
	for (const auto &tool : tools)
	{
		const json &fn = tool.contains("function") ? tool["function"] : tool;
		oss << "- " << fn.value("name", "") << ": " << fn.value("description", "")
				<< "\n  parameters: " << fn.value("parameters", json::object()).dump() << "\n";
	}
	oss << "\n";

	for (const auto &msg : messages)
	{
		std::string role = msg.value("role", "user");
		std::string content = msg.value("content", "");

		if (role == "system")
			oss << "System: " << content << "\n\n";
		else if (role == "user")
			oss << "User: " << content << "\n\n";
		else if (role == "assistant")
			oss << "Assistant: " << content << "\n\n";
		else if (role == "tool")
			oss << "Tool result: " << content << "\n\n";
	}

	oss << "Assistant:";
	return oss.str();
}

GenerateResult LlamaEngine::chat(const std::vector<json> &messages, const json &tools)
{
	return generate(build_chat_prompt(messages, tools));
}

std::string LlamaEngine::model_name() const
{
	if (!model_)
		return "not loaded";

	char buf[256];
	llama_model_desc(model_, buf, sizeof(buf));
	return std::string(buf);
}

int LlamaEngine::context_size() const
{
	return config_.n_ctx;
}
