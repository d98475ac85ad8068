#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "actor/actor.h"
#include "llm/llama_config.h"
#include "llm/llama_engine.h"

// Runs cases against local GGUF models. The model argument of predict() is
// the model path; engines are loaded on first use and kept for the run.
class LlamaActor : public Actor
{
public:
	explicit LlamaActor(LlamaConfig base_config);

	std::vector<ActualToolCall> predict(
			const std::string &model,
			const std::vector<json> &messages,
			const json &tools) override;

private:
	struct Slot
	{
		std::mutex mutex;
		std::unique_ptr<LlamaEngine> engine;
	};

	LlamaConfig base_config_;
	std::mutex slots_mutex_;
	std::map<std::string, std::unique_ptr<Slot>> slots_;

	Slot &slot_for(const std::string &model);
};
