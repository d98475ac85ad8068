#include "actor/llama_actor.h"
#include "actor/tool_call_parser.h"
#include <iostream>
#include <stdexcept>

LlamaActor::LlamaActor(LlamaConfig base_config)
		: base_config_(std::move(base_config))
{
}

LlamaActor::Slot &LlamaActor::slot_for(const std::string &model)
{
	std::lock_guard<std::mutex> lock(slots_mutex_);

	auto &slot = slots_[model];
	if (!slot)
		slot = std::make_unique<Slot>();
	return *slot;
}

std::vector<ActualToolCall> LlamaActor::predict(
		const std::string &model,
		const std::vector<json> &messages,
		const json &tools)
{
	Slot &slot = slot_for(model);

	// llama contexts are single-threaded; cases for one model queue here
	std::lock_guard<std::mutex> lock(slot.mutex);

	if (!slot.engine)
	{
		LlamaConfig config = base_config_;
		config.model_path = model;

		auto engine = std::make_unique<LlamaEngine>(config);
		if (!engine->load())
		{
			throw std::runtime_error("failed to load model: " + model);
		}
		slot.engine = std::move(engine);
	}

	GenerateResult result = slot.engine->chat(messages, tools);

	if (base_config_.verbose)
	{
		std::cerr << "[LlamaActor] Raw output:\n"
							<< result.text << "\n";
	}

	return ToolCallParser::from_text(result.text);
}
