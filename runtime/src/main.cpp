#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <getopt.h>
#include "actor/llama_actor.h"
#include "core/error.h"
#include "eval/suite_loader.h"
#include "llm/llama_config.h"

struct EvalRunConfig
{
	std::string suite_path;
	std::string output_path;
	std::vector<std::string> models;
	size_t max_concurrency = 0;
	bool verbose = false;
};

void print_usage(const char *prog)
{
	std::cout << "Usage: " << prog << " [OPTIONS]\n\n"
						<< "Options:\n"
						<< "  -s, --suite PATH       Suite definition JSON file (required)\n"
						<< "  -m, --model PATH       GGUF model to evaluate, repeatable (required)\n"
						<< "  -c, --config PATH      Path to llama config JSON file\n"
						<< "  -j, --jobs N           Cases run at once (default: from suite)\n"
						<< "  -o, --output PATH      Write the JSON report here instead of stdout\n"
						<< "  -v, --verbose          Enable verbose logging\n"
						<< "  -h, --help             Show this help\n\n"
						<< "Example:\n"
						<< "  " << prog << " --suite evals/email.json --model models/llama-3.2-3b-q4.gguf\n";
}

int main(int argc, char **argv)
{
	LlamaConfig llm_config;
	EvalRunConfig run_config;
	std::string config_file;

	static struct option long_options[] = {
			{"suite", required_argument, 0, 's'},
			{"model", required_argument, 0, 'm'},
			{"config", required_argument, 0, 'c'},
			{"jobs", required_argument, 0, 'j'},
			{"output", required_argument, 0, 'o'},
			{"verbose", no_argument, 0, 'v'},
			{"help", no_argument, 0, 'h'},
			{0, 0, 0, 0}};

	int opt;
	int option_index = 0;

	while ((opt = getopt_long(argc, argv, "s:m:c:j:o:vh", long_options, &option_index)) != -1)
	{
		switch (opt)
		{
		case 's':
			run_config.suite_path = optarg;
			break;
		case 'm':
			run_config.models.push_back(optarg);
			break;
		case 'c':
			config_file = optarg;
			break;
		case 'j':
			run_config.max_concurrency = static_cast<size_t>(std::max(1, std::atoi(optarg)));
			break;
		case 'o':
			run_config.output_path = optarg;
			break;
		case 'v':
			run_config.verbose = true;
			break;
		case 'h':
			print_usage(argv[0]);
			return 0;
		default:
			print_usage(argv[0]);
			return 1;
		}
	}

	if (!config_file.empty())
	{
		try
		{
			llm_config = LlamaConfig::from_file(config_file);
			std::cerr << "[forge-eval] Loaded config from: " << config_file << "\n";
		}
		catch (const std::exception &e)
		{
			std::cerr << "[ERROR] Failed to load config: " << e.what() << "\n";
			return 1;
		}
	}

	llm_config.verbose = llm_config.verbose || run_config.verbose;
	if (run_config.models.empty() && !llm_config.model_path.empty())
		run_config.models.push_back(llm_config.model_path);

	if (run_config.suite_path.empty() || run_config.models.empty())
	{
		std::cerr << "[ERROR] A suite and at least one model are required\n\n";
		print_usage(argv[0]);
		return 1;
	}

	try
	{
		EvalSuite suite = load_suite_file(run_config.suite_path);
		std::cerr << "[forge-eval] Loaded suite '" << suite.name() << "' with "
							<< suite.cases().size() << " case(s), " << suite.catalog().size() << " tool(s)\n";

		if (run_config.max_concurrency > 0)
			suite.set_max_concurrency(run_config.max_concurrency);
		suite.set_verbose(run_config.verbose);

		LlamaActor actor(llm_config);
		std::vector<ModelReport> reports = suite.run(actor, run_config.models);

		json report = {{"suite", suite.name()}, {"results", reports}};
		// Model output may carry invalid UTF-8; keep the report writable.
		const std::string report_text = report.dump(2, ' ', false, json::error_handler_t::replace);

		if (run_config.output_path.empty())
		{
			std::cout << report_text << "\n";
		}
		else
		{
			std::ofstream out(run_config.output_path);
			if (!out.is_open())
			{
				std::cerr << "[ERROR] Cannot write report: " << run_config.output_path << "\n";
				return 1;
			}
			out << report_text << "\n";
			std::cerr << "[forge-eval] Report written to: " << run_config.output_path << "\n";
		}

		bool any_failed = false;
		for (const auto &model_report : reports)
		{
			size_t failed = model_report.count(Classification::FAIL);
			any_failed = any_failed || failed > 0;

			std::cerr << "[forge-eval] " << model_report.model << ": "
								<< model_report.count(Classification::PASS) << " passed, "
								<< model_report.count(Classification::WARN) << " warned, "
								<< failed << " failed (mean score " << model_report.mean_score() << ")\n";
		}

		return any_failed ? 1 : 0;
	}
	catch (const ValidationError &e)
	{
		std::cerr << "[ERROR] Invalid suite: " << e.what() << "\n";
		return 1;
	}
	catch (const std::exception &e)
	{
		std::cerr << "\n[FATAL ERROR] " << e.what() << "\n";
		return 1;
	}
}
