/**
 * recchain-cli — Run a chain of record stages over JSON lines.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/recchain_cli [--config path] [--input path|-] [--output path] [--trace]
 *            stage [args...] [| stage [args...]]...
 * Example: recchain_cli --input data.jsonl fromjson '|' grep '{{active}}' '|' totable
 */

#include <recchain/app/config.hpp>
#include <recchain/app/pipeline_runner.hpp>
#include <recchain/core/chain.hpp>
#include <recchain/core/error.hpp>
#include <recchain/core/input.hpp>
#include <recchain/core/pipeline_spec.hpp>
#include <recchain/stages/builtin_stages.hpp>

#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::string_view trace_event_str(recchain::core::TraceEvent e) {
  switch (e) {
  case recchain::core::TraceEvent::Line:
    return "line";
  case recchain::core::TraceEvent::Record:
    return "record";
  case recchain::core::TraceEvent::Finish:
    return "finish";
  default:
    return "unknown";
  }
}

/// Splits "a x | b y z" into stage calls; '|' must be its own word.
recchain::core::PipelineSpec build_spec(const std::vector<std::string> &words) {
  recchain::core::PipelineSpec spec;
  std::string name;
  std::vector<recchain::core::Arg> args;
  auto flush = [&]() {
    if (!name.empty()) spec = spec.call(name, std::move(args));
    name.clear();
    args.clear();
  };
  for (const auto &word : words) {
    if (word == "|") {
      flush();
    } else if (name.empty()) {
      name = word;
    } else {
      args.emplace_back(word);
    }
  }
  flush();
  return spec;
}

void print_usage(const recchain::core::StageCatalog &catalog) {
  std::cout << "Usage: recchain_cli [options] stage [args...] [| stage [args...]]...\n"
            << "  --config <path>   Runner config (key=value file); default: built-in\n"
            << "  --input <path>    Read input lines from file; '-' or omitted = stdin\n"
            << "  --output <path>   Write output lines to file (default: stdout)\n"
            << "  --trace           Print stage events to stderr\n"
            << "\nStages:";
  for (const auto &name : catalog.names()) {
    std::cout << ' ' << name;
  }
  std::cout << "\n";
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::string input_path;
  std::string output_path;
  bool trace = false;
  std::vector<std::string> words;

  const recchain::core::StageCatalog catalog = recchain::stages::make_builtin_catalog();

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (!words.empty()) {
      words.push_back(arg);
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      output_path = argv[++i];
    } else if (arg == "--trace") {
      trace = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage(catalog);
      return 0;
    } else {
      words.push_back(arg);
    }
  }

  recchain::app::RunnerConfig cfg = recchain::app::default_config();
  if (!config_path.empty()) {
    auto loaded = recchain::app::load_config(config_path);
    if (!loaded) {
      std::cerr << "Config error: " << loaded.error().message << "\n";
      return 1;
    }
    cfg = std::move(*loaded);
  }
  trace = trace || cfg.trace;

  const recchain::core::PipelineSpec spec = build_spec(words);
  if (spec.is_empty()) {
    print_usage(catalog);
    return 1;
  }

  std::ifstream input_file;
  recchain::app::RunParams params;
  if (input_path.empty() || input_path == "-") {
    params.input = recchain::core::Input::from_stream(std::cin);
  } else {
    input_file.open(input_path);
    if (!input_file) {
      std::cerr << "Failed to open input: " << input_path << "\n";
      return 1;
    }
    params.input = recchain::core::Input::from_stream(input_file, input_path);
  }

  std::ofstream output_file;
  if (output_path.empty()) {
    params.output = &std::cout;
  } else {
    output_file.open(output_path);
    if (!output_file) {
      std::cerr << "Failed to open output: " << output_path << "\n";
      return 1;
    }
    params.output = &output_file;
  }

  recchain::app::StageTraceCallback trace_cb =
      [](std::size_t index, std::string_view name, recchain::core::TraceEvent event) {
        std::cerr << "[trace] stage " << index << " (" << name << "): "
                  << trace_event_str(event) << "\n";
      };
  if (trace) params.trace_cb = &trace_cb;

  recchain::app::PipelineRunner runner(catalog, cfg);
  auto result = runner.run(spec, std::move(params));

  if (!result) {
    std::cerr << "Pipeline error (" << recchain::core::to_string(result.error().code)
              << "): " << result.error().message << "\n";
    return 1;
  }
  return 0;
}
