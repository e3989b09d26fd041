#include <algorithm>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "polytutor/config.hpp"
#include "polytutor/metrics.hpp"
#include "polytutor/orchestrator.hpp"
#include "polytutor/service_layer.hpp"

namespace {

using namespace polytutor;

void print_usage() {
  std::cout << "polytutor - adaptive multi-agent tutor\n\n"
            << "Usage:\n"
            << "  polytutor onboard\n"
            << "  polytutor status\n"
            << "  polytutor ask -m TEXT [--user ID] [--session ID] [--level beginner|intermediate|advanced] [--json]\n"
            << "  polytutor recommend --concept NAME [--user ID] [--complexity beginner|intermediate|advanced]\n"
            << "  polytutor metrics [--json]\n"
            << "  polytutor --version\n";
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

std::string get_flag_value(const std::vector<std::string>& args, const std::string& flag,
                           const std::string& fallback = "") {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) {
      return args[i + 1];
    }
  }
  return fallback;
}

std::string mask_secret(const std::string& s) {
  if (s.empty()) {
    return "";
  }
  if (s.size() <= 6) {
    return "***";
  }
  return s.substr(0, 3) + "***" + s.substr(s.size() - 3);
}

int run_onboard() {
  const fs::path config_path = get_config_path();
  if (fs::exists(config_path)) {
    std::cout << "Config already exists: " << config_path.string() << "\n";
    return 0;
  }
  if (!save_default_config(config_path)) {
    std::cerr << "Failed to write " << config_path.string() << "\n";
    return 1;
  }
  std::cout << "Wrote default config to " << config_path.string() << "\n";
  std::cout << "Next: set service.apiKey (or $POLYTUTOR_API_KEY) and run: polytutor status\n";
  return 0;
}

int run_status() {
  const fs::path config_path = get_config_path();
  const Config cfg = load_config(config_path);

  std::cout << "polytutor status\n\n";
  std::cout << "Config: " << config_path.string() << (fs::exists(config_path) ? " [ok]" : " [missing]") << "\n";
  std::cout << "Service: " << cfg.service.base_url << "\n";
  std::cout << "AI provider: " << cfg.service.ai_provider << "\n";
  std::cout << "API key: " << (cfg.service.api_key.empty() ? "not set" : mask_secret(cfg.service.api_key)) << "\n";

  HttpServiceLayer services(cfg.service);
  try {
    const HealthStatus health = services.get_health();
    std::cout << "Health: " << health.status << "\n";
    for (const auto& kv : health.services) {
      std::cout << "  " << kv.first << ": " << (kv.second ? "up" : "down") << "\n";
    }
  } catch (const AgentError& e) {
    std::cout << "Health: unreachable (" << e.what() << ")\n";
  }

  std::cout << "Agents:\n";
  for (const AgentType t : kAllAgentTypes) {
    if (t == AgentType::kOrchestrator) {
      continue;
    }
    const AgentConfig a = cfg.agent(t);
    std::cout << "  " << agent_type_name(t) << ": " << (a.enabled ? "enabled" : "disabled") << ", "
              << a.max_concurrent_tasks << " workers, " << a.timeout_ms << "ms\n";
  }
  return 0;
}

int run_ask(const std::vector<std::string>& args) {
  const std::string text = get_flag_value(args, "-m");
  if (trim(text).empty()) {
    std::cerr << "Usage: polytutor ask -m TEXT [--user ID] [--level L] [--json]\n";
    return 1;
  }

  const Config cfg = load_config();
  apply_logging_config(cfg.logging);

  ConversationContext ctx;
  ctx.user_id = get_flag_value(args, "--user");
  ctx.session_id = get_flag_value(args, "--session", "cli");
  ctx.student_level = parse_complexity(get_flag_value(args, "--level", "intermediate"));

  auto services = std::make_shared<HttpServiceLayer>(cfg.service);
  Orchestrator orchestrator(cfg, services);
  orchestrator.initialize();

  const TutorResponse response = orchestrator.process_query(text, ctx);
  write_metrics_snapshot(orchestrator.metrics_snapshot());
  orchestrator.shutdown();

  if (has_flag(args, "--json")) {
    std::cout << to_json(response).dump(2) << "\n";
    return 0;
  }

  std::cout << response.content.text << "\n";
  if (!response.content.visualizations.empty()) {
    std::cout << "\nVisualizations: " << response.content.visualizations.size() << "\n";
  }
  if (!response.content.assessments.empty()) {
    std::cout << "\nPractice:\n";
    for (const auto& q : response.content.assessments) {
      const bool has_prompt = q.is_object() && q.contains("prompt") && q["prompt"].is_string();
      std::cout << "  - " << (has_prompt ? q["prompt"].get<std::string>() : q.dump()) << "\n";
    }
  }
  if (!response.content.videos.empty()) {
    std::cout << "\nVideos:\n";
    for (const auto& v : response.content.videos) {
      std::cout << "  - " << v.value("title", "") << " " << v.value("url", "") << "\n";
    }
  }
  if (!response.follow_up_suggestions.empty()) {
    std::cout << "\nNext: " << join(response.follow_up_suggestions, "; ") << "\n";
  }
  return 0;
}

int run_recommend(const std::vector<std::string>& args) {
  const std::string concept_name = trim(get_flag_value(args, "--concept"));
  if (concept_name.empty()) {
    std::cerr << "Usage: polytutor recommend --concept NAME [--user ID] [--complexity L]\n";
    return 1;
  }

  auto model = std::make_shared<UserModel>(get_flag_value(args, "--user", "anonymous"));
  BayesianPredictor predictor(model);

  ConceptAnalysis analysis;
  analysis.topic = concept_name;
  analysis.complexity = parse_complexity(get_flag_value(args, "--complexity", "intermediate"));
  if (const ConceptEntry* entry = find_concept(concept_name)) {
    analysis.keywords = entry->keywords;
    analysis.prerequisites = entry->prerequisites;
  }

  const Recommendation r = predictor.predict_best_modality(concept_name, analysis);
  std::cout << to_json(r).dump(2) << "\n";
  return 0;
}

int run_metrics(const std::vector<std::string>& args) {
  const bool json_out = has_flag(args, "--json");
  const std::string raw = read_text_file(default_metrics_path());
  if (json_out) {
    std::cout << (trim(raw).empty() ? "{}" : raw) << "\n";
    return 0;
  }
  std::cout << (trim(raw).empty() ? "(no metrics snapshot yet)\n" : raw + "\n");
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  {
    const char* v = std::getenv("POLYTUTOR_LOG_JSON");
    if (v && *v && std::string(v) != "0") {
      Logger::set_json(true);
    }
  }

  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (args.size() <= 1) {
    print_usage();
    return 0;
  }

  const std::string command = args[1];
  const std::vector<std::string> sub(args.begin() + 2, args.end());

  try {
    if (command == "--version" || command == "-v") {
      std::cout << "polytutor v0.1.0\n";
      return 0;
    }
    if (command == "onboard") {
      return run_onboard();
    }
    if (command == "status") {
      return run_status();
    }
    if (command == "ask") {
      return run_ask(sub);
    }
    if (command == "recommend") {
      return run_recommend(sub);
    }
    if (command == "metrics") {
      return run_metrics(sub);
    }
  } catch (const AgentError& e) {
    std::cerr << "Error [" << error_code_name(e.code()) << "]: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  print_usage();
  return 1;
}
