#include <cstdlib>
#include <string>

#include "polytutor/config.hpp"
#include "test_support.hpp"

using namespace polytutor;

namespace {

fs::path temp_path(const std::string& name) {
  return fs::temp_directory_path() / ("polytutor_test_" + std::to_string(now_ms()) + "_" + name);
}

int test_defaults_match_document() {
  const Config cfg = parse_config(default_config_json());
  EXPECT_EQ(cfg.service.base_url, std::string("http://localhost:10000"));
  EXPECT_EQ(cfg.service.ai_provider, std::string("claude"));
  EXPECT_EQ(cfg.timeouts.conversation_ms, 30000);
  EXPECT_EQ(cfg.timeouts.agent_ms, 60000);
  EXPECT_EQ(cfg.timeouts.confusion_ms, 45000);
  EXPECT_EQ(cfg.bus.dead_letter_capacity, static_cast<std::size_t>(1000));

  const AgentConfig visual = cfg.agent(AgentType::kVisualLearning);
  EXPECT_EQ(visual.max_concurrent_tasks, 2);
  EXPECT_EQ(visual.timeout_ms, 60000);
  EXPECT_TRUE(visual.enabled);
  EXPECT_EQ(std::string(priority_name(cfg.agent(AgentType::kConversation).priority)), std::string("high"));
  EXPECT_EQ(cfg.agent(AgentType::kContentSpecialist).timeout_ms, 45000);

  const Config empty{};
  EXPECT_EQ(empty.agent(AgentType::kPedagogy).retry_attempts, 3);
  EXPECT_TRUE(empty.agent(AgentType::kPedagogy).required_tools.empty());
  return 0;
}

int test_env_references() {
  ::setenv("POLYTUTOR_TEST_KEY", "sk-test-123", 1);
  EXPECT_EQ(resolve_env_ref("$POLYTUTOR_TEST_KEY"), std::string("sk-test-123"));
  EXPECT_EQ(resolve_env_ref("${POLYTUTOR_TEST_KEY}"), std::string("sk-test-123"));
  EXPECT_EQ(resolve_env_ref("literal-key"), std::string("literal-key"));
  EXPECT_EQ(resolve_env_ref("$POLYTUTOR_TEST_UNSET_VAR"), std::string(""));
  EXPECT_EQ(resolve_env_ref(""), std::string(""));

  json doc = default_config_json();
  doc["service"]["apiKey"] = "${POLYTUTOR_TEST_KEY}";
  EXPECT_EQ(parse_config(doc).service.api_key, std::string("sk-test-123"));
  ::unsetenv("POLYTUTOR_TEST_KEY");
  return 0;
}

int test_overrides_are_applied() {
  const json doc = {{"service", {{"aiProvider", "OpenAI"}}},
                    {"timeouts", {{"agentMs", 1500}, {"conversationMs", -5}}},
                    {"agents",
                     {{"resource",
                       {{"enabled", false}, {"maxConcurrentTasks", 7}, {"priority", "critical"},
                        {"requiredTools", {"youtube", 42, "filesystem"}}}}}}};
  const Config cfg = parse_config(doc);
  EXPECT_EQ(cfg.service.ai_provider, std::string("openai"));
  EXPECT_EQ(cfg.timeouts.agent_ms, 1500);
  EXPECT_EQ(cfg.timeouts.conversation_ms, 30000);

  const AgentConfig resource = cfg.agent(AgentType::kResource);
  EXPECT_TRUE(!resource.enabled);
  EXPECT_EQ(resource.max_concurrent_tasks, 7);
  EXPECT_EQ(std::string(priority_name(resource.priority)), std::string("critical"));
  EXPECT_EQ(resource.required_tools.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(resource.required_tools[1], std::string("filesystem"));
  return 0;
}

int expect_config_error(const json& doc) {
  bool threw = false;
  try {
    parse_config(doc);
  } catch (const AgentError& e) {
    threw = e.code() == ErrorCode::kConfigurationError;
  }
  EXPECT_TRUE(threw);
  return 0;
}

int test_invalid_documents_are_rejected() {
  const json bad_docs[] = {
      json{{"service", {{"aiProvider", "gemini"}}}},
      json{{"agents", {{"grader", {{"enabled", true}}}}}},
      json{{"agents", {{"orchestrator", json::object()}}}},
      json{{"timeouts", {{"agentMs", "soon"}}}},
      json::array(),
  };
  for (const auto& doc : bad_docs) {
    if (expect_config_error(doc) != 0) {
      return fail("accepted " + doc.dump(), __FILE__, __LINE__);
    }
  }
  return 0;
}

int test_load_and_save() {
  const fs::path missing = temp_path("missing.json");
  EXPECT_EQ(load_config(missing).timeouts.agent_ms, 60000);

  const fs::path broken = temp_path("broken.json");
  EXPECT_TRUE(write_text_file(broken, "{ not json"));
  EXPECT_EQ(load_config(broken).service.ai_provider, std::string("claude"));

  const fs::path saved = temp_path("saved.json");
  EXPECT_TRUE(save_default_config(saved));
  const Config cfg = load_config(saved);
  EXPECT_EQ(cfg.agent(AgentType::kContentSpecialist).max_concurrent_tasks, 3);
  EXPECT_EQ(cfg.agents.size(), static_cast<std::size_t>(6));

  std::error_code ec;
  fs::remove(broken, ec);
  fs::remove(saved, ec);
  return 0;
}

}  // namespace

int main() {
  RUN_TEST(test_defaults_match_document);
  RUN_TEST(test_env_references);
  RUN_TEST(test_overrides_are_applied);
  RUN_TEST(test_invalid_documents_are_rejected);
  RUN_TEST(test_load_and_save);

  std::cout << "OK\n";
  return 0;
}
