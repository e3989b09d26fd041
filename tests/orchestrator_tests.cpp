#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "polytutor/orchestrator.hpp"
#include "test_support.hpp"

using namespace polytutor;
using polytutor::testing::FakeServiceLayer;
using polytutor::testing::GeneratorBehavior;
using polytutor::testing::ScriptedAgent;
using polytutor::testing::fake_registry;
using polytutor::testing::wait_until;

namespace {

Config test_config() {
  Config cfg;
  cfg.timeouts.conversation_ms = 3000;
  cfg.timeouts.agent_ms = 3000;
  cfg.timeouts.generation_ms = 1000;
  return cfg;
}

ConversationContext context(const std::string& user = "", const std::string& session = "s1") {
  ConversationContext ctx;
  ctx.user_id = user;
  ctx.session_id = session;
  return ctx;
}

// Records every scripted agent it builds; types listed in `real` get the
// built-in agent instead.
struct ScriptedFactory {
  std::map<AgentType, std::chrono::milliseconds> delays;
  std::vector<AgentType> failing;
  std::vector<AgentType> failing_staged;
  std::vector<AgentType> real;
  std::shared_ptr<AdaptiveEngine> engine;

  std::mutex mu;
  std::map<AgentType, std::shared_ptr<ScriptedAgent>> built;

  AgentFactory make() {
    return [this](AgentType type, AgentDeps deps, AgentConfig config) -> std::shared_ptr<Agent> {
      if (std::find(real.begin(), real.end(), type) != real.end()) {
        return make_agent(type, std::move(deps), std::move(config), engine);
      }
      auto it = delays.find(type);
      auto agent = std::make_shared<ScriptedAgent>(type, std::move(deps), std::move(config),
                                                   it == delays.end() ? std::chrono::milliseconds(0) : it->second);
      agent->failing = std::find(failing.begin(), failing.end(), type) != failing.end();
      agent->failing_staged = std::find(failing_staged.begin(), failing_staged.end(), type) != failing_staged.end();
      std::lock_guard<std::mutex> lock(mu);
      built[type] = agent;
      return agent;
    };
  }

  std::shared_ptr<ScriptedAgent> get(AgentType type) {
    std::lock_guard<std::mutex> lock(mu);
    return built[type];
  }
};

bool has_agent(const std::vector<AgentType>& v, AgentType t) { return std::find(v.begin(), v.end(), t) != v.end(); }

int test_explanation_with_real_agents() {
  auto services = std::make_shared<FakeServiceLayer>();
  Orchestrator orchestrator(test_config(), services, fake_registry(GeneratorBehavior::kSucceed));
  orchestrator.initialize();
  EXPECT_EQ(orchestrator.agent_count(), static_cast<std::size_t>(6));

  const TutorResponse r = orchestrator.process_query("How does SN2 substitution work?", context());
  EXPECT_EQ(r.type, std::string("explanation"));
  EXPECT_TRUE(r.involved(AgentType::kConversation));
  EXPECT_TRUE(r.involved(AgentType::kContentSpecialist));
  EXPECT_TRUE(!r.involved(AgentType::kVisualLearning));
  EXPECT_TRUE(r.metadata.confidence > 0.0);
  EXPECT_TRUE(r.metadata.failed_agents.empty());
  EXPECT_TRUE(r.content.text.find("Answer from claude") != std::string::npos);
  EXPECT_EQ(r.content.videos.size(), static_cast<std::size_t>(2));
  EXPECT_TRUE(std::find(r.related_topics.begin(), r.related_topics.end(), "nucleophiles") != r.related_topics.end());
  EXPECT_TRUE(!r.follow_up_suggestions.empty());
  EXPECT_TRUE(std::find(r.metadata.sources.begin(), r.metadata.sources.end(), "ai_explanation") !=
              r.metadata.sources.end());
  EXPECT_EQ(orchestrator.events().count(kEventQueryProcessed), static_cast<uint64_t>(1));

  const json j = to_json(r);
  EXPECT_EQ(j["type"].get<std::string>(), std::string("explanation"));
  EXPECT_TRUE(j["metadata"]["agentsInvolved"].size() >= 2);

  orchestrator.shutdown();
  orchestrator.shutdown();
  return 0;
}

int test_slow_agent_is_dropped_not_fatal() {
  auto services = std::make_shared<FakeServiceLayer>();
  Config cfg = test_config();
  cfg.timeouts.agent_ms = 200;
  AgentConfig slow_cfg = default_agent_config(AgentType::kContentSpecialist);
  slow_cfg.timeout_ms = 5000;
  cfg.agents[AgentType::kContentSpecialist] = slow_cfg;

  Orchestrator orchestrator(cfg, services, fake_registry(GeneratorBehavior::kSucceed));
  ScriptedFactory factory;
  factory.real = {AgentType::kConversation, AgentType::kVisualLearning, AgentType::kAssessment,
                  AgentType::kResource, AgentType::kPedagogy};
  factory.delays[AgentType::kContentSpecialist] = std::chrono::milliseconds(600);
  orchestrator.initialize(factory.make());

  const TutorResponse r = orchestrator.process_query("How does SN2 substitution work?", context());
  EXPECT_EQ(r.type, std::string("explanation"));
  EXPECT_TRUE(r.involved(AgentType::kConversation));
  EXPECT_TRUE(!r.involved(AgentType::kContentSpecialist));
  EXPECT_TRUE(has_agent(r.metadata.failed_agents, AgentType::kContentSpecialist));
  EXPECT_TRUE(r.metadata.confidence > 0.0);
  EXPECT_TRUE(orchestrator.events().count(kEventAgentError) >= 1);
  EXPECT_EQ(orchestrator.events().count(kEventQueryFailed), static_cast<uint64_t>(0));

  EXPECT_TRUE(wait_until([&]() { return orchestrator.metrics_snapshot()["lateResponses"].get<uint64_t>() == 1; }));
  EXPECT_EQ(factory.get(AgentType::kContentSpecialist)->calls(), 1);
  orchestrator.shutdown();
  return 0;
}

int test_conversation_failure_degrades() {
  auto services = std::make_shared<FakeServiceLayer>();
  Orchestrator orchestrator(test_config(), services, fake_registry(GeneratorBehavior::kSucceed));
  ScriptedFactory factory;
  factory.failing = {AgentType::kConversation};
  orchestrator.initialize(factory.make());

  const TutorResponse r = orchestrator.process_query("Explain E1 reactions", context());
  EXPECT_EQ(r.type, std::string("feedback"));
  EXPECT_EQ(r.content.text, std::string(kDegradedResponseText));
  EXPECT_EQ(r.metadata.confidence, 0.0);
  EXPECT_EQ(r.metadata.agents_involved.size(), static_cast<std::size_t>(1));
  EXPECT_TRUE(r.involved(AgentType::kOrchestrator));
  EXPECT_EQ(r.follow_up_suggestions.size(), static_cast<std::size_t>(3));
  EXPECT_EQ(orchestrator.events().count(kEventQueryFailed), static_cast<uint64_t>(1));
  EXPECT_EQ(orchestrator.metrics_snapshot()["errorCount"].get<uint64_t>(), static_cast<uint64_t>(1));
  EXPECT_EQ(factory.get(AgentType::kContentSpecialist)->calls(), 0);
  orchestrator.shutdown();
  return 0;
}

int test_conversation_stage_failure_skips_later_stages() {
  auto services = std::make_shared<FakeServiceLayer>();
  Orchestrator orchestrator(test_config(), services, fake_registry(GeneratorBehavior::kSucceed));
  ScriptedFactory factory;
  factory.failing_staged = {AgentType::kConversation};
  orchestrator.initialize(factory.make());

  const TutorResponse r = orchestrator.process_query("Show me SN2 and give me a study plan", context("u1"));
  EXPECT_EQ(r.type, std::string("feedback"));
  EXPECT_EQ(r.content.text, std::string(kDegradedResponseText));
  EXPECT_EQ(factory.get(AgentType::kConversation)->calls(), 2);
  EXPECT_EQ(factory.get(AgentType::kContentSpecialist)->calls(), 1);
  EXPECT_EQ(factory.get(AgentType::kVisualLearning)->calls(), 0);
  EXPECT_EQ(factory.get(AgentType::kPedagogy)->calls(), 0);
  EXPECT_EQ(orchestrator.events().count(kEventQueryFailed), static_cast<uint64_t>(1));
  orchestrator.shutdown();
  return 0;
}

int test_missing_conversation_agent_degrades() {
  auto services = std::make_shared<FakeServiceLayer>();
  Config cfg = test_config();
  cfg.timeouts.conversation_ms = 200;
  AgentConfig off = default_agent_config(AgentType::kConversation);
  off.enabled = false;
  cfg.agents[AgentType::kConversation] = off;

  Orchestrator orchestrator(cfg, services, fake_registry(GeneratorBehavior::kSucceed));
  orchestrator.initialize();
  EXPECT_TRUE(!orchestrator.agent(AgentType::kConversation));

  const TutorResponse r = orchestrator.process_query("What is SN1?", context());
  EXPECT_EQ(r.type, std::string("feedback"));
  EXPECT_TRUE(orchestrator.bus().wait_idle());
  EXPECT_TRUE(orchestrator.events().count(kEventDeadLettered) >= 1);
  orchestrator.shutdown();
  return 0;
}

int test_query_before_initialize_degrades() {
  Orchestrator orchestrator(test_config(), std::make_shared<FakeServiceLayer>(),
                            fake_registry(GeneratorBehavior::kSucceed));
  const TutorResponse r = orchestrator.process_query("What is SN2?", context());
  EXPECT_EQ(r.type, std::string("feedback"));
  EXPECT_EQ(orchestrator.events().count(kEventQueryFailed), static_cast<uint64_t>(1));

  orchestrator.initialize(ScriptedFactory().make());
  bool threw = false;
  try {
    orchestrator.initialize();
  } catch (const AgentError& e) {
    threw = e.code() == ErrorCode::kConfigurationError;
  }
  EXPECT_TRUE(threw);
  return 0;
}

int test_stages_run_in_order() {
  auto services = std::make_shared<FakeServiceLayer>();
  Orchestrator orchestrator(test_config(), services, fake_registry(GeneratorBehavior::kSucceed));
  ScriptedFactory factory;
  for (const AgentType t : kAllAgentTypes) {
    factory.delays[t] = std::chrono::milliseconds(120);
  }
  orchestrator.initialize(factory.make());

  const TutorResponse r = orchestrator.process_query(
      "Show me a diagram of SN2 reactions, quiz me, and give me a study plan", context("u1"));
  EXPECT_EQ(r.type, std::string("question"));
  EXPECT_EQ(r.metadata.agents_involved.size(), static_cast<std::size_t>(5));
  EXPECT_TRUE(!r.involved(AgentType::kResource));

  auto conversation = factory.get(AgentType::kConversation);
  auto content = factory.get(AgentType::kContentSpecialist);
  auto visual = factory.get(AgentType::kVisualLearning);
  auto assessment = factory.get(AgentType::kAssessment);
  auto pedagogy = factory.get(AgentType::kPedagogy);
  EXPECT_EQ(conversation->calls(), 2);
  EXPECT_EQ(visual->calls(), 1);
  EXPECT_EQ(pedagogy->calls(), 1);

  const auto stage1_done = (std::max)(conversation->last_finish(), content->last_finish());
  EXPECT_TRUE(visual->first_start() >= stage1_done);
  EXPECT_TRUE(assessment->first_start() >= stage1_done);
  const auto stage2_done = (std::max)(visual->last_finish(), assessment->last_finish());
  EXPECT_TRUE(pedagogy->first_start() >= stage2_done);

  // The two stage-2 agents overlap.
  EXPECT_TRUE(visual->first_start() < assessment->last_finish());
  EXPECT_TRUE(assessment->first_start() < visual->last_finish());
  orchestrator.shutdown();
  return 0;
}

int test_required_agents_and_plan_shape() {
  QueryAnalysis q;
  std::vector<AgentType> required = Orchestrator::determine_required_agents(q);
  EXPECT_EQ(required.size(), static_cast<std::size_t>(1));
  EXPECT_TRUE(required[0] == AgentType::kConversation);

  ExecutionPlan plan = Orchestrator::create_execution_plan(required);
  EXPECT_EQ(plan.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(plan[0].size(), static_cast<std::size_t>(1));

  q.concepts = {"SN2"};
  q.requests_visual_content = true;
  q.requests_practice = true;
  q.requests_additional_materials = true;
  q.requests_study_plan = true;
  required = Orchestrator::determine_required_agents(q);
  EXPECT_EQ(required.size(), static_cast<std::size_t>(6));
  EXPECT_TRUE(!has_agent(required, AgentType::kOrchestrator));

  plan = Orchestrator::create_execution_plan(required);
  EXPECT_EQ(plan.size(), static_cast<std::size_t>(3));
  EXPECT_TRUE(plan[0] == std::vector<AgentType>({AgentType::kConversation, AgentType::kContentSpecialist}));
  EXPECT_TRUE(plan[1] ==
              std::vector<AgentType>({AgentType::kVisualLearning, AgentType::kAssessment, AgentType::kResource}));
  EXPECT_TRUE(plan[2] == std::vector<AgentType>({AgentType::kPedagogy}));

  plan = Orchestrator::create_execution_plan({AgentType::kConversation, AgentType::kPedagogy});
  EXPECT_EQ(plan.size(), static_cast<std::size_t>(2));
  EXPECT_TRUE(plan[1] == std::vector<AgentType>({AgentType::kPedagogy}));
  return 0;
}

int test_milestone_notification_is_tracked() {
  auto services = std::make_shared<FakeServiceLayer>();
  Orchestrator orchestrator(test_config(), services, fake_registry(GeneratorBehavior::kSucceed));
  orchestrator.initialize();

  const TutorResponse r = orchestrator.process_query("Give me a study plan for SN1 reactions", context("u7"));
  EXPECT_TRUE(r.involved(AgentType::kPedagogy));
  EXPECT_TRUE(!r.follow_up_suggestions.empty());
  EXPECT_TRUE(std::find(r.follow_up_suggestions.begin(), r.follow_up_suggestions.end(), "Review carbocations") !=
              r.follow_up_suggestions.end());

  EXPECT_TRUE(wait_until([&]() { return orchestrator.events().count(kEventLearningMilestone) == 1; }));
  const auto tracked = services->tracked();
  EXPECT_TRUE(std::find(tracked.begin(), tracked.end(), "learning_milestone") != tracked.end());
  orchestrator.shutdown();
  return 0;
}

int test_session_history_is_bounded() {
  auto services = std::make_shared<FakeServiceLayer>();
  Orchestrator orchestrator(test_config(), services, fake_registry(GeneratorBehavior::kSucceed));
  orchestrator.initialize(ScriptedFactory().make());

  for (int i = 0; i < 12; ++i) {
    orchestrator.process_query("question " + std::to_string(i), context("", "history"));
  }
  const auto history = orchestrator.session_history("history");
  EXPECT_EQ(history.size(), kSessionHistoryLimit);
  EXPECT_EQ(history.front(), std::string("question 2"));
  EXPECT_EQ(history.back(), std::string("question 11"));
  EXPECT_TRUE(orchestrator.session_history("other").empty());

  const json m = orchestrator.metrics_snapshot();
  EXPECT_EQ(m["queryCount"].get<uint64_t>(), static_cast<uint64_t>(12));
  EXPECT_EQ(m["errorCount"].get<uint64_t>(), static_cast<uint64_t>(0));
  orchestrator.shutdown();
  return 0;
}

int test_health_check_reports_agents() {
  auto services = std::make_shared<FakeServiceLayer>();
  Orchestrator orchestrator(test_config(), services, fake_registry(GeneratorBehavior::kSucceed));
  orchestrator.initialize(ScriptedFactory().make());

  json health = orchestrator.run_health_check_now();
  EXPECT_EQ(health.size(), static_cast<std::size_t>(6));
  EXPECT_TRUE(health["conversation"].get<bool>());

  services->reachable = false;
  health = orchestrator.run_health_check_now();
  EXPECT_TRUE(!health["pedagogy"].get<bool>());
  EXPECT_TRUE(orchestrator.events().count(kEventHealthCheckFailed) >= 1);
  EXPECT_EQ(orchestrator.events().count(kEventAgentUnhealthy), static_cast<uint64_t>(6));

  const json status = orchestrator.status();
  EXPECT_TRUE(status["initialized"].get<bool>());
  EXPECT_EQ(status["agentCount"].get<std::size_t>(), static_cast<std::size_t>(6));
  orchestrator.shutdown();
  return 0;
}

int test_agent_startup_failure_is_skipped() {
  auto services = std::make_shared<FakeServiceLayer>();
  services->services["youtube"] = false;
  Config cfg = test_config();
  AgentConfig resource = default_agent_config(AgentType::kResource);
  resource.required_tools = {"youtube"};
  cfg.agents[AgentType::kResource] = resource;

  Orchestrator orchestrator(cfg, services, fake_registry(GeneratorBehavior::kSucceed));
  orchestrator.initialize();
  EXPECT_EQ(orchestrator.agent_count(), static_cast<std::size_t>(5));
  EXPECT_TRUE(!orchestrator.agent(AgentType::kResource));
  EXPECT_EQ(orchestrator.events().count(kEventAgentInitFailed), static_cast<uint64_t>(1));

  const TutorResponse r = orchestrator.process_query("Any videos about resonance?", context());
  EXPECT_EQ(r.type, std::string("resources"));
  EXPECT_TRUE(has_agent(r.metadata.failed_agents, AgentType::kResource));
  EXPECT_TRUE(r.involved(AgentType::kConversation));
  orchestrator.shutdown();
  return 0;
}

}  // namespace

int main() {
  RUN_TEST(test_explanation_with_real_agents);
  RUN_TEST(test_slow_agent_is_dropped_not_fatal);
  RUN_TEST(test_conversation_failure_degrades);
  RUN_TEST(test_conversation_stage_failure_skips_later_stages);
  RUN_TEST(test_missing_conversation_agent_degrades);
  RUN_TEST(test_query_before_initialize_degrades);
  RUN_TEST(test_stages_run_in_order);
  RUN_TEST(test_required_agents_and_plan_shape);
  RUN_TEST(test_milestone_notification_is_tracked);
  RUN_TEST(test_session_history_is_bounded);
  RUN_TEST(test_health_check_reports_agents);
  RUN_TEST(test_agent_startup_failure_is_skipped);

  std::cout << "OK\n";
  return 0;
}
