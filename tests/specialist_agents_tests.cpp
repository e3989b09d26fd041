#include <memory>
#include <string>
#include <vector>

#include "polytutor/agents.hpp"
#include "polytutor/concept_catalog.hpp"
#include "polytutor/generators.hpp"
#include "test_support.hpp"

using namespace polytutor;
using polytutor::testing::FakeServiceLayer;
using polytutor::testing::GeneratorBehavior;
using polytutor::testing::fake_registry;

namespace {

struct Rig {
  EventHub events;
  MessageBus bus{&events};
  std::shared_ptr<FakeServiceLayer> services = std::make_shared<FakeServiceLayer>();

  ~Rig() { bus.stop(); }

  AgentDeps deps() {
    AgentDeps d;
    d.bus = &bus;
    d.services = services;
    d.events = &events;
    return d;
  }
};

AgentConfig config_for(int timeout_ms = 2000) {
  AgentConfig c;
  c.timeout_ms = timeout_ms;
  return c;
}

QueryAnalysis analysis_of(const std::string& query, Complexity level = Complexity::kIntermediate) {
  ConversationContext ctx;
  ctx.student_level = level;
  return ConversationAgent::analyze(query, ctx);
}

template <typename Req>
AgentContribution run(Agent& agent, AgentType type, Req req) {
  const Payload out = agent.process_with_timeout(make_request(AgentType::kOrchestrator, type, std::move(req)));
  return std::get<AgentContribution>(out);
}

int test_concepts_found_in_catalog_order() {
  const auto both = concepts_in_text("How does SN1 differ from SN2?");
  EXPECT_EQ(both.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(both[0], std::string("SN2"));
  EXPECT_EQ(both[1], std::string("SN1"));

  const auto e2 = concepts_in_text("Walk me through the E2 reaction.");
  EXPECT_EQ(e2.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(e2[0], std::string("E2"));

  EXPECT_TRUE(concepts_in_text("a database-based approach").empty());
  EXPECT_TRUE(concepts_in_text("").empty());
  EXPECT_TRUE(find_concept("  chirality ") != nullptr);
  EXPECT_TRUE(find_concept("alchemy") == nullptr);
  return 0;
}

int test_analysis_flags_and_intent() {
  const QueryAnalysis visual = analysis_of("Can you show me a 3D model of chirality? I'm confused");
  EXPECT_TRUE(visual.requests_visual_content);
  EXPECT_TRUE(visual.requests_encouragement);
  EXPECT_TRUE(!visual.requests_assessment);
  EXPECT_EQ(visual.intent, std::string("encouragement"));
  EXPECT_EQ(visual.preferred_visualization, std::string("3d"));
  EXPECT_EQ(visual.context.current_topic, std::string("chirality"));
  EXPECT_EQ(visual.learning_goals.size(), static_cast<std::size_t>(1));

  const QueryAnalysis quiz = analysis_of("Quiz me on SN2 with a video too");
  EXPECT_EQ(quiz.intent, std::string("assessment"));
  EXPECT_TRUE(quiz.needs_assessment);
  EXPECT_TRUE(quiz.needs_resources);
  EXPECT_EQ(quiz.preferred_resource_types.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(quiz.preferred_resource_types[0], std::string("video"));
  EXPECT_EQ(quiz.preferred_question_type, std::string("multiple_choice"));
  return 0;
}

int test_requested_difficulty_is_clamped() {
  EXPECT_EQ(analysis_of("Explain SN1", Complexity::kBeginner).requested_difficulty, 2);
  EXPECT_EQ(analysis_of("A harder SN1 question", Complexity::kBeginner).requested_difficulty, 3);
  EXPECT_EQ(analysis_of("Something more challenging on E1", Complexity::kAdvanced).requested_difficulty, 5);
  EXPECT_EQ(analysis_of("A simple, easier take on resonance", Complexity::kBeginner).requested_difficulty, 1);
  return 0;
}

int test_compose_falls_back_to_template() {
  Rig rig;
  auto agent = std::make_shared<ConversationAgent>(rig.deps(), config_for());

  ComposeReplyRequest req;
  req.analysis = analysis_of("I'm stuck on SN2");
  AgentContribution ok = run(*agent, AgentType::kConversation, req);
  EXPECT_EQ(ok.text, std::string("Answer from claude"));
  EXPECT_EQ(*ok.confidence, 0.9);

  rig.services->ai_down = true;
  const AgentContribution fallback = run(*agent, AgentType::kConversation, req);
  EXPECT_EQ(*fallback.confidence, 0.6);
  EXPECT_TRUE(fallback.text.find("SN2") != std::string::npos);
  EXPECT_TRUE(fallback.text.find("tricky") != std::string::npos);
  return 0;
}

int test_content_specialist_explains_with_prerequisites() {
  Rig rig;
  auto agent = std::make_shared<ContentSpecialistAgent>(rig.deps(), config_for());

  ExplainConceptRequest req;
  req.analysis = analysis_of("Explain SN2");
  req.concepts = {"SN2"};
  const AgentContribution c = run(*agent, AgentType::kContentSpecialist, req);
  EXPECT_EQ(c.prerequisites.size(), static_cast<std::size_t>(3));
  EXPECT_EQ(c.related_topics[0], std::string("SN1"));
  EXPECT_EQ(c.videos.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(rig.services->tracked().size(), static_cast<std::size_t>(1));
  EXPECT_EQ(rig.services->tracked()[0], std::string("concept_explained"));

  rig.services->videos_down = true;
  const AgentContribution no_videos = run(*agent, AgentType::kContentSpecialist, req);
  EXPECT_TRUE(no_videos.videos.empty());

  rig.services->ai_down = true;
  bool threw = false;
  try {
    run(*agent, AgentType::kContentSpecialist, req);
  } catch (const AgentError& e) {
    threw = e.code() == ErrorCode::kServiceConnectionFailed && e.agent() == AgentType::kContentSpecialist;
  }
  EXPECT_TRUE(threw);
  return 0;
}

int test_visual_agent_limits_concepts() {
  Rig rig;
  auto engine = std::make_shared<AdaptiveEngine>(fake_registry(GeneratorBehavior::kSucceed), &rig.events);
  auto agent = std::make_shared<VisualLearningAgent>(rig.deps(), config_for(), engine);

  VisualizationRequest req;
  req.analysis = analysis_of("Show me SN2, SN1 and E2");
  req.concepts = {"SN2", "SN1", "E2"};
  const AgentContribution c = run(*agent, AgentType::kVisualLearning, req);
  EXPECT_EQ(c.visualizations.size(), kMaxVisualizedConcepts);
  EXPECT_EQ(*c.confidence, 0.8);
  EXPECT_EQ(c.sources[0], std::string("adaptive_content_engine"));
  return 0;
}

int test_visual_agent_reports_exhaustion() {
  Rig rig;
  auto engine = std::make_shared<AdaptiveEngine>(fake_registry(GeneratorBehavior::kThrow), &rig.events);
  auto agent = std::make_shared<VisualLearningAgent>(rig.deps(), config_for(), engine);

  VisualizationRequest req;
  req.analysis = analysis_of("Draw chirality");
  req.concepts = {"chirality"};
  bool threw = false;
  try {
    run(*agent, AgentType::kVisualLearning, req);
  } catch (const AgentError& e) {
    threw = e.code() == ErrorCode::kGenerationExhausted;
  }
  EXPECT_TRUE(threw);

  EXPECT_EQ(std::string(complexity_name(VisualLearningAgent::detail_to_complexity("HIGH", Complexity::kBeginner))),
            std::string(complexity_name(Complexity::kAdvanced)));
  EXPECT_EQ(std::string(complexity_name(VisualLearningAgent::detail_to_complexity("", Complexity::kBeginner))),
            std::string(complexity_name(Complexity::kBeginner)));
  return 0;
}

int test_assessment_parses_or_falls_back() {
  Rig rig;
  rig.services->answer_for = [](const std::string&, std::optional<AgentType>) {
    return std::string(R"([{"prompt":"Which step is rate limiting?","options":["a","b"],"answer":0}])");
  };
  auto agent = std::make_shared<AssessmentAgent>(rig.deps(), config_for());

  AssessmentRequest req;
  req.analysis = analysis_of("Quiz me on SN1 and E1");
  req.concepts = {"SN1", "E1"};
  const AgentContribution parsed = run(*agent, AgentType::kAssessment, req);
  EXPECT_EQ(parsed.assessments.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(parsed.sources[0], std::string("ai_assessment"));

  rig.services->answer_for = [](const std::string&, std::optional<AgentType>) { return std::string("Sure! Q1..."); };
  const AgentContribution templated = run(*agent, AgentType::kAssessment, req);
  EXPECT_EQ(templated.assessments.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(*templated.confidence, 0.7);
  EXPECT_EQ(templated.assessments[1]["concept"].get<std::string>(), std::string("E1"));
  EXPECT_EQ(templated.assessments[0]["options"].size(), static_cast<std::size_t>(4));

  rig.services->answer_for = [](const std::string&, std::optional<AgentType>) {
    return std::string(R"(["What is SN1?", 42, {"options":["a"]}])");
  };
  const AgentContribution shapeless = run(*agent, AgentType::kAssessment, req);
  EXPECT_EQ(shapeless.assessments.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(shapeless.sources[0], std::string("question_templates"));
  for (const auto& q : shapeless.assessments) {
    EXPECT_TRUE(q.is_object() && q["prompt"].is_string());
  }

  rig.services->answer_for = [](const std::string&, std::optional<AgentType>) {
    return std::string(R"(["not a question", {"prompt":"Name the leaving group."}])");
  };
  const AgentContribution mixed = run(*agent, AgentType::kAssessment, req);
  EXPECT_EQ(mixed.assessments.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(mixed.assessments[0]["prompt"].get<std::string>(), std::string("Name the leaving group."));

  const auto short_answer = AssessmentAgent::template_questions({"resonance"}, 2, "short_answer");
  EXPECT_TRUE(!short_answer[0].contains("options"));
  return 0;
}

int test_resource_agent_propagates_search_failure() {
  Rig rig;
  auto agent = std::make_shared<ResourceAgent>(rig.deps(), config_for());

  ResourceRequest req;
  req.analysis = analysis_of("Videos on hybridization");
  req.topics = {"hybridization"};
  req.resource_types = {"video"};
  const AgentContribution c = run(*agent, AgentType::kResource, req);
  EXPECT_EQ(c.videos.size(), static_cast<std::size_t>(2));
  EXPECT_TRUE(c.resources.empty());

  rig.services->videos_down = true;
  bool threw = false;
  try {
    run(*agent, AgentType::kResource, req);
  } catch (const AgentError& e) {
    threw = e.code() == ErrorCode::kServiceConnectionFailed;
  }
  EXPECT_TRUE(threw);
  return 0;
}

int test_pedagogy_orders_prerequisites_first() {
  Rig rig;
  auto agent = std::make_shared<PedagogyAgent>(rig.deps(), config_for());

  LearningPathRequest req;
  req.analysis = analysis_of("Give me a study plan for SN1", Complexity::kBeginner);
  const AgentContribution c = run(*agent, AgentType::kPedagogy, req);
  EXPECT_EQ(c.next_steps[0], std::string("Review carbocations"));
  EXPECT_EQ(c.next_steps[1], std::string("Review leaving groups"));
  EXPECT_EQ(c.next_steps[2], std::string("Practice SN1"));
  EXPECT_EQ(c.adaptations[0]["value"].get<std::string>(), std::string("slow"));
  EXPECT_EQ(c.text, std::string("Study plan: Understand SN1."));
  return 0;
}

int test_generators() {
  auto services = std::make_shared<FakeServiceLayer>();
  ConceptAnalysis a;
  a.topic = "resonance";
  a.keywords = {"structure"};
  const Deadline deadline(std::chrono::milliseconds(1000));

  services->answer_for = [](const std::string&, std::optional<AgentType>) {
    return std::string(R"({"frames":3})");
  };
  AiContentGenerator animation(Modality::kAnimation, services, "claude");
  const json data = animation.generate(a, deadline);
  EXPECT_EQ(data["frames"].get<int>(), 3);
  EXPECT_EQ(data["modality"].get<std::string>(), std::string("animation"));

  services->answer_for = [](const std::string&, std::optional<AgentType>) { return std::string("plain words"); };
  EXPECT_EQ(animation.generate(a, deadline)["description"].get<std::string>(), std::string("plain words"));

  services->answer_for = [](const std::string&, std::optional<AgentType>) { return std::string("  "); };
  bool threw = false;
  try {
    animation.generate(a, deadline);
  } catch (const AgentError& e) {
    threw = e.code() == ErrorCode::kProcessingError;
  }
  EXPECT_TRUE(threw);

  TextGenerator text;
  const json outline = text.generate(a, deadline);
  EXPECT_EQ(outline["sections"].size(), static_cast<std::size_t>(2));

  const auto registry = make_default_generators(services, "claude");
  for (const Modality m : kAllModalities) {
    EXPECT_TRUE(registry->get(m) != nullptr);
  }
  return 0;
}

}  // namespace

int main() {
  RUN_TEST(test_concepts_found_in_catalog_order);
  RUN_TEST(test_analysis_flags_and_intent);
  RUN_TEST(test_requested_difficulty_is_clamped);
  RUN_TEST(test_compose_falls_back_to_template);
  RUN_TEST(test_content_specialist_explains_with_prerequisites);
  RUN_TEST(test_visual_agent_limits_concepts);
  RUN_TEST(test_visual_agent_reports_exhaustion);
  RUN_TEST(test_assessment_parses_or_falls_back);
  RUN_TEST(test_resource_agent_propagates_search_failure);
  RUN_TEST(test_pedagogy_orders_prerequisites_first);
  RUN_TEST(test_generators);

  std::cout << "OK\n";
  return 0;
}
