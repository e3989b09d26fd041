#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "polytutor/agent.hpp"
#include "polytutor/deadline.hpp"
#include "polytutor/periodic.hpp"
#include "polytutor/timers.hpp"
#include "test_support.hpp"

using namespace polytutor;
using polytutor::testing::FakeServiceLayer;
using polytutor::testing::ScriptedAgent;
using polytutor::testing::wait_until;

namespace {

struct Rig {
  EventHub events;
  MessageBus bus{&events};
  std::shared_ptr<FakeServiceLayer> services = std::make_shared<FakeServiceLayer>();

  std::mutex mu;
  std::vector<AgentMessage> inbox;

  Rig() {
    bus.subscribe(AgentType::kOrchestrator, [this](const AgentMessage& m) {
      if (m.type == MessageType::kHeartbeat) {
        return;
      }
      std::lock_guard<std::mutex> lock(mu);
      inbox.push_back(m);
    });
  }

  ~Rig() { bus.stop(); }

  AgentDeps deps() {
    AgentDeps d;
    d.bus = &bus;
    d.services = services;
    d.events = &events;
    return d;
  }

  std::vector<AgentMessage> received(MessageType type) {
    std::lock_guard<std::mutex> lock(mu);
    std::vector<AgentMessage> out;
    for (const auto& m : inbox) {
      if (m.type == type) {
        out.push_back(m);
      }
    }
    return out;
  }
};

AgentConfig quick_config(int timeout_ms = 2000) {
  AgentConfig c;
  c.max_concurrent_tasks = 2;
  c.timeout_ms = timeout_ms;
  return c;
}

int test_initialize_twice_is_rejected() {
  Rig rig;
  auto agent = std::make_shared<ScriptedAgent>(AgentType::kAssessment, rig.deps(), quick_config());
  agent->initialize();
  EXPECT_EQ(std::string(agent_state_name(agent->state())), std::string("healthy"));
  EXPECT_TRUE(rig.bus.has_subscriber(AgentType::kAssessment));
  EXPECT_EQ(rig.events.count(kEventAgentInitialized), static_cast<uint64_t>(1));

  bool threw = false;
  try {
    agent->initialize();
  } catch (const AgentError& e) {
    threw = e.code() == ErrorCode::kConfigurationError;
  }
  EXPECT_TRUE(threw);
  agent->shutdown();
  return 0;
}

int test_missing_required_tool_fails_startup() {
  Rig rig;
  AgentConfig cfg = quick_config();
  cfg.required_tools = {"claude", "wolfram"};
  auto agent = std::make_shared<ScriptedAgent>(AgentType::kResource, rig.deps(), cfg);

  bool threw = false;
  try {
    agent->initialize();
  } catch (const AgentError& e) {
    threw = e.code() == ErrorCode::kServiceConnectionFailed &&
            std::string(e.what()).find("wolfram") != std::string::npos;
  }
  EXPECT_TRUE(threw);
  EXPECT_EQ(std::string(agent_state_name(agent->state())), std::string("unhealthy"));
  EXPECT_EQ(rig.events.count(kEventAgentInitFailed), static_cast<uint64_t>(1));
  EXPECT_TRUE(!rig.bus.has_subscriber(AgentType::kResource));
  return 0;
}

int test_unreachable_services_tolerated_without_required_tools() {
  Rig rig;
  rig.services->reachable = false;
  auto agent = std::make_shared<ScriptedAgent>(AgentType::kPedagogy, rig.deps(), quick_config());
  agent->initialize();
  EXPECT_TRUE(agent->is_initialized());
  EXPECT_TRUE(!agent->health_check());
  EXPECT_EQ(std::string(agent_state_name(agent->state())), std::string("unhealthy"));
  agent->shutdown();
  return 0;
}

int test_request_gets_correlated_response() {
  Rig rig;
  auto agent = std::make_shared<ScriptedAgent>(AgentType::kAssessment, rig.deps(), quick_config());
  agent->initialize();

  AssessmentRequest req;
  req.concepts = {"SN2 reactions"};
  const AgentMessage msg = make_request(AgentType::kOrchestrator, AgentType::kAssessment, req, "q1:assessment");
  rig.bus.route(msg);

  EXPECT_TRUE(wait_until([&]() { return !rig.received(MessageType::kResponse).empty(); }));
  const AgentMessage reply = rig.received(MessageType::kResponse).front();
  EXPECT_EQ(reply.correlation_id, std::string("q1:assessment"));
  EXPECT_EQ(std::string(agent_type_name(reply.sender)), std::string("assessment"));
  const auto* c = std::get_if<AgentContribution>(&*reply.payload);
  EXPECT_TRUE(c != nullptr);
  EXPECT_EQ(c->text, std::string("assessment reply"));
  agent->shutdown();
  return 0;
}

int test_timeout_names_the_message() {
  Rig rig;
  auto agent = std::make_shared<ScriptedAgent>(AgentType::kResource, rig.deps(), quick_config(80),
                                               std::chrono::milliseconds(400));
  agent->initialize();

  const AgentMessage msg = make_request(AgentType::kOrchestrator, AgentType::kResource, ResourceRequest{});
  bool threw = false;
  try {
    agent->process_with_timeout(msg);
  } catch (const AgentError& e) {
    threw = e.code() == ErrorCode::kTimeout && e.message_id() == msg.id && e.retryable() &&
            e.agent().has_value() && *e.agent() == AgentType::kResource;
  }
  EXPECT_TRUE(threw);
  agent->shutdown();
  return 0;
}

int test_per_message_timeout_overrides_config() {
  Rig rig;
  auto agent = std::make_shared<ScriptedAgent>(AgentType::kResource, rig.deps(), quick_config(5000),
                                               std::chrono::milliseconds(300));
  agent->initialize();

  AgentMessage msg = make_request(AgentType::kOrchestrator, AgentType::kResource, ResourceRequest{});
  msg.timeout = std::chrono::milliseconds(50);
  const auto started = std::chrono::steady_clock::now();
  bool threw = false;
  try {
    agent->process_with_timeout(msg);
  } catch (const AgentError& e) {
    threw = e.code() == ErrorCode::kTimeout;
  }
  EXPECT_TRUE(threw);
  EXPECT_TRUE(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(250));
  agent->shutdown();
  return 0;
}

int test_unsupported_payload_becomes_error_reply() {
  Rig rig;
  auto agent = std::make_shared<ScriptedAgent>(AgentType::kPedagogy, rig.deps(), quick_config());
  agent->initialize();

  const AgentMessage msg = make_request(AgentType::kOrchestrator, AgentType::kPedagogy, Heartbeat{}, "hb:1");
  rig.bus.route(msg);

  EXPECT_TRUE(wait_until([&]() {
    return !rig.received(MessageType::kResponse).empty() && !rig.received(MessageType::kError).empty();
  }));
  const AgentMessage reply = rig.received(MessageType::kResponse).front();
  EXPECT_EQ(reply.correlation_id, std::string("hb:1"));
  const auto* err = std::get_if<ErrorReply>(&*reply.payload);
  EXPECT_TRUE(err != nullptr);
  EXPECT_EQ(std::string(error_code_name(err->code)), std::string(error_code_name(ErrorCode::kUnsupportedOperation)));
  EXPECT_EQ(err->message_id, msg.id);
  EXPECT_TRUE(!err->retryable);
  EXPECT_EQ(rig.events.count(kEventAgentError), static_cast<uint64_t>(1));
  EXPECT_TRUE(wait_until([&]() { return agent->metrics().error_count() == 1; }));
  agent->shutdown();
  return 0;
}

int test_metrics_track_successes_and_failures() {
  Rig rig;
  auto agent = std::make_shared<ScriptedAgent>(AgentType::kAssessment, rig.deps(), quick_config());
  agent->initialize();

  rig.bus.route(make_request(AgentType::kOrchestrator, AgentType::kAssessment, AssessmentRequest{}));
  rig.bus.route(make_request(AgentType::kOrchestrator, AgentType::kAssessment, AssessmentRequest{}));
  EXPECT_TRUE(wait_until([&]() { return agent->metrics().message_count() == 2; }));

  agent->failing = true;
  rig.bus.route(make_request(AgentType::kOrchestrator, AgentType::kAssessment, AssessmentRequest{}));
  EXPECT_TRUE(wait_until([&]() { return agent->metrics().message_count() == 3; }));

  EXPECT_EQ(agent->metrics().error_count(), static_cast<uint64_t>(1));
  EXPECT_TRUE(agent->metrics().error_rate() > 0.3 && agent->metrics().error_rate() < 0.34);
  const json snap = agent->status();
  EXPECT_EQ(snap["metrics"]["messageCount"].get<uint64_t>(), static_cast<uint64_t>(3));
  EXPECT_EQ(snap["state"].get<std::string>(), std::string("healthy"));
  agent->shutdown();
  return 0;
}

int test_shutdown_unsubscribes() {
  Rig rig;
  auto agent = std::make_shared<ScriptedAgent>(AgentType::kConversation, rig.deps(), quick_config());
  agent->initialize();
  agent->shutdown();
  agent->shutdown();
  EXPECT_EQ(std::string(agent_state_name(agent->state())), std::string("shutdown"));
  EXPECT_TRUE(!rig.bus.has_subscriber(AgentType::kConversation));
  EXPECT_TRUE(!agent->health_check());
  return 0;
}

int test_run_with_deadline_first_outcome_wins() {
  const Deadline fast(std::chrono::milliseconds(500));
  const int v = run_with_deadline([](const Deadline&) { return 42; }, fast, "fast call");
  EXPECT_EQ(v, 42);
  EXPECT_TRUE(!fast.cancelled());

  auto finished = std::make_shared<std::atomic<bool>>(false);
  const Deadline slow(std::chrono::milliseconds(50));
  bool threw = false;
  try {
    run_with_deadline(
        [finished](const Deadline&) {
          std::this_thread::sleep_for(std::chrono::milliseconds(200));
          finished->store(true);
          return 1;
        },
        slow, "slow call", "msg-7");
  } catch (const AgentError& e) {
    threw = e.code() == ErrorCode::kTimeout && e.message_id() == "msg-7";
  }
  EXPECT_TRUE(threw);
  EXPECT_TRUE(slow.cancelled());
  EXPECT_TRUE(slow.expired());
  EXPECT_TRUE(wait_until([&]() { return finished->load(); }));

  const Deadline failing(std::chrono::milliseconds(500));
  threw = false;
  try {
    run_with_deadline(
        [](const Deadline&) -> int { throw AgentError(ErrorCode::kProcessingError, "broken"); }, failing,
        "failing call");
  } catch (const AgentError& e) {
    threw = e.code() == ErrorCode::kProcessingError;
  }
  EXPECT_TRUE(threw);
  return 0;
}

int test_background_loops_stop_promptly() {
  using Clock = std::chrono::steady_clock;
  auto slowest = Clock::duration::zero();
  for (int i = 0; i < 200; ++i) {
    PeriodicTask sweep("sweep", std::chrono::seconds(30), []() {});
    sweep.start();
    if (i % 2 == 0) {
      std::this_thread::yield();
    }
    const auto started = Clock::now();
    sweep.stop();
    slowest = (std::max)(slowest, Clock::now() - started);
    EXPECT_TRUE(!sweep.running());
  }
  EXPECT_TRUE(slowest < std::chrono::seconds(1));

  slowest = Clock::duration::zero();
  for (int i = 0; i < 200; ++i) {
    TimerService timers;
    timers.schedule("confusion", std::chrono::seconds(45), []() {});
    const auto started = Clock::now();
    timers.stop();
    slowest = (std::max)(slowest, Clock::now() - started);
  }
  EXPECT_TRUE(slowest < std::chrono::seconds(1));

  auto fired = std::make_shared<std::atomic<int>>(0);
  TimerService timers;
  timers.schedule("soon", std::chrono::milliseconds(20), [fired]() { ++*fired; });
  timers.schedule("cancelled", std::chrono::milliseconds(20), [fired]() { *fired += 10; });
  EXPECT_TRUE(timers.cancel("cancelled"));
  EXPECT_TRUE(wait_until([&]() { return fired->load() == 1; }));
  timers.stop();
  timers.stop();
  EXPECT_EQ(fired->load(), 1);
  return 0;
}

}  // namespace

int main() {
  RUN_TEST(test_initialize_twice_is_rejected);
  RUN_TEST(test_missing_required_tool_fails_startup);
  RUN_TEST(test_unreachable_services_tolerated_without_required_tools);
  RUN_TEST(test_request_gets_correlated_response);
  RUN_TEST(test_timeout_names_the_message);
  RUN_TEST(test_per_message_timeout_overrides_config);
  RUN_TEST(test_unsupported_payload_becomes_error_reply);
  RUN_TEST(test_metrics_track_successes_and_failures);
  RUN_TEST(test_shutdown_unsubscribes);
  RUN_TEST(test_run_with_deadline_first_outcome_wins);
  RUN_TEST(test_background_loops_stop_promptly);

  std::cout << "OK\n";
  return 0;
}
