#include "../mocks.hpp"

#include <lemu/common/exceptions.hpp>
#include <lemu/emulator/config.hpp>
#include <lemu/emulator/discovery.hpp>
#include <lemu/emulator/registry.hpp>
#include <lemu/emulator/worker.hpp>

#include <fstream>
#include <future>
#include <thread>

#include <gtest/gtest.h>

using invocation::ErrorKind;
using invocation::InvocationPtr;
using invocation::InvocationResult;
using function::State;

using poll_t = std::pair<InvocationPtr, std::optional<invocation::Error>>;

class RegistryTest : public ::testing::Test {
protected:
  RegistryTest() : workspace({"echo"}), cfg(workspace.config()) {}

  void start()
  {
    discovery = std::make_unique<discovery::Discovery>(cfg);
    workers = std::make_unique<worker::Workers>(cfg.workers);
    registry = std::make_unique<registry::Registry>(cfg, *discovery, builder, launcher, *workers);
  }

  void TearDown() override
  {
    registry.reset();
  }

  InvocationPtr make_invocation(
      const std::string& id, Slot<InvocationResult>& slot, const std::string& function = "echo"
  )
  {
    return std::make_shared<invocation::Invocation>(
        id, function, "{}", std::chrono::seconds{30},
        [&slot](InvocationResult&& result) { slot.set(std::move(result)); }
    );
  }

  void poll(Slot<poll_t>& slot, const std::string& function = "echo")
  {
    registry->next_invocation(
        function, [&slot](InvocationPtr inv, std::optional<invocation::Error> err) {
          slot.set(std::make_pair(std::move(inv), std::move(err)));
        }
    );
  }

  bool wait_for_state(
      State state, const std::string& function = "echo",
      std::chrono::milliseconds timeout = std::chrono::seconds{5}
  )
  {
    auto end = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < end) {
      if (registry->state(function) == state) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return false;
  }

  TemporaryWorkspace workspace;
  config::Config cfg;
  testing::NiceMock<MockBuilder> builder;
  FakeLauncher launcher;
  std::unique_ptr<discovery::Discovery> discovery;
  std::unique_ptr<worker::Workers> workers;
  std::unique_ptr<registry::Registry> registry;
};

TEST_F(RegistryTest, ColdStart)
{
  EXPECT_CALL(builder, build(testing::_)).WillOnce(testing::Return("/tmp/artifact/echo"));
  start();

  Slot<InvocationResult> result;
  registry->dispatch(make_invocation("1", result));

  ASSERT_TRUE(launcher.wait_launched(1));
  EXPECT_EQ(registry->state("echo"), State::STARTING);
  EXPECT_EQ(registry->find("echo")->pending(), 1);

  auto& spec = launcher.specs[0];
  EXPECT_EQ(spec.executable, "/tmp/artifact/echo");
  EXPECT_EQ(spec.working_directory, (workspace.root / "functions" / "echo").string());
  EXPECT_EQ(spec.environment.variables.at("AWS_LAMBDA_RUNTIME_API"), "127.0.0.1:9000/echo");
  EXPECT_EQ(spec.environment.variables.at("AWS_LAMBDA_FUNCTION_NAME"), "echo");

  Slot<poll_t> next;
  poll(next);
  ASSERT_TRUE(next.ready());
  auto [inv, err] = next.get();
  ASSERT_FALSE(err.has_value());
  ASSERT_NE(inv, nullptr);
  EXPECT_EQ(inv->id(), "1");
  EXPECT_EQ(registry->state("echo"), State::INVOKING);

  EXPECT_TRUE(registry->complete("echo", "1", InvocationResult::success("{\"ok\":true}")));
  ASSERT_TRUE(result.ready());
  auto res = result.get();
  EXPECT_TRUE(res.ok());
  EXPECT_EQ(res.payload, "{\"ok\":true}");
  EXPECT_EQ(registry->state("echo"), State::READY);
}

TEST_F(RegistryTest, FifoBeforeReadiness)
{
  EXPECT_CALL(builder, build(testing::_)).WillOnce(testing::Return("/tmp/artifact/echo"));
  start();

  Slot<InvocationResult> results[3];
  for (int i = 0; i < 3; ++i) {
    registry->dispatch(make_invocation(std::to_string(i), results[i]));
  }
  ASSERT_TRUE(launcher.wait_launched(1));

  for (int i = 0; i < 3; ++i) {

    Slot<poll_t> next;
    poll(next);
    ASSERT_TRUE(next.ready());
    auto [inv, err] = next.get();
    ASSERT_NE(inv, nullptr);
    EXPECT_EQ(inv->id(), std::to_string(i));

    registry->complete("echo", inv->id(), InvocationResult::success(std::to_string(i)));
    ASSERT_TRUE(results[i].ready());
    EXPECT_EQ(results[i].get().payload, std::to_string(i));
  }

  // A single process is started for all of them.
  EXPECT_EQ(launcher.launched(), 1);
}

TEST_F(RegistryTest, ParkedPoll)
{
  EXPECT_CALL(builder, build(testing::_)).WillOnce(testing::Return("/tmp/artifact/echo"));
  start();

  Slot<std::optional<invocation::Error>> ready;
  registry->ensure_ready("echo", [&ready](std::optional<invocation::Error> err) {
    ready.set(std::move(err));
  });
  ASSERT_TRUE(launcher.wait_launched(1));

  Slot<poll_t> next;
  poll(next);
  ASSERT_TRUE(ready.ready());
  EXPECT_FALSE(ready.get().has_value());

  // Nothing queued, the poll waits.
  EXPECT_FALSE(next.ready(std::chrono::milliseconds{50}));
  EXPECT_EQ(registry->state("echo"), State::READY);

  Slot<InvocationResult> result;
  registry->dispatch(make_invocation("late", result));
  ASSERT_TRUE(next.ready());
  EXPECT_EQ(next.get().first->id(), "late");
  EXPECT_EQ(registry->state("echo"), State::INVOKING);

  registry->shutdown();
  ASSERT_TRUE(result.ready());
  EXPECT_EQ(result.get().kind, ErrorKind::FUNCTION_UNAVAILABLE);
}

TEST_F(RegistryTest, UnknownFunction)
{
  start();

  Slot<InvocationResult> result;
  EXPECT_THROW(registry->dispatch(make_invocation("1", result, "missing")), lemu::common::UnknownFunction);
  EXPECT_THROW(registry->ensure_ready("../echo", [](auto) {}), lemu::common::UnknownFunction);

  // The process side cannot address functions that were never started.
  Slot<poll_t> next;
  EXPECT_THROW(poll(next, "missing"), lemu::common::UnknownFunction);
  EXPECT_THROW(
      registry->complete("missing", "1", InvocationResult::success("")), lemu::common::UnknownFunction
  );
}

TEST_F(RegistryTest, CompileError)
{
  EXPECT_CALL(builder, build(testing::_))
      .Times(2)
      .WillRepeatedly(testing::Throw(lemu::common::CompileError("echo", 1, "error: expected ';'")));
  start();

  for (int i = 0; i < 2; ++i) {
    Slot<InvocationResult> result;
    registry->dispatch(make_invocation(std::to_string(i), result));
    ASSERT_TRUE(result.ready());

    auto res = result.get();
    EXPECT_EQ(res.kind, ErrorKind::COMPILE_ERROR);
    EXPECT_EQ(res.outcome(), invocation::Outcome::TOOL_ERROR);
    EXPECT_NE(res.error.error_message.find("error: expected ';'"), std::string::npos);
    EXPECT_TRUE(wait_for_state(State::UNBUILT));
  }

  EXPECT_EQ(launcher.launched(), 0);
}

TEST_F(RegistryTest, LaunchFailure)
{
  EXPECT_CALL(builder, build(testing::_)).WillOnce(testing::Return("/nonexistent"));
  launcher.fail = true;
  start();

  Slot<InvocationResult> result;
  registry->dispatch(make_invocation("1", result));
  ASSERT_TRUE(result.ready());
  EXPECT_EQ(result.get().kind, ErrorKind::FUNCTION_UNAVAILABLE);
  EXPECT_EQ(registry->state("echo"), State::CRASHED);
  EXPECT_EQ(registry->find("echo")->crashes(), 1);
}

TEST_F(RegistryTest, CrashAndRetryBudget)
{
  cfg.lifecycle.retry_budget = 2;
  EXPECT_CALL(builder, build(testing::_)).WillOnce(testing::Return("/tmp/artifact/echo"));
  start();

  // Crash during an invocation.
  {
    Slot<InvocationResult> result;
    registry->dispatch(make_invocation("1", result));
    ASSERT_TRUE(launcher.wait_launched(1));

    Slot<poll_t> next;
    poll(next);
    ASSERT_TRUE(next.ready());

    launcher.process(0)->exit(1 << 8);
    ASSERT_TRUE(result.ready());
    auto res = result.get();
    EXPECT_EQ(res.kind, ErrorKind::FUNCTION_UNAVAILABLE);
    EXPECT_NE(res.error.error_message.find("exit status 1"), std::string::npos);
    EXPECT_EQ(registry->state("echo"), State::CRASHED);
    EXPECT_EQ(registry->find("echo")->crashes(), 1);
  }

  // Respawn without a rebuild, then crash again before the first poll.
  {
    Slot<InvocationResult> result;
    registry->dispatch(make_invocation("2", result));
    ASSERT_TRUE(launcher.wait_launched(2));

    launcher.process(1)->exit(SIGKILL);
    ASSERT_TRUE(result.ready());
    auto res = result.get();
    EXPECT_EQ(res.kind, ErrorKind::FUNCTION_UNAVAILABLE);
    EXPECT_EQ(registry->find("echo")->crashes(), 2);
  }

  // Budget exhausted, no further process.
  {
    Slot<InvocationResult> result;
    registry->dispatch(make_invocation("3", result));
    ASSERT_TRUE(result.ready());
    EXPECT_EQ(result.get().kind, ErrorKind::FUNCTION_UNAVAILABLE);
    EXPECT_EQ(launcher.launched(), 2);
  }
}

TEST_F(RegistryTest, InvalidateCrashed)
{
  cfg.lifecycle.retry_budget = 1;
  EXPECT_CALL(builder, build(testing::_)).WillOnce(testing::Return("/tmp/artifact/echo"));
  start();

  Slot<std::optional<invocation::Error>> ready;
  registry->ensure_ready("echo", [&ready](auto err) { ready.set(std::move(err)); });
  ASSERT_TRUE(launcher.wait_launched(1));
  Slot<poll_t> first;
  poll(first);
  ASSERT_TRUE(ready.ready());

  launcher.process(0)->exit(SIGSEGV);
  EXPECT_EQ(registry->find("echo")->crashes(), 1);

  // Crashed entries can be invalidated, which resets the counter.
  registry->invalidate("echo");
  EXPECT_EQ(registry->state("echo"), State::REBUILDING);
  EXPECT_EQ(registry->find("echo")->crashes(), 0);
}

TEST_F(RegistryTest, StartupTimeout)
{
  cfg.lifecycle.startup_timeout = 100;
  cfg.lifecycle.retry_budget = 0;
  EXPECT_CALL(builder, build(testing::_)).WillOnce(testing::Return("/tmp/artifact/echo"));
  start();

  Slot<InvocationResult> result;
  registry->dispatch(make_invocation("1", result));
  ASSERT_TRUE(launcher.wait_launched(1));

  ASSERT_TRUE(result.ready());
  EXPECT_EQ(result.get().kind, ErrorKind::STARTUP_TIMEOUT);
  EXPECT_EQ(registry->state("echo"), State::CRASHED);

  // The silent process is stopped in the background.
  auto proc = launcher.process(0);
  auto end = std::chrono::steady_clock::now() + std::chrono::seconds{5};
  while (!proc->terminated && std::chrono::steady_clock::now() < end) {
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }
  EXPECT_TRUE(proc->terminated);
}

TEST_F(RegistryTest, InitError)
{
  EXPECT_CALL(builder, build(testing::_)).WillOnce(testing::Return("/tmp/artifact/echo"));
  start();

  Slot<InvocationResult> results[2];
  registry->dispatch(make_invocation("1", results[0]));
  registry->dispatch(make_invocation("2", results[1]));
  ASSERT_TRUE(launcher.wait_launched(1));
  EXPECT_EQ(registry->find("echo")->pending(), 2);

  registry->init_error("echo", invocation::ErrorInfo{"Runtime.ConfigError", "missing variable", {}});

  // Every waiting invocation fails at once, none stays queued.
  for (auto& result : results) {
    ASSERT_TRUE(result.ready(std::chrono::milliseconds{100}));
    auto res = result.get();
    EXPECT_EQ(res.kind, ErrorKind::INITIALIZATION_ERROR);
    EXPECT_EQ(res.error.error_message, "Runtime.ConfigError: missing variable");
  }
  EXPECT_EQ(registry->state("echo"), State::CRASHED);
  EXPECT_EQ(registry->find("echo")->pending(), 0);
  EXPECT_EQ(registry->find("echo")->queued(), 0);

  // A late poll of the failed process is not served.
  Slot<poll_t> next;
  poll(next);
  ASSERT_TRUE(next.ready());
  auto [inv, err] = next.get();
  EXPECT_EQ(inv, nullptr);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, ErrorKind::FUNCTION_UNAVAILABLE);
  EXPECT_EQ(registry->state("echo"), State::CRASHED);
}

TEST_F(RegistryTest, UnknownInvocationId)
{
  EXPECT_CALL(builder, build(testing::_)).WillOnce(testing::Return("/tmp/artifact/echo"));
  start();

  Slot<InvocationResult> result;
  registry->dispatch(make_invocation("1", result));
  ASSERT_TRUE(launcher.wait_launched(1));
  Slot<poll_t> next;
  poll(next);
  ASSERT_TRUE(next.ready());

  EXPECT_THROW(
      registry->complete("echo", "2", InvocationResult::success("")),
      lemu::common::UnknownInvocationId
  );
  EXPECT_FALSE(result.ready(std::chrono::milliseconds{10}));

  EXPECT_TRUE(registry->complete("echo", "1", InvocationResult::success("done")));
  ASSERT_TRUE(result.ready());
  EXPECT_EQ(result.get().payload, "done");

  // Completed invocations cannot be completed twice.
  EXPECT_THROW(
      registry->complete("echo", "1", InvocationResult::success("")),
      lemu::common::UnknownInvocationId
  );
}

TEST_F(RegistryTest, LateResultDiscarded)
{
  EXPECT_CALL(builder, build(testing::_)).WillOnce(testing::Return("/tmp/artifact/echo"));
  start();

  Slot<InvocationResult> result;
  auto inv = make_invocation("1", result);
  registry->dispatch(inv);
  ASSERT_TRUE(launcher.wait_launched(1));
  Slot<poll_t> next;
  poll(next);
  ASSERT_TRUE(next.ready());

  EXPECT_TRUE(inv->fulfill(InvocationResult::failure(ErrorKind::TIMEOUT, "Task timed out")));
  EXPECT_FALSE(registry->complete("echo", "1", InvocationResult::success("late")));

  ASSERT_TRUE(result.ready());
  EXPECT_EQ(result.get().kind, ErrorKind::TIMEOUT);
  EXPECT_EQ(registry->state("echo"), State::READY);
}

TEST_F(RegistryTest, InvalidateIdle)
{
  EXPECT_CALL(builder, build(testing::_))
      .Times(2)
      .WillRepeatedly(testing::Return("/tmp/artifact/echo"));
  start();

  Slot<std::optional<invocation::Error>> ready;
  registry->ensure_ready("echo", [&ready](auto err) { ready.set(std::move(err)); });
  ASSERT_TRUE(launcher.wait_launched(1));

  Slot<poll_t> parked;
  poll(parked);
  ASSERT_TRUE(ready.ready());

  registry->invalidate("echo");
  EXPECT_EQ(registry->state("echo"), State::REBUILDING);

  // The parked poll is released with an error and the process is stopped.
  ASSERT_TRUE(parked.ready());
  EXPECT_TRUE(parked.get().second.has_value());

  // The next request rebuilds and starts a new process.
  Slot<InvocationResult> result;
  registry->dispatch(make_invocation("1", result));
  ASSERT_TRUE(launcher.wait_launched(2));
  EXPECT_TRUE(launcher.process(0)->terminated);
  EXPECT_GT(registry->find("echo")->generation(), 1);

  Slot<poll_t> next;
  poll(next);
  ASSERT_TRUE(next.ready());
  EXPECT_EQ(next.get().first->id(), "1");

  registry->shutdown();
  EXPECT_TRUE(result.ready());
}

TEST_F(RegistryTest, InvalidateDuringInvocation)
{
  EXPECT_CALL(builder, build(testing::_)).WillOnce(testing::Return("/tmp/artifact/echo"));
  start();

  Slot<InvocationResult> result;
  registry->dispatch(make_invocation("1", result));
  ASSERT_TRUE(launcher.wait_launched(1));
  Slot<poll_t> next;
  poll(next);
  ASSERT_TRUE(next.ready());

  registry->invalidate("echo");
  // The running invocation is not interrupted.
  EXPECT_EQ(registry->state("echo"), State::INVOKING);
  EXPECT_TRUE(registry->find("echo")->stale());
  EXPECT_FALSE(result.ready(std::chrono::milliseconds{10}));

  EXPECT_TRUE(registry->complete("echo", "1", InvocationResult::success("old")));
  ASSERT_TRUE(result.ready());
  EXPECT_EQ(result.get().payload, "old");
  EXPECT_EQ(registry->state("echo"), State::REBUILDING);
}

TEST_F(RegistryTest, Functions)
{
  workspace.add_function("another");
  start();

  auto functions = registry->functions();
  ASSERT_EQ(functions.size(), 2);
  EXPECT_EQ(functions[0].first, "another");
  EXPECT_EQ(functions[0].second, State::UNBUILT);
  EXPECT_EQ(functions[1].first, "echo");

  EXPECT_FALSE(registry->state("another").has_value());
}

TEST_F(RegistryTest, Shutdown)
{
  EXPECT_CALL(builder, build(testing::_)).WillOnce(testing::Return("/tmp/artifact/echo"));
  start();

  Slot<InvocationResult> result;
  registry->dispatch(make_invocation("1", result));
  ASSERT_TRUE(launcher.wait_launched(1));

  registry->shutdown();
  ASSERT_TRUE(result.ready());
  auto res = result.get();
  EXPECT_EQ(res.kind, ErrorKind::FUNCTION_UNAVAILABLE);
  EXPECT_EQ(res.error.error_message, "Emulator is shutting down");
  EXPECT_TRUE(launcher.process(0)->terminated);

  Slot<InvocationResult> rejected;
  registry->dispatch(make_invocation("2", rejected));
  ASSERT_TRUE(rejected.ready());
  EXPECT_EQ(rejected.get().kind, ErrorKind::FUNCTION_UNAVAILABLE);
}

TEST_F(RegistryTest, IndependentFunctions)
{
  // A single pool thread; builds must not queue behind each other.
  cfg.workers.threads = 1;
  workspace.add_function("resize");

  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  EXPECT_CALL(builder, build(testing::Field(&builder::BuildRequest::function, "echo")))
      .WillOnce([released](const builder::BuildRequest&) {
        released.wait();
        return std::string{"/tmp/artifact/echo"};
      });
  EXPECT_CALL(builder, build(testing::Field(&builder::BuildRequest::function, "resize")))
      .WillOnce(testing::Return("/tmp/artifact/resize"));
  start();

  Slot<InvocationResult> stuck;
  registry->dispatch(make_invocation("e1", stuck, "echo"));
  EXPECT_TRUE(wait_for_state(State::BUILDING, "echo"));

  // The second function is built, started and invoked while the first one builds.
  Slot<InvocationResult> first;
  registry->dispatch(make_invocation("r1", first, "resize"));
  ASSERT_TRUE(launcher.wait_launched(1));
  EXPECT_EQ(launcher.specs[0].function, "resize");

  Slot<poll_t> next;
  poll(next, "resize");
  ASSERT_TRUE(next.ready());
  EXPECT_EQ(next.get().first->id(), "r1");
  EXPECT_TRUE(registry->complete("resize", "r1", InvocationResult::success("resized")));
  ASSERT_TRUE(first.ready());
  EXPECT_EQ(first.get().payload, "resized");
  EXPECT_EQ(registry->state("echo"), State::BUILDING);
  EXPECT_FALSE(stuck.ready(std::chrono::milliseconds{10}));

  // Now the first function is stuck in an invocation instead.
  release.set_value();
  ASSERT_TRUE(launcher.wait_launched(2));
  Slot<poll_t> echo_next;
  poll(echo_next, "echo");
  ASSERT_TRUE(echo_next.ready());
  EXPECT_EQ(echo_next.get().first->id(), "e1");
  EXPECT_EQ(registry->state("echo"), State::INVOKING);

  Slot<InvocationResult> second;
  registry->dispatch(make_invocation("r2", second, "resize"));
  Slot<poll_t> resize_next;
  poll(resize_next, "resize");
  ASSERT_TRUE(resize_next.ready());
  EXPECT_EQ(resize_next.get().first->id(), "r2");
  EXPECT_TRUE(registry->complete("resize", "r2", InvocationResult::success("again")));
  ASSERT_TRUE(second.ready());
  EXPECT_EQ(second.get().payload, "again");

  EXPECT_FALSE(stuck.ready(std::chrono::milliseconds{10}));
  EXPECT_TRUE(registry->complete("echo", "e1", InvocationResult::success("late")));
  ASSERT_TRUE(stuck.ready());
  EXPECT_EQ(stuck.get().payload, "late");
}

TEST_F(RegistryTest, InvalidateKeepsOtherFunctions)
{
  workspace.add_function("resize");
  EXPECT_CALL(builder, build(testing::_))
      .Times(2)
      .WillRepeatedly([](const builder::BuildRequest& req) { return "/tmp/artifact/" + req.function; });
  start();

  Slot<std::optional<invocation::Error>> echo_ready;
  registry->ensure_ready("echo", [&](auto err) { echo_ready.set(std::move(err)); });
  ASSERT_TRUE(launcher.wait_launched(1));
  Slot<poll_t> echo_parked;
  poll(echo_parked, "echo");
  ASSERT_TRUE(echo_ready.ready());

  Slot<std::optional<invocation::Error>> resize_ready;
  registry->ensure_ready("resize", [&](auto err) { resize_ready.set(std::move(err)); });
  ASSERT_TRUE(launcher.wait_launched(2));
  Slot<poll_t> resize_parked;
  poll(resize_parked, "resize");
  ASSERT_TRUE(resize_ready.ready());

  registry->invalidate("echo");
  EXPECT_EQ(registry->state("echo"), State::REBUILDING);
  ASSERT_TRUE(echo_parked.ready());

  EXPECT_EQ(registry->state("resize"), State::READY);
  EXPECT_FALSE(resize_parked.ready(std::chrono::milliseconds{50}));
  EXPECT_FALSE(launcher.process(1)->terminated);
  EXPECT_EQ(launcher.specs[1].function, "resize");

  registry->shutdown();
  EXPECT_TRUE(resize_parked.ready());
}

TEST_F(RegistryTest, InvalidateUnchangedSources)
{
  EXPECT_CALL(builder, build(testing::_)).WillOnce(testing::Return("/tmp/artifact/echo"));
  start();

  auto source = workspace.root / "functions" / "echo" / "main.cpp";
  std::ofstream{source} << "int main() {}";

  Slot<std::optional<invocation::Error>> ready;
  registry->ensure_ready("echo", [&ready](auto err) { ready.set(std::move(err)); });
  ASSERT_TRUE(launcher.wait_launched(1));
  Slot<poll_t> parked;
  poll(parked);
  ASSERT_TRUE(ready.ready());
  EXPECT_FALSE(registry->find("echo")->fingerprint().empty());

  // A notification for sources already built does not restart the process.
  EXPECT_FALSE(registry->invalidate_changed("echo"));
  EXPECT_EQ(registry->state("echo"), State::READY);
  EXPECT_FALSE(parked.ready(std::chrono::milliseconds{10}));

  std::ofstream{source} << "int main() { return 1; }";
  EXPECT_TRUE(registry->invalidate_changed("echo"));
  EXPECT_EQ(registry->state("echo"), State::REBUILDING);
  ASSERT_TRUE(parked.ready());

  // Functions never resolved are not affected.
  EXPECT_FALSE(registry->invalidate_changed("resize"));
}

TEST_F(RegistryTest, ShutdownSkipsPendingBuild)
{
  // Only the first build may run.
  EXPECT_CALL(builder, build(testing::_)).WillOnce(testing::Return("/tmp/artifact/echo"));
  start();

  Slot<std::optional<invocation::Error>> ready;
  registry->ensure_ready("echo", [&ready](auto err) { ready.set(std::move(err)); });
  ASSERT_TRUE(launcher.wait_launched(1));
  Slot<poll_t> parked;
  poll(parked);
  ASSERT_TRUE(ready.ready());

  // The old process does not stop until released; the rebuild waits for it.
  std::promise<void> release;
  launcher.process(0)->hold = release.get_future().share();

  registry->invalidate("echo");
  Slot<InvocationResult> result;
  registry->dispatch(make_invocation("1", result));
  EXPECT_EQ(registry->state("echo"), State::BUILDING);

  auto stopping = std::async(std::launch::async, [this]() { registry->shutdown(); });
  ASSERT_TRUE(result.ready());
  EXPECT_EQ(result.get().kind, ErrorKind::FUNCTION_UNAVAILABLE);

  release.set_value();
  ASSERT_EQ(stopping.wait_for(std::chrono::seconds{5}), std::future_status::ready);
  EXPECT_EQ(launcher.launched(), 1);
}

TEST_F(RegistryTest, ConcurrentResolveAndTraversal)
{
  std::vector<std::string> names;
  for (int i = 0; i < 32; ++i) {
    names.emplace_back("fn" + std::to_string(i));
    workspace.add_function(names.back());
  }
  start();

  std::atomic<bool> done{false};
  std::thread resolver{[&]() {
    for (const auto& name : names) {
      registry->resolve(name);
    }
    done = true;
  }};

  // Listing and invalidation run on other threads while entries are inserted.
  while (!done) {
    registry->invalidate_all();
    EXPECT_EQ(registry->functions().size(), names.size() + 1);
  }
  resolver.join();

  for (const auto& name : names) {
    EXPECT_EQ(registry->state(name), State::UNBUILT);
  }
}
