// dtxd-Prod headers
#include "core/Error.hpp"
#include "core/ProcessQueue.hpp"
#include "core/ShutdownCoordinator.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/DtxDevice.hpp"

// dtxd-Fake headers
#include "FakeDtxDevice.hpp"
#include "FakeProcessRunner.hpp"
#include "FakeService.hpp"
#include "LogCapture.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <csignal>
#include <optional>

#include <fcntl.h> // O_NONBLOCK, O_CLOEXEC
#include <unistd.h>

#include <boost/asio/io_context.hpp>

using namespace dtxd::core;
using namespace dtxd::test;
using namespace std::chrono_literals;

namespace {

  /// Keeps every job in flight until `finish()`.
  class HoldingRunner : public JobRunner {
  public:
    void run(const Job&, Completion done) override { held.push_back(std::move(done)); }
    void finish() {
      auto done = std::move(held.front());
      held.erase(held.begin());
      done(nullptr);
    }
    std::vector<Completion> held;
  };

  void pump(boost::asio::io_context& io) {
    io.restart();
    io.run_for(20ms);
  }

} // namespace

// --- ShutdownCoordinator -----------------------------------------------------

TEST(shutdown_coordinator, second_signal_forces_exit_with_its_number) {
  boost::asio::io_context io;
  LogCapture log;
  ProcessQueue queue(io);
  HoldingRunner runner;
  queue.start(runner, {});
  queue.trySubmit(DetachJob{});

  std::optional<int> exitCode;
  bool shutdownCalled = false, drained = false;
  ShutdownCoordinator shutdown(io, queue, [&](int code) { exitCode = code; });
  shutdown.onShutdown([&] { shutdownCalled = true; });
  shutdown.onDrained([&] { drained = true; });
  shutdown.start();
  pump(io); // job now in flight

  std::raise(SIGINT);
  pump(io);
  EXPECT_TRUE(shutdownCalled);
  EXPECT_TRUE(shutdown.draining());
  EXPECT_FALSE(exitCode);

  std::raise(SIGTERM);
  pump(io);
  ASSERT_TRUE(exitCode);
  EXPECT_EQ(*exitCode, 128 + SIGTERM);
  EXPECT_FALSE(drained);
  EXPECT_EQ(shutdown.phase(), ShutdownCoordinator::Phase::Terminated);
  EXPECT_TRUE(log.contains("shutting down..."));
  EXPECT_TRUE(log.contains("terminating..."));
}

TEST(shutdown_coordinator, drain_completes_without_forced_exit) {
  boost::asio::io_context io;
  ProcessQueue queue(io);
  HoldingRunner runner;
  queue.start(runner, {});
  queue.trySubmit(DetachJob{});

  std::optional<int> exitCode;
  bool drained = false;
  ShutdownCoordinator shutdown(io, queue, [&](int code) { exitCode = code; });
  shutdown.onDrained([&] { drained = true; });
  shutdown.start();
  pump(io);

  std::raise(SIGTERM);
  pump(io);
  EXPECT_FALSE(drained);

  runner.finish();
  pump(io);
  EXPECT_TRUE(drained);
  EXPECT_FALSE(exitCode);
  EXPECT_EQ(shutdown.phase(), ShutdownCoordinator::Phase::Terminated);
}

TEST(shutdown_coordinator, idle_queue_drains_on_first_signal) {
  boost::asio::io_context io;
  ProcessQueue queue(io);
  HoldingRunner runner;
  queue.start(runner, {});

  bool drained = false;
  ShutdownCoordinator shutdown(io, queue, [](int) { FAIL() << "unexpected forced exit"; });
  shutdown.onDrained([&] { drained = true; });
  shutdown.start();

  std::raise(SIGINT);
  pump(io);
  EXPECT_TRUE(drained);
}

// --- SystemCoordinator -------------------------------------------------------

class SystemCoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    config.attachDelay = 10s;
    coordinator = std::make_unique<SystemCoordinator>(io, config, device, service, runner,
                                                      [this](int code) { exitCode = code; });
    coordinator->errorMonitor().registerEscalation(escalation.AsStdFunction());
  }

  void pump() {
    io.restart();
    io.run_for(20ms);
  }

  boost::asio::io_context io;
  Config config;
  std::shared_ptr<FakeDtxDevice> device = std::make_shared<FakeDtxDevice>();
  std::shared_ptr<FakeService> service = std::make_shared<FakeService>();
  std::shared_ptr<FakeProcessRunner> runner = std::make_shared<FakeProcessRunner>(io);
  testing::MockFunction<void(const Error&)> escalation;
  std::optional<int> exitCode;
  LogCapture log;
  std::unique_ptr<SystemCoordinator> coordinator;
};

TEST_F(SystemCoordinatorTest, initialize_startsTasksAndPublishesDeviceMode) {
  device->opMode = OpMode::Studio;
  EXPECT_CALL(escalation, Call(testing::_)).Times(0);

  coordinator->initialize();
  EXPECT_TRUE(device->reading);
  EXPECT_TRUE(service->serving);
  EXPECT_TRUE(service->modes.empty()); // published from the loop

  pump();
  EXPECT_THAT(service->modes, testing::ElementsAre(OpMode::Studio));
}

TEST_F(SystemCoordinatorTest, deviceEvents_reachTheStateMachine) {
  coordinator->initialize();
  pump();

  device->emit(RawEvent{ 0x11, 0x0e, 0, 0 });
  EXPECT_EQ(coordinator->eventHandler().state(), State::Detaching);

  pump(); // no detach handler: latch opens straight away
  EXPECT_THAT(device->commands, testing::ElementsAre("latch_open"));
}

TEST_F(SystemCoordinatorTest, failingOpModeQuery_isFatal) {
  device->failCommands = true;
  EXPECT_CALL(escalation, Call(testing::Property(&Error::kind, ErrorKind::Runtime))).Times(1);

  coordinator->initialize();
  pump();
  EXPECT_TRUE(log.contains("Caused by: get-opmode failed"));
}

TEST_F(SystemCoordinatorTest, eventStreamEnd_isFatal) {
  EXPECT_CALL(escalation, Call(testing::Property(&Error::kind, ErrorKind::Io))).Times(1);

  coordinator->initialize();
  pump();
  device->fail(Error(ErrorKind::Io, "[DtxDevice] event stream failed: End of file"));
}

TEST_F(SystemCoordinatorTest, failingEventHandler_closesDeviceAndIsFatal) {
  EXPECT_CALL(escalation, Call(testing::Property(&Error::kind, ErrorKind::Runtime))).Times(1);

  coordinator->initialize();
  pump();
  device->emit(RawEvent{ 0x11, 0x0c, 1, 0 }); // Attaching, delayed job pending
  device->failCommands = true;
  device->emit(RawEvent{ 0x11, 0x0e, 0, 0 }); // latch-request echo fails

  EXPECT_TRUE(device->closed);
}

TEST_F(SystemCoordinatorTest, serviceEnd_isFatal) {
  EXPECT_CALL(escalation, Call(testing::Property(&Error::kind, ErrorKind::DBusService))).Times(1);

  coordinator->initialize();
  pump();
  service->fail(Error(ErrorKind::DBusService, "connection reset"));
}

TEST_F(SystemCoordinatorTest, jobFailure_isFatalWhileRunning) {
  runner->failSpawn = true;
  config.detachHandler = "/nonexistent/detach";
  coordinator = std::make_unique<SystemCoordinator>(io, config, device, service, runner,
                                                    [this](int code) { exitCode = code; });
  coordinator->errorMonitor().registerEscalation(escalation.AsStdFunction());
  EXPECT_CALL(escalation, Call(testing::Property(&Error::kind, ErrorKind::Process))).Times(1);

  coordinator->initialize();
  pump();
  device->emit(RawEvent{ 0x11, 0x0e, 0, 0 });
  pump();
}

TEST_F(SystemCoordinatorTest, signal_stopsSourcesDrainsAndStopsLoop) {
  EXPECT_CALL(escalation, Call(testing::_)).Times(0);
  coordinator->initialize();
  pump();

  std::raise(SIGTERM);
  io.restart();
  io.run_for(200ms);

  EXPECT_FALSE(device->reading);
  EXPECT_FALSE(device->closed);
  EXPECT_TRUE(service->stopped);
  EXPECT_TRUE(io.stopped());
  EXPECT_EQ(coordinator->shutdown().phase(), ShutdownCoordinator::Phase::Terminated);
  EXPECT_FALSE(exitCode);
}

TEST_F(SystemCoordinatorTest, jobFailureWhileDraining_isOnlyLogged) {
  config.detachHandler = "/etc/surface-dtx/detach.sh";
  coordinator = std::make_unique<SystemCoordinator>(io, config, device, service, runner,
                                                    [this](int code) { exitCode = code; });
  coordinator->errorMonitor().registerEscalation(escalation.AsStdFunction());
  EXPECT_CALL(escalation, Call(testing::_)).Times(0);

  coordinator->initialize();
  pump();
  device->emit(RawEvent{ 0x11, 0x0e, 0, 0 });
  pump();
  ASSERT_EQ(runner->running(), 1u);

  std::raise(SIGINT);
  pump();
  ASSERT_TRUE(coordinator->shutdown().draining());

  device->failCommands = true; // latch-open after the handler now fails
  runner->complete(0);
  pump();

  EXPECT_TRUE(log.contains("error while terminating"));
  EXPECT_TRUE(io.stopped());
}

TEST_F(SystemCoordinatorTest, drainedDetachJob_stillOpensLatch) {
  config.detachHandler = "/etc/surface-dtx/detach.sh";
  coordinator = std::make_unique<SystemCoordinator>(io, config, device, service, runner,
                                                    [this](int code) { exitCode = code; });
  coordinator->errorMonitor().registerEscalation(escalation.AsStdFunction());
  EXPECT_CALL(escalation, Call(testing::_)).Times(0);

  coordinator->initialize();
  pump();
  device->emit(RawEvent{ 0x11, 0x0e, 0, 0 });
  pump();
  ASSERT_EQ(runner->running(), 1u);

  std::raise(SIGINT);
  pump();
  ASSERT_TRUE(coordinator->shutdown().draining());
  EXPECT_FALSE(device->reading);

  runner->complete(0);
  pump();

  EXPECT_THAT(device->commands, testing::ElementsAre("latch_open"));
  EXPECT_FALSE(log.contains("error while terminating"));
  EXPECT_TRUE(io.stopped());
}

TEST_F(SystemCoordinatorTest, drainedAbortDecision_stillSendsLatchRequest) {
  config.detachHandler = "/etc/surface-dtx/detach.sh";
  coordinator = std::make_unique<SystemCoordinator>(io, config, device, service, runner,
                                                    [this](int code) { exitCode = code; });
  coordinator->errorMonitor().registerEscalation(escalation.AsStdFunction());

  coordinator->initialize();
  pump();
  device->emit(RawEvent{ 0x11, 0x0e, 0, 0 });
  pump();

  std::raise(SIGTERM);
  pump();
  runner->complete(1);
  pump();

  EXPECT_THAT(device->commands, testing::ElementsAre("latch_request"));
  EXPECT_TRUE(io.stopped());
}

// Real device node stand-in: the drained job must reach the ioctl, which a
// pipe rejects, instead of failing on a released descriptor.
TEST(system_coordinator, drain_keeps_device_descriptor_open) {
  int fds[2];
  ASSERT_EQ(0, pipe2(fds, O_NONBLOCK | O_CLOEXEC));

  boost::asio::io_context io;
  LogCapture log;
  Config config;
  config.detachHandler = "/etc/surface-dtx/detach.sh";
  auto device = std::make_shared<dtxd::io::SurfaceDtxDevice>(io, fds[0]);
  auto service = std::make_shared<FakeService>();
  auto runner = std::make_shared<FakeProcessRunner>(io);

  SystemCoordinator coordinator(io, config, device, service, runner, [](int) {});
  coordinator.errorMonitor().registerEscalation([](const Error&) {}); // get-opmode fails on a pipe
  coordinator.initialize();

  const unsigned char request[] = { 0x11, 0x0e, 0x00, 0x00 };
  ASSERT_EQ(static_cast<ssize_t>(sizeof(request)), write(fds[1], request, sizeof(request)));
  pump(io);
  ASSERT_EQ(runner->running(), 1u);

  std::raise(SIGINT);
  pump(io);
  runner->complete(0);
  pump(io);

  EXPECT_TRUE(log.contains("commencing detach, opening latch"));
  EXPECT_TRUE(log.contains("latch-open failed"));
  EXPECT_FALSE(log.contains("on closed device"));
  EXPECT_TRUE(io.stopped());
  ::close(fds[1]);
}
