// ============================================================================
// RATE TABLE CONTROLLER - single-axis rate table test runner
// ============================================================================
// Homes the table, positions it (stationary) or configures an oscillation
// (sinusoid), waits for the operator, samples the encoder at a fixed rate to
// CSV, then stops the table and writes a JSON run summary.
//
// Usage: ratetable [settings.json]     (default: ratetable.json)
// Exit:  0 = completed, 130 = aborted by operator, 1 = failed
// ============================================================================

// ============================================================================
// LIBRARIES
// ============================================================================
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <poll.h>
#include <unistd.h>

// ============================================================================
// PROJECT HEADERS
// ============================================================================
#include "core/Config.h"
#include "core/Types.h"
#include "core/Format.h"
#include "core/UtilityEngine.h"
#include "core/Clock.h"
#include "core/CancellationController.h"
#include "core/recording/RecordSink.h"
#include "core/settings/SettingsLoader.h"

#include "hardware/SerialTransport.h"

#include "communication/CommandProtocol.h"
#include "communication/StatusReporter.h"

#include "movement/AcquisitionLoop.h"
#include "movement/MotionSequencer.h"
#include "movement/OperatorRendezvous.h"

// ============================================================================
// EXIT CODES
// ============================================================================
constexpr int EXIT_RUN_COMPLETED = 0;
constexpr int EXIT_RUN_FAILED = 1;
constexpr int EXIT_RUN_ABORTED = 130;   // Shell convention for SIGINT

constexpr double TWO_PI = 6.283185307179586;

// ============================================================================
// HELPERS
// ============================================================================

void printUsage(const char* program) {
  std::cout << "Usage: " << program << " [settings.json]\n"
            << "  Runs one rate table test. Settings default to " << DEFAULT_SETTINGS_FILE
            << " (built-in defaults if absent).\n";
}

void printBanner(const RunSettings& settings) {
  const TestProfile& p = settings.profile;
  engine->info("==================================================");
  engine->info("RATE TABLE " + std::string(p.isSinusoid() ? "SINUSOIDAL" : "STATIONARY") + " TEST");
  engine->info("==================================================");

  if (p.isSinusoid()) {
    double peakVelocity = TWO_PI * p.amplitudeDeg * p.frequencyHz;
    engine->info("Amplitude: " + toCompact(p.amplitudeDeg) + " deg | Freq: " + toCompact(p.frequencyHz) +
                 " Hz | Cycles: " + std::to_string(p.cycleCount));
    engine->info("Peak velocity: " + toFixed(peakVelocity, 1) + " deg/s | Duration: " +
                 toFixed(p.effectiveDurationSec(), 1) + " s");
  } else {
    engine->info("Target: " + toCompact(p.targetPositionDeg) + " deg | Duration: " +
                 toFixed(p.effectiveDurationSec(), 1) + " s");
  }
  engine->info("Sampling: " + toFixed(1.0 / p.samplePeriodSec, 2) + " Hz | Port: " + settings.serial.port +
               " @ " + std::to_string(settings.serial.baudRate));
}

/**
 * Operator console: any line on stdin releases the rendezvous
 * Polls so it can notice shutdown without a keypress
 */
void consoleReader(OperatorRendezvous& rendezvous, CancellationController& cancel, std::atomic<bool>& done) {
  char buf[128];

  while (!done && !cancel.isCancelled()) {
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int rc = ::poll(&pfd, 1, 100);
    if (rc < 0) {
      if (errno == EINTR) continue;
      engine->error("[Console] ❌ stdin poll failed: " + std::string(std::strerror(errno)));
      return;
    }
    if (rc == 0) continue;

    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      engine->error("[Console] ❌ stdin read failed: " + std::string(std::strerror(errno)));
      return;
    }
    if (n == 0) {
      engine->warn("[Console] ⚠️ stdin closed: use Ctrl+C to abort, the run cannot be started from here");
      return;
    }

    if (std::memchr(buf, '\n', static_cast<size_t>(n)) != nullptr && rendezvous.isAwaiting()) {
      rendezvous.resume();
    }
  }
}

int exitCodeFor(const RunReport& report) {
  switch (report.outcome) {
    case TerminalOutcome::OUTCOME_COMPLETED: return EXIT_RUN_COMPLETED;
    case TerminalOutcome::OUTCOME_ABORTED:   return EXIT_RUN_ABORTED;
    default:                                 return EXIT_RUN_FAILED;
  }
}

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char* argv[]) {
  // Console logging is available before initialize()
  UtilityEngine utilityEngine;
  engine = &utilityEngine;

  // Must precede every std::thread: the mask is inherited
  if (!CancellationController::blockTerminationSignals()) {
    return EXIT_RUN_FAILED;
  }

  if (argc > 2 || (argc == 2 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0))) {
    printUsage(argv[0]);
    return argc > 2 ? EXIT_RUN_FAILED : EXIT_RUN_COMPLETED;
  }

  // ==========================================================================
  // SETTINGS & ENGINE
  // ==========================================================================
  const std::string settingsPath = (argc == 2) ? argv[1] : DEFAULT_SETTINGS_FILE;
  RunSettings settings;
  std::string err;

  if (!SettingsLoader::loadFile(settingsPath, settings, err)) {
    engine->error("[Main] ❌ Settings: " + err);
    return EXIT_RUN_FAILED;
  }

  engine->setLogLevel(settings.logLevel);
  if (!engine->initialize(settings.dataDirectory, settings.fileLogging)) {
    return EXIT_RUN_FAILED;
  }

  printBanner(settings);

  CancellationController cancel;
  if (!cancel.startSignalWatcher()) {
    engine->shutdown();
    return EXIT_RUN_FAILED;
  }

  // ==========================================================================
  // HARDWARE LINK
  // ==========================================================================
  SerialTransport transport(settings.serial);
  if (!transport.open(err)) {
    engine->error("[Main] ❌ " + err);
    cancel.stopSignalWatcher();
    engine->shutdown();
    return EXIT_RUN_FAILED;
  }

  SteadyClock clock;
  CommandProtocol protocol(transport, clock,
                           std::chrono::milliseconds(settings.serial.responseTimeoutMs),
                           std::chrono::milliseconds(settings.serial.queryTimeoutMs));

  // ==========================================================================
  // RECORDING
  // ==========================================================================
  RecordSink sink;
  const std::string csvPath = engine->resolvePath(settings.outputFile);
  if (!sink.open(csvPath, settings.csvFlushEvery, err)) {
    engine->error("[Main] ❌ " + err);
    transport.close();
    cancel.stopSignalWatcher();
    engine->shutdown();
    return EXIT_RUN_FAILED;
  }

  const uint64_t expectedBytes = CSV_BYTES_PER_ROW_ESTIMATE *
      AcquisitionLoop::plannedTicks(settings.profile.samplePeriodSec, settings.profile.effectiveDurationSec());
  if (engine->getAvailableBytes() < expectedBytes) {
    engine->warn("[Main] ⚠️ Low disk space: " + std::to_string(engine->getAvailableBytes() / 1024) +
                 " KB free, run needs ~" + std::to_string(expectedBytes / 1024) + " KB");
  }

  // ==========================================================================
  // OPERATOR CONSOLE
  // ==========================================================================
  OperatorRendezvous rendezvous;
  rendezvous.setOnReady([](const TestProfile&) {
    engine->info("*** Start your IMU logging now ***");
    engine->info("Press ENTER to start the test (Ctrl+C to abort)...");
  });

  std::atomic<bool> consoleDone(false);
  std::thread console(consoleReader, std::ref(rendezvous), std::ref(cancel), std::ref(consoleDone));

  // ==========================================================================
  // RUN
  // ==========================================================================
  MotionSequencer sequencer(protocol, clock, cancel, rendezvous, settings.timing);
  RunReport report;

  try {
    report = sequencer.run(settings.profile, sink);
  } catch (const std::exception& e) {
    report.outcome = TerminalOutcome::OUTCOME_FAILED;
    report.lastActiveState = sequencer.getState();
    report.message = std::string("Unexpected error: ") + e.what();
    engine->error("[Main] ❌ " + report.message);
  }

  // Sequencer never reached STOPPING: the table still gets its STOP
  if (cancel.claimFinalStop()) {
    engine->warn("[Main] ⚠️ Issuing safety STOP");
    CommandResult stop = protocol.stop();
    report.stop = stop.ok() ? StopOutcome::STOP_ACKNOWLEDGED : StopOutcome::STOP_FAILED;
  }
  sink.seal();

  // ==========================================================================
  // SHUTDOWN
  // ==========================================================================
  consoleDone = true;
  console.join();
  transport.close();

  StatusReporter& reporter = StatusReporter::getInstance();
  reporter.logReport(report);
  if (!reporter.saveSummary(settings.profile, report, settings.outputFile, err)) {
    engine->warn("[Main] ⚠️ Summary not written: " + err);
  }

  cancel.stopSignalWatcher();
  engine->shutdown();

  return exitCodeFor(report);
}
