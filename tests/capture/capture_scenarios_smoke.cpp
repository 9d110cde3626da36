#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "backends/webcam/testing/scripted_camera_driver.hpp"
#include "backends/webcam/testing/scripted_frame_writer.hpp"
#include "capture/capture_orchestrator.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using camshot::backends::webcam::testing::ScriptedCameraDriver;
using camshot::backends::webcam::testing::ScriptedDevice;
using camshot::backends::webcam::testing::ScriptedFrameWriter;
using camshot::backends::webcam::testing::ScriptedRead;
using camshot::backends::webcam::testing::ScriptedWrite;
using camshot::capture::CaptureOrchestrator;
using camshot::capture::CaptureResult;
using camshot::capture::CaptureState;
using camshot::config::CaptureConfig;
using camshot::core::errors::CaptureErrorCode;
using camshot::core::logging::Logger;
using camshot::core::logging::LogLevel;
using camshot::tests::common::AssertContains;
using camshot::tests::common::Fail;
using camshot::tests::common::ListFilesWithExtension;
using camshot::tests::common::ScopedTempDir;

constexpr const char* kScenarioFilename = "host_aa-bb-cc-dd-ee-ff_alice_20240101_120000_000.jpg";

CaptureConfig FastConfig(const fs::path& output_dir, std::uint32_t max_devices) {
  CaptureConfig config;
  config.output_dir = output_dir;
  config.max_devices = max_devices;
  config.read_attempts = 3U;
  config.validation_retry_delay = std::chrono::milliseconds(0);
  config.capture_retry_delay = std::chrono::milliseconds(0);
  config.settle_delay = std::chrono::milliseconds(0);
  config.verify_settle_delay = std::chrono::milliseconds(0);
  return config;
}

ScriptedDevice HealthyDevice() {
  ScriptedDevice device;
  device.openable = true;
  device.reads = {{.kind = ScriptedRead::Kind::kFrame}, {.kind = ScriptedRead::Kind::kFrame}};
  return device;
}

std::size_t CountLines(const std::string& text, const std::string& needle) {
  std::size_t count = 0U;
  for (std::size_t pos = text.find(needle); pos != std::string::npos;
       pos = text.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

void RequireFinalState(const CaptureOrchestrator& orchestrator, CaptureState expected) {
  const auto& transitions = orchestrator.transitions();
  if (transitions.empty() || transitions.front().state != CaptureState::kIdle) {
    Fail("expected state machine to start in idle");
  }
  if (transitions.back().state != expected) {
    Fail(std::string("unexpected final state: ") +
         camshot::capture::ToString(transitions.back().state));
  }
}

// No camera at any index.
void ScenarioNoDevices() {
  ScopedTempDir temp("camshot-scenario-a");
  std::ostringstream log_out;
  Logger logger(LogLevel::kDebug, log_out);
  ScriptedCameraDriver driver;
  ScriptedFrameWriter writer;

  CaptureOrchestrator orchestrator(FastConfig(temp.path(), 5U), driver, writer,
                                   []() { return std::string(kScenarioFilename); }, logger);
  const CaptureResult result = orchestrator.Run();

  if (result.success || result.file_path.has_value() || result.device_index.has_value()) {
    Fail("expected failed result without device or path");
  }
  if (result.fatal || result.interrupted) {
    Fail("expected a plain exhausted outcome");
  }
  if (result.error_code != CaptureErrorCode::kNoDeviceFound) {
    Fail("expected NO_DEVICE_FOUND outcome");
  }
  if (driver.stats().open_attempts != std::vector<std::size_t>{0U, 1U, 2U, 3U, 4U}) {
    Fail("expected open attempts on indices 0..4 in order");
  }
  if (orchestrator.open_attempts() != 5U || result.devices_tried != 5U) {
    Fail("expected exactly five open attempts");
  }
  if (CountLines(log_out.str(), "msg=\"probing camera\"") != 5U) {
    Fail("expected five logged open attempts");
  }
  if (driver.stats().currently_open != 0U) {
    Fail("expected no device handle left open");
  }
  if (!writer.attempted_paths().empty()) {
    Fail("expected no write attempt without a camera");
  }
  if (!ListFilesWithExtension(temp.path(), ".jpg").empty()) {
    Fail("expected no image file");
  }
  RequireFinalState(orchestrator, CaptureState::kExhausted);
  AssertContains(log_out.str(), "error_code=\"NO_DEVICE_FOUND\"");
}

// Only index 2 works and produces a 15 KB file.
void ScenarioThirdIndexSucceeds() {
  ScopedTempDir temp("camshot-scenario-b");
  std::ostringstream log_out;
  Logger logger(LogLevel::kDebug, log_out);
  ScriptedCameraDriver driver({{2U, HealthyDevice()}});
  ScriptedFrameWriter writer({{.kind = ScriptedWrite::Kind::kWrite, .bytes = 15U * 1024U}});

  CaptureConfig config = FastConfig(temp.path(), 5U);
  config.jpeg_quality = 85;
  CaptureOrchestrator orchestrator(config, driver, writer,
                                   []() { return std::string(kScenarioFilename); }, logger);
  const CaptureResult result = orchestrator.Run();

  if (!result.success) {
    Fail("expected capture to succeed on index 2: " + result.error);
  }
  if (result.device_index != std::optional<std::size_t>(2U)) {
    Fail("expected device index 2");
  }
  if (!result.file_path.has_value() || result.file_path->filename() != kScenarioFilename) {
    Fail("expected result path to end in the generated filename");
  }
  if (!result.file_path->is_absolute()) {
    Fail("expected an absolute result path");
  }
  if (result.file_size_bytes != 15U * 1024U) {
    Fail("expected a 15 KB file size in the result");
  }
  if (result.error_code.has_value() || !result.error.empty()) {
    Fail("expected no error on success");
  }
  if (driver.stats().open_attempts != std::vector<std::size_t>{0U, 1U, 2U}) {
    Fail("expected probing to stop at the first working index");
  }
  if (writer.qualities() != std::vector<int>{85}) {
    Fail("expected a single write at the configured quality");
  }
  const auto files = ListFilesWithExtension(temp.path(), ".jpg");
  if (files.size() != 1U || files.front().filename() != kScenarioFilename) {
    Fail("expected exactly one image file in the output directory");
  }
  if (driver.stats().currently_open != 0U || driver.stats().effective_releases != 1U) {
    Fail("expected the successful device to be released exactly once");
  }
  if (driver.stats().max_concurrently_open != 1U) {
    Fail("expected at most one device open at a time");
  }
  RequireFinalState(orchestrator, CaptureState::kSucceeded);
  AssertContains(log_out.str(), "level=SUCCESS");
  AssertContains(log_out.str(), "size_kb=\"15.0\"");
}

// Index 0 validates but the write is refused; index 1 is tried next.
void ScenarioPermissionDeniedAdvances() {
  ScopedTempDir temp("camshot-scenario-c");
  std::ostringstream log_out;
  Logger logger(LogLevel::kDebug, log_out);
  ScriptedCameraDriver driver({{0U, HealthyDevice()}});
  ScriptedFrameWriter writer({{.kind = ScriptedWrite::Kind::kThrowPermissionDenied}});

  CaptureOrchestrator orchestrator(FastConfig(temp.path(), 2U), driver, writer,
                                   []() { return std::string(kScenarioFilename); }, logger);
  const CaptureResult result = orchestrator.Run();

  if (result.success || result.fatal) {
    Fail("expected non-fatal failure after the write was refused");
  }
  if (driver.stats().open_attempts != std::vector<std::size_t>{0U, 1U}) {
    Fail("expected index 1 to be opened after the write failure on index 0");
  }
  if (writer.attempted_paths().size() != 1U) {
    Fail("expected the failed write not to be retried on the same device");
  }
  if (driver.stats().currently_open != 0U) {
    Fail("expected device 0 released after the write failure");
  }
  if (!ListFilesWithExtension(temp.path(), ".jpg").empty()) {
    Fail("expected no image file");
  }
  RequireFinalState(orchestrator, CaptureState::kExhausted);
  AssertContains(log_out.str(), "msg=\"image write failed\"");
  AssertContains(log_out.str(), "error_code=\"PERSISTENCE_FAILED\"");
}

// Memory runs out during the capture read on index 1.
void ScenarioOutOfMemoryAborts() {
  ScopedTempDir temp("camshot-scenario-d");
  std::ostringstream log_out;
  Logger logger(LogLevel::kDebug, log_out);

  ScriptedDevice exhausted;
  exhausted.openable = true;
  exhausted.reads = {{.kind = ScriptedRead::Kind::kFrame},
                     {.kind = ScriptedRead::Kind::kOutOfMemory}};
  ScriptedCameraDriver driver({{1U, exhausted}, {2U, HealthyDevice()}, {3U, HealthyDevice()}});
  ScriptedFrameWriter writer;

  CaptureOrchestrator orchestrator(FastConfig(temp.path(), 5U), driver, writer,
                                   []() { return std::string(kScenarioFilename); }, logger);
  const CaptureResult result = orchestrator.Run();

  if (result.success || !result.fatal) {
    Fail("expected a fatal failure");
  }
  if (result.error_code != CaptureErrorCode::kResourceExhaustion) {
    Fail("expected RESOURCE_EXHAUSTED outcome");
  }
  if (driver.stats().open_attempts != std::vector<std::size_t>{0U, 1U}) {
    Fail("expected no device beyond index 1 to be opened");
  }
  if (driver.stats().currently_open != 0U) {
    Fail("expected device 1 released while unwinding");
  }
  if (!writer.attempted_paths().empty()) {
    Fail("expected no write after the out-of-memory abort");
  }
  RequireFinalState(orchestrator, CaptureState::kAborted);
  AssertContains(result.error, "RESOURCE_EXHAUSTED");
  AssertContains(log_out.str(), "msg=\"memory exhausted, aborting capture run\"");
  AssertContains(log_out.str(), "device_index=\"1\"");
}

} // namespace

int main() {
  ScenarioNoDevices();
  ScenarioThirdIndexSucceeds();
  ScenarioPermissionDeniedAdvances();
  ScenarioOutOfMemoryAborts();

  std::cout << "capture_scenarios_smoke: ok\n";
  return 0;
}
