#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "backends/webcam/opencv_bootstrap.hpp"
#include "backends/webcam/opencv_frame_writer.hpp"
#include "backends/webcam/testing/scripted_camera_driver.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using camshot::backends::FrameSample;
using camshot::backends::webcam::IsOpenCvBootstrapEnabled;
using camshot::backends::webcam::OpenCvFrameWriter;
using camshot::backends::webcam::OpenCvNotAvailableError;
using camshot::backends::webcam::testing::MakeScriptedFrame;
using camshot::tests::common::AssertContains;
using camshot::tests::common::Fail;
using camshot::tests::common::ReadFileToString;
using camshot::tests::common::ScopedTempDir;

void TestWriteLeavesFrameUntouched() {
  ScopedTempDir temp("camshot-opencv-writer");
  const FrameSample frame = MakeScriptedFrame(64, 48);
  const std::vector<std::uint8_t> original_pixels = frame.pixels;
  const fs::path path = temp.path() / "frame.jpg";

  OpenCvFrameWriter writer;
  std::string error;
  const bool written = writer.WriteJpeg(frame, path, 90, error);

  if (frame.pixels != original_pixels) {
    Fail("expected the source frame to be left unchanged by the writer");
  }
  if (!IsOpenCvBootstrapEnabled()) {
    if (written || error != OpenCvNotAvailableError()) {
      Fail("expected a not-available error without OpenCV");
    }
    return;
  }
  if (!written) {
    Fail("expected the JPEG write to succeed: " + error);
  }
  const std::string bytes = ReadFileToString(path);
  if (bytes.size() < 2U || static_cast<unsigned char>(bytes[0]) != 0xFFU ||
      static_cast<unsigned char>(bytes[1]) != 0xD8U) {
    Fail("expected a JPEG start-of-image marker");
  }
}

void TestGeometryMismatchIsRejected() {
  ScopedTempDir temp("camshot-opencv-writer-geometry");
  FrameSample frame = MakeScriptedFrame(16, 16);
  frame.pixels.resize(frame.pixels.size() - 3U);

  OpenCvFrameWriter writer;
  std::string error;
  if (writer.WriteJpeg(frame, temp.path() / "bad.jpg", 90, error)) {
    Fail("expected a short pixel buffer to be rejected");
  }
  AssertContains(error, "does not match geometry");
  if (fs::exists(temp.path() / "bad.jpg")) {
    Fail("expected no file for a rejected frame");
  }
}

} // namespace

int main() {
  TestWriteLeavesFrameUntouched();
  TestGeometryMismatchIsRejected();

  std::cout << "opencv_frame_writer_smoke: ok\n";
  return 0;
}
