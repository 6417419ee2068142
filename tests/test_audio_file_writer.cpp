#include <catch2/catch.hpp>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>
#include "io/AudioFileWriter.hpp"

namespace {

constexpr uint16_t kWaveExtensible = 0xFFFE;

struct WavImage {
  uint16_t formatTag = 0;
  uint16_t channels = 0;
  uint32_t sampleRate = 0;
  uint16_t bitsPerSample = 0;
  std::vector<uint8_t> data;
};

uint16_t read16(const std::vector<uint8_t>& b, size_t at) {
  return static_cast<uint16_t>(b[at] | (b[at + 1] << 8));
}

uint32_t read32(const std::vector<uint8_t>& b, size_t at) {
  return static_cast<uint32_t>(b[at]) | (static_cast<uint32_t>(b[at + 1]) << 8)
       | (static_cast<uint32_t>(b[at + 2]) << 16) | (static_cast<uint32_t>(b[at + 3]) << 24);
}

std::string tag(const std::vector<uint8_t>& b, size_t at) {
  return std::string(reinterpret_cast<const char*>(b.data() + at), 4);
}

std::vector<uint8_t> readBytes(const std::filesystem::path& path) {
  std::ifstream f(path, std::ios::binary);
  REQUIRE(f.good());
  return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

// Walks the RIFF chunks; writers are free to add chunks besides fmt and data.
WavImage parseWav(const std::vector<uint8_t>& b) {
  REQUIRE(b.size() >= 12);
  REQUIRE(tag(b, 0) == "RIFF");
  REQUIRE(tag(b, 8) == "WAVE");
  WavImage img;
  bool haveFmt = false, haveData = false;
  size_t at = 12;
  while (at + 8 <= b.size()) {
    const std::string id = tag(b, at);
    const uint32_t size = read32(b, at + 4);
    const size_t body = at + 8;
    REQUIRE(body + size <= b.size());
    if (id == "fmt ") {
      img.formatTag = read16(b, body);
      img.channels = read16(b, body + 2);
      img.sampleRate = read32(b, body + 4);
      img.bitsPerSample = read16(b, body + 14);
      haveFmt = true;
    } else if (id == "data") {
      img.data.assign(b.begin() + static_cast<std::ptrdiff_t>(body), b.begin() + static_cast<std::ptrdiff_t>(body + size));
      haveData = true;
    }
    at = body + size + (size & 1u);
  }
  REQUIRE(haveFmt);
  REQUIRE(haveData);
  return img;
}

std::filesystem::path tempFile(const char* name) {
  return std::filesystem::temp_directory_path() / name;
}

} // namespace

TEST_CASE("pcm16 wav stores clipped samples", "[audiofile]") {
  const auto path = tempFile("chime_test_pcm16.wav");
  AudioFileSpec spec;
  spec.bitDepth = BitDepth::Pcm16;
  spec.sampleRate = 48000;
  spec.channels = 2;
  writeAudioFile(path.string(), spec, {0.0f, 1.0f, -1.0f, 2.0f});

  const WavImage img = parseWav(readBytes(path));
  CHECK((img.formatTag == 1 || img.formatTag == kWaveExtensible));
  CHECK(img.channels == 2);
  CHECK(img.sampleRate == 48000);
  CHECK(img.bitsPerSample == 16);
  REQUIRE(img.data.size() == 8);
  CHECK(static_cast<int16_t>(read16(img.data, 0)) == 0);
  CHECK(static_cast<int16_t>(read16(img.data, 2)) == 32767);
  CHECK(static_cast<int16_t>(read16(img.data, 4)) <= -32767);
  // out of range input is clipped, not wrapped
  CHECK(static_cast<int16_t>(read16(img.data, 6)) == 32767);
  std::filesystem::remove(path);
}

TEST_CASE("pcm24 wav stores little-endian samples", "[audiofile]") {
  const auto path = tempFile("chime_test_pcm24.wav");
  AudioFileSpec spec;
  spec.bitDepth = BitDepth::Pcm24;
  spec.sampleRate = 44100;
  spec.channels = 1;
  writeAudioFile(path.string(), spec, {1.0f, -1.0f});

  const WavImage img = parseWav(readBytes(path));
  CHECK((img.formatTag == 1 || img.formatTag == kWaveExtensible));
  CHECK(img.bitsPerSample == 24);
  REQUIRE(img.data.size() == 6);
  CHECK(img.data[0] == 0xff);
  CHECK(img.data[1] == 0xff);
  CHECK(img.data[2] == 0x7f);
  CHECK(img.data[3] <= 0x01);
  CHECK(img.data[4] == 0x00);
  CHECK(img.data[5] == 0x80);
  std::filesystem::remove(path);
}

TEST_CASE("float32 wav stores raw IEEE samples", "[audiofile]") {
  const auto path = tempFile("chime_test_f32.wav");
  AudioFileSpec spec;
  spec.bitDepth = BitDepth::Float32;
  spec.sampleRate = 22050;
  spec.channels = 2;
  writeAudioFile(path.string(), spec, {0.25f, -1.5f});

  const WavImage img = parseWav(readBytes(path));
  CHECK((img.formatTag == 3 || img.formatTag == kWaveExtensible));
  CHECK(img.sampleRate == 22050);
  CHECK(img.bitsPerSample == 32);
  REQUIRE(img.data.size() == 8);
  float first = 0.0f, second = 0.0f;
  const uint32_t a = read32(img.data, 0), b = read32(img.data, 4);
  std::memcpy(&first, &a, sizeof(first));
  std::memcpy(&second, &b, sizeof(second));
  CHECK(first == 0.25f);
  // float output is not clipped
  CHECK(second == -1.5f);
  std::filesystem::remove(path);
}

TEST_CASE("aiff and caf containers are written", "[audiofile]") {
  const std::vector<float> samples(64, 0.5f);
  AudioFileSpec spec;
  spec.bitDepth = BitDepth::Pcm16;
  spec.channels = 1;

  const auto aiffPath = tempFile("chime_test.aiff");
  spec.format = FileFormat::Aiff;
  writeAudioFile(aiffPath.string(), spec, samples);
  const auto aiff = readBytes(aiffPath);
  REQUIRE(aiff.size() > 12);
  CHECK(tag(aiff, 0) == "FORM");
  CHECK((tag(aiff, 8) == "AIFF" || tag(aiff, 8) == "AIFC"));
  std::filesystem::remove(aiffPath);

  const auto cafPath = tempFile("chime_test.caf");
  spec.format = FileFormat::Caf;
  spec.bitDepth = BitDepth::Float32;
  writeAudioFile(cafPath.string(), spec, samples);
  const auto caf = readBytes(cafPath);
  REQUIRE(caf.size() > 8);
  CHECK(tag(caf, 0) == "caff");
  std::filesystem::remove(cafPath);
}

TEST_CASE("unusable layouts are rejected before any file is created", "[audiofile]") {
  const auto path = tempFile("chime_test_rejected.wav");
  std::filesystem::remove(path);
  AudioFileSpec spec;

  spec.channels = 0;
  CHECK_THROWS_AS((writeAudioFile(path.string(), spec, {})), std::invalid_argument);
  spec.channels = 2;
  spec.sampleRate = 0;
  CHECK_THROWS_AS((writeAudioFile(path.string(), spec, {0.0f, 0.0f})), std::invalid_argument);
  spec.sampleRate = 44100;
  CHECK_THROWS_AS((writeAudioFile(path.string(), spec, {0.0f, 0.0f, 0.0f})), std::invalid_argument);
  CHECK_FALSE(std::filesystem::exists(path));
}

TEST_CASE("unwritable paths are reported", "[audiofile]") {
  AudioFileSpec spec;
  CHECK_THROWS_AS((writeAudioFile("/nonexistent-dir/chime/out.wav", spec, {0.0f, 0.0f})), std::runtime_error);
}

TEST_CASE("format and bit depth names match the CLI spelling", "[audiofile]") {
  CHECK(std::string(toString(FileFormat::Wav)) == "wav");
  CHECK(std::string(toString(FileFormat::Aiff)) == "aiff");
  CHECK(std::string(toString(FileFormat::Caf)) == "caf");
  CHECK(std::string(toString(BitDepth::Pcm16)) == "16");
  CHECK(std::string(toString(BitDepth::Pcm24)) == "24");
  CHECK(std::string(toString(BitDepth::Float32)) == "32f");
}
