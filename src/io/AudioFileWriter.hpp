#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class FileFormat { Wav, Aiff, Caf };
enum class BitDepth { Pcm16, Pcm24, Float32 };

struct AudioFileSpec {
  FileFormat format = FileFormat::Wav;
  BitDepth bitDepth = BitDepth::Float32;
  uint32_t sampleRate = 44100;
  uint32_t channels = 2;
};

// Writes interleaved float frames through ExtAudioFile on Apple platforms and
// libsndfile elsewhere. Integer depths clip to [-1, 1]; float samples are stored as is.
// Throws std::invalid_argument on an unusable spec or a partial frame, and
// std::runtime_error if the file cannot be created or written.
void writeAudioFile(const std::string& path, const AudioFileSpec& spec, const std::vector<float>& interleaved);

const char* toString(FileFormat f);
const char* toString(BitDepth d);
