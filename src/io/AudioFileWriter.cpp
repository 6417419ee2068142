#include "AudioFileWriter.hpp"
#include <stdexcept>

#if defined(__APPLE__)
#include <AudioToolbox/AudioToolbox.h>
#include <AudioToolbox/ExtendedAudioFile.h>
#include <CoreAudio/CoreAudioTypes.h>
#include <CoreFoundation/CoreFoundation.h>
#include "../realtime/OsStatusUtils.hpp"
#else
#include <sndfile.h>
#endif

const char* toString(FileFormat f) {
  switch (f) {
    case FileFormat::Wav: return "wav";
    case FileFormat::Aiff: return "aiff";
    case FileFormat::Caf: return "caf";
  }
  return "wav";
}

const char* toString(BitDepth d) {
  switch (d) {
    case BitDepth::Pcm16: return "16";
    case BitDepth::Pcm24: return "24";
    case BitDepth::Float32: return "32f";
  }
  return "32f";
}

namespace {

void checkSpec(const AudioFileSpec& spec, const std::vector<float>& interleaved) {
  if (spec.channels == 0) throw std::invalid_argument("Audio file channels must be > 0");
  if (spec.sampleRate == 0) throw std::invalid_argument("Audio file sample rate must be > 0");
  if (interleaved.size() % spec.channels != 0) {
    throw std::invalid_argument("Interleaved buffer does not hold whole frames");
  }
}

#if defined(__APPLE__)

AudioFileTypeID toFileType(const AudioFileSpec& spec) {
  switch (spec.format) {
    case FileFormat::Wav: return kAudioFileWAVEType;
    // plain AIFF has no float encoding
    case FileFormat::Aiff: return spec.bitDepth == BitDepth::Float32 ? kAudioFileAIFCType : kAudioFileAIFFType;
    case FileFormat::Caf: return kAudioFileCAFType;
  }
  return kAudioFileWAVEType;
}

AudioStreamBasicDescription floatFrames(const AudioFileSpec& spec) {
  AudioStreamBasicDescription d{};
  d.mSampleRate = spec.sampleRate;
  d.mFormatID = kAudioFormatLinearPCM;
  d.mFormatFlags = kAudioFormatFlagsNativeFloatPacked;
  d.mBitsPerChannel = 32;
  d.mChannelsPerFrame = spec.channels;
  d.mFramesPerPacket = 1;
  d.mBytesPerFrame = 4 * spec.channels;
  d.mBytesPerPacket = d.mBytesPerFrame;
  return d;
}

AudioStreamBasicDescription fileFrames(const AudioFileSpec& spec) {
  AudioStreamBasicDescription d = floatFrames(spec);
  if (spec.bitDepth == BitDepth::Float32) {
    if (spec.format == FileFormat::Aiff) d.mFormatFlags |= kLinearPCMFormatFlagIsBigEndian;
    return d;
  }
  d.mFormatFlags = kLinearPCMFormatFlagIsSignedInteger | kLinearPCMFormatFlagIsPacked;
  d.mBitsPerChannel = spec.bitDepth == BitDepth::Pcm16 ? 16 : 24;
  d.mBytesPerFrame = (d.mBitsPerChannel / 8) * spec.channels;
  d.mBytesPerPacket = d.mBytesPerFrame;
  if (spec.format == FileFormat::Aiff) d.mFormatFlags |= kLinearPCMFormatFlagIsBigEndian;
  return d;
}

void writeWithExtAudioFile(const std::string& path, const AudioFileSpec& spec, const std::vector<float>& interleaved) {
  AudioStreamBasicDescription src = floatFrames(spec);
  AudioStreamBasicDescription dst = fileFrames(spec);

  CFURLRef url = CFURLCreateFromFileSystemRepresentation(kCFAllocatorDefault, reinterpret_cast<const UInt8*>(path.c_str()),
                                                         static_cast<CFIndex>(path.size()), false);
  if (!url) throw std::runtime_error("Cannot build a file URL for " + path);
  ExtAudioFileRef file = nullptr;
  OSStatus err = ExtAudioFileCreateWithURL(url, toFileType(spec), &dst, nullptr, kAudioFileFlags_EraseFile, &file);
  CFRelease(url);
  if (err != noErr) throw std::runtime_error(osstatusMessage("ExtAudioFileCreateWithURL", err) + ": " + path);

  err = ExtAudioFileSetProperty(file, kExtAudioFileProperty_ClientDataFormat, sizeof(src), &src);
  if (err != noErr) {
    ExtAudioFileDispose(file);
    throw std::runtime_error(osstatusMessage("ExtAudioFileSetProperty(ClientDataFormat)", err));
  }

  AudioBufferList buf{};
  buf.mNumberBuffers = 1;
  buf.mBuffers[0].mNumberChannels = spec.channels;
  buf.mBuffers[0].mDataByteSize = static_cast<UInt32>(interleaved.size() * sizeof(float));
  buf.mBuffers[0].mData = const_cast<float*>(interleaved.data());

  const UInt32 frames = static_cast<UInt32>(interleaved.size() / spec.channels);
  err = ExtAudioFileWrite(file, frames, &buf);
  const OSStatus disposeErr = ExtAudioFileDispose(file);
  if (err != noErr) throw std::runtime_error(osstatusMessage("ExtAudioFileWrite", err) + ": " + path);
  if (disposeErr != noErr) throw std::runtime_error(osstatusMessage("ExtAudioFileDispose", disposeErr) + ": " + path);
}

#else

int toSndFormat(const AudioFileSpec& spec) {
  int major = SF_FORMAT_WAV;
  switch (spec.format) {
    case FileFormat::Wav: major = SF_FORMAT_WAV; break;
    case FileFormat::Aiff: major = SF_FORMAT_AIFF; break;
    case FileFormat::Caf: major = SF_FORMAT_CAF; break;
  }
  int minor = SF_FORMAT_FLOAT;
  switch (spec.bitDepth) {
    case BitDepth::Pcm16: minor = SF_FORMAT_PCM_16; break;
    case BitDepth::Pcm24: minor = SF_FORMAT_PCM_24; break;
    case BitDepth::Float32: minor = SF_FORMAT_FLOAT; break;
  }
  return major | minor;
}

void writeWithSndFile(const std::string& path, const AudioFileSpec& spec, const std::vector<float>& interleaved) {
  SF_INFO info{};
  info.samplerate = static_cast<int>(spec.sampleRate);
  info.channels = static_cast<int>(spec.channels);
  info.format = toSndFormat(spec);
  if (!sf_format_check(&info)) {
    throw std::invalid_argument(std::string("Unsupported audio file layout: ") + toString(spec.format) + " / " + toString(spec.bitDepth));
  }

  SNDFILE* file = sf_open(path.c_str(), SFM_WRITE, &info);
  if (!file) throw std::runtime_error("Failed to open audio file for writing: " + path + " (" + sf_strerror(nullptr) + ")");
  sf_command(file, SFC_SET_CLIPPING, nullptr, SF_TRUE);

  const sf_count_t frames = static_cast<sf_count_t>(interleaved.size() / spec.channels);
  const sf_count_t written = sf_writef_float(file, interleaved.data(), frames);
  const std::string writeError = (written != frames) ? sf_strerror(file) : std::string();
  const int closeErr = sf_close(file);
  if (written != frames) throw std::runtime_error("Failed to write audio file: " + path + " (" + writeError + ")");
  if (closeErr != 0) throw std::runtime_error("Failed to finalize audio file: " + path + " (" + sf_error_number(closeErr) + ")");
}

#endif

} // namespace

void writeAudioFile(const std::string& path, const AudioFileSpec& spec, const std::vector<float>& interleaved) {
  checkSpec(spec, interleaved);
#if defined(__APPLE__)
  writeWithExtAudioFile(path, spec, interleaved);
#else
  writeWithSndFile(path, spec, interleaved);
#endif
}
