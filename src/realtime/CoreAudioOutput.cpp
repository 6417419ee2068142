#include "CoreAudioOutput.hpp"
#include <utility>
#include "OsStatusUtils.hpp"

CoreAudioOutput::CoreAudioOutput(double requestedSampleRate, uint32_t channels)
: sampleRate_(requestedSampleRate), channels_(channels) {
  if (!(sampleRate_ > 0.0)) throw AudioError(AudioErrorKind::DefaultStreamConfig, "sample rate must be > 0");
  if (channels_ == 0) throw AudioError(AudioErrorKind::DefaultStreamConfig, "channels must be > 0");
}

CoreAudioOutput::~CoreAudioOutput() {
  stop();
  unit_.reset();
}

void CoreAudioOutput::start(SampleCallback callback) {
  if (!callback) throw AudioError(AudioErrorKind::BuildStream, "callback is empty");
  if (unit_.valid()) throw AudioError(AudioErrorKind::BuildStream, "output already started");
  callback_ = std::move(callback);

  AudioComponentDescription desc{};
  desc.componentType = kAudioUnitType_Output;
  desc.componentSubType = kAudioUnitSubType_DefaultOutput;
  desc.componentManufacturer = kAudioUnitManufacturer_Apple;
  AudioComponent comp = AudioComponentFindNext(nullptr, &desc);
  if (!comp) throw AudioError(AudioErrorKind::UnknownDevice, "Default output component not found");

  OSStatus err = AudioComponentInstanceNew(comp, unit_.ptr());
  if (err != noErr) throw AudioError(AudioErrorKind::BuildStream, osstatusMessage("AudioComponentInstanceNew", err));

  AudioStreamBasicDescription asbd{};
  asbd.mSampleRate = sampleRate_;
  asbd.mFormatID = kAudioFormatLinearPCM;
  asbd.mFormatFlags = kAudioFormatFlagsNativeFloatPacked;
  asbd.mBitsPerChannel = 32;
  asbd.mChannelsPerFrame = channels_;
  asbd.mFramesPerPacket = 1;
  asbd.mBytesPerFrame = 4 * channels_;
  asbd.mBytesPerPacket = 4 * channels_;

  err = AudioUnitSetProperty(unit_.get(), kAudioUnitProperty_StreamFormat, kAudioUnitScope_Input, 0, &asbd, sizeof(asbd));
  if (err != noErr) {
    unit_.reset();
    throw AudioError(AudioErrorKind::BuildStream, osstatusMessage("AudioUnitSetProperty(StreamFormat)", err));
  }

  AURenderCallbackStruct cb{};
  cb.inputProc = &CoreAudioOutput::render;
  cb.inputProcRefCon = this;
  err = AudioUnitSetProperty(unit_.get(), kAudioUnitProperty_SetRenderCallback, kAudioUnitScope_Global, 0, &cb, sizeof(cb));
  if (err != noErr) {
    unit_.reset();
    throw AudioError(AudioErrorKind::BuildStream, osstatusMessage("AudioUnitSetProperty(SetRenderCallback)", err));
  }

  err = AudioUnitInitialize(unit_.get());
  if (err != noErr) {
    unit_.reset();
    throw AudioError(AudioErrorKind::BuildStream, osstatusMessage("AudioUnitInitialize", err));
  }
  unit_.markInitialized();

  // The unit may have settled on a different rate; the clock follows the device.
  UInt32 size = sizeof(asbd);
  err = AudioUnitGetProperty(unit_.get(), kAudioUnitProperty_StreamFormat, kAudioUnitScope_Input, 0, &asbd, &size);
  if (err == noErr && asbd.mSampleRate > 0.0) sampleRate_ = asbd.mSampleRate;

  clock_.reset();
  err = AudioOutputUnitStart(unit_.get());
  if (err != noErr) {
    unit_.reset();
    throw AudioError(AudioErrorKind::PlayStream, osstatusMessage("AudioOutputUnitStart", err));
  }
  unit_.markStarted();
}

void CoreAudioOutput::stop() {
  unit_.stop();
}

OSStatus CoreAudioOutput::render(void* inRefCon, AudioUnitRenderActionFlags*, const AudioTimeStamp*, UInt32, UInt32 inNumberFrames, AudioBufferList* ioData) noexcept {
  auto* self = static_cast<CoreAudioOutput*>(inRefCon);
  float* out = static_cast<float*>(ioData->mBuffers[0].mData);
  const uint32_t channels = self->channels_;
  const double step = 1.0 / self->sampleRate_;
  for (UInt32 i = 0; i < inNumberFrames; ++i) {
    const float s = self->callback_ ? static_cast<float>(self->callback_(self->clock_.now())) : 0.0f;
    for (uint32_t ch = 0; ch < channels; ++ch) out[i * channels + ch] = s;
    self->clock_.advance(step);
  }
  return noErr;
}
