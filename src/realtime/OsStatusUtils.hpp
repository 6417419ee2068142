#pragma once

#include <AudioToolbox/AudioToolbox.h>
#include <CoreAudio/CoreAudioTypes.h>
#include <cctype>
#include <cstring>
#include <string>

// Four-char codes print as 'fmt?', everything else as a number.
inline std::string osstatusToString(OSStatus status) {
  const UInt32 be = CFSwapInt32HostToBig(static_cast<UInt32>(status));
  char code[5] = {0};
  std::memcpy(code, &be, 4);
  for (int i = 0; i < 4; ++i) {
    if (!std::isprint(static_cast<unsigned char>(code[i]))) return std::to_string(status);
  }
  return std::string("'") + code + "'";
}

// "<call> failed (<status>)"
inline std::string osstatusMessage(const char* call, OSStatus status) {
  return std::string(call) + " failed (" + osstatusToString(status) + ")";
}
