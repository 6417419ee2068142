#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <sys/select.h>
#include "core/Oscillator.hpp"
#include "core/SessionConfig.hpp"
#include "instruments/presets/Presets.hpp"
#include "io/AudioFileWriter.hpp"
#include "offline/OfflineTimelineRenderer.hpp"
#if defined(__APPLE__)
#include "core/Player.hpp"
#include "realtime/CoreAudioOutput.hpp"
#endif

static std::atomic<bool> gRunning{true};

static void onSigInt(int) {
  gRunning.store(false);
}

static std::string formatDuration(double seconds) {
  if (seconds < 0.0) seconds = 0.0;
  const int64_t totalMs = static_cast<int64_t>(seconds * 1000.0 + 0.5);
  const int64_t mins = totalMs / (60 * 1000);
  const int64_t secs = (totalMs % (60 * 1000)) / 1000;
  const int64_t ms = totalMs % 1000;
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld.%03lld",
                static_cast<long long>(mins), static_cast<long long>(secs), static_cast<long long>(ms));
  return std::string(buf);
}

static void computePeakAndRms(const std::vector<float>& interleaved, double& outPeakDb, double& outRmsDb) {
  double peak = 0.0;
  long double sumSq = 0.0L;
  for (float f : interleaved) {
    const double s = static_cast<double>(f);
    peak = std::max(peak, std::fabs(s));
    sumSq += static_cast<long double>(s * s);
  }
  const size_t n = interleaved.size();
  const double rms = (n > 0) ? std::sqrt(static_cast<double>(sumSq / static_cast<long double>(n))) : 0.0;
  auto toDb = [](double x) -> double { return (x > 0.0) ? (20.0 * std::log10(x)) : -std::numeric_limits<double>::infinity(); };
  outPeakDb = toDb(peak);
  outRmsDb = toDb(rms);
}

static void printUsage(const char* exe) {
  std::fprintf(stderr,
               "Usage: %s [--session path.json] [--wav out.wav] [--format wav|aiff|caf] [--bitdepth 16|24|32f]\n"
               "          [--duration SEC] [--sr HZ] [--random-seed N] [--quit-after SEC] [--verbose]\n"
               "          [--validate path.json] [--list path.json] [--list-presets] [--help]\n"
               "\n"
               "  --session PATH     Session file (default: demo.json from the search path)\n"
               "  --wav PATH         Offline export to an audio file instead of realtime playback\n"
               "  --format F         Export container: wav, aiff or caf (default wav)\n"
               "  --bitdepth D       Export sample format: 16, 24 or 32f (default 32f)\n"
               "  --duration SEC     Hard export duration (overrides the session)\n"
               "  --sr HZ            Override the session sample rate\n"
               "  --random-seed N    Seed noise oscillators, export and realtime (overrides session randomSeed)\n"
               "  --quit-after SEC   Realtime: stop after SEC seconds\n"
               "  --verbose          Realtime: print note count once per second\n"
               "  --validate PATH    Check a session file and exit\n"
               "  --list PATH        Print instruments, sequencer tracks and events of a session\n"
               "  --list-presets     Print the built-in instrument presets\n"
               "\nRelative session paths are searched in the CWD, examples/sessions/ and\n"
               "CHIME_SEARCH_PATHS (colon-separated).\n",
               exe);
}

static int runValidate(const std::string& path) {
  try {
    const SessionSpec spec = loadSessionSpecFromJsonFile(path);
    const auto errors = validateSession(spec);
    if (!errors.empty()) {
      for (const auto& e : errors) std::fprintf(stderr, "Error: %s\n", e.c_str());
      std::fprintf(stderr, "Validation failed: %zu problem(s) in %s\n", errors.size(), path.c_str());
      return 1;
    }
    std::fprintf(stderr, "Validation OK: %s\n", path.c_str());
    return 0;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "Validation failed: %s\n", e.what());
    return 1;
  }
}

static void printPatch(const PatchParams& p, const char* indent) {
  std::printf("%s%s: volume=%.2f maxLifeTime=%.2fs ADSR=%.3f/%.3f/%.3f sustain=%.2f start=%.2f\n",
              indent, p.name.c_str(), p.volume, p.maxLifeTime, p.env.attackTime, p.env.decayTime,
              p.env.releaseTime, p.env.sustainAmplitude, p.env.startAmplitude);
  for (const auto& part : p.partials) {
    if (part.fixedHz >= 0.0) {
      std::printf("%s  %-11s weight=%.3f hz=%.2f\n", indent, toString(part.osc.wave), part.weight, part.fixedHz);
    } else {
      std::printf("%s  %-11s weight=%.3f semitones=%+d\n", indent, toString(part.osc.wave), part.weight, part.semitones);
    }
  }
}

static int runList(const std::string& path) {
  try {
    const SessionSpec spec = loadSessionSpecFromJsonFile(path);
    std::printf("Session %s (v%d) %u Hz, %u ch\n", path.c_str(), spec.version, spec.sampleRate, spec.channels);
    if (!spec.description.empty()) std::printf("  %s\n", spec.description.c_str());
    std::printf("Instruments (%zu):\n", spec.instruments.size());
    for (const auto& p : spec.instruments) printPatch(p, "  ");
    if (spec.hasSequencer) {
      const auto& c = spec.sequencer.config;
      std::printf("Sequencer: tempo=%.1f beats=%u subBeats=%u\n", c.tempo, c.beats, c.subBeats);
      for (const auto& t : spec.sequencer.tracks) std::printf("  %-12s %s\n", t.instrument.c_str(), t.steps.c_str());
    }
    std::printf("Events (%zu):\n", spec.events.size());
    for (const auto& e : spec.events) {
      std::printf("  %8.3fs %-3s %s pitch=%d\n", e.timeSec, toString(e.type), e.instrument.c_str(), e.pitch);
    }
    return 0;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "List failed: %s\n", e.what());
    return 1;
  }
}

static int runExport(const SessionSpec& spec, const std::string& wavPath, FileFormat format, BitDepth depth, const OfflineRenderOptions& opts) {
  try {
    const OfflineRenderResult res = renderSession(spec, opts);
    AudioFileSpec fs;
    fs.format = format;
    fs.bitDepth = depth;
    fs.sampleRate = res.sampleRate;
    fs.channels = res.channels;
    writeAudioFile(wavPath, fs, res.interleaved);

    double peakDb = 0.0, rmsDb = 0.0;
    computePeakAndRms(res.interleaved, peakDb, rmsDb);
    const double seconds = static_cast<double>(res.frames) / static_cast<double>(res.sampleRate);
    std::fprintf(stderr,
                 "Exported %s\n  Frames: %llu\n  Duration: %s (%.3fs)\n  Sample rate: %u Hz\n  Channels: %u\n  Format: %s / %s\n  Peak: %.2f dBFS\n  RMS: %.2f dBFS\n  Events: %zu (peak notes %zu)\n",
                 wavPath.c_str(), static_cast<unsigned long long>(res.frames), formatDuration(seconds).c_str(), seconds,
                 res.sampleRate, res.channels, toString(format), toString(depth), peakDb, rmsDb, res.eventsApplied, res.peakNotes);
    return 0;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "Export failed: %s\n", e.what());
    return 1;
  }
}

#if defined(__APPLE__)
// non-blocking stdin check using select
static bool isStdinReady() {
  fd_set readfds;
  FD_ZERO(&readfds);
  FD_SET(STDIN_FILENO, &readfds);
  timeval tv{0, 0};
  int rv = select(STDIN_FILENO + 1, &readfds, nullptr, nullptr, &tv);
  return (rv > 0) && FD_ISSET(STDIN_FILENO, &readfds);
}

static int runRealtime(const SessionSpec& spec, double sampleRate, uint32_t randomSeedOverride, double quitAfterSec, bool verbose) {
  try {
    struct Scheduled { double timeSec; SessionSpec::EventType type; Voice voice; };
    std::vector<Scheduled> events;
    for (const auto& e : spec.events) {
      events.push_back(Scheduled{e.timeSec, e.type, Voice(resolveInstrument(spec, e.instrument), e.pitch)});
    }
    std::stable_sort(events.begin(), events.end(), [](const Scheduled& a, const Scheduled& b) { return a.timeSec < b.timeSec; });

    std::unique_ptr<PercussionSequencer> seq;
    if (spec.hasSequencer) seq = std::make_unique<PercussionSequencer>(buildSequencer(spec));

    CoreAudioOutput output(sampleRate, spec.channels ? spec.channels : 2u);
    PlayerConfig playerConfig = spec.player;
    playerConfig.randomSeed = randomSeedOverride ? randomSeedOverride : spec.randomSeed;
    Player player(output, playerConfig);
    std::fprintf(stderr, "Realtime: %.0f Hz, %u ch. Press Enter or Ctrl-C to stop.\n", output.sampleRate(), output.channels());

    if (seq) seq->start();
    const double endSec = (quitAfterSec > 0.0) ? quitAfterSec
                        : (!spec.hasSequencer ? computeSessionDurationSec(spec, OfflineRenderOptions{}) : 0.0);
    size_t next = 0;
    double lastReport = 0.0;
    while (gRunning.load()) {
      if (isStdinReady()) {
        char buf[4];
        (void)read(STDIN_FILENO, buf, sizeof(buf));
        gRunning.store(false);
        break;
      }
      const double now = player.time();
      while (next < events.size() && events[next].timeSec <= now) {
        if (events[next].type == SessionSpec::EventType::NoteOn) player.addNote(events[next].voice);
        else player.removeNote(events[next].voice);
        ++next;
      }
      if (seq) {
        const std::vector<Voice> voices = seq->update();
        if (!voices.empty()) player.addNotes(voices);
      }
      if (verbose && now - lastReport >= 1.0) {
        std::fprintf(stderr, "%s notes=%zu\n", formatDuration(now).c_str(), player.simultaneousNoteCount());
        lastReport = now;
      }
      if (endSec > 0.0 && now >= endSec) break;
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return 0;
  } catch (const AudioError& e) {
    std::fprintf(stderr, "Audio output failed (%s): %s\n", toString(e.kind()), e.what());
    return 1;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "Realtime session failed: %s\n", e.what());
    return 1;
  }
}
#endif

int main(int argc, char** argv) {
  std::string sessionPath = "demo.json";
  std::string wavPath;
  std::string validatePath;
  std::string listPath;
  bool listPresets = false;
  FileFormat outFormat = FileFormat::Wav;
  BitDepth outDepth = BitDepth::Float32;
  double overrideDurationSec = -1.0; // < 0 means auto
  double overrideSr = 0.0;
  uint32_t randomSeedOverride = 0;   // override JSON randomSeed if non-zero
  double quitAfterSec = 0.0;
  bool verbose = false;
  // Startup banner (binary identity)
  {
    static const char* kChimeVersion = "0.1.0";
    std::fprintf(stderr, "chime -- version %s starting up (built %s %s)\n", kChimeVersion, __DATE__, __TIME__);
  }
  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    auto need = [&](int remain) {
      if (i + remain >= argc) {
        printUsage(argv[0]);
        std::exit(1);
      }
    };
    if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else if (std::strcmp(a, "--session") == 0) {
      need(1); sessionPath = argv[++i];
    } else if (std::strcmp(a, "--wav") == 0) {
      need(1); wavPath = argv[++i];
    } else if (std::strcmp(a, "--format") == 0) {
      need(1);
      const char* f = argv[++i];
      if (std::strcmp(f, "wav") == 0) outFormat = FileFormat::Wav;
      else if (std::strcmp(f, "aiff") == 0) outFormat = FileFormat::Aiff;
      else if (std::strcmp(f, "caf") == 0) outFormat = FileFormat::Caf;
      else {
        std::fprintf(stderr, "Unknown format: %s (expected wav, aiff or caf)\n", f);
        return 1;
      }
    } else if (std::strcmp(a, "--bitdepth") == 0) {
      need(1);
      const char* d = argv[++i];
      if (std::strcmp(d, "16") == 0) outDepth = BitDepth::Pcm16;
      else if (std::strcmp(d, "24") == 0) outDepth = BitDepth::Pcm24;
      else if (std::strcmp(d, "32f") == 0 || std::strcmp(d, "32") == 0) outDepth = BitDepth::Float32;
      else {
        std::fprintf(stderr, "Unknown bit depth: %s (expected 16, 24 or 32f)\n", d);
        return 1;
      }
    } else if (std::strcmp(a, "--duration") == 0) {
      need(1); overrideDurationSec = std::atof(argv[++i]);
    } else if (std::strcmp(a, "--sr") == 0) {
      need(1); overrideSr = std::atof(argv[++i]);
      if (overrideSr < 8000.0) overrideSr = 8000.0;
    } else if (std::strcmp(a, "--random-seed") == 0) {
      need(1); randomSeedOverride = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (std::strcmp(a, "--quit-after") == 0) {
      need(1); quitAfterSec = std::atof(argv[++i]);
    } else if (std::strcmp(a, "--verbose") == 0) {
      verbose = true;
    } else if (std::strcmp(a, "--validate") == 0) {
      need(1); validatePath = argv[++i];
    } else if (std::strcmp(a, "--list") == 0) {
      need(1); listPath = argv[++i];
    } else if (std::strcmp(a, "--list-presets") == 0) {
      listPresets = true;
    } else {
      std::fprintf(stderr, "Unknown argument: %s\n", a);
      printUsage(argv[0]);
      return 1;
    }
  }

  if (!validatePath.empty()) return runValidate(validatePath);
  if (!listPath.empty()) return runList(listPath);
  if (listPresets) {
    for (const auto& p : presetPatches()) printPatch(p, "");
    return 0;
  }

  SessionSpec spec;
  try {
    spec = loadSessionSpecFromJsonFile(sessionPath);
    const auto errors = validateSession(spec);
    if (!errors.empty()) {
      for (const auto& e : errors) std::fprintf(stderr, "Error: %s\n", e.c_str());
      return 1;
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "Failed to load session %s: %s\n", sessionPath.c_str(), e.what());
    return 1;
  }

  std::signal(SIGINT, onSigInt);

  if (!wavPath.empty()) {
    OfflineRenderOptions opts;
    opts.durationSec = overrideDurationSec;
    opts.sampleRateOverride = static_cast<uint32_t>(overrideSr + 0.5);
    opts.randomSeedOverride = randomSeedOverride;
    return runExport(spec, wavPath, outFormat, outDepth, opts);
  }

#if defined(__APPLE__)
  const double sr = overrideSr > 0.0 ? overrideSr : static_cast<double>(spec.sampleRate);
  return runRealtime(spec, sr, randomSeedOverride, quitAfterSec, verbose);
#else
  (void)quitAfterSec;
  (void)randomSeedOverride;
  (void)verbose;
  std::fprintf(stderr, "Realtime playback needs CoreAudio (macOS); use --wav to export instead.\n");
  return 1;
#endif
}
