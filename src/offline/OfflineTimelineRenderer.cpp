#include "OfflineTimelineRenderer.hpp"
#include <algorithm>
#include <memory>
#include <stdexcept>
#include "OfflineOutput.hpp"
#include "../core/Player.hpp"

double computeSessionDurationSec(const SessionSpec& spec, const OfflineRenderOptions& opts) {
  if (opts.durationSec >= 0.0) return opts.durationSec;
  if (spec.durationSec > 0.0) return spec.durationSec;
  double lastEvent = 0.0;
  for (const auto& e : spec.events) lastEvent = std::max(lastEvent, e.timeSec);
  double duration = spec.events.empty() ? 0.0 : lastEvent + opts.tailSec;
  if (spec.hasSequencer && spec.sequencer.config.tempo > 0.0 && spec.sequencer.config.subBeats > 0) {
    const auto& c = spec.sequencer.config;
    // a cycle spans `beats` beats whatever the subdivision
    const double cycle = (60.0 / c.tempo) * static_cast<double>(c.beats);
    duration = std::max(duration, cycle + opts.tailSec);
  }
  return duration;
}

OfflineRenderResult renderSession(const SessionSpec& spec, const OfflineRenderOptions& opts) {
  OfflineRenderResult res;
  res.sampleRate = opts.sampleRateOverride ? opts.sampleRateOverride : spec.sampleRate;
  res.channels = spec.channels ? spec.channels : 1u;
  if (res.sampleRate == 0) throw std::invalid_argument("sample rate must be > 0");
  const uint32_t block = opts.blockFrames ? opts.blockFrames : 256u;

  // Resolve everything up front so the render loop cannot fail half way.
  struct Scheduled { double timeSec; SessionSpec::EventType type; Voice voice; };
  std::vector<Scheduled> events;
  events.reserve(spec.events.size());
  for (const auto& e : spec.events) {
    events.push_back(Scheduled{e.timeSec, e.type, Voice(resolveInstrument(spec, e.instrument), e.pitch)});
  }
  std::stable_sort(events.begin(), events.end(), [](const Scheduled& a, const Scheduled& b) { return a.timeSec < b.timeSec; });

  std::unique_ptr<PercussionSequencer> seq;
  if (spec.hasSequencer) seq = std::make_unique<PercussionSequencer>(buildSequencer(spec));

  const double duration = computeSessionDurationSec(spec, opts);
  res.frames = static_cast<uint64_t>(duration * res.sampleRate + 0.5);
  res.interleaved.assign(static_cast<size_t>(res.frames * res.channels), 0.0f);

  OfflineOutput output(static_cast<double>(res.sampleRate));
  PlayerConfig playerConfig = spec.player;
  playerConfig.randomSeed = opts.randomSeedOverride ? opts.randomSeedOverride : spec.randomSeed;
  Player player(output, playerConfig);

  size_t next = 0;
  for (uint64_t f = 0; f < res.frames; f += block) {
    const uint32_t thisBlock = static_cast<uint32_t>(std::min<uint64_t>(block, res.frames - f));
    const double now = output.time();

    // Deliver due events in time order at the block start
    while (next < events.size() && events[next].timeSec <= now) {
      const Scheduled& ev = events[next];
      if (ev.type == SessionSpec::EventType::NoteOn) player.addNote(ev.voice);
      else player.removeNote(ev.voice);
      ++next;
      ++res.eventsApplied;
    }

    if (seq) {
      const std::vector<Voice> voices = seq->advance(static_cast<double>(thisBlock) / res.sampleRate);
      if (!voices.empty()) {
        player.addNotes(voices);
        res.eventsApplied += voices.size();
      }
    }

    res.peakNotes = std::max(res.peakNotes, player.simultaneousNoteCount());
    output.renderInto(res.interleaved.data() + static_cast<size_t>(f) * res.channels, thisBlock, res.channels);
  }
  return res;
}
