#include "Player.hpp"
#include <algorithm>
#include <cmath>
#include "Random.hpp"

Player::Player(AudioOutput& output, PlayerConfig config)
: output_(output), config_(config) {
  notes_.reserve(config_.reserveNotes);
  output_.start([this](double time) { return render(time); });
}

Player::~Player() {
  output_.stop();
}

static Note makeNote(const Voice& v) {
  Note n;
  n.pitch = v.pitch();
  n.kind = v.kind();
  n.instrument = v.cloneInstrument();
  return n;
}

void Player::addNote(const Voice& voice) {
  std::vector<Note> fresh;
  fresh.push_back(makeNote(voice));
  insertNotes(fresh);
}

void Player::addNotes(const std::vector<Voice>& voices) {
  std::vector<Note> fresh;
  fresh.reserve(voices.size());
  for (const Voice& v : voices) fresh.push_back(makeNote(v));
  insertNotes(fresh);
}

// Instrument clones are made by the callers before locking; notes not
// inserted are destroyed by the caller after the lock is released.
void Player::insertNotes(std::vector<Note>& fresh) {
  std::lock_guard<std::mutex> lock(mutex_);
  const double now = output_.time();
  for (Note& n : fresh) {
    auto it = std::find_if(notes_.begin(), notes_.end(), [&](const Note& existing) {
      return existing.sounding() && existing.matches(n.pitch, n.kind);
    });
    if (it != notes_.end()) {
      it->timing.onTime = now;
      continue;
    }
    n.timing.onTime = now;
    n.timing.offTime = 0.0;
    n.timing.stage = NoteStage::Sounding;
    notes_.push_back(std::move(n));
  }
}

void Player::removeNote(const Voice& voice) {
  std::lock_guard<std::mutex> lock(mutex_);
  releaseLocked(voice, output_.time());
}

void Player::removeNotes(const std::vector<Voice>& voices) {
  std::lock_guard<std::mutex> lock(mutex_);
  const double now = output_.time();
  for (const Voice& v : voices) releaseLocked(v, now);
}

void Player::releaseLocked(const Voice& voice, double now) {
  auto it = std::find_if(notes_.begin(), notes_.end(), [&](const Note& existing) {
    return existing.sounding() && existing.matches(voice.pitch(), voice.kind());
  });
  if (it == notes_.end()) return;
  it->timing.offTime = now;
  it->timing.stage = NoteStage::Releasing;
}

size_t Player::simultaneousNoteCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return notes_.size();
}

double Player::render(double time) noexcept {
  if (!renderSeeded_) {
    seedThreadRng(config_.randomSeed);
    renderSeeded_ = true;
  }
  double mixed = 0.0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (Note& n : notes_) {
      bool finished = false;
      mixed += n.instrument->sound(time, n.timing, n.pitch, finished);
      if (finished) n.timing.stage = NoteStage::Finished;
    }
    notes_.erase(std::remove_if(notes_.begin(), notes_.end(), [](const Note& n) { return n.finished(); }),
                 notes_.end());
  }
  double out = mixed * config_.mixGain;
  if (config_.amplitudeLimit) {
    const double limit = std::fabs(*config_.amplitudeLimit);
    out = std::clamp(out, -limit, limit);
  }
  return out;
}
