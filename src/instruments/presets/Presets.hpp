#pragma once

#include <memory>
#include <string>
#include <vector>
#include "../patch/PatchInstrument.hpp"

// Glockenspiel-like: sine partials an octave up, no sustain.
PatchParams bellPatch();
// Square-based bell with some sustain.
PatchParams bell8Patch();
// Reed: saw + squares with a little breath noise.
PatchParams harmonicaPatch();
PatchParams drumKickPatch();
PatchParams drumSnarePatch();
PatchParams drumHiHatPatch();

std::vector<PatchParams> presetPatches();

// Case-insensitive lookup by display name ("Bell", "8-Bit Bell", "Drum Kick", ...).
// Returns nullptr if no preset matches.
std::unique_ptr<PatchInstrument> makePreset(const std::string& name);
