// src/midi/smf.hpp
// Public API: Standard MIDI File (SMF) encode/decode in memory.
// - No printing here; pure data transformation.
// - Throws std::runtime_error on malformed input.

#pragma once
#include <cstdint>
#include <vector>

#include "midi/events.hpp"

namespace midi {

// Parse an entire Standard MIDI File (SMF) already loaded in memory.
// On success, returns a Song containing:
//   - header: SMFHeader (format, nTracks, timing division info)
//   - tracks: per-track channel and SysEx events with delta + absolute ticks
//             (deltas are measured between the returned events, so meta
//             events never shift them)
//   - notes : flattened NoteOn/NoteOff events across tracks (absolute ticks)
//   - tempi : collected tempo changes (microseconds per quarter note)
// On failure, throws std::runtime_error with a descriptive message.
Song parse_smf(const std::vector<std::uint8_t> &bytes);

// Serialize one track as a format-0 SMF:
//   MThd (division = track.ppqn), MTrk { set-tempo @0, events..., EOT }.
// Every event must satisfy is_storable(); throws std::runtime_error otherwise
// or when ppqn/tempo are out of range for the file format.
std::vector<std::uint8_t> encode_smf(const SmfTrack &track);

} // namespace midi
