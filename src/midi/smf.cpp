// src/midi/smf.cpp
// Parse a Standard MIDI File (SMF) into midi::Song, and write a recorded
// session back out as a format-0 file.
// Pure byte work: no printing, no file I/O.

#include "midi/smf.hpp"
#include "common/reader.hpp" // Bytes cursor + read_vlq()
#include "common/writer.hpp" // ByteWriter + write_vlq()
#include "midi/events.hpp"
#include "midi/message.hpp"

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

constexpr std::uint32_t kMThd = 0x4D546864; // "MThd"
constexpr std::uint32_t kMTrk = 0x4D54726B; // "MTrk"

// Parse SMF header (MThd chunk) and fill midi::SMFHeader.
midi::SMFHeader parse_header(Bytes &r) {
  const std::uint32_t id = r.be32();
  if (id != kMThd) {
    throw std::runtime_error("Not a MIDI file (missing 'MThd')");
  }

  const std::uint32_t length = r.be32();
  if (length < 6) {
    throw std::runtime_error("Header chunk length must be at least 6");
  }

  midi::SMFHeader h{};
  h.format = r.be16();
  h.nTracks = r.be16();
  h.division = r.be16();
  r.skip(length - 6); // future header fields, if any

  if ((h.division & 0x8000) == 0) {
    // PPQN timing (ticks per quarter note)
    h.isPPQN = true;
    h.ppqn = static_cast<unsigned>(h.division & 0x7FFF);
    if (h.ppqn == 0) {
      throw std::runtime_error("PPQN division of 0");
    }
  } else {
    // SMPTE timing (two's-complement FPS in high byte, subframes in low byte)
    h.isPPQN = false;
    h.smpte_fps = 256 - ((h.division >> 8) & 0xFF); // e.g., 24, 25, 29, 30
    h.smpte_sub = static_cast<int>(h.division & 0xFF);
  }

  return h; // r.off now points to first track chunk (MTrk)
}

// Walk a single MTrk chunk and append events to the out vectors.
// - Produces absolute tick times (track-local absolute; OK for format 1).
void walk_one_track(Bytes &r, std::vector<midi::TrackEvent> &outTrack,
                    std::vector<midi::NoteEv> &outNotes,
                    std::vector<midi::TempoEv> &outTempi) {
  const std::uint32_t id = r.be32();
  if (id != kMTrk) {
    throw std::runtime_error("Missing 'MTrk' chunk");
  }
  const std::uint32_t len = r.be32();

  // A sub-cursor over just this track's bytes; the main reader skips them.
  Bytes tr(r.take(len));

  std::uint32_t tick = 0;
  std::uint32_t lastKeptTick = 0; // tick of the previous event in outTrack
  std::uint8_t running = 0;       // last channel status for running status

  auto keep = [&](midi::Message msg) {
    outTrack.push_back(midi::TrackEvent{tick - lastKeptTick, tick,
                                        std::move(msg)});
    lastKeptTick = tick;
  };

  while (!tr.at_end()) {
    // 1) Delta-time (Variable-Length Quantity)
    tick += read_vlq(tr);

    // 2) Status or running status?
    std::uint8_t first = tr.u8();
    std::uint8_t status = 0;
    bool haveData1 = false;
    std::uint8_t data1 = 0;

    if (first & 0x80) {
      status = first;
      if ((status & 0xF0) < 0xF0) {
        running = status; // only channel messages set running status
      }
    } else {
      // Running status: 'first' is actually data1 for the previous channel
      // status
      if (running == 0) {
        throw std::runtime_error("Running status used before any status");
      }
      status = running;
      haveData1 = true;
      data1 = first;
    }

    const std::uint8_t type = status & 0xF0;
    const std::uint8_t ch = status & 0x0F;
    const int dataLen = midi::channel_data_length(status);

    // Channel voice messages (one or two data bytes)
    if (dataLen > 0) {
      std::vector<std::uint8_t> raw{status};
      raw.push_back(haveData1 ? data1 : tr.u8());
      if (dataLen == 2) {
        raw.push_back(tr.u8());
      }

      if (type == 0x90 && raw[2] != 0) {
        outNotes.push_back(
            midi::NoteEv{tick, ch, raw[1], raw[2], midi::EvType::NoteOn});
      } else if (type == 0x80 || type == 0x90) {
        // Note Off (either true 0x80 or "Note On with velocity 0")
        outNotes.push_back(
            midi::NoteEv{tick, ch, raw[1], raw[2], midi::EvType::NoteOff});
      }
      keep(midi::decode_message(std::move(raw)));
      continue;
    }

    // Meta events
    if (status == 0xFF) {
      std::uint8_t metaType = tr.u8();
      std::uint32_t mlen = read_vlq(tr);

      if (metaType == 0x2F) { // End of Track
        tr.skip(mlen);
        break;
      } else if (metaType == 0x51 && mlen == 3) {
        // Tempo: 3 bytes big-endian microseconds per quarter note
        outTempi.push_back(midi::TempoEv{tick, tr.be24()});
      } else {
        // Names, signatures, markers... not needed here
        tr.skip(mlen);
      }
      continue;
    }

    // SysEx events: F0 <len> <data> (data ends with F7) or F7 escape
    if (status == 0xF0 || status == 0xF7) {
      std::uint32_t slen = read_vlq(tr);
      std::vector<std::uint8_t> raw{status};
      const auto payload = tr.take(slen);
      raw.insert(raw.end(), payload.begin(), payload.end());
      keep(midi::decode_message(std::move(raw)));
      continue;
    }

    // Anything else is unsupported/malformed at this stage
    std::ostringstream oss;
    oss << "Unsupported or malformed status byte: 0x" << std::hex
        << int(status);
    throw std::runtime_error(oss.str());
  }
}

void write_event(ByteWriter &w, const midi::TrackEvent &ev) {
  if (!midi::is_storable(ev.msg)) {
    std::ostringstream oss;
    oss << "Message with status 0x" << std::hex << int(ev.msg.status())
        << " cannot be stored in a track";
    throw std::runtime_error(oss.str());
  }

  write_vlq(w, ev.delta);
  const auto &raw = ev.msg.bytes;
  if (raw.front() == 0xF0) {
    // SysEx: status, VLQ length, then everything after the status byte
    w.u8(0xF0);
    write_vlq(w, static_cast<std::uint32_t>(raw.size() - 1));
    w.bytes(std::vector<std::uint8_t>(raw.begin() + 1, raw.end()));
    return;
  }

  // Channel message: full status every time (no running status on write)
  const int dataLen = midi::channel_data_length(raw.front());
  for (int i = 0; i <= dataLen; ++i) {
    w.u8(raw[static_cast<std::size_t>(i)]);
  }
}

} // namespace

namespace midi {

Song parse_smf(const std::vector<std::uint8_t> &bytes) {
  Bytes r(bytes);

  // Header
  SMFHeader header = parse_header(r);

  // Accumulate events from all tracks
  std::vector<std::vector<TrackEvent>> tracks;
  std::vector<NoteEv> notes;
  std::vector<TempoEv> tempi;
  notes.reserve(4096);
  tempi.reserve(64);

  for (std::uint16_t i = 0; i < header.nTracks; ++i) {
    tracks.emplace_back();
    walk_one_track(r, tracks.back(), notes, tempi);
  }

  Song song;
  song.header = header;
  song.tracks = std::move(tracks);
  song.notes = std::move(notes);
  song.tempi = std::move(tempi);
  return song;
}

std::vector<std::uint8_t> encode_smf(const SmfTrack &track) {
  if (track.ppqn == 0 || track.ppqn > 0x7FFF) {
    throw std::runtime_error("ticks per beat must be in 1..32767");
  }
  if (track.usPerQN == 0 || track.usPerQN > 0xFFFFFF) {
    throw std::runtime_error("tempo must be in 1..16777215 us per beat");
  }

  ByteWriter w;

  // Header chunk: format 0, one track, PPQN division
  w.be32(kMThd);
  w.be32(6);
  w.be16(0);
  w.be16(1);
  w.be16(static_cast<std::uint16_t>(track.ppqn));

  // Track chunk; the length is patched once the body is known
  w.be32(kMTrk);
  const std::size_t lengthAt = w.size();
  w.be32(0);
  const std::size_t bodyStart = w.size();

  // Set Tempo meta at tick 0
  write_vlq(w, 0);
  w.u8(0xFF);
  w.u8(0x51);
  w.u8(0x03);
  w.be24(track.usPerQN);

  for (const auto &ev : track.events) {
    write_event(w, ev);
  }

  // End of Track
  write_vlq(w, 0);
  w.u8(0xFF);
  w.u8(0x2F);
  w.u8(0x00);

  w.patch_be32(lengthAt, static_cast<std::uint32_t>(w.size() - bodyStart));
  return std::move(w.data);
}

} // namespace midi
