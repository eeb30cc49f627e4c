// src/review.cpp
// midi-review: look at a recorded session.
// Flow:
//  1) Parse CLI (file path)
//  2) Load + parse the MIDI file into midi::Song
//  3) Build tempo map and print a summary

#include <exception>
#include <iostream>

#include "app/cli.hpp"
#include "app/preview.hpp"
#include "io/io.hpp"
#include "midi/smf.hpp"
#include "midi/tempo.hpp"

int main(int argc, char **argv) {
  try {
    const auto cli = app::parse_review_cli(argc, argv);

    const auto bytes = io::read_all(cli.midiPath);
    const midi::Song song = midi::parse_smf(bytes);
    const midi::TempoMap tempo = midi::build_tempo_map(song);

    std::cout << "File: " << cli.midiPath.string() << "\n\n";
    app::print_preview(song, tempo);
    return 0;
  } catch (const std::exception &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
