#pragma once
#include "ocr_engine.hpp"
#include <string>
#include <vector>

// Level badge text that appears on the same line as a creature name.
constexpr const char* kLevelMarker = "Lv.";

/**
 * Picks creature-name tokens out of recognized lines.
 *
 * Only lines containing the level marker are read. A word survives when it
 * starts with an uppercase letter and, once lowercased, is longer than three
 * characters, has no digit or whitespace, and contains none of the banned
 * substrings. Any "llv." left in a survivor is removed. Output keeps line and
 * word order, duplicates included.
 */
std::vector<std::string> FilterCandidates(const std::vector<TextLine>& lines);
