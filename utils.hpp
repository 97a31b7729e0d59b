#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

// Reads every line of the stream. Line terminators ("\n" or "\r\n") are
// removed; a last line without a terminator is kept.
std::vector<std::string> read_lines(std::istream &stream);

void write_lines(std::ostream &stream, const std::vector<std::string> &lines);
