#include "AnsiStripper.hpp"

namespace tb {
namespace {
const unsigned char ESC = 0x1b;
const unsigned char BEL = 0x07;
const unsigned char C1_DCS = 0x90;
const unsigned char C1_SOS = 0x98;
const unsigned char C1_CSI = 0x9b;
const unsigned char C1_ST = 0x9c;
const unsigned char C1_OSC = 0x9d;
const unsigned char C1_PM = 0x9e;
const unsigned char C1_APC = 0x9f;

inline unsigned char byteAt(const string& s, size_t pos) {
  return static_cast<unsigned char>(s[pos]);
}

inline bool isContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }
}  // namespace

size_t AnsiStripper::skipCsi(const string& input, size_t pos) {
  // Parameter and intermediate bytes are 0x20-0x3F, the final byte 0x40-0x7E
  while (pos < input.length()) {
    unsigned char c = byteAt(input, pos++);
    if (c >= 0x40 && c <= 0x7e) {
      break;
    }
    if (c < 0x20 && c != ESC) {
      // Stray control inside the sequence, drop it with the sequence
      continue;
    }
    if (c == ESC) {
      // Aborted sequence; let the caller rescan the new escape
      return pos - 1;
    }
  }
  return pos;
}

size_t AnsiStripper::skipString(const string& input, size_t pos) {
  // OSC/DCS/SOS/PM/APC run until BEL, ST (0x9C) or ESC '\'
  while (pos < input.length()) {
    unsigned char c = byteAt(input, pos);
    if (c == BEL || c == C1_ST) {
      return pos + 1;
    }
    if (c == ESC) {
      if (pos + 1 < input.length() && input[pos + 1] == '\\') {
        return pos + 2;
      }
      return pos;
    }
    pos++;
  }
  return pos;
}

string AnsiStripper::strip(const string& input) {
  string output;
  output.reserve(input.length());
  size_t i = 0;
  while (i < input.length()) {
    unsigned char c = byteAt(input, i);

    if (c >= 0xC0) {
      // UTF-8 lead byte: copy the whole character verbatim
      output.push_back(char(c));
      i++;
      while (i < input.length() && isContinuation(byteAt(input, i))) {
        output.push_back(input[i]);
        i++;
      }
      continue;
    }

    if (c == ESC) {
      if (i + 1 >= input.length()) {
        break;
      }
      unsigned char next = byteAt(input, i + 1);
      if (next == '[') {
        i = skipCsi(input, i + 2);
      } else if (next == ']' || next == 'P' || next == 'X' || next == '^' ||
                 next == '_') {
        i = skipString(input, i + 2);
      } else if (next == '(' || next == ')' || next == '*' || next == '+' ||
                 next == '#' || next == '%') {
        // Charset designation and DEC line attributes carry one more byte
        i = std::min(input.length(), i + 3);
      } else {
        i += 2;
      }
      continue;
    }

    if (c == C1_CSI) {
      i = skipCsi(input, i + 1);
      continue;
    }
    if (c == C1_OSC || c == C1_DCS || c == C1_SOS || c == C1_PM ||
        c == C1_APC) {
      i = skipString(input, i + 1);
      continue;
    }
    if (c >= 0x80 && c <= 0x9f) {
      // Other C1 control, or an orphaned continuation byte
      i++;
      continue;
    }

    if ((c < 0x20 && c != '\n' && c != '\r' && c != '\t') || c == 0x7f) {
      i++;
      continue;
    }

    output.push_back(char(c));
    i++;
  }
  return output;
}
}  // namespace tb
