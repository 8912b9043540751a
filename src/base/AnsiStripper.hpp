#ifndef __TB_ANSI_STRIPPER__
#define __TB_ANSI_STRIPPER__

#include "Headers.hpp"

namespace tb {
/**
 * @brief Removes terminal control traffic from captured output.
 *
 * Scans bytes literally (no regex): CSI and OSC sequences in both their
 * 7-bit (ESC-prefixed) and 8-bit C1 forms, DCS/SOS/PM/APC strings, two and
 * three byte ESC sequences, and single C0 control bytes other than newline,
 * carriage return and tab. UTF-8 multi-byte characters are preserved, so
 * continuation bytes in 0x80-0x9F are never mistaken for C1 controls.
 */
class AnsiStripper {
 public:
  static string strip(const string& input);

 private:
  static size_t skipCsi(const string& input, size_t pos);
  static size_t skipString(const string& input, size_t pos);
};
}  // namespace tb

#endif  // __TB_ANSI_STRIPPER__
