#ifndef __TB_SCREEN_MODEL__
#define __TB_SCREEN_MODEL__

#include "Headers.hpp"

namespace tb {
/**
 * @brief An in-memory terminal emulator that tracks what a client would be
 * looking at.
 *
 * serialize() produces a byte string that, written into a freshly reset
 * model of the same dimensions, reproduces the same visible screen, cursor
 * and scrollback.
 */
class ScreenModel {
 public:
  virtual ~ScreenModel() {}

  virtual void write(const string& data) = 0;
  virtual void resize(int columns, int rows) = 0;
  virtual void reset() = 0;
  virtual string serialize() const = 0;

  virtual int getColumns() const = 0;
  virtual int getRows() const = 0;
};
}  // namespace tb

#endif  // __TB_SCREEN_MODEL__
