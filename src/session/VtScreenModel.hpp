#ifndef __TB_VT_SCREEN_MODEL__
#define __TB_VT_SCREEN_MODEL__

#include <vterm.h>

#include "ScreenModel.hpp"

namespace tb {
struct CellColor {
  enum Type { DEFAULT, INDEXED, RGB };

  Type type = DEFAULT;
  int index = 0;
  uint8_t red = 0;
  uint8_t green = 0;
  uint8_t blue = 0;

  static CellColor indexed(int index) {
    CellColor color;
    color.type = INDEXED;
    color.index = index;
    return color;
  }
  static CellColor rgb(uint8_t red, uint8_t green, uint8_t blue) {
    CellColor color;
    color.type = RGB;
    color.red = red;
    color.green = green;
    color.blue = blue;
    return color;
  }

  bool operator==(const CellColor& other) const {
    if (type != other.type) {
      return false;
    }
    switch (type) {
      case INDEXED:
        return index == other.index;
      case RGB:
        return red == other.red && green == other.green && blue == other.blue;
      default:
        return true;
    }
  }
  bool operator!=(const CellColor& other) const { return !(*this == other); }
};

struct CellAttributes {
  CellColor foreground;
  CellColor background;
  bool bold = false;
  // 0 none, 1 single, 2 double, 3 curly
  int underline = 0;
  bool italic = false;
  bool blink = false;
  bool inverse = false;
  bool strike = false;

  bool operator==(const CellAttributes& other) const {
    return foreground == other.foreground && background == other.background &&
           bold == other.bold && underline == other.underline &&
           italic == other.italic && blink == other.blink &&
           inverse == other.inverse && strike == other.strike;
  }
  bool operator!=(const CellAttributes& other) const {
    return !(*this == other);
  }
};

struct Cell {
  // One UTF-8 encoded glyph, empty for the right half of a wide glyph
  string text = " ";
  int width = 1;
  CellAttributes attributes;

  bool isBlank() const { return text == " " && attributes == CellAttributes(); }
};

typedef vector<Cell> ScreenLine;

/**
 * @brief Screen model backed by libvterm.
 *
 * libvterm interprets the output.  This class keeps the scrollback that
 * libvterm hands out through sb_pushline and rebuilds a replayable byte
 * stream from the cells.  The few bits of state libvterm does not expose
 * (DEC private modes, scroll margins, the primary screen while the alternate
 * one is shown, a pending autowrap) are followed alongside.
 */
class VtScreenModel : public ScreenModel {
 public:
  VtScreenModel(int _columns, int _rows, int _scrollbackLimit);
  virtual ~VtScreenModel() {}

  VtScreenModel(const VtScreenModel&) = delete;
  VtScreenModel& operator=(const VtScreenModel&) = delete;

  virtual void write(const string& data);
  virtual void resize(int newColumns, int newRows);
  virtual void reset();
  virtual string serialize() const;

  virtual int getColumns() const { return columns; }
  virtual int getRows() const { return rows; }

  /** @brief Text of a visible row with trailing blanks removed. */
  string getLineText(int row) const;
  /** @brief Text of the scrollback, oldest line first. */
  vector<string> getScrollbackText() const;
  Cell getCell(int row, int column) const;
  int getCursorRow() const;
  int getCursorColumn() const;
  int getScrollbackSize() const { return int(scrollback.size()); }
  bool isAlternateScreen() const { return alternateScreen; }

 protected:
  // Follows escape sequences next to libvterm for the state it keeps private
  enum class ScanState { NORMAL, ESCAPE, CSI, STRING, STRING_ESCAPE };
  enum class ScanAction { NONE, ENTER_ALTERNATE, CURSOR_MOVED };

  void createTerminal();
  void feed(const char* data, size_t length, bool text);
  ScanAction scanByte(unsigned char c);
  ScanAction dispatchCsi(char finalByte);
  void setPrivateMode(int mode, bool value);
  void resetTrackedModes();
  void capturePrimaryScreen();

  ScreenLine readLine(int row) const;
  bool isContinuation(int row) const;
  Cell toCell(const VTermScreenCell& screenCell) const;
  void toScreenCell(const Cell& cell, VTermScreenCell* screenCell) const;
  CellAttributes penAttributes() const;
  bool isModeSet(int mode) const;
  void appendRows(string* out, const vector<ScreenLine>& lines,
                  const vector<bool>& continuation,
                  CellAttributes* current) const;

  static CellColor toColor(const VTermColor& color);
  static string lineText(const ScreenLine& line);
  static bool isEmptyLine(const ScreenLine& line);
  static string sgrFor(const CellAttributes& attributes);
  static string cursorPosition(int row, int column);
  static void appendLine(string* out, const ScreenLine& line, int maxColumns,
                         bool fullWidth, CellAttributes* current);
  static void appendNewline(string* out, CellAttributes* current);

  static int onDamage(VTermRect rect, void* user);
  static int onMoveCursor(VTermPos pos, VTermPos oldpos, int visible,
                          void* user);
  static int onSetTermProp(VTermProp prop, VTermValue* val, void* user);
  static int onPushLine(int cols, const VTermScreenCell* cells, void* user);
  static int onPopLine(int cols, VTermScreenCell* cells, void* user);
  static int onClearScrollback(void* user);

  struct TerminalDeleter {
    void operator()(VTerm* terminal) const { vterm_free(terminal); }
  };

  int columns;
  int rows;
  int scrollbackLimit;
  deque<ScreenLine> scrollback;

  unique_ptr<VTerm, TerminalDeleter> terminal;
  VTermScreen* screen;
  VTermState* state;
  VTermScreenCallbacks callbacks;
  bool feedingText;

  // The last glyph landed in the last column and the cursor has not moved
  // since, so the next glyph wraps first.
  bool edgeGlyph;
  VTermPos edgePosition;

  bool alternateScreen;
  int alternateMode;
  vector<ScreenLine> primaryLines;
  vector<bool> primaryContinuation;
  VTermPos primaryCursor;

  // 1-based inclusive scroll margins, 0 when unset
  int marginTop;
  int marginBottom;
  map<int, bool> privateModes;
  map<int, bool> ansiModes;
  bool keypadApplication;

  ScanState scanState;
  string scanSequence;
};
}  // namespace tb

#endif  // __TB_VT_SCREEN_MODEL__
