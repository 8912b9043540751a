#include "VtScreenModel.hpp"

namespace tb {
namespace {
const size_t MAX_SEQUENCE_LENGTH = 64;
const uint32_t WIDE_CONTINUATION = (uint32_t)-1;

bool isTrackedPrivateMode(int mode) {
  switch (mode) {
    case 1:
    case 5:
    case 6:
    case 7:
    case 25:
    case 1000:
    case 1002:
    case 1003:
    case 1004:
    case 1005:
    case 1006:
    case 1015:
    case 2004:
      return true;
    default:
      return false;
  }
}

bool defaultPrivateMode(int mode) { return mode == 7 || mode == 25; }

void appendUtf8(string* out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out->push_back(char(codepoint));
  } else if (codepoint < 0x800) {
    out->push_back(char(0xC0 | (codepoint >> 6)));
    out->push_back(char(0x80 | (codepoint & 0x3F)));
  } else if (codepoint < 0x10000) {
    out->push_back(char(0xE0 | (codepoint >> 12)));
    out->push_back(char(0x80 | ((codepoint >> 6) & 0x3F)));
    out->push_back(char(0x80 | (codepoint & 0x3F)));
  } else {
    out->push_back(char(0xF0 | (codepoint >> 18)));
    out->push_back(char(0x80 | ((codepoint >> 12) & 0x3F)));
    out->push_back(char(0x80 | ((codepoint >> 6) & 0x3F)));
    out->push_back(char(0x80 | (codepoint & 0x3F)));
  }
}

vector<uint32_t> decodeUtf8(const string& text) {
  vector<uint32_t> codepoints;
  size_t i = 0;
  while (i < text.size()) {
    unsigned char lead = (unsigned char)text[i];
    int remaining = 0;
    uint32_t codepoint = lead;
    if (lead >= 0xF0) {
      remaining = 3;
      codepoint = lead & 0x07;
    } else if (lead >= 0xE0) {
      remaining = 2;
      codepoint = lead & 0x0F;
    } else if (lead >= 0xC0) {
      remaining = 1;
      codepoint = lead & 0x1F;
    }
    i++;
    for (; remaining > 0 && i < text.size(); remaining--, i++) {
      codepoint = (codepoint << 6) | ((unsigned char)text[i] & 0x3F);
    }
    codepoints.push_back(codepoint);
  }
  return codepoints;
}

void appendColor(string* sgr, const CellColor& color, int base, int bright,
                 int extended) {
  switch (color.type) {
    case CellColor::INDEXED:
      if (color.index < 8) {
        *sgr += ";" + to_string(base + color.index);
      } else if (color.index < 16) {
        *sgr += ";" + to_string(bright + color.index - 8);
      } else {
        *sgr += ";" + to_string(extended) + ";5;" + to_string(color.index);
      }
      break;
    case CellColor::RGB:
      *sgr += ";" + to_string(extended) + ";2;" + to_string(color.red) + ";" +
              to_string(color.green) + ";" + to_string(color.blue);
      break;
    default:
      break;
  }
}

VTermColor toVTermColor(const CellColor& color, const VTermColor& fallback) {
  VTermColor result = fallback;
  switch (color.type) {
    case CellColor::INDEXED:
      vterm_color_indexed(&result, uint8_t(color.index));
      break;
    case CellColor::RGB:
      vterm_color_rgb(&result, color.red, color.green, color.blue);
      break;
    default:
      break;
  }
  return result;
}
}  // namespace

VtScreenModel::VtScreenModel(int _columns, int _rows, int _scrollbackLimit)
    : columns(max(1, _columns)),
      rows(max(1, _rows)),
      scrollbackLimit(max(0, _scrollbackLimit)),
      screen(NULL),
      state(NULL) {
  memset(&callbacks, 0, sizeof(callbacks));
  callbacks.damage = VtScreenModel::onDamage;
  callbacks.movecursor = VtScreenModel::onMoveCursor;
  callbacks.settermprop = VtScreenModel::onSetTermProp;
  callbacks.sb_pushline = VtScreenModel::onPushLine;
  callbacks.sb_popline = VtScreenModel::onPopLine;
  callbacks.sb_clear = VtScreenModel::onClearScrollback;
  reset();
}

void VtScreenModel::createTerminal() {
  terminal.reset(vterm_new(rows, columns));
  if (!terminal) {
    throw std::runtime_error("Could not allocate a terminal");
  }
  vterm_set_utf8(terminal.get(), 1);

  state = vterm_obtain_state(terminal.get());
  screen = vterm_obtain_screen(terminal.get());
  vterm_screen_set_callbacks(screen, &callbacks, this);
  vterm_screen_set_damage_merge(screen, VTERM_DAMAGE_CELL);
  vterm_screen_enable_altscreen(screen, 1);
  vterm_screen_enable_reflow(screen, true);
  vterm_screen_reset(screen, 1);
}

void VtScreenModel::reset() {
  // The old terminal goes first so nothing it does lands in the new state
  terminal.reset();
  scrollback.clear();
  feedingText = false;
  edgeGlyph = false;
  edgePosition.row = edgePosition.col = 0;
  alternateScreen = false;
  alternateMode = 0;
  primaryLines.clear();
  primaryContinuation.clear();
  primaryCursor.row = primaryCursor.col = 0;
  scanState = ScanState::NORMAL;
  scanSequence.clear();
  resetTrackedModes();
  createTerminal();
}

void VtScreenModel::resetTrackedModes() {
  marginTop = marginBottom = 0;
  privateModes.clear();
  ansiModes.clear();
  keypadApplication = false;
}

void VtScreenModel::write(const string& data) {
  const char* bytes = data.data();
  size_t start = 0;
  bool text = false;
  for (size_t i = 0; i < data.size(); i++) {
    unsigned char c = (unsigned char)bytes[i];
    bool isText = scanState == ScanState::NORMAL && c >= 0x20 && c != 0x7f;
    if (isText != text) {
      feed(bytes + start, i - start, text);
      start = i;
      text = isText;
    }
    ScanAction action = scanByte(c);
    if (action == ScanAction::ENTER_ALTERNATE) {
      // Hold back the final byte until the primary screen is copied
      feed(bytes + start, i - start, text);
      start = i;
      capturePrimaryScreen();
    } else if (action == ScanAction::CURSOR_MOVED) {
      feed(bytes + start, i + 1 - start, text);
      start = i + 1;
      edgeGlyph = false;
    }
  }
  feed(bytes + start, data.size() - start, text);
}

void VtScreenModel::feed(const char* data, size_t length, bool text) {
  if (length == 0) {
    return;
  }
  feedingText = text;
  vterm_input_write(terminal.get(), data, length);
  feedingText = false;
}

VtScreenModel::ScanAction VtScreenModel::scanByte(unsigned char c) {
  switch (scanState) {
    case ScanState::NORMAL:
      if (c == 0x1b) {
        scanState = ScanState::ESCAPE;
        scanSequence.clear();
      }
      return ScanAction::NONE;

    case ScanState::ESCAPE: {
      if (c == 0x18 || c == 0x1a) {
        scanState = ScanState::NORMAL;
        return ScanAction::NONE;
      }
      if (c == 0x1b) {
        scanSequence.clear();
        return ScanAction::NONE;
      }
      if (c < 0x20) {
        return ScanAction::NONE;
      }
      if (c <= 0x2f) {
        if (scanSequence.size() < MAX_SEQUENCE_LENGTH) {
          scanSequence.push_back(char(c));
        }
        return ScanAction::NONE;
      }
      scanState = ScanState::NORMAL;
      if (!scanSequence.empty()) {
        // Character set designations and the like
        scanSequence.clear();
        return ScanAction::NONE;
      }
      switch (c) {
        case '[':
          scanState = ScanState::CSI;
          return ScanAction::NONE;
        case ']':
        case 'P':
        case 'X':
        case '^':
        case '_':
          scanState = ScanState::STRING;
          return ScanAction::NONE;
        case 'c':
          resetTrackedModes();
          return ScanAction::CURSOR_MOVED;
        case '=':
          keypadApplication = true;
          return ScanAction::NONE;
        case '>':
          keypadApplication = false;
          return ScanAction::NONE;
        case '8':
        case 'D':
        case 'E':
        case 'M':
          return ScanAction::CURSOR_MOVED;
        default:
          return ScanAction::NONE;
      }
    }

    case ScanState::CSI:
      if (c >= 0x40 && c <= 0x7e) {
        scanState = ScanState::NORMAL;
        ScanAction action = dispatchCsi(char(c));
        scanSequence.clear();
        return action;
      }
      if (c >= 0x20 && c <= 0x3f) {
        if (scanSequence.size() < MAX_SEQUENCE_LENGTH) {
          scanSequence.push_back(char(c));
        }
      } else if (c == 0x1b) {
        scanState = ScanState::ESCAPE;
        scanSequence.clear();
      } else if (c == 0x18 || c == 0x1a) {
        scanState = ScanState::NORMAL;
        scanSequence.clear();
      }
      return ScanAction::NONE;

    case ScanState::STRING:
      if (c == 0x07 || c == 0x18 || c == 0x1a) {
        scanState = ScanState::NORMAL;
      } else if (c == 0x1b) {
        scanState = ScanState::STRING_ESCAPE;
      }
      return ScanAction::NONE;

    case ScanState::STRING_ESCAPE:
      if (c == '\\') {
        scanState = ScanState::NORMAL;
        return ScanAction::NONE;
      }
      // The string ended and this byte belongs to a new escape
      scanState = ScanState::ESCAPE;
      scanSequence.clear();
      return scanByte(c);
  }
  return ScanAction::NONE;
}

VtScreenModel::ScanAction VtScreenModel::dispatchCsi(char finalByte) {
  string params = scanSequence;
  char leader = 0;
  if (!params.empty() && params[0] >= 0x3c && params[0] <= 0x3f) {
    leader = params[0];
    params.erase(0, 1);
  }
  string intermediates;
  while (!params.empty() && params.back() >= 0x20 && params.back() <= 0x2f) {
    intermediates.insert(intermediates.begin(), params.back());
    params.pop_back();
  }

  vector<int> args(1, -1);
  bool subParameter = false;
  for (char ch : params) {
    if (ch == ';') {
      args.push_back(-1);
      subParameter = false;
    } else if (ch == ':') {
      subParameter = true;
    } else if (!subParameter && ch >= '0' && ch <= '9') {
      args.back() = min(99999, max(0, args.back()) * 10 + (ch - '0'));
    }
  }

  if (!intermediates.empty()) {
    if (leader == 0 && intermediates == "!" && finalByte == 'p') {
      // DECSTR
      resetTrackedModes();
      return ScanAction::CURSOR_MOVED;
    }
    return ScanAction::NONE;
  }

  if (leader == '?') {
    if (finalByte != 'h' && finalByte != 'l') {
      return ScanAction::NONE;
    }
    bool value = finalByte == 'h';
    bool enterAlternate = false;
    bool homed = false;
    for (int mode : args) {
      if (value && !alternateScreen &&
          (mode == 47 || mode == 1047 || mode == 1049)) {
        enterAlternate = true;
        alternateMode = mode;
      }
      if (mode == 6) {
        homed = true;
      }
      setPrivateMode(mode, value);
    }
    if (enterAlternate) {
      return ScanAction::ENTER_ALTERNATE;
    }
    return homed ? ScanAction::CURSOR_MOVED : ScanAction::NONE;
  }
  if (leader != 0) {
    return ScanAction::NONE;
  }

  switch (finalByte) {
    case 'h':
    case 'l':
      for (int mode : args) {
        if (mode == 4 || mode == 20) {
          ansiModes[mode] = finalByte == 'h';
        }
      }
      return ScanAction::NONE;
    case 'r': {
      int top = min(rows, args[0] > 0 ? args[0] : 1);
      int bottom = args.size() > 1 && args[1] > 0 ? min(args[1], rows) : rows;
      if ((top == 1 && bottom == rows) || bottom < top) {
        marginTop = marginBottom = 0;
      } else {
        marginTop = top;
        marginBottom = bottom;
      }
      return ScanAction::CURSOR_MOVED;
    }
    case 'H':
    case 'f':
    case 'A':
    case 'B':
    case 'C':
    case 'D':
    case 'E':
    case 'F':
    case 'G':
    case 'd':
    case '`':
    case 'a':
    case 'e':
    case 'u':
      return ScanAction::CURSOR_MOVED;
    default:
      return ScanAction::NONE;
  }
}

void VtScreenModel::setPrivateMode(int mode, bool value) {
  if (!isTrackedPrivateMode(mode)) {
    VLOG(3) << "Not tracking private mode " << mode;
    return;
  }
  if (value) {
    // Mouse tracking modes and mouse encodings each replace one another
    static const vector<vector<int>> exclusiveGroups = {{1000, 1002, 1003},
                                                        {1005, 1006, 1015}};
    for (const auto& group : exclusiveGroups) {
      if (find(group.begin(), group.end(), mode) != group.end()) {
        for (int other : group) {
          privateModes[other] = false;
        }
      }
    }
  }
  privateModes[mode] = value;
}

bool VtScreenModel::isModeSet(int mode) const {
  auto it = privateModes.find(mode);
  if (it == privateModes.end()) {
    return defaultPrivateMode(mode);
  }
  return it->second;
}

void VtScreenModel::capturePrimaryScreen() {
  primaryLines.clear();
  primaryContinuation.clear();
  for (int row = 0; row < rows; row++) {
    primaryLines.push_back(readLine(row));
    primaryContinuation.push_back(isContinuation(row));
  }
  vterm_state_get_cursorpos(state, &primaryCursor);
  edgeGlyph = false;
}

void VtScreenModel::resize(int newColumns, int newRows) {
  if (newColumns < 1 || newRows < 1) {
    LOG(WARNING) << "Ignoring invalid screen size " << newColumns << "x"
                 << newRows;
    return;
  }
  if (newColumns == columns && newRows == rows) {
    return;
  }
  columns = newColumns;
  rows = newRows;
  edgeGlyph = false;
  vterm_set_size(terminal.get(), rows, columns);

  if (marginTop > 0) {
    marginBottom = min(marginBottom, rows);
    if (marginBottom < marginTop || (marginTop == 1 && marginBottom == rows)) {
      marginTop = marginBottom = 0;
    }
  }

  if (alternateScreen) {
    while (int(primaryLines.size()) > rows) {
      if (primaryCursor.row > 0) {
        primaryLines.erase(primaryLines.begin());
        primaryContinuation.erase(primaryContinuation.begin());
        primaryCursor.row--;
      } else {
        primaryLines.pop_back();
        primaryContinuation.pop_back();
      }
    }
    while (int(primaryLines.size()) < rows) {
      primaryLines.push_back(ScreenLine());
      primaryContinuation.push_back(false);
    }
    primaryCursor.col = min(primaryCursor.col, columns - 1);
  }
}

string VtScreenModel::getLineText(int row) const {
  return lineText(readLine(row));
}

vector<string> VtScreenModel::getScrollbackText() const {
  vector<string> text;
  for (const auto& line : scrollback) {
    text.push_back(lineText(line));
  }
  return text;
}

Cell VtScreenModel::getCell(int row, int column) const {
  VTermPos pos;
  pos.row = row;
  pos.col = column;
  VTermScreenCell screenCell;
  if (row < 0 || row >= rows || column < 0 || column >= columns ||
      !vterm_screen_get_cell(screen, pos, &screenCell)) {
    return Cell();
  }
  return toCell(screenCell);
}

int VtScreenModel::getCursorRow() const {
  VTermPos cursor;
  vterm_state_get_cursorpos(state, &cursor);
  return cursor.row;
}

int VtScreenModel::getCursorColumn() const {
  VTermPos cursor;
  vterm_state_get_cursorpos(state, &cursor);
  return cursor.col;
}

ScreenLine VtScreenModel::readLine(int row) const {
  ScreenLine line;
  if (row < 0 || row >= rows) {
    return line;
  }
  line.reserve(columns);
  for (int column = 0; column < columns; column++) {
    line.push_back(getCell(row, column));
  }
  return line;
}

bool VtScreenModel::isContinuation(int row) const {
  const VTermLineInfo* info = vterm_state_get_lineinfo(state, row);
  return info && info->continuation;
}

Cell VtScreenModel::toCell(const VTermScreenCell& screenCell) const {
  Cell cell;
  if (screenCell.chars[0] == WIDE_CONTINUATION) {
    cell.text.clear();
    cell.width = 0;
  } else if (screenCell.chars[0] != 0) {
    cell.text.clear();
    for (int i = 0; i < VTERM_MAX_CHARS_PER_CELL && screenCell.chars[i]; i++) {
      appendUtf8(&cell.text, screenCell.chars[i]);
    }
    cell.width = screenCell.width;
  }
  cell.attributes.bold = screenCell.attrs.bold;
  cell.attributes.underline = screenCell.attrs.underline;
  cell.attributes.italic = screenCell.attrs.italic;
  cell.attributes.blink = screenCell.attrs.blink;
  cell.attributes.inverse = screenCell.attrs.reverse;
  cell.attributes.strike = screenCell.attrs.strike;
  cell.attributes.foreground = toColor(screenCell.fg);
  cell.attributes.background = toColor(screenCell.bg);
  return cell;
}

void VtScreenModel::toScreenCell(const Cell& cell,
                                 VTermScreenCell* screenCell) const {
  memset(screenCell, 0, sizeof(*screenCell));
  if (cell.width == 0) {
    screenCell->chars[0] = WIDE_CONTINUATION;
    screenCell->width = 1;
  } else {
    if (cell.text != " ") {
      vector<uint32_t> codepoints = decodeUtf8(cell.text);
      for (int i = 0;
           i < VTERM_MAX_CHARS_PER_CELL && i < int(codepoints.size()); i++) {
        screenCell->chars[i] = codepoints[i];
      }
    }
    screenCell->width = char(cell.width);
  }
  screenCell->attrs.bold = cell.attributes.bold;
  screenCell->attrs.underline = cell.attributes.underline;
  screenCell->attrs.italic = cell.attributes.italic;
  screenCell->attrs.blink = cell.attributes.blink;
  screenCell->attrs.reverse = cell.attributes.inverse;
  screenCell->attrs.strike = cell.attributes.strike;

  VTermColor defaultForeground, defaultBackground;
  vterm_state_get_default_colors(state, &defaultForeground, &defaultBackground);
  screenCell->fg =
      toVTermColor(cell.attributes.foreground, defaultForeground);
  screenCell->bg =
      toVTermColor(cell.attributes.background, defaultBackground);
}

CellColor VtScreenModel::toColor(const VTermColor& color) {
  if (VTERM_COLOR_IS_DEFAULT_FG(&color) || VTERM_COLOR_IS_DEFAULT_BG(&color)) {
    return CellColor();
  }
  if (VTERM_COLOR_IS_INDEXED(&color)) {
    return CellColor::indexed(color.indexed.idx);
  }
  return CellColor::rgb(color.rgb.red, color.rgb.green, color.rgb.blue);
}

CellAttributes VtScreenModel::penAttributes() const {
  CellAttributes attributes;
  VTermValue value;
  if (vterm_state_get_penattr(state, VTERM_ATTR_BOLD, &value)) {
    attributes.bold = value.boolean;
  }
  if (vterm_state_get_penattr(state, VTERM_ATTR_UNDERLINE, &value)) {
    attributes.underline = value.number;
  }
  if (vterm_state_get_penattr(state, VTERM_ATTR_ITALIC, &value)) {
    attributes.italic = value.boolean;
  }
  if (vterm_state_get_penattr(state, VTERM_ATTR_BLINK, &value)) {
    attributes.blink = value.boolean;
  }
  if (vterm_state_get_penattr(state, VTERM_ATTR_REVERSE, &value)) {
    attributes.inverse = value.boolean;
  }
  if (vterm_state_get_penattr(state, VTERM_ATTR_STRIKE, &value)) {
    attributes.strike = value.boolean;
  }
  if (vterm_state_get_penattr(state, VTERM_ATTR_FOREGROUND, &value)) {
    attributes.foreground = toColor(value.color);
  }
  if (vterm_state_get_penattr(state, VTERM_ATTR_BACKGROUND, &value)) {
    attributes.background = toColor(value.color);
  }
  return attributes;
}

string VtScreenModel::lineText(const ScreenLine& line) {
  string text;
  for (const auto& cell : line) {
    if (cell.width > 0) {
      text += cell.text;
    }
  }
  size_t end = text.find_last_not_of(' ');
  return end == string::npos ? string() : text.substr(0, end + 1);
}

bool VtScreenModel::isEmptyLine(const ScreenLine& line) {
  for (const auto& cell : line) {
    if (!cell.isBlank()) {
      return false;
    }
  }
  return true;
}

string VtScreenModel::sgrFor(const CellAttributes& attributes) {
  string sgr = "\x1b[0";
  if (attributes.bold) {
    sgr += ";1";
  }
  if (attributes.italic) {
    sgr += ";3";
  }
  switch (attributes.underline) {
    case 1:
      sgr += ";4";
      break;
    case 2:
      sgr += ";21";
      break;
    case 3:
      sgr += ";4:3";
      break;
    default:
      break;
  }
  if (attributes.blink) {
    sgr += ";5";
  }
  if (attributes.inverse) {
    sgr += ";7";
  }
  if (attributes.strike) {
    sgr += ";9";
  }
  appendColor(&sgr, attributes.foreground, 30, 90, 38);
  appendColor(&sgr, attributes.background, 40, 100, 48);
  return sgr + "m";
}

string VtScreenModel::cursorPosition(int row, int column) {
  return "\x1b[" + to_string(row + 1) + ";" + to_string(column + 1) + "H";
}

void VtScreenModel::appendLine(string* out, const ScreenLine& line,
                               int maxColumns, bool fullWidth,
                               CellAttributes* current) {
  int end = min(int(line.size()), maxColumns);
  if (!fullWidth) {
    while (end > 0 && line[end - 1].isBlank()) {
      end--;
    }
  }
  int column = 0;
  for (int i = 0; i < end; i++) {
    const Cell& cell = line[i];
    if (cell.width == 0) {
      continue;
    }
    if (column + cell.width > maxColumns) {
      break;
    }
    if (cell.attributes != *current) {
      *out += sgrFor(cell.attributes);
      *current = cell.attributes;
    }
    *out += cell.text;
    column += cell.width;
  }
  if (fullWidth && column < maxColumns) {
    if (*current != CellAttributes()) {
      *out += sgrFor(CellAttributes());
      *current = CellAttributes();
    }
    out->append(maxColumns - column, ' ');
  }
}

void VtScreenModel::appendNewline(string* out, CellAttributes* current) {
  // A scroll fills the new line with the current background
  if (*current != CellAttributes()) {
    *out += "\x1b[0m";
    *current = CellAttributes();
  }
  *out += "\r\n";
}

void VtScreenModel::appendRows(string* out, const vector<ScreenLine>& lines,
                               const vector<bool>& continuation,
                               CellAttributes* current) const {
  for (size_t row = 0; row < lines.size(); row++) {
    bool last = row + 1 == lines.size();
    // Filling a row to the edge lets the next glyph wrap onto a continuation
    bool joined = !last && continuation[row + 1] && !isEmptyLine(lines[row + 1]);
    appendLine(out, lines[row], columns, joined, current);
    if (!last && !joined) {
      appendNewline(out, current);
    }
  }
}

string VtScreenModel::serialize() const {
  string out;
  CellAttributes current;

  vector<ScreenLine> lines;
  vector<bool> continuation;
  if (alternateScreen && !primaryLines.empty()) {
    lines = primaryLines;
    continuation = primaryContinuation;
  } else {
    for (int row = 0; row < rows; row++) {
      lines.push_back(alternateScreen ? ScreenLine() : readLine(row));
      continuation.push_back(!alternateScreen && isContinuation(row));
    }
  }

  for (size_t i = 0; i < scrollback.size(); i++) {
    bool joined = i + 1 == scrollback.size() && continuation[0] &&
                  !isEmptyLine(lines[0]);
    appendLine(&out, scrollback[i], columns, joined, &current);
    if (!joined) {
      appendNewline(&out, &current);
    }
  }
  appendRows(&out, lines, continuation, &current);

  if (alternateScreen) {
    if (current != CellAttributes()) {
      out += "\x1b[0m";
      current = CellAttributes();
    }
    out += cursorPosition(primaryCursor.row, primaryCursor.col);
    out += "\x1b[?" + to_string(alternateMode ? alternateMode : 1049) + "h";
    for (int row = 0; row < rows; row++) {
      ScreenLine line = readLine(row);
      if (isEmptyLine(line)) {
        continue;
      }
      out += cursorPosition(row, 0);
      appendLine(&out, line, columns, false, &current);
    }
  }

  out += "\x1b[0m";
  if (marginTop > 0) {
    out += "\x1b[" + to_string(marginTop) + ";" + to_string(marginBottom) +
           "r";
  }
  for (const auto& it : privateModes) {
    if (it.second != defaultPrivateMode(it.first)) {
      out += "\x1b[?" + to_string(it.first) + (it.second ? "h" : "l");
    }
  }
  if (keypadApplication) {
    out += "\x1b=";
  }

  int originRow = isModeSet(6) && marginTop > 0 ? marginTop - 1 : 0;
  if (edgeGlyph && isModeSet(7)) {
    // Rewriting the last glyph leaves the next one pending a wrap
    Cell cell = getCell(edgePosition.row, edgePosition.col);
    out += cursorPosition(edgePosition.row - originRow, edgePosition.col);
    out += sgrFor(cell.attributes);
    out += cell.width == 0 ? string(" ") : cell.text;
  } else {
    VTermPos cursor;
    vterm_state_get_cursorpos(state, &cursor);
    out += cursorPosition(cursor.row - originRow, cursor.col);
  }
  for (const auto& it : ansiModes) {
    if (it.second) {
      out += "\x1b[" + to_string(it.first) + "h";
    }
  }
  out += sgrFor(penAttributes());
  return out;
}

int VtScreenModel::onDamage(VTermRect rect, void* user) {
  VtScreenModel* model = static_cast<VtScreenModel*>(user);
  if (!model->feedingText || rect.end_row - rect.start_row != 1 ||
      rect.end_col != model->columns || rect.end_col - rect.start_col > 2) {
    return 1;
  }
  // A glyph drawn at the cursor against the right edge
  VTermPos cursor;
  vterm_state_get_cursorpos(model->state, &cursor);
  if (cursor.row == rect.start_row && cursor.col == rect.start_col) {
    model->edgeGlyph = true;
    model->edgePosition = cursor;
  }
  return 1;
}

int VtScreenModel::onMoveCursor(VTermPos pos, VTermPos oldpos, int visible,
                                void* user) {
  VtScreenModel* model = static_cast<VtScreenModel*>(user);
  if (model->edgeGlyph && (pos.row != model->edgePosition.row ||
                           pos.col != model->edgePosition.col)) {
    model->edgeGlyph = false;
  }
  return 1;
}

int VtScreenModel::onSetTermProp(VTermProp prop, VTermValue* val,
                                 void* user) {
  VtScreenModel* model = static_cast<VtScreenModel*>(user);
  if (prop == VTERM_PROP_ALTSCREEN) {
    model->alternateScreen = val->boolean;
    if (!model->alternateScreen) {
      model->alternateMode = 0;
      model->primaryLines.clear();
      model->primaryContinuation.clear();
    }
  }
  return 1;
}

int VtScreenModel::onPushLine(int cols, const VTermScreenCell* cells,
                              void* user) {
  VtScreenModel* model = static_cast<VtScreenModel*>(user);
  if (model->scrollbackLimit == 0) {
    return 0;
  }
  ScreenLine line;
  line.reserve(cols);
  for (int i = 0; i < cols; i++) {
    line.push_back(model->toCell(cells[i]));
  }
  model->scrollback.push_back(std::move(line));
  while (int(model->scrollback.size()) > model->scrollbackLimit) {
    model->scrollback.pop_front();
  }
  return 1;
}

int VtScreenModel::onPopLine(int cols, VTermScreenCell* cells, void* user) {
  VtScreenModel* model = static_cast<VtScreenModel*>(user);
  if (model->scrollback.empty()) {
    return 0;
  }
  const ScreenLine& line = model->scrollback.back();
  Cell blank;
  for (int i = 0; i < cols; i++) {
    model->toScreenCell(i < int(line.size()) ? line[i] : blank, &cells[i]);
  }
  model->scrollback.pop_back();
  return 1;
}

int VtScreenModel::onClearScrollback(void* user) {
  VtScreenModel* model = static_cast<VtScreenModel*>(user);
  model->scrollback.clear();
  return 1;
}
}  // namespace tb
