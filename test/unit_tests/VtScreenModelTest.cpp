#include "TestHeaders.hpp"
#include "VtScreenModel.hpp"

using namespace tb;

namespace {
void requireSameScreen(VtScreenModel& expected, VtScreenModel& actual) {
  REQUIRE(actual.getColumns() == expected.getColumns());
  REQUIRE(actual.getRows() == expected.getRows());
  for (int row = 0; row < expected.getRows(); row++) {
    INFO("row " << row);
    REQUIRE(actual.getLineText(row) == expected.getLineText(row));
    for (int column = 0; column < expected.getColumns(); column++) {
      REQUIRE(actual.getCell(row, column).attributes ==
              expected.getCell(row, column).attributes);
    }
  }
  REQUIRE(actual.getScrollbackText() == expected.getScrollbackText());
  REQUIRE(actual.getCursorRow() == expected.getCursorRow());
  REQUIRE(actual.getCursorColumn() == expected.getCursorColumn());
}

// The replayed copy has to match now and keep matching as output continues
void requireSerializeRestores(VtScreenModel& model,
                              const string& followUp = "\r\nafter replay") {
  VtScreenModel copy(model.getColumns(), model.getRows(), 1000);
  copy.write(model.serialize());
  requireSameScreen(model, copy);

  model.write(followUp);
  copy.write(followUp);
  requireSameScreen(model, copy);
}

string allText(const VtScreenModel& model) {
  string text;
  for (const auto& line : model.getScrollbackText()) {
    text += line + "\n";
  }
  for (int row = 0; row < model.getRows(); row++) {
    text += model.getLineText(row) + "\n";
  }
  return text;
}
}  // namespace

TEST_CASE("Plain text and newlines", "[VtScreenModel]") {
  VtScreenModel model(80, 24, 100);
  model.write("hello\r\nworld\r\n");
  REQUIRE(model.getLineText(0) == "hello");
  REQUIRE(model.getLineText(1) == "world");
  REQUIRE(model.getLineText(2) == "");
  REQUIRE(model.getCursorRow() == 2);
  REQUIRE(model.getCursorColumn() == 0);

  SECTION("Line feed keeps the column") {
    model.write("ab\ncd");
    REQUIRE(model.getLineText(2) == "ab");
    REQUIRE(model.getLineText(3) == "  cd");
  }
  SECTION("Backspace and tab") {
    model.write("abc\b\bX\tY");
    REQUIRE(model.getLineText(2) == "aXc     Y");
  }
}

TEST_CASE("Autowrap is deferred until the next glyph", "[VtScreenModel]") {
  VtScreenModel model(10, 3, 100);
  model.write("0123456789");
  REQUIRE(model.getCursorRow() == 0);
  REQUIRE(model.getCursorColumn() == 9);

  SECTION("CRLF after a full line does not add a blank line") {
    model.write("\r\nnext");
    REQUIRE(model.getLineText(1) == "next");
  }
  SECTION("The next glyph wraps") {
    model.write("a");
    REQUIRE(model.getLineText(0) == "0123456789");
    REQUIRE(model.getLineText(1) == "a");
    REQUIRE(model.getCursorColumn() == 1);
  }
}

TEST_CASE("Scrolling feeds the scrollback", "[VtScreenModel]") {
  VtScreenModel model(20, 3, 2);
  model.write("one\r\ntwo\r\nthree\r\nfour\r\nfive");
  REQUIRE(model.getLineText(0) == "three");
  REQUIRE(model.getLineText(1) == "four");
  REQUIRE(model.getLineText(2) == "five");
  REQUIRE(model.getScrollbackText() == vector<string>({"one", "two"}));

  model.write("\r\nsix");
  // Scrollback is bounded
  REQUIRE(model.getScrollbackText() == vector<string>({"two", "three"}));

  SECTION("ED 3 clears the scrollback") {
    model.write("\x1b[3J");
    REQUIRE(model.getScrollbackSize() == 0);
  }
}

TEST_CASE("Cursor movement and erase", "[VtScreenModel]") {
  VtScreenModel model(20, 5, 10);
  model.write("aaaaa\r\nbbbbb\r\nccccc");

  SECTION("Absolute position") {
    model.write("\x1b[2;3HX");
    REQUIRE(model.getLineText(1) == "bbXbb");
  }
  SECTION("Relative moves are clamped") {
    model.write("\x1b[99A\x1b[99DZ");
    REQUIRE(model.getLineText(0) == "Zaaaa");
    REQUIRE(model.getCursorRow() == 0);
  }
  SECTION("Erase to end of line") {
    model.write("\x1b[1;3H\x1b[K");
    REQUIRE(model.getLineText(0) == "aa");
  }
  SECTION("Erase to start of line") {
    model.write("\x1b[2;3H\x1b[1K");
    REQUIRE(model.getLineText(1) == "   bb");
  }
  SECTION("Erase display below") {
    model.write("\x1b[2;1H\x1b[J");
    REQUIRE(model.getLineText(0) == "aaaaa");
    REQUIRE(model.getLineText(1) == "");
    REQUIRE(model.getLineText(2) == "");
  }
  SECTION("Erase whole display keeps the cursor") {
    model.write("\x1b[2J");
    for (int row = 0; row < 5; row++) {
      REQUIRE(model.getLineText(row) == "");
    }
    REQUIRE(model.getCursorRow() == 2);
    REQUIRE(model.getCursorColumn() == 5);
  }
  SECTION("Delete and insert characters") {
    model.write("\x1b[1;2H\x1b[2P");
    REQUIRE(model.getLineText(0) == "aaa");
    model.write("\x1b[2@");
    REQUIRE(model.getLineText(0) == "a  aa");
  }
}

TEST_CASE("SGR attributes are tracked per cell", "[VtScreenModel]") {
  VtScreenModel model(20, 2, 10);
  model.write("\x1b[1;31mR\x1b[0mn\x1b[38;5;200;48;5;17mx\x1b[7;94mi");

  CellAttributes red;
  red.bold = true;
  red.foreground = CellColor::indexed(1);
  REQUIRE(model.getCell(0, 0).attributes == red);
  REQUIRE(model.getCell(0, 1).attributes == CellAttributes());

  CellAttributes indexed;
  indexed.foreground = CellColor::indexed(200);
  indexed.background = CellColor::indexed(17);
  REQUIRE(model.getCell(0, 2).attributes == indexed);

  CellAttributes inverse = indexed;
  inverse.inverse = true;
  inverse.foreground = CellColor::indexed(12);
  REQUIRE(model.getCell(0, 3).attributes == inverse);

  SECTION("Truecolor and extra attributes") {
    model.write("\x1b[0;3;9;38;2;1;2;3mt");
    CellAttributes truecolor;
    truecolor.italic = true;
    truecolor.strike = true;
    truecolor.foreground = CellColor::rgb(1, 2, 3);
    REQUIRE(model.getCell(0, 4).attributes == truecolor);
    requireSerializeRestores(model);
  }
}

TEST_CASE("Private modes and OSC strings leave the screen alone",
          "[VtScreenModel]") {
  VtScreenModel model(20, 2, 10);
  model.write("\x1b]0;window title\x07\x1b[?2004h$ \x1b(B\x1b]2;t\x1b\\ls");
  REQUIRE(model.getLineText(0) == "$ ls");
}

TEST_CASE("UTF-8 glyphs take one cell, even split across writes",
          "[VtScreenModel]") {
  VtScreenModel model(20, 2, 10);
  model.write("caf\xc3");
  model.write("\xa9!");
  REQUIRE(model.getLineText(0) == "caf\xc3\xa9!");
  REQUIRE(model.getCursorColumn() == 5);
}

TEST_CASE("Resize keeps the cursor line visible", "[VtScreenModel]") {
  VtScreenModel model(20, 5, 10);
  model.write("l1\r\nl2\r\nl3\r\nl4\r\nl5");

  SECTION("Fewer rows push lines into the scrollback") {
    model.resize(10, 3);
    REQUIRE(model.getColumns() == 10);
    REQUIRE(model.getRows() == 3);
    REQUIRE(model.getLineText(2) == "l5");
    REQUIRE(model.getScrollbackText() == vector<string>({"l1", "l2"}));
    REQUIRE(model.getCursorRow() == 2);
  }
  SECTION("More rows add blank lines at the bottom") {
    model.resize(30, 8);
    REQUIRE(model.getLineText(4) == "l5");
    REQUIRE(model.getLineText(7) == "");
    REQUIRE(model.getCursorRow() == 4);
  }
}

TEST_CASE("Narrowing reflows wrapped text", "[VtScreenModel]") {
  VtScreenModel model(20, 5, 10);
  model.write("abcdefghij");
  model.resize(4, 5);
  REQUIRE(allText(model).find("abcd\nefgh\nij\n") != string::npos);
  REQUIRE(model.getLineText(0) == "abcd");
  REQUIRE(model.getCursorRow() == 2);
  REQUIRE(model.getCursorColumn() == 2);
  requireSerializeRestores(model);
}

TEST_CASE("Reset clears everything", "[VtScreenModel]") {
  VtScreenModel model(10, 2, 10);
  model.write("\x1b[31mone\r\ntwo\r\nthree");
  model.reset();
  REQUIRE(model.getScrollbackSize() == 0);
  REQUIRE(model.getLineText(0) == "");
  REQUIRE(model.getCursorRow() == 0);
  model.write("x");
  REQUIRE(model.getCell(0, 0).attributes == CellAttributes());
}

TEST_CASE("Serialized state reproduces the screen", "[VtScreenModel]") {
  SECTION("Empty screen") {
    VtScreenModel model(80, 24, 1000);
    requireSerializeRestores(model);
  }
  SECTION("Text with colors and a moved cursor") {
    VtScreenModel model(40, 6, 1000);
    model.write("$ ls\r\n\x1b[1;34mdir\x1b[0m  file\r\n$ \x1b[32mgreen");
    model.write("\x1b[2;10H");
    requireSerializeRestores(model);
  }
  SECTION("Scrollback and full width lines") {
    VtScreenModel model(10, 4, 1000);
    for (int i = 0; i < 12; i++) {
      model.write("line " + to_string(i) + "\r\n");
    }
    model.write("0123456789");
    model.write("\r\n\x1b[7mtail");
    REQUIRE(model.getScrollbackSize() == 10);
    requireSerializeRestores(model);
  }
  SECTION("Wide glyphs") {
    VtScreenModel model(10, 3, 1000);
    model.write("\xe4\xb8\xad\xe6\x96\x87 ok");
    REQUIRE(model.getCell(0, 0).width == 2);
    REQUIRE(model.getCell(0, 1).width == 0);
    requireSerializeRestores(model);
  }
  SECTION("Modes and keypad") {
    VtScreenModel model(20, 4, 1000);
    model.write("\x1b[?25l\x1b[?2004h\x1b[?1000h\x1b[?1002h\x1b=$ ");
    requireSerializeRestores(model);
    string snapshot = model.serialize();
    REQUIRE(snapshot.find("\x1b[?25l") != string::npos);
    REQUIRE(snapshot.find("\x1b[?2004h") != string::npos);
    REQUIRE(snapshot.find("\x1b[?1002h") != string::npos);
    REQUIRE(snapshot.find("\x1b[?1000h") == string::npos);
    REQUIRE(snapshot.find("\x1b=") != string::npos);
  }
}

TEST_CASE("A pending wrap survives a replay", "[VtScreenModel]") {
  VtScreenModel model(5, 3, 1000);
  model.write("abcde");
  requireSerializeRestores(model, "f");
  REQUIRE(model.getLineText(0) == "abcde");
  REQUIRE(model.getLineText(1) == "f");

  SECTION("A wrapped line stays joined") {
    VtScreenModel wrapped(5, 3, 1000);
    wrapped.write("abcdefgh");
    VtScreenModel copy(5, 3, 1000);
    copy.write(wrapped.serialize());
    requireSameScreen(wrapped, copy);
    // Widening joins the wrapped rows back into one line
    wrapped.resize(10, 3);
    copy.resize(10, 3);
    REQUIRE(wrapped.getLineText(0) == "abcdefgh");
    REQUIRE(copy.getLineText(0) == "abcdefgh");
  }
  SECTION("A cursor move cancels the wrap") {
    VtScreenModel moved(5, 3, 1000);
    moved.write("abcde\x1b[1;5H");
    requireSerializeRestores(moved, "X");
    REQUIRE(moved.getLineText(0) == "abcdX");
    REQUIRE(moved.getLineText(1) == "");
  }
}

TEST_CASE("The alternate screen keeps the primary screen", "[VtScreenModel]") {
  VtScreenModel model(20, 4, 1000);
  model.write("$ prompt\r\n\x1b[?1049h\x1b[Hvim buffer");
  REQUIRE(model.isAlternateScreen());
  REQUIRE(model.getLineText(0) == "vim buffer");

  SECTION("Leaving restores the prompt") {
    model.write("\x1b[?1049l");
    REQUIRE(!model.isAlternateScreen());
    REQUIRE(model.getLineText(0) == "$ prompt");
    REQUIRE(model.getCursorRow() == 1);
    REQUIRE(model.getCursorColumn() == 0);
  }
  SECTION("A replay while in the alternate screen can leave it") {
    requireSerializeRestores(model, "\x1b[?1049l");
    REQUIRE(model.getLineText(0) == "$ prompt");
  }
  SECTION("A replay after leaving shows the prompt") {
    model.write("\x1b[?1049l");
    requireSerializeRestores(model);
    REQUIRE(model.getLineText(0) == "$ prompt");
  }
}

TEST_CASE("Scroll margins survive a replay", "[VtScreenModel]") {
  VtScreenModel model(10, 5, 1000);
  model.write("top\x1b[2;4r\x1b[2;1Ha\r\nb\r\nc\r\nd\r\ne");
  REQUIRE(model.getLineText(0) == "top");
  REQUIRE(model.getLineText(1) == "c");
  REQUIRE(model.getLineText(3) == "e");
  REQUIRE(model.getLineText(4) == "");
  REQUIRE(model.getScrollbackSize() == 0);

  requireSerializeRestores(model, "\r\nf\r\ng");
  REQUIRE(model.getLineText(0) == "top");
  REQUIRE(model.getLineText(3) == "g");

  SECTION("Origin mode positions inside the margins") {
    model.write("\x1b[?6h\x1b[3;2H");
    REQUIRE(model.getCursorRow() == 3);
    requireSerializeRestores(model, "Z\r\nnext");
  }
}
  SECTION("Blank cells with attributes survive") {
    VtScreenModel model(10, 3, 1000);
    model.write("\x1b[44m   \x1b[0m");
    requireSerializeRestores(model);
  }
}
