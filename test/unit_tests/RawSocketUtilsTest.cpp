#include "RawSocketUtils.hpp"
#include "TestHeaders.hpp"

using namespace tb;

namespace {
string readExactly(int fd, size_t count) {
  string buffer(count, '\0');
  size_t pos = 0;
  while (pos < count) {
    ssize_t rc = ::read(fd, &buffer[pos], count - pos);
    if (rc <= 0) {
      break;
    }
    pos += rc;
  }
  return buffer.substr(0, pos);
}
}  // namespace

TEST_CASE("RawSocketUtils writeAll writes all data", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  // Larger than a pipe buffer so the writer has to wait for the reader
  string payload(256 * 1024, '\0');
  for (size_t a = 0; a < payload.length(); a++) {
    payload[a] = rand() % 26 + 'A';
  }
  std::thread writer([&]() {
    RawSocketUtils::writeAll(fds[1], payload.data(), payload.size());
    ::close(fds[1]);
  });

  string buffer = readExactly(fds[0], payload.size());
  writer.join();
  REQUIRE(buffer == payload);
  ::close(fds[0]);
}

TEST_CASE("RawSocketUtils writeAll throws on a closed pipe",
          "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  ::close(fds[0]);

  const string payload = "test data";
  REQUIRE_THROWS(
      RawSocketUtils::writeAll(fds[1], payload.data(), payload.size()));
  ::close(fds[1]);
}

TEST_CASE("RawSocketUtils writeAll rejects invalid descriptors",
          "[RawSocketUtils]") {
  REQUIRE_THROWS(RawSocketUtils::writeAll(-1, "x", 1));
}
