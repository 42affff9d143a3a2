#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "proto_support.h"

namespace iwmisc {

namespace {

// Closes the descriptor when done.
class AFile {
  private:
    int _fd;

  public:
    explicit AFile(const std::string& fname) {
      _fd = ::open(fname.c_str(), O_RDONLY);
    }
    ~AFile() {
      if (_fd >= 0) {
        ::close(_fd);
      }
    }

    int good() const { return _fd >= 0;}
    int fd() const { return _fd;}
};

}  // namespace

std::optional<std::string>
FileContents(const std::string& fname) {
  AFile input(fname);
  if (! input.good()) {
    cerr << "FileContents:cannot open '" << fname << "'\n";
    return std::nullopt;
  }

  struct stat st;
  std::string result;
  if (::fstat(input.fd(), &st) == 0 && st.st_size > 0) {
    result.reserve(st.st_size);
  }

  char buffer[8192];
  while (true) {
    const ssize_t nchars = ::read(input.fd(), buffer, sizeof(buffer));
    if (nchars < 0) {
      cerr << "FileContents:read error '" << fname << "'\n";
      return std::nullopt;
    }
    if (nchars == 0) {
      break;
    }
    result.append(buffer, nchars);
  }

  return result;
}

}  // namespace iwmisc
