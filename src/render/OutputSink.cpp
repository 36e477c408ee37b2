#include "render/OutputSink.hpp"
#include <cerrno>
#include <sys/ioctl.h>
#include <unistd.h>

namespace inkwell::render {

FdSink::FdSink(int fd)
    : fd_(fd), tty_(::isatty(fd) == 1),
      name_(fd == STDOUT_FILENO ? "stdout" : fd == STDERR_FILENO ? "stderr" : "fd") {}

bool FdSink::write(std::string_view data) {
  const char* p = data.data();
  size_t left = data.size();
  while (left > 0) {
    ssize_t n = ::write(fd_, p, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (n == 0) return false;
    p += n;
    left -= (size_t)n;
  }
  return true;
}

int FdSink::columns() const {
  if (!tty_) return 0;
  struct winsize ws{};
  if (ioctl(fd_, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return ws.ws_col;
  return 0;
}

bool MemorySink::write(std::string_view data) {
  if (fail_after_ >= 0 && writes_ >= fail_after_) return false;
  ++writes_;
  data_.append(data);
  return true;
}

std::string MemorySink::take() {
  std::string out;
  out.swap(data_);
  return out;
}

} // namespace inkwell::render
