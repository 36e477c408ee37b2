#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace inkwell::render {

// Byte sink the writer emits terminal output into. Implementations may be a
// file descriptor, a pipe or an in-memory capture for tests.
class IOutputSink {
public:
  virtual ~IOutputSink() = default;

  // Write all of data. Return false if the sink is broken.
  [[nodiscard]] virtual bool write(std::string_view data) = 0;

  // True when the sink is an interactive terminal (cursor control is honored)
  [[nodiscard]] virtual bool is_terminal() const { return false; }

  // Current column count if the sink knows it, else 0
  [[nodiscard]] virtual int columns() const { return 0; }

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

// Writes to a file descriptor, retrying partial writes and EINTR.
class FdSink : public IOutputSink {
public:
  explicit FdSink(int fd);

  [[nodiscard]] bool write(std::string_view data) override;
  [[nodiscard]] bool is_terminal() const override { return tty_; }
  [[nodiscard]] int columns() const override;
  [[nodiscard]] const char* name() const override { return name_; }
  [[nodiscard]] int fd() const { return fd_; }

private:
  int fd_;
  bool tty_;
  const char* name_;
};

// Captures everything written. Optionally pretends to be a terminal and
// starts failing after a number of successful writes.
class MemorySink : public IOutputSink {
public:
  explicit MemorySink(bool terminal = true, int columns = 80, int fail_after = -1)
      : terminal_(terminal), columns_(columns), fail_after_(fail_after) {}

  [[nodiscard]] bool write(std::string_view data) override;
  [[nodiscard]] bool is_terminal() const override { return terminal_; }
  [[nodiscard]] int columns() const override { return columns_; }
  [[nodiscard]] const char* name() const override { return "memory"; }

  void set_columns(int c) { columns_ = c; }
  [[nodiscard]] const std::string& data() const { return data_; }
  [[nodiscard]] int writes() const { return writes_; }
  // Returns and forgets everything captured so far
  std::string take();

private:
  bool terminal_;
  int columns_;
  int fail_after_;
  int writes_{0};
  std::string data_;
};

} // namespace inkwell::render
