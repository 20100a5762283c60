#ifndef QCDC_CONSOLE_UTILS_H
#define QCDC_CONSOLE_UTILS_H
#include <string>
#include <format>

typedef enum {
  STDOUT_HANDLE = 1,
  STDERR_HANDLE = 2,
} StdHandles;

void write_to_handle(StdHandles handle, const std::string& msg);

inline void print_to_console(const std::string& msg) { write_to_handle(StdHandles::STDOUT_HANDLE, msg); }

template<class... Args>
void print_to_console(const std::string& fmt, Args&&... args) {
  return print_to_console(std::vformat(fmt, std::make_format_args(args...)));
}

inline void print_to_error(const std::string& msg) { write_to_handle(StdHandles::STDERR_HANDLE, msg); }

template<class... Args>
void print_to_error(const std::string& fmt, Args&&... args) {
  return print_to_error(std::vformat(fmt, std::make_format_args(args...)));
}

#endif
