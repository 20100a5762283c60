#include "console_utils.hpp"

#include <cerrno>
#include <mutex>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace {
  // Worker threads report through here too, keep their lines whole
  std::mutex console_mutex;
}

void write_to_handle(StdHandles handle, const std::string& msg) {
  std::scoped_lock lock(console_mutex);
  const char* pending = msg.data();
  auto remaining = msg.size();
  while (remaining > 0) {
#ifdef _WIN32
    const auto written = _write(handle, pending, static_cast<unsigned int>(remaining));
#else
    const auto written = write(handle, pending, remaining);
#endif
    if (written < 0) {
      if (errno == EINTR) continue;
      // Nowhere left to report the failure
      return;
    }
    pending += written;
    remaining -= static_cast<size_t>(written);
  }
}
