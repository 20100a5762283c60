#include "io_utils.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {
  std::runtime_error make_io_error(const std::string& what, const std::filesystem::path& path) {
    return std::runtime_error(what + " " + path.string() + ": " + std::strerror(errno));
  }
}

MappedFile::MappedFile(const std::filesystem::path& path) {
  const int fd = open(path.c_str(), O_RDONLY);
  if (fd < 0) throw make_io_error("Can't open", path);

  struct stat file_stat{};
  if (fstat(fd, &file_stat) != 0) {
    const auto error = make_io_error("Can't stat", path);
    close(fd);
    throw error;
  }
  if (!S_ISREG(file_stat.st_mode)) {
    close(fd);
    throw std::runtime_error("Not a regular file: " + path.string());
  }

  len = static_cast<uint64_t>(file_stat.st_size);
  if (len > 0) {
    void* addr = mmap(nullptr, len, PROT_READ, MAP_PRIVATE, fd, 0);
    if (addr == MAP_FAILED) {
      const auto error = make_io_error("Can't map", path);
      close(fd);
      throw error;
    }
    mapping = static_cast<uint8_t*>(addr);
    // Only advice, the mapping is usable either way
    std::ignore = madvise(addr, len, MADV_SEQUENTIAL);
  }
  // The mapping stays valid after the descriptor is gone
  close(fd);
}

MappedFile::~MappedFile() {
  unmap();
}

MappedFile::MappedFile(MappedFile&& other) noexcept
  : mapping(std::exchange(other.mapping, nullptr)), len(std::exchange(other.len, 0)) {}

MappedFile& MappedFile::operator=(MappedFile&& other) noexcept {
  if (this != &other) {
    unmap();
    mapping = std::exchange(other.mapping, nullptr);
    len = std::exchange(other.len, 0);
  }
  return *this;
}

void MappedFile::unmap() {
  if (mapping != nullptr) {
    munmap(mapping, len);
    mapping = nullptr;
    len = 0;
  }
}
