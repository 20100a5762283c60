#ifndef QCDC_IO_UTILS_H
#define QCDC_IO_UTILS_H

#include <cstdint>
#include <filesystem>
#include <span>

// Read only view of a whole file, mapped for as long as the object lives. Zero sized files are valid and map nothing.
class MappedFile {
  uint8_t* mapping = nullptr;
  uint64_t len = 0;
public:
  // Throws std::runtime_error if the file can't be opened, stat'ed or mapped
  explicit MappedFile(const std::filesystem::path& path);
  ~MappedFile();

  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;
  MappedFile(MappedFile&& other) noexcept;
  MappedFile& operator=(MappedFile&& other) noexcept;

  std::span<const uint8_t> data() const { return { mapping, len }; }
  uint64_t size() const { return len; }
  bool empty() const { return len == 0; }

private:
  void unmap();
};

#endif
