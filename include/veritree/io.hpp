#ifndef VERITREE_IO_HPP
#define VERITREE_IO_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <span>
#include <string>
#include <vector>

namespace veritree {

/**
 * @brief Byte source. read() may return fewer bytes than requested; 0 means
 * end of input.
 */
class Reader {
public:
  virtual ~Reader() = default;
  virtual size_t read(uint8_t *buf, size_t len) = 0;
};

/** Reader with absolute repositioning. */
class SeekableReader : public Reader {
public:
  virtual void seek(uint64_t offset) = 0;
};

class Writer {
public:
  virtual ~Writer() = default;
  virtual void write(const uint8_t *buf, size_t len) = 0;
};

/** Writer that can place bytes at an absolute offset. */
class SeekableWriter : public Writer {
public:
  virtual void write_at(uint64_t offset, const uint8_t *buf, size_t len) = 0;
};

/**
 * @brief Read until @p len bytes arrived or the input ended.
 * @return Number of bytes read; less than @p len only at end of input.
 */
size_t read_up_to(Reader &reader, uint8_t *buf, size_t len);

/**
 * @brief Read exactly @p len bytes.
 * @throw TruncatedInputError if the input ends first.
 */
void read_exact(Reader &reader, uint8_t *buf, size_t len);

/** Reader over a caller-owned memory region. */
class MemoryReader : public SeekableReader {
public:
  explicit MemoryReader(std::span<const uint8_t> data) : data_(data) {}

  size_t read(uint8_t *buf, size_t len) override;
  /// Seeking past the end is allowed; later reads return 0.
  void seek(uint64_t offset) override { pos_ = offset; }
  uint64_t position() const { return pos_; }

private:
  std::span<const uint8_t> data_;
  uint64_t pos_{0};
};

/** Writer appending to (or patching) an owned byte vector. */
class VectorWriter : public SeekableWriter {
public:
  void write(const uint8_t *buf, size_t len) override;
  void write_at(uint64_t offset, const uint8_t *buf, size_t len) override;

  const std::vector<uint8_t> &data() const { return data_; }
  std::vector<uint8_t> take() { return std::move(data_); }

private:
  std::vector<uint8_t> data_;
};

/**
 * @brief Binary file reader.
 *
 * Transient stream failures are retried a bounded number of times with a
 * short delay, clearing the error flags between attempts.
 */
class FileReader : public SeekableReader {
public:
  /** @throw IoError if the file cannot be opened. */
  explicit FileReader(const std::string &path, int retries = 3,
                      int delayMs = 50);

  size_t read(uint8_t *buf, size_t len) override;
  /** @throw IoError if the stream cannot be repositioned. */
  void seek(uint64_t offset) override;

private:
  std::string path_;
  std::ifstream stream_;
  int retries_;
  int delayMs_;
};

/** Binary file writer, truncating the target on open. */
class FileWriter : public SeekableWriter {
public:
  /** @throw IoError if the file cannot be created. */
  explicit FileWriter(const std::string &path, int retries = 3,
                      int delayMs = 50);

  void write(const uint8_t *buf, size_t len) override;
  void write_at(uint64_t offset, const uint8_t *buf, size_t len) override;
  /** @throw IoError if buffered data cannot be flushed. */
  void flush();

private:
  bool seekpWithRetry(std::streamoff offset);

  std::string path_;
  std::fstream stream_;
  int retries_;
  int delayMs_;
};

/// Read a whole file into memory.
std::vector<uint8_t> read_file(const std::string &path);

} // namespace veritree

#endif // VERITREE_IO_HPP
