#include "veritree/io.hpp"
#include "veritree/errors.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>

namespace veritree {

size_t read_up_to(Reader &reader, uint8_t *buf, size_t len) {
  size_t total = 0;
  while (total < len) {
    size_t n = reader.read(buf + total, len - total);
    if (n == 0) {
      break; // end of input
    }
    total += n;
  }
  return total;
}

void read_exact(Reader &reader, uint8_t *buf, size_t len) {
  size_t got = read_up_to(reader, buf, len);
  if (got != len) {
    ThrowTruncatedInput(len, got);
  }
}

size_t MemoryReader::read(uint8_t *buf, size_t len) {
  if (pos_ >= data_.size()) {
    return 0;
  }
  size_t n = static_cast<size_t>(
      std::min<uint64_t>(len, data_.size() - pos_));
  std::memcpy(buf, data_.data() + pos_, n);
  pos_ += n;
  return n;
}

void VectorWriter::write(const uint8_t *buf, size_t len) {
  data_.insert(data_.end(), buf, buf + len);
}

void VectorWriter::write_at(uint64_t offset, const uint8_t *buf, size_t len) {
  if (offset + len > data_.size()) {
    data_.resize(static_cast<size_t>(offset + len));
  }
  std::memcpy(data_.data() + offset, buf, len);
}

FileReader::FileReader(const std::string &path, int retries, int delayMs)
    : path_(path), retries_(retries), delayMs_(delayMs) {
  for (int attempt = 0; attempt <= retries_; ++attempt) {
    stream_.clear();
    stream_.open(path_, std::ios::in | std::ios::binary);
    if (stream_.is_open()) {
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(delayMs_));
  }
  ThrowIoError("cannot open " + path_ + " for reading");
}

size_t FileReader::read(uint8_t *buf, size_t len) {
  for (int attempt = 0; attempt <= retries_; ++attempt) {
    stream_.read(reinterpret_cast<char *>(buf),
                 static_cast<std::streamsize>(len));
    std::streamsize count = stream_.gcount();
    if (count > 0) {
      // A short read that hit EOF still delivered bytes; the flags are
      // cleared so the next call can report end of input with 0.
      stream_.clear();
      return static_cast<size_t>(count);
    }
    if (stream_.eof()) {
      stream_.clear();
      return 0;
    }
    stream_.clear();
    std::this_thread::sleep_for(std::chrono::milliseconds(delayMs_));
  }
  ThrowIoError("read failed on " + path_);
}

void FileReader::seek(uint64_t offset) {
  for (int attempt = 0; attempt <= retries_; ++attempt) {
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_.fail()) {
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(delayMs_));
  }
  ThrowIoError("seek to " + std::to_string(offset) + " failed on " + path_);
}

FileWriter::FileWriter(const std::string &path, int retries, int delayMs)
    : path_(path), retries_(retries), delayMs_(delayMs) {
  for (int attempt = 0; attempt <= retries_; ++attempt) {
    stream_.clear();
    stream_.open(path_, std::ios::in | std::ios::out | std::ios::binary |
                            std::ios::trunc);
    if (stream_.is_open()) {
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(delayMs_));
  }
  ThrowIoError("cannot open " + path_ + " for writing");
}

bool FileWriter::seekpWithRetry(std::streamoff offset) {
  for (int attempt = 0; attempt <= retries_; ++attempt) {
    stream_.clear();
    stream_.seekp(offset, std::ios::beg);
    if (!stream_.fail()) {
      return true;
    }
    stream_.clear();
    std::this_thread::sleep_for(std::chrono::milliseconds(delayMs_));
  }
  return false;
}

void FileWriter::write(const uint8_t *buf, size_t len) {
  stream_.seekp(0, std::ios::end);
  stream_.write(reinterpret_cast<const char *>(buf),
                static_cast<std::streamsize>(len));
  if (stream_.fail()) {
    ThrowIoError("write failed on " + path_);
  }
}

void FileWriter::write_at(uint64_t offset, const uint8_t *buf, size_t len) {
  if (!seekpWithRetry(static_cast<std::streamoff>(offset))) {
    ThrowIoError("seek to " + std::to_string(offset) + " failed on " + path_);
  }
  stream_.write(reinterpret_cast<const char *>(buf),
                static_cast<std::streamsize>(len));
  if (stream_.fail()) {
    ThrowIoError("write failed on " + path_);
  }
}

void FileWriter::flush() {
  stream_.flush();
  if (stream_.fail()) {
    ThrowIoError("flush failed on " + path_);
  }
}

std::vector<uint8_t> read_file(const std::string &path) {
  FileReader reader(path);
  std::vector<uint8_t> data;
  uint8_t buffer[65536];
  while (true) {
    size_t n = reader.read(buffer, sizeof(buffer));
    if (n == 0)
      break;
    data.insert(data.end(), buffer, buffer + n);
  }
  return data;
}

} // namespace veritree
