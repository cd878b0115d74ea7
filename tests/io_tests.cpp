#include "veritree/errors.hpp"
#include "veritree/io.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace veritree;

namespace {

std::string tempPath(const std::string &name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

// Hands out at most two bytes per call.
class TrickleReader : public Reader {
public:
  explicit TrickleReader(std::vector<uint8_t> data) : data_(std::move(data)) {}
  size_t read(uint8_t *buf, size_t len) override {
    size_t n = std::min<size_t>({len, 2, data_.size() - pos_});
    std::copy(data_.begin() + pos_, data_.begin() + pos_ + n, buf);
    pos_ += n;
    return n;
  }

private:
  std::vector<uint8_t> data_;
  size_t pos_{0};
};

} // namespace

TEST(ReadExact, AssemblesShortReads) {
  TrickleReader reader({1, 2, 3, 4, 5});
  uint8_t buf[5] = {0};
  read_exact(reader, buf, sizeof(buf));
  EXPECT_EQ(buf[0], 1);
  EXPECT_EQ(buf[4], 5);
}

TEST(ReadExact, ThrowsOnEarlyEnd) {
  TrickleReader reader({1, 2, 3});
  uint8_t buf[5];
  EXPECT_THROW(read_exact(reader, buf, sizeof(buf)), TruncatedInputError);

  TrickleReader again({1, 2, 3});
  EXPECT_EQ(read_up_to(again, buf, sizeof(buf)), 3u);
}

TEST(MemoryReader, SeekPastEndReadsNothing) {
  std::vector<uint8_t> data = {9, 8, 7};
  MemoryReader reader(data);
  reader.seek(10);
  uint8_t b = 0;
  EXPECT_EQ(reader.read(&b, 1), 0u);
  reader.seek(1);
  EXPECT_EQ(reader.read(&b, 1), 1u);
  EXPECT_EQ(b, 8);
}

TEST(VectorWriter, WriteAtGrowsBuffer) {
  VectorWriter writer;
  const uint8_t tail[2] = {5, 6};
  const uint8_t head[2] = {1, 2};
  writer.write_at(4, tail, 2);
  writer.write_at(0, head, 2);
  writer.write(tail, 1);
  std::vector<uint8_t> expected = {1, 2, 0, 0, 5, 6, 5};
  EXPECT_EQ(writer.data(), expected);
}

TEST(FileIo, WriteAtThenReadBack) {
  const std::string path = tempPath("veritree_file_io.bin");
  {
    FileWriter writer(path);
    const uint8_t body[3] = {'a', 'b', 'c'};
    const uint8_t header[2] = {'H', 'D'};
    writer.write_at(2, body, 3);
    writer.write_at(0, header, 2);
    writer.flush();
  }
  std::vector<uint8_t> expected = {'H', 'D', 'a', 'b', 'c'};
  EXPECT_EQ(read_file(path), expected);

  FileReader reader(path);
  reader.seek(3);
  uint8_t buf[8];
  EXPECT_EQ(read_up_to(reader, buf, sizeof(buf)), 2u);
  EXPECT_EQ(buf[0], 'b');
  EXPECT_EQ(reader.read(buf, sizeof(buf)), 0u);
  reader.seek(0);
  EXPECT_EQ(reader.read(buf, 1), 1u);
  EXPECT_EQ(buf[0], 'H');
  std::remove(path.c_str());
}

TEST(FileIo, MissingFileThrowsIoError) {
  EXPECT_THROW(FileReader("/nonexistent/veritree_missing.bin", 1, 1), IoError);
  EXPECT_THROW(FileWriter("/nonexistent/dir/out.bin", 1, 1), IoError);
}

TEST(FileIo, OpenRetriesUntilFileAppears) {
  const std::string path = tempPath("veritree_retry_delayed.bin");
  std::remove(path.c_str());
  std::thread creator([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    {
      std::ofstream out(path + ".tmp", std::ios::binary);
      out << "data";
    }
    std::filesystem::rename(path + ".tmp", path);
  });
  std::vector<uint8_t> got;
  {
    FileReader reader(path, 10, 20);
    uint8_t buf[4];
    read_exact(reader, buf, sizeof(buf));
    got.assign(buf, buf + 4);
  }
  creator.join();
  EXPECT_EQ(got, std::vector<uint8_t>({'d', 'a', 't', 'a'}));
  std::remove(path.c_str());
}
