#pragma once

#include <ios>
#include <streambuf>
#include <string>
#include <utility>

// Stream buffer that serves some bytes, then fails like a broken device.
class FailingBuf : public std::streambuf {
public:
  explicit FailingBuf(std::string data) : data_(std::move(data)) {
    setg(data_.data(), data_.data(), data_.data() + data_.size());
  }

protected:
  int_type underflow() override {
    throw std::ios_base::failure("device gone");
  }

private:
  std::string data_;
};
