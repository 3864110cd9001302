#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

#include "paystream/ledger/transaction.hpp"

namespace paystream {
namespace ingest {

class DecodeError : public std::runtime_error {
 public:
  DecodeError(std::size_t line, const std::string& what)
      : std::runtime_error("line " + std::to_string(line) + ": " + what), line_(line) {}

  [[nodiscard]] std::size_t line() const noexcept { return line_; }

 private:
  std::size_t line_;
};

// Upstream producer of transactions in arrival order.
class TransactionSource {
 public:
  virtual ~TransactionSource() = default;

  // nullopt once the input is exhausted. Throws DecodeError on a malformed record.
  virtual std::optional<ledger::Transaction> next() = 0;
};

}  // namespace ingest
}  // namespace paystream
