#pragma once

#include <array>
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "paystream/ingest/transaction_source.hpp"
#include "paystream/ledger/transaction.hpp"

namespace paystream {
namespace ingest {

// Raw CSV row, fields already trimmed. amount is empty when absent.
struct CsvRecord {
  std::string type;
  std::string client;
  std::string tx;
  std::string amount;
};

// Turns one record into a typed transaction. Throws DecodeError.
[[nodiscard]] ledger::Transaction decode_record(const CsvRecord& record, std::size_t line);

// Reads "type, client, tx, amount" CSV. The header row is required and may list
// the columns in any order; amount may be omitted on non-money rows.
class CsvReader : public TransactionSource {
 public:
  explicit CsvReader(std::istream& input);

  std::optional<ledger::Transaction> next() override;

  [[nodiscard]] std::size_t line() const noexcept { return line_; }

 private:
  enum Column : std::size_t { kType, kClient, kTx, kAmount, kColumnCount };
  static constexpr std::size_t kAbsent = static_cast<std::size_t>(-1);

  void read_header();
  [[nodiscard]] std::optional<std::vector<std::string>> next_row();

  std::istream& input_;
  std::size_t line_{0};
  bool header_read_{false};
  std::array<std::size_t, kColumnCount> column_index_{};
};

}  // namespace ingest
}  // namespace paystream
