#include "paystream/ingest/csv_reader.hpp"

#include <charconv>
#include <cstdint>
#include <limits>
#include <system_error>

#include "paystream/common/amount.hpp"

namespace paystream {
namespace ingest {

namespace {

std::string_view trim(std::string_view text) noexcept {
  constexpr std::string_view kWhitespace = " \t\r\n";
  const auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

std::vector<std::string> split_fields(std::string_view line) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  while (true) {
    const auto comma = line.find(',', start);
    fields.emplace_back(trim(line.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start)));
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }
  return fields;
}

template <typename T>
T parse_id(std::string_view field, std::string_view name, std::size_t line) {
  if (field.empty()) {
    throw DecodeError(line, "missing " + std::string(name));
  }
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
  if (ec == std::errc::result_out_of_range ||
      (ec == std::errc{} && ptr == field.data() + field.size() && value > std::numeric_limits<T>::max())) {
    throw DecodeError(line, std::string(name) + " out of range: " + std::string(field));
  }
  if (ec != std::errc{} || ptr != field.data() + field.size()) {
    throw DecodeError(line, "invalid " + std::string(name) + ": " + std::string(field));
  }
  return static_cast<T>(value);
}

ledger::MoneyTransaction parse_money(const CsvRecord& record, common::ClientId client, common::TxId tx,
                                     std::string_view kind_label, std::size_t line) {
  if (record.amount.empty()) {
    throw DecodeError(line, std::string(kind_label) + " requires an amount");
  }
  const auto amount = common::Amount::parse(record.amount);
  if (!amount) {
    throw DecodeError(line, "invalid amount: " + record.amount);
  }
  try {
    return ledger::MoneyTransaction(client, tx, *amount);
  } catch (const ledger::InvalidAmount& e) {
    throw DecodeError(line, e.what());
  }
}

}  // namespace

ledger::Transaction decode_record(const CsvRecord& record, std::size_t line) {
  const auto client = parse_id<common::ClientId>(record.client, "client", line);
  const auto tx = parse_id<common::TxId>(record.tx, "tx", line);
  const common::ClientTransaction target{.client = client, .tx = tx};

  if (record.type == "deposit") {
    return ledger::Deposit{parse_money(record, client, tx, "deposit", line)};
  }
  if (record.type == "withdrawal") {
    return ledger::Withdrawal{parse_money(record, client, tx, "withdrawal", line)};
  }
  if (record.type == "dispute") {
    return ledger::Dispute{target};
  }
  if (record.type == "resolve") {
    return ledger::Resolve{target};
  }
  if (record.type == "chargeback") {
    return ledger::Chargeback{target};
  }
  throw DecodeError(line, "unknown transaction type: " + record.type);
}

CsvReader::CsvReader(std::istream& input) : input_(input) {
  column_index_.fill(kAbsent);
}

std::optional<std::vector<std::string>> CsvReader::next_row() {
  std::string raw;
  while (std::getline(input_, raw)) {
    ++line_;
    if (!trim(raw).empty()) {
      return split_fields(raw);
    }
  }
  if (input_.bad()) {
    throw DecodeError(line_, "read failure");
  }
  return std::nullopt;
}

void CsvReader::read_header() {
  header_read_ = true;
  auto header = next_row();
  if (!header) {
    return;
  }

  for (std::size_t idx = 0; idx < header->size(); ++idx) {
    const auto& name = (*header)[idx];
    if (name == "type") {
      column_index_[kType] = idx;
    } else if (name == "client") {
      column_index_[kClient] = idx;
    } else if (name == "tx") {
      column_index_[kTx] = idx;
    } else if (name == "amount") {
      column_index_[kAmount] = idx;
    }
  }

  for (auto required : {kType, kClient, kTx}) {
    if (column_index_[required] == kAbsent) {
      static constexpr std::string_view kNames[] = {"type", "client", "tx", "amount"};
      throw DecodeError(line_, "header is missing column '" + std::string(kNames[required]) + "'");
    }
  }
}

std::optional<ledger::Transaction> CsvReader::next() {
  if (!header_read_) {
    read_header();
  }

  auto row = next_row();
  if (!row) {
    return std::nullopt;
  }

  auto field = [&](Column column) -> std::string {
    const auto idx = column_index_[column];
    return idx < row->size() ? (*row)[idx] : std::string{};
  };

  const CsvRecord record{
      .type = field(kType),
      .client = field(kClient),
      .tx = field(kTx),
      .amount = field(kAmount),
  };
  return decode_record(record, line_);
}

}  // namespace ingest
}  // namespace paystream
