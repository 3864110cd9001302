#include "test_csv.hpp"

#include <cassert>
#include <sstream>
#include <string>
#include <variant>

#include "paystream/ingest/csv_reader.hpp"

namespace paystream::tests {

using common::Amount;

namespace {

// Returns the DecodeError message, or an empty string if decoding succeeded.
std::string decode_error_of(const ingest::CsvRecord& record) {
  try {
    (void)ingest::decode_record(record, 7);
  } catch (const ingest::DecodeError& e) {
    assert(e.line() == 7);
    return e.what();
  }
  return {};
}

}  // namespace

void test_csv_decodes_all_kinds() {
  std::istringstream input(
      "type,client,tx,amount\n"
      "deposit,1,100,50.00\n"
      "withdrawal,2,200,25.50\n"
      "dispute,3,300,\n"
      "resolve,4,400\n"
      "chargeback,5,500,\n");
  ingest::CsvReader reader(input);

  auto tx = reader.next();
  assert(std::holds_alternative<ledger::Deposit>(*tx));
  assert(ledger::client_id(*tx) == 1);
  assert(ledger::transaction_id(*tx) == 100);
  assert(ledger::money(*tx)->amount() == Amount::from_whole(50));

  tx = reader.next();
  assert(std::holds_alternative<ledger::Withdrawal>(*tx));
  assert(ledger::money(*tx)->amount() == *Amount::parse("25.5"));
  assert(ledger::client_id(*tx) == 2);

  tx = reader.next();
  assert(std::get<ledger::Dispute>(*tx).target == (common::ClientTransaction{.client = 3, .tx = 300}));

  tx = reader.next();
  assert(std::get<ledger::Resolve>(*tx).target == (common::ClientTransaction{.client = 4, .tx = 400}));

  tx = reader.next();
  assert(std::get<ledger::Chargeback>(*tx).target == (common::ClientTransaction{.client = 5, .tx = 500}));

  assert(!reader.next());
  assert(!reader.next());
  assert(reader.line() == 6);
}

void test_csv_header_order_and_whitespace() {
  std::istringstream input(
      "  amount , tx, type ,client\r\n"
      "\n"
      "  10.25 , 9,  deposit  , 65535\r\n"
      "   ,  10 , dispute, 65535\n");
  ingest::CsvReader reader(input);

  auto tx = reader.next();
  assert(std::holds_alternative<ledger::Deposit>(*tx));
  assert(ledger::client_id(*tx) == 65535);
  assert(ledger::transaction_id(*tx) == 9);
  assert(ledger::money(*tx)->amount() == *Amount::parse("10.25"));
  assert(reader.line() == 3);

  tx = reader.next();
  assert(std::holds_alternative<ledger::Dispute>(*tx));
  assert(ledger::transaction_id(*tx) == 10);
  assert(!reader.next());
}

void test_csv_decode_errors() {
  assert(decode_error_of({.type = "deposit", .client = "1", .tx = "1", .amount = ""}).find("requires an amount") !=
         std::string::npos);
  assert(decode_error_of({.type = "withdrawal", .client = "1", .tx = "1", .amount = ""})
             .find("withdrawal requires an amount") != std::string::npos);
  assert(decode_error_of({.type = "unknown", .client = "1", .tx = "1", .amount = "10"})
             .find("unknown transaction type") != std::string::npos);
  assert(decode_error_of({.type = "deposit", .client = "1", .tx = "1", .amount = "0"}).find("positive") !=
         std::string::npos);
  assert(decode_error_of({.type = "deposit", .client = "1", .tx = "1", .amount = "-5"}).find("positive") !=
         std::string::npos);
  assert(decode_error_of({.type = "deposit", .client = "1", .tx = "1", .amount = "ten"}).find("invalid amount") !=
         std::string::npos);
  assert(decode_error_of({.type = "deposit", .client = "65536", .tx = "1", .amount = "1"}).find("out of range") !=
         std::string::npos);
  assert(decode_error_of({.type = "deposit", .client = "1", .tx = "4294967296", .amount = "1"})
             .find("out of range") != std::string::npos);
  assert(decode_error_of({.type = "dispute", .client = "-1", .tx = "1", .amount = ""}).find("invalid client") !=
         std::string::npos);
  assert(decode_error_of({.type = "dispute", .client = "1", .tx = "", .amount = ""}).find("missing tx") !=
         std::string::npos);
  assert(decode_error_of({.type = "Deposit", .client = "1", .tx = "1", .amount = "1"}).find("unknown") !=
         std::string::npos);
  assert(decode_error_of({.type = "dispute", .client = "1", .tx = "2", .amount = ""}).empty());

  std::istringstream missing_column("type,client,amount\ndeposit,1,1.0\n");
  ingest::CsvReader reader(missing_column);
  bool threw = false;
  try {
    (void)reader.next();
  } catch (const ingest::DecodeError& e) {
    threw = true;
    assert(e.line() == 1);
    assert(std::string(e.what()).find("'tx'") != std::string::npos);
  }
  assert(threw);
}

void test_csv_sub_unit_amount() {
  std::istringstream input(
      "type,client,tx,amount\n"
      "deposit,1,1,0.00004\n"
      "deposit,1,2,5\n");
  ingest::CsvReader reader(input);

  auto tx = reader.next();
  assert(ledger::money(*tx)->amount() == Amount::from_units(1));
  assert(ledger::money(*tx)->amount().to_string() == "0.0001");

  tx = reader.next();
  assert(ledger::transaction_id(*tx) == 2);
  assert(ledger::money(*tx)->amount() == Amount::from_whole(5));
  assert(!reader.next());

  // Zero written with extra digits is still zero, and still rejected.
  assert(decode_error_of({.type = "deposit", .client = "1", .tx = "3", .amount = "0.00000"}).find("positive") !=
         std::string::npos);
}

void test_csv_empty_input() {
  std::istringstream empty("");
  ingest::CsvReader reader(empty);
  assert(!reader.next());

  std::istringstream header_only("type, client, tx, amount\n");
  ingest::CsvReader header_reader(header_only);
  assert(!header_reader.next());
}

}  // namespace paystream::tests
