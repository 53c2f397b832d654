#include <float.h>
#include <stdint.h>
#include <stdio.h>

#include <cmath>
#include <functional>
#include <iostream>
#include <phosg/Arguments.hh>
#include <phosg/Filesystem.hh>
#include <stdexcept>
#include <string>
#include <vector>

#include "Base64.hh"
#include "Cell.hh"
#include "Envelope.hh"
#include "FormatError.hh"
#include "Gzip.hh"
#include "Loggers.hh"
#include "SaveTables.hh"
#include "ToolConfig.hh"

using namespace std;

namespace {

int failures = 0;

void expect(bool cond, const string& msg) {
  if (!cond) {
    ++failures;
    cerr << "[FAIL] " << msg << "\n";
  }
}

template <typename ExcT>
void expect_raises(const function<void()>& fn, const string& msg) {
  try {
    fn();
  } catch (const ExcT&) {
    return;
  } catch (const exception& e) {
    ++failures;
    cerr << "[FAIL] " << msg << " (wrong exception: " << e.what() << ")\n";
    return;
  }
  ++failures;
  cerr << "[FAIL] " << msg << " (no exception)\n";
}

void expect_format_error(FormatError::Stage stage, const function<void()>& fn, const string& msg) {
  try {
    fn();
  } catch (const FormatError& e) {
    expect(e.stage() == stage, msg + " (stage was " + phosg::name_for_enum(e.stage()) + ")");
    return;
  } catch (const exception& e) {
    ++failures;
    cerr << "[FAIL] " << msg << " (wrong exception: " << e.what() << ")\n";
    return;
  }
  ++failures;
  cerr << "[FAIL] " << msg << " (no exception)\n";
}

// Deterministic pseudorandom bytes, so failures are reproducible
string pseudorandom_data(size_t size, uint32_t seed) {
  string ret;
  ret.reserve(size);
  for (size_t z = 0; z < size; z++) {
    seed = seed * 1103515245 + 12345;
    ret.push_back(static_cast<char>(seed >> 16));
  }
  return ret;
}

// Produces a reader over a string that returns at most max_size bytes per call
StreamReadFunction string_reader(const string& data, size_t* offset) {
  return [&data, offset](size_t max_size) -> string {
    string ret = data.substr(*offset, max_size);
    *offset += ret.size();
    return ret;
  };
}

StreamWriteFunction string_writer(string* out) {
  return [out](const void* data, size_t size) -> void {
    out->append(reinterpret_cast<const char*>(data), size);
  };
}

string stream_encode(const string& data, size_t chunk_size) {
  size_t offset = 0;
  string ret;
  envelope_encode_stream(string_reader(data, &offset), string_writer(&ret), chunk_size);
  return ret;
}

string stream_decode(const string& text, size_t chunk_size) {
  size_t offset = 0;
  string ret;
  envelope_decode_stream(string_reader(text, &offset), string_writer(&ret), chunk_size);
  return ret;
}

const vector<size_t> CHUNK_SIZES = {1, 2, 3, 4, 5, 7, 13, 64, 1000, DEFAULT_ENVELOPE_CHUNK_SIZE};

vector<string> sample_payloads() {
  string text;
  while (text.size() < 100000) {
    text += "The quick brown fox jumps over the lazy dog. ";
  }
  string all_bytes;
  for (size_t z = 0; z < 0x100; z++) {
    all_bytes.push_back(static_cast<char>(z));
  }
  return {
      "",
      "A",
      "Hello from test\n",
      all_bytes,
      text,
      string(200000, 'A'),
      pseudorandom_data(50000, 1),
  };
}

////////////////////////////////////////////////////////////////////////////////
// Envelope: whole-buffer mode

void test_envelope_round_trip() {
  for (const auto& payload : sample_payloads()) {
    string text = encode_envelope(payload);
    expect(decode_envelope(text) == payload,
        "envelope round trip failed for payload of " + to_string(payload.size()) + " bytes");
  }
}

void test_envelope_hello_scenario() {
  string original = "Hello from test\n";
  string text = encode_envelope(original);
  expect(decode_envelope(text) == original, "hello scenario did not round-trip");
}

void test_envelope_text_is_plain_base64() {
  string text = encode_envelope(pseudorandom_data(10000, 7));
  expect(!text.empty() && (text.size() % 4 == 0), "envelope length is not a multiple of 4");
  bool all_valid = true;
  for (size_t z = 0; z < text.size(); z++) {
    char ch = text[z];
    if (!is_base64_char(ch) && !((ch == '=') && (z >= text.size() - 2))) {
      all_valid = false;
    }
  }
  expect(all_valid, "envelope contains characters outside the base64 alphabet or misplaced padding");
}

void test_envelope_is_gzip_inside() {
  string text = encode_envelope("some data");
  string compressed = base64_decode_groups(text);
  expect(compressed.size() > 18, "compressed envelope contents are too short to be gzip");
  expect((static_cast<uint8_t>(compressed[0]) == 0x1F) && (static_cast<uint8_t>(compressed[1]) == 0x8B),
      "envelope contents do not start with the gzip magic number");
  expect(gzip_decompress(compressed) == "some data", "envelope contents are not the gzip of the input");
}

void test_envelope_decode_trims_whitespace() {
  string payload = "whitespace test payload";
  string text = encode_envelope(payload);
  expect(decode_envelope("  \n" + text + "\r\n\t ") == payload, "surrounding whitespace was not trimmed");

  // Line breaks inside the text are skipped as well
  string wrapped;
  for (size_t z = 0; z < text.size(); z += 10) {
    wrapped += text.substr(z, 10);
    wrapped += "\r\n";
  }
  expect(decode_envelope(wrapped) == payload, "interior line breaks were not skipped");
}

void test_envelope_decode_rejects_bad_base64() {
  expect_format_error(FormatError::Stage::BASE64, []() {
    decode_envelope("not-valid-base64!!");
  },
      "invalid base64 characters not rejected");

  string text = encode_envelope("padding test data");
  expect_format_error(FormatError::Stage::BASE64, [&]() {
    decode_envelope(text + "A");
  },
      "stray trailing character not rejected");
  expect_format_error(FormatError::Stage::BASE64, [&]() {
    decode_envelope(text.substr(0, text.size() - 2));
  },
      "incomplete final group not rejected");
  expect_format_error(FormatError::Stage::BASE64, []() {
    decode_envelope("AA==AAAA");
  },
      "padding before the end of the data not rejected");
  expect_format_error(FormatError::Stage::BASE64, []() {
    decode_envelope("AA=A");
  },
      "padding followed by data within a group not rejected");
  expect_format_error(FormatError::Stage::BASE64, []() {
    decode_envelope("A===");
  },
      "excess padding not rejected");
  expect_format_error(FormatError::Stage::BASE64, []() {
    decode_envelope("H4sI\x01\x02");
  },
      "control characters not rejected");
}

void test_envelope_decode_rejects_bad_gzip() {
  // Valid base64, but the data isn't gzip
  expect_format_error(FormatError::Stage::GZIP, []() {
    decode_envelope(base64_encode_groups(string("this is not gzip data"), true));
  },
      "non-gzip data not rejected");

  string compressed = gzip_compress(pseudorandom_data(1000, 3));

  // Truncated stream
  expect_format_error(FormatError::Stage::GZIP, [&]() {
    decode_envelope(base64_encode_groups(compressed.substr(0, compressed.size() - 10), true));
  },
      "truncated gzip stream not rejected");

  // Corrupt CRC (the CRC32 is the 8th through 5th bytes from the end)
  string corrupt = compressed;
  corrupt[corrupt.size() - 6] ^= 0x55;
  expect_format_error(FormatError::Stage::GZIP, [&]() {
    decode_envelope(base64_encode_groups(corrupt, true));
  },
      "gzip CRC mismatch not rejected");

  // An empty envelope contains no gzip member at all
  expect_format_error(FormatError::Stage::GZIP, []() {
    decode_envelope("");
  },
      "empty envelope not rejected");
}

void test_envelope_ignores_data_after_gzip_member() {
  string compressed = gzip_compress(string("first member"));
  string text = base64_encode_groups(compressed + "trailing garbage", true);
  expect(decode_envelope(text) == "first member", "data after the gzip member was not ignored");
}

////////////////////////////////////////////////////////////////////////////////
// Envelope: streaming mode

void test_stream_encode_matches_whole_buffer() {
  for (const auto& payload : sample_payloads()) {
    string expected = encode_envelope(payload);
    for (size_t chunk_size : CHUNK_SIZES) {
      // A chunk size of 1 on the largest payloads is slow and adds nothing
      if ((chunk_size < 4) && (payload.size() > 60000)) {
        continue;
      }
      expect(stream_encode(payload, chunk_size) == expected,
          "streaming encode of " + to_string(payload.size()) + " bytes with chunk size " + to_string(chunk_size) + " differs from whole-buffer encode");
    }
  }
}

void test_stream_decode_matches_whole_buffer() {
  for (const auto& payload : sample_payloads()) {
    string text = encode_envelope(payload);
    for (size_t chunk_size : CHUNK_SIZES) {
      if ((chunk_size < 4) && (payload.size() > 60000)) {
        continue;
      }
      expect(stream_decode(text, chunk_size) == payload,
          "streaming decode of " + to_string(payload.size()) + " bytes with chunk size " + to_string(chunk_size) + " differs from whole-buffer decode");
    }
  }
}

void test_stream_encoder_output_never_padded_midstream() {
  EnvelopeEncoder enc;
  string data = pseudorandom_data(30000, 11);
  bool padded_midstream = false;
  for (size_t z = 0; z < data.size(); z += 997) {
    string text = enc.add(data.substr(z, 997));
    if (text.find('=') != string::npos) {
      padded_midstream = true;
    }
  }
  string tail = enc.close();
  expect(!padded_midstream, "streaming encoder produced padding before the end of the stream");
  expect(!tail.empty(), "streaming encoder produced no final text");
  expect(enc.input_size() == data.size(), "streaming encoder input size is wrong");
}

void test_stream_decode_with_interior_whitespace() {
  string payload = pseudorandom_data(5000, 5);
  string text = encode_envelope(payload);
  string wrapped;
  for (size_t z = 0; z < text.size(); z += 76) {
    wrapped += text.substr(z, 76);
    wrapped += "\n";
  }
  for (size_t chunk_size : {1, 3, 77, 4096}) {
    expect(stream_decode(wrapped, chunk_size) == payload,
        "streaming decode of wrapped text failed with chunk size " + to_string(chunk_size));
  }
}

void test_stream_decode_errors() {
  string text = encode_envelope(pseudorandom_data(2000, 9));

  string bad_char = text;
  bad_char[text.size() / 2] = '!';
  for (size_t chunk_size : {1, 5, 8192}) {
    expect_format_error(FormatError::Stage::BASE64, [&]() {
      stream_decode(bad_char, chunk_size);
    },
        "streaming decode did not reject an invalid character with chunk size " + to_string(chunk_size));
    expect_format_error(FormatError::Stage::BASE64, [&]() {
      stream_decode(text + "AB", chunk_size);
    },
        "streaming decode did not reject a partial group at the end with chunk size " + to_string(chunk_size));
    expect_format_error(FormatError::Stage::GZIP, [&]() {
      stream_decode(text.substr(0, (text.size() / 8) * 4), chunk_size);
    },
        "streaming decode did not reject a truncated gzip stream with chunk size " + to_string(chunk_size));
  }

  expect_format_error(FormatError::Stage::BASE64, [&]() {
    stream_decode("AA==AAAA", 2);
  },
      "streaming decode did not reject data after padding");
}

void test_stream_decoder_refuses_input_after_error() {
  EnvelopeDecoder dec;
  expect_format_error(FormatError::Stage::BASE64, [&]() {
    dec.add(string("!!!!"));
  },
      "decoder did not reject invalid group");
  expect_raises<logic_error>([&]() {
    dec.add(string("AAAA"));
  },
      "decoder accepted input after an error");
}

void test_stream_invalid_usage() {
  expect_raises<invalid_argument>([]() {
    stream_encode("data", 0);
  },
      "chunk size 0 accepted by streaming encode");
  expect_raises<invalid_argument>([]() {
    stream_decode("data", 0);
  },
      "chunk size 0 accepted by streaming decode");

  EnvelopeEncoder enc;
  enc.add(string("data"));
  enc.close();
  expect_raises<logic_error>([&]() {
    enc.add(string("more"));
  },
      "encoder accepted input after close");
}

void test_stream_file_functions() {
  string payload = pseudorandom_data(40000, 13);

  FILE* raw_f = tmpfile();
  FILE* text_f = tmpfile();
  FILE* decoded_f = tmpfile();
  expect(raw_f && text_f && decoded_f, "cannot create temporary files");
  if (!raw_f || !text_f || !decoded_f) {
    return;
  }

  fwrite(payload.data(), 1, payload.size(), raw_f);
  rewind(raw_f);
  envelope_encode_stream(raw_f, text_f, 1000);
  rewind(text_f);
  envelope_decode_stream(text_f, decoded_f, 999);
  rewind(decoded_f);

  string decoded(payload.size() + 1, '\0');
  size_t bytes_read = fread(decoded.data(), 1, decoded.size(), decoded_f);
  decoded.resize(bytes_read);
  expect(decoded == payload, "FILE* streaming round trip failed");

  fclose(raw_f);
  fclose(text_f);
  fclose(decoded_f);
}

////////////////////////////////////////////////////////////////////////////////
// Cells

void test_infer_cell() {
  expect(infer_cell("123") == Cell(123), "\"123\" should be INT 123");
  expect(infer_cell("-45") == Cell(-45), "\"-45\" should be INT -45");
  expect(infer_cell("3.14") == Cell(3.14), "\"3.14\" should be FLOAT 3.14");
  expect(infer_cell("-0.5") == Cell(-0.5), "\"-0.5\" should be FLOAT -0.5");
  expect(infer_cell("abc") == Cell("abc"), "\"abc\" should be TEXT");
  expect(infer_cell("") == Cell(""), "\"\" should be TEXT");
  expect(infer_cell("12.3.4") == Cell("12.3.4"), "\"12.3.4\" should be TEXT");

  expect(infer_cell("0").is_int(), "\"0\" should be INT");
  expect(infer_cell("007") == Cell(7), "\"007\" should be INT 7");
  expect(infer_cell("5.") == Cell(5.0), "\"5.\" should be FLOAT 5");
  expect(infer_cell(".5") == Cell(0.5), "\".5\" should be FLOAT 0.5");
  expect(infer_cell("-.5") == Cell(-0.5), "\"-.5\" should be FLOAT -0.5");
  expect(infer_cell("-").is_text(), "\"-\" should be TEXT");
  expect(infer_cell(".").is_text(), "\".\" should be TEXT");
  expect(infer_cell("-.").is_text(), "\"-.\" should be TEXT");
  expect(infer_cell("--5").is_text(), "\"--5\" should be TEXT");
  expect(infer_cell("5-").is_text(), "\"5-\" should be TEXT");
  expect(infer_cell("+5").is_text(), "\"+5\" should be TEXT");
  expect(infer_cell(" 5").is_text(), "\" 5\" should be TEXT");
  expect(infer_cell("1e5").is_text(), "\"1e5\" should be TEXT");
  expect(infer_cell("1,5").is_text(), "\"1,5\" should be TEXT");
  expect(infer_cell("99999999999999999999").is_text(), "INT overflow should be TEXT");
  expect(infer_cell("9223372036854775807") == Cell(static_cast<int64_t>(9223372036854775807LL)),
      "INT64_MAX should be INT");

  // Values outside the normal double range are still FLOATs
  Cell tiny = infer_cell("0." + string(400, '0') + "1");
  expect(tiny.is_float() && (tiny.as_float() == 0.0), "underflowing FLOAT should be FLOAT 0");
  Cell subnormal = infer_cell("-0." + string(323, '0') + "5");
  expect(subnormal.is_float() && (subnormal.as_float() < 0.0) && (subnormal.as_float() > -1e-320),
      "subnormal FLOAT should be FLOAT");
  Cell huge = infer_cell(string(400, '9') + ".0");
  expect(huge.is_float() && isinf(huge.as_float()), "overflowing FLOAT should be FLOAT inf");
}

void test_format_cell() {
  expect(format_cell(Cell(500)) == "500", "INT 500 formatted incorrectly");
  expect(format_cell(Cell(-45)) == "-45", "INT -45 formatted incorrectly");
  expect(format_cell(Cell(3.14)) == "3.14", "FLOAT 3.14 formatted incorrectly");
  expect(format_cell(Cell(-0.5)) == "-0.5", "FLOAT -0.5 formatted incorrectly");
  expect(format_cell(Cell(0.1)) == "0.1", "FLOAT 0.1 formatted incorrectly");
  expect(format_cell(Cell(500.0)) == "500.0", "FLOAT 500 formatted incorrectly");
  expect(format_cell(Cell("a b\tc")) == "a b\tc", "TEXT not written verbatim");
  expect(format_cell(Cell()) == "", "default cell is not empty TEXT");

  for (double v : {0.0, 1.5, -2.25, 123456.789, 1e15, 1e300, 1e-300, 0.1 + 0.2,
           5e-324, -5e-324, 2.225e-308, DBL_MIN, DBL_MAX}) {
    Cell reparsed = infer_cell(format_cell(Cell(v)));
    expect(reparsed.is_float() && (reparsed.as_float() == v),
        "FLOAT " + format_cell(Cell(v)) + " does not read back as the same value");
  }
}

void test_cell_accessors() {
  Cell c(42);
  expect(c.type() == Cell::Type::INT, "INT cell has wrong type");
  expect(c.as_int() == 42, "INT cell has wrong value");
  expect(c.str() == "42", "INT cell str() is wrong");
  expect_raises<bad_variant_access>([&]() {
    c.as_text();
  },
      "as_text on an INT cell did not throw");
  expect(Cell(1) != Cell(1.0), "INT and FLOAT cells compared equal");
  expect(Cell("1") != Cell(1), "TEXT and INT cells compared equal");
}

////////////////////////////////////////////////////////////////////////////////
// Tables

void test_parse_savegame_scenario() {
  string text = "###Savegame\nName\tMoney\nAlice\t500\n\n";
  auto parsed = parse_tables(text);

  expect(parsed.tables.size() == 1, "scenario should have one table");
  const Table* table = parsed.tables.get("Savegame");
  expect(table && (table->size() == 1), "Savegame table should have one row");
  if (table && !table->empty()) {
    const auto& row = table->front();
    expect(row.size() == 2, "Savegame row should have two cells");
    expect(row.at("Name") == Cell("Alice"), "Name should be TEXT Alice");
    expect(row.at("Money") == Cell(500), "Money should be INT 500");
  }
  expect((parsed.header_order.size() == 1) &&
          (parsed.header_order.at("Savegame") == vector<string>({"Name", "Money"})),
      "header order should be [Name, Money]");
  expect(format_tables(parsed.tables, parsed.header_order) == text, "scenario did not format back byte-for-byte");
}

void test_parse_pads_short_rows() {
  auto parsed = parse_tables("###T\nA\tB\tC\n1\t2\n");
  const auto& table = parsed.tables.at("T");
  expect(table.size() == 1, "short row was not kept");
  if (!table.empty()) {
    Row expected = {{"A", Cell(1)}, {"B", Cell(2)}, {"C", Cell("")}};
    expect(table.front() == expected, "short row was not padded with empty TEXT");
  }
}

void test_parse_long_row_policies() {
  string text = "###T\nA\tB\n1\t2\n3\t4\t5\n6\t7\n";

  expect_format_error(FormatError::Stage::TABLE_STRUCTURE, [&]() {
    parse_tables(text);
  },
      "long row was not rejected by default");

  TableParseOptions options;
  options.long_row_policy = LongRowPolicy::TRUNCATE;
  auto truncated = parse_tables(text, options);
  const auto& truncated_table = truncated.tables.at("T");
  expect(truncated_table.size() == 3, "TRUNCATE policy should keep all rows");
  if (truncated_table.size() == 3) {
    expect(truncated_table[1] == Row({{"A", Cell(3)}, {"B", Cell(4)}}), "TRUNCATE policy kept the wrong fields");
  }

  options.long_row_policy = LongRowPolicy::SKIP;
  auto skipped = parse_tables(text, options);
  const auto& skipped_table = skipped.tables.at("T");
  expect(skipped_table.size() == 2, "SKIP policy should drop the long row");
  if (skipped_table.size() == 2) {
    expect(skipped_table[1].at("A") == Cell(6), "SKIP policy dropped the wrong row");
  }

  expect(phosg::enum_for_name<LongRowPolicy>("TRUNCATE") == LongRowPolicy::TRUNCATE, "policy name lookup failed");
  expect(string(phosg::name_for_enum(LongRowPolicy::SKIP)) == "SKIP", "policy name is wrong");
}

void test_parse_ignores_preamble_and_blank_lines() {
  string text = "garbage before\tany table\n12\n\n###T\r\n\r\nsingle field line\r\nA\tB\r\n\r\n1\t2\r\n   \r\nx\ty\r\n";
  auto parsed = parse_tables(text);
  expect(parsed.tables.names() == vector<string>({"T"}), "preamble created a table");
  const auto& table = parsed.tables.at("T");
  expect(table.size() == 2, "blank lines were not skipped");
  expect(parsed.header_order.at("T") == vector<string>({"A", "B"}), "single-field line was taken as the header");
  if (table.size() == 2) {
    expect(table[1] == Row({{"A", Cell("x")}, {"B", Cell("y")}}), "CRLF line endings not handled");
  }
}

void test_parse_table_without_header() {
  auto parsed = parse_tables("###Empty\n\n###Other\nonly_one_field\n");
  expect(parsed.tables.names() == vector<string>({"Empty", "Other"}), "tables without headers were not kept");
  expect(parsed.tables.at("Empty").empty() && parsed.tables.at("Other").empty(), "tables without headers should be empty");
  expect(parsed.header_order.empty(), "header order captured for tables without headers");
  expect(format_tables(parsed.tables, parsed.header_order) == "###Empty\n\n###Other\n\n", "empty tables formatted incorrectly");
}

void test_parse_whitespace_lines_before_header() {
  auto parsed = parse_tables("###Savegame\n\t\n \t \nName\tMoney\nAlice\t500\n\n");
  expect(parsed.header_order.at("Savegame") == vector<string>({"Name", "Money"}),
      "whitespace-only line was taken as the header");
  const auto& table = parsed.tables.at("Savegame");
  expect((table.size() == 1) && (table[0] == Row({{"Name", Cell("Alice")}, {"Money", Cell(500)}})),
      "header line was parsed as a data row");

  // After the header, a tab-only line is still a row of empty cells
  auto with_empty_row = parse_tables("###T\nA\tB\n\t\n   \n1\t2\n");
  expect(with_empty_row.tables.at("T").size() == 2, "tab-only row after the header was not kept");
}

void test_parse_indented_marker_and_table_names() {
  auto parsed = parse_tables("  \t###Savegame  \r\nA\tB\n1\t2\n###  Spaced Name\nC\tD\n3\t4\n");
  expect(parsed.tables.names() == vector<string>({"Savegame", "  Spaced Name"}),
      "indented marker or leading spaces in a name handled incorrectly");
  string formatted = format_tables(parsed.tables, parsed.header_order);
  auto reparsed = parse_tables(formatted);
  expect(reparsed.tables == parsed.tables, "table names did not survive format and parse");
}

void test_parse_repeated_table_marker() {
  auto parsed = parse_tables("###A\nx\ty\n1\t2\n###B\np\tq\n3\t4\n###A\nz\tw\n5\t6\n");
  expect(parsed.tables.names() == vector<string>({"A", "B"}), "repeated table moved or duplicated");
  const auto& table = parsed.tables.at("A");
  expect((table.size() == 1) && (table[0] == Row({{"z", Cell(5)}, {"w", Cell(6)}})), "repeated table did not replace earlier rows");
  expect(parsed.header_order.at("A") == vector<string>({"z", "w"}), "repeated table kept the old header");
}

void test_parse_preserves_empty_cells() {
  string text = "###T\nA\tB\tC\n\tmiddle\t\n\t\t\n";
  auto parsed = parse_tables(text);
  const auto& table = parsed.tables.at("T");
  expect(table.size() == 2, "rows of empty cells were dropped");
  if (table.size() == 2) {
    expect(table[0] == Row({{"A", Cell("")}, {"B", Cell("middle")}, {"C", Cell("")}}), "leading empty cell shifted columns");
    expect(table[1] == Row({{"A", Cell("")}, {"B", Cell("")}, {"C", Cell("")}}), "all-empty row parsed incorrectly");
  }
  expect(format_tables(parsed.tables, parsed.header_order) == text + "\n", "empty cells did not format back");
}

void test_format_uses_captured_header_order() {
  TableSet tables;
  auto& table = tables.emplace("Youtuber");
  table.emplace_back(Row({{"Zeta", Cell(1)}, {"Alpha", Cell("a")}, {"Mid", Cell(2.5)}}));
  // Missing a column, and has one that isn't in the header
  table.emplace_back(Row({{"Alpha", Cell("b")}, {"Extra", Cell(9)}}));

  HeaderOrder order = {{"Youtuber", {"Zeta", "Alpha", "Mid"}}};
  expect(format_tables(tables, order) == "###Youtuber\nZeta\tAlpha\tMid\n1\ta\t2.5\n\tb\t\n\n",
      "captured header order not used");

  // Without a captured order, the first row's iteration order is used
  expect(format_tables(tables) == "###Youtuber\nAlpha\tMid\tZeta\na\t2.5\t1\nb\t\t\n\n",
      "fallback column order not used");
}

void test_format_parse_round_trip() {
  string text =
      "###Savegame\nName\tMoney\tCurrent_date\tHouse\nAlice\t500\t12.5\t3\n\n"
      "###Channel\nDay\tSubscribers\tViews\tMoney\n1\t10\t100\t-2.75\n2\t15\t\t0.0\n3\t-1\t99999\t1000000.125\n\n"
      "###Inventory\n\n"
      "###Youtuber\nName\tLevel\tBio\nBob\t7\tlikes games, 12.3.4 and -\n\n";
  auto parsed = parse_tables(text);
  string formatted = format_tables(parsed.tables, parsed.header_order);
  expect(formatted == text, "canonical text did not format back byte-for-byte");

  auto reparsed = parse_tables(formatted);
  expect(reparsed.tables == parsed.tables, "tables changed through a format/parse round trip");
  expect(reparsed.header_order == parsed.header_order, "header order changed through a format/parse round trip");
}

void test_full_pipeline() {
  string text = "###Savegame\nName\tMoney\nAlice\t500\n\n###Youtuber\nLevel\tFans\n3\t1200\n\n###Channel\nDay\tViews\n1\t50\n\n";
  auto parsed = parse_tables(text);
  parsed.tables.at("Savegame").at(0)["Money"] = Cell(123456);

  string envelope = encode_envelope(format_tables(parsed.tables, parsed.header_order));
  auto reparsed = parse_tables(decode_envelope(envelope));
  expect(reparsed.tables.at("Savegame").at(0).at("Money") == Cell(123456), "edit did not survive the save pipeline");
  expect(reparsed.tables.names() == vector<string>({"Savegame", "Youtuber", "Channel"}), "table order changed in the save pipeline");
}

void test_table_set() {
  TableSet tables;
  expect(tables.empty() && !tables.contains("A"), "new table set is not empty");
  tables.emplace("B").emplace_back(Row({{"x", Cell(1)}}));
  tables.emplace("A");
  expect(tables.names() == vector<string>({"B", "A"}), "table set does not keep insertion order");
  expect(tables.get("missing") == nullptr, "get returned a missing table");
  expect_raises<out_of_range>([&]() {
    tables.at("missing");
  },
      "at did not throw for a missing table");

  tables.emplace("B");
  expect(tables.at("B").empty() && (tables.names() == vector<string>({"B", "A"})),
      "re-adding a table did not clear it in place");
}

void test_find_missing_tables() {
  auto parsed = parse_tables("###Savegame\nA\tB\n1\t2\n\n###Channel\n\n");
  auto missing = find_missing_tables(parsed.tables, {"Savegame", "Youtuber", "Channel", "Other"});
  expect(missing == vector<string>({"Youtuber", "Other"}), "missing tables reported incorrectly");
  expect(find_missing_tables(parsed.tables, {}).empty(), "missing tables reported for an empty requirement list");
}

void test_log_level_arguments_override_config() {
  static const char* config_filename = "ylsedit-tests-config.json";
  phosg::save_file(config_filename,
      "{\"ChunkSize\": 77, \"LogLevels\": {\"CLI\": \"INFO\", \"Config\": \"INFO\", \"Envelope\": \"INFO\", \"Tables\": \"INFO\"}}");

  auto load_with_args = [&](const vector<string>& arg_strs) -> ToolConfig {
    vector<string> storage = arg_strs;
    vector<char*> argv;
    for (auto& arg : storage) {
      argv.emplace_back(arg.data());
    }
    phosg::Arguments args(argv.data(), argv.size());
    return load_tool_config(args);
  };

  auto config = load_with_args({"decode", string("--config=") + config_filename, "--verbose"});
  expect(config.chunk_size == 77, "ChunkSize was not read from the config file");
  expect(envelope_log.min_level == phosg::LogLevel::L_DEBUG, "--verbose was overridden by the config file");
  expect(tables_log.min_level == phosg::LogLevel::L_DEBUG, "--verbose did not apply to all loggers");

  load_with_args({"decode", string("--config=") + config_filename, "--quiet"});
  expect(cli_log.min_level == phosg::LogLevel::L_WARNING, "--quiet was overridden by the config file");

  load_with_args({"decode", string("--config=") + config_filename});
  expect(envelope_log.min_level == phosg::LogLevel::L_INFO, "config file log levels were not applied");

  config = load_with_args({"decode", string("--config=") + config_filename, "--chunk-size=5", "--long-rows=skip"});
  expect(config.chunk_size == 5, "--chunk-size did not override the config file");
  expect(config.long_row_policy == LongRowPolicy::SKIP, "--long-rows did not override the config file");

  remove(config_filename);
  set_all_log_levels(phosg::LogLevel::L_ERROR);
}

} // namespace

int main(int, char**) {
  set_all_log_levels(phosg::LogLevel::L_ERROR);

  test_envelope_round_trip();
  test_envelope_hello_scenario();
  test_envelope_text_is_plain_base64();
  test_envelope_is_gzip_inside();
  test_envelope_decode_trims_whitespace();
  test_envelope_decode_rejects_bad_base64();
  test_envelope_decode_rejects_bad_gzip();
  test_envelope_ignores_data_after_gzip_member();

  test_stream_encode_matches_whole_buffer();
  test_stream_decode_matches_whole_buffer();
  test_stream_encoder_output_never_padded_midstream();
  test_stream_decode_with_interior_whitespace();
  test_stream_decode_errors();
  test_stream_decoder_refuses_input_after_error();
  test_stream_invalid_usage();
  test_stream_file_functions();

  test_infer_cell();
  test_format_cell();
  test_cell_accessors();

  test_parse_savegame_scenario();
  test_parse_pads_short_rows();
  test_parse_long_row_policies();
  test_parse_ignores_preamble_and_blank_lines();
  test_parse_table_without_header();
  test_parse_whitespace_lines_before_header();
  test_parse_indented_marker_and_table_names();
  test_parse_repeated_table_marker();
  test_parse_preserves_empty_cells();
  test_format_uses_captured_header_order();
  test_format_parse_round_trip();
  test_full_pipeline();
  test_table_set();
  test_find_missing_tables();

  test_log_level_arguments_override_config();

  if (failures) {
    cerr << failures << " test expectation(s) failed\n";
    return 1;
  }
  cout << "All tests passed\n";
  return 0;
}
