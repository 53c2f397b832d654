#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <algorithm>
#include <format>
#include <functional>
#include <memory>
#include <phosg/Arguments.hh>
#include <phosg/Filesystem.hh>
#include <phosg/Strings.hh>
#include <phosg/Time.hh>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "Cell.hh"
#include "Envelope.hh"
#include "FormatError.hh"
#include "Loggers.hh"
#include "SaveTables.hh"
#include "ToolConfig.hh"

using namespace std;

void print_usage();

static bool is_stdio_filename(const string& filename) {
  return filename.empty() || (filename == "-");
}

string read_input_data(phosg::Arguments& args) {
  const string& input_filename = args.get<string>(1, false);
  if (!is_stdio_filename(input_filename)) {
    return phosg::load_file(input_filename);
  } else {
    return phosg::read_all(stdin);
  }
}

// Returns true if the input should be treated as decoded save text rather than
// as an envelope
bool input_is_text(phosg::Arguments& args) {
  if (args.get<bool>("text")) {
    return true;
  }
  const string& input_filename = args.get<string>(1, false);
  return input_filename.ends_with(".txt");
}

bool is_text_extension(const char* extension) {
  return (!strcmp(extension, "txt") || !strcmp(extension, "yls") || !strcmp(extension, "json"));
}

string get_output_filename(phosg::Arguments& args, const char* extension) {
  const string& input_filename = args.get<string>(1, false);
  const string& output_filename = args.get<string>(2, false);

  if (!is_stdio_filename(output_filename)) {
    return output_filename;
  } else if (output_filename.empty() && !is_stdio_filename(input_filename)) {
    // If no output filename is given and an input filename is given, write to
    // <input_filename>.<extension>
    if (!extension) {
      throw runtime_error("an output filename is required");
    }
    return input_filename + "." + extension;
  } else {
    return "";
  }
}

void write_output_data(phosg::Arguments& args, const void* data, size_t size, const char* extension) {
  string filename = get_output_filename(args, extension);
  if (!filename.empty()) {
    phosg::save_file(filename, data, size);
    cli_log.info_f("Wrote {} bytes to {}", size, filename);

  } else if (isatty(fileno(stdout)) && (!extension || !is_text_extension(extension))) {
    // If stdout is a terminal and the data is not known to be text, use
    // print_data to write the result
    phosg::print_data(stdout, data, size);
    fflush(stdout);

  } else {
    // If stdout is not a terminal, write the data as-is
    phosg::fwritex(stdout, data, size);
    fflush(stdout);
  }
}

void write_output_data(phosg::Arguments& args, const string& data, const char* extension) {
  write_output_data(args, data.data(), data.size(), extension);
}

ParsedTables read_input_tables(phosg::Arguments& args, const ToolConfig& config) {
  string data = read_input_data(args);
  if (!input_is_text(args)) {
    data = decode_envelope(data);
  }
  return parse_tables(data, config.parse_options());
}

struct Action;
unordered_map<string, const Action*> all_actions;
vector<const Action*> action_order;

struct Action {
  const char* name;
  const char* help_text; // May be null
  function<void(phosg::Arguments& args)> run;

  Action(
      const char* name,
      const char* help_text,
      function<void(phosg::Arguments& args)> run)
      : name(name),
        help_text(help_text),
        run(run) {
    auto emplace_ret = all_actions.emplace(this->name, this);
    if (!emplace_ret.second) {
      throw logic_error(std::format("multiple actions with the same name: {}", this->name));
    }
    action_order.emplace_back(this);
  }
};

Action a_help(
    "help", "\
  help\n\
    You\'re reading it now.\n",
    +[](phosg::Arguments&) -> void {
      print_usage();
    });

static void a_encode_decode_fn(phosg::Arguments& args) {
  bool is_decode = (args.get<string>(0) == "decode");
  const char* extension = is_decode ? "txt" : "yls";
  auto config = load_tool_config(args);

  uint64_t start = phosg::now();
  size_t input_bytes, output_bytes;
  if (args.get<bool>("stream")) {
    const string& input_filename = args.get<string>(1, false);
    string output_filename = get_output_filename(args, extension);
    shared_ptr<FILE> in_f = is_stdio_filename(input_filename)
        ? shared_ptr<FILE>(stdin, +[](FILE*) {})
        : phosg::fopen_shared(input_filename, "rb");
    shared_ptr<FILE> out_f = output_filename.empty()
        ? shared_ptr<FILE>(stdout, +[](FILE*) {})
        : phosg::fopen_shared(output_filename, "wb");

    input_bytes = 0;
    output_bytes = 0;
    auto read_fn = [&](size_t max_size) -> string {
      string ret(max_size, '\0');
      size_t bytes_read = fread(ret.data(), 1, max_size, in_f.get());
      if ((bytes_read < max_size) && ferror(in_f.get())) {
        throw runtime_error("cannot read input: " + phosg::string_for_error(errno));
      }
      ret.resize(bytes_read);
      input_bytes += bytes_read;
      return ret;
    };
    auto write_fn = [&](const void* data, size_t size) -> void {
      phosg::fwritex(out_f.get(), data, size);
      output_bytes += size;
    };
    if (is_decode) {
      envelope_decode_stream(read_fn, write_fn, config.chunk_size);
    } else {
      envelope_encode_stream(read_fn, write_fn, config.chunk_size);
    }
    fflush(out_f.get());

  } else {
    string data = read_input_data(args);
    input_bytes = data.size();
    data = is_decode ? decode_envelope(data) : encode_envelope(data);
    output_bytes = data.size();
    write_output_data(args, data, extension);
  }

  uint64_t end = phosg::now();
  cli_log.info_f("{} bytes input => {} bytes output in {}",
      input_bytes, output_bytes, phosg::format_duration(end - start));
}

Action a_decode(
    "decode", "\
  decode [INPUT-FILENAME [OUTPUT-FILENAME]]\n\
    Decode a save file envelope (base64-encoded gzip data) and write the\n\
    decoded data. With --stream, the input is decoded in pieces of\n\
    --chunk-size bytes (default 8192), so the whole file is never held in\n\
    memory.\n",
    a_encode_decode_fn);
Action a_encode(
    "encode", "\
  encode [INPUT-FILENAME [OUTPUT-FILENAME]]\n\
    Compress the input with gzip and base64-encode the result, producing a\n\
    save file envelope. --stream and --chunk-size work the same way as for\n\
    the decode action.\n",
    a_encode_decode_fn);

Action a_show_tables(
    "show-tables", "\
  show-tables [INPUT-FILENAME]\n\
    Decode a save file and describe the tables in it: the number of rows in\n\
    each table and its columns, in order. With --json, write the entire\n\
    contents of all tables as JSON instead. If the input is already decoded\n\
    (the filename ends in .txt, or --text is given), it is parsed directly.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_tool_config(args);
      auto parsed = read_input_tables(args, config);

      if (args.get<bool>("json")) {
        string out_data = parsed.tables.json().serialize(phosg::JSON::SerializeOption::FORMAT | phosg::JSON::SerializeOption::ESCAPE_CONTROLS_ONLY);
        out_data += '\n';
        phosg::fwritex(stdout, out_data.data(), out_data.size());
        return;
      }

      for (const auto& [name, table] : parsed.tables) {
        phosg::fwrite_fmt(stdout, "{} ({} rows)\n", name, table.size());
        auto order_it = parsed.header_order.find(name);
        if (order_it != parsed.header_order.end()) {
          for (const auto& column : order_it->second) {
            const char* type_name = table.empty() ? "---" : phosg::name_for_enum(table.front().at(column).type());
            phosg::fwrite_fmt(stdout, "  {:5} {}\n", type_name, column);
          }
        }
      }
    });

Action a_format_tables(
    "format-tables", "\
  format-tables [INPUT-FILENAME [OUTPUT-FILENAME]]\n\
    Parse a save file\'s tables and write them out again. This normalizes the\n\
    text (for example, numbers are rewritten in their canonical form). The\n\
    output is decoded text, unless --encode is given, in which case it is a\n\
    save file envelope.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_tool_config(args);
      auto parsed = read_input_tables(args, config);
      string text = format_tables(parsed.tables, parsed.header_order);
      if (args.get<bool>("encode")) {
        write_output_data(args, encode_envelope(text), "yls");
      } else {
        write_output_data(args, text, "txt");
      }
    });

static Row& get_cli_row(phosg::Arguments& args, ParsedTables& parsed, string* table_name = nullptr) {
  string name = args.get<string>("table");
  if (name.empty()) {
    throw runtime_error("the --table option is required");
  }
  if (table_name) {
    *table_name = name;
  }
  Table* table = parsed.tables.get(name);
  if (!table) {
    throw runtime_error(std::format("there is no table named {}", name));
  }
  size_t row_index = args.get<size_t>("row", 0);
  if (row_index >= table->size()) {
    throw runtime_error(std::format("row {} is out of range (table {} has {} rows)", row_index, name, table->size()));
  }
  return table->at(row_index);
}

Action a_get_cell(
    "get-cell", "\
  get-cell --table=NAME [--row=INDEX] --column=NAME [INPUT-FILENAME]\n\
    Print the type and value of one cell. Rows are numbered from 0; the\n\
    default row is 0.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_tool_config(args);
      auto parsed = read_input_tables(args, config);
      const auto& row = get_cli_row(args, parsed);
      string column = args.get<string>("column");
      try {
        const auto& cell = row.at(column);
        phosg::fwrite_fmt(stdout, "{} {}\n", phosg::name_for_enum(cell.type()), cell.str());
      } catch (const out_of_range&) {
        throw runtime_error(std::format("there is no column named {}", column));
      }
    });

Action a_set_cell(
    "set-cell", "\
  set-cell --table=NAME [--row=INDEX] --column=NAME --value=VALUE\n\
      [INPUT-FILENAME [OUTPUT-FILENAME]]\n\
    Change the value of one cell and write the modified save file. The new\n\
    value\'s type is inferred the same way as when the file is parsed. The\n\
    output is in the same form as the input (decoded text or envelope).\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_tool_config(args);
      auto parsed = read_input_tables(args, config);
      string table_name;
      auto& row = get_cli_row(args, parsed, &table_name);

      string column = args.get<string>("column");
      auto order_it = parsed.header_order.find(table_name);
      bool column_known = row.count(column) ||
          ((order_it != parsed.header_order.end()) &&
              (find(order_it->second.begin(), order_it->second.end(), column) != order_it->second.end()));
      if (!column_known) {
        throw runtime_error(std::format("there is no column named {}", column));
      }

      Cell new_value = infer_cell(args.get<string>("value"));
      cli_log.info_f("{}.{}: {} => {} ({})", table_name, column,
          row.count(column) ? row.at(column).str() : "(missing)", new_value.str(), phosg::name_for_enum(new_value.type()));
      row[column] = std::move(new_value);

      string text = format_tables(parsed.tables, parsed.header_order);
      if (input_is_text(args)) {
        write_output_data(args, text, "txt");
      } else {
        write_output_data(args, encode_envelope(text), "yls");
      }
    });

Action a_validate(
    "validate", "\
  validate [INPUT-FILENAME]\n\
    Check that the save file can be decoded and parsed, and that it contains\n\
    all of the required tables (Savegame, Youtuber, and Channel by default;\n\
    this list can be changed with RequiredTables in the configuration file).\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_tool_config(args);
      auto parsed = read_input_tables(args, config);
      auto missing = find_missing_tables(parsed.tables, config.required_tables);
      for (const auto& name : missing) {
        cli_log.warning_f("Missing required table: {}", name);
      }
      if (!missing.empty()) {
        throw runtime_error(std::format("save data is missing {} required table(s)", missing.size()));
      }
      cli_log.info_f("Save data appears valid ({} tables)", parsed.tables.size());
    });

static void check_self_test(bool ok, const char* name) {
  if (!ok) {
    throw runtime_error(std::format("self-test failed: {}", name));
  }
  cli_log.info_f("self-test: {}: OK", name);
}

Action a_self_test(
    "self-test", "\
  self-test\n\
    Run round-trip tests of the envelope and table formats, including the\n\
    streaming encoder and decoder.\n",
    +[](phosg::Arguments& args) -> void {
      auto config = load_tool_config(args);

      string original = "Hello from ylsedit self-test\n";
      check_self_test(decode_envelope(encode_envelope(original)) == original, "whole-buffer round trip");

      // Streaming decode of a larger envelope
      string big;
      while (big.size() < 100000) {
        big += "The quick brown fox jumps over the lazy dog. ";
      }
      big.resize(100000);
      string big_envelope = encode_envelope(big);
      size_t read_offset = 0;
      auto read_envelope_fn = [&](size_t max_size) -> string {
        string ret = big_envelope.substr(read_offset, max_size);
        read_offset += ret.size();
        return ret;
      };
      string decoded;
      auto append_decoded_fn = [&](const void* data, size_t size) -> void {
        decoded.append(reinterpret_cast<const char*>(data), size);
      };
      envelope_decode_stream(read_envelope_fn, append_decoded_fn, config.chunk_size);
      check_self_test(decoded == big, "streaming decode");

      // Streaming encode followed by streaming decode
      string big2(200000, 'A');
      read_offset = 0;
      auto read_raw_fn = [&](size_t max_size) -> string {
        string ret = big2.substr(read_offset, max_size);
        read_offset += ret.size();
        return ret;
      };
      string encoded;
      auto append_encoded_fn = [&](const void* data, size_t size) -> void {
        encoded.append(reinterpret_cast<const char*>(data), size);
      };
      envelope_encode_stream(read_raw_fn, append_encoded_fn, config.chunk_size);
      check_self_test(encoded == encode_envelope(big2), "streaming encode");
      read_offset = 0;
      big_envelope = std::move(encoded);
      decoded.clear();
      envelope_decode_stream(read_envelope_fn, append_decoded_fn, config.chunk_size);
      check_self_test(decoded == big2, "streaming encode/decode round trip");

      // Table round trip
      string text = "###Savegame\nName\tMoney\tCurrent_date\nAlice\t500\t12.5\n\n###Channel\n\n";
      auto parsed = parse_tables(text, config.parse_options());
      check_self_test(format_tables(parsed.tables, parsed.header_order) == text, "table round trip");
    });

void print_usage() {
  fputs("\
Usage:\n\
  ylsedit ACTION [OPTIONS...]\n\
\n\
ylsedit reads and writes Youtubers Life save files. Save files are stored as\n\
an envelope: gzip-compressed text, base64-encoded. The decoded text consists\n\
of tab-separated tables, each introduced by a ###TableName line.\n\
\n\
Some actions accept input and/or output filenames; see the descriptions below\n\
for details. If INPUT-FILENAME is missing or is \'-\', ylsedit reads from stdin.\n\
If OUTPUT-FILENAME is missing and the input is not from stdin, ylsedit writes\n\
the output to INPUT-FILENAME.txt or INPUT-FILENAME.yls; if OUTPUT-FILENAME is\n\
\'-\', ylsedit writes the output to stdout.\n\
\n\
The actions are:\n",
      stderr);
  for (const auto& a : action_order) {
    if (a->help_text) {
      fputs(a->help_text, stderr);
    }
  }
  fputs("\n\
All actions accept the following options:\n\
  --config=FILENAME\n\
      Load settings from this JSON file. If not given, system/config.json is\n\
      used if it exists.\n\
  --chunk-size=BYTES\n\
      Read size for streaming operations (overrides ChunkSize in the config).\n\
  --long-rows=reject|truncate|skip\n\
      What to do with table rows that have more fields than their header\n\
      (overrides LongRowPolicy in the config). The default is reject.\n\
  --text\n\
      Treat the input as decoded text instead of an envelope.\n\
  --verbose, --quiet\n\
      Log more or less than usual.\n\
\n",
      stderr);
}

int main(int argc, char** argv) {
  phosg::Arguments args(&argv[1], argc - 1);
  if (args.get<bool>("help")) {
    print_usage();
    return 0;
  }
  apply_log_level_arguments(args);

  string action_name = args.get<string>(0, false);
  const Action* a;
  try {
    a = all_actions.at(action_name);
  } catch (const out_of_range&) {
    phosg::log_error_f("Unknown or invalid action; try --help");
    return 1;
  }

  try {
    a->run(args);
  } catch (const FormatError& e) {
    phosg::log_error_f("Input is not valid: {}", e.what());
    return 2;
  } catch (const phosg::cannot_open_file& e) {
    phosg::log_error_f("Top-level exception (cannot_open_file): {}", e.what());
    return 1;
  } catch (const invalid_argument& e) {
    phosg::log_error_f("Top-level exception (invalid_argument): {}", e.what());
    return 1;
  } catch (const out_of_range& e) {
    phosg::log_error_f("Top-level exception (out_of_range): {}", e.what());
    return 1;
  } catch (const runtime_error& e) {
    phosg::log_error_f("Top-level exception (runtime_error): {}", e.what());
    return 1;
  } catch (const exception& e) {
    phosg::log_error_f("Top-level exception: {}", e.what());
    return 1;
  }
  return 0;
}
