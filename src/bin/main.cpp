#include <xw/errors.hpp>
#include <xw/expat_source.hpp>
#include <xw/format_options.hpp>
#include <xw/xml_writer.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_writer = 4;

static constexpr std::size_t max_indent = 64;

struct cli_options {
  std::string input_file;
  std::string output_file;
  xw::format_options format;
  bool strip_blank = false;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: xw-format [options] [file.xml]\n"
     << "\n"
     << "Reads XML from the file (or standard input) and writes it back out.\n"
     << "\n"
     << "Options:\n"
     << "  -o <file>             Output file (default: standard output)\n"
     << "  --pretty              Indent nested elements (implies "
        "--strip-blank)\n"
     << "  --indent <n|string>   Indent unit: n spaces or a literal string "
        "(default: 4 spaces)\n"
     << "  --offset <string>     Written before the indent on every line\n"
     << "  --attr-per-line       One attribute per line\n"
     << "  --no-minimize         Write <e></e> instead of <e/>\n"
     << "  --all-attributes      Also write attributes defaulted by the DTD\n"
     << "  --escape-non-ascii    Write non-ASCII characters as references\n"
     << "  --decimal             Decimal character references (default: "
        "hex)\n"
     << "  --standalone yes|no   Standalone declaration (default: yes)\n"
     << "  --xml-version <v>     Version in the XML declaration (default: "
        "1.0)\n"
     << "  --strip-blank         Drop whitespace-only text\n"
     << "  -h, --help            Show this help message\n"
     << "  --version             Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "xw-format " << XW_VERSION << "\n";
}

static std::string
require_value(int argc, char* argv[], int& i, const std::string& option) {
  if (i + 1 >= argc) {
    std::cerr << "xw-format: " << option << " requires an argument\n";
    std::exit(exit_usage);
  }
  return argv[++i];
}

static std::string
indent_from_arg(const std::string& value) {
  if (value.empty() ||
      value.find_first_not_of("0123456789") != std::string::npos) {
    return value;
  }

  std::size_t count = 0;
  const char* last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), last, count);
  if (ec != std::errc{} || ptr != last || count > max_indent) {
    std::cerr << "xw-format: --indent count must be at most " << max_indent
              << ": " << value << "\n";
    std::exit(exit_usage);
  }
  return std::string(count, ' ');
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "-o") {
      opts.output_file = require_value(argc, argv, i, arg);
      continue;
    }

    if (arg == "--pretty") {
      opts.format.pretty_print = true;
      opts.strip_blank = true;
      continue;
    }

    if (arg == "--indent") {
      opts.format.indent = indent_from_arg(require_value(argc, argv, i, arg));
      continue;
    }

    if (arg == "--offset") {
      opts.format.offset = require_value(argc, argv, i, arg);
      continue;
    }

    if (arg == "--attr-per-line") {
      opts.format.attr_per_line = true;
      continue;
    }

    if (arg == "--no-minimize") {
      opts.format.minimize_empty = false;
      continue;
    }

    if (arg == "--all-attributes") {
      opts.format.specified_only = false;
      continue;
    }

    if (arg == "--escape-non-ascii") {
      opts.format.escape_non_ascii = true;
      continue;
    }

    if (arg == "--decimal") {
      opts.format.use_decimal = true;
      continue;
    }

    if (arg == "--standalone") {
      std::string value = require_value(argc, argv, i, arg);
      if (value != "yes" && value != "no") {
        std::cerr << "xw-format: --standalone must be yes or no\n";
        std::exit(exit_usage);
      }
      opts.format.standalone = value == "yes";
      continue;
    }

    if (arg == "--xml-version") {
      opts.format.xml_version = require_value(argc, argv, i, arg);
      continue;
    }

    if (arg == "--strip-blank") {
      opts.strip_blank = true;
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "xw-format: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    if (!opts.input_file.empty()) {
      std::cerr << "xw-format: only one input file may be given\n";
      std::exit(exit_usage);
    }
    opts.input_file = arg;
  }

  return opts;
}

static int
format(std::istream& in, std::ostream& out, const cli_options& opts) {
  xw::expat_source source;
  source.set_strip_blank_text(opts.strip_blank);

  xw::xml_writer writer(source, out);
  writer.set_options(opts.format);

  try {
    writer.parse(in);
  } catch (const xw::illegal_event_error& e) {
    std::cerr << "xw-format: writer error: " << e.what() << "\n";
    return exit_writer;
  } catch (const xw::write_error& e) {
    std::cerr << "xw-format: cannot write output: " << e.what() << "\n";
    return exit_writer;
  } catch (const std::runtime_error& e) {
    std::cerr << "xw-format: " << e.what() << "\n";
    return exit_parse;
  }
  return exit_success;
}

static int
run(const cli_options& opts) {
  std::ifstream file_in;
  if (!opts.input_file.empty()) {
    file_in.open(opts.input_file, std::ios::binary);
    if (!file_in) {
      std::cerr << "xw-format: cannot open file: " << opts.input_file << "\n";
      return exit_io;
    }
  }
  std::istream& in = opts.input_file.empty() ? std::cin : file_in;

  if (opts.output_file.empty()) { return format(in, std::cout, opts); }

  std::ofstream out(opts.output_file, std::ios::binary);
  if (!out) {
    std::cerr << "xw-format: cannot write file: " << opts.output_file << "\n";
    return exit_io;
  }
  return format(in, out, opts);
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  return run(opts);
}
