#include <catch2/catch.hpp>

#define STRINGIFY_HELPER(x) #x
#define STRINGIFY(x) STRINGIFY_HELPER(x)

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

static const std::string xw_cli = STRINGIFY(XW_CLI);

// Portable exit code extraction: WEXITSTATUS on POSIX, raw value on Windows
static int
exit_code(int status) {
#ifdef _WIN32
  return status;
#else
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return -1;
#endif
}

static int
run_cli(const std::string& args) {
  std::string cmd = xw_cli + " " + args + " 2>/dev/null";
  return exit_code(std::system(cmd.c_str()));
}

static int
run_cli_stderr(const std::string& args, std::string& stderr_output) {
  auto tmp = fs::temp_directory_path() / "xw_cli_stderr.txt";
  std::string cmd = xw_cli + " " + args + " 2>" + tmp.string();
  int rc = exit_code(std::system(cmd.c_str()));
  std::ifstream in(tmp);
  stderr_output.assign(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
  fs::remove(tmp);
  return rc;
}

static int
run_cli_stdout(const std::string& args, std::string& stdout_output) {
  auto tmp = fs::temp_directory_path() / "xw_cli_stdout.txt";
  std::string cmd = xw_cli + " " + args + " >" + tmp.string() + " 2>/dev/null";
  int rc = exit_code(std::system(cmd.c_str()));
  std::ifstream in(tmp);
  stdout_output.assign(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
  fs::remove(tmp);
  return rc;
}

static std::string
make_tmp_dir(const std::string& name) {
  auto dir = fs::temp_directory_path() / ("xw_cli_" + name);
  fs::create_directories(dir);
  return dir.string();
}

static void
cleanup_dir(const std::string& path) {
  fs::remove_all(path);
}

static std::string
write_file(const std::string& dir, const std::string& name,
           const std::string& content) {
  auto path = fs::path(dir) / name;
  std::ofstream out(path, std::ios::binary);
  out << content;
  return path.string();
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(in),
          std::istreambuf_iterator<char>()};
}

TEST_CASE("--help exits 0 and produces output", "[cli]") {
  std::string err;
  int rc = run_cli_stderr("--help", err);
  CHECK(rc == 0);
  CHECK(err.find("Usage") != std::string::npos);
}

TEST_CASE("-h exits 0 and produces output", "[cli]") {
  CHECK(run_cli("-h") == 0);
}

TEST_CASE("--version exits 0 and contains version", "[cli]") {
  std::string err;
  int rc = run_cli_stderr("--version", err);
  CHECK(rc == 0);
  CHECK(err.find("xw-format") != std::string::npos);
}

TEST_CASE("unknown option exits 1 (usage error)", "[cli]") {
  std::string err;
  CHECK(run_cli_stderr("--bogus", err) == 1);
  CHECK(err.find("--bogus") != std::string::npos);
}

TEST_CASE("option without its argument exits 1", "[cli]") {
  CHECK(run_cli("--indent") == 1);
}

TEST_CASE("out of range --indent count exits 1", "[cli]") {
  std::string err;
  CHECK(run_cli_stderr("--indent 99999999999999999999", err) == 1);
  CHECK(err.find("--indent") != std::string::npos);
  CHECK(run_cli("--indent 4000000000") == 1);
  CHECK(run_cli("--indent 65") == 1);
}

TEST_CASE("--indent accepts counts up to 64", "[cli]") {
  std::string dir = make_tmp_dir("indent");
  auto input = write_file(dir, "in.xml", "<r><a/></r>");

  std::string out;
  int rc = run_cli_stdout("--pretty --indent 64 " + input, out);
  CHECK(rc == 0);
  CHECK(out.find("\n" + std::string(64, ' ') + "<a/>") != std::string::npos);

  cleanup_dir(dir);
}

TEST_CASE("bad --standalone value exits 1", "[cli]") {
  CHECK(run_cli("--standalone maybe") == 1);
}

TEST_CASE("two input files exit 1", "[cli]") {
  CHECK(run_cli("a.xml b.xml") == 1);
}

TEST_CASE("nonexistent input file exits 2 (file error)", "[cli]") {
  CHECK(run_cli("nonexistent.xml") == 2);
}

TEST_CASE("malformed XML exits 3", "[cli]") {
  std::string dir = make_tmp_dir("malformed");
  auto input = write_file(dir, "bad.xml", "<a><b></a>");

  std::string err;
  int rc = run_cli_stderr(input + " -o " + dir + "/out.xml", err);
  cleanup_dir(dir);

  CHECK(rc == 3);
  CHECK(err.find("parse error") != std::string::npos);
}

TEST_CASE("unwritable output exits 4", "[cli]") {
  if (!fs::exists("/dev/full")) return;

  std::string dir = make_tmp_dir("full");
  auto input = write_file(dir, "in.xml", "<a>text</a>");
  int rc = run_cli(input + " -o /dev/full");
  cleanup_dir(dir);

  CHECK(rc == 4);
}

TEST_CASE("document is copied to the output file", "[cli]") {
  std::string dir = make_tmp_dir("copy");
  const std::string xml = "<?xml version=\"1.0\" standalone=\"yes\"?>\n"
                          "<r a=\"1\">\n"
                          "    <e>text &amp; more</e>\n"
                          "    <empty/>\n"
                          "</r>\n";
  auto input = write_file(dir, "in.xml", xml);

  int rc = run_cli(input + " -o " + dir + "/out.xml");
  CHECK(rc == 0);
  CHECK(read_file(dir + "/out.xml") == xml);

  cleanup_dir(dir);
}

TEST_CASE("--pretty reindents the document", "[cli]") {
  std::string dir = make_tmp_dir("pretty");
  auto input = write_file(dir, "in.xml", "<r>  <a><b/></a>\n<c>x</c></r>");

  int rc = run_cli("--pretty --indent 2 -o " + dir + "/out.xml " + input);
  CHECK(rc == 0);
  CHECK(read_file(dir + "/out.xml") ==
        "<?xml version=\"1.0\" standalone=\"yes\"?>\n"
        "<r>\n"
        "  <a>\n"
        "    <b/>\n"
        "  </a>\n"
        "  <c>x</c>\n"
        "</r>\n");

  cleanup_dir(dir);
}

TEST_CASE("output goes to stdout by default", "[cli]") {
  std::string dir = make_tmp_dir("stdout");
  auto input = write_file(dir, "in.xml", "<r><e/></r>");

  std::string out;
  int rc = run_cli_stdout("--no-minimize --standalone no " + input, out);
  CHECK(rc == 0);
  CHECK(out == "<?xml version=\"1.0\" standalone=\"no\"?>\n"
               "<r><e></e></r>\n");

  cleanup_dir(dir);
}

TEST_CASE("input is read from stdin without a file", "[cli]") {
  std::string dir = make_tmp_dir("stdin");
  auto input = write_file(dir, "in.xml", "<r>caf\xC3\xA9</r>");

  std::string out;
  int rc = run_cli_stdout("--escape-non-ascii --decimal < " + input, out);
  CHECK(rc == 0);
  CHECK(out == "<?xml version=\"1.0\" standalone=\"yes\"?>\n"
               "<r>caf&#233;</r>\n");

  cleanup_dir(dir);
}

TEST_CASE("--attr-per-line and --offset", "[cli]") {
  std::string dir = make_tmp_dir("attrs");
  auto input = write_file(dir, "in.xml", "<r a=\"1\" b=\"2\"/>");

  std::string out;
  int rc = run_cli_stdout("--attr-per-line --offset '> ' " + input, out);
  CHECK(rc == 0);
  CHECK(out.find("\n> ") != std::string::npos);
  CHECK(out.find("b=\"2\"") != std::string::npos);

  cleanup_dir(dir);
}

TEST_CASE("--all-attributes keeps DTD defaults", "[cli]") {
  std::string dir = make_tmp_dir("defaults");
  auto input = write_file(dir, "in.xml",
                          "<!DOCTYPE r [<!ATTLIST r d CDATA \"dv\">]><r/>");

  std::string plain;
  std::string all;
  CHECK(run_cli_stdout(input, plain) == 0);
  CHECK(run_cli_stdout("--all-attributes " + input, all) == 0);
  CHECK(plain.find("d=\"dv\"") == std::string::npos);
  CHECK(all.find("<r d=\"dv\"/>") != std::string::npos);

  cleanup_dir(dir);
}
