#include <gmock/gmock.h>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "analysis.hxx"
#include "logger.hxx"
#include "nm.hxx"
#include "objdump.hxx"
#include "process-utils.hxx"
#include "readelf.hxx"
#include "report.hxx"
#include "symbol-assignment.hxx"
#include "toolchain.hxx"
#include "utils.hxx"

namespace fs = std::filesystem;

namespace {

const char* readelf_capture = R"(There are 7 section headers, starting at offset 0x21c48:

Section Headers:
  [Nr] Name              Type            Addr     Off    Size   ES Flg Lk Inf Al
  [ 0]                   NULL            00000000 000000 000000 00      0   0  0
  [ 1] .isr_vector       PROGBITS        08000000 010000 000188 00   A  0   0  4
  [ 2] .text             PROGBITS        08000188 010188 002000 00  AX  0   0  8
  [ 3] .data             PROGBITS        20000000 020000 000010 00  WA  0   0  4
  [ 4] .bss              NOBITS          20000010 020010 000100 00  WA  0   0  4
  [ 5] .comment          PROGBITS        00000000 020010 000045 01  MS  0   0  1
  [ 6] .symtab           SYMTAB          00000000 020058 000800 10      7  90  4
Key to Flags:
  W (write), A (alloc), X (execute), M (merge), S (strings), I (info),
  L (link order), O (extra OS processing required), G (group), T (TLS),
  C (compressed), x (unknown), o (OS specific), E (exclude),
  y (purecode), p (processor specific)
)";

const char* objdump_capture = R"(
firmware.elf:     file format elf32-littlearm

Sections:
Idx Name          Size      VMA       LMA       File off  Algn
  0 .isr_vector   00000188  08000000  08000000  00010000  2**2
                  CONTENTS, ALLOC, LOAD, READONLY, DATA
  1 .text         00002000  08000188  08000188  00010188  2**3
                  CONTENTS, ALLOC, LOAD, READONLY, CODE
  2 .data         00000010  20000000  08002188  00020000  2**2
                  CONTENTS, ALLOC, LOAD, DATA
  3 .bss          00000100  20000010  20000010  00020010  2**2
                  ALLOC
  4 .comment      00000045  00000000  00000000  00020010  2**0
                  CONTENTS, READONLY
)";

const char* nm_capture =
    "08000188 00000020 T main\t/src/app/main.cpp:10\n"
    "080001a8 00000010 W _ZN4RingILj8EE4pushEh\t/src/app/ring.hpp:20\n"
    "080001b8 00000010 W _ZN4RingILj16EE4pushEh\n"
    "/src/app/../app/ring.hpp:20\n"
    "080001c8 00000008 T _Z5resetv\t??:0\n"
    "20000000 00000004 D counter\n"
    "20000010 00000100 b buffer\n";

void write_file(const fs::path& path, const char *data) {
  std::ofstream of(path.string());
  of << data;
  of.close();
}

NmSymbol make_nm_symbol(std::uint64_t address, std::uint64_t size, char type, const std::string& name)
{
  NmSymbol symbol;
  symbol.address = address;
  symbol.size = size;
  symbol.type = type;
  symbol.name = name;
  symbol.raw_name = name;
  return symbol;
}

std::vector<Section> firmware_sections()
{
  std::istringstream in(readelf_capture);
  std::vector<Section> sections;
  parse_readelf_sections(in, sections);

  std::istringstream headers_in(objdump_capture);
  SectionHeaders headers;
  parse_objdump_section_headers(headers_in, headers);
  apply_load_addresses(sections, headers);

  return sections;
}

bool has_executable(const std::string& name)
{
  bool found = false;
  which(name, found);
  return found;
}

// Redirects the global logger to memory for the lifetime of the guard.
class LogCapture
{
private:
  CTXLogger::severity_level mLevel;

public:
  std::vector<std::string> messages;

  explicit LogCapture(CTXLogger::severity_level level)
    : mLevel(CTXLogger::_severity_level)
  {
    CTXLogger::_severity_level = level;
    CTXLogger::logger.set_sink(std::make_unique<CTXLogger::MemorySink>(messages));
  }

  ~LogCapture()
  {
    CTXLogger::logger.clear_context();
    CTXLogger::logger.set_sink(std::make_unique<CTXLogger::StreamSink>(std::cerr));
    CTXLogger::_severity_level = mLevel;
  }
};

} // anonymous namespace

void PrintTo(const NmSymbol& symbol, std::ostream* os) {
  *os << '{' << symbol.address << ' ' << symbol.type << ' ' << symbol.name << ' ' << symbol.size << '}';
}

TEST(utils, split) {
  EXPECT_THAT(split("a:b::c", ':'), ::testing::ElementsAre("a", "b", "", "c"));
  EXPECT_THAT(split("a:", ':'), ::testing::ElementsAre("a", ""));
  EXPECT_THAT(split_ws("  00000000 \t .text  AX "), ::testing::ElementsAre("00000000", ".text", "AX"));
}

TEST(utils, parse_hex) {
  std::uint64_t value = 42;
  EXPECT_TRUE(parse_hex("08000188", value));
  EXPECT_EQ(value, 0x08000188u);
  EXPECT_TRUE(parse_hex("ffffffffffffffff", value));
  EXPECT_EQ(value, 0xffffffffffffffffu);

  value = 42;
  EXPECT_FALSE(parse_hex("", value));
  EXPECT_FALSE(parse_hex("0x10", value));
  EXPECT_FALSE(parse_hex("10000000000000000", value));
  EXPECT_EQ(value, 42u);

  EXPECT_EQ(to_hex(0x20000010), "0x20000010");
}

TEST(utils, format_number) {
  EXPECT_EQ(format_number(0), "0");
  EXPECT_EQ(format_number(4096), "4096");
  EXPECT_EQ(format_number(134218120), "134218120");
  EXPECT_EQ(format_number(1.5), "1.5");
}

TEST(nm, parse_output) {
  std::istringstream in(nm_capture);
  std::vector<NmSymbol> symbols;
  parse_nm_output(in, symbols);

  ASSERT_EQ(symbols.size(), 6u);

  EXPECT_EQ(symbols[0].address, 0x08000188u);
  EXPECT_EQ(symbols[0].size, 0x20u);
  EXPECT_EQ(symbols[0].type, 'T');
  EXPECT_EQ(symbols[0].name, "main");
  ASSERT_TRUE(symbols[0].source);
  EXPECT_EQ(symbols[0].source->file, "/src/app/main.cpp");
  EXPECT_EQ(symbols[0].source->line, 10);

  EXPECT_EQ(symbols[1].name, "Ring<8u>::push(unsigned char)");
  EXPECT_EQ(symbols[1].raw_name, "_ZN4RingILj8EE4pushEh");
  EXPECT_EQ(symbols[1].type, 'W');

  // Location printed on its own line.
  EXPECT_EQ(symbols[2].name, "Ring<16u>::push(unsigned char)");
  ASSERT_TRUE(symbols[2].source);
  EXPECT_EQ(symbols[2].source->file, "/src/app/ring.hpp");
  EXPECT_EQ(symbols[2].source->line, 20);

  EXPECT_EQ(symbols[3].name, "reset()");
  EXPECT_FALSE(symbols[3].source);

  EXPECT_EQ(symbols[5].name, "buffer");
  EXPECT_EQ(symbols[5].type, 'b');
}

TEST(nm, skips_undefined_and_debug_symbols) {
  std::istringstream in(
      "Archive index:\n"
      "00000000 00000004 U undefined_symbol\n"
      "00000000 00000010 N .debug_info\n"
      "\n"
      "00001000 00000004 T defined\n");
  std::vector<NmSymbol> symbols;
  parse_nm_output(in, symbols);

  ASSERT_EQ(symbols.size(), 1u);
  EXPECT_EQ(symbols[0].name, "defined");
}

TEST(nm, names_with_spaces) {
  std::istringstream in(
      "00001000 00000004 t Ring<8u>::push(unsigned char) const\n"
      "00001004 00000004 t Ring<8u>::pop(unsigned char)\t/src/ring.hpp:42 (discriminator 2)\n");
  std::vector<NmSymbol> symbols;
  parse_nm_output(in, symbols);

  ASSERT_EQ(symbols.size(), 2u);
  EXPECT_EQ(symbols[0].name, "Ring<8u>::push(unsigned char) const");
  EXPECT_FALSE(symbols[0].source);
  EXPECT_EQ(symbols[1].name, "Ring<8u>::pop(unsigned char)");
  ASSERT_TRUE(symbols[1].source);
  EXPECT_EQ(symbols[1].source->line, 42);
}

TEST(nm, parse_source_location) {
  EXPECT_FALSE(parse_source_location("??:0"));
  EXPECT_FALSE(parse_source_location("char)"));
  EXPECT_FALSE(parse_source_location(":12"));

  const std::optional<SourceLocation> location = parse_source_location("/src/./drivers/../app/uart.c:7:3");
  ASSERT_TRUE(location);
  EXPECT_EQ(location->file, "/src/app/uart.c");
  EXPECT_EQ(location->line, 7);
}

TEST(nm, demangle) {
  EXPECT_EQ(demangle("_Z3fooi"), "foo(int)");
  EXPECT_EQ(demangle("plain_c_function"), "plain_c_function");
}

TEST(nm, arguments) {
  EXPECT_THAT(nm_arguments("fw.elf", 0),
              ::testing::ElementsAre("--print-size", "--size-sort", "--numeric-sort", "fw.elf"));
  EXPECT_THAT(nm_arguments("fw.elf", nm_options::line_numbers),
              ::testing::ElementsAre("--print-size", "--size-sort", "--numeric-sort", "--line-numbers", "fw.elf"));
}

TEST(nm, line_numbers_through_pipeline) {
  const fs::path dir = create_temporary_directory();
  const FileSystemGuard g(dir);

  // Fake nm printing its arguments as the name of a single symbol.
  const fs::path fake_nm = dir / "fake-nm";
  write_file(fake_nm, "#!/bin/sh\necho \"00001000 00000004 T $*\"\n");
  fs::permissions(fake_nm, fs::perms::owner_all);

  std::vector<NmSymbol> symbols;
  check_process(nm(fake_nm.string(), "fw.elf", symbols, nm_options::line_numbers));

  ASSERT_EQ(symbols.size(), 1u);
  EXPECT_EQ(symbols[0].name, "--print-size --size-sort --numeric-sort --line-numbers fw.elf");
}

TEST(readelf, parse_sections) {
  std::istringstream in(readelf_capture);
  std::vector<Section> sections;
  parse_readelf_sections(in, sections);

  ASSERT_EQ(sections.size(), 6u);

  EXPECT_EQ(sections[0].id, "sec_1");
  EXPECT_EQ(sections[0].name, ".isr_vector");
  EXPECT_EQ(sections[0].type, "PROGBITS");
  EXPECT_EQ(sections[0].vma, 0x08000000u);
  EXPECT_EQ(sections[0].size, 0x188u);
  EXPECT_EQ(flags_string(sections[0].flags), "A");

  EXPECT_EQ(sections[1].name, ".text");
  EXPECT_TRUE(sections[1].flags.exec);
  EXPECT_EQ(flags_string(sections[1].flags), "AX");

  EXPECT_EQ(sections[3].name, ".bss");
  EXPECT_EQ(sections[3].type, "NOBITS");
  EXPECT_EQ(flags_string(sections[3].flags), "WA");

  EXPECT_EQ(sections[4].name, ".comment");
  EXPECT_FALSE(sections[4].flags.alloc);

  EXPECT_EQ(sections[5].id, "sec_6");
  EXPECT_EQ(flags_string(sections[5].flags), "");
}

TEST(objdump, load_addresses) {
  const std::vector<Section> sections = firmware_sections();

  ASSERT_EQ(sections.size(), 6u);
  EXPECT_EQ(sections[2].name, ".data");
  ASSERT_TRUE(sections[2].lma);
  EXPECT_EQ(*sections[2].lma, 0x08002188u);
  EXPECT_TRUE(sections[2].has_distinct_load_address());

  EXPECT_FALSE(sections[1].has_distinct_load_address());
  EXPECT_FALSE(sections[5].lma);
}

TEST(symbol_assignment, classify) {
  EXPECT_EQ(classify_symbol_kind('T'), SymbolKind::func);
  EXPECT_EQ(classify_symbol_kind('t'), SymbolKind::func);
  EXPECT_EQ(classify_symbol_kind('W'), SymbolKind::func);
  EXPECT_EQ(classify_symbol_kind('b'), SymbolKind::object);
  EXPECT_EQ(classify_symbol_kind('R'), SymbolKind::object);
  EXPECT_EQ(classify_symbol_kind('V'), SymbolKind::object);
  EXPECT_EQ(classify_symbol_kind('N'), SymbolKind::section);
  EXPECT_EQ(classify_symbol_kind('A'), SymbolKind::other);
}

TEST(symbol_assignment, sections_and_locations) {
  const std::vector<NmSymbol> nm_symbols = {
    make_nm_symbol(0x08000188, 0x20, 'T', "main"),
    make_nm_symbol(0x20000000, 4, 'D', "counter"),
    make_nm_symbol(0x20000010, 0x100, 'b', "buffer"),
    make_nm_symbol(0x30000000, 4, 'T', "orphan"),
    make_nm_symbol(0x08000188, 0x20, 'W', "main"),
  };

  const SymbolAssignment assignment = assign_symbols_to_sections(nm_symbols, firmware_sections());

  ASSERT_EQ(assignment.symbols.size(), 4u);
  ASSERT_EQ(assignment.warnings.size(), 1u);
  EXPECT_THAT(assignment.warnings[0], ::testing::HasSubstr("orphan"));

  const Symbol& main = assignment.symbols[0];
  EXPECT_EQ(main.id, "sym_0");
  EXPECT_EQ(main.section_id, "sec_2");
  EXPECT_EQ(main.kind, SymbolKind::func);
  EXPECT_TRUE(main.weak);
  EXPECT_FALSE(main.local);
  EXPECT_FALSE(main.mangled_name);
  ASSERT_EQ(main.locations.size(), 1u);
  ASSERT_TRUE(main.primary_location);
  EXPECT_EQ(main.primary_location->address_type, AddressKind::runtime);
  EXPECT_EQ(main.primary_location->addr, static_cast<double>(0x08000188));

  const Symbol& counter = assignment.symbols[1];
  EXPECT_EQ(counter.section_id, "sec_3");
  EXPECT_EQ(counter.kind, SymbolKind::object);
  ASSERT_EQ(counter.locations.size(), 2u);
  EXPECT_EQ(counter.locations[1].address_type, AddressKind::load);
  EXPECT_EQ(counter.locations[1].addr, static_cast<double>(0x08002188));
  EXPECT_EQ(counter.primary_location, counter.locations[0]);

  const Symbol& buffer = assignment.symbols[2];
  EXPECT_EQ(buffer.section_id, "sec_4");
  EXPECT_TRUE(buffer.local);
  EXPECT_EQ(buffer.locations.size(), 1u);

  const Symbol& orphan = assignment.symbols[3];
  EXPECT_EQ(orphan.id, "sym_3");
  EXPECT_FALSE(orphan.section_id);
  EXPECT_FALSE(orphan.primary_location);
  EXPECT_THAT(orphan.locations, ::testing::IsEmpty());
}

TEST(symbol_assignment, mangled_aliases) {
  NmSymbol complete = make_nm_symbol(0x08000200, 0x10, 'W', "Ring<8u>::Ring()");
  complete.raw_name = "_ZN4RingILj8EEC1Ev";
  NmSymbol base = make_nm_symbol(0x08000200, 0x10, 'W', "Ring<8u>::Ring()");
  base.raw_name = "_ZN4RingILj8EEC2Ev";

  const SymbolAssignment assignment = assign_symbols_to_sections({complete, base}, firmware_sections());

  ASSERT_EQ(assignment.symbols.size(), 1u);
  EXPECT_EQ(assignment.symbols[0].mangled_name, "_ZN4RingILj8EEC1Ev");
  EXPECT_THAT(assignment.symbols[0].aliases, ::testing::ElementsAre("_ZN4RingILj8EEC2Ev"));
}

TEST(toolchain, resolve) {
  const fs::path dir = create_temporary_directory();
  const FileSystemGuard g(dir);

  write_file(dir / "arm-none-eabi-nm", "#!/bin/sh\n");
  fs::permissions(dir / "arm-none-eabi-nm", fs::perms::owner_all);

  write_file(dir / "arm-none-eabi-readelf.exe", "#!/bin/sh\n");
  fs::permissions(dir / "arm-none-eabi-readelf.exe", fs::perms::owner_all);

  // Not executable
  write_file(dir / "arm-none-eabi-size", "#!/bin/sh\n");
  fs::permissions(dir / "arm-none-eabi-size", fs::perms::owner_read | fs::perms::owner_write);

  ToolchainOptions options;
  options.directory = dir.string();

  const Toolchain toolchain = resolve_toolchain(options);
  EXPECT_EQ(toolchain.nm, (dir / "arm-none-eabi-nm").string());
  EXPECT_EQ(toolchain.readelf, (dir / "arm-none-eabi-readelf.exe").string());
  EXPECT_EQ(toolchain.objdump, "arm-none-eabi-objdump");
  EXPECT_EQ(toolchain.size, "arm-none-eabi-size");

  EXPECT_EQ(toolchain.strings, "arm-none-eabi-strings");

  options.directory.clear();
  options.prefix.clear();
  EXPECT_EQ(resolve_toolchain(options).nm, "nm");
}

TEST(toolchain, logs_every_tool) {
  LogCapture capture(CTXLogger::severity_level::debug);

  ToolchainOptions options;
  options.prefix = "tmplxplore-test-";
  resolve_toolchain(options);

  EXPECT_THAT(capture.messages, ::testing::IsSupersetOf({
    "nm: tmplxplore-test-nm",
    "objdump: tmplxplore-test-objdump",
    "size: tmplxplore-test-size",
    "readelf: tmplxplore-test-readelf",
    "strings: tmplxplore-test-strings",
  }));
}

TEST(process, output_and_exit_code) {
  const ProcessResult result = run_command("sh", {"-c", "echo out; echo err >&2; exit 3"});

  EXPECT_EQ(result.code, 3);
  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.out, "out\n");
  EXPECT_EQ(result.err, "err\n");
  EXPECT_TRUE(failed(result));

  try {
    check_process(result);
    FAIL() << "process_failure expected";
  } catch (const process_failure& ex) {
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("exit code 3"));
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("err"));
    EXPECT_EQ(ex.result().code, 3);
  }
}

TEST(process, success) {
  const ProcessResult result = run_command("sh", {"-c", "echo ok"}, RunOptions{std::chrono::milliseconds(10000), {}});

  EXPECT_EQ(result.code, 0);
  EXPECT_EQ(result.out, "ok\n");
  EXPECT_NO_THROW(check_process(result));
}

TEST(process, timeout) {
  RunOptions options;
  options.timeout = std::chrono::milliseconds(200);

  const ProcessResult result = run_command("sleep", {"10"}, options);

  EXPECT_TRUE(result.timed_out);
  EXPECT_THROW(check_process(result), process_timeout);
}

TEST(process, executable_not_found) {
  EXPECT_THROW(run_command("tmplxplore-no-such-command", {}), executable_not_found);
  EXPECT_THROW(run_command("/nonexistent/tmplxplore/nm", {}), executable_not_found);
}

TEST(process, working_directory) {
  const fs::path dir = create_temporary_directory();
  const FileSystemGuard g(dir);

  RunOptions options;
  options.directory = dir.string();

  const ProcessResult result = run_command("pwd", {}, options);
  EXPECT_EQ(fs::canonical(trim_copy(result.out)).string(), fs::canonical(dir).string());
}

TEST(report, groups_csv) {
  Symbol a;
  a.id = "sym_0";
  a.name = "Vec<int>";
  a.size = 16;
  a.section_id = "S";
  a.addr = 100;
  Symbol b = a;
  b.id = "sym_1";
  Symbol c = a;
  c.id = "sym_2";
  c.name = "init;board";
  c.addr = 200;

  GroupReportOptions options;
  options.format = output_format::csv;

  std::ostringstream out;
  print_groups(out, build_template_groups({a, b, c}), options);

  EXPECT_EQ(out.str(),
            "group;template;symbols;specializations;size;unique_size;largest;smallest\n"
            "Vec;1;2;1;32;16;16;16\n"
            "\"init;board\";0;1;1;16;16;16;16\n");

  options.specializations = true;
  options.non_templates = false;

  std::ostringstream spec_out;
  print_groups(spec_out, build_template_groups({a, b, c}), options);

  EXPECT_EQ(spec_out.str(),
            "group;template;symbols;specializations;size;unique_size;largest;smallest;"
            "specialization;specialization_symbols;specialization_size;specialization_unique_size\n"
            "Vec;1;2;1;32;16;16;16;int;2;32;16\n");
}

TEST(report, symbols_csv) {
  NmSymbol counter = make_nm_symbol(0x20000000, 4, 'D', "counter");
  counter.source = SourceLocation{"/src/app/main.cpp", 3};

  const SymbolAssignment assignment = assign_symbols_to_sections({counter}, firmware_sections());

  std::ostringstream out;
  print_symbols(out, assignment.symbols, output_format::csv);

  EXPECT_EQ(out.str(),
            "id;address;size;kind;section;name;mangled_name;source;locations\n"
            "sym_0;0x20000000;4;object;sec_3;counter;;/src/app/main.cpp:3;runtime:0x20000000 load:0x8002188\n");
}

TEST(report, sort_groups) {
  Symbol small;
  small.id = "sym_0";
  small.name = "Small<int>";
  small.size = 4;
  Symbol large = small;
  large.id = "sym_1";
  large.name = "Large<int>";
  large.size = 64;
  Symbol medium = small;
  medium.id = "sym_2";
  medium.name = "Medium<int>";
  medium.size = 16;

  const std::vector<TemplateGroupSummary> groups = build_template_groups({small, large, medium});

  auto names = [](const std::vector<TemplateGroupSummary>& sorted) {
    std::vector<std::string> result;
    for(const TemplateGroupSummary& group : sorted)
      result.push_back(group.display_name);
    return result;
  };

  EXPECT_THAT(names(sort_groups(groups, group_order::input)), ::testing::ElementsAre("Small", "Large", "Medium"));
  EXPECT_THAT(names(sort_groups(groups, group_order::size)), ::testing::ElementsAre("Large", "Medium", "Small"));
  EXPECT_THAT(names(sort_groups(groups, group_order::name)), ::testing::ElementsAre("Large", "Medium", "Small"));

  GroupReportOptions options;
  options.format = output_format::csv;
  options.limit = 1;

  std::ostringstream out;
  print_groups(out, sort_groups(groups, group_order::size), options);
  EXPECT_THAT(out.str(), ::testing::EndsWith("\nLarge;1;1;1;64;64;64;64\n"));
}

TEST(logger, context_and_exceptions) {
  LogCapture capture(CTXLogger::severity_level::info);

  {
    LOG_CTX() << "Reading sections of fw.elf";
    LOG(debug) << "not printed";
  }
  EXPECT_THAT(capture.messages, ::testing::IsEmpty());

  {
    LOG_CTX() << "Reading symbols of fw.elf";
    LOG(warning) << "Symbol orphan does not fall within any known section.";
  }
  EXPECT_THAT(capture.messages, ::testing::ElementsAre("Reading symbols of fw.elf",
                                                       "Symbol orphan does not fall within any known section."));

  capture.messages.clear();

  try {
    try {
      throw process_timeout("Command timed out: nm fw.elf", ProcessResult{});
    } catch (...) {
      std::throw_with_nested(std::runtime_error("Unable to read symbols from fw.elf"));
    }
  } catch (const std::exception& ex) {
    LOG_EX(fatal, ex);
  }

  EXPECT_THAT(capture.messages, ::testing::ElementsAre("Error: Unable to read symbols from fw.elf",
                                                       "Error:   Command timed out: nm fw.elf"));
}

TEST(logger, flushed_context) {
  {
    LogCapture capture(CTXLogger::severity_level::info);
    LOG_CTX_FLUSH(info) << "Analysing fw.elf";
    EXPECT_THAT(capture.messages, ::testing::ElementsAre("Analysing fw.elf"));

    LOG(warning) << "no section";
    EXPECT_THAT(capture.messages, ::testing::ElementsAre("Analysing fw.elf", "no section"));
  }

  {
    LogCapture capture(CTXLogger::severity_level::warning);
    {
      LOG_CTX_FLUSH(info) << "Analysing fw.elf";
      EXPECT_THAT(capture.messages, ::testing::IsEmpty());
    }
    LOG(warning) << "no section";
    EXPECT_THAT(capture.messages, ::testing::ElementsAre("no section"));
  }
}

TEST(logger, parse_severity_level) {
  EXPECT_EQ(CTXLogger::parse_severity_level("trace"), CTXLogger::severity_level::trace);
  EXPECT_EQ(CTXLogger::parse_severity_level("warning"), CTXLogger::severity_level::warning);
  EXPECT_THROW(CTXLogger::parse_severity_level("loud"), std::invalid_argument);
}

TEST(analysis, captured_outputs) {
  const fs::path dir = create_temporary_directory();
  const FileSystemGuard g(dir);

  write_file(dir / "readelf.txt", readelf_capture);
  write_file(dir / "objdump.txt", objdump_capture);
  write_file(dir / "nm.txt", nm_capture);

  AnalysisOptions options;
  options.elf = (dir / "firmware.elf").string();
  options.readelf_output = (dir / "readelf.txt").string();
  options.objdump_output = (dir / "objdump.txt").string();
  options.nm_output = (dir / "nm.txt").string();

  const Analysis analysis = analyse_binary(options);

  EXPECT_EQ(analysis.sections.size(), 6u);
  ASSERT_EQ(analysis.symbols.size(), 6u);

  const std::vector<TemplateGroupSummary> groups = build_template_groups(analysis.symbols);
  auto ring = std::find_if(groups.begin(), groups.end(), [](const TemplateGroupSummary& group) { return group.id == "Ring"; });
  ASSERT_NE(ring, groups.end());
  EXPECT_EQ(ring->totals.symbol_count, 2u);
  EXPECT_EQ(ring->totals.size_bytes, 32.0);
  EXPECT_EQ(ring->totals.unique_size_bytes, 32.0);
  ASSERT_EQ(ring->specializations.size(), 2u);
  EXPECT_EQ(ring->specializations[0].key, "8u");
  EXPECT_EQ(ring->specializations[1].key, "16u");
}

TEST(analysis, missing_capture) {
  AnalysisOptions options;
  options.elf = "firmware.elf";
  options.readelf_output = "/nonexistent/readelf.txt";
  options.nm_output = "/nonexistent/nm.txt";

  try {
    analyse_binary(options);
    FAIL() << "exception expected";
  } catch (const std::runtime_error& ex) {
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("Unable to read section headers"));
    EXPECT_THROW(std::rethrow_if_nested(ex), std::runtime_error);
  }
}

TEST(analysis, missing_toolchain) {
  AnalysisOptions options;
  options.elf = "firmware.elf";
  options.toolchain.prefix = "tmplxplore-no-such-toolchain-";

  try {
    analyse_binary(options);
    FAIL() << "exception expected";
  } catch (const std::runtime_error& ex) {
    EXPECT_THROW(std::rethrow_if_nested(ex), executable_not_found);
  }
}

TEST(analysis, host_binary) {
  if (!has_executable("g++") || !has_executable("nm") || !has_executable("readelf") || !has_executable("objdump"))
    GTEST_SKIP() << "Host toolchain not available";

  const fs::path dir = create_temporary_directory();
  const FileSystemGuard g(dir);
  const fs::path source = dir / "main.cxx";
  const fs::path binary = dir / "main";

  write_file(source, R"(
template <typename T>
struct Box {
  T value;
  T get() const { return value + 1; }
};

int main() {
  Box<int> a{1};
  Box<char> b{'c'};
  return a.get() + b.get();
}
)");

  const std::string cmd = "g++ -O0 -o " + binary.string() + " " + source.string();
  ASSERT_EQ(system(cmd.c_str()), 0);

  AnalysisOptions options;
  options.elf = binary.string();
  options.toolchain.prefix.clear();

  const Analysis analysis = analyse_binary(options);
  EXPECT_THAT(analysis.sections, ::testing::Not(::testing::IsEmpty()));

  const std::vector<TemplateGroupSummary> groups = build_template_groups(analysis.symbols);
  auto box = std::find_if(groups.begin(), groups.end(), [](const TemplateGroupSummary& group) { return group.id == "Box"; });
  ASSERT_NE(box, groups.end());
  EXPECT_TRUE(box->is_template);

  std::vector<std::string> keys;
  for(const TemplateGroupSpecializationSummary& specialization : box->specializations)
    keys.push_back(specialization.key.value_or(""));
  EXPECT_THAT(keys, ::testing::UnorderedElementsAre("int", "char"));

  auto main = std::find_if(groups.begin(), groups.end(), [](const TemplateGroupSummary& group) { return group.display_name == "main"; });
  ASSERT_NE(main, groups.end());
  EXPECT_FALSE(main->is_template);
}
