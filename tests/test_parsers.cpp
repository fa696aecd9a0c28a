/**
 * @file test_parsers.cpp
 * @brief perf script / folded input parsing and the file-to-file generator.
 */

#include "../include/proflame.hpp"
#include "test_framework.hpp"
#include "test_profiles.hpp"

using namespace proflame;

namespace {
const char* kFoldedWithHeader =
    "# sample_types: cpu/nanoseconds alloc/bytes\n"
    "# default_sample_type: alloc\n"
    "main;foo 10 100\n"
    "main;bar 5 50\n"
    "\n"
    "main;foo 3 30\n";

const char* kPerfScript =
    "prog  1234 100.000000000:     250000 cpu-clock:u:\n"
    "\t    7f0b8bf5766d foo+0x5d (/usr/bin/prog)\n"
    "\t    7f0b8bf57000 main+0x10 (/usr/bin/prog)\n"
    "\t    7f0b8bf50000 [unknown] (/usr/lib/libc.so.6)\n"
    "\n"
    "prog  1234 102.500000000:     250000 cpu-clock:u:\n"
    "\t    7f0b8bf5766e bar+0x1 (/usr/bin/prog)\n"
    "\t    7f0b8bf57000 main+0x10 (/usr/bin/prog)\n"
    "\t    7f0b8bf50000 [unknown] (/usr/lib/libc.so.6)\n";
} // namespace

TEST(folded_header_declares_types_and_default) {
    Profile profile = FoldedStackParser{}.parse(kFoldedWithHeader);

    TEST_ASSERT_EQ(profile.sample_types.size(), size_t{2}, "two types");
    TEST_ASSERT_EQ(profile.sample_types[0].type, std::string("cpu"), "cpu");
    TEST_ASSERT_EQ(profile.sample_types[0].unit, std::string("nanoseconds"), "cpu unit");
    TEST_ASSERT_EQ(profile.sample_types[1].type, std::string("alloc"), "alloc");
    TEST_ASSERT_EQ(profile.default_sample_type, std::string("alloc"), "declared default");
    TEST_ASSERT_EQ(profile.samples.size(), size_t{3}, "blank lines ignored");

    FlameNodeRoot cpu = FlameGraphBuilder{}.build_tree(profile, 0);
    TEST_ASSERT_EQ(cpu->value, int64_t{18}, "cpu total");
    TEST_ASSERT_EQ(cpu->find_child("main")->find_child("foo")->value, int64_t{13}, "foo merged");
    TEST_ASSERT_EQ(cpu->find_child("main")->find_child("bar")->value, int64_t{5}, "bar");

    FlameNodeRoot alloc = FlameGraphBuilder{}.build_tree(profile, 1);
    TEST_ASSERT_EQ(alloc->value, int64_t{180}, "alloc total");
}

TEST(folded_stacks_are_stored_leaf_first) {
    Profile profile = FoldedStackParser{}.parse("entry;mid;leaf 1\n");
    std::vector<std::string_view> stack = resolve_stack(profile.samples[0]);
    TEST_ASSERT_EQ(stack.size(), size_t{3}, "three frames");
    TEST_ASSERT(stack[0] == "leaf" && stack[2] == "entry", "leaf first");
    TEST_ASSERT_EQ(profile.locations().size(), size_t{3}, "one location per frame");
}

TEST(folded_without_header_counts_samples) {
    Profile profile = FoldedStackParser{}.parse("a;b 4\na;c 6\n# a comment\na;b 1\n");
    TEST_ASSERT_EQ(profile.sample_types.size(), size_t{1}, "single series");
    TEST_ASSERT_EQ(profile.sample_types[0].type, std::string("samples"), "samples");
    TEST_ASSERT_EQ(profile.sample_types[0].unit, std::string("count"), "count");
    TEST_ASSERT_EQ(profile.functions().size(), size_t{3}, "functions interned by name");

    FlameNodeRoot root = FlameGraphBuilder{}.build_tree(profile, 0);
    TEST_ASSERT_EQ(root->find_child("a")->find_child("b")->value, int64_t{5}, "b merged");
}

TEST(folded_frames_may_contain_spaces) {
    Profile profile = FoldedStackParser{}.parse("main;std::vector<int, std::allocator<int> >::push_back 7\n");
    FlameNodeRoot root = FlameGraphBuilder{}.build_tree(profile, 0);
    const FlameNode* push_back =
        root->find_child("main")->find_child("std::vector<int, std::allocator<int> >::push_back");
    TEST_ASSERT(push_back != nullptr, "name kept whole");
    TEST_ASSERT_EQ(push_back->value, int64_t{7}, "value");
}

TEST(folded_errors_name_the_line) {
    const char* too_few = "# sample_types: cpu alloc\nmain;foo 1 2\nmain;bar 3\n";
    bool threw = false;
    try {
        FoldedStackParser{}.parse(too_few);
    } catch (const ParseException& e) {
        threw = true;
        TEST_ASSERT(std::string(e.what()).find("line 3") != std::string::npos, e.what());
    }
    TEST_ASSERT(threw, "value count mismatch");

    TEST_ASSERT_THROWS(FoldedStackParser{}.parse("main;foo abc\n"), ParseException, "non-numeric value");
    TEST_ASSERT_THROWS(FoldedStackParser{}.parse("# only comments\n\n"), ParseException, "no samples");
    TEST_ASSERT_THROWS(FoldedStackParser{}.parse("a 1\n# sample_types: cpu\n"), ParseException, "late header");
}

TEST(perf_script_samples_and_series) {
    Profile profile = PerfScriptParser{}.parse(kPerfScript);

    TEST_ASSERT_EQ(profile.sample_types.size(), size_t{2}, "samples + period");
    TEST_ASSERT_EQ(profile.sample_types[0].type, std::string("samples"), "samples series");
    TEST_ASSERT_EQ(profile.sample_types[1].type, std::string("cpu-clock"), "event series");
    TEST_ASSERT_EQ(profile.sample_types[1].unit, std::string("nanoseconds"), "clock events are time");
    TEST_ASSERT_EQ(profile.samples.size(), size_t{2}, "two samples");
    TEST_ASSERT_EQ(profile.time_nanos, int64_t{100} * 1000000000, "first timestamp");
    TEST_ASSERT_EQ(profile.duration_nanos, int64_t{2500000000}, "span");
    TEST_ASSERT_EQ(ProfileLegend::file_name(profile), std::string("prog"), "first mapping");

    FlameNodeRoot root = FlameGraphBuilder{}.build_tree(profile, 1);
    TEST_ASSERT_EQ(root->value, int64_t{500000}, "period total");
    const FlameNode* libc = root->find_child("[libc.so.6]");
    TEST_ASSERT(libc != nullptr, "unknown symbol replaced by its dso");
    const FlameNode* main_node = libc->find_child("main");
    TEST_ASSERT(main_node != nullptr, "main under libc");
    TEST_ASSERT_EQ(main_node->find_child("foo")->value, int64_t{250000}, "foo");
    TEST_ASSERT_EQ(main_node->find_child("bar")->value, int64_t{250000}, "bar");

    FlameNodeRoot counts = FlameGraphBuilder{}.build_tree(profile, 0);
    TEST_ASSERT_EQ(counts->value, int64_t{2}, "one per sample");
}

TEST(perf_script_without_period_uses_event_name) {
    const char* input =
        "prog 77 [001] 5.000000: cycles:\n"
        "\tffffffff81000000 [unknown] ([kernel.kallsyms])\n"
        "\t400500 main+0x4 (/opt/app)\n";
    Profile profile = PerfScriptParser{}.parse(input);

    TEST_ASSERT_EQ(profile.sample_types[1].type, std::string("cycles"), "event");
    TEST_ASSERT_EQ(profile.sample_types[1].unit, std::string("count"), "non-clock event");
    TEST_ASSERT_EQ(profile.samples[0].values[1], int64_t{1}, "default period");

    FlameNodeRoot root = FlameGraphBuilder{}.build_tree(profile, 0);
    TEST_ASSERT(root->find_child("main") != nullptr, "main is the entry");
    TEST_ASSERT(root->find_child("main")->find_child("[kernel.kallsyms]") != nullptr, "bracketed dso kept as is");
}

TEST(perf_script_reports_skipped_frames) {
    const char* input =
        "prog 1234 10.000000000: 100 cpu-clock:\n"
        "\t400600 foo+0x8 (/opt/app)\n"
        "\t7f00 [unknown]\n"
        "\t400500 main+0x4 (/opt/app)\n";
    Profile profile = PerfScriptParser{}.parse(input);

    TEST_ASSERT_EQ(profile.warnings.size(), size_t{1}, "one warning");
    TEST_ASSERT(profile.warnings[0].find("skipped 1 ") != std::string::npos, profile.warnings[0].c_str());

    FlameNodeRoot root = FlameGraphBuilder{}.build_tree(profile, 1);
    TEST_ASSERT_EQ(root->find_child("main")->find_child("foo")->value, int64_t{100}, "good frames kept");

    FlamePage page = FlameGraphView(profile).prepare({});
    TEST_ASSERT_EQ(page.errors.size(), size_t{1}, "warning shown on the page");
    TEST_ASSERT_EQ(page.errors[0], profile.warnings[0], "same message");

    TEST_ASSERT(PerfScriptParser{}.parse(kPerfScript).warnings.empty(), "clean input has no warnings");
}

TEST(auto_detect_dispatches_by_content) {
    AutoDetectParser perf;
    perf.parse(kPerfScript);
    TEST_ASSERT_EQ(perf.get_using_parser(), std::string("AutoDetect(PerfScriptParser)"), "perf");

    AutoDetectParser folded;
    folded.parse(kFoldedWithHeader);
    TEST_ASSERT_EQ(folded.get_using_parser(), std::string("AutoDetect(FoldedStackParser)"), "folded");

    TEST_ASSERT_THROWS(AutoDetectParser{}.parse(""), ParseException, "empty input");
}

TEST(auto_detect_keeps_folded_names_that_look_like_events) {
    AutoDetectParser parser;
    Profile profile = parser.parse("main;std::chrono::steady_clock::now 5\n"
                                   "main;perf::cycles::read 2\n"
                                   "main;work 7\n");
    TEST_ASSERT_EQ(parser.get_using_parser(), std::string("AutoDetect(FoldedStackParser)"), "folded");
    TEST_ASSERT_EQ(profile.samples.size(), size_t{3}, "every line is a sample");

    FlameNodeRoot root = FlameGraphBuilder{}.build_tree(profile, 0);
    TEST_ASSERT_EQ(root->value, int64_t{14}, "total");
    TEST_ASSERT_EQ(root->find_child("main")->find_child("std::chrono::steady_clock::now")->value, int64_t{5},
                   "clock frame kept whole");
}

TEST(auto_detect_finds_perf_by_frame_lines) {
    AutoDetectParser parser;
    parser.parse("prog 1234 cycles:\n"
                 "\t400500 main+0x4 (/opt/app)\n");
    TEST_ASSERT_EQ(parser.get_using_parser(), std::string("AutoDetect(PerfScriptParser)"), "address and dso");
}

TEST(generator_writes_json_and_html) {
    auto dir = proflame_test::scratch_dir("generator");
    proflame_test::write_file(dir / "input.folded", kFoldedWithHeader);

    FlameGraphGenerator generator;
    RenderRequest request;
    request.sample_type = "cpu";
    auto diagnostics = generator.generate((dir / "input.folded").string(), (dir / "out.json").string(), request);
    TEST_ASSERT(diagnostics.empty(), "cpu resolves");

    const std::string expected = R"({"name":"root","value":18,"children":[)"
                                 R"({"name":"main","value":18,"children":[)"
                                 R"({"name":"bar","value":5,"children":[]},)"
                                 R"({"name":"foo","value":13,"children":[]}]}]})"
                                 "\n";
    TEST_ASSERT_EQ(proflame_test::read_file(dir / "out.json"), expected, "json file");

    generator.generate((dir / "input.folded").string(), (dir / "out.html").string());
    std::string html = proflame_test::read_file(dir / "out.html");
    TEST_ASSERT(html.find(R"(var data = {"name":"root","value":180,)") != std::string::npos, "declared default used");
    TEST_ASSERT(html.find("<title>unknown</title>") != std::string::npos, "folded input has no mapping");

    std::filesystem::remove_all(dir);
}

TEST(generator_reports_and_wraps_failures) {
    auto dir = proflame_test::scratch_dir("generator_errors");
    proflame_test::write_file(dir / "input.folded", "main;foo 1\n");

    FlameGraphGenerator generator;
    RenderRequest request;
    request.sample_type = "wall";
    auto diagnostics = generator.generate((dir / "input.folded").string(), (dir / "out.json").string(), request);
    TEST_ASSERT_EQ(diagnostics.size(), size_t{1}, "unknown type reported, not raised");

    TEST_ASSERT_THROWS(generator.generate((dir / "missing.folded").string(), (dir / "x.html").string()),
                       ProflameException, "missing input");
    TEST_ASSERT_THROWS(generator.generate((dir / "input.folded").string(), (dir / "noext").string()),
                       ProflameException, "output suffix required");

    proflame_test::write_file(dir / "bad.folded", "main;foo x\n");
    TEST_ASSERT_THROWS(generator.generate((dir / "bad.folded").string(), (dir / "x.json").string()), ParseException,
                       "parse errors keep their type");

    std::filesystem::remove_all(dir);
}

int main(int argc, char** argv) {
    return run_tests(argc, argv);
}
