// Tests for the persistent job registry.

#include "accrete/codec.hpp"
#include "accrete/registry.hpp"
#include "test_dir.hpp"

#include <gtest/gtest.h>

using namespace accrete;
namespace fs = std::filesystem;

namespace {

JobRecord job(std::string input, std::string output, std::string command) {
    JobRecord r;
    r.inputs = std::vector<std::string>{std::move(input)};
    r.outputs = std::vector<std::string>{std::move(output)};
    r.command = std::move(command);
    return r;
}

} // namespace

class RegistryTest : public TempDirTest {
protected:
    fs::path cache() const {
        return dir / "cache.json";
    }
};

// ============================================================================
// Load / append
// ============================================================================

TEST_F(RegistryTest, MissingDocumentLoadsEmpty) {
    JobRegistry registry(cache());
    auto jobs = registry.load();
    ASSERT_TRUE(jobs);
    EXPECT_TRUE(jobs->empty());
    EXPECT_FALSE(fs::exists(cache()));
}

TEST_F(RegistryTest, FirstAppendCreatesDocument) {
    JobRegistry registry(cache());
    ASSERT_TRUE(registry.append(job("a.c", "a.o", "gcc -c a.c -o a.o")));

    auto doc = json::parse(slurp(cache()));
    EXPECT_EQ(doc, json::parse(R"({"jobs":[{"inputs":["a.c"],"outputs":["a.o"],"command":"gcc -c a.c -o a.o"}]})"));
}

TEST_F(RegistryTest, DocumentIsIndentedWithStableKeyOrder) {
    JobRegistry registry(cache());
    ASSERT_TRUE(registry.append(job("a.c", "a.o", "cc")));
    EXPECT_EQ(slurp(cache()),
              "{\n"
              "  \"jobs\": [\n"
              "    {\n"
              "      \"inputs\": [\n"
              "        \"a.c\"\n"
              "      ],\n"
              "      \"outputs\": [\n"
              "        \"a.o\"\n"
              "      ],\n"
              "      \"command\": \"cc\"\n"
              "    }\n"
              "  ]\n"
              "}\n");
}

TEST_F(RegistryTest, AppendsPreserveCallOrder) {
    JobRegistry registry(cache());
    ASSERT_TRUE(registry.append(job("1", "2", "first")));
    ASSERT_TRUE(registry.append(job("2", "3", "second")));
    ASSERT_TRUE(registry.append(job("3", "4", "third")));

    auto jobs = registry.load();
    ASSERT_TRUE(jobs);
    ASSERT_EQ(jobs->size(), 3u);
    EXPECT_EQ(*(*jobs)[0].command, "first");
    EXPECT_EQ(*(*jobs)[1].command, "second");
    EXPECT_EQ(*(*jobs)[2].command, "third");
}

TEST_F(RegistryTest, MetadataSurvivesRoundTrip) {
    JobRecord full = job("in", "out", "run");
    full.description = "desc";
    full.pipeline_name = "nightly";
    full.ci_stage = CiStage::Report;
    full.timeout = 120;
    full.timeout_ok = true;
    full.ok_returns = std::vector<int>{0, -1, 3};

    JobRegistry registry(cache());
    ASSERT_TRUE(registry.append(full));
    auto jobs = registry.load();
    ASSERT_TRUE(jobs);
    ASSERT_EQ(jobs->size(), 1u);
    EXPECT_EQ(jobs->front(), full);
}

TEST_F(RegistryTest, CreatesParentDirectories) {
    JobRegistry registry(dir / "nested" / "deeper" / "cache.json");
    ASSERT_TRUE(registry.append(job("a", "b", "c")));
    EXPECT_TRUE(fs::exists(dir / "nested" / "deeper" / "cache.json"));
}

TEST_F(RegistryTest, NoTemporaryFilesAreLeftBehind) {
    JobRegistry registry(cache());
    ASSERT_TRUE(registry.append(job("a", "b", "c")));
    ASSERT_TRUE(registry.append(job("b", "d", "e")));
    size_t count = 0;
    for (const auto &entry : fs::directory_iterator(dir)) {
        EXPECT_EQ(entry.path().filename().string(), "cache.json");
        ++count;
    }
    EXPECT_EQ(count, 1u);
}

TEST_F(RegistryTest, IncompleteRecordsLoadForTheCompilerToReport) {
    write(cache(), R"({"jobs":[{"inputs":["a"],"command":"x"}]})");
    auto jobs = JobRegistry(cache()).load();
    ASSERT_TRUE(jobs);
    ASSERT_EQ(jobs->size(), 1u);
    EXPECT_FALSE(jobs->front().outputs.has_value());
}

TEST_F(RegistryTest, UnknownKeysAreIgnored) {
    write(cache(), R"({"jobs":[{"inputs":["a"],"outputs":["b"],"command":"x","extra":1}],"other":true})");
    auto jobs = JobRegistry(cache()).load();
    ASSERT_TRUE(jobs);
    EXPECT_EQ(jobs->size(), 1u);
}

// ============================================================================
// Corruption
// ============================================================================

TEST_F(RegistryTest, InvalidJsonIsMalformed) {
    write(cache(), "{\"jobs\": [");
    auto jobs = JobRegistry(cache()).load();
    ASSERT_FALSE(jobs);
    EXPECT_EQ(jobs.error().kind, ErrorKind::MalformedCache);
    EXPECT_NE(jobs.error().message.find(cache().string()), std::string::npos);
}

TEST_F(RegistryTest, WrongShapesAreMalformed) {
    for (const char *doc : {
             "[]",
             "{}",
             R"({"jobs": 5})",
             R"({"jobs": [3]})",
             R"({"jobs": [{"inputs": "a.c"}]})",
             R"({"jobs": [{"inputs": [1]}]})",
             R"({"jobs": [{"command": ["x"]}]})",
             R"({"jobs": [{"ci_stage": "deploy"}]})",
             R"({"jobs": [{"timeout": -1}]})",
             R"({"jobs": [{"timeout_ok": "yes"}]})",
             R"({"jobs": [{"ok_returns": ["0"]}]})",
             R"({"jobs": [{"ok_returns": [4294967296]}]})",
             R"({"jobs": [{"ok_returns": [-2147483649]}]})",
         }) {
        write(cache(), doc);
        auto jobs = JobRegistry(cache()).load();
        ASSERT_FALSE(jobs) << doc;
        EXPECT_EQ(jobs.error().kind, ErrorKind::MalformedCache) << doc;
    }
}

TEST_F(RegistryTest, AppendToMalformedDocumentLeavesItUntouched) {
    write(cache(), "garbage");
    auto res = JobRegistry(cache()).append(job("a", "b", "c"));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::MalformedCache);
    EXPECT_EQ(slurp(cache()), "garbage");
}

// ============================================================================
// Concurrent writers
// ============================================================================

TEST_F(RegistryTest, StaleSnapshotIsRejected) {
    JobRegistry registry(cache());
    ASSERT_TRUE(registry.append(job("a", "b", "first")));

    auto snapshot = registry.load_snapshot();
    ASSERT_TRUE(snapshot);

    // Another invocation gets in between.
    ASSERT_TRUE(JobRegistry(cache()).append(job("b", "c", "second")));

    snapshot->jobs.push_back(job("c", "d", "third"));
    auto res = registry.store(*snapshot);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::ConcurrentModification);

    auto jobs = registry.load();
    ASSERT_TRUE(jobs);
    ASSERT_EQ(jobs->size(), 2u);
    EXPECT_EQ(*(*jobs)[1].command, "second");
}

TEST_F(RegistryTest, DocumentCreatedAfterSnapshotIsDetected) {
    JobRegistry registry(cache());
    auto snapshot = registry.load_snapshot();
    ASSERT_TRUE(snapshot);
    EXPECT_FALSE(snapshot->stamp.exists);

    ASSERT_TRUE(JobRegistry(cache()).append(job("a", "b", "other")));
    EXPECT_EQ(registry.store(*snapshot).error().kind, ErrorKind::ConcurrentModification);
}

TEST_F(RegistryTest, NonUtf8CommandIsAnErrorNotACrash) {
    JobRegistry registry(cache());
    ASSERT_TRUE(registry.append(job("a", "b", "first")));
    std::string before = slurp(cache());

    auto res = registry.append(job("c", "d", "echo caf\xe9"));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::InvalidEncoding);
    EXPECT_EQ(slurp(cache()), before);
}

TEST_F(RegistryTest, ReturnCodesAtIntLimitsLoad) {
    write(cache(), R"({"jobs":[{"ok_returns":[2147483647,-2147483648]}]})");
    auto jobs = JobRegistry(cache()).load();
    ASSERT_TRUE(jobs);
    EXPECT_EQ(jobs->front().ok_returns, (std::vector<int>{2147483647, -2147483648}));
}

TEST(RegistryCodecTest, DescribeReplacesInvalidBytes) {
    JobRecord r;
    r.command = "caf\xe9";
    EXPECT_EQ(describe_record(r), "{\"command\":\"caf\xef\xbf\xbd\"}");
}

TEST(RegistryCodecTest, AbsentOptionalsAreOmitted) {
    JobRecord r;
    r.command = "x";
    EXPECT_EQ(record_to_json(r).dump(), R"({"command":"x"})");
}
