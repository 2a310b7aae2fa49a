#include <gtest/gtest.h>
#include "ks_config.hpp"
#include "ks_diagnostics.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace kestrel;

// ============================================================================
// Runtime configuration
// ============================================================================

TEST(ConfigTests, EmptyObjectKeepsDefaults) {
    RuntimeConfig config;
    std::string err;
    ASSERT_TRUE(parse_runtime_config("{}", config, err)) << err;

    VMConfig vm_defaults;
    GcConfig gc_defaults;
    EXPECT_EQ(config.vm.max_stack_size, vm_defaults.max_stack_size);
    EXPECT_EQ(config.vm.max_call_depth, vm_defaults.max_call_depth);
    EXPECT_EQ(config.gc.initial_threshold, gc_defaults.initial_threshold);
    EXPECT_DOUBLE_EQ(config.gc.growth_factor, gc_defaults.growth_factor);
    EXPECT_FALSE(config.gc.stress);
}

TEST(ConfigTests, ParsesEverySection) {
    const char* text = R"({
        "vm": { "initial_stack_size": 32, "max_stack_size": 4096, "max_call_depth": 100,
                "enable_debug": true, "trace_execution": false },
        "gc": { "initial_threshold": 2048, "growth_factor": 1.5, "max_heap_bytes": 1048576,
                "max_free_list_bytes": 0, "stress": true }
    })";
    RuntimeConfig config;
    std::string err;
    ASSERT_TRUE(parse_runtime_config(text, config, err)) << err;

    EXPECT_EQ(config.vm.initial_stack_size, 32u);
    EXPECT_EQ(config.vm.max_stack_size, 4096u);
    EXPECT_EQ(config.vm.max_call_depth, 100u);
    EXPECT_TRUE(config.vm.enable_debug);
    EXPECT_FALSE(config.vm.trace_execution);
    EXPECT_EQ(config.gc.initial_threshold, 2048u);
    EXPECT_DOUBLE_EQ(config.gc.growth_factor, 1.5);
    EXPECT_EQ(config.gc.max_heap_bytes, 1048576u);
    EXPECT_EQ(config.gc.max_free_list_bytes, 0u);
    EXPECT_TRUE(config.gc.stress);
}

TEST(ConfigTests, IntegerGrowthFactorIsAccepted) {
    RuntimeConfig config;
    std::string err;
    ASSERT_TRUE(parse_runtime_config(R"({"gc": {"growth_factor": 3}})", config, err)) << err;
    EXPECT_DOUBLE_EQ(config.gc.growth_factor, 3.0);
}

TEST(ConfigTests, UnknownKeysAreIgnored) {
    RuntimeConfig config;
    std::string err;
    EXPECT_TRUE(parse_runtime_config(
        R"({"vm": {"max_call_depth": 10, "jit": true}, "logging": {"level": "debug"}})", config, err)) << err;
    EXPECT_EQ(config.vm.max_call_depth, 10u);
}

TEST(ConfigTests, WrongTypeIsRejected) {
    RuntimeConfig config;
    std::string err;
    EXPECT_FALSE(parse_runtime_config(R"({"vm": {"max_call_depth": "deep"}})", config, err));
    EXPECT_EQ(err, "vm.max_call_depth: unexpected string");

    EXPECT_FALSE(parse_runtime_config(R"({"gc": {"stress": 1}})", config, err));
    EXPECT_EQ(err, "gc.stress: unexpected number");

    EXPECT_FALSE(parse_runtime_config(R"({"vm": {"max_stack_size": 1.5}})", config, err));
    EXPECT_EQ(err, "vm.max_stack_size: unexpected number");
}

TEST(ConfigTests, NegativeSizesAreRejected) {
    RuntimeConfig config;
    std::string err;
    EXPECT_FALSE(parse_runtime_config(R"({"gc": {"max_heap_bytes": -1}})", config, err));
    EXPECT_EQ(err, "gc.max_heap_bytes: unexpected number");
}

TEST(ConfigTests, FailedParseLeavesConfigUntouched) {
    RuntimeConfig config;
    config.vm.max_call_depth = 7;
    std::string err;
    EXPECT_FALSE(parse_runtime_config(
        R"({"vm": {"max_call_depth": 99}, "gc": {"growth_factor": 0.5}})", config, err));
    EXPECT_EQ(err, "gc.growth_factor: must be at least 1.0");
    EXPECT_EQ(config.vm.max_call_depth, 7u);
}

TEST(ConfigTests, ZeroLimitsAreRejected) {
    RuntimeConfig config;
    std::string err;
    EXPECT_FALSE(parse_runtime_config(R"({"vm": {"max_call_depth": 0}})", config, err));
    EXPECT_FALSE(err.empty());
}

TEST(ConfigTests, MalformedDocuments) {
    RuntimeConfig config;
    std::string err;
    EXPECT_FALSE(parse_runtime_config("{ not json", config, err));
    EXPECT_EQ(err, "invalid JSON");

    EXPECT_FALSE(parse_runtime_config("[1, 2]", config, err));
    EXPECT_EQ(err, "configuration must be a JSON object");

    EXPECT_FALSE(parse_runtime_config(R"({"gc": 5})", config, err));
    EXPECT_EQ(err, "gc: expected an object");
}

TEST(ConfigTests, LoadsFromFile) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "kestrel_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"vm": {"max_call_depth": 321}})";
    }

    RuntimeConfig config;
    std::string err;
    EXPECT_TRUE(load_runtime_config(path, config, err)) << err;
    EXPECT_EQ(config.vm.max_call_depth, 321u);

    {
        std::ofstream out(path);
        out << R"({"vm": []})";
    }
    EXPECT_FALSE(load_runtime_config(path, config, err));
    EXPECT_EQ(err, path.string() + ": vm: expected an object");

    std::filesystem::remove(path);
}

TEST(ConfigTests, MissingFile) {
    RuntimeConfig config;
    std::string err;
    std::filesystem::path path = std::filesystem::temp_directory_path() / "kestrel_no_such_config.json";
    EXPECT_FALSE(load_runtime_config(path, config, err));
    EXPECT_EQ(err, "cannot open: " + path.string());
}

// ============================================================================
// Diagnostic JSON form
// ============================================================================

TEST(DiagnosticTests, RuntimeDiagnosticToJson) {
    Diagnostic diag;
    diag.kind = ErrorKind::TypeError;
    diag.location = SourceLocation{3, 9};
    diag.message = "operator + expects numbers";
    diag.context = "f";
    diag.frames.push_back(FrameInfo{"f", 12, SourceLocation{3, 9}});
    diag.frames.push_back(FrameInfo{"<script>", 4, SourceLocation{5, 1}});

    nlohmann::json j = diag;
    EXPECT_EQ(j["kind"], "TypeError");
    EXPECT_EQ(j["message"], "operator + expects numbers");
    EXPECT_EQ(j["location"]["line"], 3);
    EXPECT_EQ(j["location"]["column"], 9);
    EXPECT_EQ(j["context"], "f");
    ASSERT_EQ(j["frames"].size(), 2u);
    EXPECT_EQ(j["frames"][1]["function"], "<script>");
    EXPECT_EQ(j["frames"][1]["pc"], 4);
}

TEST(DiagnosticTests, OptionalFieldsAreOmitted) {
    Diagnostic diag;
    diag.kind = ErrorKind::UndefinedName;
    diag.message = "undefined name 'x'";

    nlohmann::json j = diag;
    EXPECT_EQ(j["kind"], "UndefinedName");
    EXPECT_FALSE(j.contains("location"));
    EXPECT_FALSE(j.contains("context"));
    EXPECT_FALSE(j.contains("frames"));
}

TEST(DiagnosticTests, SummaryText) {
    Diagnostic diag{ErrorKind::UseAfterMove, SourceLocation{2, 4}, "use of moved value 'a'", "a", {}};
    EXPECT_EQ(diag.summary(), "UseAfterMove at 2:4: use of moved value 'a'");

    AnalysisError error({diag, diag});
    EXPECT_EQ(error.count(ErrorKind::UseAfterMove), 2u);
    EXPECT_FALSE(error.has(ErrorKind::ConflictingBorrow));
    EXPECT_NE(std::string(error.what()).find("(and 1 more)"), std::string::npos);
}
