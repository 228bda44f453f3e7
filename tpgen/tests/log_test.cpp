//! # Logger Unit Tests
//!
//! LogFilter parsing, FileSink I/O, JSON output, command-line and
//! environment configuration, and the logging macros as used by the
//! generator modules.

#include "log/log.hpp"
#include "model/scoped_event.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace tpgen::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("codegen=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "codegen"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "codegen"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "codegen"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "registry"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "registry"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("registry=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "registry"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "codegen"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    // No "=level" means Trace
    filter.parse("synth");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "synth"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "cli"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("codegen=trace,synth=info,tu=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "codegen"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "synth"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "synth"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "tu"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "tu"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "cli"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("codegen=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);

    LogFilter only_default;
    only_default.set_default_level(LogLevel::Error);
    EXPECT_EQ(only_default.min_level(), LogLevel::Error);
}

TEST(LogLevelHelpersTest, LevelNames) {
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(level_name(LogLevel::Off), "OFF");
}

TEST(LogLevelHelpersTest, ParseLevel) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("garbage"), LogLevel::Info);
}

TEST(TimestampTest, GetTimestampFormat) {
    std::string ts = get_timestamp();
    // HH:MM:SS.mmm
    EXPECT_EQ(ts.size(), 12u);
    EXPECT_EQ(ts[2], ':');
    EXPECT_EQ(ts[5], ':');
    EXPECT_EQ(ts[8], '.');
}

// ============================================================================
// Record Formatting and FileSink
// ============================================================================

namespace {

LogRecord make_record(LogLevel level, std::string_view module, std::string message) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = 12345;
    return record;
}

} // namespace

TEST(FormatTest, TextLine) {
    auto line = format_text(make_record(LogLevel::Info, "codegen", "wrote tu_tracepoints.h"));
    EXPECT_NE(line.find("INFO"), std::string::npos);
    EXPECT_NE(line.find("[codegen] wrote tu_tracepoints.h"), std::string::npos);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(FormatTest, JsonEscapesSpecialCharacters) {
    auto json = format_json(make_record(LogLevel::Error, "cli", "a\"b\\c\nd\te"));
    EXPECT_EQ(json, "{\"ts\":12345,\"level\":\"ERROR\",\"module\":\"cli\","
                    "\"msg\":\"a\\\"b\\\\c\\nd\\te\"}");
}

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() /
                    (std::string("tpgen_log_") +
                     ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".log");
        fs::remove(temp_file);
    }

    void TearDown() override {
        fs::remove(temp_file);
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path);
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return content;
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "registry", "tracepoint #0 start_blit"));
        sink.flush();
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[registry]"), std::string::npos);
    EXPECT_NE(content.find("tracepoint #0 start_blit"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "tu", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Warn, "tu", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonLines) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Error, "codegen", "write failed"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"module\":\"codegen\""), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"write failed\""), std::string::npos);
}

// ============================================================================
// Command Line and Environment
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("TPGEN_LOG");
    }

    void TearDown() override {
        unsetenv("TPGEN_LOG");
    }

    LogConfig parse(std::vector<std::string> args) {
        args.insert(args.begin(), "tpgen");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return parse_log_options(static_cast<int>(args.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, DefaultsToWarn) {
    auto config = parse({"--utrace-src", "a.c"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.log_file.empty());
    EXPECT_EQ(config.format, LogFormat::Text);
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"--verbose"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitLevelWinsOverVerbosity) {
    EXPECT_EQ(parse({"-vvv", "--log-level=error"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, FilterFileAndFormat) {
    auto config = parse({"--log-filter=codegen=trace,*=warn", "--log-file=/tmp/tpgen.log",
                         "--log-format=json"});
    EXPECT_EQ(config.filter_spec, "codegen=trace,*=warn");
    EXPECT_EQ(config.log_file, "/tmp/tpgen.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, EnvironmentFallback) {
    setenv("TPGEN_LOG", "debug", 1);
    EXPECT_EQ(parse({}).level, LogLevel::Debug);

    setenv("TPGEN_LOG", "codegen=trace", 1);
    EXPECT_EQ(parse({}).filter_spec, "codegen=trace");

    // A command-line level takes precedence
    setenv("TPGEN_LOG", "trace", 1);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST(IsLogOptionTest, RecognizesLoggingOptions) {
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("--log-filter=codegen"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--quiet"));

    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("-p"));
    EXPECT_FALSE(is_log_option("--utrace-src"));
    EXPECT_FALSE(is_log_option("--log-level"));
}

// ============================================================================
// Logger and Macros
// ============================================================================

namespace {

class CaptureSink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    explicit CaptureSink(std::vector<Entry>& out) : out_(out) {}

    void write(const LogRecord& record) override {
        out_.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

private:
    std::vector<Entry>& out_;
};

} // namespace

class LoggerCaptureTest : public ::testing::Test {
protected:
    std::vector<CaptureSink::Entry> records;

    void SetUp() override {
        LogConfig config;
        config.console = false;
        config.level = LogLevel::Trace;
        Logger::init(config);
        Logger::instance().add_sink(std::make_unique<CaptureSink>(records));
    }

    void TearDown() override {
        Logger::init(LogConfig{});
    }
};

TEST_F(LoggerCaptureTest, MacroFormatsMessage) {
    TPGEN_LOG_INFO("codegen", "generating " << 24 << " tracepoints");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Info);
    EXPECT_EQ(records[0].module, "codegen");
    EXPECT_EQ(records[0].message, "generating 24 tracepoints");
}

TEST_F(LoggerCaptureTest, LevelThreshold) {
    Logger::instance().set_level(LogLevel::Warn);

    TPGEN_LOG_DEBUG("registry", "hidden");
    TPGEN_LOG_INFO("registry", "hidden");
    TPGEN_LOG_WARN("registry", "shown");
    TPGEN_LOG_ERROR("registry", "shown");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].level, LogLevel::Warn);
    EXPECT_EQ(records[1].level, LogLevel::Error);
}

TEST_F(LoggerCaptureTest, ModuleFilter) {
    Logger::instance().set_filter("synth=debug,*=error");

    TPGEN_LOG_DEBUG("synth", "shown");
    TPGEN_LOG_DEBUG("codegen", "hidden");
    TPGEN_LOG_WARN("codegen", "hidden");
    TPGEN_LOG_ERROR("codegen", "shown");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].module, "synth");
    EXPECT_EQ(records[1].module, "codegen");
}

TEST_F(LoggerCaptureTest, SynthesizerLogsEachPair) {
    tpgen::model::DeclarationRegistry registry;
    tpgen::model::PairSynthesizer synth(registry, "tu");
    tpgen::model::ScopedEvent blit;
    blit.name = "blit";
    ASSERT_TRUE(tpgen::is_ok(synth.declare_scoped_event(std::move(blit))));

    bool found = false;
    for (const auto& entry : records) {
        if (entry.module == "synth" && entry.message.find("start_blit") != std::string::npos &&
            entry.message.find("end_blit") != std::string::npos) {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(LoggerCaptureTest, ClearSinksDropsMessages) {
    Logger::instance().clear_sinks();
    TPGEN_LOG_ERROR("cli", "dropped");
    EXPECT_TRUE(records.empty());
}
