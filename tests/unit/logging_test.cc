#include <gtest/gtest.h>
#include "core/logging.hh"
#include "game/session.hh"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>

namespace eureka {
namespace {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger& logger = Logger::instance();
        logger.clear_sinks();
        logger.clear_component_levels();
        logger.set_level(LogLevel::INFO);
        sink_ = std::make_shared<MemorySink>();
        logger.add_sink(sink_);
    }

    void TearDown() override {
        Logger& logger = Logger::instance();
        logger.clear_sinks();
        logger.clear_component_levels();
        logger.set_level(LogLevel::INFO);
    }

    std::shared_ptr<MemorySink> sink_;
};

TEST_F(LoggingTest, LogLevelNames) {
    EXPECT_EQ(log_level_name(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(log_level_name(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(log_level_name(LogLevel::INFO), "INFO");
    EXPECT_EQ(log_level_name(LogLevel::WARN), "WARN");
    EXPECT_EQ(log_level_name(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(log_level_name(LogLevel::OFF), "OFF");
}

TEST_F(LoggingTest, LoggerSingleton) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger& logger = Logger::instance();
    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG));
    EXPECT_TRUE(logger.is_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger.is_enabled(LogLevel::ERROR));
    EXPECT_FALSE(logger.is_enabled(LogLevel::OFF));

    log::core.debug("hidden");
    log::core.info("shown");
    EXPECT_FALSE(sink_->contains("hidden"));
    EXPECT_TRUE(sink_->contains("shown"));
}

TEST_F(LoggingTest, ComponentLevelOverridesDefault) {
    Logger& logger = Logger::instance();
    logger.set_component_level("runtime.host", LogLevel::TRACE);

    EXPECT_TRUE(logger.is_enabled(LogLevel::TRACE, "runtime.host"));
    EXPECT_FALSE(logger.is_enabled(LogLevel::TRACE, "runtime"));
    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG, "game"));
}

TEST_F(LoggingTest, ChildComponentInheritsParentLevel) {
    Logger& logger = Logger::instance();
    logger.set_component_level("game", LogLevel::ERROR);

    EXPECT_FALSE(logger.is_enabled(LogLevel::WARN, "game.registry"));
    EXPECT_TRUE(logger.is_enabled(LogLevel::ERROR, "game.ledger"));
    EXPECT_TRUE(logger.is_enabled(LogLevel::WARN, "runtime"));

    logger.set_component_level("game.registry", LogLevel::DEBUG);
    EXPECT_TRUE(logger.is_enabled(LogLevel::DEBUG, "game.registry"));
}

TEST_F(LoggingTest, StreamMacroRecordsComponent) {
    EUREKA_LOG_INFO(log::game) << "accepted " << 3 << " results";
    EUREKA_LOG_DEBUG(log::game) << "not recorded";

    auto entries = sink_->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].component, "game");
    EXPECT_EQ(entries[0].message, "accepted 3 results");
    EXPECT_EQ(entries[0].level, LogLevel::INFO);
    EXPECT_GT(entries[0].line, 0u);
}

TEST_F(LoggingTest, MemorySinkCapacity) {
    auto small = std::make_shared<MemorySink>(2);
    Logger::instance().add_sink(small);

    log::core.info("one");
    log::core.info("two");
    log::core.info("three");

    auto entries = small->entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "two");
    EXPECT_EQ(entries[1].message, "three");

    Logger::instance().remove_sink(small);
    log::core.info("four");
    EXPECT_FALSE(small->contains("four"));
    EXPECT_TRUE(sink_->contains("four"));
}

TEST_F(LoggingTest, CountByLevelAndComponent) {
    log::game.warn("a");
    log::host.warn("b");
    log::host.error("c");

    EXPECT_EQ(sink_->count(LogLevel::WARN), 2u);
    EXPECT_EQ(sink_->count(LogLevel::WARN, "runtime.host"), 1u);
    EXPECT_EQ(sink_->count(LogLevel::ERROR, "game"), 0u);

    sink_->clear();
    EXPECT_TRUE(sink_->entries().empty());
}

TEST_F(LoggingTest, FileSinkRotates) {
    namespace fs = std::filesystem;
    auto path = (fs::temp_directory_path() / "eureka_file_sink_test.log").string();
    for (const auto& suffix : {"", ".1", ".2", ".3"}) {
        fs::remove(path + suffix);
    }

    {
        FileSink sink(path);
        ASSERT_TRUE(sink.is_open());
        sink.set_max_file_size(1);
        sink.set_max_files(2);

        for (const auto* message : {"first", "second", "third", "fourth"}) {
            LogEntry entry{};
            entry.level = LogLevel::INFO;
            entry.timestamp = std::chrono::system_clock::now();
            entry.thread_id = std::this_thread::get_id();
            entry.component = "game";
            entry.message = message;
            sink.write(entry);
        }
        sink.flush();
    }

    auto read_file = [](const std::string& file) {
        std::ifstream in(file);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    };
    EXPECT_NE(read_file(path).find("fourth"), std::string::npos);
    EXPECT_NE(read_file(path + ".1").find("third"), std::string::npos);
    EXPECT_NE(read_file(path + ".2").find("second"), std::string::npos);
    EXPECT_FALSE(fs::exists(path + ".3"));

    for (const auto& suffix : {"", ".1", ".2"}) {
        fs::remove(path + suffix);
    }
}

TEST_F(LoggingTest, FileSinkOnMissingDirectory) {
    FileSink sink("/nonexistent-eureka-dir/eureka.log");
    EXPECT_FALSE(sink.is_open());
}

TEST_F(LoggingTest, FormattedEntry) {
    LogEntry entry{};
    entry.level = LogLevel::WARN;
    entry.timestamp = std::chrono::system_clock::now();
    entry.thread_id = std::this_thread::get_id();
    entry.component = "game.ledger";
    entry.message = "duplicate key";

    auto line = format_log_entry(entry, false);
    EXPECT_NE(line.find("WARN]"), std::string::npos);
    EXPECT_NE(line.find("[game.ledger]"), std::string::npos);
    EXPECT_NE(line.find("duplicate key"), std::string::npos);
}

TEST_F(LoggingTest, RejectedSubmissionIsReported) {
    AccountData data;
    auto session = GameSession::init_state(InitAccount{{{"p1", 0}}, data.serialize()});
    ASSERT_TRUE(session.has_value());

    EXPECT_EQ(session->submit("ghost", {1}), ErrorCode::UNKNOWN_PARTICIPANT);
    EXPECT_EQ(sink_->count(LogLevel::WARN, "game"), 1u);
    EXPECT_TRUE(sink_->contains("ghost"));
}

TEST_F(LoggingTest, InitLoggingAppliesComponentLevels) {
    LogConfig config;
    config.console_enabled = false;
    config.default_level = LogLevel::WARN;
    config.component_levels["runtime"] = LogLevel::DEBUG;
    init_logging(config);

    Logger& logger = Logger::instance();
    EXPECT_EQ(logger.level(), LogLevel::WARN);
    EXPECT_TRUE(logger.is_enabled(LogLevel::DEBUG, "runtime.evaluator"));
    EXPECT_FALSE(logger.is_enabled(LogLevel::INFO, "game"));
    shutdown_logging();
}

}  // namespace
}  // namespace eureka
