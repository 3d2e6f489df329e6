#include "logging.hh"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace eureka {

// ============================================================================
// Formatting
// ============================================================================

namespace {

void write_timestamp(std::ostringstream& oss, std::chrono::system_clock::time_point ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ');
}

}  // namespace

std::string format_log_entry(const LogEntry& entry, bool with_thread_id) {
    std::ostringstream oss;
    write_timestamp(oss, entry.timestamp);

    if (with_thread_id) {
        oss << " [" << entry.thread_id << "]";
    }

    oss << " [" << std::setw(5) << log_level_name(entry.level) << "]";

    if (!entry.component.empty()) {
        oss << " [" << entry.component << "]";
    }

    oss << " " << entry.message;
    return oss.str();
}

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : use_colors_(use_colors) {}

void ConsoleSink::write(const LogEntry& entry) {
    std::string line = format_log_entry(entry, show_thread_id_);

    if (use_colors_) {
        // Color the level tag only
        auto tag = "[" + std::string(5 - log_level_name(entry.level).size(), ' ') +
                   std::string(log_level_name(entry.level)) + "]";
        auto pos = line.find(tag);
        if (pos != std::string::npos) {
            line.insert(pos + tag.size(), "\033[0m");
            line.insert(pos, log_level_color(entry.level));
        }
    }

    if (show_source_location_ && !entry.file.empty()) {
        line += " (" + entry.file + ":" + std::to_string(entry.line) + ")";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << line << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

// ============================================================================
// FileSink Implementation
// ============================================================================

FileSink::FileSink(const std::string& filename)
    : filename_(filename) {
    file_ = std::fopen(filename.c_str(), "a");
    if (file_) {
        std::fseek(file_, 0, SEEK_END);
        current_size_ = static_cast<std::size_t>(std::ftell(file_));
    }
}

FileSink::~FileSink() {
    if (file_) {
        std::fclose(file_);
    }
}

void FileSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!file_) {
        return;
    }

    if (current_size_ >= max_file_size_) {
        rotate();
        if (!file_) {
            return;
        }
    }

    std::string line = format_log_entry(entry, true);
    if (!entry.file.empty()) {
        line += " (" + entry.file + ":" + std::to_string(entry.line) + " " + entry.function + ")";
    }
    line += "\n";

    std::fwrite(line.c_str(), 1, line.size(), file_);
    current_size_ += line.size();
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        std::fflush(file_);
    }
}

void FileSink::rotate() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }

    namespace fs = std::filesystem;
    std::error_code ec;

    // Shift eureka.log.N-1 -> eureka.log.N, dropping the oldest
    fs::remove(filename_ + "." + std::to_string(max_files_), ec);
    for (std::size_t i = max_files_; i > 1; --i) {
        std::string src = filename_ + "." + std::to_string(i - 1);
        std::string dst = filename_ + "." + std::to_string(i);
        if (fs::exists(src, ec)) {
            fs::rename(src, dst, ec);
        }
    }
    if (fs::exists(filename_, ec)) {
        fs::rename(filename_, filename_ + ".1", ec);
    }

    file_ = std::fopen(filename_.c_str(), "w");
    current_size_ = 0;
}

// ============================================================================
// MemorySink Implementation
// ============================================================================

MemorySink::MemorySink(std::size_t capacity)
    : capacity_(capacity) {}

void MemorySink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ == 0) {
        return;
    }
    if (entries_.size() >= capacity_) {
        entries_.erase(entries_.begin());
    }
    entries_.push_back(entry);
}

std::vector<LogEntry> MemorySink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::size_t MemorySink::count(LogLevel level, std::string_view component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        entries_.begin(), entries_.end(), [&](const LogEntry& e) {
            return e.level == level && (component.empty() || e.component == component);
        }));
}

bool MemorySink::contains(std::string_view needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(), [&](const LogEntry& e) {
        return e.message.find(needle) != std::string::npos;
    });
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    // Default: console sink
    add_sink(std::make_shared<ConsoleSink>(true));
}

Logger::~Logger() {
    flush();
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

void Logger::set_component_level(const std::string& component, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    component_levels_[component] = level;
}

void Logger::clear_component_levels() {
    std::lock_guard<std::mutex> lock(mutex_);
    component_levels_.clear();
}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::remove_sink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

bool Logger::is_enabled(LogLevel level, const std::string& component) const {
    if (level == LogLevel::OFF) {
        return false;
    }

    // Check component-specific level first
    if (!component.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = component_levels_.find(component);
        if (it != component_levels_.end()) {
            return level >= it->second;
        }

        // Fall back to parent components ("game" for "game.ledger")
        std::string parent = component;
        for (auto pos = parent.rfind('.'); pos != std::string::npos; pos = parent.rfind('.')) {
            parent.resize(pos);
            it = component_levels_.find(parent);
            if (it != component_levels_.end()) {
                return level >= it->second;
            }
        }
    }

    return level >= level_.load();
}

void Logger::log(LogLevel level,
                 std::string_view component,
                 std::string_view message,
                 const std::source_location& loc) {

    if (!is_enabled(level, std::string(component))) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.timestamp = std::chrono::system_clock::now();
    entry.thread_id = std::this_thread::get_id();
    entry.component = std::string(component);
    entry.message = std::string(message);
    entry.file = loc.file_name();
    entry.line = loc.line();
    entry.function = loc.function_name();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(entry);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

// ============================================================================
// LogStream Implementation
// ============================================================================

LogStream::LogStream(LogLevel level,
                     std::string_view component,
                     const std::source_location& loc)
    : level_(level)
    , component_(component)
    , loc_(loc)
    , enabled_(Logger::instance().is_enabled(level, std::string(component))) {}

LogStream::~LogStream() {
    if (enabled_ && !stream_.str().empty()) {
        Logger::instance().log(level_, component_, stream_.str(), loc_);
    }
}

// ============================================================================
// ComponentLogger Implementation
// ============================================================================

ComponentLogger::ComponentLogger(std::string component)
    : component_(std::move(component)) {}

bool ComponentLogger::is_trace_enabled() const {
    return Logger::instance().is_enabled(LogLevel::TRACE, component_);
}

bool ComponentLogger::is_debug_enabled() const {
    return Logger::instance().is_enabled(LogLevel::DEBUG, component_);
}

bool ComponentLogger::is_info_enabled() const {
    return Logger::instance().is_enabled(LogLevel::INFO, component_);
}

LogStream ComponentLogger::trace(const std::source_location& loc) const {
    return LogStream(LogLevel::TRACE, component_, loc);
}

LogStream ComponentLogger::debug(const std::source_location& loc) const {
    return LogStream(LogLevel::DEBUG, component_, loc);
}

LogStream ComponentLogger::info(const std::source_location& loc) const {
    return LogStream(LogLevel::INFO, component_, loc);
}

LogStream ComponentLogger::warn(const std::source_location& loc) const {
    return LogStream(LogLevel::WARN, component_, loc);
}

LogStream ComponentLogger::error(const std::source_location& loc) const {
    return LogStream(LogLevel::ERROR, component_, loc);
}

void ComponentLogger::debug(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::DEBUG, component_, msg, loc);
}

void ComponentLogger::info(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::INFO, component_, msg, loc);
}

void ComponentLogger::warn(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::WARN, component_, msg, loc);
}

void ComponentLogger::error(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::ERROR, component_, msg, loc);
}

// ============================================================================
// Initialization
// ============================================================================

void init_logging(const LogConfig& config) {
    Logger& logger = Logger::instance();
    logger.clear_sinks();
    logger.clear_component_levels();
    logger.set_level(config.default_level);

    for (const auto& [component, level] : config.component_levels) {
        logger.set_component_level(component, level);
    }

    if (config.console_enabled) {
        auto console = std::make_shared<ConsoleSink>(config.console_colors);
        console->set_show_thread_id(config.console_thread_id);
        console->set_show_source_location(config.console_source_location);
        logger.add_sink(console);
    }

    if (config.file_enabled) {
        auto file = std::make_shared<FileSink>(config.file_path);
        if (!file->is_open()) {
            log::core.warn("Failed to open log file " + config.file_path);
        } else {
            file->set_max_file_size(config.file_max_size);
            file->set_max_files(config.file_max_count);
            logger.add_sink(file);
        }
    }

    log::core.debug("Logging initialized");
}

void shutdown_logging() {
    log::core.debug("Logging shutting down");
    Logger::instance().flush();
}

}  // namespace eureka
