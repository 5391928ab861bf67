#include "logging.hh"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <ctime>
#include <filesystem>

namespace shardkeep {

// ============================================================================
// Formatting
// ============================================================================

std::string format_log_entry(const LogEntry& entry, const FormatOptions& options) {
    std::ostringstream oss;

    auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    oss << std::setfill(' ');

    if (options.thread_id) {
        oss << " [" << entry.thread_id << "]";
    }

    if (options.colors) {
        oss << " " << log_level_color(entry.level);
    }
    oss << " [" << std::setw(5) << log_level_name(entry.level) << "]";
    if (options.colors) {
        oss << "\033[0m";
    }

    if (!entry.component.empty()) {
        oss << " [" << entry.component << "]";
    }

    oss << " " << entry.message;

    if (options.source_location && !entry.file.empty()) {
        oss << " (" << entry.file << ":" << entry.line;
        if (options.function_name) {
            oss << " " << entry.function;
        }
        oss << ")";
    }

    return oss.str();
}

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) {
    options_.colors = use_colors;
}

void ConsoleSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << format_log_entry(entry, options_) << '\n';
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

    if (current_size_ >= max_file_size_) {
        rotate();
    }
    if (!file_) {
        return;
    }

    FormatOptions options;
    options.source_location = true;
    options.function_name = true;

    std::string line = format_log_entry(entry, options);
    line.push_back('\n');
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

    // shardkeep.log.N is dropped, every other generation shifts up by one
    fs::remove(filename_ + "." + std::to_string(max_files_), ec);
    for (std::size_t i = max_files_; i > 1; --i) {
        std::string src = filename_ + "." + std::to_string(i - 1);
        if (fs::exists(src, ec)) {
            fs::rename(src, filename_ + "." + std::to_string(i), ec);
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

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

// ============================================================================
// AsyncSink Implementation
// ============================================================================

AsyncSink::AsyncSink(std::shared_ptr<LogSink> inner_sink, std::size_t queue_size)
    : inner_sink_(std::move(inner_sink))
    , max_queue_size_(queue_size) {}

AsyncSink::~AsyncSink() {
    stop();
}

void AsyncSink::write(const LogEntry& entry) {
    if (!running_.load()) {
        inner_sink_->write(entry);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= max_queue_size_) {
        queue_.pop();  // Drop oldest entry
    }
    queue_.push(entry);
    cv_.notify_one();
}

void AsyncSink::flush() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        drained_cv_.wait(lock, [this]() {
            return (queue_.empty() && in_flight_ == 0) || !running_.load();
        });
    }
    inner_sink_->flush();
}

void AsyncSink::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_thread_ = std::thread(&AsyncSink::worker_loop, this);
}

void AsyncSink::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    cv_.notify_all();
    drained_cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    // Drain whatever the worker left behind
    std::lock_guard<std::mutex> lock(mutex_);
    while (!queue_.empty()) {
        inner_sink_->write(queue_.front());
        queue_.pop();
    }
    inner_sink_->flush();
}

void AsyncSink::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this]() {
            return !queue_.empty() || !running_.load();
        });
        if (queue_.empty() && !running_.load()) {
            break;
        }

        while (!queue_.empty()) {
            LogEntry entry = std::move(queue_.front());
            queue_.pop();
            ++in_flight_;
            lock.unlock();

            inner_sink_->write(entry);

            lock.lock();
            --in_flight_;
        }
        drained_cv_.notify_all();
    }
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() {
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

    if (!component.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string scope = component;
        while (true) {
            auto it = component_levels_.find(scope);
            if (it != component_levels_.end()) {
                return level >= it->second;
            }
            auto pos = scope.rfind('.');
            if (pos == std::string::npos) {
                break;
            }
            scope.resize(pos);
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

LogStream ComponentLogger::fatal(const std::source_location& loc) const {
    return LogStream(LogLevel::FATAL, component_, loc);
}

void ComponentLogger::trace(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::TRACE, component_, msg, loc);
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

void ComponentLogger::fatal(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::FATAL, component_, msg, loc);
}

// ============================================================================
// Initialization
// ============================================================================

namespace {

std::shared_ptr<LogSink> maybe_async(std::shared_ptr<LogSink> sink, bool async) {
    if (!async) {
        return sink;
    }
    auto wrapped = std::make_shared<AsyncSink>(std::move(sink));
    wrapped->start();
    return wrapped;
}

}  // namespace

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
        logger.add_sink(maybe_async(console, config.async_logging));
    }

    if (config.file_enabled) {
        auto file = std::make_shared<FileSink>(config.file_path);
        file->set_max_file_size(config.file_max_size);
        file->set_max_files(config.file_max_count);
        logger.add_sink(maybe_async(file, config.async_logging));
    }

    log::core.info("Logging initialized");
}

void shutdown_logging() {
    log::core.info("Logging shutting down");
    Logger::instance().flush();
}

}  // namespace shardkeep
