#include <linepipe/common/debug.hpp>
#include <linepipe/common/platform.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace linepipe::common::debug {

namespace {

// Platform-safe localtime conversion
inline std::tm safe_localtime(const std::time_t* time) {
    std::tm result{};
#if defined(LINEPIPE_OS_WINDOWS)
    localtime_s(&result, time);
#else
    localtime_r(time, &result);
#endif
    return result;
}

void write_timestamp(std::ostream& out, std::chrono::system_clock::time_point ts) {
    auto time = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()) % 1000;
    auto tm_result = safe_localtime(&time);
    out << std::put_time(&tm_result, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms.count() << std::setfill(' ');
}

}  // anonymous namespace

// ============================================================================
// Log Level Parsing
// ============================================================================

std::optional<LogLevel> try_parse_log_level(std::string_view name) noexcept {
    struct Alias {
        std::string_view name;
        LogLevel level;
    };
    static constexpr std::array<Alias, 11> ALIASES = {{{"trace", LogLevel::TRACE},
                                                       {"debug", LogLevel::DEBUG},
                                                       {"info", LogLevel::INFO},
                                                       {"warn", LogLevel::WARN},
                                                       {"warning", LogLevel::WARN},
                                                       {"error", LogLevel::ERROR},
                                                       {"err", LogLevel::ERROR},
                                                       {"fatal", LogLevel::FATAL},
                                                       {"critical", LogLevel::FATAL},
                                                       {"off", LogLevel::OFF},
                                                       {"none", LogLevel::OFF}}};

    auto same = [](std::string_view a, std::string_view b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) == y;
               });
    };

    for (const auto& alias : ALIASES) {
        if (same(name, alias.name)) {
            return alias.level;
        }
    }
    return std::nullopt;
}

LogLevel parse_log_level(std::string_view name) noexcept {
    return try_parse_log_level(name).value_or(LogLevel::INFO);
}

// ============================================================================
// LogFilter Implementation
// ============================================================================

void LogFilter::set_category_level(std::string_view category, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_[std::string(category)] = level;
}

bool LogFilter::should_log(LogLevel level, std::string_view category) const noexcept {
    if (level == LogLevel::OFF) {
        return false;
    }

    // First check global level
    if (level < global_level_.load(std::memory_order_relaxed)) {
        return false;
    }

    // Then check category-specific level
    if (!category.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = category_levels_.find(std::string(category));
        if (it != category_levels_.end()) {
            return level >= it->second;
        }
    }

    return true;
}

void LogFilter::reset() noexcept {
    global_level_.store(LogLevel::INFO, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_.clear();
}

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

namespace {

constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD  = "\033[1m";
constexpr const char* DIM   = "\033[2m";
constexpr const char* BLUE  = "\033[34m";

// Gray, cyan, green, yellow, red, magenta; indexed by LogLevel
constexpr std::array<const char*, 6> LEVEL_COLORS = {"\033[90m", "\033[36m", "\033[32m",
                                                     "\033[33m", "\033[31m", "\033[35m"};

const char* color_for_level(LogLevel level) noexcept {
    auto index = static_cast<size_t>(level);
    return index < LEVEL_COLORS.size() ? LEVEL_COLORS[index] : "";
}

}  // anonymous namespace

ConsoleSink::ConsoleSink() : use_colors_(platform::is_terminal(stderr)) {}

ConsoleSink::~ConsoleSink() {
    flush();
}

void ConsoleSink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostream& out = std::cerr;
    auto paint = [&](const char* color) {
        if (use_colors_)
            out << color;
    };

    paint(DIM);
    write_timestamp(out, record.timestamp);
    paint(RESET);
    out << ' ';

    paint(color_for_level(record.level));
    paint(BOLD);
    out << '[' << level_char(record.level) << ']';
    paint(RESET);

    if (!record.category.empty()) {
        out << ' ';
        paint(BLUE);
        out << '[' << record.category << ']';
        paint(RESET);
    }

    out << ' ' << record.message << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

// ============================================================================
// FileSink Implementation
// ============================================================================

struct FileSink::Impl {
    Config config;
    std::ofstream file;
    std::mutex mutex;
    size_t current_size = 0;

    bool open() {
        file.open(config.file_path, std::ios::app);
        if (file.is_open()) {
            file.seekp(0, std::ios::end);
            current_size = static_cast<size_t>(file.tellp());
            return true;
        }
        return false;
    }

    void rotate() {
        file.close();

        // Drop the oldest, then shift path.N -> path.N+1
        std::string oldest = config.file_path + "." + std::to_string(config.max_files);
        std::remove(oldest.c_str());

        for (int i = static_cast<int>(config.max_files) - 1; i >= 0; --i) {
            std::string old_name = config.file_path;
            if (i > 0) {
                old_name += "." + std::to_string(i);
            }
            std::string new_name = config.file_path + "." + std::to_string(i + 1);
            std::rename(old_name.c_str(), new_name.c_str());
        }

        current_size = 0;
        open();
    }
};

FileSink::FileSink(Config config) : impl_(std::make_unique<Impl>()) {
    impl_->config = std::move(config);
    impl_->open();
}

FileSink::~FileSink() {
    flush();
}

void FileSink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->file.is_open())
        return;

    std::ostringstream oss;

    write_timestamp(oss, record.timestamp);
    oss << ' ' << level_name(record.level) << ' ';
    if (!record.category.empty()) {
        oss << '[' << record.category << "] ";
    }
    oss << "[T:" << std::hex << record.thread_id << std::dec << "] ";

    oss << record.message;

    if (record.location.is_valid()) {
        oss << " (" << record.location.file << ':' << record.location.line << ')';
    }

    oss << '\n';

    std::string line = oss.str();
    impl_->file << line;
    impl_->current_size += line.size();

    if (impl_->config.max_file_size > 0 && impl_->current_size >= impl_->config.max_file_size) {
        impl_->rotate();
    }
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->file.is_open()) {
        impl_->file.flush();
    }
}

bool FileSink::is_ready() const noexcept {
    return impl_->file.is_open();
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::instance() noexcept {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    filter_.set_level(LogLevel::WARN);
    add_sink(std::make_shared<ConsoleSink>());
}

Logger::~Logger() {
    flush();
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string_view category, std::string message,
                 SourceLocation loc) {
    if (!filter_.should_log(level, category)) {
        return;
    }

    LogRecord record;
    record.level     = level;
    record.category  = category;
    record.message   = std::move(message);
    record.location  = loc;
    record.timestamp = std::chrono::system_clock::now();
    record.thread_id = platform::get_thread_id();

    dispatch(record);
}

void Logger::dispatch(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (auto& sink : sinks_) {
        if (sink && sink->is_ready()) {
            sink->write(record);
        }
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (auto& sink : sinks_) {
        if (sink)
            sink->flush();
    }
}

// ============================================================================
// Span Implementation
// ============================================================================

Span::Span(std::string_view name, std::string_view category, SourceLocation loc)
    : name_(name), category_(category), location_(loc),
      start_time_(std::chrono::steady_clock::now()) {
    LINEPIPE_LOG_TRACE(category_, name_ << ": started");
}

Span::~Span() {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed()).count();

    std::ostringstream summary;
    summary << name_ << (has_error_ ? ": failed after " : ": done in ") << us << "us";
    for (const auto& [key, value] : context_) {
        summary << ' ' << key << '=' << value;
    }

    if (has_error_) {
        summary << " error=" << error_name(error_code_);
        if (!error_message_.empty()) {
            summary << " (" << error_message_ << ')';
        }
        LINEPIPE_LOG_ERROR(category_, summary.str());
    } else {
        LINEPIPE_LOG_DEBUG(category_, summary.str());
    }
}

Span& Span::add_context(std::string_view key, std::string_view value) {
    context_.emplace_back(std::string(key), std::string(value));
    return *this;
}

Span& Span::add_context(std::string_view key, uint64_t value) {
    context_.emplace_back(std::string(key), std::to_string(value));
    return *this;
}

void Span::set_error(ErrorCode code, std::string_view message) {
    has_error_     = true;
    error_code_    = code;
    error_message_ = std::string(message);
}

std::chrono::nanoseconds Span::elapsed() const noexcept {
    return std::chrono::steady_clock::now() - start_time_;
}

// ============================================================================
// Initialization
// ============================================================================

void init_logging(LogLevel level) {
    Logger::instance().set_level(level);

    std::string env_level = platform::get_env("LINEPIPE_LOG_LEVEL");
    if (!env_level.empty()) {
        if (auto parsed = try_parse_log_level(env_level)) {
            Logger::instance().set_level(*parsed);
        }
    }
}

void shutdown_logging() {
    Logger::instance().flush();
    Logger::instance().clear_sinks();
}

}  // namespace linepipe::common::debug
