/**
 * TOLLGATE - Resilient LLM Provider Client
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <random>
#include <utility>
#include <vector>

namespace tollgate::util {

std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

namespace {

thread_local std::string tl_request_id;

struct LevelName {
    std::string_view name;
    LogLevel level;
    spdlog::level::level_enum spd;
};

// First entry per level is the canonical name; the rest are accepted aliases
constexpr std::array<LevelName, 12> kLevelNames{{
    {"trace",    LogLevel::Trace,    spdlog::level::trace},
    {"debug",    LogLevel::Debug,    spdlog::level::debug},
    {"info",     LogLevel::Info,     spdlog::level::info},
    {"warn",     LogLevel::Warn,     spdlog::level::warn},
    {"warning",  LogLevel::Warn,     spdlog::level::warn},
    {"error",    LogLevel::Error,    spdlog::level::err},
    {"err",      LogLevel::Error,    spdlog::level::err},
    {"critical", LogLevel::Critical, spdlog::level::critical},
    {"crit",     LogLevel::Critical, spdlog::level::critical},
    {"fatal",    LogLevel::Critical, spdlog::level::critical},
    {"off",      LogLevel::Off,      spdlog::level::off},
    {"none",     LogLevel::Off,      spdlog::level::off},
}};

const LevelName* find_level(LogLevel level) {
    auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(),
                           [level](const LevelName& n) { return n.level == level; });
    return it == kLevelNames.end() ? nullptr : &*it;
}

std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_color_mode(config.enable_colors ? spdlog::color_mode::automatic
                                                     : spdlog::color_mode::never);
        console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
        sinks.push_back(std::move(console));
    }

    if (!config.file_path.empty()) {
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, config.max_file_size_mb * 1024 * 1024, config.max_files);
        rotating->set_pattern("%Y-%m-%dT%H:%M:%S.%e %l [tid %t] %v");
        sinks.push_back(std::move(rotating));
    }

    return sinks;
}

} // namespace

Logger::Logger()
    : sinks_(std::make_shared<spdlog::sinks::dist_sink_mt>())
    , logger_(std::make_shared<spdlog::logger>("tollgate", sinks_))
    , call_logger_(std::make_shared<spdlog::logger>("tollgate.calls", sinks_))
{
    logger_->flush_on(spdlog::level::warn);
}

void Logger::init(const LogConfig& config) {
    instance().configure(config);
}

Logger& Logger::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(LogConfig{});
    });
    return *instance_;
}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    sinks_->set_sinks(make_sinks(config));
    logger_->set_level(to_spdlog_level(config.level));

    // Call lines are emitted at INFO unless logging is off entirely
    call_logger_->set_level(config.level == LogLevel::Off ? spdlog::level::off
                                                          : spdlog::level::info);

    current_level_.store(config.level, std::memory_order_relaxed);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
    current_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::get_level() const {
    return current_level_.load(std::memory_order_relaxed);
}

std::optional<LogLevel> Logger::parse_level(std::string_view level_str) {
    std::string lower(level_str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& entry : kLevelNames) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    return std::nullopt;
}

std::string_view Logger::level_to_string(LogLevel level) {
    const auto* entry = find_level(level);
    return entry ? entry->name : std::string_view{"unknown"};
}

void Logger::call(const CallLogEntry& entry) {
    if (!call_logger_) return;

    auto dash = [](const std::string& s) -> std::string_view {
        return s.empty() ? std::string_view{"-"} : std::string_view{s};
    };

    // id provider model outcome stage status latency cache tokens cost
    // 3f9a0c1e22b4d871 local-x llama3 ok - 200 152ms MISS 12/40 $0.000000
    call_logger_->info("{} {} {} {} {} {} {}ms {} {}/{} ${:.6f}",
                       dash(entry.request_id),
                       entry.provider,
                       dash(entry.model),
                       entry.outcome,
                       dash(entry.stage),
                       entry.http_status,
                       entry.latency.count(),
                       entry.cache_hit ? "HIT" : "MISS",
                       entry.prompt_tokens,
                       entry.completion_tokens,
                       entry.estimated_cost);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_->flush();
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    const auto* entry = find_level(level);
    return entry ? entry->spd : spdlog::level::info;
}

// RequestContext

RequestContext::RequestContext(std::string request_id)
    : request_id_(request_id.empty() ? generate_id() : std::move(request_id))
    , previous_id_(std::exchange(tl_request_id, request_id_))
{
}

RequestContext::~RequestContext() {
    tl_request_id = std::move(previous_id_);
}

std::string RequestContext::current_id() {
    return tl_request_id;
}

std::string RequestContext::generate_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    return fmt::format("{:016x}", rng());
}

} // namespace tollgate::util
