#include "guard_link/logging.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace guard_link {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};
constexpr const char* k_logger_name{"guard_link"};
constexpr const char* k_file_name{"guard_link.log"};
// %v is already a JSON object, so it is embedded unquoted.
constexpr const char* k_file_pattern{
    R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":%t,"event":%v})"};
constexpr const char* k_console_pattern{"%H:%M:%S.%e %^%-5l%$ %v"};
}  // namespace

std::filesystem::path log_file_path(const std::string& log_directory) {
    return std::filesystem::path{log_directory} / k_file_name;
}

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(
        logger_once_flag,
        [&log_directory]() {
            std::error_code error_directory;
            std::filesystem::create_directories(log_directory, error_directory);
            if (error_directory) {
                throw std::runtime_error(
                    "Unable to create log directory at " + log_directory + ": " + error_directory.message());
            }

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(k_console_pattern);
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path(log_directory).string(),
                k_max_file_size_bytes,
                k_max_files
            );
            // The timestamp carries a Z suffix, so it has to be rendered in UTC.
            file_sink->set_formatter(
                std::make_unique<spdlog::pattern_formatter>(k_file_pattern, spdlog::pattern_time_type::utc));

            spdlog::sinks_init_list sinks{console_sink, file_sink};
            shared_logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
            shared_logger->set_level(spdlog::level::info);
            shared_logger->flush_on(spdlog::level::warn);
            spdlog::register_logger(shared_logger);
        }
    );
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

void set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return;
    }
    // from_str maps unknown names to off.
    const auto level = spdlog::level::from_str(str_level);
    if (level == spdlog::level::off && str_level != "off") {
        shared_logger->warn(R"({{"component":"logging","event":"unknown_level","level":"{}","fallback":"info"}})",
                            str_level);
        shared_logger->set_level(spdlog::level::info);
        return;
    }
    shared_logger->set_level(level);
}

}  // namespace guard_link
