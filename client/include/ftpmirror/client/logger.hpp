#pragma once

#include <chrono>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace ftpmirror::client
{

    struct LogTarget
    {
        bool console{true};
        std::optional<std::filesystem::path> file;
        bool verbose{};
    };

    // Dated log file placed beside the mirror target:
    // <directory or parent of local_root>/YYYY-MM-DD_HH-MM-SS-<local root name>.log
    std::filesystem::path default_log_path(const std::filesystem::path &local_root,
                                           const std::optional<std::filesystem::path> &directory,
                                           std::chrono::system_clock::time_point now);

    // Tagged logging on top of spdlog. A default-constructed Logger discards everything.
    class Logger
    {
    public:
        Logger() = default;
        explicit Logger(const LogTarget &target);

        template <typename... Args>
        void info(const std::string &tag, Args &&...args)
        {
            write(spdlog::level::info, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(const std::string &tag, Args &&...args)
        {
            write(spdlog::level::warn, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void error(const std::string &tag, Args &&...args)
        {
            write(spdlog::level::err, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void debug(const std::string &tag, Args &&...args)
        {
            write(spdlog::level::debug, tag, std::forward<Args>(args)...);
        }

        // Untagged line, used for banners and the summary.
        void plain(const std::string &line);

        bool verbose() const noexcept;

        void flush();

    private:
        template <typename... Args>
        void write(spdlog::level::level_enum level, const std::string &tag, Args &&...args)
        {
            if (!logger_ || !logger_->should_log(level))
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            if (tag.empty())
            {
                logger_->log(level, "{}", std::string(buf.data(), buf.size()));
            }
            else
            {
                logger_->log(level, "[{}] {}", tag, std::string(buf.data(), buf.size()));
            }
        }

        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace ftpmirror::client
