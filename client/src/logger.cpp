#include "ftpmirror/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace ftpmirror::client
{

    namespace
    {

        std::string timestamp(std::chrono::system_clock::time_point now)
        {
            const auto seconds = std::chrono::system_clock::to_time_t(now);
            std::tm local{};
            localtime_r(&seconds, &local);
            std::ostringstream oss;
            oss << std::put_time(&local, "%Y-%m-%d_%H-%M-%S");
            return oss.str();
        }

    } // namespace

    std::filesystem::path default_log_path(const std::filesystem::path &local_root,
                                           const std::optional<std::filesystem::path> &directory,
                                           std::chrono::system_clock::time_point now)
    {
        auto root = local_root.lexically_normal();
        if (!root.has_filename() && root.has_parent_path())
        {
            root = root.parent_path();
        }
        const auto absolute_root = std::filesystem::absolute(root);
        auto folder = directory ? *directory : absolute_root.parent_path();
        auto name = absolute_root.filename().string();
        if (name.empty())
        {
            name = "mirror";
        }
        return folder / (timestamp(now) + "-" + name + ".log");
    }

    Logger::Logger(const LogTarget &target)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            if (target.console)
            {
                auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                console->set_pattern("%v");
                sinks.push_back(std::move(console));
            }
            if (target.file)
            {
                if (target.file->has_parent_path())
                {
                    std::filesystem::create_directories(target.file->parent_path());
                }
                auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(target.file->string(), false);
                file->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
                sinks.push_back(std::move(file));
            }
            logger_ = std::make_shared<spdlog::logger>("ftpmirror", sinks.begin(), sinks.end());
            logger_->set_level(target.verbose ? spdlog::level::debug : spdlog::level::info);
            logger_->flush_on(spdlog::level::warn);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "Logging disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            std::cerr << "Logging disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

    void Logger::plain(const std::string &line)
    {
        if (logger_)
        {
            logger_->info("{}", line);
        }
    }

    bool Logger::verbose() const noexcept
    {
        return logger_ && logger_->should_log(spdlog::level::debug);
    }

    void Logger::flush()
    {
        if (logger_)
        {
            logger_->flush();
        }
    }

} // namespace ftpmirror::client
