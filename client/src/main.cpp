#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "ftpmirror/client/config.hpp"
#include "ftpmirror/client/logger.hpp"
#include "ftpmirror/client/report.hpp"
#include "ftpmirror/client/session.hpp"
#include "ftpmirror/version.hpp"

namespace
{

    constexpr int kUsageExitCode = 2;

    std::filesystem::path executable_path(const char *argv0)
    {
        std::error_code ec;
        auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (ec)
        {
            path = std::filesystem::absolute(argv0, ec);
        }
        return path;
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace ftpmirror::client;

    CommandLine command_line;
    try
    {
        command_line = parse_arguments(argc, argv);
        if (command_line.show_help)
        {
            std::cout << usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (command_line.show_version)
        {
            std::cout << "ftpmirror " << ftpmirror::version() << std::endl;
            return EXIT_SUCCESS;
        }
        validate(command_line.config);
    }
    catch (const ConfigError &ex)
    {
        std::cerr << "ERROR: " << ex.what() << "\n\n"
                  << usage(argv[0]);
        return kUsageExitCode;
    }

    const auto &config = command_line.config;
    try
    {
        LogTarget target;
        target.verbose = config.log.verbose;
        if (config.log.file)
        {
            target.file = default_log_path(config.local_root, config.log.directory, std::chrono::system_clock::now());
        }
        Logger logger(target);
        if (target.file)
        {
            logger.info("INFO", "Logging to ", target.file->string());
        }

        if (config.log.header)
        {
            std::error_code ec;
            const HeaderInfo header{"ftpmirror", std::string(ftpmirror::version()), executable_path(argv[0]),
                                    std::filesystem::current_path(ec)};
            for (const auto &line : format_header(header))
            {
                logger.plain(line);
            }
        }

        MirrorSession session(config, std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
