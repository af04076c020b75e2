#include "DownloadManager.hpp"
#include "Error.hpp"
#include "Logger.hpp"
#include "MirrorList.hpp"
#include "ProgressBar.hpp"
#include "Utils.hpp"

#include <argparse/argparse.hpp>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

namespace {

int report_failure(const std::string& cause) {
    std::cerr << cause << '\n' << "Download failed" << std::endl;
    rangeget::logger::flush();
    return 1;
}

}  // namespace

int main(int argc, char** argv) {
    argparse::ArgumentParser arg_parser("cpp-rangeget");

    arg_parser.add_argument("source").help("URL of the file, or path of a file listing mirror URLs");

    arg_parser.add_argument("connections")
        .help("Maximum number of concurrent connections")
        .nargs(argparse::nargs_pattern::optional)
        .default_value(static_cast<int>(rangeget::DEFAULT_CONNECTIONS))
        .scan<'i', int>();

    arg_parser.add_argument("-o", "--output")
        .help("Output file, defaults to the file name of the first URL")
        .default_value(std::string{});

    arg_parser.add_argument("-p", "--progress-bar")
        .help("Draw a progress bar instead of printing the percentage")
        .default_value(false)
        .implicit_value(true);

    arg_parser.add_argument("-l", "--logging")
        .help("Enable logging")
        .default_value(false)
        .implicit_value(true);

    arg_parser.add_argument("-lf", "--log-file")
        .help("Path to the log file")
        .default_value(std::string("./log.txt"));

    try {
        arg_parser.parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << arg_parser;
        return 1;
    }

    if (arg_parser.get<bool>("--logging")) {
        try {
            rangeget::logger::init(arg_parser.get<std::string>("--log-file"));
        } catch (const std::exception& e) {
            return report_failure(e.what());
        }
#ifdef DEBUG
        rangeget::logger::set_level(rangeget::logger::Level::debug);
#else
        rangeget::logger::set_level(rangeget::logger::Level::info);
#endif
    } else {
        rangeget::logger::set_level(rangeget::logger::Level::off);
    }

    auto mirrors = rangeget::MirrorList::from_source(arg_parser.get<std::string>("source"));
    if (!mirrors.has_value()) {
        return report_failure(mirrors.error().message());
    }

    const int connections{arg_parser.get<int>("connections")};
    if (connections < 1) {
        return report_failure(
            std::error_code{rangeget::DownloadErrc::invalid_argument}.message()
        );
    }

    std::string output{arg_parser.get<std::string>("--output")};
    if (output.empty()) {
        output = rangeget::utils::file_name_from_url(mirrors->front());
    }
    if (output.empty()) {
        return report_failure(
            std::error_code{rangeget::DownloadErrc::invalid_argument}.message()
        );
    }

    const bool draw_progress_bar{arg_parser.get<bool>("--progress-bar")};

    rangeget::DownloadConfig config{
        .urls        = mirrors->get_urls(),
        .output_path = output,
        .connections = static_cast<uint32_t>(connections),
    };
    config.on_completion = [] { std::cout << "Download succeeded" << std::endl; };
    if (!draw_progress_bar) {
        config.on_progress = [](uint32_t percent) {
            std::cout << "Downloaded " << percent << "%" << std::endl;
        };
    }

    try {
        rangeget::DownloadManager download_manager(std::move(config));

        rangeget::ui::ProgressBar progress_bar(download_manager);
        std::jthread              draw_thread;
        if (draw_progress_bar) {
            draw_thread = std::jthread([&progress_bar] { progress_bar.start_draw(); });
        }

        auto result = download_manager.run();

        progress_bar.stop_draw();
        if (draw_thread.joinable()) {
            draw_thread.join();
        }

        if (!result.has_value()) {
            return report_failure(result.error().message());
        }
    } catch (const std::exception& e) {
        LOG_CRITICAL("{}", e.what());
        return report_failure(e.what());
    }

    rangeget::logger::flush();
    return 0;
}
