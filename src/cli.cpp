#include "socksget/cli.hpp"

#include "socksget/chunked_download.hpp"
#include "socksget/config.hpp"
#include "socksget/errors.hpp"
#include "socksget/logging.hpp"
#include "socksget/progress_reporter.hpp"

#include <exception>
#include <ostream>
#include <utility>

namespace socksget {

void printUsage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name
        << " --url <url> --filename <file> --sport <port> --threads <n> [options]\n"
        << "Download a single file through multiple SOCKS5 proxies in parallel.\n"
        << "Proxies are expected on consecutive local ports: '--sport 9000 --threads 2'\n"
        << "uses 127.0.0.1:9000 and 127.0.0.1:9001.\n\n"
        << "Required:\n"
        << "  --url <url>            URL of the file to download\n"
        << "  --filename <file>      Output filename\n"
        << "  --sport <port>         First proxy port\n"
        << "  --threads <n>          Number of proxy ports and worker threads\n"
        << "Options:\n"
        << "  --scratch-dir <dir>    Directory for progress files (default: system temp dir)\n"
        << "  --chunk-size <bytes>   Chunk size (default: 1048576)\n"
        << "  --retries <n>          Attempts per chunk (default: 5)\n"
        << "  --retry-delay <ms>     Pause between attempts (default: 0)\n"
        << "  --serial               Wait for each chunk before dispatching the next\n"
        << "  --no-progress          Do not draw the progress bar\n"
        << "  --log-level <level>    trace, debug, info, warn or error (default: info)\n"
        << "  -h, --help             Show this message" << std::endl;
}

int runCli(int argc, const char* const argv[], std::ostream& err, HttpClientPtr client) {
    const char* program_name = argc > 0 ? argv[0] : "socksget";

    CliOptions options;
    try {
        options = parseArgs(argc, argv);
        if (options.show_help) {
            printUsage(err, program_name);
            return kExitSuccess;
        }
        setupLogging(parseLogLevel(options.log_level));
    } catch (const ConfigError& ex) {
        err << ex.what() << '\n';
        printUsage(err, program_name);
        return kExitUsage;
    }

    try {
        ChunkedDownload task(options.config, std::move(client));
        if (options.show_progress) {
            ProgressReporter reporter(err);
            reporter.run(task);
        } else {
            task.run();
        }
    } catch (const DownloadError& ex) {
        logger()->critical("{}", ex.what());
        return kExitFatal;
    } catch (const std::exception& ex) {
        logger()->critical("Fatal error: {}", ex.what());
        return kExitFatal;
    }

    return kExitSuccess;
}

} // namespace socksget
