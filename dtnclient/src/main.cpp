#include "client.hpp"
#include "command/cli_options.hpp"
#include "command/command.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "msgpack_codec.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <iostream>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& out) {
    out << "Usage: dtnclient [options] <command> [command options]\n"
        << "\n"
        << "Options:\n"
        << "  -s, --socket <path>   Path to the dtnd application agent socket (default: "
        << DTNCLIENT_DEFAULT_SOCKET << ")\n"
        << "  --config <path>       log4cplus properties file (default: log4cplus.ini)\n"
        << "  --timeout <ms>        Socket send/receive deadline, 0 = none (default: 0)\n"
        << "  --dump-dir <dir>      Where undecodable replies are saved (default: temp dir)\n"
        << "  -v                    Verbose logging\n"
        << "  --version             Print version information\n"
        << "  -h, --help            Show this help\n"
        << "\n";
    dtnclient::commands::print_command_usage(out);
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    dtnclient::commands::CliOptions options;
    try {
        options = dtnclient::commands::parse_cli_options(argc, argv, DTNCLIENT_DEFAULT_SOCKET);
    } catch (const dtnclient::commands::UsageError& exc) {
        std::cerr << exc.what() << "\n\n";
        print_usage(std::cerr);
        return kExitUsage;
    }

    if (options.show_version) {
        std::cout << "Version: " << DTNCLIENT_VERSION_STRING << std::endl;
        std::cout << "Commit: " << DTNCLIENT_GIT_VERSION_STRING << std::endl;
        std::cout << "Build Time: " << DTNCLIENT_BUILD_TIMESTAMP << std::endl;
        return kExitSuccess;
    }

    if (options.show_help) {
        print_usage(std::cout);
        return kExitSuccess;
    }

    dtnclient::init_logging(options.config_path);
    if (options.verbose) {
        dtnclient::enable_verbose_logging();
    }

    if (options.command.empty()) {
        std::cerr << "Must choose a command\n\n";
        print_usage(std::cerr);
        return kExitUsage;
    }

    if (!options.dump_dir.empty()) {
        dtnclient::codec::set_dump_directory(options.dump_dir);
    }

    LOG4CPLUS_DEBUG(dtnclient::core_logger(), "dtnclient " << DTNCLIENT_VERSION_STRING << ", socket: " << options.socket_path);

    dtnclient::Client client(dtnclient::unix_socket_factory(options.socket_path, options.timeout));

    try {
        dtnclient::commands::run_command(options.command, options.command_args, client, std::cout);
    } catch (const dtnclient::commands::UsageError& exc) {
        LOG4CPLUS_ERROR(dtnclient::core_logger(), exc.what());
        print_usage(std::cerr);
        return kExitUsage;
    } catch (const dtnclient::ConnectionNotFoundError& exc) {
        LOG4CPLUS_ERROR(dtnclient::core_logger(), "Could not connect to agent socket: " << exc.what());
        return kExitFailure;
    } catch (const dtnclient::DataError& exc) {
        LOG4CPLUS_ERROR(dtnclient::core_logger(), "Error communicating with dtnd: " << exc.what());
        return kExitFailure;
    } catch (const dtnclient::DaemonError& exc) {
        LOG4CPLUS_ERROR(dtnclient::core_logger(), "dtnd responded with error: " << exc.what());
        return kExitFailure;
    } catch (const dtnclient::InvalidMessageError& exc) {
        LOG4CPLUS_ERROR(dtnclient::core_logger(), "Invalid message: " << exc.what());
        return kExitFailure;
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(dtnclient::core_logger(), "Generic error: " << exc.what());
        return kExitFailure;
    }

    return kExitSuccess;
}
