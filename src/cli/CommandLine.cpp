#include "CommandLine.hpp"

#include <absl/status/status.h>

#include <boost/program_options.hpp>
#include <sstream>

namespace po = boost::program_options;

namespace imageless {

namespace {

const po::options_description& optionsDescription() {
    static const po::options_description desc = [] {
        po::options_description options("imageless options");
        options.add_options()("help,h", "Print this help and exit")(
            "file,f", po::value<std::string>()->required(), "File to process")(
            "out,o", po::value<std::string>()->required(), "Output file")(
            "config,c", po::value<std::string>()->required(),
            "Path to an imageless config file")(
            "verbose,v", "Enable debug logging")(
            "log-file", po::value<std::string>(),
            "Also write the log to this file");
        return options;
    }();
    return desc;
}

}  // namespace

absl::StatusOr<CommandLineOptions> parseCommandLine(const int argc,
                                                    const char* const argv[]) {
    po::variables_map vm;
    CommandLineOptions options;
    try {
        po::store(po::parse_command_line(argc, argv, optionsDescription()),
                  vm);
        if (vm.count("help") != 0U) {
            options.help = true;
            return options;
        }
        po::notify(vm);
    } catch (const po::error& ex) {
        return absl::InvalidArgumentError(ex.what());
    }

    options.file = vm["file"].as<std::string>();
    options.out = vm["out"].as<std::string>();
    options.config = vm["config"].as<std::string>();
    options.log.verbose = vm.count("verbose") != 0U;
    if (vm.count("log-file") != 0U) {
        options.log.logFile = vm["log-file"].as<std::string>();
    }
    return options;
}

std::string usage() {
    std::ostringstream ss;
    ss << "Usage: imageless -f <input> -o <output> -c <config.json>\n"
       << optionsDescription();
    return ss.str();
}

}  // namespace imageless
