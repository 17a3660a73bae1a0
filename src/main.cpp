#include <absl/status/status.h>

#include <cli/CommandLine.hpp>
#include <config/ConfigParser.hpp>
#include <cstdlib>
#include <imagep/ImageProcOpenCV.hpp>
#include <imagep/Pipeline.hpp>
#include <iostream>
#include <logging/LogInit.hpp>

#include <LogCompat.hpp>

int main(int argc, char** argv) {
    const auto options = imageless::parseCommandLine(argc, argv);
    if (!options.ok()) {
        std::cerr << options.status().message() << "\n\n"
                  << imageless::usage();
        return EXIT_FAILURE;
    }
    if (options->help) {
        std::cout << imageless::usage();
        return EXIT_SUCCESS;
    }

    Imageless_LogInit(options->log);
    DLOG(INFO) << imageless::OpenCVImage::version();

    absl::Status status;
    if (auto config = imageless::loadConfig(options->config); config.ok()) {
        status = imageless::processAndSave(options->file, options->out,
                                           config->outFormat,
                                           config->operations);
    } else {
        status = config.status();
    }

    if (!status.ok()) {
        LOG(ERROR) << "Failed to process " << options->file << ": " << status;
    } else {
        LOG(INFO) << "Saved " << options->out;
    }
    Imageless_LogDeInit();
    return status.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}
