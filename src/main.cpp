#include "capshare/share/shareprotocol.hpp"
#include "cli/commandline.hpp"
#include "config/shareconfig.hpp"
#include "core/log.hpp"
#include <iostream>
#include <stdexcept>

using namespace capshare;

namespace {

int runShare(share::ShareProtocol& protocol, const cli::CommandLine& cmd) {
    if (!protocol.sharingEnabled()) {
        std::cerr << "Sharing is disabled: no shareRoot configured" << std::endl;
        return 1;
    }

    bool shared = false;
    auto done = protocol.share(
        cli::CommandLineParser::selectionFromArgs(cmd.args),
        cmd.location,
        [&shared](const std::string& url, const std::string& anchorText) {
            shared = true;
            std::cout << "Share URL: " << url << "\n"
                      << "           (" << anchorText << ")" << std::endl;
        },
        [](const std::string& message) {
            std::cerr << message << std::endl;
        });
    done.get();
    return shared ? 0 : 1;
}

int runPut(share::ShareProtocol& protocol, const cli::CommandLine& cmd) {
    for (const auto& path : cmd.args) {
        std::cout << protocol.putFile(path) << "  " << path << std::endl;
    }
    return 0;
}

int runDescribe(share::ShareProtocol& protocol, const cli::CommandLine& cmd) {
    auto desc = protocol.describe(cmd.args.front());
    if (!desc) {
        std::cerr << "Blob not found: " << cmd.args.front() << std::endl;
        return 1;
    }

    std::cout << "ref:  " << desc->ref << "\n"
              << "size: " << desc->size << "\n";
    if (!desc->camliType.empty()) {
        std::cout << "type: " << desc->camliType << "\n";
    }
    if (desc->signatureValid) {
        std::cout << "signature: " << (*desc->signatureValid ? "valid" : "INVALID") << "\n";
    }
    for (const auto& member : desc->members) {
        std::cout << "  member " << member << "\n";
    }
    if (!desc->camliType.empty()) {
        std::cout << desc->content;
    }
    std::cout.flush();
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    cli::CommandLineParser parser(argc > 0 ? argv[0] : "capshare");

    cli::CommandLine cmd;
    try {
        cmd = parser.parse(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n";
        parser.usage(std::cerr);
        return 2;
    }
    if (cmd.help) {
        parser.usage(std::cout);
        return 0;
    }

    log::init(cmd.verbose);

    try {
        share::ShareProtocol protocol(cmd.configPath);
        if (cmd.command == "share") {
            return runShare(protocol, cmd);
        }
        if (cmd.command == "put") {
            return runPut(protocol, cmd);
        }
        return runDescribe(protocol, cmd);
    } catch (const config::ConfigError& e) {
        log::get("config")->error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        log::get("share")->error("{}", e.what());
        return 1;
    }
}
