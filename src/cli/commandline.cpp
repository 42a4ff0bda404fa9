#include "cli/commandline.hpp"
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace capshare::cli {

CommandLineParser::CommandLineParser(std::string processName)
    : processName_(std::move(processName)) {}

CommandLine CommandLineParser::parse(int argc, const char* const argv[]) const {
    CommandLine cmd;

    std::vector<std::string> tokens;
    for (int i = 1; i < argc; ++i) {
        tokens.emplace_back(argv[i]);
    }

    size_t i = 0;
    auto takeValue = [&](const std::string& option) {
        if (i + 1 >= tokens.size()) {
            throw std::invalid_argument("option " + option + " needs a value");
        }
        return tokens[++i];
    };

    for (; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        if (token.rfind("-", 0) != 0 || token == "-") {
            break;
        }
        if (token == "--config" || token == "-c") {
            cmd.configPath = takeValue(token);
        } else if (token == "--location" || token == "-l") {
            cmd.location = takeValue(token);
        } else if (token == "--verbose" || token == "-v") {
            cmd.verbose = true;
        } else if (token == "--help" || token == "-h") {
            cmd.help = true;
            return cmd;
        } else {
            throw std::invalid_argument("unknown option " + token);
        }
    }

    if (i == tokens.size()) {
        throw std::invalid_argument("no command given");
    }

    cmd.command = tokens[i++];
    cmd.args.assign(tokens.begin() + static_cast<std::ptrdiff_t>(i), tokens.end());

    if (cmd.command == "share" || cmd.command == "put") {
        if (cmd.args.empty()) {
            throw std::invalid_argument(cmd.command + " needs at least one argument");
        }
    } else if (cmd.command == "describe") {
        if (cmd.args.size() != 1) {
            throw std::invalid_argument("describe takes exactly one ref");
        }
    } else {
        throw std::invalid_argument("unknown command " + cmd.command);
    }

    return cmd;
}

void CommandLineParser::usage(std::ostream& out) const {
    out << "Usage:\n"
        << "  " << processName_ << " [options] share REF:ISDIR...\n"
        << "  " << processName_ << " [options] put FILE...\n"
        << "  " << processName_ << " [options] describe REF\n"
        << "\n"
        << "Options:\n"
        << "  -c, --config FILE     configuration file (default "
        << CommandLine::DEFAULT_CONFIG << ")\n"
        << "  -l, --location URL    current UI location (default "
        << CommandLine::DEFAULT_LOCATION << ")\n"
        << "  -v, --verbose         debug logging\n"
        << "  -h, --help            show this help\n";
}

std::vector<std::map<std::string, std::string>> CommandLineParser::selectionFromArgs(
    const std::vector<std::string>& args) {

    std::vector<std::map<std::string, std::string>> selection;
    selection.reserve(args.size());
    for (const auto& arg : args) {
        std::map<std::string, std::string> item;
        auto colon = arg.rfind(':');
        if (colon == std::string::npos) {
            item["blobRef"] = arg;
        } else {
            item["blobRef"] = arg.substr(0, colon);
            item["isDir"] = arg.substr(colon + 1);
        }
        selection.push_back(std::move(item));
    }
    return selection;
}

} // namespace capshare::cli
