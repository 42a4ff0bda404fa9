#pragma once

#include "core/core_export.hpp"
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace capshare::cli {

struct CommandLine {
    static constexpr const char* DEFAULT_CONFIG = "capshare.json";
    static constexpr const char* DEFAULT_LOCATION = "http://localhost:3179/ui/";

    std::string configPath = DEFAULT_CONFIG;
    std::string location = DEFAULT_LOCATION;   // Location the URL prefix is recovered from
    bool verbose = false;
    bool help = false;
    std::string command;                       // share, put or describe
    std::vector<std::string> args;
};

/**
 * @brief Parses capshare's argv
 *
 *   capshare [--config FILE] [--location URL] [--verbose] share REF:ISDIR...
 *   capshare [--config FILE] [--verbose] put FILE...
 *   capshare [--config FILE] describe REF
 */
class CAPSHARE_CORE_EXPORT CommandLineParser {
public:
    explicit CommandLineParser(std::string processName = "capshare");

    /**
     * @throws std::invalid_argument on unknown options, missing values,
     *         an unknown command or a wrong argument count
     */
    CommandLine parse(int argc, const char* const argv[]) const;

    void usage(std::ostream& out) const;

    /**
     * @brief Turn "REF:ISDIR" arguments into selection items
     *
     * The flag follows the last colon. An argument without a colon yields
     * an item with no "isDir" key.
     */
    static std::vector<std::map<std::string, std::string>> selectionFromArgs(
        const std::vector<std::string>& args);

private:
    std::string processName_;
};

} // namespace capshare::cli
