#ifndef CLI_HPP
#define CLI_HPP

#include <iosfwd>
#include <string>
#include <vector>

// zwstego 命令行：embed / extract / strip / stats
namespace zwstego {

    enum ExitCode {
        RC_OK = 0,
        RC_USAGE = 1,
        RC_NOT_FOUND = 2,   // extract found no hidden text
        RC_IO = 3,
        RC_INTERNAL = 4     // marker alphabet failed its startup check
    };

    struct CliArgs {
        std::string mode, cover, secret, inPath, outPath;
        bool haveCover = false;
        bool haveSecret = false;
    };

    void printUsage(std::ostream& err);

    // args excludes the program name.
    bool parseCliArgs(const std::vector<std::string>& args, CliArgs& a);

    // in is read when --in is not given; out receives payload output only.
    ExitCode runCli(const CliArgs& a, std::istream& in, std::ostream& out);

    // Alphabet check, parse, run.
    ExitCode cliMain(const std::vector<std::string>& args,
                     std::istream& in, std::ostream& out);

}

#endif // CLI_HPP
