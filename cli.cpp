#include "cli.hpp"
#include "markers.hpp"
#include "metrics.hpp"
#include "text_stego.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace zwstego {

    static bool readInput(const std::string& path, std::istream& in, std::string& out)
    {
        if (path.empty()) {
            out.assign(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
            return !in.bad();
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            std::cerr << "[cli] Failed to open: " << path << std::endl;
            return false;
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        out = ss.str();
        return true;
    }

    static bool writeOutput(const std::string& path, const std::string& data, std::ostream& out)
    {
        if (path.empty()) {
            out << data << std::endl;
            return static_cast<bool>(out);
        }

        std::ofstream file(path, std::ios::binary);
        if (!file || !file.write(data.data(), data.size())) {
            std::cerr << "[cli] Failed to write: " << path << std::endl;
            return false;
        }
        std::cerr << "[embed] Done. Saved: " << path << std::endl;
        return true;
    }

    static ExitCode runStats(const CliArgs& a, std::ostream& out)
    {
        metrics::EmbeddingStats s = metrics::computeStats(a.cover, a.secret);
        out << "cover bytes:    " << s.coverBytes << "\n"
            << "secret bytes:   " << s.secretBytes << "\n"
            << "markers:        " << s.markerCount << "\n"
            << "hidden bytes:   " << s.hiddenBytes << "\n"
            << "combined bytes: " << s.combinedBytes << "\n"
            << "expansion:      " << s.expansion << std::endl;
        return out ? RC_OK : RC_IO;
    }

    void printUsage(std::ostream& err)
    {
        err <<
            "Usage:\n"
            "  zwstego embed   --cover TEXT --secret TEXT [--out FILE]\n"
            "  zwstego extract [--in FILE]\n"
            "  zwstego strip   [--in FILE]\n"
            "  zwstego stats   --cover TEXT --secret TEXT\n"
            "Without --in the text is read from stdin.\n";
    }

    bool parseCliArgs(const std::vector<std::string>& args, CliArgs& a)
    {
        if (args.empty()) return false;
        a.mode = args[0];

        for (size_t i = 1; i < args.size(); i++) {
            const std::string& k = args[i];
            if (i + 1 >= args.size()) {
                std::cerr << "[cli] Missing value for " << k << "\n";
                return false;
            }
            const std::string& v = args[++i];

            if (k == "--cover") { a.cover = v; a.haveCover = true; }
            else if (k == "--secret") { a.secret = v; a.haveSecret = true; }
            else if (k == "--in") a.inPath = v;
            else if (k == "--out") a.outPath = v;
            else {
                std::cerr << "[cli] Unknown arg: " << k << "\n";
                return false;
            }
        }

        if (a.mode == "embed" || a.mode == "stats") {
            return a.haveCover && a.haveSecret;
        }
        return a.mode == "extract" || a.mode == "strip";
    }

    ExitCode runCli(const CliArgs& a, std::istream& in, std::ostream& out)
    {
        if (a.mode == "stats") {
            return runStats(a, out);
        }

        if (a.mode == "embed") {
            std::string combined = embedText(a.cover, a.secret);
            return writeOutput(a.outPath, combined, out) ? RC_OK : RC_IO;
        }

        std::string text;
        if (!readInput(a.inPath, in, text)) {
            return RC_IO;
        }

        if (a.mode == "strip") {
            out << stripMarkers(text);
            return out ? RC_OK : RC_IO;
        }

        std::string secret;
        if (!extractText(text, secret)) {
            return RC_NOT_FOUND;
        }
        out << secret << std::endl;
        return out ? RC_OK : RC_IO;
    }

    ExitCode cliMain(const std::vector<std::string>& args,
                     std::istream& in, std::ostream& out)
    {
        if (!checkMarkerAlphabet()) {
            std::cerr << "[cli] Marker alphabet is inconsistent, expected "
                      << MARKER_SIZE << "-byte markers\n";
            return RC_INTERNAL;
        }

        CliArgs a;
        if (!parseCliArgs(args, a)) {
            printUsage(std::cerr);
            return RC_USAGE;
        }
        return runCli(a, in, out);
    }

}
