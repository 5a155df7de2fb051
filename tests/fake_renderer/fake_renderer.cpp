//
// Stand-in for the PlantUML command line used by the process tests.
//
// Accepts the same flags (-tsvg/-tpng/-ttxt with -pipe, or -pipemap), reads
// the whole diagram from stdin and answers on stdout. Lines of the form
//   'fake: <directive> [argument]
// inside the diagram steer the failure modes:
//   exit N       exit with status N after writing output
//   stderr TEXT  write TEXT to stderr
//   no-output    write nothing to stdout
//   no-map       -pipemap produces an empty map
//   sleep MS     wait MS milliseconds before answering
//
// Environment:
//   FAKE_RENDERER_LOG    append one line per launch (the arguments) to this file
//   FAKE_RENDERER_FLOOD  write this many bytes to stdout and stderr before reading stdin
//

#include <chrono>
#include <cstdlib>
#include <system_error>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>

namespace {

struct Directives {
    int exitCode = 0;
    std::string stderrText;
    bool noOutput = false;
    bool noMap = false;
    long sleepMs = 0;
};

Directives parseDirectives(const std::string& source)
{
    Directives d;
    std::istringstream lines(source);
    std::string line;
    const std::string marker = "'fake: ";
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const auto pos = line.find(marker);
        if (pos == std::string::npos) {
            continue;
        }
        const std::string directive = line.substr(pos + marker.size());
        if (directive.rfind("exit ", 0) == 0) {
            d.exitCode = std::atoi(directive.c_str() + 5);
        } else if (directive.rfind("stderr ", 0) == 0) {
            d.stderrText += directive.substr(7) + "\n";
        } else if (directive == "no-output") {
            d.noOutput = true;
        } else if (directive == "no-map") {
            d.noMap = true;
        } else if (directive.rfind("sleep ", 0) == 0) {
            d.sleepMs = std::atol(directive.c_str() + 6);
        }
    }
    return d;
}

std::string xmlEscape(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        default: out += c; break;
        }
    }
    return out;
}

std::string currentDirectory()
{
    std::error_code ec;
    const std::filesystem::path cwd = std::filesystem::current_path(ec);
    return ec ? std::string() : cwd.string();
}

std::string joinArgs(int argc, char** argv)
{
    std::string joined;
    for (int i = 1; i < argc; ++i) {
        if (i > 1) {
            joined += ' ';
        }
        joined += argv[i];
    }
    return joined;
}

} // namespace

int main(int argc, char** argv)
{
    std::ios::sync_with_stdio(false);

    const std::string args = joinArgs(argc, argv);

    if (const char* logPath = std::getenv("FAKE_RENDERER_LOG")) {
        std::ofstream log(logPath, std::ios::app);
        log << args << "\n";
    }

    if (const char* flood = std::getenv("FAKE_RENDERER_FLOOD")) {
        const long bytes = std::atol(flood);
        if (bytes > 0) {
            const std::string burst(static_cast<size_t>(bytes), 'x');
            std::cerr << burst << std::flush;
            std::cout << burst << std::flush;
        }
    }

    const std::string source((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    const Directives directives = parseDirectives(source);

    if (directives.sleepMs > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(directives.sleepMs));
    }

    std::string format;
    bool pipeMap = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-pipemap") {
            pipeMap = true;
        } else if (arg.rfind("-t", 0) == 0 && arg.size() > 2) {
            format = arg.substr(2);
        }
    }

    std::cerr << directives.stderrText << std::flush;

    if (!directives.noOutput) {
        if (pipeMap) {
            if (!directives.noMap) {
                std::cout << "<map id=\"plantuml_map\" name=\"plantuml_map\">\n"
                          << "<area shape=\"rect\" id=\"id1\" href=\"https://example.com/\" coords=\"0,0,10,10\"/>\n"
                          << "</map>\n";
            }
        } else if (format == "svg") {
            std::cout << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>"
                      << "<svg xmlns=\"http://www.w3.org/2000/svg\">"
                      << "<!-- cwd: " << currentDirectory() << " -->"
                      << "<!-- args: " << args << " -->"
                      << "<text>" << xmlEscape(source) << "</text></svg>\n";
        } else if (format == "png") {
            static const char signature[] = {'\x89', 'P', 'N', 'G', '\r', '\n', '\x1a', '\n', '\0', '\x01', '\xff'};
            std::cout.write(signature, sizeof(signature));
            std::cout << source;
        } else if (format == "txt") {
            std::cout << "ASCII\n" << source;
        }
    }
    std::cout << std::flush;

    return directives.exitCode;
}
