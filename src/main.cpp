// file main.cpp:

#include "UniqueCopy/UniqueCopy.hpp"
#include "cxxopts.hpp"

#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

#ifndef UNIQOPY_VERSION
#define UNIQOPY_VERSION "0.0.0"
#endif

namespace
{

constexpr const char* ProgramName = "uniqopy";

// The timestamp is local time, not UTC.
constexpr const char* UsageText = R"(
usage: uniqopy <file>

Create a copy of a file incorporating its MD5 hash and the current
local timestamp into the new file's name. The file's extension will
be retained.

Use `--` before a file name that starts with a dash:
    uniqopy -- -v.txt

Examples:
    example -> example.2022-02-02-22:22:22.d41d8cd98f00b204e9800998ecf8427e
    example.txt -> example.2022-02-02-22:22:22.d41d8cd98f00b204e9800998ecf8427e.txt
)";

/**
 * @brief Outcome of command-line parsing.
 */
enum class ParseStatus
{
    Run,      /**< Exactly one source file was given */
    Exit,     /**< Help or version was printed */
    Usage     /**< Arguments were invalid */
};

void PrintUsageError()
{
    std::cerr << ProgramName << " version " << UNIQOPY_VERSION << '\n' << UsageText;
}

/**
 * @brief Parses command-line arguments using cxxopts.
 *
 * @param[in] argc Argument count.
 * @param[in] argv Argument values.
 * @param[out] config Configuration filled from the arguments when ParseStatus::Run is returned.
 * @return ParseStatus::Run when a copy should be performed, ParseStatus::Exit when help or
 *         version was shown, ParseStatus::Usage when the arguments are invalid.
 */
ParseStatus ParseCommandLineOptions(int argc, char* argv[], CopyConfig& config)
{
    cxxopts::Options options(ProgramName, "Copy a file to a name carrying its timestamp and MD5 hash");

    // clang-format off
    options.add_options()
        ("file",      "File to copy", cxxopts::value<std::string>())
        ("v,verbose", "Verbose output")
        ("V,version", "Print version")
        ("h,help",    "Print help");
    // clang-format on

    options.parse_positional({"file"});
    options.positional_help("<file>");

    std::optional<cxxopts::ParseResult> parseResult;
    try
    {
        parseResult = options.parse(argc, argv);
    }
    catch (const cxxopts::exceptions::exception& exception)
    {
        std::cerr << exception.what() << '\n';
        return ParseStatus::Usage;
    }

    if (0 < parseResult->count("help"))
    {
        std::cout << UsageText << '\n' << options.help() << '\n';
        return ParseStatus::Exit;
    }

    if (0 < parseResult->count("version"))
    {
        std::cout << ProgramName << " version " << UNIQOPY_VERSION << '\n';
        return ParseStatus::Exit;
    }

    if (0 == parseResult->count("file"))
    {
        return ParseStatus::Usage;
    }

    // Positionals beyond the first are left unmatched.
    if (false == parseResult->unmatched().empty())
    {
        return ParseStatus::Usage;
    }

    config.sourceFile = fs::path((*parseResult)["file"].as<std::string>());
    config.verbose = (0 < parseResult->count("verbose"));
    return ParseStatus::Run;
}

/**
 * @brief Installs the progress handler that prints the copy report.
 *
 * The copying and copied stages are always printed; the remaining stages only
 * in verbose mode.
 *
 * @param[in,out] config Configuration to attach the handler to.
 */
void SetupProgressReporting(CopyConfig& config)
{
    const bool verbose = config.verbose;
    config.onProgress = [verbose](const CopyProgress& progress)
    {
        if (0 == std::strcmp(progress.stage, "copying"))
        {
            std::cout << "Copying " << progress.source.string() << " to " << progress.destination.string() << '\n';
        }
        else if (0 == std::strcmp(progress.stage, "copied"))
        {
            std::cout << "Copied " << progress.bytes << " bytes\n";
        }
        else if (true == verbose)
        {
            std::cout << "[" << progress.stage << "] " << progress.source.string() << '\n';
        }
    };
}

} // namespace

int main(int argc, char* argv[])
{
    CopyConfig config;

    const ParseStatus parseStatus = ParseCommandLineOptions(argc, argv, config);
    if (ParseStatus::Exit == parseStatus)
    {
        return 0;
    }
    if (ParseStatus::Usage == parseStatus)
    {
        PrintUsageError();
        return CopyErrorKindToExitCode(CopyErrorKind::Usage);
    }

    SetupProgressReporting(config);

    const CopyOutcome outcome = RunUniqueCopy(config);
    if (CopyErrorKind::None != outcome.kind)
    {
        std::cerr << outcome.message << '\n';
        return CopyErrorKindToExitCode(outcome.kind);
    }

    if (true == config.verbose)
    {
        std::cout << "Copy completed successfully\n";
    }

    return 0;
}
