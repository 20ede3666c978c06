#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// Core models
#include "core/AnalysisError.hpp"
#include "core/JournalSnapshot.hpp"

// Input
#include "input/JournalParser.hpp"

// Utils
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"

// Analysis
#include "analysis/DreamSearch.hpp"
#include "analysis/ReportAssembler.hpp"
#include "analysis/ReportConfig.hpp"

// Reporting
#include "report/ConsoleReporter.hpp"
#include "report/JsonReporter.hpp"

namespace
{
    enum ExitCode
    {
        kExitOk             = 0,
        kExitUsage          = 1,
        kExitJournal        = 2,
        kExitInvalidJournal = 3
    };

    // -------------------------
    // CLI
    // -------------------------
    struct CliOptions
    {
        std::string inputFile;
        std::optional<std::string> configFile;
        std::optional<std::string> month;
        std::optional<std::string> topWords;
        std::optional<std::string> asOf;
        std::optional<std::string> search;
        std::optional<std::string> outputFile;
        bool titles  = false;
        bool json    = false;
        bool pretty  = false;
        bool verbose = false;
        bool help    = false;
        std::string error;
    };

    CliOptions parseArgs(int argc, char *argv[])
    {
        CliOptions opts;

        auto takeValue = [&](int &i, const std::string &flag) -> std::optional<std::string> {
            if (i + 1 >= argc)
            {
                opts.error = "missing value for " + flag;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        for (int i = 1; i < argc && opts.error.empty(); ++i)
        {
            const std::string arg = argv[i];

            if (arg == "--config" || arg == "-c")
                opts.configFile = takeValue(i, arg);
            else if (arg == "--month" || arg == "-m")
                opts.month = takeValue(i, arg);
            else if (arg == "--top" || arg == "-n")
                opts.topWords = takeValue(i, arg);
            else if (arg == "--as-of")
                opts.asOf = takeValue(i, arg);
            else if (arg == "--search")
                opts.search = takeValue(i, arg);
            else if (arg == "--output" || arg == "-o")
                opts.outputFile = takeValue(i, arg);
            else if (arg == "--titles")
                opts.titles = true;
            else if (arg == "--json")
                opts.json = true;
            else if (arg == "--pretty")
                opts.pretty = true;
            else if (arg == "--verbose" || arg == "-v")
                opts.verbose = true;
            else if (arg == "--help" || arg == "-h")
                opts.help = true;
            else if (!arg.empty() && arg[0] != '-' && opts.inputFile.empty())
                opts.inputFile = arg;
            else
                opts.error = "unexpected argument '" + arg + "'";
        }

        return opts;
    }

    void printUsage(const char *progName)
    {
        std::cout
            << "Usage: " << progName << " [OPTIONS] journal.txt\n\n"
            << "OPTIONS:\n"
            << "  -c, --config FILE        key = value configuration file\n"
            << "  -m, --month YYYY-MM      Month shown in the calendar (default: current month)\n"
            << "  -n, --top N              Number of top words (default: 10)\n"
            << "      --as-of YYYY-MM-DD   Last day of the weekly summary (default: today)\n"
            << "      --titles             Include dream titles in the word ranking\n"
            << "      --search KEYWORD     List dreams whose title, content or tags contain KEYWORD\n"
            << "      --json               Write the report as JSON\n"
            << "      --pretty             Indent JSON output\n"
            << "  -o, --output FILE        Write the report to FILE instead of stdout\n"
            << "  -v, --verbose            Debug logging\n"
            << "  -h, --help               Show this help\n\n"
            << "EXIT CODES:\n"
            << "  0 success, 1 usage or configuration error,\n"
            << "  2 unreadable or malformed journal, 3 journal violates record rules\n";
    }

    // CLI flags take precedence over the configuration file.
    void applyOverrides(const CliOptions &opts, LucidLog::Utils::ConfigLoader &config)
    {
        if (opts.topWords)
            config.set("top_words", *opts.topWords);
        if (opts.month)
            config.set("calendar_month", *opts.month);
        if (opts.asOf)
            config.set("reference_date", *opts.asOf);
        if (opts.titles)
            config.set("include_titles", "true");
    }

    bool configureLogger(const LucidLog::Utils::ConfigLoader &config, bool verbose)
    {
        auto &logger = LucidLog::Utils::getLogger();

        if (auto name = config.getString("log_level"))
        {
            const auto level = LucidLog::Utils::parseLogLevel(*name);
            if (!level)
            {
                std::cerr << "Error: unknown log_level '" << *name << "'\n";
                return false;
            }
            logger.setLevel(*level);
        }
        if (verbose)
            logger.setLevel(LucidLog::Utils::LogLevel::DEBUG);

        if (auto path = config.getString("log_file"))
        {
            if (!logger.setLogFile(*path))
            {
                std::cerr << "Error: cannot open log file '" << *path << "'\n";
                return false;
            }
        }
        return true;
    }
} // namespace

int main(int argc, char *argv[])
{
    using namespace LucidLog;

    const auto opts = parseArgs(argc, argv);

    if (opts.help)
    {
        printUsage(argv[0]);
        return kExitOk;
    }
    if (!opts.error.empty() || opts.inputFile.empty())
    {
        std::cerr << "Error: " << (opts.error.empty() ? "journal file required." : opts.error) << "\n\n";
        printUsage(argv[0]);
        return kExitUsage;
    }

    // Configuration
    Utils::ConfigLoader config;
    if (opts.configFile)
    {
        if (!config.loadFromFile(*opts.configFile))
        {
            std::cerr << "Error: cannot read config file '" << *opts.configFile << "'\n";
            return kExitUsage;
        }
    }
    applyOverrides(opts, config);

    if (!configureLogger(config, opts.verbose))
        return kExitUsage;

    auto &logger = Utils::getLogger();
    logger.info("Starting LucidLog");
    logger.info("Journal: " + opts.inputFile);
    if (config.malformedLines() > 0)
        logger.warn("Config: skipped " + std::to_string(config.malformedLines()) + " malformed line(s)");

    std::vector<std::string> knownKeys = Analysis::reportConfigKeys();
    knownKeys.insert(knownKeys.end(), {"log_level", "log_file"});
    for (const auto &key : config.unknownKeys(knownKeys))
        logger.warn("Config: ignoring unknown key '" + key + "'");

    Analysis::ReportConfig reportConfig;
    if (auto error = Analysis::loadReportConfig(config, reportConfig))
    {
        logger.error(error->describe());
        std::cerr << "Error: " << error->describe() << "\n";
        return kExitUsage;
    }

    // Journal
    Input::JournalParser parser;
    const auto loaded = parser.loadFile(opts.inputFile);
    if (!loaded.opened)
    {
        std::cerr << "Error: cannot open journal '" << opts.inputFile << "'\n";
        return kExitJournal;
    }
    if (!loaded.errors.empty())
    {
        for (const auto &err : loaded.errors)
            std::cerr << opts.inputFile << ":" << err.line << ": " << err.message << "\n";
        return kExitJournal;
    }

    // Analysis
    const auto result = Analysis::ReportAssembler{}.assemble(loaded.snapshot, reportConfig);
    if (!result.ok())
    {
        std::cerr << "Error: " << result.error->describe() << "\n";
        return result.error->kind == core::AnalysisErrorKind::ConfigurationError ? kExitUsage
                                                                                 : kExitInvalidJournal;
    }

    std::optional<Analysis::DreamSearch::Result> search;
    if (opts.search)
    {
        search = Analysis::DreamSearch{}.search(loaded.snapshot.dreams, *opts.search);
        if (search->error)
        {
            std::cerr << "Error: " << search->error->describe() << "\n";
            return kExitUsage;
        }
    }

    // Output
    std::ofstream file;
    if (opts.outputFile)
    {
        file.open(*opts.outputFile, std::ios::out | std::ios::trunc);
        if (!file.is_open())
        {
            logger.error("Cannot open output file: " + *opts.outputFile);
            std::cerr << "Error: cannot write '" << *opts.outputFile << "'\n";
            return kExitUsage;
        }
    }
    std::ostream &out = opts.outputFile ? static_cast<std::ostream &>(file) : std::cout;

    if (opts.json)
    {
        Report::JsonReporter json(opts.pretty ? Report::JsonReporter::PrettyPrint::PRETTY
                                              : Report::JsonReporter::PrettyPrint::COMPACT);
        json.generateReport(*result.report);
        if (search)
            json.setSearchResult(*opts.search, search->matches);
        json.writeJson(out);
        if (!opts.pretty)
            out << "\n";
    }
    else
    {
        Report::ConsoleReporter console(opts.verbose ? Report::ConsoleReporter::Verbosity::VERBOSE
                                                     : Report::ConsoleReporter::Verbosity::NORMAL,
                                        out);
        console.generateReport(*result.report);
        if (search)
            console.printSearchResult(*opts.search, search->matches, loaded.snapshot.dreams);
    }

    out.flush();
    if (!out)
    {
        logger.error("Failed writing report");
        return kExitUsage;
    }

    logger.info("Done");
    return kExitOk;
}
