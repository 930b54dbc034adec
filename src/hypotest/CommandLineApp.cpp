#include "CommandLineApp.h"
#include <fstream>
#include <iomanip>
#include <memory>
#include <boost/program_options.hpp>
#include "BatchTestRunner.h"
#include "ChiSquareDistribution.h"
#include "FDistribution.h"
#include "HypothesisTestException.h"
#include "HypothesisTestRunner.h"
#include "InputParsing.h"
#include "NormalDistribution.h"
#include "ResultSerializer.h"
#include "StudentTDistribution.h"
#include "utils/OutputUtils.h"

namespace po = boost::program_options;

namespace hypotest {

namespace {

    const std::vector<std::string> kNoArgs;

    void requireArgs(const std::vector<std::string>& args, std::size_t minCount, std::size_t maxCount,
                     const std::string& command) {
        if (args.size() < minCount || args.size() > maxCount)
            throw po::error("wrong number of arguments for '" + command + "'");
    }

    EngineConfiguration buildConfiguration(const po::variables_map& vm) {
        EngineConfiguration config = EngineConfiguration::createDefault();

        if (vm.count("config")) {
            const std::string path = vm["config"].as<std::string>();
            if (!config.loadFromFile(path))
                throw InvalidParameterException(config.getLastError());
        }

        if (vm.count("alpha"))
            config.setAlpha(parseNumber(vm["alpha"].as<std::string>(), "--alpha"));
        if (vm.count("threads"))
            config.setThreads(parseCount(vm["threads"].as<std::string>(), "--threads"));
        if (vm.count("log"))
            config.setLogFile(vm["log"].as<std::string>());
        if (vm.count("format")) {
            OutputFormat format;
            const std::string text = vm["format"].as<std::string>();
            if (!EngineConfiguration::parseOutputFormat(text, format))
                throw InvalidParameterException("Unknown output format '" + text + "' (expected text or json)");
            config.setOutputFormat(format);
        }

        const std::vector<std::string> errors = config.validate();
        if (!errors.empty()) {
            std::string message = "Invalid configuration: " + errors.front();
            for (std::size_t i = 1; i < errors.size(); ++i)
                message += "; " + errors[i];
            throw InvalidParameterException(message);
        }

        return config;
    }

    template<typename Result>
    void report(const Result& result, OutputFormat format, std::ostream& os) {
        if (format == OutputFormat::Json)
            os << ResultSerializer::toJson(result);
        else
            ResultSerializer::writeText(result, os);
    }

    double quantile(const std::vector<std::string>& args) {
        const std::string& dist = args[0];
        const double p = parseNumber(args[1], "probability");

        if (dist == "normal") {
            requireArgs(args, 2, 2, "quantile normal");
            return NormalDistribution::inverseCdf(p);
        }
        if (dist == "t") {
            requireArgs(args, 3, 3, "quantile t");
            return StudentTDistribution::inverseCdf(p, parseNumber(args[2], "degrees of freedom"));
        }
        if (dist == "chi-square") {
            requireArgs(args, 3, 3, "quantile chi-square");
            return ChiSquareDistribution::inverseCdf(p, parseNumber(args[2], "degrees of freedom"));
        }
        if (dist == "f") {
            requireArgs(args, 4, 4, "quantile f");
            return FDistribution::inverseCdf(p, parseNumber(args[2], "numerator degrees of freedom"),
                                             parseNumber(args[3], "denominator degrees of freedom"));
        }
        throw InvalidParameterException("Unknown distribution '" + dist +
                                        "' (expected normal, t, chi-square or f)");
    }

    int execute(const std::string& command,
                const std::vector<std::string>& args,
                const po::variables_map& vm,
                const EngineConfiguration& config,
                std::ostream& os,
                std::ostream& progress) {
        const HypothesisTestRunner runner(config);
        const OutputFormat format = config.getOutputFormat();

        if (command == "t-test") {
            requireArgs(args, 2, 2, command);
            report(runner.runTTest(parseSample(args[0]), parseSample(args[1]),
                                   vm.count("equal-variance") > 0),
                   format, os);
        }
        else if (command == "mann-whitney") {
            requireArgs(args, 2, 2, command);
            report(runner.runMannWhitney(parseSample(args[0]), parseSample(args[1])), format, os);
        }
        else if (command == "anova") {
            requireArgs(args, 1, 1, command);
            report(runner.runAnova(parseGroups(args[0])), format, os);
        }
        else if (command == "chi-square") {
            requireArgs(args, 1, 1, command);
            report(runner.runChiSquare(parseContingencyTable(args[0])), format, os);
        }
        else if (command == "power") {
            requireArgs(args, 2, 2, command);
            report(runner.runPower(parseNumber(args[0], "effect size"),
                                   parseCount(args[1], "sample size")),
                   format, os);
        }
        else if (command == "sample-size") {
            requireArgs(args, 2, 2, command);
            report(runner.runSampleSize(parseNumber(args[0], "effect size"),
                                        parseNumber(args[1], "target power")),
                   format, os);
        }
        else if (command == "series") {
            requireArgs(args, 2, 2, command);
            report(runner.runOnSeries(args[0], parseSample(args[1])), format, os);
        }
        else if (command == "run") {
            if (args.size() != 2 && args.size() != 4)
                throw po::error("wrong number of arguments for 'run'");
            const std::string null = args.size() == 4 ? args[2] : std::string();
            const std::string alt = args.size() == 4 ? args[3] : std::string();
            report(runner.run(args[0], args[1], null, alt), format, os);
        }
        else if (command == "batch") {
            requireArgs(args, 1, 1, command);
            const BatchTestRunner batch(config);
            const auto results = batch.run(BatchTestRunner::loadJobsFromFile(args[0]), progress);
            report(results, format, os);

            for (const auto& r : results) {
                if (!r.succeeded())
                    return CommandLineApp::kFailure;
            }
        }
        else if (command == "quantile") {
            if (args.size() < 2)
                throw po::error("wrong number of arguments for 'quantile'");
            os << std::setprecision(10) << quantile(args) << std::endl;
        }
        else {
            throw po::error("unknown command '" + command + "'");
        }

        return CommandLineApp::kSuccess;
    }
}

void CommandLineApp::usage(std::ostream& os) {
    os << "Usage: hypotest [options] <command> <args...>\n\n"
       << "Commands:\n"
       << "  t-test SAMPLE1 SAMPLE2 [--equal-variance]\n"
       << "  anova JSON                      e.g. '[[1,2,3],[4,5,6]]'\n"
       << "  chi-square JSON                 e.g. '[[10,20],[30,40]]'\n"
       << "  mann-whitney SAMPLE1 SAMPLE2\n"
       << "  power EFFECT N\n"
       << "  sample-size EFFECT TARGET_POWER\n"
       << "  series TEST SERIES              t-test, mann-whitney or anova on one series\n"
       << "  run TEST DATA [NULL ALT]        DATA is 'a,b|c,d' or a JSON nested array\n"
       << "  batch FILE\n"
       << "  quantile normal|t|chi-square|f P [DF1 [DF2]]\n\n"
       << "Samples are comma separated, e.g. '1.5,2.1,3.0'.\n";
}

int CommandLineApp::run(int argc, const char* const argv[], std::ostream& out, std::ostream& err) const {
    po::options_description desc("Options");
    desc.add_options()
        ("help", "Show help message")
        ("config", po::value<std::string>(), "JSON configuration file")
        ("alpha", po::value<std::string>(), "Significance level")
        ("format", po::value<std::string>(), "Output format: text or json")
        ("log", po::value<std::string>(), "Copy output to this file")
        ("threads", po::value<std::string>(), "Batch worker threads (0 = hardware)")
        ("equal-variance", "Pooled variance t-test");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>())
        ("args", po::value<std::vector<std::string>>());

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    try {
        // Short options are disabled so that negative numbers reach the commands
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .style(po::command_line_style::unix_style ^ po::command_line_style::allow_short)
                      .run(),
                  vm);
        po::notify(vm);

        if (vm.count("help")) {
            usage(out);
            out << "\n" << desc << std::endl;
            return kSuccess;
        }

        if (!vm.count("command")) {
            usage(err);
            return kUsageError;
        }

        const EngineConfiguration config = buildConfiguration(vm);
        const std::string command = vm["command"].as<std::string>();
        const std::vector<std::string>& args =
            vm.count("args") ? vm["args"].as<std::vector<std::string>>() : kNoArgs;

        // JSON output stays parseable: batch progress goes to the error stream
        const bool json = config.getOutputFormat() == OutputFormat::Json;

        if (config.getLogFile().empty())
            return execute(command, args, vm, config, out, json ? err : out);

        std::ofstream logFile(config.getLogFile(), std::ios::app);
        if (!logFile.is_open())
            throw InvalidParameterException("Could not open log file: " + config.getLogFile());

        utils::TeeStream tee(out, logFile);
        const int status = execute(command, args, vm, config, tee, json ? err : static_cast<std::ostream&>(tee));
        tee.flush();
        return status;
    }
    catch (const po::error& e) {
        err << "Error: " << e.what() << "\n\n";
        usage(err);
        return kUsageError;
    }
    catch (const HypothesisTestException& e) {
        err << "Error: " << e.what() << std::endl;
        return kFailure;
    }
    catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return kFailure;
    }
}

int CommandLineApp::run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) const {
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    argv.push_back("hypotest");
    for (const auto& a : args)
        argv.push_back(a.c_str());

    return run(static_cast<int>(argv.size()), argv.data(), out, err);
}

} // namespace hypotest
