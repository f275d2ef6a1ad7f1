// branta, infers a context-free grammar from guide strings and labeled positive and negative examples.
#include "branta/DumpPopulationJSON.hpp"
#include "branta/ErrorReporter.hpp"
#include "branta/ExampleFile.hpp"
#include "branta/Grammar.hpp"
#include "branta/Search.hpp"

#include "fmt/format.h"
#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <random>

DEFINE_string(guides, "", "Path to a file of guide strings, one per line, used to seed the search.");
DEFINE_string(positives, "", "Path to a file of strings the grammar should accept. Defaults to the guides.");
DEFINE_string(negatives, "", "Path to a file of strings the grammar should reject.");
DEFINE_string(outputFile, "", "Path to write the best grammar to. Prints to stdout if empty.");
DEFINE_string(jsonReport, "", "Optional path to write a JSON report of the final population.");
DEFINE_uint64(generations, 30, "Number of generations to run.");
DEFINE_uint64(populationSize, 20, "Maximum number of candidate grammars kept between generations.");
DEFINE_bool(stopWhenGoodEnough, false, "Stop early once a grammar accepts every positive and rejects every negative.");
DEFINE_uint64(seed, 0, "Random seed, or 0 to draw one from the system.");
DEFINE_uint64(parseBudget, branta::EarleyParser::kDefaultBudget, "Maximum parser chart items per membership test.");
DEFINE_string(logLevel, "info", "One of trace, debug, info, warn, error, critical, off.");

namespace {

bool readExamples(const std::string& path, std::shared_ptr<branta::ErrorReporter> errorReporter,
        std::vector<std::string>& examples) {
    branta::ExampleFile file(path);
    if (!file.read(errorReporter)) {
        return false;
    }
    examples = file.examples();
    return true;
}

bool writeFile(const std::string& path, const std::string& contents,
        std::shared_ptr<branta::ErrorReporter> errorReporter) {
    std::ofstream outFile(path, std::ofstream::binary);
    if (!outFile) {
        errorReporter->addFileOpenError(path);
        return false;
    }
    outFile << contents;
    if (!outFile) {
        errorReporter->addError(fmt::format("Error writing file '{}'.", path));
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("Infers a context-free grammar approximating a set of labeled examples.");
    gflags::ParseCommandLineFlags(&argc, &argv, false);

    spdlog::set_level(spdlog::level::from_str(FLAGS_logLevel));

    auto errorReporter = std::make_shared<branta::ErrorReporter>();
    if (FLAGS_guides.empty()) {
        errorReporter->addError("--guides is required.");
        return -1;
    }

    std::vector<std::string> guides;
    if (!readExamples(FLAGS_guides, errorReporter, guides)) {
        return -1;
    }
    std::vector<std::string> positives;
    if (FLAGS_positives.empty()) {
        positives = guides;
    } else if (!readExamples(FLAGS_positives, errorReporter, positives)) {
        return -1;
    }
    std::vector<std::string> negatives;
    if (!FLAGS_negatives.empty() && !readExamples(FLAGS_negatives, errorReporter, negatives)) {
        return -1;
    }

    branta::SearchOptions options;
    options.generations = FLAGS_generations;
    options.populationSize = FLAGS_populationSize;
    options.stopWhenGoodEnough = FLAGS_stopWhenGoodEnough;
    options.parseBudget = FLAGS_parseBudget;
    options.seed = FLAGS_seed;
    if (options.seed == 0) {
        std::random_device device;
        options.seed = device();
    }
    SPDLOG_INFO("Random seed {}", options.seed);

    branta::Search search(std::move(guides), std::move(positives), std::move(negatives), options, errorReporter);
    if (!search.run()) {
        return -1;
    }

    const std::string& rendering = search.best().grammar->render();
    if (FLAGS_outputFile.empty()) {
        std::cout << rendering;
    } else if (!writeFile(FLAGS_outputFile, rendering, errorReporter)) {
        return -1;
    }

    if (!FLAGS_jsonReport.empty() && !writeFile(FLAGS_jsonReport, branta::DumpPopulationJSON(search), errorReporter)) {
        return -1;
    }

    return 0;
}
