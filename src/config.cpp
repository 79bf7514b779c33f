#include "sortsel/config.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <boost/program_options.hpp>
#include <fstream>
#include <sstream>

#include "sortsel/exceptions.hpp"

namespace po = boost::program_options;

namespace sortsel {

const std::vector<std::string> Config::known_algorithms{
    "quick", "quick3", "heap", "intro", "select", "pq"};

namespace {
// no default_value() anywhere: a value only lands in its field when the
// option was actually given, so a later source overrides an earlier one
// without resetting what it does not mention
po::options_description options(Config &conf) {
    po::options_description opts("sort_analysis options");
    opts.add_options()
        ("files", po::value<std::vector<std::string>>(&conf.files),
         "input key files")
        ("algorithms,a",
         po::value<std::vector<std::string>>(&conf.algorithms)->multitoken(),
         "algorithms to run: quick quick3 heap intro select pq")
        ("results,o", po::value<std::string>(&conf.results_csv),
         "CSV file results are appended to")
        ("runs,r", po::value<int>(&conf.runs), "runs per input file")
        ("seed,s", po::value<uint64_t>(&conf.seed), "shuffle seed")
        ("select-rank,k", po::value<double>(&conf.select_rank),
         "rank for select as a fraction of n-1, in [0, 1]")
        ("binary,b", po::value<bool>(&conf.binary_input)->implicit_value(true),
         "input files hold raw uint32 keys")
        ("validate", po::value<bool>(&conf.validate)->implicit_value(true),
         "check every result against a reference")
        ("verbose,v", po::value<bool>(&conf.verbose)->implicit_value(true),
         "trace logging");
    return opts;
}
}  // namespace

bool Config::parse(const char *config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) return false;

    po::variables_map vm;
    try {
        po::store(po::parse_config_file(file, options(*this)), vm);
        po::notify(vm);
    } catch (const po::error &e) {
        throw invalid_argument(std::string(config_file) + ": " + e.what());
    }
    return true;
}

void Config::parse(int argc, char **argv) {
    po::options_description opts = options(*this);
    opts.add_options()("help,h", po::bool_switch(&help), "print help message");
    po::positional_options_description popts;
    popts.add("files", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(opts)
                      .positional(popts)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error &e) {
        throw invalid_argument(e.what());
    }
}

void Config::check() const {
    if (runs < 1) {
        throw invalid_argument("runs must be at least 1");
    }
    if (!(select_rank >= 0.0 && select_rank <= 1.0)) {
        throw invalid_argument(
            fmt::format("select-rank {} outside [0, 1]", select_rank));
    }
    for (const auto &algorithm : algorithms) {
        if (std::find(known_algorithms.begin(), known_algorithms.end(),
                      algorithm) == known_algorithms.end()) {
            throw invalid_argument("unknown algorithm: " + algorithm);
        }
    }
}

void Config::print(utils::logging::Logger &log) const {
    log.info("files: {}", fmt::join(files, " "));
    log.info("algorithms: {}", fmt::join(algorithms, " "));
    log.info("results: {}", results_csv);
    log.info("runs: {}", runs);
    log.info("seed: {}", seed);
    log.info("select rank: {}", select_rank);
    log.info("binary input: {}", binary_input);
    log.info("validate: {}", validate);
}

std::string Config::usage() const {
    Config scratch;
    std::ostringstream os;
    os << "usage: sort_analysis [options] <input_file>...\n"
       << options(scratch) << '\n';
    return os.str();
}

}  // namespace sortsel
