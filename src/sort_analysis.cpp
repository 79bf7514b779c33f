#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "sortsel/config.hpp"
#include "sortsel/utils/executor.hpp"
#include "sortsel/utils/logging.hpp"
#include "sortsel/utils/utils.hpp"

using key_type = uint32_t;

int main(int argc, char **argv) {
    // initialize logger
    auto &log = sortsel::utils::logging::Logger::get_instance();

    try {
        std::string config_file = "sortsel.cfg";
        sortsel::Config conf;
        if (!sortsel::utils::infra::config::load_configurations(conf,
                                                                config_file)) {
            log.debug("No {} found, using defaults", config_file);
        }
        sortsel::utils::infra::config::load_configurations(conf, argc, argv);

        if (conf.help) {
            std::cout << conf.usage();
            return 0;
        }
        if (conf.files.empty()) {
            log.error("Usage: ./sort_analysis [options] <input_file>...");
            return -1;
        }
        conf.check();
        log.set_verbose(conf.verbose);
        sortsel::utils::infra::config::print_configurations(conf);

        log.info("Writing CSV Results to: {}", conf.results_csv);

        std::vector<std::vector<key_type>> data;
        sortsel::utils::infra::load::load_data(data, conf);

        sortsel::utils::executor::Workload<key_type> workload(conf);
        const size_t failures = workload.run_all(data);
        if (failures) {
            log.error("{} results failed validation", failures);
            return 1;
        }
    } catch (const std::exception &e) {
        log.error("{}", e.what());
        return 1;
    }
    return 0;
}
