#include <cstdlib>
#include <exception>
#include <iostream>

#include "data_capturing/configuration.hpp"
#include "data_capturing/logging.hpp"
#include "data_capturing/version.hpp"

int main() {
    using namespace data_capturing;

    try {
        const Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);

        auto logger = get_logger();
        logger->info("Starting {}", library_identity());

        std::cout << library_identity() << '\n'
                  << "version_number: " << version_number() << '\n'
                  << "version_string: " << version_string() << '\n'
                  << "log_directory: " << configuration.log_directory << '\n'
                  << "track_cleaner.min_speed_mps: " << configuration.track_cleaner.min_speed_mps << '\n'
                  << "track_cleaner.max_speed_mps: " << configuration.track_cleaner.max_speed_mps << '\n'
                  << "track_cleaner.max_accuracy_m: " << configuration.track_cleaner.max_accuracy_m << '\n'
                  << "ascent.ascend_threshold_m: " << configuration.ascent.ascend_threshold_m << '\n'
                  << "ascent.vertical_accuracy_threshold_m: " << configuration.ascent.vertical_accuracy_threshold_m
                  << '\n';
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
