/**
 * main.cpp
 *
 * Entry point for the ADAU1467 SPI model console.
 *
 *   adau_sim [--variant NAME] [--chip-address N] [--log-level LEVEL] [script]
 */

#include "console.hpp"

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--variant ADAU1467|ADAU1463] [--chip-address N]"
              << " [--log-level noisy|debug|info|warning|error] [script]\n";
}

int main(int argc, char* argv[]) {
    Logger log(std::cerr, LogLevel::Warning);
    DeviceConfig config;
    std::string script;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = (i + 1 < argc);

        if (arg == "--variant" && has_value) {
            config.variant = argv[++i];
        } else if (arg == "--chip-address" && has_value) {
            auto v = parse_number(argv[++i]);
            if (!v || *v > 0x7F) {
                std::cerr << "Invalid chip address: " << argv[i] << "\n";
                return 1;
            }
            config.chip_address = static_cast<Byte>(*v);
        } else if (arg == "--log-level" && has_value) {
            auto level = Logger::parse_level(argv[++i]);
            if (!level) {
                std::cerr << "Invalid log level: " << argv[i] << "\n";
                return 1;
            }
            log.set_threshold(*level);
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && script.empty()) {
            script = arg;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    if (!script.empty() && !std::ifstream(script)) {
        std::cerr << "Cannot open script: " << script << "\n";
        return 1;
    }

    try {
        Adau1467 device(log, config);
        Console console(device, log, std::cout, config.chip_address);

        // If a script is provided, run it first; 'quit' in the script exits
        if (!script.empty() && !console.source(script)) {
            return 0;
        }

        // Run the interactive command loop
        console.run();
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    return 0;
}
