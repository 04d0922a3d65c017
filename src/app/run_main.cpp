#include "config/run_config.h"
#include "config/run_executor.h"
#include "config/setup_writer.h"
#include "control/command_handler.h"
#include "simulation/simulation.h"
#include "common/logger.h"
#include <iostream>
#include <string>
#include <vector>

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <mode> -i <file> [options]\n"
              << "Modes:\n"
              << "  --run                 Execute the run file given with -i\n"
              << "  --setup               Write <trace>.ini for the trace given with -i\n"
              << "  --console             Read commands for the trace given with -i from stdin\n"
              << "Options:\n"
              << "  -i, --input <file>    Run file (--run) or trace file (--setup, --console)\n"
              << "  --point <lat,lon,pattern>\n"
              << "                        Place a drone (--setup, repeatable);\n"
              << "                        pattern: circular, angular, tractor, static, square\n"
              << "  --log-level <level>   DEBUG, INFO, WARN, ALARM, ERROR, FATAL (default: INFO)\n"
              << "  --help                Show this help\n";
}

bool parse_placed_point(const std::string& text, dts::PlacedPoint& out) {
    auto last = text.find_last_of(',');
    if (last == std::string::npos)
        return false;
    std::string pattern = text.substr(last + 1);
    auto first = pattern.find_first_not_of(" \t");
    if (first == std::string::npos)
        return false;
    pattern = pattern.substr(first);

    return dts::parse_point(text.substr(0, last), out.point) &&
           dts::parse_pattern_kind(pattern, out.kind);
}

int run_console(dts::Simulation& sim) {
    dts::CommandHandler handler(sim, dts::Logger::instance());
    std::string line;
    while (std::getline(std::cin, line)) {
        auto start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos)
            continue;
        line = line.substr(start);
        auto end = line.find_last_not_of(" \t\r");
        line = line.substr(0, end + 1);

        std::string verb = line.substr(0, line.find_first_of(" \t"));
        if (verb == "QUIT" || verb == "quit" || verb == "EXIT" || verb == "exit")
            break;
        std::cout << handler.handle(line) << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    enum class Mode { NONE, RUN, SETUP, CONSOLE };
    Mode mode = Mode::NONE;
    std::string input;
    std::vector<dts::PlacedPoint> points;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--run") {
            mode = Mode::RUN;
        } else if (arg == "--setup") {
            mode = Mode::SETUP;
        } else if (arg == "--console") {
            mode = Mode::CONSOLE;
        } else if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            input = argv[++i];
        } else if (arg == "--point" && i + 1 < argc) {
            dts::PlacedPoint pp;
            std::string text = argv[++i];
            if (!parse_placed_point(text, pp)) {
                std::cerr << "Invalid point: " << text << "\n";
                print_usage(argv[0]);
                return 1;
            }
            points.push_back(pp);
        } else if (arg == "--log-level" && i + 1 < argc) {
            dts::Severity level;
            if (!dts::parse_severity(argv[++i], level)) {
                std::cerr << "Invalid log level: " << argv[i] << "\n";
                return 1;
            }
            dts::Logger::instance().set_level(level);
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (mode == Mode::NONE) {
        std::cerr << "Error: no mode given. Use --run, --setup or --console\n";
        print_usage(argv[0]);
        return 1;
    }
    if (input.empty()) {
        std::cerr << "Error: --input is required\n";
        print_usage(argv[0]);
        return 1;
    }

    // Replies and vehicle dumps own stdout
    dts::Logger::instance().set_output(std::cerr);

    try {
        switch (mode) {
            case Mode::RUN: {
                dts::RunExecutor executor(std::cout);
                auto sim = executor.run(dts::load_run_config(input));
                const auto& report = executor.report();
                std::cerr << "Run complete: " << report.sections_run << " sections, "
                          << report.sections_skipped << " skipped, "
                          << report.created_ids.size() << " drones, "
                          << sim->vehicle_count() << " agents\n";
                return 0;
            }
            case Mode::SETUP: {
                auto doc = dts::TraceDocument::load_file(input);
                std::string path = dts::write_setup_config(input, points, doc.bounds());
                std::cerr << "Run file written: " << path << "\n";
                return 0;
            }
            case Mode::CONSOLE: {
                auto sim = dts::Simulation::from_file(input);
                return run_console(*sim);
            }
            case Mode::NONE:
                break;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 1;
}
