#include "encounter_engine.hpp"
#include <iostream>
#include <string>

void showUsage(const char* program_name) {
    std::cout << "Encounter Tracker - counts creature encounters read from the screen\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -m, --models DIR        Models directory (default: ../../models)\n";
    std::cout << "  -s, --state FILE        State file (default: state.json)\n";
    std::cout << "  -n, --new               Start from an empty state instead of loading FILE\n";
    std::cout << "  -d, --display NAME      X display to capture (default: $DISPLAY)\n";
    std::cout << "  -f, --frames N          Detection window; N-1 frames per cycle (default: 4)\n";
    std::cout << "  -i, --interval MS       Delay between cycles (default: 400)\n";
    std::cout << "  -b, --brightness N      Brightness shift applied before OCR (default: -50)\n";
    std::cout << "  -c, --cuda              Enable CUDA acceleration\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -n                       # First session, creates state.json\n";
    std::cout << "  " << program_name << " -s runs/route1.json       # Continue a saved session\n";
    std::cout << "  " << program_name << " -c -f 6 -i 250            # CUDA, more frames, faster polling\n";
}

bool parseInt(const std::string& text, int& value) {
    try {
        size_t used = 0;
        value = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    EngineOptions options;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        int number = 0;

        if (arg == "-h" || arg == "--help") {
            showUsage(argv[0]);
            return 0;
        } else if ((arg == "-m" || arg == "--models") && i + 1 < argc) {
            options.models_dir = argv[++i];
        } else if ((arg == "-s" || arg == "--state") && i + 1 < argc) {
            options.state_path = argv[++i];
        } else if ((arg == "-d" || arg == "--display") && i + 1 < argc) {
            options.display_name = argv[++i];
        } else if ((arg == "-f" || arg == "--frames") && i + 1 < argc) {
            if (!parseInt(argv[++i], number) || number < 2) {
                std::cerr << "Error: --frames needs an integer >= 2" << std::endl;
                return 1;
            }
            options.tracker.detect_frames = number;
        } else if ((arg == "-i" || arg == "--interval") && i + 1 < argc) {
            if (!parseInt(argv[++i], number) || number < 0) {
                std::cerr << "Error: --interval needs a non-negative number of milliseconds" << std::endl;
                return 1;
            }
            options.tracker.cycle_delay = std::chrono::milliseconds(number);
        } else if ((arg == "-b" || arg == "--brightness") && i + 1 < argc) {
            if (!parseInt(argv[++i], number)) {
                std::cerr << "Error: --brightness needs an integer" << std::endl;
                return 1;
            }
            options.normalizer.brightness = number;
        } else if (arg == "-n" || arg == "--new") {
            options.fresh_state = true;
        } else if (arg == "-c" || arg == "--cuda") {
            options.use_cuda = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            showUsage(argv[0]);
            return 1;
        }
    }

    try {
        EncounterState state;
        if (options.fresh_state) {
            std::cout << "Starting a new session in " << options.state_path << std::endl;
        } else {
            state = StateStore(options.state_path).Load();
            std::cout << "Loaded " << options.state_path << ": " << state.encounters << " encounters so far" << std::endl;
        }

        EncounterEngine engine(options);

        ModeSwitch mode_switch;
        ConsoleReader console(mode_switch, std::cin, std::cout);

        std::cout << "Commands: 'start', 'pause', 'status', 'quit'" << std::endl;
        engine.Run(state, mode_switch);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
