/**
 * story_replay — Headless driver for the story rule core.
 *
 * Loads a story bundle, optionally applies a saved snapshot, plays a command
 * script through the turn coordinator and writes a transcript of every
 * command's tagged output.
 *
 * Usage:
 *   story_replay --world <path> --script <path> [--load <snapshot>]
 *                [--seed S] [--retention N] [--fallback TEXT]
 *                [--text] [--output <path>] [--log-level L] [--verbose]
 */

#include "replay/script_runner.hpp"
#include "replay/transcript_writer.hpp"
#include "io/json_reader.hpp"
#include "io/snapshot.hpp"
#include "io/world_loader.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include <fstream>
#include <iostream>
#include <string>

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --world <path> --script <path> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --world <path>       Story bundle JSON (required)\n"
              << "  --script <path>      Command script JSON (required)\n"
              << "  --load <path>        Snapshot applied before the script\n"
              << "  --seed S             Override the bundle RNG seed\n"
              << "  --retention N        Tombstone retention in turns (default: 1000, 0 = keep all)\n"
              << "  --fallback TEXT      Message when no trigger reacts (default: \"Nothing happens.\")\n"
              << "  --output <path>      Transcript file (default: stdout)\n"
              << "  --text               Plain-text transcript instead of JSON\n"
              << "  --log-level L        debug, info, warn, error or off (default: warn)\n"
              << "  --verbose            Same as --log-level info\n"
              << "  --help               Show this message\n";
}

int main(int argc, char* argv[]) {
    story::ReplayConfig config;
    bool text_mode = false;

    // Parse CLI arguments
    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--world" && i + 1 < argc) {
                config.world_path = argv[++i];
            } else if (arg == "--script" && i + 1 < argc) {
                config.script_path = argv[++i];
            } else if (arg == "--load" && i + 1 < argc) {
                config.load_path = argv[++i];
            } else if (arg == "--seed" && i + 1 < argc) {
                config.core.seed = static_cast<int32_t>(std::stol(argv[++i]));
            } else if (arg == "--retention" && i + 1 < argc) {
                config.core.tombstone_retention = std::stoull(argv[++i]);
            } else if (arg == "--fallback" && i + 1 < argc) {
                config.core.fallback_message = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                config.output_path = argv[++i];
            } else if (arg == "--text") {
                text_mode = true;
            } else if (arg == "--log-level" && i + 1 < argc) {
                config.core.log_level = story::Log::parse_level(argv[++i]);
            } else if (arg == "--verbose" || arg == "-v") {
                config.core.verbose = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: bad argument value: " << e.what() << "\n";
        return 1;
    }

    if (config.world_path.empty() || config.script_path.empty()) {
        std::cerr << "Error: --world and --script are required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (config.core.verbose && config.core.log_level > story::LogLevel::INFO) {
        config.core.log_level = story::LogLevel::INFO;
    }
    story::Log::set_level(config.core.log_level);

    // Load bundle and script
    story::StoryBundle bundle;
    story::JsonValue script;
    try {
        bundle = story::WorldLoader::load_file(config.world_path);
        script = story::JsonReader::parse_file(config.script_path);
    } catch (const std::exception& e) {
        std::cerr << "Error loading input: " << e.what() << "\n";
        return 1;
    }

    story::ScriptRunner runner(std::move(bundle), config.core);

    if (!config.load_path.empty() &&
        !story::Snapshot::load(config.load_path, runner.world(), runner.triggers(),
                               runner.scheduler(), runner.coordinator())) {
        std::cerr << "Error: cannot apply snapshot " << config.load_path << "\n";
        return 1;
    }

    story::TranscriptWriter transcript;
    try {
        transcript.record_all(runner.run_script(script));
    } catch (const story::LoadError& e) {
        std::cerr << "Error in script: " << e.what() << "\n";
        return 1;
    }

    story::Log::info("Replay", std::to_string(transcript.size()) + " commands, final turn " +
                     std::to_string(runner.world().turn_count) + ", " +
                     std::to_string(story::Log::warning_count()) + " warnings");

    // Write output
    auto emit = [&](std::ostream& out) {
        if (text_mode) {
            transcript.write_text(out);
        } else {
            transcript.write_json(out, config, runner.world(), runner.scheduler());
        }
    };

    if (config.output_path.empty()) {
        emit(std::cout);
    } else {
        std::ofstream out(config.output_path);
        if (!out.is_open()) {
            std::cerr << "Error: cannot open output file: " << config.output_path << "\n";
            return 1;
        }
        emit(out);
    }
    return 0;
}
