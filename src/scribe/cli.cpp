#include "cli.hpp"

#include "model_handle.hpp"
#include "output/stdout_output.hpp"
#include "platform/platform_paths.hpp"
#include "transcriber.hpp"
#include "whisper/backend_factory.hpp"

#include <optional>
#include <print>
#include <vector>

static void usage(std::FILE* err, const char* prog) {
    std::println(err, "Usage: {} [options] <audio_file> [output_file]", prog);
    std::println(err, "Options:");
    std::println(err, "  -b, --backend TYPE   Model backend: local or lan");
    std::println(err, "  -m, --model PATH     whisper.cpp model file");
    std::println(err, "  -l, --language LANG  Spoken language ('auto' to detect)");
    std::println(err, "  -u, --url URL        Server URL for the lan backend");
    std::println(err, "  -c, --config PATH    Config file path");
    std::println(err, "  -p, --print          Also print the transcription to stdout");
    std::println(err, "  -v, --verbose        Enable verbose logging");
    std::println(err, "  -h, --help           Show this help");
}

int run_cli(int argc, char* argv[], std::FILE* out, std::FILE* err,
            const BackendFactory& factory) {
    const char* prog = argc > 0 ? argv[0] : "scribe";
    bool verbose = false;
    bool print_text = false;
    std::optional<std::string> config_path, backend_type, model_path, language, url;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&](std::optional<std::string>& dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };

        bool ok = true;
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--print" || arg == "-p") {
            print_text = true;
        } else if (arg == "--config" || arg == "-c") {
            ok = value(config_path);
        } else if (arg == "--backend" || arg == "-b") {
            ok = value(backend_type);
        } else if (arg == "--model" || arg == "-m") {
            ok = value(model_path);
        } else if (arg == "--language" || arg == "-l") {
            ok = value(language);
        } else if (arg == "--url" || arg == "-u") {
            ok = value(url);
        } else if (arg == "--help" || arg == "-h") {
            usage(err, prog);
            return kExitOk;
        } else if (arg == "--") {
            for (i++; i < argc; i++) positional.emplace_back(argv[i]);
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::println(err, "Unknown option: {}", arg);
            usage(err, prog);
            return kExitUsage;
        } else {
            positional.push_back(arg);
        }

        if (!ok) {
            std::println(err, "Missing value for {}", arg);
            usage(err, prog);
            return kExitUsage;
        }
    }

    if (positional.empty() || positional.size() > 2) {
        usage(err, prog);
        return kExitUsage;
    }

    std::string audio_path = platform::expand_user(positional[0]);
    std::optional<std::string> output_path;
    if (positional.size() > 1) output_path = platform::expand_user(positional[1]);

    if (verbose) {
        std::println(err, "[scribe] audio file: {}", audio_path);
        std::println(err, "[scribe] output path: {}", output_path.value_or("(derived)"));
    }

    // Fail on a missing input before any backend is built.
    if (auto res = check_audio_file(audio_path); !res) {
        std::println(err, "scribe: {}", res.error().message());
        return kExitFailure;
    }

    // Load config
    Config config = config_path ? Config::load(platform::expand_user(*config_path))
                                : Config::load_default();
    if (backend_type) config.backend.type = *backend_type;
    if (model_path) config.model.path = platform::expand_user(*model_path);
    if (language) config.backend.language = *language;
    if (url) config.backend.url = *url;

    auto backend = factory(config);
    if (!backend) {
        std::println(err, "scribe: {}", backend.error());
        return kExitFailure;
    }

    ModelHandle model(std::move(*backend));
    auto result = process_audio_with_whisper(model, audio_path, output_path, verbose);
    if (!result) {
        std::println(err, "scribe: {}", result.error().message());
        return kExitFailure;
    }

    std::println(out, "{}", result->output_path);
    if (print_text) {
        StdoutOutput text_out(out);
        if (auto res = text_out.deliver(result->text); !res) {
            std::println(err, "scribe: {}", res.error());
            return kExitFailure;
        }
    }

    if (verbose) {
        std::println(err, "[scribe] Complete");
    }
    return kExitOk;
}

int run_cli(int argc, char* argv[], std::FILE* out, std::FILE* err) {
    return run_cli(argc, argv, out, err, make_backend);
}
