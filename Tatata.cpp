#include "pch.h"
#include "Tatata.h"

static const char* g_usage =
    "usage: tatata [options] path_to_script.tatata\n"
    "  -d, --dry-run     print the input instead of sending it\n"
    "  -v, --verbose     log every action as it is executed\n"
    "  -t, --tick <ms>   interpolation step of timed mouse moves (default 16)\n";

static volatile std::sig_atomic_t g_interrupted = 0;

static void OnInterrupt(int)
{
    g_interrupted = 1;
}

static bool EndsWith(const std::string& str, const std::string& suffix)
{
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int main(int argc, char* argv[])
{
    tt::PlayerSettings settings;
    bool dry_run = false;
    std::string path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-d" || arg == "--dry-run") {
            dry_run = true;
        }
        else if (arg == "-v" || arg == "--verbose") {
            settings.verbose = true;
        }
        else if (arg == "-t" || arg == "--tick") {
            int64_t v;
            if (i + 1 >= argc || !tt::ToInt(argv[i + 1], v) || v <= 0) {
                fprintf(stderr, "invalid tick interval\n%s", g_usage);
                return 1;
            }
            settings.tick_interval = (tt::millisec)v;
            ++i;
        }
        else if (arg == "-h" || arg == "--help") {
            printf("%s", g_usage);
            return 0;
        }
        else if (!arg.empty() && arg[0] == '-') {
            fprintf(stderr, "unknown option %s\n%s", arg.c_str(), g_usage);
            return 1;
        }
        else if (path.empty()) {
            path = arg;
        }
        else {
            fprintf(stderr, "%s", g_usage);
            return 1;
        }
    }
    if (path.empty()) {
        fprintf(stderr, "%s", g_usage);
        return 1;
    }
    if (!EndsWith(path, ".tatata")) {
        fprintf(stderr, "Not a TATATA file: %s\n", path.c_str());
        return 1;
    }

    tt::Script script;
    std::string error;
    if (!tt::LoadScript(path.c_str(), script, &error)) {
        fprintf(stderr, "%s\n", error.c_str());
        return 1;
    }
    for (auto& w : script.warnings)
        fprintf(stderr, "warning: %s\n", w.toText().c_str());
    if (!script.valid()) {
        for (auto& e : script.errors)
            fprintf(stderr, "%s\n", e.toText().c_str());
        fprintf(stderr, "%d error(s), nothing was executed\n", (int)script.errors.size());
        return 1;
    }

    tt::IInjectorPtr injector;
    if (dry_run) {
        injector = tt::CreatePrintInjector();
    }
    else {
#ifdef _WIN32
        injector = tt::CreateSendInputInjector();
#else
        fprintf(stderr, "no input backend is available on %s, use --dry-run\n", tt::ToString(tt::GetPlatform()));
        return 1;
#endif
    }

    auto player = tt::CreatePlayer(injector.get(), settings);
    std::signal(SIGINT, OnInterrupt);
    if (!player->start(script)) {
        fprintf(stderr, "failed to start playback\n");
        return 1;
    }
    while (!player->waitFor(50)) {
        if (g_interrupted)
            player->cancel();
    }

    switch (player->wait()) {
    case tt::PlayState::Completed:
        return 0;
    case tt::PlayState::Cancelled:
        fprintf(stderr, "cancelled\n");
        return 2;
    default:
        fprintf(stderr, "playback failed: %s\n", player->getError().c_str());
        return 1;
    }
}
