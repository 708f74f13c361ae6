// demo_cradle.cpp
//
// Resolves the build configuration of a Haskell source file the way an
// editor session would, and prints what a compiler would be given:
//
//     ./hiecore-cradle src/Lib/Foo.hs           # configuration + flags
//     ./hiecore-cradle app/Main.hs --debug      # same, with debug logging
//     ./hiecore-cradle /tmp/Orphan.hs           # "None" configuration
//
// Settings come from ~/.hiecore/config.toml and <project>/.hiecore.toml.

#include <hiecore/config.hpp>
#include <hiecore/log.hpp>
#include <hiecore/path_match.hpp>
#include <hiecore/process.hpp>
#include <hiecore/cradle/cabal_backend.hpp>
#include <hiecore/cradle/locator.hpp>
#include <hiecore/cradle/resolver.hpp>

#include <iostream>
#include <string>

using namespace hiecore;

struct Args {
    std::string file;
    bool debug = false;
};

static Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--debug") {
            args.debug = true;
        } else if (!a.empty() && a[0] == '-') {
            return HieError{HieError::InvalidArg, "unknown option: " + a,
                            "usage: hiecore-cradle <file> [--debug]"};
        } else if (args.file.empty()) {
            args.file = a;
        } else {
            return HieError{HieError::InvalidArg, "more than one file given",
                            "usage: hiecore-cradle <file> [--debug]"};
        }
    }
    if (args.file.empty()) {
        return HieError{HieError::InvalidArg, "no input file specified",
                        "usage: hiecore-cradle <file> [--debug]"};
    }
    return Result<Args>::ok(args);
}

static Status run(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    HIECORE_TRY(args);

    std::string file = canonicalize(args.value().file);
    if (args.value().debug) log::set_level(log::Debug);

    // The project is located with the default tool names to find where
    // its .hiecore.toml lives; the resolver then uses the configured ones.
    CabalBackend backend;
    SystemToolProbe probe;
    ProjectLocator bootstrap(backend, probe);
    auto config = Config::discover(bootstrap.project_root(file));
    HIECORE_TRY(config);
    config.value().apply_logging();
    if (args.value().debug) log::set_level(log::Debug);

    ConfigurationResolver resolver(backend, probe, config.value().tools);

    Configuration cradle = resolver.resolve(file);
    std::cout << "configuration: " << cradle.name() << "\n";
    std::cout << "root:          " << cradle.root_dir() << "\n";

    auto flags = cradle.resolve(file);
    HIECORE_TRY(flags);

    std::cout << "flags:\n";
    for (const auto& opt : flags.value().options) std::cout << "  " << opt << "\n";
    if (!flags.value().dependencies.empty()) {
        std::cout << "depends on:\n";
        for (const auto& dep : flags.value().dependencies) std::cout << "  " << dep << "\n";
    }
    return ok_status();
}

int main(int argc, char** argv) {
    auto status = run(argc, argv);
    if (status.is_err()) {
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
