// Outil en ligne de commande pour les polyglottes PNG/ZIP/WAV
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

#include "core/errors.h"
#include "polyglot_creator.hpp"
#include "polyglot_inspector.hpp"
#include "utilities.hpp"
#include "validation_report.hpp"

namespace fs = std::filesystem;
using namespace polyglot;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

void printUsage(const char *prog) {
    std::fprintf(stderr,
                 "Usage:\n"
                 "  %s create --png <image.png> (--zip <archive.zip> | --wav <son.wav>)\n"
                 "         --output <sortie> [--method idat|text|zip|wav|riff]\n"
                 "         [--entry-name <nom>] [--quiet]\n"
                 "  %s extract --input <polyglotte> --output <sortie> [--quiet]\n"
                 "  %s validate --input <polyglotte> [--verbose] [--json] [--quiet]\n",
                 prog, prog, prog);
}

struct Arguments {
    std::string command;
    std::map<std::string, std::string> values;
    std::set<std::string> flags;

    const std::string *value(const std::string &name) const {
        auto it = values.find(name);
        return it == values.end() ? nullptr : &it->second;
    }
    bool has(const std::string &flag) const { return flags.count(flag) != 0; }
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

Arguments parseArguments(int argc, char *argv[]) {
    static const std::set<std::string> kFlags = {"--quiet", "--verbose", "--json"};
    static const std::set<std::string> kValued = {"--png",    "--zip",   "--wav",
                                                  "--output", "--input", "--method",
                                                  "--entry-name"};
    Arguments args;
    args.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (kFlags.count(arg)) {
            args.flags.insert(arg);
        } else if (kValued.count(arg)) {
            if (i + 1 >= argc) {
                throw UsageError("Valeur manquante pour " + arg);
            }
            args.values[arg] = argv[++i];
        } else {
            throw UsageError("Option inconnue: " + arg);
        }
    }
    return args;
}

const std::string &required(const Arguments &args, const std::string &name) {
    const std::string *v = args.value(name);
    if (!v) {
        throw UsageError("Option obligatoire absente: " + name);
    }
    return *v;
}

int runCreate(const Arguments &args, const Options &opts) {
    const fs::path pngPath = required(args, "--png");
    const fs::path outPath = required(args, "--output");
    const std::string *zipPath = args.value("--zip");
    const std::string *wavPath = args.value("--wav");
    if ((zipPath == nullptr) == (wavPath == nullptr)) {
        throw UsageError("Indiquer exactement un fichier --zip ou --wav");
    }
    const SecondInput kind = zipPath ? SecondInput::Archive : SecondInput::Audio;

    EmbedStrategy strategy = default_strategy(kind, outPath);
    if (const std::string *method = args.value("--method")) {
        auto parsed = strategy_from_name(*method);
        if (!parsed) {
            throw UsageError("Méthode inconnue: " + *method);
        }
        strategy = *parsed;
    }

    const fs::path secondPath = zipPath ? *zipPath : *wavPath;
    if (!opts.quiet) {
        std::fprintf(stderr, "🔧 Création (%s) : %s + %s\n", to_string(strategy),
                     pngPath.string().c_str(), secondPath.string().c_str());
    }

    PolyglotCreator creator(read_file(pngPath, opts), read_file(secondPath, opts),
                            kind, opts, outPath);
    const Bytes out = creator.create(strategy);
    write_file(outPath, out);

    if (!opts.quiet) {
        std::fprintf(stderr, "✅ Polyglotte écrit : %s (%zu octets)\n",
                     outPath.string().c_str(), out.size());
    }
    return EXIT_SUCCESS;
}

int runExtract(const Arguments &args, const Options &opts) {
    const fs::path inPath = required(args, "--input");
    const fs::path outPath = required(args, "--output");

    const Bytes data = read_file(inPath, opts);
    if (!opts.quiet) {
        std::fprintf(stderr, "🔍 Format dominant : %s\n",
                     outer_format_name(detect_dominant(data)));
    }
    const Extraction result = extract(data, opts, inPath);
    write_file(outPath, result.bytes);

    if (!opts.quiet) {
        std::fprintf(stderr, "✅ %s extrait (offset %zu, %zu octets%s) : %s\n",
                     payload_format_name(result.kind), result.offset,
                     result.bytes.size(), result.bounded ? "" : ", fin non bornée",
                     outPath.string().c_str());
    }
    return EXIT_SUCCESS;
}

int runValidate(const Arguments &args, const Options &opts) {
    const fs::path inPath = required(args, "--input");
    const Bytes data = read_file(inPath, opts);
    const ValidationReport report = validate(data);

    if (args.has("--json")) {
        std::printf("%s\n", report_to_json(report, opts.verbose).dump(2).c_str());
    } else {
        std::printf("%s", format_report(report, opts.verbose).c_str());
    }
    if (!report.valid()) {
        log_warn(inPath, std::string("Validation en échec: ") + to_string(report.status),
                 opts);
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[]) {
    if (argc < 2 || std::strcmp(argv[1], "--help") == 0 ||
        std::strcmp(argv[1], "-h") == 0) {
        printUsage(argv[0]);
        return argc < 2 ? kExitUsage : EXIT_SUCCESS;
    }

    try {
        const Arguments args = parseArguments(argc, argv);
        Options opts;
        opts.quiet = args.has("--quiet");
        opts.verbose = args.has("--verbose");
        if (const std::string *name = args.value("--entry-name")) {
            opts.entryName = *name;
        }

        if (args.command == "create") {
            return runCreate(args, opts);
        }
        if (args.command == "extract") {
            return runExtract(args, opts);
        }
        if (args.command == "validate") {
            return runValidate(args, opts);
        }
        throw UsageError("Commande inconnue: " + args.command);
    } catch (const UsageError &e) {
        std::fprintf(stderr, "❌ %s\n", e.what());
        printUsage(argv[0]);
        return kExitUsage;
    } catch (const PolyglotError &e) {
        std::fprintf(stderr, "❌ [%s/%s] %s\n", to_string(e.kind()),
                     to_string(e.code()), e.what());
        return kExitFailure;
    } catch (const std::exception &e) {
        std::fprintf(stderr, "❌ Erreur: %s\n", e.what());
        return kExitFailure;
    }
}
