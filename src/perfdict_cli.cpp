/**
 * @file perfdict_cli.cpp
 * @brief Command-line interface for perfdict files
 *
 * Builds a perfect_map<std::string> from a tab-separated key/value file,
 * stores it as a blob, and answers lookups against the stored blob.
 *
 * Usage: perfdict <command> [arguments] [options]
 */

#include <perfdict/blob_file.hpp>
#include <perfdict/perfdict.hpp>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

using namespace perfdict;

using string_map = perfect_map<std::string>;

// Exit codes for consistent error handling
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_ERROR_CODE = 1;
constexpr int EXIT_INVALID_ARGS = 2;
constexpr int EXIT_FILE_ERROR = 3;
constexpr int EXIT_MISSING_KEY = 4;
constexpr int EXIT_BUILD_FAILED = 5;

void usage() {
    std::cerr << R"(perfdict - compact dictionaries over a fixed key set

COMMANDS:
    build <input.tsv> <out.pdict>    Build from key<TAB>value lines
    get <file> <key> [key...]        Print the value of each key
    contains <file> <key>            Exit 0 if the key passes the fingerprint
    set <file> <key> <value>         Overwrite the slot of key (no validation)
    update <file> <key> <value>      Overwrite only if the key is accepted
    values <file>                    Print all values in slot order
    stats <file>                     Show size and build parameters
    verify <file> <input.tsv>        Check every input key and measure false positives

BUILD OPTIONS:
    --load-factor <c>                Vertex space multiplier, > 1 (default 2.5)
    --fingerprint-bits <b>           Digest width 0-32, 0 disables (default 16)
    --seed <s>                       First seed tried (default 0)
    --max-attempts <n>               Seed retry budget (default 32)
    --threads <n>                    Solver threads (default 1)
    --verbose                        Print construction statistics

EXAMPLES:
    perfdict build words.tsv words.pdict --fingerprint-bits 8
    perfdict get words.pdict apple banana
    perfdict verify words.pdict words.tsv
)";
}

/**
 * @brief Read key<TAB>value lines; blank lines are skipped
 * @return false on I/O failure or a line without a tab
 */
bool read_tsv(const char* path, std::vector<std::pair<std::string, std::string>>& out) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Failed to open " << path << "\n";
        return false;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        auto tab = line.find('\t');
        if (tab == std::string::npos) {
            std::cerr << path << ":" << line_no << ": expected key<TAB>value\n";
            return false;
        }
        out.emplace_back(line.substr(0, tab), line.substr(tab + 1));
    }
    if (in.bad()) {
        std::cerr << "Read error on " << path << "\n";
        return false;
    }
    return true;
}

result<string_map> load(const char* path) {
    auto blob = mapped_blob::open(path);
    if (!blob) {
        return std::unexpected(blob.error());
    }
    return string_map::deserialize(blob->bytes());
}

int report_load_failure(const char* path, perfdict::error e) {
    std::cerr << "Failed to open " << path << ": " << error_message(e) << "\n";
    return EXIT_FILE_ERROR;
}

void print_build_stats(const build_stats& s) {
    std::cerr << "Attempts:        " << s.attempts << "\n";
    std::cerr << "  self-loops:    " << s.self_loops << "\n";
    std::cerr << "  dup edges:     " << s.duplicate_edges << "\n";
    std::cerr << "  cyclic:        " << s.cyclic_components << "\n";
    if (s.failures() < s.attempts) {
        std::cerr << "Accepted seed:   " << s.seed << "\n";
        std::cerr << "Components:      " << s.component_count << "\n";
    }
    std::cerr << "Vertices:        " << s.vertex_count << "\n";
    std::cerr << "Build time:      " << s.build_time_us / 1000.0 << " ms\n";
}

/**
 * @brief Parse build options starting at argv[first]
 * Throws std::invalid_argument / std::out_of_range on malformed numbers.
 */
bool parse_build_options(int argc, char* argv[], int first, perfect_map_config& cfg, bool& verbose) {
    for (int i = first; i < argc; ++i) {
        auto needs_value = [&](const char* name) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << name << " requires a value\n";
                return false;
            }
            return true;
        };

        if (std::strcmp(argv[i], "--load-factor") == 0) {
            if (!needs_value(argv[i])) return false;
            cfg.load_factor = std::stod(argv[++i]);
        } else if (std::strcmp(argv[i], "--fingerprint-bits") == 0) {
            if (!needs_value(argv[i])) return false;
            cfg.fingerprint_bits = static_cast<unsigned>(std::stoul(argv[++i]));
        } else if (std::strcmp(argv[i], "--seed") == 0) {
            if (!needs_value(argv[i])) return false;
            cfg.seed = std::stoull(argv[++i]);
        } else if (std::strcmp(argv[i], "--max-attempts") == 0) {
            if (!needs_value(argv[i])) return false;
            cfg.max_attempts = std::stoull(argv[++i]);
        } else if (std::strcmp(argv[i], "--threads") == 0) {
            if (!needs_value(argv[i])) return false;
            cfg.threads = std::stoull(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Error: Unknown option '" << argv[i] << "'\n";
            return false;
        }
    }
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage();
        return EXIT_INVALID_ARGS;
    }

    std::string cmd = argv[1];

    if (cmd == "--help" || cmd == "-h") {
        usage();
        return EXIT_SUCCESS_CODE;
    }

    /**
     * BUILD command - compile a TSV file into a perfdict blob
     *
     * Usage: perfdict build <input.tsv> <out.pdict> [options]
     */
    if (cmd == "build" && argc >= 4) {
        perfect_map_config cfg;
        bool verbose = false;
        try {
            if (!parse_build_options(argc, argv, 4, cfg, verbose)) {
                return EXIT_INVALID_ARGS;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: invalid option value: " << e.what() << "\n";
            return EXIT_INVALID_ARGS;
        }

        std::vector<std::pair<std::string, std::string>> pairs;
        if (!read_tsv(argv[2], pairs)) {
            return EXIT_FILE_ERROR;
        }

        build_stats stats;
        auto m = string_map::build(pairs, cfg, &stats);
        if (verbose) {
            print_build_stats(stats);
        }
        if (!m) {
            std::cerr << "Build failed: " << error_message(m.error()) << "\n";
            if (m.error() == error::construction_exhausted) {
                std::cerr << "Gave up after " << stats.attempts
                          << " seeds; try a larger --load-factor or --max-attempts\n";
            }
            return m.error() == error::invalid_config ? EXIT_INVALID_ARGS : EXIT_BUILD_FAILED;
        }

        if (auto ok = write_blob(argv[3], m->serialize()); !ok) {
            std::cerr << "Failed to write " << argv[3] << ": " << error_message(ok.error()) << "\n";
            return EXIT_FILE_ERROR;
        }

        std::cout << "Built " << argv[3] << " with " << m->size() << " keys\n";
        return EXIT_SUCCESS_CODE;
    }

    /**
     * GET command - print the value for each key
     *
     * Usage: perfdict get <file> <key> [key...]
     *
     * Absent keys are reported only if fingerprinting is enabled; without it
     * some stored value is printed.
     */
    if (cmd == "get" && argc >= 4) {
        auto m = load(argv[2]);
        if (!m) return report_load_failure(argv[2], m.error());

        int rc = EXIT_SUCCESS_CODE;
        for (int i = 3; i < argc; ++i) {
            if (auto v = m->get(argv[i])) {
                std::cout << *v << "\n";
            } else {
                std::cout << "null\n";
                rc = EXIT_MISSING_KEY;
            }
        }
        return rc;
    }

    if (cmd == "contains" && argc == 4) {
        auto m = load(argv[2]);
        if (!m) return report_load_failure(argv[2], m.error());

        bool found = m->contains(argv[3]);
        std::cout << (found ? "yes" : "no") << "\n";
        return found ? EXIT_SUCCESS_CODE : EXIT_MISSING_KEY;
    }

    /**
     * SET / UPDATE commands - rewrite one value in place
     *
     * set overwrites the slot the key hashes to even if the key was never
     * built in; update refuses keys the fingerprint rejects.
     */
    if ((cmd == "set" || cmd == "update") && argc == 5) {
        auto m = load(argv[2]);
        if (!m) return report_load_failure(argv[2], m.error());

        if (cmd == "set") {
            m->set(argv[3], argv[4]);
        } else if (auto ok = m->update(argv[3], argv[4]); !ok) {
            std::cerr << "Not updated: " << error_message(ok.error()) << "\n";
            return EXIT_MISSING_KEY;
        }

        if (auto ok = write_blob(argv[2], m->serialize()); !ok) {
            std::cerr << "Failed to write " << argv[2] << ": " << error_message(ok.error()) << "\n";
            return EXIT_FILE_ERROR;
        }
        std::cout << "OK\n";
        return EXIT_SUCCESS_CODE;
    }

    if (cmd == "values" && argc == 3) {
        auto m = load(argv[2]);
        if (!m) return report_load_failure(argv[2], m.error());

        for (const auto& v : *m) {
            std::cout << v << "\n";
        }
        return EXIT_SUCCESS_CODE;
    }

    if (cmd == "stats" && argc == 3) {
        auto m = load(argv[2]);
        if (!m) return report_load_failure(argv[2], m.error());

        auto s = m->statistics();
        std::cout << "File: " << argv[2] << "\n";
        std::cout << "======================\n";
        std::cout << "Keys:             " << s.key_count << "\n";
        std::cout << "Vertices:         " << s.vertex_count << "\n";
        std::cout << "Seed:             " << m->hash_function().seed() << "\n";
        std::cout << "Fingerprint bits: " << s.fingerprint_bits << "\n";
        std::cout << "Index memory:     " << s.index_bytes / 1024 << " KB\n";
        std::cout << "Index bits/key:   " << std::fixed << std::setprecision(2) << s.index_bits_per_key << "\n";
        std::cout << "False positives:  " << std::scientific << s.false_positive_rate << " per absent key\n";
        return EXIT_SUCCESS_CODE;
    }

    /**
     * VERIFY command - read back every input pair, then probe absent keys
     *
     * Usage: perfdict verify <file> <input.tsv>
     */
    if (cmd == "verify" && argc == 4) {
        auto m = load(argv[2]);
        if (!m) return report_load_failure(argv[2], m.error());

        std::vector<std::pair<std::string, std::string>> pairs;
        if (!read_tsv(argv[3], pairs)) {
            return EXIT_FILE_ERROR;
        }

        size_t wrong = 0;
        for (const auto& [k, v] : pairs) {
            auto got = m->get(k);
            if (!got || *got != v) ++wrong;
        }

        std::unordered_set<std::string> known;
        for (const auto& [k, v] : pairs) known.insert(k);

        constexpr size_t probes = 10000;
        std::mt19937_64 rng{42};
        size_t false_positives = 0;
        size_t tried = 0;
        while (tried < probes) {
            auto probe = "probe_" + std::to_string(rng());
            if (known.count(probe)) continue;
            ++tried;
            if (m->contains(probe)) ++false_positives;
        }

        std::cout << "Correct:          " << (pairs.size() - wrong) << "/" << pairs.size() << "\n";
        std::cout << "False positives:  " << false_positives << "/" << probes << " absent keys"
                  << " (expected rate " << m->fingerprints().false_positive_rate() << ")\n";
        return wrong == 0 ? EXIT_SUCCESS_CODE : EXIT_ERROR_CODE;
    }

    std::cerr << "Error: Unknown command '" << cmd << "'\n\n";
    usage();
    return EXIT_INVALID_ARGS;
}
