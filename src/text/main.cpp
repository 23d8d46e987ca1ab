#include "mine_prob/engine.hpp"
#include "mine_prob/text/board_file.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

std::atomic<bool> g_timeout_flag{false};
mine_prob::Engine* g_current_engine = nullptr;

void timeout_handler(int) {
    g_timeout_flag = true;
    if (g_current_engine) {
        g_current_engine->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [-m MINES] [-p PER_CELL] [-d DETECTION] [-i] [-c MAXCFG] [-t SEC] [-s] [-v]"
                 " <board.txt>\n";
    std::cerr << "  -m MINES      Total number of mines (overrides 'mines:')\n";
    std::cerr << "  -p PER_CELL   Maximum mines per cell (overrides 'per_cell:')\n";
    std::cerr << "  -d DETECTION  Neighbourhood radius (overrides 'detection:')\n";
    std::cerr << "  -i            Treat flags as unclicked cells\n";
    std::cerr << "  -c MAXCFG     Configuration budget (0 = unlimited)\n";
    std::cerr << "  -t SEC        Timeout in seconds\n";
    std::cerr << "  -s            Print engine statistics to stderr\n";
    std::cerr << "  -v            Verbose mode (print enumeration progress)\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const mine_prob::Engine& engine) {
    if (!g_print_stats) return;
    const auto& s = engine.stats();
    std::cerr << "% Stats: constraints=" << s.constraint_count
              << " groups=" << s.group_count
              << " edge_cells=" << s.edge_cell_count
              << " outer_cells=" << s.outer_cell_count
              << " configurations=" << s.configuration_count
              << " branches=" << s.branch_count
              << " dead_ends=" << s.dead_end_count
              << " uniform=" << (s.used_uniform_fallback ? "yes" : "no")
              << "\n";
}

/**
 * @brief 未確定セルを確率（%）に置き換えて盤面を出力
 */
void print_probabilities(const mine_prob::Board& board, const mine_prob::ProbabilityMap& probs) {
    for (int y = 0; y < board.y_size(); ++y) {
        for (int x = 0; x < board.x_size(); ++x) {
            mine_prob::Coord coord{x, y};
            std::ostringstream cell;
            auto it = probs.find(coord);
            if (it != probs.end()) {
                cell << std::fixed << std::setprecision(1) << it->second * 100.0;
            } else {
                cell << mine_prob::to_string(board.cell_contents(coord));
            }
            if (x > 0) std::cout << " ";
            std::cout << std::setw(5) << cell.str();
        }
        std::cout << "\n";
    }
}

// 数値オプションを読む
int parse_int_option(const char* option, const char* value) {
    char* end = nullptr;
    long v = std::strtol(value, &end, 10);
    if (end == value || *end != '\0' || v < 0 || v > 1000000000L) {
        throw std::invalid_argument(std::string("Invalid value for ") + option + ": " + value);
    }
    return static_cast<int>(v);
}

int main(int argc, char* argv[]) {
    const char* filename = nullptr;
    std::optional<int> mines;
    std::optional<int> per_cell;
    std::optional<int> detection;
    std::optional<int> max_configurations;
    bool ignore_flags = false;
    int timeout_sec = 0;

    try {
        // Parse command line arguments
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "-m") == 0 && i + 1 < argc) {
                mines = parse_int_option("-m", argv[++i]);
            } else if (std::strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
                per_cell = parse_int_option("-p", argv[++i]);
            } else if (std::strcmp(argv[i], "-d") == 0 && i + 1 < argc) {
                detection = parse_int_option("-d", argv[++i]);
            } else if (std::strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
                max_configurations = parse_int_option("-c", argv[++i]);
            } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
                timeout_sec = parse_int_option("-t", argv[++i]);
            } else if (std::strcmp(argv[i], "-i") == 0) {
                ignore_flags = true;
            } else if (std::strcmp(argv[i], "-s") == 0) {
                g_print_stats = true;
            } else if (std::strcmp(argv[i], "-v") == 0) {
                g_verbose = true;
            } else if (std::strcmp(argv[i], "-h") == 0 ||
                       std::strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (argv[i][0] != '-') {
                filename = argv[i];
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (!filename) {
        print_usage(argv[0]);
        return 1;
    }

    mine_prob::Engine engine;
    engine.set_verbose(g_verbose);
    engine.set_ignore_flags(ignore_flags);
    if (max_configurations) {
        engine.set_max_configurations(static_cast<size_t>(*max_configurations));
    }
    g_current_engine = &engine;

    // Setup timeout
    if (timeout_sec > 0) {
        std::signal(SIGALRM, timeout_handler);
        alarm(timeout_sec);
    }

    try {
        auto file = mine_prob::text::parse_file(filename);
        if (mines) file.mines = *mines;

        auto board = file.to_board(detection);
        int remaining = file.mines_remaining();
        int capacity = per_cell ? *per_cell : file.per_cell.value_or(1);

        if (g_verbose) {
            std::cerr << "% [verbose] board " << board.x_size() << "x" << board.y_size()
                      << ", detection " << board.detection() << ", " << remaining
                      << " mines remaining, per_cell " << capacity << "\n";
        }

        auto probs = engine.compute(board, remaining, capacity);
        print_stats(engine);
        print_probabilities(board, probs);
    } catch (const std::exception& e) {
        g_current_engine = nullptr;
        print_stats(engine);
        if (g_timeout_flag) {
            std::cerr << "% Timeout after " << timeout_sec << " s\n";
        }
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    g_current_engine = nullptr;
    return 0;
}
