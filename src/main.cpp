#include <iostream>
#include <string>
#include <stdexcept>
#include <cstdint>

#include <opencv2/core.hpp>

#include "dctblur/blur.hpp"
#include "dctblur/compare.hpp"
#include "dctblur/errors.hpp"

// --- Default Configuration Values ---
// These can be overridden by command-line arguments
struct Config {
    int rows = 64;
    int cols = 64;
    double amount = 4.0;
    std::string pattern = "edge-strip";
    std::uint64_t seed = 42;
    std::string transform;      // empty: compare all paths
    bool mirror_padding = false;
};

// --- Simple Argument Parser ---
void printUsage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " [options]\n\n"
              << "Options:\n"
              << "  --rows <int>         Grid height (default: 64)\n"
              << "  --cols <int>         Grid width (default: 64)\n"
              << "  --amount <float>     Blur amount, spatial sigma in samples (default: 4.0)\n"
              << "  --pattern <name>     edge-strip | checkerboard | ramp | noise (default: edge-strip)\n"
              << "  --seed <int>         RNG seed for the noise pattern (default: 42)\n"
              << "  --transform <name>   Run only one path: dct | dft (default: compare dct, dft, dft+mirror)\n"
              << "  --mirror             Mirror-pad before the DFT (requires --transform dft)\n"
              << "  --help               Show this help message\n"
              << std::endl;
}

bool parseArgs(int argc, char* argv[], Config& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            printUsage(argv[0]);
            return false; // Indicate exit
        } else if (arg == "--rows" && i + 1 < argc) {
            try { config.rows = std::stoi(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Error: Invalid integer for --rows\n"; return false; }
        } else if (arg == "--cols" && i + 1 < argc) {
            try { config.cols = std::stoi(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Error: Invalid integer for --cols\n"; return false; }
        } else if (arg == "--amount" && i + 1 < argc) {
            try { config.amount = std::stod(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Error: Invalid float for --amount\n"; return false; }
        } else if (arg == "--seed" && i + 1 < argc) {
            try { config.seed = std::stoull(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Error: Invalid integer for --seed\n"; return false; }
        } else if (arg == "--pattern" && i + 1 < argc) {
            config.pattern = argv[++i];
        } else if (arg == "--transform" && i + 1 < argc) {
            config.transform = argv[++i];
        } else if (arg == "--mirror") {
            config.mirror_padding = true;
        } else {
            std::cerr << "Error: Unknown or invalid argument: " << arg << std::endl;
            printUsage(argv[0]);
            return false;
        }
    }
    if (config.rows <= 0 || config.cols <= 0) {
        std::cerr << "Error: Grid size must be positive (rows=" << config.rows << ", cols=" << config.cols << ").\n";
        return false;
    }
    if (!(config.amount > 0)) {
        std::cerr << "Error: Blur amount must be positive.\n";
        return false;
    }
    if (config.mirror_padding && config.transform != "dft") {
        std::cerr << "Error: --mirror requires --transform dft.\n";
        return false;
    }
    return true; // Indicate success
}

void printStats(const std::string& label, const dctblur::GridStats& stats, double leakage) {
    std::cout << label << ": sum=" << stats.sum
              << " energy=" << stats.energy
              << " variance=" << stats.variance
              << " far-edge=" << leakage << std::endl;
}

int main(int argc, char* argv[]) {
    std::cout << "DCT Gaussian Blur - Path Comparison" << std::endl;
    std::cout << "Using OpenCV version: " << CV_VERSION << std::endl;

    Config config;
    if (!parseArgs(argc, argv, config)) {
        return (argc > 1 && std::string(argv[1]) == "--help") ? 0 : 1; // Exit code 0 for --help, 1 for error
    }

    std::cout << "--- Configuration ---" << std::endl;
    std::cout << "Grid: " << config.rows << "x" << config.cols << std::endl;
    std::cout << "Pattern: " << config.pattern << std::endl;
    std::cout << "Amount: " << config.amount << std::endl;
    std::cout << "Seed: " << config.seed << std::endl;
    std::cout << "Transform: " << (config.transform.empty() ? "all" : config.transform)
              << (config.mirror_padding ? " (mirrored)" : "") << std::endl;
    std::cout << "---------------------" << std::endl;

    try {
        const dctblur::TestPattern pattern = dctblur::parseTestPattern(config.pattern);
        cv::Mat grid = dctblur::makeTestPattern(pattern, config.rows, config.cols, config.seed);

        if (config.transform.empty()) {
            dctblur::ComparisonReport report = dctblur::compareBlurPaths(grid, config.amount);
            std::cout << dctblur::formatReport(report);
        } else {
            dctblur::BlurParameters params;
            params.amount = config.amount;
            params.transform = dctblur::parseTransformKind(config.transform);
            params.mirror_padding = config.mirror_padding;

            dctblur::PathReport path = dctblur::runBlurPath(grid, params, config.transform);
            printStats("input", dctblur::computeStats(grid), dctblur::farEdgeLeakage(grid));
            printStats(path.label, path.stats, path.far_edge_leakage);
            std::cout << "Elapsed: " << path.elapsed_ms << " ms" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error during processing: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
