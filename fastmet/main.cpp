/*
 * @Description: Multi-environment trial analysis CLI
 * @Author: Chao Ning
 * @Date: 2025-04-06 09:30:11
 * @LastEditTime: 2025-04-15 18:02:44
 * @LastEditors: Chao Ning
 */

#include <iostream>
#include <getopt.h>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include "ammi.hpp"
#include "anova_ind.hpp"
#include "stability.hpp"
#include "ge_factanal.hpp"
#include "fai_blup.hpp"
#include "can_corr.hpp"
#include "lpcor.hpp"

// Display the general help message
void show_help_general() {
    std::cout << "Usage: fastmet [options]\n"
              << "Options:\n"
              << "  -h 1   AMMI analysis (--ammi)\n"
              << "  -h 2   Within-environment analysis of variance (--anova-ind)\n"
              << "  -h 3   Fox stability (--fox)\n"
              << "  -h 4   Shukla stability variance (--shukla)\n"
              << "  -h 5   Factor analysis of the GE means (--ge-factanal)\n"
              << "  -h 6   Factor-analysis ideotype index (--fai-blup)\n"
              << "  -h 7   Canonical correlation (--can-corr)\n"
              << "  -h 8   Linear and partial correlation (--lpcor)\n";
}

int ammi_(int argc, char* argv[]) {
    AMMI ammiA;
    return ammiA.run(argc, argv);
}

int anova_ind_(int argc, char* argv[]) {
    AnovaInd anovaA;
    return anovaA.run(argc, argv);
}

int fox_(int argc, char* argv[]) {
    Stability stabilityA;
    return stabilityA.run_fox(argc, argv);
}

int shukla_(int argc, char* argv[]) {
    Stability stabilityA;
    return stabilityA.run_shukla(argc, argv);
}

int ge_factanal_(int argc, char* argv[]) {
    GEFactanal factanalA;
    return factanalA.run(argc, argv);
}

int fai_blup_(int argc, char* argv[]) {
    FaiBlup faiA;
    return faiA.run(argc, argv);
}

int can_corr_(int argc, char* argv[]) {
    CanCorr cancorA;
    return cancorA.run(argc, argv);
}

int lpcor_(int argc, char* argv[]) {
    Lpcor lpcorA;
    return lpcorA.run(argc, argv);
}


int dispatch(int opt, int argc, char* argv[]) {
    switch (opt) {
        case 1: return ammi_(argc, argv);
        case 2: return anova_ind_(argc, argv);
        case 3: return fox_(argc, argv);
        case 4: return shukla_(argc, argv);
        case 5: return ge_factanal_(argc, argv);
        case 6: return fai_blup_(argc, argv);
        case 7: return can_corr_(argc, argv);
        case 8: return lpcor_(argc, argv);
        default:
            spdlog::error("Invalid argument for -h");
            show_help_general();
            return 1;
    }
}


int main(int argc, char* argv[]) {
    // Define command-line options
    struct option long_options[] = {
        {"ammi", no_argument, nullptr, 'a'},           // AMMI analysis
        {"anova-ind", no_argument, nullptr, 'i'},      // Within-environment ANOVA
        {"fox", no_argument, nullptr, 'f'},            // Fox stability
        {"shukla", no_argument, nullptr, 's'},         // Shukla stability variance
        {"ge-factanal", no_argument, nullptr, 'g'},    // Factor analysis of the GE means
        {"fai-blup", no_argument, nullptr, 'b'},       // Ideotype index
        {"can-corr", no_argument, nullptr, 'c'},       // Canonical correlation
        {"lpcor", no_argument, nullptr, 'l'},          // Linear and partial correlation
        {"help", optional_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    if (argc == 1) {
        show_help_general();
        return 1;
    }

    int opt;
    while ((opt = getopt_long(argc, argv, "h::aifsgbcl", long_options, nullptr)) != -1) {
        try {
            switch (opt) {
                case 'h': {
                    // Manually check argv if optarg is nullptr
                    if (optarg == nullptr) {
                        if (optind < argc && argv[optind][0] != '-') {
                            optarg = argv[optind];  // Assign the next argument manually
                            optind++;
                        }
                    }

                    if (optarg == nullptr) {
                        show_help_general();  // No argument, show general help
                        return 0;
                    }
                    return dispatch(std::atoi(optarg), argc, argv);
                }
                case 'a':
                    return ammi_(argc, argv);
                case 'i':
                    return anova_ind_(argc, argv);
                case 'f':
                    return fox_(argc, argv);
                case 's':
                    return shukla_(argc, argv);
                case 'g':
                    return ge_factanal_(argc, argv);
                case 'b':
                    return fai_blup_(argc, argv);
                case 'c':
                    return can_corr_(argc, argv);
                case 'l':
                    return lpcor_(argc, argv);
                default:
                    spdlog::error("Unknown option provided.");
                    show_help_general();
                    return 1;
            }
        } catch (const std::exception& e) {
            spdlog::error("fastmet stopped: {}", e.what());
            return 1;
        }
    }

    return 0;
}
