/**
 * @file main.cpp
 * @brief Headless economic simulation: many players with different budgets buying cells for N days.
 *
 * Prints how prices, accessibility for small budgets, whale share, the prize pool and operator fees
 * evolve, then closes the cycle and prints the payouts.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <algorithm>
#include <cstring>
#include <exception>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>
#include "Clock.h"
#include "LedgerConfig.h"
#include "LocalBank.h"
#include "Logger.h"
#include "PixelLedger.h"

namespace {

/** @brief Spending profile; budget is the most a player pays for one cell, in initial-price units. */
struct Profile {
    const char* name;
    Amount budgetUnits;
    double activity;
    std::uint64_t maxPixels;
};

// Casual 70%, regular 20%, enthusiast 8%, whale 2%.
const Profile kCasual{"casual", 100, 0.2, 5};
const Profile kRegular{"regular", 500, 0.5, 20};
const Profile kEnthusiast{"enthusiast", 2000, 0.8, 50};
const Profile kWhale{"whale", 10000, 1.0, 200};

struct Player {
    ActorId id;
    const Profile* profile;
    Amount budget;
};

struct SimOptions {
    unsigned days{30};
    unsigned perDay{200};
    unsigned players{500};
    unsigned seed{42};
};

void readUnsigned(const char* text, const char* flag, unsigned& out) {
    Amount v = 0;
    if (parseAmount(text, v) && v > 0 && v <= 1000000) out = static_cast<unsigned>(v);
    else Logger::warn(std::string("pricesim: bad value for ") + flag);
}

SimOptions parseOptions(int argc, char** argv) {
    SimOptions o;
    static const struct { const char* flag; unsigned SimOptions::*field; } flags[] = {
        {"--days", &SimOptions::days},
        {"--per-day", &SimOptions::perDay},
        {"--players", &SimOptions::players},
        {"--seed", &SimOptions::seed},
    };
    for (int i = 1; i < argc; ++i) {
        for (const auto& f : flags) {
            size_t n = std::strlen(f.flag);
            if (std::strcmp(argv[i], f.flag) == 0 && i + 1 < argc) {
                readUnsigned(argv[++i], f.flag, o.*f.field);
                break;
            }
            if (std::strncmp(argv[i], f.flag, n) == 0 && argv[i][n] == '=') {
                readUnsigned(argv[i] + n + 1, f.flag, o.*f.field);
                break;
            }
        }
    }
    return o;
}

/** @brief Price expressed in initial-price units with two decimals. */
std::string units(Amount v, Amount initial) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << static_cast<double>(v) / static_cast<double>(initial);
    return oss.str();
}

}

/** @brief Program entry: runs the simulation and prints a report to stdout. */
int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "pricesim");
    Logger::info("pricesim starting");
    try {
        LedgerConfig cfg;
        cfg.applyEnv();
        cfg.applyArgs(argc, argv);
        SimOptions opt = parseOptions(argc, argv);

        ManualClock clock(0);
        LocalBank bank;
        PixelLedger ledger(cfg, clock, bank);
        ledger.start();

        std::mt19937 rng(opt.seed);
        std::vector<Player> players;
        players.reserve(opt.players);
        std::uniform_real_distribution<double> u01(0.0, 1.0);
        for (unsigned i = 0; i < opt.players; ++i) {
            double r = u01(rng);
            const Profile* p = r < 0.7 ? &kCasual : r < 0.9 ? &kRegular : r < 0.98 ? &kEnthusiast : &kWhale;
            Player pl{"player_" + std::to_string(i), p, mulDivFloor(p->budgetUnits, cfg.initialPrice, 1)};
            // Ten purchases at the player's ceiling.
            bank.deposit(pl.id, mulDivFloor(pl.budget, 10, 1));
            players.push_back(pl);
        }
        std::vector<double> weights;
        for (const auto& p : players) weights.push_back(p.profile->activity);
        std::discrete_distribution<size_t> pickPlayer(weights.begin(), weights.end());
        std::uniform_int_distribution<int> pickX(0, cfg.width - 1);
        std::uniform_int_distribution<int> pickY(0, cfg.height - 1);

        const Seconds gap = std::max<Seconds>(1, 86400 / static_cast<Seconds>(opt.perDay));
        const Amount casualBudget = mulDivFloor(kCasual.budgetUnits, cfg.initialPrice, 1);

        std::cout << "pixelwar price simulation: " << cfg.describe() << "\n"
                  << opt.days << " days x " << opt.perDay << " purchases/day, " << opt.players
                  << " players, seed " << opt.seed << "\n\n";
        std::cout << std::left << std::setw(5) << "day" << std::setw(8) << "bought" << std::setw(12) << "avg-price"
                  << std::setw(12) << "max-price" << std::setw(10) << "access" << std::setw(8) << "whale"
                  << std::setw(14) << "pool" << "operator\n";

        unsigned long totalBought = 0;
        for (unsigned day = 1; day <= opt.days; ++day) {
            unsigned bought = 0;
            for (unsigned t = 0; t < opt.perDay; ++t) {
                clock.advance(gap);
                Player& pl = players[pickPlayer(rng)];
                if (ledger.ownedCount(pl.id) >= pl.profile->maxPixels) continue;
                int x = pickX(rng), y = pickY(rng);
                CellView cell = ledger.getCell(x, y);
                if (cell.price > pl.budget || cell.owner == pl.id) continue;
                if (!bank.debit(pl.id, cell.price)) continue;
                PurchaseResult r = ledger.purchase(x, y, pl.profile->name, cell.price, pl.id);
                if (!r.ok()) {
                    bank.deposit(pl.id, cell.price);
                    Logger::warn("pricesim: purchase rejected: " + std::string(purchaseErrorName(r.error)));
                    continue;
                }
                ++bought;
            }
            totalBought += bought;

            CanvasSnapshot snap = ledger.snapshot();
            unsigned __int128 sum = 0;
            Amount maxPrice = 0;
            size_t affordable = 0;
            for (Amount p : snap.prices) {
                sum += p;
                maxPrice = std::max(maxPrice, p);
                if (p <= casualBudget) ++affordable;
            }
            std::uint64_t whaleCells = 0;
            for (const auto& p : players) if (p.profile == &kWhale) whaleCells += ledger.ownedCount(p.id);
            std::uint64_t owned = ledger.totalOwned();
            const Amount avg = static_cast<Amount>(sum / snap.prices.size());
            CycleState cs = ledger.cycleState();

            std::cout << std::left << std::setw(5) << day << std::setw(8) << bought
                      << std::setw(12) << units(avg, cfg.initialPrice)
                      << std::setw(12) << units(maxPrice, cfg.initialPrice)
                      << std::setw(10) << std::fixed << std::setprecision(3)
                      << static_cast<double>(affordable) / static_cast<double>(snap.prices.size())
                      << std::setw(8) << (owned ? static_cast<double>(whaleCells) / static_cast<double>(owned) : 0.0)
                      << std::setw(14) << units(cs.prizePool, cfg.initialPrice)
                      << units(cs.operatorEarnings, cfg.initialPrice) << "\n";
        }

        // Let the inactivity window run out and settle the cycle.
        clock.advance(cfg.inactivityWindow);
        CycleSummary summary;
        if (!ledger.tryEndCycle(&summary)) {
            Logger::error("pricesim: cycle did not end after the inactivity window");
            std::cerr << "cycle did not end\n";
            Logger::shutdown();
            return 1;
        }

        std::cout << "\ncycle " << summary.cycleId << " closed after " << totalBought << " purchases\n"
                  << "prize pool " << units(summary.prizePool, cfg.initialPrice)
                  << ", distributed " << units(summary.distributed, cfg.initialPrice)
                  << ", carried " << summary.carriedOver << " (smallest units)\n"
                  << "winners (" << summary.winningCount << " cells):";
        for (const auto& w : summary.winners) std::cout << " " << w;
        std::cout << "\n\ntop payouts:\n";
        std::vector<Payout> top = summary.payouts;
        std::sort(top.begin(), top.end(), [](const Payout& a, const Payout& b) {
            return a.amount != b.amount ? a.amount > b.amount : a.actor < b.actor;
        });
        if (top.size() > 10) top.resize(10);
        for (const auto& p : top) {
            std::cout << "  " << std::setw(14) << p.actor << std::setw(6) << p.cells
                      << units(p.amount, cfg.initialPrice) << (p.delivered ? "" : "  (failed)") << "\n";
        }

        Logger::info("pricesim finished: purchases=" + std::to_string(totalBought));
        Logger::shutdown();
        return 0;
    } catch (const std::exception& e) {
        Logger::logException("unhandled exception (pricesim)", e);
        std::cerr << "pricesim: " << e.what() << "\n";
        Logger::shutdown();
        return 2;
    }
}
