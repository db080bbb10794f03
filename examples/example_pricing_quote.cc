/**
 * @file example_pricing_quote.cc
 * @brief Flex vs commit comparison using the shipped tier schedule
 *
 * Demonstrates:
 * - Building the reference TierTable and a PricingEngine
 * - Error handling with std::expected
 * - Pricing one spend/commitment pair with quote()
 * - Listing the tier schedule
 *
 * Usage:
 *   example_pricing_quote [monthly_spend] [commit_amount]
 */

#include "src/pricing/price_quote.hpp"
#include "src/pricing/reference_schedule.hpp"
#include <cstdlib>
#include <iomanip>
#include <iostream>

int main(int argc, char** argv) {
    std::cout << "=== Cloud Spend Pricing Example ===\n\n";

    double spend = 500'000.0;
    double commit_amount = 0.0;
    if (argc > 1) spend = std::strtod(argv[1], nullptr);
    if (argc > 2) commit_amount = std::strtod(argv[2], nullptr);

    // 1. Validate the shipped schedule
    auto table = spendcalc::make_reference_table();
    if (!table.has_value()) {
        std::cerr << "ERROR: Tier schedule rejected: " << table.error() << "\n";
        return 1;
    }

    // 2. Bind an engine with the default commercial constants
    auto engine = spendcalc::PricingEngine::create(*table);
    if (!engine.has_value()) {
        std::cerr << "ERROR: Engine creation failed: " << engine.error() << "\n";
        return 1;
    }

    // 3. Price both models
    auto q = spendcalc::quote(*engine, spend, commit_amount);
    if (!q.has_value()) {
        std::cerr << "ERROR: " << q.error() << "\n";
        return 1;
    }

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Schedule version:      " << spendcalc::kReferenceScheduleVersion << "\n";
    std::cout << "Monthly spend:         $" << q->spend << "\n";
    std::cout << "Commitment:            $" << q->commit_amount << "\n\n";
    std::cout << "Flex pricing:          $" << q->flex_cost << "\n";
    std::cout << "Commit pricing:        $" << q->commit_cost << "\n";
    if (q->has_savings()) {
        std::cout << "Monthly savings:       $" << q->savings << "\n";
    }
    std::cout << "Recommended commit:    $" << q->recommended_commit << "\n";
    std::cout << "Commitment range:      $0 - $" << q->max_commit_amount << "\n\n";

    // 4. Tier schedule
    std::cout << "Pricing tiers:\n";
    for (const auto& tier : engine->list_tiers()) {
        std::cout << "  $" << std::setw(11) << tier.lower
                  << " - $" << std::setw(11) << tier.upper
                  << "  " << std::setprecision(2) << (tier.rate * 100.0) << "%\n";
    }

    return 0;
}
