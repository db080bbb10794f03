// SPDX-License-Identifier: MIT
#include "src/pricing/reference_schedule.hpp"
#include <utility>

namespace spendcalc {

std::vector<Tier> reference_tiers() {
    return {
        {          0,     125'000, 0.0330},
        {    125'001,     250'000, 0.0315},
        {    250'001,     416'667, 0.0297},
        {    416'668,     833'333, 0.0264},
        {    833'334,   1'666'667, 0.0231},
        {  1'666'668,   2'500'000, 0.0215},
        {  2'500'001,   3'333'333, 0.0198},
        {  3'333'334,   4'166'667, 0.0182},
        {  4'166'668,   6'250'000, 0.0165},
        {  6'250'001,   8'333'333, 0.0132},
        {  8'333'334,  12'500'000, 0.0116},
        { 12'500'001,  16'666'667, 0.0107},
        { 16'666'668,  20'833'333, 0.0100},
        { 20'833'334,  25'000'000, 0.0095},
        { 25'000'001,  29'166'667, 0.0091},
        { 29'166'668,  33'333'333, 0.0088},
        { 33'333'334,  41'666'667, 0.0084},
        { 41'666'668,  62'500'000, 0.0069},
        { 62'500'001,  83'333'333, 0.0062},
        { 83'333'334, 104'166'667, 0.0054},
        {104'166'668, 125'000'000, 0.0050},
        {125'000'001, 145'833'333, 0.0046},
        {145'833'334, 166'666'667, 0.0043},
        {166'666'668, 187'500'000, 0.0040},
        {187'500'001, 208'333'333, 0.0038},
        {208'333'334, 250'000'000, 0.0034},
    };
}

std::expected<std::shared_ptr<const TierTable>, ConfigurationError> make_reference_table() {
    auto table = TierTable::create(reference_tiers());
    if (!table.has_value()) {
        return std::unexpected(table.error());
    }
    return std::make_shared<const TierTable>(std::move(*table));
}

}  // namespace spendcalc
