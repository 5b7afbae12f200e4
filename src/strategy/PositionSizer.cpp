#include "strategy/PositionSizer.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

namespace gridcycle {
namespace strategy {

const char* toString(TableOverflow overflow) {
    return overflow == TableOverflow::BASE_AMOUNT ? "base_amount" : "last_multiplier";
}

TableOverflow parseTableOverflow(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "last_multiplier" || n == "last") return TableOverflow::LAST_MULTIPLIER;
    if (n == "base_amount" || n == "base") return TableOverflow::BASE_AMOUNT;
    throw InvalidConfigurationError("unknown scaling overflow '" + name + "'");
}

Volume PositionSizer::size(double base_amount, const ScalingTable& table, int layer_index,
                           TableOverflow overflow) {
    if (!(base_amount > 0.0) || !std::isfinite(base_amount)) {
        throw InvalidConfigurationError("base amount must be positive, got " + std::to_string(base_amount));
    }
    validateTable(table);

    const std::size_t distance = static_cast<std::size_t>(std::abs(layer_index));
    if (distance >= table.size() && overflow == TableOverflow::BASE_AMOUNT) {
        return base_amount;
    }
    const std::size_t slot = distance < table.size() ? distance : table.size() - 1;
    return base_amount * table[slot];
}

void PositionSizer::validateTable(const ScalingTable& table) {
    if (table.empty()) {
        throw InvalidConfigurationError("scaling table is empty");
    }
    if (table[0] < 1.0) {
        throw InvalidConfigurationError("scaling table[0] must be >= 1");
    }
    for (std::size_t i = 0; i < table.size(); ++i) {
        if (!(table[i] > 0.0) || !std::isfinite(table[i])) {
            throw InvalidConfigurationError("scaling table entry " + std::to_string(i) + " must be positive");
        }
    }
}

} // namespace strategy
} // namespace gridcycle
