/**
 * @file LedgerConfig.cpp
 * @brief Validation and override parsing for LedgerConfig.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "LedgerConfig.h"
#include "Logger.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {
/** @brief Assign @p v to an int field if it fits; logs and ignores otherwise. */
void setInt(const char* name, Amount v, int& field) {
    if (v > static_cast<Amount>(std::numeric_limits<int>::max())) {
        Logger::warn(std::string("config: ") + name + " out of range, ignored");
        return;
    }
    field = static_cast<int>(v);
}

void setPct(const char* name, Amount v, unsigned& field) {
    if (v > 100) {
        Logger::warn(std::string("config: ") + name + " above 100, ignored");
        return;
    }
    field = static_cast<unsigned>(v);
}

const char* const kNumericKeys[] = {"width", "height", "initial-price", "price-num", "price-den",
                                    "owner-pct", "pool-pct", "operator-pct", "window"};

bool isConfigKey(const std::string& key) {
    if (key == "operator") return true;
    for (const char* k : kNumericKeys) if (key == k) return true;
    return false;
}

/**
 * @brief Apply one named setting from text. Returns false if @p key is not a config key.
 *
 * Keys match the long flag names without the leading dashes.
 */
bool applySetting(LedgerConfig& cfg, const std::string& key, const char* value) {
    if (!isConfigKey(key)) return false;
    if (key == "operator") {
        if (value && *value) cfg.operatorId = value;
        else Logger::warn("config: empty operator id ignored");
        return true;
    }

    Amount v = 0;
    if (!parseAmount(value, v)) {
        Logger::warn("config: bad value for " + key + ": '" + (value ? value : "") + "'");
        return true;
    }
    if (key == "width") setInt("width", v, cfg.width);
    else if (key == "height") setInt("height", v, cfg.height);
    else if (key == "initial-price") cfg.initialPrice = v;
    else if (key == "price-num") cfg.priceNumerator = v;
    else if (key == "price-den") cfg.priceDenominator = v;
    else if (key == "owner-pct") setPct("owner-pct", v, cfg.ownerPct);
    else if (key == "pool-pct") setPct("pool-pct", v, cfg.poolPct);
    else if (key == "operator-pct") setPct("operator-pct", v, cfg.operatorPct);
    else if (key == "window") {
        if (v > static_cast<Amount>(std::numeric_limits<Seconds>::max())) Logger::warn("config: window out of range, ignored");
        else cfg.inactivityWindow = static_cast<Seconds>(v);
    }
    return true;
}
}

bool parseAmount(const char* s, Amount& out) {
    if (!s || !*s) return false;
    for (const char* p = s; *p; ++p) if (*p < '0' || *p > '9') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno == ERANGE || end == s || *end != '\0') return false;
    out = static_cast<Amount>(v);
    return true;
}

/** @copydoc LedgerConfig::validate */
void LedgerConfig::validate() const {
    if (width <= 0 || height <= 0) throw std::invalid_argument("grid dimensions must be positive");
    if (width > MaxSide || height > MaxSide) throw std::invalid_argument("grid side exceeds " + std::to_string(MaxSide));
    if (initialPrice == 0) throw std::invalid_argument("initial price must be positive");
    if (priceDenominator == 0) throw std::invalid_argument("price multiplier denominator must be non-zero");
    if (priceNumerator <= priceDenominator) throw std::invalid_argument("price multiplier must be greater than 1");
    // Escalation is floor(p * num / den); if it does not move the starting price it never moves any price.
    Amount first = 0;
    try {
        first = mulDivFloor(initialPrice, priceNumerator, priceDenominator);
    } catch (const std::overflow_error&) {
        throw std::invalid_argument("initial price escalation overflows");
    }
    if (first <= initialPrice) throw std::invalid_argument("multiplier does not raise the initial price after truncation");
    if (ownerPct + poolPct + operatorPct != 100) {
        throw std::invalid_argument("split percentages must sum to 100 (got " +
                                    std::to_string(ownerPct + poolPct + operatorPct) + ")");
    }
    if (inactivityWindow <= 0) throw std::invalid_argument("inactivity window must be positive");
    if (operatorId.empty()) throw std::invalid_argument("operator id must be non-empty");
}

/** @copydoc LedgerConfig::applyEnv */
void LedgerConfig::applyEnv() {
    static const struct { const char* env; const char* key; } vars[] = {
        {"PIXELWAR_WIDTH", "width"},
        {"PIXELWAR_HEIGHT", "height"},
        {"PIXELWAR_INITIAL_PRICE", "initial-price"},
        {"PIXELWAR_PRICE_NUM", "price-num"},
        {"PIXELWAR_PRICE_DEN", "price-den"},
        {"PIXELWAR_OWNER_PCT", "owner-pct"},
        {"PIXELWAR_POOL_PCT", "pool-pct"},
        {"PIXELWAR_OPERATOR_PCT", "operator-pct"},
        {"PIXELWAR_WINDOW_SECS", "window"},
        {"PIXELWAR_OPERATOR", "operator"},
    };
    for (const auto& v : vars) {
        const char* s = std::getenv(v.env);
        if (!s) continue;
        applySetting(*this, v.key, s);
    }
}

/** @copydoc LedgerConfig::applyArgs */
void LedgerConfig::applyArgs(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind("--", 0) != 0) continue;
        std::string body = a.substr(2);
        size_t eq = body.find('=');
        if (eq != std::string::npos) {
            applySetting(*this, body.substr(0, eq), body.c_str() + eq + 1);
            continue;
        }
        // Only consume the next argument when the flag is one of ours.
        if (!isConfigKey(body)) continue;
        const char* next = (i + 1 < argc) ? argv[i + 1] : nullptr;
        applySetting(*this, body, next);
        if (next) ++i;
    }
}

/** @copydoc LedgerConfig::describe */
std::string LedgerConfig::describe() const {
    std::ostringstream oss;
    oss << width << "x" << height
        << " initial=" << initialPrice
        << " multiplier=" << priceNumerator << "/" << priceDenominator
        << " split=" << ownerPct << "/" << poolPct << "/" << operatorPct
        << " window=" << inactivityWindow << "s"
        << " operator=" << operatorId;
    return oss.str();
}
