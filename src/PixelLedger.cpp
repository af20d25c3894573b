/**
 * @file PixelLedger.cpp
 * @brief PixelLedger implementation: locking, reentrancy rejection and read-only views.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "PixelLedger.h"
#include "Clock.h"
#include "Logger.h"
#include "PaymentGateway.h"
#include "WinnerResolver.h"

#include <stdexcept>
#include <string>

namespace {
const LedgerConfig& validated(const LedgerConfig& c) {
    c.validate();
    return c;
}

/** @brief Marks the current thread as the ledger writer for the lifetime of the scope. */
class WriterScope {
public:
    explicit WriterScope(std::atomic<std::thread::id>& w) : slot(w) { slot.store(std::this_thread::get_id()); }
    ~WriterScope() { slot.store(std::thread::id()); }
    WriterScope(const WriterScope&) = delete;
    WriterScope& operator=(const WriterScope&) = delete;

private:
    std::atomic<std::thread::id>& slot;
};
}

/** @copydoc PixelLedger::PixelLedger */
PixelLedger::PixelLedger(const LedgerConfig& c, Clock& clk, PaymentGateway& gw)
    : cfg(validated(c)),
      clock(clk),
      gateway(gw),
      grid(cfg.width, cfg.height, cfg.initialPrice),
      cycle(cfg.inactivityWindow),
      pricing(cfg.priceNumerator, cfg.priceDenominator),
      splitter(cfg.ownerPct, cfg.poolPct, cfg.operatorPct),
      processor(grid, owners, cycle, pricing, splitter, gateway, cfg.operatorId, cfg.initialPrice) {
    Logger::info("ledger created: " + cfg.describe());
}

void PixelLedger::checkNotReentrant(const char* op) const {
    if (writer.load() == std::this_thread::get_id()) {
        throw std::logic_error(std::string("PixelLedger::") + op + " called from inside a payment transfer");
    }
}

/** @copydoc PixelLedger::start */
bool PixelLedger::start() {
    checkNotReentrant("start");
    std::lock_guard<std::mutex> lock(mtx);
    return cycle.start(clock.now());
}

/** @copydoc PixelLedger::purchase */
PurchaseResult PixelLedger::purchase(int x, int y, const std::string& tag, Amount amountTendered, const ActorId& actor) {
    if (writer.load() == std::this_thread::get_id()) {
        Logger::warn("purchase rejected: reentrant call from transfer, actor=" + actor);
        PurchaseResult r;
        r.error = PurchaseError::ReentrantCall;
        return r;
    }
    if (actor.empty()) throw std::invalid_argument("PixelLedger::purchase: empty actor id");

    std::lock_guard<std::mutex> lock(mtx);
    WriterScope scope(writer);
    const Timestamp now = clock.now();
    // An expired cycle is over even if nobody has polled tryEndCycle yet.
    if (cycle.shouldEnd(now)) {
        Logger::info("purchase by " + actor + " after inactivity window; closing cycle " +
                     std::to_string(cycle.cycleId()) + " first");
        closeCycleLocked(now, nullptr);
    }
    PurchaseResult r = processor.purchase(x, y, tag, amountTendered, actor, now);
    if (r.ok()) operatorEarnings += r.receipt.split.operatorShare;
    return r;
}

CellView PixelLedger::viewLocked(int x, int y) const {
    Cell c = processor.effectiveCell(x, y);
    CellView v;
    v.owner = c.owner;
    v.price = c.price;
    v.tag = c.tag;
    return v;
}

/** @copydoc PixelLedger::getCell */
CellView PixelLedger::getCell(int x, int y) const {
    checkNotReentrant("getCell");
    std::lock_guard<std::mutex> lock(mtx);
    return viewLocked(x, y);
}

/** @copydoc PixelLedger::ownedCells */
std::vector<std::pair<int, int>> PixelLedger::ownedCells(const ActorId& actor) const {
    checkNotReentrant("ownedCells");
    std::vector<std::pair<int, int>> out;
    if (actor.empty()) return out;
    std::lock_guard<std::mutex> lock(mtx);
    const std::uint64_t expected = owners.count(actor);
    if (expected == 0) return out;
    out.reserve(static_cast<size_t>(expected));
    for (int y = 0; y < grid.height() && out.size() < expected; ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            const Cell& c = grid.get(x, y);
            if (c.lastUpdateCycle == cycle.cycleId() && c.owner == actor) out.emplace_back(x, y);
        }
    }
    return out;
}

/** @copydoc PixelLedger::ownedCount */
std::uint64_t PixelLedger::ownedCount(const ActorId& actor) const {
    checkNotReentrant("ownedCount");
    std::lock_guard<std::mutex> lock(mtx);
    return owners.count(actor);
}

/** @copydoc PixelLedger::totalOwned */
std::uint64_t PixelLedger::totalOwned() const {
    checkNotReentrant("totalOwned");
    std::lock_guard<std::mutex> lock(mtx);
    return owners.totalOwned();
}

/** @copydoc PixelLedger::leaders */
std::vector<ActorId> PixelLedger::leaders(std::uint64_t* topCount) const {
    checkNotReentrant("leaders");
    std::lock_guard<std::mutex> lock(mtx);
    return WinnerResolver::resolve(owners, topCount);
}

/** @copydoc PixelLedger::cycleState */
CycleState PixelLedger::cycleState() const {
    checkNotReentrant("cycleState");
    const Timestamp now = clock.now();
    std::lock_guard<std::mutex> lock(mtx);
    CycleState s;
    s.active = cycle.active();
    s.cycleId = cycle.cycleId();
    s.startedAt = cycle.startedAt();
    s.lastActivityAt = cycle.lastActivityAt();
    s.remainingTime = cycle.remainingTime(now);
    s.prizePool = cycle.prizePool();
    s.operatorEarnings = operatorEarnings;
    return s;
}

/** @copydoc PixelLedger::tryEndCycle(Timestamp,CycleSummary*) */
bool PixelLedger::tryEndCycle(Timestamp now, CycleSummary* summary) {
    if (writer.load() == std::this_thread::get_id()) {
        Logger::warn("tryEndCycle ignored: reentrant call from transfer");
        return false;
    }
    std::lock_guard<std::mutex> lock(mtx);
    WriterScope scope(writer);
    return closeCycleLocked(now, summary);
}

bool PixelLedger::closeCycleLocked(Timestamp now, CycleSummary* summary) {
    CycleSummary s;
    if (!cycle.endAndRestart(now, owners, gateway, s)) return false;
    lastSummary = s;
    haveSummary = true;
    if (summary) *summary = std::move(s);
    return true;
}

/** @copydoc PixelLedger::tryEndCycle(CycleSummary*) */
bool PixelLedger::tryEndCycle(CycleSummary* summary) {
    return tryEndCycle(clock.now(), summary);
}

/** @copydoc PixelLedger::lastCycleSummary */
bool PixelLedger::lastCycleSummary(CycleSummary& out) const {
    checkNotReentrant("lastCycleSummary");
    std::lock_guard<std::mutex> lock(mtx);
    if (!haveSummary) return false;
    out = lastSummary;
    return true;
}

/** @copydoc PixelLedger::snapshot */
CanvasSnapshot PixelLedger::snapshot() const {
    checkNotReentrant("snapshot");
    std::lock_guard<std::mutex> lock(mtx);
    CanvasSnapshot s;
    s.width = grid.width();
    s.height = grid.height();
    s.owners.reserve(grid.size());
    s.tags.reserve(grid.size());
    s.prices.reserve(grid.size());
    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            CellView v = viewLocked(x, y);
            s.owners.push_back(std::move(v.owner));
            s.tags.push_back(std::move(v.tag));
            s.prices.push_back(v.price);
        }
    }
    return s;
}
