#include "parkgate/gate/SlotLedger.h"
#include <iostream>

namespace parkgate {
namespace gate {

SlotLedger::SlotLedger(RecordRepository& repo, int total_slots)
    : repo_(repo), total_slots_(total_slots > 0 ? total_slots : 1) {
    if (total_slots <= 0) {
        std::cerr << "[Ledger] Warning: invalid slot count " << total_slots << ", using 1\n";
    }
}

std::vector<int> SlotLedger::availableSlots() {
    return repo_.availableSlots(total_slots_);
}

std::optional<int> SlotLedger::nextFreeSlot() {
    auto slots = availableSlots();
    if (slots.empty()) return std::nullopt;
    return slots.front();
}

bool SlotLedger::recordsFull() {
    return repo_.isFull(total_slots_);
}

bool SlotLedger::isFull() {
    if (hardware_occupied_.load()) return true;
    return recordsFull();
}

void SlotLedger::setHardwareOccupied(bool occupied) {
    bool previous = hardware_occupied_.exchange(occupied);
    if (previous != occupied) {
        std::cout << "[Ledger] Parking slot is now " << (occupied ? "occupied" : "free") << "\n";
    }
}

} // namespace gate
} // namespace parkgate
