#ifndef PARKGATE_SLOT_LEDGER_H
#define PARKGATE_SLOT_LEDGER_H

#include <atomic>
#include <optional>
#include <vector>

#include "parkgate/gate/RecordRepository.h"

namespace parkgate {
namespace gate {

// Slot occupancy derived from the active records, plus the occupancy flag
// reported by the slot sensor. Either one can make the lot full.
class SlotLedger {
public:
    SlotLedger(RecordRepository& repo, int total_slots);

    int totalSlots() const { return total_slots_; }

    std::vector<int> availableSlots();
    std::optional<int> nextFreeSlot();    // 编号最小的空车位

    bool recordsFull();                   // 仅按记录
    bool isFull();                        // 记录 或 传感器

    void setHardwareOccupied(bool occupied);
    bool hardwareOccupied() const { return hardware_occupied_.load(); }

private:
    RecordRepository& repo_;
    int total_slots_;
    std::atomic<bool> hardware_occupied_{false};
};

} // namespace gate
} // namespace parkgate

#endif // PARKGATE_SLOT_LEDGER_H
