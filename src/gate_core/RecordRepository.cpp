#include "parkgate/gate/RecordRepository.h"
#include <set>

namespace parkgate {
namespace gate {

std::vector<int> RecordRepository::availableSlots(int total_slots) {
    std::set<int> occupied;
    for (const auto& v : listActive()) occupied.insert(v.slot);

    std::vector<int> available;
    for (int slot = 1; slot <= total_slots; ++slot) {
        if (occupied.count(slot) == 0) available.push_back(slot);
    }
    return available;
}

bool RecordRepository::isFull(int total_slots) {
    return availableSlots(total_slots).empty();
}

std::optional<HistoryRecord> RecordRepository::lastHistoryFor(const std::string& plate) {
    for (auto& r : listHistory()) {
        if (r.number_plate == plate) return r;
    }
    return std::nullopt;
}

} // namespace gate
} // namespace parkgate
