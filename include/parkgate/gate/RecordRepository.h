#ifndef PARKGATE_RECORD_REPOSITORY_H
#define PARKGATE_RECORD_REPOSITORY_H

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace parkgate {
namespace gate {

using TimePoint = std::chrono::system_clock::time_point;

// Vehicle currently parked, unique by plate.
struct ActiveVehicle {
    std::string number_plate;
    TimePoint   entry_time;
    int         slot = 0;
};

// Completed stay, append-only.
struct HistoryRecord {
    std::string number_plate;
    TimePoint   entry_time;
    TimePoint   exit_time;
    double      fee = 0.0;
    int         slot = 0;
};

// Active-vehicle and history storage. Implementations never throw past this
// boundary: failures come back as false / nullopt / empty and are logged.
class RecordRepository {
public:
    virtual ~RecordRepository() = default;

    virtual bool addActive(const std::string& plate, TimePoint entry_time, int slot) = 0;
    virtual std::optional<ActiveVehicle> getActive(const std::string& plate) = 0;
    virtual bool removeActive(const std::string& plate) = 0;
    virtual bool addHistory(const std::string& plate, TimePoint entry_time, TimePoint exit_time,
                            double fee, int slot) = 0;
    virtual std::vector<ActiveVehicle> listActive() = 0;

    // most recent first; limit 0 = all
    virtual std::vector<HistoryRecord> listHistory(std::size_t limit = 0) = 0;

    // newest history record for a plate; default scans listHistory()
    virtual std::optional<HistoryRecord> lastHistoryFor(const std::string& plate);

    // 1-indexed slots not held by an active record, ascending
    std::vector<int> availableSlots(int total_slots);
    bool isFull(int total_slots);
};

} // namespace gate
} // namespace parkgate

#endif // PARKGATE_RECORD_REPOSITORY_H
