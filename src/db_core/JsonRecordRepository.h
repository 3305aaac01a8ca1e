#ifndef JSON_RECORD_REPOSITORY_H
#define JSON_RECORD_REPOSITORY_H

#include "parkgate/gate/RecordRepository.h"
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

namespace parkgate {

// vehicles.json {"vehicles": [...]} + history.json {"history": [...]} in data_dir.
// Each write replaces the file through a temp file + rename.
class JsonRecordRepository : public gate::RecordRepository {
public:
    explicit JsonRecordRepository(const std::string& data_dir = "data",
                                  const std::string& vehicles_file = "vehicles.json",
                                  const std::string& history_file = "history.json");

    bool addActive(const std::string& plate, gate::TimePoint entry_time, int slot) override;
    std::optional<gate::ActiveVehicle> getActive(const std::string& plate) override;
    bool removeActive(const std::string& plate) override;
    bool addHistory(const std::string& plate, gate::TimePoint entry_time, gate::TimePoint exit_time,
                    double fee, int slot) override;
    std::vector<gate::ActiveVehicle> listActive() override;
    std::vector<gate::HistoryRecord> listHistory(std::size_t limit = 0) override;

    const std::string& vehiclesPath() const { return vehicles_path_; }
    const std::string& historyPath() const { return history_path_; }

private:
    void initializeFiles();
    std::optional<nlohmann::json> readJson(const std::string& path, const char* key);
    bool writeJson(const std::string& path, const nlohmann::json& data);

    static std::optional<gate::ActiveVehicle> vehicleFromJson(const nlohmann::json& j);

    std::string data_dir_;
    std::string vehicles_path_;
    std::string history_path_;
    std::mutex file_mutex_;
};

} // namespace parkgate

#endif // JSON_RECORD_REPOSITORY_H
