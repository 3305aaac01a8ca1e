#ifndef SQLITE_RECORD_REPOSITORY_H
#define SQLITE_RECORD_REPOSITORY_H

#include <SQLiteCpp/SQLiteCpp.h>
#include <memory>
#include <mutex>
#include <string>

#include "parkgate/gate/RecordRepository.h"

namespace parkgate {

// RecordRepository on a single SQLite file. ":memory:" gives a private in-memory db.
class SqliteRecordRepository : public gate::RecordRepository {
public:
    // throws SQLite::Exception when the file cannot be opened
    explicit SqliteRecordRepository(const std::string& db_path);

    SqliteRecordRepository(const SqliteRecordRepository&) = delete;
    SqliteRecordRepository& operator=(const SqliteRecordRepository&) = delete;

    // Database Initialization
    bool initialize();

    bool addActive(const std::string& plate, gate::TimePoint entry_time, int slot) override;
    std::optional<gate::ActiveVehicle> getActive(const std::string& plate) override;
    bool removeActive(const std::string& plate) override;
    bool addHistory(const std::string& plate, gate::TimePoint entry_time, gate::TimePoint exit_time,
                    double fee, int slot) override;
    std::vector<gate::ActiveVehicle> listActive() override;
    std::vector<gate::HistoryRecord> listHistory(std::size_t limit = 0) override;
    std::optional<gate::HistoryRecord> lastHistoryFor(const std::string& plate) override;

    const std::string& path() const { return db_path_; }

private:
    bool createTables();

    std::string db_path_;
    std::unique_ptr<SQLite::Database> database_;
    std::mutex db_mutex_;
};

} // namespace parkgate

#endif // SQLITE_RECORD_REPOSITORY_H
