#include "SqliteRecordRepository.h"
#include "DatabaseSchemas.h"
#include "TimeUtils.h"
#include <cstdint>
#include <iostream>

namespace parkgate {

SqliteRecordRepository::SqliteRecordRepository(const std::string& db_path) : db_path_(db_path) {
    try {
        database_ = std::make_unique<SQLite::Database>(db_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
        std::cout << "[Store] Database opened: " << db_path << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Error: failed to open database " << db_path << ": " << e.what() << std::endl;
        throw;
    }
}

bool SqliteRecordRepository::initialize() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        bool success = createTables();
        if (success) {
            std::cout << "[Store] Database initialized." << std::endl;
        }
        return success;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Error: database initialization failed: " << e.what() << std::endl;
        return false;
    }
}

// Create Table
bool SqliteRecordRepository::createTables() {
    try {
        SQLite::Transaction transaction(*database_);
        database_->exec(DatabaseSchemas::CREATE_ACTIVE_VEHICLES_TABLE);
        database_->exec(DatabaseSchemas::CREATE_PARKING_HISTORY_TABLE);
        database_->exec(DatabaseSchemas::CREATE_HISTORY_PLATE_INDEX);
        transaction.commit();
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Error: table creation failed: " << e.what() << std::endl;
        return false;
    }
}

bool SqliteRecordRepository::addActive(const std::string& plate, gate::TimePoint entry_time, int slot) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        SQLite::Transaction transaction(*database_);

        SQLite::Statement exists(*database_, "SELECT 1 FROM active_vehicles WHERE number_plate = ?");
        exists.bind(1, plate);
        if (exists.executeStep()) {
            std::cerr << "[Store] Warning: vehicle " << plate << " already in system" << std::endl;
            return false;   // transaction rolls back on scope exit
        }

        SQLite::Statement query(*database_,
            "INSERT INTO active_vehicles (number_plate, entry_time, slot) VALUES (?, ?, ?)");
        query.bind(1, plate);
        query.bind(2, TimeUtils::toIsoString(entry_time));
        query.bind(3, slot);

        bool success = query.exec() == 1;
        if (success) {
            transaction.commit();
            std::cout << "[Store] Added vehicle entry: " << plate << " at slot " << slot << std::endl;
        }
        return success;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Error: insert active vehicle failed: " << e.what() << std::endl;
        return false;
    }
}

std::optional<gate::ActiveVehicle> SqliteRecordRepository::getActive(const std::string& plate) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_,
            "SELECT number_plate, entry_time, slot FROM active_vehicles WHERE number_plate = ?");
        query.bind(1, plate);
        if (!query.executeStep()) return std::nullopt;

        auto entry = TimeUtils::fromIsoString(query.getColumn(1).getString());
        if (!entry) {
            std::cerr << "[Store] Error: malformed entry_time for " << plate << std::endl;
            return std::nullopt;
        }
        gate::ActiveVehicle v;
        v.number_plate = query.getColumn(0).getString();
        v.entry_time = *entry;
        v.slot = query.getColumn(2).getInt();
        return v;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Error: get active vehicle failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

bool SqliteRecordRepository::removeActive(const std::string& plate) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, "DELETE FROM active_vehicles WHERE number_plate = ?");
        query.bind(1, plate);
        if (query.exec() != 1) {
            std::cerr << "[Store] Warning: vehicle " << plate << " not found in active records" << std::endl;
            return false;
        }
        std::cout << "[Store] Removed vehicle entry: " << plate << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Error: remove active vehicle failed: " << e.what() << std::endl;
        return false;
    }
}

bool SqliteRecordRepository::addHistory(const std::string& plate, gate::TimePoint entry_time,
                                        gate::TimePoint exit_time, double fee, int slot) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_,
            "INSERT INTO parking_history (number_plate, entry_time, exit_time, fee, slot) VALUES (?, ?, ?, ?, ?)");
        query.bind(1, plate);
        query.bind(2, TimeUtils::toIsoString(entry_time));
        query.bind(3, TimeUtils::toIsoString(exit_time));
        query.bind(4, fee);
        query.bind(5, slot);

        bool success = query.exec() == 1;
        if (success) {
            std::cout << "[Store] Added history record: " << plate << ", Fee: " << fee << std::endl;
        }
        return success;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Error: insert history failed: " << e.what() << std::endl;
        return false;
    }
}

std::vector<gate::ActiveVehicle> SqliteRecordRepository::listActive() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<gate::ActiveVehicle> vehicles;

    try {
        SQLite::Statement query(*database_,
            "SELECT number_plate, entry_time, slot FROM active_vehicles ORDER BY slot");
        while (query.executeStep()) {
            auto entry = TimeUtils::fromIsoString(query.getColumn(1).getString());
            if (!entry) {
                std::cerr << "[Store] Warning: skipping malformed vehicle record" << std::endl;
                continue;
            }
            gate::ActiveVehicle v;
            v.number_plate = query.getColumn(0).getString();
            v.entry_time = *entry;
            v.slot = query.getColumn(2).getInt();
            vehicles.push_back(v);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Store] Error: list active vehicles failed: " << e.what() << std::endl;
    }
    return vehicles;
}

std::vector<gate::HistoryRecord> SqliteRecordRepository::listHistory(std::size_t limit) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<gate::HistoryRecord> history;

    try {
        // 最新在前; LIMIT -1 表示不限制
        SQLite::Statement query(*database_,
            "SELECT number_plate, entry_time, exit_time, fee, slot FROM parking_history "
            "ORDER BY record_id DESC LIMIT ?");
        query.bind(1, limit > 0 ? static_cast<int64_t>(limit) : static_cast<int64_t>(-1));

        while (query.executeStep()) {
            auto entry = TimeUtils::fromIsoString(query.getColumn(1).getString());
            auto exit = TimeUtils::fromIsoString(query.getColumn(2).getString());
            if (!entry || !exit) {
                std::cerr << "[Store] Warning: skipping malformed history record" << std::endl;
                continue;
            }
            gate::HistoryRecord r;
            r.number_plate = query.getColumn(0).getString();
            r.entry_time = *entry;
            r.exit_time = *exit;
            r.fee = query.getColumn(3).getDouble();
            r.slot = query.getColumn(4).getInt();
            history.push_back(r);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Store] Error: list history failed: " << e.what() << std::endl;
    }
    return history;
}

std::optional<gate::HistoryRecord> SqliteRecordRepository::lastHistoryFor(const std::string& plate) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_,
            "SELECT number_plate, entry_time, exit_time, fee, slot FROM parking_history "
            "WHERE number_plate = ? ORDER BY record_id DESC LIMIT 1");
        query.bind(1, plate);
        if (!query.executeStep()) return std::nullopt;

        auto entry = TimeUtils::fromIsoString(query.getColumn(1).getString());
        auto exit = TimeUtils::fromIsoString(query.getColumn(2).getString());
        if (!entry || !exit) {
            std::cerr << "[Store] Error: malformed history record for " << plate << std::endl;
            return std::nullopt;
        }
        gate::HistoryRecord r;
        r.number_plate = query.getColumn(0).getString();
        r.entry_time = *entry;
        r.exit_time = *exit;
        r.fee = query.getColumn(3).getDouble();
        r.slot = query.getColumn(4).getInt();
        return r;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Error: last history lookup failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace parkgate
