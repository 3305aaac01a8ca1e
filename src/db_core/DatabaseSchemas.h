#ifndef DATABASE_SCHEMAS_H
#define DATABASE_SCHEMAS_H

#include <string>

namespace DatabaseSchemas {
    //在场车辆
    const std::string CREATE_ACTIVE_VEHICLES_TABLE = R"(
        CREATE TABLE IF NOT EXISTS active_vehicles (
            number_plate TEXT PRIMARY KEY,
            entry_time TEXT NOT NULL,
            slot INTEGER NOT NULL CHECK(slot >= 1),
            created_at DATETIME DEFAULT CURRENT_TIMESTAMP
        );
    )";
    //停车历史, 只追加
    const std::string CREATE_PARKING_HISTORY_TABLE = R"(
        CREATE TABLE IF NOT EXISTS parking_history (
            record_id INTEGER PRIMARY KEY AUTOINCREMENT,
            number_plate TEXT NOT NULL,
            entry_time TEXT NOT NULL,
            exit_time TEXT NOT NULL,
            fee REAL NOT NULL DEFAULT 0,
            slot INTEGER NOT NULL
        );
    )";

    const std::string CREATE_HISTORY_PLATE_INDEX = R"(
        CREATE INDEX IF NOT EXISTS idx_parking_history_plate ON parking_history(number_plate);
    )";
} // namespace DatabaseSchemas

#endif // DATABASE_SCHEMAS_H
