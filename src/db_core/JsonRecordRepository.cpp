#include "JsonRecordRepository.h"
#include "TimeUtils.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

using nlohmann::json;
namespace fs = std::filesystem;

namespace parkgate {

JsonRecordRepository::JsonRecordRepository(const std::string& data_dir,
                                           const std::string& vehicles_file,
                                           const std::string& history_file)
    : data_dir_(data_dir),
      vehicles_path_((fs::path(data_dir) / vehicles_file).string()),
      history_path_((fs::path(data_dir) / history_file).string()) {
    initializeFiles();
}

void JsonRecordRepository::initializeFiles() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    std::error_code ec;
    fs::create_directories(data_dir_, ec);
    if (ec) {
        std::cerr << "[Store] Error creating data directory " << data_dir_ << ": " << ec.message() << "\n";
        return;
    }
    if (!fs::exists(vehicles_path_)) {
        if (writeJson(vehicles_path_, json{{"vehicles", json::array()}}))
            std::cout << "[Store] Initialized " << vehicles_path_ << "\n";
    }
    if (!fs::exists(history_path_)) {
        if (writeJson(history_path_, json{{"history", json::array()}}))
            std::cout << "[Store] Initialized " << history_path_ << "\n";
    }
}

std::optional<json> JsonRecordRepository::readJson(const std::string& path, const char* key) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        std::cerr << "[Store] Warning: file not found: " << path << "\n";
        return json{{key, json::array()}};
    }
    try {
        json root; ifs >> root;
        if (!root.is_object()) {
            std::cerr << "[Store] Error: unexpected layout in " << path << "\n";
            return std::nullopt;
        }
        if (!root.contains(key) || !root[key].is_array()) root[key] = json::array();
        return root;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Error: JSON decode error in " << path << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

bool JsonRecordRepository::writeJson(const std::string& path, const json& data) {
    // 写临时文件后 rename, 目标文件要么完整要么未改动
    const std::string tmp_path = path + ".tmp";
    try {
        {
            std::ofstream ofs(tmp_path, std::ios::trunc);
            if (!ofs.is_open()) {
                std::cerr << "[Store] Error writing to " << tmp_path << "\n";
                return false;
            }
            ofs << data.dump(2);
            ofs.flush();
            if (!ofs) {
                std::cerr << "[Store] Error writing to " << tmp_path << "\n";
                return false;
            }
        }
        std::error_code ec;
        fs::rename(tmp_path, path, ec);
        if (ec) {
            std::cerr << "[Store] Error replacing " << path << ": " << ec.message() << "\n";
            fs::remove(tmp_path, ec);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Store] Error writing to " << path << ": " << e.what() << "\n";
        return false;
    }
}

std::optional<gate::ActiveVehicle> JsonRecordRepository::vehicleFromJson(const json& j) {
    try {
        auto entry = TimeUtils::fromIsoString(j.at("entry_time").get<std::string>());
        if (!entry) return std::nullopt;
        gate::ActiveVehicle v;
        v.number_plate = j.at("number_plate").get<std::string>();
        v.entry_time = *entry;
        v.slot = j.value("slot", 1);
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool JsonRecordRepository::addActive(const std::string& plate, gate::TimePoint entry_time, int slot) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    auto data = readJson(vehicles_path_, "vehicles");
    if (!data) return false;

    json& vehicles = (*data)["vehicles"];
    for (const auto& v : vehicles) {
        if (v.value("number_plate", std::string()) == plate) {
            std::cerr << "[Store] Warning: vehicle " << plate << " already in system\n";
            return false;
        }
    }
    vehicles.push_back(json{
        {"number_plate", plate},
        {"entry_time", TimeUtils::toIsoString(entry_time)},
        {"slot", slot}
    });
    if (!writeJson(vehicles_path_, *data)) return false;

    std::cout << "[Store] Added vehicle entry: " << plate << " at slot " << slot << "\n";
    return true;
}

std::optional<gate::ActiveVehicle> JsonRecordRepository::getActive(const std::string& plate) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    auto data = readJson(vehicles_path_, "vehicles");
    if (!data) return std::nullopt;

    for (const auto& v : (*data)["vehicles"]) {
        if (v.value("number_plate", std::string()) != plate) continue;
        auto parsed = vehicleFromJson(v);
        if (!parsed) {
            std::cerr << "[Store] Error: malformed record for " << plate << "\n";
        }
        return parsed;
    }
    return std::nullopt;
}

bool JsonRecordRepository::removeActive(const std::string& plate) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    auto data = readJson(vehicles_path_, "vehicles");
    if (!data) return false;

    json& vehicles = (*data)["vehicles"];
    json kept = json::array();
    for (const auto& v : vehicles) {
        if (v.value("number_plate", std::string()) != plate) kept.push_back(v);
    }
    if (kept.size() == vehicles.size()) {
        std::cerr << "[Store] Warning: vehicle " << plate << " not found in active records\n";
        return false;
    }
    vehicles = std::move(kept);
    if (!writeJson(vehicles_path_, *data)) return false;

    std::cout << "[Store] Removed vehicle entry: " << plate << "\n";
    return true;
}

bool JsonRecordRepository::addHistory(const std::string& plate, gate::TimePoint entry_time,
                                      gate::TimePoint exit_time, double fee, int slot) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    auto data = readJson(history_path_, "history");
    if (!data) return false;

    (*data)["history"].push_back(json{
        {"number_plate", plate},
        {"entry_time", TimeUtils::toIsoString(entry_time)},
        {"exit_time", TimeUtils::toIsoString(exit_time)},
        {"fee", fee},
        {"slot", slot}
    });
    if (!writeJson(history_path_, *data)) return false;

    std::cout << "[Store] Added history record: " << plate << ", Fee: $"
              << std::fixed << std::setprecision(2) << fee << std::defaultfloat << "\n";
    return true;
}

std::vector<gate::ActiveVehicle> JsonRecordRepository::listActive() {
    std::vector<gate::ActiveVehicle> out;
    std::lock_guard<std::mutex> lock(file_mutex_);
    auto data = readJson(vehicles_path_, "vehicles");
    if (!data) return out;

    for (const auto& v : (*data)["vehicles"]) {
        auto parsed = vehicleFromJson(v);
        if (parsed) out.push_back(std::move(*parsed));
        else std::cerr << "[Store] Warning: skipping malformed vehicle record\n";
    }
    return out;
}

std::vector<gate::HistoryRecord> JsonRecordRepository::listHistory(std::size_t limit) {
    std::vector<gate::HistoryRecord> out;
    std::lock_guard<std::mutex> lock(file_mutex_);
    auto data = readJson(history_path_, "history");
    if (!data) return out;

    for (const auto& h : (*data)["history"]) {
        try {
            auto entry = TimeUtils::fromIsoString(h.at("entry_time").get<std::string>());
            auto exit = TimeUtils::fromIsoString(h.at("exit_time").get<std::string>());
            if (!entry || !exit) continue;
            gate::HistoryRecord r;
            r.number_plate = h.at("number_plate").get<std::string>();
            r.entry_time = *entry;
            r.exit_time = *exit;
            r.fee = h.value("fee", 0.0);
            r.slot = h.value("slot", 1);
            out.push_back(std::move(r));
        } catch (const std::exception&) {
            std::cerr << "[Store] Warning: skipping malformed history record\n";
        }
    }
    std::reverse(out.begin(), out.end());
    if (limit > 0 && out.size() > limit) out.resize(limit);
    return out;
}

} // namespace parkgate
