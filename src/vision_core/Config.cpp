#include "parkgate/Config.h"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>

using nlohmann::json;

namespace parkgate {

static void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n[key]) v = n[key].as<std::string>(); }
static void try_get(const YAML::Node& n, const char* key, int& v)         { if (n[key]) v = n[key].as<int>(); }
static void try_get(const YAML::Node& n, const char* key, double& v)      { if (n[key]) v = n[key].as<double>(); }
static void try_get(const YAML::Node& n, const char* key, bool& v)        { if (n[key]) v = n[key].as<bool>(); }

static void try_get(const YAML::Node& n, const char* key, vision::ZoneRect& z) {
    if (!n[key]) return;
    const YAML::Node& r = n[key];
    try_get(r, "x1", z.x1);
    try_get(r, "y1", z.y1);
    try_get(r, "x2", z.x2);
    try_get(r, "y2", z.y2);
}

ParkingConfig ParkingConfig::fromYaml(const std::string& yaml_path) {
    ParkingConfig c;
    if (!std::filesystem::exists(yaml_path)) {
        std::cerr << "[Config] Warning: configuration file not found: " << yaml_path << ". Using defaults.\n";
        return c;
    }
    try {
        YAML::Node r = YAML::LoadFile(yaml_path);
        try_get(r, "entry_zone", c.entry_zone);
        try_get(r, "exit_zone",  c.exit_zone);
        try_get(r, "entry_virtual_line_position", c.entry_virtual_line_position);
        try_get(r, "exit_virtual_line_position",  c.exit_virtual_line_position);
        try_get(r, "motion_threshold", c.motion_threshold);
        try_get(r, "frame_width",  c.frame_width);
        try_get(r, "frame_height", c.frame_height);

        try_get(r, "camera_index", c.camera_index);
        try_get(r, "video_source", c.video_source);
        try_get(r, "warmup_frames", c.warmup_frames);
        try_get(r, "frame_interval_ms", c.frame_interval_ms);

        try_get(r, "mog2_history",        c.mog2_history);
        try_get(r, "mog2_var_threshold",  c.mog2_var_threshold);
        try_get(r, "mog2_detect_shadows", c.mog2_detect_shadows);
        try_get(r, "crossing_cooldown_ms", c.crossing_cooldown_ms);

        try_get(r, "serial_port", c.serial_port);
        try_get(r, "baud_rate", c.baud_rate);
        try_get(r, "serial_timeout_ms", c.serial_timeout_ms);
        try_get(r, "poll_interval_ms", c.poll_interval_ms);

        try_get(r, "hourly_rate", c.hourly_rate);
        try_get(r, "total_slots", c.total_slots);
        try_get(r, "gate_grace_ms", c.gate_grace_ms);
        try_get(r, "buzzer_ms", c.buzzer_ms);
        try_get(r, "ocr_retry_delay_ms", c.ocr_retry_delay_ms);

        try_get(r, "tessdata_prefix", c.tessdata_prefix);
        try_get(r, "ocr_language", c.ocr_language);
        try_get(r, "ocr_timeout_ms", c.ocr_timeout_ms);

        try_get(r, "storage_backend", c.storage_backend);
        try_get(r, "data_dir", c.data_dir);
        try_get(r, "sqlite_path", c.sqlite_path);
        try_get(r, "shutdown_timeout_ms", c.shutdown_timeout_ms);
    } catch (const std::exception& ex) {
        std::cerr << "[Config] Error parsing configuration file " << yaml_path << ": " << ex.what()
                  << ". Using defaults.\n";
        return ParkingConfig{};
    }
    c.sanitize();
    std::cout << "[Config] Configuration loaded from " << yaml_path << "\n";
    return c;
}

ParkingConfig ParkingConfig::fromJson(const std::string& json_path) {
    ParkingConfig c;
    std::ifstream ifs(json_path);
    if (!ifs.is_open()) {
        std::cerr << "[Config] Warning: configuration file not found: " << json_path << ". Using defaults.\n";
        return c;
    }
    try {
        json r; ifs >> r;
        auto get_s = [&](const char* k, std::string& v){ if(r.contains(k)) v = r[k].get<std::string>(); };
        auto get_i = [&](const char* k, int& v){ if(r.contains(k)) v = r[k].get<int>(); };
        auto get_d = [&](const char* k, double& v){ if(r.contains(k)) v = r[k].get<double>(); };
        auto get_b = [&](const char* k, bool& v){ if(r.contains(k)) v = r[k].get<bool>(); };
        auto get_z = [&](const char* k, vision::ZoneRect& z){
            if (!r.contains(k)) return;
            const json& zj = r[k];
            z.x1 = zj.value("x1", z.x1);
            z.y1 = zj.value("y1", z.y1);
            z.x2 = zj.value("x2", z.x2);
            z.y2 = zj.value("y2", z.y2);
        };

        get_z("entry_zone", c.entry_zone);
        get_z("exit_zone",  c.exit_zone);
        get_d("entry_virtual_line_position", c.entry_virtual_line_position);
        get_d("exit_virtual_line_position",  c.exit_virtual_line_position);
        get_i("motion_threshold", c.motion_threshold);
        get_i("frame_width",  c.frame_width);
        get_i("frame_height", c.frame_height);

        get_i("camera_index", c.camera_index);
        get_s("video_source", c.video_source);
        get_i("warmup_frames", c.warmup_frames);
        get_i("frame_interval_ms", c.frame_interval_ms);

        get_i("mog2_history", c.mog2_history);
        get_i("mog2_var_threshold", c.mog2_var_threshold);
        get_b("mog2_detect_shadows", c.mog2_detect_shadows);
        get_i("crossing_cooldown_ms", c.crossing_cooldown_ms);

        get_s("serial_port", c.serial_port);
        get_i("baud_rate", c.baud_rate);
        get_i("serial_timeout_ms", c.serial_timeout_ms);
        get_i("poll_interval_ms", c.poll_interval_ms);

        get_d("hourly_rate", c.hourly_rate);
        get_i("total_slots", c.total_slots);
        get_i("gate_grace_ms", c.gate_grace_ms);
        get_i("buzzer_ms", c.buzzer_ms);
        get_i("ocr_retry_delay_ms", c.ocr_retry_delay_ms);

        get_s("tessdata_prefix", c.tessdata_prefix);
        get_s("ocr_language", c.ocr_language);
        get_i("ocr_timeout_ms", c.ocr_timeout_ms);

        get_s("storage_backend", c.storage_backend);
        get_s("data_dir", c.data_dir);
        get_s("sqlite_path", c.sqlite_path);
        get_i("shutdown_timeout_ms", c.shutdown_timeout_ms);
    } catch (const std::exception& ex) {
        std::cerr << "[Config] Error parsing configuration file " << json_path << ": " << ex.what()
                  << ". Using defaults.\n";
        return ParkingConfig{};
    }
    c.sanitize();
    std::cout << "[Config] Configuration loaded from " << json_path << "\n";
    return c;
}

ParkingConfig ParkingConfig::load(const std::string& path) {
    auto ext = std::filesystem::path(path).extension().string();
    if (ext == ".yml" || ext == ".yaml") return fromYaml(path);
    return fromJson(path);
}

int ParkingConfig::sanitize() {
    const ParkingConfig d;
    int fixed = 0;

    auto zone = [&](const char* name, vision::ZoneRect& z, const vision::ZoneRect& def) {
        if (!z.valid()) {
            std::cerr << "[Config] Warning: invalid " << name << " (" << z.x1 << "," << z.y1 << ","
                      << z.x2 << "," << z.y2 << "), using default\n";
            z = def; ++fixed;
        }
    };
    auto line = [&](const char* name, double& v, double def) {
        if (!(v >= 0.0 && v <= 1.0)) {
            std::cerr << "[Config] Warning: " << name << " must be between 0.0 and 1.0, using default\n";
            v = def; ++fixed;
        }
    };
    auto positive = [&](const char* name, int& v, int def) {
        if (v <= 0) {
            std::cerr << "[Config] Warning: " << name << " must be positive, using default " << def << "\n";
            v = def; ++fixed;
        }
    };

    zone("entry_zone", entry_zone, d.entry_zone);
    zone("exit_zone",  exit_zone,  d.exit_zone);
    line("entry_virtual_line_position", entry_virtual_line_position, d.entry_virtual_line_position);
    line("exit_virtual_line_position",  exit_virtual_line_position,  d.exit_virtual_line_position);

    positive("motion_threshold", motion_threshold, d.motion_threshold);
    positive("frame_width", frame_width, d.frame_width);
    positive("frame_height", frame_height, d.frame_height);
    positive("frame_interval_ms", frame_interval_ms, d.frame_interval_ms);
    positive("mog2_history", mog2_history, d.mog2_history);
    positive("mog2_var_threshold", mog2_var_threshold, d.mog2_var_threshold);
    positive("crossing_cooldown_ms", crossing_cooldown_ms, d.crossing_cooldown_ms);
    positive("baud_rate", baud_rate, d.baud_rate);
    positive("serial_timeout_ms", serial_timeout_ms, d.serial_timeout_ms);
    positive("poll_interval_ms", poll_interval_ms, d.poll_interval_ms);
    positive("total_slots", total_slots, d.total_slots);
    positive("gate_grace_ms", gate_grace_ms, d.gate_grace_ms);
    positive("buzzer_ms", buzzer_ms, d.buzzer_ms);
    positive("ocr_retry_delay_ms", ocr_retry_delay_ms, d.ocr_retry_delay_ms);
    positive("ocr_timeout_ms", ocr_timeout_ms, d.ocr_timeout_ms);
    positive("shutdown_timeout_ms", shutdown_timeout_ms, d.shutdown_timeout_ms);

    if (warmup_frames < 0) {
        std::cerr << "[Config] Warning: warmup_frames must not be negative, using default\n";
        warmup_frames = d.warmup_frames; ++fixed;
    }
    if (!(hourly_rate >= 0.0)) {
        std::cerr << "[Config] Warning: hourly_rate must not be negative, using default\n";
        hourly_rate = d.hourly_rate; ++fixed;
    }
    if (storage_backend != "json" && storage_backend != "sqlite") {
        std::cerr << "[Config] Warning: unknown storage_backend '" << storage_backend << "', using json\n";
        storage_backend = d.storage_backend; ++fixed;
    }
    return fixed;
}

vision::ZoneLayout ParkingConfig::zoneLayout() const {
    return vision::ZoneLayout(entry_zone, entry_virtual_line_position,
                              exit_zone,  exit_virtual_line_position);
}

} // namespace parkgate
