#pragma once
#include <string>
#include "parkgate/vision/Zone.h"

namespace parkgate {

// ParkGate running config (load from config/parking.json or parking.yml)
struct ParkingConfig {
    // ===================== 字段fields ===================== //

    // 区域与触发线
    vision::ZoneRect entry_zone{0, 0, 640, 480};
    vision::ZoneRect exit_zone{640, 0, 1280, 480};
    double entry_virtual_line_position = 0.5;   // 0.0~1.0 of frame height
    double exit_virtual_line_position  = 0.5;

    int motion_threshold = 500;                 // 轮廓最小面积, 去除噪声/阴影碎片
    int frame_width  = 1280;                    // 请求的采集尺寸 (实际尺寸以首帧为准)
    int frame_height = 720;

    // 相机
    int camera_index = 0;
    std::string video_source;                   // 非空: 用视频文件代替相机
    int warmup_frames = 150;                    // ~5s @30fps 背景学习
    int frame_interval_ms = 33;                 // 检测循环节拍

    // MOG2 参数
    int  mog2_history         = 500;
    int  mog2_var_threshold   = 50;
    bool mog2_detect_shadows  = true;

    int crossing_cooldown_ms = 3000;

    // 串口
    std::string serial_port;                    // 空: 自动探测
    int baud_rate = 115200;
    int serial_timeout_ms = 1000;
    int poll_interval_ms = 100;

    // 闸门/计费
    double hourly_rate = 10.0;
    int total_slots = 1;
    int gate_grace_ms = 5000;
    int buzzer_ms = 3000;
    int ocr_retry_delay_ms = 500;

    // OCR
    std::string tessdata_prefix;
    std::string ocr_language = "eng";
    int ocr_timeout_ms = 2000;

    // 存储
    std::string storage_backend = "json";       // "json" | "sqlite"
    std::string data_dir = "data";
    std::string sqlite_path = "data/parking.db";

    int shutdown_timeout_ms = 2000;

    // ===================== 方法methods ===================== //

    // 配置加载函数: 文件缺失/解析失败 -> 默认值 + 警告
    static ParkingConfig fromYaml(const std::string& yaml_path);
    static ParkingConfig fromJson(const std::string& json_path);
    static ParkingConfig load(const std::string& path);   // by extension

    // 逐字段校验, 非法字段回退默认值; 返回被回退的字段数
    int sanitize();

    vision::ZoneLayout zoneLayout() const;
};

} // namespace parkgate
