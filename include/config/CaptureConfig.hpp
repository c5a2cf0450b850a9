#pragma once
#include "audio/CaptureSession.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Capture settings as read from config/capture.json. Every key is optional;
// a missing key keeps the default below.
//
//   {
//     "target_rate_hz": 16000,
//     "timeout_secs": 30,
//     "default_expected_secs": 30,
//     "device": "",
//     "channels": 1,
//     "frames_per_block": 512,
//     "grace_period_ms": 1000,
//     "tick_interval_ms": 100,
//     "resample_chunk_size": 1024,
//     "resample_sub_chunks": 2,
//     "skip_tolerance_hz": 1000,
//     "log_level": "info"
//   }
struct CaptureConfig {
    int         targetRateHz       = 16000;
    int         timeoutSecs        = 30;     // toggle-mode safety bound
    int         defaultExpectedSecs = 30;    // toggle-mode buffer pre-size
    std::string device;                      // empty = default input
    int         channels           = 1;
    int         framesPerBlock     = 512;
    int         gracePeriodMs      = 1000;
    int         tickIntervalMs     = 100;
    int         resampleChunkSize  = 1024;
    int         resampleSubChunks  = 2;
    int         skipToleranceHz    = 1000;
    std::string logLevel           = "info";

    static CaptureConfig fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;

    // Missing file → defaults (with a warning). Unreadable JSON or invalid
    // values throw std::runtime_error naming the file.
    static CaptureConfig load(const std::string& path);

    // Empty string when valid, otherwise the first problem found.
    std::string validate() const;

    CaptureOptions toCaptureOptions() const;
};
