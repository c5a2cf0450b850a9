#include "config/CaptureConfig.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

CaptureConfig CaptureConfig::fromJson(const nlohmann::json& j) {
    CaptureConfig c;
    c.targetRateHz      = j.value("target_rate_hz", c.targetRateHz);
    c.timeoutSecs       = j.value("timeout_secs", c.timeoutSecs);
    c.defaultExpectedSecs = j.value("default_expected_secs", c.defaultExpectedSecs);
    c.device            = j.value("device", c.device);
    c.channels          = j.value("channels", c.channels);
    c.framesPerBlock    = j.value("frames_per_block", c.framesPerBlock);
    c.gracePeriodMs     = j.value("grace_period_ms", c.gracePeriodMs);
    c.tickIntervalMs    = j.value("tick_interval_ms", c.tickIntervalMs);
    c.resampleChunkSize = j.value("resample_chunk_size", c.resampleChunkSize);
    c.resampleSubChunks = j.value("resample_sub_chunks", c.resampleSubChunks);
    c.skipToleranceHz   = j.value("skip_tolerance_hz", c.skipToleranceHz);
    c.logLevel          = j.value("log_level", c.logLevel);
    return c;
}

nlohmann::json CaptureConfig::toJson() const {
    return {
        {"target_rate_hz",      targetRateHz},
        {"timeout_secs",        timeoutSecs},
        {"default_expected_secs", defaultExpectedSecs},
        {"device",              device},
        {"channels",            channels},
        {"frames_per_block",    framesPerBlock},
        {"grace_period_ms",     gracePeriodMs},
        {"tick_interval_ms",    tickIntervalMs},
        {"resample_chunk_size", resampleChunkSize},
        {"resample_sub_chunks", resampleSubChunks},
        {"skip_tolerance_hz",   skipToleranceHz},
        {"log_level",           logLevel}
    };
}

CaptureConfig CaptureConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return CaptureConfig{};
    }

    CaptureConfig c;
    try {
        nlohmann::json j;
        f >> j;
        c = fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config " + path + ": " + e.what());
    }

    std::string problem = c.validate();
    if (!problem.empty())
        throw std::runtime_error("Invalid config " + path + ": " + problem);

    spdlog::info("Loaded config: {}", path);
    return c;
}

std::string CaptureConfig::validate() const {
    if (targetRateHz <= 0)       return "target_rate_hz must be positive";
    if (timeoutSecs <= 0)        return "timeout_secs must be positive";
    if (defaultExpectedSecs <= 0) return "default_expected_secs must be positive";
    if (channels < 1 || channels > 2)
        return "channels must be 1 or 2";
    if (framesPerBlock <= 0)     return "frames_per_block must be positive";
    if (gracePeriodMs < 0)       return "grace_period_ms must not be negative";
    if (tickIntervalMs <= 0)     return "tick_interval_ms must be positive";
    if (resampleChunkSize <= 0)  return "resample_chunk_size must be positive";
    if (resampleSubChunks <= 0)  return "resample_sub_chunks must be positive";
    if (skipToleranceHz < 0)     return "skip_tolerance_hz must not be negative";
    if (logLevel != "debug" && logLevel != "info" &&
        logLevel != "warn" && logLevel != "error")
        return "log_level must be one of debug, info, warn, error";
    return "";
}

CaptureOptions CaptureConfig::toCaptureOptions() const {
    CaptureOptions o;
    o.targetRateHz = targetRateHz;
    o.gracePeriod  = std::chrono::milliseconds(gracePeriodMs);
    o.tickInterval = std::chrono::milliseconds(tickIntervalMs);
    o.defaultExpectedSecs = defaultExpectedSecs;

    o.resample.chunkSize       = resampleChunkSize;
    o.resample.subChunks       = resampleSubChunks;
    o.resample.skipToleranceHz = skipToleranceHz;

    o.stream.device         = device;
    o.stream.channelCount   = channels;
    o.stream.framesPerBlock = framesPerBlock;
    return o;
}
