#pragma once
#include <vector>
#include <algorithm>
#include <cmath>

// Level summary of a captured buffer, for the capture-statistics log line.
struct SignalStats {
    float rmsDB     = -96.0f;
    float peakDB    = -96.0f;
    float crestDB   = 0.0f;   // peak - rms
    bool  hasSignal = false;  // rms above -60 dBFS

    static SignalStats measure(const std::vector<float>& samples) {
        SignalStats s;
        if (samples.empty()) return s;

        double sumSq = 0.0;
        float peak = 0.0f;
        for (float x : samples) {
            sumSq += (double)x * x;
            float a = std::abs(x);
            if (a > peak) peak = a;
        }
        float rms = (float)std::sqrt(sumSq / samples.size());
        s.rmsDB  = toDBFS(rms);
        s.peakDB = toDBFS(peak);
        s.crestDB = s.peakDB - s.rmsDB;
        s.hasSignal = s.rmsDB > -60.0f;
        return s;
    }

    static float toDBFS(float linear) {
        if (linear < 1e-10f) return -96.0f;
        return std::max(-96.0f, 20.0f * std::log10(linear));
    }
};
