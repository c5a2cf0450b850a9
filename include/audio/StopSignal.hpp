#pragma once

// Process-wide "stop recording" flag for toggle captures.
//
// install() routes SIGUSR1 to the flag, so `kill -USR1 <pid>` ends a running
// `voxcap toggle`. requested() is the stop predicate handed to
// CaptureSession::captureToggle(); it only reads the flag.
class StopSignal {
public:
    // Returns false (and logs) if the handler could not be installed.
    static bool install();

    static bool requested();

    // Set the flag without a signal (daemon IPC path, tests).
    static void raise();

    // Clear before starting a new toggle capture.
    static void reset();
};
