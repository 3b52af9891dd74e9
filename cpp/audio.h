#pragma once
#include <portaudio.h>
#include <atomic>

// ═══════════════════════════════════════════════════════════════
//  AUDIO CAPTURE
// ═══════════════════════════════════════════════════════════════
constexpr int CHUNK = 1024;
constexpr int CHANNELS = 1;
constexpr int RATE = 44100;
constexpr double FULL_SCALE_RMS = 5000.0;

// Microphone RMS level, smoothed in the PortAudio callback.
class AudioCapture {
public:
    AudioCapture();
    ~AudioCapture();
    bool open_mic();
    double get_volume() const;
    double get_level() const;   // 0..1
    void stop();
private:
    static int pa_callback(const void* in, void*, unsigned long frames,
                           const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void* ud);
    PaStream* stream_ = nullptr;
    std::atomic<double> volume_{0.0};
    bool initialized_ = false;
};
