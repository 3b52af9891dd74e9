#include "audio.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

AudioCapture::AudioCapture() {
    PaError err = Pa_Initialize();
    initialized_ = (err == paNoError);
    if (!initialized_) fprintf(stderr, "⚠ PortAudio init failed: %s\n", Pa_GetErrorText(err));
}

AudioCapture::~AudioCapture() { stop(); }

int AudioCapture::pa_callback(const void* input, void*, unsigned long frames,
                              const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void* ud) {
    auto* self = (AudioCapture*)ud;
    if (!input || frames == 0) return paContinue;
    const short* data = (const short*)input;
    double sum = 0;
    for (unsigned long i = 0; i < frames; i++) sum += (double)data[i] * data[i];
    double rms = std::sqrt(sum / frames);
    double prev = self->volume_.load();
    self->volume_.store(prev * 0.7 + rms * 0.3);
    return paContinue;
}

bool AudioCapture::open_mic() {
    if (!initialized_) return false;
    PaStreamParameters inp;
    inp.device = Pa_GetDefaultInputDevice();
    if (inp.device == paNoDevice) { fprintf(stderr, "⚠ No microphone, audio level stays at zero\n"); return false; }
    inp.channelCount = CHANNELS;
    inp.sampleFormat = paInt16;
    inp.suggestedLatency = Pa_GetDeviceInfo(inp.device)->defaultLowInputLatency;
    inp.hostApiSpecificStreamInfo = nullptr;
    PaError err = Pa_OpenStream(&stream_, &inp, nullptr, RATE, CHUNK, paClipOff, pa_callback, this);
    if (err != paNoError) { fprintf(stderr, "⚠ Mic open failed: %s\n", Pa_GetErrorText(err)); stream_ = nullptr; return false; }
    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        fprintf(stderr, "⚠ Mic start failed: %s\n", Pa_GetErrorText(err));
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        return false;
    }
    printf("✓ Microphone audio stream opened.\n");
    return true;
}

double AudioCapture::get_volume() const { return volume_.load(); }

double AudioCapture::get_level() const { return std::min(get_volume() / FULL_SCALE_RMS, 1.0); }

void AudioCapture::stop() {
    if (stream_) { Pa_StopStream(stream_); Pa_CloseStream(stream_); stream_ = nullptr; }
    if (initialized_) { Pa_Terminate(); initialized_ = false; }
}
