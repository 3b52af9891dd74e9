#include "control.h"
#include "io.h"
#include "audio.h"
#include <chrono>
#include <csignal>
#include <thread>

// ═══════════════════════════════════════════════════════════════
//  MAIN
// ═══════════════════════════════════════════════════════════════

static volatile bool g_running = true;
static void sig_handler(int) { g_running = false; }

static const char* CLI_KEYS =
    "{help h usage ? |      | print this message}"
    "{config         |      | visualization parameters (JSON or YAML)}"
    "{conversation   |      | conversation segments file}"
    "{width          | 1000 | canvas width in pixels}"
    "{height         | 800  | canvas height in pixels}"
    "{fps            | 30   | frame rate limit}"
    "{layout         |      | layout profile: emotions, timeline, people}"
    "{loop           |      | replay the current segment}"
    "{paused         |      | start with the animation paused}"
    "{debug          |      | draw home regions}"
    "{no-mic         |      | do not open the microphone}"
    "{snapshot       |      | save the last frame as an image}"
    "{record         |      | record the visualisation to a video file}";

int main(int argc, char** argv) {
    cv::CommandLineParser parser(argc, argv, CLI_KEYS);
    parser.about("emoblob: emotion-reactive ASCII blobs");
    if (parser.has("help")) {
        parser.printMessage();
        return 0;
    }
    std::string config_path = parser.get<std::string>("config");
    std::string convo_path = parser.get<std::string>("conversation");
    int width = parser.get<int>("width");
    int height = parser.get<int>("height");
    int fps_limit = std::max(1, parser.get<int>("fps"));
    std::string layout = parser.get<std::string>("layout");
    std::string snapshot_path = parser.get<std::string>("snapshot");
    std::string record_path = parser.get<std::string>("record");
    if (!parser.check()) {
        parser.printErrors();
        return 1;
    }

    signal(SIGINT, sig_handler);

    // ── Configuration ──
    VizConfig cfg = default_config();
    if (!config_path.empty() && load_config(config_path, cfg))
        printf("✓ Loaded parameters from %s\n", config_path.c_str());

    std::vector<SegmentMeta> segments;
    if (!convo_path.empty() && load_conversation(convo_path, segments))
        printf("✓ Loaded %zu segments from %s\n", segments.size(), convo_path.c_str());
    if (segments.empty()) {
        SegmentMeta idle;
        idle.file = "idle";
        idle.emotions = {"neutral"};
        segments.push_back(idle);
    }

    Visualizer viz(cfg);
    viz.resize(width, height);
    Conversation convo(viz, segments);
    convo.start();
    if (!layout.empty()) viz.post(Command::optimize_layout(layout));
    if (parser.has("loop")) viz.post(Command::set_loop(true));
    if (parser.has("paused")) viz.post(Command::pause());
    if (parser.has("debug")) viz.post(Command::set_debug_overlay(true));

    // ── Setup Audio ──
    AudioCapture audio;
    bool mic = !parser.has("no-mic") && audio.open_mic();
    if (!mic) fprintf(stderr, "⚠ Running without microphone input.\n");

    // ── Surfaces ──
    auto [term_cols, term_rows] = get_terminal_size();
    TerminalSurface terminal(term_cols, term_rows - 1);
    ImageSurface image;
    SurfaceGroup surfaces;
    surfaces.targets.push_back(&terminal);
    if (!snapshot_path.empty() || !record_path.empty()) surfaces.targets.push_back(&image);
    if (!record_path.empty() && image.start_recording(record_path, fps_limit, width, height))
        printf("✓ Recording to %s\n", record_path.c_str());

    printf("Starting emoblob... Press Ctrl+C to stop.\n");
    fflush(stdout);
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    // Clear screen, hide cursor
    printf("\033[2J\033[?25l");
    fflush(stdout);

    auto prev_time = std::chrono::steady_clock::now();
    long serial = -1;
    double segment_elapsed = 0.0;

    while (g_running) {
        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - prev_time).count();
        if (elapsed < 1.0 / fps_limit) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        prev_time = now;

        // ── Terminal size ──
        auto [cols, rows] = get_terminal_size();
        if (cols != terminal.cols() || rows - 1 != terminal.rows()) terminal.set_size(cols, rows - 1);

        // ── AUDIO ──
        viz.set_audio_level(viz.active_speaker(), mic ? audio.get_level() : 0.0);

        viz.tick(&surfaces);

        // ── Segment clock ──
        if (viz.segment_serial() != serial) {
            serial = viz.segment_serial();
            segment_elapsed = 0.0;
        } else if (!viz.ctx.paused()) {
            segment_elapsed += elapsed;
        }
        const SegmentMeta* seg = viz.current_segment();
        if (seg && segment_elapsed >= seg->duration && viz.pending() == 0) {
            viz.post(Command::segment_ended());
            segment_elapsed = 0.0;
        }
    }

    // ── Cleanup ──
    printf("\033[?25h\033[0m\n");
    if (!snapshot_path.empty() && image.save(snapshot_path)) printf("✓ Snapshot saved to %s\n", snapshot_path.c_str());
    image.stop_recording();
    audio.stop();
    printf("Exiting emoblob...\n");
    fflush(stdout);
    return 0;
}
