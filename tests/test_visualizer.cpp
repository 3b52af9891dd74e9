#include "doctest.h"
#include "control.h"
#include "recording_surface.h"

static SegmentMeta segment(const std::string& file, int speaker, std::vector<std::string> emotions) {
    SegmentMeta s;
    s.file = file;
    s.speaker = speaker;
    s.emotions = std::move(emotions);
    return s;
}

TEST_CASE("Visualizer - layout profiles") {
    CHECK(layout_profile("emotions", true).grid_size == 15);
    CHECK(layout_profile("emotions", true).frame_skip == 5);
    CHECK(layout_profile("emotions", false).grid_size == 50);
    CHECK(layout_profile("emotions", false).frame_skip == 3);
    CHECK(layout_profile("people", false).grid_size == 40);
    CHECK(layout_profile("people", true).frame_skip == 2);
    CHECK(layout_profile("timeline", false, 70).grid_size == 70);
    CHECK(layout_profile("timeline", false).frame_skip == 1);
    CHECK(layout_profile("mosaic", false).grid_size == DEFAULT_GRID_SIZE);
}

TEST_CASE("Visualizer - commands apply on the next tick") {
    Visualizer viz;
    viz.resize(1000, 800);
    viz.post(Command::optimize_layout("emotions", true));
    CHECK(viz.pending() == 1);
    CHECK(viz.ctx.frame_skip == 1);

    CHECK(viz.tick(nullptr));
    CHECK(viz.pending() == 0);
    CHECK(viz.ctx.frame_skip == 5);
    CHECK(viz.effective_grid() == 15);

    int rendered = 0;
    for (int i = 0; i < 10; i++) rendered += viz.tick(nullptr) ? 1 : 0;
    CHECK(rendered == 2);
}

TEST_CASE("Visualizer - pause and resume") {
    Visualizer viz;
    viz.post(Command::pause());
    viz.post(Command::resume());
    viz.post(Command::pause());
    viz.tick(nullptr);
    CHECK(viz.ctx.paused());
    double frozen = viz.ctx.anim_frame();
    viz.tick(nullptr);
    viz.tick(nullptr);
    CHECK(viz.ctx.anim_frame() == frozen);

    viz.post(Command::resume());
    viz.tick(nullptr);
    CHECK_FALSE(viz.ctx.paused());
    CHECK(viz.ctx.anim_frame() > frozen);
}

TEST_CASE("Visualizer - segment drives the speaker and idles the others") {
    VizConfig cfg = default_config();
    cfg.emotion_palette["joy"] = {1, 2, 3};
    Visualizer viz(cfg);
    viz.resize(1000, 800);

    SegmentMeta s = segment("a.mp3", 1, {"joy", "fear"});
    s.overrides.push_back({ParamField::BlobStrength, 2500});
    s.flash = true;
    viz.post(Command::set_segment(s));
    viz.tick(nullptr);

    REQUIRE(viz.current_segment() != nullptr);
    CHECK(viz.active_speaker() == 1);
    const Blob& speaker = viz.blobs[1];
    CHECK(speaker.target.blob_strength == 2500);
    CHECK(speaker.params.is_flashing);
    REQUIRE(speaker.display_colors.size() == 2);
    CHECK(speaker.display_colors[0] == Color3{1, 2, 3});
    CHECK(speaker.display_colors[1] == FALLBACK_EMOTION_COLORS[1]);

    const Blob& idle = viz.blobs[0];
    CHECK(idle.current_emotions.empty());
    CHECK(idle.target.blob_strength == 300);
    CHECK(idle.target.blob_size_scale == 2);
    CHECK(idle.target.volume_impact == 0);
    CHECK(viz.highlights.get(0) == nullptr);
    REQUIRE(viz.highlights.get(1) != nullptr);
    CHECK_FALSE(viz.highlights.get(1)->points.empty());
}

TEST_CASE("Visualizer - spacing preset sets the distance between the pair") {
    Visualizer viz;
    viz.resize(1000, 800);
    SegmentMeta s = segment("a.mp3", 0, {"joy"});
    ParamOverride close;
    close.field = ParamField::MinBlobSpacing;
    close.spacing = SpacingPref::named("close");
    s.overrides.push_back(close);
    viz.post(Command::set_segment(s));
    viz.tick(nullptr);
    viz.tick(nullptr);

    CHECK(viz.blobs[1].target.min_blob_spacing == SpacingPref::named("close"));
    CHECK(viz.blobs[0].home_center.x == doctest::Approx(350));
    CHECK(viz.blobs[1].home_center.x == doctest::Approx(650));

    SegmentMeta far = segment("b.mp3", 1, {"fear"});
    ParamOverride apart;
    apart.field = ParamField::MinBlobSpacing;
    apart.spacing = SpacingPref::named("far away");
    far.overrides.push_back(apart);
    viz.post(Command::set_segment(far));
    viz.tick(nullptr);
    viz.tick(nullptr);
    CHECK(viz.blobs[1].home_center.x - viz.blobs[0].home_center.x == doctest::Approx(600));
}

TEST_CASE("Visualizer - out-of-range speaker falls back to the first blob") {
    Visualizer viz;
    viz.apply_segment(segment("x.mp3", 7, {"hope"}));
    CHECK(viz.active_speaker() == 0);
    CHECK(viz.blobs[0].current_emotions.size() == 1);
}

TEST_CASE("Visualizer - home region moves the speaker") {
    Visualizer viz;
    viz.resize(1000, 800);
    SegmentMeta s = segment("a.mp3", 0, {"joy"});
    s.home_region = "top-center";
    viz.apply_segment(s);
    CHECK(viz.blobs[0].pos == viz.ctx.region_center("top-center"));
    CHECK(viz.blobs[0].home_region == "top-center");
    CHECK_FALSE(viz.blobs[0].transitioning());
}

TEST_CASE("Visualizer - palette updates and aliases") {
    VizConfig cfg = default_config();
    cfg.emotion_palette["anger"] = {200, 0, 0};
    Visualizer viz(cfg);
    viz.apply_segment(segment("a.mp3", 0, {"כעס", "joy"}));
    CHECK(viz.blobs[0].display_colors[0] == Color3{200, 0, 0});
    CHECK(viz.blobs[0].display_colors[1] == FALLBACK_EMOTION_COLORS[1]);

    viz.post(Command::update_emotion_colors({{"joy", {9, 9, 9}}}));
    CHECK(viz.blobs[0].display_colors[1] == FALLBACK_EMOTION_COLORS[1]);
    viz.tick(nullptr);
    CHECK(viz.blobs[0].display_colors[1] == Color3{9, 9, 9});
}

TEST_CASE("Visualizer - grid change re-places highlights") {
    Visualizer viz;
    viz.resize(1000, 800);
    viz.post(Command::set_segment(segment("a.mp3", 0, {"joy"})));
    viz.tick(nullptr);
    REQUIRE(viz.highlights.get(0) != nullptr);
    CHECK(viz.highlights.get(0)->grid_size == DEFAULT_GRID_SIZE);

    viz.post(Command::optimize_layout("people"));
    viz.tick(nullptr);
    CHECK(viz.highlights.get(0)->grid_size == 40);

    SegmentMeta s = segment("b.mp3", 0, {"joy"});
    s.grid_resolution = 80;
    viz.post(Command::set_segment(s));
    viz.tick(nullptr);
    CHECK(viz.effective_grid() == 80);
    CHECK(viz.highlights.get(0)->grid_size == 80);
}

TEST_CASE("Visualizer - debug overlay and connections reach the surface") {
    Visualizer viz;
    viz.resize(1000, 800);
    SegmentMeta s = segment("a.mp3", 0, {"joy"});
    s.connect_blobs = true;
    viz.post(Command::set_segment(s));
    viz.post(Command::set_debug_overlay(true));

    RecordingSurface rec;
    viz.tick(&rec);
    CHECK(rec.begun == 1);
    CHECK(rec.ended == 1);
    CHECK(rec.texts.size() == 2);
    CHECK(rec.lines.size() == 1);
    CHECK_FALSE(rec.glyphs.empty());

    viz.post(Command::set_debug_overlay(false));
    viz.tick(&rec);
    CHECK(rec.texts.empty());
}

TEST_CASE("Conversation - advances and wraps on segment end") {
    Visualizer viz;
    std::vector<SegmentMeta> segs = {segment("a", 0, {"joy"}), segment("b", 1, {"fear"}), segment("c", 0, {"hope"})};
    {
        Conversation convo(viz, segs);
        CHECK(viz.events.subscribers() == 1);
        convo.start();
        viz.tick(nullptr);
        CHECK(viz.current_segment()->file == "a");

        std::vector<std::string> ended;
        int listener = viz.events.subscribe([&ended](const SegmentEvent& e) { ended.push_back(e.file); });

        viz.post(Command::segment_ended());
        viz.tick(nullptr);
        CHECK(convo.current() == 1);
        CHECK(viz.pending() == 1);
        viz.tick(nullptr);
        CHECK(viz.current_segment()->file == "b");
        CHECK(viz.active_speaker() == 1);

        viz.post(Command::segment_ended());
        viz.tick(nullptr);
        viz.post(Command::segment_ended());
        viz.tick(nullptr);
        viz.tick(nullptr);
        CHECK(convo.current() == 0);
        CHECK(viz.current_segment()->file == "a");
        CHECK(ended == std::vector<std::string>{"a", "b", "c"});
        viz.events.unsubscribe(listener);
    }
    CHECK(viz.events.subscribers() == 0);
}

TEST_CASE("Conversation - loop mode replays the current segment") {
    Visualizer viz;
    Conversation convo(viz, {segment("a", 0, {"joy"}), segment("b", 1, {"fear"})});
    convo.start(1);
    viz.post(Command::set_loop(true));
    viz.tick(nullptr);
    long serial = viz.segment_serial();

    viz.post(Command::segment_ended());
    viz.tick(nullptr);
    viz.tick(nullptr);
    CHECK(convo.current() == 1);
    CHECK(viz.current_segment()->file == "b");
    CHECK(viz.segment_serial() == serial + 1);

    viz.post(Command::set_loop(false));
    viz.post(Command::segment_ended());
    viz.tick(nullptr);
    viz.tick(nullptr);
    CHECK(viz.current_segment()->file == "a");
}
