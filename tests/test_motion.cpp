#include "doctest.h"
#include "control.h"

TEST_CASE("MotionSimulator - audio response curves") {
    using G = GrowthPattern;
    CHECK(MotionSimulator::audio_response(G::Linear, 0.0, 1500) == doctest::Approx(1.0));
    CHECK(MotionSimulator::audio_response(G::Exponential, 0.0, 1500) == doctest::Approx(1.0));
    CHECK(MotionSimulator::audio_response(G::Linear, 0.5, 1500) == doctest::Approx(23.5));
    CHECK(MotionSimulator::audio_response(G::Exponential, 0.5, 1500) == doctest::Approx(31.0));
    CHECK(MotionSimulator::audio_response(G::Logarithmic, 0.5, 1500) == doctest::Approx(1.0 + std::log(6.0) * 75.0));
    CHECK(MotionSimulator::audio_response(G::Sine, 1.0, 1500) == doctest::Approx(61.0));
}

TEST_CASE("MotionSimulator - breathing pulse stays in range") {
    for (int f = 0; f < 500; f += 7) {
        double p = MotionSimulator::breathing_pulse(f, 3.3);
        CHECK(p >= 0.5);
        CHECK(p <= 1.5);
    }
}

TEST_CASE("MotionSimulator - intensity scales with neighbour distance") {
    SimContext ctx;
    std::vector<Blob> all;
    all.emplace_back(0, "center-left", Vec2(500, 400), VisualParams{});
    all.emplace_back(1, "center-right", Vec2(550, 400), VisualParams{});
    const auto& presets = ctx.spacing_presets;

    CHECK(MotionSimulator::movement_intensity(all[0], all, 200, presets) == doctest::Approx(0.25));
    CHECK(MotionSimulator::movement_intensity(all[0], all, 40, presets) == doctest::Approx(1.0));

    all[1].pos = Vec2(505, 400);
    CHECK(MotionSimulator::movement_intensity(all[0], all, 200, presets) == doctest::Approx(0.1));

    all[1].pos = Vec2(800, 400);
    CHECK(MotionSimulator::movement_intensity(all[0], all, 600, presets) == doctest::Approx(0.15));

    all[0].params.blur = 2.5;
    CHECK(MotionSimulator::movement_intensity(all[0], all, 200, presets) == doctest::Approx(0.5));
}

TEST_CASE("MotionSimulator - non-finite position recovers to home") {
    SimContext ctx;
    ctx.resize(1000, 800);
    SpacingResolver spacing;
    MotionSimulator motion;
    std::vector<Blob> all;
    all.emplace_back(0, "center-left", Vec2(400, 400), VisualParams{});
    spacing.update_home(all[0], ctx);

    all[0].pos = Vec2(std::nan(""), 10);
    motion.step(all[0], all, ctx);
    CHECK(is_finite(all[0].pos));
    CHECK(all[0].pos.x == doctest::Approx(400));
    CHECK(all[0].pos.y == doctest::Approx(400));
    CHECK(all[0].vel == Vec2(0, 0));
    CHECK(std::isfinite(all[0].cached_strength));
}

TEST_CASE("MotionSimulator - transition target clears when reached") {
    SimContext ctx;
    ctx.resize(1000, 800);
    MotionSimulator motion;
    std::vector<Blob> all;
    all.emplace_back(0, "center-left", Vec2(400, 400), VisualParams{});
    all[0].target_pos = Vec2(403, 400);

    motion.step(all[0], all, ctx);
    CHECK_FALSE(all[0].transitioning());
}

TEST_CASE("MotionSimulator - full blur freezes position") {
    SimContext ctx;
    ctx.resize(1000, 800);
    MotionSimulator motion;
    VisualParams v;
    v.blur = 5.0;
    std::vector<Blob> all;
    all.emplace_back(0, "center-left", Vec2(400, 400), v);
    all[0].vel = Vec2(2, 1);

    for (int i = 0; i < 10; i++) {
        motion.step(all[0], all, ctx);
        ctx.advance_frame();
    }
    CHECK(all[0].pos == Vec2(400, 400));
    CHECK(vec_length(all[0].vel) < 0.01);
}

TEST_CASE("MotionSimulator - parameters ease toward targets") {
    Blob b(0, "center", Vec2(0, 0), VisualParams{});
    VisualParams v;
    v.blob_strength = 2000;
    v.blur = 4;
    v.blob_size_scale = 0.05;
    b.set_target_visuals(v);
    CHECK(b.target.blob_size_scale == doctest::Approx(1.0));

    b.interpolate_params(PARAM_SMOOTHING);
    CHECK(b.params.blob_strength == doctest::Approx(1150));
    CHECK(b.params.blur == doctest::Approx(4));
}

TEST_CASE("MotionSimulator - blobs stay inside the canvas margin") {
    seed_rng(7);
    Visualizer viz;
    viz.resize(1000, 800);
    SegmentMeta seg;
    seg.emotions = {"joy"};
    seg.overrides.push_back({ParamField::VolumeImpact, 5000});
    viz.post(Command::set_segment(seg));

    for (int i = 0; i < 300; i++) {
        viz.set_audio_level(0, (i % 20) / 19.0);
        viz.tick(nullptr);
        for (const Blob& b : viz.blobs) {
            CHECK(is_finite(b.pos));
            CHECK(b.pos.x >= -EDGE_MARGIN);
            CHECK(b.pos.x <= 1000 + EDGE_MARGIN);
            CHECK(b.pos.y >= -EDGE_MARGIN);
            CHECK(b.pos.y <= 800 + EDGE_MARGIN);
            CHECK(b.params.blob_size_scale > MIN_SIZE_SCALE);
        }
    }
}

TEST_CASE("MotionSimulator - paused blobs hold still") {
    Visualizer viz;
    viz.resize(1000, 800);
    for (int i = 0; i < 5; i++) viz.tick(nullptr);
    viz.post(Command::pause());
    viz.tick(nullptr);

    std::vector<Vec2> before;
    for (const Blob& b : viz.blobs) before.push_back(b.pos);
    for (int i = 0; i < 10; i++) {
        viz.set_audio_level(0, 1.0);
        viz.tick(nullptr);
    }
    for (size_t i = 0; i < viz.blobs.size(); i++) CHECK(viz.blobs[i].pos == before[i]);
    CHECK(viz.blobs[0].smoothed_audio_level == doctest::Approx(0.0));

    viz.post(Command::resume());
    viz.tick(nullptr);
    CHECK_FALSE(viz.ctx.paused());
}
