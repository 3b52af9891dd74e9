#include "doctest.h"
#include "control.h"

static SimContext make_ctx() {
    SimContext ctx;
    ctx.resize(1000, 800);
    return ctx;
}

TEST_CASE("FieldSampler - influence strictly decreases with distance") {
    SimContext ctx = make_ctx();
    Blob b(0, "center", Vec2(500, 400), VisualParams{});

    double prev = FieldSampler::influence(ctx.noise, b, 501, 400, 0);
    for (double d : {2.0, 5.0, 10.0, 40.0, 100.0, 250.0, 480.0}) {
        double v = FieldSampler::influence(ctx.noise, b, 500 + d, 400, 0);
        CHECK(v < prev);
        prev = v;
    }
}

TEST_CASE("FieldSampler - coincident cell uses a unit distance floor") {
    SimContext ctx = make_ctx();
    Blob b(0, "center", Vec2(500, 400), VisualParams{});
    double v = FieldSampler::influence(ctx.noise, b, 500, 400, 0);
    CHECK(std::isfinite(v));
    CHECK(v > 0);
}

TEST_CASE("FieldSampler - shaping curve endpoints and monotonicity") {
    for (double gamma : {1.0, 1.5, 15.0}) {
        CHECK(FieldSampler::shape(0.0, gamma) == doctest::Approx(0.0));
        CHECK(FieldSampler::shape(1.0, gamma) == doctest::Approx(1.0));
        double prev = 0.0;
        for (int i = 0; i <= 100; i++) {
            double s = FieldSampler::shape(i / 100.0, gamma);
            CHECK(s >= prev);
            prev = s;
        }
    }
    CHECK(FieldSampler::shape(7.0, 15) == doctest::Approx(1.0));
    CHECK(FieldSampler::shape(std::nan(""), 15) == doctest::Approx(0.0));
}

TEST_CASE("FieldSampler - distortion stays within unit range") {
    NoiseField noise;
    for (int i = 0; i < 64; i++) {
        double a = i * CV_PI / 32 - CV_PI;
        double d = FieldSampler::distortion(noise, Vec2(120.0 + i, 300.0 - i), a, i * 0.37);
        CHECK(d >= -1.0);
        CHECK(d <= 1.0);
    }
}

TEST_CASE("FieldSampler - dominant blob owns the cells around it") {
    SimContext ctx = make_ctx();
    std::vector<Blob> blobs;
    blobs.emplace_back(0, "center-left", Vec2(250, 400), VisualParams{});
    blobs.emplace_back(1, "center-right", Vec2(750, 400), VisualParams{});

    FieldSampler field;
    field.sample(ctx, blobs, 50);
    CHECK(field.grid_size() == 50);
    CHECK(field.dominant(12, 25) == 0);
    CHECK(field.dominant(37, 25) == 1);
    CHECK(field.drawable(12, 25));

    FieldSample s = field.at(12, 25);
    REQUIRE(s.influences.size() == 2);
    CHECK(s.influences[0] > s.influences[1]);
    CHECK(s.influence == doctest::Approx(s.influences[0]));
}

TEST_CASE("FieldSampler - invisible blobs contribute nothing") {
    SimContext ctx = make_ctx();
    std::vector<Blob> blobs;
    blobs.emplace_back(0, "center-left", Vec2(250, 400), VisualParams{});
    blobs.emplace_back(1, "center-right", Vec2(750, 400), VisualParams{});
    blobs[1].params.is_visible = false;

    FieldSampler field;
    field.sample(ctx, blobs, 40);
    for (int y = 0; y < 40; y++)
        for (int x = 0; x < 40; x++) {
            CHECK(field.dominant(x, y) != 1);
            CHECK(field.at(x, y).influences[1] == 0.0);
        }
}

TEST_CASE("FieldSampler - fine threshold gates drawable cells") {
    SimContext ctx = make_ctx();
    std::vector<Blob> blobs;
    blobs.emplace_back(0, "center", Vec2(500, 400), VisualParams{});
    ctx.final_draw_threshold = 2.0;

    FieldSampler field;
    field.sample(ctx, blobs, 30);
    CHECK(cv::countNonZero(field.shaped_map() > 0) > 0);
    for (int y = 0; y < 30; y++)
        for (int x = 0; x < 30; x++) CHECK_FALSE(field.drawable(x, y));
}

TEST_CASE("FieldSampler - paused frames sample identical grids") {
    Visualizer viz;
    viz.resize(1000, 800);
    SegmentMeta seg;
    seg.emotions = {"joy"};
    viz.post(Command::set_segment(seg));
    for (int i = 0; i < 5; i++) {
        viz.set_audio_level(0, 0.4 + 0.1 * i);
        viz.tick(nullptr);
    }

    viz.post(Command::pause());
    viz.tick(nullptr);
    double frozen = viz.ctx.anim_frame();

    viz.set_audio_level(0, 1.0);
    viz.tick(nullptr);
    cv::Mat shaped1 = viz.field.shaped_map().clone();
    cv::Mat dom1 = viz.field.dominant_map().clone();
    viz.tick(nullptr);

    CHECK(viz.ctx.anim_frame() == frozen);
    CHECK(cv::norm(shaped1, viz.field.shaped_map(), cv::NORM_INF) == 0.0);
    CHECK(cv::countNonZero(dom1 != viz.field.dominant_map()) == 0);
}
