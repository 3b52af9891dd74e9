#include "doctest.h"
#include "emoblob.h"

TEST_CASE("SpacingResolver - close preset anchors the pair around the center") {
    SimContext ctx;
    ctx.resize(1000, 800);
    SpacingResolver r;

    HomeAnchor a = r.resolve(SpacingPref::named("close"), 0, "center-left", ctx);
    HomeAnchor b = r.resolve(SpacingPref::named("close"), 1, "center-right", ctx);
    CHECK(a.center.x == doctest::Approx(350));
    CHECK(a.center.y == doctest::Approx(400));
    CHECK(b.center.x == doctest::Approx(650));
    CHECK(b.center.y == doctest::Approx(400));
    CHECK(a.tier == SpacingTier::Close);
    CHECK(a.radius == doctest::Approx(90));

    HomeAnchor again = r.resolve(SpacingPref::named("close"), 0, "center-left", ctx);
    CHECK(again.center == a.center);
    CHECK(again.radius == a.radius);
}

TEST_CASE("SpacingResolver - tiers and radii") {
    SimContext ctx;
    ctx.resize(1000, 800);
    SpacingResolver r;

    HomeAnchor together = r.resolve(SpacingPref::named("together"), 0, "center-left", ctx);
    CHECK(together.tier == SpacingTier::Together);
    CHECK(together.radius == doctest::Approx(TOGETHER_HOME_RADIUS));
    CHECK(together.center.x == doctest::Approx(450));

    HomeAnchor far = r.resolve(SpacingPref::named("far away"), 1, "center-right", ctx);
    CHECK(far.tier == SpacingTier::Far);
    CHECK(far.radius == doctest::Approx(300));
    CHECK(far.center.x == doctest::Approx(800));

    CHECK(SpacingResolver::tier_for(50, ctx.spacing_presets) == SpacingTier::Together);
    CHECK(SpacingResolver::tier_for(250, ctx.spacing_presets) == SpacingTier::Close);
    CHECK(SpacingResolver::tier_for(900, ctx.spacing_presets) == SpacingTier::Far);
}

TEST_CASE("SpacingResolver - spacing distance lookup") {
    SimContext ctx;
    const auto& presets = ctx.spacing_presets;
    CHECK(SpacingResolver::spacing_distance(SpacingPref::named("together"), presets) == 100);
    CHECK(SpacingResolver::spacing_distance(SpacingPref::named("Far Away"), presets) == 600);
    CHECK(SpacingResolver::spacing_distance(SpacingPref::named("nowhere"), presets) == DEFAULT_SPACING);
    CHECK(SpacingResolver::spacing_distance(SpacingPref::distance(250), presets) == 250);
    CHECK(SpacingResolver::spacing_distance(SpacingPref::distance(-5), presets) == DEFAULT_SPACING);
    CHECK(SpacingResolver::spacing_distance(SpacingPref::distance(std::nan("")), presets) == DEFAULT_SPACING);
    CHECK(SpacingResolver::spacing_distance(SpacingPref::distance(INFINITY), presets) == DEFAULT_SPACING);
}

TEST_CASE("SpacingResolver - configured presets override defaults") {
    SimContext ctx;
    ctx.resize(1000, 800);
    ctx.spacing_presets["close"] = 400;
    SpacingResolver r;
    HomeAnchor a = r.resolve(SpacingPref::named("close"), 0, "center-left", ctx);
    CHECK(a.center.x == doctest::Approx(300));
    CHECK(a.radius == doctest::Approx(120));
}

TEST_CASE("SpacingResolver - extra speakers keep their region") {
    SimContext ctx;
    ctx.resize(1000, 800);
    SpacingResolver r;
    HomeAnchor a = r.resolve(SpacingPref::named("close"), 2, "top-left", ctx);
    CHECK(a.center == ctx.region_center("top-left"));
    CHECK(a.radius == doctest::Approx(96));
}

TEST_CASE("SpacingResolver - anchor shift starts a transition") {
    SimContext ctx;
    ctx.resize(1000, 800);
    SpacingResolver r;
    VisualParams v;
    v.min_blob_spacing = SpacingPref::named("close");
    Blob b(0, "center-left", Vec2(350, 400), v);

    r.update_home(b, ctx);
    CHECK(b.has_home);
    CHECK_FALSE(b.transitioning());
    CHECK(b.home_center.x == doctest::Approx(350));

    r.update_home(b, ctx);
    CHECK_FALSE(b.transitioning());

    b.params.min_blob_spacing = SpacingPref::named("far away");
    r.update_home(b, ctx);
    REQUIRE(b.transitioning());
    CHECK(b.target_pos->x == doctest::Approx(200));
    CHECK(b.target_pos->y == doctest::Approx(400));
    CHECK(b.home_center.x == doctest::Approx(200));
}
