#include "emoblob.h"

// ═══════════════════════════════════════════════════════════════
//  SPACING RESOLVER
// ═══════════════════════════════════════════════════════════════
static double preset_or(const std::map<std::string,double>& presets, const std::string& name, double fallback) {
    auto it = presets.find(name);
    return it != presets.end() ? it->second : fallback;
}

double SpacingResolver::spacing_distance(const SpacingPref& pref, const std::map<std::string,double>& presets) {
    if (!pref.preset.empty()) {
        auto it = presets.find(pref.preset);
        if (it == presets.end()) it = presets.find(to_lower(pref.preset));
        if (it != presets.end() && std::isfinite(it->second) && it->second > 0) return it->second;
        return DEFAULT_SPACING;
    }
    if (std::isfinite(pref.pixels) && pref.pixels > 0) return pref.pixels;
    return DEFAULT_SPACING;
}

SpacingTier SpacingResolver::tier_for(double distance, const std::map<std::string,double>& presets) {
    if (distance <= preset_or(presets, "together", TOGETHER_SPACING)) return SpacingTier::Together;
    if (distance >= preset_or(presets, "far away", FAR_SPACING)) return SpacingTier::Far;
    return SpacingTier::Close;
}

HomeAnchor SpacingResolver::resolve(const SpacingPref& pref, int blob_id, const std::string& region,
                                    const SimContext& ctx) const {
    const Vec2& region_pos = ctx.region_center(region);
    if (blob_id > 1) {
        // speakers beyond the pair keep their symbolic region
        return {region_pos, std::min(ctx.width, ctx.height) * 0.12, SpacingTier::Close};
    }
    double d = spacing_distance(pref, ctx.spacing_presets);
    SpacingTier tier = tier_for(d, ctx.spacing_presets);
    double half = d / 2.0;
    Vec2 center(ctx.width / 2.0 + (blob_id == 0 ? -half : half), region_pos.y);
    double radius = TOGETHER_HOME_RADIUS;
    if (tier == SpacingTier::Close) radius = d * 0.3;
    else if (tier == SpacingTier::Far) radius = std::min(d * 0.5, ctx.width * 0.3);
    return {center, radius, tier};
}

void SpacingResolver::update_home(Blob& b, const SimContext& ctx) const {
    HomeAnchor a = resolve(b.params.min_blob_spacing, b.id, b.home_region, ctx);
    if (b.has_home && vec_length(a.center - b.home_center) > ANCHOR_SHIFT_THRESHOLD)
        b.target_pos = a.center;
    b.home_center = a.center;
    b.home_radius = a.radius;
    b.has_home = true;
}

// ═══════════════════════════════════════════════════════════════
//  MOTION SIMULATOR
// ═══════════════════════════════════════════════════════════════
double MotionSimulator::audio_response(GrowthPattern g, double level, double volume_impact) {
    double response = 1.0 + level * (volume_impact * 0.03);
    if (level <= 0.0) return response;
    switch (g) {
        case GrowthPattern::Exponential: return 1.0 + std::pow(level * 2.0, 2.0) * (volume_impact * 0.02);
        case GrowthPattern::Logarithmic: return 1.0 + std::log(1.0 + level * 10.0) * (volume_impact * 0.05);
        case GrowthPattern::Sine:        return 1.0 + std::sin(level * CV_PI * 0.5) * (volume_impact * 0.04);
        default: return response;
    }
}

double MotionSimulator::breathing_pulse(double anim_frame, double time_offset) {
    return std::sin(anim_frame * 0.05 + time_offset) * 0.5 + 1.0;
}

double MotionSimulator::pattern_gain(int id) {
    static const double gains[4] = {0.1, 0.08, 0.12, 0.06};
    return gains[id % 4];
}

double MotionSimulator::movement_intensity(const Blob& b, const std::vector<Blob>& all, double spacing,
                                           const std::map<std::string,double>& presets) {
    double intensity = 1.0;
    if (b.params.blur > 0) intensity *= 1.0 - std::min(b.params.blur / MAX_BLUR, 0.9);

    double nearest = std::numeric_limits<double>::infinity();
    for (const Blob& o : all) {
        if (o.id == b.id || !o.visible()) continue;
        nearest = std::min(nearest, vec_length(b.pos - o.pos));
    }
    if (nearest < spacing) {
        intensity *= std::max(0.1, nearest / spacing);
        if (tier_for_far(spacing, presets)) intensity *= 0.3;
    }
    return intensity;
}

bool MotionSimulator::tier_for_far(double spacing, const std::map<std::string,double>& presets) {
    return SpacingResolver::tier_for(spacing, presets) == SpacingTier::Far;
}

Vec2 MotionSimulator::pattern_target(const Blob& b, double time, double audio_influence, double intensity,
                                     const NoiseField& noise) {
    const Vec2& home = b.home_center;
    double r = b.home_radius;
    switch (b.id % 4) {
        case 0: { // orbit
            double radius = r * 0.3 * (1 + audio_influence * 0.5) * intensity;
            double speed = 0.02 + audio_influence * 0.01;
            return {home.x + std::cos(time * speed) * radius, home.y + std::sin(time * speed) * radius};
        }
        case 1: { // figure eight
            double scale = r * 0.4 * (1 + audio_influence * 0.3) * intensity;
            double speed = 0.015 + audio_influence * 0.008;
            return {home.x + std::sin(time * speed) * scale, home.y + std::sin(time * speed * 2) * scale * 0.5};
        }
        case 2: { // breathing in and out from home
            double radius = r * 0.6 * (0.3 + 0.7 * std::fabs(std::sin(time * 0.03))) * intensity;
            double angle = b.time_offset + audio_influence * 0.5;
            return {home.x + std::cos(angle) * radius, home.y + std::sin(angle) * radius};
        }
        default: { // wander
            double radius = r * 0.5 * intensity;
            double ns = 0.005;
            double wx = (noise.noise(time * ns, b.time_offset) - 0.5) * radius * 2;
            double wy = (noise.noise(time * ns + 100, b.time_offset + 100) - 0.5) * radius * 2;
            return {home.x + wx, home.y + wy};
        }
    }
}

void MotionSimulator::apply_repulsion(Blob& b, const std::vector<Blob>& all, const SimContext& ctx) {
    double min_distance = SpacingResolver::spacing_distance(b.params.min_blob_spacing, ctx.spacing_presets);
    for (const Blob& o : all) {
        if (o.id == b.id || !o.visible()) continue;
        double d = vec_length(b.pos - o.pos);
        if (d < min_distance && d > 0) {
            double strength = map_range(d, 0, min_distance, 0.03, 0.005);
            b.vel += normalized(b.pos - o.pos) * strength;
        }
    }
}

void MotionSimulator::apply_dynamic_movement(Blob& b, const std::vector<Blob>& all, const SimContext& ctx) {
    double spacing = SpacingResolver::spacing_distance(b.params.min_blob_spacing, ctx.spacing_presets);
    double intensity = movement_intensity(b, all, spacing, ctx.spacing_presets);
    double time = ctx.anim_frame() * 0.01 + b.time_offset;
    double audio_influence = b.smoothed_audio_level * 2;

    Vec2 target = pattern_target(b, time, audio_influence, intensity, ctx.noise);
    Vec2 force = (target - b.pos) * (pattern_gain(b.id) * intensity);
    force += random2d() * ((0.1 + audio_influence * 0.1) * intensity);

    if (b.smoothed_audio_level > 0.1) {
        double rhythm = std::sin(time * 2) * std::sin(time * 3.7) * 0.5 + 0.5;
        force += random2d() * (audio_influence * 0.3 * intensity * rhythm);
    }

    b.vel += force;
    b.vel = limit(b.vel, (1.8 + audio_influence) * intensity);
}

void MotionSimulator::apply_containment(Blob& b, const SimContext& ctx) {
    double m = EDGE_MARGIN, w = ctx.width, h = ctx.height;
    if (b.pos.x < m)     b.vel.x = std::fabs(b.vel.x) * 0.1;
    if (b.pos.x > w - m) b.vel.x = -std::fabs(b.vel.x) * 0.1;
    if (b.pos.y < m)     b.vel.y = std::fabs(b.vel.y) * 0.1;
    if (b.pos.y > h - m) b.vel.y = -std::fabs(b.vel.y) * 0.1;

    double damping = b.params.blur > 0 ? std::max(0.0, 0.95 - b.params.blur * 0.05) : 0.98;
    b.vel *= damping;

    b.pos.x = std::clamp(b.pos.x, -m, w + m);
    b.pos.y = std::clamp(b.pos.y, -m, h + m);
}

void MotionSimulator::update_strength(Blob& b, const SimContext& ctx) {
    double response = audio_response(b.params.growth_pattern, b.smoothed_audio_level, b.params.volume_impact);
    b.cached_strength = b.params.blob_strength * response * breathing_pulse(ctx.anim_frame(), b.time_offset);
    if (!std::isfinite(b.cached_strength)) b.cached_strength = b.params.blob_strength;
}

void MotionSimulator::step(Blob& b, const std::vector<Blob>& all, const SimContext& ctx) {
    b.params.is_visible = b.target.is_visible;
    if (!ctx.paused()) b.interpolate_params(ctx.param_smoothing);

    bool frozen = b.params.blur >= MAX_BLUR || ctx.paused();
    if (b.params.blur < MAX_BLUR) apply_repulsion(b, all, ctx);

    if (!frozen) apply_dynamic_movement(b, all, ctx);
    else b.vel *= 0.1;

    if (b.target_pos && !ctx.paused()) {
        Vec2 to_target = *b.target_pos - b.pos;
        if (vec_length(to_target) > TARGET_REACHED_DIST) {
            double easing = b.params.movement_easing > 0 ? b.params.movement_easing : DEFAULT_MOVEMENT_EASING;
            b.vel += normalized(to_target) * (ctx.transition_speed * easing / DEFAULT_MOVEMENT_EASING);
        } else {
            b.target_pos.reset();
        }
    }

    if (!frozen) {
        b.pos += b.vel;
        double from_home = vec_length(b.pos - b.home_center);
        double r = b.home_radius;
        if (r > 0 && from_home > r * 1.5) {
            double blur_reduction = b.params.blur > 0 ? (1 - b.params.blur / 10) : 1;
            double pull = map_clamped(from_home, r * 1.5, r * 3, 0.03, 0.08);
            b.vel += normalized(b.home_center - b.pos) * (pull * blur_reduction);
        }
    }

    apply_containment(b, ctx);

    if (!is_finite(b.vel)) b.vel = Vec2(0, 0);
    if (!is_finite(b.pos)) {
        b.pos = b.has_home ? b.home_center : Vec2(ctx.width / 2.0, ctx.height / 2.0);
        b.target_pos.reset();
    }

    update_strength(b, ctx);
}
