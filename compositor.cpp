#include "emoblob.h"

// ═══════════════════════════════════════════════════════════════
//  GLYPH SELECTION
// ═══════════════════════════════════════════════════════════════
static int wrap_index(long v, int n) {
    if (n <= 0) return 0;
    long r = v % n;
    return (int)(r < 0 ? r + n : r);
}

static Color3 scale_color(const double rgb[3]) {
    return {(int)std::clamp(rgb[0], 0.0, 255.0), (int)std::clamp(rgb[1], 0.0, 255.0), (int)std::clamp(rgb[2], 0.0, 255.0)};
}

int Compositor::plain_index(double shaped, int n) {
    if (n <= 1) return 0;
    int idx = (int)std::floor(map_range(shaped, 0, 1, 0, n - 1));
    return std::clamp(idx, 0, n - 1);
}

int Compositor::emotion_index_at(const Blob& b, const CellInfo& cell, double time) {
    int count = (int)b.current_emotions.size();
    if (count <= 1) return 0;

    double dx = cell.gx - b.pos.x, dy = cell.gy - b.pos.y;
    int idx = 0;
    switch ((cell.x + cell.y) % 4) {
        case 0: { // pie sectors
            double a = (std::atan2(dy, dx) + CV_PI) / (2 * CV_PI);
            idx = (int)std::floor(a * count);
            break;
        }
        case 1: { // rings
            double d = std::min(1.0, std::sqrt(dx * dx + dy * dy) / (cell.step_x * 10));
            idx = (int)std::floor(d * count);
            break;
        }
        case 2: { // sub-grid buckets
            int gw = (int)std::ceil(std::sqrt((double)count));
            int gh = (int)std::ceil((double)count / gw);
            int bx = wrap_index((long)std::floor((dx + cell.step_x * 5) / cell.step_x), gw);
            int by = wrap_index((long)std::floor((dy + cell.step_y * 5) / cell.step_y), gh);
            idx = (by * gw + bx) % count;
            break;
        }
        default:
            idx = (int)std::floor(std::fmod(time * 2 + cell.x * 0.1 + cell.y * 0.1, (double)count));
            break;
    }
    return std::clamp(idx, 0, count - 1);
}

double Compositor::activity(const SimContext& ctx, const Blob& b, int x, int y) {
    double strength = std::min(1.0, b.cached_strength / 2000.0);
    double time = ctx.anim_frame() * 0.01;
    double motion = std::fabs(ctx.noise.noise(x * 0.05 + time, y * 0.05 + time * 0.8) - 0.5) * 2;
    return strength * 0.4 + b.smoothed_audio_level * 0.3 + motion * 0.3;
}

std::vector<std::string> Compositor::activity_charset(const std::vector<std::string>& base, double activity) {
    size_t keep = base.size();
    if (activity < 0.2) keep = 2;
    else if (activity < 0.5) keep = 3;
    else if (activity < 0.8) keep = 4;
    keep = std::min(keep, base.size());
    return std::vector<std::string>(base.end() - keep, base.end());
}

const std::vector<std::string>& Compositor::emotion_glyphs(const std::string& emotion) {
    auto it = EMOTION_GLYPHS.find(canonical_emotion(emotion));
    return it != EMOTION_GLYPHS.end() ? it->second : DEFAULT_EMOTION_GLYPHS;
}

Vec2 Compositor::humor_offset(const SimContext& ctx, const Blob& b, double gx, double gy,
                              double step_x, double base_scale, double scatter_scale) {
    double humor = b.params.humor;
    if (humor <= 0) return {0, 0};
    double t = ctx.anim_frame() * 0.02;
    double nx = gx * 0.01 + t + b.id * 100;
    double ny = gy * 0.01 + t + b.id * 200;
    double ox = (ctx.noise.noise(nx, ny, t * 0.5) - 0.5) * 2;
    double oy = (ctx.noise.noise(nx + 1000, ny + 1000, t * 0.7) - 0.5) * 2;

    double jitter = map_range(humor, 0, 10, 0, step_x * base_scale);
    if (humor >= 6) {
        double scatter = map_range(humor, 6, 10, 0, step_x * scatter_scale);
        jitter += scatter * (0.5 + ctx.noise.noise(t * 0.3 + gx * 0.01 + gy * 0.01));
    }
    return {ox * jitter, oy * jitter};
}

Glyph Compositor::plain_glyph(const SimContext& ctx, const Blob& b, const CellInfo& cell) const {
    const std::vector<std::string>& chars = regular_charset.empty() ? PLAIN_GLYPHS : regular_charset;
    Glyph g;
    g.ch = chars[plain_index(cell.shaped, (int)chars.size())];
    g.color = ctx.glyph_color;
    g.alpha = 255;
    if (b.params.is_flashing && flash_on(ctx)) g.color = {230, 230, 230};
    if (b.params.blur > 0) g.alpha = (int)std::max(30.0, map_range(b.params.blur, 0, 10, 255, 40));

    double shine = b.params.shine;
    if (shine > 0) {
        double rgb[3] = {(double)g.color[0], (double)g.color[1], (double)g.color[2]};
        double boost = map_range(shine, 0, 10, 1.0, 3.2);
        for (double& c : rgb) c = std::min(255.0, c * boost);
        if (shine >= 7) {
            double glow = map_range(shine, 7, 10, 0.2, 0.6);
            for (double& c : rgb) c = std::min(255.0, c + (255 - c) * glow);
        }
        if (shine >= 2) {
            double speed = map_range(shine, 2, 10, 0.07, 0.20);
            double strength = map_range(shine, 2, 10, 0.3, 1.0);
            double pulse = 1 + std::sin(ctx.anim_frame() * speed + cell.gx * 0.08 + cell.gy * 0.08) * strength;
            for (double& c : rgb) c = std::min(255.0, c * pulse);
        }
        g.color = scale_color(rgb);
        g.alpha = (int)std::min(255.0, map_range(shine, 0, 10, g.alpha, 255) * 1.15);
    }

    Vec2 jitter = humor_offset(ctx, b, cell.gx, cell.gy, cell.step_x, 1.2, 0.8);
    g.x = cell.gx + jitter.x;
    g.y = cell.gy + jitter.y;
    g.size = cell.step_x * b.params.regular_char_size;
    return g;
}

Glyph Compositor::colored_glyph(const SimContext& ctx, const Blob& b, const CellInfo& cell,
                                const HighlightPoint& hp) const {
    double frame = ctx.anim_frame();
    double t = frame * 0.01;
    int count = (int)b.current_emotions.size();
    int idx = emotion_index_at(b, cell, t);
    const std::string& emotion = count > 0 ? b.current_emotions[idx] : hp.emotion;
    double act = activity(ctx, b, cell.x, cell.y);

    Color3 base = NEUTRAL_GRAY;
    if (!b.display_colors.empty())
        base = b.display_colors[(size_t)std::max(0, hp.emotion_index) % b.display_colors.size()];

    double rgb[3] = {(double)base[0], (double)base[1], (double)base[2]};
    if (const Color3* ec = ctx.emotion_color(emotion)) {
        double f = 0.6 + act * 0.4;
        for (int i = 0; i < 3; i++) rgb[i] = rgb[i] * (1 - f) + (*ec)[i] * f;
    }

    double n = ctx.noise.noise(cell.x * 0.1, cell.y * 0.1, t);
    double pulse = 0.95 + 0.05 * std::sin(frame * 0.03 + cell.x + cell.y);
    for (double& c : rgb) c = c * (0.9 + 0.2 * n) * pulse;

    if (act > 0.8) {
        double p = 1.2 + 0.3 * std::sin(t * 6 + cell.x * 0.1 + cell.y * 0.1);
        for (double& c : rgb) c = std::min(255.0, c * p);
    } else if (act > 0.6) {
        for (double& c : rgb) c = std::min(255.0, c * (1.1 + act * 0.3));
    }
    if (count > 1)
        for (double& c : rgb) c *= 0.9 + idx * 0.1;

    Glyph g;
    g.color = scale_color(rgb);
    g.alpha = 255;
    if (b.params.is_flashing && flash_on(ctx)) g.color = {255, 255, 255};
    if (b.params.blur > 0) g.alpha = (int)std::max(20.0, map_range(b.params.blur, 0, 10, 255, 20));

    std::vector<std::string> chars = (count <= 1 && !color_charset.empty())
        ? color_charset : activity_charset(emotion_glyphs(emotion), act);
    int nc = (int)chars.size();
    int ci;
    if (act > 0.7)      ci = wrap_index((long)std::floor(t * 4 + cell.x * 0.15 + cell.y * 0.15 + idx * 50), nc);
    else if (act > 0.4) ci = wrap_index((long)std::floor(t * 2 + cell.x * 0.1 + cell.y * 0.1 + idx * 30), nc);
    else if (act > 0.2) ci = wrap_index((long)std::floor(t + cell.x * 0.05 + cell.y * 0.05 + idx * 20), nc);
    else                ci = wrap_index(cell.x * 137L + cell.y * 149L + idx * 73L + (long)(frame / 30), nc);
    g.ch = nc > 0 ? chars[ci] : std::string("●");

    Vec2 p = Vec2(cell.gx, cell.gy) + humor_offset(ctx, b, cell.gx, cell.gy, cell.step_x, 1.5, 1.0);
    if (act > 0.6) {
        p.x += std::sin(t * 2 + cell.x * 0.1 + idx) * cell.step_x * act * 0.2;
        p.y += std::cos(t * 2.2 + cell.y * 0.1 + idx) * cell.step_y * act * 0.2;
    } else if (act > 0.3) {
        p.x += (ctx.noise.noise(cell.x * 0.03 + t + idx, cell.y * 0.03) - 0.5) * cell.step_x * act * 0.3;
        p.y += (ctx.noise.noise(cell.y * 0.03 + t + idx, cell.x * 0.03) - 0.5) * cell.step_y * act * 0.3;
    }
    if (count > 1) {
        p.x += std::sin(t + idx * 0.3) * cell.step_x * 0.1;
        p.y += std::cos(t * 1.1 + idx * 0.3) * cell.step_y * 0.1;
    }
    g.x = p.x;
    g.y = p.y;

    g.size = cell.step_x * b.params.colored_char_size * 2.3;
    if (act > 0.2) {
        double grow = 1.0 + idx * 0.05 + act * 0.4;
        double throb = 1.0 + std::sin(t * 3 + cell.x * 0.1 + cell.y * 0.1) * (act * 0.1);
        g.size *= grow * throb;
    }
    return g;
}

// ═══════════════════════════════════════════════════════════════
//  FRAME
// ═══════════════════════════════════════════════════════════════
void Compositor::draw_connections(const SimContext& ctx, const std::vector<Blob>& blobs, Surface& surface) const {
    double max_dist = ctx.width * 0.6;
    for (size_t i = 0; i < blobs.size(); i++) {
        for (size_t j = i + 1; j < blobs.size(); j++) {
            const Blob& a = blobs[i];
            const Blob& c = blobs[j];
            if (!a.visible() || !c.visible()) continue;
            double d = vec_length(a.pos - c.pos);
            if (d >= max_dist) continue;

            int alpha = (int)map_range(d, 0, max_dist, 180, 20);
            Color3 col = NEUTRAL_GRAY;
            if (!a.display_colors.empty() && !c.display_colors.empty()) {
                const Color3& c1 = a.display_colors[0];
                const Color3& c2 = c.display_colors[0];
                col = {(c1[0] + c2[0]) / 2, (c1[1] + c2[1]) / 2, (c1[2] + c2[2]) / 2};
            }
            double wobble = std::sin(ctx.anim_frame() * 0.02 + i + j) * 0.1;
            surface.draw_line(a.pos, c.pos, col, alpha, map_range(d, 0, max_dist, 3, 1) + wobble);
            surface.draw_circle(a.pos, 2 + wobble, col, alpha, true);
            surface.draw_circle(c.pos, 2 + wobble, col, alpha, true);
        }
    }
}

void Compositor::draw_home_regions(const SimContext& ctx, const std::vector<Blob>& blobs, Surface& surface) const {
    const Color3 overlay = {100, 100, 200};
    double radius = std::min(ctx.width, ctx.height) * 0.15;
    for (const Blob& b : blobs) {
        if (!b.visible()) continue;
        Vec2 c = b.has_home ? b.home_center : ctx.region_center(b.home_region);
        surface.draw_circle(c, radius, overlay, 100, false);
        surface.draw_circle(c, 4, overlay, 150, true);
        surface.draw_text("Blob " + std::to_string(b.id), Vec2(c.x, c.y - radius - 15), overlay, 200, 12);
    }
}

int Compositor::render(const SimContext& ctx, const std::vector<Blob>& blobs, const FieldSampler& field,
                       const HighlightPlacer& highlights, Surface& surface) const {
    surface.begin_frame(ctx.width, ctx.height, ctx.background);
    if (ctx.connect_blobs) draw_connections(ctx, blobs, surface);

    int grid = field.grid_size();
    double step_x = (double)ctx.width / std::max(1, grid);
    double step_y = (double)ctx.height / std::max(1, grid);
    int drawn = 0;

    for (int y = 0; y < grid; y++) {
        for (int x = 0; x < grid; x++) {
            if (!field.drawable(x, y)) continue;
            int dom = field.dominant(x, y);
            if (dom < 0 || dom >= (int)blobs.size()) continue;
            const Blob& b = blobs[dom];

            CellInfo cell{x, y, x * step_x + step_x / 2, y * step_y + step_y / 2, step_x, step_y, field.shaped(x, y)};
            const HighlightPoint* hp = b.current_emotions.empty() ? nullptr : highlights.lookup(b.id, x, y, grid);
            Glyph g = hp ? colored_glyph(ctx, b, cell, *hp) : plain_glyph(ctx, b, cell);
            if (g.ch.empty() || g.ch == " ") continue;
            surface.draw_glyph(g);
            drawn++;
        }
    }

    if (ctx.debug_overlay) draw_home_regions(ctx, blobs, surface);
    surface.end_frame();
    return drawn;
}
