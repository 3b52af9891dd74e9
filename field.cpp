#include "emoblob.h"

// ═══════════════════════════════════════════════════════════════
//  FIELD SAMPLER
// ═══════════════════════════════════════════════════════════════
double FieldSampler::distortion(const NoiseField& noise, const Vec2& p, double angle, double t) {
    double n1 = noise.noise(0.01 * p.x + std::cos(angle * 3.0 + t), 0.01 * p.y + std::sin(angle * 2.5 - t));
    double n2 = noise.noise(0.015 * p.x + std::cos(angle * 1.7 - t * 0.5), 0.015 * p.y + std::sin(angle * 1.3 + t * 0.3));
    return std::sin(n1 * CV_PI) * std::cos(n2 * CV_PI);
}

double FieldSampler::influence(const NoiseField& noise, const Blob& b, double gx, double gy, double anim_frame) {
    double t = anim_frame * b.params.breath_speed;
    double dx = gx - b.pos.x, dy = gy - b.pos.y;
    double d2 = std::max(1.0, dx * dx + dy * dy);
    double angle = std::atan2(dy, dx);
    double dist = distortion(noise, b.pos, angle, t);
    double strength = b.cached_strength * b.params.blob_size_scale * (1 + b.params.blobiness * 0.3 * dist);
    double v = (strength * b.params.blob_density) / (d2 * b.params.blob_spread_field + INFLUENCE_EPSILON);
    return std::isfinite(v) ? v : 0.0;
}

double FieldSampler::shape(double influence, double gamma) {
    if (!std::isfinite(influence)) influence = 0.0;
    double i = std::clamp(influence, 0.0, 1.0);
    double s = std::pow(i, gamma);
    return 1.0 - std::pow(1.0 - s, gamma);
}

void FieldSampler::sample(const SimContext& ctx, const std::vector<Blob>& blobs, int grid) {
    grid_ = std::max(1, grid);
    max_influence_.create(grid_, grid_, CV_64F);
    shaped_.create(grid_, grid_, CV_64F);
    dominant_.create(grid_, grid_, CV_32S);
    drawable_.create(grid_, grid_, CV_8U);
    max_influence_.setTo(0.0);
    shaped_.setTo(0.0);
    dominant_.setTo(-1);
    drawable_.setTo(0);

    raw_.resize(blobs.size());
    for (auto& m : raw_) { m.create(grid_, grid_, CV_64F); m.setTo(0.0); }

    double step_x = (double)ctx.width / grid_, step_y = (double)ctx.height / grid_;
    double frame = ctx.anim_frame();

    for (int y = 0; y < grid_; y++) {
        double gy = y * step_y + step_y / 2;
        double* row_max = max_influence_.ptr<double>(y);
        int* row_dom = dominant_.ptr<int>(y);
        for (int x = 0; x < grid_; x++) {
            double gx = x * step_x + step_x / 2;
            for (size_t i = 0; i < blobs.size(); i++) {
                const Blob& b = blobs[i];
                if (!b.visible()) continue;
                double v = influence(ctx.noise, b, gx, gy, frame);
                raw_[i].at<double>(y, x) = v;
                if (v > row_max[x]) { row_max[x] = v; row_dom[x] = (int)i; }
            }
            if (row_dom[x] < 0 || row_max[x] <= ctx.draw_threshold) continue;
            double s = shape(row_max[x], blobs[row_dom[x]].params.gradient_strength);
            shaped_.at<double>(y, x) = s;
            if (s >= ctx.final_draw_threshold) drawable_.at<uchar>(y, x) = 1;
        }
    }
}

FieldSample FieldSampler::at(int x, int y) const {
    FieldSample s;
    s.x = x; s.y = y;
    for (const auto& m : raw_) s.influences.push_back(m.at<double>(y, x));
    s.dominant = dominant_.at<int>(y, x);
    s.influence = max_influence_.at<double>(y, x);
    s.shaped = shaped_.at<double>(y, x);
    s.drawable = drawable_.at<uchar>(y, x) > 0;
    return s;
}

// ═══════════════════════════════════════════════════════════════
//  HIGHLIGHT PLACER
// ═══════════════════════════════════════════════════════════════
const HighlightPoint* Placement::find(int x, int y) const {
    auto it = index.find(key(x, y));
    return it != index.end() ? &points[it->second] : nullptr;
}

int HighlightPlacer::point_count(int circles_per_emotion, double char_amount, size_t emotion_count, int grid) {
    if (circles_per_emotion <= 0 || !(char_amount > 0)) return 0;
    int n = (int)std::lround(circles_per_emotion * (char_amount / DEFAULT_EMOTION_CHAR_AMOUNT));
    // sparse grids still need a handful of visible highlights
    int floor_n = std::max((int)emotion_count, grid <= 30 ? 3 : 1);
    int ceil_n = std::clamp(grid * grid / 8, 10, MAX_HIGHLIGHTS);
    return std::clamp(n, std::min(floor_n, ceil_n), ceil_n);
}

double HighlightPlacer::min_distance_for(int count, int grid) {
    double base = std::max(1.0, std::min(4.0, std::floor(std::sqrt((double)count) * 0.5)));
    return std::max(1.0, std::floor(base * std::min(1.0, grid / (double)DEFAULT_GRID_SIZE)));
}

int HighlightPlacer::search_radius_for(double size_scale, int grid) {
    int r = std::max(20, std::min(60, (int)std::floor(size_scale * 6)));
    return std::max(2, (int)std::lround(r * grid / (double)DEFAULT_GRID_SIZE));
}

bool HighlightPlacer::distribution_valid(const std::vector<std::string>& emotions,
                                         const std::vector<std::pair<std::string,double>>& distribution) {
    if (distribution.empty() || emotions.empty()) return false;
    double sum = 0.0;
    for (const auto& d : distribution) {
        if (!std::isfinite(d.second) || d.second < 0) return false;
        if (std::find(emotions.begin(), emotions.end(), d.first) == emotions.end()) return false;
        sum += d.second;
    }
    return std::fabs(sum - 100.0) <= 1.0;
}

std::vector<std::string> HighlightPlacer::assign_emotions(const std::vector<std::string>& emotions,
                                                          const std::vector<std::pair<std::string,double>>& distribution,
                                                          int count) {
    std::vector<std::string> out;
    if (count <= 0) return out;
    if (emotions.empty()) return std::vector<std::string>(count, "neutral");

    if (!distribution_valid(emotions, distribution)) {
        for (int i = 0; i < count; i++) out.push_back(emotions[i % emotions.size()]);
        return out;
    }

    // largest remainder: floor first, leftovers by descending fraction
    std::vector<int> counts(distribution.size());
    std::vector<std::pair<double,size_t>> remainders;
    int assigned = 0;
    for (size_t i = 0; i < distribution.size(); i++) {
        double exact = distribution[i].second / 100.0 * count;
        counts[i] = (int)std::floor(exact);
        assigned += counts[i];
        remainders.push_back({exact - std::floor(exact), i});
    }
    std::stable_sort(remainders.begin(), remainders.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });
    for (int j = 0; j < count - assigned && j < (int)remainders.size(); j++) counts[remainders[j].second]++;

    for (size_t i = 0; i < distribution.size(); i++)
        for (int j = 0; j < counts[i]; j++) out.push_back(distribution[i].first);
    while ((int)out.size() < count) out.push_back(emotions[0]);
    out.resize(count);
    return out;
}

// strongest unoccupied cell inside the search window, or -1 when every cell holds a point
static void best_free_cell(const SimContext& ctx, const Blob& b, const Placement& p, int cx, int cy, int radius,
                           double step_x, double step_y, int& out_x, int& out_y) {
    int grid = p.grid_size;
    double best = -1.0;
    out_x = out_y = -1;
    for (int y = std::max(0, cy - radius); y <= std::min(grid - 1, cy + radius); y++)
        for (int x = std::max(0, cx - radius); x <= std::min(grid - 1, cx + radius); x++) {
            if (p.find(x, y)) continue;
            double v = FieldSampler::influence(ctx.noise, b, x * step_x + step_x / 2, y * step_y + step_y / 2, ctx.anim_frame());
            double s = FieldSampler::shape(v, b.params.gradient_strength);
            if (s > best) { best = s; out_x = x; out_y = y; }
        }
}

Placement HighlightPlacer::place(const SimContext& ctx, const Blob& b, const PlacementRequest& req) const {
    Placement p;
    int grid = std::clamp(req.grid_size, 1, MAX_GRID_SIZE);
    p.grid_size = grid;

    int n = point_count(req.circles_per_emotion, req.emotion_char_amount, req.emotions.size(), grid);
    if (n == 0) return p;

    if (!req.distribution.empty() && !distribution_valid(req.emotions, req.distribution))
        fprintf(stderr, "⚠ Blob %d: emotion distribution does not match emotions, using round-robin\n", b.id);
    std::vector<std::string> labels = assign_emotions(req.emotions, req.distribution, n);

    double step_x = (double)ctx.width / grid, step_y = (double)ctx.height / grid;
    int cx = std::clamp((int)std::floor(b.pos.x / step_x), 0, grid - 1);
    int cy = std::clamp((int)std::floor(b.pos.y / step_y), 0, grid - 1);
    int radius = search_radius_for(b.params.blob_size_scale, grid);
    p.min_distance = min_distance_for(n, grid);
    double relaxed = ctx.final_draw_threshold * RELAXED_THRESHOLD_SCALE;
    double frame = ctx.anim_frame();

    for (int i = 0; i < n; i++) {
        bool valid = false;
        int x = cx, y = cy;
        int best_x = cx, best_y = cy;
        double best = -1.0;
        int free_x = -1, free_y = -1;
        double best_free = -1.0;

        for (int a = 0; a < PLACEMENT_ATTEMPTS && !valid; a++) {
            int px, py;
            if (a < PLACEMENT_ATTEMPTS * 0.7) {
                double angle = randf(0.0, 2 * CV_PI), r;
                if (i < n / 4.0)            r = std::sqrt(randf()) * radius * 0.6;
                else if (i < n / 2.0)       r = (0.4 + std::sqrt(randf()) * 0.6) * radius;
                else if (i < 3 * n / 4.0)   r = (0.7 + std::sqrt(randf()) * 0.3) * radius;
                else                        r = (0.8 + randf() * 0.2) * radius;
                px = (int)std::floor(cx + std::cos(angle) * r);
                py = (int)std::floor(cy + std::sin(angle) * r);
            } else if (a < PLACEMENT_ATTEMPTS * 0.9) {
                int step = std::max(2, radius / 8);
                px = cx + ((a % 9) - 4) * step;
                py = cy + (((a % 81) / 9) - 4) * step;
            } else {
                px = (int)std::floor(cx + randf(-radius, radius));
                py = (int)std::floor(cy + randf(-radius, radius));
            }
            px = std::clamp(px, 0, grid - 1);
            py = std::clamp(py, 0, grid - 1);

            double v = FieldSampler::influence(ctx.noise, b, px * step_x + step_x / 2, py * step_y + step_y / 2, frame);
            double s = FieldSampler::shape(v, b.params.gradient_strength);
            bool taken = p.find(px, py) != nullptr;
            if (s > best) { best = s; best_x = px; best_y = py; }
            if (!taken && s > best_free) { best_free = s; free_x = px; free_y = py; }
            if (s < relaxed || taken) continue;

            valid = true;
            for (const HighlightPoint& h : p.points) {
                if (std::hypot(px - h.x, py - h.y) < p.min_distance) { valid = false; break; }
            }
            if (valid) { x = px; y = py; }
        }

        if (!valid) {
            // spacing may break, cells are only shared once the window is full
            if (free_x < 0) best_free_cell(ctx, b, p, cx, cy, radius, step_x, step_y, free_x, free_y);
            if (free_x >= 0) { x = free_x; y = free_y; }
            else { x = best_x; y = best_y; }
            p.fallback_count++;
        }

        const std::string& emotion = labels[i];
        auto it = std::find(req.emotions.begin(), req.emotions.end(), emotion);
        int idx = it != req.emotions.end() ? (int)(it - req.emotions.begin()) : 0;
        p.points.push_back({x, y, emotion, idx, randf(0.0, 1000.0), !valid});
        p.index.emplace(Placement::key(x, y), p.points.size() - 1);
    }

    if (p.fallback_count > 0)
        fprintf(stderr, "⚠ Blob %d: %d of %d highlights placed without spacing\n", b.id, p.fallback_count, n);
    return p;
}

void HighlightPlacer::replace(int blob_id, Placement p) { placements_[blob_id] = std::move(p); }

void HighlightPlacer::clear() { placements_.clear(); }

void HighlightPlacer::clear(int blob_id) { placements_.erase(blob_id); }

const Placement* HighlightPlacer::get(int blob_id) const {
    auto it = placements_.find(blob_id);
    return it != placements_.end() ? &it->second : nullptr;
}

const HighlightPoint* HighlightPlacer::lookup(int blob_id, int x, int y, int render_grid) const {
    const Placement* p = get(blob_id);
    if (!p || p->points.empty()) return nullptr;
    if (render_grid != p->grid_size && render_grid > 0) {
        x = std::min(p->grid_size - 1, (int)std::floor((double)x * p->grid_size / render_grid));
        y = std::min(p->grid_size - 1, (int)std::floor((double)y * p->grid_size / render_grid));
    }
    return p->find(x, y);
}
