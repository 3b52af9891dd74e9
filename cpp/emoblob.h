#pragma once
#include <opencv2/core.hpp>
#include <cmath>
#include <cstdio>
#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include <array>
#include <deque>
#include <map>
#include <unordered_map>
#include <optional>
#include <algorithm>
#include <utility>

// ═══════════════════════════════════════════════════════════════
//  CONFIGURATION
// ═══════════════════════════════════════════════════════════════
constexpr int DEFAULT_GRID_SIZE = 50;
constexpr int MIN_GRID_SIZE = 20;
constexpr int MAX_GRID_SIZE = 150;
constexpr int MIN_LAYOUT_GRID_SIZE = 10;
constexpr int DEFAULT_BLOB_COUNT = 2;
constexpr int MAX_BLOB_COUNT = 16;

constexpr double DRAW_THRESHOLD = 0.00001;
constexpr double FINAL_DRAW_THRESHOLD = 0.000005;
constexpr double INFLUENCE_EPSILON = 1e-6;

constexpr double DEFAULT_SPACING = 200.0;
constexpr double TOGETHER_SPACING = 100.0;
constexpr double CLOSE_SPACING = 300.0;
constexpr double FAR_SPACING = 600.0;
constexpr double TOGETHER_HOME_RADIUS = 40.0;
constexpr double ANCHOR_SHIFT_THRESHOLD = 2.0;

constexpr double EDGE_MARGIN = 10.0;
constexpr double TARGET_REACHED_DIST = 5.0;
constexpr double TRANSITION_SPEED = 0.8;
constexpr double DEFAULT_MOVEMENT_EASING = 0.03;
constexpr double PARAM_SMOOTHING = 0.15;
constexpr double AUDIO_SMOOTHING = 0.15;
constexpr int AUDIO_HISTORY = 10;
constexpr double MIN_SIZE_SCALE = 0.1;
constexpr double MAX_BLUR = 5.0;

constexpr int PLACEMENT_ATTEMPTS = 600;
constexpr double RELAXED_THRESHOLD_SCALE = 0.3;
constexpr int MAX_HIGHLIGHTS = 100;
constexpr int DEFAULT_CIRCLES_PER_EMOTION = 5;
constexpr double DEFAULT_EMOTION_CHAR_AMOUNT = 50.0;

using Color3 = std::array<int,3>;
using Vec2 = cv::Point2d;

// ═══════════════════════════════════════════════════════════════
//  GLOBAL DATA
// ═══════════════════════════════════════════════════════════════
extern const std::vector<std::string> PLAIN_GLYPHS;
extern const std::vector<std::string> DEFAULT_EMOTION_GLYPHS;
extern const std::map<std::string, std::vector<std::string>> EMOTION_GLYPHS;
extern const std::vector<Color3> FALLBACK_EMOTION_COLORS;
extern const std::vector<std::string> HOME_REGIONS;
extern const Color3 NEUTRAL_GRAY;

// ═══════════════════════════════════════════════════════════════
//  UTILITY
// ═══════════════════════════════════════════════════════════════
Color3 lerp_color(const Color3& c1, const Color3& c2, double t);
bool parse_hex_color(const std::string& hex, Color3& out);
double map_range(double v, double in_lo, double in_hi, double out_lo, double out_hi);
double map_clamped(double v, double in_lo, double in_hi, double out_lo, double out_hi);
std::string to_lower(const std::string& s);
std::string title_case(const std::string& s);
std::vector<std::string> split_glyphs(const std::string& s);
std::string canonical_emotion(const std::string& label);
bool is_finite(const Vec2& v);
double vec_length(const Vec2& v);
Vec2 limit(const Vec2& v, double max_len);
Vec2 normalized(const Vec2& v);

// seedable RNG; tests reseed for reproducible placement
thread_local inline std::mt19937 tl_rng{std::random_device{}()};
inline void seed_rng(unsigned seed) { tl_rng.seed(seed); }
inline double randf() { return std::uniform_real_distribution<double>(0.0,1.0)(tl_rng); }
inline double randf(double lo, double hi) { return std::uniform_real_distribution<double>(lo,hi)(tl_rng); }
inline Vec2 random2d() { double a = randf(0.0, 2.0 * CV_PI); return {std::cos(a), std::sin(a)}; }

// ═══════════════════════════════════════════════════════════════
//  NOISE FIELD
// ═══════════════════════════════════════════════════════════════
// Octave value noise with cosine interpolation. Output lies in [0,1).
class NoiseField {
public:
    explicit NoiseField(unsigned seed = 0x5eedu);
    void reseed(unsigned seed);
    double noise(double x, double y = 0.0, double z = 0.0) const;
private:
    static constexpr int YWRAPB = 4, YWRAP = 1 << YWRAPB;
    static constexpr int ZWRAPB = 8, ZWRAP = 1 << ZWRAPB;
    static constexpr int SIZE = 4095;
    static constexpr int OCTAVES = 4;
    static constexpr double FALLOFF = 0.5;
    std::array<double, SIZE + 1> perlin_{};
};

// ═══════════════════════════════════════════════════════════════
//  VISUAL PARAMETERS
// ═══════════════════════════════════════════════════════════════
enum class GrowthPattern { Linear, Exponential, Logarithmic, Sine };

bool parse_growth_pattern(const std::string& name, GrowthPattern& out);
const char* growth_pattern_name(GrowthPattern g);

// Either a named preset ("close", "far away", ...) or a pixel distance.
struct SpacingPref {
    std::string preset;
    double pixels = DEFAULT_SPACING;

    static SpacingPref named(const std::string& name) { SpacingPref s; s.preset = name; return s; }
    static SpacingPref distance(double px) { SpacingPref s; s.pixels = px; return s; }
    bool operator==(const SpacingPref& o) const { return preset == o.preset && pixels == o.pixels; }
};

struct VisualParams {
    double blob_strength = 1000.0;
    double blob_size_scale = 8.0;
    double volume_impact = 1500.0;
    double blob_spread_field = 6.0;
    double breath_speed = 0.0003;
    double gradient_strength = 15.0;
    double blobiness = 1.5;
    double colored_char_size = 1.0;
    double regular_char_size = 1.0;
    double blob_density = 1.2;
    double movement_easing = DEFAULT_MOVEMENT_EASING;
    GrowthPattern growth_pattern = GrowthPattern::Linear;
    double blur = 0.0;
    double humor = 0.0;
    double shine = 0.0;
    SpacingPref min_blob_spacing;
    bool is_visible = true;
    bool is_flashing = false;
};

VisualParams idle_visuals(const VisualParams& defaults);

// ═══════════════════════════════════════════════════════════════
//  BLOB
// ═══════════════════════════════════════════════════════════════
class Blob {
public:
    int id;
    std::string home_region;
    Vec2 pos, vel;
    std::optional<Vec2> target_pos;
    Vec2 home_center;
    double home_radius = 0.0;
    bool has_home = false;
    double time_offset;
    VisualParams params, target;
    std::vector<std::string> current_emotions;
    std::vector<Color3> display_colors{NEUTRAL_GRAY};
    double audio_level = 0.0, smoothed_audio_level = 0.0;
    std::deque<double> audio_history;
    double cached_strength = 0.0;

    Blob(int id, const std::string& region, const Vec2& start, const VisualParams& defaults);
    void set_target_visuals(const VisualParams& v);
    void set_audio_level(double level);
    void set_emotions(const std::vector<std::string>& emotions, const std::vector<Color3>& colors);
    void interpolate_params(double rate);
    void teleport(const Vec2& p);
    bool transitioning() const { return target_pos.has_value(); }
    bool visible() const { return params.is_visible; }
};

// ═══════════════════════════════════════════════════════════════
//  SIMULATION CONTEXT
// ═══════════════════════════════════════════════════════════════
// Shared state the simulator, sampler and compositor read: surface size,
// clock, pause flag, presets and the emotion palette.
class SimContext {
public:
    int width = 1000, height = 800;
    int grid_size = DEFAULT_GRID_SIZE;
    int frame_skip = 1;
    double draw_threshold = DRAW_THRESHOLD;
    double final_draw_threshold = FINAL_DRAW_THRESHOLD;
    double transition_speed = TRANSITION_SPEED;
    double param_smoothing = PARAM_SMOOTHING;
    Color3 background{247,249,243};
    Color3 glyph_color{0,0,0};
    bool connect_blobs = false;
    bool debug_overlay = false;
    bool loop_segment = false;
    std::map<std::string, double> spacing_presets;
    std::map<std::string, Color3> emotion_colors;
    NoiseField noise;

    SimContext();
    void resize(int w, int h);
    void advance_frame();
    void set_paused(bool p);
    bool paused() const { return paused_; }
    long frame_count() const { return frame_count_; }
    double anim_frame() const { return (double)(paused_ ? frozen_frame_ : frame_count_); }
    bool should_render() const { return frame_skip <= 1 || frame_count_ % frame_skip == 0; }
    const Vec2& region_center(const std::string& region) const;
    const Color3* emotion_color(const std::string& label) const;
private:
    long frame_count_ = 0, frozen_frame_ = 0;
    bool paused_ = false;
    mutable std::map<std::string, Vec2> region_cache_;
    mutable int cache_w_ = -1, cache_h_ = -1;
};

// ═══════════════════════════════════════════════════════════════
//  SPACING RESOLVER
// ═══════════════════════════════════════════════════════════════
enum class SpacingTier { Together, Close, Far };

struct HomeAnchor { Vec2 center; double radius; SpacingTier tier; };

class SpacingResolver {
public:
    static double spacing_distance(const SpacingPref& pref, const std::map<std::string,double>& presets);
    static SpacingTier tier_for(double distance, const std::map<std::string,double>& presets);
    HomeAnchor resolve(const SpacingPref& pref, int blob_id, const std::string& region, const SimContext& ctx) const;
    void update_home(Blob& b, const SimContext& ctx) const;
};

// ═══════════════════════════════════════════════════════════════
//  MOTION SIMULATOR
// ═══════════════════════════════════════════════════════════════
class MotionSimulator {
public:
    void step(Blob& b, const std::vector<Blob>& all, const SimContext& ctx);

    static double audio_response(GrowthPattern g, double smoothed_level, double volume_impact);
    static double breathing_pulse(double anim_frame, double time_offset);
    static double movement_intensity(const Blob& b, const std::vector<Blob>& all, double spacing,
                                     const std::map<std::string,double>& presets);
    static Vec2 pattern_target(const Blob& b, double time, double audio_influence, double intensity,
                               const NoiseField& noise);
    static double pattern_gain(int id);
private:
    static bool tier_for_far(double spacing, const std::map<std::string,double>& presets);
    void apply_repulsion(Blob& b, const std::vector<Blob>& all, const SimContext& ctx);
    void apply_dynamic_movement(Blob& b, const std::vector<Blob>& all, const SimContext& ctx);
    void apply_containment(Blob& b, const SimContext& ctx);
    void update_strength(Blob& b, const SimContext& ctx);
};

// ═══════════════════════════════════════════════════════════════
//  FIELD SAMPLER
// ═══════════════════════════════════════════════════════════════
struct FieldSample {
    int x = 0, y = 0;
    std::vector<double> influences;
    int dominant = -1;
    double influence = 0.0;
    double shaped = 0.0;
    bool drawable = false;
};

class FieldSampler {
public:
    static double distortion(const NoiseField& noise, const Vec2& blob_pos, double angle, double t);
    static double influence(const NoiseField& noise, const Blob& b, double gx, double gy, double anim_frame);
    static double shape(double influence, double gamma);

    void sample(const SimContext& ctx, const std::vector<Blob>& blobs, int grid);
    int grid_size() const { return grid_; }
    FieldSample at(int x, int y) const;
    int dominant(int x, int y) const { return dominant_.at<int>(y, x); }
    double shaped(int x, int y) const { return shaped_.at<double>(y, x); }
    bool drawable(int x, int y) const { return drawable_.at<uchar>(y, x) > 0; }
    const cv::Mat& shaped_map() const { return shaped_; }
    const cv::Mat& dominant_map() const { return dominant_; }
private:
    int grid_ = 0;
    cv::Mat max_influence_;   // CV_64F
    cv::Mat shaped_;          // CV_64F
    cv::Mat dominant_;        // CV_32S, -1 = no visible blob
    cv::Mat drawable_;        // CV_8U
    std::vector<cv::Mat> raw_;
};

// ═══════════════════════════════════════════════════════════════
//  HIGHLIGHT PLACER
// ═══════════════════════════════════════════════════════════════
struct HighlightPoint {
    int x, y;
    std::string emotion;
    int emotion_index;
    double noise_offset;
    bool fallback;
};

struct PlacementRequest {
    std::vector<std::string> emotions;
    std::vector<std::pair<std::string,double>> distribution;
    int circles_per_emotion = DEFAULT_CIRCLES_PER_EMOTION;
    double emotion_char_amount = DEFAULT_EMOTION_CHAR_AMOUNT;
    int grid_size = DEFAULT_GRID_SIZE;
};

struct Placement {
    int grid_size = 0;
    double min_distance = 0.0;
    int fallback_count = 0;
    std::vector<HighlightPoint> points;
    std::unordered_map<long long, size_t> index;

    const HighlightPoint* find(int x, int y) const;
    static long long key(int x, int y) { return ((long long)x << 32) | (unsigned int)y; }
};

class HighlightPlacer {
public:
    Placement place(const SimContext& ctx, const Blob& b, const PlacementRequest& req) const;
    void replace(int blob_id, Placement p);
    void clear();
    void clear(int blob_id);
    const Placement* get(int blob_id) const;
    const HighlightPoint* lookup(int blob_id, int x, int y, int render_grid) const;

    static int point_count(int circles_per_emotion, double char_amount, size_t emotion_count, int grid);
    static double min_distance_for(int count, int grid);
    static int search_radius_for(double size_scale, int grid);
    static bool distribution_valid(const std::vector<std::string>& emotions,
                                   const std::vector<std::pair<std::string,double>>& distribution);
    static std::vector<std::string> assign_emotions(const std::vector<std::string>& emotions,
                                                    const std::vector<std::pair<std::string,double>>& distribution,
                                                    int count);
private:
    std::map<int, Placement> placements_;
};

// ═══════════════════════════════════════════════════════════════
//  DRAWING SURFACE
// ═══════════════════════════════════════════════════════════════
struct Glyph { std::string ch; Color3 color; int alpha; double x, y, size; };

class Surface {
public:
    virtual ~Surface() = default;
    virtual void begin_frame(int w, int h, const Color3& bg) = 0;
    virtual void draw_glyph(const Glyph& g) = 0;
    virtual void draw_line(const Vec2& a, const Vec2& b, const Color3& c, int alpha, double weight) = 0;
    virtual void draw_circle(const Vec2& center, double radius, const Color3& c, int alpha, bool filled) = 0;
    virtual void draw_text(const std::string& text, const Vec2& pos, const Color3& c, int alpha, double size) = 0;
    virtual void end_frame() = 0;
};

// ═══════════════════════════════════════════════════════════════
//  COMPOSITOR
// ═══════════════════════════════════════════════════════════════
struct CellInfo {
    int x, y;
    double gx, gy;
    double step_x, step_y;
    double shaped;
};

class Compositor {
public:
    std::vector<std::string> regular_charset;
    std::vector<std::string> color_charset;

    int render(const SimContext& ctx, const std::vector<Blob>& blobs, const FieldSampler& field,
               const HighlightPlacer& highlights, Surface& surface) const;
    Glyph plain_glyph(const SimContext& ctx, const Blob& b, const CellInfo& cell) const;
    Glyph colored_glyph(const SimContext& ctx, const Blob& b, const CellInfo& cell, const HighlightPoint& hp) const;
    void draw_connections(const SimContext& ctx, const std::vector<Blob>& blobs, Surface& surface) const;
    void draw_home_regions(const SimContext& ctx, const std::vector<Blob>& blobs, Surface& surface) const;

    static int plain_index(double shaped, int n);
    static int emotion_index_at(const Blob& b, const CellInfo& cell, double time);
    static double activity(const SimContext& ctx, const Blob& b, int x, int y);
    static std::vector<std::string> activity_charset(const std::vector<std::string>& base, double activity);
    static const std::vector<std::string>& emotion_glyphs(const std::string& emotion);
    static bool flash_on(const SimContext& ctx) { return ((long)ctx.anim_frame()) % 8 < 4; }
    static Vec2 humor_offset(const SimContext& ctx, const Blob& b, double gx, double gy,
                             double step_x, double base_scale, double scatter_scale);
};
