#include "emoblob.h"

// ═══════════════════════════════════════════════════════════════
//  GLOBAL DATA DEFINITIONS
// ═══════════════════════════════════════════════════════════════
std::vector<std::string> split_glyphs(const std::string& s) {
    std::vector<std::string> v;
    // Handle multi-byte UTF-8 chars
    size_t i = 0;
    while (i < s.size()) {
        int len = 1;
        unsigned char c = s[i];
        if (c >= 0xC0 && c < 0xE0) len = 2;
        else if (c >= 0xE0 && c < 0xF0) len = 3;
        else if (c >= 0xF0) len = 4;
        v.push_back(s.substr(i, len));
        i += len;
    }
    return v;
}

// ordered sparse -> dense
const std::vector<std::string> PLAIN_GLYPHS = {" ", "░", "▒", "▓", "█"};
const std::vector<std::string> DEFAULT_EMOTION_GLYPHS = split_glyphs("●◉○◯◦");

const std::map<std::string, std::vector<std::string>> EMOTION_GLYPHS = {
    {"happiness",   split_glyphs("☺✦★●◉")},
    {"happy",       split_glyphs("☺✦★●◉")},
    {"joy",         split_glyphs("●◉⬢⬡◯")},
    {"excitement",  split_glyphs("✧★☆◉●")},
    {"love",        split_glyphs("♥❤♡●◉")},
    {"surprise",    split_glyphs("!?◉○●")},
    {"anger",       split_glyphs("▲▼◆■●")},
    {"fear",        split_glyphs("!‼⚡◊●")},
    {"sadness",     split_glyphs("◌◔◕○●")},
    {"disgust",     split_glyphs("×✕✖◈●")},
    {"curiosity",   split_glyphs("?¿◔◕●")},
    {"frustration", split_glyphs("●◉⬢⬡◯")},
    {"anxiety",     split_glyphs("~≈◔◕●")},
    {"hope",        split_glyphs("☆★✧◯●")},
    {"pride",       split_glyphs("★☆◉●⬢")},
    {"neutral",     split_glyphs("—–−•●")},
};

// Hebrew labels used by the conversation analyzer
static const std::map<std::string, std::string> EMOTION_ALIASES = {
    {"שמחה", "happiness"}, {"שמח", "happy"}, {"עליזות", "joy"}, {"התרגשות", "excitement"},
    {"אהבה", "love"}, {"הפתעה", "surprise"}, {"כעס", "anger"}, {"פחד", "fear"},
    {"עצב", "sadness"}, {"גועל", "disgust"}, {"סקרנות", "curiosity"}, {"תסכול", "frustration"},
    {"חרדה", "anxiety"}, {"תקווה", "hope"}, {"גאווה", "pride"}, {"נייטרלי", "neutral"},
    {"ניטרלי", "neutral"},
};

std::string canonical_emotion(const std::string& label) {
    auto it = EMOTION_ALIASES.find(label);
    return it != EMOTION_ALIASES.end() ? it->second : to_lower(label);
}

const std::vector<Color3> FALLBACK_EMOTION_COLORS = {
    {0xf3,0x70,0x21}, {0x66,0x4d,0xe5}, {0x3c,0x7a,0x41}, {0xa4,0x2d,0x2d}, {0x2d,0x43,0x66},
    {0x84,0x2e,0x2b}, {0xdc,0x86,0x30}, {0x8d,0xb5,0xdd}, {0xf6,0x9f,0x87}
};

const std::vector<std::string> HOME_REGIONS = {
    "top-left", "center-left", "bottom-left", "top-center", "center",
    "bottom-center", "top-right", "center-right", "bottom-right"
};

const Color3 NEUTRAL_GRAY = {150,150,150};

// ═══════════════════════════════════════════════════════════════
//  UTILITY IMPLEMENTATIONS
// ═══════════════════════════════════════════════════════════════
Color3 lerp_color(const Color3& c1, const Color3& c2, double t) {
    t = std::max(0.0, std::min(1.0, t));
    return {(int)(c1[0]+(c2[0]-c1[0])*t), (int)(c1[1]+(c2[1]-c1[1])*t), (int)(c1[2]+(c2[2]-c1[2])*t)};
}

bool parse_hex_color(const std::string& hex, Color3& out) {
    auto nib = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        c = (char)std::tolower((unsigned char)c);
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };
    if (hex.empty() || hex[0] != '#') return false;
    if (hex.size() == 4) {
        int r = nib(hex[1]), g = nib(hex[2]), b = nib(hex[3]);
        if (r < 0 || g < 0 || b < 0) return false;
        out = {r*17, g*17, b*17};
        return true;
    }
    if (hex.size() == 7) {
        int v[6];
        for (int i = 0; i < 6; i++) { v[i] = nib(hex[i+1]); if (v[i] < 0) return false; }
        out = {v[0]*16+v[1], v[2]*16+v[3], v[4]*16+v[5]};
        return true;
    }
    return false;
}

double map_range(double v, double in_lo, double in_hi, double out_lo, double out_hi) {
    if (in_hi == in_lo) return out_lo;
    return out_lo + (v - in_lo) * (out_hi - out_lo) / (in_hi - in_lo);
}

double map_clamped(double v, double in_lo, double in_hi, double out_lo, double out_hi) {
    double r = map_range(v, in_lo, in_hi, out_lo, out_hi);
    return std::clamp(r, std::min(out_lo, out_hi), std::max(out_lo, out_hi));
}

std::string to_lower(const std::string& s) {
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return r;
}

std::string title_case(const std::string& s) {
    std::string r = to_lower(s);
    if (!r.empty()) r[0] = (char)std::toupper((unsigned char)r[0]);
    return r;
}

bool is_finite(const Vec2& v) { return std::isfinite(v.x) && std::isfinite(v.y); }

double vec_length(const Vec2& v) { return std::sqrt(v.x*v.x + v.y*v.y); }

Vec2 limit(const Vec2& v, double max_len) {
    double len = vec_length(v);
    if (len <= max_len || len <= 0.0) return v;
    return v * (max_len / len);
}

Vec2 normalized(const Vec2& v) {
    double len = vec_length(v);
    return len > 0.0 ? v * (1.0 / len) : Vec2(0, 0);
}

// ═══════════════════════════════════════════════════════════════
//  NOISE FIELD
// ═══════════════════════════════════════════════════════════════
static inline double scaled_cosine(double i) { return 0.5 * (1.0 - std::cos(i * CV_PI)); }

NoiseField::NoiseField(unsigned seed) { reseed(seed); }

void NoiseField::reseed(unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    for (auto& p : perlin_) p = dist(gen);
}

double NoiseField::noise(double x, double y, double z) const {
    x = std::fabs(x); y = std::fabs(y); z = std::fabs(z);
    if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(z)) return 0.5;
    uint32_t xi = (uint32_t)std::floor(x), yi = (uint32_t)std::floor(y), zi = (uint32_t)std::floor(z);
    double xf = x - std::floor(x), yf = y - std::floor(y), zf = z - std::floor(z);
    double r = 0.0, ampl = 0.5;
    for (int o = 0; o < OCTAVES; o++) {
        uint32_t of = xi + (yi << YWRAPB) + (zi << ZWRAPB);
        double rxf = scaled_cosine(xf), ryf = scaled_cosine(yf);

        double n1 = perlin_[of & SIZE];
        n1 += rxf * (perlin_[(of + 1) & SIZE] - n1);
        double n2 = perlin_[(of + YWRAP) & SIZE];
        n2 += rxf * (perlin_[(of + YWRAP + 1) & SIZE] - n2);
        n1 += ryf * (n2 - n1);

        of += ZWRAP;
        n2 = perlin_[of & SIZE];
        n2 += rxf * (perlin_[(of + 1) & SIZE] - n2);
        double n3 = perlin_[(of + YWRAP) & SIZE];
        n3 += rxf * (perlin_[(of + YWRAP + 1) & SIZE] - n3);
        n2 += ryf * (n3 - n2);

        n1 += scaled_cosine(zf) * (n2 - n1);
        r += n1 * ampl;
        ampl *= FALLOFF;

        xi <<= 1; xf *= 2; yi <<= 1; yf *= 2; zi <<= 1; zf *= 2;
        if (xf >= 1.0) { xi++; xf -= 1.0; }
        if (yf >= 1.0) { yi++; yf -= 1.0; }
        if (zf >= 1.0) { zi++; zf -= 1.0; }
    }
    return r;
}

// ═══════════════════════════════════════════════════════════════
//  VISUAL PARAMETERS
// ═══════════════════════════════════════════════════════════════
bool parse_growth_pattern(const std::string& name, GrowthPattern& out) {
    std::string n = to_lower(name);
    if (n == "linear") out = GrowthPattern::Linear;
    else if (n == "exponential") out = GrowthPattern::Exponential;
    else if (n == "logarithmic") out = GrowthPattern::Logarithmic;
    else if (n == "sine") out = GrowthPattern::Sine;
    else return false;
    return true;
}

const char* growth_pattern_name(GrowthPattern g) {
    switch (g) {
        case GrowthPattern::Exponential: return "exponential";
        case GrowthPattern::Logarithmic: return "logarithmic";
        case GrowthPattern::Sine: return "sine";
        default: return "linear";
    }
}

VisualParams idle_visuals(const VisualParams& defaults) {
    VisualParams v = defaults;
    v.blob_size_scale = 2.0;
    v.blob_strength = 300.0;
    v.volume_impact = 0.0;
    v.is_visible = true;
    v.is_flashing = false;
    return v;
}

// ═══════════════════════════════════════════════════════════════
//  BLOB
// ═══════════════════════════════════════════════════════════════
Blob::Blob(int id_, const std::string& region, const Vec2& start, const VisualParams& defaults)
    : id(id_), home_region(region), pos(start), vel(random2d() * randf(0.7, 1.2)),
      time_offset(randf(0.0, 1000.0)), params(defaults), target(defaults) {
    if (params.blob_size_scale <= MIN_SIZE_SCALE) params.blob_size_scale = 1.0;
    if (target.blob_size_scale <= MIN_SIZE_SCALE) target.blob_size_scale = 1.0;
    cached_strength = params.blob_strength;
}

void Blob::set_target_visuals(const VisualParams& v) {
    target = v;
    if (target.blob_size_scale <= MIN_SIZE_SCALE) target.blob_size_scale = 1.0;
}

void Blob::set_audio_level(double level) {
    if (!std::isfinite(level)) level = 0.0;
    level = std::clamp(level, 0.0, 1.0);
    audio_level = level;
    audio_history.push_back(level);
    if ((int)audio_history.size() > AUDIO_HISTORY) audio_history.pop_front();
    double sum = 0.0;
    for (double a : audio_history) sum += a;
    double avg = sum / audio_history.size();
    smoothed_audio_level += (avg - smoothed_audio_level) * AUDIO_SMOOTHING;
}

void Blob::set_emotions(const std::vector<std::string>& emotions, const std::vector<Color3>& colors) {
    current_emotions = emotions;
    display_colors = colors.empty() ? std::vector<Color3>{NEUTRAL_GRAY} : colors;
    if (current_emotions.size() > 1 && display_colors.size() != current_emotions.size())
        fprintf(stderr, "⚠ Blob %d: %zu emotions but %zu colors\n", id, current_emotions.size(), display_colors.size());
}

void Blob::interpolate_params(double rate) {
    auto ease = [rate](double& cur, double tgt) { cur += (tgt - cur) * rate; };
    ease(params.blob_strength, target.blob_strength);
    ease(params.blob_size_scale, target.blob_size_scale);
    ease(params.volume_impact, target.volume_impact);
    ease(params.blob_spread_field, target.blob_spread_field);
    ease(params.breath_speed, target.breath_speed);
    ease(params.gradient_strength, target.gradient_strength);
    ease(params.blobiness, target.blobiness);
    ease(params.colored_char_size, target.colored_char_size);
    ease(params.regular_char_size, target.regular_char_size);
    ease(params.blob_density, target.blob_density);
    ease(params.movement_easing, target.movement_easing);
    params.blob_size_scale = std::max(MIN_SIZE_SCALE, params.blob_size_scale);
    // effect levels and switches snap
    params.growth_pattern = target.growth_pattern;
    params.blur = target.blur;
    params.humor = target.humor;
    params.shine = target.shine;
    params.min_blob_spacing = target.min_blob_spacing;
    params.is_visible = target.is_visible;
    params.is_flashing = target.is_flashing;
}

void Blob::teleport(const Vec2& p) {
    pos = p;
    target_pos.reset();
}

// ═══════════════════════════════════════════════════════════════
//  SIMULATION CONTEXT
// ═══════════════════════════════════════════════════════════════
SimContext::SimContext() {
    spacing_presets = {
        {"together", TOGETHER_SPACING}, {"close", CLOSE_SPACING}, {"far away", FAR_SPACING},
        {"very close", 50.0}, {"middle", 300.0}, {"farest", 600.0}
    };
}

void SimContext::resize(int w, int h) {
    width = std::max(1, w);
    height = std::max(1, h);
}

void SimContext::advance_frame() {
    frame_count_++;
    if (!paused_) frozen_frame_ = frame_count_;
}

void SimContext::set_paused(bool p) {
    if (p && !paused_) frozen_frame_ = frame_count_;
    paused_ = p;
    if (!paused_) frozen_frame_ = frame_count_;
}

const Vec2& SimContext::region_center(const std::string& region) const {
    if (width != cache_w_ || height != cache_h_) {
        region_cache_.clear();
        cache_w_ = width; cache_h_ = height;
    }
    auto it = region_cache_.find(region);
    if (it != region_cache_.end()) return it->second;

    double w = width, h = height;
    double off = std::min(w, h) * 0.15;
    double x = w / 2, y = h / 2;
    if (region == "top-left")           { x = w/2 - off; y = h/2 - off; }
    else if (region == "center-left")   { x = w/2 - off; }
    else if (region == "bottom-left")   { x = w/2 - off; y = h/2 + off; }
    else if (region == "top-center")    { y = h/2 - off; }
    else if (region == "bottom-center") { y = h/2 + off; }
    else if (region == "top-right")     { x = w/2 + off; y = h/2 - off; }
    else if (region == "center-right")  { x = w/2 + off; }
    else if (region == "bottom-right")  { x = w/2 + off; y = h/2 + off; }
    return region_cache_.emplace(region, Vec2(x, y)).first->second;
}

const Color3* SimContext::emotion_color(const std::string& label) const {
    for (const std::string& variant : {label, to_lower(label), title_case(label)}) {
        auto it = emotion_colors.find(variant);
        if (it != emotion_colors.end()) return &it->second;
    }
    return nullptr;
}
