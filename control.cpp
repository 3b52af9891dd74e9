#include "control.h"

// ═══════════════════════════════════════════════════════════════
//  VISUAL PARAMETER FIELDS
// ═══════════════════════════════════════════════════════════════
static const std::pair<ParamField, const char*> PARAM_KEYS[] = {
    {ParamField::BlobStrength,     "blobStrength"},
    {ParamField::BlobSizeScale,    "blobSizeScale"},
    {ParamField::VolumeImpact,     "volumeImpact"},
    {ParamField::BlobSpreadField,  "blobSpreadField"},
    {ParamField::BreathSpeed,      "breathSpeed"},
    {ParamField::GradientStrength, "gradientStrength"},
    {ParamField::Blobiness,        "blobiness"},
    {ParamField::ColoredCharSize,  "coloredCircleCharSize"},
    {ParamField::RegularCharSize,  "regularAsciiCharSize"},
    {ParamField::BlobDensity,      "blobDensity"},
    {ParamField::MovementEasing,   "movementEasing"},
    {ParamField::GrowthPattern,    "blobGrowthPattern"},
    {ParamField::Blur,             "blur"},
    {ParamField::Humor,            "humor"},
    {ParamField::Shine,            "shine"},
    {ParamField::MinBlobSpacing,   "minBlobSpacing"},
    {ParamField::IsVisible,        "isVisible"},
    {ParamField::IsFlashing,       "isFlashing"},
};

const char* param_key(ParamField f) {
    for (const auto& k : PARAM_KEYS) if (k.first == f) return k.second;
    return "";
}

bool param_field_from_key(const std::string& key, ParamField& out) {
    for (const auto& k : PARAM_KEYS) {
        if (key == k.second) { out = k.first; return true; }
    }
    return false;
}

static bool is_number(const cv::FileNode& n) { return n.isInt() || n.isReal(); }

static bool read_number(const cv::FileNode& n, double& out) {
    if (!is_number(n)) return false;
    double v = (double)n;
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

// JSON true/false arrive as integers
static bool read_flag(const cv::FileNode& n, bool& out) {
    if (n.isInt()) { out = (int)n != 0; return true; }
    if (n.isString()) {
        std::string s = to_lower((std::string)n);
        if (s == "true") { out = true; return true; }
        if (s == "false") { out = false; return true; }
    }
    return false;
}

static bool is_home_region(const std::string& r) {
    return std::find(HOME_REGIONS.begin(), HOME_REGIONS.end(), r) != HOME_REGIONS.end();
}

static bool read_string_list(const cv::FileNode& n, std::vector<std::string>& out) {
    if (n.isString()) { out = {(std::string)n}; return true; }
    if (!n.isSeq()) return false;
    std::vector<std::string> v;
    for (auto it = n.begin(); it != n.end(); ++it) {
        if (!(*it).isString()) return false;
        v.push_back((std::string)*it);
    }
    out = v;
    return true;
}

static bool read_charset(const cv::FileNode& n, std::vector<std::string>& out) {
    if (n.isString()) { out = split_glyphs((std::string)n); return !out.empty(); }
    return read_string_list(n, out) && !out.empty();
}

static bool read_color(const cv::FileNode& n, Color3& out) {
    if (n.isString()) return parse_hex_color((std::string)n, out);
    if (!n.isSeq() || n.size() != 3) return false;
    Color3 c;
    for (int i = 0; i < 3; i++) {
        double v;
        if (!read_number(n[i], v)) return false;
        c[i] = (int)std::clamp(v, 0.0, 255.0);
    }
    out = c;
    return true;
}

bool read_param_override(const cv::FileNode& node, ParamField field, ParamOverride& out) {
    out.field = field;
    switch (field) {
        case ParamField::GrowthPattern:
            return node.isString() && parse_growth_pattern((std::string)node, out.growth);
        case ParamField::MinBlobSpacing: {
            if (node.isString()) { out.spacing = SpacingPref::named((std::string)node); return true; }
            double px;
            if (!read_number(node, px) || px <= 0) return false;
            out.spacing = SpacingPref::distance(px);
            return true;
        }
        case ParamField::IsVisible:
        case ParamField::IsFlashing:
            return read_flag(node, out.flag);
        case ParamField::GradientStrength:
        case ParamField::BlobSpreadField:
            return read_number(node, out.number) && out.number > 0;
        default:
            return read_number(node, out.number);
    }
}

void apply_override(VisualParams& v, const ParamOverride& o) {
    switch (o.field) {
        case ParamField::BlobStrength:     v.blob_strength = o.number; break;
        case ParamField::BlobSizeScale:    v.blob_size_scale = o.number; break;
        case ParamField::VolumeImpact:     v.volume_impact = o.number; break;
        case ParamField::BlobSpreadField:  v.blob_spread_field = o.number; break;
        case ParamField::BreathSpeed:      v.breath_speed = o.number; break;
        case ParamField::GradientStrength: v.gradient_strength = o.number; break;
        case ParamField::Blobiness:        v.blobiness = o.number; break;
        case ParamField::ColoredCharSize:  v.colored_char_size = o.number; break;
        case ParamField::RegularCharSize:  v.regular_char_size = o.number; break;
        case ParamField::BlobDensity:      v.blob_density = o.number; break;
        case ParamField::MovementEasing:   v.movement_easing = o.number; break;
        case ParamField::GrowthPattern:    v.growth_pattern = o.growth; break;
        case ParamField::Blur:             v.blur = std::clamp(o.number, 0.0, 10.0); break;
        case ParamField::Humor:            v.humor = std::clamp(o.number, 0.0, 10.0); break;
        case ParamField::Shine:            v.shine = std::clamp(o.number, 0.0, 10.0); break;
        case ParamField::MinBlobSpacing:   v.min_blob_spacing = o.spacing; break;
        case ParamField::IsVisible:        v.is_visible = o.flag; break;
        case ParamField::IsFlashing:       v.is_flashing = o.flag; break;
    }
}

int merge_visual_params(VisualParams& v, const cv::FileNode& map, const char* context) {
    if (!map.isMap()) return 0;
    int applied = 0;
    for (auto it = map.begin(); it != map.end(); ++it) {
        cv::FileNode n = *it;
        std::string key = n.name();
        ParamField f;
        if (!param_field_from_key(key, f)) {
            fprintf(stderr, "⚠ %s: unknown parameter '%s' ignored\n", context, key.c_str());
            continue;
        }
        ParamOverride o;
        if (!read_param_override(n, f, o)) {
            fprintf(stderr, "⚠ %s: bad value for '%s' ignored\n", context, key.c_str());
            continue;
        }
        apply_override(v, o);
        applied++;
    }
    return applied;
}

// ═══════════════════════════════════════════════════════════════
//  CONFIGURATION
// ═══════════════════════════════════════════════════════════════
VizConfig default_config() {
    VizConfig c;
    c.spacing_presets = SimContext().spacing_presets;
    return c;
}

static void read_palette(const cv::FileNode& n, std::map<std::string, Color3>& palette) {
    if (n.isMap()) {
        for (auto it = n.begin(); it != n.end(); ++it) {
            Color3 c;
            if (read_color(*it, c)) palette[(*it).name()] = c;
            else fprintf(stderr, "⚠ Config: bad color for emotion '%s'\n", (*it).name().c_str());
        }
    } else if (n.isSeq()) {
        for (auto it = n.begin(); it != n.end(); ++it) {
            cv::FileNode e = *it;
            Color3 c;
            if (e.isMap() && e["label"].isString() && read_color(e["color"], c))
                palette[(std::string)e["label"]] = c;
            else
                fprintf(stderr, "⚠ Config: malformed palette entry skipped\n");
        }
    }
}

static void read_config(const cv::FileNode& top, VizConfig& cfg) {
    cv::FileNode root = top["visualization_parameters"].isMap() ? top["visualization_parameters"] : top;
    double v;

    cv::FileNode canvas = root["canvas"];
    if (canvas.isMap()) {
        if (!canvas["background_color"].empty() && !read_color(canvas["background_color"], cfg.background))
            fprintf(stderr, "⚠ Config: bad canvas.background_color, keeping default\n");
        if (!canvas["glyph_color"].empty() && !read_color(canvas["glyph_color"], cfg.glyph_color))
            fprintf(stderr, "⚠ Config: bad canvas.glyph_color, keeping default\n");
    }

    cv::FileNode grid = root["grid"];
    if (grid.isMap()) {
        if (read_number(grid["default_size"], v))
            cfg.grid_size = (int)std::lround(std::clamp(v, (double)MIN_GRID_SIZE, (double)MAX_GRID_SIZE));
        if (read_number(grid["ascii_threshold"], v) && v > 0) cfg.draw_threshold = v;
        if (read_number(grid["final_draw_threshold"], v) && v > 0) cfg.final_draw_threshold = v;
    }

    cv::FileNode blobs = root["blobs"];
    if (blobs.isMap()) {
        if (read_number(blobs["count"], v)) cfg.blob_count = (int)std::clamp(v, (double)DEFAULT_BLOB_COUNT, (double)MAX_BLOB_COUNT);
        std::vector<std::string> regions;
        if (read_string_list(blobs["default_home_regions"], regions) && !regions.empty()) {
            if (std::all_of(regions.begin(), regions.end(), is_home_region)) cfg.home_regions = regions;
            else fprintf(stderr, "⚠ Config: unknown home region in blobs.default_home_regions, keeping default\n");
        }
        cv::FileNode presets = blobs["spacing_presets"];
        if (presets.isMap()) {
            for (auto it = presets.begin(); it != presets.end(); ++it) {
                std::string name = (*it).name();
                std::replace(name.begin(), name.end(), '_', ' ');
                if (read_number(*it, v) && v > 0) cfg.spacing_presets[to_lower(name)] = v;
                else fprintf(stderr, "⚠ Config: bad spacing preset '%s' ignored\n", name.c_str());
            }
        }
        merge_visual_params(cfg.default_visuals, blobs["default_visuals"], "Config");
    }

    cv::FileNode conn = root["connections"];
    if (conn.isMap()) read_flag(conn["enabled"], cfg.connect_blobs);

    cv::FileNode colors = root["colors"];
    if (colors.isMap()) read_palette(colors["emotion_palette"], cfg.emotion_palette);

    cv::FileNode motion = root["motion"];
    if (motion.isMap()) {
        if (read_number(motion["transition_speed"], v) && v > 0) cfg.transition_speed = v;
        if (read_number(motion["param_smoothing"], v) && v > 0 && v <= 1) cfg.param_smoothing = v;
    }
}

static bool load_config_from(const std::string& source, int flags, const char* label, VizConfig& cfg) {
    try {
        cv::FileStorage fs(source, cv::FileStorage::READ | flags);
        if (!fs.isOpened()) {
            fprintf(stderr, "⚠ Could not open config %s, using defaults\n", label);
            return false;
        }
        VizConfig tmp = cfg;
        read_config(fs.root(), tmp);
        cfg = tmp;
        return true;
    } catch (const cv::Exception& e) {
        fprintf(stderr, "⚠ Config %s unreadable: %s\n", label, e.what());
        return false;
    }
}

bool load_config(const std::string& path, VizConfig& cfg) {
    return load_config_from(path, 0, path.c_str(), cfg);
}

bool load_config_string(const std::string& text, VizConfig& cfg) {
    return load_config_from(text, cv::FileStorage::MEMORY, "<memory>", cfg);
}

void apply_config(const VizConfig& cfg, SimContext& ctx) {
    ctx.background = cfg.background;
    ctx.glyph_color = cfg.glyph_color;
    ctx.grid_size = cfg.grid_size;
    ctx.draw_threshold = cfg.draw_threshold;
    ctx.final_draw_threshold = cfg.final_draw_threshold;
    for (const auto& p : cfg.spacing_presets) ctx.spacing_presets[p.first] = p.second;
    ctx.connect_blobs = cfg.connect_blobs;
    ctx.emotion_colors = cfg.emotion_palette;
    ctx.transition_speed = cfg.transition_speed;
    ctx.param_smoothing = cfg.param_smoothing;
}

// ═══════════════════════════════════════════════════════════════
//  SEGMENT METADATA
// ═══════════════════════════════════════════════════════════════
bool parse_segment(const cv::FileNode& node, SegmentMeta& out) {
    if (!node.isMap()) {
        fprintf(stderr, "⚠ Segment is not an object, skipped\n");
        return false;
    }
    SegmentMeta m;
    for (auto it = node.begin(); it != node.end(); ++it) {
        cv::FileNode n = *it;
        std::string key = n.name();
        bool ok = true;
        double v = 0;
        bool b = false;

        if (key == "file") {
            ok = n.isString();
            if (ok) m.file = (std::string)n;
        } else if (key == "speaker") {
            ok = read_number(n, v) && v >= 0 && v < MAX_BLOB_COUNT;
            if (ok) m.speaker = (int)v;
        } else if (key == "duration") {
            ok = read_number(n, v) && v > 0;
            if (ok) m.duration = v;
        } else if (key == "emotions") {
            ok = read_string_list(n, m.emotions);
        } else if (key == "emotionDistribution") {
            ok = n.isMap();
            for (auto d = n.begin(); ok && d != n.end(); ++d) {
                ok = read_number(*d, v);
                if (ok) m.distribution.push_back({(*d).name(), v});
            }
            if (!ok) m.distribution.clear();
        } else if (key == "blobsVisible") {
            ok = read_flag(n, b);
            if (ok) m.blobs_visible = b;
        } else if (key == "flash") {
            ok = read_flag(n, b);
            if (ok) m.flash = b;
        } else if (key == "connectBlobs") {
            ok = read_flag(n, b);
            if (ok) m.connect_blobs = b;
        } else if (key == "isDrasticMovement") {
            ok = read_flag(n, m.drastic_movement);
        } else if (key == "blobHomeRegion") {
            ok = n.isString() && is_home_region((std::string)n);
            if (ok) m.home_region = (std::string)n;
        } else if (key == "gridResolution") {
            ok = read_number(n, v);
            if (ok) m.grid_resolution = (int)std::lround(std::clamp(v, (double)MIN_GRID_SIZE, (double)MAX_GRID_SIZE));
        } else if (key == "circlesPerEmotion") {
            ok = read_number(n, v) && v >= 0 && v <= MAX_HIGHLIGHTS;
            if (ok) m.circles_per_emotion = (int)v;
        } else if (key == "emotionCharAmount") {
            ok = read_number(n, v);
            if (ok) m.emotion_char_amount = std::clamp(v, 0.0, 200.0);
        } else if (key == "regularCharset") {
            ok = read_charset(n, m.regular_charset);
        } else if (key == "colorCharset") {
            ok = read_charset(n, m.color_charset);
        } else {
            ParamField f;
            if (!param_field_from_key(key, f)) {
                fprintf(stderr, "⚠ Segment %s: unknown key '%s' ignored\n", m.file.c_str(), key.c_str());
                continue;
            }
            ParamOverride o;
            ok = read_param_override(n, f, o);
            if (ok) m.overrides.push_back(o);
        }
        if (!ok) fprintf(stderr, "⚠ Segment %s: bad value for '%s' ignored\n", m.file.c_str(), key.c_str());
    }
    out = m;
    return true;
}

bool parse_segment_string(const std::string& text, SegmentMeta& out) {
    try {
        cv::FileStorage fs(text, cv::FileStorage::READ | cv::FileStorage::MEMORY);
        if (!fs.isOpened()) return false;
        return parse_segment(fs.root(), out);
    } catch (const cv::Exception& e) {
        fprintf(stderr, "⚠ Segment unreadable: %s\n", e.what());
        return false;
    }
}

static bool read_conversation(cv::FileStorage& fs, std::vector<SegmentMeta>& out) {
    cv::FileNode segs = fs["segments"];
    if (!segs.isSeq()) {
        fprintf(stderr, "⚠ Conversation has no 'segments' list\n");
        return false;
    }
    std::vector<SegmentMeta> v;
    for (auto it = segs.begin(); it != segs.end(); ++it) {
        SegmentMeta m;
        if (parse_segment(*it, m)) v.push_back(m);
    }
    out = v;
    return !out.empty();
}

bool load_conversation(const std::string& path, std::vector<SegmentMeta>& out) {
    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            fprintf(stderr, "⚠ Could not open conversation %s\n", path.c_str());
            return false;
        }
        return read_conversation(fs, out);
    } catch (const cv::Exception& e) {
        fprintf(stderr, "⚠ Conversation %s unreadable: %s\n", path.c_str(), e.what());
        return false;
    }
}

bool load_conversation_string(const std::string& text, std::vector<SegmentMeta>& out) {
    try {
        cv::FileStorage fs(text, cv::FileStorage::READ | cv::FileStorage::MEMORY);
        if (!fs.isOpened()) return false;
        return read_conversation(fs, out);
    } catch (const cv::Exception& e) {
        fprintf(stderr, "⚠ Conversation unreadable: %s\n", e.what());
        return false;
    }
}

// ═══════════════════════════════════════════════════════════════
//  COMMANDS & EVENTS
// ═══════════════════════════════════════════════════════════════
Command Command::set_segment(const SegmentMeta& s) { Command c{CommandType::SetSegment}; c.segment = s; return c; }
Command Command::set_loop(bool on) { Command c{CommandType::SetLoop}; c.flag = on; return c; }
Command Command::pause() { return Command{CommandType::Pause}; }
Command Command::resume() { return Command{CommandType::Resume}; }
Command Command::optimize_layout(const std::string& layout, bool reduce_quality) {
    Command c{CommandType::OptimizeLayout};
    c.layout = layout;
    c.flag = reduce_quality;
    return c;
}
Command Command::update_emotion_colors(const std::map<std::string, Color3>& colors) {
    Command c{CommandType::UpdateEmotionColors};
    c.colors = colors;
    return c;
}
Command Command::set_debug_overlay(bool on) { Command c{CommandType::SetDebugOverlay}; c.flag = on; return c; }
Command Command::segment_ended() { return Command{CommandType::SegmentEnded}; }

int SegmentEvents::subscribe(Handler h) {
    int id = next_id_++;
    handlers_[id] = std::move(h);
    return id;
}

void SegmentEvents::unsubscribe(int id) { handlers_.erase(id); }

void SegmentEvents::publish(const SegmentEvent& e) const {
    // handlers may post commands but never resubscribe during delivery
    for (const auto& h : handlers_) h.second(e);
}

// ═══════════════════════════════════════════════════════════════
//  VISUALIZER
// ═══════════════════════════════════════════════════════════════
LayoutProfile layout_profile(const std::string& layout, bool reduce_quality, int default_grid) {
    if (layout == "emotions") return reduce_quality ? LayoutProfile{15, 5} : LayoutProfile{50, 3};
    if (layout == "people") return {40, 2};
    return {default_grid, 1};
}

Visualizer::Visualizer(const VizConfig& cfg) { reset(cfg); }

void Visualizer::reset(const VizConfig& cfg) {
    config_ = cfg;
    apply_config(cfg, ctx);
    blobs.clear();
    highlights.clear();
    pending_.clear();
    levels_.clear();
    segment_.reset();
    placement_grid_ = 0;

    int count = std::max(DEFAULT_BLOB_COUNT, cfg.blob_count);
    blobs.reserve(count);
    for (int i = 0; i < count; i++) {
        std::string region = i < (int)cfg.home_regions.size() ? cfg.home_regions[i] : "center";
        blobs.emplace_back(i, region, ctx.region_center(region), cfg.default_visuals);
        spacing.update_home(blobs.back(), ctx);
    }
}

void Visualizer::resize(int w, int h) { ctx.resize(w, h); }

void Visualizer::post(const Command& c) { pending_.push_back(c); }

void Visualizer::set_audio_level(int blob_id, double level) { levels_[blob_id] = level; }

int Visualizer::effective_grid() const {
    if (segment_ && segment_->grid_resolution) return *segment_->grid_resolution;
    return std::clamp(ctx.grid_size, MIN_LAYOUT_GRID_SIZE, MAX_GRID_SIZE);
}

void Visualizer::drain_commands() {
    std::vector<Command> cmds;
    cmds.swap(pending_);
    for (const Command& c : cmds) handle(c);
}

void Visualizer::handle(const Command& c) {
    switch (c.type) {
        case CommandType::SetSegment:          apply_segment(c.segment); break;
        case CommandType::SetLoop:             ctx.loop_segment = c.flag; break;
        case CommandType::Pause:               ctx.set_paused(true); break;
        case CommandType::Resume:              ctx.set_paused(false); break;
        case CommandType::OptimizeLayout:      optimize_for_layout(c.layout, c.flag); break;
        case CommandType::UpdateEmotionColors: update_emotion_colors(c.colors); break;
        case CommandType::SetDebugOverlay:     ctx.debug_overlay = c.flag; break;
        case CommandType::SegmentEnded:
            events.publish({segment_ ? segment_->file : std::string(), ctx.frame_count()});
            break;
    }
}

std::vector<Color3> Visualizer::colors_for(const std::vector<std::string>& emotions, bool report) const {
    std::vector<Color3> colors;
    for (size_t i = 0; i < emotions.size(); i++) {
        const Color3* c = ctx.emotion_color(emotions[i]);
        if (!c) c = ctx.emotion_color(canonical_emotion(emotions[i]));
        if (c) {
            colors.push_back(*c);
        } else {
            if (report) fprintf(stderr, "⚠ No palette color for '%s', using fallback\n", emotions[i].c_str());
            colors.push_back(FALLBACK_EMOTION_COLORS[i % FALLBACK_EMOTION_COLORS.size()]);
        }
    }
    return colors;
}

void Visualizer::apply_segment(const SegmentMeta& meta) {
    SegmentMeta m = meta;
    if (m.speaker >= (int)blobs.size()) {
        fprintf(stderr, "⚠ Segment %s: speaker %d out of range, using 0\n", m.file.c_str(), m.speaker);
        m.speaker = 0;
    }
    segment_ = m;
    segment_serial_++;

    VisualParams v = config_.default_visuals;
    for (const ParamOverride& o : m.overrides) apply_override(v, o);
    v.is_visible = m.blobs_visible.value_or(true);
    v.is_flashing = m.flash.value_or(false);
    if (m.drastic_movement) v.movement_easing = 0.1;

    // spacing is the distance between the pair, so idle blobs share it
    VisualParams idle = idle_visuals(config_.default_visuals);
    idle.min_blob_spacing = v.min_blob_spacing;

    for (Blob& b : blobs) {
        if (b.id != m.speaker) {
            b.set_target_visuals(idle);
            b.set_emotions({}, {});
            highlights.clear(b.id);
            continue;
        }
        b.set_target_visuals(v);
        b.set_emotions(m.emotions, colors_for(m.emotions, true));

        if (!m.home_region.empty()) {
            b.home_region = m.home_region;
            spacing.update_home(b, ctx);
            b.teleport(ctx.region_center(m.home_region));
        }
    }

    if (m.connect_blobs) ctx.connect_blobs = *m.connect_blobs;
    compositor.regular_charset = m.regular_charset;
    compositor.color_charset = m.color_charset;
    refresh_highlights();
}

void Visualizer::refresh_highlights() {
    if (!segment_) return;
    int grid = effective_grid();
    placement_grid_ = grid;
    const Blob& speaker = blobs[segment_->speaker];

    PlacementRequest req;
    req.emotions = segment_->emotions;
    req.distribution = segment_->distribution;
    req.circles_per_emotion = segment_->circles_per_emotion;
    req.emotion_char_amount = segment_->emotion_char_amount;
    req.grid_size = grid;
    highlights.replace(speaker.id, highlights.place(ctx, speaker, req));
}

void Visualizer::optimize_for_layout(const std::string& layout, bool reduce_quality) {
    LayoutProfile p = layout_profile(layout, reduce_quality, config_.grid_size);
    ctx.grid_size = p.grid_size;
    ctx.frame_skip = p.frame_skip;
}

void Visualizer::update_emotion_colors(const std::map<std::string, Color3>& colors) {
    for (const auto& c : colors) ctx.emotion_colors[c.first] = c.second;
    for (Blob& b : blobs) {
        if (!b.current_emotions.empty()) b.set_emotions(b.current_emotions, colors_for(b.current_emotions, false));
    }
}

bool Visualizer::tick(Surface* surface) {
    drain_commands();

    if (!ctx.paused()) {
        for (Blob& b : blobs) {
            auto it = levels_.find(b.id);
            b.set_audio_level(it != levels_.end() ? it->second : 0.0);
        }
    }
    for (Blob& b : blobs) spacing.update_home(b, ctx);
    for (Blob& b : blobs) motion.step(b, blobs, ctx);

    int grid = effective_grid();
    if (segment_ && grid != placement_grid_) refresh_highlights();

    bool rendered = false;
    if (ctx.should_render()) {
        field.sample(ctx, blobs, grid);
        if (surface) compositor.render(ctx, blobs, field, highlights, *surface);
        rendered = true;
    }
    ctx.advance_frame();
    return rendered;
}

// ═══════════════════════════════════════════════════════════════
//  CONVERSATION
// ═══════════════════════════════════════════════════════════════
Conversation::Conversation(Visualizer& viz, std::vector<SegmentMeta> segments)
    : viz_(viz), segments_(std::move(segments)) {
    subscription_ = viz_.events.subscribe([this](const SegmentEvent& e) { on_segment_ended(e); });
}

Conversation::~Conversation() { viz_.events.unsubscribe(subscription_); }

void Conversation::start(size_t index) {
    if (segments_.empty()) {
        fprintf(stderr, "⚠ Conversation is empty\n");
        return;
    }
    index_ = index % segments_.size();
    viz_.post(Command::set_segment(segments_[index_]));
}

const SegmentMeta* Conversation::current_segment() const {
    return segments_.empty() ? nullptr : &segments_[index_];
}

void Conversation::on_segment_ended(const SegmentEvent&) {
    if (segments_.empty()) return;
    if (!viz_.ctx.loop_segment) index_ = (index_ + 1) % segments_.size();
    viz_.post(Command::set_segment(segments_[index_]));
}
