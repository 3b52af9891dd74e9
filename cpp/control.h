#pragma once
#include "emoblob.h"
#include <functional>

// ═══════════════════════════════════════════════════════════════
//  VISUAL PARAMETER FIELDS
// ═══════════════════════════════════════════════════════════════
enum class ParamField {
    BlobStrength, BlobSizeScale, VolumeImpact, BlobSpreadField, BreathSpeed,
    GradientStrength, Blobiness, ColoredCharSize, RegularCharSize, BlobDensity,
    MovementEasing, GrowthPattern, Blur, Humor, Shine, MinBlobSpacing,
    IsVisible, IsFlashing
};

const char* param_key(ParamField f);
bool param_field_from_key(const std::string& key, ParamField& out);

// Only the member matching the field's kind is meaningful.
struct ParamOverride {
    ParamField field;
    double number = 0.0;
    bool flag = false;
    GrowthPattern growth = GrowthPattern::Linear;
    SpacingPref spacing;
};
using ParamOverrides = std::vector<ParamOverride>;

bool read_param_override(const cv::FileNode& node, ParamField field, ParamOverride& out);
void apply_override(VisualParams& v, const ParamOverride& o);
// Applies every recognised key of a map node; unknown keys are reported and skipped.
int merge_visual_params(VisualParams& v, const cv::FileNode& map, const char* context);

// ═══════════════════════════════════════════════════════════════
//  CONFIGURATION
// ═══════════════════════════════════════════════════════════════
struct VizConfig {
    Color3 background{247,249,243};
    Color3 glyph_color{0,0,0};
    int grid_size = DEFAULT_GRID_SIZE;
    double draw_threshold = DRAW_THRESHOLD;
    double final_draw_threshold = FINAL_DRAW_THRESHOLD;
    int blob_count = DEFAULT_BLOB_COUNT;
    std::vector<std::string> home_regions{"center-left", "center-right"};
    std::map<std::string, double> spacing_presets;
    VisualParams default_visuals;
    bool connect_blobs = false;
    std::map<std::string, Color3> emotion_palette;
    double transition_speed = TRANSITION_SPEED;
    double param_smoothing = PARAM_SMOOTHING;
};

VizConfig default_config();
bool load_config(const std::string& path, VizConfig& cfg);
bool load_config_string(const std::string& text, VizConfig& cfg);
void apply_config(const VizConfig& cfg, SimContext& ctx);

// ═══════════════════════════════════════════════════════════════
//  SEGMENT METADATA
// ═══════════════════════════════════════════════════════════════
struct SegmentMeta {
    std::string file;
    int speaker = 0;
    double duration = 4.0;
    std::vector<std::string> emotions;
    std::vector<std::pair<std::string,double>> distribution;
    ParamOverrides overrides;
    std::optional<bool> blobs_visible;
    std::optional<bool> flash;
    std::optional<bool> connect_blobs;
    bool drastic_movement = false;
    std::string home_region;
    std::optional<int> grid_resolution;
    int circles_per_emotion = DEFAULT_CIRCLES_PER_EMOTION;
    double emotion_char_amount = DEFAULT_EMOTION_CHAR_AMOUNT;
    std::vector<std::string> regular_charset;
    std::vector<std::string> color_charset;
};

bool parse_segment(const cv::FileNode& node, SegmentMeta& out);
bool parse_segment_string(const std::string& text, SegmentMeta& out);
bool load_conversation(const std::string& path, std::vector<SegmentMeta>& out);
bool load_conversation_string(const std::string& text, std::vector<SegmentMeta>& out);

// ═══════════════════════════════════════════════════════════════
//  COMMANDS & EVENTS
// ═══════════════════════════════════════════════════════════════
enum class CommandType {
    SetSegment, SetLoop, Pause, Resume, OptimizeLayout,
    UpdateEmotionColors, SetDebugOverlay, SegmentEnded
};

struct Command {
    CommandType type;
    SegmentMeta segment;
    bool flag = false;
    std::string layout;
    std::map<std::string, Color3> colors;

    static Command set_segment(const SegmentMeta& s);
    static Command set_loop(bool on);
    static Command pause();
    static Command resume();
    static Command optimize_layout(const std::string& layout, bool reduce_quality = false);
    static Command update_emotion_colors(const std::map<std::string, Color3>& colors);
    static Command set_debug_overlay(bool on);
    static Command segment_ended();
};

struct SegmentEvent { std::string file; long frame; };

// "Segment ended" channel between playback and segment selection.
class SegmentEvents {
public:
    using Handler = std::function<void(const SegmentEvent&)>;
    int subscribe(Handler h);
    void unsubscribe(int id);
    void publish(const SegmentEvent& e) const;
    size_t subscribers() const { return handlers_.size(); }
private:
    std::map<int, Handler> handlers_;
    int next_id_ = 0;
};

// ═══════════════════════════════════════════════════════════════
//  VISUALIZER
// ═══════════════════════════════════════════════════════════════
struct LayoutProfile { int grid_size; int frame_skip; };

LayoutProfile layout_profile(const std::string& layout, bool reduce_quality, int default_grid = DEFAULT_GRID_SIZE);

class Visualizer {
public:
    SimContext ctx;
    std::vector<Blob> blobs;
    SpacingResolver spacing;
    MotionSimulator motion;
    FieldSampler field;
    HighlightPlacer highlights;
    Compositor compositor;
    SegmentEvents events;

    explicit Visualizer(const VizConfig& cfg = default_config());
    void reset(const VizConfig& cfg);
    void resize(int w, int h);

    void post(const Command& c);
    void set_audio_level(int blob_id, double level);
    bool tick(Surface* surface);

    void apply_segment(const SegmentMeta& meta);
    void optimize_for_layout(const std::string& layout, bool reduce_quality);
    void update_emotion_colors(const std::map<std::string, Color3>& colors);

    int effective_grid() const;
    int active_speaker() const { return segment_ ? segment_->speaker : 0; }
    const SegmentMeta* current_segment() const { return segment_ ? &*segment_ : nullptr; }
    long segment_serial() const { return segment_serial_; }
    size_t pending() const { return pending_.size(); }
    const VizConfig& config() const { return config_; }
private:
    VizConfig config_;
    std::vector<Command> pending_;
    std::map<int, double> levels_;
    std::optional<SegmentMeta> segment_;
    long segment_serial_ = 0;
    int placement_grid_ = 0;

    void drain_commands();
    void handle(const Command& c);
    void refresh_highlights();
    std::vector<Color3> colors_for(const std::vector<std::string>& emotions, bool report) const;
};

// ═══════════════════════════════════════════════════════════════
//  CONVERSATION
// ═══════════════════════════════════════════════════════════════
// Playlist of segments; advances (or replays in loop mode) on "segment ended".
class Conversation {
public:
    Conversation(Visualizer& viz, std::vector<SegmentMeta> segments);
    ~Conversation();
    Conversation(const Conversation&) = delete;
    Conversation& operator=(const Conversation&) = delete;

    void start(size_t index = 0);
    size_t current() const { return index_; }
    size_t size() const { return segments_.size(); }
    const SegmentMeta* current_segment() const;
private:
    void on_segment_ended(const SegmentEvent& e);
    Visualizer& viz_;
    std::vector<SegmentMeta> segments_;
    size_t index_ = 0;
    int subscription_ = -1;
};
