#pragma once
#include "emoblob.h"
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>

std::pair<int,int> get_terminal_size();

// ═══════════════════════════════════════════════════════════════
//  TERMINAL SURFACE
// ═══════════════════════════════════════════════════════════════
// Maps canvas pixels onto a cols x rows character grid and writes the
// frame with 24-bit ANSI escapes.
class TerminalSurface : public Surface {
public:
    bool write_to_stdout = true;

    TerminalSurface(int cols, int rows);
    void set_size(int cols, int rows);
    int cols() const { return cols_; }
    int rows() const { return rows_; }

    void begin_frame(int w, int h, const Color3& bg) override;
    void draw_glyph(const Glyph& g) override;
    void draw_line(const Vec2& a, const Vec2& b, const Color3& c, int alpha, double weight) override;
    void draw_circle(const Vec2& center, double radius, const Color3& c, int alpha, bool filled) override;
    void draw_text(const std::string& text, const Vec2& pos, const Color3& c, int alpha, double size) override;
    void end_frame() override;

    const std::string& cell(int col, int row) const { return cells_[row * cols_ + col].ch; }
    Color3 cell_color(int col, int row) const { return cells_[row * cols_ + col].color; }
    const std::string& frame_text() const { return output_buf_; }
private:
    struct Cell { std::string ch; Color3 color; bool set; };
    int cols_, rows_;
    int width_ = 1, height_ = 1;
    Color3 bg_{0,0,0};
    std::vector<Cell> cells_;
    std::string output_buf_;

    bool to_cell(const Vec2& p, int& col, int& row) const;
    void put(int col, int row, const std::string& ch, const Color3& c, int alpha, bool overwrite);
};

// ═══════════════════════════════════════════════════════════════
//  IMAGE SURFACE
// ═══════════════════════════════════════════════════════════════
class ImageSurface : public Surface {
public:
    cv::Mat canvas;   // CV_8UC3, BGR

    void begin_frame(int w, int h, const Color3& bg) override;
    void draw_glyph(const Glyph& g) override;
    void draw_line(const Vec2& a, const Vec2& b, const Color3& c, int alpha, double weight) override;
    void draw_circle(const Vec2& center, double radius, const Color3& c, int alpha, bool filled) override;
    void draw_text(const std::string& text, const Vec2& pos, const Color3& c, int alpha, double size) override;
    void end_frame() override;

    bool save(const std::string& path) const;
    bool start_recording(const std::string& path, double fps, int w, int h);
    void stop_recording();
    bool recording() const { return writer_.isOpened(); }
private:
    Color3 bg_{0,0,0};
    cv::VideoWriter writer_;
    cv::Scalar blend(const Color3& c, int alpha) const;
};

// ═══════════════════════════════════════════════════════════════
//  SURFACE GROUP
// ═══════════════════════════════════════════════════════════════
// Forwards every draw call to several surfaces.
class SurfaceGroup : public Surface {
public:
    std::vector<Surface*> targets;

    void begin_frame(int w, int h, const Color3& bg) override { for (auto* s : targets) s->begin_frame(w, h, bg); }
    void draw_glyph(const Glyph& g) override { for (auto* s : targets) s->draw_glyph(g); }
    void draw_line(const Vec2& a, const Vec2& b, const Color3& c, int alpha, double weight) override {
        for (auto* s : targets) s->draw_line(a, b, c, alpha, weight);
    }
    void draw_circle(const Vec2& center, double radius, const Color3& c, int alpha, bool filled) override {
        for (auto* s : targets) s->draw_circle(center, radius, c, alpha, filled);
    }
    void draw_text(const std::string& text, const Vec2& pos, const Color3& c, int alpha, double size) override {
        for (auto* s : targets) s->draw_text(text, pos, c, alpha, size);
    }
    void end_frame() override { for (auto* s : targets) s->end_frame(); }
};
