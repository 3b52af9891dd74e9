#pragma once
#include "emoblob.h"

// Captures draw calls so tests can inspect a composed frame.
struct RecordingSurface : Surface {
    int begun = 0, ended = 0;
    std::vector<Glyph> glyphs;
    std::vector<std::pair<Vec2,Vec2>> lines;
    std::vector<std::pair<Vec2,double>> circles;
    std::vector<std::string> texts;

    void begin_frame(int, int, const Color3&) override { begun++; glyphs.clear(); lines.clear(); circles.clear(); texts.clear(); }
    void draw_glyph(const Glyph& g) override { glyphs.push_back(g); }
    void draw_line(const Vec2& a, const Vec2& b, const Color3&, int, double) override { lines.push_back({a, b}); }
    void draw_circle(const Vec2& c, double r, const Color3&, int, bool) override { circles.push_back({c, r}); }
    void draw_text(const std::string& t, const Vec2&, const Color3&, int, double) override { texts.push_back(t); }
    void end_frame() override { ended++; }
};
