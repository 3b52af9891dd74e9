#include "io.h"
#include <sys/ioctl.h>
#include <unistd.h>

std::pair<int,int> get_terminal_size() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) return {ws.ws_col, ws.ws_row};
    return {100, 50};
}

static Color3 over(const Color3& c, const Color3& bg, int alpha) {
    return lerp_color(bg, c, std::clamp(alpha, 0, 255) / 255.0);
}

// ═══════════════════════════════════════════════════════════════
//  TERMINAL SURFACE
// ═══════════════════════════════════════════════════════════════
TerminalSurface::TerminalSurface(int cols, int rows) { set_size(cols, rows); }

void TerminalSurface::set_size(int cols, int rows) {
    cols_ = std::max(1, cols);
    rows_ = std::max(1, rows);
    cells_.assign(cols_ * rows_, Cell{" ", bg_, false});
}

void TerminalSurface::begin_frame(int w, int h, const Color3& bg) {
    width_ = std::max(1, w);
    height_ = std::max(1, h);
    bg_ = bg;
    cells_.assign(cols_ * rows_, Cell{" ", bg_, false});
}

bool TerminalSurface::to_cell(const Vec2& p, int& col, int& row) const {
    if (!is_finite(p)) return false;
    col = (int)std::floor(p.x / width_ * cols_);
    row = (int)std::floor(p.y / height_ * rows_);
    return col >= 0 && col < cols_ && row >= 0 && row < rows_;
}

void TerminalSurface::put(int col, int row, const std::string& ch, const Color3& c, int alpha, bool overwrite) {
    Cell& cell = cells_[row * cols_ + col];
    if (cell.set && !overwrite) return;
    cell = {ch, over(c, bg_, alpha), true};
}

void TerminalSurface::draw_glyph(const Glyph& g) {
    int col, row;
    if (to_cell(Vec2(g.x, g.y), col, row)) put(col, row, g.ch, g.color, g.alpha, true);
}

void TerminalSurface::draw_line(const Vec2& a, const Vec2& b, const Color3& c, int alpha, double) {
    double cells = std::max(std::fabs(b.x - a.x) / width_ * cols_, std::fabs(b.y - a.y) / height_ * rows_);
    int steps = std::max(1, (int)std::ceil(cells));
    for (int i = 0; i <= steps; i++) {
        double t = (double)i / steps;
        int col, row;
        if (to_cell(a + (b - a) * t, col, row)) put(col, row, "·", c, alpha, false);
    }
}

void TerminalSurface::draw_circle(const Vec2& center, double radius, const Color3& c, int alpha, bool filled) {
    int col, row;
    if (filled && radius * cols_ / width_ < 1.0) {
        if (to_cell(center, col, row)) put(col, row, "•", c, alpha, false);
        return;
    }
    int steps = std::max(12, (int)(2 * CV_PI * radius / width_ * cols_ * 2));
    for (int i = 0; i < steps; i++) {
        double a = 2 * CV_PI * i / steps;
        if (to_cell(center + Vec2(std::cos(a), std::sin(a)) * radius, col, row)) put(col, row, "·", c, alpha, false);
    }
}

void TerminalSurface::draw_text(const std::string& text, const Vec2& pos, const Color3& c, int alpha, double) {
    int col, row;
    std::vector<std::string> chars = split_glyphs(text);
    if (!to_cell(pos, col, row)) return;
    col -= (int)chars.size() / 2;
    for (size_t i = 0; i < chars.size(); i++) {
        int x = col + (int)i;
        if (x >= 0 && x < cols_) put(x, row, chars[i], c, alpha, true);
    }
}

void TerminalSurface::end_frame() {
    output_buf_.clear();
    char ansi_buf[64];
    int len = snprintf(ansi_buf, sizeof(ansi_buf), "\033[48;2;%d;%d;%dm", bg_[0], bg_[1], bg_[2]);
    output_buf_.append(ansi_buf, len);

    Color3 last{-1,-1,-1};
    for (int y = 0; y < rows_; y++) {
        for (int x = 0; x < cols_; x++) {
            const Cell& cell = cells_[y * cols_ + x];
            if (cell.set && cell.color != last) {
                len = snprintf(ansi_buf, sizeof(ansi_buf), "\033[38;2;%d;%d;%dm", cell.color[0], cell.color[1], cell.color[2]);
                output_buf_.append(ansi_buf, len);
                last = cell.color;
            }
            output_buf_.append(cell.ch);
        }
        if (y < rows_ - 1) output_buf_.push_back('\n');
    }

    if (!write_to_stdout) return;
    printf("\033[H");
    fwrite(output_buf_.data(), 1, output_buf_.size(), stdout);
    printf("\033[0m");
    fflush(stdout);
}

// ═══════════════════════════════════════════════════════════════
//  IMAGE SURFACE
// ═══════════════════════════════════════════════════════════════
cv::Scalar ImageSurface::blend(const Color3& c, int alpha) const {
    Color3 o = over(c, bg_, alpha);
    return cv::Scalar(o[2], o[1], o[0]);
}

void ImageSurface::begin_frame(int w, int h, const Color3& bg) {
    bg_ = bg;
    canvas.create(std::max(1, h), std::max(1, w), CV_8UC3);
    canvas.setTo(cv::Scalar(bg[2], bg[1], bg[0]));
}

void ImageSurface::draw_glyph(const Glyph& g) {
    static const std::map<std::string, double> SHADES = {{"░", 0.25}, {"▒", 0.5}, {"▓", 0.75}, {"█", 1.0}};
    cv::Point c((int)std::lround(g.x), (int)std::lround(g.y));
    double size = std::max(1.0, g.size);

    auto shade = SHADES.find(g.ch);
    if (shade != SHADES.end()) {
        int half = std::max(1, (int)std::lround(size / 2));
        cv::Rect r(c.x - half, c.y - half, half * 2, half * 2);
        cv::rectangle(canvas, r & cv::Rect(0, 0, canvas.cols, canvas.rows), blend(g.color, (int)(g.alpha * shade->second)), cv::FILLED);
        return;
    }
    bool ascii = g.ch.size() == 1 && g.ch[0] > 32 && g.ch[0] < 127;
    if (ascii) {
        double scale = size / 30.0;
        int base = 0;
        cv::Size ts = cv::getTextSize(g.ch, cv::FONT_HERSHEY_SIMPLEX, scale, 1, &base);
        cv::putText(canvas, g.ch, cv::Point(c.x - ts.width / 2, c.y + ts.height / 2), cv::FONT_HERSHEY_SIMPLEX,
                    scale, blend(g.color, g.alpha), 1, cv::LINE_AA);
    } else {
        cv::circle(canvas, c, std::max(1, (int)std::lround(size * 0.2)), blend(g.color, g.alpha), cv::FILLED, cv::LINE_AA);
    }
}

void ImageSurface::draw_line(const Vec2& a, const Vec2& b, const Color3& c, int alpha, double weight) {
    if (!is_finite(a) || !is_finite(b)) return;
    cv::line(canvas, cv::Point(a), cv::Point(b), blend(c, alpha), std::max(1, (int)std::lround(weight)), cv::LINE_AA);
}

void ImageSurface::draw_circle(const Vec2& center, double radius, const Color3& c, int alpha, bool filled) {
    if (!is_finite(center)) return;
    cv::circle(canvas, cv::Point(center), std::max(1, (int)std::lround(radius)), blend(c, alpha),
               filled ? cv::FILLED : 2, cv::LINE_AA);
}

void ImageSurface::draw_text(const std::string& text, const Vec2& pos, const Color3& c, int alpha, double size) {
    double scale = size / 24.0;
    int base = 0;
    cv::Size ts = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, scale, 1, &base);
    cv::putText(canvas, text, cv::Point((int)pos.x - ts.width / 2, (int)pos.y + ts.height / 2),
                cv::FONT_HERSHEY_SIMPLEX, scale, blend(c, alpha), 1, cv::LINE_AA);
}

void ImageSurface::end_frame() {
    if (!writer_.isOpened() || canvas.empty()) return;
    writer_.write(canvas);
}

bool ImageSurface::save(const std::string& path) const {
    if (canvas.empty()) {
        fprintf(stderr, "⚠ Nothing rendered, snapshot %s skipped\n", path.c_str());
        return false;
    }
    try {
        if (cv::imwrite(path, canvas)) return true;
        fprintf(stderr, "⚠ Could not write snapshot %s\n", path.c_str());
    } catch (const cv::Exception& e) {
        fprintf(stderr, "⚠ Snapshot %s failed: %s\n", path.c_str(), e.what());
    }
    return false;
}

bool ImageSurface::start_recording(const std::string& path, double fps, int w, int h) {
    try {
        writer_.open(path, cv::VideoWriter::fourcc('M','J','P','G'), fps, cv::Size(w, h));
    } catch (const cv::Exception& e) {
        fprintf(stderr, "⚠ Recording %s failed: %s\n", path.c_str(), e.what());
        return false;
    }
    if (!writer_.isOpened()) {
        fprintf(stderr, "⚠ Could not open video writer for %s\n", path.c_str());
        return false;
    }
    return true;
}

void ImageSurface::stop_recording() {
    if (writer_.isOpened()) writer_.release();
}
