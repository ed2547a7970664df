#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <pviz/color_ramp.hpp>

namespace pviz {

struct Vec2f {
  float x{};
  float y{};
};

struct TextStyle {
  int size_px{10};
  bool bold{false};
};

// Pixel-space drawing target. Colors and line width are sticky state, like a
// 2-D canvas context. Text is centred horizontally on x with its baseline at y,
// drawn in the fill color.
class RenderSurface {
public:
  virtual ~RenderSurface() = default;

  virtual int width() const = 0;
  virtual int height() const = 0;

  virtual void clear() = 0;
  virtual void set_fill_color(Rgba c) = 0;
  virtual void set_stroke_color(Rgba c) = 0;
  virtual void set_line_width(float w) = 0;

  virtual void fill_rect(float x, float y, float w, float h) = 0;
  virtual void stroke_rect(float x, float y, float w, float h) = 0;
  virtual void draw_line(float x0, float y0, float x1, float y1) = 0;
  // Angles in radians, clockwise from +x in screen space.
  virtual void stroke_arc(float cx, float cy, float r, float start_rad, float end_rad) = 0;
  virtual void fill_circle(float cx, float cy, float r) = 0;
  virtual void stroke_circle(float cx, float cy, float r) = 0;
  virtual void stroke_polyline(const std::vector<Vec2f>& pts) = 0;
  virtual void draw_text(const std::string& text, float x, float y, TextStyle font) = 0;
};

enum class DrawKind {
  Clear,
  FillRect,
  StrokeRect,
  Line,
  Arc,
  FillCircle,
  StrokeCircle,
  Polyline,
  Text,
};

// One recorded call with the state that was active when it was issued.
struct DrawCommand {
  DrawKind kind{DrawKind::Clear};
  Rgba fill{};
  Rgba stroke{};
  float line_width{1.0f};
  // rect: x,y,w,h  line: x,y -> x2,y2  circle/arc: x,y,r
  float x{}, y{}, w{}, h{};
  float x2{}, y2{};
  float r{};
  float start_rad{}, end_rad{};
  std::vector<Vec2f> points{};
  std::string text{};
  TextStyle font{};
};

// Surface that appends every call to a command list instead of drawing.
class RecordingSurface : public RenderSurface {
public:
  RecordingSurface(int width, int height) : width_(width), height_(height) {}

  int width() const override { return width_; }
  int height() const override { return height_; }
  void resize(int width, int height) { width_ = width; height_ = height; }

  void clear() override;
  void set_fill_color(Rgba c) override { fill_ = c; }
  void set_stroke_color(Rgba c) override { stroke_ = c; }
  void set_line_width(float w) override { line_width_ = w; }

  void fill_rect(float x, float y, float w, float h) override;
  void stroke_rect(float x, float y, float w, float h) override;
  void draw_line(float x0, float y0, float x1, float y1) override;
  void stroke_arc(float cx, float cy, float r, float start_rad, float end_rad) override;
  void fill_circle(float cx, float cy, float r) override;
  void stroke_circle(float cx, float cy, float r) override;
  void stroke_polyline(const std::vector<Vec2f>& pts) override;
  void draw_text(const std::string& text, float x, float y, TextStyle font) override;

  const std::vector<DrawCommand>& commands() const { return commands_; }
  std::size_t count(DrawKind kind) const;
  std::vector<DrawCommand> of_kind(DrawKind kind) const;
  void reset() { commands_.clear(); }

private:
  DrawCommand make_(DrawKind kind) const;

  int width_{0};
  int height_{0};
  Rgba fill_{0, 0, 0, 1.0};
  Rgba stroke_{0, 0, 0, 1.0};
  float line_width_{1.0f};
  std::vector<DrawCommand> commands_;
};

} // namespace pviz
