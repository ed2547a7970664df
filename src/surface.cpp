#include <pviz/surface.hpp>
#include <algorithm>
#include <iterator>

namespace pviz {

DrawCommand RecordingSurface::make_(DrawKind kind) const {
  DrawCommand c;
  c.kind = kind;
  c.fill = fill_;
  c.stroke = stroke_;
  c.line_width = line_width_;
  return c;
}

void RecordingSurface::clear() {
  // A clear starts a fresh frame.
  commands_.clear();
  commands_.push_back(make_(DrawKind::Clear));
}

void RecordingSurface::fill_rect(float x, float y, float w, float h) {
  auto c = make_(DrawKind::FillRect);
  c.x = x; c.y = y; c.w = w; c.h = h;
  commands_.push_back(std::move(c));
}

void RecordingSurface::stroke_rect(float x, float y, float w, float h) {
  auto c = make_(DrawKind::StrokeRect);
  c.x = x; c.y = y; c.w = w; c.h = h;
  commands_.push_back(std::move(c));
}

void RecordingSurface::draw_line(float x0, float y0, float x1, float y1) {
  auto c = make_(DrawKind::Line);
  c.x = x0; c.y = y0; c.x2 = x1; c.y2 = y1;
  commands_.push_back(std::move(c));
}

void RecordingSurface::stroke_arc(float cx, float cy, float r, float start_rad, float end_rad) {
  auto c = make_(DrawKind::Arc);
  c.x = cx; c.y = cy; c.r = r;
  c.start_rad = start_rad; c.end_rad = end_rad;
  commands_.push_back(std::move(c));
}

void RecordingSurface::fill_circle(float cx, float cy, float r) {
  auto c = make_(DrawKind::FillCircle);
  c.x = cx; c.y = cy; c.r = r;
  commands_.push_back(std::move(c));
}

void RecordingSurface::stroke_circle(float cx, float cy, float r) {
  auto c = make_(DrawKind::StrokeCircle);
  c.x = cx; c.y = cy; c.r = r;
  commands_.push_back(std::move(c));
}

void RecordingSurface::stroke_polyline(const std::vector<Vec2f>& pts) {
  auto c = make_(DrawKind::Polyline);
  c.points = pts;
  commands_.push_back(std::move(c));
}

void RecordingSurface::draw_text(const std::string& text, float x, float y, TextStyle font) {
  auto c = make_(DrawKind::Text);
  c.x = x; c.y = y;
  c.text = text;
  c.font = font;
  commands_.push_back(std::move(c));
}

std::size_t RecordingSurface::count(DrawKind kind) const {
  return static_cast<std::size_t>(std::count_if(commands_.begin(), commands_.end(),
    [kind](const DrawCommand& c){ return c.kind == kind; }));
}

std::vector<DrawCommand> RecordingSurface::of_kind(DrawKind kind) const {
  std::vector<DrawCommand> out;
  std::copy_if(commands_.begin(), commands_.end(), std::back_inserter(out),
    [kind](const DrawCommand& c){ return c.kind == kind; });
  return out;
}

} // namespace pviz
