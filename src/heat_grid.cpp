#include <pviz/heat_grid.hpp>
#include <algorithm>
#include <cmath>
#include <system_error>
#include <thread>
#include <pviz/log.hpp>

namespace pviz {

static bool cell_for(const PositionSample& s, int w, int h, int& row, int& col) {
  if (!std::isfinite(s.x) || !std::isfinite(s.y)) return false;
  const double fc = std::floor((s.x / 100.0) * w);
  const double fr = std::floor((s.y / 100.0) * h);
  if (fc < 0.0 || fc >= static_cast<double>(w)) return false;
  if (fr < 0.0 || fr >= static_cast<double>(h)) return false;
  col = static_cast<int>(fc);
  row = static_cast<int>(fr);
  return true;
}

static void accumulate_range(std::vector<double>& cells,
                             const std::vector<PositionSample>& samples,
                             std::size_t begin, std::size_t end,
                             int w, int h) {
  for (std::size_t i = begin; i < end; ++i) {
    int row = 0, col = 0;
    if (!cell_for(samples[i], w, h, row, col)) continue;
    cells[static_cast<std::size_t>(row) * w + col] += samples[i].intensity;
  }
}

static double max_of(const std::vector<double>& cells) {
  double m = 0.0;
  for (double v : cells) if (v > m) m = v;
  return m;
}

double HeatGrid::total() const {
  double sum = 0.0;
  for (double v : cells) sum += v;
  return sum;
}

std::vector<GridCell> HeatGrid::occupied_cells() const {
  std::vector<GridCell> out;
  for (int r = 0; r < height; ++r) {
    for (int c = 0; c < width; ++c) {
      const double v = at(r, c);
      if (v > 0.0) out.push_back(GridCell{r, c, v});
    }
  }
  return out;
}

void HeatGrid::reset(int w, int h) {
  width  = std::max(0, w);
  height = std::max(0, h);
  cells.assign(static_cast<std::size_t>(width) * height, 0.0);
  max_value = 0.0;
}

GridDims grid_dims_for_surface(int width_px, int height_px, int cell_size) {
  if (width_px <= 0 || height_px <= 0) return GridDims{};
  const int cs = std::max(1, cell_size);
  return GridDims{ (width_px + cs - 1) / cs, (height_px + cs - 1) / cs };
}

HeatGrid aggregate(const std::vector<PositionSample>& samples, int grid_width, int grid_height) {
  HeatGrid g;
  aggregate_into(g, samples, grid_width, grid_height);
  return g;
}

void aggregate_into(HeatGrid& scratch,
                    const std::vector<PositionSample>& samples,
                    int grid_width,
                    int grid_height) {
  scratch.reset(grid_width, grid_height);
  if (scratch.empty()) return;
  accumulate_range(scratch.cells, samples, 0, samples.size(), scratch.width, scratch.height);
  scratch.max_value = max_of(scratch.cells);
}

HeatGrid aggregate_partitioned(const std::vector<PositionSample>& samples,
                               int grid_width,
                               int grid_height,
                               std::size_t partitions) {
  HeatGrid out;
  out.reset(grid_width, grid_height);
  if (out.empty()) return out;

  const std::size_t n = samples.size();
  const std::size_t hw = std::max(1u, std::thread::hardware_concurrency());
  const std::size_t parts = std::min({std::max<std::size_t>(partitions, 1), std::max<std::size_t>(n, 1), hw});
  if (parts == 1) {
    accumulate_range(out.cells, samples, 0, n, out.width, out.height);
    out.max_value = max_of(out.cells);
    return out;
  }

  // One partial grid per worker; merged in partition order for a stable sum.
  std::vector<std::vector<double>> partial(parts, std::vector<double>(out.cells.size(), 0.0));
  std::vector<std::thread> workers;
  workers.reserve(parts);
  const std::size_t chunk = (n + parts - 1) / parts;
  std::size_t started = 0;
  try {
    for (; started < parts; ++started) {
      const std::size_t begin = std::min(n, started * chunk);
      const std::size_t end   = std::min(n, begin + chunk);
      workers.emplace_back([&, p = started, begin, end]{
        accumulate_range(partial[p], samples, begin, end, out.width, out.height);
      });
    }
  } catch (const std::system_error& e) {
    log()->warn("aggregate_partitioned: started {} of {} workers ({}), finishing inline",
                started, parts, e.what());
  }
  // Partitions without a worker are accumulated on this thread.
  for (std::size_t p = started; p < parts; ++p) {
    const std::size_t begin = std::min(n, p * chunk);
    const std::size_t end   = std::min(n, begin + chunk);
    accumulate_range(partial[p], samples, begin, end, out.width, out.height);
  }
  for (auto& th : workers) th.join();

  for (const auto& grid : partial) {
    for (std::size_t i = 0; i < grid.size(); ++i) out.cells[i] += grid[i];
  }
  out.max_value = max_of(out.cells);
  return out;
}

} // namespace pviz
