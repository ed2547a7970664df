#pragma once
#include <cstddef>
#include <vector>
#include <pviz/sample.hpp>

namespace pviz {

// Default heat cell edge in surface pixels.
inline constexpr int kDefaultCellSize = 15;

struct GridCell {
  int row{};
  int col{};
  double accumulated{};
};

// Row-major accumulation grid over normalized field coordinates.
struct HeatGrid {
  int width{0};
  int height{0};
  std::vector<double> cells{};
  double max_value{0.0};

  double at(int row, int col) const { return cells[static_cast<std::size_t>(row) * width + col]; }
  bool empty() const { return width <= 0 || height <= 0; }

  // Sum over all cells.
  double total() const;
  // Cells with a positive value, row-major order.
  std::vector<GridCell> occupied_cells() const;
  // Resize to w x h and zero every cell.
  void reset(int w, int h);
};

struct GridDims {
  int width{0};
  int height{0};
};

// ceil(px / cell_size) per axis; 0x0 for a degenerate surface.
GridDims grid_dims_for_surface(int width_px, int height_px, int cell_size = kDefaultCellSize);

// Bin samples: col = floor(x/100 * w), row = floor(y/100 * h).
// Samples landing outside the grid are dropped, never clamped.
HeatGrid aggregate(const std::vector<PositionSample>& samples, int grid_width, int grid_height);

// Same as aggregate() but reuses a caller-owned buffer.
// The buffer must not be shared across concurrent calls.
void aggregate_into(HeatGrid& scratch,
                    const std::vector<PositionSample>& samples,
                    int grid_width,
                    int grid_height);

// Splits samples into contiguous partitions, bins each on a worker thread and
// merges the partial grids by addition. partitions <= 1 runs inline. Workers are
// capped at hardware_concurrency(); partitions whose thread cannot be started
// are binned on the calling thread.
HeatGrid aggregate_partitioned(const std::vector<PositionSample>& samples,
                               int grid_width,
                               int grid_height,
                               std::size_t partitions);

} // namespace pviz
