#include "tile_grid.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace tilerun::world {

bool IsSolidKind(TileKind kind) {
  switch (kind) {
    case TileKind::Ground:
    case TileKind::Brick:
    case TileKind::Question:
    case TileKind::Used:
    case TileKind::PipeTopLeft:
    case TileKind::PipeTopRight:
    case TileKind::PipeBottomLeft:
    case TileKind::PipeBottomRight:
    case TileKind::Hard:
    case TileKind::Castle:
    case TileKind::Bridge:
      return true;
    case TileKind::Air:
    case TileKind::FlagPole:
    case TileKind::FlagTop:
    case TileKind::Lava:
    case TileKind::Axe:
    case TileKind::Cloud:
    case TileKind::Bush:
    case TileKind::Hill:
    case TileKind::Water:
    case TileKind::Coral:
      return false;
  }
  return false;
}

const char *TileKindName(TileKind kind) {
  switch (kind) {
    case TileKind::Air:
      return "air";
    case TileKind::Ground:
      return "ground";
    case TileKind::Brick:
      return "brick";
    case TileKind::Question:
      return "question";
    case TileKind::Used:
      return "used";
    case TileKind::PipeTopLeft:
      return "pipe_tl";
    case TileKind::PipeTopRight:
      return "pipe_tr";
    case TileKind::PipeBottomLeft:
      return "pipe_bl";
    case TileKind::PipeBottomRight:
      return "pipe_br";
    case TileKind::Hard:
      return "hard";
    case TileKind::Castle:
      return "castle";
    case TileKind::FlagPole:
      return "flag_pole";
    case TileKind::FlagTop:
      return "flag_top";
    case TileKind::Lava:
      return "lava";
    case TileKind::Bridge:
      return "bridge";
    case TileKind::Axe:
      return "axe";
    case TileKind::Cloud:
      return "cloud";
    case TileKind::Bush:
      return "bush";
    case TileKind::Hill:
      return "hill";
    case TileKind::Water:
      return "water";
    case TileKind::Coral:
      return "coral";
  }
  return "air";
}

TileGrid::TileGrid(int width, int height, TileKind fill) : width_(width), height_(height) {
  if (width <= 0 || height <= 0) {
    throw std::logic_error("tile grid size must be positive: " + std::to_string(width) + "x" +
                           std::to_string(height));
  }
  rows_.assign(static_cast<size_t>(height), std::vector<TileKind>(static_cast<size_t>(width), fill));
}

int TileGrid::width() const {
  return width_;
}

int TileGrid::height() const {
  return height_;
}

bool TileGrid::InBounds(int tx, int ty) const {
  return tx >= 0 && tx < width_ && ty >= 0 && ty < height_;
}

TileKind TileGrid::tile_at(int tx, int ty) const {
  if (!InBounds(tx, ty)) {
    return TileKind::Air;
  }
  return rows_[static_cast<size_t>(ty)][static_cast<size_t>(tx)];
}

bool TileGrid::solid(int tx, int ty) const {
  return IsSolidKind(tile_at(tx, ty));
}

bool TileGrid::set_tile(int tx, int ty, TileKind kind) {
  if (!InBounds(tx, ty)) {
    return false;
  }
  rows_[static_cast<size_t>(ty)][static_cast<size_t>(tx)] = kind;
  return true;
}

void TileGrid::FillRow(int ty, int x_begin, int x_end, TileKind kind) {
  if (ty < 0 || ty >= height_) {
    return;
  }
  const int begin = std::max(0, x_begin);
  const int end = std::min(width_, x_end);
  for (int x = begin; x < end; ++x) {
    rows_[static_cast<size_t>(ty)][static_cast<size_t>(x)] = kind;
  }
}

void TileGrid::FillRect(int x_begin, int y_begin, int x_end, int y_end, TileKind kind) {
  for (int y = y_begin; y < y_end; ++y) {
    FillRow(y, x_begin, x_end, kind);
  }
}

const std::vector<TileKind> &TileGrid::row(int ty) const {
  return rows_.at(static_cast<size_t>(ty));
}

}  // namespace tilerun::world
