#pragma once

#include <cstdint>
#include <vector>

namespace tilerun::world {

enum class TileKind : uint8_t {
  Air = 0,
  Ground,
  Brick,
  Question,
  Used,
  PipeTopLeft,
  PipeTopRight,
  PipeBottomLeft,
  PipeBottomRight,
  Hard,
  Castle,
  FlagPole,
  FlagTop,
  Lava,
  Bridge,
  Axe,
  Cloud,
  Bush,
  Hill,
  Water,
  Coral,
};

bool IsSolidKind(TileKind kind);
const char *TileKindName(TileKind kind);

class TileGrid {
public:
  TileGrid(int width, int height, TileKind fill = TileKind::Air);

  int width() const;
  int height() const;
  bool InBounds(int tx, int ty) const;

  // Off-grid coordinates read as Air and are never solid.
  TileKind tile_at(int tx, int ty) const;
  bool solid(int tx, int ty) const;

  // Returns false (and changes nothing) for off-grid coordinates.
  bool set_tile(int tx, int ty, TileKind kind);

  void FillRow(int ty, int x_begin, int x_end, TileKind kind);
  void FillRect(int x_begin, int y_begin, int x_end, int y_end, TileKind kind);

  const std::vector<TileKind> &row(int ty) const;

private:
  int width_ = 0;
  int height_ = 0;
  std::vector<std::vector<TileKind>> rows_;
};

}  // namespace tilerun::world
