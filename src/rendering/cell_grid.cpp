// Tessera Rendering Core
// cell_grid.cpp - Cell grid implementation

#include <algorithm>
#include <tessera/rendering/cell_grid.hpp>

namespace tessera::rendering {

CellGrid::CellGrid(uint32_t width, uint32_t height)
    : width_(width), height_(height), cells_(static_cast<size_t>(width) * height) {}

void CellGrid::resize(uint32_t new_width, uint32_t new_height) {
    if (new_width == width_ && new_height == height_) {
        return;
    }

    std::vector<Cell> resized(static_cast<size_t>(new_width) * new_height);
    const uint32_t keep_width = std::min(width_, new_width);
    const uint32_t keep_height = std::min(height_, new_height);

    for (uint32_t y = 0; y < keep_height; ++y) {
        auto src = cells_.begin() + static_cast<std::ptrdiff_t>(index_of(0, y));
        auto dst = resized.begin() + static_cast<std::ptrdiff_t>(static_cast<size_t>(y) * new_width);
        std::copy(src, src + keep_width, dst);
    }

    cells_ = std::move(resized);
    width_ = new_width;
    height_ = new_height;
    ++revision_;
}

std::optional<Cell> CellGrid::get(uint32_t x, uint32_t y) const {
    if (!in_bounds(x, y)) {
        return std::nullopt;
    }
    return cells_[index_of(x, y)];
}

core::RenderError CellGrid::set(uint32_t x, uint32_t y, const Cell& cell) {
    if (!in_bounds(x, y)) {
        return core::RenderError::OutOfBounds;
    }
    cells_[index_of(x, y)] = cell;
    ++revision_;
    return core::RenderError::None;
}

core::RenderError CellGrid::set_glyph(uint32_t x, uint32_t y, uint32_t glyph_index) {
    if (!in_bounds(x, y)) {
        return core::RenderError::OutOfBounds;
    }
    cells_[index_of(x, y)].glyph_index = glyph_index;
    ++revision_;
    return core::RenderError::None;
}

void CellGrid::fill(const Cell& cell) {
    std::fill(cells_.begin(), cells_.end(), cell);
    ++revision_;
}

void CellGrid::clear() {
    fill(Cell{});
}

void CellGrid::clear_glyphs() {
    for (Cell& cell : cells_) {
        cell.glyph_index = 0;
    }
    ++revision_;
}

void CellGrid::stamp_onto(CellGrid& target, uint32_t offset_x, uint32_t offset_y) const {
    const uint32_t room_x = target.width_ > offset_x ? target.width_ - offset_x : 0;
    const uint32_t room_y = target.height_ > offset_y ? target.height_ - offset_y : 0;
    const uint32_t copy_width = std::min(width_, room_x);
    const uint32_t copy_height = std::min(height_, room_y);

    for (uint32_t y = 0; y < copy_height; ++y) {
        for (uint32_t x = 0; x < copy_width; ++x) {
            const Cell& cell = cells_[index_of(x, y)];
            if (!cell.transparent) {
                target.cells_[target.index_of(offset_x + x, offset_y + y)] = cell;
            }
        }
    }
    ++target.revision_;
}

}  // namespace tessera::rendering
