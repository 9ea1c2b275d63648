// Tessera Rendering Core
// cell_grid.hpp - Dense row-major grid of glyph cells

#pragma once

#include "color.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <tessera/core/error.hpp>
#include <vector>

namespace tessera::rendering {

// One grid position. Direct color mode reads fg/bg; palette mode reads palette.
struct Cell {
    uint32_t glyph_index = 0;
    Color fg_color = colors::WHITE;
    Color bg_color = colors::TRANSPARENT_BLACK;
    Palette palette;
    bool transparent = false;  // Skipped by CellGrid::stamp_onto

    bool operator==(const Cell& other) const = default;
};

// Row-major cell storage. cells_.size() == width * height at all times.
class CellGrid {
public:
    // ========================================================================
    // Row-major traversal yielding (x, y, cell)
    // ========================================================================

    struct Entry {
        uint32_t x;
        uint32_t y;
        const Cell& cell;
    };

    class ConstIterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Entry;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = Entry;

        ConstIterator() = default;
        ConstIterator(const CellGrid* grid, size_t index) : grid_(grid), index_(index) {}

        [[nodiscard]] Entry operator*() const {
            const uint32_t width = grid_->width_;
            return Entry{static_cast<uint32_t>(index_ % width), static_cast<uint32_t>(index_ / width),
                         grid_->cells_[index_]};
        }

        ConstIterator& operator++() {
            ++index_;
            return *this;
        }

        ConstIterator operator++(int) {
            ConstIterator copy = *this;
            ++index_;
            return copy;
        }

        bool operator==(const ConstIterator& other) const { return grid_ == other.grid_ && index_ == other.index_; }
        bool operator!=(const ConstIterator& other) const { return !(*this == other); }

    private:
        const CellGrid* grid_ = nullptr;
        size_t index_ = 0;
    };

    // Lazy, restartable view; holds no state beyond the grid pointer
    class CellRange {
    public:
        explicit CellRange(const CellGrid* grid) : grid_(grid) {}
        [[nodiscard]] ConstIterator begin() const { return ConstIterator(grid_, 0); }
        [[nodiscard]] ConstIterator end() const { return ConstIterator(grid_, grid_->cells_.size()); }
        [[nodiscard]] size_t size() const { return grid_->cells_.size(); }

    private:
        const CellGrid* grid_;
    };

    CellGrid() = default;
    CellGrid(uint32_t width, uint32_t height);

    // ========================================================================
    // Dimensions
    // ========================================================================

    [[nodiscard]] uint32_t get_width() const { return width_; }
    [[nodiscard]] uint32_t get_height() const { return height_; }
    [[nodiscard]] size_t size() const { return cells_.size(); }
    [[nodiscard]] bool empty() const { return cells_.empty(); }

    // Keeps the overlapping top-left region; everything else becomes a blank Cell
    void resize(uint32_t new_width, uint32_t new_height);

    // ========================================================================
    // Cell Access
    // ========================================================================

    [[nodiscard]] bool in_bounds(uint32_t x, uint32_t y) const { return x < width_ && y < height_; }

    [[nodiscard]] std::optional<Cell> get(uint32_t x, uint32_t y) const;

    // OutOfBounds leaves the grid untouched
    [[nodiscard]] core::RenderError set(uint32_t x, uint32_t y, const Cell& cell);

    // Convenience for the common glyph-only update
    [[nodiscard]] core::RenderError set_glyph(uint32_t x, uint32_t y, uint32_t glyph_index);

    [[nodiscard]] CellRange cells() const { return CellRange(this); }
    [[nodiscard]] const std::vector<Cell>& data() const { return cells_; }

    // ========================================================================
    // Bulk Operations
    // ========================================================================

    void fill(const Cell& cell);

    // Reset every cell to the blank default
    void clear();

    // Zero every glyph index, leaving colors and palettes
    void clear_glyphs();

    // Copy non-transparent cells onto target at (offset_x, offset_y), truncated to target bounds
    void stamp_onto(CellGrid& target, uint32_t offset_x, uint32_t offset_y) const;

    // Bumped by every mutation; consumers compare against a remembered value
    [[nodiscard]] uint64_t get_revision() const { return revision_; }

private:
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    std::vector<Cell> cells_;
    uint64_t revision_ = 0;

    [[nodiscard]] size_t index_of(uint32_t x, uint32_t y) const {
        return static_cast<size_t>(y) * width_ + x;
    }
};

}  // namespace tessera::rendering
