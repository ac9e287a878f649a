/*
 * Copyright (c) 2025 Li Chaoyu
 * 
 * This file is part of Lattice.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 *
 * For commercial licensing, please contact: 2052046346@qq.com
 */
#include "lattice/ui/layout/ui_grid.h"

#include <algorithm>
#include <string>

#include "lattice/error.h"
#include "lattice/logger.h"
#include "lattice/ui/ui_layout_config.h"

namespace Lattice::UI {

namespace {

void ValidateColumns(int columns) {
    if (columns <= 0) {
        throw LATTICE_ERROR(ErrorCode::InvalidLayoutParameter,
                            "Grid column count must be positive, got " + std::to_string(columns));
    }
}

int CeilDiv(int value, int divisor) {
    return (value + divisor - 1) / divisor;
}

} // namespace

UIGrid::UIGrid(const UIGridOptions& grid)
    : m_columns(grid.columns)
    , m_rows(std::max(0, grid.rows))
    , m_columnSpacing(grid.columnSpacing)
    , m_rowSpacing(grid.rowSpacing)
    , m_padding(grid.padding)
    , m_explicitCell{grid.cellWidth, grid.cellHeight} {
    ValidateColumns(grid.columns);
}

UIElementPtr UIGrid::Create(const UIGridOptions& grid, UIElementOptions options) {
    return UIElement::CreateWithKind<UIGrid>(std::move(options), grid);
}

SizeMode UIGrid::GetDefaultSizeMode(UIAxis /*axis*/) const noexcept {
    return SizeMode::Content;
}

// ============================================================================
// 尺寸
// ============================================================================

float UIGrid::ComputeIntrinsicExtent(const UIElement& self, UIAxis axis) const {
    const int tracks = GetTrackCount(axis);
    const float cell = ComputeCellExtent(self, axis);
    return cell * static_cast<float>(tracks) + GetSpacing(axis) * static_cast<float>(tracks - 1) + m_padding * 2.0f;
}

float UIGrid::ComputeFillExtent(const UIElement& self, const UIElement& /*child*/, UIAxis axis) const {
    return ComputeCellExtent(self, axis);
}

float UIGrid::GetCellExtent(UIAxis axis) const {
    if (const UIElement* owner = GetOwner()) {
        return ComputeCellExtent(*owner, axis);
    }
    const auto& explicitCell = m_explicitCell[static_cast<size_t>(axis)];
    const Size& fallback = GetLayoutConfig().defaultCellSize;
    return explicitCell.value_or(axis == UIAxis::Horizontal ? fallback.width : fallback.height);
}

float UIGrid::ComputeCellExtent(const UIElement& self, UIAxis axis) const {
    const SizeMode mode = self.GetSizeMode(axis);
    const bool sizedByGrid = mode == SizeMode::Fixed || mode == SizeMode::Fill;
    const bool boundedTracks = axis == UIAxis::Horizontal || m_rows > 0;

    if (sizedByGrid && boundedTracks) {
        const int tracks = axis == UIAxis::Horizontal ? m_columns : m_rows;
        const float available = self.GetExtent(axis) - m_padding * 2.0f - GetSpacing(axis) * static_cast<float>(tracks - 1);
        return std::max(1.0f, available / static_cast<float>(tracks));
    }

    const auto& explicitCell = m_explicitCell[static_cast<size_t>(axis)];
    if (explicitCell) {
        return *explicitCell;
    }
    return ComputeAutoCellExtent(self, axis);
}

float UIGrid::ComputeAutoCellExtent(const UIElement& self, UIAxis axis) const {
    AutoCell& cell = m_autoCells[static_cast<size_t>(axis)];
    if (cell.valid) {
        return cell.value;
    }
    if (cell.resolving) {
        // Fill 子元素反过来查询单元格尺寸
        const float fallback = cell.value > 0.0f ? cell.value : GetLayoutConfig().minimumFallbackSize;
        Logger::GetInstance().DebugFormat("[UIGrid] Cell size cycle on '%s' (%s axis), falling back to %.2f",
                                          self.GetId().c_str(), ToString(axis), fallback);
        return fallback;
    }

    float value = 0.0f;
    {
        UIResolveGuard guard(cell.resolving);
        if (self.GetChildCount() == 0) {
            const Size& size = GetLayoutConfig().defaultCellSize;
            value = axis == UIAxis::Horizontal ? size.width : size.height;
        } else {
            self.ForEachChild([&value, axis](const UIElement& child) {
                value = std::max(value, child.GetExtent(axis));
            });
        }
    }

    cell.value = value;
    cell.valid = true;
    return value;
}

int UIGrid::GetTrackCount(UIAxis axis) const noexcept {
    if (axis == UIAxis::Horizontal) {
        return m_columns;
    }
    if (m_rows > 0) {
        return m_rows;
    }
    return std::max(1, CeilDiv(GetChildCount(), m_columns));
}

float UIGrid::GetSpacing(UIAxis axis) const noexcept {
    return axis == UIAxis::Horizontal ? m_columnSpacing : m_rowSpacing;
}

void UIGrid::OnSizeInvalidated(UIElement& /*self*/, UIAxisMask axes) {
    for (UIAxis axis : {UIAxis::Horizontal, UIAxis::Vertical}) {
        if (HasAxis(axes, axis)) {
            m_autoCells[static_cast<size_t>(axis)].valid = false;
        }
    }
}

void UIGrid::InvalidateCells(UIAxisMask axes) {
    for (UIAxis axis : {UIAxis::Horizontal, UIAxis::Vertical}) {
        if (HasAxis(axes, axis)) {
            m_autoCells[static_cast<size_t>(axis)].valid = false;
        }
    }
    if (UIElement* owner = GetOwner()) {
        owner->NotifyFillDependents(axes);
        owner->InvalidateSize(axes);
    }
}

// ============================================================================
// 排列
// ============================================================================

void UIGrid::Arrange(UIElement& self) {
    const float cellWidth = ComputeCellExtent(self, UIAxis::Horizontal);
    const float cellHeight = ComputeCellExtent(self, UIAxis::Vertical);
    const float originX = self.GetX() + m_padding;
    const float originY = self.GetY() + m_padding;

    const size_t count = self.GetChildCount();
    for (size_t i = 0; i < count; ++i) {
        const int column = static_cast<int>(i) % m_columns;
        const int row = static_cast<int>(i) / m_columns;
        if (m_rows > 0 && row >= m_rows) {
            break;
        }

        UIElement& child = *self.GetChild(i);
        const float cellX = originX + static_cast<float>(column) * (cellWidth + m_columnSpacing);
        const float cellY = originY + static_cast<float>(row) * (cellHeight + m_rowSpacing);

        // 子元素不小于单元格时贴在单元格起始边
        const float childWidth = child.GetWidth();
        const float childHeight = child.GetHeight();
        const float x = childWidth >= cellWidth
            ? cellX
            : cellX + (cellWidth - childWidth) * GetHorizontalAnchor(child.GetAlignment());
        const float y = childHeight >= cellHeight
            ? cellY
            : cellY + (cellHeight - childHeight) * GetVerticalAnchor(child.GetAlignment());
        child.SetPosition(x, y);
    }
}

// ============================================================================
// 参数
// ============================================================================

void UIGrid::SetColumns(int columns) {
    ValidateColumns(columns);
    if (m_columns == columns) {
        return;
    }
    m_columns = columns;
    InvalidateCells(UIAxisMask::Both);
}

void UIGrid::SetRows(int rows) {
    rows = std::max(0, rows);
    if (m_rows == rows) {
        return;
    }
    m_rows = rows;
    InvalidateCells(UIAxisMask::Vertical);
}

void UIGrid::SetCellExtent(UIAxis axis, float value) {
    auto& explicitCell = m_explicitCell[static_cast<size_t>(axis)];
    if (explicitCell && *explicitCell == value) {
        return;
    }
    explicitCell = value;
    InvalidateCells(ToMask(axis));
}

void UIGrid::ClearCellExtent(UIAxis axis) {
    auto& explicitCell = m_explicitCell[static_cast<size_t>(axis)];
    if (!explicitCell) {
        return;
    }
    explicitCell.reset();
    InvalidateCells(ToMask(axis));
}

void UIGrid::SetColumnSpacing(float spacing) {
    if (m_columnSpacing == spacing) {
        return;
    }
    m_columnSpacing = spacing;
    InvalidateCells(UIAxisMask::Horizontal);
}

void UIGrid::SetRowSpacing(float spacing) {
    if (m_rowSpacing == spacing) {
        return;
    }
    m_rowSpacing = spacing;
    InvalidateCells(UIAxisMask::Vertical);
}

void UIGrid::SetPadding(float padding) {
    if (m_padding == padding) {
        return;
    }
    m_padding = padding;
    InvalidateCells(UIAxisMask::Both);
}

// ============================================================================
// 单元格查询
// ============================================================================

int UIGrid::GetChildCount() const noexcept {
    const UIElement* owner = GetOwner();
    return owner ? static_cast<int>(owner->GetChildCount()) : 0;
}

UIElement* UIGrid::GetChildAt(int column, int row) const noexcept {
    if (column < 0 || column >= m_columns || row < 0 || (m_rows > 0 && row >= m_rows)) {
        return nullptr;
    }
    const UIElement* owner = GetOwner();
    if (!owner) {
        return nullptr;
    }
    const int index = row * m_columns + column;
    return index < GetChildCount() ? owner->GetChildren()[static_cast<size_t>(index)].get() : nullptr;
}

UIGridPosition UIGrid::GetPositionOfChild(const UIElement* child) const noexcept {
    const UIElement* owner = GetOwner();
    const int index = owner ? owner->IndexOfChild(child) : -1;
    if (index < 0) {
        return UIGridPosition{};
    }
    return UIGridPosition{index % m_columns, index / m_columns};
}

UIElement* UIGrid::InsertChildAt(UIElementPtr&& child, int column, int row) {
    UIElement* owner = GetOwner();
    if (!child || !owner) {
        return nullptr;
    }

    column = std::clamp(column, 0, m_columns - 1);
    row = std::max(0, row);
    if (m_rows > 0) {
        row = std::min(row, m_rows - 1);
    }
    const int index = std::clamp(row * m_columns + column, 0, GetChildCount());
    return owner->InsertChild(static_cast<size_t>(index), std::move(child));
}

int UIGrid::GetMaxCapacity() const noexcept {
    return m_rows > 0 ? m_columns * m_rows : -1;
}

int UIGrid::GetAvailableCells() const noexcept {
    if (m_rows <= 0) {
        return -1;
    }
    return std::max(0, GetMaxCapacity() - GetChildCount());
}

bool UIGrid::IsFull() const noexcept {
    return m_rows > 0 && GetChildCount() >= GetMaxCapacity();
}

int UIGrid::GetActualRows() const noexcept {
    const int count = GetChildCount();
    return count == 0 ? 0 : CeilDiv(count, m_columns);
}

} // namespace Lattice::UI
