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
#pragma once

#include <array>
#include <optional>

#include "lattice/ui/ui_element.h"
#include "lattice/ui/ui_element_kind.h"

namespace Lattice::UI {

/**
 * @brief 网格参数
 */
struct UIGridOptions {
    int columns = 1;                    // 必须 > 0
    int rows = 0;                       // 0 表示行数不限
    std::optional<float> cellWidth;     // 未给出时由子元素推导
    std::optional<float> cellHeight;
    float columnSpacing = 0.0f;
    float rowSpacing = 0.0f;
    float padding = 0.0f;
};

struct UIGridPosition {
    int column = -1;
    int row = -1;

    bool operator==(const UIGridPosition& other) const noexcept {
        return column == other.column && row == other.row;
    }
};

/**
 * @brief 二维网格容器
 *
 * 第 i 个子元素位于 (i mod columns, i div columns)，按行优先填充。
 *
 * 单元格尺寸按轴决定：
 * - 宽度为 Fixed/Fill：由网格宽度均分，(width - 2p - (c-1)s) / c，至少为 1
 * - 高度为 Fixed/Fill 且行数有限：同一公式作用在行上
 * - 其余情况：显式单元格尺寸；未显式给出时取所有子元素的最大尺寸（缓存，随子元素失效）
 *
 * Fill 子元素得到的是单元格尺寸而不是网格尺寸。
 */
class UIGrid : public UIElementKind {
public:
    explicit UIGrid(const UIGridOptions& grid);

    /**
     * @throws LatticeError InvalidLayoutParameter 列数 <= 0
     */
    static UIElementPtr Create(const UIGridOptions& grid, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::Grid; }
    [[nodiscard]] SizeMode GetDefaultSizeMode(UIAxis axis) const noexcept override;
    [[nodiscard]] float ComputeIntrinsicExtent(const UIElement& self, UIAxis axis) const override;
    [[nodiscard]] float ComputeFillExtent(const UIElement& self, const UIElement& child, UIAxis axis) const override;
    void Arrange(UIElement& self) override;
    void OnSizeInvalidated(UIElement& self, UIAxisMask axes) override;

    [[nodiscard]] int GetColumns() const noexcept { return m_columns; }
    void SetColumns(int columns);

    [[nodiscard]] int GetRows() const noexcept { return m_rows; }
    virtual void SetRows(int rows);

    /// 当前生效的单元格尺寸
    [[nodiscard]] float GetCellWidth() const { return GetCellExtent(UIAxis::Horizontal); }
    [[nodiscard]] float GetCellHeight() const { return GetCellExtent(UIAxis::Vertical); }
    [[nodiscard]] float GetCellExtent(UIAxis axis) const;

    /// 显式设置单元格尺寸，Fill 子元素随之失效
    void SetCellWidth(float width) { SetCellExtent(UIAxis::Horizontal, width); }
    void SetCellHeight(float height) { SetCellExtent(UIAxis::Vertical, height); }
    void SetCellExtent(UIAxis axis, float value);

    /// 恢复为由子元素推导的单元格尺寸
    void ClearCellExtent(UIAxis axis);
    [[nodiscard]] bool HasExplicitCellExtent(UIAxis axis) const noexcept {
        return m_explicitCell[static_cast<size_t>(axis)].has_value();
    }

    [[nodiscard]] float GetColumnSpacing() const noexcept { return m_columnSpacing; }
    void SetColumnSpacing(float spacing);
    [[nodiscard]] float GetRowSpacing() const noexcept { return m_rowSpacing; }
    void SetRowSpacing(float spacing);
    [[nodiscard]] float GetPadding() const noexcept { return m_padding; }
    void SetPadding(float padding);

    // ------------------------------------------------------------------
    // 单元格查询
    // ------------------------------------------------------------------

    /// @return 坐标越界或单元格为空时返回 nullptr
    [[nodiscard]] UIElement* GetChildAt(int column, int row) const noexcept;

    /// @return 不是直接子元素时返回 (-1, -1)
    [[nodiscard]] UIGridPosition GetPositionOfChild(const UIElement* child) const noexcept;

    /**
     * @brief 在指定单元格插入子元素，后续子元素顺延
     *
     * 越界坐标被截断到网格内，平铺索引再截断到 [0, 子元素数量]。
     */
    UIElement* InsertChildAt(UIElementPtr&& child, int column, int row);

    /// 行数有限时为 columns x rows，否则为 -1
    [[nodiscard]] int GetMaxCapacity() const noexcept;
    /// 行数不限时为 -1
    [[nodiscard]] int GetAvailableCells() const noexcept;
    [[nodiscard]] bool IsFull() const noexcept;
    [[nodiscard]] int GetActualRows() const noexcept;

protected:
    [[nodiscard]] int GetChildCount() const noexcept;

private:
    struct AutoCell {
        float value = 0.0f;
        bool valid = false;
        bool resolving = false;
    };

    [[nodiscard]] float ComputeCellExtent(const UIElement& self, UIAxis axis) const;
    [[nodiscard]] float ComputeAutoCellExtent(const UIElement& self, UIAxis axis) const;
    [[nodiscard]] int GetTrackCount(UIAxis axis) const noexcept;
    [[nodiscard]] float GetSpacing(UIAxis axis) const noexcept;

    void InvalidateCells(UIAxisMask axes);

    int m_columns;
    int m_rows;
    float m_columnSpacing;
    float m_rowSpacing;
    float m_padding;
    std::array<std::optional<float>, 2> m_explicitCell;
    mutable std::array<AutoCell, 2> m_autoCells{};
};

} // namespace Lattice::UI
