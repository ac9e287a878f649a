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

#include "lattice/ui/layout/ui_grid.h"

namespace Lattice::UI {

/**
 * @brief 宽度恒为 Fill、高度为 Content、行数不限的网格
 *
 * 单元格宽度 = (父宽度 - 2p - (c-1)s) / c；单元格高度与 UIGrid 的自动推导相同。
 */
class UIFillGrid final : public UIGrid {
public:
    explicit UIFillGrid(const UIGridOptions& grid);

    /**
     * @note grid.rows 被忽略（记录警告）；options 中的宽高模式只能是 Fill / Content
     */
    static UIElementPtr Create(const UIGridOptions& grid, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::FillGrid; }
    [[nodiscard]] SizeMode GetDefaultSizeMode(UIAxis axis) const noexcept override;
    [[nodiscard]] bool AcceptsSizeMode(UIAxis axis, SizeMode mode) const noexcept override;

    /// 行数固定为不限，调用只记录警告
    void SetRows(int rows) override;

private:
    static UIGridOptions Unbounded(const UIGridOptions& grid);
};

} // namespace Lattice::UI
