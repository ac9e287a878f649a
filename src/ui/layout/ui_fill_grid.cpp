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
#include "lattice/ui/layout/ui_fill_grid.h"

#include "lattice/logger.h"

namespace Lattice::UI {

UIFillGrid::UIFillGrid(const UIGridOptions& grid)
    : UIGrid(Unbounded(grid)) {
}

UIElementPtr UIFillGrid::Create(const UIGridOptions& grid, UIElementOptions options) {
    return UIElement::CreateWithKind<UIFillGrid>(std::move(options), grid);
}

UIGridOptions UIFillGrid::Unbounded(const UIGridOptions& grid) {
    UIGridOptions result = grid;
    if (result.rows != 0) {
        Logger::GetInstance().WarningFormat("[UIFillGrid] Row count %d ignored, fill grids grow without a row limit",
                                            result.rows);
        result.rows = 0;
    }
    return result;
}

SizeMode UIFillGrid::GetDefaultSizeMode(UIAxis axis) const noexcept {
    return axis == UIAxis::Horizontal ? SizeMode::Fill : SizeMode::Content;
}

bool UIFillGrid::AcceptsSizeMode(UIAxis axis, SizeMode mode) const noexcept {
    return mode == GetDefaultSizeMode(axis);
}

void UIFillGrid::SetRows(int rows) {
    if (rows != 0) {
        Logger::GetInstance().WarningFormat("[UIFillGrid] SetRows(%d) ignored, fill grids grow without a row limit", rows);
    }
}

} // namespace Lattice::UI
