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
#include "lattice/ui/layout/ui_row.h"

#include "lattice/ui/ui_layout_config.h"

namespace Lattice::UI {

UIRow::UIRow(std::optional<float> spacing)
    : UILinearLayout(UIAxis::Horizontal, spacing.value_or(GetLayoutConfig().rowSpacing)) {
}

UIElementPtr UIRow::Create(UIElementOptions options, std::optional<float> spacing) {
    return UIElement::CreateWithKind<UIRow>(std::move(options), spacing);
}

} // namespace Lattice::UI
