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
#include "lattice/ui/layout/ui_linear_layout.h"

#include "lattice/ui/ui_layout_config.h"

namespace Lattice::UI {

UILinearLayout::UILinearLayout(UIAxis packAxis, float spacing)
    : m_packAxis(packAxis)
    , m_spacing(spacing) {
}

SizeMode UILinearLayout::GetDefaultSizeMode(UIAxis /*axis*/) const noexcept {
    return SizeMode::Content;
}

float UILinearLayout::ComputeIntrinsicExtent(const UIElement& self, UIAxis axis) const {
    if (self.GetChildCount() == 0) {
        const Size& size = GetLayoutConfig().defaultElementSize;
        return axis == UIAxis::Horizontal ? size.width : size.height;
    }
    return ComputePackedExtent(self, m_packAxis, axis, m_spacing);
}

void UILinearLayout::Arrange(UIElement& self) {
    PackChildren(self, m_packAxis, m_spacing, self.GetPosition());
}

void UILinearLayout::SetSpacing(float spacing) {
    if (m_spacing == spacing) {
        return;
    }
    m_spacing = spacing;
    InvalidateOwnerSize(ToMask(m_packAxis));
}

} // namespace Lattice::UI
