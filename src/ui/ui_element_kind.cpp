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
#include "lattice/ui/ui_element_kind.h"

#include <algorithm>

#include "lattice/ui/ui_element.h"
#include "lattice/ui/ui_layout_config.h"

namespace Lattice::UI {

SizeMode UIElementKind::GetDefaultSizeMode(UIAxis /*axis*/) const noexcept {
    return SizeMode::Fixed;
}

bool UIElementKind::AcceptsSizeMode(UIAxis /*axis*/, SizeMode /*mode*/) const noexcept {
    return true;
}

float UIElementKind::ComputeIntrinsicExtent(const UIElement& self, UIAxis axis) const {
    const UILayoutConfig& config = GetLayoutConfig();
    if (self.GetChildCount() == 0) {
        return axis == UIAxis::Horizontal ? config.defaultElementSize.width : config.defaultElementSize.height;
    }
    return ComputePackedExtent(self, UIAxis::Vertical, axis, config.lineSpacing);
}

Size UIElementKind::ComputeIntrinsicSize(const UIElement& self) const {
    return Size(ComputeIntrinsicExtent(self, UIAxis::Horizontal), ComputeIntrinsicExtent(self, UIAxis::Vertical));
}

float UIElementKind::ComputeFillExtent(const UIElement& self, const UIElement& /*child*/, UIAxis axis) const {
    return self.GetExtent(axis);
}

void UIElementKind::Arrange(UIElement& self) {
    PackChildren(self, UIAxis::Vertical, GetLayoutConfig().lineSpacing, self.GetPosition());
}

void UIElementKind::Paint(const UIElement& /*self*/, UIPainter& /*painter*/) {
}

void UIElementKind::RenderChildren(UIElement& self, UIPainter& painter) {
    self.ForEachChild([&painter](UIElement& child) {
        child.Render(painter);
    });
}

void UIElementKind::OnSizeInvalidated(UIElement& /*self*/, UIAxisMask /*axes*/) {
}

void UIElementKind::OnAttached(UIElement& /*self*/) {
}

void UIElementKind::InvalidateOwnerSize(UIAxisMask axes) {
    if (m_owner) {
        m_owner->InvalidateSize(axes);
    }
}

void UIElementKind::InvalidateOwnerLayout() {
    if (m_owner) {
        m_owner->MarkDirty(UIDirtyFlag::Layout);
    }
}

float UIElementKind::ComputePackedExtent(const UIElement& self, UIAxis packAxis, UIAxis axis, float spacing) {
    const size_t count = self.GetChildCount();
    if (count == 0) {
        return 0.0f;
    }

    float total = 0.0f;
    float largest = 0.0f;
    self.ForEachChild([&](const UIElement& child) {
        const float extent = child.GetExtent(axis);
        total += extent;
        largest = std::max(largest, extent);
    });

    if (axis != packAxis) {
        return largest;
    }
    return total + spacing * static_cast<float>(count - 1);
}

void UIElementKind::PackChildren(UIElement& self, UIAxis packAxis, float spacing, const Vector2& origin) {
    float cursor = packAxis == UIAxis::Horizontal ? origin.x() : origin.y();
    self.ForEachChild([&](UIElement& child) {
        if (packAxis == UIAxis::Horizontal) {
            child.SetPosition(cursor, origin.y());
            cursor += child.GetWidth() + spacing;
        } else {
            child.SetPosition(origin.x(), cursor);
            cursor += child.GetHeight() + spacing;
        }
    });
}

} // namespace Lattice::UI
