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
#include "lattice/ui/layout/ui_scroll_container.h"

#include <algorithm>

#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_painter.h"

namespace Lattice::UI {

UIScrollContainer::UIScrollContainer(UIScrollContainerOptions scroll)
    : m_padding(scroll.padding)
    , m_spacing(scroll.spacing.value_or(GetLayoutConfig().scrollContainerSpacing))
    , m_scrollPosition(scroll.scrollPosition ? std::move(scroll.scrollPosition)
                                             : MakeSharedValue<Vector2>(Vector2::Zero()))
    , m_showScrollbars(scroll.showScrollbars) {
}

UIElementPtr UIScrollContainer::Create(UIScrollContainerOptions scroll, UIElementOptions options) {
    return UIElement::CreateWithKind<UIScrollContainer>(std::move(options), std::move(scroll));
}

SizeMode UIScrollContainer::GetDefaultSizeMode(UIAxis /*axis*/) const noexcept {
    return SizeMode::Content;
}

float UIScrollContainer::ComputeIntrinsicExtent(const UIElement& self, UIAxis axis) const {
    const float insets = m_padding * 2.0f;
    if (self.GetChildCount() == 0) {
        return std::max(1.0f, insets);
    }
    return std::max(1.0f, ComputePackedExtent(self, UIAxis::Vertical, axis, m_spacing) + insets);
}

float UIScrollContainer::ComputeFillExtent(const UIElement& self, const UIElement& /*child*/, UIAxis axis) const {
    return std::max(1.0f, self.GetExtent(axis) - m_padding * 2.0f);
}

void UIScrollContainer::Arrange(UIElement& self) {
    const Rect area = ComputeContentArea(self, m_padding);
    PackChildren(self, UIAxis::Vertical, m_spacing, Vector2(area.x, area.y));
}

void UIScrollContainer::Paint(const UIElement& self, UIPainter& painter) {
    painter.DrawMenuSection(self.GetRect());
}

void UIScrollContainer::RenderChildren(UIElement& self, UIPainter& painter) {
    const Rect area = ComputeContentArea(self, m_padding);
    const Rect bounds = ComputeContentBounds(self);

    UIScrollViewScope scope(painter, area, m_scrollPosition->Value(), bounds, m_showScrollbars);
    UIElementKind::RenderChildren(self, painter);
}

Rect UIScrollContainer::ComputeContentArea(const UIElement& self, float padding) {
    return Rect(self.GetX() + padding,
                self.GetY() + padding,
                std::max(1.0f, self.GetWidth() - padding * 2.0f),
                std::max(1.0f, self.GetHeight() - padding * 2.0f));
}

Rect UIScrollContainer::ComputeContentBounds(const UIElement& self) const {
    const Rect area = ComputeContentArea(self, m_padding);
    if (self.GetChildCount() == 0) {
        return area;
    }

    Rect bounds = self.GetChildren().front()->GetRect();
    self.ForEachChild([&bounds](const UIElement& child) {
        bounds = bounds.Union(child.GetRect());
    });

    bounds.width = std::max(bounds.width, area.width);
    bounds.height = std::max(bounds.height, area.height);
    return bounds;
}

Rect UIScrollContainer::GetContentArea() const {
    const UIElement* owner = GetOwner();
    return owner ? ComputeContentArea(*owner, m_padding) : Rect();
}

Rect UIScrollContainer::GetContentBounds() const {
    const UIElement* owner = GetOwner();
    return owner ? ComputeContentBounds(*owner) : Rect();
}

bool UIScrollContainer::ContentOverflows() const {
    const Rect area = GetContentArea();
    const Rect bounds = GetContentBounds();
    return bounds.width > area.width || bounds.height > area.height;
}

void UIScrollContainer::SetPadding(float padding) {
    if (m_padding == padding) {
        return;
    }
    m_padding = padding;
    if (UIElement* owner = GetOwner()) {
        owner->NotifyFillDependents(UIAxisMask::Both);
    }
    InvalidateOwnerSize();
}

void UIScrollContainer::SetSpacing(float spacing) {
    if (m_spacing == spacing) {
        return;
    }
    m_spacing = spacing;
    InvalidateOwnerSize(UIAxisMask::Vertical);
}

void UIScrollContainer::SetShowScrollbars(bool show) {
    if (m_showScrollbars == show) {
        return;
    }
    m_showScrollbars = show;
    InvalidateOwnerLayout();
}

} // namespace Lattice::UI
