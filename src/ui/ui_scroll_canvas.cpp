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
#include "lattice/ui/ui_scroll_canvas.h"

#include <algorithm>

#include "lattice/ui/ui_layout_config.h"
#include "lattice/ui/ui_painter.h"

namespace Lattice::UI {

UIScrollCanvas::UIScrollCanvas(const Rect& rect, UIScrollCanvasOptions scroll)
    : m_initialRect(rect)
    , m_scrollPosition(scroll.scrollPosition ? std::move(scroll.scrollPosition)
                                             : MakeSharedValue<Vector2>(Vector2::Zero()))
    , m_showScrollbars(scroll.showScrollbars)
    , m_padding(scroll.padding) {
}

UIElementPtr UIScrollCanvas::Create(const Rect& rect, UIScrollCanvasOptions scroll, UIElementOptions options) {
    return UIElement::CreateWithKind<UIScrollCanvas>(std::move(options), rect, std::move(scroll));
}

bool UIScrollCanvas::AcceptsSizeMode(UIAxis /*axis*/, SizeMode mode) const noexcept {
    return mode == SizeMode::Fixed;
}

void UIScrollCanvas::OnAttached(UIElement& self) {
    self.SetPosition(m_initialRect.x, m_initialRect.y);
    self.SetSize(m_initialRect.width, m_initialRect.height);
}

float UIScrollCanvas::ComputeFillExtent(const UIElement& self, const UIElement& /*child*/, UIAxis axis) const {
    const float scrollbar = m_showScrollbars ? GetLayoutConfig().scrollbarSize : 0.0f;
    return std::max(1.0f, self.GetExtent(axis) - m_padding * 2.0f - scrollbar);
}

void UIScrollCanvas::Arrange(UIElement& /*self*/) {
    // 子元素保持调用方给出的绝对坐标
}

void UIScrollCanvas::Paint(const UIElement& self, UIPainter& painter) {
    painter.DrawMenuSection(self.GetRect());
}

void UIScrollCanvas::RenderChildren(UIElement& self, UIPainter& painter) {
    const Rect viewRect = CalculateViewRect();
    const Rect scrollRect = CalculateScrollRect();

    UIScrollViewScope scope(painter, scrollRect, m_scrollPosition->Value(), viewRect, m_showScrollbars);
    UIElementKind::RenderChildren(self, painter);
}

Rect UIScrollCanvas::GetRect() const {
    const UIElement* owner = GetOwner();
    return owner ? owner->GetRect() : m_initialRect;
}

void UIScrollCanvas::UpdateRect(const Rect& rect) {
    UIElement* owner = GetOwner();
    if (!owner) {
        m_initialRect = rect;
        return;
    }
    owner->SetPosition(rect.x, rect.y);
    owner->SetSize(rect.width, rect.height);
}

Rect UIScrollCanvas::CalculateScrollRect() const {
    const Rect rect = GetRect();
    return Rect(rect.x + m_padding,
                rect.y + m_padding,
                std::max(1.0f, rect.width - m_padding * 2.0f),
                std::max(1.0f, rect.height - m_padding * 2.0f));
}

Rect UIScrollCanvas::CalculateViewRect() const {
    const Rect rect = GetRect();
    const UIElement* owner = GetOwner();
    if (!owner || owner->GetChildCount() == 0) {
        return rect;
    }

    Rect content = owner->GetChildren().front()->GetRect();
    owner->ForEachChild([&content](const UIElement& child) {
        content = content.Union(child.GetRect());
    });

    // 内容越出画布时保持原样，否则滚动范围会把越界部分截掉
    if (rect.Contains(content) && (content.width < rect.width || content.height < rect.height)) {
        return Rect(rect.x, rect.y, std::max(content.width, rect.width), std::max(content.height, rect.height));
    }
    return content;
}

void UIScrollCanvas::SetShowScrollbars(bool show) {
    if (m_showScrollbars == show) {
        return;
    }
    m_showScrollbars = show;
    NotifyViewportChanged();
}

void UIScrollCanvas::SetPadding(float padding) {
    if (m_padding == padding) {
        return;
    }
    m_padding = padding;
    NotifyViewportChanged();
}

void UIScrollCanvas::NotifyViewportChanged() {
    if (UIElement* owner = GetOwner()) {
        owner->NotifyFillDependents(UIAxisMask::Both);
        owner->MarkDirty(UIDirtyFlag::Layout);
    }
}

} // namespace Lattice::UI
