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
#include "lattice/ui/ui_canvas.h"

#include "lattice/ui/ui_painter.h"

namespace Lattice::UI {

UICanvas::UICanvas(const Rect& rect)
    : m_initialRect(rect) {
}

UIElementPtr UICanvas::Create(const Rect& rect, UIElementOptions options) {
    return UIElement::CreateWithKind<UICanvas>(std::move(options), rect);
}

bool UICanvas::AcceptsSizeMode(UIAxis /*axis*/, SizeMode mode) const noexcept {
    return mode == SizeMode::Fixed;
}

void UICanvas::OnAttached(UIElement& self) {
    self.SetPosition(m_initialRect.x, m_initialRect.y);
    self.SetSize(m_initialRect.width, m_initialRect.height);
}

void UICanvas::Paint(const UIElement& self, UIPainter& painter) {
    if (m_drawFrame) {
        painter.DrawMenuSection(self.GetRect());
    }
}

Rect UICanvas::GetRect() const {
    const UIElement* owner = GetOwner();
    return owner ? owner->GetRect() : m_initialRect;
}

void UICanvas::UpdateRect(const Rect& rect) {
    UIElement* owner = GetOwner();
    if (!owner) {
        m_initialRect = rect;
        return;
    }
    owner->SetPosition(rect.x, rect.y);
    owner->SetSize(rect.width, rect.height);
}

void UICanvas::SetDrawFrame(bool drawFrame) {
    if (m_drawFrame == drawFrame) {
        return;
    }
    m_drawFrame = drawFrame;
    if (UIElement* owner = GetOwner()) {
        owner->MarkDirty(UIDirtyFlag::Visual);
    }
}

} // namespace Lattice::UI
