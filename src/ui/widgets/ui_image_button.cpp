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
#include "lattice/ui/widgets/ui_image_button.h"

#include <algorithm>

#include "lattice/error.h"
#include "lattice/ui/ui_layout_config.h"

namespace Lattice::UI {

UIImageButton::UIImageButton(UITexture texture, UISharedValuePtr<bool> clicked)
    : m_texture(texture)
    , m_clicked(std::move(clicked)) {
    if (!m_clicked) {
        throw LATTICE_ERROR(ErrorCode::NullPointer, "ImageButton requires a clicked state cell");
    }
}

UIElementPtr UIImageButton::Create(UITexture texture, UISharedValuePtr<bool> clicked, UIElementOptions options) {
    return UIElement::CreateWithKind<UIImageButton>(std::move(options), texture, std::move(clicked));
}

Size UIImageButton::Measure(const UIElement& /*self*/) const {
    if (!m_texture.IsValid()) {
        const float side = GetLayoutConfig().widgets.imageButtonFallbackSize;
        return Size(side, side);
    }
    return Size(std::max(1.0f, m_texture.width), std::max(1.0f, m_texture.height));
}

void UIImageButton::Paint(const UIElement& self, UIPainter& painter) {
    const bool pressed = painter.DrawImageButton(self.GetRect(), m_texture, !m_disabled);

    if (pressed && !m_disabled) {
        m_clicked->Set(true);
    } else if (!pressed && m_clicked->Get()) {
        m_clicked->Set(false);
    }

    PaintTooltip(self, painter);
}

void UIImageButton::SetTexture(const UITexture& texture) {
    const bool sizeChanged = texture.IsValid() != m_texture.IsValid() ||
                             texture.width != m_texture.width || texture.height != m_texture.height;
    m_texture = texture;
    if (sizeChanged) {
        InvalidateOwnerSize();
    } else if (UIElement* owner = GetOwner()) {
        owner->MarkDirty(UIDirtyFlag::Visual);
    }
}

void UIImageButton::SetDisabled(bool disabled) {
    if (m_disabled == disabled) {
        return;
    }
    m_disabled = disabled;
    if (UIElement* owner = GetOwner()) {
        owner->MarkDirty(UIDirtyFlag::Visual);
    }
}

} // namespace Lattice::UI
