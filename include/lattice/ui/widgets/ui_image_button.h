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

#include "lattice/ui/ui_painter.h"
#include "lattice/ui/ui_shared_value.h"
#include "lattice/ui/widgets/ui_widget_kind.h"

namespace Lattice::UI {

/**
 * @brief 图片按钮
 *
 * 点击语义与 UIButton 相同。尺寸取纹理尺寸（每边至少 1），无纹理时 32x32。
 */
class UIImageButton final : public UIWidgetKind {
public:
    UIImageButton(UITexture texture, UISharedValuePtr<bool> clicked);

    /**
     * @throws LatticeError NullPointer clicked 为空
     */
    static UIElementPtr Create(UITexture texture, UISharedValuePtr<bool> clicked, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::ImageButton; }
    void Paint(const UIElement& self, UIPainter& painter) override;

    [[nodiscard]] const UITexture& GetTexture() const noexcept { return m_texture; }
    void SetTexture(const UITexture& texture);

    [[nodiscard]] bool IsDisabled() const noexcept { return m_disabled; }
    void SetDisabled(bool disabled);

    [[nodiscard]] bool WasClicked() const noexcept { return m_clicked->Get(); }

protected:
    [[nodiscard]] Size Measure(const UIElement& self) const override;

private:
    UITexture m_texture;
    UISharedValuePtr<bool> m_clicked;
    bool m_disabled = false;
};

} // namespace Lattice::UI
