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

#include <functional>
#include <string>

#include "lattice/ui/ui_shared_value.h"
#include "lattice/ui/widgets/ui_widget_kind.h"

namespace Lattice::UI {

/**
 * @brief 文本按钮
 *
 * 点击的那一帧把共享单元置为 true（禁用时除外），之后没有点击的帧复位为 false。
 * 尺寸：空文本 60x30；否则 文本宽 + 20 x max(文本高 + 10, 30)。
 */
class UIButton final : public UIWidgetKind {
public:
    using ClickHandler = std::function<void()>;

    UIButton(std::string text, UISharedValuePtr<bool> clicked);

    /**
     * @throws LatticeError NullPointer clicked 为空
     */
    static UIElementPtr Create(std::string text, UISharedValuePtr<bool> clicked, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::Button; }
    void Paint(const UIElement& self, UIPainter& painter) override;

    [[nodiscard]] const std::string& GetText() const noexcept { return m_text; }
    void SetText(std::string text);

    [[nodiscard]] bool IsDisabled() const noexcept { return m_disabled; }
    void SetDisabled(bool disabled);

    [[nodiscard]] bool WasClicked() const noexcept { return m_clicked->Get(); }
    [[nodiscard]] const UISharedValuePtr<bool>& GetClickedCell() const noexcept { return m_clicked; }

    void SetClickHandler(ClickHandler handler) { m_onClick = std::move(handler); }

protected:
    [[nodiscard]] Size Measure(const UIElement& self) const override;

private:
    std::string m_text;
    UISharedValuePtr<bool> m_clicked;
    ClickHandler m_onClick;
    bool m_disabled = false;
};

} // namespace Lattice::UI
