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

#include <string>

#include "lattice/ui/ui_shared_value.h"
#include "lattice/ui/widgets/ui_widget_kind.h"

namespace Lattice::UI {

/**
 * @brief 复选框，可带标签
 *
 * 尺寸：无标签 24x24；有标签 24 + 4 + 文本宽 x 24。
 */
class UICheckbox final : public UIWidgetKind {
public:
    UICheckbox(std::string label, UISharedValuePtr<bool> checked);

    /**
     * @throws LatticeError NullPointer checked 为空
     */
    static UIElementPtr Create(std::string label, UISharedValuePtr<bool> checked, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::Checkbox; }
    void Paint(const UIElement& self, UIPainter& painter) override;

    [[nodiscard]] const std::string& GetLabel() const noexcept { return m_label; }
    void SetLabel(std::string label);

    [[nodiscard]] bool IsChecked() const noexcept { return m_checked->Get(); }
    void SetChecked(bool checked) { m_checked->Set(checked); }

    /// 上一帧绘制是否改变了勾选状态
    [[nodiscard]] bool HasChanged() const noexcept { return m_changed; }

protected:
    [[nodiscard]] Size Measure(const UIElement& self) const override;

private:
    std::string m_label;
    UISharedValuePtr<bool> m_checked;
    bool m_changed = false;
};

} // namespace Lattice::UI
