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
 * @brief 单选按钮
 *
 * 同组按钮共享一个整数单元，单元值等于自身 index 时为选中。
 * 尺寸：24 + 6 + 文本宽 x max(24, 行高)。
 */
class UIRadioButton final : public UIWidgetKind {
public:
    UIRadioButton(std::string label, UISharedValuePtr<int> selected, int index);

    /**
     * @throws LatticeError NullPointer selected 为空
     */
    static UIElementPtr Create(std::string label, UISharedValuePtr<int> selected, int index,
                               UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::RadioButton; }
    void Paint(const UIElement& self, UIPainter& painter) override;

    [[nodiscard]] const std::string& GetLabel() const noexcept { return m_label; }
    void SetLabel(std::string label);

    [[nodiscard]] int GetIndex() const noexcept { return m_index; }
    [[nodiscard]] bool IsSelected() const noexcept { return m_selected->Get() == m_index; }

protected:
    [[nodiscard]] Size Measure(const UIElement& self) const override;

private:
    std::string m_label;
    UISharedValuePtr<int> m_selected;
    int m_index;
};

} // namespace Lattice::UI
