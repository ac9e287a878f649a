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
#include <vector>

#include "lattice/ui/ui_shared_value.h"
#include "lattice/ui/widgets/ui_widget_kind.h"

namespace Lattice::UI {

/**
 * @brief 下拉选择框
 *
 * 选中索引越界时显示占位文本。宽度 max(150, 最宽条目 + 30, 占位文本 + 30)，高度 30。
 */
class UIDropdown final : public UIWidgetKind {
public:
    UIDropdown(std::vector<std::string> items, UISharedValuePtr<int> selected, std::string placeholder);

    /**
     * @throws LatticeError NullPointer selected 为空
     */
    static UIElementPtr Create(std::vector<std::string> items, UISharedValuePtr<int> selected,
                               std::string placeholder = {}, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::Dropdown; }
    void Paint(const UIElement& self, UIPainter& painter) override;

    [[nodiscard]] const std::vector<std::string>& GetItems() const noexcept { return m_items; }
    void SetItems(std::vector<std::string> items);

    [[nodiscard]] const std::string& GetPlaceholder() const noexcept { return m_placeholder; }
    void SetPlaceholder(std::string placeholder);

    [[nodiscard]] int GetSelectedIndex() const noexcept { return m_selected->Get(); }
    [[nodiscard]] bool HasSelection() const noexcept;

    /// 选中条目的文本，没有有效选择时为占位文本
    [[nodiscard]] const std::string& GetDisplayText() const noexcept;

    [[nodiscard]] bool HasChanged() const noexcept { return m_changed; }

protected:
    [[nodiscard]] Size Measure(const UIElement& self) const override;

private:
    std::vector<std::string> m_items;
    UISharedValuePtr<int> m_selected;
    std::string m_placeholder;
    bool m_changed = false;
};

} // namespace Lattice::UI
