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

#include <cstddef>
#include <optional>
#include <string>

#include "lattice/ui/ui_shared_value.h"
#include "lattice/ui/widgets/ui_widget_kind.h"

namespace Lattice::UI {

struct UITextEntryOptions {
    std::string label;
    UISharedValuePtr<std::string> text;
    int lineCount = 1;                      // > 1 时为多行文本区
    std::optional<size_t> maxLength;        // 按 UTF-8 码点计数
};

/**
 * @brief 文本输入框，标签在上方
 *
 * 尺寸：无标签 150 x 行高*行数；有标签 max(150, 文本宽) x (行高 + 行高*行数)。
 */
class UITextEntry final : public UIWidgetKind {
public:
    explicit UITextEntry(UITextEntryOptions entry);

    /**
     * @throws LatticeError NullPointer text 为空
     */
    static UIElementPtr Create(UITextEntryOptions entry, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::TextEntry; }
    void Paint(const UIElement& self, UIPainter& painter) override;

    [[nodiscard]] const std::string& GetLabel() const noexcept { return m_label; }
    void SetLabel(std::string label);

    [[nodiscard]] const std::string& GetText() const noexcept { return m_text->Get(); }

    [[nodiscard]] int GetLineCount() const noexcept { return m_lineCount; }
    void SetLineCount(int lineCount);
    [[nodiscard]] bool IsMultiLine() const noexcept { return m_lineCount > 1; }

    [[nodiscard]] const std::optional<size_t>& GetMaxLength() const noexcept { return m_maxLength; }
    void SetMaxLength(std::optional<size_t> maxLength) { m_maxLength = maxLength; }

    [[nodiscard]] bool HasChanged() const noexcept { return m_changed; }

protected:
    [[nodiscard]] Size Measure(const UIElement& self) const override;

private:
    std::string m_label;
    UISharedValuePtr<std::string> m_text;
    int m_lineCount;
    std::optional<size_t> m_maxLength;
    bool m_changed = false;
};

} // namespace Lattice::UI
