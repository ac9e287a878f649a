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

#include <optional>
#include <string>

#include "lattice/ui/widgets/ui_widget_kind.h"

namespace Lattice::UI {

/**
 * @brief 文本标签，按元素的对齐方式绘制
 *
 * 尺寸：
 * - 空文本：1 x 行高
 * - 不换行：文本宽 x 行高
 * - 换行且给出 maxWidth：maxWidth x 换行高度
 * - 换行无 maxWidth：min(文本宽, 300) x 换行高度；宽度为 Fixed / Fill 时
 *   高度按元素的实际宽度换行计算
 */
class UILabel final : public UIWidgetKind {
public:
    UILabel(std::string text, bool wordWrap, std::optional<float> maxWidth);

    static UIElementPtr Create(std::string text, bool wordWrap = false, std::optional<float> maxWidth = std::nullopt,
                               UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::Label; }
    void Paint(const UIElement& self, UIPainter& painter) override;
    void OnSizeInvalidated(UIElement& self, UIAxisMask axes) override;

    [[nodiscard]] const std::string& GetText() const noexcept { return m_text; }
    void SetText(std::string text);

    [[nodiscard]] bool GetWordWrap() const noexcept { return m_wordWrap; }
    void SetWordWrap(bool wordWrap);

    [[nodiscard]] const std::optional<float>& GetMaxWidth() const noexcept { return m_maxWidth; }
    void SetMaxWidth(std::optional<float> maxWidth);

protected:
    [[nodiscard]] Size Measure(const UIElement& self) const override;

private:
    [[nodiscard]] float GetWrapWidth(const UIElement& self, float intrinsicWidth) const;

    std::string m_text;
    bool m_wordWrap;
    std::optional<float> m_maxWidth;
};

} // namespace Lattice::UI
