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
#include <string_view>

#include "lattice/types.h"

namespace Lattice::UI {

/// UTF-8 码点数量（续字节 10xxxxxx 不计数）
[[nodiscard]] size_t CountCodePoints(std::string_view text) noexcept;

/**
 * @brief 截取前 maxCodePoints 个码点，不会切断多字节序列
 */
[[nodiscard]] std::string_view TruncateCodePoints(std::string_view text, size_t maxCodePoints) noexcept;

/**
 * @brief 文本度量提供者
 *
 * 仅被文本类叶子控件的 Content 尺寸计算使用，单位与布局单位一致。
 */
class UITextMetrics {
public:
    virtual ~UITextMetrics() = default;

    /**
     * @brief 不换行时的文本尺寸（多行文本按 '\n' 分行）
     */
    [[nodiscard]] virtual Size MeasureText(std::string_view text) const = 0;

    /**
     * @brief 在给定最大宽度下自动换行后的高度
     */
    [[nodiscard]] virtual float MeasureWrappedHeight(std::string_view text, float maxWidth) const = 0;

    [[nodiscard]] virtual float GetLineHeight() const = 0;

    [[nodiscard]] float MeasureWidth(std::string_view text) const { return MeasureText(text).width; }

    /**
     * @brief 进程级默认提供者（宿主应用在初始化时替换）
     */
    static void SetDefault(Ref<UITextMetrics> metrics);
    [[nodiscard]] static const UITextMetrics& GetDefault();
};

/**
 * @brief 等宽字体度量：每个字符固定步进，贪心按单词换行
 *
 * 结果完全确定，适合无图形环境和测试。
 */
class UIMonospaceTextMetrics final : public UITextMetrics {
public:
    explicit UIMonospaceTextMetrics(float glyphAdvance = 8.0f, float lineHeight = 20.0f);

    [[nodiscard]] Size MeasureText(std::string_view text) const override;
    [[nodiscard]] float MeasureWrappedHeight(std::string_view text, float maxWidth) const override;
    [[nodiscard]] float GetLineHeight() const override { return m_lineHeight; }

    [[nodiscard]] float GetGlyphAdvance() const noexcept { return m_glyphAdvance; }

private:
    [[nodiscard]] float MeasureRun(std::string_view run) const;
    [[nodiscard]] int CountWrappedLines(std::string_view paragraph, float maxWidth) const;

    float m_glyphAdvance;
    float m_lineHeight;
};

} // namespace Lattice::UI
