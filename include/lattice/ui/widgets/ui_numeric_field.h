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
#include <string_view>
#include <type_traits>

#include "lattice/ui/ui_shared_value.h"
#include "lattice/ui/widgets/ui_widget_kind.h"

namespace Lattice::UI {

enum class UINumericLabelPlacement : uint8_t {
    Above,      // 标签一行，输入框在下方
    Inline      // 标签在左，输入框在右
};

template <typename T>
struct UINumericFieldOptions {
    std::string label;
    UISharedValuePtr<T> value;           // 为空时内部创建
    std::optional<T> min;                // 默认 0
    std::optional<T> max;                // 默认 1e9
    UINumericLabelPlacement placement = UINumericLabelPlacement::Above;
};

/**
 * @brief 数值输入框
 *
 * 编辑的是文本缓冲区；缓冲区能完整解析为数值时夹紧到 [min, max] 写回单元，
 * 解析失败（空文本、输入到一半的 "-"）时保留缓冲区、数值不变。
 * 单元被外部修改后，下一帧缓冲区重新格式化为新值。
 *
 * 尺寸（输入框宽 120）：
 * - 无标签：120 x 行高
 * - 标签在上：max(120, 标签宽) x 2 行高
 * - 标签在左：标签宽 + 6 + 120 x 行高；宽度为 Fill 时输入框占满剩余宽度
 */
template <typename T>
class UINumericField final : public UIWidgetKind {
    static_assert(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, "UINumericField requires a numeric type");

public:
    static constexpr T kDefaultMin = static_cast<T>(0);
    static constexpr T kDefaultMax = static_cast<T>(1000000000);

    explicit UINumericField(UINumericFieldOptions<T> field);

    /**
     * @throws LatticeError InvalidArgument min > max
     */
    static UIElementPtr Create(UINumericFieldOptions<T> field, UIElementOptions options = {});

    [[nodiscard]] UIElementType GetType() const noexcept override { return UIElementType::NumericField; }
    void Paint(const UIElement& self, UIPainter& painter) override;

    [[nodiscard]] const std::string& GetLabel() const noexcept { return m_label; }
    void SetLabel(std::string label);

    [[nodiscard]] UINumericLabelPlacement GetPlacement() const noexcept { return m_placement; }
    void SetPlacement(UINumericLabelPlacement placement);

    [[nodiscard]] T GetValue() const noexcept { return m_value->Get(); }
    /// 写入前夹紧
    void SetValue(T value);

    [[nodiscard]] T GetMin() const noexcept { return m_min; }
    [[nodiscard]] T GetMax() const noexcept { return m_max; }

    /**
     * @brief 修改取值范围，当前值随之夹紧
     * @throws LatticeError InvalidArgument min > max
     */
    void SetRange(T min, T max);

    [[nodiscard]] const std::string& GetBuffer() const noexcept { return m_buffer; }

    [[nodiscard]] bool HasChanged() const noexcept { return m_changed; }

    /**
     * @brief 解析完整文本（允许首尾空格），不能完整解析时返回空
     */
    [[nodiscard]] static std::optional<T> Parse(std::string_view text);
    [[nodiscard]] static std::string Format(T value);

protected:
    [[nodiscard]] Size Measure(const UIElement& self) const override;

private:
    void SyncBuffer();

    std::string m_label;
    UISharedValuePtr<T> m_value;
    T m_min;
    T m_max;
    UINumericLabelPlacement m_placement;

    std::string m_buffer;
    std::optional<T> m_bufferValue;     // 缓冲区当前表示的数值
    bool m_changed = false;
};

using UIIntField = UINumericField<int>;
using UIFloatField = UINumericField<float>;
using UIDoubleField = UINumericField<double>;

extern template class UINumericField<int>;
extern template class UINumericField<float>;
extern template class UINumericField<double>;

} // namespace Lattice::UI
