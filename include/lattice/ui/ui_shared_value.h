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

#include <utility>

#include "lattice/types.h"

namespace Lattice::UI {

/**
 * @brief 引用计数的共享状态单元
 *
 * 多个控件（或多帧重建的控件树）持有同一个单元时观察到同一个值，
 * 这是有意的共享，而非意外的别名。单元由宿主应用持有，
 * 每帧重建 UI 树时作为持久状态传入，例如滚动位置、复选框状态。
 */
template <typename T>
class UISharedValue {
public:
    UISharedValue() = default;
    explicit UISharedValue(T value) : m_value(std::move(value)) {}

    [[nodiscard]] const T& Get() const noexcept { return m_value; }
    void Set(T value) { m_value = std::move(value); }

    /**
     * @brief 直接引用，供需要 ref 形参的立即模式绘制接口使用
     */
    [[nodiscard]] T& Value() noexcept { return m_value; }

private:
    T m_value{};
};

template <typename T>
using UISharedValuePtr = Ref<UISharedValue<T>>;

template <typename T>
UISharedValuePtr<T> MakeSharedValue(T value = T{}) {
    return CreateRef<UISharedValue<T>>(std::move(value));
}

} // namespace Lattice::UI
