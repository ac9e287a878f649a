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
#include "lattice/ui/ui_text_metrics.h"

#include <algorithm>
#include <cmath>

#include "lattice/logger.h"

namespace Lattice::UI {

namespace {

Ref<UITextMetrics>& DefaultMetricsSlot() {
    static Ref<UITextMetrics> metrics = CreateRef<UIMonospaceTextMetrics>();
    return metrics;
}

bool IsContinuationByte(char c) noexcept {
    return (static_cast<unsigned char>(c) & 0xC0u) == 0x80u;
}

} // namespace

size_t CountCodePoints(std::string_view text) noexcept {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) { return !IsContinuationByte(c); }));
}

std::string_view TruncateCodePoints(std::string_view text, size_t maxCodePoints) noexcept {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (IsContinuationByte(text[i])) {
            continue;
        }
        // 第 maxCodePoints + 1 个码点的首字节即截断位置
        if (seen == maxCodePoints) {
            return text.substr(0, i);
        }
        ++seen;
    }
    return text;
}

void UITextMetrics::SetDefault(Ref<UITextMetrics> metrics) {
    if (!metrics) {
        Logger::GetInstance().Warning("[UITextMetrics] Null metrics ignored, keeping current provider");
        return;
    }
    DefaultMetricsSlot() = std::move(metrics);
}

const UITextMetrics& UITextMetrics::GetDefault() {
    return *DefaultMetricsSlot();
}

UIMonospaceTextMetrics::UIMonospaceTextMetrics(float glyphAdvance, float lineHeight)
    : m_glyphAdvance(std::max(0.0f, glyphAdvance))
    , m_lineHeight(std::max(1.0f, lineHeight)) {
}

float UIMonospaceTextMetrics::MeasureRun(std::string_view run) const {
    return static_cast<float>(CountCodePoints(run)) * m_glyphAdvance;
}

Size UIMonospaceTextMetrics::MeasureText(std::string_view text) const {
    if (text.empty()) {
        return Size(0.0f, 0.0f);
    }

    float width = 0.0f;
    int lines = 0;
    size_t start = 0;
    while (start <= text.size()) {
        const size_t end = text.find('\n', start);
        const std::string_view line = text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        width = std::max(width, MeasureRun(line));
        ++lines;
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }

    return Size(width, static_cast<float>(lines) * m_lineHeight);
}

int UIMonospaceTextMetrics::CountWrappedLines(std::string_view paragraph, float maxWidth) const {
    const float spaceWidth = m_glyphAdvance;
    int lines = 1;
    float lineWidth = 0.0f;

    size_t pos = 0;
    while (pos < paragraph.size()) {
        const size_t next = paragraph.find(' ', pos);
        const std::string_view word = paragraph.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
        const float wordWidth = MeasureRun(word);

        if (!word.empty()) {
            const float needed = lineWidth > 0.0f ? lineWidth + spaceWidth + wordWidth : wordWidth;
            if (needed <= maxWidth) {
                lineWidth = needed;
            } else if (wordWidth <= maxWidth) {
                // 换到新行
                if (lineWidth > 0.0f) {
                    ++lines;
                }
                lineWidth = wordWidth;
            } else {
                // 超长单词按宽度截断成多行
                if (lineWidth > 0.0f) {
                    ++lines;
                }
                const int pieces = static_cast<int>(std::ceil(wordWidth / maxWidth));
                lines += pieces - 1;
                lineWidth = wordWidth - static_cast<float>(pieces - 1) * maxWidth;
            }
        }

        if (next == std::string_view::npos) {
            break;
        }
        pos = next + 1;
    }

    return lines;
}

float UIMonospaceTextMetrics::MeasureWrappedHeight(std::string_view text, float maxWidth) const {
    if (text.empty()) {
        return 0.0f;
    }
    if (maxWidth <= 0.0f || m_glyphAdvance <= 0.0f) {
        return MeasureText(text).height;
    }

    int lines = 0;
    size_t start = 0;
    while (true) {
        const size_t end = text.find('\n', start);
        const std::string_view paragraph = text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        lines += CountWrappedLines(paragraph, maxWidth);
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }

    return static_cast<float>(lines) * m_lineHeight;
}

} // namespace Lattice::UI
