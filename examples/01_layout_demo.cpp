/**
 * @file 01_layout_demo.cpp
 * @brief 布局引擎演示：控制台绘制器输出每个控件解析后的矩形
 */

#include "lattice/logger.h"
#include "lattice/ui/layout/ui_fill_grid.h"
#include "lattice/ui/layout/ui_row.h"
#include "lattice/ui/layout/ui_scroll_container.h"
#include "lattice/ui/layout/ui_stack.h"
#include "lattice/ui/ui_painter.h"
#include "lattice/ui/ui_scroll_canvas.h"
#include "lattice/ui/widgets/ui_button.h"
#include "lattice/ui/widgets/ui_checkbox.h"
#include "lattice/ui/widgets/ui_dropdown.h"
#include "lattice/ui/widgets/ui_label.h"
#include "lattice/ui/widgets/ui_line.h"
#include "lattice/ui/widgets/ui_numeric_field.h"
#include "lattice/ui/widgets/ui_range_slider.h"
#include "lattice/ui/widgets/ui_slider.h"

#include <cstdio>
#include <iostream>
#include <string>

using namespace Lattice;
using namespace Lattice::UI;

namespace {

// 把绘制调用打印成一行一条，滚动视图内的调用缩进
class ConsolePainter final : public UIPainter {
public:
    bool DrawButton(const Rect& rect, std::string_view text, bool enabled) override {
        Print(enabled ? "Button" : "Button(disabled)", rect, text);
        return false;
    }

    bool DrawCheckbox(const Rect& rect, std::string_view label, bool checked) override {
        Print(checked ? "Checkbox[x]" : "Checkbox[ ]", rect, label);
        return checked;
    }

    bool DrawRadioButton(const Rect& rect, std::string_view label, bool selected) override {
        Print(selected ? "Radio(o)" : "Radio( )", rect, label);
        return false;
    }

    bool DrawImageButton(const Rect& rect, const UITexture& texture, bool enabled) override {
        Print(enabled ? "ImageButton" : "ImageButton(disabled)", rect, std::to_string(texture.handle));
        return false;
    }

    UIValueRange<float> DrawRangeSlider(const Rect& rect, UIValueRange<float> range, float /*min*/,
                                        float /*max*/) override {
        Print("RangeSlider", rect, std::to_string(range.lower) + " .. " + std::to_string(range.upper));
        return range;
    }

    float DrawSlider(const Rect& rect, float value, float /*min*/, float /*max*/) override {
        Print("Slider", rect, std::to_string(value));
        return value;
    }

    std::string DrawTextField(const Rect& rect, std::string_view text, bool multiline) override {
        Print(multiline ? "TextArea" : "TextField", rect, text);
        return std::string(text);
    }

    int DrawDropdown(const Rect& rect, std::string_view displayText,
                     const std::vector<std::string>& /*items*/) override {
        Print("Dropdown", rect, displayText);
        return -1;
    }

    void DrawLabel(const Rect& rect, std::string_view text, bool /*wordWrap*/, UIAlignment /*anchor*/) override {
        Print("Label", rect, text);
    }

    void DrawLine(const Vector2& from, const Vector2& to, float /*thickness*/, const Color& /*color*/) override {
        Indent();
        std::printf("Line (%.0f,%.0f) -> (%.0f,%.0f)\n", from.x(), from.y(), to.x(), to.y());
    }

    void FillRect(const Rect& /*rect*/, const Color& /*color*/) override {}

    void DrawMenuSection(const Rect& rect) override {
        Print("Section", rect, {});
    }

    void ShowTooltip(const Rect& /*rect*/, std::string_view /*text*/) override {}

    void OpenColorPicker(const UISharedValuePtr<Color>& /*color*/, UIColorPickerMode /*mode*/,
                         const std::vector<Color>& /*palette*/) override {}

    void BeginScrollView(const Rect& outRect, Vector2& /*scrollPosition*/,
                         const Rect& viewRect, bool /*showScrollbars*/) override {
        Print("BeginScroll", outRect, {});
        Indent();
        std::printf("  view (%.0f,%.0f %.0fx%.0f)\n", viewRect.x, viewRect.y, viewRect.width, viewRect.height);
        ++m_depth;
    }

    void EndScrollView() override {
        --m_depth;
        Indent();
        std::printf("EndScroll\n");
    }

private:
    void Indent() const {
        for (int i = 0; i < m_depth; ++i) {
            std::printf("  ");
        }
    }

    void Print(const char* op, const Rect& rect, std::string_view text) const {
        Indent();
        std::printf("%-16s (%.0f,%.0f %.0fx%.0f) %.*s\n", op, rect.x, rect.y, rect.width, rect.height,
                    static_cast<int>(text.size()), text.data());
    }

    int m_depth = 0;
};

} // namespace

int main() {
    Logger::GetInstance().SetLogToFile(false);
    Logger::GetInstance().SetLogLevel(LogLevel::Info);

    auto scroll = MakeSharedValue<Vector2>(Vector2::Zero());
    auto clicked = MakeSharedValue<bool>(false);
    auto vsync = MakeSharedValue<bool>(true);
    auto quality = MakeSharedValue<int>(1);
    auto volume = MakeSharedValue<float>(65.0f);
    auto frameLimit = MakeSharedValue<int>(60);
    auto levelRange = MakeSharedValue<UIValueRange<int>>({1, 10});

    auto window = UIScrollCanvas::Create(Rect(0.0f, 0.0f, 400.0f, 300.0f), {.scrollPosition = scroll, .padding = 8.0f});

    auto* stack = window->AddChild(UIStack::Create({.id = "settings", .widthMode = SizeMode::Fill}));
    stack->AddChild(UILabel::Create("Settings"));
    stack->AddChild(UILine::Create(UILineOrientation::Horizontal, 1.0f, Color::White(), {.widthMode = SizeMode::Fill}));

    auto* row = stack->AddChild(UIRow::Create());
    row->AddChild(UICheckbox::Create("VSync", vsync));
    row->AddChild(UIDropdown::Create({"Low", "Medium", "High"}, quality, "Quality"));

    stack->AddChild(UISlider::Create({.label = "Volume", .value = volume, .min = 0.0f, .max = 100.0f, .roundTo = 5.0f},
                                     {.widthMode = SizeMode::Fill}));
    stack->AddChild(UIIntField::Create({.label = "Frame limit", .value = frameLimit, .min = 0, .max = 240,
                                        .placement = UINumericLabelPlacement::Inline}));
    stack->AddChild(UIIntRangeSlider::Create({.range = levelRange, .min = 1, .max = 20, .gap = 1}));

    auto* grid = stack->AddChild(UIFillGrid::Create({.columns = 3, .columnSpacing = 4.0f}));
    for (const char* name : {"Apply", "Reset", "Close"}) {
        grid->AddChild(UIButton::Create(name, clicked, {.widthMode = SizeMode::Fill}));
    }

    auto* log = stack->AddChild(UIScrollContainer::Create({.padding = 4.0f}, {.width = 200.0f, .height = 60.0f,
                                                          .widthMode = SizeMode::Fixed,
                                                          .heightMode = SizeMode::Fixed}));
    for (int i = 0; i < 6; ++i) {
        log->AddChild(UILabel::Create("Log line " + std::to_string(i)));
    }

    ConsolePainter painter;
    std::cout << "========== 400x300 ==========" << std::endl;
    window->Render(painter);

    // 窗口缩小后 Fill 子元素随之收缩
    window->As<UIScrollCanvas>()->UpdateRect(Rect(0.0f, 0.0f, 260.0f, 300.0f));
    std::cout << "\n========== 260x300 ==========" << std::endl;
    window->Render(painter);

    LOG_INFO_F("[LayoutDemo] Settings stack resolved to %.0fx%.0f", stack->GetWidth(), stack->GetHeight());
    return 0;
}
