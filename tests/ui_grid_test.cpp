/**
 * @file ui_grid_test.cpp
 * @brief UIGrid / UIFillGrid 网格布局测试（CTest 兼容版本）
 */

#include "lattice/error.h"
#include "lattice/logger.h"
#include "lattice/ui/layout/ui_fill_grid.h"
#include "lattice/ui/layout/ui_grid.h"
#include "ui_test_painter.h"

#include <cmath>
#include <iostream>

using namespace Lattice;
using namespace Lattice::UI;

// ============================================================================
// 简单的测试框架（CTest 兼容）
// ============================================================================

static int g_testCount = 0;
static int g_passedCount = 0;
static int g_failedCount = 0;

#define TEST_ASSERT(condition, message) \
    do { \
        g_testCount++; \
        if (!(condition)) { \
            std::cerr << "❌ 测试失败: " << message << std::endl; \
            std::cerr << "   位置: " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::cerr << "   条件: " << #condition << std::endl; \
            g_failedCount++; \
            return false; \
        } \
        g_passedCount++; \
    } while(0)

#define TEST_ASSERT_NEAR(actual, expected, tolerance, message) \
    do { \
        g_testCount++; \
        float diff = std::abs((actual) - (expected)); \
        if (diff > (tolerance)) { \
            std::cerr << "❌ 测试失败: " << message << std::endl; \
            std::cerr << "   位置: " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::cerr << "   实际值: " << (actual) << std::endl; \
            std::cerr << "   期望值: " << (expected) << std::endl; \
            std::cerr << "   差值: " << diff << " (容忍度: " << (tolerance) << ")" << std::endl; \
            g_failedCount++; \
            return false; \
        } \
        g_passedCount++; \
    } while(0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "运行测试: " << #test_func << "..." << std::endl; \
        if (test_func()) { \
            std::cout << "✓ " << #test_func << " 通过" << std::endl; \
        } else { \
            std::cout << "✗ " << #test_func << " 失败" << std::endl; \
        } \
    } while(0)

UIElementPtr MakeBox(float width, float height, UIAlignment alignment = UIAlignment::UpperLeft) {
    UIElementOptions options;
    options.width = width;
    options.height = height;
    options.alignment = alignment;
    return UIElement::Create(std::move(options));
}

UIElementPtr MakeFillBox() {
    UIElementOptions options;
    options.widthMode = SizeMode::Fill;
    options.heightMode = SizeMode::Fill;
    return UIElement::Create(std::move(options));
}

// ============================================================================
// 构造与参数
// ============================================================================

bool Test_Grid_RejectsNonPositiveColumns() {
    bool threw = false;
    try {
        auto grid = UIGrid::Create({.columns = 0});
    } catch (const LatticeError& e) {
        threw = e.GetCode() == ErrorCode::InvalidLayoutParameter;
    }
    TEST_ASSERT(threw, "列数为 0 应抛出 InvalidLayoutParameter");

    auto grid = UIGrid::Create({.columns = 2});
    threw = false;
    try {
        grid->As<UIGrid>()->SetColumns(-1);
    } catch (const LatticeError& e) {
        threw = e.GetCode() == ErrorCode::InvalidLayoutParameter;
    }
    TEST_ASSERT(threw, "SetColumns 负数应抛出异常");
    TEST_ASSERT(grid->As<UIGrid>()->GetColumns() == 2, "列数保持不变");
    return true;
}

bool Test_Grid_DefaultsToContent() {
    auto grid = UIGrid::Create({.columns = 2});
    TEST_ASSERT(grid->GetType() == UIElementType::Grid, "类型为 Grid");
    TEST_ASSERT(grid->GetWidthMode() == SizeMode::Content, "默认宽度 Content");
    TEST_ASSERT(grid->GetHeightMode() == SizeMode::Content, "默认高度 Content");
    return true;
}

// ============================================================================
// 单元格尺寸
// ============================================================================

bool Test_Grid_EmptyUsesDefaultCell() {
    auto grid = UIGrid::Create({.columns = 2});
    TEST_ASSERT(grid->GetWidth() == 100.0f, "两列默认单元格宽 50");
    TEST_ASSERT(grid->GetHeight() == 30.0f, "空网格占一行，高 30");
    return true;
}

bool Test_Grid_AutoCellFromLargestChild() {
    auto grid = UIGrid::Create({.columns = 3, .columnSpacing = 5.0f, .rowSpacing = 4.0f, .padding = 10.0f});
    grid->AddChild(MakeBox(20.0f, 10.0f));
    grid->AddChild(MakeBox(40.0f, 12.0f));
    grid->AddChild(MakeBox(30.0f, 20.0f));
    grid->AddChild(MakeBox(10.0f, 5.0f));
    grid->AddChild(MakeBox(15.0f, 15.0f));

    auto* kind = grid->As<UIGrid>();
    TEST_ASSERT(kind->GetCellWidth() == 40.0f, "单元格宽为最大子元素宽度");
    TEST_ASSERT(kind->GetCellHeight() == 20.0f, "单元格高为最大子元素高度");
    TEST_ASSERT(grid->GetWidth() == 150.0f, "40*3 + 5*2 + 10*2");
    TEST_ASSERT(grid->GetHeight() == 64.0f, "两行：20*2 + 4 + 10*2");
    TEST_ASSERT(kind->GetActualRows() == 2, "实际行数为 2");
    return true;
}

bool Test_Grid_ExplicitCellSize() {
    auto grid = UIGrid::Create({.columns = 2, .rows = 3, .cellWidth = 60.0f, .cellHeight = 25.0f});
    grid->AddChild(MakeBox(200.0f, 200.0f));
    TEST_ASSERT(grid->GetWidth() == 120.0f, "显式单元格宽 60 x 2");
    TEST_ASSERT(grid->GetHeight() == 75.0f, "显式单元格高 25 x 3 行");
    return true;
}

bool Test_Grid_FixedSizeDividesSpace() {
    auto grid = UIGrid::Create({.columns = 2, .rows = 2, .columnSpacing = 10.0f, .padding = 5.0f},
                               {.width = 230.0f, .height = 100.0f});
    auto* kind = grid->As<UIGrid>();
    TEST_ASSERT(kind->GetCellWidth() == 105.0f, "(230 - 10 - 10) / 2");
    TEST_ASSERT(kind->GetCellHeight() == 45.0f, "(100 - 10) / 2");
    return true;
}

bool Test_Grid_FixedHeightUnboundedRowsUsesChildren() {
    auto grid = UIGrid::Create({.columns = 2}, {.width = 100.0f, .height = 300.0f});
    grid->AddChild(MakeBox(10.0f, 35.0f));
    TEST_ASSERT(grid->As<UIGrid>()->GetCellHeight() == 35.0f, "行数不限时单元格高度来自子元素");
    TEST_ASSERT(grid->As<UIGrid>()->GetCellWidth() == 50.0f, "宽度按列数平分");
    return true;
}

bool Test_Grid_CellNeverBelowOne() {
    auto grid = UIGrid::Create({.columns = 4, .columnSpacing = 20.0f}, {.width = 30.0f, .height = 30.0f});
    TEST_ASSERT(grid->As<UIGrid>()->GetCellWidth() == 1.0f, "空间不足时单元格宽度为 1");
    return true;
}

bool Test_Grid_SetColumnsRecomputes() {
    auto grid = UIGrid::Create({.columns = 2});
    for (int i = 0; i < 4; ++i) {
        grid->AddChild(MakeBox(30.0f, 10.0f));
    }
    TEST_ASSERT(grid->GetWidth() == 60.0f, "两列宽 60");
    TEST_ASSERT(grid->GetHeight() == 20.0f, "两行高 20");

    grid->As<UIGrid>()->SetColumns(4);
    TEST_ASSERT(grid->GetWidth() == 120.0f, "四列宽 120");
    TEST_ASSERT(grid->GetHeight() == 10.0f, "一行高 10");
    return true;
}

bool Test_Grid_ChildResizeRefreshesAutoCell() {
    auto grid = UIGrid::Create({.columns = 2});
    auto* a = grid->AddChild(MakeBox(30.0f, 10.0f));
    grid->AddChild(MakeBox(20.0f, 10.0f));
    TEST_ASSERT(grid->As<UIGrid>()->GetCellWidth() == 30.0f, "初始单元格宽度");

    a->SetWidth(70.0f);
    TEST_ASSERT(grid->As<UIGrid>()->GetCellWidth() == 70.0f, "子元素变宽后单元格随之变宽");
    TEST_ASSERT(grid->GetWidth() == 140.0f, "网格宽度随之更新");
    return true;
}

// ============================================================================
// Fill 子元素
// ============================================================================

bool Test_Grid_FillChildTakesCell() {
    auto grid = UIGrid::Create({.columns = 2, .cellWidth = 80.0f, .cellHeight = 40.0f});
    auto* fill = grid->AddChild(MakeFillBox());
    TEST_ASSERT(fill->GetWidth() == 80.0f, "Fill 宽度等于单元格宽度");
    TEST_ASSERT(fill->GetHeight() == 40.0f, "Fill 高度等于单元格高度");

    grid->As<UIGrid>()->SetCellWidth(120.0f);
    TEST_ASSERT(fill->GetWidth() == 120.0f, "单元格变化后 Fill 子元素跟随");
    return true;
}

bool Test_Grid_FillChildInAutoCell() {
    auto grid = UIGrid::Create({.columns = 2});
    grid->AddChild(MakeBox(60.0f, 20.0f));
    auto* fill = grid->AddChild(MakeFillBox());

    TEST_ASSERT(grid->As<UIGrid>()->GetCellWidth() == 60.0f, "自动单元格忽略 Fill 子元素的回退值");
    TEST_ASSERT(fill->GetWidth() == 60.0f, "Fill 子元素占满自动单元格");
    TEST_ASSERT(fill->GetHeight() == 20.0f, "Fill 子元素高度等于单元格高度");
    return true;
}

// ============================================================================
// 排列
// ============================================================================

bool Test_Grid_NineAlignments() {
    auto grid = UIGrid::Create({.columns = 3, .rows = 3, .cellWidth = 100.0f, .cellHeight = 50.0f});
    UIElement* children[9] = {};
    for (int i = 0; i < 9; ++i) {
        children[i] = grid->AddChild(MakeBox(20.0f, 10.0f, static_cast<UIAlignment>(i)));
    }
    grid->UpdateLayout();

    for (int i = 0; i < 9; ++i) {
        const int column = i % 3;
        const int row = i / 3;
        const float expectedX = static_cast<float>(column) * 100.0f + 80.0f * GetHorizontalAnchor(static_cast<UIAlignment>(i));
        const float expectedY = static_cast<float>(row) * 50.0f + 40.0f * GetVerticalAnchor(static_cast<UIAlignment>(i));
        TEST_ASSERT_NEAR(children[i]->GetX(), expectedX, 0.001f, "水平对齐位置");
        TEST_ASSERT_NEAR(children[i]->GetY(), expectedY, 0.001f, "垂直对齐位置");
    }

    TEST_ASSERT(children[4]->GetPosition() == Vector2(140.0f, 70.0f), "中心对齐位于单元格中央");
    TEST_ASSERT(children[8]->GetPosition() == Vector2(280.0f, 140.0f), "右下对齐贴在单元格右下角");
    return true;
}

bool Test_Grid_OversizedChildPinnedToCellStart() {
    auto grid = UIGrid::Create({.columns = 2, .cellWidth = 50.0f, .cellHeight = 20.0f, .columnSpacing = 5.0f},
                               {.x = 10.0f, .y = 10.0f});
    grid->AddChild(MakeBox(10.0f, 10.0f));
    auto* big = grid->AddChild(MakeBox(80.0f, 40.0f, UIAlignment::MiddleCenter));
    grid->UpdateLayout();

    TEST_ASSERT(big->GetX() == 65.0f, "超出单元格的子元素贴在单元格左边");
    TEST_ASSERT(big->GetY() == 10.0f, "超出单元格的子元素贴在单元格上边");
    return true;
}

bool Test_Grid_PaddingOffsetsOrigin() {
    auto grid = UIGrid::Create({.columns = 2, .cellWidth = 30.0f, .cellHeight = 30.0f,
                                .columnSpacing = 6.0f, .rowSpacing = 4.0f, .padding = 8.0f},
                               {.x = 100.0f, .y = 200.0f});
    for (int i = 0; i < 3; ++i) {
        grid->AddChild(MakeBox(30.0f, 30.0f));
    }
    grid->UpdateLayout();

    TEST_ASSERT(grid->GetChild(0)->GetPosition() == Vector2(108.0f, 208.0f), "内边距偏移");
    TEST_ASSERT(grid->GetChild(1)->GetPosition() == Vector2(144.0f, 208.0f), "第二列 108 + 30 + 6");
    TEST_ASSERT(grid->GetChild(2)->GetPosition() == Vector2(108.0f, 242.0f), "第二行 208 + 30 + 4");
    return true;
}

bool Test_Grid_ChildrenBeyondRowsNotArranged() {
    auto grid = UIGrid::Create({.columns = 2, .rows = 1, .cellWidth = 20.0f, .cellHeight = 20.0f});
    grid->AddChild(MakeBox(20.0f, 20.0f));
    grid->AddChild(MakeBox(20.0f, 20.0f));
    auto* overflow = grid->AddChild(UIElement::Create({.x = -5.0f, .y = -5.0f, .width = 20.0f, .height = 20.0f}));
    grid->UpdateLayout();

    TEST_ASSERT(overflow->GetPosition() == Vector2(-5.0f, -5.0f), "超出行数的子元素位置不变");
    TEST_ASSERT(grid->GetHeight() == 20.0f, "高度按设定的行数计算");
    return true;
}

// ============================================================================
// 单元格查询
// ============================================================================

bool Test_Grid_Capacity() {
    auto bounded = UIGrid::Create({.columns = 3, .rows = 2});
    auto* kind = bounded->As<UIGrid>();
    TEST_ASSERT(kind->GetMaxCapacity() == 6, "容量为 3 x 2");
    for (int i = 0; i < 4; ++i) {
        bounded->AddChild(MakeBox(10.0f, 10.0f));
    }
    TEST_ASSERT(kind->GetAvailableCells() == 2, "剩余 2 个单元格");
    TEST_ASSERT(!kind->IsFull(), "尚未填满");
    bounded->AddChild(MakeBox(10.0f, 10.0f));
    bounded->AddChild(MakeBox(10.0f, 10.0f));
    TEST_ASSERT(kind->IsFull(), "已填满");
    TEST_ASSERT(kind->GetAvailableCells() == 0, "没有剩余单元格");

    auto unbounded = UIGrid::Create({.columns = 3});
    TEST_ASSERT(unbounded->As<UIGrid>()->GetMaxCapacity() == -1, "行数不限时容量为 -1");
    TEST_ASSERT(unbounded->As<UIGrid>()->GetAvailableCells() == -1, "行数不限时剩余为 -1");
    TEST_ASSERT(!unbounded->As<UIGrid>()->IsFull(), "行数不限时永不填满");
    return true;
}

bool Test_Grid_GetChildAtAndPosition() {
    auto grid = UIGrid::Create({.columns = 3});
    UIElement* children[4] = {};
    for (int i = 0; i < 4; ++i) {
        children[i] = grid->AddChild(MakeBox(10.0f, 10.0f));
    }
    auto* kind = grid->As<UIGrid>();

    TEST_ASSERT(kind->GetChildAt(0, 0) == children[0], "(0, 0)");
    TEST_ASSERT(kind->GetChildAt(0, 1) == children[3], "(0, 1) 为第四个子元素");
    TEST_ASSERT(kind->GetChildAt(1, 1) == nullptr, "空单元格返回 nullptr");
    TEST_ASSERT(kind->GetChildAt(-1, 0) == nullptr, "负列返回 nullptr");
    TEST_ASSERT(kind->GetChildAt(3, 0) == nullptr, "越界列返回 nullptr");

    TEST_ASSERT((kind->GetPositionOfChild(children[3]) == UIGridPosition{0, 1}), "第四个子元素位于 (0, 1)");
    TEST_ASSERT((kind->GetPositionOfChild(children[2]) == UIGridPosition{2, 0}), "第三个子元素位于 (2, 0)");

    auto stranger = MakeBox(10.0f, 10.0f);
    TEST_ASSERT((kind->GetPositionOfChild(stranger.get()) == UIGridPosition{-1, -1}), "非子元素返回 (-1, -1)");
    TEST_ASSERT((kind->GetPositionOfChild(nullptr) == UIGridPosition{-1, -1}), "空指针返回 (-1, -1)");
    return true;
}

bool Test_Grid_InsertChildAt() {
    auto grid = UIGrid::Create({.columns = 3});
    for (int i = 0; i < 4; ++i) {
        grid->AddChild(UIElement::Create({.id = "c" + std::to_string(i), .width = 10.0f, .height = 10.0f}));
    }
    auto* kind = grid->As<UIGrid>();

    auto* inserted = kind->InsertChildAt(UIElement::Create({.id = "new"}), 1, 0);
    TEST_ASSERT(grid->IndexOfChild(inserted) == 1, "插入到 (1, 0)");
    TEST_ASSERT(grid->GetChild(2)->GetId() == "c1", "后续子元素顺延");

    auto* clamped = kind->InsertChildAt(UIElement::Create({.id = "far"}), 10, 10);
    TEST_ASSERT(grid->IndexOfChild(clamped) == 5, "越界坐标追加到末尾");

    TEST_ASSERT(kind->InsertChildAt(nullptr, 0, 0) == nullptr, "空子元素返回 nullptr");
    TEST_ASSERT(grid->GetChildCount() == 6, "子元素数量");
    return true;
}

// ============================================================================
// UIFillGrid
// ============================================================================

bool Test_FillGrid_CellWidthFromParent() {
    auto parent = UIElement::Create({.width = 600.0f, .height = 400.0f});
    auto* grid = parent->AddChild(UIFillGrid::Create({.columns = 3, .columnSpacing = 10.0f, .padding = 20.0f}));

    TEST_ASSERT(grid->GetType() == UIElementType::FillGrid, "类型为 FillGrid");
    TEST_ASSERT(grid->GetWidthMode() == SizeMode::Fill, "宽度为 Fill");
    TEST_ASSERT(grid->GetHeightMode() == SizeMode::Content, "高度为 Content");
    TEST_ASSERT(grid->GetWidth() == 600.0f, "网格占满父元素宽度");
    TEST_ASSERT(grid->As<UIFillGrid>()->GetCellWidth() == 180.0f, "(600 - 40 - 20) / 3");

    parent->SetWidth(300.0f);
    TEST_ASSERT(grid->As<UIFillGrid>()->GetCellWidth() == 80.0f, "父元素变窄后 (300 - 40 - 20) / 3");
    return true;
}

bool Test_FillGrid_FractionalCells() {
    auto parent = UIElement::Create({.width = 200.0f, .height = 100.0f});
    auto* grid = parent->AddChild(UIFillGrid::Create({.columns = 4, .columnSpacing = 5.0f, .padding = 10.0f}));
    TEST_ASSERT_NEAR(grid->As<UIFillGrid>()->GetCellWidth(), 41.25f, 0.0001f, "(200 - 20 - 15) / 4");
    return true;
}

bool Test_FillGrid_ContentHeight() {
    auto parent = UIElement::Create({.width = 600.0f, .height = 400.0f});
    auto* grid = parent->AddChild(UIFillGrid::Create({.columns = 3, .rowSpacing = 6.0f, .padding = 20.0f}));
    for (int i = 0; i < 5; ++i) {
        grid->AddChild(MakeBox(50.0f, 30.0f));
    }
    TEST_ASSERT(grid->GetHeight() == 106.0f, "两行：30*2 + 6 + 20*2");
    return true;
}

bool Test_FillGrid_RowsLocked() {
    auto grid = UIFillGrid::Create({.columns = 2, .rows = 4});
    auto* kind = grid->As<UIFillGrid>();
    TEST_ASSERT(kind->GetRows() == 0, "行数被忽略");
    kind->SetRows(3);
    TEST_ASSERT(kind->GetRows() == 0, "SetRows 被忽略");
    TEST_ASSERT(kind->GetMaxCapacity() == -1, "容量不限");
    return true;
}

bool Test_FillGrid_ModesLocked() {
    auto grid = UIFillGrid::Create({.columns = 2}, {.widthMode = SizeMode::Fixed});
    TEST_ASSERT(grid->GetWidthMode() == SizeMode::Fill, "不支持的模式回退到 Fill");
    TEST_ASSERT(!grid->SetSizeMode(UIAxis::Horizontal, SizeMode::Content), "拒绝切换宽度模式");
    TEST_ASSERT(!grid->SetSizeMode(UIAxis::Vertical, SizeMode::Fixed), "拒绝切换高度模式");
    TEST_ASSERT(grid->GetHeightMode() == SizeMode::Content, "高度仍为 Content");
    return true;
}

bool Test_FillGrid_FillChildrenTrackCells() {
    auto parent = UIElement::Create({.width = 320.0f, .height = 400.0f});
    auto* grid = parent->AddChild(UIFillGrid::Create({.columns = 4}));
    auto* fill = grid->AddChild(MakeFillBox());
    TEST_ASSERT(fill->GetWidth() == 80.0f, "Fill 子元素宽度为单元格宽度");

    parent->SetWidth(400.0f);
    TEST_ASSERT(fill->GetWidth() == 100.0f, "父元素变化后 Fill 孙元素跟随");
    return true;
}

// ============================================================================
// 主函数
// ============================================================================

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;

    std::cout << "========================================" << std::endl;
    std::cout << "UIGrid / UIFillGrid 测试开始" << std::endl;
    std::cout << "========================================" << std::endl;

    Logger::GetInstance().SetLogToFile(false);
    Logger::GetInstance().SetLogLevel(LogLevel::Error);

    std::cout << "\n[构造与参数测试]" << std::endl;
    RUN_TEST(Test_Grid_RejectsNonPositiveColumns);
    RUN_TEST(Test_Grid_DefaultsToContent);

    std::cout << "\n[单元格尺寸测试]" << std::endl;
    RUN_TEST(Test_Grid_EmptyUsesDefaultCell);
    RUN_TEST(Test_Grid_AutoCellFromLargestChild);
    RUN_TEST(Test_Grid_ExplicitCellSize);
    RUN_TEST(Test_Grid_FixedSizeDividesSpace);
    RUN_TEST(Test_Grid_FixedHeightUnboundedRowsUsesChildren);
    RUN_TEST(Test_Grid_CellNeverBelowOne);
    RUN_TEST(Test_Grid_SetColumnsRecomputes);
    RUN_TEST(Test_Grid_ChildResizeRefreshesAutoCell);

    std::cout << "\n[Fill 子元素测试]" << std::endl;
    RUN_TEST(Test_Grid_FillChildTakesCell);
    RUN_TEST(Test_Grid_FillChildInAutoCell);

    std::cout << "\n[排列测试]" << std::endl;
    RUN_TEST(Test_Grid_NineAlignments);
    RUN_TEST(Test_Grid_OversizedChildPinnedToCellStart);
    RUN_TEST(Test_Grid_PaddingOffsetsOrigin);
    RUN_TEST(Test_Grid_ChildrenBeyondRowsNotArranged);

    std::cout << "\n[单元格查询测试]" << std::endl;
    RUN_TEST(Test_Grid_Capacity);
    RUN_TEST(Test_Grid_GetChildAtAndPosition);
    RUN_TEST(Test_Grid_InsertChildAt);

    std::cout << "\n[UIFillGrid 测试]" << std::endl;
    RUN_TEST(Test_FillGrid_CellWidthFromParent);
    RUN_TEST(Test_FillGrid_FractionalCells);
    RUN_TEST(Test_FillGrid_ContentHeight);
    RUN_TEST(Test_FillGrid_RowsLocked);
    RUN_TEST(Test_FillGrid_ModesLocked);
    RUN_TEST(Test_FillGrid_FillChildrenTrackCells);

    // 打印统计
    std::cout << "\n========================================" << std::endl;
    std::cout << "测试完成" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "总测试数: " << g_testCount << std::endl;
    std::cout << "通过: " << g_passedCount << " ✓" << std::endl;
    std::cout << "失败: " << g_failedCount << " ✗" << std::endl;

    if (g_failedCount > 0) {
        std::cout << "\n❌ 部分测试失败" << std::endl;
        return 1;  // CTest 会识别非零返回码为失败
    }

    std::cout << "\n✅ 所有测试通过" << std::endl;
    return 0;  // CTest 识别返回 0 为成功
}
