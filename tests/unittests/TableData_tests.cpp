#include "controller/TableData.h"
#include "exceptions.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace hwpmcp::tests
{
    using json = nlohmann::json;

    TEST(TableData, ParseTableData_MixedCells_ConvertsToText)
    {
        // Arrange
        json data = json::array({json::array({"Item", "Qty", "Price", "Note"}),
                                 json::array({"Pen", 3, 1.5, nullptr}),
                                 json::array({"Ink", -2, 10.0, true})});

        // Act
        TableData table = parseTableData(data);

        // Assert
        ASSERT_EQ(table.size(), 3u);
        EXPECT_EQ(table[1], (std::vector<std::string>{"Pen", "3", "1.5", ""}));
        EXPECT_EQ(table[2], (std::vector<std::string>{"Ink", "-2", "10", "true"}));
    }

    TEST(TableData, CellText_Float_HasNoTrailingZeros)
    {
        EXPECT_EQ(cellText(0.25), "0.25");
        EXPECT_EQ(cellText(100.0), "100");
        EXPECT_EQ(cellText(-0.5), "-0.5");
    }

    TEST(TableData, CellText_NestedValue_ThrowsInvalidArgument)
    {
        EXPECT_THROW((void) cellText(json::object()), InvalidArgumentError);
        EXPECT_THROW((void) cellText(json::array({1})), InvalidArgumentError);
    }

    TEST(TableData, ParseTableData_EmptyData_ThrowsInvalidArgument)
    {
        EXPECT_THROW((void) parseTableData(json::array()), InvalidArgumentError);
        EXPECT_THROW((void) parseTableData(json::object()), InvalidArgumentError);
    }

    TEST(TableData, ParseTableData_EmptyRow_ThrowsInvalidArgument)
    {
        EXPECT_THROW((void) parseTableData(json::array({json::array()})), InvalidArgumentError);
        EXPECT_THROW((void) parseTableData(json::array({"not a row"})), InvalidArgumentError);
    }

    TEST(TableData, ParseTableData_RaggedRows_NamesOffendingRow)
    {
        // Arrange
        json data = json::array({json::array({1, 2}), json::array({3, 4}), json::array({5})});

        // Act & Assert
        try
        {
            (void) parseTableData(data);
            FAIL() << "Expected InvalidArgumentError";
        }
        catch (InvalidArgumentError const & e)
        {
            EXPECT_STREQ(e.what(), "Row 3 has 1 cells, expected 2 like the first row");
        }
    }
}
