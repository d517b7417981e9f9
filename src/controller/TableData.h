#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hwpmcp
{
    /// Rectangular cell texts, row major
    using TableData = std::vector<std::vector<std::string>>;

    /**
     * @brief Converts a JSON array of rows into cell texts
     *
     * Cells may be strings, numbers, booleans or null. Integral numbers are written without a
     * fraction, other numbers without trailing zeros, null as an empty cell.
     *
     * @throws InvalidArgumentError if the data is empty, a row is empty or not an array,
     * rows differ in length or a cell is an object or array
     */
    [[nodiscard]] TableData parseTableData(nlohmann::json const & data);

    /// Text of a single cell value, see parseTableData()
    [[nodiscard]] std::string cellText(nlohmann::json const & value);
}
