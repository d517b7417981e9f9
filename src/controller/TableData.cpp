#include "TableData.h"
#include "../exceptions.h"

#include <cmath>
#include <cstdint>
#include <fmt/format.h>

namespace hwpmcp
{
    namespace
    {
        // Beyond this doubles no longer hold every integer
        constexpr double MaxExactInteger = 9007199254740992.0;

        std::string numberText(double value)
        {
            if (std::isfinite(value) && std::trunc(value) == value &&
                std::fabs(value) < MaxExactInteger)
            {
                return fmt::format("{}", static_cast<std::int64_t>(value));
            }
            // Shortest representation that round trips, so no trailing zeros
            return fmt::format("{}", value);
        }
    }

    std::string cellText(nlohmann::json const & value)
    {
        switch (value.type())
        {
        case nlohmann::json::value_t::null:
            return {};
        case nlohmann::json::value_t::string:
            return value.get<std::string>();
        case nlohmann::json::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        case nlohmann::json::value_t::number_integer:
            return fmt::format("{}", value.get<std::int64_t>());
        case nlohmann::json::value_t::number_unsigned:
            return fmt::format("{}", value.get<std::uint64_t>());
        case nlohmann::json::value_t::number_float:
            return numberText(value.get<double>());
        default:
            throw InvalidArgumentError(
              fmt::format("Table cells must be strings, numbers or null, got {}", value.type_name()));
        }
    }

    TableData parseTableData(nlohmann::json const & data)
    {
        if (!data.is_array() || data.empty())
        {
            throw InvalidArgumentError("Table data must be a non-empty array of rows");
        }

        TableData table;
        table.reserve(data.size());

        size_t columns = 0;
        for (size_t rowIndex = 0; rowIndex < data.size(); ++rowIndex)
        {
            auto const & row = data[rowIndex];
            if (!row.is_array() || row.empty())
            {
                throw InvalidArgumentError(
                  fmt::format("Row {} of the table data must be a non-empty array", rowIndex + 1));
            }

            if (rowIndex == 0)
            {
                columns = row.size();
            }
            else if (row.size() != columns)
            {
                throw InvalidArgumentError(
                  fmt::format("Row {} has {} cells, expected {} like the first row",
                              rowIndex + 1,
                              row.size(),
                              columns));
            }

            std::vector<std::string> cells;
            cells.reserve(row.size());
            for (auto const & cell : row)
            {
                cells.push_back(cellText(cell));
            }
            table.push_back(std::move(cells));
        }
        return table;
    }
}
