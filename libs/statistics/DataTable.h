// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __DATA_TABLE_H
#define __DATA_TABLE_H 1

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include "BootstrapException.h"

namespace treestat
{
  namespace statistics
  {
    /**
     * @class DataTable
     * @brief Ordered, named, equal-length columns of numbers or labels.
     *
     * The first column added fixes the row count. Column order is insertion
     * order. Bootstrap resamples are built with selectRows().
     */
    class DataTable
    {
    public:
      DataTable() = default;

      std::size_t numRows() const
      {
	return m_numRows;
      }

      std::size_t numColumns() const
      {
	return m_columns.size();
      }

      std::vector<std::string> columnNames() const;

      bool hasColumn(const std::string& name) const;

      // True for a numeric column, false for a label column.
      // @throws MissingColumnError
      bool isNumeric(const std::string& name) const;

      /**
       * @throws std::invalid_argument if the name is taken or the length
       *         differs from numRows() of a non-empty table.
       */
      void addNumericColumn(const std::string& name, std::vector<double> values);
      void addLabelColumn(const std::string& name, std::vector<std::string> values);

      /**
       * @throws MissingColumnError if there is no such column,
       *         std::invalid_argument if it holds labels.
       */
      const std::vector<double>& numeric(const std::string& name) const;

      /**
       * @throws MissingColumnError if there is no such column,
       *         std::invalid_argument if it holds numbers.
       */
      const std::vector<std::string>& labels(const std::string& name) const;

      /**
       * @brief New table made of the given rows, in the given order.
       *
       * Indices may repeat.
       * @throws std::out_of_range for an index >= numRows().
       */
      DataTable selectRows(const std::vector<std::size_t>& rows) const;

      bool operator==(const DataTable& rhs) const;

    private:
      using ColumnValues = std::variant<std::vector<double>, std::vector<std::string>>;

      struct Column
      {
	std::string  name;
	ColumnValues values;

	bool operator==(const Column& rhs) const
	{
	  return name == rhs.name && values == rhs.values;
	}
      };

      const Column& findColumn(const std::string& name) const;
      void addColumn(const std::string& name, ColumnValues values, std::size_t length);

    private:
      std::vector<Column> m_columns;
      std::size_t         m_numRows = 0;
    };
  }
}

#endif
