// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "DataTable.h"

#include <stdexcept>

namespace treestat
{
  namespace statistics
  {
    namespace
    {
      template <class T>
      std::vector<T> pick(const std::vector<T>& values, const std::vector<std::size_t>& rows)
      {
	std::vector<T> out;
	out.reserve(rows.size());
	for (std::size_t r : rows)
	  out.push_back(values[r]);
	return out;
      }
    }

    std::vector<std::string> DataTable::columnNames() const
    {
      std::vector<std::string> names;
      names.reserve(m_columns.size());
      for (const auto& c : m_columns)
	names.push_back(c.name);
      return names;
    }

    bool DataTable::hasColumn(const std::string& name) const
    {
      for (const auto& c : m_columns)
	{
	  if (c.name == name)
	    return true;
	}
      return false;
    }

    const DataTable::Column& DataTable::findColumn(const std::string& name) const
    {
      for (const auto& c : m_columns)
	{
	  if (c.name == name)
	    return c;
	}
      throw MissingColumnError("DataTable: no column named '" + name + "'");
    }

    bool DataTable::isNumeric(const std::string& name) const
    {
      return std::holds_alternative<std::vector<double>>(findColumn(name).values);
    }

    void DataTable::addColumn(const std::string& name, ColumnValues values, std::size_t length)
    {
      if (hasColumn(name))
	throw std::invalid_argument("DataTable: duplicate column '" + name + "'");

      if (!m_columns.empty() && length != m_numRows)
	throw std::invalid_argument("DataTable: column '" + name + "' has "
				    + std::to_string(length) + " rows, expected "
				    + std::to_string(m_numRows));

      m_numRows = length;
      m_columns.push_back(Column{ name, std::move(values) });
    }

    void DataTable::addNumericColumn(const std::string& name, std::vector<double> values)
    {
      const std::size_t n = values.size();
      addColumn(name, ColumnValues(std::move(values)), n);
    }

    void DataTable::addLabelColumn(const std::string& name, std::vector<std::string> values)
    {
      const std::size_t n = values.size();
      addColumn(name, ColumnValues(std::move(values)), n);
    }

    const std::vector<double>& DataTable::numeric(const std::string& name) const
    {
      const Column& c = findColumn(name);
      if (const auto* v = std::get_if<std::vector<double>>(&c.values))
	return *v;

      throw std::invalid_argument("DataTable: column '" + name + "' holds labels, not numbers");
    }

    const std::vector<std::string>& DataTable::labels(const std::string& name) const
    {
      const Column& c = findColumn(name);
      if (const auto* v = std::get_if<std::vector<std::string>>(&c.values))
	return *v;

      throw std::invalid_argument("DataTable: column '" + name + "' holds numbers, not labels");
    }

    DataTable DataTable::selectRows(const std::vector<std::size_t>& rows) const
    {
      for (std::size_t r : rows)
	{
	  if (r >= m_numRows)
	    throw std::out_of_range("DataTable::selectRows: row " + std::to_string(r)
				    + " out of range for " + std::to_string(m_numRows) + " rows");
	}

      DataTable out;
      out.m_numRows = rows.size();
      out.m_columns.reserve(m_columns.size());

      for (const auto& c : m_columns)
	{
	  ColumnValues picked = std::visit([&rows](const auto& values) {
	      return ColumnValues(pick(values, rows));
	    }, c.values);

	  out.m_columns.push_back(Column{ c.name, std::move(picked) });
	}

      return out;
    }

    bool DataTable::operator==(const DataTable& rhs) const
    {
      return m_numRows == rhs.m_numRows && m_columns == rhs.m_columns;
    }
  }
}
