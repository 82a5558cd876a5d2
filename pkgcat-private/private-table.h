// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Table layout - arrange a list of words in columns

   The words are filled in column-major order like ls(1) does, the
   widest layout still narrower than the given width is chosen.

   ##################################################################### */
									/*}}}*/
#ifndef PKGCAT_PRIVATE_TABLE_H
#define PKGCAT_PRIVATE_TABLE_H

#include <pkgcat/macros.h>

#include <cstddef>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace PkgCat {

struct PKGCAT_PUBLIC ColumnLayout
{
   /** number of columns actually used */
   size_t Count = 0;
   /** width of each column, padding included except for the last one */
   std::vector<size_t> Widths;
};

/** \brief pick the column layout for \b Items
 *
 *  \param Width the lines have to stay strictly below this length
 *  \param Padding spaces between two columns
 *  \param ForcedColumns use this many columns instead of the widest
 *         fitting layout, 0 to let the width decide
 */
PKGCAT_PUBLIC ColumnLayout LayoutColumns(std::vector<std::string> const &Items, size_t const Width,
					 size_t const Padding = 2, size_t const ForcedColumns = 0);

/** \brief the rows of a column-major table
 *
 *  Rows are computed while iterating and the range can be iterated as
 *  often as needed. A row always has one cell per column, cells past
 *  the end of the items are \b nullptr.
 */
class PKGCAT_PUBLIC TableRows
{
   std::vector<std::string> const *Items;
   size_t Columns;
   size_t RowCount;

   public:
   typedef std::vector<std::string const *> Row;

   class const_iterator
   {
      TableRows const *Table;
      size_t Current;

      public:
      typedef std::input_iterator_tag iterator_category;
      typedef TableRows::Row value_type;
      typedef std::ptrdiff_t difference_type;
      typedef TableRows::Row const *pointer;
      typedef TableRows::Row reference;

      const_iterator(TableRows const * const Table, size_t const Current) : Table(Table), Current(Current) {}
      Row operator*() const { return Table->RowAt(Current); }
      const_iterator &operator++() { ++Current; return *this; }
      const_iterator operator++(int) { const_iterator tmp(*this); ++Current; return tmp; }
      bool operator==(const_iterator const &o) const { return Table == o.Table && Current == o.Current; }
      bool operator!=(const_iterator const &o) const { return !(*this == o); }
   };

   TableRows(std::vector<std::string> const &Items, size_t const Columns);

   Row RowAt(size_t const Index) const;
   const_iterator begin() const { return const_iterator(this, 0); }
   const_iterator end() const { return const_iterator(this, RowCount); }
   size_t size() const { return RowCount; }
   bool empty() const { return RowCount == 0; }
};

/** \brief the rows of \b Items laid out in \b Columns columns
 *
 *  \b Items has to outlive the returned range.
 */
PKGCAT_PUBLIC TableRows RowsForColumnCount(std::vector<std::string> const &Items, size_t const Columns);

/** \brief print \b Items as table, the last cell of a row isn't padded */
PKGCAT_PUBLIC void ShowColumns(std::ostream &out, std::vector<std::string> const &Items,
			       ColumnLayout const &Layout, size_t const Indent = 0);

}

#endif
