// Include files							/*{{{*/
#include <config.h>

#include <pkgcat-private/private-table.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>
									/*}}}*/

namespace PkgCat {

struct ColumnCandidate
{
   size_t Columns;
   bool Valid;
   size_t LineLength;
   std::vector<size_t> Widths;

   explicit ColumnCandidate(size_t const Columns) : Columns(Columns), Valid(true),
      LineLength(0), Widths(Columns, 0) {}
};

// LayoutColumns - find the widest layout which fits			/*{{{*/
// ---------------------------------------------------------------------
/* Every candidate column count is tried at once while walking over the
   items, a candidate is dropped as soon as its line gets too long. */
ColumnLayout LayoutColumns(std::vector<std::string> const &Items, size_t const Width,
			   size_t const Padding, size_t const ForcedColumns)
{
   ColumnLayout Layout;
   if (Items.empty() == true)
      return Layout;

   size_t const ItemCount = Items.size();
   std::vector<ColumnCandidate> Candidates;
   if (ForcedColumns != 0)
      Candidates.emplace_back(ForcedColumns);
   else
   {
      size_t Shortest = Items.front().length();
      for (auto const &I : Items)
	 Shortest = std::min(Shortest, I.length());
      size_t const MaxColumns = std::min(ItemCount, std::max<size_t>(1, Width / (Shortest + Padding)));
      for (size_t C = 1; C <= MaxColumns; ++C)
	 Candidates.emplace_back(C);
   }

   for (size_t I = 0; I < ItemCount; ++I)
   {
      size_t const Length = Items[I].length();
      for (auto &C : Candidates)
      {
	 if (C.Valid == false)
	    continue;
	 size_t const Rows = (ItemCount + C.Columns - 1) / C.Columns;
	 size_t const Col = I / Rows;
	 size_t const Needed = Length + (Col < C.Columns - 1 ? Padding : 0);
	 if (C.Widths[Col] >= Needed)
	    continue;
	 C.LineLength += Needed - C.Widths[Col];
	 C.Widths[Col] = Needed;
	 C.Valid = C.LineLength < Width;
      }
   }

   auto Chosen = std::find_if(Candidates.rbegin(), Candidates.rend(),
			      [](ColumnCandidate const &C) { return C.Valid; });
   ColumnCandidate const &Best = (Chosen == Candidates.rend()) ? Candidates.front() : *Chosen;

   std::copy_if(Best.Widths.begin(), Best.Widths.end(), std::back_inserter(Layout.Widths),
		[](size_t const W) { return W != 0; });
   Layout.Count = Layout.Widths.size();
   return Layout;
}
									/*}}}*/
// TableRows								/*{{{*/
TableRows::TableRows(std::vector<std::string> const &Items, size_t const Columns) :
   Items(&Items), Columns(Columns),
   RowCount(Columns == 0 ? 0 : (Items.size() + Columns - 1) / Columns)
{
}
TableRows::Row TableRows::RowAt(size_t const Index) const
{
   Row Cells(Columns, nullptr);
   for (size_t C = 0; C < Columns; ++C)
   {
      size_t const I = C * RowCount + Index;
      if (I < Items->size())
	 Cells[C] = &(*Items)[I];
   }
   return Cells;
}
TableRows RowsForColumnCount(std::vector<std::string> const &Items, size_t const Columns)
{
   return TableRows(Items, Columns);
}
									/*}}}*/
void ShowColumns(std::ostream &out, std::vector<std::string> const &Items,	/*{{{*/
		 ColumnLayout const &Layout, size_t const Indent)
{
   for (auto const &Row : RowsForColumnCount(Items, Layout.Count))
   {
      out << std::string(Indent, ' ');
      for (size_t C = 0; C < Row.size() && Row[C] != nullptr; ++C)
      {
	 std::string const &Cell = *Row[C];
	 out << Cell;
	 bool const Last = C + 1 == Row.size() || Row[C + 1] == nullptr;
	 if (Last == false && Layout.Widths[C] > Cell.length())
	    out << std::string(Layout.Widths[C] - Cell.length(), ' ');
      }
      out << '\n';
   }
}
									/*}}}*/
}
