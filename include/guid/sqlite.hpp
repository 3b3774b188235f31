#pragma once

#include <guid/guid.hpp>
#include <guid/result.hpp>
#include <sqlite3.h>

namespace guid {

// Binds the 26-character text form; sortable in a TEXT column.
Status bind_guid(sqlite3_stmt* stmt, int index, const Guid& g);

// Binds the 26 raw bytes.
Status bind_guid_blob(sqlite3_stmt* stmt, int index, const Guid& g);

// Reads column `col` of the current row. TEXT is parsed; a BLOB holding the
// text form is parsed too, any other BLOB is taken as the raw form. NULL
// yields the zero guid.
Result<Guid> column_guid(sqlite3_stmt* stmt, int col);

} // namespace guid
