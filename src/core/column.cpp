#include <pivot/core/column.hpp>
#include <pivot/core/time.hpp>

#include <cstdint>
#include <string>

namespace pivot {

// Explicit instantiations for the element types a Table can hold.
template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;
template class Column<Date>;

}  // namespace pivot
