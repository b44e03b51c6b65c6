// Location-tagged marks from `common.hpp`.
// Include after all standard headers, and pair with `macros_close.hpp`.
#undef assert
#define unreachable unreachable(__FILE__, __LINE__, static_cast<char const*>(__func__))
#define assert(expr) assert(!!(expr), #expr, __FILE__, __LINE__, static_cast<char const*>(__func__))
