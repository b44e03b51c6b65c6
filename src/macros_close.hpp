#undef unreachable
#undef assert
