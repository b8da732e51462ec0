#ifndef DROPIN_STATUS_MACROS_H_
#define DROPIN_STATUS_MACROS_H_

#include <utility>

#define RETURN_IF_ERROR(expr) \
  if (auto _status = (expr); !_status.ok()) return _status

#define ASSIGN_OR_RETURN_IMPL(status_or, lhs, rexpr) \
  auto status_or = (rexpr);                          \
  if (!status_or.ok()) return status_or.status();    \
  lhs = std::move(*status_or)

#define DROPIN_CONCAT_IMPL(x, y) x##y
#define DROPIN_CONCAT(x, y) DROPIN_CONCAT_IMPL(x, y)

#define ASSIGN_OR_RETURN(lhs, rexpr) ASSIGN_OR_RETURN_IMPL(DROPIN_CONCAT(_status_or, __LINE__), lhs, rexpr)

#endif  // DROPIN_STATUS_MACROS_H_
