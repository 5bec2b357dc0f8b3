#include "errors.hpp"

namespace docstore::util {

std::string WrappedError::Describe(const std::string& msg, const std::exception_ptr& cause) {
  if (!cause) {
    return msg;
  }

  try {
    std::rethrow_exception(cause);
  } catch (const std::exception& e) {
    return msg + ": " + e.what();
  } catch (...) {
    return msg + ": unknown error";
  }
}

} // namespace docstore::util
