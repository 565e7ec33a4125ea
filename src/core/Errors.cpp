#include "core/Errors.hpp"
#include <sstream>

namespace {
std::string Describe(const Move& m, const std::string& reason) {
    std::ostringstream oss;
    oss << "Illegal move " << m << ": " << reason;
    return oss.str();
}
} // namespace

IllegalMoveError::IllegalMoveError(const Move& m, const std::string& reason)
    : std::invalid_argument(Describe(m, reason)), move_(m) {}
