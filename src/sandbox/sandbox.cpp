#include "sandbox/sandbox.hpp"

namespace labjudge {

sandbox::~sandbox() {}

void sandbox::shutdown() {}

}  // namespace labjudge
