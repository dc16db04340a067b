#include "log.hpp"

#include <atomic>

namespace gfaestus {

namespace logging {

static std::atomic<bool> quiet_info(false);

void set_quiet(bool quiet) {
    quiet_info.store(quiet);
}

cerrWrapper info(const std::string& context) {
    return cerrWrapper("[" + context + "] ", false, quiet_info.load());
}

cerrWrapper warn(const std::string& context) {
    return cerrWrapper("warning[" + context + "] ", false);
}

cerrWrapper error(const std::string& context) {
    return cerrWrapper("error[" + context + "] ", true);
}

}

}
